#include <mcpfs/sandbox/path_sandbox.hpp>

#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace mcpfs {

namespace {

constexpr const char* kValidateOp = "PathSandbox::Validate";

constexpr int kMaxSymlinkHops = 40;

// Pushes the components of `p` so that the first one is popped first.
void PushComponents(std::vector<std::filesystem::path>& pending,
                    const std::filesystem::path& p) {
    std::vector<std::filesystem::path> parts(p.begin(), p.end());
    pending.insert(pending.end(), parts.rbegin(), parts.rend());
}

// Resolves `absolute` one component at a time, following every symlink,
// including dangling ones, through read_symlink. Components below the first
// missing one are resolved lexically.
Result<std::filesystem::path, Error> ResolvePath(const std::filesystem::path& absolute,
                                                 const std::string& raw) {
    std::vector<std::filesystem::path> pending;
    PushComponents(pending, absolute.relative_path());

    std::filesystem::path resolved = absolute.root_path();
    bool on_disk = true;
    int hops = 0;

    while (!pending.empty()) {
        const auto part = std::move(pending.back());
        pending.pop_back();

        if (part.empty() || part == ".") {
            continue;
        }
        if (part == "..") {
            resolved = resolved.parent_path();
            continue;
        }

        auto next = resolved / part;
        if (!on_disk) {
            resolved = std::move(next);
            continue;
        }

        std::error_code ec;
        const auto status = std::filesystem::symlink_status(next, ec);
        if (status.type() == std::filesystem::file_type::not_found) {
            on_disk = false;
            resolved = std::move(next);
            continue;
        }
        if (ec) {
            return Result<std::filesystem::path, Error>::Err(Error::Make(
                ErrorCategory::Io, kValidateOp, raw,
                "Cannot resolve path: " + ec.message()));
        }
        if (!std::filesystem::is_symlink(status)) {
            resolved = std::move(next);
            continue;
        }

        if (++hops > kMaxSymlinkHops) {
            return Result<std::filesystem::path, Error>::Err(Error::Make(
                ErrorCategory::Io, kValidateOp, raw,
                "Cannot resolve path: too many levels of symbolic links"));
        }
        auto target = std::filesystem::read_symlink(next, ec);
        if (ec) {
            return Result<std::filesystem::path, Error>::Err(Error::Make(
                ErrorCategory::Io, kValidateOp, raw,
                "Cannot resolve path: " + ec.message()));
        }
        // Relative targets continue from the link's directory.
        if (target.is_absolute()) {
            resolved = target.root_path();
            target = target.relative_path();
        }
        PushComponents(pending, target);
    }

    return Result<std::filesystem::path, Error>::Ok(std::move(resolved));
}

} // anonymous namespace

Result<PathSandbox, Error> PathSandbox::Create(const std::filesystem::path& root) {
    const std::string shown = root.string();
    if (root.empty()) {
        return Result<PathSandbox, Error>::Err(Error::Make(
            ErrorCategory::Config, "PathSandbox::Create", shown,
            "Sandbox root must not be empty"));
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec) || ec) {
        return Result<PathSandbox, Error>::Err(Error::Make(
            ErrorCategory::Config, "PathSandbox::Create", shown,
            "Sandbox root is not an existing directory"));
    }

    auto canonical = std::filesystem::canonical(root, ec);
    if (ec) {
        return Result<PathSandbox, Error>::Err(Error::Make(
            ErrorCategory::Config, "PathSandbox::Create", shown,
            "Cannot resolve sandbox root: " + ec.message()));
    }

    return Result<PathSandbox, Error>::Ok(PathSandbox(std::move(canonical)));
}

bool PathSandbox::IsWithin(const std::filesystem::path& root,
                           const std::filesystem::path& candidate) {
    auto root_it = root.begin();
    auto cand_it = candidate.begin();
    for (; root_it != root.end() && cand_it != candidate.end(); ++root_it, ++cand_it) {
        if (*root_it != *cand_it) {
            return false;
        }
    }
    return root_it == root.end();
}

Result<std::filesystem::path, Error> PathSandbox::Validate(
    std::string_view raw_path) const {
    const std::string raw(raw_path);

    if (raw.find('\0') != std::string::npos) {
        return Result<std::filesystem::path, Error>::Err(Error::Make(
            ErrorCategory::InvalidArguments, kValidateOp, raw,
            "Path contains a NUL byte"));
    }

    std::filesystem::path candidate(raw.empty() ? std::string(".") : raw);
    if (candidate.is_relative()) {
        candidate = root_ / candidate;
    }

    auto resolved_result = ResolvePath(candidate, raw);
    if (resolved_result.IsErr()) {
        return resolved_result;
    }
    auto resolved = std::move(resolved_result).Value();

    if (!IsWithin(root_, resolved)) {
        auto err = Error::Make(
            ErrorCategory::PathEscape, kValidateOp, raw,
            "Access denied: " + raw + " is outside allowed directory " +
                root_.string());
        err.hint = "Use a path inside " + root_.string();
        return Result<std::filesystem::path, Error>::Err(std::move(err));
    }

    return Result<std::filesystem::path, Error>::Ok(std::move(resolved));
}

} // namespace mcpfs
