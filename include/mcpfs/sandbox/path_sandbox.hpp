#pragma once

#include <mcpfs/core/result.hpp>

#include <filesystem>
#include <string_view>

namespace mcpfs {

// ---------------------------------------------------------------------------
// PathSandbox: confines tool paths to a single root directory.
//
// Validate() joins a raw path to the root, resolves `.`, `..` and symlinks
// (every link on the existing prefix is followed, dangling ones included;
// the missing rest is resolved lexically) and accepts the result only if it is the root or lies below it
// component-wise. It opens nothing; callers do their I/O on the returned
// path afterwards.
//
// Immutable after Create(); safe to share across handler threads.
// ---------------------------------------------------------------------------
class PathSandbox {
public:
    // Fails with a Config error unless `root` is an existing directory.
    static Result<PathSandbox, Error> Create(const std::filesystem::path& root);

    [[nodiscard]] const std::filesystem::path& Root() const noexcept { return root_; }

    // Canonical absolute path inside the root, or PathEscape /
    // InvalidArguments / Io.
    [[nodiscard]] Result<std::filesystem::path, Error> Validate(
        std::string_view raw_path) const;

    // Component-wise prefix test; "/data-evil" is not within "/data".
    static bool IsWithin(const std::filesystem::path& root,
                         const std::filesystem::path& candidate);

private:
    explicit PathSandbox(std::filesystem::path root) : root_(std::move(root)) {}

    std::filesystem::path root_;
};

} // namespace mcpfs
