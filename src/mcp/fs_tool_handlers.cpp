#include <mcpfs/mcp/fs_tool_handlers.hpp>

#include <mcpfs/core/log.hpp>

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

namespace mcpfs {

namespace fs = std::filesystem;

namespace {

// ---------------------------------------------------------------------------
// Result helpers
// ---------------------------------------------------------------------------

Result<ToolResult, Error> Fail(ErrorCategory category, const std::string& op,
                               const std::string& target, const std::string& msg) {
    return Result<ToolResult, Error>::Err(Error::Make(category, op, target, msg));
}

ToolParameter PathParam(const std::string& description) {
    return ToolParameter{"path", ParamType::String, description, true};
}

// ---------------------------------------------------------------------------
// Tool handlers
// ---------------------------------------------------------------------------

// read_file
Result<ToolResult, Error> HandleReadFile(const PathSandbox& sandbox,
                                         const FsToolOptions& options,
                                         const nlohmann::json& params) {
    constexpr const char* kOp = "read_file";
    auto raw = params["path"].get<std::string>();
    auto resolved = sandbox.Validate(raw);
    if (resolved.IsErr()) return Result<ToolResult, Error>::Err(resolved.Error());
    const auto& path = resolved.Value();

    std::error_code ec;
    auto status = fs::status(path, ec);
    if (!fs::exists(status)) {
        return Fail(ErrorCategory::NotFound, kOp, raw, "File not found: " + raw);
    }
    if (!fs::is_regular_file(status)) {
        return Fail(ErrorCategory::Io, kOp, raw, "Not a file: " + raw);
    }
    auto size = fs::file_size(path, ec);
    if (ec) {
        return Fail(ErrorCategory::Io, kOp, raw, "Cannot stat file: " + ec.message());
    }
    if (size > options.max_file_bytes) {
        return Fail(ErrorCategory::Io, kOp, raw,
                    "File too large: " + std::to_string(size) + " bytes (limit " +
                        std::to_string(options.max_file_bytes) + ")");
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Fail(ErrorCategory::Io, kOp, raw, "Cannot open file: " + raw);
    }
    std::string content((std::istreambuf_iterator<char>(in)),
                        std::istreambuf_iterator<char>());
    if (in.bad()) {
        return Fail(ErrorCategory::Io, kOp, raw, "Read failed: " + raw);
    }
    if (!IsValidUtf8(content)) {
        return Fail(ErrorCategory::Io, kOp, raw, "File is not a text file: " + raw);
    }

    LogInfo("fs", "Read file: " + path.filename().string() + " (" +
                      std::to_string(content.size()) + " bytes)");
    return Result<ToolResult, Error>::Ok(ToolResult::Text(content));
}

// list_directory
Result<ToolResult, Error> HandleListDirectory(const PathSandbox& sandbox,
                                              const nlohmann::json& params) {
    constexpr const char* kOp = "list_directory";
    auto raw = params["path"].get<std::string>();
    auto details_it = params.find("details");
    bool details = details_it != params.end() && details_it->is_boolean() &&
                   details_it->get<bool>();

    auto resolved = sandbox.Validate(raw);
    if (resolved.IsErr()) return Result<ToolResult, Error>::Err(resolved.Error());
    const auto& dir = resolved.Value();

    std::error_code ec;
    auto status = fs::status(dir, ec);
    if (!fs::exists(status)) {
        return Fail(ErrorCategory::NotFound, kOp, raw, "Directory not found: " + raw);
    }
    if (!fs::is_directory(status)) {
        return Fail(ErrorCategory::Io, kOp, raw, "Not a directory: " + raw);
    }

    std::vector<fs::directory_entry> entries;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        entries.push_back(*it);
    }
    if (ec) {
        return Fail(ErrorCategory::Io, kOp, raw, "Cannot list directory: " + ec.message());
    }
    // Byte-lexicographic by file name.
    std::sort(entries.begin(), entries.end(),
              [](const fs::directory_entry& a, const fs::directory_entry& b) {
                  return a.path().filename().string() < b.path().filename().string();
              });

    std::vector<std::string> chunks;
    chunks.reserve(entries.size());
    for (const auto& entry : entries) {
        auto name = entry.path().filename().string();
        if (!details) {
            chunks.push_back(name);
            continue;
        }
        std::error_code entry_ec;
        bool is_dir = entry.is_directory(entry_ec);
        std::uintmax_t size = 0;
        if (!is_dir && entry.is_regular_file(entry_ec)) {
            size = entry.file_size(entry_ec);
            if (entry_ec) size = 0;
        }
        std::ostringstream line;
        line << std::left << std::setw(6) << (is_dir ? "DIR" : "FILE") << ' '
             << std::right << std::setw(10) << size << " bytes  " << name;
        chunks.push_back(line.str());
    }

    LogInfo("fs", "Listed directory: " + dir.filename().string() + " (" +
                      std::to_string(chunks.size()) + " items)");
    return Result<ToolResult, Error>::Ok(ToolResult::TextChunks(chunks));
}

// write_file
Result<ToolResult, Error> HandleWriteFile(const PathSandbox& sandbox,
                                          const nlohmann::json& params) {
    constexpr const char* kOp = "write_file";
    auto raw = params["path"].get<std::string>();
    const auto& content = params["content"].get_ref<const std::string&>();

    auto resolved = sandbox.Validate(raw);
    if (resolved.IsErr()) return Result<ToolResult, Error>::Err(resolved.Error());
    const auto& path = resolved.Value();

    std::error_code ec;
    if (fs::is_directory(path, ec)) {
        return Fail(ErrorCategory::Io, kOp, raw, "Path is a directory: " + raw);
    }

    // The parent chain was validated together with the path.
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        return Fail(ErrorCategory::Io, kOp, raw,
                    "Cannot create parent directories: " + ec.message());
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Fail(ErrorCategory::Io, kOp, raw, "Cannot open file for writing: " + raw);
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.close();
    if (!out) {
        return Fail(ErrorCategory::Io, kOp, raw, "Write failed: " + raw);
    }

    auto name = path.filename().string();
    LogInfo("fs", "Wrote file: " + name + " (" + std::to_string(content.size()) + " bytes)");
    return Result<ToolResult, Error>::Ok(ToolResult::Text(
        "Successfully wrote " + std::to_string(content.size()) + " bytes to " + name));
}

} // anonymous namespace

bool IsValidUtf8(std::string_view text) {
    std::size_t i = 0;
    const std::size_t n = text.size();
    while (i < n) {
        auto c = static_cast<unsigned char>(text[i]);
        std::size_t len = 0;
        std::uint32_t cp = 0;
        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            len = 2; cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3; cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4; cp = c & 0x07;
        } else {
            return false;
        }
        if (i + len > n) return false;
        for (std::size_t k = 1; k < len; ++k) {
            auto cc = static_cast<unsigned char>(text[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        // Overlong forms, surrogates, out of range.
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) ||
            (len == 4 && cp < 0x10000) || cp > 0x10FFFF ||
            (cp >= 0xD800 && cp <= 0xDFFF)) {
            return false;
        }
        i += len;
    }
    return true;
}

Result<void, Error> RegisterFilesystemTools(ToolRegistry& registry,
                                            const PathSandbox& sandbox,
                                            FsToolOptions options) {
    auto r = registry.Register(
        ToolDescriptor{
            "read_file",
            "Read the complete contents of a text file. Returns file content as string.",
            {PathParam("Path to the file to read (relative or absolute)")}},
        [sandbox, options](const nlohmann::json& params) {
            return HandleReadFile(sandbox, options, params);
        });
    if (r.IsErr()) return r;

    r = registry.Register(
        ToolDescriptor{
            "list_directory",
            "List all files and directories in a given directory path, sorted by name.",
            {PathParam("Directory path to list (relative or absolute). "
                       "Use '.' for the root directory."),
             ToolParameter{"details", ParamType::Boolean,
                           "Include entry type and size (default: false)", false}}},
        [sandbox](const nlohmann::json& params) {
            return HandleListDirectory(sandbox, params);
        });
    if (r.IsErr()) return r;

    r = registry.Register(
        ToolDescriptor{
            "write_file",
            "Write content to a file. Creates file if it doesn't exist, overwrites if it does.",
            {PathParam("Path where to write the file"),
             ToolParameter{"content", ParamType::String,
                           "Content to write to the file", true}}},
        [sandbox](const nlohmann::json& params) {
            return HandleWriteFile(sandbox, params);
        });
    return r;
}

} // namespace mcpfs
