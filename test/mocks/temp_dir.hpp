#pragma once

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <system_error>

namespace mcpfs::testing {

// Fresh directory under the system temp dir, removed recursively on scope
// exit.
class TempDir {
public:
    TempDir() {
        auto pattern = (std::filesystem::temp_directory_path() / "mcpfs-test-XXXXXX").string();
        if (::mkdtemp(pattern.data()) == nullptr) {
            throw std::runtime_error("mkdtemp failed for " + pattern);
        }
        path_ = std::filesystem::canonical(pattern);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& Path() const noexcept { return path_; }

    std::filesystem::path operator/(const std::string& rel) const { return path_ / rel; }

    // Creates parent directories as needed.
    std::filesystem::path WriteFile(const std::string& rel, const std::string& content) const {
        auto target = path_ / rel;
        std::filesystem::create_directories(target.parent_path());
        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        out << content;
        return target;
    }

    std::filesystem::path MakeDir(const std::string& rel) const {
        auto target = path_ / rel;
        std::filesystem::create_directories(target);
        return target;
    }

private:
    std::filesystem::path path_;
};

inline std::string ReadFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)),
                       std::istreambuf_iterator<char>());
}

} // namespace mcpfs::testing
