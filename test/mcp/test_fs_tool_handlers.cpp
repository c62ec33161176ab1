#include <catch2/catch_test_macros.hpp>

#include <mcpfs/mcp/fs_tool_handlers.hpp>

#include "mocks/temp_dir.hpp"

#include <atomic>
#include <filesystem>
#include <string>
#include <thread>
#include <vector>

using namespace mcpfs;
namespace fs = std::filesystem;

namespace {

struct FsFixture {
    mcpfs::testing::TempDir dir;
    ToolRegistry registry;

    explicit FsFixture(FsToolOptions options = {}) {
        auto sandbox = PathSandbox::Create(dir.Path());
        REQUIRE(sandbox.IsOk());
        REQUIRE(RegisterFilesystemTools(registry, sandbox.Value(), options).IsOk());
    }

    Result<ToolResult, Error> Call(const std::string& tool, const nlohmann::json& args) {
        return registry.Dispatch(tool, args);
    }
};

} // anonymous namespace

// ===========================================================================
// Registration
// ===========================================================================

TEST_CASE("FsTools: registers the three tools", "[mcp][fs]") {
    FsFixture fx;
    REQUIRE(fx.registry.Tools().size() == 3);
    CHECK(fx.registry.HasTool("read_file"));
    CHECK(fx.registry.HasTool("list_directory"));
    CHECK(fx.registry.HasTool("write_file"));

    const auto* write = fx.registry.Find("write_file");
    REQUIRE(write != nullptr);
    auto schema = write->InputSchema();
    CHECK(schema["required"] == nlohmann::json::array({"path", "content"}));
}

TEST_CASE("FsTools: registering twice fails", "[mcp][fs]") {
    FsFixture fx;
    auto sandbox = PathSandbox::Create(fx.dir.Path());
    REQUIRE(sandbox.IsOk());
    auto again = RegisterFilesystemTools(fx.registry, sandbox.Value());
    REQUIRE(again.IsErr());
    CHECK(again.Error().category == ErrorCategory::Config);
}

// ===========================================================================
// read_file
// ===========================================================================

TEST_CASE("read_file: returns file content", "[mcp][fs]") {
    FsFixture fx;
    fx.dir.WriteFile("notes/today.txt", "line one\nline two\n");

    auto r = fx.Call("read_file", {{"path", "notes/today.txt"}});
    REQUIRE(r.IsOk());
    CHECK(r.Value().JoinedText() == "line one\nline two\n");
    CHECK_FALSE(r.Value().is_error);
}

TEST_CASE("read_file: UTF-8 text is accepted", "[mcp][fs]") {
    FsFixture fx;
    fx.dir.WriteFile("utf8.txt", "caf\xC3\xA9 \xE2\x82\xAC \xF0\x9F\x98\x80");

    auto r = fx.Call("read_file", {{"path", "utf8.txt"}});
    REQUIRE(r.IsOk());
    CHECK(r.Value().JoinedText() == "caf\xC3\xA9 \xE2\x82\xAC \xF0\x9F\x98\x80");
}

TEST_CASE("read_file: empty file", "[mcp][fs]") {
    FsFixture fx;
    fx.dir.WriteFile("empty.txt", "");

    auto r = fx.Call("read_file", {{"path", "empty.txt"}});
    REQUIRE(r.IsOk());
    CHECK(r.Value().JoinedText().empty());
}

TEST_CASE("read_file: missing file is NotFound", "[mcp][fs]") {
    FsFixture fx;
    auto r = fx.Call("read_file", {{"path", "nope.txt"}});
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::NotFound);
    CHECK(r.Error().message == "File not found: nope.txt");
}

TEST_CASE("read_file: directory is not a file", "[mcp][fs]") {
    FsFixture fx;
    fx.dir.MakeDir("sub");
    auto r = fx.Call("read_file", {{"path", "sub"}});
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Io);
    CHECK(r.Error().message == "Not a file: sub");
}

TEST_CASE("read_file: binary content is rejected", "[mcp][fs]") {
    FsFixture fx;
    fx.dir.WriteFile("blob.bin", std::string("\x89PNG\r\n\x1a\n\xff\xfe", 10));
    auto r = fx.Call("read_file", {{"path", "blob.bin"}});
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Io);
    CHECK(r.Error().message == "File is not a text file: blob.bin");
}

TEST_CASE("read_file: size limit", "[mcp][fs]") {
    FsToolOptions options;
    options.max_file_bytes = 16;
    FsFixture fx(options);
    fx.dir.WriteFile("big.txt", std::string(17, 'a'));
    fx.dir.WriteFile("fits.txt", std::string(16, 'a'));

    auto big = fx.Call("read_file", {{"path", "big.txt"}});
    REQUIRE(big.IsErr());
    CHECK(big.Error().category == ErrorCategory::Io);
    CHECK(big.Error().message == "File too large: 17 bytes (limit 16)");

    CHECK(fx.Call("read_file", {{"path", "fits.txt"}}).IsOk());
}

TEST_CASE("read_file: escape is denied", "[mcp][fs]") {
    FsFixture fx;
    auto r = fx.Call("read_file", {{"path", "../../etc/passwd"}});
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::PathEscape);
    CHECK(r.Error().RpcCode() == -32001);
}

TEST_CASE("read_file: missing path argument", "[mcp][fs]") {
    FsFixture fx;
    auto r = fx.Call("read_file", nlohmann::json::object());
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::InvalidArguments);
    CHECK(r.Error().message == "Missing required parameter: path");
}

// ===========================================================================
// list_directory
// ===========================================================================

TEST_CASE("list_directory: sorted names, one chunk each", "[mcp][fs]") {
    FsFixture fx;
    fx.dir.WriteFile("b.txt", "b");
    fx.dir.WriteFile("a.txt", "a");
    fx.dir.MakeDir("c_dir");

    auto r = fx.Call("list_directory", {{"path", "."}});
    REQUIRE(r.IsOk());
    CHECK(r.Value().Texts() == std::vector<std::string>{"a.txt", "b.txt", "c_dir"});
}

TEST_CASE("list_directory: details show type and size", "[mcp][fs]") {
    FsFixture fx;
    fx.dir.WriteFile("docs/readme.md", "12345");
    fx.dir.MakeDir("docs/img");

    auto r = fx.Call("list_directory", {{"path", "docs"}, {"details", true}});
    REQUIRE(r.IsOk());
    auto texts = r.Value().Texts();
    REQUIRE(texts.size() == 2);
    CHECK(texts[0] == "DIR             0 bytes  img");
    CHECK(texts[1] == "FILE            5 bytes  readme.md");
}

TEST_CASE("list_directory: empty directory", "[mcp][fs]") {
    FsFixture fx;
    fx.dir.MakeDir("empty");
    auto r = fx.Call("list_directory", {{"path", "empty"}});
    REQUIRE(r.IsOk());
    CHECK(r.Value().content.empty());
}

TEST_CASE("list_directory: errors", "[mcp][fs]") {
    FsFixture fx;
    fx.dir.WriteFile("file.txt", "x");

    SECTION("missing") {
        auto r = fx.Call("list_directory", {{"path", "ghost"}});
        REQUIRE(r.IsErr());
        CHECK(r.Error().category == ErrorCategory::NotFound);
        CHECK(r.Error().message == "Directory not found: ghost");
    }
    SECTION("a file") {
        auto r = fx.Call("list_directory", {{"path", "file.txt"}});
        REQUIRE(r.IsErr());
        CHECK(r.Error().category == ErrorCategory::Io);
        CHECK(r.Error().message == "Not a directory: file.txt");
    }
    SECTION("outside") {
        auto r = fx.Call("list_directory", {{"path", ".."}});
        REQUIRE(r.IsErr());
        CHECK(r.Error().category == ErrorCategory::PathEscape);
    }
    SECTION("details of the wrong type") {
        auto r = fx.Call("list_directory", {{"path", "."}, {"details", "yes"}});
        REQUIRE(r.IsErr());
        CHECK(r.Error().category == ErrorCategory::InvalidArguments);
    }
}

// ===========================================================================
// write_file
// ===========================================================================

TEST_CASE("write_file: creates file and parents", "[mcp][fs]") {
    FsFixture fx;
    auto r = fx.Call("write_file", {{"path", "out/deep/result.txt"}, {"content", "hello"}});
    REQUIRE(r.IsOk());
    CHECK(r.Value().JoinedText() == "Successfully wrote 5 bytes to result.txt");
    CHECK(mcpfs::testing::ReadFile(fx.dir / "out/deep/result.txt") == "hello");
}

TEST_CASE("write_file: overwrites existing content", "[mcp][fs]") {
    FsFixture fx;
    fx.dir.WriteFile("f.txt", "a much longer original body");
    REQUIRE(fx.Call("write_file", {{"path", "f.txt"}, {"content", "short"}}).IsOk());
    CHECK(mcpfs::testing::ReadFile(fx.dir / "f.txt") == "short");
}

TEST_CASE("write_file: empty content", "[mcp][fs]") {
    FsFixture fx;
    auto r = fx.Call("write_file", {{"path", "zero.txt"}, {"content", ""}});
    REQUIRE(r.IsOk());
    CHECK(r.Value().JoinedText() == "Successfully wrote 0 bytes to zero.txt");
    CHECK(fs::file_size(fx.dir / "zero.txt") == 0);
}

TEST_CASE("write_file: directory target is rejected", "[mcp][fs]") {
    FsFixture fx;
    fx.dir.MakeDir("sub");
    auto r = fx.Call("write_file", {{"path", "sub"}, {"content", "x"}});
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Io);
    CHECK(r.Error().message == "Path is a directory: sub");
}

TEST_CASE("write_file: escape leaves the filesystem untouched", "[mcp][fs]") {
    mcpfs::testing::TempDir outside;
    FsFixture fx;
    fs::create_directory_symlink(outside.Path(), fx.dir.Path() / "link");

    auto via_dots = fx.Call("write_file",
                            {{"path", "../" + outside.Path().filename().string() + "/x.txt"},
                             {"content", "pwned"}});
    REQUIRE(via_dots.IsErr());
    CHECK(via_dots.Error().category == ErrorCategory::PathEscape);

    auto via_link = fx.Call("write_file", {{"path", "link/x.txt"}, {"content", "pwned"}});
    REQUIRE(via_link.IsErr());
    CHECK(via_link.Error().category == ErrorCategory::PathEscape);

    CHECK_FALSE(fs::exists(outside / "x.txt"));
}

TEST_CASE("write_file: dangling symlink pointing outside is denied", "[mcp][fs]") {
    mcpfs::testing::TempDir outside;
    FsFixture fx;
    fs::create_symlink(outside.Path() / "created.txt", fx.dir.Path() / "link");

    auto r = fx.Call("write_file", {{"path", "link"}, {"content", "escaped"}});
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::PathEscape);
    CHECK_FALSE(fs::exists(outside / "created.txt"));
}

TEST_CASE("write_file: content must be a string", "[mcp][fs]") {
    FsFixture fx;
    auto r = fx.Call("write_file", {{"path", "a.txt"}, {"content", 5}});
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::InvalidArguments);
    CHECK_FALSE(fs::exists(fx.dir / "a.txt"));
}

// ===========================================================================
// Concurrency
// ===========================================================================

TEST_CASE("FsTools: concurrent writes to distinct files", "[mcp][fs]") {
    FsFixture fx;
    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&fx, &failures, t] {
            auto name = "f" + std::to_string(t) + ".txt";
            auto w = fx.registry.Dispatch("write_file",
                                          {{"path", name}, {"content", name}});
            auto r = fx.registry.Dispatch("read_file", {{"path", name}});
            if (w.IsErr() || r.IsErr() || r.Value().JoinedText() != name) ++failures;
        });
    }
    for (auto& th : threads) th.join();
    CHECK(failures == 0);
}

// ===========================================================================
// IsValidUtf8
// ===========================================================================

TEST_CASE("IsValidUtf8: accepts and rejects", "[mcp][fs]") {
    CHECK(IsValidUtf8(""));
    CHECK(IsValidUtf8("plain ascii"));
    CHECK(IsValidUtf8("\xC3\xA9\xE2\x82\xAC\xF0\x9F\x98\x80"));
    CHECK_FALSE(IsValidUtf8("\xFF"));
    CHECK_FALSE(IsValidUtf8("\xC3"));               // truncated
    CHECK_FALSE(IsValidUtf8("\xC0\xAF"));           // overlong
    CHECK_FALSE(IsValidUtf8("\xED\xA0\x80"));       // surrogate
    CHECK_FALSE(IsValidUtf8("\xF4\x90\x80\x80"));   // above U+10FFFF
}
