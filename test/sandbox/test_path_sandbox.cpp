#include <catch2/catch_test_macros.hpp>

#include <mcpfs/sandbox/path_sandbox.hpp>

#include "mocks/temp_dir.hpp"

#include <filesystem>
#include <string>

using namespace mcpfs;
namespace fs = std::filesystem;

namespace {

PathSandbox MakeSandbox(const mcpfs::testing::TempDir& dir) {
    auto sandbox = PathSandbox::Create(dir.Path());
    REQUIRE(sandbox.IsOk());
    return std::move(sandbox).Value();
}

} // anonymous namespace

// ===========================================================================
// Create
// ===========================================================================

TEST_CASE("PathSandbox: Create canonicalizes the root", "[sandbox]") {
    mcpfs::testing::TempDir dir;
    dir.MakeDir("sub");
    auto sandbox = PathSandbox::Create(dir.Path() / "sub" / "..");
    REQUIRE(sandbox.IsOk());
    CHECK(sandbox.Value().Root() == dir.Path());
}

TEST_CASE("PathSandbox: Create rejects missing and non-directory roots", "[sandbox]") {
    mcpfs::testing::TempDir dir;
    auto file = dir.WriteFile("plain.txt", "x");

    SECTION("missing") {
        auto r = PathSandbox::Create(dir / "nope");
        REQUIRE(r.IsErr());
        CHECK(r.Error().category == ErrorCategory::Config);
    }
    SECTION("regular file") {
        auto r = PathSandbox::Create(file);
        REQUIRE(r.IsErr());
        CHECK(r.Error().category == ErrorCategory::Config);
    }
    SECTION("empty") {
        auto r = PathSandbox::Create(fs::path());
        REQUIRE(r.IsErr());
        CHECK(r.Error().category == ErrorCategory::Config);
    }
}

// ===========================================================================
// Validate: accepted paths
// ===========================================================================

TEST_CASE("PathSandbox: relative paths resolve under the root", "[sandbox]") {
    mcpfs::testing::TempDir dir;
    dir.WriteFile("docs/a.txt", "a");
    auto sandbox = MakeSandbox(dir);

    SECTION("existing file") {
        auto r = sandbox.Validate("docs/a.txt");
        REQUIRE(r.IsOk());
        CHECK(r.Value() == dir.Path() / "docs" / "a.txt");
    }
    SECTION("dot is the root") {
        auto r = sandbox.Validate(".");
        REQUIRE(r.IsOk());
        CHECK(r.Value() == dir.Path());
    }
    SECTION("empty is the root") {
        auto r = sandbox.Validate("");
        REQUIRE(r.IsOk());
        CHECK(r.Value() == dir.Path());
    }
    SECTION("inner dot-dot that stays inside") {
        auto r = sandbox.Validate("docs/../docs/./a.txt");
        REQUIRE(r.IsOk());
        CHECK(r.Value() == dir.Path() / "docs" / "a.txt");
    }
    SECTION("trailing separator") {
        auto r = sandbox.Validate("docs/");
        REQUIRE(r.IsOk());
        CHECK(r.Value() == dir.Path() / "docs");
    }
    SECTION("not-yet-existing file") {
        auto r = sandbox.Validate("new/dir/file.txt");
        REQUIRE(r.IsOk());
        CHECK(r.Value() == dir.Path() / "new" / "dir" / "file.txt");
    }
}

TEST_CASE("PathSandbox: absolute path inside the root is accepted", "[sandbox]") {
    mcpfs::testing::TempDir dir;
    dir.WriteFile("a.txt", "a");
    auto sandbox = MakeSandbox(dir);

    auto r = sandbox.Validate((dir.Path() / "a.txt").string());
    REQUIRE(r.IsOk());
    CHECK(r.Value() == dir.Path() / "a.txt");
}

TEST_CASE("PathSandbox: symlink pointing inside is accepted", "[sandbox]") {
    mcpfs::testing::TempDir dir;
    dir.WriteFile("real/a.txt", "a");
    fs::create_directory_symlink(dir.Path() / "real", dir.Path() / "alias");
    auto sandbox = MakeSandbox(dir);

    auto r = sandbox.Validate("alias/a.txt");
    REQUIRE(r.IsOk());
    CHECK(r.Value() == dir.Path() / "real" / "a.txt");
}

// ===========================================================================
// Validate: escapes
// ===========================================================================

TEST_CASE("PathSandbox: dot-dot escapes are denied", "[sandbox]") {
    mcpfs::testing::TempDir dir;
    dir.MakeDir("inner");
    auto sandbox = MakeSandbox(dir);

    for (const char* raw : {"..", "../x.txt", "inner/../../x", "inner/../.."}) {
        auto r = sandbox.Validate(raw);
        REQUIRE(r.IsErr());
        CHECK(r.Error().category == ErrorCategory::PathEscape);
        CHECK(r.Error().message.find("Access denied") != std::string::npos);
        CHECK(r.Error().message.find("outside allowed directory") != std::string::npos);
        CHECK(r.Error().hint.has_value());
    }
}

TEST_CASE("PathSandbox: absolute path outside is denied", "[sandbox]") {
    mcpfs::testing::TempDir dir;
    auto sandbox = MakeSandbox(dir);

    auto r = sandbox.Validate("/etc/passwd");
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::PathEscape);
    CHECK(r.Error().target == "/etc/passwd");
}

TEST_CASE("PathSandbox: sibling with shared prefix is denied", "[sandbox]") {
    mcpfs::testing::TempDir outer;
    outer.MakeDir("data");
    outer.WriteFile("data-evil/secret.txt", "s");
    auto sandbox = PathSandbox::Create(outer / "data");
    REQUIRE(sandbox.IsOk());

    auto r = sandbox.Value().Validate("../data-evil/secret.txt");
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::PathEscape);

    auto abs = sandbox.Value().Validate((outer / "data-evil" / "secret.txt").string());
    REQUIRE(abs.IsErr());
    CHECK(abs.Error().category == ErrorCategory::PathEscape);
}

TEST_CASE("PathSandbox: symlink pointing outside is denied", "[sandbox]") {
    mcpfs::testing::TempDir outside;
    outside.WriteFile("secret.txt", "s");
    mcpfs::testing::TempDir dir;
    fs::create_directory_symlink(outside.Path(), dir.Path() / "link");
    fs::create_symlink(outside.Path() / "secret.txt", dir.Path() / "file-link");
    auto sandbox = MakeSandbox(dir);

    SECTION("through a directory link") {
        auto r = sandbox.Validate("link/secret.txt");
        REQUIRE(r.IsErr());
        CHECK(r.Error().category == ErrorCategory::PathEscape);
    }
    SECTION("file link") {
        auto r = sandbox.Validate("file-link");
        REQUIRE(r.IsErr());
        CHECK(r.Error().category == ErrorCategory::PathEscape);
    }
    SECTION("new file below an escaping link") {
        auto r = sandbox.Validate("link/new.txt");
        REQUIRE(r.IsErr());
        CHECK(r.Error().category == ErrorCategory::PathEscape);
    }
}

TEST_CASE("PathSandbox: dangling symlink pointing outside is denied", "[sandbox]") {
    mcpfs::testing::TempDir outside;
    mcpfs::testing::TempDir dir;
    fs::create_symlink(outside.Path() / "absent.txt", dir.Path() / "abs-link");
    fs::create_symlink(fs::path("..") / outside.Path().filename() / "absent.txt",
                       dir.Path() / "rel-link");
    fs::create_symlink(dir.Path() / "abs-link", dir.Path() / "chain");
    auto sandbox = MakeSandbox(dir);

    for (const char* raw : {"abs-link", "rel-link", "chain"}) {
        auto r = sandbox.Validate(raw);
        REQUIRE(r.IsErr());
        CHECK(r.Error().category == ErrorCategory::PathEscape);
    }
}

TEST_CASE("PathSandbox: dangling symlink pointing inside resolves to its target", "[sandbox]") {
    mcpfs::testing::TempDir dir;
    fs::create_symlink("later.txt", dir.Path() / "link");
    auto sandbox = MakeSandbox(dir);

    auto r = sandbox.Validate("link");
    REQUIRE(r.IsOk());
    CHECK(r.Value() == dir.Path() / "later.txt");
}

TEST_CASE("PathSandbox: symlink loop is an Io error", "[sandbox]") {
    mcpfs::testing::TempDir dir;
    fs::create_symlink("b", dir.Path() / "a");
    fs::create_symlink("a", dir.Path() / "b");
    auto sandbox = MakeSandbox(dir);

    auto r = sandbox.Validate("a");
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Io);
}

TEST_CASE("PathSandbox: NUL byte is invalid", "[sandbox]") {
    mcpfs::testing::TempDir dir;
    auto sandbox = MakeSandbox(dir);

    auto r = sandbox.Validate(std::string("a\0b", 3));
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::InvalidArguments);
}

// ===========================================================================
// Idempotence
// ===========================================================================

TEST_CASE("PathSandbox: validating a validated path returns it unchanged", "[sandbox]") {
    mcpfs::testing::TempDir dir;
    dir.WriteFile("real/a.txt", "a");
    fs::create_directory_symlink(dir.Path() / "real", dir.Path() / "alias");
    auto sandbox = MakeSandbox(dir);

    for (const char* raw : {"real/a.txt", "alias/a.txt", "missing/new.txt", "real/",
                            "real/../real/./a.txt", ""}) {
        auto once = sandbox.Validate(raw);
        REQUIRE(once.IsOk());
        auto twice = sandbox.Validate(once.Value().string());
        REQUIRE(twice.IsOk());
        CHECK(twice.Value() == once.Value());
    }
}

// ===========================================================================
// IsWithin
// ===========================================================================

TEST_CASE("PathSandbox: IsWithin compares whole components", "[sandbox]") {
    CHECK(PathSandbox::IsWithin("/data", "/data"));
    CHECK(PathSandbox::IsWithin("/data", "/data/a/b"));
    CHECK_FALSE(PathSandbox::IsWithin("/data", "/data-evil"));
    CHECK_FALSE(PathSandbox::IsWithin("/data", "/"));
    CHECK_FALSE(PathSandbox::IsWithin("/data/a", "/data"));
}
