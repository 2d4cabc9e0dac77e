#include <doctest/doctest.h>
#include <crosspath/converter.hpp>

using namespace crosspath;

namespace {

std::string to_unix(const PathStyleConverter& c, const std::string& path) {
    auto r = c.convert(path, PathStyle::Auto, PathStyle::Unix);
    REQUIRE_MESSAGE(r.ok, error_to_string(r.error));
    return r.value;
}

std::string to_windows(const PathStyleConverter& c, const std::string& path) {
    auto r = c.convert(path, PathStyle::Auto, PathStyle::Windows);
    REQUIRE_MESSAGE(r.ok, error_to_string(r.error));
    return r.value;
}

} // namespace

// ============================================================================
// Windows -> Unix
// ============================================================================

TEST_CASE("drive paths use the default mappings") {
    PathStyleConverter c(default_path_config());
    CHECK(to_unix(c, R"(C:\Users\John\file.txt)") == "/mnt/c/Users/John/file.txt");
    CHECK(to_unix(c, R"(c:\Users\test)") == "/mnt/c/Users/test");
    CHECK(to_unix(c, R"(E:\)") == "/mnt/e");
    CHECK(to_unix(c, "D:") == "/mnt/d");
    CHECK(to_unix(c, "C:/Users/test/") == "/mnt/c/Users/test");
}

TEST_CASE("unmapped drives fall back to mount_root") {
    PathStyleConverter c(default_path_config());
    CHECK(to_unix(c, R"(Z:\data\x)") == "/mnt/z/data/x");

    PathConfig root;
    root.mount_root = "/";
    PathStyleConverter at_root(root);
    CHECK(to_unix(at_root, R"(Q:\x)") == "/q/x");
}

TEST_CASE("unmapped drive without mount_root is an error") {
    PathConfig config = default_path_config();
    config.mount_root = "";
    PathStyleConverter c(config);
    auto r = c.convert(R"(Q:\x)", PathStyle::Auto, PathStyle::Unix);
    CHECK_FALSE(r.ok);
    CHECK(r.error.conversion == ConversionError::InvalidDriveMapping);
}

TEST_CASE("UNC and rooted Windows paths") {
    PathStyleConverter c(default_path_config());
    CHECK(to_unix(c, R"(\\server\share\dir\file)") == "//server/share/dir/file");
    CHECK(to_unix(c, R"(\\server\share)") == "//server/share");
    CHECK(to_unix(c, R"(\temp\x)") == "/temp/x");
}

TEST_CASE("custom drive mapping") {
    PathConfig config = default_path_config();
    config.drive_mappings = {{"D:", "/mnt/data"}};
    PathStyleConverter c(config);
    CHECK(to_unix(c, R"(D:\Data\file.txt)") == "/mnt/data/Data/file.txt");
    CHECK(to_windows(c, "/mnt/data/x") == R"(D:\x)");
}

TEST_CASE("first mapping for a drive wins") {
    PathConfig config = default_path_config();
    config.drive_mappings = {{"C:", "/first"}, {"c:", "/second"}};
    PathStyleConverter c(config);
    CHECK(to_unix(c, R"(C:\a)") == "/first/a");
}

TEST_CASE("mount trailing separators are ignored") {
    PathConfig config = default_path_config();
    config.drive_mappings = {{"C:", "/mnt/c/"}};
    PathStyleConverter c(config);
    CHECK(to_unix(c, R"(C:\a)") == "/mnt/c/a");
    CHECK(to_windows(c, "/mnt/c/a") == R"(C:\a)");
}

// ============================================================================
// Unix -> Windows
// ============================================================================

TEST_CASE("mounted paths map back to their drive") {
    PathStyleConverter c(default_path_config());
    CHECK(to_windows(c, "/mnt/c/Users/test/file.txt") == R"(C:\Users\test\file.txt)");
    CHECK(to_windows(c, "/mnt/d") == R"(D:\)");
    CHECK(to_windows(c, "/mnt/z/data") == R"(Z:\data)");
}

TEST_CASE("unmapped absolute paths go under the default drive") {
    PathStyleConverter c(default_path_config());
    CHECK(to_windows(c, "/home/john/file.txt") == R"(C:\home\john\file.txt)");
    CHECK(to_windows(c, "/") == R"(C:\)");
    CHECK(to_windows(c, "/mnt") == R"(C:\mnt)");
    CHECK(to_windows(c, "/mnt/data") == R"(C:\mnt\data)");

    PathConfig config = default_path_config();
    config.default_drive = "d:";
    PathStyleConverter d(config);
    CHECK(to_windows(d, "/home") == R"(D:\home)");
}

TEST_CASE("no default drive is an error") {
    PathConfig config = default_path_config();
    config.default_drive = "";
    PathStyleConverter c(config);
    auto r = c.convert("/home/john", PathStyle::Auto, PathStyle::Windows);
    CHECK_FALSE(r.ok);
    CHECK(r.error.kind == ErrorKind::Conversion);
    CHECK(r.error.conversion == ConversionError::InvalidDriveMapping);
}

TEST_CASE("longest mount wins") {
    PathConfig config = default_path_config();
    config.drive_mappings = {{"C:", "/mnt"}, {"D:", "/mnt/data"}};
    PathStyleConverter c(config);
    CHECK(to_windows(c, "/mnt/data/x") == R"(D:\x)");
    CHECK(to_windows(c, "/mnt/other") == R"(C:\other)");
    CHECK(to_windows(c, "/mnt/database") == R"(C:\database)");
}

TEST_CASE("a root mount catches every absolute path") {
    PathConfig config = default_path_config();
    config.drive_mappings = {{"R:", "/"}, {"D:", "/data"}};
    PathStyleConverter c(config);
    CHECK(to_unix(c, R"(R:\srv)") == "/srv");
    CHECK(to_windows(c, "/srv/www") == R"(R:\srv\www)");
    CHECK(to_windows(c, "/data/x") == R"(D:\x)");
}

TEST_CASE("Unix UNC paths") {
    PathStyleConverter c(default_path_config());
    CHECK(to_windows(c, "//server/share/dir") == R"(\\server\share\dir)");
}

// ============================================================================
// Style resolution
// ============================================================================

TEST_CASE("relative paths only change separators") {
    PathStyleConverter c(default_path_config());
    CHECK(to_unix(c, R"(foo/bar\baz)") == "foo/bar/baz");
    CHECK(to_windows(c, R"(foo/bar\baz)") == R"(foo\bar\baz)");
}

TEST_CASE("auto target picks the other style") {
    PathStyleConverter c(default_path_config());

    auto win = c.convert(R"(C:\a)", PathStyle::Auto, PathStyle::Auto);
    REQUIRE(win.ok);
    CHECK(win.value == "/mnt/c/a");

    auto unix_path = c.convert("/mnt/c/a", PathStyle::Auto, PathStyle::Auto);
    REQUIRE(unix_path.ok);
    CHECK(unix_path.value == R"(C:\a)");

    auto declared = c.convert("foo/bar", PathStyle::Windows, PathStyle::Auto);
    REQUIRE(declared.ok);
    CHECK(declared.value == "foo/bar");
}

TEST_CASE("auto target with an ambiguous source fails") {
    PathStyleConverter c(default_path_config());
    auto r = c.convert("foo/bar", PathStyle::Auto, PathStyle::Auto);
    CHECK_FALSE(r.ok);
    CHECK(r.error.conversion == ConversionError::AmbiguousStyle);
}

TEST_CASE("path structure overrides a declared source style") {
    PathStyleConverter c(default_path_config());
    auto r = c.convert(R"(C:\a)", PathStyle::Unix, PathStyle::Auto);
    REQUIRE(r.ok);
    CHECK(r.value == "/mnt/c/a");
}

TEST_CASE("malformed UNC is reported") {
    PathStyleConverter c(default_path_config());
    auto r = c.convert(R"(\\server)", PathStyle::Auto, PathStyle::Unix);
    CHECK_FALSE(r.ok);
    CHECK(r.error.conversion == ConversionError::InvalidUncPath);
}

// ============================================================================
// Normalization during conversion
// ============================================================================

TEST_CASE("conversion normalizes by default") {
    PathStyleConverter c(default_path_config());
    CHECK(to_unix(c, R"(C:\Users\.\test\\docs\)") == "/mnt/c/Users/test/docs");
    CHECK(to_unix(c, "a/./b//c/") == "a/b/c");
    CHECK(to_unix(c, "a/..") == ".");
    CHECK(to_unix(c, "") == "");
}

TEST_CASE("parent references never leave the drive mount") {
    PathStyleConverter c(default_path_config());
    CHECK(to_unix(c, R"(C:\Users\..\..\Windows)") == "/mnt/c/Windows");
    CHECK(to_windows(c, "/mnt/c/../d/x") == R"(D:\x)");
}

TEST_CASE("normalize disabled keeps the segments") {
    PathConfig config = default_path_config();
    config.normalize = false;
    PathStyleConverter c(config);
    CHECK(to_unix(c, R"(C:\a\.\b)") == "/mnt/c/a/./b");
    CHECK(to_unix(c, R"(a\\b)") == "a//b");
    CHECK(to_windows(c, "x/../y") == R"(x\..\y)");
}

// ============================================================================
// Free functions
// ============================================================================

TEST_CASE("convert_path validates the config") {
    PathConfig config = default_path_config();
    config.drive_mappings = {{"CC", "/x"}};
    auto r = convert_path(R"(C:\a)", PathStyle::Windows, PathStyle::Unix, config);
    CHECK_FALSE(r.ok);
    CHECK(r.error.kind == ErrorKind::InvalidConfig);

    auto ok = convert_path(R"(C:\a)", PathStyle::Windows, PathStyle::Unix, default_path_config());
    REQUIRE(ok.ok);
    CHECK(ok.value == "/mnt/c/a");
}

TEST_CASE("normalize_path keeps the path's own style") {
    auto win = normalize_path("C:/Users//test/./x/..");
    REQUIRE(win.ok);
    CHECK(win.value == R"(C:\Users\test)");

    auto unix_path = normalize_path("/a//b/../c/");
    REQUIRE(unix_path.ok);
    CHECK(unix_path.value == "/a/c");

    auto rel_win = normalize_path(R"(foo\bar\..\baz)");
    REQUIRE(rel_win.ok);
    CHECK(rel_win.value == R"(foo\baz)");

    auto rel_unix = normalize_path("foo/bar/../baz");
    REQUIRE(rel_unix.ok);
    CHECK(rel_unix.value == "foo/baz");
}

TEST_CASE("normalize_path in an explicit style") {
    auto r = normalize_path(R"(c:\a\.\b)", PathStyle::Unix);
    REQUIRE(r.ok);
    CHECK(r.value == "/mnt/c/a/b");

    auto rel = normalize_path("a/b", PathStyle::Windows);
    REQUIRE(rel.ok);
    CHECK(rel.value == R"(a\b)");
}

TEST_CASE("normalize_path is idempotent") {
    const char* paths[] = {
        R"(C:\Users\..\x\.\y\)",
        "/a/./b/../../c",
        "../../a/b",
        R"(\\server\share\a\..\b)",
        "a/..",
        R"(\temp\\x)",
        "",
    };
    for (const char* p : paths) {
        auto once = normalize_path(p);
        REQUIRE(once.ok);
        auto twice = normalize_path(once.value);
        REQUIRE(twice.ok);
        CHECK(twice.value == once.value);
    }
}
