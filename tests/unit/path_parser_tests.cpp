#include <doctest/doctest.h>
#include <crosspath/path_parser.hpp>

using namespace crosspath;

using Parts = std::vector<std::string>;

TEST_CASE("split keeps empty components") {
    CHECK(split_components("").empty());
    CHECK(split_components("a") == Parts{"a"});
    CHECK(split_components("a/b\\c") == Parts{"a", "b", "c"});
    CHECK(split_components("a//b/") == Parts{"a", "", "b", ""});
}

// ============================================================================
// Classification
// ============================================================================

TEST_CASE("parse drive paths") {
    auto r = parse_path(R"(c:\Users\test)");
    REQUIRE(r.ok);
    CHECK(r.value.kind == PathKind::WindowsDrive);
    CHECK(r.value.drive == 'C');
    CHECK(r.value.components == Parts{"Users", "test"});

    SUBCASE("bare drive") {
        auto bare = parse_path("D:");
        REQUIRE(bare.ok);
        CHECK(bare.value.kind == PathKind::WindowsDrive);
        CHECK(bare.value.drive == 'D');
        CHECK(bare.value.components.empty());
    }

    SUBCASE("drive root") {
        auto root = parse_path(R"(C:\)");
        REQUIRE(root.ok);
        CHECK(root.value.components.empty());
    }

    SUBCASE("forward slashes after the drive") {
        auto fwd = parse_path("C:/Users/test");
        REQUIRE(fwd.ok);
        CHECK(fwd.value.kind == PathKind::WindowsDrive);
        CHECK(fwd.value.components == Parts{"Users", "test"});
    }

    SUBCASE("drive-relative text is not a drive path") {
        auto rel = parse_path("C:foo");
        REQUIRE(rel.ok);
        CHECK(rel.value.kind == PathKind::Relative);
    }
}

TEST_CASE("parse unix paths") {
    auto r = parse_path("/home/john/file.txt");
    REQUIRE(r.ok);
    CHECK(r.value.kind == PathKind::UnixAbsolute);
    CHECK(r.value.components == Parts{"home", "john", "file.txt"});

    auto root = parse_path("/");
    REQUIRE(root.ok);
    CHECK(root.value.kind == PathKind::UnixAbsolute);
    CHECK(root.value.components == Parts{""});
}

TEST_CASE("parse UNC paths") {
    auto win = parse_path(R"(\\server\share\dir\file)");
    REQUIRE(win.ok);
    CHECK(win.value.kind == PathKind::WindowsUnc);
    CHECK(win.value.server == "server");
    CHECK(win.value.share == "share");
    CHECK(win.value.components == Parts{"dir", "file"});
    CHECK(win.value.is_unc());

    auto unix_unc = parse_path("//server/share/dir");
    REQUIRE(unix_unc.ok);
    CHECK(unix_unc.value.kind == PathKind::UnixUnc);
    CHECK(unix_unc.value.server == "server");
    CHECK(unix_unc.value.components == Parts{"dir"});
}

TEST_CASE("UNC without share is rejected") {
    auto r = parse_path(R"(\\server)");
    CHECK_FALSE(r.ok);
    CHECK(r.error.kind == ErrorKind::Conversion);
    CHECK(r.error.conversion == ConversionError::InvalidUncPath);

    auto empty_server = parse_path(R"(\\\share)");
    CHECK_FALSE(empty_server.ok);
}

TEST_CASE("double slash without share is a plain absolute path") {
    auto r = parse_path("//server");
    REQUIRE(r.ok);
    CHECK(r.value.kind == PathKind::UnixAbsolute);
}

TEST_CASE("rooted and relative paths") {
    auto rooted = parse_path(R"(\Windows\Temp)");
    REQUIRE(rooted.ok);
    CHECK(rooted.value.kind == PathKind::WindowsRooted);
    CHECK(rooted.value.components == Parts{"Windows", "Temp"});

    auto rel = parse_path(R"(foo/bar\baz)");
    REQUIRE(rel.ok);
    CHECK(rel.value.kind == PathKind::Relative);
    CHECK_FALSE(rel.value.is_absolute());
    CHECK(rel.value.components == Parts{"foo", "bar", "baz"});
}

// ============================================================================
// Style detection
// ============================================================================

TEST_CASE("detect_style") {
    CHECK(detect_style(R"(C:\Users)") == PathStyle::Windows);
    CHECK(detect_style(R"(\\server\share)") == PathStyle::Windows);
    CHECK(detect_style(R"(\\broken)") == PathStyle::Windows);
    CHECK(detect_style(R"(\temp)") == PathStyle::Windows);
    CHECK(detect_style("/usr/local") == PathStyle::Unix);
    CHECK(detect_style("//server/share") == PathStyle::Unix);
    CHECK(detect_style("foo/bar") == PathStyle::Auto);
    CHECK(detect_style(R"(foo\bar)") == PathStyle::Auto);
    CHECK(detect_style("") == PathStyle::Auto);
}

// ============================================================================
// Normalization
// ============================================================================

TEST_CASE("normalize_components collapses dot segments") {
    CHECK(normalize_components({"a", "", ".", "b"}, false) == Parts{"a", "b"});
    CHECK(normalize_components({"a", "b", "..", "c"}, false) == Parts{"a", "c"});
    CHECK(normalize_components({"a", "b", ""}, true) == Parts{"a", "b"});
}

TEST_CASE("normalize_components keeps leading parent refs of relative paths") {
    CHECK(normalize_components({"..", "a"}, false) == Parts{"..", "a"});
    CHECK(normalize_components({"..", "..", "a"}, false) == Parts{"..", "..", "a"});
    CHECK(normalize_components({"a", "..", ".."}, false) == Parts{".."});
}

TEST_CASE("normalize_components stops at an absolute root") {
    CHECK(normalize_components({"..", "etc"}, true) == Parts{"etc"});
    CHECK(normalize_components({"a", "..", "..", "b"}, true) == Parts{"b"});
}
