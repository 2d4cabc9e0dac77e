#include <doctest/doctest.h>
#include <crosspath/encoding.hpp>

using namespace crosspath;

namespace {

std::vector<uint8_t> utf16le(const std::string& ascii, bool bom = false, bool nul = false) {
    std::vector<uint8_t> out;
    if (bom) {
        out.push_back(0xFF);
        out.push_back(0xFE);
    }
    for (char c : ascii) {
        out.push_back(static_cast<uint8_t>(c));
        out.push_back(0x00);
    }
    if (nul) {
        out.push_back(0x00);
        out.push_back(0x00);
    }
    return out;
}

} // namespace

// ============================================================================
// Detection
// ============================================================================

TEST_CASE("plain ASCII is UTF-8") {
    CHECK(detect_encoding(std::string("C:\\Users\\test")) == DetectedEncoding::UTF8);
    CHECK(detect_encoding(std::string("/home/john")) == DetectedEncoding::UTF8);
    CHECK(detect_encoding(std::string()) == DetectedEncoding::UTF8);
}

TEST_CASE("multibyte UTF-8 is UTF-8") {
    CHECK(detect_encoding(std::string("/home/j\xC3\xBCrgen")) == DetectedEncoding::UTF8);
    CHECK(detect_encoding(std::string("C:\\\xE6\x97\xA5\xE6\x9C\xAC")) == DetectedEncoding::UTF8);
}

TEST_CASE("UTF-16LE with and without BOM") {
    CHECK(detect_encoding(utf16le("C:\\a", true)) == DetectedEncoding::UTF16LE);
    CHECK(detect_encoding(utf16le("C:\\Users\\test")) == DetectedEncoding::UTF16LE);
    std::vector<uint8_t> bom_only = {0xFF, 0xFE};
    CHECK(detect_encoding(bom_only) == DetectedEncoding::UTF16LE);
}

TEST_CASE("Windows-1252 high bytes") {
    std::string bytes = "C:\\Users\\\x93\x65\x88\x97\\file.txt";
    CHECK_FALSE(is_valid_utf8(bytes));
    CHECK(detect_encoding(bytes) == DetectedEncoding::Windows1252);
}

TEST_CASE("undefined Windows-1252 bytes are Unknown") {
    CHECK(detect_encoding(std::string("\x81\x8D")) == DetectedEncoding::Unknown);
    CHECK(detect_encoding(std::string("a\x01\xFF")) == DetectedEncoding::Unknown);
}

TEST_CASE("strict UTF-8 validation") {
    CHECK(is_valid_utf8("abc"));
    CHECK(is_valid_utf8("\xF0\x9F\x98\x80"));
    CHECK_FALSE(is_valid_utf8("\xC0\xAF"));          // overlong '/'
    CHECK_FALSE(is_valid_utf8("\xED\xA0\x80"));      // surrogate
    CHECK_FALSE(is_valid_utf8("\xE6\x97"));          // truncated
    CHECK_FALSE(is_valid_utf8("\xF4\x90\x80\x80"));  // above U+10FFFF
}

// ============================================================================
// Decoding
// ============================================================================

TEST_CASE("to_utf8 passes UTF-8 through") {
    auto r = to_utf8(std::string("/home/j\xC3\xBCrgen"));
    REQUIRE(r.ok);
    CHECK(r.value == "/home/j\xC3\xBCrgen");
    CHECK(r.warnings.empty());
}

TEST_CASE("UTF-8 BOM is stripped") {
    auto r = decode_path_bytes("\xEF\xBB\xBF/tmp/x");
    REQUIRE(r.ok);
    CHECK(r.value.encoding == DetectedEncoding::UTF8);
    CHECK(r.value.text == "/tmp/x");
}

TEST_CASE("Windows-1252 decodes to the mapped characters") {
    auto r = decode_path_bytes("C:\\Users\\\x93\x65\x88\x97\\file.txt");
    REQUIRE(r.ok);
    CHECK(r.value.encoding == DetectedEncoding::Windows1252);
    CHECK_FALSE(r.value.lossy);
    // U+201C e U+02C6 U+2014
    CHECK(r.value.text == "C:\\Users\\\xE2\x80\x9C" "e\xCB\x86\xE2\x80\x94\\file.txt");
}

TEST_CASE("Latin-1 range of Windows-1252") {
    auto r = to_utf8(std::string("caf\xE9"));
    REQUIRE(r.ok);
    CHECK(r.value == "caf\xC3\xA9");
}

TEST_CASE("UTF-16LE decodes with BOM and terminator removed") {
    auto bytes = utf16le("C:\\a\\b", true, true);
    auto decoded = to_utf8(bytes);
    REQUIRE(decoded.ok);
    CHECK(decoded.value == "C:\\a\\b");
}

TEST_CASE("UTF-16LE surrogate pairs") {
    // "/a" + U+1F600 + "b"
    std::vector<uint8_t> bytes = {0xFF, 0xFE, '/', 0, 'a', 0, 0x3D, 0xD8, 0x00, 0xDE, 'b', 0};
    auto r = to_utf8(bytes);
    REQUIRE(r.ok);
    CHECK(r.value == "/a\xF0\x9F\x98\x80" "b");
}

TEST_CASE("unpaired surrogate is MalformedUtf16 unless preserved") {
    std::vector<uint8_t> bytes = {0xFF, 0xFE, 'a', 0, 0x3D, 0xD8, 'b', 0};

    auto strict = to_utf8(bytes, false);
    CHECK_FALSE(strict.ok);
    CHECK(strict.error.kind == ErrorKind::Encoding);
    CHECK(strict.error.encoding == EncodingError::MalformedUtf16);

    auto lossy = decode_path_bytes(std::string(bytes.begin(), bytes.end()), true);
    REQUIRE(lossy.ok);
    CHECK(lossy.value.lossy);
    CHECK(lossy.value.text == "a\xEF\xBF\xBD" "b");
    REQUIRE(lossy.warnings.size() == 1);
    CHECK(lossy.warnings[0] == "lossy_decode:UTF16LE");
}

TEST_CASE("odd-length UTF-16LE after a BOM is malformed") {
    std::vector<uint8_t> bytes = {0xFF, 0xFE, 'a', 0, 'b'};
    auto r = to_utf8(bytes);
    CHECK_FALSE(r.ok);
    CHECK(r.error.encoding == EncodingError::MalformedUtf16);
}

TEST_CASE("Unknown bytes fail without preserve_encoding") {
    auto r = decode_path_bytes("\x81\x8D", false);
    CHECK_FALSE(r.ok);
    CHECK(r.error.kind == ErrorKind::Encoding);
    CHECK(r.error.encoding == EncodingError::Undecodable);
}

TEST_CASE("Unknown bytes decode lossily with preserve_encoding") {
    auto r = decode_path_bytes("a\x81" "b", true);
    REQUIRE(r.ok);
    CHECK(r.value.encoding == DetectedEncoding::Unknown);
    CHECK(r.value.lossy);
    CHECK(r.value.text == "a\xEF\xBF\xBD" "b");
    REQUIRE(r.warnings.size() == 1);
    CHECK(r.warnings[0] == "lossy_decode:Unknown");
}

// ============================================================================
// Encoding
// ============================================================================

TEST_CASE("from_utf8 to UTF-16LE") {
    auto r = from_utf8("C:\\a", DetectedEncoding::UTF16LE);
    REQUIRE(r.ok);
    CHECK(r.value == utf16le("C:\\a"));

    auto back = to_utf8(r.value);
    REQUIRE(back.ok);
    CHECK(back.value == "C:\\a");
}

TEST_CASE("from_utf8 to Windows-1252") {
    auto r = from_utf8("\xE2\x80\x9C" "e\xCB\x86\xE2\x80\x94", DetectedEncoding::Windows1252);
    REQUIRE(r.ok);
    std::vector<uint8_t> expected = {0x93, 0x65, 0x88, 0x97};
    CHECK(r.value == expected);

    auto unmappable = from_utf8("\xE6\x97\xA5", DetectedEncoding::Windows1252);
    CHECK_FALSE(unmappable.ok);
    CHECK(unmappable.error.encoding == EncodingError::Undecodable);
    CHECK(unmappable.error.message.find("U+65E5") != std::string::npos);
}

TEST_CASE("from_utf8 rejects Unknown target and invalid input") {
    CHECK_FALSE(from_utf8("abc", DetectedEncoding::Unknown).ok);
    CHECK_FALSE(from_utf8("\xC0\xAF", DetectedEncoding::UTF8).ok);
}
