#include "crosspath/encoding.hpp"

#include <spdlog/spdlog.h>

#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>
#include <vector>

namespace crosspath {

namespace {

// Windows-1252 0x80-0x9F; 0 marks the five undefined bytes
constexpr char32_t kWindows1252High[32] = {
    0x20AC, 0,      0x201A, 0x0192, 0x201E, 0x2026, 0x2020, 0x2021,
    0x02C6, 0x2030, 0x0160, 0x2039, 0x0152, 0,      0x017D, 0,
    0,      0x2018, 0x2019, 0x201C, 0x201D, 0x2022, 0x2013, 0x2014,
    0x02DC, 0x2122, 0x0161, 0x203A, 0x0153, 0,      0x017E, 0x0178,
};

inline uint8_t byte_at(const std::string& s, size_t i) {
    return static_cast<uint8_t>(s[i]);
}

inline bool is_continuation(uint8_t b) {
    return (b & 0xC0) == 0x80;
}

// Length of the well-formed UTF-8 sequence starting at i, or 0
size_t utf8_sequence_length(const std::string& s, size_t i) {
    uint8_t b0 = byte_at(s, i);
    size_t remaining = s.size() - i;

    if (b0 < 0x80) return 1;

    if (b0 >= 0xC2 && b0 <= 0xDF) {
        return (remaining >= 2 && is_continuation(byte_at(s, i + 1))) ? 2 : 0;
    }

    if (b0 >= 0xE0 && b0 <= 0xEF) {
        if (remaining < 3) return 0;
        uint8_t b1 = byte_at(s, i + 1);
        uint8_t lo = 0x80;
        uint8_t hi = 0xBF;
        if (b0 == 0xE0) lo = 0xA0;       // overlong
        if (b0 == 0xED) hi = 0x9F;       // surrogates
        if (b1 < lo || b1 > hi) return 0;
        return is_continuation(byte_at(s, i + 2)) ? 3 : 0;
    }

    if (b0 >= 0xF0 && b0 <= 0xF4) {
        if (remaining < 4) return 0;
        uint8_t b1 = byte_at(s, i + 1);
        uint8_t lo = 0x80;
        uint8_t hi = 0xBF;
        if (b0 == 0xF0) lo = 0x90;       // overlong
        if (b0 == 0xF4) hi = 0x8F;       // above U+10FFFF
        if (b1 < lo || b1 > hi) return 0;
        return (is_continuation(byte_at(s, i + 2)) && is_continuation(byte_at(s, i + 3))) ? 4 : 0;
    }

    return 0;
}

void append_utf8(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

std::optional<std::vector<char32_t>> decode_codepoints(const std::string& text) {
    std::vector<char32_t> cps;
    size_t i = 0;
    while (i < text.size()) {
        size_t len = utf8_sequence_length(text, i);
        if (len == 0) {
            return std::nullopt;
        }
        uint8_t b0 = byte_at(text, i);
        char32_t cp = 0;
        switch (len) {
            case 1: cp = b0; break;
            case 2: cp = b0 & 0x1F; break;
            case 3: cp = b0 & 0x0F; break;
            default: cp = b0 & 0x07; break;
        }
        for (size_t k = 1; k < len; ++k) {
            cp = (cp << 6) | (byte_at(text, i + k) & 0x3F);
        }
        cps.push_back(cp);
        i += len;
    }
    return cps;
}

std::string codepoint_label(char32_t cp) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "U+%04X", static_cast<unsigned>(cp));
    return buf;
}

bool has_utf16le_bom(const std::string& b) {
    return b.size() >= 2 && byte_at(b, 0) == 0xFF && byte_at(b, 1) == 0xFE;
}

bool has_utf8_bom(const std::string& b) {
    return b.size() >= 3 && byte_at(b, 0) == 0xEF && byte_at(b, 1) == 0xBB && byte_at(b, 2) == 0xBF;
}

// At least two code units and three quarters of them ASCII-range LE units
bool looks_like_utf16le(const std::string& b) {
    if (b.size() < 4 || b.size() % 2 != 0) {
        return false;
    }
    size_t units = b.size() / 2;
    size_t ascii_units = 0;
    for (size_t i = 0; i < units; ++i) {
        uint8_t lo = byte_at(b, 2 * i);
        uint8_t hi = byte_at(b, 2 * i + 1);
        if (lo != 0 && lo < 0x80 && hi == 0) {
            ++ascii_units;
        }
    }
    return ascii_units * 4 >= units * 3;
}

bool is_windows1252_byte(uint8_t b) {
    if (b >= 0x20 && b <= 0x7E) return true;
    if (b >= 0xA0) return true;
    if (b >= 0x80 && b <= 0x9F) return kWindows1252High[b - 0x80] != 0;
    return false;
}

bool is_windows1252_text(const std::string& b) {
    for (char c : b) {
        if (!is_windows1252_byte(static_cast<uint8_t>(c))) {
            return false;
        }
    }
    return true;
}

std::string decode_windows1252(const std::string& b) {
    std::string out;
    out.reserve(b.size());
    for (char c : b) {
        uint8_t byte = static_cast<uint8_t>(c);
        if (byte >= 0x80 && byte <= 0x9F) {
            append_utf8(out, kWindows1252High[byte - 0x80]);
        } else {
            append_utf8(out, byte);
        }
    }
    return out;
}

// Valid sequences copied through, each bad byte replaced
std::string decode_utf8_lossy(const std::string& b) {
    std::string out;
    size_t i = 0;
    while (i < b.size()) {
        size_t len = utf8_sequence_length(b, i);
        if (len == 0) {
            append_utf8(out, REPLACEMENT_CODEPOINT);
            ++i;
        } else {
            out.append(b, i, len);
            i += len;
        }
    }
    return out;
}

Result<DecodedText> decode_utf16le(const std::string& b, bool preserve_encoding) {
    DecodedText decoded;
    decoded.encoding = DetectedEncoding::UTF16LE;

    size_t start = has_utf16le_bom(b) ? 2 : 0;
    size_t units = (b.size() - start) / 2;
    bool odd = (b.size() - start) % 2 != 0;

    auto unit_at = [&](size_t i) -> char16_t {
        size_t pos = start + 2 * i;
        return static_cast<char16_t>(byte_at(b, pos) | (byte_at(b, pos + 1) << 8));
    };

    // Drop a single NUL terminator
    if (units > 0 && unit_at(units - 1) == 0) {
        --units;
    }

    for (size_t i = 0; i < units; ++i) {
        char16_t u = unit_at(i);
        if (u >= 0xD800 && u <= 0xDBFF) {
            if (i + 1 < units) {
                char16_t next = unit_at(i + 1);
                if (next >= 0xDC00 && next <= 0xDFFF) {
                    char32_t cp = 0x10000 + ((static_cast<char32_t>(u) - 0xD800) << 10) +
                                  (static_cast<char32_t>(next) - 0xDC00);
                    append_utf8(decoded.text, cp);
                    ++i;
                    continue;
                }
            }
        } else if (u < 0xDC00 || u > 0xDFFF) {
            append_utf8(decoded.text, u);
            continue;
        }

        if (!preserve_encoding) {
            return make_failure<DecodedText>(make_encoding_error(
                EncodingError::MalformedUtf16,
                "unpaired UTF-16 surrogate at code unit " + std::to_string(i)));
        }
        append_utf8(decoded.text, REPLACEMENT_CODEPOINT);
        decoded.lossy = true;
    }

    if (odd) {
        if (!preserve_encoding) {
            return make_failure<DecodedText>(make_encoding_error(
                EncodingError::MalformedUtf16, "odd number of bytes in UTF-16 input"));
        }
        append_utf8(decoded.text, REPLACEMENT_CODEPOINT);
        decoded.lossy = true;
    }

    return make_ok(std::move(decoded));
}

} // namespace

bool is_valid_utf8(const std::string& bytes) {
    size_t i = 0;
    while (i < bytes.size()) {
        size_t len = utf8_sequence_length(bytes, i);
        if (len == 0) {
            return false;
        }
        i += len;
    }
    return true;
}

DetectedEncoding detect_encoding(const std::string& bytes) {
    if (has_utf16le_bom(bytes) || looks_like_utf16le(bytes)) {
        return DetectedEncoding::UTF16LE;
    }
    if (is_valid_utf8(bytes)) {
        return DetectedEncoding::UTF8;
    }
    if (is_windows1252_text(bytes)) {
        return DetectedEncoding::Windows1252;
    }
    return DetectedEncoding::Unknown;
}

DetectedEncoding detect_encoding(const std::vector<uint8_t>& bytes) {
    return detect_encoding(std::string(bytes.begin(), bytes.end()));
}

Result<DecodedText> decode_path_bytes(const std::string& bytes, bool preserve_encoding) {
    DetectedEncoding encoding = detect_encoding(bytes);
    Result<DecodedText> result;

    switch (encoding) {
        case DetectedEncoding::UTF16LE:
            result = decode_utf16le(bytes, preserve_encoding);
            break;

        case DetectedEncoding::UTF8: {
            DecodedText decoded;
            decoded.encoding = encoding;
            decoded.text = has_utf8_bom(bytes) ? bytes.substr(3) : bytes;
            result = make_ok(std::move(decoded));
            break;
        }

        case DetectedEncoding::Windows1252: {
            DecodedText decoded;
            decoded.encoding = encoding;
            decoded.text = decode_windows1252(bytes);
            result = make_ok(std::move(decoded));
            break;
        }

        case DetectedEncoding::Unknown:
        default: {
            if (!preserve_encoding) {
                return make_failure<DecodedText>(make_encoding_error(
                    EncodingError::Undecodable,
                    "bytes are not UTF-8, UTF-16LE or Windows-1252"));
            }
            DecodedText decoded;
            decoded.encoding = DetectedEncoding::Unknown;
            decoded.text = decode_utf8_lossy(bytes);
            decoded.lossy = true;
            result = make_ok(std::move(decoded));
            break;
        }
    }

    if (result.ok && result.value.lossy) {
        std::string warning = std::string("lossy_decode:") + encoding_to_string(result.value.encoding);
        spdlog::warn("Undecodable path bytes replaced with U+FFFD ({})",
                     encoding_name(result.value.encoding));
        result.warnings.push_back(warning);
    }
    return result;
}

Result<std::string> to_utf8(const std::string& bytes, bool preserve_encoding) {
    auto decoded = decode_path_bytes(bytes, preserve_encoding);
    Result<std::string> result;
    result.ok = decoded.ok;
    result.error = decoded.error;
    result.warnings = decoded.warnings;
    if (decoded.ok) {
        result.value = std::move(decoded.value.text);
    }
    return result;
}

Result<std::string> to_utf8(const std::vector<uint8_t>& bytes, bool preserve_encoding) {
    return to_utf8(std::string(bytes.begin(), bytes.end()), preserve_encoding);
}

Result<std::vector<uint8_t>> from_utf8(const std::string& text, DetectedEncoding target) {
    auto cps = decode_codepoints(text);
    if (!cps) {
        return make_failure<std::vector<uint8_t>>(make_encoding_error(
            EncodingError::Undecodable, "input is not valid UTF-8"));
    }

    std::vector<uint8_t> out;
    switch (target) {
        case DetectedEncoding::UTF8:
            out.assign(text.begin(), text.end());
            break;

        case DetectedEncoding::UTF16LE:
            out.reserve(cps->size() * 2);
            for (char32_t cp : *cps) {
                if (cp >= 0x10000) {
                    char32_t v = cp - 0x10000;
                    char16_t hi = static_cast<char16_t>(0xD800 + (v >> 10));
                    char16_t lo = static_cast<char16_t>(0xDC00 + (v & 0x3FF));
                    out.push_back(static_cast<uint8_t>(hi & 0xFF));
                    out.push_back(static_cast<uint8_t>(hi >> 8));
                    out.push_back(static_cast<uint8_t>(lo & 0xFF));
                    out.push_back(static_cast<uint8_t>(lo >> 8));
                } else {
                    out.push_back(static_cast<uint8_t>(cp & 0xFF));
                    out.push_back(static_cast<uint8_t>(cp >> 8));
                }
            }
            break;

        case DetectedEncoding::Windows1252:
            out.reserve(cps->size());
            for (char32_t cp : *cps) {
                if (cp < 0x80 || (cp >= 0xA0 && cp <= 0xFF)) {
                    out.push_back(static_cast<uint8_t>(cp));
                    continue;
                }
                bool found = false;
                for (size_t i = 0; i < 32; ++i) {
                    if (kWindows1252High[i] != 0 && kWindows1252High[i] == cp) {
                        out.push_back(static_cast<uint8_t>(0x80 + i));
                        found = true;
                        break;
                    }
                }
                if (!found) {
                    return make_failure<std::vector<uint8_t>>(make_encoding_error(
                        EncodingError::Undecodable,
                        codepoint_label(cp) + " has no Windows-1252 representation"));
                }
            }
            break;

        case DetectedEncoding::Unknown:
        default:
            return make_failure<std::vector<uint8_t>>(make_encoding_error(
                EncodingError::Undecodable, "cannot encode into an unknown encoding"));
    }

    return make_ok(std::move(out));
}

} // namespace crosspath
