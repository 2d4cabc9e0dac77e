#pragma once

/**
 * @file encoding.hpp
 * @brief Encoding detection and decoding for raw path bytes
 *
 * Paths arriving from Windows tooling are not always UTF-8. The detector
 * classifies a byte sequence with fixed-priority heuristics (first match
 * wins):
 *
 * 1. UTF-16LE: a FF FE byte-order mark, or mostly ASCII code units in
 *    little-endian order (every other byte NUL)
 * 2. UTF-8: strict validation (no overlongs, surrogates or truncation)
 * 3. Windows-1252: every byte printable or in the defined extended range
 * 4. Unknown
 *
 * Short inputs are inherently ambiguous ("a\0" is both valid UTF-8 and
 * UTF-16LE); ties are settled by the order above and nothing else.
 *
 * @example
 * ```cpp
 * std::vector<uint8_t> raw = read_name_from_archive();
 * auto text = crosspath::to_utf8(raw);
 * if (text.ok) {
 *     use(text.value);
 * }
 * ```
 */

#include "crosspath/export.hpp"
#include "crosspath/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace crosspath {

/// Replacement codepoint used by lossy decoding
constexpr char32_t REPLACEMENT_CODEPOINT = 0xFFFD;

/// Decoded canonical text and where it came from
struct DecodedText {
    std::string text;  ///< UTF-8
    DetectedEncoding encoding = DetectedEncoding::UTF8;
    bool lossy = false;  ///< true when undecodable bytes were replaced
};

/// Classify a byte sequence; pure, never fails
CROSSPATH_API DetectedEncoding detect_encoding(const std::vector<uint8_t>& bytes);
CROSSPATH_API DetectedEncoding detect_encoding(const std::string& bytes);

/// Strict UTF-8 validation
CROSSPATH_API bool is_valid_utf8(const std::string& bytes);

/**
 * @brief Detect and decode raw bytes into canonical UTF-8 text
 * @param preserve_encoding when set, undecodable input is decoded lossily
 *        (U+FFFD per bad byte) and a warning is added to the result instead
 *        of failing with an EncodingError
 */
CROSSPATH_API Result<DecodedText> decode_path_bytes(const std::string& bytes,
                                                    bool preserve_encoding = false);

/// Convenience wrapper returning only the text
CROSSPATH_API Result<std::string> to_utf8(const std::vector<uint8_t>& bytes,
                                          bool preserve_encoding = false);
CROSSPATH_API Result<std::string> to_utf8(const std::string& bytes,
                                          bool preserve_encoding = false);

/**
 * @brief Re-encode canonical text into a target encoding
 *
 * UTF-16LE output carries no byte-order mark. Characters that Windows-1252
 * cannot represent are an EncodingError. Unknown is not a valid target.
 */
CROSSPATH_API Result<std::vector<uint8_t>> from_utf8(const std::string& text,
                                                     DetectedEncoding target);

} // namespace crosspath
