#include "crosspath/types.hpp"

#include <algorithm>
#include <cctype>
#include <optional>

namespace crosspath {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

const char* error_kind_label(ErrorKind k) {
    switch (k) {
        case ErrorKind::None: return "ok";
        case ErrorKind::InvalidConfig: return "invalid configuration";
        case ErrorKind::Encoding: return "encoding error";
        case ErrorKind::Security: return "security violation";
        case ErrorKind::Conversion: return "conversion error";
        default: return "error";
    }
}

} // namespace

std::optional<PathStyle> parse_path_style(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "windows") return PathStyle::Windows;
    if (lower == "unix") return PathStyle::Unix;
    if (lower == "auto") return PathStyle::Auto;
    return std::nullopt;
}

PathStyle current_platform_style() {
#ifdef _WIN32
    return PathStyle::Windows;
#else
    return PathStyle::Unix;
#endif
}

std::optional<DetectedEncoding> parse_detected_encoding(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "utf8" || lower == "utf-8") return DetectedEncoding::UTF8;
    if (lower == "utf16le" || lower == "utf-16le") return DetectedEncoding::UTF16LE;
    if (lower == "windows1252" || lower == "windows-1252") return DetectedEncoding::Windows1252;
    if (lower == "unknown") return DetectedEncoding::Unknown;
    return std::nullopt;
}

std::string error_to_string(const Error& error) {
    std::string out = error_kind_label(error.kind);
    if (error.kind == ErrorKind::Security) {
        out += std::string(" (") + violation_to_string(error.violation.kind) + ")";
    } else if (error.kind == ErrorKind::Conversion) {
        out += std::string(" (") + conversion_error_to_string(error.conversion) + ")";
    }
    if (!error.message.empty()) {
        out += ": " + error.message;
    }
    return out;
}

Error make_config_error(const std::string& message) {
    Error e;
    e.kind = ErrorKind::InvalidConfig;
    e.message = message;
    return e;
}

Error make_encoding_error(EncodingError code, const std::string& message) {
    Error e;
    e.kind = ErrorKind::Encoding;
    e.encoding = code;
    e.message = message;
    return e;
}

Error make_security_error(const SecurityViolation& violation) {
    Error e;
    e.kind = ErrorKind::Security;
    e.violation = violation;
    switch (violation.kind) {
        case SecurityViolationKind::TraversalAttempt:
            e.message = "path traversal attempt";
            break;
        case SecurityViolationKind::ReservedName:
            e.message = "reserved device name '" + violation.fragment + "'";
            break;
        case SecurityViolationKind::DangerousCharacter:
            e.message = "dangerous character in '" + violation.fragment + "'";
            break;
        case SecurityViolationKind::SystemDirectoryAccess:
            e.message = "access to system directory '" + violation.fragment + "'";
            break;
        case SecurityViolationKind::None:
            break;
    }
    return e;
}

Error make_conversion_error(ConversionError code, const std::string& message) {
    Error e;
    e.kind = ErrorKind::Conversion;
    e.conversion = code;
    e.message = message;
    return e;
}

} // namespace crosspath
