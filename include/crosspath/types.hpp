#pragma once

#include "crosspath/export.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace crosspath {

// ============================================================================
// Path Style
// ============================================================================

enum class PathStyle {
    Windows,
    Unix,
    Auto
};

// Serialized tag ("Windows", "Unix", "Auto")
inline const char* style_to_string(PathStyle s) {
    switch (s) {
        case PathStyle::Windows: return "Windows";
        case PathStyle::Unix: return "Unix";
        case PathStyle::Auto: return "Auto";
        default: return "Auto";
    }
}

// Parse a style tag (case-insensitive)
CROSSPATH_API std::optional<PathStyle> parse_path_style(const std::string& s);

// Style native to the platform this library was compiled for
CROSSPATH_API PathStyle current_platform_style();

// ============================================================================
// Detected Encoding
// ============================================================================

enum class DetectedEncoding {
    UTF8,
    UTF16LE,
    Windows1252,
    Unknown
};

// Human-readable name
inline const char* encoding_name(DetectedEncoding e) {
    switch (e) {
        case DetectedEncoding::UTF8: return "UTF-8";
        case DetectedEncoding::UTF16LE: return "UTF-16LE";
        case DetectedEncoding::Windows1252: return "Windows-1252";
        case DetectedEncoding::Unknown: return "Unknown";
        default: return "Unknown";
    }
}

// Serialized tag ("UTF8", "UTF16LE", "Windows1252", "Unknown")
inline const char* encoding_to_string(DetectedEncoding e) {
    switch (e) {
        case DetectedEncoding::UTF8: return "UTF8";
        case DetectedEncoding::UTF16LE: return "UTF16LE";
        case DetectedEncoding::Windows1252: return "Windows1252";
        case DetectedEncoding::Unknown: return "Unknown";
        default: return "Unknown";
    }
}

// Parse a serialized tag or a human-readable name (case-insensitive)
CROSSPATH_API std::optional<DetectedEncoding> parse_detected_encoding(const std::string& s);

// ============================================================================
// Error Taxonomy
// ============================================================================

enum class EncodingError {
    None,
    Undecodable,     // bytes match no supported encoding
    MalformedUtf16,  // odd length or unpaired surrogate
};

enum class SecurityViolationKind {
    None,
    TraversalAttempt,
    ReservedName,
    DangerousCharacter,
    SystemDirectoryAccess,
};

inline const char* violation_to_string(SecurityViolationKind k) {
    switch (k) {
        case SecurityViolationKind::None: return "None";
        case SecurityViolationKind::TraversalAttempt: return "TraversalAttempt";
        case SecurityViolationKind::ReservedName: return "ReservedName";
        case SecurityViolationKind::DangerousCharacter: return "DangerousCharacter";
        case SecurityViolationKind::SystemDirectoryAccess: return "SystemDirectoryAccess";
        default: return "None";
    }
}

struct SecurityViolation {
    SecurityViolationKind kind = SecurityViolationKind::None;
    std::string fragment;  // offending segment, name or denylisted prefix
};

enum class ConversionError {
    None,
    AmbiguousStyle,
    InvalidDriveMapping,
    InvalidUncPath,
};

inline const char* conversion_error_to_string(ConversionError e) {
    switch (e) {
        case ConversionError::None: return "None";
        case ConversionError::AmbiguousStyle: return "AmbiguousStyle";
        case ConversionError::InvalidDriveMapping: return "InvalidDriveMapping";
        case ConversionError::InvalidUncPath: return "InvalidUncPath";
        default: return "None";
    }
}

enum class ErrorKind {
    None,
    InvalidConfig,
    Encoding,
    Security,
    Conversion,
};

struct Error {
    ErrorKind kind = ErrorKind::None;
    EncodingError encoding = EncodingError::None;
    SecurityViolation violation;
    ConversionError conversion = ConversionError::None;
    std::string message;

    bool has_error() const { return kind != ErrorKind::None; }
};

// "<category>: <message>" for display
CROSSPATH_API std::string error_to_string(const Error& error);

CROSSPATH_API Error make_config_error(const std::string& message);
CROSSPATH_API Error make_encoding_error(EncodingError code, const std::string& message);
CROSSPATH_API Error make_security_error(const SecurityViolation& violation);
CROSSPATH_API Error make_conversion_error(ConversionError code, const std::string& message);

// ============================================================================
// Results
// ============================================================================

// All fallible operations report through a result struct; value is only
// meaningful when ok is true. Warnings carry non-fatal conditions.
template<typename T>
struct Result {
    bool ok = false;
    T value{};
    Error error;
    std::vector<std::string> warnings;
};

template<typename T>
Result<T> make_ok(T value) {
    Result<T> r;
    r.ok = true;
    r.value = std::move(value);
    return r;
}

template<typename T>
Result<T> make_failure(Error error) {
    Result<T> r;
    r.ok = false;
    r.error = std::move(error);
    return r;
}

struct SecurityCheckResult {
    bool ok = true;
    SecurityViolation violation;
};

} // namespace crosspath
