#pragma once

#include "crosspath/export.hpp"
#include "crosspath/types.hpp"

#include <string>
#include <vector>

namespace crosspath {

// ============================================================================
// Structural Path Analysis
// ============================================================================

enum class PathKind {
    Relative,       // no root: "a/b", "a\b", ""
    UnixAbsolute,   // "/a/b"
    UnixUnc,        // "//server/share/a"
    WindowsRooted,  // "\a\b" (current drive root)
    WindowsDrive,   // "C:", "C:\a", "c:/a"
    WindowsUnc,     // "\\server\share\a"
};

inline const char* path_kind_to_string(PathKind k) {
    switch (k) {
        case PathKind::Relative: return "relative";
        case PathKind::UnixAbsolute: return "unix_absolute";
        case PathKind::UnixUnc: return "unix_unc";
        case PathKind::WindowsRooted: return "windows_rooted";
        case PathKind::WindowsDrive: return "windows_drive";
        case PathKind::WindowsUnc: return "windows_unc";
        default: return "relative";
    }
}

struct ParsedPath {
    std::string original;
    PathKind kind = PathKind::Relative;
    char drive = '\0';   // upper-case letter for WindowsDrive
    std::string server;  // UNC kinds
    std::string share;   // UNC kinds

    // Segments after the prefix, split on both separators. Empty, "." and
    // ".." segments are kept verbatim so the text can be reproduced.
    std::vector<std::string> components;

    bool is_absolute() const { return kind != PathKind::Relative; }
    bool is_unc() const { return kind == PathKind::UnixUnc || kind == PathKind::WindowsUnc; }
};

inline bool is_separator(char c) {
    return c == '/' || c == '\\';
}

// Split on '/' and '\', preserving empty parts. "" yields no components.
CROSSPATH_API std::vector<std::string> split_components(const std::string& s);

// Parse path text into its prefix and components. Fails only with
// ConversionError::InvalidUncPath for a "\\" prefix lacking server or share.
CROSSPATH_API Result<ParsedPath> parse_path(const std::string& path);

// Structural style sniffing:
// - drive letter, UNC or "\" root => Windows
// - leading "/"                  => Unix
// - anything else                => Auto (ambiguous)
CROSSPATH_API PathStyle detect_style(const std::string& path);
CROSSPATH_API PathStyle style_of(PathKind kind);

// Lexically resolve components:
// - drops empty and "." segments
// - ".." pops the previous segment
// - at the root of an absolute path ".." is dropped; in a relative path a
//   leading ".." is kept
CROSSPATH_API std::vector<std::string> normalize_components(const std::vector<std::string>& components,
                                                            bool absolute);

} // namespace crosspath
