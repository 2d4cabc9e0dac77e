#pragma once

#include "crosspath/export.hpp"
#include "crosspath/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace crosspath {

// ============================================================================
// Drive Mapping
// ============================================================================

// Correspondence between a Windows drive prefix ("C:") and a Unix mount
// point ("/mnt/c"). Order matters: the first entry for a drive wins when
// converting to Unix, the longest mount wins when converting back.
struct DriveMapping {
    std::string drive;
    std::string mount;
};

inline bool operator==(const DriveMapping& a, const DriveMapping& b) {
    return a.drive == b.drive && a.mount == b.mount;
}

CROSSPATH_API std::vector<DriveMapping> default_drive_mappings();
CROSSPATH_API std::vector<std::string> default_system_directories();

// ============================================================================
// Path Config
// ============================================================================

// Defaults live in the struct: PathConfig{} is the default configuration.
struct PathConfig {
    PathStyle style = PathStyle::Auto;

    // Unknown byte sequences decode lossily (with a warning) instead of failing
    bool preserve_encoding = true;

    // Construction fails on any security violation
    bool security_check = true;

    std::vector<DriveMapping> drive_mappings = default_drive_mappings();

    // Collapse separators and resolve "." / ".." lexically
    bool normalize = true;

    // Drive that unmapped absolute Unix paths are rooted under. Empty
    // disables the fallback (InvalidDriveMapping instead).
    std::string default_drive = "C:";

    // Unmapped drives convert to <mount_root>/<letter>. Empty disables the
    // fallback.
    std::string mount_root = "/mnt";

    // Denylisted prefixes for the system directory check
    std::vector<std::string> system_directories = default_system_directories();
};

// Same as PathConfig{}
CROSSPATH_API PathConfig default_path_config();

// Reject malformed configuration up front. Returns an Error with
// kind == ErrorKind::None when the config is usable.
CROSSPATH_API Error validate_path_config(const PathConfig& config);

// "X:" with an ASCII letter
CROSSPATH_API bool is_drive_designator(const std::string& s);

// ============================================================================
// JSON
// ============================================================================

// Parse a PathConfig from JSON. Missing fields keep their defaults;
// mistyped fields are skipped with an "invalid_configuration:<field>"
// warning; the result is validated before it is returned.
CROSSPATH_API Result<PathConfig> parse_path_config(const std::string& json_str);

// Serialize with stable key order; drive_mappings as [drive, mount] pairs
CROSSPATH_API std::string serialize_path_config(const PathConfig& config, int indent = 2);

// DetectedEncoding as a JSON string value, e.g. "\"UTF16LE\""
CROSSPATH_API std::string serialize_encoding_json(DetectedEncoding encoding);
CROSSPATH_API std::optional<DetectedEncoding> parse_encoding_json(const std::string& json_str);

} // namespace crosspath
