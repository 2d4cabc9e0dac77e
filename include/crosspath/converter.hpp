#pragma once

#include "crosspath/export.hpp"
#include "crosspath/path_config.hpp"
#include "crosspath/path_parser.hpp"
#include "crosspath/types.hpp"

#include <string>
#include <vector>

namespace crosspath {

// ============================================================================
// Path Style Converter
// ============================================================================

// Rewrites separators, drive prefixes and UNC prefixes between Windows and
// Unix conventions. Both lookup tables are built once from the config:
//   forward: drive letter -> mount, in config order (first match wins)
//   reverse: mount -> drive, longest mount first
//
// Windows -> Unix
//   C:\Users\a        -> /mnt/c/Users/a     (mapping, else <mount_root>/c)
//   \\server\share\a  -> //server/share/a
//   \dir\a            -> /dir/a
// Unix -> Windows
//   /mnt/c/Users/a    -> C:\Users\a         (reverse mapping or fallback scheme)
//   /home/a           -> C:\home\a          (default_drive, lossy)
//   //server/share/a  -> \\server\share\a
// Relative paths only have their separators translated.
class CROSSPATH_API PathStyleConverter {
public:
    explicit PathStyleConverter(const PathConfig& config);

    // source == Auto sniffs the style from the text. target == Auto converts
    // to the other style, failing with AmbiguousStyle when the source style
    // cannot be determined.
    Result<std::string> convert(const std::string& canonical,
                                PathStyle source,
                                PathStyle target) const;

    const PathConfig& config() const { return config_; }

private:
    struct ForwardEntry {
        char drive;
        std::string mount;
    };

    struct ReverseEntry {
        std::vector<std::string> mount_components;
        char drive;
    };

    Result<std::string> format_unix(const ParsedPath& parsed,
                                    const std::vector<std::string>& components) const;
    Result<std::string> format_windows(const ParsedPath& parsed,
                                       const std::vector<std::string>& components) const;
    Result<std::string> mount_for_drive(char drive) const;

    PathConfig config_;
    std::vector<ForwardEntry> forward_;
    std::vector<ReverseEntry> reverse_;
    std::vector<std::string> fallback_root_;
};

// Validates config, then converts. Same contract as PathStyleConverter::convert.
CROSSPATH_API Result<std::string> convert_path(const std::string& canonical,
                                               PathStyle source,
                                               PathStyle target,
                                               const PathConfig& config);

// Lexical normalization in the given style (Auto keeps the path's own
// style). Collapses separator runs, drops ".", resolves ".." without
// crossing the root, strips trailing separators and upper-cases drive
// letters. Idempotent.
CROSSPATH_API Result<std::string> normalize_path(const std::string& path,
                                                 PathStyle style = PathStyle::Auto);

} // namespace crosspath
