#pragma once

#include "crosspath/converter.hpp"
#include "crosspath/export.hpp"
#include "crosspath/path_config.hpp"
#include "crosspath/types.hpp"

#include <string>
#include <vector>

namespace crosspath {

// ============================================================================
// Path Security Checker
// ============================================================================

// Maximum length of a sanitized segment in bytes
constexpr size_t MAX_SANITIZED_SEGMENT = 255;

// Validates canonical path text against traversal, Windows-illegal
// characters, reserved device names and denylisted system directories.
// Checks run in that order and the first violation is reported.
//
// The denylist is matched against the path as written and against its
// Unix and Windows renderings under the config's drive mappings, so
// "\etc\passwd" hits "/etc" and "/mnt/c/Windows/System32" hits
// "C:\Windows\System32".
class CROSSPATH_API PathSecurityChecker {
public:
    // Default mappings and denylist
    PathSecurityChecker();

    // Default mappings, custom denylist
    explicit PathSecurityChecker(std::vector<std::string> system_directories);

    // Mappings and denylist taken from the config
    explicit PathSecurityChecker(const PathConfig& config);

    // - TraversalAttempt: any ".." in a relative path; ".." climbing above
    //   the root of an absolute path
    // - DangerousCharacter: < > : " | ? * NUL or a control character in any
    //   segment (drive and UNC prefixes excluded)
    // - ReservedName: basename stem is CON, PRN, AUX, NUL, COM1-9 or LPT1-9
    // - SystemDirectoryAccess: lexically normalized path, in either style,
    //   at or under a denylisted prefix. A rooted Windows path ("\\x")
    //   matches drive entries on any drive.
    SecurityCheckResult check(const std::string& path) const;

    const std::vector<std::string>& system_directories() const { return system_directories_; }

    // Make a single segment safe to use as a file name. Total: never fails.
    static std::string sanitize_path(const std::string& segment);

    // Case-insensitive, with or without an extension ("con", "Aux.txt")
    static bool is_reserved_name(const std::string& name);

    static bool is_dangerous_char(char c);

private:
    bool is_system_path(const std::string& path, const ParsedPath& parsed,
                        std::string& matched) const;

    std::vector<std::string> system_directories_;
    PathStyleConverter converter_;
};

// Convenience for one-off checks with the default denylist
CROSSPATH_API SecurityCheckResult check_path_security(const std::string& path);

} // namespace crosspath
