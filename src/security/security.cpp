#include "crosspath/security.hpp"
#include "crosspath/path_config.hpp"
#include "crosspath/path_parser.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

namespace crosspath {

namespace {

const char* const kReservedNames[] = {
    "CON", "PRN", "AUX", "NUL",
    "COM1", "COM2", "COM3", "COM4", "COM5", "COM6", "COM7", "COM8", "COM9",
    "LPT1", "LPT2", "LPT3", "LPT4", "LPT5", "LPT6", "LPT7", "LPT8", "LPT9",
};

std::string to_upper(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

bool equals_ignore_case(const std::string& a, const std::string& b) {
    return a.size() == b.size() && to_upper(a) == to_upper(b);
}

std::string join(const std::vector<std::string>& parts, size_t count, char sep) {
    std::string out;
    for (size_t i = 0; i < count && i < parts.size(); ++i) {
        if (i > 0) out.push_back(sep);
        out += parts[i];
    }
    return out;
}

// Index of the ".." that climbs out of the start, or parts.size()
size_t find_escaping_parent(const std::vector<std::string>& parts, bool absolute) {
    size_t depth = 0;
    for (size_t i = 0; i < parts.size(); ++i) {
        const auto& part = parts[i];
        if (part.empty() || part == ".") {
            continue;
        }
        if (part == "..") {
            if (!absolute || depth == 0) {
                return i;
            }
            --depth;
        } else {
            ++depth;
        }
    }
    return parts.size();
}

bool same_root(const ParsedPath& entry, const ParsedPath& path) {
    switch (entry.kind) {
        case PathKind::UnixAbsolute:
            return path.kind == PathKind::UnixAbsolute;
        case PathKind::WindowsDrive:
            if (path.kind == PathKind::WindowsRooted) {
                return true;  // rooted on the current drive, whichever it is
            }
            return path.kind == PathKind::WindowsDrive && path.drive == entry.drive;
        case PathKind::WindowsRooted:
            return path.kind == PathKind::WindowsRooted || path.kind == PathKind::WindowsDrive;
        case PathKind::WindowsUnc:
        case PathKind::UnixUnc:
            return path.is_unc() &&
                   equals_ignore_case(path.server, entry.server) &&
                   equals_ignore_case(path.share, entry.share);
        case PathKind::Relative:
        default:
            return false;
    }
}

bool is_under(const ParsedPath& entry, const ParsedPath& path) {
    if (!same_root(entry, path)) {
        return false;
    }
    bool ignore_case = style_of(entry.kind) == PathStyle::Windows || entry.is_unc();
    auto prefix = normalize_components(entry.components, true);
    auto target = normalize_components(path.components, true);
    if (prefix.size() > target.size()) {
        return false;
    }
    for (size_t i = 0; i < prefix.size(); ++i) {
        bool match = ignore_case ? equals_ignore_case(prefix[i], target[i])
                                 : prefix[i] == target[i];
        if (!match) {
            return false;
        }
    }
    return true;
}

PathConfig lexical_config(PathConfig config) {
    config.normalize = true;
    return config;
}

SecurityCheckResult violation(SecurityViolationKind kind, const std::string& fragment) {
    SecurityCheckResult result;
    result.ok = false;
    result.violation.kind = kind;
    result.violation.fragment = fragment;
    return result;
}

} // namespace

PathSecurityChecker::PathSecurityChecker()
    : PathSecurityChecker(default_path_config()) {}

PathSecurityChecker::PathSecurityChecker(std::vector<std::string> system_directories)
    : system_directories_(std::move(system_directories)),
      converter_(lexical_config(default_path_config())) {}

PathSecurityChecker::PathSecurityChecker(const PathConfig& config)
    : system_directories_(config.system_directories),
      converter_(lexical_config(config)) {}

bool PathSecurityChecker::is_dangerous_char(char c) {
    unsigned char uc = static_cast<unsigned char>(c);
    if (uc < 0x20 || uc == 0x7F) {
        return true;
    }
    switch (c) {
        case '<': case '>': case ':': case '"':
        case '|': case '?': case '*':
            return true;
        default:
            return false;
    }
}

bool PathSecurityChecker::is_reserved_name(const std::string& name) {
    std::string stem = to_upper(name.substr(0, name.find('.')));
    for (const char* reserved : kReservedNames) {
        if (stem == reserved) {
            return true;
        }
    }
    return false;
}

SecurityCheckResult PathSecurityChecker::check(const std::string& path) const {
    ParsedPath parsed;
    auto parse_result = parse_path(path);
    if (parse_result.ok) {
        parsed = std::move(parse_result.value);
    } else {
        // Malformed UNC prefix: still inspect every segment
        parsed.original = path;
        parsed.kind = PathKind::Relative;
        parsed.components = split_components(path);
    }
    const auto& parts = parsed.components;

    // Traversal
    size_t escape = find_escaping_parent(parts, parsed.is_absolute());
    if (escape < parts.size()) {
        std::string fragment = join(parts, escape + 1, '/');
        if (parsed.is_absolute()) {
            fragment = "/" + fragment;
        }
        return violation(SecurityViolationKind::TraversalAttempt, fragment);
    }

    // Dangerous characters (drive designator excluded)
    std::vector<const std::string*> segments;
    if (parsed.is_unc()) {
        segments.push_back(&parsed.server);
        segments.push_back(&parsed.share);
    }
    for (const auto& part : parts) {
        segments.push_back(&part);
    }
    for (const auto* segment : segments) {
        for (char c : *segment) {
            if (is_dangerous_char(c)) {
                return violation(SecurityViolationKind::DangerousCharacter, *segment);
            }
        }
    }

    // Reserved device names
    for (auto it = parts.rbegin(); it != parts.rend(); ++it) {
        if (it->empty()) {
            continue;  // trailing separator
        }
        if (is_reserved_name(*it)) {
            return violation(SecurityViolationKind::ReservedName, *it);
        }
        break;
    }

    // System directories
    std::string matched;
    if (parsed.is_absolute() && is_system_path(path, parsed, matched)) {
        return violation(SecurityViolationKind::SystemDirectoryAccess, matched);
    }

    return {};
}

bool PathSecurityChecker::is_system_path(const std::string& path, const ParsedPath& parsed,
                                         std::string& matched) const {
    std::vector<ParsedPath> forms{parsed};
    for (PathStyle target : {PathStyle::Unix, PathStyle::Windows}) {
        auto converted = converter_.convert(path, PathStyle::Auto, target);
        if (!converted.ok) {
            continue;  // no rendering in this style (unmapped drive)
        }
        auto reparsed = parse_path(converted.value);
        if (reparsed.ok && reparsed.value.is_absolute()) {
            forms.push_back(std::move(reparsed.value));
        }
    }

    for (const auto& dir : system_directories_) {
        auto entry = parse_path(dir);
        if (!entry.ok || !entry.value.is_absolute()) {
            continue;
        }
        for (const auto& form : forms) {
            if (is_under(entry.value, form)) {
                matched = dir;
                return true;
            }
        }
    }
    return false;
}

std::string PathSecurityChecker::sanitize_path(const std::string& segment) {
    std::string sanitized = segment;

    // Strip traversal sequences until none are left ("....//" hides one)
    for (const char* seq : {"../", "..\\"}) {
        size_t pos;
        while ((pos = sanitized.find(seq)) != std::string::npos) {
            sanitized.erase(pos, 3);
        }
    }

    for (auto& c : sanitized) {
        if (is_dangerous_char(c) || is_separator(c)) {
            c = '_';
        }
    }

    if (sanitized.empty() || sanitized == "." || sanitized == "..") {
        sanitized = "_";
    } else if (is_reserved_name(sanitized)) {
        sanitized = "_" + sanitized;
    }

    if (sanitized.size() > MAX_SANITIZED_SEGMENT) {
        size_t cut = MAX_SANITIZED_SEGMENT;
        while (cut > 0 && (static_cast<unsigned char>(sanitized[cut]) & 0xC0) == 0x80) {
            --cut;
        }
        sanitized.resize(cut);
    }

    return sanitized;
}

SecurityCheckResult check_path_security(const std::string& path) {
    PathSecurityChecker checker;
    return checker.check(path);
}

} // namespace crosspath
