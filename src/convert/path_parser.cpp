#include "crosspath/path_parser.hpp"

#include <cctype>
#include <string>
#include <vector>

namespace crosspath {

namespace {

bool is_drive_prefix(const std::string& s) {
    return s.size() >= 2 &&
           std::isalpha(static_cast<unsigned char>(s[0])) &&
           s[1] == ':' &&
           (s.size() == 2 || is_separator(s[2]));
}

} // namespace

std::vector<std::string> split_components(const std::string& s) {
    std::vector<std::string> parts;
    if (s.empty()) {
        return parts;
    }
    std::string current;
    for (char c : s) {
        if (is_separator(c)) {
            parts.push_back(current);
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    parts.push_back(current);
    return parts;
}

Result<ParsedPath> parse_path(const std::string& path) {
    ParsedPath parsed;
    parsed.original = path;

    // \\server\share[\...]
    if (path.size() >= 2 && path[0] == '\\' && path[1] == '\\') {
        auto parts = split_components(path.substr(2));
        if (parts.size() < 2 || parts[0].empty() || parts[1].empty()) {
            return make_failure<ParsedPath>(make_conversion_error(
                ConversionError::InvalidUncPath, "UNC path requires server and share: " + path));
        }
        parsed.kind = PathKind::WindowsUnc;
        parsed.server = parts[0];
        parsed.share = parts[1];
        parsed.components.assign(parts.begin() + 2, parts.end());
        return make_ok(std::move(parsed));
    }

    // //server/share[/...]; anything shorter is an ordinary absolute path
    if (path.size() >= 3 && path[0] == '/' && path[1] == '/' && !is_separator(path[2])) {
        auto parts = split_components(path.substr(2));
        if (parts.size() >= 2 && !parts[0].empty() && !parts[1].empty()) {
            parsed.kind = PathKind::UnixUnc;
            parsed.server = parts[0];
            parsed.share = parts[1];
            parsed.components.assign(parts.begin() + 2, parts.end());
            return make_ok(std::move(parsed));
        }
    }

    if (is_drive_prefix(path)) {
        parsed.kind = PathKind::WindowsDrive;
        parsed.drive = static_cast<char>(std::toupper(static_cast<unsigned char>(path[0])));
        parsed.components = split_components(path.size() > 3 ? path.substr(3) : std::string());
        return make_ok(std::move(parsed));
    }

    if (!path.empty() && path[0] == '/') {
        parsed.kind = PathKind::UnixAbsolute;
        parsed.components = split_components(path.substr(1));
        return make_ok(std::move(parsed));
    }

    if (!path.empty() && path[0] == '\\') {
        parsed.kind = PathKind::WindowsRooted;
        parsed.components = split_components(path.substr(1));
        return make_ok(std::move(parsed));
    }

    parsed.kind = PathKind::Relative;
    parsed.components = split_components(path);
    return make_ok(std::move(parsed));
}

PathStyle style_of(PathKind kind) {
    switch (kind) {
        case PathKind::WindowsDrive:
        case PathKind::WindowsUnc:
        case PathKind::WindowsRooted:
            return PathStyle::Windows;
        case PathKind::UnixAbsolute:
        case PathKind::UnixUnc:
            return PathStyle::Unix;
        case PathKind::Relative:
        default:
            return PathStyle::Auto;
    }
}

PathStyle detect_style(const std::string& path) {
    // A malformed UNC prefix is still unmistakably Windows
    if (path.size() >= 2 && path[0] == '\\' && path[1] == '\\') {
        return PathStyle::Windows;
    }
    auto parsed = parse_path(path);
    if (!parsed.ok) {
        return PathStyle::Auto;
    }
    return style_of(parsed.value.kind);
}

std::vector<std::string> normalize_components(const std::vector<std::string>& components,
                                              bool absolute) {
    std::vector<std::string> normalized;
    for (const auto& part : components) {
        if (part.empty() || part == ".") {
            continue;
        }
        if (part == "..") {
            if (!normalized.empty() && normalized.back() != "..") {
                normalized.pop_back();
            } else if (!absolute) {
                normalized.push_back(part);
            }
            // ".." at an absolute root stays at the root
        } else {
            normalized.push_back(part);
        }
    }
    return normalized;
}

} // namespace crosspath
