#include "crosspath/converter.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

namespace crosspath {

namespace {

std::string join(const std::vector<std::string>& parts, size_t start, char sep) {
    std::string out;
    for (size_t i = start; i < parts.size(); ++i) {
        if (i > start) out.push_back(sep);
        out += parts[i];
    }
    return out;
}

// base + sep + components, without doubling a separator base already ends with
std::string append_components(const std::string& base,
                              const std::vector<std::string>& components,
                              size_t start,
                              char sep) {
    if (start >= components.size()) {
        return base;
    }
    std::string out = base;
    if (out.empty() || out.back() != sep) {
        out.push_back(sep);
    }
    out += join(components, start, sep);
    return out;
}

bool has_prefix(const std::vector<std::string>& components,
                const std::vector<std::string>& prefix) {
    if (prefix.size() > components.size()) {
        return false;
    }
    return std::equal(prefix.begin(), prefix.end(), components.begin());
}

std::vector<std::string> mount_components(const std::string& mount) {
    return normalize_components(split_components(mount.substr(1)), true);
}

std::string relative_text(const ParsedPath& parsed,
                          const std::vector<std::string>& components,
                          char sep) {
    if (components.empty()) {
        // Everything resolved away: "a/.." is the current directory
        return parsed.components.empty() ? std::string() : std::string(".");
    }
    return join(components, 0, sep);
}

} // namespace

PathStyleConverter::PathStyleConverter(const PathConfig& config) : config_(config) {
    for (const auto& m : config_.drive_mappings) {
        if (!is_drive_designator(m.drive) || m.mount.empty() || m.mount[0] != '/') {
            continue;  // rejected by validate_path_config
        }
        char letter = static_cast<char>(std::toupper(static_cast<unsigned char>(m.drive[0])));
        auto components = mount_components(m.mount);
        forward_.push_back({letter, append_components("/", components, 0, '/')});
        reverse_.push_back({components, letter});
    }

    // Longest mount first; ties keep config order
    std::stable_sort(reverse_.begin(), reverse_.end(),
                     [](const ReverseEntry& a, const ReverseEntry& b) {
                         return a.mount_components.size() > b.mount_components.size();
                     });

    if (!config_.mount_root.empty() && config_.mount_root[0] == '/') {
        fallback_root_ = mount_components(config_.mount_root);
    }
}

Result<std::string> PathStyleConverter::mount_for_drive(char drive) const {
    for (const auto& entry : forward_) {
        if (entry.drive == drive) {
            return make_ok(entry.mount);
        }
    }

    if (config_.mount_root.empty()) {
        return make_failure<std::string>(make_conversion_error(
            ConversionError::InvalidDriveMapping,
            std::string("no mapping for drive ") + drive + ": and no mount_root fallback"));
    }

    std::string letter(1, static_cast<char>(std::tolower(static_cast<unsigned char>(drive))));
    std::vector<std::string> components = fallback_root_;
    components.push_back(letter);
    return make_ok(append_components("/", components, 0, '/'));
}

Result<std::string> PathStyleConverter::format_unix(const ParsedPath& parsed,
                                                    const std::vector<std::string>& components) const {
    switch (parsed.kind) {
        case PathKind::Relative:
            return make_ok(relative_text(parsed, components, '/'));

        case PathKind::UnixAbsolute:
        case PathKind::WindowsRooted:
            return make_ok(append_components("/", components, 0, '/'));

        case PathKind::UnixUnc:
        case PathKind::WindowsUnc:
            return make_ok(append_components("//" + parsed.server + "/" + parsed.share,
                                             components, 0, '/'));

        case PathKind::WindowsDrive: {
            auto mount = mount_for_drive(parsed.drive);
            if (!mount.ok) {
                return mount;
            }
            return make_ok(append_components(mount.value, components, 0, '/'));
        }
    }
    return make_ok(join(components, 0, '/'));
}

Result<std::string> PathStyleConverter::format_windows(const ParsedPath& parsed,
                                                       const std::vector<std::string>& components) const {
    switch (parsed.kind) {
        case PathKind::Relative:
            return make_ok(relative_text(parsed, components, '\\'));

        case PathKind::WindowsRooted:
            return make_ok(append_components("\\", components, 0, '\\'));

        case PathKind::WindowsDrive:
            return make_ok(append_components(std::string(1, parsed.drive) + ":\\",
                                             components, 0, '\\'));

        case PathKind::UnixUnc:
        case PathKind::WindowsUnc:
            return make_ok(append_components("\\\\" + parsed.server + "\\" + parsed.share,
                                             components, 0, '\\'));

        case PathKind::UnixAbsolute:
            break;
    }

    // Configured mounts, longest first
    for (const auto& entry : reverse_) {
        if (has_prefix(components, entry.mount_components)) {
            return make_ok(append_components(std::string(1, entry.drive) + ":\\",
                                             components, entry.mount_components.size(), '\\'));
        }
    }

    // Fallback scheme: <mount_root>/<letter>
    if (!config_.mount_root.empty() && has_prefix(components, fallback_root_) &&
        components.size() > fallback_root_.size()) {
        const auto& letter = components[fallback_root_.size()];
        if (letter.size() == 1 && std::isalpha(static_cast<unsigned char>(letter[0])) &&
            static_cast<unsigned char>(letter[0]) < 0x80) {
            char drive = static_cast<char>(std::toupper(static_cast<unsigned char>(letter[0])));
            return make_ok(append_components(std::string(1, drive) + ":\\",
                                             components, fallback_root_.size() + 1, '\\'));
        }
    }

    if (config_.default_drive.empty()) {
        return make_failure<std::string>(make_conversion_error(
            ConversionError::InvalidDriveMapping,
            "no drive mapping covers '" + parsed.original + "' and no default_drive is set"));
    }

    std::string drive = config_.default_drive;
    drive[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(drive[0])));
    return make_ok(append_components(drive + "\\", components, 0, '\\'));
}

Result<std::string> PathStyleConverter::convert(const std::string& canonical,
                                                PathStyle source,
                                                PathStyle target) const {
    auto parsed = parse_path(canonical);
    if (!parsed.ok) {
        return make_failure<std::string>(parsed.error);
    }
    const ParsedPath& path = parsed.value;

    // Structure wins; a declared source only settles relative paths
    PathStyle structural = style_of(path.kind);
    PathStyle effective_source = structural != PathStyle::Auto ? structural : source;

    PathStyle effective_target = target;
    if (target == PathStyle::Auto) {
        if (effective_source == PathStyle::Auto) {
            return make_failure<std::string>(make_conversion_error(
                ConversionError::AmbiguousStyle,
                "cannot infer the style of '" + canonical + "' to pick a target"));
        }
        effective_target = effective_source == PathStyle::Windows ? PathStyle::Unix
                                                                  : PathStyle::Windows;
    }

    std::vector<std::string> components = config_.normalize
        ? normalize_components(path.components, path.is_absolute())
        : path.components;

    if (effective_target == PathStyle::Unix) {
        return format_unix(path, components);
    }
    return format_windows(path, components);
}

Result<std::string> convert_path(const std::string& canonical,
                                 PathStyle source,
                                 PathStyle target,
                                 const PathConfig& config) {
    Error invalid = validate_path_config(config);
    if (invalid.has_error()) {
        return make_failure<std::string>(invalid);
    }
    PathStyleConverter converter(config);
    return converter.convert(canonical, source, target);
}

Result<std::string> normalize_path(const std::string& path, PathStyle style) {
    auto parsed = parse_path(path);
    if (!parsed.ok) {
        return make_failure<std::string>(parsed.error);
    }

    PathStyle own = style_of(parsed.value.kind);
    PathStyle out = style != PathStyle::Auto ? style : own;
    if (out == PathStyle::Auto) {
        bool backslashes_only = path.find('\\') != std::string::npos &&
                                path.find('/') == std::string::npos;
        out = backslashes_only ? PathStyle::Windows : PathStyle::Unix;
    }

    PathConfig config = default_path_config();
    config.normalize = true;
    PathStyleConverter converter(config);
    return converter.convert(path, own == PathStyle::Auto ? out : own, out);
}

} // namespace crosspath
