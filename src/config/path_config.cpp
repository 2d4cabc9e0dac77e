#include "crosspath/path_config.hpp"

#include <cctype>
#include <optional>

#include <nlohmann/json.hpp>

namespace crosspath {

namespace {

// Helper to safely get a bool from JSON, recording a warning on type mismatch
void read_bool(const nlohmann::json& j, const std::string& key, bool& out,
               std::vector<std::string>& warnings) {
    if (!j.contains(key)) return;
    if (j[key].is_boolean()) {
        out = j[key].get<bool>();
    } else {
        warnings.push_back("invalid_configuration:" + key);
    }
}

void read_string(const nlohmann::json& j, const std::string& key, std::string& out,
                 std::vector<std::string>& warnings) {
    if (!j.contains(key)) return;
    if (j[key].is_string()) {
        out = j[key].get<std::string>();
    } else {
        warnings.push_back("invalid_configuration:" + key);
    }
}

// Accepts ["C:", "/mnt/c"] pairs and {"drive": "C:", "mount": "/mnt/c"} objects
std::optional<DriveMapping> parse_drive_mapping(const nlohmann::json& j) {
    if (j.is_array() && j.size() == 2 && j[0].is_string() && j[1].is_string()) {
        return DriveMapping{j[0].get<std::string>(), j[1].get<std::string>()};
    }
    if (j.is_object() && j.contains("drive") && j["drive"].is_string() &&
        j.contains("mount") && j["mount"].is_string()) {
        return DriveMapping{j["drive"].get<std::string>(), j["mount"].get<std::string>()};
    }
    return std::nullopt;
}

} // namespace

std::vector<DriveMapping> default_drive_mappings() {
    return {
        {"C:", "/mnt/c"},
        {"D:", "/mnt/d"},
        {"E:", "/mnt/e"},
    };
}

std::vector<std::string> default_system_directories() {
    return {
        "/etc",
        "/sys",
        "/proc",
        "/dev",
        "/boot",
        "/root",
        "/bin",
        "/sbin",
        "/usr/bin",
        "/usr/sbin",
        "C:\\Windows\\System32",
        "C:\\Windows\\SysWOW64",
    };
}

PathConfig default_path_config() {
    return PathConfig{};
}

bool is_drive_designator(const std::string& s) {
    return s.size() == 2 &&
           std::isalpha(static_cast<unsigned char>(s[0])) &&
           static_cast<unsigned char>(s[0]) < 0x80 &&
           s[1] == ':';
}

Error validate_path_config(const PathConfig& config) {
    for (size_t i = 0; i < config.drive_mappings.size(); ++i) {
        const auto& m = config.drive_mappings[i];
        std::string where = "drive_mappings[" + std::to_string(i) + "]";
        if (m.drive.empty()) {
            return make_config_error(where + ": empty drive letter");
        }
        if (!is_drive_designator(m.drive)) {
            return make_config_error(where + ": drive must look like \"X:\", got \"" + m.drive + "\"");
        }
        if (m.mount.empty() || m.mount[0] != '/') {
            return make_config_error(where + ": mount must be an absolute Unix path, got \"" +
                                     m.mount + "\"");
        }
    }

    if (!config.default_drive.empty() && !is_drive_designator(config.default_drive)) {
        return make_config_error("default_drive must be empty or look like \"X:\", got \"" +
                                 config.default_drive + "\"");
    }

    if (!config.mount_root.empty() && config.mount_root[0] != '/') {
        return make_config_error("mount_root must be empty or an absolute Unix path, got \"" +
                                 config.mount_root + "\"");
    }

    for (const auto& dir : config.system_directories) {
        if (dir.empty()) {
            return make_config_error("system_directories contains an empty entry");
        }
    }

    return {};
}

Result<PathConfig> parse_path_config(const std::string& json_str) {
    Result<PathConfig> result;
    result.value = default_path_config();
    auto& config = result.value;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = make_config_error("JSON must be an object");
            return result;
        }

        // style
        if (j.contains("style")) {
            std::optional<PathStyle> style;
            if (j["style"].is_string()) {
                style = parse_path_style(j["style"].get<std::string>());
            }
            if (style) {
                config.style = *style;
            } else {
                result.warnings.push_back("invalid_configuration:style");
            }
        }

        read_bool(j, "preserve_encoding", config.preserve_encoding, result.warnings);
        read_bool(j, "security_check", config.security_check, result.warnings);
        read_bool(j, "normalize", config.normalize, result.warnings);
        read_string(j, "default_drive", config.default_drive, result.warnings);
        read_string(j, "mount_root", config.mount_root, result.warnings);

        // drive_mappings replaces the defaults entirely when present
        if (j.contains("drive_mappings")) {
            if (j["drive_mappings"].is_array()) {
                config.drive_mappings.clear();
                for (const auto& elem : j["drive_mappings"]) {
                    auto mapping = parse_drive_mapping(elem);
                    if (!mapping) {
                        result.error = make_config_error(
                            "drive_mappings entries must be [drive, mount] pairs");
                        return result;
                    }
                    config.drive_mappings.push_back(*mapping);
                }
            } else {
                result.warnings.push_back("invalid_configuration:drive_mappings");
            }
        }

        if (j.contains("system_directories")) {
            if (j["system_directories"].is_array()) {
                config.system_directories.clear();
                for (const auto& elem : j["system_directories"]) {
                    if (elem.is_string()) {
                        config.system_directories.push_back(elem.get<std::string>());
                    } else {
                        result.warnings.push_back("invalid_configuration:system_directories");
                    }
                }
            } else {
                result.warnings.push_back("invalid_configuration:system_directories");
            }
        }

        Error invalid = validate_path_config(config);
        if (invalid.has_error()) {
            result.error = invalid;
            return result;
        }

        result.ok = true;
        return result;

    } catch (const nlohmann::json::parse_error& e) {
        result.error = make_config_error(std::string("parse error: ") + e.what());
        return result;
    } catch (const nlohmann::json::exception& e) {
        result.error = make_config_error(std::string("JSON error: ") + e.what());
        return result;
    }
}

std::string serialize_path_config(const PathConfig& config, int indent) {
    nlohmann::ordered_json j;

    j["style"] = style_to_string(config.style);
    j["preserve_encoding"] = config.preserve_encoding;
    j["security_check"] = config.security_check;

    nlohmann::ordered_json mappings = nlohmann::ordered_json::array();
    for (const auto& m : config.drive_mappings) {
        mappings.push_back(nlohmann::ordered_json::array({m.drive, m.mount}));
    }
    j["drive_mappings"] = mappings;

    j["normalize"] = config.normalize;
    j["default_drive"] = config.default_drive;
    j["mount_root"] = config.mount_root;
    j["system_directories"] = config.system_directories;

    return j.dump(indent);
}

std::string serialize_encoding_json(DetectedEncoding encoding) {
    return nlohmann::json(encoding_to_string(encoding)).dump();
}

std::optional<DetectedEncoding> parse_encoding_json(const std::string& json_str) {
    try {
        auto j = nlohmann::json::parse(json_str);
        if (!j.is_string()) {
            return std::nullopt;
        }
        return parse_detected_encoding(j.get<std::string>());
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
}

} // namespace crosspath
