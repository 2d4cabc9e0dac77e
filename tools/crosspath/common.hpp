/**
 * crosspath CLI - Common utilities and types
 */

#pragma once

#include <crosspath/crosspath.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace crosspath::cli {

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string config_path;       // --config
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

/**
 * Route library logging to stderr so stdout stays machine-readable.
 * -v shows the pipeline's debug output, -q only errors.
 */
inline void init_logging(const GlobalOptions& opts) {
    auto logger = spdlog::get("crosspath");
    if (!logger) {
        logger = spdlog::stderr_color_mt("crosspath");
    }
    spdlog::set_default_logger(logger);

    if (opts.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (opts.quiet) {
        spdlog::set_level(spdlog::level::err);
    } else {
        spdlog::set_level(spdlog::level::warn);
    }
}

/**
 * Warning collector for accumulating warnings during command execution.
 * In JSON mode, warnings are collected and output at the end.
 * In text mode, warnings are printed immediately to stderr.
 */
struct WarningCollector {
    std::vector<std::string> warnings;
    bool json_mode = false;
    bool quiet = false;

    void add(const std::string& msg) {
        if (json_mode) {
            warnings.push_back(msg);
        } else if (!quiet) {
            std::cerr << "Warning: " << msg << std::endl;
        }
    }

    void add_all(const std::vector<std::string>& msgs) {
        for (const auto& msg : msgs) {
            add(msg);
        }
    }

    void clear() { warnings.clear(); }
    bool empty() const { return warnings.empty(); }

    nlohmann::json to_json() const {
        return nlohmann::json(warnings);
    }
};

inline WarningCollector& get_warning_collector() {
    static thread_local WarningCollector collector;
    return collector;
}

inline void init_command(const GlobalOptions& opts) {
    init_logging(opts);
    auto& collector = get_warning_collector();
    collector.clear();
    collector.json_mode = opts.json;
    collector.quiet = opts.quiet;
}

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        auto& collector = get_warning_collector();
        if (!collector.empty()) {
            j["warnings"] = collector.to_json();
        }
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void output_json(const nlohmann::json& j) {
    auto& collector = get_warning_collector();
    if (!collector.empty() && !j.contains("warnings")) {
        nlohmann::json output = j;
        output["warnings"] = collector.to_json();
        std::cout << output.dump(2) << std::endl;
    } else {
        std::cout << j.dump(2) << std::endl;
    }
}

inline std::optional<std::string> read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

/**
 * Load the path config named by --config, or the defaults.
 * Prints the error and returns nullopt on failure.
 */
inline std::optional<PathConfig> load_config(const GlobalOptions& opts) {
    if (opts.config_path.empty()) {
        return default_path_config();
    }

    auto content = read_file(opts.config_path);
    if (!content) {
        print_error("Failed to read config: " + opts.config_path, opts.json);
        return std::nullopt;
    }

    auto result = parse_path_config(*content);
    get_warning_collector().add_all(result.warnings);
    if (!result.ok) {
        print_error(opts.config_path + ": " + error_to_string(result.error), opts.json);
        return std::nullopt;
    }

    spdlog::debug("loaded config from {}", opts.config_path);
    return result.value;
}

} // namespace crosspath::cli
