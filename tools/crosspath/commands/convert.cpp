/**
 * crosspath CLI - convert command
 *
 * Decode, check and convert a path to the requested style.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace crosspath::cli::commands {

namespace {

struct ConvertOptions {
    std::string path;
    std::string to = "auto";
    std::vector<std::string> maps;
    bool no_normalize = false;
    bool no_security = false;
};

// "X:=/mount"
std::optional<DriveMapping> parse_map_option(const std::string& spec) {
    auto eq = spec.find('=');
    if (eq == std::string::npos || eq == 0 || eq + 1 == spec.size()) {
        return std::nullopt;
    }
    return DriveMapping{spec.substr(0, eq), spec.substr(eq + 1)};
}

int cmd_convert(const GlobalOptions& opts, const ConvertOptions& convert_opts) {
    init_command(opts);

    auto config = load_config(opts);
    if (!config) {
        return 1;
    }

    if (!convert_opts.maps.empty()) {
        config->drive_mappings.clear();
        for (const auto& spec : convert_opts.maps) {
            auto mapping = parse_map_option(spec);
            if (!mapping) {
                print_error("Invalid --map (expected X:=/mount): " + spec, opts.json);
                return 1;
            }
            config->drive_mappings.push_back(*mapping);
        }
    }
    if (convert_opts.no_normalize) config->normalize = false;
    if (convert_opts.no_security) config->security_check = false;

    auto cp = CrossPath::with_config(convert_opts.path, *config);
    get_warning_collector().add_all(cp.warnings);
    if (!cp.ok) {
        print_error(error_to_string(cp.error), opts.json);
        return 1;
    }

    Result<std::string> converted;
    std::string target_name;
    if (convert_opts.to == "platform") {
        converted = cp.value.to_platform();
        target_name = "platform";
    } else {
        auto target = parse_path_style(convert_opts.to);
        if (!target) {
            print_error("Unknown style: " + convert_opts.to, opts.json);
            return 1;
        }
        converted = cp.value.to_style(*target);
        target_name = style_to_string(*target);
    }

    if (!converted.ok) {
        print_error(error_to_string(converted.error), opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["input"] = cp.value.canonical();
        j["output"] = converted.value;
        j["source_style"] = style_to_string(cp.value.source_style());
        j["target_style"] = target_name;
        j["encoding"] = encoding_to_string(cp.value.encoding());
        output_json(j);
    } else {
        std::cout << converted.value << std::endl;
    }

    return 0;
}

} // anonymous namespace

void setup_convert(CLI::App* app, GlobalOptions& opts) {
    static ConvertOptions convert_opts;

    app->add_option("path", convert_opts.path, "Path to convert")->required();
    app->add_option("--to", convert_opts.to, "Target style: unix, windows, auto or platform");
    app->add_option("--map", convert_opts.maps, "Drive mapping X:=/mount (repeatable, replaces config)");
    app->add_flag("--no-normalize", convert_opts.no_normalize, "Keep '.', '..' and repeated separators");
    app->add_flag("--no-security", convert_opts.no_security, "Skip the security checks");

    app->callback([&opts]() {
        std::exit(cmd_convert(opts, convert_opts));
    });
}

} // namespace crosspath::cli::commands
