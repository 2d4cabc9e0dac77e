/**
 * crosspath CLI - config command
 *
 * Print the effective path config as JSON.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace crosspath::cli::commands {

namespace {

struct ConfigOptions {
    bool defaults = false;
};

int cmd_config(const GlobalOptions& opts, const ConfigOptions& config_opts) {
    init_command(opts);

    PathConfig config;
    if (!config_opts.defaults) {
        auto loaded = load_config(opts);
        if (!loaded) {
            return 1;
        }
        config = *loaded;
    }

    // Always JSON; --json only adds the warnings envelope
    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["config"] = nlohmann::json::parse(serialize_path_config(config));
        output_json(j);
    } else {
        std::cout << serialize_path_config(config) << std::endl;
    }

    return 0;
}

} // anonymous namespace

void setup_config(CLI::App* app, GlobalOptions& opts) {
    static ConfigOptions config_opts;

    app->add_flag("--defaults", config_opts.defaults, "Ignore --config and print the defaults");

    app->callback([&opts]() {
        std::exit(cmd_config(opts, config_opts));
    });
}

} // namespace crosspath::cli::commands
