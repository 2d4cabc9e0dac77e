/**
 * crosspath CLI - sanitize command
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace crosspath::cli::commands {

namespace {

struct SanitizeOptions {
    std::string segment;
};

int cmd_sanitize(const GlobalOptions& opts, const SanitizeOptions& sanitize_opts) {
    init_command(opts);

    std::string sanitized = PathSecurityChecker::sanitize_path(sanitize_opts.segment);
    if (sanitized != sanitize_opts.segment) {
        spdlog::debug("sanitized '{}' to '{}'", sanitize_opts.segment, sanitized);
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["input"] = sanitize_opts.segment;
        j["output"] = sanitized;
        j["changed"] = sanitized != sanitize_opts.segment;
        output_json(j);
    } else {
        std::cout << sanitized << std::endl;
    }

    return 0;
}

} // anonymous namespace

void setup_sanitize(CLI::App* app, GlobalOptions& opts) {
    static SanitizeOptions sanitize_opts;

    app->add_option("segment", sanitize_opts.segment, "File or directory name")->required();

    app->callback([&opts]() {
        std::exit(cmd_sanitize(opts, sanitize_opts));
    });
}

} // namespace crosspath::cli::commands
