/**
 * crosspath CLI - check command
 *
 * Run traversal, reserved name, character and system directory checks.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace crosspath::cli::commands {

namespace {

struct CheckOptions {
    std::string path;
};

int cmd_check(const GlobalOptions& opts, const CheckOptions& check_opts) {
    init_command(opts);

    auto config = load_config(opts);
    if (!config) {
        return 1;
    }

    auto decoded = to_utf8(check_opts.path, config->preserve_encoding);
    get_warning_collector().add_all(decoded.warnings);
    if (!decoded.ok) {
        print_error(error_to_string(decoded.error), opts.json);
        return 1;
    }

    PathSecurityChecker checker(*config);
    auto result = checker.check(decoded.value);

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = result.ok;
        j["path"] = decoded.value;
        if (!result.ok) {
            j["violation"] = violation_to_string(result.violation.kind);
            j["fragment"] = result.violation.fragment;
        }
        output_json(j);
    } else if (result.ok) {
        if (!opts.quiet) {
            std::cout << "ok: " << decoded.value << std::endl;
        }
    } else {
        std::cout << violation_to_string(result.violation.kind) << ": "
                  << result.violation.fragment << std::endl;
    }

    return result.ok ? 0 : 1;
}

} // anonymous namespace

void setup_check(CLI::App* app, GlobalOptions& opts) {
    static CheckOptions check_opts;

    app->add_option("path", check_opts.path, "Path to check")->required();

    app->callback([&opts]() {
        std::exit(cmd_check(opts, check_opts));
    });
}

} // namespace crosspath::cli::commands
