/**
 * crosspath CLI - Entry Point
 *
 * Converts, checks and decodes paths from the command line.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace crosspath::cli::commands {
    void setup_convert(CLI::App* app, GlobalOptions& opts);
    void setup_check(CLI::App* app, GlobalOptions& opts);
    void setup_sanitize(CLI::App* app, GlobalOptions& opts);
    void setup_detect(CLI::App* app, GlobalOptions& opts);
    void setup_config(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace crosspath::cli;

    CLI::App app{"crosspath - Windows/Unix path conversion"};
    app.set_version_flag("-V,--version", CROSSPATH_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_option("--config", opts.config_path, "Path config JSON file");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Log each pipeline stage");
    app.add_flag("-q,--quiet", opts.quiet, "Minimal output");

    // Commands
    auto* convert_cmd = app.add_subcommand("convert", "Convert a path to another style");
    commands::setup_convert(convert_cmd, opts);

    auto* check_cmd = app.add_subcommand("check", "Run the security checks on a path");
    commands::setup_check(check_cmd, opts);

    auto* sanitize_cmd = app.add_subcommand("sanitize", "Make a single segment safe to use");
    commands::setup_sanitize(sanitize_cmd, opts);

    auto* detect_cmd = app.add_subcommand("detect", "Detect and decode the encoding of raw bytes");
    commands::setup_detect(detect_cmd, opts);

    auto* config_cmd = app.add_subcommand("config", "Print the effective path config");
    commands::setup_config(config_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
