/**
 * crosspath CLI - detect command
 *
 * Classify raw bytes given as hex or read from a file, then decode them.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

#include <cctype>

namespace crosspath::cli::commands {

namespace {

struct DetectOptions {
    std::string hex;
    std::string file;
    bool lossy = false;
};

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// "43 3a 5c" or "433a5c"
std::optional<std::string> parse_hex(const std::string& text) {
    std::string bytes;
    int high = -1;
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            continue;
        }
        int v = hex_value(c);
        if (v < 0) {
            return std::nullopt;
        }
        if (high < 0) {
            high = v;
        } else {
            bytes.push_back(static_cast<char>((high << 4) | v));
            high = -1;
        }
    }
    if (high >= 0) {
        return std::nullopt;
    }
    return bytes;
}

int cmd_detect(const GlobalOptions& opts, const DetectOptions& detect_opts) {
    init_command(opts);

    if (detect_opts.hex.empty() && detect_opts.file.empty()) {
        print_error("Either --hex or --file is required", opts.json);
        return 1;
    }

    std::string bytes;
    if (!detect_opts.hex.empty()) {
        auto parsed = parse_hex(detect_opts.hex);
        if (!parsed) {
            print_error("Invalid hex input: " + detect_opts.hex, opts.json);
            return 1;
        }
        bytes = *parsed;
    } else {
        auto content = read_file(detect_opts.file);
        if (!content) {
            print_error("Failed to read file: " + detect_opts.file, opts.json);
            return 1;
        }
        bytes = *content;
    }

    DetectedEncoding detected = detect_encoding(bytes);
    auto decoded = decode_path_bytes(bytes, detect_opts.lossy);
    get_warning_collector().add_all(decoded.warnings);

    if (!decoded.ok) {
        if (opts.json) {
            nlohmann::json j;
            j["ok"] = false;
            j["encoding"] = encoding_to_string(detected);
            j["error"] = error_to_string(decoded.error);
            output_json(j);
        } else {
            std::cout << encoding_name(detected) << std::endl;
            print_error(error_to_string(decoded.error), false);
        }
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["encoding"] = encoding_to_string(detected);
        j["text"] = decoded.value.text;
        j["lossy"] = decoded.value.lossy;
        output_json(j);
    } else {
        std::cout << encoding_name(detected) << ": " << decoded.value.text << std::endl;
    }

    return 0;
}

} // anonymous namespace

void setup_detect(CLI::App* app, GlobalOptions& opts) {
    static DetectOptions detect_opts;

    auto* hex = app->add_option("--hex", detect_opts.hex, "Bytes as hex digits");
    auto* file = app->add_option("--file", detect_opts.file, "Read bytes from a file");
    hex->excludes(file);
    app->add_flag("--lossy", detect_opts.lossy, "Replace undecodable bytes instead of failing");

    app->callback([&opts]() {
        std::exit(cmd_detect(opts, detect_opts));
    });
}

} // namespace crosspath::cli::commands
