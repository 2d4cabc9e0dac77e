#include "crosspath/cross_path.hpp"
#include "crosspath/converter.hpp"
#include "crosspath/encoding.hpp"
#include "crosspath/path_parser.hpp"
#include "crosspath/security.hpp"

#include <spdlog/spdlog.h>

namespace crosspath {

Result<CrossPath> CrossPath::with_config(const std::string& input, const PathConfig& config) {
    Error invalid = validate_path_config(config);
    if (invalid.has_error()) {
        spdlog::debug("rejecting path config: {}", invalid.message);
        return make_failure<CrossPath>(invalid);
    }

    // 1. Encoding
    auto decoded = decode_path_bytes(input, config.preserve_encoding);
    if (!decoded.ok) {
        spdlog::debug("cannot decode path bytes: {}", decoded.error.message);
        Result<CrossPath> failed = make_failure<CrossPath>(decoded.error);
        failed.warnings = decoded.warnings;
        return failed;
    }
    spdlog::debug("decoded {} bytes as {}", input.size(), encoding_name(decoded.value.encoding));

    CrossPath path;
    path.original_ = input;
    path.canonical_ = std::move(decoded.value.text);
    path.encoding_ = decoded.value.encoding;
    path.lossy_ = decoded.value.lossy;
    path.config_ = config;
    path.source_style_ = detect_style(path.canonical_);

    // 2. Security
    if (config.security_check) {
        PathSecurityChecker checker(config);
        auto check = checker.check(path.canonical_);
        if (!check.ok) {
            spdlog::debug("security check failed for '{}': {} ({})", path.canonical_,
                          violation_to_string(check.violation.kind), check.violation.fragment);
            Result<CrossPath> failed = make_failure<CrossPath>(make_security_error(check.violation));
            failed.warnings = decoded.warnings;
            return failed;
        }
    }

    spdlog::debug("accepted '{}' as {} path", path.canonical_, style_to_string(path.source_style_));

    Result<CrossPath> result = make_ok(std::move(path));
    result.warnings = std::move(decoded.warnings);
    return result;
}

Result<CrossPath> CrossPath::create(const std::string& input) {
    return with_config(input, default_path_config());
}

Result<CrossPath> CrossPath::from_bytes(const std::vector<uint8_t>& bytes,
                                        const PathConfig& config) {
    return with_config(std::string(bytes.begin(), bytes.end()), config);
}

Result<CrossPath> CrossPath::from_bytes(const std::vector<uint8_t>& bytes) {
    return from_bytes(bytes, default_path_config());
}

Result<std::string> CrossPath::to_style(PathStyle style) const {
    PathStyleConverter converter(config_);
    return converter.convert(canonical_, source_style_, style);
}

Result<std::string> CrossPath::to_unix() const {
    return to_style(PathStyle::Unix);
}

Result<std::string> CrossPath::to_windows() const {
    return to_style(PathStyle::Windows);
}

Result<std::string> CrossPath::to_platform() const {
    PathStyle target = config_.style == PathStyle::Auto ? current_platform_style() : config_.style;
    return to_style(target);
}

SecurityCheckResult CrossPath::check_security() const {
    PathSecurityChecker checker(config_);
    return checker.check(canonical_);
}

Result<std::string> to_unix_path(const std::string& path) {
    auto cp = CrossPath::create(path);
    if (!cp.ok) {
        Result<std::string> failed = make_failure<std::string>(cp.error);
        failed.warnings = cp.warnings;
        return failed;
    }
    return cp.value.to_unix();
}

Result<std::string> to_windows_path(const std::string& path) {
    auto cp = CrossPath::create(path);
    if (!cp.ok) {
        Result<std::string> failed = make_failure<std::string>(cp.error);
        failed.warnings = cp.warnings;
        return failed;
    }
    return cp.value.to_windows();
}

} // namespace crosspath
