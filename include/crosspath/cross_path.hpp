#pragma once

#include "crosspath/export.hpp"
#include "crosspath/path_config.hpp"
#include "crosspath/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace crosspath {

// ============================================================================
// CrossPath
// ============================================================================

// A path decoded, validated and ready to be rendered in either style.
//
// Construction runs the pipeline once:
//   raw bytes -> encoding detection -> security check (per config) -> canonical text
// Conversions are computed on demand and never modify the instance, so a
// CrossPath can be shared between threads freely.
//
//   auto cp = CrossPath::create(R"(C:\Users\John\file.txt)");
//   if (cp.ok) {
//       auto unix_path = cp.value.to_unix();  // "/mnt/c/Users/John/file.txt"
//   }
class CROSSPATH_API CrossPath {
public:
    // Empty path with the default config. Only meaningful as the value of a
    // failed Result; use the factories below.
    CrossPath() = default;

    // with_config(input, default_path_config())
    static Result<CrossPath> create(const std::string& input);

    // Fails with InvalidConfig, Encoding or Security errors (first one wins)
    static Result<CrossPath> with_config(const std::string& input, const PathConfig& config);

    static Result<CrossPath> from_bytes(const std::vector<uint8_t>& bytes,
                                        const PathConfig& config);
    static Result<CrossPath> from_bytes(const std::vector<uint8_t>& bytes);

    Result<std::string> to_unix() const;
    Result<std::string> to_windows() const;

    // Auto converts to the style opposite to the source style
    Result<std::string> to_style(PathStyle style) const;

    // The configured style; Auto means the current platform's style
    Result<std::string> to_platform() const;

    // Explicit check, for callers running with security_check disabled
    SecurityCheckResult check_security() const;

    const std::string& original() const { return original_; }
    const std::string& canonical() const { return canonical_; }
    PathStyle source_style() const { return source_style_; }
    DetectedEncoding encoding() const { return encoding_; }
    const PathConfig& config() const { return config_; }
    bool lossy() const { return lossy_; }

private:
    std::string original_;
    std::string canonical_;
    PathStyle source_style_ = PathStyle::Auto;
    DetectedEncoding encoding_ = DetectedEncoding::UTF8;
    PathConfig config_;
    bool lossy_ = false;
};

// Shortcuts over the same pipeline with the default config
CROSSPATH_API Result<std::string> to_unix_path(const std::string& path);
CROSSPATH_API Result<std::string> to_windows_path(const std::string& path);

} // namespace crosspath
