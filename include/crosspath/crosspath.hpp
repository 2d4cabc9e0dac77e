#pragma once

/**
 * @file crosspath.hpp
 * @brief Umbrella header for the crosspath library
 *
 * Converts path strings between Windows and Unix conventions, decodes path
 * bytes from legacy Windows encodings and rejects dangerous paths.
 *
 * @example
 * ```cpp
 * #include <crosspath/crosspath.hpp>
 *
 * auto unix_path = crosspath::to_unix_path(R"(C:\Users\John\file.txt)");
 * // unix_path.value == "/mnt/c/Users/John/file.txt"
 *
 * crosspath::PathConfig config = crosspath::default_path_config();
 * config.drive_mappings = {{"D:", "/mnt/data"}};
 * auto cp = crosspath::CrossPath::with_config(R"(D:\Data\file.txt)", config);
 * // cp.value.to_unix().value == "/mnt/data/Data/file.txt"
 * ```
 */

#include "crosspath/converter.hpp"
#include "crosspath/cross_path.hpp"
#include "crosspath/encoding.hpp"
#include "crosspath/export.hpp"
#include "crosspath/path_config.hpp"
#include "crosspath/path_parser.hpp"
#include "crosspath/security.hpp"
#include "crosspath/types.hpp"
