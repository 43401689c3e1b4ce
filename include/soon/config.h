/**
 * @file config.h
 * @brief Codec defaults loaded from a JSON config file
 *
 * Example config.json:
 *   {
 *     "decode":  { "allow_duplicate_keys": false, "max_depth": 100, "strict": false },
 *     "encode":  { "indent": 2, "sort_keys": false, "compact": false },
 *     "verbose": false
 *   }
 *
 * Keys may also appear at top level; a section entry wins over a top-level
 * one. Values of the wrong JSON type are ignored.
 */

#pragma once

#include "soon/parser.h"
#include "soon/serializer.h"

#include "nlohmann/json.hpp"

#include <string>

namespace soon {

struct CodecConfig {
    ParserOptions decode;
    SerializerOptions encode;
    bool verbose = false;
};

/**
 * @brief Config file location
 *
 * $SOON_CONFIG_PATH, then $XDG_CONFIG_HOME/soon/config.json, then
 * $HOME/.config/soon/config.json.
 */
std::string default_config_path();

/**
 * @brief Overlay the settings found in @p root onto @p config
 */
void apply_config(const nlohmann::json& root, CodecConfig& config);

/**
 * @brief Read and apply a config file
 * @return false if the file is missing (error left empty) or unreadable /
 *         malformed (error set)
 */
bool load_config_file(const std::string& path, CodecConfig& config, std::string& error);

} // namespace soon
