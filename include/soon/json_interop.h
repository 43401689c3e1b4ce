/**
 * @file json_interop.h
 * @brief Conversion between SOON and JSON (nlohmann::ordered_json)
 *
 * Member order is preserved in both directions. Dates become ISO-8601 strings
 * and binary data becomes Base64 strings, so JSON -> SOON never yields those
 * two kinds.
 */

#pragma once

#include "soon/parser.h"
#include "soon/serializer.h"
#include "soon/value.h"

#include "nlohmann/json.hpp"

#include <string>

namespace soon {

Value from_json_value(const nlohmann::ordered_json& json);
nlohmann::ordered_json to_json_value(const Value& value);

/**
 * @brief JSON text to SOON text
 * @throws JsonError on malformed JSON, EncodeError from the serializer
 */
std::string from_json(const std::string& json_text,
                      const SerializerOptions& options = SerializerOptions{});

/**
 * @brief SOON text to JSON text
 * @param indent Spaces per level; negative for single-line output
 * @throws DecodeError
 */
std::string to_json(const std::string& soon_text,
                    const ParserOptions& options = ParserOptions{},
                    int indent = 2);

} // namespace soon
