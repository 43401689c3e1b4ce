/**
 * @file soon.h
 * @brief SOON (Streamable Object Notation Optimized) public API
 *
 * An indentation-structured text format for the JSON value model plus dates
 * and binary data, with tables, inline records and chunked streaming.
 *
 * Quick start:
 *   #include "soon/soon.h"
 *
 *   soon::Value v = soon::decode("name John\nage 30");
 *   std::string name = v["name"].as_string();
 *
 *   soon::SerializerOptions opts;
 *   opts.compact = true;
 *   std::string text = soon::encode(soon::Object{{"x", 10}, {"y", 20}}, opts);
 *   // text == "x:10 y:20"
 */

#pragma once

#include "soon/base64.h"
#include "soon/date_time.h"
#include "soon/errors.h"
#include "soon/evaluator.h"
#include "soon/lexer.h"
#include "soon/parser.h"
#include "soon/serializer.h"
#include "soon/stream_parser.h"
#include "soon/value.h"

#include <string>
#include <vector>

namespace soon {

static const char* const VERSION = "1.0.0";

/**
 * @brief Outcome of validate()
 */
struct ValidationResult {
    bool valid = true;
    ErrorCode code = ErrorCode::UnexpectedToken;  // meaningful only when !valid
    std::string message;
    int line = 0;
    int column = 0;
    std::string details;                          // DecodeError::format() output

    std::string to_string() const;
};

/**
 * @brief Parse SOON text into a Value
 * @throws LexError, ParseError or EvalError, with the source line attached
 */
Value decode(const std::string& text, const ParserOptions& options = ParserOptions{});

/**
 * @brief Render a Value as SOON text
 * @throws EncodeError
 */
std::string encode(const Value& value, const SerializerOptions& options = SerializerOptions{});

/**
 * @brief Check that text decodes, without throwing on bad input
 */
ValidationResult validate(const std::string& text, const ParserOptions& options = ParserOptions{});

/**
 * @brief Token stream of @p text, comments dropped
 * @throws LexError
 */
std::vector<Token> tokenize(const std::string& text);

} // namespace soon
