/**
 * @file soon.cpp
 * @brief decode / encode / validate entry points
 */

#include "soon/soon.h"

#include <sstream>

namespace soon {

std::string ValidationResult::to_string() const {
    if (valid) {
        return "valid";
    }
    std::ostringstream oss;
    oss << "invalid (" << error_code_name(code) << "): " << message;
    if (line > 0) {
        oss << " at line " << line << ", column " << column;
    }
    return oss.str();
}

Value decode(const std::string& text, const ParserOptions& options) {
    try {
        Lexer lexer(text);
        Parser parser(lexer.tokenize(), options);
        auto root = parser.parse();
        Evaluator evaluator;
        return evaluator.evaluate(*root);
    } catch (DecodeError& e) {
        e.attach_source(text);
        throw;
    }
}

std::string encode(const Value& value, const SerializerOptions& options) {
    Serializer serializer(options);
    return serializer.serialize(value);
}

ValidationResult validate(const std::string& text, const ParserOptions& options) {
    ValidationResult result;
    try {
        decode(text, options);
    } catch (const DecodeError& e) {
        result.valid = false;
        result.code = e.code();
        result.message = e.message();
        result.line = e.line();
        result.column = e.column();
        result.details = e.format();
    }
    return result;
}

std::vector<Token> tokenize(const std::string& text) {
    Lexer lexer(text);
    return lexer.tokenize();
}

} // namespace soon
