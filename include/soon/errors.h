/**
 * @file errors.h
 * @brief Exception hierarchy for the SOON codec
 *
 * Every failure raised by the codec derives from SOONError, which carries an
 * ErrorCode and, when known, the 1-based line and column of the offending
 * input. Decode-side failures (lexing, parsing, evaluation) derive from
 * DecodeError and can render a source excerpt with a caret.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace soon {

/**
 * @brief Machine-readable failure kinds
 */
enum class ErrorCode {
    // Lexer
    UnexpectedCharacter,
    UnterminatedString,
    InconsistentIndentation,
    // Parser
    DuplicateKey,
    MaxDepthExceeded,
    InvalidDate,
    MalformedInlineRow,
    UnexpectedToken,
    NumberOutOfRange,
    // Evaluator
    UndefinedAnchor,
    UnknownNode,
    // Serializer
    NonFiniteNumber,
    DateOutOfRange,
    UnrepresentableValue,
    // Value model
    TypeMismatch,
    KeyNotFound,
    // Streaming / interop
    StreamClosed,
    InvalidJson
};

const char* error_code_name(ErrorCode code);

/**
 * @brief Base class of every SOON error
 */
class SOONError : public std::runtime_error {
public:
    SOONError(ErrorCode code, const std::string& message, int line = 0, int column = 0);

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }
    int line() const { return line_; }
    int column() const { return column_; }
    bool has_position() const { return line_ > 0; }

    /// Class name used when rendering diagnostics
    virtual const char* kind() const { return "SOONError"; }

private:
    ErrorCode code_;
    std::string message_;
    int line_;
    int column_;
};

/**
 * @brief Failure while turning text into a Value
 */
class DecodeError : public SOONError {
public:
    using SOONError::SOONError;

    const char* kind() const override { return "DecodeError"; }

    /**
     * @brief Remember the offending source line so format() can show it
     * @param source Full document text the error was raised on
     */
    void attach_source(const std::string& source);

    const std::string& source_line() const { return source_line_; }

    /**
     * @brief Render "Kind: message at line L, column C" plus an excerpt
     *
     * The excerpt is the offending line followed by a line with a caret under
     * the reported column. Without attached source only the first line is
     * produced.
     */
    std::string format() const;

private:
    std::string source_line_;
    bool has_source_ = false;
};

class LexError : public DecodeError {
public:
    using DecodeError::DecodeError;
    const char* kind() const override { return "LexError"; }
};

class ParseError : public DecodeError {
public:
    using DecodeError::DecodeError;
    const char* kind() const override { return "ParseError"; }
};

class EvalError : public DecodeError {
public:
    using DecodeError::DecodeError;
    const char* kind() const override { return "EvalError"; }
};

/**
 * @brief Value cannot be represented in SOON text
 */
class EncodeError : public SOONError {
public:
    using SOONError::SOONError;
    const char* kind() const override { return "EncodeError"; }
};

/**
 * @brief Wrong accessor used on a Value, or missing key
 */
class SOONTypeError : public SOONError {
public:
    using SOONError::SOONError;
    const char* kind() const override { return "SOONTypeError"; }
};

class StreamError : public SOONError {
public:
    using SOONError::SOONError;
    const char* kind() const override { return "StreamError"; }
};

class JsonError : public SOONError {
public:
    using SOONError::SOONError;
    const char* kind() const override { return "JsonError"; }
};

} // namespace soon
