/**
 * @file errors.cpp
 * @brief SOON error formatting
 */

#include "soon/errors.h"

#include <sstream>

namespace soon {

namespace {

std::string with_position(const std::string& message, int line, int column) {
    if (line <= 0) {
        return message;
    }
    return "Line " + std::to_string(line) + ", Col " + std::to_string(column) + ": " + message;
}

} // anonymous namespace

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::UnexpectedCharacter:     return "UNEXPECTED_CHARACTER";
        case ErrorCode::UnterminatedString:      return "UNTERMINATED_STRING";
        case ErrorCode::InconsistentIndentation: return "INCONSISTENT_INDENTATION";
        case ErrorCode::DuplicateKey:            return "DUPLICATE_KEY";
        case ErrorCode::MaxDepthExceeded:        return "MAX_DEPTH_EXCEEDED";
        case ErrorCode::InvalidDate:             return "INVALID_DATE";
        case ErrorCode::MalformedInlineRow:      return "MALFORMED_INLINE_ROW";
        case ErrorCode::UnexpectedToken:         return "UNEXPECTED_TOKEN";
        case ErrorCode::NumberOutOfRange:        return "NUMBER_OUT_OF_RANGE";
        case ErrorCode::UndefinedAnchor:         return "UNDEFINED_ANCHOR";
        case ErrorCode::UnknownNode:             return "UNKNOWN_NODE";
        case ErrorCode::NonFiniteNumber:         return "NON_FINITE_NUMBER";
        case ErrorCode::DateOutOfRange:          return "DATE_OUT_OF_RANGE";
        case ErrorCode::UnrepresentableValue:    return "UNREPRESENTABLE_VALUE";
        case ErrorCode::TypeMismatch:            return "TYPE_MISMATCH";
        case ErrorCode::KeyNotFound:             return "KEY_NOT_FOUND";
        case ErrorCode::StreamClosed:            return "STREAM_CLOSED";
        case ErrorCode::InvalidJson:             return "INVALID_JSON";
    }
    return "UNKNOWN";
}

SOONError::SOONError(ErrorCode code, const std::string& message, int line, int column)
    : std::runtime_error(with_position(message, line, column))
    , code_(code)
    , message_(message)
    , line_(line)
    , column_(column) {
}

void DecodeError::attach_source(const std::string& source) {
    if (line() <= 0) {
        return;
    }

    size_t start = 0;
    for (int current = 1; current < line(); ++current) {
        size_t nl = source.find('\n', start);
        if (nl == std::string::npos) {
            return;
        }
        start = nl + 1;
    }

    size_t end = source.find('\n', start);
    source_line_ = source.substr(start, end == std::string::npos ? std::string::npos : end - start);
    if (!source_line_.empty() && source_line_.back() == '\r') {
        source_line_.pop_back();
    }
    has_source_ = true;
}

std::string DecodeError::format() const {
    std::ostringstream out;
    out << kind() << ": " << message();
    if (has_position()) {
        out << " at line " << line() << ", column " << column();
    }
    if (has_source_) {
        out << "\n" << source_line_ << "\n";
        out << std::string(column() > 1 ? static_cast<size_t>(column() - 1) : 0, ' ') << "^";
    }
    return out.str();
}

} // namespace soon
