/**
 * @file serializer.cpp
 * @brief SOON text output
 */

#include "soon/serializer.h"
#include "soon/base64.h"
#include "soon/errors.h"
#include "soon/lexer.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <set>

namespace soon {

namespace {

constexpr size_t kCompactMaxKeys = 4;

bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

// ^-?\d+\.?\d*([eE][+-]?\d+)?$
bool looks_like_number(const std::string& s) {
    size_t i = 0;
    if (i < s.size() && s[i] == '-') ++i;

    size_t digits_start = i;
    while (i < s.size() && is_digit(s[i])) ++i;
    if (i == digits_start) return false;

    if (i < s.size() && s[i] == '.') ++i;
    while (i < s.size() && is_digit(s[i])) ++i;

    if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
        ++i;
        if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
        size_t exp_start = i;
        while (i < s.size() && is_digit(s[i])) ++i;
        if (i == exp_start) return false;
    }
    return i == s.size();
}

std::string join(const std::vector<std::string>& parts, const std::string& separator) {
    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) result += separator;
        result += parts[i];
    }
    return result;
}

} // anonymous namespace

Serializer::Serializer(const SerializerOptions& options) : options_(options) {
    if (options_.indent < 1) {
        options_.indent = 1;
    }
}

std::string Serializer::serialize(const Value& value) const {
    if (value.is_scalar()) {
        return scalar(value);
    }

    Lines lines;
    if (value.is_array()) {
        write_array(nullptr, value.as_array(), 0, lines);
    } else {
        const Object& record = value.as_object();
        if (options_.compact && !record.empty() && is_compact_record(record)) {
            return inline_record(record);
        }
        write_object(record, 0, lines);
    }
    return join(lines, "\n");
}

// =============================================================================
// Scalars
// =============================================================================

bool Serializer::needs_quoting(const std::string& text) {
    if (text.empty()) return true;
    if (text == "true" || text == "false" || text == "null") return true;
    if (looks_like_number(text)) return true;
    if (match_iso8601(text, 0) == text.size()) return true;

    // Spaces, ':', '#', '|', quotes, control characters, ...
    for (char c : text) {
        if (!Lexer::is_word_char(c)) return true;
    }
    return false;
}

std::string Serializer::quote(const std::string& text) {
    std::string escaped;
    escaped.reserve(text.size() + 2);
    escaped += '"';
    for (char c : text) {
        switch (c) {
            case '\\': escaped += "\\\\"; break;
            case '"':  escaped += "\\\""; break;
            case '\n': escaped += "\\n"; break;
            case '\t': escaped += "\\t"; break;
            case '\r': escaped += "\\r"; break;
            default:   escaped += c; break;
        }
    }
    escaped += '"';
    return escaped;
}

bool Serializer::is_bare_key(const std::string& key) {
    if (needs_quoting(key)) return false;
    // Leading digits lex as a number, date or glued string
    if (is_digit(key[0])) return false;
    if (key[0] == '-' && key.size() > 1 && is_digit(key[1])) return false;
    return true;
}

std::string Serializer::format_number(double number) {
    if (!std::isfinite(number)) {
        throw EncodeError(ErrorCode::NonFiniteNumber, "Cannot encode non-finite number");
    }
    char buf[32];
    auto result = std::to_chars(buf, buf + sizeof(buf), number);
    return std::string(buf, result.ptr);
}

std::string Serializer::scalar(const Value& value) const {
    switch (value.type()) {
        case ValueType::Null:
            return "null";
        case ValueType::Bool:
            return value.as_bool() ? "true" : "false";
        case ValueType::Number:
            return format_number(value.as_number());
        case ValueType::String: {
            const std::string& text = value.as_string();
            return needs_quoting(text) ? quote(text) : text;
        }
        case ValueType::Date: {
            const DateTime& date = value.as_date();
            if (!date.is_valid()) {
                throw EncodeError(ErrorCode::InvalidDate, "Cannot encode invalid date");
            }
            int year = date.year();
            if (year < 0 || year > 9999) {
                throw EncodeError(ErrorCode::DateOutOfRange,
                                  "Date year " + std::to_string(year) + " is outside 0000-9999");
            }
            return date.to_iso_string();
        }
        case ValueType::Binary:
            return quote(base64_encode(value.as_binary()));
        case ValueType::Array:
        case ValueType::Object:
            break;
    }
    return inline_value(value);
}

std::string Serializer::inline_value(const Value& value) const {
    if (value.is_scalar()) {
        return scalar(value);
    }
    if (value.is_object()) {
        return inline_record(value.as_object());
    }
    std::vector<std::string> parts;
    for (const auto& item : value.as_array()) {
        parts.push_back(inline_value(item));
    }
    return join(parts, " ");
}

std::string Serializer::inline_record(const Object& record) const {
    std::vector<std::string> parts;
    for (const Object::Entry* entry : ordered_entries(record)) {
        parts.push_back(format_key(entry->first) + ":" + inline_value(entry->second));
    }
    return join(parts, " ");
}

std::string Serializer::format_key(const std::string& key) const {
    return is_bare_key(key) ? key : quote(key);
}

std::string Serializer::pad(int level) const {
    return std::string(static_cast<size_t>(level * options_.indent), ' ');
}

// =============================================================================
// Shape checks
// =============================================================================

std::vector<const Object::Entry*> Serializer::ordered_entries(const Object& record) const {
    std::vector<const Object::Entry*> entries;
    entries.reserve(record.size());
    for (const auto& entry : record) {
        entries.push_back(&entry);
    }
    if (options_.sort_keys) {
        std::sort(entries.begin(), entries.end(),
                  [](const Object::Entry* a, const Object::Entry* b) { return a->first < b->first; });
    }
    return entries;
}

bool Serializer::is_compact_record(const Object& record) const {
    return record.size() <= kCompactMaxKeys && is_flat_record(record);
}

bool Serializer::is_flat_record(const Object& record) const {
    for (const auto& entry : record) {
        if (!entry.second.is_scalar()) return false;
    }
    return true;
}

bool Serializer::is_table(const Array& items) const {
    std::set<std::string> columns;
    for (size_t i = 0; i < items.size(); ++i) {
        if (!items[i].is_object()) return false;
        const Object& record = items[i].as_object();
        if (record.empty() || !is_flat_record(record)) return false;

        std::set<std::string> keys;
        for (const auto& entry : record) {
            if (!is_bare_key(entry.first)) return false;
            keys.insert(entry.first);
        }
        if (i == 0) {
            columns = std::move(keys);
        } else if (keys != columns) {
            return false;
        }
    }
    return !items.empty();
}

// =============================================================================
// Block output
// =============================================================================

void Serializer::write_object(const Object& record, int level, Lines& lines) const {
    for (const Object::Entry* entry : ordered_entries(record)) {
        write_property(entry->first, entry->second, level, lines);
    }
}

void Serializer::write_property(const std::string& key, const Value& value, int level, Lines& lines) const {
    std::string formatted_key = format_key(key);

    if (value.is_scalar()) {
        lines.push_back(pad(level) + formatted_key + " " + scalar(value));
        return;
    }

    if (value.is_array()) {
        write_array(&formatted_key, value.as_array(), level, lines);
        return;
    }

    const Object& record = value.as_object();
    lines.push_back(pad(level) + formatted_key);
    if (record.empty()) {
        return;
    }
    if (options_.compact && is_compact_record(record)) {
        lines.push_back(pad(level + 1) + inline_record(record));
        return;
    }
    write_object(record, level + 1, lines);
}

void Serializer::write_array(const std::string* key, const Array& items, int level, Lines& lines) const {
    std::string prefix = pad(level) + (key ? *key : std::string());

    if (items.empty()) {
        if (key) lines.push_back(prefix);
        return;
    }

    bool all_scalar = std::all_of(items.begin(), items.end(),
                                  [](const Value& v) { return v.is_scalar(); });
    if (all_scalar) {
        std::vector<std::string> parts;
        for (const auto& item : items) {
            parts.push_back(scalar(item));
        }
        lines.push_back(key ? prefix + " " + join(parts, " ") : prefix + join(parts, " "));
        return;
    }

    if (key && is_table(items)) {
        write_table(*key, items, level, lines);
        return;
    }

    bool all_flat_records = std::all_of(items.begin(), items.end(), [this](const Value& v) {
        return v.is_object() && !v.as_object().empty() && is_flat_record(v.as_object());
    });
    if (key && all_flat_records) {
        lines.push_back(prefix + " " + inline_record(items.front().as_object()));
        for (size_t i = 1; i < items.size(); ++i) {
            lines.push_back(pad(level + 1) + inline_record(items[i].as_object()));
        }
        return;
    }

    // Nested arrays, mixed records and records holding containers have no line form
    // that reads back as an array. At top level only scalar arrays do.
    throw EncodeError(ErrorCode::UnrepresentableValue,
                      key ? "Cannot encode array '" + *key + "': elements must be scalars or flat records"
                          : std::string("Cannot encode a top-level array of non-scalar values"));
}

void Serializer::write_table(const std::string& key, const Array& items, int level, Lines& lines) const {
    std::vector<std::string> headers;
    for (const Object::Entry* entry : ordered_entries(items.front().as_object())) {
        headers.push_back(entry->first);
    }

    std::vector<std::vector<std::string>> rows;
    rows.reserve(items.size());
    for (const auto& item : items) {
        const Object& record = item.as_object();
        std::vector<std::string> cells;
        cells.reserve(headers.size());
        for (const auto& header : headers) {
            cells.push_back(scalar(record.at(header)));
        }
        rows.push_back(std::move(cells));
    }

    std::vector<size_t> widths = calculate_column_widths(headers, rows);

    auto render = [&widths](const std::vector<std::string>& cells) {
        std::string line;
        for (size_t i = 0; i < cells.size(); ++i) {
            if (i > 0) line += " ";
            line += cells[i];
            if (cells[i].size() < widths[i]) {
                line.append(widths[i] - cells[i].size(), ' ');
            }
        }
        return line;
    };

    std::string header_line = pad(level) + key + " " + render(headers);
    trim_trailing_whitespace(header_line);
    lines.push_back(header_line);

    for (const auto& cells : rows) {
        std::string row_line = pad(level + 1) + render(cells);
        trim_trailing_whitespace(row_line);
        lines.push_back(row_line);
    }
}

std::vector<size_t> Serializer::calculate_column_widths(const std::vector<std::string>& headers,
                                                        const std::vector<std::vector<std::string>>& rows) {
    std::vector<size_t> widths(headers.size());
    for (size_t i = 0; i < headers.size(); ++i) {
        widths[i] = headers[i].size();
    }
    for (const auto& row : rows) {
        for (size_t i = 0; i < row.size() && i < widths.size(); ++i) {
            widths[i] = std::max(widths[i], row[i].size());
        }
    }
    return widths;
}

void Serializer::trim_trailing_whitespace(std::string& line) {
    while (!line.empty() && (line.back() == ' ' || line.back() == '\t')) {
        line.pop_back();
    }
}

} // namespace soon
