/**
 * @file serializer.h
 * @brief Renders Values as SOON text
 *
 * Arrays under a key pick the densest form that reads back unchanged:
 *
 *   tags red green blue              all scalars
 *   users name  age                  records with identical key sets
 *     Alice 25
 *     Bob   30
 *   events kind:open at:1            records with differing key sets
 *     kind:close
 *
 * Any other array has no form that reads back and throws EncodeError
 * (UnrepresentableValue). At top level only scalar arrays are accepted.
 */

#pragma once

#include "soon/value.h"

#include <string>
#include <vector>

namespace soon {

struct SerializerOptions {
    int indent = 2;          // spaces per level, values below 1 act as 1
    bool sort_keys = false;  // lexicographic instead of insertion order
    bool compact = false;    // small flat records as one k:v line
};

class Serializer {
public:
    explicit Serializer(const SerializerOptions& options = SerializerOptions{});

    /**
     * @brief Render a value
     * @throws EncodeError on non-finite numbers and unrepresentable dates
     */
    std::string serialize(const Value& value) const;

    /// True if @p text would not read back as the same bare string
    static bool needs_quoting(const std::string& text);

    /// Double-quoted form with \" \\ \n \t \r escapes
    static std::string quote(const std::string& text);

    /// True if @p key lexes as a single identifier
    static bool is_bare_key(const std::string& key);

    /// Shortest round-trip form, no trailing ".0" for integers
    static std::string format_number(double number);

private:
    using Lines = std::vector<std::string>;

    std::string scalar(const Value& value) const;
    std::string inline_value(const Value& value) const;
    std::string inline_record(const Object& record) const;
    std::string format_key(const std::string& key) const;
    std::string pad(int level) const;

    std::vector<const Object::Entry*> ordered_entries(const Object& record) const;
    bool is_compact_record(const Object& record) const;
    bool is_flat_record(const Object& record) const;
    bool is_table(const Array& items) const;

    void write_object(const Object& record, int level, Lines& lines) const;
    void write_property(const std::string& key, const Value& value, int level, Lines& lines) const;
    void write_array(const std::string* key, const Array& items, int level, Lines& lines) const;
    void write_table(const std::string& key, const Array& items, int level, Lines& lines) const;

    static std::vector<size_t> calculate_column_widths(const std::vector<std::string>& headers,
                                                       const std::vector<std::vector<std::string>>& rows);
    static void trim_trailing_whitespace(std::string& line);

    SerializerOptions options_;
};

} // namespace soon
