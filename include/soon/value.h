/**
 * @file value.h
 * @brief SOON value model
 *
 * A Value is a closed tagged union over null, booleans, numbers (IEEE-754
 * double), strings, dates, binary buffers, arrays and insertion-ordered
 * records. Values own their children; copying a Value copies the whole tree.
 */

#pragma once

#include "soon/date_time.h"

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace soon {

class Value;

// =============================================================================
// Value Type
// =============================================================================

enum class ValueType {
    Null,
    Bool,
    Number,
    String,
    Date,
    Binary,
    Array,
    Object
};

const char* value_type_name(ValueType type);

using Array = std::vector<Value>;
using Binary = std::vector<uint8_t>;

// =============================================================================
// Object (insertion-ordered record)
// =============================================================================

/**
 * @brief String-keyed record that remembers insertion order
 *
 * Iteration and serialization follow insertion order. Re-setting an existing
 * key replaces the value in place. Equality ignores order.
 */
class Object {
public:
    using Entry = std::pair<std::string, Value>;
    using iterator = std::vector<Entry>::iterator;
    using const_iterator = std::vector<Entry>::const_iterator;

    Object();
    Object(std::initializer_list<Entry> entries);
    Object(const Object& other);
    Object(Object&& other) noexcept;
    Object& operator=(const Object& other);
    Object& operator=(Object&& other) noexcept;
    ~Object();

    size_t size() const;
    bool empty() const;
    bool contains(const std::string& key) const;

    /// Pointer to the value for @p key, nullptr if absent
    const Value* get(const std::string& key) const;
    Value* get(const std::string& key);

    /// Throws SOONTypeError (KeyNotFound) if absent
    const Value& at(const std::string& key) const;
    Value& at(const std::string& key);

    /// Inserts null for a missing key
    Value& operator[](const std::string& key);

    void set(const std::string& key, Value value);
    bool erase(const std::string& key);
    void clear();

    std::vector<std::string> keys() const;

    iterator begin();
    iterator end();
    const_iterator begin() const;
    const_iterator end() const;

    bool operator==(const Object& other) const;
    bool operator!=(const Object& other) const { return !(*this == other); }

private:
    void reindex();

    std::vector<Entry> entries_;
    std::unordered_map<std::string, size_t> index_;
};

// =============================================================================
// Value
// =============================================================================

class Value {
public:
    Value() : data_(nullptr) {}
    Value(std::nullptr_t) : data_(nullptr) {}
    Value(bool b) : data_(b) {}
    Value(int n) : data_(static_cast<double>(n)) {}
    Value(long n) : data_(static_cast<double>(n)) {}
    Value(long long n) : data_(static_cast<double>(n)) {}
    Value(unsigned n) : data_(static_cast<double>(n)) {}
    Value(unsigned long n) : data_(static_cast<double>(n)) {}
    Value(unsigned long long n) : data_(static_cast<double>(n)) {}
    Value(float f) : data_(static_cast<double>(f)) {}
    Value(double d) : data_(d) {}
    Value(const char* s) : data_(std::string(s)) {}
    Value(const std::string& s) : data_(s) {}
    Value(std::string&& s) : data_(std::move(s)) {}
    Value(const DateTime& date) : data_(date) {}
    Value(Binary bytes) : data_(std::move(bytes)) {}
    Value(Array items) : data_(std::move(items)) {}
    Value(Object record) : data_(std::move(record)) {}

    // Type checking
    ValueType type() const { return static_cast<ValueType>(data_.index()); }
    bool is_null() const { return type() == ValueType::Null; }
    bool is_bool() const { return type() == ValueType::Bool; }
    bool is_number() const { return type() == ValueType::Number; }
    bool is_string() const { return type() == ValueType::String; }
    bool is_date() const { return type() == ValueType::Date; }
    bool is_binary() const { return type() == ValueType::Binary; }
    bool is_array() const { return type() == ValueType::Array; }
    bool is_object() const { return type() == ValueType::Object; }

    /// Anything that is not an array or object
    bool is_scalar() const;

    // Value access (throws SOONTypeError if wrong type)
    bool as_bool() const;
    double as_number() const;
    int64_t as_int() const;
    const std::string& as_string() const;
    const DateTime& as_date() const;
    const Binary& as_binary() const;
    const Array& as_array() const;
    Array& as_array();
    const Object& as_object() const;
    Object& as_object();

    /// Object member access; throws if not an object or key is absent
    const Value& operator[](const std::string& key) const;

    /// Array element access; throws if not an array or index is out of range
    const Value& operator[](size_t index) const;

    /// Element count for arrays and objects, 0 otherwise
    size_t size() const;

    bool operator==(const Value& other) const;
    bool operator!=(const Value& other) const { return !(*this == other); }

private:
    // Alternative order must match ValueType
    std::variant<std::nullptr_t, bool, double, std::string, DateTime, Binary, Array, Object> data_;
};

} // namespace soon
