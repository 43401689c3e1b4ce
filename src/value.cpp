/**
 * @file value.cpp
 * @brief Value and Object implementation
 */

#include "soon/value.h"
#include "soon/errors.h"

namespace soon {

const char* value_type_name(ValueType type) {
    switch (type) {
        case ValueType::Null:   return "null";
        case ValueType::Bool:   return "bool";
        case ValueType::Number: return "number";
        case ValueType::String: return "string";
        case ValueType::Date:   return "date";
        case ValueType::Binary: return "binary";
        case ValueType::Array:  return "array";
        case ValueType::Object: return "object";
    }
    return "unknown";
}

// =============================================================================
// Object
// =============================================================================

Object::Object() = default;

Object::Object(std::initializer_list<Entry> entries) {
    for (const auto& entry : entries) {
        set(entry.first, entry.second);
    }
}

Object::Object(const Object& other) = default;

Object::Object(Object&& other) noexcept
    : entries_(std::move(other.entries_))
    , index_(std::move(other.index_)) {
}

Object& Object::operator=(const Object& other) = default;

Object& Object::operator=(Object&& other) noexcept {
    entries_ = std::move(other.entries_);
    index_ = std::move(other.index_);
    return *this;
}

Object::~Object() = default;

size_t Object::size() const { return entries_.size(); }
bool Object::empty() const { return entries_.empty(); }

bool Object::contains(const std::string& key) const {
    return index_.find(key) != index_.end();
}

const Value* Object::get(const std::string& key) const {
    auto it = index_.find(key);
    return it == index_.end() ? nullptr : &entries_[it->second].second;
}

Value* Object::get(const std::string& key) {
    auto it = index_.find(key);
    return it == index_.end() ? nullptr : &entries_[it->second].second;
}

const Value& Object::at(const std::string& key) const {
    const Value* value = get(key);
    if (!value) {
        throw SOONTypeError(ErrorCode::KeyNotFound, "Key not found: " + key);
    }
    return *value;
}

Value& Object::at(const std::string& key) {
    Value* value = get(key);
    if (!value) {
        throw SOONTypeError(ErrorCode::KeyNotFound, "Key not found: " + key);
    }
    return *value;
}

Value& Object::operator[](const std::string& key) {
    auto it = index_.find(key);
    if (it != index_.end()) {
        return entries_[it->second].second;
    }
    index_.emplace(key, entries_.size());
    entries_.emplace_back(key, Value());
    return entries_.back().second;
}

void Object::set(const std::string& key, Value value) {
    auto it = index_.find(key);
    if (it != index_.end()) {
        entries_[it->second].second = std::move(value);
        return;
    }
    index_.emplace(key, entries_.size());
    entries_.emplace_back(key, std::move(value));
}

bool Object::erase(const std::string& key) {
    auto it = index_.find(key);
    if (it == index_.end()) {
        return false;
    }
    entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(it->second));
    reindex();
    return true;
}

void Object::clear() {
    entries_.clear();
    index_.clear();
}

std::vector<std::string> Object::keys() const {
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& entry : entries_) {
        result.push_back(entry.first);
    }
    return result;
}

Object::iterator Object::begin() { return entries_.begin(); }
Object::iterator Object::end() { return entries_.end(); }
Object::const_iterator Object::begin() const { return entries_.begin(); }
Object::const_iterator Object::end() const { return entries_.end(); }

bool Object::operator==(const Object& other) const {
    if (entries_.size() != other.entries_.size()) {
        return false;
    }
    for (const auto& entry : entries_) {
        const Value* theirs = other.get(entry.first);
        if (!theirs || *theirs != entry.second) {
            return false;
        }
    }
    return true;
}

void Object::reindex() {
    index_.clear();
    for (size_t i = 0; i < entries_.size(); ++i) {
        index_[entries_[i].first] = i;
    }
}

// =============================================================================
// Value
// =============================================================================

namespace {

[[noreturn]] void throw_type_error(const char* expected, ValueType actual) {
    throw SOONTypeError(ErrorCode::TypeMismatch,
                        std::string("Value is not a ") + expected +
                        " (got " + value_type_name(actual) + ")");
}

} // anonymous namespace

bool Value::is_scalar() const {
    return !is_array() && !is_object();
}

bool Value::as_bool() const {
    if (!is_bool()) throw_type_error("bool", type());
    return std::get<bool>(data_);
}

double Value::as_number() const {
    if (!is_number()) throw_type_error("number", type());
    return std::get<double>(data_);
}

int64_t Value::as_int() const {
    return static_cast<int64_t>(as_number());
}

const std::string& Value::as_string() const {
    if (!is_string()) throw_type_error("string", type());
    return std::get<std::string>(data_);
}

const DateTime& Value::as_date() const {
    if (!is_date()) throw_type_error("date", type());
    return std::get<DateTime>(data_);
}

const Binary& Value::as_binary() const {
    if (!is_binary()) throw_type_error("binary", type());
    return std::get<Binary>(data_);
}

const Array& Value::as_array() const {
    if (!is_array()) throw_type_error("array", type());
    return std::get<Array>(data_);
}

Array& Value::as_array() {
    if (!is_array()) throw_type_error("array", type());
    return std::get<Array>(data_);
}

const Object& Value::as_object() const {
    if (!is_object()) throw_type_error("object", type());
    return std::get<Object>(data_);
}

Object& Value::as_object() {
    if (!is_object()) throw_type_error("object", type());
    return std::get<Object>(data_);
}

const Value& Value::operator[](const std::string& key) const {
    return as_object().at(key);
}

const Value& Value::operator[](size_t index) const {
    const Array& items = as_array();
    if (index >= items.size()) {
        throw SOONTypeError(ErrorCode::KeyNotFound,
                            "Array index out of range: " + std::to_string(index));
    }
    return items[index];
}

size_t Value::size() const {
    if (is_array()) return std::get<Array>(data_).size();
    if (is_object()) return std::get<Object>(data_).size();
    return 0;
}

bool Value::operator==(const Value& other) const {
    if (type() != other.type()) {
        return false;
    }
    switch (type()) {
        case ValueType::Null:   return true;
        case ValueType::Bool:   return std::get<bool>(data_) == std::get<bool>(other.data_);
        case ValueType::Number: return std::get<double>(data_) == std::get<double>(other.data_);
        case ValueType::String: return std::get<std::string>(data_) == std::get<std::string>(other.data_);
        case ValueType::Date:   return std::get<DateTime>(data_) == std::get<DateTime>(other.data_);
        case ValueType::Binary: return std::get<Binary>(data_) == std::get<Binary>(other.data_);
        case ValueType::Array:  return std::get<Array>(data_) == std::get<Array>(other.data_);
        case ValueType::Object: return std::get<Object>(data_) == std::get<Object>(other.data_);
    }
    return false;
}

} // namespace soon
