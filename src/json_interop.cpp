/**
 * @file json_interop.cpp
 * @brief SOON <-> JSON conversion
 */

#include "soon/json_interop.h"
#include "soon/base64.h"
#include "soon/errors.h"
#include "soon/soon.h"

#include <cmath>

using ordered_json = nlohmann::ordered_json;

namespace soon {

namespace {

// Largest integer magnitude a double holds exactly
constexpr double kMaxSafeInteger = 9007199254740992.0;

} // anonymous namespace

Value from_json_value(const ordered_json& json) {
    switch (json.type()) {
        case ordered_json::value_t::null:
        case ordered_json::value_t::discarded:
            return Value();
        case ordered_json::value_t::boolean:
            return Value(json.get<bool>());
        case ordered_json::value_t::number_integer:
            return Value(static_cast<double>(json.get<int64_t>()));
        case ordered_json::value_t::number_unsigned:
            return Value(static_cast<double>(json.get<uint64_t>()));
        case ordered_json::value_t::number_float:
            return Value(json.get<double>());
        case ordered_json::value_t::string:
            return Value(json.get<std::string>());
        case ordered_json::value_t::binary: {
            const auto& bytes = json.get_binary();
            return Value(Binary(bytes.begin(), bytes.end()));
        }
        case ordered_json::value_t::array: {
            Array items;
            items.reserve(json.size());
            for (const auto& item : json) {
                items.push_back(from_json_value(item));
            }
            return Value(std::move(items));
        }
        case ordered_json::value_t::object: {
            Object record;
            for (const auto& item : json.items()) {
                record.set(item.key(), from_json_value(item.value()));
            }
            return Value(std::move(record));
        }
    }
    return Value();
}

ordered_json to_json_value(const Value& value) {
    switch (value.type()) {
        case ValueType::Null:
            return nullptr;
        case ValueType::Bool:
            return value.as_bool();
        case ValueType::Number: {
            double number = value.as_number();
            if (!std::isfinite(number)) {
                return nullptr;
            }
            if (std::trunc(number) == number && std::fabs(number) <= kMaxSafeInteger) {
                return static_cast<int64_t>(number);
            }
            return number;
        }
        case ValueType::String:
            return value.as_string();
        case ValueType::Date: {
            const DateTime& date = value.as_date();
            if (!date.is_valid()) {
                return nullptr;
            }
            return date.to_iso_string();
        }
        case ValueType::Binary:
            return base64_encode(value.as_binary());
        case ValueType::Array: {
            ordered_json items = ordered_json::array();
            for (const auto& item : value.as_array()) {
                items.push_back(to_json_value(item));
            }
            return items;
        }
        case ValueType::Object: {
            ordered_json record = ordered_json::object();
            for (const auto& entry : value.as_object()) {
                record[entry.first] = to_json_value(entry.second);
            }
            return record;
        }
    }
    return nullptr;
}

std::string from_json(const std::string& json_text, const SerializerOptions& options) {
    ordered_json parsed;
    try {
        parsed = ordered_json::parse(json_text);
    } catch (const ordered_json::parse_error& e) {
        throw JsonError(ErrorCode::InvalidJson, std::string("Invalid JSON: ") + e.what());
    }
    return encode(from_json_value(parsed), options);
}

std::string to_json(const std::string& soon_text, const ParserOptions& options, int indent) {
    return to_json_value(decode(soon_text, options)).dump(indent < 0 ? -1 : indent, ' ', false,
                                                        ordered_json::error_handler_t::replace);
}

} // namespace soon
