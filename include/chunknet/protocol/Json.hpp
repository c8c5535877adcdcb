#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace chunknet::json {

enum class ValueType {
    Null,
    Boolean,
    Integer,
    Double,
    String,
    Object,
    Array
};

struct Value {
    ValueType type{ValueType::Null};
    bool boolean_value{false};
    std::int64_t integer_value{0};
    double double_value{0.0};
    std::string string_value;
    std::map<std::string, Value> object_value;
    std::vector<Value> array_value;

    Value() = default;
    explicit Value(bool value) : type(ValueType::Boolean), boolean_value(value) {}
    explicit Value(std::int64_t value) : type(ValueType::Integer), integer_value(value) {}
    explicit Value(double value) : type(ValueType::Double), double_value(value) {}
    explicit Value(std::string value) : type(ValueType::String), string_value(std::move(value)) {}
    Value(const char* value) : Value(std::string(value)) {}

    static Value make_object() {
        Value value;
        value.type = ValueType::Object;
        return value;
    }

    static Value make_array() {
        Value value;
        value.type = ValueType::Array;
        return value;
    }

    bool is_null() const { return type == ValueType::Null; }
    bool is_boolean() const { return type == ValueType::Boolean; }
    bool is_integer() const { return type == ValueType::Integer; }
    bool is_number() const { return type == ValueType::Integer || type == ValueType::Double; }
    bool is_string() const { return type == ValueType::String; }
    bool is_object() const { return type == ValueType::Object; }
    bool is_array() const { return type == ValueType::Array; }

    const std::map<std::string, Value>& as_object() const {
        static const std::map<std::string, Value> empty{};
        return type == ValueType::Object ? object_value : empty;
    }

    std::map<std::string, Value>& as_object() {
        if (type != ValueType::Object) {
            *this = make_object();
        }
        return object_value;
    }

    const std::vector<Value>& as_array() const {
        static const std::vector<Value> empty{};
        return type == ValueType::Array ? array_value : empty;
    }

    std::vector<Value>& as_array() {
        if (type != ValueType::Array) {
            *this = make_array();
        }
        return array_value;
    }

    // Member lookup on objects; nullptr for non-objects and absent keys.
    const Value* find(const std::string& key) const;

    // Integer view of numeric values (doubles are truncated).
    std::optional<std::int64_t> as_int64() const;
};

class ParseError : public std::runtime_error {
public:
    ParseError(const std::string& message, std::size_t offset)
        : std::runtime_error(message + " at offset " + std::to_string(offset)), offset_(offset) {}

    std::size_t offset() const noexcept { return offset_; }

private:
    std::size_t offset_;
};

// Parses exactly one JSON document; trailing content is an error.
Value parse(std::string_view text);
std::optional<Value> try_parse(std::string_view text);

// indent < 0 produces compact output.
std::string dump(const Value& value, int indent = -1);

}  // namespace chunknet::json
