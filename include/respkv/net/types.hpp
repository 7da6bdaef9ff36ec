#ifndef RESPKV_NET_TYPES_HPP
#define RESPKV_NET_TYPES_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace respkv::net {

// RESP2 value kinds
enum class ValueType : uint8_t {
    SimpleString = 0,
    Error = 1,
    Integer = 2,
    BulkString = 3,
    Array = 4,
};

/*
    one RESP frame. only the fields that belong to `type` are meaningful:
    - SimpleString / Error / BulkString -> str
    - Integer -> integer
    - Array -> elements
    null is only valid for BulkString and Array ($-1 / *-1)
*/
struct Value {
    ValueType type = ValueType::BulkString;
    std::string str;
    int64_t integer = 0;
    std::vector<Value> elements;
    bool null = false;

    static Value simple(std::string s) {
        Value v;
        v.type = ValueType::SimpleString;
        v.str = std::move(s);
        return v;
    }

    static Value error(std::string msg) {
        Value v;
        v.type = ValueType::Error;
        v.str = std::move(msg);
        return v;
    }

    static Value integer_value(int64_t n) {
        Value v;
        v.type = ValueType::Integer;
        v.integer = n;
        return v;
    }

    static Value bulk(std::string s) {
        Value v;
        v.type = ValueType::BulkString;
        v.str = std::move(s);
        return v;
    }

    static Value null_bulk() {
        Value v;
        v.type = ValueType::BulkString;
        v.null = true;
        return v;
    }

    static Value array(std::vector<Value> items) {
        Value v;
        v.type = ValueType::Array;
        v.elements = std::move(items);
        return v;
    }

    static Value null_array() {
        Value v;
        v.type = ValueType::Array;
        v.null = true;
        return v;
    }

    static Value ok() {
        return simple("OK");
    }

    [[nodiscard]] bool is_error() const noexcept {
        return type == ValueType::Error;
    }

    [[nodiscard]] bool is_null() const noexcept {
        return null;
    }

    bool operator==(const Value& other) const {
        if (type != other.type || null != other.null) {
            return false;
        }
        if (null) {
            return true;
        }
        switch (type) {
            case ValueType::SimpleString:
            case ValueType::Error:
            case ValueType::BulkString:
                return str == other.str;
            case ValueType::Integer:
                return integer == other.integer;
            case ValueType::Array:
                return elements == other.elements;
        }
        return false;
    }

    bool operator!=(const Value& other) const {
        return !(*this == other);
    }
};

}  // namespace respkv::net

#endif
