#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace swagcheck
{

/// Insertion-ordered so document fields are visited in the order they were written.
using Json = nlohmann::ordered_json;

/// Primitive types a Swagger property can declare through its `type` key.
enum class PrimitiveType
{
    String,
    Boolean,
    Integer,
    Number,
    Array,
    Object
};

inline std::string to_string(PrimitiveType type)
{
    switch (type)
    {
    case PrimitiveType::String:
        return "string";
    case PrimitiveType::Boolean:
        return "boolean";
    case PrimitiveType::Integer:
        return "integer";
    case PrimitiveType::Number:
        return "number";
    case PrimitiveType::Array:
        return "array";
    case PrimitiveType::Object:
        return "object";
    }
    return "object";
}

/// Unknown type names (e.g. "file") yield nullopt and are not checked.
inline std::optional<PrimitiveType> primitive_type_from_string(const std::string& s)
{
    if (s == "string")
        return PrimitiveType::String;
    if (s == "boolean")
        return PrimitiveType::Boolean;
    if (s == "integer")
        return PrimitiveType::Integer;
    if (s == "number")
        return PrimitiveType::Number;
    if (s == "array")
        return PrimitiveType::Array;
    if (s == "object")
        return PrimitiveType::Object;
    return std::nullopt;
}

} // namespace swagcheck
