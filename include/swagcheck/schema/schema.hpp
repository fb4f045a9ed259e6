#pragma once
#include "swagcheck/exceptions.hpp"
#include "swagcheck/types.hpp"

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace swagcheck::schema
{

constexpr const char* DEFINITIONS_PREFIX = "#/definitions/";

/// Property with no usable `type`, `$ref` or `enum`; never checked.
struct UntypedProperty
{
};

struct PrimitiveProperty
{
    PrimitiveType type;
};

/// `items` of an array property: a reference, an inline primitive, or nothing.
struct ArrayItems
{
    std::optional<std::string> ref;
    std::optional<PrimitiveType> type;
};

/// `$ref` to another definition. Sibling `type`, `enum` and (for arrays)
/// `items` keys are kept and checked as well.
struct ReferenceProperty
{
    std::string ref;
    std::optional<PrimitiveType> type;
    std::vector<Json> values; ///< empty when no inline enum
    std::optional<ArrayItems> items;
};

/// Non-empty inline `enum`, optionally typed. `items` is set when the
/// declared type is array.
struct EnumProperty
{
    std::optional<PrimitiveType> type;
    std::vector<Json> values;
    std::optional<ArrayItems> items;
};

struct ArrayProperty
{
    ArrayItems items;
};

using PropertySpec =
    std::variant<UntypedProperty, PrimitiveProperty, ReferenceProperty, EnumProperty, ArrayProperty>;

/// Builds a PropertySpec from its raw Swagger JSON.
PropertySpec parse_property(const Json& raw);

/// Primitive type a value must match, if the property declares one.
std::optional<PrimitiveType> declared_type(const PropertySpec& spec);

/// Non-empty inline enumeration of the property, or nullptr.
const std::vector<Json>* inline_enum(const PropertySpec& spec);

/// Target of a `$ref` property, or nullptr.
const std::string* reference(const PropertySpec& spec);

/// Items of a property declared as an array, or nullptr.
const ArrayItems* array_items(const PropertySpec& spec);

/// Substring after the last '.' of a fully-qualified definition name.
std::string short_name(const std::string& full_name);

/// Removes a leading "#/definitions/" from a reference.
std::string strip_reference_prefix(const std::string& ref);

class Definition
{
  public:
    Definition() = default;
    Definition(std::string name, std::map<std::string, PropertySpec> properties,
               std::vector<Json> enum_values = {}, Json raw = Json::object());

    static Definition from_json(const std::string& name, const Json& raw);

    const std::string& name() const
    {
        return name_;
    }
    std::string short_name() const
    {
        return schema::short_name(name_);
    }
    const std::map<std::string, PropertySpec>& properties() const
    {
        return properties_;
    }
    const PropertySpec* find_property(const std::string& name) const;

    /// True only when the definition carries a non-empty enumeration.
    bool is_enum() const
    {
        return !enum_values_.empty();
    }
    const std::vector<Json>& enum_values() const
    {
        return enum_values_;
    }
    const Json& raw() const
    {
        return raw_;
    }

  private:
    std::string name_;
    std::map<std::string, PropertySpec> properties_;
    std::vector<Json> enum_values_;
    Json raw_;
};

/// Immutable set of definitions keyed by fully-qualified name.
class Schema
{
  public:
    Schema() = default;
    explicit Schema(std::map<std::string, Definition> definitions,
                    std::optional<std::string> title = std::nullopt);

    /// Reads the `definitions` block of a parsed Swagger document.
    /// Throws SchemaError when the document has no definitions object.
    static Schema from_json(const Json& swagger);

    const Definition* find(const std::string& full_name) const;
    bool contains(const std::string& full_name) const
    {
        return definitions_.count(full_name) > 0;
    }
    const std::map<std::string, Definition>& definitions() const
    {
        return definitions_;
    }
    size_t size() const
    {
        return definitions_.size();
    }
    bool empty() const
    {
        return definitions_.empty();
    }
    const std::optional<std::string>& title() const
    {
        return title_;
    }

  private:
    std::map<std::string, Definition> definitions_;
    std::optional<std::string> title_;
};

} // namespace swagcheck::schema
