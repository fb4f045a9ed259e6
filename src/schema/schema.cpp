#include "swagcheck/schema/schema.hpp"

#include <utility>

namespace swagcheck::schema
{

namespace
{
std::optional<PrimitiveType> type_of(const Json& raw)
{
    if (!raw.contains("type") || !raw["type"].is_string())
        return std::nullopt;
    return primitive_type_from_string(raw["type"].get<std::string>());
}

std::optional<std::string> ref_of(const Json& raw)
{
    if (raw.contains("$ref") && raw["$ref"].is_string())
        return raw["$ref"].get<std::string>();
    return std::nullopt;
}

std::vector<Json> enum_of(const Json& raw)
{
    std::vector<Json> values;
    if (raw.contains("enum") && raw["enum"].is_array())
        for (const auto& v : raw["enum"])
            values.push_back(v);
    return values;
}

ArrayItems items_of(const Json& raw)
{
    ArrayItems items;
    if (raw.contains("items") && raw["items"].is_object())
    {
        items.ref = ref_of(raw["items"]);
        items.type = type_of(raw["items"]);
    }
    return items;
}
} // namespace

PropertySpec parse_property(const Json& raw)
{
    if (!raw.is_object())
        return UntypedProperty{};

    auto type = type_of(raw);
    auto values = enum_of(raw);
    std::optional<ArrayItems> items;
    if (type == PrimitiveType::Array)
        items = items_of(raw);

    if (auto ref = ref_of(raw))
        return ReferenceProperty{*ref, type, std::move(values), std::move(items)};
    if (!values.empty())
        return EnumProperty{type, std::move(values), std::move(items)};
    if (items)
        return ArrayProperty{std::move(*items)};
    if (type)
        return PrimitiveProperty{*type};
    return UntypedProperty{};
}

std::optional<PrimitiveType> declared_type(const PropertySpec& spec)
{
    struct Visitor
    {
        std::optional<PrimitiveType> operator()(const UntypedProperty&) const
        {
            return std::nullopt;
        }
        std::optional<PrimitiveType> operator()(const PrimitiveProperty& p) const
        {
            return p.type;
        }
        std::optional<PrimitiveType> operator()(const ReferenceProperty& p) const
        {
            return p.type;
        }
        std::optional<PrimitiveType> operator()(const EnumProperty& p) const
        {
            return p.type;
        }
        std::optional<PrimitiveType> operator()(const ArrayProperty&) const
        {
            return PrimitiveType::Array;
        }
    };
    return std::visit(Visitor{}, spec);
}

const std::vector<Json>* inline_enum(const PropertySpec& spec)
{
    if (const auto* e = std::get_if<EnumProperty>(&spec))
        return &e->values;
    if (const auto* r = std::get_if<ReferenceProperty>(&spec))
        return r->values.empty() ? nullptr : &r->values;
    return nullptr;
}

const std::string* reference(const PropertySpec& spec)
{
    if (const auto* r = std::get_if<ReferenceProperty>(&spec))
        return &r->ref;
    return nullptr;
}

const ArrayItems* array_items(const PropertySpec& spec)
{
    struct Visitor
    {
        const ArrayItems* operator()(const UntypedProperty&) const
        {
            return nullptr;
        }
        const ArrayItems* operator()(const PrimitiveProperty&) const
        {
            return nullptr;
        }
        const ArrayItems* operator()(const ReferenceProperty& p) const
        {
            return p.items ? &*p.items : nullptr;
        }
        const ArrayItems* operator()(const EnumProperty& p) const
        {
            return p.items ? &*p.items : nullptr;
        }
        const ArrayItems* operator()(const ArrayProperty& p) const
        {
            return &p.items;
        }
    };
    return std::visit(Visitor{}, spec);
}

std::string short_name(const std::string& full_name)
{
    auto pos = full_name.rfind('.');
    if (pos == std::string::npos)
        return full_name;
    return full_name.substr(pos + 1);
}

std::string strip_reference_prefix(const std::string& ref)
{
    static const std::string prefix = DEFINITIONS_PREFIX;
    if (ref.compare(0, prefix.size(), prefix) == 0)
        return ref.substr(prefix.size());
    return ref;
}

Definition::Definition(std::string name, std::map<std::string, PropertySpec> properties,
                       std::vector<Json> enum_values, Json raw)
    : name_(std::move(name)), properties_(std::move(properties)),
      enum_values_(std::move(enum_values)), raw_(std::move(raw))
{
}

Definition Definition::from_json(const std::string& name, const Json& raw)
{
    std::map<std::string, PropertySpec> properties;
    if (raw.is_object() && raw.contains("properties") && raw["properties"].is_object())
    {
        for (const auto& [prop_name, prop] : raw["properties"].items())
            properties.emplace(prop_name, parse_property(prop));
    }
    std::vector<Json> values = raw.is_object() ? enum_of(raw) : std::vector<Json>{};
    return Definition(name, std::move(properties), std::move(values), raw);
}

const PropertySpec* Definition::find_property(const std::string& name) const
{
    auto it = properties_.find(name);
    if (it == properties_.end())
        return nullptr;
    return &it->second;
}

Schema::Schema(std::map<std::string, Definition> definitions, std::optional<std::string> title)
    : definitions_(std::move(definitions)), title_(std::move(title))
{
}

Schema Schema::from_json(const Json& swagger)
{
    if (!swagger.is_object())
        throw SchemaError("Swagger document must be a JSON object");
    if (!swagger.contains("definitions") || !swagger["definitions"].is_object())
        throw SchemaError("Swagger document is missing 'definitions' object");

    std::map<std::string, Definition> definitions;
    for (const auto& [name, raw] : swagger["definitions"].items())
        definitions.emplace(name, Definition::from_json(name, raw));

    std::optional<std::string> title;
    if (swagger.contains("info") && swagger["info"].is_object() &&
        swagger["info"].contains("title") && swagger["info"]["title"].is_string())
        title = swagger["info"]["title"].get<std::string>();

    return Schema(std::move(definitions), std::move(title));
}

const Definition* Schema::find(const std::string& full_name) const
{
    auto it = definitions_.find(full_name);
    if (it == definitions_.end())
        return nullptr;
    return &it->second;
}

} // namespace swagcheck::schema
