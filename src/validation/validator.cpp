#include "swagcheck/validation/validator.hpp"

#include <algorithm>

namespace swagcheck::validation
{

namespace
{
std::string display_value(const Json& value)
{
    if (value.is_string())
        return "'" + value.get<std::string>() + "'";
    return value.dump();
}

bool matches(const Json& value, PrimitiveType expected)
{
    switch (expected)
    {
    case PrimitiveType::String:
        return value.is_string();
    case PrimitiveType::Boolean:
        return value.is_boolean();
    case PrimitiveType::Integer:
        return value.is_number_integer();
    case PrimitiveType::Number:
        return value.is_number();
    case PrimitiveType::Array:
        return value.is_array();
    case PrimitiveType::Object:
        return value.is_object();
    }
    return true;
}

std::string not_found_message(const std::string& name)
{
    return "'" + name + "' not in schema";
}
} // namespace

std::string observed_type(const Json& value)
{
    if (value.is_null())
        return "null";
    if (value.is_boolean())
        return "boolean";
    if (value.is_number_integer())
        return "integer";
    if (value.is_number())
        return "number";
    if (value.is_string())
        return "string";
    if (value.is_array())
        return "array";
    if (value.is_object())
        return "object";
    return value.type_name();
}

bool enum_contains(const std::vector<Json>& allowed, const Json& value)
{
    return std::find(allowed.begin(), allowed.end(), value) != allowed.end();
}

std::string enum_violation_message(const Json& value, const std::vector<Json>& allowed)
{
    Json shown = Json::array();
    for (size_t i = 0; i < allowed.size() && i < ENUM_DISPLAY_LIMIT; ++i)
        shown.push_back(allowed[i]);
    std::string msg = display_value(value) + " not in " + shown.dump();
    if (allowed.size() > ENUM_DISPLAY_LIMIT)
        msg += "...";
    return msg;
}

Issues check_type(const Json& value, const schema::PropertySpec& spec, const std::string& path)
{
    if (value.is_null())
        return {};
    auto expected = schema::declared_type(spec);
    if (!expected || matches(value, *expected))
        return {};

    // Numeric properties get a dedicated message for booleans.
    if ((*expected == PrimitiveType::Integer || *expected == PrimitiveType::Number) &&
        value.is_boolean())
        return {Issue(IssueCategory::TypeMismatch, path,
                      "expected " + to_string(*expected) + ", got boolean")};

    return {Issue(IssueCategory::TypeMismatch, path,
                  "expected " + to_string(*expected) + ", got " + observed_type(value))};
}

Validator::Validator(const schema::Schema& schema, const schema::SchemaIndex& index)
    : Validator(schema, index, Options{})
{
}

Validator::Validator(const schema::Schema& schema, const schema::SchemaIndex& index,
                     Options options)
    : schema_(schema), index_(index), options_(options)
{
}

Issues Validator::validate(const Json& value, const std::string& definition,
                           const std::string& path) const
{
    Issues issues;
    validate_into(value, definition, path, issues);
    return issues;
}

void Validator::validate_into(const Json& value, const std::string& definition,
                              const std::string& path, Issues& out) const
{
    std::optional<std::string> resolved;
    if (schema_.contains(definition))
        resolved = definition;
    else
        resolved = schema::resolve(definition, schema_, index_);
    if (!resolved)
    {
        out.emplace_back(IssueCategory::SchemaNotFound, path, not_found_message(definition));
        return;
    }

    const schema::Definition* def = schema_.find(*resolved);
    if (!value.is_object())
        return;

    for (auto it = value.begin(); it != value.end(); ++it)
    {
        const std::string& key = it.key();
        std::string field_path = path.empty() ? key : path + "." + key;

        const schema::PropertySpec* spec = def->find_property(key);
        if (!spec)
        {
            out.emplace_back(IssueCategory::UnknownField, field_path,
                             "not in '" + def->short_name() + "' (has " +
                                 std::to_string(def->properties().size()) + " properties)");
            continue;
        }
        check_field(it.value(), *spec, field_path, out);
    }
}

void Validator::check_field(const Json& value, const schema::PropertySpec& spec,
                            const std::string& path, Issues& out) const
{
    auto type_issues = check_type(value, spec, path);
    out.insert(out.end(), type_issues.begin(), type_issues.end());

    if (const auto* allowed = schema::inline_enum(spec))
    {
        if (!value.is_null() && !enum_contains(*allowed, value))
            out.emplace_back(IssueCategory::InvalidEnum, path,
                             enum_violation_message(value, *allowed));
    }

    const auto* ref = schema::reference(spec);
    const auto* items = schema::array_items(spec);
    if (ref && value.is_object())
        check_reference(value, *ref, path, out);
    else if (items && value.is_array())
        check_array(value, *items, path, out);
    else if (ref && options_.strict_references && !value.is_null() && !schema::declared_type(spec))
        check_scalar_reference(value, *ref, path, out);
}

void Validator::check_reference(const Json& value, const std::string& ref,
                                const std::string& path, Issues& out) const
{
    auto target = schema::resolve(ref, schema_, index_);
    if (!target)
    {
        out.emplace_back(IssueCategory::SchemaNotFound, path,
                         not_found_message(schema::strip_reference_prefix(ref)));
        return;
    }

    const schema::Definition* def = schema_.find(*target);
    if (def->is_enum())
    {
        // Wrapper enum: the coded scalar sits under "Value".
        auto inner = value.find(std::string(WRAPPED_VALUE_KEY));
        if (inner != value.end() && !inner->is_null() && !enum_contains(def->enum_values(), *inner))
            out.emplace_back(IssueCategory::InvalidEnum, path + "." + WRAPPED_VALUE_KEY,
                             enum_violation_message(*inner, def->enum_values()));
        return;
    }
    validate_into(value, *target, path, out);
}

void Validator::check_scalar_reference(const Json& value, const std::string& ref,
                                       const std::string& path, Issues& out) const
{
    // Enum definitions may be bound to their bare coded scalar.
    auto target = schema::resolve(ref, schema_, index_);
    if (target && !schema_.find(*target)->is_enum())
        out.emplace_back(IssueCategory::TypeMismatch, path,
                         "expected object, got " + observed_type(value));
}

void Validator::check_array(const Json& value, const schema::ArrayItems& items,
                            const std::string& path, Issues& out) const
{
    if (!items.ref)
        return;

    auto target = schema::resolve(*items.ref, schema_, index_);
    if (!target)
    {
        // Empty or all-null arrays have nothing to check.
        bool has_elements = std::any_of(value.begin(), value.end(),
                                        [](const Json& item) { return !item.is_null(); });
        if (has_elements)
            out.emplace_back(IssueCategory::SchemaNotFound, path,
                             not_found_message(schema::strip_reference_prefix(*items.ref)));
        return;
    }

    const schema::Definition* def = schema_.find(*target);
    for (size_t i = 0; i < value.size(); ++i)
    {
        const Json& item = value[i];
        std::string item_path = path + "[" + std::to_string(i) + "]";
        if (def->is_enum())
        {
            const Json* inner = &item;
            if (item.is_object())
            {
                auto it = item.find(std::string(WRAPPED_VALUE_KEY));
                inner = it == item.end() ? nullptr : &*it;
            }
            if (inner && !inner->is_null() && !enum_contains(def->enum_values(), *inner))
                out.emplace_back(IssueCategory::InvalidEnum, item_path,
                                 enum_violation_message(*inner, def->enum_values()));
        }
        else if (item.is_object())
            validate_into(item, *target, item_path, out);
    }
}

} // namespace swagcheck::validation
