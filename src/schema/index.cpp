#include "swagcheck/schema/index.hpp"

namespace swagcheck::schema
{

SchemaIndex SchemaIndex::build(const Schema& schema, const std::string& preferred_namespace)
{
    SchemaIndex index;
    index.preferred_namespace_ = preferred_namespace;
    auto is_preferred = [&preferred_namespace](const std::string& name)
    { return !preferred_namespace.empty() && name.find(preferred_namespace) != std::string::npos; };

    for (const auto& entry : schema.definitions())
    {
        const auto& name = entry.first;
        auto short_key = short_name(name);
        auto it = index.entries_.find(short_key);
        if (it == index.entries_.end())
        {
            index.entries_.emplace(short_key, name);
            continue;
        }
        if (!is_preferred(it->second) && is_preferred(name))
            it->second = name;
    }
    return index;
}

std::optional<std::string> SchemaIndex::find(const std::string& short_name) const
{
    auto it = entries_.find(short_name);
    if (it == entries_.end())
        return std::nullopt;
    return it->second;
}

std::optional<std::string> resolve(const std::string& ref_or_name, const Schema& schema,
                                   const SchemaIndex& index)
{
    auto name = strip_reference_prefix(ref_or_name);
    if (schema.contains(name))
        return name;
    return index.find(short_name(name));
}

std::optional<std::string> find_preferred(const std::string& short_name, const Schema& schema,
                                          const SchemaIndex& index)
{
    const std::string suffix = "." + short_name;
    const auto& marker = index.preferred_namespace();
    for (const auto& entry : schema.definitions())
    {
        const auto& name = entry.first;
        if (name.size() < suffix.size() ||
            name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0)
            continue;
        if (!marker.empty() && name.find(marker) != std::string::npos)
            return name;
    }
    return resolve(short_name, schema, index);
}

} // namespace swagcheck::schema
