#pragma once
#include "swagcheck/schema/schema.hpp"

#include <optional>
#include <string>
#include <unordered_map>

namespace swagcheck::schema
{

constexpr const char* DEFAULT_PREFERRED_NAMESPACE = "Standard";

/// Short name -> fully-qualified name lookup.
///
/// When several definitions share a short name, the first one whose full name
/// contains the preferred namespace marker wins. Without a marked candidate the
/// first one in schema iteration order is kept.
class SchemaIndex
{
  public:
    SchemaIndex() = default;

    static SchemaIndex build(const Schema& schema,
                             const std::string& preferred_namespace = DEFAULT_PREFERRED_NAMESPACE);

    std::optional<std::string> find(const std::string& short_name) const;
    size_t size() const
    {
        return entries_.size();
    }
    bool empty() const
    {
        return entries_.empty();
    }
    const std::string& preferred_namespace() const
    {
        return preferred_namespace_;
    }

  private:
    std::unordered_map<std::string, std::string> entries_;
    std::string preferred_namespace_{DEFAULT_PREFERRED_NAMESPACE};
};

/// Turns a `$ref` pointer or bare name into a fully-qualified definition name.
/// Returns nullopt when neither the full name nor its short name is known.
std::optional<std::string> resolve(const std::string& ref_or_name, const Schema& schema,
                                   const SchemaIndex& index);

/// First definition named `*.<short_name>` that contains the preferred marker,
/// falling back to resolve().
std::optional<std::string> find_preferred(const std::string& short_name, const Schema& schema,
                                          const SchemaIndex& index);

} // namespace swagcheck::schema
