#pragma once
#include "swagcheck/schema/index.hpp"
#include "swagcheck/schema/schema.hpp"
#include "swagcheck/validation/issue.hpp"

#include <string>

namespace swagcheck::validation
{

/// Number of allowed values shown in an INVALID_ENUM message.
constexpr size_t ENUM_DISPLAY_LIMIT = 6;

/// Conventional key holding the coded scalar of a wrapper enum object.
constexpr const char* WRAPPED_VALUE_KEY = "Value";

/// Recursive structural checker for documents against a Schema.
///
/// The validator only reads the schema and index, so one instance may be
/// shared by concurrent callers. Recursion follows the document tree, which
/// keeps cyclic schemas from causing non-termination.
class Validator
{
  public:
    struct Options
    {
        /// Report a non-null, non-object value bound to an object definition
        /// as TYPE_MISMATCH instead of skipping it.
        bool strict_references = false;
    };

    Validator(const schema::Schema& schema, const schema::SchemaIndex& index);
    Validator(const schema::Schema& schema, const schema::SchemaIndex& index, Options options);

    /// Checks `value` against `definition` (full name, short name or `$ref`).
    /// Never throws for document content; every anomaly becomes an Issue.
    Issues validate(const Json& value, const std::string& definition,
                    const std::string& path = "") const;

    const schema::Schema& schema() const
    {
        return schema_;
    }
    const schema::SchemaIndex& index() const
    {
        return index_;
    }
    const Options& options() const
    {
        return options_;
    }

  private:
    void validate_into(const Json& value, const std::string& definition, const std::string& path,
                       Issues& out) const;
    void check_field(const Json& value, const schema::PropertySpec& spec,
                     const std::string& path, Issues& out) const;
    void check_reference(const Json& value, const std::string& ref, const std::string& path,
                         Issues& out) const;
    void check_scalar_reference(const Json& value, const std::string& ref,
                                const std::string& path, Issues& out) const;
    void check_array(const Json& value, const schema::ArrayItems& items, const std::string& path,
                     Issues& out) const;

    const schema::Schema& schema_;
    const schema::SchemaIndex& index_;
    Options options_;
};

/// 0 or 1 TYPE_MISMATCH issue for `value` against the property's declared type.
Issues check_type(const Json& value, const schema::PropertySpec& spec, const std::string& path);

/// Name of the JSON shape of `value`: null, boolean, integer, number, string,
/// array or object.
std::string observed_type(const Json& value);

/// "'<value>' not in [..first six..]" with a trailing "..." when truncated.
std::string enum_violation_message(const Json& value, const std::vector<Json>& allowed);

/// Membership test using JSON equality.
bool enum_contains(const std::vector<Json>& allowed, const Json& value);

} // namespace swagcheck::validation
