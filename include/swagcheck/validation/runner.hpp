#pragma once
#include "swagcheck/schema/index.hpp"
#include "swagcheck/schema/schema.hpp"
#include "swagcheck/validation/issue.hpp"
#include "swagcheck/validation/validator.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace swagcheck::validation
{

/// Document identifier (file name) -> issues, sorted by identifier.
using ValidationResult = std::map<std::string, Issues>;

/// True when every document produced zero issues.
bool all_valid(const ValidationResult& result);

/// Applies the Validator to the entry points of firstbase-style documents:
/// the primary entity under `root_key`, every child link under
/// `child_link_key`, and the primary entity embedded in each child link.
class Runner
{
  public:
    struct Options
    {
        std::string root_definition = "TradeItem";
        std::string root_key = "TradeItem";
        std::string root_path = "TradeItem";
        std::string child_link_key = "CatalogueItemChildItemLink";
        std::vector<std::string> embedded_path = {"CatalogueItem", "TradeItem"};
        std::string preferred_namespace = schema::DEFAULT_PREFERRED_NAMESPACE;
        Validator::Options validator;
    };

    /// Throws NotFoundError if the schema has no root definition.
    explicit Runner(const schema::Schema& schema);
    Runner(const schema::Schema& schema, Options options);

    Runner(const Runner&) = delete;
    Runner& operator=(const Runner&) = delete;

    Issues validate_document(const Json& document) const;

    /// A parse failure yields exactly one PARSE_ERROR issue.
    Issues validate_text(const std::string& text) const;

    /// An unreadable file yields exactly one PARSE_ERROR issue.
    Issues validate_file(const std::filesystem::path& path) const;

    /// Validates every file, keyed by file name. With jobs > 1 the files are
    /// spread over worker threads; the result does not depend on jobs.
    ValidationResult validate_files(const std::vector<std::filesystem::path>& files,
                                    unsigned jobs = 1) const;

    /// Expands directories into their sorted `*.json` files and keeps
    /// explicit `.json` files.
    static std::vector<std::filesystem::path> collect_documents(const std::vector<std::string>& inputs);

    const std::string& root_definition() const
    {
        return root_definition_;
    }
    const std::optional<std::string>& child_definition() const
    {
        return child_definition_;
    }
    const Validator& validator() const
    {
        return validator_;
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
    const schema::Schema& schema_;
    Options options_;
    schema::SchemaIndex index_;
    Validator validator_;
    std::string root_definition_;
    std::optional<std::string> child_definition_;
};

} // namespace swagcheck::validation
