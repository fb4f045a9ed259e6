#pragma once
#include "swagcheck/schema/index.hpp"
#include "swagcheck/schema/schema.hpp"
#include "swagcheck/validation/runner.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace swagcheck::report
{

constexpr size_t DEFAULT_PATTERN_LIMIT = 50;

/// A recurring issue shape and the number of documents showing it.
struct IssuePattern
{
    std::string key; ///< "<CATEGORY> <normalized path>: <message>"
    size_t documents{0};
};

struct Summary
{
    std::string label;
    size_t total{0};
    size_t valid{0};
    size_t invalid{0};
    std::vector<IssuePattern> patterns; ///< most common first

    bool success() const
    {
        return invalid == 0;
    }
};

/// Counts pass/fail documents and aggregates issue patterns, each pattern
/// counted at most once per document.
Summary summarize(const std::string& label, const validation::ValidationResult& result,
                  size_t limit = DEFAULT_PATTERN_LIMIT);

void to_json(Json& j, const IssuePattern& pattern);
void to_json(Json& j, const Summary& summary);

/// Writes the human-readable report; returns summary.success().
bool print_summary(std::ostream& out, const Summary& summary,
                   const validation::ValidationResult& result, bool verbose = false);

/// JSON report: the summary plus every document's issues.
Json result_to_json(const Summary& summary, const validation::ValidationResult& result);

struct DefinitionLookup
{
    std::optional<std::string> full_name;
    Json definition;                      ///< raw definition when found
    std::vector<std::string> suggestions; ///< near matches when not found
};

constexpr size_t MAX_SUGGESTIONS = 10;

/// Finds `name` by full or short name; otherwise collects case-insensitive
/// substring matches.
DefinitionLookup describe_definition(const schema::Schema& schema,
                                     const schema::SchemaIndex& index, const std::string& name);

void print_definition_lookup(std::ostream& out, const std::string& label, const std::string& name,
                             const DefinitionLookup& lookup, size_t definition_count);

} // namespace swagcheck::report
