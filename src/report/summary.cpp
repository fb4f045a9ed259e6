#include "swagcheck/report/summary.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <unordered_map>
#include <unordered_set>

namespace swagcheck::report
{

namespace
{
const std::string kHeavyRule(66, '=');
const std::string kLightRule(66, '-');

std::string lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string pattern_key(const validation::Issue& issue)
{
    return validation::to_string(issue.category()) + " " + issue.normalized_path() + ": " +
           issue.message();
}
} // namespace

Summary summarize(const std::string& label, const validation::ValidationResult& result,
                  size_t limit)
{
    Summary summary;
    summary.label = label;
    summary.total = result.size();

    std::unordered_map<std::string, size_t> position;
    std::vector<IssuePattern> patterns;
    for (const auto& [document, issues] : result)
    {
        if (issues.empty())
            ++summary.valid;
        else
            ++summary.invalid;

        std::unordered_set<std::string> seen;
        for (const auto& issue : issues)
        {
            auto key = pattern_key(issue);
            if (!seen.insert(key).second)
                continue;
            auto it = position.find(key);
            if (it == position.end())
            {
                position.emplace(key, patterns.size());
                patterns.push_back(IssuePattern{key, 1});
            }
            else
                ++patterns[it->second].documents;
        }
    }

    // Ties keep first-appearance order.
    std::stable_sort(patterns.begin(), patterns.end(),
                     [](const IssuePattern& a, const IssuePattern& b)
                     { return a.documents > b.documents; });
    if (patterns.size() > limit)
        patterns.resize(limit);
    summary.patterns = std::move(patterns);
    return summary;
}

void to_json(Json& j, const IssuePattern& pattern)
{
    j = Json{{"pattern", pattern.key}, {"documents", pattern.documents}};
}

void to_json(Json& j, const Summary& summary)
{
    j = Json{{"label", summary.label},
             {"total", summary.total},
             {"valid", summary.valid},
             {"invalid", summary.invalid},
             {"success", summary.success()},
             {"patterns", summary.patterns}};
}

bool print_summary(std::ostream& out, const Summary& summary,
                   const validation::ValidationResult& result, bool verbose)
{
    out << "\n" << kHeavyRule << "\n";
    out << "  " << summary.label << "\n";
    out << kHeavyRule << "\n";
    out << "Files validated : " << summary.total << "\n";
    out << "Valid           : " << summary.valid << "\n";
    out << "With issues     : " << summary.invalid << "\n";

    if (verbose)
    {
        out << "\n" << kLightRule << "\n";
        for (const auto& [document, issues] : result)
        {
            out << "  [" << (issues.empty() ? "PASS" : "FAIL") << "] " << document << "\n";
            for (const auto& issue : issues)
                out << "    " << issue.to_string() << "\n";
        }
    }

    if (!summary.patterns.empty())
    {
        out << "\n" << kLightRule << "\n";
        out << "ISSUE PATTERNS (unique path + message, count = files affected):\n";
        out << kLightRule << "\n";
        for (const auto& pattern : summary.patterns)
            out << "  " << std::setw(4) << pattern.documents << "x  " << pattern.key << "\n";
    }
    else
    {
        out << "\nAll " << summary.total << " files passed validation.\n";
    }
    return summary.success();
}

Json result_to_json(const Summary& summary, const validation::ValidationResult& result)
{
    Json documents = Json::object();
    for (const auto& [document, issues] : result)
        documents[document] = issues;
    Json j = summary;
    j["documents"] = std::move(documents);
    return j;
}

DefinitionLookup describe_definition(const schema::Schema& schema,
                                     const schema::SchemaIndex& index, const std::string& name)
{
    DefinitionLookup lookup;
    std::string full = index.find(name).value_or(name);
    if (const auto* def = schema.find(full))
    {
        lookup.full_name = full;
        lookup.definition = def->raw();
        return lookup;
    }

    auto needle = lower(name);
    for (const auto& entry : schema.definitions())
    {
        if (lower(entry.first).find(needle) == std::string::npos)
            continue;
        lookup.suggestions.push_back(entry.first);
        if (lookup.suggestions.size() >= MAX_SUGGESTIONS)
            break;
    }
    return lookup;
}

void print_definition_lookup(std::ostream& out, const std::string& label, const std::string& name,
                             const DefinitionLookup& lookup, size_t definition_count)
{
    if (lookup.full_name)
    {
        out << "\n[" << label << "] " << *lookup.full_name << ":\n";
        out << lookup.definition.dump(2) << "\n";
        return;
    }
    if (!lookup.suggestions.empty())
    {
        out << "\n[" << label << "] '" << name << "' not found. Did you mean:\n";
        for (const auto& s : lookup.suggestions)
            out << "  " << s << "\n";
        return;
    }
    out << "\n[" << label << "] '" << name << "' not found in " << definition_count
        << " definitions.\n";
}

} // namespace swagcheck::report
