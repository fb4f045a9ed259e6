#include "swagcheck/validation/issue.hpp"

#include "swagcheck/exceptions.hpp"

#include <regex>

namespace swagcheck::validation
{

std::string to_string(IssueCategory category)
{
    switch (category)
    {
    case IssueCategory::SchemaNotFound:
        return "SCHEMA_NOT_FOUND";
    case IssueCategory::UnknownField:
        return "UNKNOWN_FIELD";
    case IssueCategory::TypeMismatch:
        return "TYPE_MISMATCH";
    case IssueCategory::InvalidEnum:
        return "INVALID_ENUM";
    case IssueCategory::ParseError:
        return "PARSE_ERROR";
    }
    return "SCHEMA_NOT_FOUND";
}

std::optional<IssueCategory> category_from_string(const std::string& s)
{
    if (s == "SCHEMA_NOT_FOUND")
        return IssueCategory::SchemaNotFound;
    if (s == "UNKNOWN_FIELD")
        return IssueCategory::UnknownField;
    if (s == "TYPE_MISMATCH")
        return IssueCategory::TypeMismatch;
    if (s == "INVALID_ENUM")
        return IssueCategory::InvalidEnum;
    if (s == "PARSE_ERROR")
        return IssueCategory::ParseError;
    return std::nullopt;
}

std::string normalize_path(const std::string& path)
{
    static const std::regex index_re(R"(\[\d+\])");
    return std::regex_replace(path, index_re, "[*]");
}

std::string Issue::normalized_path() const
{
    return normalize_path(path_);
}

std::string Issue::to_string() const
{
    return validation::to_string(category_) + " " + path_ + ": " + message_;
}

void to_json(Json& j, const Issue& issue)
{
    j = Json{{"category", to_string(issue.category())},
             {"path", issue.path()},
             {"normalized_path", issue.normalized_path()},
             {"message", issue.message()}};
}

void from_json(const Json& j, Issue& issue)
{
    auto name = j.at("category").get<std::string>();
    auto category = category_from_string(name);
    if (!category)
        throw Error("unknown issue category: " + name);
    issue = Issue(*category, j.at("path").get<std::string>(), j.at("message").get<std::string>());
}

} // namespace swagcheck::validation
