#pragma once
#include "swagcheck/types.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace swagcheck::validation
{

enum class IssueCategory
{
    SchemaNotFound,
    UnknownField,
    TypeMismatch,
    InvalidEnum,
    ParseError
};

std::string to_string(IssueCategory category);
std::optional<IssueCategory> category_from_string(const std::string& s);

/// One discrepancy between a document and its schema.
class Issue
{
  public:
    Issue() = default;
    Issue(IssueCategory category, std::string path, std::string message)
        : category_(category), path_(std::move(path)), message_(std::move(message))
    {
    }

    IssueCategory category() const
    {
        return category_;
    }
    const std::string& path() const
    {
        return path_;
    }
    const std::string& message() const
    {
        return message_;
    }

    /// Path with every "[<digits>]" replaced by "[*]".
    std::string normalized_path() const;

    /// "<CATEGORY> <path>: <message>"
    std::string to_string() const;

    bool operator==(const Issue& other) const
    {
        return category_ == other.category_ && path_ == other.path_ &&
               message_ == other.message_;
    }
    bool operator!=(const Issue& other) const
    {
        return !(*this == other);
    }

  private:
    IssueCategory category_{IssueCategory::SchemaNotFound};
    std::string path_;
    std::string message_;
};

std::string normalize_path(const std::string& path);

using Issues = std::vector<Issue>;

void to_json(Json& j, const Issue& issue);
void from_json(const Json& j, Issue& issue);

} // namespace swagcheck::validation
