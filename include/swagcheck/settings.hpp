#pragma once
#include "swagcheck/types.hpp"

#include <string>
#include <vector>

namespace swagcheck
{

struct Settings
{
    std::string log_level{"INFO"};
    bool verbose{false};
    bool json_output{false};
    std::vector<std::string> schemas;
    std::string documents_dir{"firstbase_json"};
    std::string preferred_namespace{"Standard"};
    std::string root_definition{"TradeItem"};
    bool strict_references{false};
    unsigned jobs{1};

    static Settings from_env();
    static Settings from_json(const Json& j);
    /// Throws ConfigError when the file is unreadable or malformed.
    static Settings from_file(const std::string& path);

    /// Severity rank of a level name: DEBUG=0, INFO=1, WARN=2, ERROR=3.
    static int level_rank(const std::string& level);
    bool log_enabled(const std::string& level) const
    {
        return level_rank(level) >= level_rank(log_level);
    }
};

} // namespace swagcheck
