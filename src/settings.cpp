#include "swagcheck/settings.hpp"

#include "swagcheck/exceptions.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace swagcheck
{

static std::string getenv_str(const char* key, const std::string& defv)
{
    if (const char* v = std::getenv(key))
        return std::string(v);
    return defv;
}

static bool truthy(const std::string& v)
{
    return v == "1" || v == "true" || v == "TRUE";
}

static std::vector<std::string> split(const std::string& s, char sep)
{
    std::vector<std::string> parts;
    std::string part;
    std::istringstream in(s);
    while (std::getline(in, part, sep))
        if (!part.empty())
            parts.push_back(part);
    return parts;
}

static std::string upper(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(), ::toupper);
    return s;
}

Settings Settings::from_env()
{
    Settings s;
    s.log_level = upper(getenv_str("SWAGCHECK_LOG_LEVEL", s.log_level));
    auto schemas = getenv_str("SWAGCHECK_SCHEMAS", "");
    if (!schemas.empty())
        s.schemas = split(schemas, ':');
    s.documents_dir = getenv_str("SWAGCHECK_DOCUMENTS_DIR", s.documents_dir);
    s.strict_references = truthy(getenv_str("SWAGCHECK_STRICT", "0"));
    auto jobs = getenv_str("SWAGCHECK_JOBS", "");
    if (!jobs.empty())
    {
        try
        {
            int n = std::stoi(jobs);
            s.jobs = n > 0 ? static_cast<unsigned>(n) : 1u;
        }
        catch (const std::exception&)
        {
            throw ConfigError("SWAGCHECK_JOBS must be a number, got: " + jobs);
        }
    }
    return s;
}

Settings Settings::from_json(const Json& j)
{
    Settings s;
    if (j.contains("log_level"))
        s.log_level = upper(j.at("log_level").get<std::string>());
    if (j.contains("verbose"))
        s.verbose = j.at("verbose").get<bool>();
    if (j.contains("json_output"))
        s.json_output = j.at("json_output").get<bool>();
    if (j.contains("schemas"))
        s.schemas = j.at("schemas").get<std::vector<std::string>>();
    if (j.contains("documents_dir"))
        s.documents_dir = j.at("documents_dir").get<std::string>();
    if (j.contains("preferred_namespace"))
        s.preferred_namespace = j.at("preferred_namespace").get<std::string>();
    if (j.contains("root_definition"))
        s.root_definition = j.at("root_definition").get<std::string>();
    if (j.contains("strict_references"))
        s.strict_references = j.at("strict_references").get<bool>();
    if (j.contains("jobs"))
        s.jobs = std::max(1u, j.at("jobs").get<unsigned>());
    return s;
}

Settings Settings::from_file(const std::string& path)
{
    std::ifstream in(path);
    if (!in)
        throw ConfigError("Unable to open config file: " + path);
    try
    {
        return from_json(Json::parse(in));
    }
    catch (const Json::exception& e)
    {
        throw ConfigError("Invalid config file " + path + ": " + e.what());
    }
}

int Settings::level_rank(const std::string& level)
{
    if (level == "DEBUG")
        return 0;
    if (level == "INFO")
        return 1;
    if (level == "WARN" || level == "WARNING")
        return 2;
    if (level == "ERROR")
        return 3;
    return 1;
}

} // namespace swagcheck
