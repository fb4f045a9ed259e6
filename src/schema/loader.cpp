#include "swagcheck/schema/loader.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace swagcheck::schema
{

Schema load_schema_file(const std::string& path)
{
    std::ifstream in(std::filesystem::path(path), std::ios::binary);
    if (!in)
        throw NotFoundError("Unable to open schema file: " + path);

    std::ostringstream ss;
    ss << in.rdbuf();
    Json swagger;
    try
    {
        swagger = Json::parse(ss.str());
    }
    catch (const Json::parse_error& e)
    {
        throw SchemaError("Invalid schema JSON in " + path + ": " + std::string(e.what()));
    }
    return Schema::from_json(swagger);
}

} // namespace swagcheck::schema
