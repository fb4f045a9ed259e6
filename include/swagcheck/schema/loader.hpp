#pragma once
#include "swagcheck/schema/schema.hpp"

#include <string>

namespace swagcheck::schema
{

/// Loads a Swagger document previously saved to disk.
/// Throws NotFoundError if the file cannot be opened and SchemaError if it is
/// not valid JSON or carries no definitions.
Schema load_schema_file(const std::string& path);

} // namespace swagcheck::schema
