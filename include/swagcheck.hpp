#pragma once

/// @file swagcheck.hpp
/// @brief Main header for swagcheck - includes the schema model, validator,
/// runner and report helpers.
///
/// Usage:
/// @code
/// #include <swagcheck.hpp>
///
/// int main() {
///     auto schema = swagcheck::schema::load_schema_file("catalogue.json");
///     swagcheck::validation::Runner runner(schema);
///     auto issues = runner.validate_file("firstbase_json/item.json");
///     for (const auto& issue : issues)
///         std::cout << issue.to_string() << "\n";
/// }
/// @endcode

#include "swagcheck/exceptions.hpp"
#include "swagcheck/report/summary.hpp"
#include "swagcheck/schema/index.hpp"
#include "swagcheck/schema/loader.hpp"
#include "swagcheck/schema/schema.hpp"
#include "swagcheck/settings.hpp"
#include "swagcheck/types.hpp"
#include "swagcheck/validation/issue.hpp"
#include "swagcheck/validation/runner.hpp"
#include "swagcheck/validation/validator.hpp"
#include "swagcheck/version.hpp"
