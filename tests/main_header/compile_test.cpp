/// @file tests/main_header/compile_test.cpp
/// @brief Compile test for main swagcheck.hpp header
///
/// Including just <swagcheck.hpp> must be enough to load a schema, run the
/// validator and summarize the result.

#include "swagcheck.hpp"

#include <cassert>
#include <iostream>
#include <sstream>

using namespace swagcheck;

int main()
{
    std::cout << "=== Main Header Compile Test ===" << std::endl;

    std::cout << "test_schema_types_accessible..." << std::endl;
    {
        auto schema = schema::Schema::from_json(Json{
            {"definitions",
             Json{{"Shop.Standard.TradeItem",
                   Json{{"properties", Json{{"GTIN", Json{{"type", "string"}}}}}}}}}});
        auto index = schema::SchemaIndex::build(schema);
        assert(schema::resolve("TradeItem", schema, index) ==
               std::optional<std::string>("Shop.Standard.TradeItem"));
    }
    std::cout << "  PASSED" << std::endl;

    std::cout << "test_runner_and_report_accessible..." << std::endl;
    {
        auto schema = schema::Schema::from_json(Json{
            {"definitions",
             Json{{"Shop.Standard.TradeItem",
                   Json{{"properties", Json{{"GTIN", Json{{"type", "string"}}}}}}}}}});
        validation::Runner runner(schema);
        validation::ValidationResult result;
        result["item.json"] = runner.validate_document(Json{{"TradeItem", Json{{"GTIN", 1}}}});
        auto summary = report::summarize("shop", result);
        assert(summary.invalid == 1);

        std::ostringstream out;
        assert(!report::print_summary(out, summary, result));
    }
    std::cout << "  PASSED" << std::endl;

    std::cout << "test_version_accessible..." << std::endl;
    {
        assert(VERSION_MAJOR >= 1);
        Settings settings;
        assert(settings.jobs == 1);
    }
    std::cout << "  PASSED" << std::endl;

    std::cout << "\n=== All main header tests passed ===" << std::endl;
    return 0;
}
