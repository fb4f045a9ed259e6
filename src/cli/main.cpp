#include "swagcheck/exceptions.hpp"
#include "swagcheck/report/summary.hpp"
#include "swagcheck/schema/index.hpp"
#include "swagcheck/schema/loader.hpp"
#include "swagcheck/settings.hpp"
#include "swagcheck/validation/runner.hpp"
#include "swagcheck/version.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace
{

static int usage(int exit_code = 1)
{
    std::cout << "swagcheck " << swagcheck::VERSION_MAJOR << "." << swagcheck::VERSION_MINOR << "."
              << swagcheck::VERSION_PATCH << "\n";
    std::cout << "Usage:\n";
    std::cout << "  swagcheck --help\n";
    std::cout << "  swagcheck --version\n";
    std::cout << "  swagcheck --schema <swagger.json> [options] [files-or-dirs...]\n";
    std::cout << "  swagcheck --schema <swagger.json> --dump-schema <Name>\n";
    std::cout << "\n";
    std::cout << "Options:\n";
    std::cout << "  --schema <file>       Swagger document to validate against (repeatable)\n";
    std::cout << "  --config <file>       JSON config file (see Settings)\n";
    std::cout << "  --root <ShortName>    Root definition (default: TradeItem)\n";
    std::cout << "  --jobs <n>            Validate files on n worker threads\n";
    std::cout << "  --strict              Report scalars bound to object references\n";
    std::cout << "  --json                Print a JSON report instead of text\n";
    std::cout << "  -v, --verbose         List every file with its issues\n";
    std::cout << "\n";
    std::cout << "Without file arguments, every *.json file in the documents directory\n";
    std::cout << "(default: firstbase_json, env SWAGCHECK_DOCUMENTS_DIR) is validated.\n";
    std::cout << "Exit status: 0 all files valid, 1 issues found, 2 usage or config error.\n";
    return exit_code;
}

static bool is_flag(const std::string& s)
{
    return !s.empty() && s[0] == '-';
}

static std::optional<std::string> consume_flag_value(std::vector<std::string>& args,
                                                     const std::string& flag)
{
    for (size_t i = 0; i + 1 < args.size(); ++i)
    {
        if (args[i] == flag)
        {
            std::string value = args[i + 1];
            args.erase(args.begin() + static_cast<long long>(i),
                       args.begin() + static_cast<long long>(i) + 2);
            return value;
        }
    }
    return std::nullopt;
}

static bool consume_flag(std::vector<std::string>& args, const std::string& flag)
{
    for (size_t i = 0; i < args.size(); ++i)
    {
        if (args[i] == flag)
        {
            args.erase(args.begin() + static_cast<long long>(i));
            return true;
        }
    }
    return false;
}

static int parse_int(const std::string& s, int default_value)
{
    try
    {
        size_t pos = 0;
        int v = std::stoi(s, &pos, 10);
        if (pos != s.size())
            return default_value;
        return v;
    }
    catch (const std::exception&)
    {
        return default_value;
    }
}

struct LoadedSchema
{
    std::string label;
    swagcheck::schema::Schema schema;
};

static std::string schema_label(const std::string& path, const swagcheck::schema::Schema& schema)
{
    if (schema.title() && !schema.title()->empty())
        return *schema.title();
    return std::filesystem::path(path).stem().string();
}

static int run_dump_schema(const std::vector<LoadedSchema>& schemas, const std::string& name,
                           const swagcheck::Settings& settings)
{
    for (const auto& loaded : schemas)
    {
        auto index =
            swagcheck::schema::SchemaIndex::build(loaded.schema, settings.preferred_namespace);
        auto lookup = swagcheck::report::describe_definition(loaded.schema, index, name);
        swagcheck::report::print_definition_lookup(std::cout, loaded.label, name, lookup,
                                                   loaded.schema.size());
    }
    return 0;
}

static int run_validation(const std::vector<LoadedSchema>& schemas,
                          const std::vector<std::filesystem::path>& files,
                          const swagcheck::Settings& settings)
{
    using namespace swagcheck;

    bool all_success = true;
    Json reports = Json::array();
    for (const auto& loaded : schemas)
    {
        validation::Runner::Options options;
        options.root_definition = settings.root_definition;
        options.root_key = settings.root_definition;
        options.root_path = settings.root_definition;
        options.preferred_namespace = settings.preferred_namespace;
        options.validator.strict_references = settings.strict_references;

        std::optional<validation::Runner> runner;
        try
        {
            runner.emplace(loaded.schema, options);
        }
        catch (const NotFoundError&)
        {
            std::cerr << "ERROR: " << settings.root_definition << " not found in " << loaded.label
                      << "\n";
            return 1;
        }

        const auto* root = loaded.schema.find(runner->root_definition());
        if (!settings.json_output)
            std::cout << loaded.label << ": " << loaded.schema.size() << " definitions, "
                      << settings.root_definition << " has " << root->properties().size()
                      << " properties\n";
        if (settings.log_enabled("INFO"))
            std::cerr << "Validating " << files.size() << " files...\n";

        auto started = std::chrono::steady_clock::now();
        auto result = runner->validate_files(files, settings.jobs);
        if (settings.log_enabled("DEBUG"))
        {
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started);
            std::cerr << "[swagcheck] " << loaded.label << ": " << files.size() << " files in "
                      << elapsed.count() << " ms on " << settings.jobs << " job(s)\n";
        }

        auto summary = report::summarize(loaded.label, result);
        if (settings.json_output)
            reports.push_back(report::result_to_json(summary, result));
        else
            report::print_summary(std::cout, summary, result, settings.verbose);
        if (!summary.success())
            all_success = false;
    }

    if (settings.json_output)
        std::cout << reports.dump(2) << "\n";
    return all_success ? 0 : 1;
}

} // namespace

int main(int argc, char** argv)
{
    using namespace swagcheck;

    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i)
        args.emplace_back(argv[i]);

    if (consume_flag(args, "--help") || consume_flag(args, "-h"))
        return usage(0);
    if (consume_flag(args, "--version"))
    {
        std::cout << VERSION_MAJOR << "." << VERSION_MINOR << "." << VERSION_PATCH << "\n";
        return 0;
    }

    try
    {
        Settings settings = Settings::from_env();
        if (auto config = consume_flag_value(args, "--config"))
            settings = Settings::from_file(*config);

        std::vector<std::string> schema_paths;
        while (auto path = consume_flag_value(args, "--schema"))
            schema_paths.push_back(*path);
        if (!schema_paths.empty())
            settings.schemas = schema_paths;

        if (consume_flag(args, "--verbose") || consume_flag(args, "-v"))
            settings.verbose = true;
        if (consume_flag(args, "--json"))
            settings.json_output = true;
        if (consume_flag(args, "--strict"))
            settings.strict_references = true;
        if (auto root = consume_flag_value(args, "--root"))
            settings.root_definition = *root;
        if (auto jobs = consume_flag_value(args, "--jobs"))
            settings.jobs = static_cast<unsigned>(std::max(1, parse_int(*jobs, 1)));
        auto dump_name = consume_flag_value(args, "--dump-schema");
        if (!dump_name && consume_flag(args, "--dump-schema"))
        {
            std::cerr << "Usage: --dump-schema <SchemaName>\n";
            return 2;
        }

        for (const auto& a : args)
        {
            if (is_flag(a))
            {
                std::cerr << "Unknown option: " << a << "\n";
                return 2;
            }
        }

        if (settings.schemas.empty())
        {
            std::cerr << "No schema given. Use --schema <file> or SWAGCHECK_SCHEMAS.\n";
            return 2;
        }

        std::vector<LoadedSchema> schemas;
        for (const auto& path : settings.schemas)
        {
            auto schema = schema::load_schema_file(path);
            if (settings.log_enabled("DEBUG"))
                std::cerr << "[swagcheck] loaded " << path << " (" << schema.size()
                          << " definitions)\n";
            auto label = schema_label(path, schema);
            schemas.push_back(LoadedSchema{label, std::move(schema)});
        }

        if (dump_name)
            return run_dump_schema(schemas, *dump_name, settings);

        std::vector<std::string> inputs = args;
        if (inputs.empty())
        {
            if (!std::filesystem::is_directory(settings.documents_dir))
            {
                std::cerr << "ERROR: " << settings.documents_dir << " not found.\n";
                return 2;
            }
            inputs.push_back(settings.documents_dir);
        }
        auto files = validation::Runner::collect_documents(inputs);
        if (files.empty())
        {
            std::cerr << "No JSON files to validate.\n";
            return 2;
        }

        return run_validation(schemas, files, settings);
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }
}
