#include "swagcheck/validation/runner.hpp"

#include "swagcheck/exceptions.hpp"

#include <algorithm>
#include <atomic>
#include <fstream>
#include <iterator>
#include <set>
#include <sstream>
#include <thread>
#include <utility>

namespace swagcheck::validation
{

namespace
{
void append(Issues& out, Issues&& more)
{
    out.insert(out.end(), std::make_move_iterator(more.begin()),
               std::make_move_iterator(more.end()));
}

bool has_json_extension(const std::filesystem::path& path)
{
    return path.extension() == ".json";
}

/// File name, or the full path when two inputs share a file name.
std::vector<std::string> document_ids(const std::vector<std::filesystem::path>& files)
{
    std::set<std::string> seen;
    std::set<std::string> duplicated;
    for (const auto& f : files)
        if (!seen.insert(f.filename().string()).second)
            duplicated.insert(f.filename().string());

    std::vector<std::string> ids;
    ids.reserve(files.size());
    for (const auto& f : files)
    {
        auto name = f.filename().string();
        ids.push_back(duplicated.count(name) ? f.generic_string() : name);
    }
    return ids;
}
} // namespace

bool all_valid(const ValidationResult& result)
{
    return std::all_of(result.begin(), result.end(),
                       [](const auto& kv) { return kv.second.empty(); });
}

Runner::Runner(const schema::Schema& schema) : Runner(schema, Options{}) {}

Runner::Runner(const schema::Schema& schema, Options options)
    : schema_(schema), options_(std::move(options)),
      index_(schema::SchemaIndex::build(schema, options_.preferred_namespace)),
      validator_(schema_, index_, options_.validator)
{
    auto root = schema::find_preferred(options_.root_definition, schema_, index_);
    if (!root)
        throw NotFoundError(options_.root_definition + " not found in schema");
    root_definition_ = *root;

    if (!options_.child_link_key.empty())
        child_definition_ = schema::resolve(options_.child_link_key, schema_, index_);
}

Issues Runner::validate_document(const Json& document) const
{
    const Json* primary = &document;
    if (document.is_object())
    {
        auto it = document.find(options_.root_key);
        if (it != document.end())
            primary = &*it;
    }
    Issues issues = validator_.validate(*primary, root_definition_, options_.root_path);

    if (!child_definition_ || !document.is_object())
        return issues;
    auto links = document.find(options_.child_link_key);
    if (links == document.end() || !links->is_array())
        return issues;

    for (size_t i = 0; i < links->size(); ++i)
    {
        const Json& link = (*links)[i];
        std::string link_path = options_.child_link_key + "[" + std::to_string(i) + "]";
        append(issues, validator_.validate(link, *child_definition_, link_path));

        if (options_.embedded_path.empty())
            continue;
        const Json* embedded = &link;
        std::string embedded_path = link_path;
        for (const auto& segment : options_.embedded_path)
        {
            if (!embedded->is_object())
            {
                embedded = nullptr;
                break;
            }
            auto it = embedded->find(segment);
            if (it == embedded->end())
            {
                embedded = nullptr;
                break;
            }
            embedded = &*it;
            embedded_path += "." + segment;
        }
        // Null and empty entities carry nothing to check.
        if (embedded && !embedded->empty())
            append(issues, validator_.validate(*embedded, root_definition_, embedded_path));
    }
    return issues;
}

Issues Runner::validate_text(const std::string& text) const
{
    Json document;
    try
    {
        document = Json::parse(text);
    }
    catch (const Json::parse_error& e)
    {
        return {Issue(IssueCategory::ParseError, "", e.what())};
    }
    return validate_document(document);
}

Issues Runner::validate_file(const std::filesystem::path& path) const
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        return {Issue(IssueCategory::ParseError, "", "unable to read " + path.string())};
    std::ostringstream ss;
    ss << in.rdbuf();
    return validate_text(ss.str());
}

ValidationResult Runner::validate_files(const std::vector<std::filesystem::path>& files,
                                        unsigned jobs) const
{
    auto ids = document_ids(files);
    std::vector<Issues> slots(files.size());

    unsigned workers = std::max(1u, std::min<unsigned>(jobs, static_cast<unsigned>(files.size())));
    if (workers <= 1)
    {
        for (size_t i = 0; i < files.size(); ++i)
            slots[i] = validate_file(files[i]);
    }
    else
    {
        std::atomic<size_t> next{0};
        std::vector<std::thread> threads;
        threads.reserve(workers);
        for (unsigned w = 0; w < workers; ++w)
        {
            threads.emplace_back(
                [&]()
                {
                    for (size_t i = next.fetch_add(1); i < files.size(); i = next.fetch_add(1))
                        slots[i] = validate_file(files[i]);
                });
        }
        for (auto& t : threads)
            t.join();
    }

    ValidationResult result;
    for (size_t i = 0; i < files.size(); ++i)
        result[ids[i]] = std::move(slots[i]);
    return result;
}

std::vector<std::filesystem::path> Runner::collect_documents(const std::vector<std::string>& inputs)
{
    std::vector<std::filesystem::path> files;
    for (const auto& input : inputs)
    {
        std::filesystem::path p(input);
        std::error_code ec;
        if (std::filesystem::is_directory(p, ec))
        {
            std::vector<std::filesystem::path> found;
            for (const auto& entry : std::filesystem::directory_iterator(p, ec))
                if (entry.is_regular_file(ec) && has_json_extension(entry.path()))
                    found.push_back(entry.path());
            std::sort(found.begin(), found.end());
            files.insert(files.end(), found.begin(), found.end());
        }
        else if (has_json_extension(p))
            files.push_back(p);
    }
    return files;
}

} // namespace swagcheck::validation
