#include "config.hpp"
#include <CLI/CLI.hpp>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace Spoor {
namespace Core {

namespace {

template <typename T>
void read(const YAML::Node& yaml, const char* key, T& target) {
    if (yaml[key])
        target = yaml[key].as<T>();
}

void read_list(const YAML::Node& yaml, const char* key, std::vector<std::string>& target) {
    const YAML::Node node = yaml[key];
    if (!node)
        return;
    if (node.IsScalar()) {
        target = {node.as<std::string>()};
        return;
    }
    if (!node.IsSequence())
        throw std::runtime_error(std::string("'") + key + "' must be a list");
    target.clear();
    for (const auto& item : node)
        target.push_back(item.as<std::string>());
}

SourceConfig read_source(const YAML::Node& node, size_t index) {
    if (!node.IsMap())
        throw std::runtime_error("sources[" + std::to_string(index) + "] must be a mapping");

    SourceConfig source;
    read(node, "type", source.type);
    read(node, "tag", source.tag);
    read(node, "url_template", source.url_template);
    read(node, "page_size", source.page_size);
    read_list(node, "queries", source.queries);
    read_list(node, "urls", source.urls);
    read(node, "urls_file", source.urls_file);
    read(node, "pagination", source.pagination);

    if (source.tag.empty())
        source.tag = source.type + "-" + std::to_string(index + 1);
    return source;
}

}  // namespace

void load_yaml(Config& config, const std::string& path) {
    try {
        YAML::Node yaml = YAML::LoadFile(path);
        if (!yaml || yaml.IsNull())
            return;

        read(yaml, "workers", config.workers);
        read(yaml, "threads", config.threads);
        read(yaml, "max_depth", config.max_depth);
        read(yaml, "max_pages_per_query", config.max_pages_per_query);
        read(yaml, "empty_page_limit", config.empty_page_limit);
        read(yaml, "max_frontier_items", config.max_frontier_items);
        read(yaml, "attempt_budget", config.attempt_budget);
        read(yaml, "backoff_base_ms", config.backoff_base_ms);
        read(yaml, "min_host_interval_ms", config.min_host_interval_ms);
        read(yaml, "respect_robots", config.respect_robots);
        read_list(yaml, "user_agents", config.user_agents);
        read(yaml, "request_timeout_seconds", config.request_timeout_seconds);
        read(yaml, "connect_timeout_ms", config.connect_timeout_ms);
        read(yaml, "output", config.output);
        read(yaml, "format", config.format);
        read(yaml, "merge_existing", config.merge_existing);
        read(yaml, "log_level", config.log_level);

        if (const YAML::Node fp = yaml["fingerprint"]) {
            if (fp.IsScalar()) {
                config.fingerprint = fp.as<std::string>();
            } else {
                read(fp, "suffix", config.fingerprint);
                read_list(fp, "reserved", config.reserved_keys);
                read_list(fp, "body_patterns", config.body_patterns);
            }
        }

        if (const YAML::Node sources = yaml["sources"]) {
            if (!sources.IsSequence())
                throw std::runtime_error("'sources' must be a list");
            for (size_t i = 0; i < sources.size(); ++i)
                config.sources.push_back(read_source(sources[i], i));
        }
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Error parsing config file: " + std::string(e.what()));
    }
}

Config Config::parse(int argc, char* argv[]) {
    Config   config;
    CLI::App app{"Spoor - Fingerprint-driven host discovery crawler"};

    app.add_option("-w,--workers", config.workers, "Concurrent crawl workers (coroutines)");
    app.add_option("-t,--threads", config.threads, "Number of IO threads");
    app.add_option("-d,--depth", config.max_depth, "Maximum traversal depth");
    app.add_option("--max-pages", config.max_pages_per_query, "Maximum pages per query");
    app.add_option("--empty-pages", config.empty_page_limit,
                   "Consecutive pages without new hosts before a query stops (0 = never)");
    app.add_option("--max-items", config.max_frontier_items, "Maximum pending frontier items");
    app.add_option("--retries", config.attempt_budget, "Attempts per URL");
    app.add_option("--backoff-ms", config.backoff_base_ms, "Base retry backoff in milliseconds");
    app.add_option("--delay-ms", config.min_host_interval_ms, "Minimum delay between requests to one host");
    app.add_flag(
        "--no-robots",
        [&](size_t count) {
            if (count > 0)
                config.respect_robots = false;
        },
        "Ignore robots.txt");
    app.add_option("--user-agent", config.user_agents, "User-Agent string (repeat to rotate)");
    app.add_option("--timeout", config.request_timeout_seconds, "Request timeout in seconds");
    app.add_option("--connect-timeout-ms", config.connect_timeout_ms, "Connect timeout in milliseconds");
    app.add_option("-f,--fingerprint", config.fingerprint, "Host suffix identifying targets");
    app.add_option("-o,--output", config.output, "Output file");
    app.add_option("--format", config.format, "Output format")->check(CLI::IsMember({"json", "csv"}));
    app.add_flag("--merge", config.merge_existing, "Merge with hosts already in the output file");
    app.add_option("--log-level", config.log_level, "debug, info, warn, error or quiet");
    app.add_option("-q,--query", config.queries, "Search query (needs --search-template)");
    app.add_option("--search-template", config.search_template,
                   "Search URL with {query}, {page} and {offset} placeholders");
    app.add_option("--urls-file", config.urls_file, "File with one URL per line");
    app.add_option("--pagination", config.pagination, "Pagination for URL lists")
        ->check(CLI::IsMember({"none", "next_link", "same_host"}));
    app.add_option("--config", config.config_path, "Path to YAML configuration file");

    app.add_option("urls", config.urls, "URLs to crawl");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        exit(app.exit(e));
    }

    if (!config.config_path.empty()) {
        load_yaml(config, config.config_path);

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            exit(app.exit(e));
        }
    }

    return config;
}

void Config::validate() const {
    if (workers < 1)
        throw std::runtime_error("workers must be at least 1");
    if (threads < 1)
        throw std::runtime_error("threads must be at least 1");
    if (max_depth < 1)
        throw std::runtime_error("max_depth must be at least 1");
    if (max_pages_per_query < 1)
        throw std::runtime_error("max_pages_per_query must be at least 1");
    if (max_frontier_items < 1)
        throw std::runtime_error("max_frontier_items must be at least 1");
    if (backoff_base_ms < 0 || min_host_interval_ms < 0)
        throw std::runtime_error("delays must not be negative");
    if (request_timeout_seconds < 1 || connect_timeout_ms < 1)
        throw std::runtime_error("timeouts must be positive");
    if (fingerprint.empty())
        throw std::runtime_error("fingerprint must not be empty");
    if (format != "json" && format != "csv")
        throw std::runtime_error("Unknown output format: " + format);
    if (!queries.empty() && search_template.empty())
        throw std::runtime_error("--query needs --search-template");

    for (const auto& source : sources) {
        if (source.type == "search") {
            if (source.url_template.empty())
                throw std::runtime_error("Source '" + source.tag + "' has no url_template");
        } else if (source.type == "links") {
            if (source.pagination != "none" && source.pagination != "next_link"
                && source.pagination != "same_host")
                throw std::runtime_error("Source '" + source.tag
                                         + "' has unknown pagination: " + source.pagination);
        } else {
            throw std::runtime_error("Unknown source type '" + source.type + "'");
        }
    }
}

std::vector<SourceConfig> Config::all_sources() const {
    std::vector<SourceConfig> out = sources;

    if (!queries.empty()) {
        SourceConfig search;
        search.type         = "search";
        search.tag          = "search";
        search.url_template = search_template;
        search.queries      = queries;
        out.push_back(std::move(search));
    }
    if (!urls.empty() || !urls_file.empty()) {
        SourceConfig links;
        links.type       = "links";
        links.tag        = "urls";
        links.urls       = urls;
        links.urls_file  = urls_file;
        links.pagination = pagination;
        out.push_back(std::move(links));
    }
    return out;
}

}  // namespace Core
}  // namespace Spoor
