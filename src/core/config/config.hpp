#pragma once
#include <string>
#include <vector>

#include "../types/constants.hpp"

namespace Spoor {
namespace Core {

// One entry of the YAML `sources:` list.
struct SourceConfig {
    std::string              type;  // "search" or "links"
    std::string              tag;
    std::string              url_template;
    unsigned                 page_size = 10;
    std::vector<std::string> queries;
    std::vector<std::string> urls;
    std::string              urls_file;
    std::string              pagination = "none";  // none | next_link | same_host
};

struct Config {
    int      workers              = Constants::DEFAULT_WORKERS;
    int      threads              = Constants::DEFAULT_THREADS;
    unsigned max_depth            = Constants::DEFAULT_MAX_DEPTH;
    unsigned max_pages_per_query  = Constants::DEFAULT_MAX_PAGES;
    unsigned empty_page_limit     = Constants::DEFAULT_EMPTY_PAGE_LIMIT;
    size_t   max_frontier_items   = Constants::DEFAULT_MAX_FRONTIER_ITEMS;
    int      attempt_budget       = Constants::MAX_RETRIES;
    int      backoff_base_ms      = Constants::BACKOFF_BASE_MS;
    int      min_host_interval_ms = Constants::MIN_HOST_INTERVAL_MS;
    bool     respect_robots       = true;

    std::vector<std::string> user_agents;
    int                      request_timeout_seconds = Constants::REQUEST_TIMEOUT_SECONDS;
    int                      connect_timeout_ms      = Constants::CONNECT_TIMEOUT_MS;

    std::string              fingerprint = Constants::DEFAULT_FINGERPRINT;
    std::vector<std::string> reserved_keys;  // Empty means the built-in list
    std::vector<std::string> body_patterns;

    std::string output         = Constants::DEFAULT_OUTPUT;
    std::string format         = "json";
    bool        merge_existing = false;
    std::string log_level      = "info";
    std::string config_path;

    // Command-line shorthands, turned into sources by all_sources()
    std::vector<std::string> urls;
    std::vector<std::string> queries;
    std::string              search_template;
    std::string              urls_file;
    std::string              pagination = "none";

    std::vector<SourceConfig> sources;

    static Config parse(int argc, char* argv[]);

    // Throws std::runtime_error describing the first invalid setting.
    void validate() const;

    // YAML sources followed by the ones implied by urls/queries/urls_file.
    std::vector<SourceConfig> all_sources() const;
};

void load_yaml(Config& config, const std::string& path);

}  // namespace Core
}  // namespace Spoor
