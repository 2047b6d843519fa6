#include <exception>
#include <memory>
#include <set>
#include "core/config/config.hpp"
#include "core/logger/logger.hpp"
#include "engine/crawler/crawler.hpp"
#include "sources/source_factory.hpp"
#include "storage/csv_file_sink.hpp"
#include "storage/json_file_sink.hpp"

namespace {

using namespace Spoor;

Engine::CrawlerConfig make_crawler_config(const Core::Config& config) {
    Engine::CrawlerConfig crawler_config;
    crawler_config.threads                      = config.threads;
    crawler_config.workers                      = config.workers;
    crawler_config.frontier.max_depth           = config.max_depth;
    crawler_config.frontier.max_pages_per_query = config.max_pages_per_query;
    crawler_config.frontier.empty_page_limit    = config.empty_page_limit;
    crawler_config.frontier.max_items           = config.max_frontier_items;
    crawler_config.attempt_budget               = config.attempt_budget;
    crawler_config.backoff.base                 = std::chrono::milliseconds(config.backoff_base_ms);
    crawler_config.min_host_interval            = std::chrono::milliseconds(config.min_host_interval_ms);
    crawler_config.respect_robots               = config.respect_robots;
    crawler_config.user_agents                  = config.user_agents;
    crawler_config.connect_timeout              = std::chrono::milliseconds(config.connect_timeout_ms);
    crawler_config.request_timeout              = std::chrono::seconds(config.request_timeout_seconds);
    crawler_config.rules.fingerprint.suffix     = config.fingerprint;
    if (!config.reserved_keys.empty()) {
        crawler_config.rules.fingerprint.reserved =
            std::set<std::string>(config.reserved_keys.begin(), config.reserved_keys.end());
    }
    crawler_config.rules.body_patterns = config.body_patterns;
    crawler_config.handle_signals      = true;
    return crawler_config;
}

std::unique_ptr<Storage::Sink> make_sink(const Core::Config& config) {
    if (config.format == "csv")
        return std::make_unique<Storage::CsvFileSink>(config.output);
    return std::make_unique<Storage::JsonFileSink>(config.output, config.merge_existing);
}

void log_summary(const Engine::RunResult& result) {
    const auto& s = result.stats;
    Core::Logger::info("Run " + std::string(Engine::to_string(result.state)) + ": "
                       + std::to_string(s.processed) + " processed, " + std::to_string(s.blocked)
                       + " blocked, " + std::to_string(s.failed) + " failed, "
                       + std::to_string(s.disallowed) + " disallowed, " + std::to_string(s.dropped)
                       + " dropped, " + std::to_string(s.requests) + " requests, "
                       + std::to_string(s.entities) + " hosts");
}

int run_crawler(const Core::Config& config) {
    auto sources = Sources::make_sources(config);
    if (sources.empty()) {
        Core::Logger::error("No sources configured. Pass URLs, --query or a config file.");
        return 1;
    }

    Engine::Crawler crawler(make_crawler_config(config));
    for (auto& source : sources)
        crawler.add_source(std::move(source));

    auto result = crawler.run();
    log_summary(result);

    auto sink = make_sink(config);
    return sink->write(result.entities) ? 0 : 1;
}

}  // namespace

int main(int argc, char* argv[]) {
    try {
        auto config = Spoor::Core::Config::parse(argc, argv);
        Spoor::Core::Logger::set_level(Spoor::Core::Logger::parse_level(config.log_level));
        config.validate();
        return run_crawler(config);
    } catch (const std::exception& e) {
        Spoor::Core::Logger::error(e.what());
        return 1;
    }
}
