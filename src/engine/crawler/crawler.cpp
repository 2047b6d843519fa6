#include "crawler.hpp"
#include <stdexcept>
#include "../../core/logger/logger.hpp"
#include "../../network/http/beast_client.hpp"

namespace Spoor {
namespace Engine {

using namespace Spoor::Network::Identity;

namespace {

std::string robots_agent(const std::vector<std::string>& user_agents) {
    return user_agents.empty() ? std::string(Constants::USER_AGENT) : user_agents.front();
}

}  // namespace

const char* to_string(RunState state) {
    switch (state) {
        case RunState::Idle:
            return "idle";
        case RunState::Running:
            return "running";
        case RunState::Draining:
            return "draining";
        case RunState::Exhausted:
            return "exhausted";
        case RunState::Aborted:
            return "aborted";
    }
    return "unknown";
}

Crawler::Crawler(CrawlerConfig config, ClientFactory client_factory)
    : config_(std::move(config)),
      client_factory_(std::move(client_factory)),
      frontier_(config_.frontier),
      politeness_(robots_agent(config_.user_agents), config_.min_host_interval,
                  config_.respect_robots),
      extractor_(config_.rules),
      canonicalizer_(config_.rules.fingerprint),
      identity_(make_identity(config_.user_agents)) {
    if (config_.threads < 1)
        config_.threads = 1;
    if (config_.workers < 1)
        config_.workers = 1;
}

void Crawler::add_source(std::shared_ptr<Sources::SourceProvider> source) {
    if (!source)
        return;
    if (state_ != RunState::Idle)
        throw std::logic_error("Sources must be added before the crawler runs");
    if (!sources_.emplace(source->tag(), source).second)
        throw std::logic_error("Duplicate source tag: " + source->tag());
}

RunState Crawler::state() const {
    return state_.load();
}

void Crawler::cancel() {
    if (stop_.exchange(true))
        return;
    RunState expected = RunState::Running;
    state_.compare_exchange_strong(expected, RunState::Draining);
    Logger::info("Crawler: Cancellation requested, draining in-flight work...");
}

void Crawler::enqueue(Traversal::FrontierItem item) {
    std::string target = item.target;
    auto        result = frontier_.enqueue(std::move(item));
    if (result == Traversal::EnqueueResult::Accepted || result == Traversal::EnqueueResult::Visited)
        return;
    dropped_++;
    Logger::debug("Not queued (" + std::string(Traversal::to_string(result)) + "): " + target);
}

void Crawler::enqueue_seeds() {
    for (const auto& [tag, source] : sources_) {
        auto seeds = source->seeds();
        Logger::info("Source " + tag + ": " + std::to_string(seeds.size()) + " seed(s)");
        for (auto& seed : seeds)
            enqueue(std::move(seed));
    }
}

RunResult Crawler::run() {
    RunState expected = RunState::Idle;
    if (!state_.compare_exchange_strong(expected, RunState::Running))
        throw std::logic_error("Crawler has already been run");

    enqueue_seeds();
    if (frontier_.empty()) {
        Logger::warn("Crawler: Nothing to crawl");
        state_ = stop_ ? RunState::Aborted : RunState::Exhausted;
        return collect_result();
    }

    init_io_services();
    init_signals();
    spawn_workers();
    Logger::info("Crawler: Workers spawned, awaiting completion...");
    await_completion();
    shutdown();

    state_ = stop_ ? RunState::Aborted : RunState::Exhausted;
    return collect_result();
}

RunResult Crawler::collect_result() const {
    RunResult result;
    result.state            = state_.load();
    result.entities         = store_.entities();
    result.stats.processed  = processed_.load();
    result.stats.blocked    = blocked_.load();
    result.stats.failed     = failed_.load();
    result.stats.disallowed = disallowed_.load();
    result.stats.dropped    = dropped_.load();
    result.stats.requests   = requests_.load();
    result.stats.entities   = result.entities.size();
    return result;
}

std::unique_ptr<HttpClient> Crawler::create_client() {
    std::unique_ptr<HttpClient> client =
        client_factory_ ? client_factory_(ioc_) : std::make_unique<BeastClient>(ioc_);
    if (!client)
        throw std::runtime_error("Client factory returned no client");
    client->set_connect_timeout(config_.connect_timeout);
    client->set_request_timeout(config_.request_timeout);
    return client;
}

}  // namespace Engine
}  // namespace Spoor
