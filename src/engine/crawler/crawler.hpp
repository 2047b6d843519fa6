#pragma once
#include <atomic>
#include <utility>
#include <boost/asio.hpp>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "../../core/types/constants.hpp"
#include "../../network/http/http_client.hpp"
#include "../../network/identity/request_identity.hpp"
#include "../../sources/source_provider.hpp"
#include "../../storage/dedup_store.hpp"
#include "../canonical/canonicalizer.hpp"
#include "../extract/extractor.hpp"
#include "../fetch/fetcher.hpp"
#include "../frontier/frontier.hpp"
#include "../politeness/politeness_gate.hpp"

namespace Spoor {
namespace Engine {

using namespace Spoor::Core;
using namespace Spoor::Network::Http;

enum class RunState { Idle, Running, Draining, Exhausted, Aborted };

const char* to_string(RunState state);

struct CrawlerConfig {
    int threads = Constants::DEFAULT_THREADS;
    int workers = Constants::DEFAULT_WORKERS;

    Traversal::FrontierPolicy frontier;
    int                       attempt_budget = Constants::MAX_RETRIES;
    Fetch::BackoffPolicy      backoff;

    std::chrono::milliseconds min_host_interval{Constants::MIN_HOST_INTERVAL_MS};
    bool                      respect_robots = true;
    std::vector<std::string>  user_agents;
    std::chrono::milliseconds connect_timeout{Constants::CONNECT_TIMEOUT_MS};
    std::chrono::milliseconds request_timeout{
        std::chrono::seconds(Constants::REQUEST_TIMEOUT_SECONDS)};

    Extract::RuleSet rules;

    // Install SIGINT/SIGTERM handlers that cancel the run.
    bool handle_signals = false;
};

struct RunStats {
    std::uint64_t processed  = 0;
    std::uint64_t blocked    = 0;
    std::uint64_t failed     = 0;
    std::uint64_t disallowed = 0;
    std::uint64_t dropped    = 0;
    std::uint64_t requests   = 0;
    std::uint64_t entities   = 0;
};

struct RunResult {
    RunState                                state = RunState::Idle;
    RunStats                                stats;
    std::vector<Canonical::CanonicalEntity> entities;
};

using ClientFactory = std::function<std::unique_ptr<HttpClient>(boost::asio::io_context&)>;

/**
 * Crawl coordinator.
 *
 * Runs `workers` coroutines over `threads` IO threads. Each worker pulls from the
 * shared frontier and takes an item through politeness, fetch, extraction and
 * canonicalization, then hands the page back to its source for follow-up links.
 * A run ends when the frontier is empty with no worker busy (Exhausted) or after
 * cancel() once in-flight items have finished (Aborted).
 */
class Crawler {
public:
    explicit Crawler(CrawlerConfig config, ClientFactory client_factory = {});
    ~Crawler();

    Crawler(const Crawler&)            = delete;
    Crawler& operator=(const Crawler&) = delete;

    // Sources must be registered before run(). Tags must be unique.
    void add_source(std::shared_ptr<Sources::SourceProvider> source);

    // Blocks until the run ends. A crawler runs once; a second call throws std::logic_error.
    RunResult run();

    // Cooperative stop: no new dequeues, in-flight fetches complete. Thread-safe.
    void cancel();

    RunState                   state() const;
    const Storage::DedupStore& store() const {
        return store_;
    }

private:
    CrawlerConfig config_;
    ClientFactory client_factory_;

    Traversal::Frontier                         frontier_;
    Politeness::PolitenessGate                  politeness_;
    Extract::Extractor                          extractor_;
    Canonical::Canonicalizer                    canonicalizer_;
    Storage::DedupStore                         store_;
    std::shared_ptr<Network::Identity::RequestIdentity> identity_;

    std::map<std::string, std::shared_ptr<Sources::SourceProvider>> sources_;

    boost::asio::io_context ioc_;
    std::unique_ptr<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
                             work_guard_;
    std::vector<std::thread> io_threads_;
    boost::asio::signal_set  signals_{ioc_};

    std::mutex queue_mutex_;

    std::atomic<RunState>   state_{RunState::Idle};
    std::atomic<bool>       stop_{false};
    std::atomic<int>        active_workers_{0};
    std::atomic<int>        live_workers_{0};
    std::atomic<bool>       done_{false};
    std::condition_variable done_cv_;
    std::mutex              done_mutex_;
    std::atomic<bool>       is_shutdown_{false};

    std::atomic<std::uint64_t> processed_{0};
    std::atomic<std::uint64_t> blocked_{0};
    std::atomic<std::uint64_t> failed_{0};
    std::atomic<std::uint64_t> disallowed_{0};
    std::atomic<std::uint64_t> dropped_{0};
    std::atomic<std::uint64_t> requests_{0};

    void init_io_services();
    void init_signals();
    void spawn_workers();
    void await_completion();
    void trigger_done();
    void shutdown();
    void enqueue_seeds();
    void enqueue(Traversal::FrontierItem item);

    std::unique_ptr<HttpClient>            create_client();
    std::optional<Traversal::FrontierItem> fetch_next_task();
    bool                                   should_stop_worker();
    void                                   worker_exited();
    RunResult                              collect_result() const;

    boost::asio::awaitable<void> worker_loop();
    boost::asio::awaitable<void> process_item(HttpClient&             client,
                                              Fetch::Fetcher&         fetcher,
                                              Traversal::FrontierItem item);
    boost::asio::awaitable<bool> wait_for_politeness(HttpClient&                    client,
                                                     const Traversal::FrontierItem& item);
    void handle_page(const Traversal::FrontierItem& item, const Fetch::FetchOutcome& outcome);
};

}  // namespace Engine
}  // namespace Spoor
