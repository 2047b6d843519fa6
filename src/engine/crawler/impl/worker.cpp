#include <algorithm>
#include <utility>
#include <boost/asio/steady_timer.hpp>
#include "../../../core/logger/logger.hpp"
#include "../crawler.hpp"

namespace Spoor {
namespace Engine {

using namespace Spoor::Engine::Traversal;

namespace {
constexpr int WORKER_POLL_INTERVAL_MS = 50;
constexpr int MAX_POLITENESS_SLICE_MS = 250;  // Stop flag is re-checked between slices
}  // namespace

std::optional<FrontierItem> Crawler::fetch_next_task() {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    auto                        item = frontier_.dequeue();
    if (item)
        active_workers_++;
    return item;
}

bool Crawler::should_stop_worker() {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return stop_ || (active_workers_ == 0 && frontier_.empty());
}

struct WorkerGuard {
    std::atomic<int>& count;
    explicit WorkerGuard(std::atomic<int>& c) : count(c) {
    }
    ~WorkerGuard() {
        count--;
    }
};

boost::asio::awaitable<void> Crawler::worker_loop() {
    try {
        auto                      client = create_client();
        Fetch::Fetcher            fetcher(*client, identity_, config_.backoff, &stop_, &requests_);
        boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);

        while (!stop_) {
            auto item = fetch_next_task();

            if (!item) {
                if (should_stop_worker())
                    break;
                timer.expires_after(std::chrono::milliseconds(WORKER_POLL_INTERVAL_MS));
                boost::system::error_code ec;
                co_await timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
                continue;
            }

            WorkerGuard guard(active_workers_);
            std::string target = item->target;
            try {
                co_await process_item(*client, fetcher, std::move(*item));
            } catch (const std::exception& e) {
                failed_++;
                Logger::error("Worker exception on " + target + ": " + e.what());
            }
        }
    } catch (const std::exception& e) {
        Logger::error("Worker Loop Exception: " + std::string(e.what()));
    }
    worker_exited();
}

boost::asio::awaitable<bool> Crawler::wait_for_politeness(HttpClient& client, const FrontierItem& item) {
    auto auth = co_await politeness_.authorize(item.target, client);
    if (!auth.allow) {
        disallowed_++;
        co_return false;
    }

    boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);
    auto                      wait = auth.wait;
    while (true) {
        if (stop_)
            co_return false;
        if (wait.count() <= 0) {
            wait = politeness_.commit(item.target);
            if (wait.count() <= 0)
                co_return true;
        }
        auto slice = std::min(wait, std::chrono::milliseconds(MAX_POLITENESS_SLICE_MS));
        timer.expires_after(slice);
        co_await timer.async_wait(boost::asio::use_awaitable);
        wait -= slice;
    }
}

boost::asio::awaitable<void>
Crawler::process_item(HttpClient& client, Fetch::Fetcher& fetcher, FrontierItem item) {
    if (!co_await wait_for_politeness(client, item)) {
        if (stop_)
            dropped_++;
        co_return;
    }

    Logger::info("Fetching: " + item.target + " (Depth " + std::to_string(item.depth) + ", Page "
                 + std::to_string(item.page_index) + ")");
    auto outcome = co_await fetcher.fetch(item.target, config_.attempt_budget);
    politeness_.record_result(item.target, outcome.ok());
    processed_++;

    switch (outcome.status) {
        case Fetch::FetchStatus::Success:
            handle_page(item, outcome);
            break;
        case Fetch::FetchStatus::Blocked:
            blocked_++;
            break;
        case Fetch::FetchStatus::ClientError:
            failed_++;
            Logger::warn("HTTP " + std::to_string(outcome.http_code.value_or(0)) + ": " + item.target);
            break;
        default:
            failed_++;
            break;
    }
}

void Crawler::handle_page(const FrontierItem& item, const Fetch::FetchOutcome& outcome) {
    auto document   = Extract::Document::from_outcome(outcome, item.target);
    auto candidates = extractor_.extract(document);

    size_t fresh = 0;
    for (const auto& candidate : candidates) {
        auto entity = canonicalizer_.canonicalize(candidate);
        if (!entity) {
            Logger::debug("Rejected candidate: " + candidate.raw_text);
            continue;
        }
        if (store_.insert(*entity)) {
            ++fresh;
            Logger::success("Discovered: " + entity->uri + " ["
                            + Extract::to_string(candidate.origin_field) + "]");
        }
    }

    // Pagination is only requested once the page is recorded, so a page that
    // stops its query never schedules a successor.
    if (!frontier_.record_page(item.query_key(), fresh) || stop_)
        return;

    auto source = sources_.find(item.source_tag);
    if (source == sources_.end())
        return;
    for (auto& next : source->second->next_links_from(document, item))
        enqueue(std::move(next));
}

}  // namespace Engine
}  // namespace Spoor
