#include "frontier.hpp"
#include <algorithm>
#include "../../core/logger/logger.hpp"

namespace Spoor {
namespace Engine {
namespace Traversal {

using namespace Spoor::Core;

namespace {

std::string describe(const std::string& query_key) {
    std::string label = query_key;
    std::replace(label.begin(), label.end(), '\x1f', '/');
    return label;
}

}  // namespace

const char* to_string(EnqueueResult result) {
    switch (result) {
        case EnqueueResult::Accepted:
            return "accepted";
        case EnqueueResult::Visited:
            return "visited";
        case EnqueueResult::TooDeep:
            return "too-deep";
        case EnqueueResult::PageLimit:
            return "page-limit";
        case EnqueueResult::QueryStopped:
            return "query-stopped";
        case EnqueueResult::QueryBudget:
            return "query-budget";
        case EnqueueResult::Overflow:
            return "overflow";
    }
    return "unknown";
}

Frontier::Frontier(FrontierPolicy policy) : policy_(policy) {
}

EnqueueResult Frontier::enqueue(FrontierItem item) {
    if (item.depth > policy_.max_depth)
        return EnqueueResult::TooDeep;
    if (item.page_index > policy_.max_pages_per_query)
        return EnqueueResult::PageLimit;

    std::string key          = item.query_key();
    std::string visited_key  = item.target + '\x1f' + item.source_tag;
    auto        query_budget = static_cast<unsigned long long>(policy_.max_depth)
                        * static_cast<unsigned long long>(policy_.max_pages_per_query);

    std::lock_guard<std::mutex> lock(mutex_);
    QueryState&                 state = queries_[key];
    if (state.stopped)
        return EnqueueResult::QueryStopped;
    if (visited_.count(visited_key))
        return EnqueueResult::Visited;
    if (state.dequeued + state.pending.size() >= query_budget)
        return EnqueueResult::QueryBudget;
    if (pending_ >= policy_.max_items) {
        Logger::warn("Frontier full (" + std::to_string(policy_.max_items)
                     + " items), dropping: " + item.target);
        return EnqueueResult::Overflow;
    }

    visited_.insert(std::move(visited_key));
    state.pending.push_back(std::move(item));
    ++pending_;
    if (!state.scheduled) {
        state.scheduled = true;
        rotation_.push_back(key);
    }
    return EnqueueResult::Accepted;
}

std::optional<FrontierItem> Frontier::dequeue() {
    std::lock_guard<std::mutex> lock(mutex_);
    while (!rotation_.empty()) {
        std::string key = std::move(rotation_.front());
        rotation_.pop_front();

        QueryState& state = queries_[key];
        if (state.pending.empty()) {
            state.scheduled = false;
            continue;
        }

        FrontierItem item = std::move(state.pending.front());
        state.pending.pop_front();
        --pending_;
        ++state.dequeued;

        if (state.pending.empty())
            state.scheduled = false;
        else
            rotation_.push_back(std::move(key));
        return item;
    }
    return std::nullopt;
}

void Frontier::stop_query(const std::string& query_key, QueryState& state) {
    state.stopped = true;
    pending_ -= state.pending.size();
    state.pending.clear();
    if (state.scheduled) {
        rotation_.erase(std::remove(rotation_.begin(), rotation_.end(), query_key), rotation_.end());
        state.scheduled = false;
    }
}

bool Frontier::record_page(const std::string& query_key, size_t new_entities) {
    std::lock_guard<std::mutex> lock(mutex_);
    QueryState&                 state = queries_[query_key];
    if (state.stopped)
        return false;

    state.empty_pages = new_entities > 0 ? 0 : state.empty_pages + 1;
    if (policy_.empty_page_limit > 0 && state.empty_pages >= policy_.empty_page_limit) {
        size_t discarded = state.pending.size();
        stop_query(query_key, state);
        Logger::info("Query " + describe(query_key) + " stopped after "
                     + std::to_string(state.empty_pages) + " empty page(s), "
                     + std::to_string(discarded) + " pending discarded");
        return false;
    }
    return true;
}

bool Frontier::is_stopped(const std::string& query_key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        it = queries_.find(query_key);
    return it != queries_.end() && it->second.stopped;
}

size_t Frontier::dequeued_for(const std::string& query_key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        it = queries_.find(query_key);
    return it == queries_.end() ? 0 : it->second.dequeued;
}

unsigned Frontier::consecutive_empty_pages(const std::string& query_key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        it = queries_.find(query_key);
    return it == queries_.end() ? 0 : it->second.empty_pages;
}

size_t Frontier::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_;
}

bool Frontier::empty() const {
    return size() == 0;
}

void Frontier::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    queries_.clear();
    rotation_.clear();
    visited_.clear();
    pending_ = 0;
}

}  // namespace Traversal
}  // namespace Engine
}  // namespace Spoor
