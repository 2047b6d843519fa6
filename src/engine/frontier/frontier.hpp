#pragma once
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>

#include "../../core/types/constants.hpp"
#include "frontier_item.hpp"

namespace Spoor {
namespace Engine {
namespace Traversal {

struct FrontierPolicy {
    unsigned max_depth           = Spoor::Core::Constants::DEFAULT_MAX_DEPTH;
    unsigned max_pages_per_query = Spoor::Core::Constants::DEFAULT_MAX_PAGES;
    unsigned empty_page_limit    = Spoor::Core::Constants::DEFAULT_EMPTY_PAGE_LIMIT;  // 0 disables
    size_t   max_items           = Spoor::Core::Constants::DEFAULT_MAX_FRONTIER_ITEMS;
};

enum class EnqueueResult { Accepted, Visited, TooDeep, PageLimit, QueryStopped, QueryBudget, Overflow };

const char* to_string(EnqueueResult result);

/**
 * Pending fetch tasks, FIFO within a query and round-robin across queries.
 *
 * Owns the per-run visited set of (target, source_tag) pairs, so an accepted
 * pair is never handed out twice. A single query never takes more than
 * max_depth * max_pages_per_query items over the run.
 */
class Frontier {
public:
    explicit Frontier(FrontierPolicy policy = {});

    EnqueueResult               enqueue(FrontierItem item);
    std::optional<FrontierItem> dequeue();

    // Records a processed page of a query. Returns false once the query is stopped
    // by the consecutive-empty-page limit; its pending items are discarded.
    bool record_page(const std::string& query_key, size_t new_entities);

    bool     is_stopped(const std::string& query_key) const;
    size_t   dequeued_for(const std::string& query_key) const;
    unsigned consecutive_empty_pages(const std::string& query_key) const;

    size_t size() const;
    bool   empty() const;
    void   clear();

    const FrontierPolicy& policy() const {
        return policy_;
    }

private:
    struct QueryState {
        std::deque<FrontierItem> pending;
        size_t                   dequeued    = 0;
        unsigned                 empty_pages = 0;
        bool                     stopped     = false;
        bool                     scheduled   = false;  // Present in rotation_
    };

    FrontierPolicy policy_;

    mutable std::mutex                          mutex_;
    std::unordered_map<std::string, QueryState> queries_;
    std::deque<std::string>                     rotation_;
    std::unordered_set<std::string>             visited_;
    size_t                                      pending_ = 0;

    void stop_query(const std::string& query_key, QueryState& state);
};

}  // namespace Traversal
}  // namespace Engine
}  // namespace Spoor
