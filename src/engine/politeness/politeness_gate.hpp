#pragma once
#include <utility>
#include <boost/asio.hpp>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "../../network/http/http_client.hpp"
#include "../../utils/robotstxt/robotstxt.hpp"
#include "../../utils/url/url.hpp"

namespace Spoor {
namespace Engine {
namespace Politeness {

using Clock = std::chrono::steady_clock;

// Per-host cache entry. Created lazily on first contact, never shared across hosts.
struct HostPolicy {
    std::string                                  host;
    std::shared_ptr<const Spoor::Utils::RobotsTxt> robots;
    std::chrono::milliseconds                    crawl_delay{0};
    std::optional<Clock::time_point>             last_request_at;
    unsigned                                     consecutive_failures = 0;
};

struct Authorization {
    bool                      allow = true;
    std::chrono::milliseconds wait{0};
};

/**
 * Robots compliance and per-host spacing.
 *
 * Two-phase: authorize() says whether and how long to wait; commit() charges
 * the host only once the caller actually proceeds with the fetch.
 */
class PolitenessGate {
public:
    PolitenessGate(std::string user_agent, std::chrono::milliseconds min_interval,
                   bool respect_robots = true);

    boost::asio::awaitable<Authorization> authorize(const std::string&          uri,
                                                    Network::Http::HttpClient& client);

    // Returns zero and records the request if the host interval has elapsed,
    // otherwise the remaining wait (nothing recorded).
    std::chrono::milliseconds commit(const std::string& uri);

    void     record_result(const std::string& uri, bool success);
    unsigned consecutive_failures(const std::string& uri) const;
    bool     has_robots(const std::string& uri) const;
    void     set_robots(const std::string& uri, const Spoor::Utils::RobotsTxt& robots);
    size_t   host_count() const;

private:
    std::string               user_agent_;
    std::chrono::milliseconds min_interval_;
    bool                      respect_robots_;

    mutable std::mutex                mutex_;
    std::map<std::string, HostPolicy> hosts_;

    HostPolicy&               entry(const std::string& host);
    std::chrono::milliseconds remaining_wait(const HostPolicy& policy, Clock::time_point now) const;
    void store_robots(const std::string& host, std::shared_ptr<const Spoor::Utils::RobotsTxt> robots);

    boost::asio::awaitable<std::shared_ptr<const Spoor::Utils::RobotsTxt>>
    fetch_robots(const Spoor::Utils::UrlParsed& parsed, Network::Http::HttpClient& client);
};

}  // namespace Politeness
}  // namespace Engine
}  // namespace Spoor
