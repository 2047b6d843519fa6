#include "politeness_gate.hpp"
#include <algorithm>
#include "../../core/logger/logger.hpp"

namespace Spoor {
namespace Engine {
namespace Politeness {

using namespace Spoor::Core;
using namespace Spoor::Utils;

PolitenessGate::PolitenessGate(std::string               user_agent,
                               std::chrono::milliseconds min_interval,
                               bool                      respect_robots)
    : user_agent_(std::move(user_agent)),
      min_interval_(min_interval),
      respect_robots_(respect_robots) {
}

HostPolicy& PolitenessGate::entry(const std::string& host) {
    auto it = hosts_.find(host);
    if (it == hosts_.end()) {
        HostPolicy policy;
        policy.host = host;
        it          = hosts_.emplace(host, std::move(policy)).first;
    }
    return it->second;
}

std::chrono::milliseconds PolitenessGate::remaining_wait(const HostPolicy& policy,
                                                         Clock::time_point now) const {
    if (!policy.last_request_at)
        return std::chrono::milliseconds(0);

    auto interval = std::max(min_interval_, policy.crawl_delay);
    auto elapsed =
        std::chrono::duration_cast<std::chrono::milliseconds>(now - *policy.last_request_at);
    if (elapsed >= interval)
        return std::chrono::milliseconds(0);
    return interval - elapsed;
}

void PolitenessGate::store_robots(const std::string& host, std::shared_ptr<const RobotsTxt> robots) {
    auto delay = std::chrono::milliseconds(
        static_cast<long long>(robots->get_crawl_delay(user_agent_) * 1000));

    std::lock_guard<std::mutex> lock(mutex_);
    HostPolicy&                 policy = entry(host);
    if (!policy.robots) {
        policy.robots      = std::move(robots);
        policy.crawl_delay = delay;
    }
}

boost::asio::awaitable<std::shared_ptr<const RobotsTxt>>
PolitenessGate::fetch_robots(const UrlParsed& parsed, Network::Http::HttpClient& client) {
    std::string robots_url = Url::origin(parsed) + "/robots.txt";
    Logger::debug("Fetching robots.txt: " + robots_url);

    client.set_user_agent(user_agent_);
    Response res = co_await client.get(robots_url);

    if (res.status_code >= 200 && res.status_code < 300) {
        co_return std::make_shared<const RobotsTxt>(RobotsTxt::parse(res.body));
    }

    std::string reason = res.status_code ? "HTTP " + std::to_string(res.status_code) : res.error;
    Logger::warn("robots.txt unavailable for " + parsed.host + " (" + reason + "), allowing");
    co_return std::make_shared<const RobotsTxt>(RobotsTxt::allow_all());
}

boost::asio::awaitable<Authorization>
PolitenessGate::authorize(const std::string& uri, Network::Http::HttpClient& client) {
    auto parsed = Url::parse(uri);
    if (parsed.host.empty())
        co_return Authorization{};

    std::string host = Url::host_key(uri);

    if (respect_robots_ && parsed.path != "/robots.txt") {
        if (!has_robots(uri)) {
            auto robots = co_await fetch_robots(parsed, client);
            store_robots(host, std::move(robots));
        }

        std::shared_ptr<const RobotsTxt> robots;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            robots = entry(host).robots;
        }

        std::string path = parsed.path.empty() ? "/" : parsed.path;
        if (!parsed.query.empty())
            path += "?" + parsed.query;
        if (robots && !robots->is_allowed(user_agent_, path)) {
            Logger::info("Blocked by robots.txt: " + uri);
            co_return Authorization{.allow = false, .wait = std::chrono::milliseconds(0)};
        }
    }

    std::chrono::milliseconds wait;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        wait = remaining_wait(entry(host), Clock::now());
    }
    co_return Authorization{.allow = true, .wait = wait};
}

std::chrono::milliseconds PolitenessGate::commit(const std::string& uri) {
    std::string host = Url::host_key(uri);
    if (host.empty())
        return std::chrono::milliseconds(0);

    std::lock_guard<std::mutex> lock(mutex_);
    HostPolicy&                 policy = entry(host);
    auto                        now    = Clock::now();
    auto                        wait   = remaining_wait(policy, now);
    if (wait.count() > 0)
        return wait;
    policy.last_request_at = now;
    return std::chrono::milliseconds(0);
}

void PolitenessGate::record_result(const std::string& uri, bool success) {
    std::string host = Url::host_key(uri);
    if (host.empty())
        return;

    std::lock_guard<std::mutex> lock(mutex_);
    HostPolicy&                 policy = entry(host);
    policy.consecutive_failures        = success ? 0 : policy.consecutive_failures + 1;
}

unsigned PolitenessGate::consecutive_failures(const std::string& uri) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        it = hosts_.find(Url::host_key(uri));
    return it == hosts_.end() ? 0 : it->second.consecutive_failures;
}

bool PolitenessGate::has_robots(const std::string& uri) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        it = hosts_.find(Url::host_key(uri));
    return it != hosts_.end() && it->second.robots != nullptr;
}

void PolitenessGate::set_robots(const std::string& uri, const RobotsTxt& robots) {
    store_robots(Url::host_key(uri), std::make_shared<const RobotsTxt>(robots));
}

size_t PolitenessGate::host_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return hosts_.size();
}

}  // namespace Politeness
}  // namespace Engine
}  // namespace Spoor
