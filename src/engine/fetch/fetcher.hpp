#pragma once
#include <atomic>
#include <utility>
#include <boost/asio.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "../../core/types/constants.hpp"
#include "../../network/http/http_client.hpp"
#include "../../network/identity/request_identity.hpp"
#include "fetch_outcome.hpp"

namespace Spoor {
namespace Engine {
namespace Fetch {

struct BackoffPolicy {
    std::chrono::milliseconds base{Spoor::Core::Constants::BACKOFF_BASE_MS};
    double                    jitter = Spoor::Core::Constants::BACKOFF_JITTER;

    // base * 2^attempt, plus up to `jitter` of that again.
    std::chrono::milliseconds exponential(int attempt) const;
    // base * (attempt + 1)
    std::chrono::milliseconds linear(int attempt) const;
    std::chrono::milliseconds delay_for(FetchStatus status, int attempt) const;
};

FetchOutcome classify(const Response& response);

class Fetcher {
public:
    Fetcher(Network::Http::HttpClient&                          client,
            std::shared_ptr<Network::Identity::RequestIdentity> identity,
            BackoffPolicy                                       backoff,
            const std::atomic<bool>*                            stop_flag       = nullptr,
            std::atomic<std::uint64_t>*                         request_counter = nullptr);

    boost::asio::awaitable<FetchOutcome>
    fetch(const std::string& uri, int attempt_budget = Spoor::Core::Constants::MAX_RETRIES);

    std::uint64_t requests_issued() const {
        return requests_issued_;
    }

private:
    Network::Http::HttpClient&                          client_;
    std::shared_ptr<Network::Identity::RequestIdentity> identity_;
    BackoffPolicy                                       backoff_;
    const std::atomic<bool>*                            stop_flag_;
    std::atomic<std::uint64_t>*                         request_counter_;
    std::uint64_t                                       requests_issued_ = 0;

    bool stop_requested() const {
        return stop_flag_ && stop_flag_->load();
    }
};

}  // namespace Fetch
}  // namespace Engine
}  // namespace Spoor
