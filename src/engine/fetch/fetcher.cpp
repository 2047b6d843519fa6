#include "fetcher.hpp"
#include <utility>
#include <boost/asio/steady_timer.hpp>
#include <algorithm>
#include <random>
#include "../../core/logger/logger.hpp"

namespace Spoor {
namespace Engine {
namespace Fetch {

using namespace Spoor::Core;
using namespace Spoor::Network::Http;

const char* to_string(FetchStatus status) {
    switch (status) {
        case FetchStatus::Success: return "Success";
        case FetchStatus::Blocked: return "Blocked";
        case FetchStatus::RateLimited: return "RateLimited";
        case FetchStatus::ClientError: return "ClientError";
        case FetchStatus::ServerError: return "ServerError";
        case FetchStatus::NetworkError: return "NetworkError";
        case FetchStatus::Timeout: return "Timeout";
    }
    return "Unknown";
}

bool is_retryable(FetchStatus status) {
    return status == FetchStatus::RateLimited || status == FetchStatus::ServerError
           || status == FetchStatus::NetworkError || status == FetchStatus::Timeout;
}

std::chrono::milliseconds BackoffPolicy::exponential(int attempt) const {
    if (attempt < 0)
        attempt = 0;
    auto delay = base * (1LL << std::min(attempt, 20));
    if (jitter <= 0.0 || delay.count() == 0)
        return delay;

    thread_local std::mt19937_64           rng{std::random_device{}()};
    std::uniform_real_distribution<double> dist(0.0, jitter);
    auto extra = static_cast<long long>(static_cast<double>(delay.count()) * dist(rng));
    return delay + std::chrono::milliseconds(extra);
}

std::chrono::milliseconds BackoffPolicy::linear(int attempt) const {
    if (attempt < 0)
        attempt = 0;
    return base * (attempt + 1);
}

std::chrono::milliseconds BackoffPolicy::delay_for(FetchStatus status, int attempt) const {
    return status == FetchStatus::RateLimited ? exponential(attempt) : linear(attempt);
}

FetchOutcome classify(const Response& response) {
    FetchOutcome outcome;
    outcome.final_uri    = response.effective_url;
    outcome.content_type = response.content_type;
    outcome.error        = response.error;

    if (response.error_type == ErrorType::Timeout) {
        outcome.status = FetchStatus::Timeout;
        return outcome;
    }
    if (response.status_code == static_cast<long>(HTTPCode::NetworkError)) {
        // A target the transport cannot even address is permanent.
        outcome.status = response.error_type == ErrorType::Other ? FetchStatus::ClientError
                                                                 : FetchStatus::NetworkError;
        return outcome;
    }

    long code         = response.status_code;
    outcome.http_code = static_cast<int>(code);

    if (code >= 200 && code < static_cast<long>(MaxCode::ClientError)) {
        outcome.status = FetchStatus::Success;
        outcome.body   = response.body;
    }
    else if (code == static_cast<long>(HTTPCode::Forbidden)) {
        outcome.status = FetchStatus::Blocked;
    }
    else if (code == static_cast<long>(HTTPCode::TooManyRequests)) {
        outcome.status = FetchStatus::RateLimited;
    }
    else if (code >= static_cast<long>(MaxCode::ServerError)) {
        outcome.status = FetchStatus::ServerError;
    }
    else {
        outcome.status = FetchStatus::ClientError;
    }
    return outcome;
}

Fetcher::Fetcher(HttpClient&                                         client,
                 std::shared_ptr<Network::Identity::RequestIdentity> identity,
                 BackoffPolicy                                       backoff,
                 const std::atomic<bool>*                            stop_flag,
                 std::atomic<std::uint64_t>*                         request_counter)
    : client_(client),
      identity_(std::move(identity)),
      backoff_(backoff),
      stop_flag_(stop_flag),
      request_counter_(request_counter) {
}

boost::asio::awaitable<FetchOutcome> Fetcher::fetch(const std::string& uri, int attempt_budget) {
    if (attempt_budget < 1)
        attempt_budget = 1;

    FetchOutcome outcome;
    for (int attempt = 0; attempt < attempt_budget; ++attempt) {
        if (identity_)
            client_.set_user_agent(identity_->user_agent());

        ++requests_issued_;
        if (request_counter_)
            request_counter_->fetch_add(1, std::memory_order_relaxed);

        Response res     = co_await client_.get(uri);
        outcome          = classify(res);
        outcome.attempts = attempt + 1;
        if (outcome.final_uri.empty())
            outcome.final_uri = uri;

        if (!is_retryable(outcome.status)) {
            if (outcome.status == FetchStatus::Blocked)
                Logger::warn("Blocked (403): " + uri);
            co_return outcome;
        }

        if (attempt + 1 == attempt_budget) {
            Logger::error("Failed: " + uri + " [" + to_string(outcome.status)
                          + "] - Max retries");
            break;
        }
        if (stop_requested())
            break;

        auto delay = backoff_.delay_for(outcome.status, attempt);
        Logger::warn("Retry " + std::to_string(attempt + 2) + "/" + std::to_string(attempt_budget)
                     + " for " + uri + " [" + to_string(outcome.status) + "] in "
                     + std::to_string(delay.count()) + "ms");

        boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);
        timer.expires_after(delay);
        co_await timer.async_wait(boost::asio::use_awaitable);
    }
    co_return outcome;
}

}  // namespace Fetch
}  // namespace Engine
}  // namespace Spoor
