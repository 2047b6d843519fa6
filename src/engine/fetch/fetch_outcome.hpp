#pragma once
#include <optional>
#include <string>

namespace Spoor {
namespace Engine {
namespace Fetch {

enum class FetchStatus {
    Success,
    Blocked,
    RateLimited,
    ClientError,
    ServerError,
    NetworkError,
    Timeout
};

struct FetchOutcome {
    FetchStatus                status = FetchStatus::NetworkError;
    std::optional<int>         http_code;
    std::optional<std::string> body;
    std::string                final_uri;
    std::string                content_type;
    std::string                error;
    int                        attempts = 0;

    bool ok() const {
        return status == FetchStatus::Success;
    }
};

const char* to_string(FetchStatus status);

// RateLimited, ServerError, NetworkError and Timeout are transient.
bool is_retryable(FetchStatus status);

}  // namespace Fetch
}  // namespace Engine
}  // namespace Spoor
