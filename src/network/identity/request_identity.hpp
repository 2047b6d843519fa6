#pragma once
#include <atomic>
#include <memory>
#include <string>
#include <vector>

namespace Spoor {
namespace Network {
namespace Identity {

// Chooses the identifying header sent with each request attempt.
class RequestIdentity {
public:
    virtual ~RequestIdentity() = default;

    virtual std::string user_agent() = 0;
};

class StaticIdentity : public RequestIdentity {
public:
    explicit StaticIdentity(std::string user_agent);

    std::string user_agent() override;

private:
    std::string user_agent_;
};

// Round-robin over a fixed list of agent strings. Safe to share between workers.
class RotatingIdentity : public RequestIdentity {
public:
    explicit RotatingIdentity(std::vector<std::string> user_agents);

    std::string user_agent() override;

private:
    std::vector<std::string> user_agents_;
    std::atomic<size_t>      next_{0};
};

std::shared_ptr<RequestIdentity> make_identity(const std::vector<std::string>& user_agents);

}  // namespace Identity
}  // namespace Network
}  // namespace Spoor
