#include "request_identity.hpp"
#include "../../core/types/constants.hpp"

namespace Spoor {
namespace Network {
namespace Identity {

StaticIdentity::StaticIdentity(std::string user_agent) : user_agent_(std::move(user_agent)) {
}

std::string StaticIdentity::user_agent() {
    return user_agent_;
}

RotatingIdentity::RotatingIdentity(std::vector<std::string> user_agents)
    : user_agents_(std::move(user_agents)) {
    if (user_agents_.empty())
        user_agents_.push_back(Spoor::Core::Constants::USER_AGENT);
}

std::string RotatingIdentity::user_agent() {
    size_t idx = next_.fetch_add(1, std::memory_order_relaxed);
    return user_agents_[idx % user_agents_.size()];
}

std::shared_ptr<RequestIdentity> make_identity(const std::vector<std::string>& user_agents) {
    if (user_agents.empty())
        return std::make_shared<StaticIdentity>(Spoor::Core::Constants::USER_AGENT);
    if (user_agents.size() == 1)
        return std::make_shared<StaticIdentity>(user_agents.front());
    return std::make_shared<RotatingIdentity>(user_agents);
}

}  // namespace Identity
}  // namespace Network
}  // namespace Spoor
