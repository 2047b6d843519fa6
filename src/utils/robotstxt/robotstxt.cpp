/**
 * WRAPPER AROUND GOOGLE ROBOTSTXT PARSER (https://github.com/google/robotstxt)
 */
#include "robotstxt.hpp"
#include <optional>
#include <cstdlib>
#include <vector>
#include "absl/strings/match.h"
#include "robots.h"

namespace Spoor {
namespace Utils {

RobotsTxt RobotsTxt::parse(const std::string& content) {
    RobotsTxt robots;
    robots.content_ = content;
    return robots;
}

RobotsTxt RobotsTxt::allow_all() {
    return RobotsTxt();
}

bool RobotsTxt::is_allowed(const std::string& user_agent, const std::string& path) const {
    if (content_.empty())
        return true;
    googlebot::RobotsMatcher matcher;
    // The matcher wants the product token only ("Spoor", not "Spoor/0.1 (...)").
    std::string token = user_agent.substr(0, user_agent.find_first_of("/ "));
    std::vector<std::string> user_agents{token};
    return matcher.AllowedByRobots(content_, &user_agents, path);
}

namespace {
class CrawlDelayMatcher : public googlebot::RobotsMatcher {
public:
    explicit CrawlDelayMatcher(const std::vector<std::string>& user_agents) {
        InitUserAgentsAndPath(&user_agents, "/");
    }

    double GetDelay(const std::string& content) {
        googlebot::ParseRobotsTxt(content, this);
        if (specific_delay_)
            return *specific_delay_;
        if (global_delay_)
            return *global_delay_;
        return 0.0;
    }

protected:
    void
    HandleUnknownAction(int line_num, absl::string_view action, absl::string_view value) override {
        if (absl::EqualsIgnoreCase(action, "Crawl-delay")) {
            std::string text(value);
            char*       end   = nullptr;
            double      delay = std::strtod(text.c_str(), &end);
            if (end != text.c_str() && delay >= 0.0) {
                if (seen_specific_agent_)
                    specific_delay_ = delay;
                else if (seen_global_agent_)
                    global_delay_ = delay;
            }
        }
        googlebot::RobotsMatcher::HandleUnknownAction(line_num, action, value);
    }

private:
    std::optional<double> global_delay_;
    std::optional<double> specific_delay_;
};
}  // namespace

double RobotsTxt::get_crawl_delay(const std::string& user_agent) const {
    if (content_.empty())
        return 0.0;
    std::vector<std::string> ua_list{user_agent.substr(0, user_agent.find_first_of("/ "))};
    CrawlDelayMatcher        matcher(ua_list);
    return matcher.GetDelay(content_);
}

}  // namespace Utils
}  // namespace Spoor
