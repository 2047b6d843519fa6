/**
 * WRAPPER AROUND GOOGLE ROBOTSTXT PARSER (https://github.com/google/robotstxt)
 */
#pragma once

#include <string>

namespace Spoor {
namespace Utils {

// An empty (default constructed) instance allows everything.
class RobotsTxt {
public:
    RobotsTxt() = default;

    static RobotsTxt parse(const std::string& content);
    static RobotsTxt allow_all();

    bool   is_allowed(const std::string& user_agent, const std::string& path) const;
    double get_crawl_delay(const std::string& user_agent) const;
    bool   empty() const {
        return content_.empty();
    }

private:
    std::string content_;
};

}  // namespace Utils
}  // namespace Spoor
