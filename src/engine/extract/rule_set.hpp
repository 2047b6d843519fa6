#pragma once
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include "../canonical/fingerprint.hpp"

namespace Spoor {
namespace Engine {
namespace Extract {

struct RuleSet {
    Canonical::Fingerprint   fingerprint;
    std::vector<std::string> body_patterns;  // In addition to the built-in identifier pattern
};

// Compiled form of a RuleSet, shared read-only by all strategies.
class PatternSet {
public:
    explicit PatternSet(const RuleSet& rules);

    std::vector<std::string> find_all(const std::string& text) const;
    std::vector<std::string> find_fallback(const std::string& text) const;
    bool                     mentions_fingerprint(std::string_view text) const;

    const std::string& suffix() const {
        return suffix_;
    }

private:
    std::string             suffix_;
    std::vector<std::regex> patterns_;
    std::regex              fallback_;
};

std::string escape_regex(const std::string& literal);

}  // namespace Extract
}  // namespace Engine
}  // namespace Spoor
