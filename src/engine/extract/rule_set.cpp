#include "rule_set.hpp"
#include <stdexcept>
#include "../../utils/text/string_utils.hpp"

namespace Spoor {
namespace Engine {
namespace Extract {

using namespace Spoor::Utils::Text;

namespace {

constexpr auto REGEX_FLAGS = std::regex::ECMAScript | std::regex::icase | std::regex::optimize;

void collect(const std::regex& pattern, const std::string& text, std::vector<std::string>& out) {
    for (auto it = std::sregex_iterator(text.begin(), text.end(), pattern);
         it != std::sregex_iterator();
         ++it) {
        if (it->length(0) > 0)
            out.push_back(it->str(0));
    }
}

}  // namespace

std::string escape_regex(const std::string& literal) {
    static const std::string special = R"(\^$.|?*+()[]{})";
    std::string              out;
    out.reserve(literal.size() * 2);
    for (char c : literal) {
        if (special.find(c) != std::string::npos)
            out += '\\';
        out += c;
    }
    return out;
}

PatternSet::PatternSet(const RuleSet& rules) : suffix_(to_lower(trim(rules.fingerprint.suffix))) {
    while (!suffix_.empty() && suffix_.front() == '.')
        suffix_.erase(0, 1);
    if (suffix_.empty())
        throw std::runtime_error("Fingerprint suffix must not be empty");

    std::string escaped  = escape_regex(suffix_);
    std::string boundary = R"((?![a-z0-9-]|\.[a-z0-9]))";

    patterns_.emplace_back(R"([a-z0-9][a-z0-9-]*\.)" + escaped + boundary, REGEX_FLAGS);
    for (const auto& extra : rules.body_patterns) {
        try {
            patterns_.emplace_back(extra, REGEX_FLAGS);
        } catch (const std::regex_error& e) {
            throw std::runtime_error("Invalid body pattern '" + extra + "': " + e.what());
        }
    }
    fallback_ = std::regex(R"([^\s"'<>()\[\]{},;|\\]*)" + escaped, REGEX_FLAGS);
}

std::vector<std::string> PatternSet::find_all(const std::string& text) const {
    std::vector<std::string> out;
    for (const auto& pattern : patterns_)
        collect(pattern, text, out);
    return out;
}

std::vector<std::string> PatternSet::find_fallback(const std::string& text) const {
    std::vector<std::string> out;
    collect(fallback_, text, out);
    return out;
}

bool PatternSet::mentions_fingerprint(std::string_view text) const {
    return icontains(text, suffix_);
}

}  // namespace Extract
}  // namespace Engine
}  // namespace Spoor
