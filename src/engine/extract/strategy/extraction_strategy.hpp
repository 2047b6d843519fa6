#pragma once
#include <memory>

#include "../candidate.hpp"
#include "../document.hpp"
#include "../rule_set.hpp"

namespace Spoor {
namespace Engine {
namespace Extract {

// One independent way of finding fingerprint candidates in a document.
class ExtractionStrategy {
public:
    explicit ExtractionStrategy(std::shared_ptr<const PatternSet> patterns)
        : patterns_(std::move(patterns)) {
    }
    virtual ~ExtractionStrategy() = default;

    virtual const char*  name() const                         = 0;
    virtual CandidateSet extract(const Document& document) const = 0;

protected:
    std::shared_ptr<const PatternSet> patterns_;

    // Adds every pattern match inside `text`, or `text` itself when it names the
    // fingerprint but no pattern matched.
    void add_matches(const std::string& text,
                     OriginField        origin,
                     const Document&    document,
                     CandidateSet&      out) const {
        auto matches = patterns_->find_all(text);
        if (matches.empty() && patterns_->mentions_fingerprint(text)) {
            out.insert(CandidateMatch{text, origin, document.uri()});
            return;
        }
        for (auto& match : matches)
            out.insert(CandidateMatch{std::move(match), origin, document.uri()});
    }
};

}  // namespace Extract
}  // namespace Engine
}  // namespace Spoor
