#pragma once
#include <memory>
#include <string>
#include <vector>

#include "../fetch/fetch_outcome.hpp"
#include "candidate.hpp"
#include "document.hpp"
#include "rule_set.hpp"
#include "strategy/extraction_strategy.hpp"

namespace Spoor {
namespace Engine {
namespace Extract {

/**
 * Runs every registered strategy over a document and unions the results.
 *
 * All strategies run even when an earlier one already matched. If the union is
 * empty but the body still contains the fingerprint, a permissive pattern is
 * applied to the raw body as a last resort.
 */
class Extractor {
public:
    // Registers the body, link, attribute and embedded-data strategies.
    explicit Extractor(const RuleSet& rules);
    Extractor(const RuleSet& rules, std::vector<std::unique_ptr<ExtractionStrategy>> strategies);

    void add_strategy(std::unique_ptr<ExtractionStrategy> strategy);

    CandidateSet extract(const Document& document) const;
    CandidateSet extract(const Fetch::FetchOutcome& outcome, const std::string& requested_uri) const;

    std::shared_ptr<const PatternSet> patterns() const {
        return patterns_;
    }
    size_t strategy_count() const {
        return strategies_.size();
    }

private:
    std::shared_ptr<const PatternSet>                patterns_;
    std::vector<std::unique_ptr<ExtractionStrategy>> strategies_;
};

}  // namespace Extract
}  // namespace Engine
}  // namespace Spoor
