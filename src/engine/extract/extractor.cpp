#include "extractor.hpp"
#include "../../core/logger/logger.hpp"
#include "strategy/attribute_strategy.hpp"
#include "strategy/body_pattern_strategy.hpp"
#include "strategy/embedded_data_strategy.hpp"
#include "strategy/link_strategy.hpp"

namespace Spoor {
namespace Engine {
namespace Extract {

using namespace Spoor::Core;

Extractor::Extractor(const RuleSet& rules) : patterns_(std::make_shared<const PatternSet>(rules)) {
    strategies_.push_back(std::make_unique<BodyPatternStrategy>(patterns_));
    strategies_.push_back(std::make_unique<LinkStrategy>(patterns_));
    strategies_.push_back(std::make_unique<AttributeStrategy>(patterns_));
    strategies_.push_back(std::make_unique<EmbeddedDataStrategy>(patterns_));
}

Extractor::Extractor(const RuleSet& rules, std::vector<std::unique_ptr<ExtractionStrategy>> strategies)
    : patterns_(std::make_shared<const PatternSet>(rules)), strategies_(std::move(strategies)) {
}

void Extractor::add_strategy(std::unique_ptr<ExtractionStrategy> strategy) {
    if (strategy)
        strategies_.push_back(std::move(strategy));
}

CandidateSet Extractor::extract(const Document& document) const {
    CandidateSet result;
    if (document.body().empty())
        return result;

    for (const auto& strategy : strategies_) {
        try {
            auto found = strategy->extract(document);
            result.insert(found.begin(), found.end());
        } catch (const std::exception& e) {
            Logger::warn("Extraction strategy '" + std::string(strategy->name()) + "' failed on "
                         + document.uri() + ": " + e.what());
        }
    }

    if (result.empty() && patterns_->mentions_fingerprint(document.body())) {
        Logger::debug("Structured extraction empty, using fallback pattern on " + document.uri());
        for (auto& match : patterns_->find_fallback(document.body()))
            result.insert(CandidateMatch{std::move(match), OriginField::Body, document.uri()});
    }
    return result;
}

CandidateSet Extractor::extract(const Fetch::FetchOutcome& outcome,
                                const std::string&         requested_uri) const {
    if (!outcome.ok() || !outcome.body)
        return {};
    return extract(Document::from_outcome(outcome, requested_uri));
}

}  // namespace Extract
}  // namespace Engine
}  // namespace Spoor
