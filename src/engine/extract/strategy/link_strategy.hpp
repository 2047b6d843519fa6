#pragma once
#include "extraction_strategy.hpp"

namespace Spoor {
namespace Engine {
namespace Extract {

// Anchor hrefs (resolved against the page) and visible anchor text.
class LinkStrategy : public ExtractionStrategy {
public:
    using ExtractionStrategy::ExtractionStrategy;

    const char* name() const override {
        return "links";
    }
    CandidateSet extract(const Document& document) const override;
};

}  // namespace Extract
}  // namespace Engine
}  // namespace Spoor
