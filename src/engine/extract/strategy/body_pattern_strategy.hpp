#pragma once
#include "extraction_strategy.hpp"

namespace Spoor {
namespace Engine {
namespace Extract {

// Regex matches over the raw body, markup included.
class BodyPatternStrategy : public ExtractionStrategy {
public:
    using ExtractionStrategy::ExtractionStrategy;

    const char* name() const override {
        return "body";
    }
    CandidateSet extract(const Document& document) const override;
};

}  // namespace Extract
}  // namespace Engine
}  // namespace Spoor
