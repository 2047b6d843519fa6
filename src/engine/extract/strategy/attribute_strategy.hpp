#pragma once
#include "extraction_strategy.hpp"

namespace Spoor {
namespace Engine {
namespace Extract {

// Every attribute of every element whose value names the fingerprint.
// Values found on <meta> elements are reported as MetaTag.
class AttributeStrategy : public ExtractionStrategy {
public:
    using ExtractionStrategy::ExtractionStrategy;

    const char* name() const override {
        return "attributes";
    }
    CandidateSet extract(const Document& document) const override;
};

}  // namespace Extract
}  // namespace Engine
}  // namespace Spoor
