#pragma once
#include <nlohmann/json.hpp>
#include "extraction_strategy.hpp"

namespace Spoor {
namespace Engine {
namespace Extract {

// String leaves of JSON payloads: <script type="application/json">,
// <script type="application/ld+json">, or a body that is JSON itself.
class EmbeddedDataStrategy : public ExtractionStrategy {
public:
    using ExtractionStrategy::ExtractionStrategy;

    const char* name() const override {
        return "embedded";
    }
    CandidateSet extract(const Document& document) const override;

private:
    void walk(const nlohmann::json& node, const Document& document, CandidateSet& out) const;
};

}  // namespace Extract
}  // namespace Engine
}  // namespace Spoor
