#include "embedded_data_strategy.hpp"
#include "../../../core/logger/logger.hpp"

namespace Spoor {
namespace Engine {
namespace Extract {

using namespace Spoor::Core;

void EmbeddedDataStrategy::walk(const nlohmann::json& node,
                                const Document&       document,
                                CandidateSet&         out) const {
    if (node.is_string()) {
        const auto& value = node.get_ref<const std::string&>();
        if (patterns_->mentions_fingerprint(value))
            add_matches(value, OriginField::EmbeddedData, document, out);
        return;
    }
    if (node.is_structured()) {
        for (const auto& child : node)
            walk(child, document, out);
    }
}

CandidateSet EmbeddedDataStrategy::extract(const Document& document) const {
    std::vector<std::string> payloads;
    if (document.looks_like_json()) {
        payloads.push_back(document.body());
    } else {
        payloads = document.html().script_bodies({"application/json", "application/ld+json"});
    }

    CandidateSet out;
    for (const auto& payload : payloads) {
        if (!patterns_->mentions_fingerprint(payload))
            continue;
        auto data = nlohmann::json::parse(payload, nullptr, false);
        if (data.is_discarded()) {
            Logger::debug("Unparseable embedded JSON on " + document.uri());
            continue;
        }
        walk(data, document, out);
    }
    return out;
}

}  // namespace Extract
}  // namespace Engine
}  // namespace Spoor
