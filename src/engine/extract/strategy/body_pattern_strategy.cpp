#include "body_pattern_strategy.hpp"

namespace Spoor {
namespace Engine {
namespace Extract {

CandidateSet BodyPatternStrategy::extract(const Document& document) const {
    CandidateSet out;
    for (auto& match : patterns_->find_all(document.body()))
        out.insert(CandidateMatch{std::move(match), OriginField::Body, document.uri()});
    return out;
}

}  // namespace Extract
}  // namespace Engine
}  // namespace Spoor
