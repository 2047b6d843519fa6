#include "link_strategy.hpp"
#include "../../../utils/url/url.hpp"

namespace Spoor {
namespace Engine {
namespace Extract {

using namespace Spoor::Utils;

CandidateSet LinkStrategy::extract(const Document& document) const {
    CandidateSet out;
    for (const auto& link : document.html().links()) {
        std::string href = Url::resolve(document.uri(), link.href);
        if (href.empty())
            href = link.href;
        if (patterns_->mentions_fingerprint(href))
            out.insert(CandidateMatch{href, OriginField::LinkHref, document.uri()});

        if (!link.text.empty())
            add_matches(link.text, OriginField::LinkText, document, out);
    }
    return out;
}

}  // namespace Extract
}  // namespace Engine
}  // namespace Spoor
