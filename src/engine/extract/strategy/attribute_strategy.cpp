#include "attribute_strategy.hpp"

namespace Spoor {
namespace Engine {
namespace Extract {

CandidateSet AttributeStrategy::extract(const Document& document) const {
    CandidateSet out;
    document.html().for_each_element([&](const GumboElement& element) {
        OriginField origin =
            element.tag == GUMBO_TAG_META ? OriginField::MetaTag : OriginField::Attribute;

        const GumboVector* attributes = &element.attributes;
        for (unsigned int i = 0; i < attributes->length; ++i) {
            const auto* attr = static_cast<const GumboAttribute*>(attributes->data[i]);
            if (!attr->value || !patterns_->mentions_fingerprint(attr->value))
                continue;
            add_matches(attr->value, origin, document, out);
        }
    });
    return out;
}

}  // namespace Extract
}  // namespace Engine
}  // namespace Spoor
