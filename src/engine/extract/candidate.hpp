#pragma once
#include <set>
#include <string>
#include <tuple>

namespace Spoor {
namespace Engine {
namespace Extract {

enum class OriginField { Body, LinkHref, LinkText, Attribute, MetaTag, EmbeddedData };

inline const char* to_string(OriginField field) {
    switch (field) {
        case OriginField::Body:
            return "body";
        case OriginField::LinkHref:
            return "link-href";
        case OriginField::LinkText:
            return "link-text";
        case OriginField::Attribute:
            return "attribute";
        case OriginField::MetaTag:
            return "meta";
        case OriginField::EmbeddedData:
            return "embedded";
    }
    return "unknown";
}

struct CandidateMatch {
    std::string raw_text;
    OriginField origin_field = OriginField::Body;
    std::string source_uri;

    bool operator<(const CandidateMatch& other) const {
        return std::tie(raw_text, origin_field, source_uri)
               < std::tie(other.raw_text, other.origin_field, other.source_uri);
    }
};

using CandidateSet = std::set<CandidateMatch>;

}  // namespace Extract
}  // namespace Engine
}  // namespace Spoor
