#pragma once
#include <optional>
#include <string>

#include "../extract/candidate.hpp"
#include "fingerprint.hpp"

namespace Spoor {
namespace Engine {
namespace Canonical {

struct CanonicalEntity {
    std::string key;
    std::string uri;

    bool operator==(const CanonicalEntity& other) const {
        return key == other.key && uri == other.uri;
    }
    bool operator<(const CanonicalEntity& other) const {
        return key < other.key || (key == other.key && uri < other.uri);
    }
};

/**
 * Turns raw candidate text into a canonical entity.
 *
 * Pure and idempotent: feeding the resulting uri back in yields the same entity.
 */
class Canonicalizer {
public:
    explicit Canonicalizer(Fingerprint fingerprint = {});

    std::optional<CanonicalEntity> canonicalize(const std::string& raw) const;
    std::optional<CanonicalEntity> canonicalize(const Extract::CandidateMatch& candidate) const {
        return canonicalize(candidate.raw_text);
    }

    bool is_valid_key(const std::string& key) const;

    const Fingerprint& fingerprint() const {
        return fingerprint_;
    }

private:
    Fingerprint fingerprint_;

    std::string strip_prefixes(std::string text) const;
};

}  // namespace Canonical
}  // namespace Engine
}  // namespace Spoor
