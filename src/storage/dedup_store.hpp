#pragma once
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "../engine/canonical/canonicalizer.hpp"

namespace Spoor {
namespace Storage {

using Spoor::Engine::Canonical::CanonicalEntity;

/**
 * Set of canonical entities keyed by `key`. Every operation is atomic.
 *
 * insert() keeps the first uri seen for a key. merge()/absorb() form the union
 * of both stores, with the other store's uri winning on a shared key.
 */
class DedupStore {
public:
    DedupStore() = default;
    DedupStore(const DedupStore& other);
    DedupStore& operator=(const DedupStore& other);

    bool                           insert(CanonicalEntity entity);
    bool                           contains(const std::string& key) const;
    std::optional<CanonicalEntity> find(const std::string& key) const;

    DedupStore merge(const DedupStore& other) const;
    void       absorb(const DedupStore& other);

    size_t size() const;
    bool   empty() const;
    void   clear();

    // Sorted by key.
    std::vector<CanonicalEntity> entities() const;

private:
    mutable std::mutex                     mutex_;
    std::map<std::string, CanonicalEntity> entries_;

    std::map<std::string, CanonicalEntity> snapshot() const;
};

}  // namespace Storage
}  // namespace Spoor
