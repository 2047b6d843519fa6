#include "dedup_store.hpp"

namespace Spoor {
namespace Storage {

DedupStore::DedupStore(const DedupStore& other) : entries_(other.snapshot()) {
}

DedupStore& DedupStore::operator=(const DedupStore& other) {
    if (this != &other) {
        auto                        copy = other.snapshot();
        std::lock_guard<std::mutex> lock(mutex_);
        entries_ = std::move(copy);
    }
    return *this;
}

std::map<std::string, CanonicalEntity> DedupStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

bool DedupStore::insert(CanonicalEntity entity) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string                 key = entity.key;
    return entries_.emplace(std::move(key), std::move(entity)).second;
}

bool DedupStore::contains(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.count(key) > 0;
}

std::optional<CanonicalEntity> DedupStore::find(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        it = entries_.find(key);
    if (it == entries_.end())
        return std::nullopt;
    return it->second;
}

DedupStore DedupStore::merge(const DedupStore& other) const {
    DedupStore result(*this);
    result.absorb(other);
    return result;
}

void DedupStore::absorb(const DedupStore& other) {
    if (this == &other)
        return;
    auto                        incoming = other.snapshot();
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [key, entity] : incoming)
        entries_[key] = std::move(entity);
}

size_t DedupStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

bool DedupStore::empty() const {
    return size() == 0;
}

void DedupStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

std::vector<CanonicalEntity> DedupStore::entities() const {
    std::lock_guard<std::mutex>  lock(mutex_);
    std::vector<CanonicalEntity> out;
    out.reserve(entries_.size());
    for (const auto& [key, entity] : entries_)
        out.push_back(entity);
    return out;
}

}  // namespace Storage
}  // namespace Spoor
