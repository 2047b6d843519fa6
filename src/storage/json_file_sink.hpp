#pragma once
#include <string>

#include "dedup_store.hpp"
#include "sink.hpp"

namespace Spoor {
namespace Storage {

// {"date_export": ..., "total_sites": N, "sites": [{"key": ..., "url": ...}]}
class JsonFileSink : public Sink {
public:
    explicit JsonFileSink(std::string path, bool merge_existing = false);

    bool write(const std::vector<CanonicalEntity>& entities) override;

    // Sites of a previously written file. Missing or unreadable files give an empty store.
    static DedupStore load(const std::string& path);

private:
    std::string path_;
    bool        merge_existing_;
};

}  // namespace Storage
}  // namespace Spoor
