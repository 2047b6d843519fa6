#pragma once
#include <string>

#include "sink.hpp"

namespace Spoor {
namespace Storage {

// "key,url" header followed by one row per entity, sorted by key.
class CsvFileSink : public Sink {
public:
    explicit CsvFileSink(std::string path);

    bool write(const std::vector<CanonicalEntity>& entities) override;

private:
    std::string path_;
};

}  // namespace Storage
}  // namespace Spoor
