#pragma once
#include <string>
#include <vector>

#include "../engine/canonical/canonicalizer.hpp"

namespace Spoor {
namespace Storage {

using Spoor::Engine::Canonical::CanonicalEntity;

// Receives the final deduplicated entity set. Returns false (and logs) on failure.
class Sink {
public:
    virtual ~Sink() = default;

    virtual bool write(const std::vector<CanonicalEntity>& entities) = 0;
};

// Creates missing parent directories of `path`.
bool prepare_output_path(const std::string& path);

}  // namespace Storage
}  // namespace Spoor
