#pragma once
#include <memory>
#include <vector>

#include "../core/config/config.hpp"
#include "source_provider.hpp"

namespace Spoor {
namespace Sources {

// Throws std::runtime_error for unknown types or unreadable URL files.
std::unique_ptr<SourceProvider> make_source(const Spoor::Core::SourceConfig& config);

std::vector<std::unique_ptr<SourceProvider>> make_sources(const Spoor::Core::Config& config);

}  // namespace Sources
}  // namespace Spoor
