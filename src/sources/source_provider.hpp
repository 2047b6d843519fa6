#pragma once
#include <string>
#include <vector>

#include "../engine/extract/document.hpp"
#include "../engine/frontier/frontier_item.hpp"

namespace Spoor {
namespace Sources {

using Spoor::Engine::Extract::Document;
using Spoor::Engine::Traversal::FrontierItem;

// Supplies seeds and the pagination strategy of one data source.
class SourceProvider {
public:
    virtual ~SourceProvider() = default;

    virtual const std::string&        tag() const   = 0;
    virtual std::vector<FrontierItem> seeds() const = 0;

    // Follow-up items for a processed page. Children must be built with
    // current.child() so depth and query bookkeeping stay consistent.
    virtual std::vector<FrontierItem> next_links_from(const Document&     document,
                                                      const FrontierItem& current) const = 0;
};

}  // namespace Sources
}  // namespace Spoor
