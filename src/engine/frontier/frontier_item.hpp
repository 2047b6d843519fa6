#pragma once
#include <chrono>
#include <string>

namespace Spoor {
namespace Engine {
namespace Traversal {

struct FrontierItem {
    std::string                           target;
    unsigned                              depth      = 1;
    unsigned                              page_index = 1;
    std::string                           source_tag;
    std::string                           query;  // Seed query label within the source
    std::chrono::system_clock::time_point born_at = std::chrono::system_clock::now();

    // Pagination and empty-page accounting are tracked per (source_tag, query).
    std::string query_key() const {
        return source_tag + '\x1f' + query;
    }

    // Child of this item, inheriting source and query.
    FrontierItem child(std::string child_target, unsigned child_page_index) const {
        FrontierItem item;
        item.target     = std::move(child_target);
        item.depth      = depth + 1;
        item.page_index = child_page_index;
        item.source_tag = source_tag;
        item.query      = query;
        return item;
    }
};

}  // namespace Traversal
}  // namespace Engine
}  // namespace Spoor
