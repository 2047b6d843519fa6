#include "search_pages_source.hpp"
#include "../utils/text/string_utils.hpp"
#include "../utils/url/url.hpp"

namespace Spoor {
namespace Sources {

using namespace Spoor::Utils;

SearchPagesSource::SearchPagesSource(std::string              tag,
                                     std::string              url_template,
                                     std::vector<std::string> queries,
                                     unsigned                 page_size)
    : tag_(std::move(tag)),
      url_template_(std::move(url_template)),
      queries_(std::move(queries)),
      page_size_(page_size == 0 ? 1 : page_size) {
}

std::string SearchPagesSource::page_url(const std::string& query, unsigned page) const {
    std::string url = Text::replace_all(url_template_, "{query}", Url::encode_component(query));
    url             = Text::replace_all(url, "{page}", std::to_string(page));
    return Text::replace_all(url, "{offset}", std::to_string((page - 1) * page_size_ + 1));
}

std::vector<FrontierItem> SearchPagesSource::seeds() const {
    std::vector<FrontierItem> items;
    for (const auto& query : queries_) {
        FrontierItem item;
        item.target     = page_url(query, 1);
        item.source_tag = tag_;
        item.query      = query;
        items.push_back(std::move(item));
    }
    return items;
}

std::vector<FrontierItem> SearchPagesSource::next_links_from(const Document& /*document*/,
                                                             const FrontierItem& current) const {
    unsigned next = current.page_index + 1;
    return {current.child(page_url(current.query, next), next)};
}

}  // namespace Sources
}  // namespace Spoor
