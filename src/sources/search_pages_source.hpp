#pragma once
#include "source_provider.hpp"

namespace Spoor {
namespace Sources {

/**
 * Numbered result pages built from a URL template.
 *
 * Placeholders: {query} (percent-encoded), {page} (1-based) and {offset}
 * ((page - 1) * page_size + 1). Every processed page yields the next one;
 * the frontier policy decides when a query ends.
 */
class SearchPagesSource : public SourceProvider {
public:
    SearchPagesSource(std::string              tag,
                      std::string              url_template,
                      std::vector<std::string> queries,
                      unsigned                 page_size = 10);

    const std::string& tag() const override {
        return tag_;
    }
    std::vector<FrontierItem> seeds() const override;
    std::vector<FrontierItem> next_links_from(const Document&     document,
                                              const FrontierItem& current) const override;

    std::string page_url(const std::string& query, unsigned page) const;

private:
    std::string              tag_;
    std::string              url_template_;
    std::vector<std::string> queries_;
    unsigned                 page_size_;
};

}  // namespace Sources
}  // namespace Spoor
