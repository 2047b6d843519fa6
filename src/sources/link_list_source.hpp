#pragma once
#include "source_provider.hpp"

namespace Spoor {
namespace Sources {

enum class Pagination { None, NextLink, SameHost };

Pagination parse_pagination(const std::string& name);

// A fixed list of start pages. Each start page is its own query.
class LinkListSource : public SourceProvider {
public:
    LinkListSource(std::string tag, std::vector<std::string> urls, Pagination pagination);

    // One URL per line; blank lines and '#' comments are skipped.
    static std::vector<std::string> load_urls_file(const std::string& path);

    const std::string& tag() const override {
        return tag_;
    }
    std::vector<FrontierItem> seeds() const override;
    std::vector<FrontierItem> next_links_from(const Document&     document,
                                              const FrontierItem& current) const override;

private:
    std::string              tag_;
    std::vector<std::string> urls_;
    Pagination               pagination_;

    std::vector<FrontierItem> next_page(const Document& document, const FrontierItem& current) const;
    std::vector<FrontierItem> same_host_links(const Document&     document,
                                              const FrontierItem& current) const;
};

}  // namespace Sources
}  // namespace Spoor
