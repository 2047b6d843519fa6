#include "link_list_source.hpp"
#include <fstream>
#include <set>
#include <stdexcept>
#include "../utils/text/string_utils.hpp"
#include "../utils/url/url.hpp"

namespace Spoor {
namespace Sources {

using namespace Spoor::Utils;

namespace {

const std::vector<std::string>& next_markers() {
    static const std::vector<std::string> markers = {
        "next", "suivant", "\xE2\x80\xBA" /* › */, "\xC2\xBB" /* » */};
    return markers;
}

bool says_next(const std::string& value) {
    for (const auto& marker : next_markers()) {
        if (Text::icontains(value, marker))
            return true;
    }
    return false;
}

bool is_next_link(const Html::Link& link) {
    for (const auto& token : Text::split_any(Text::to_lower(link.rel), " \t")) {
        if (token == "next")
            return true;
    }
    return says_next(link.text) || says_next(link.css_class) || says_next(link.aria_label);
}

bool is_web_url(const std::string& url) {
    auto scheme = Text::to_lower(Url::parse(url).scheme);
    return scheme == "http" || scheme == "https";
}

}  // namespace

Pagination parse_pagination(const std::string& name) {
    if (name.empty() || name == "none")
        return Pagination::None;
    if (name == "next_link")
        return Pagination::NextLink;
    if (name == "same_host")
        return Pagination::SameHost;
    throw std::runtime_error("Unknown pagination mode: " + name);
}

LinkListSource::LinkListSource(std::string tag, std::vector<std::string> urls, Pagination pagination)
    : tag_(std::move(tag)), urls_(std::move(urls)), pagination_(pagination) {
}

std::vector<std::string> LinkListSource::load_urls_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open())
        throw std::runtime_error("Cannot open URL list: " + path);

    std::vector<std::string> urls;
    std::string              line;
    while (std::getline(file, line)) {
        size_t hash = line.find('#');
        if (hash != std::string::npos)
            line = line.substr(0, hash);
        line = Text::trim(line);
        if (!line.empty())
            urls.push_back(line);
    }
    return urls;
}

std::vector<FrontierItem> LinkListSource::seeds() const {
    std::vector<FrontierItem> items;
    for (const auto& url : urls_) {
        FrontierItem item;
        item.target     = url;
        item.source_tag = tag_;
        item.query      = url;
        items.push_back(std::move(item));
    }
    return items;
}

std::vector<FrontierItem> LinkListSource::next_links_from(const Document&     document,
                                                          const FrontierItem& current) const {
    switch (pagination_) {
        case Pagination::NextLink:
            return next_page(document, current);
        case Pagination::SameHost:
            return same_host_links(document, current);
        case Pagination::None:
            break;
    }
    return {};
}

std::vector<FrontierItem> LinkListSource::next_page(const Document&     document,
                                                    const FrontierItem& current) const {
    std::string self = Url::strip_fragment(document.uri());
    for (const auto& link : document.html().links()) {
        if (!is_next_link(link))
            continue;
        std::string target = Url::strip_fragment(Url::resolve(document.uri(), link.href));
        if (target.empty() || target == self || !is_web_url(target))
            continue;
        return {current.child(std::move(target), current.page_index + 1)};
    }
    return {};
}

std::vector<FrontierItem> LinkListSource::same_host_links(const Document&     document,
                                                          const FrontierItem& current) const {
    std::vector<FrontierItem> items;
    std::set<std::string>     seen;
    for (const auto& link : document.html().links()) {
        std::string target = Url::strip_fragment(Url::resolve(document.uri(), link.href));
        if (target.empty() || !is_web_url(target) || !Url::is_same_domain(target, document.uri()))
            continue;
        if (!seen.insert(target).second)
            continue;
        items.push_back(current.child(std::move(target), current.page_index));
    }
    return items;
}

}  // namespace Sources
}  // namespace Spoor
