#include "source_factory.hpp"
#include <stdexcept>
#include "link_list_source.hpp"
#include "search_pages_source.hpp"

namespace Spoor {
namespace Sources {

std::unique_ptr<SourceProvider> make_source(const Spoor::Core::SourceConfig& config) {
    if (config.type == "search") {
        if (config.url_template.empty())
            throw std::runtime_error("Source '" + config.tag + "' has no url_template");
        return std::make_unique<SearchPagesSource>(
            config.tag, config.url_template, config.queries, config.page_size);
    }

    if (config.type == "links") {
        std::vector<std::string> urls = config.urls;
        if (!config.urls_file.empty()) {
            auto from_file = LinkListSource::load_urls_file(config.urls_file);
            urls.insert(urls.end(), from_file.begin(), from_file.end());
        }
        return std::make_unique<LinkListSource>(
            config.tag, std::move(urls), parse_pagination(config.pagination));
    }

    throw std::runtime_error("Unknown source type '" + config.type + "'");
}

std::vector<std::unique_ptr<SourceProvider>> make_sources(const Spoor::Core::Config& config) {
    std::vector<std::unique_ptr<SourceProvider>> providers;
    for (const auto& source : config.all_sources())
        providers.push_back(make_source(source));
    return providers;
}

}  // namespace Sources
}  // namespace Spoor
