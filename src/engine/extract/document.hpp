#pragma once
#include <memory>
#include <string>

#include "../../utils/html/html_document.hpp"
#include "../fetch/fetch_outcome.hpp"

namespace Spoor {
namespace Engine {
namespace Extract {

// A fetched page as seen by extraction strategies and source providers.
// The HTML tree is parsed on first use and shared by every reader of the document.
class Document {
public:
    Document(std::string uri, std::string body, std::string content_type = "");

    static Document from_outcome(const Fetch::FetchOutcome& outcome, const std::string& requested_uri);

    const std::string& uri() const {
        return uri_;
    }
    const std::string& body() const {
        return body_;
    }
    const std::string& content_type() const {
        return content_type_;
    }

    bool looks_like_json() const;

    const Spoor::Utils::Html::HtmlDocument& html() const;

private:
    std::string uri_;
    std::string body_;
    std::string content_type_;

    mutable std::unique_ptr<Spoor::Utils::Html::HtmlDocument> html_;
};

}  // namespace Extract
}  // namespace Engine
}  // namespace Spoor
