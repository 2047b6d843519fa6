#include "document.hpp"
#include "../../utils/text/string_utils.hpp"

namespace Spoor {
namespace Engine {
namespace Extract {

using namespace Spoor::Utils;

Document::Document(std::string uri, std::string body, std::string content_type)
    : uri_(std::move(uri)), body_(std::move(body)), content_type_(std::move(content_type)) {
}

Document Document::from_outcome(const Fetch::FetchOutcome& outcome, const std::string& requested_uri) {
    return Document(outcome.final_uri.empty() ? requested_uri : outcome.final_uri,
                    outcome.body.value_or(""),
                    outcome.content_type);
}

bool Document::looks_like_json() const {
    if (Text::icontains(content_type_, "json"))
        return true;
    size_t first = body_.find_first_not_of(" \t\r\n");
    return first != std::string::npos && (body_[first] == '{' || body_[first] == '[');
}

const Html::HtmlDocument& Document::html() const {
    if (!html_)
        html_ = std::make_unique<Html::HtmlDocument>(body_);
    return *html_;
}

}  // namespace Extract
}  // namespace Engine
}  // namespace Spoor
