#pragma once
#include <gumbo.h>
#include <functional>
#include <string>
#include <vector>

namespace Spoor {
namespace Utils {
namespace Html {

struct Link {
    std::string href;
    std::string text;
    std::string rel;
    std::string css_class;
    std::string aria_label;
};

// Owns a gumbo parse tree for the lifetime of the object.
class HtmlDocument {
public:
    explicit HtmlDocument(const std::string& html);
    ~HtmlDocument();

    HtmlDocument(const HtmlDocument&)            = delete;
    HtmlDocument& operator=(const HtmlDocument&) = delete;

    // Depth-first visit of every element node.
    void for_each_element(const std::function<void(const GumboElement&)>& visitor) const;

    std::vector<Link>        links() const;
    std::vector<std::string> script_bodies(const std::vector<std::string>& types) const;

    static std::string text_content(const GumboElement& element);
    static std::string attribute(const GumboElement& element, const char* name);

private:
    GumboOutput* output_;
};

}  // namespace Html
}  // namespace Utils
}  // namespace Spoor
