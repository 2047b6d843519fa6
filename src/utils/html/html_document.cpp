#include "html_document.hpp"
#include <vector>
#include "../text/string_utils.hpp"

namespace Spoor {
namespace Utils {
namespace Html {

namespace {

void visit_node(const GumboNode*                                  node,
                const std::function<void(const GumboElement&)>& visitor) {
    if (node->type != GUMBO_NODE_ELEMENT && node->type != GUMBO_NODE_TEMPLATE)
        return;

    visitor(node->v.element);

    const GumboVector* children = &node->v.element.children;
    for (unsigned int i = 0; i < children->length; ++i) {
        visit_node(static_cast<const GumboNode*>(children->data[i]), visitor);
    }
}

void collect_text(const GumboNode* node, std::string& out) {
    if (node->type == GUMBO_NODE_TEXT || node->type == GUMBO_NODE_WHITESPACE
        || node->type == GUMBO_NODE_CDATA) {
        out += node->v.text.text;
        return;
    }
    if (node->type != GUMBO_NODE_ELEMENT && node->type != GUMBO_NODE_TEMPLATE)
        return;

    const GumboVector* children = &node->v.element.children;
    for (unsigned int i = 0; i < children->length; ++i) {
        collect_text(static_cast<const GumboNode*>(children->data[i]), out);
    }
}

}  // namespace

HtmlDocument::HtmlDocument(const std::string& html)
    : output_(gumbo_parse_with_options(&kGumboDefaultOptions, html.data(), html.size())) {
}

HtmlDocument::~HtmlDocument() {
    if (output_)
        gumbo_destroy_output(&kGumboDefaultOptions, output_);
}

void HtmlDocument::for_each_element(
    const std::function<void(const GumboElement&)>& visitor) const {
    if (output_)
        visit_node(output_->root, visitor);
}

std::string HtmlDocument::text_content(const GumboElement& element) {
    std::string        out;
    const GumboVector* children = &element.children;
    for (unsigned int i = 0; i < children->length; ++i) {
        collect_text(static_cast<const GumboNode*>(children->data[i]), out);
    }
    return Text::trim(out);
}

std::string HtmlDocument::attribute(const GumboElement& element, const char* name) {
    GumboAttribute* attr = gumbo_get_attribute(&element.attributes, name);
    return attr ? std::string(attr->value) : std::string();
}

std::vector<Link> HtmlDocument::links() const {
    std::vector<Link> links;
    for_each_element([&links](const GumboElement& element) {
        if (element.tag != GUMBO_TAG_A)
            return;
        GumboAttribute* href = gumbo_get_attribute(&element.attributes, "href");
        if (!href)
            return;
        links.push_back(Link{.href       = href->value,
                             .text       = text_content(element),
                             .rel        = attribute(element, "rel"),
                             .css_class  = attribute(element, "class"),
                             .aria_label = attribute(element, "aria-label")});
    });
    return links;
}

std::vector<std::string> HtmlDocument::script_bodies(const std::vector<std::string>& types) const {
    std::vector<std::string> bodies;
    for_each_element([&](const GumboElement& element) {
        if (element.tag != GUMBO_TAG_SCRIPT)
            return;
        std::string type = Text::to_lower(Text::trim(attribute(element, "type")));
        bool        wanted = false;
        for (const auto& t : types) {
            if (type == t) {
                wanted = true;
                break;
            }
        }
        if (!wanted)
            return;
        std::string body;
        const GumboVector* children = &element.children;
        for (unsigned int i = 0; i < children->length; ++i) {
            collect_text(static_cast<const GumboNode*>(children->data[i]), body);
        }
        if (!body.empty())
            bodies.push_back(std::move(body));
    });
    return bodies;
}

}  // namespace Html
}  // namespace Utils
}  // namespace Spoor
