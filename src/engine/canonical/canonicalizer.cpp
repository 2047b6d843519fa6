#include "canonicalizer.hpp"
#include "../../utils/text/string_utils.hpp"

namespace Spoor {
namespace Engine {
namespace Canonical {

using namespace Spoor::Utils::Text;

namespace {

bool is_label_char(char c) {
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-';
}

bool is_alnum(char c) {
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
}

// The suffix must end the host name: "foo.myshopify.com.evil.net" does not match,
// "foo.myshopify.com/" and "foo.myshopify.com." (sentence end) do.
bool ends_host(const std::string& text, size_t pos) {
    if (pos >= text.size())
        return true;
    char c = text[pos];
    if (is_label_char(c))
        return false;
    if (c == '.')
        return pos + 1 >= text.size() || !is_alnum(text[pos + 1]);
    return true;
}

}  // namespace

Canonicalizer::Canonicalizer(Fingerprint fingerprint) : fingerprint_(std::move(fingerprint)) {
    fingerprint_.suffix = to_lower(trim(fingerprint_.suffix));
    while (!fingerprint_.suffix.empty() && fingerprint_.suffix.front() == '.')
        fingerprint_.suffix.erase(0, 1);
    if (fingerprint_.scheme.empty())
        fingerprint_.scheme = "https";
}

std::string Canonicalizer::strip_prefixes(std::string text) const {
    auto scheme_end = text.find("://");
    if (scheme_end != std::string::npos) {
        bool is_scheme = scheme_end > 0;
        for (size_t i = 0; i < scheme_end && is_scheme; ++i) {
            char c    = text[i];
            is_scheme = is_alnum(c) || c == '+' || c == '-' || c == '.';
        }
        if (is_scheme)
            text.erase(0, scheme_end + 3);
    }

    size_t start = text.find_first_not_of('/');
    text.erase(0, start == std::string::npos ? text.size() : start);

    while (starts_with(text, "*."))
        text.erase(0, 2);
    if (starts_with(text, "www."))
        text.erase(0, 4);
    return text;
}

bool Canonicalizer::is_valid_key(const std::string& key) const {
    if (key.size() < fingerprint_.min_length || key.size() > fingerprint_.max_length)
        return false;
    if (key.front() == '-' || key.back() == '-')
        return false;
    for (char c : key) {
        if (!is_label_char(c))
            return false;
    }
    return fingerprint_.reserved.count(key) == 0;
}

std::optional<CanonicalEntity> Canonicalizer::canonicalize(const std::string& raw) const {
    if (fingerprint_.suffix.empty())
        return std::nullopt;

    std::string text   = strip_prefixes(to_lower(trim(raw)));
    std::string needle = "." + fingerprint_.suffix;

    for (size_t pos = text.find(needle); pos != std::string::npos;
         pos        = text.find(needle, pos + 1)) {
        if (!ends_host(text, pos + needle.size()))
            continue;

        size_t begin = pos;
        while (begin > 0 && is_label_char(text[begin - 1]))
            --begin;

        std::string key = text.substr(begin, pos - begin);
        if (!is_valid_key(key))
            return std::nullopt;

        return CanonicalEntity{key, fingerprint_.scheme + "://" + key + needle};
    }
    return std::nullopt;
}

}  // namespace Canonical
}  // namespace Engine
}  // namespace Spoor
