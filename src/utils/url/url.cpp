#include "url.hpp"
#include <algorithm>
#include <cctype>
#include <string_view>
#include <vector>

namespace Spoor {
namespace Utils {

UrlParsed Url::parse(const std::string& url) {
    UrlParsed parsed;
    parsed.start_url = url;

    if (url.empty()) {
        parsed.path = "/";
        return parsed;
    }

    std::string_view sv = url;

    size_t colon       = sv.find(':');
    size_t first_slash = sv.find('/');
    size_t first_q     = sv.find('?');
    size_t first_h     = sv.find('#');
    bool   has_scheme  = (colon != std::string_view::npos);
    if (has_scheme && first_slash != std::string_view::npos && colon > first_slash)
        has_scheme = false;
    if (has_scheme && first_q != std::string_view::npos && colon > first_q)
        has_scheme = false;
    if (has_scheme && first_h != std::string_view::npos && colon > first_h)
        has_scheme = false;

    if (has_scheme) {
        parsed.scheme = std::string(sv.substr(0, colon));
        sv.remove_prefix(colon + 1);
    }

    if (sv.size() >= 2 && sv[0] == '/' && sv[1] == '/') {
        sv.remove_prefix(2);
        size_t      end_auth  = sv.find_first_of("/?#");
        std::string authority = std::string(sv.substr(0, end_auth));

        if (end_auth != std::string_view::npos) {
            sv.remove_prefix(end_auth);
        }
        else {
            sv = "";
        }

        if (!authority.empty()) {
            size_t      at = authority.find_last_of('@');
            std::string host_port =
                (at != std::string::npos) ? authority.substr(at + 1) : authority;

            if (!host_port.empty() && host_port[0] == '[') {
                size_t end_bracket = host_port.find(']');
                if (end_bracket != std::string::npos) {
                    parsed.host    = host_port.substr(0, end_bracket + 1);
                    size_t p_colon = host_port.find(':', end_bracket + 1);
                    if (p_colon != std::string::npos) {
                        parsed.port = host_port.substr(p_colon + 1);
                    }
                }
                else {
                    parsed.host = host_port;
                }
            }
            else {
                size_t p_colon = host_port.find_last_of(':');
                if (p_colon != std::string::npos) {
                    parsed.host = host_port.substr(0, p_colon);
                    parsed.port = host_port.substr(p_colon + 1);
                }
                else {
                    parsed.host = host_port;
                }
            }
        }
    }

    size_t q_pos = sv.find('?');
    size_t h_pos = sv.find('#');

    size_t path_end = sv.length();
    if (q_pos != std::string_view::npos)
        path_end = std::min(path_end, q_pos);
    if (h_pos != std::string_view::npos)
        path_end = std::min(path_end, h_pos);

    parsed.path = std::string(sv.substr(0, path_end));
    if (q_pos != std::string_view::npos && (h_pos == std::string_view::npos || q_pos < h_pos)) {
        size_t q_end = (h_pos == std::string_view::npos) ? sv.length() : h_pos;
        parsed.query = std::string(sv.substr(q_pos + 1, q_end - q_pos - 1));
    }
    if (h_pos != std::string_view::npos)
        parsed.fragment = std::string(sv.substr(h_pos + 1));

    if (parsed.path.empty())
        parsed.path = "/";
    return parsed;
}

namespace {

std::string authority_of(const UrlParsed& parsed) {
    return parsed.port.empty() ? parsed.host : parsed.host + ":" + parsed.port;
}

// Drops "." and empty segments and applies "..", never climbing above the root.
std::string remove_dot_segments(const std::string& path) {
    std::vector<std::string> segments;
    size_t                   start = 0;
    while (start <= path.size()) {
        size_t      slash   = path.find('/', start);
        size_t      end     = slash == std::string::npos ? path.size() : slash;
        std::string segment = path.substr(start, end - start);
        if (segment == "..") {
            if (!segments.empty())
                segments.pop_back();
        }
        else if (!segment.empty() && segment != ".") {
            segments.push_back(std::move(segment));
        }
        if (slash == std::string::npos)
            break;
        start = slash + 1;
    }

    std::string out = "/";
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0)
            out += '/';
        out += segments[i];
    }
    if (path.size() > 1 && path.back() == '/' && out.back() != '/')
        out += '/';
    return out;
}

bool starts_with_scheme(const std::string& ref) {
    size_t colon = ref.find(':');
    if (colon == std::string::npos || colon == 0 || colon > ref.find_first_of("/?#"))
        return false;
    if (!std::isalpha(static_cast<unsigned char>(ref[0])))
        return false;
    for (size_t i = 1; i < colon; ++i) {
        unsigned char c = static_cast<unsigned char>(ref[i]);
        if (!std::isalnum(c) && c != '+' && c != '-' && c != '.')
            return false;
    }
    return true;
}

}  // namespace

std::string Url::resolve(const std::string& base, const std::string& relative) {
    if (relative.empty())
        return base;

    if (relative[0] == '#')
        return strip_fragment(base) + relative;

    if (relative[0] == '?') {
        size_t cut = base.find_first_of("?#");
        return (cut == std::string::npos ? base : base.substr(0, cut)) + relative;
    }

    if (relative.find("://") != std::string::npos)
        return relative;

    // Other schemes (javascript:, mailto:, tel:) do not resolve against a web base.
    if (starts_with_scheme(relative))
        return "";

    UrlParsed parsed = parse(base);
    if (relative.compare(0, 2, "//") == 0)
        return parsed.scheme + ":" + relative;

    std::string merged;
    if (relative[0] == '/') {
        merged = relative;
    }
    else {
        size_t last_slash = parsed.path.find_last_of('/');
        merged = (last_slash == std::string::npos ? "/" : parsed.path.substr(0, last_slash + 1))
                 + relative;
    }

    size_t      cut    = merged.find_first_of("?#");
    std::string path   = cut == std::string::npos ? merged : merged.substr(0, cut);
    std::string suffix = cut == std::string::npos ? "" : merged.substr(cut);
    return parsed.scheme + "://" + authority_of(parsed) + remove_dot_segments(path) + suffix;
}

bool Url::is_same_domain(const std::string& url1, const std::string& url2) {
    UrlParsed p1 = parse(url1);
    UrlParsed p2 = parse(url2);

    auto clean_host = [](std::string h) {
        if (!h.empty() && h.back() == '.')
            h.pop_back();  // Strip trailing dot
        for (char& c : h) {
            if (c >= 'A' && c <= 'Z')
                c = (char)(c + ('a' - 'A'));
        }
        return h;
    };

    return clean_host(p1.host) == clean_host(p2.host);
}

std::string Url::origin(const UrlParsed& parsed) {
    return parsed.scheme + "://" + authority_of(parsed);
}

std::string Url::host_key(const std::string& url) {
    UrlParsed   p    = parse(url);
    std::string host = p.host;
    if (!host.empty() && host.back() == '.')
        host.pop_back();
    for (char& c : host) {
        if (c >= 'A' && c <= 'Z')
            c = (char)(c + ('a' - 'A'));
    }
    if (!p.port.empty())
        host += ":" + p.port;
    return host;
}

std::string Url::strip_fragment(const std::string& url) {
    size_t hash = url.find('#');
    return hash == std::string::npos ? url : url.substr(0, hash);
}

std::string Url::encode_component(const std::string& value) {
    static const char* HEX = "0123456789ABCDEF";
    std::string        out;
    out.reserve(value.size() * 3);
    for (unsigned char c : value) {
        if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-'
            || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        }
        else {
            out += '%';
            out += HEX[c >> 4];
            out += HEX[c & 0x0F];
        }
    }
    return out;
}

}  // namespace Utils
}  // namespace Spoor
