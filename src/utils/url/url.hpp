#pragma once
#include <string>

namespace Spoor {
namespace Utils {

struct UrlParsed {
    std::string scheme;
    std::string host;
    std::string port;
    std::string path;
    std::string query;
    std::string fragment;
    std::string start_url;
};

class Url {
public:
    static UrlParsed   parse(const std::string& url);
    static std::string resolve(const std::string& base, const std::string& relative);
    static bool        is_same_domain(const std::string& url1, const std::string& url2);

    // scheme://host[:port]
    static std::string origin(const UrlParsed& parsed);
    // Lowercased host with port, used to key per-host state.
    static std::string host_key(const std::string& url);
    static std::string strip_fragment(const std::string& url);
    static std::string encode_component(const std::string& value);
};

}  // namespace Utils
}  // namespace Spoor
