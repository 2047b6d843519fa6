#pragma once

#include <utility>
#include <boost/asio.hpp>
#include <chrono>
#include <string>

namespace Spoor {
namespace Network {
namespace Http {

enum class ErrorType { None, Network, Timeout, TooManyRedirects, Other };

enum class HTTPCode {
    Ok              = 200,
    NetworkError    = 0,
    Forbidden       = 403,
    NotFound        = 404,
    TooManyRequests = 429
};

enum class MaxCode { ClientError = 400, ServerError = 500 };

}  // namespace Http
}  // namespace Network
}  // namespace Spoor

namespace Spoor {

struct Response {
    std::string              effective_url;  // Final URL after redirects
    long                     status_code = 0;
    std::string              content_type;
    std::string              location;  // Location header of an unfollowed 3xx
    std::string              body;
    std::string              error;
    bool                     success    = false;
    Network::Http::ErrorType error_type = Network::Http::ErrorType::None;
};

namespace Network {
namespace Http {

class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual void set_user_agent(const std::string& user_agent)             = 0;
    virtual void set_connect_timeout(std::chrono::milliseconds /*timeout*/) {};
    virtual void set_request_timeout(std::chrono::milliseconds /*timeout*/) {};
    virtual boost::asio::awaitable<Response> get(const std::string& url) = 0;
};

}  // namespace Http
}  // namespace Network
}  // namespace Spoor
