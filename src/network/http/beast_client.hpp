#pragma once

#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>
#include <string>
#include "../../core/types/constants.hpp"
#include "http_client.hpp"

namespace Spoor {
namespace Network {
namespace Http {

class BeastClient : public HttpClient {
public:
    explicit BeastClient(boost::asio::io_context& ioc);
    ~BeastClient() override = default;

    void set_user_agent(const std::string& user_agent) override;
    void set_connect_timeout(std::chrono::milliseconds timeout) override;
    void set_request_timeout(std::chrono::milliseconds timeout) override;
    boost::asio::awaitable<Response> get(const std::string& url) override;

private:
    std::string               user_agent_ = Spoor::Core::Constants::USER_AGENT;
    std::chrono::milliseconds connect_timeout_{Spoor::Core::Constants::CONNECT_TIMEOUT_MS};
    std::chrono::milliseconds request_timeout_{
        std::chrono::seconds(Spoor::Core::Constants::REQUEST_TIMEOUT_SECONDS)};
    boost::asio::ssl::context ssl_ctx_{boost::asio::ssl::context::tlsv12_client};

    boost::asio::awaitable<Response> do_request(const std::string& url);
    boost::asio::awaitable<Response> do_request_impl(const std::string& host,
                                                     const std::string& port,
                                                     const std::string& target,
                                                     bool               is_ssl);

    boost::asio::awaitable<Response> perform_http_request(const std::string& host,
                                                          const std::string& port,
                                                          const std::string& target);
    boost::asio::awaitable<Response> perform_https_request(const std::string& host,
                                                           const std::string& port,
                                                           const std::string& target);
};

}  // namespace Http
}  // namespace Network
}  // namespace Spoor
