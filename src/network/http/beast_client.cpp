#include "beast_client.hpp"
#include "../../core/logger/logger.hpp"
#include "../../utils/url/url.hpp"

namespace Spoor {
namespace Network {
namespace Http {

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
namespace ssl   = net::ssl;
using tcp       = net::ip::tcp;

namespace {

constexpr std::size_t BODY_LIMIT = 16 * 1024 * 1024;

void fill_response(Response& response, http::response<http::string_body>& res) {
    response.status_code = res.result_int();
    response.body        = std::move(res.body());
    response.success     = (response.status_code >= 200
                        && response.status_code < static_cast<long>(MaxCode::ClientError));
    auto ct = res.find(http::field::content_type);
    if (ct != res.end())
        response.content_type = std::string(ct->value());
    auto loc = res.find(http::field::location);
    if (loc != res.end())
        response.location = std::string(loc->value());
    if (!response.success)
        response.error = "HTTP " + std::to_string(response.status_code);
}

bool is_redirect(long status) {
    return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

bool is_timeout(const boost::system::error_code& ec) {
    return ec == beast::error::timeout || ec == net::error::timed_out;
}

}  // namespace

BeastClient::BeastClient(net::io_context& /*ioc*/) {
    ssl_ctx_.set_default_verify_paths();
    ssl_ctx_.set_verify_mode(ssl::verify_peer);
}

void BeastClient::set_user_agent(const std::string& user_agent) {
    user_agent_ = user_agent;
}

void BeastClient::set_connect_timeout(std::chrono::milliseconds timeout) {
    connect_timeout_ = timeout;
}

void BeastClient::set_request_timeout(std::chrono::milliseconds timeout) {
    request_timeout_ = timeout;
}

net::awaitable<Response> BeastClient::get(const std::string& url) {
    std::string current = url;
    for (int hop = 0; hop <= Spoor::Core::Constants::MAX_REDIRECTS; ++hop) {
        Response res = co_await do_request(current);
        if (!is_redirect(res.status_code) || res.location.empty()) {
            co_return res;
        }
        std::string next = Spoor::Utils::Url::resolve(current, res.location);
        if (next.empty() || next == current) {
            co_return res;
        }
        Spoor::Core::Logger::debug("Redirect " + current + " -> " + next);
        current = std::move(next);
    }

    Response response;
    response.effective_url = current;
    response.error         = "Too many redirects";
    response.error_type    = ErrorType::TooManyRedirects;
    co_return response;
}

net::awaitable<Response> BeastClient::do_request(const std::string& url) {
    auto parsed = Spoor::Utils::Url::parse(url);
    if (parsed.host.empty() || (parsed.scheme != "http" && parsed.scheme != "https")) {
        co_return Response{.effective_url = url,
                           .status_code   = 0,
                           .content_type  = "",
                           .location      = "",
                           .body          = "",
                           .error         = "Invalid URL",
                           .success       = false,
                           .error_type    = ErrorType::Other};
    }

    std::string host = parsed.host;
    std::string port =
        parsed.port.empty() ? (parsed.scheme == "https" ? "443" : "80") : parsed.port;
    std::string target = parsed.path.empty() ? "/" : parsed.path;
    if (!parsed.query.empty())
        target += "?" + parsed.query;

    bool is_ssl = (parsed.scheme == "https");

    Response response = co_await do_request_impl(host, port, target, is_ssl);
    response.effective_url = Spoor::Utils::Url::origin(parsed) + target;
    co_return response;
}

net::awaitable<Response> BeastClient::do_request_impl(const std::string& host,
                                                      const std::string& port,
                                                      const std::string& target,
                                                      bool               is_ssl) {
    Response failure;
    try {
        if (!is_ssl) {
            co_return co_await perform_http_request(host, port, target);
        }
        else {
            co_return co_await perform_https_request(host, port, target);
        }
    } catch (const boost::system::system_error& e) {
        failure.error      = e.what();
        failure.error_type = is_timeout(e.code()) ? ErrorType::Timeout : ErrorType::Network;
    } catch (const std::exception& e) {
        failure.error      = e.what();
        failure.error_type = ErrorType::Network;
    }
    failure.success     = false;
    failure.status_code = static_cast<long>(HTTPCode::NetworkError);
    co_return failure;
}

net::awaitable<Response> BeastClient::perform_http_request(const std::string& host,
                                                           const std::string& port,
                                                           const std::string& target) {
    Response response;

    tcp::resolver resolver(co_await net::this_coro::executor);
    auto results = co_await resolver.async_resolve(host, port, net::use_awaitable);

    beast::tcp_stream stream(co_await net::this_coro::executor);
    stream.expires_after(connect_timeout_);
    co_await stream.async_connect(results, net::use_awaitable);

    stream.expires_after(request_timeout_);

    http::request<http::string_body> req{http::verb::get, target, 11};
    req.set(http::field::host, host);
    req.set(http::field::user_agent, user_agent_);
    req.set(http::field::accept, "text/html,application/xhtml+xml,application/json;q=0.9,*/*;q=0.8");

    co_await http::async_write(stream, req, net::use_awaitable);

    beast::flat_buffer                              b;
    http::response_parser<http::string_body>        parser;
    parser.body_limit(BODY_LIMIT);
    co_await http::async_read(stream, b, parser, net::use_awaitable);

    auto res = parser.release();
    fill_response(response, res);

    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    co_return response;
}

net::awaitable<Response> BeastClient::perform_https_request(const std::string& host,
                                                            const std::string& port,
                                                            const std::string& target) {
    Response response;

    tcp::resolver resolver(co_await net::this_coro::executor);
    auto results = co_await resolver.async_resolve(host, port, net::use_awaitable);

    beast::ssl_stream<beast::tcp_stream> ssl_stream(co_await net::this_coro::executor, ssl_ctx_);
    if (!SSL_set_tlsext_host_name(ssl_stream.native_handle(), host.c_str())) {
        throw beast::system_error(
            beast::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()));
    }

    beast::get_lowest_layer(ssl_stream).expires_after(connect_timeout_);
    co_await beast::get_lowest_layer(ssl_stream).async_connect(results, net::use_awaitable);

    beast::get_lowest_layer(ssl_stream).expires_after(connect_timeout_);
    co_await ssl_stream.async_handshake(ssl::stream_base::client, net::use_awaitable);

    beast::get_lowest_layer(ssl_stream).expires_after(request_timeout_);

    http::request<http::string_body> req{http::verb::get, target, 11};
    req.set(http::field::host, host);
    req.set(http::field::user_agent, user_agent_);
    req.set(http::field::accept, "text/html,application/xhtml+xml,application/json;q=0.9,*/*;q=0.8");

    co_await http::async_write(ssl_stream, req, net::use_awaitable);

    beast::flat_buffer                       b;
    http::response_parser<http::string_body> parser;
    parser.body_limit(BODY_LIMIT);
    co_await http::async_read(ssl_stream, b, parser, net::use_awaitable);

    auto res = parser.release();
    fill_response(response, res);

    // Servers routinely drop the connection without close_notify.
    beast::error_code ec;
    co_await ssl_stream.async_shutdown(net::redirect_error(net::use_awaitable, ec));
    co_return response;
}

}  // namespace Http
}  // namespace Network
}  // namespace Spoor
