#pragma once

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>
#include <functional>
#include <memory>
#include <string>

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

namespace arbscan {

// One-shot HTTPS request with a whole-exchange timeout
class HttpsRequest : public std::enable_shared_from_this<HttpsRequest> {
public:
    using Handler = std::function<void(beast::error_code ec, unsigned status, const std::string& body)>;

    static constexpr int TIMEOUT_SECONDS = 10;

    HttpsRequest(asio::io_context& ioc, ssl::context& ssl_ctx, std::string host, std::string port = "443");

    void get(const std::string& target, Handler handler);
    void post(const std::string& target, const std::string& body, Handler handler);

private:
    void run(Handler handler);
    void connect(const tcp::resolver::results_type& results);
    void handshake();
    void write();
    void read();
    void shutdown();
    void finish(beast::error_code ec);

    tcp::resolver resolver_;
    beast::ssl_stream<beast::tcp_stream> stream_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> req_;
    http::response<http::string_body> res_;
    std::string host_;
    std::string port_;
    Handler handler_;
};

} // namespace arbscan
