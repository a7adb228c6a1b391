#pragma once

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "arbscan/price_quote.hpp"

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

namespace arbscan {

// Push-stream adapter base: TLS WebSocket with fixed-delay reconnects.
// Every parsed quote is delivered with Transport::Stream.
//
// All I/O for one client runs on its own strand, so stop() may be called
// from any thread. Once connected, a ping goes out after half the idle
// timeout without traffic; a peer that answers nothing by the full timeout
// fails the read and is reconnected like any other failure.
class WebSocketClient : public std::enable_shared_from_this<WebSocketClient> {
public:
    WebSocketClient(
        asio::io_context& ioc,
        ssl::context& ssl_ctx,
        const std::string& name,
        const std::string& host,
        const std::string& port,
        const std::string& path,
        std::vector<std::string> symbols
    );

    virtual ~WebSocketClient() = default;

    void set_callback(QuoteCallback callback) { callback_ = std::move(callback); }
    void start();
    void stop();

    const std::string& name() const { return name_; }

    // Handshake and idle limits applied to every session
    static websocket::stream_base::timeout stream_timeouts();
    std::uint64_t messages_received() const { return messages_received_.load(); }

protected:
    // Empty when the subscription is encoded in the URL path
    virtual std::string get_subscribe_message() = 0;

    // May throw json::ParseError; the frame is logged and skipped
    virtual std::vector<PriceQuote> parse_message(const std::string& message) = 0;

    std::string name_;
    std::vector<std::string> symbols_;

private:
    using Stream = websocket::stream<beast::ssl_stream<beast::tcp_stream>>;

    void open_session();
    void on_resolve(beast::error_code ec, const tcp::resolver::results_type& results);
    void on_connect(beast::error_code ec);
    void on_ssl_handshake(beast::error_code ec);
    void on_ws_handshake(beast::error_code ec);
    void subscribe();
    void read();
    void on_read(beast::error_code ec, std::size_t bytes_transferred);

    // Logs the failed stage and schedules a reconnect
    void fail(const char* stage, beast::error_code ec);
    void reconnect();
    void deliver(const std::vector<PriceQuote>& quotes);

    asio::strand<asio::io_context::executor_type> strand_;
    ssl::context& ssl_ctx_;
    tcp::resolver resolver_;
    asio::steady_timer reconnect_timer_;
    std::unique_ptr<Stream> ws_;
    beast::flat_buffer buffer_;

    std::string host_;
    std::string port_;
    std::string path_;

    QuoteCallback callback_;
    std::atomic<bool> running_;
    std::atomic<std::uint64_t> messages_received_;
    int reconnect_attempts_;

    static constexpr int MAX_RECONNECT_ATTEMPTS = 10;
    static constexpr int RECONNECT_DELAY_SECONDS = 5;
    static constexpr int CONNECT_TIMEOUT_SECONDS = 10;
    static constexpr int IDLE_TIMEOUT_SECONDS = 30;
};

} // namespace arbscan
