#pragma once

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <atomic>
#include <chrono>
#include <memory>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "arbscan/price_quote.hpp"

namespace asio = boost::asio;
namespace ssl = asio::ssl;

namespace arbscan {

// Periodic REST scan of both exchanges. Every parsed quote is delivered with
// Transport::Rest; a failed request skips that exchange for the cycle.
class RestPoller : public std::enable_shared_from_this<RestPoller> {
public:
    RestPoller(
        asio::io_context& ioc,
        ssl::context& ssl_ctx,
        std::vector<std::string> symbols,
        std::chrono::seconds interval
    );

    void set_callback(QuoteCallback callback) { callback_ = std::move(callback); }

    // Polls immediately, then every interval
    void start();
    void stop();

    void poll_once();

private:
    void schedule();
    void poll_binance();
    void poll_hyperliquid();
    void deliver(const char* source, const std::vector<PriceQuote>& quotes);

    asio::io_context& ioc_;
    ssl::context& ssl_ctx_;
    asio::steady_timer timer_;
    std::vector<std::string> symbols_;
    std::set<std::string> tracked_;
    std::unordered_map<std::string, std::string> binance_mapping_;
    std::chrono::seconds interval_;
    QuoteCallback callback_;
    std::atomic<bool> running_;
};

} // namespace arbscan
