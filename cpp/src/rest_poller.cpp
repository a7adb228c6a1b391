#include "arbscan/rest_poller.hpp"
#include "arbscan/binance_client.hpp"
#include "arbscan/clock.hpp"
#include "arbscan/https_request.hpp"
#include "arbscan/hyperliquid_client.hpp"

#include <iostream>

namespace arbscan {

RestPoller::RestPoller(
    asio::io_context& ioc,
    ssl::context& ssl_ctx,
    std::vector<std::string> symbols,
    std::chrono::seconds interval
)
    : ioc_(ioc)
    , ssl_ctx_(ssl_ctx)
    , timer_(ioc)
    , symbols_(std::move(symbols))
    , tracked_(symbols_.begin(), symbols_.end())
    , binance_mapping_(BinanceClient::make_reverse_mapping(symbols_))
    , interval_(interval)
    , running_(false)
{
}

void RestPoller::start() {
    running_ = true;
    std::cout << "[RestPoller] Polling " << symbols_.size() << " symbols every "
              << interval_.count() << "s" << std::endl;
    poll_once();
    schedule();
}

void RestPoller::stop() {
    running_ = false;
    asio::post(ioc_, [self = shared_from_this()]() {
        self->timer_.cancel();
    });
    std::cout << "[RestPoller] Stopped" << std::endl;
}

void RestPoller::schedule() {
    timer_.expires_after(interval_);
    timer_.async_wait([self = shared_from_this()](boost::system::error_code ec) {
        if (ec == asio::error::operation_aborted || !self->running_) {
            return;
        }
        self->poll_once();
        self->schedule();
    });
}

void RestPoller::poll_once() {
    poll_hyperliquid();
    poll_binance();
}

void RestPoller::poll_binance() {
    auto request = std::make_shared<HttpsRequest>(ioc_, ssl_ctx_, BinanceClient::REST_HOST);
    request->get(
        BinanceClient::rest_target(symbols_),
        [self = shared_from_this()](beast::error_code ec, unsigned status, const std::string& body) {
            if (ec) {
                std::cerr << "[RestPoller] Binance request failed: " << ec.message() << std::endl;
                return;
            }
            if (status != 200) {
                std::cerr << "[RestPoller] Binance HTTP status " << status << std::endl;
                return;
            }
            try {
                self->deliver("Binance", BinanceClient::parse_rest_prices(body, self->binance_mapping_, SystemClock().now()));
            } catch (const std::exception& e) {
                std::cerr << "[RestPoller] Binance parse error: " << e.what() << std::endl;
            }
        }
    );
}

void RestPoller::poll_hyperliquid() {
    auto request = std::make_shared<HttpsRequest>(ioc_, ssl_ctx_, HyperliquidClient::REST_HOST);
    request->post(
        HyperliquidClient::REST_TARGET,
        HyperliquidClient::REST_BODY,
        [self = shared_from_this()](beast::error_code ec, unsigned status, const std::string& body) {
            if (ec) {
                std::cerr << "[RestPoller] Hyperliquid request failed: " << ec.message() << std::endl;
                return;
            }
            if (status != 200) {
                std::cerr << "[RestPoller] Hyperliquid HTTP status " << status << std::endl;
                return;
            }
            try {
                self->deliver("Hyperliquid", HyperliquidClient::parse_rest_mids(body, self->tracked_, SystemClock().now()));
            } catch (const std::exception& e) {
                std::cerr << "[RestPoller] Hyperliquid parse error: " << e.what() << std::endl;
            }
        }
    );
}

void RestPoller::deliver(const char* source, const std::vector<PriceQuote>& quotes) {
    if (!callback_ || !running_) {
        return;
    }
    for (const auto& quote : quotes) {
        try {
            callback_(quote);
        } catch (const std::exception& e) {
            std::cerr << "[RestPoller] " << source << " quote for " << quote.symbol
                      << " rejected: " << e.what() << std::endl;
        }
    }
}

} // namespace arbscan
