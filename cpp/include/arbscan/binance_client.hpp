#pragma once

#include "arbscan/websocket_client.hpp"
#include <unordered_map>

namespace arbscan {

// Exchange B. Symbols are base assets quoted in USDT (BTC <-> BTCUSDT).
class BinanceClient : public WebSocketClient {
public:
    static constexpr const char* REST_HOST = "api.binance.com";

    BinanceClient(asio::io_context& ioc, ssl::context& ssl_ctx, std::vector<std::string> symbols);

    // 24hrTicker event, bare or wrapped in a combined-stream envelope
    static std::vector<PriceQuote> parse_ticker(
        const std::string& message,
        const std::unordered_map<std::string, std::string>& reverse_mapping,
        TimePoint now
    );

    // GET /api/v3/ticker/price response: [{"symbol":"BTCUSDT","price":"..."}]
    static std::vector<PriceQuote> parse_rest_prices(
        const std::string& body,
        const std::unordered_map<std::string, std::string>& reverse_mapping,
        TimePoint now
    );

    static std::string rest_target(const std::vector<std::string>& symbols);
    static std::string stream_path(const std::vector<std::string>& symbols);

    // BTCUSDT -> BTC for every tracked symbol
    static std::unordered_map<std::string, std::string> make_reverse_mapping(const std::vector<std::string>& symbols);

protected:
    std::string get_subscribe_message() override;
    std::vector<PriceQuote> parse_message(const std::string& message) override;

private:
    std::unordered_map<std::string, std::string> reverse_mapping_;
};

} // namespace arbscan
