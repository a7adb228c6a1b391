#pragma once

#include "arbscan/websocket_client.hpp"
#include <set>

namespace arbscan {

// Exchange A. Prices are the allMids mid prices keyed by coin name.
class HyperliquidClient : public WebSocketClient {
public:
    static constexpr const char* REST_HOST = "api.hyperliquid.xyz";
    static constexpr const char* REST_TARGET = "/info";
    static constexpr const char* REST_BODY = R"({"type":"allMids"})";

    HyperliquidClient(asio::io_context& ioc, ssl::context& ssl_ctx, std::vector<std::string> symbols);

    // {"channel":"allMids","data":{"mids":{"BTC":"50000.5",...}}}
    static std::vector<PriceQuote> parse_all_mids(
        const std::string& message,
        const std::set<std::string>& symbols,
        TimePoint now
    );

    // POST /info {"type":"allMids"} response: {"BTC":"50000.5",...}
    static std::vector<PriceQuote> parse_rest_mids(
        const std::string& body,
        const std::set<std::string>& symbols,
        TimePoint now
    );

protected:
    std::string get_subscribe_message() override;
    std::vector<PriceQuote> parse_message(const std::string& message) override;

private:
    std::set<std::string> tracked_;
};

} // namespace arbscan
