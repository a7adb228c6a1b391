#include "arbscan/hyperliquid_client.hpp"
#include "arbscan/clock.hpp"
#include "arbscan/json_fields.hpp"

namespace arbscan {

namespace {
    std::vector<PriceQuote> quotes_from_mids(
        const json::FlatObject& mids,
        const std::set<std::string>& symbols,
        TimePoint now,
        Transport transport
    ) {
        std::vector<PriceQuote> quotes;
        for (const auto& symbol : symbols) {
            const json::Value* mid = mids.find(symbol);
            if (!mid) {
                continue;
            }

            PriceQuote quote;
            quote.exchange = ExchangeId::Hyperliquid;
            quote.symbol = symbol;
            quote.price = json::to_double(*mid);
            quote.observed_at = now;
            quote.transport = transport;
            quotes.push_back(quote);
        }
        return quotes;
    }
}

HyperliquidClient::HyperliquidClient(asio::io_context& ioc, ssl::context& ssl_ctx, std::vector<std::string> symbols)
    : WebSocketClient(
        ioc,
        ssl_ctx,
        "Hyperliquid",
        "api.hyperliquid.xyz",
        "443",
        "/ws",
        symbols
    )
    , tracked_(symbols.begin(), symbols.end())
{
}

std::string HyperliquidClient::get_subscribe_message() {
    return R"({"method":"subscribe","subscription":{"type":"allMids"}})";
}

std::vector<PriceQuote> HyperliquidClient::parse_message(const std::string& message) {
    return parse_all_mids(message, tracked_, SystemClock().now());
}

std::vector<PriceQuote> HyperliquidClient::parse_all_mids(
    const std::string& message,
    const std::set<std::string>& symbols,
    TimePoint now
) {
    const json::FlatObject obj = json::parse_object(message);

    // subscriptionResponse and pong frames carry no prices
    const auto channel = obj.find_string("channel");
    if (!channel || *channel != "allMids") {
        return {};
    }

    const json::Value* data = obj.find("data");
    if (!data || data->kind != json::Kind::Object) {
        return {};
    }

    json::FlatObject mids = json::parse_object(data->text);
    if (const json::Value* inner = mids.find("mids"); inner && inner->kind == json::Kind::Object) {
        mids = json::parse_object(inner->text);
    }
    return quotes_from_mids(mids, symbols, now, Transport::Stream);
}

std::vector<PriceQuote> HyperliquidClient::parse_rest_mids(
    const std::string& body,
    const std::set<std::string>& symbols,
    TimePoint now
) {
    return quotes_from_mids(json::parse_object(body), symbols, now, Transport::Rest);
}

} // namespace arbscan
