#include "arbscan/binance_client.hpp"
#include "arbscan/clock.hpp"
#include "arbscan/json_fields.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace arbscan {

namespace {
    std::string url_encode(const std::string& s) {
        std::ostringstream oss;
        oss << std::hex << std::uppercase;
        for (unsigned char c : s) {
            if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
                oss << c;
            } else {
                oss << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
            }
        }
        return oss.str();
    }

    std::string lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), ::tolower);
        return s;
    }
}

BinanceClient::BinanceClient(asio::io_context& ioc, ssl::context& ssl_ctx, std::vector<std::string> symbols)
    : WebSocketClient(
        ioc,
        ssl_ctx,
        "Binance",
        "stream.binance.com",
        "9443",
        stream_path(symbols),
        symbols
    )
    , reverse_mapping_(make_reverse_mapping(symbols))
{
}

std::unordered_map<std::string, std::string> BinanceClient::make_reverse_mapping(const std::vector<std::string>& symbols) {
    std::unordered_map<std::string, std::string> mapping;
    for (const auto& symbol : symbols) {
        mapping[symbol + "USDT"] = symbol;
    }
    return mapping;
}

std::string BinanceClient::stream_path(const std::vector<std::string>& symbols) {
    std::string path = "/ws";
    for (const auto& symbol : symbols) {
        path += "/" + lower(symbol) + "usdt@ticker";
    }
    return path;
}

std::string BinanceClient::rest_target(const std::vector<std::string>& symbols) {
    std::string list = "[";
    for (std::size_t i = 0; i < symbols.size(); ++i) {
        if (i > 0) list += ",";
        list += "\"" + symbols[i] + "USDT\"";
    }
    list += "]";
    return "/api/v3/ticker/price?symbols=" + url_encode(list);
}

std::string BinanceClient::get_subscribe_message() {
    // Binance uses URL-based subscription, no message needed
    return "";
}

std::vector<PriceQuote> BinanceClient::parse_message(const std::string& message) {
    return parse_ticker(message, reverse_mapping_, SystemClock().now());
}

std::vector<PriceQuote> BinanceClient::parse_ticker(
    const std::string& message,
    const std::unordered_map<std::string, std::string>& reverse_mapping,
    TimePoint now
) {
    // {"e":"24hrTicker","E":123456789,"s":"BTCUSDT","c":"50000.00",...}
    json::FlatObject obj = json::parse_object(message);
    if (const json::Value* data = obj.find("data"); data && data->kind == json::Kind::Object) {
        obj = json::parse_object(data->text);
    }

    const auto event = obj.find_string("e");
    if (!event || *event != "24hrTicker") {
        return {};
    }

    auto it = reverse_mapping.find(obj.get_string("s"));
    if (it == reverse_mapping.end()) {
        return {};
    }

    PriceQuote quote;
    quote.exchange = ExchangeId::Binance;
    quote.symbol = it->second;
    quote.price = obj.get_double("c");
    quote.observed_at = now;
    quote.transport = Transport::Stream;
    return {quote};
}

std::vector<PriceQuote> BinanceClient::parse_rest_prices(
    const std::string& body,
    const std::unordered_map<std::string, std::string>& reverse_mapping,
    TimePoint now
) {
    std::vector<PriceQuote> quotes;
    for (const auto& element : json::split_array(body)) {
        const json::FlatObject obj = json::parse_object(element);

        auto it = reverse_mapping.find(obj.get_string("symbol"));
        if (it == reverse_mapping.end()) {
            continue;
        }

        PriceQuote quote;
        quote.exchange = ExchangeId::Binance;
        quote.symbol = it->second;
        quote.price = obj.get_double("price");
        quote.observed_at = now;
        quote.transport = Transport::Rest;
        quotes.push_back(quote);
    }
    return quotes;
}

} // namespace arbscan
