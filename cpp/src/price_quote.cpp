#include "arbscan/price_quote.hpp"
#include "arbscan/json_fields.hpp"

#include <cmath>
#include <sstream>
#include <iomanip>

namespace arbscan {

bool PriceQuote::is_valid() const {
    return !symbol.empty() && std::isfinite(price) && price > 0.0;
}

std::string PriceQuote::to_json() const {
    std::ostringstream oss;
    oss << std::setprecision(17);
    oss << "{\"exchange\":\"" << to_string(exchange) << "\","
        << "\"symbol\":" << json::quote(symbol) << ","
        << "\"price\":" << price << ","
        << "\"observedAt\":" << to_epoch_ms(observed_at) << ","
        << "\"transport\":\"" << to_string(transport) << "\"}";

    return oss.str();
}

} // namespace arbscan
