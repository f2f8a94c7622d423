#include "IPriceFeed.hpp"

#include <cctype>
#include <cmath>

std::string to_lower_copy(const std::string& s) {
    std::string out = s;
    for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

std::optional<double> price_of(const std::vector<Price>& prices, const std::string& address) {
    const std::string key = to_lower_copy(address);
    for (const auto& p : prices) {
        if (to_lower_copy(p.address) != key) continue;
        if (!std::isfinite(p.price) || p.price <= 0.0) return std::nullopt;
        return p.price;
    }
    return std::nullopt;
}
