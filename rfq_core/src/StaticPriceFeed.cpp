#include "StaticPriceFeed.hpp"

StaticPriceFeed::StaticPriceFeed(const std::unordered_map<std::string, double>& prices) {
    for (const auto& [addr, px] : prices) {
        prices_[to_lower_copy(addr)] = px;
    }
}

void StaticPriceFeed::set_price(const std::string& address, double price) {
    std::lock_guard<std::mutex> lk(mtx_);
    prices_[to_lower_copy(address)] = price;
}

void StaticPriceFeed::erase(const std::string& address) {
    std::lock_guard<std::mutex> lk(mtx_);
    prices_.erase(to_lower_copy(address));
}

std::vector<Price> StaticPriceFeed::lookup(const std::vector<std::string>& addresses) {
    std::lock_guard<std::mutex> lk(mtx_);

    std::vector<Price> out;
    for (const auto& addr : addresses) {
        auto it = prices_.find(to_lower_copy(addr));
        if (it == prices_.end()) continue;
        out.push_back({it->first, it->second});
    }
    return out;
}
