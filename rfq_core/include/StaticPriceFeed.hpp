#pragma once
#include "IPriceFeed.hpp"
#include <mutex>
#include <string>
#include <unordered_map>

// Fixed price table (offline runs / tests). Keys are matched case-insensitively.
class StaticPriceFeed : public IPriceFeed {
public:
    StaticPriceFeed() = default;
    explicit StaticPriceFeed(const std::unordered_map<std::string, double>& prices);

    void set_price(const std::string& address, double price);
    void erase(const std::string& address);

    std::vector<Price> lookup(const std::vector<std::string>& addresses) override;

private:
    std::mutex mtx_;
    std::unordered_map<std::string, double> prices_;   // lower-case address -> price
};
