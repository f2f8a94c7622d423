#pragma once
#include "QuoteTypes.hpp"
#include <optional>
#include <string>
#include <vector>

class IPriceFeed {
public:
    virtual ~IPriceFeed() = default;

    // Partial results are valid: addresses without a price are simply absent.
    // Must not throw for a single failed address.
    virtual std::vector<Price> lookup(const std::vector<std::string>& addresses) = 0;
};

// Case-insensitive match. A zero, negative or non-finite price counts as unknown.
std::optional<double> price_of(const std::vector<Price>& prices, const std::string& address);

std::string to_lower_copy(const std::string& s);
