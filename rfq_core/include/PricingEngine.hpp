#pragma once
#include "IPriceFeed.hpp"
#include "QuoteTypes.hpp"
#include <functional>
#include <string>
#include <vector>

// Draws the fee fraction applied to one destination token
using FeeSource = std::function<double()>;

// Uniform over [min, max]. Copyable, safe to call from several threads.
class UniformFee {
public:
    UniformFee(double min = 0.001, double max = 0.01);

    double operator()() const;

    double min() const { return min_; }
    double max() const { return max_; }

private:
    double min_;
    double max_;
};

class PricingEngine {
public:
    explicit PricingEngine(IPriceFeed& feed, FeeSource fee = UniformFee{});

    // from-token addresses followed by to-token addresses, duplicates kept
    static std::vector<std::string> extract_addresses(const QuoteRequest& r);

    // Prices the request.
    //   source value = from.tokens[0].weight (a quantity) * source price
    //   dest amount  = source value * weight / 100 / dest price * (1 - fee)
    // Unknown destination price or a non-finite amount -> amount 0 (warning),
    // others unaffected.
    // Throws PricingError if from.tokens is empty or the source price is unknown.
    QuoteResponse quote(const QuoteRequest& r, const std::string& solver) const;

    std::vector<TokenAmount> price_destinations(const std::vector<TokenWeight>& to,
                                                double source_value,
                                                const std::vector<Price>& prices) const;

private:
    IPriceFeed& feed_;
    FeeSource fee_;
};
