#include "PricingEngine.hpp"
#include "Log.hpp"
#include "RfqErrors.hpp"

#include <cmath>
#include <random>
#include <utility>

UniformFee::UniformFee(double min, double max)
    : min_(min), max_(max)
{
    if (max_ < min_) std::swap(min_, max_);
}

double UniformFee::operator()() const {
    thread_local std::mt19937_64 gen{std::random_device{}()};
    std::uniform_real_distribution<double> dist(min_, max_);
    return dist(gen);
}

PricingEngine::PricingEngine(IPriceFeed& feed, FeeSource fee)
    : feed_(feed), fee_(std::move(fee))
{}

std::vector<std::string> PricingEngine::extract_addresses(const QuoteRequest& r) {
    std::vector<std::string> out;
    out.reserve(r.from.tokens.size() + r.to.tokens.size());
    for (const auto& t : r.from.tokens) out.push_back(t.address);
    for (const auto& t : r.to.tokens)   out.push_back(t.address);
    return out;
}

std::vector<TokenAmount> PricingEngine::price_destinations(
    const std::vector<TokenWeight>& to,
    double source_value,
    const std::vector<Price>& prices) const
{
    std::vector<TokenAmount> out;
    out.reserve(to.size());

    for (const auto& tok : to) {
        auto px = price_of(prices, tok.address);
        if (!px) {
            LogLine(LogLevel::Warn, "Pricing") << "Price not found for destination " << tok.address;
            out.push_back({tok.address, 0.0});
            continue;
        }

        const double dest_value = source_value * tok.weight / 100.0;
        const double dest_qty   = dest_value / *px;
        const double fee        = fee_ ? fee_() : 0.0;
        const double amount     = dest_qty * (1.0 - fee);

        // JSON has no inf/nan; report it like an unknown price
        if (!std::isfinite(amount)) {
            LogLine(LogLevel::Warn, "Pricing") << "Non-finite amount for destination " << tok.address;
            out.push_back({tok.address, 0.0});
            continue;
        }
        out.push_back({tok.address, amount});
    }
    return out;
}

QuoteResponse PricingEngine::quote(const QuoteRequest& r, const std::string& solver) const {
    if (r.from.tokens.empty()) {
        throw PricingError(PricingError::Kind::NoSourceToken, "request has no source token");
    }

    const auto prices = feed_.lookup(extract_addresses(r));
    const TokenWeight& src = r.from.tokens.front();

    auto src_px = price_of(prices, src.address);
    if (!src_px) {
        throw PricingError(PricingError::Kind::MissingSourcePrice,
                           "missing source price for " + src.address);
    }

    // weight of the source token is an absolute quantity
    const double source_value = src.weight * *src_px;

    QuoteResponse resp;
    resp.solver       = solver;
    resp.from.network = r.from.network;
    for (const auto& t : r.from.tokens) {
        resp.from.tokens.push_back({t.address, t.weight});
    }
    resp.to.network = r.to.network;
    resp.to.tokens  = price_destinations(r.to.tokens, source_value, prices);
    return resp;
}
