#pragma once
#include <string>
#include <vector>

// One token inside one side of a request.
// For the first source token the weight is an absolute quantity,
// for destination tokens it is a 0-100 share of the source value.
struct TokenWeight {
    std::string address;     // contract address, e.g. "0xc02a..."
    double weight = 0.0;

    bool operator==(const TokenWeight& o) const {
        return address == o.address && weight == o.weight;
    }
};

struct TokenAmount {
    std::string address;
    double amount = 0.0;     // absolute token quantity

    bool operator==(const TokenAmount& o) const {
        return address == o.address && amount == o.amount;
    }
};

struct RequestSide {
    std::string network;     // "mainnet", "base", ...
    std::vector<TokenWeight> tokens;

    bool operator==(const RequestSide& o) const {
        return network == o.network && tokens == o.tokens;
    }
};

struct ResponseSide {
    std::string network;
    std::vector<TokenAmount> tokens;

    bool operator==(const ResponseSide& o) const {
        return network == o.network && tokens == o.tokens;
    }
};

struct QuoteRequest {
    std::string bucket;      // correlation key, names the response topic
    RequestSide from;
    RequestSide to;

    bool operator==(const QuoteRequest& o) const {
        return bucket == o.bucket && from == o.from && to == o.to;
    }
};

struct QuoteResponse {
    std::string solver;      // solver public key
    ResponseSide from;
    ResponseSide to;

    bool operator==(const QuoteResponse& o) const {
        return solver == o.solver && from == o.from && to == o.to;
    }
};

// Spot price in the reference fiat unit (USD)
struct Price {
    std::string address;
    double price = 0.0;
};
