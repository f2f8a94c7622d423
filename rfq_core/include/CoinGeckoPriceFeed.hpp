#pragma once
#include "IPriceFeed.hpp"
#include <optional>
#include <string>

struct CoinGeckoParams {
    std::string base_url    = "https://api.coingecko.com/api/v3";
    std::string platform    = "ethereum";
    std::string vs_currency = "usd";
    std::string api_key;            // optional demo key (x-cg-demo-api-key)
    long timeout_ms         = 5000;
};

// One blocking GET per distinct address:
//   <base>/simple/token_price/<platform>?contract_addresses=<addr>&vs_currencies=<vs>
// Failures are logged per address; that address is left out of the result.
class CoinGeckoPriceFeed : public IPriceFeed {
public:
    explicit CoinGeckoPriceFeed(CoinGeckoParams p = {});

    std::vector<Price> lookup(const std::vector<std::string>& addresses) override;

    std::string url_for(const std::string& address) const;

    // {"<lower addr>": {"usd": 3123.4}} -> 3123.4
    // Returns nullopt if the body has no price for this address. Throws on bad JSON.
    static std::optional<double> parse_price(const std::string& body,
                                             const std::string& address,
                                             const std::string& vs_currency);

private:
    // Returns HTTP body. Throws TransportError on curl failure or non-2xx status.
    std::string http_get(const std::string& url) const;

private:
    CoinGeckoParams p_;
};
