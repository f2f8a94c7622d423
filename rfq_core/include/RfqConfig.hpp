#pragma once
#include "CoinGeckoPriceFeed.hpp"
#include "IPriceFeed.hpp"
#include "ZmqMessageBus.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <unordered_map>

struct PriceFeedConfig {
    std::string type = "coingecko";                       // "coingecko" | "static"
    CoinGeckoParams coingecko;
    std::unordered_map<std::string, double> prices;       // used by "static"
};

struct RfqConfig {
    // relay
    std::string relay_publish_bind   = "tcp://*:5555";
    std::string relay_subscribe_bind = "tcp://*:5556";

    // clients
    ZmqBusParams bus;

    PriceFeedConfig price_feed;
    double fee_min = 0.001;
    double fee_max = 0.01;

    int retry_delay_ms      = 3000;
    int listen_wait_ms      = 10000;
    int response_timeout_ms = 30000;   // 0 = wait forever

    std::string http_address = "0.0.0.0";
    unsigned short http_port = 3000;

    std::string log_level = "info";
};

// Missing keys keep their defaults. Throws ConfigError on wrong types.
RfqConfig config_from_json(const nlohmann::json& j);

// Throws ConfigError if the file cannot be read or parsed
RfqConfig load_config(const std::string& path);

// RFQ_PUBLISH_ENDPOINT, RFQ_SUBSCRIBE_ENDPOINT, COINGECKO_API_KEY, RFQ_LOG_LEVEL
void apply_env_overrides(RfqConfig& cfg);

// Throws ConfigError on an unknown feed type
std::unique_ptr<IPriceFeed> make_price_feed(const PriceFeedConfig& cfg);
