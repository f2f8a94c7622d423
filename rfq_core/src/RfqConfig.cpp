#include "RfqConfig.hpp"
#include "RfqErrors.hpp"
#include "StaticPriceFeed.hpp"

#include <cstdlib>
#include <fstream>

using json = nlohmann::json;

static std::string env_or(const char* k, const std::string& def) {
    const char* v = std::getenv(k);
    return (v && *v) ? std::string(v) : def;
}

static const json& section(const json& j, const char* key) {
    static const json empty = json::object();
    if (!j.contains(key)) return empty;
    if (!j[key].is_object())
        throw ConfigError(std::string("config section '") + key + "' is not an object");
    return j[key];
}

RfqConfig config_from_json(const json& j) {
    if (!j.is_object()) throw ConfigError("config root is not an object");

    RfqConfig c;
    try {
        // ---------- relay ----------
        const json& relay = section(j, "relay");
        c.relay_publish_bind   = relay.value("publishBind", c.relay_publish_bind);
        c.relay_subscribe_bind = relay.value("subscribeBind", c.relay_subscribe_bind);

        // ---------- bus ----------
        const json& bus = section(j, "bus");
        c.bus.publish_endpoint     = bus.value("publishEndpoint", c.bus.publish_endpoint);
        c.bus.subscribe_endpoint   = bus.value("subscribeEndpoint", c.bus.subscribe_endpoint);
        c.bus.peer_timeout_ms      = bus.value("peerTimeoutMs", c.bus.peer_timeout_ms);
        c.bus.subscribe_timeout_ms = bus.value("subscribeTimeoutMs", c.bus.subscribe_timeout_ms);
        c.bus.linger_ms            = bus.value("lingerMs", c.bus.linger_ms);

        // ---------- price feed ----------
        const json& pf = section(j, "priceFeed");
        c.price_feed.type                   = pf.value("type", c.price_feed.type);
        c.price_feed.coingecko.base_url     = pf.value("baseUrl", c.price_feed.coingecko.base_url);
        c.price_feed.coingecko.platform     = pf.value("platform", c.price_feed.coingecko.platform);
        c.price_feed.coingecko.vs_currency  = pf.value("vsCurrency", c.price_feed.coingecko.vs_currency);
        c.price_feed.coingecko.api_key      = pf.value("apiKey", c.price_feed.coingecko.api_key);
        c.price_feed.coingecko.timeout_ms   = pf.value("timeoutMs", c.price_feed.coingecko.timeout_ms);
        if (pf.contains("prices")) {
            for (const auto& [addr, px] : section(pf, "prices").items()) {
                c.price_feed.prices[addr] = px.get<double>();
            }
        }

        // ---------- fee ----------
        const json& fee = section(j, "fee");
        c.fee_min = fee.value("min", c.fee_min);
        c.fee_max = fee.value("max", c.fee_max);

        // ---------- protocol ----------
        c.retry_delay_ms      = j.value("retryDelayMs", c.retry_delay_ms);
        c.listen_wait_ms      = j.value("listenWaitMs", c.listen_wait_ms);
        c.response_timeout_ms = j.value("responseTimeoutMs", c.response_timeout_ms);

        // ---------- http ----------
        const json& http = section(j, "http");
        c.http_address = http.value("address", c.http_address);
        c.http_port    = http.value("port", c.http_port);

        c.log_level = j.value("logLevel", c.log_level);
    } catch (const json::exception& e) {
        throw ConfigError(std::string("bad config value: ") + e.what());
    }

    if (c.fee_min < 0.0 || c.fee_max >= 1.0 || c.fee_min > c.fee_max)
        throw ConfigError("fee range must satisfy 0 <= min <= max < 1");
    if (c.retry_delay_ms <= 0)
        throw ConfigError("retryDelayMs must be positive");

    return c;
}

RfqConfig load_config(const std::string& path) {
    // ---------- Open config file ----------
    std::ifstream cfg(path);
    if (!cfg.is_open()) {
        throw ConfigError("Failed to open " + path);
    }

    // ---------- Parse JSON ----------
    json j = json::parse(cfg, nullptr, false);
    if (j.is_discarded()) {
        throw ConfigError(path + " is not valid JSON");
    }
    return config_from_json(j);
}

void apply_env_overrides(RfqConfig& cfg) {
    cfg.bus.publish_endpoint   = env_or("RFQ_PUBLISH_ENDPOINT", cfg.bus.publish_endpoint);
    cfg.bus.subscribe_endpoint = env_or("RFQ_SUBSCRIBE_ENDPOINT", cfg.bus.subscribe_endpoint);
    cfg.price_feed.coingecko.api_key = env_or("COINGECKO_API_KEY", cfg.price_feed.coingecko.api_key);
    cfg.log_level = env_or("RFQ_LOG_LEVEL", cfg.log_level);
}

std::unique_ptr<IPriceFeed> make_price_feed(const PriceFeedConfig& cfg) {
    if (cfg.type == "coingecko") return std::make_unique<CoinGeckoPriceFeed>(cfg.coingecko);
    if (cfg.type == "static")    return std::make_unique<StaticPriceFeed>(cfg.prices);
    throw ConfigError("unknown priceFeed.type '" + cfg.type + "'");
}
