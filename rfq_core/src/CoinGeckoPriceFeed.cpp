#include "CoinGeckoPriceFeed.hpp"
#include "Log.hpp"
#include "RfqErrors.hpp"

#include <curl/curl.h>
#include <nlohmann/json.hpp>

#include <unordered_set>

using json = nlohmann::json;

static size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* s = static_cast<std::string*>(userdata);
    s->append(ptr, size * nmemb);
    return size * nmemb;
}

CoinGeckoPriceFeed::CoinGeckoPriceFeed(CoinGeckoParams p)
    : p_(std::move(p))
{}

std::string CoinGeckoPriceFeed::url_for(const std::string& address) const {
    return p_.base_url + "/simple/token_price/" + p_.platform +
           "?contract_addresses=" + address +
           "&vs_currencies=" + p_.vs_currency;
}

std::string CoinGeckoPriceFeed::http_get(const std::string& url) const {
    CURL* curl = curl_easy_init();
    if (!curl) throw TransportError("curl init failed");

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Accept: application/json");
    if (!p_.api_key.empty()) {
        headers = curl_slist_append(headers, ("x-cg-demo-api-key: " + p_.api_key).c_str());
    }

    std::string resp;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &resp);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, p_.timeout_ms);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);   // callbacks run on worker threads

    // TLS verify ON
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);

    CURLcode rc = curl_easy_perform(curl);

    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (rc != CURLE_OK) {
        throw TransportError(std::string("curl perform failed: ") + curl_easy_strerror(rc));
    }
    if (status < 200 || status >= 300) {
        throw TransportError("HTTP error status " + std::to_string(status));
    }
    return resp;
}

std::optional<double> CoinGeckoPriceFeed::parse_price(const std::string& body,
                                                      const std::string& address,
                                                      const std::string& vs_currency)
{
    const json j = json::parse(body);
    const std::string key = to_lower_copy(address);

    if (!j.is_object() || !j.contains(key)) return std::nullopt;
    const auto& entry = j[key];
    if (!entry.is_object() || !entry.contains(vs_currency)) return std::nullopt;
    if (!entry[vs_currency].is_number()) return std::nullopt;

    return entry[vs_currency].get<double>();
}

std::vector<Price> CoinGeckoPriceFeed::lookup(const std::vector<std::string>& addresses) {
    std::vector<Price> prices;
    std::unordered_set<std::string> seen;

    // sequential round trips; duplicates are fetched once
    for (const auto& address : addresses) {
        const std::string key = to_lower_copy(address);
        if (!seen.insert(key).second) continue;

        try {
            const std::string body = http_get(url_for(key));
            auto px = parse_price(body, key, p_.vs_currency);
            if (px) {
                prices.push_back({key, *px});
            } else {
                LogLine(LogLevel::Warn, "PriceFeed") << "Price not found for " << address;
            }
        } catch (const TransportError& e) {
            LogLine(LogLevel::Error, "PriceFeed") << "Error fetching token price for " << address << ": " << e.what();
        } catch (const json::exception& e) {
            LogLine(LogLevel::Error, "PriceFeed") << "Bad price payload for " << address << ": " << e.what();
        }
    }

    return prices;
}
