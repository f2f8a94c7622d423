#include "QuoteCodec.hpp"
#include "RfqErrors.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// ---------------- encode ----------------

static json side_to_json(const RequestSide& s) {
    json tokens = json::array();
    for (const auto& t : s.tokens) {
        tokens.push_back({{"address", t.address}, {"weight", t.weight}});
    }
    return {{"network", s.network}, {"tokens", tokens}};
}

static json side_to_json(const ResponseSide& s) {
    json tokens = json::array();
    for (const auto& t : s.tokens) {
        tokens.push_back({{"address", t.address}, {"amount", t.amount}});
    }
    return {{"network", s.network}, {"tokens", tokens}};
}

std::string encode_request(const QuoteRequest& r) {
    json j;
    j["bucket"] = r.bucket;
    j["from"]   = side_to_json(r.from);
    j["to"]     = side_to_json(r.to);
    return j.dump();
}

std::string encode_response(const QuoteResponse& r) {
    json j;
    j["solver"] = r.solver;
    j["from"]   = side_to_json(r.from);
    j["to"]     = side_to_json(r.to);
    return j.dump();
}

// ---------------- decode ----------------

static json parse_object(const std::string& payload) {
    json j = json::parse(payload, nullptr, false);
    if (j.is_discarded())
        throw CodecError("payload is not valid JSON");
    if (!j.is_object())
        throw CodecError("payload root is not an object");
    return j;
}

static std::string get_string(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return "";
    if (!j[key].is_string())
        throw CodecError(std::string("field '") + key + "' is not a string");
    return j[key].get<std::string>();
}

static double get_number(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return 0.0;
    if (!j[key].is_number())
        throw CodecError(std::string("field '") + key + "' is not a number");
    return j[key].get<double>();
}

static const json& get_object(const json& j, const char* key) {
    static const json empty = json::object();
    if (!j.contains(key) || j[key].is_null()) return empty;
    if (!j[key].is_object())
        throw CodecError(std::string("field '") + key + "' is not an object");
    return j[key];
}

static const json& get_array(const json& j, const char* key) {
    static const json empty = json::array();
    if (!j.contains(key) || j[key].is_null()) return empty;
    if (!j[key].is_array())
        throw CodecError(std::string("field '") + key + "' is not an array");
    return j[key];
}

static RequestSide request_side_from_json(const json& j) {
    RequestSide s;
    s.network = get_string(j, "network");
    for (const auto& t : get_array(j, "tokens")) {
        if (!t.is_object()) throw CodecError("token entry is not an object");
        s.tokens.push_back({get_string(t, "address"), get_number(t, "weight")});
    }
    return s;
}

static ResponseSide response_side_from_json(const json& j) {
    ResponseSide s;
    s.network = get_string(j, "network");
    for (const auto& t : get_array(j, "tokens")) {
        if (!t.is_object()) throw CodecError("token entry is not an object");
        s.tokens.push_back({get_string(t, "address"), get_number(t, "amount")});
    }
    return s;
}

QuoteRequest decode_request(const std::string& payload) {
    const json j = parse_object(payload);

    QuoteRequest r;
    r.bucket = get_string(j, "bucket");
    r.from   = request_side_from_json(get_object(j, "from"));
    r.to     = request_side_from_json(get_object(j, "to"));
    return r;
}

QuoteResponse decode_response(const std::string& payload) {
    const json j = parse_object(payload);

    QuoteResponse r;
    r.solver = get_string(j, "solver");
    r.from   = response_side_from_json(get_object(j, "from"));
    r.to     = response_side_from_json(get_object(j, "to"));
    return r;
}
