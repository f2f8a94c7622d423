#pragma once
#include "QuoteTypes.hpp"
#include <string>

// JSON wire codec for the two RFQ messages.
//
// Missing fields decode to their defaults (empty string / list, 0).
// Anything that is not a JSON object, or a field of the wrong type,
// throws CodecError.
std::string encode_request(const QuoteRequest& r);
QuoteRequest decode_request(const std::string& payload);

std::string encode_response(const QuoteResponse& r);
QuoteResponse decode_response(const std::string& payload);
