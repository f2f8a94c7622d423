#pragma once
#include <cstddef>
#include <string>

// Topic layout: /<namespace>/<version>/<bucket|rfq>/<format>
constexpr const char* kTopicNamespace  = "iLayer";
constexpr const char* kTopicVersion    = "1";
constexpr const char* kRequestSegment  = "rfq";
constexpr const char* kTopicFormat     = "proto";

constexpr std::size_t kBucketLength = 8;

// Per-session secp256k1 identity. Lives in memory only.
struct Keypair {
    std::string private_key;   // hex, no prefix
    std::string public_key;    // compressed SEC1 point, "0x" + 66 hex digits
};

// Throws IdentityError if key generation fails
Keypair new_identity();

std::string sha256_hex(const std::string& data);

// First 8 hex chars of sha256(public_key text). Deterministic.
std::string bucket_of(const std::string& public_key);

bool is_valid_bucket(const std::string& bucket);

std::string topic_for(const std::string& bucket);
std::string request_topic();
