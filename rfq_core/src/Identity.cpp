#include "Identity.hpp"
#include "RfqErrors.hpp"

#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/crypto.h>
#include <openssl/ec.h>
#include <openssl/evp.h>

#include <cstring>
#include <iomanip>
#include <memory>
#include <sstream>

static std::string hex_encode(const unsigned char* data, size_t len) {
    std::ostringstream oss;
    for (size_t i = 0; i < len; i++)
        oss << std::hex << std::setw(2) << std::setfill('0') << (int)data[i];
    return oss.str();
}

Keypair new_identity() {
    std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> pkey(
        EVP_EC_gen("secp256k1"), &EVP_PKEY_free);
    if (!pkey) throw IdentityError("secp256k1 key generation failed");

    // compressed point: 0x02/0x03 + 32-byte X
    if (!EVP_PKEY_set_utf8_string_param(pkey.get(),
                                        OSSL_PKEY_PARAM_EC_POINT_CONVERSION_FORMAT,
                                        OSSL_PKEY_EC_POINT_CONVERSION_FORMAT_COMPRESSED)) {
        throw IdentityError("cannot select compressed point format");
    }

    unsigned char* pub = nullptr;
    const size_t pub_len = EVP_PKEY_get1_encoded_public_key(pkey.get(), &pub);
    if (pub_len == 0 || !pub) throw IdentityError("cannot encode public key");

    Keypair kp;
    kp.public_key = "0x" + hex_encode(pub, pub_len);
    OPENSSL_free(pub);

    BIGNUM* priv = nullptr;
    if (!EVP_PKEY_get_bn_param(pkey.get(), OSSL_PKEY_PARAM_PRIV_KEY, &priv) || !priv)
        throw IdentityError("cannot read private key");

    unsigned char priv_bytes[32];
    const int n = BN_bn2binpad(priv, priv_bytes, sizeof(priv_bytes));
    BN_clear_free(priv);
    if (n != static_cast<int>(sizeof(priv_bytes)))
        throw IdentityError("unexpected private key size");

    kp.private_key = hex_encode(priv_bytes, sizeof(priv_bytes));
    OPENSSL_cleanse(priv_bytes, sizeof(priv_bytes));
    return kp;
}

std::string sha256_hex(const std::string& data) {
    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int outlen = 0;
    if (!EVP_Digest(data.data(), data.size(), out, &outlen, EVP_sha256(), nullptr))
        throw IdentityError("sha256 digest failed");
    return hex_encode(out, outlen);
}

std::string bucket_of(const std::string& public_key) {
    return sha256_hex(public_key).substr(0, kBucketLength);
}

bool is_valid_bucket(const std::string& bucket) {
    if (bucket.size() != kBucketLength) return false;
    for (char c : bucket) {
        const bool digit = c >= '0' && c <= '9';
        const bool lower = c >= 'a' && c <= 'f';
        if (!digit && !lower) return false;
    }
    return true;
}

static std::string make_topic(const std::string& segment) {
    return std::string("/") + kTopicNamespace + "/" + kTopicVersion + "/" +
           segment + "/" + kTopicFormat;
}

std::string topic_for(const std::string& bucket) {
    return make_topic(bucket);
}

std::string request_topic() {
    return make_topic(kRequestSegment);
}
