#include <gtest/gtest.h>
#include "Identity.hpp"
#include "Session.hpp"

#include <cctype>
#include <set>

TEST(IdentityTest, Sha256KnownVector) {
    EXPECT_EQ(sha256_hex("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(sha256_hex(""),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(IdentityTest, BucketIsFirstEightHexOfDigest) {
    EXPECT_EQ(bucket_of("abc"), "ba7816bf");
}

TEST(IdentityTest, BucketIsDeterministic) {
    const std::string key = "0x02a1b2c3d4e5f60718293a4b5c6d7e8f90a1b2c3d4e5f60718293a4b5c6d7e8f90";
    const std::string b1 = bucket_of(key);
    const std::string b2 = bucket_of(key);

    EXPECT_EQ(b1, b2);
    EXPECT_EQ(b1.size(), kBucketLength);
    EXPECT_TRUE(is_valid_bucket(b1));
}

TEST(IdentityTest, NewIdentityHasCompressedPublicKey) {
    Keypair kp = new_identity();

    ASSERT_EQ(kp.public_key.size(), 2u + 66u);
    EXPECT_EQ(kp.public_key.substr(0, 2), "0x");
    const std::string prefix = kp.public_key.substr(2, 2);
    EXPECT_TRUE(prefix == "02" || prefix == "03");
    for (size_t i = 2; i < kp.public_key.size(); ++i) {
        EXPECT_TRUE(std::isxdigit(static_cast<unsigned char>(kp.public_key[i])));
    }
    EXPECT_EQ(kp.private_key.size(), 64u);
}

TEST(IdentityTest, DistinctIdentitiesGiveDistinctBuckets) {
    std::set<std::string> keys;
    std::set<std::string> buckets;
    for (int i = 0; i < 16; ++i) {
        Keypair kp = new_identity();
        keys.insert(kp.public_key);
        buckets.insert(bucket_of(kp.public_key));
    }
    EXPECT_EQ(keys.size(), 16u);
    EXPECT_EQ(buckets.size(), 16u);
}

TEST(IdentityTest, ValidBucketRules) {
    EXPECT_TRUE(is_valid_bucket("ab12cd34"));
    EXPECT_TRUE(is_valid_bucket("00000000"));
    EXPECT_FALSE(is_valid_bucket(""));
    EXPECT_FALSE(is_valid_bucket("ab12cd3"));
    EXPECT_FALSE(is_valid_bucket("ab12cd345"));
    EXPECT_FALSE(is_valid_bucket("AB12CD34"));
    EXPECT_FALSE(is_valid_bucket("ab12/d34"));
    EXPECT_FALSE(is_valid_bucket("rfq"));
}

TEST(IdentityTest, TopicLayout) {
    EXPECT_EQ(request_topic(), "/iLayer/1/rfq/proto");
    EXPECT_EQ(topic_for("ab12cd34"), "/iLayer/1/ab12cd34/proto");
    EXPECT_EQ(topic_for("ab12cd34"), topic_for("ab12cd34"));
}

TEST(SessionTest, DerivedFieldsAreConsistent) {
    Keypair kp;
    kp.public_key = "0x03deadbeef";
    Session s = make_session(kp);

    EXPECT_EQ(s.identity.public_key, "0x03deadbeef");
    EXPECT_EQ(s.bucket, bucket_of("0x03deadbeef"));
    EXPECT_EQ(s.request_topic, "/iLayer/1/rfq/proto");
    EXPECT_EQ(s.response_topic, topic_for(s.bucket));
}

TEST(SessionTest, FreshSessionsDiffer) {
    Session a = make_session();
    Session b = make_session();
    EXPECT_NE(a.identity.public_key, b.identity.public_key);
    EXPECT_NE(a.response_topic, b.response_topic);
    EXPECT_EQ(a.request_topic, b.request_topic);
}
