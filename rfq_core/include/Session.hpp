#pragma once
#include "Identity.hpp"
#include <string>

// Everything a requester or solver derives once at startup.
// Built by make_session() and passed by value / const ref afterwards.
struct Session {
    Keypair identity;
    std::string bucket;           // bucket_of(identity.public_key)
    std::string request_topic;    // /iLayer/1/rfq/proto
    std::string response_topic;   // /iLayer/1/<bucket>/proto
};

Session make_session();
Session make_session(Keypair identity);
