#include "Session.hpp"

Session make_session() {
    return make_session(new_identity());
}

Session make_session(Keypair identity) {
    Session s;
    s.bucket         = bucket_of(identity.public_key);
    s.request_topic  = request_topic();
    s.response_topic = topic_for(s.bucket);
    s.identity       = std::move(identity);
    return s;
}
