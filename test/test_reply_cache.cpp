#include <doctest/doctest.h>
#include <mailpipe/server/reply_cache.hpp>

using mailpipe::Message;
using mailpipe::ReplyCache;
using mailpipe::UdpEndpoint;

TEST_CASE("ReplyCache - lookup") {
    ReplyCache cache;
    UdpEndpoint a{"127.0.0.1", 5001};
    UdpEndpoint b{"127.0.0.1", 5002};

    CHECK_FALSE(cache.lookup(a, 1).has_value());

    cache.store(a, 1, Message{0x01});
    auto hit = cache.lookup(a, 1);
    REQUIRE(hit.has_value());
    CHECK((*hit)[0] == 0x01);

    // Same id from another address is a different request
    CHECK_FALSE(cache.lookup(b, 1).has_value());
    CHECK_FALSE(cache.lookup(a, 2).has_value());
}

TEST_CASE("ReplyCache - per-address history is bounded") {
    ReplyCache cache(3, 16);
    UdpEndpoint a{"127.0.0.1", 5001};
    for (dp::u32 id = 1; id <= 5; ++id) {
        cache.store(a, id, Message{static_cast<dp::u8>(id)});
    }
    CHECK(cache.entry_count(a) == 3);
    CHECK_FALSE(cache.lookup(a, 1).has_value());
    CHECK_FALSE(cache.lookup(a, 2).has_value());
    CHECK(cache.lookup(a, 3).has_value());
    CHECK(cache.lookup(a, 5).has_value());
}

TEST_CASE("ReplyCache - least recently used address is evicted") {
    ReplyCache cache(4, 2);
    UdpEndpoint a{"127.0.0.1", 5001};
    UdpEndpoint b{"127.0.0.1", 5002};
    UdpEndpoint c{"127.0.0.1", 5003};

    cache.store(a, 1, Message{0x0A});
    cache.store(b, 1, Message{0x0B});
    // Touch a so b becomes the oldest
    REQUIRE(cache.lookup(a, 1).has_value());

    cache.store(c, 1, Message{0x0C});
    CHECK(cache.peer_count() == 2);
    CHECK(cache.lookup(a, 1).has_value());
    CHECK_FALSE(cache.lookup(b, 1).has_value());
    CHECK(cache.lookup(c, 1).has_value());
}
