#include <doctest/doctest.h>
#include <mailpipe/endpoint.hpp>

#include <map>

TEST_CASE("UdpEndpoint") {
    SUBCASE("Create and convert to string") {
        mailpipe::UdpEndpoint endpoint{"127.0.0.1", 9090};
        CHECK(endpoint.host == "127.0.0.1");
        CHECK(endpoint.port == 9090);
        CHECK(endpoint.to_string() == "127.0.0.1:9090");
    }

    SUBCASE("Equality compares host and port") {
        mailpipe::UdpEndpoint a{"127.0.0.1", 12000};
        mailpipe::UdpEndpoint b{"127.0.0.1", 12000};
        mailpipe::UdpEndpoint c{"127.0.0.1", 12001};
        mailpipe::UdpEndpoint d{"127.0.0.2", 12000};
        CHECK(a == b);
        CHECK(a != c);
        CHECK(a != d);
    }

    SUBCASE("Ordering keys a map by address") {
        std::map<mailpipe::UdpEndpoint, int> peers;
        peers[{"10.0.0.2", 1}] = 1;
        peers[{"10.0.0.1", 2}] = 2;
        peers[{"10.0.0.1", 1}] = 3;
        peers[{"10.0.0.1", 1}] = 4;
        REQUIRE(peers.size() == 3);
        auto it = peers.begin();
        CHECK(it->first.port == 1);
        CHECK(it->second == 4);
        ++it;
        CHECK(it->first.port == 2);
    }
}

TEST_CASE("resolve_endpoint") {
    SUBCASE("Numeric address is unchanged") {
        auto res = mailpipe::resolve_endpoint({"127.0.0.1", 12000});
        REQUIRE(res.is_ok());
        CHECK(res.value().host == "127.0.0.1");
        CHECK(res.value().port == 12000);
    }

    SUBCASE("localhost resolves to loopback") {
        auto res = mailpipe::resolve_endpoint({"localhost", 12000});
        REQUIRE(res.is_ok());
        CHECK(res.value().host == "127.0.0.1");
    }

    SUBCASE("Empty host is rejected") {
        auto res = mailpipe::resolve_endpoint({"", 12000});
        CHECK(res.is_err());
    }
}
