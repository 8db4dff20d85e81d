#include <doctest/doctest.h>
#include <mailpipe/protocol/codec.hpp>

#include <random>

using namespace mailpipe;
using namespace mailpipe::protocol;

namespace {
    ProtocolMessage round_trip(const ProtocolMessage &msg) {
        auto decoded = decode(encode(msg));
        REQUIRE(decoded.is_ok());
        return decoded.value();
    }
} // namespace

TEST_CASE("Codec - header layout") {
    auto bytes = encode(make_message(0xA1B2C3D4, Connect{"alice", "Alice"}));
    REQUIRE(bytes.size() == HEADER_SIZE + 2 + 5 + 2 + 5);
    CHECK(bytes[0] == PROTOCOL_VERSION_1);
    CHECK(bytes[1] == static_cast<dp::u8>(MessageKind::Connect));
    CHECK(bytes[2] == 0xA1);
    CHECK(bytes[5] == 0xD4);
    // username length prefix, then bytes
    CHECK(bytes[6] == 0x00);
    CHECK(bytes[7] == 0x05);
    CHECK(bytes[8] == 'a');
}

TEST_CASE("Codec - every kind decodes to what was encoded") {
    SUBCASE("Requests") {
        CHECK(round_trip(make_message(1, Connect{"alice", "Alice"})) == make_message(1, Connect{"alice", "Alice"}));
        CHECK(round_trip(make_message(2, List{"alice"})) == make_message(2, List{"alice"}));
        CHECK(round_trip(make_message(3, Send{"alice", "bob", "hi"})) == make_message(3, Send{"alice", "bob", "hi"}));
        CHECK(round_trip(make_message(4, Retrieve{"bob", ""})) == make_message(4, Retrieve{"bob", ""}));
        CHECK(round_trip(make_message(5, Retrieve{"bob", "alice"})) == make_message(5, Retrieve{"bob", "alice"}));
        CHECK(round_trip(make_message(6, Disconnect{"bob"})) == make_message(6, Disconnect{"bob"}));
    }

    SUBCASE("Replies") {
        ListResponse list;
        list.total = 2;
        list.users.push_back(UserEntry{"alice", "Alice"});
        list.users.push_back(UserEntry{"bob", "Bob"});
        CHECK(round_trip(make_message(7, list)) == make_message(7, list));

        RetrieveResponse mail;
        mail.remaining = 3;
        mail.messages.push_back(MailItem{"alice", "hi", 1700000000123ULL});
        CHECK(round_trip(make_message(8, mail)) == make_message(8, mail));

        CHECK(round_trip(make_message(9, ConnectAck{"alice", "Alice"})).is<ConnectAck>());
        CHECK(round_trip(make_message(10, SendAck{})).kind() == MessageKind::SendAck);
        CHECK(round_trip(make_message(11, Ack{})).kind() == MessageKind::Ack);

        auto err = round_trip(make_message(12, ErrorReply{ErrorCode::UnknownRecipient, "no such user"}));
        REQUIRE(err.is<ErrorReply>());
        CHECK(err.as<ErrorReply>().code == ErrorCode::UnknownRecipient);
        CHECK(err.as<ErrorReply>().reason == "no such user");
    }

    SUBCASE("Correlation id survives unchanged") {
        CHECK(round_trip(make_message(0xFFFFFFFFu, Ack{})).correlation_id == 0xFFFFFFFFu);
        CHECK(round_trip(make_message(0u, Ack{})).correlation_id == 0u);
    }

    SUBCASE("Empty lists") {
        auto list = round_trip(make_message(1, ListResponse{}));
        CHECK(list.as<ListResponse>().users.empty());
        auto mail = round_trip(make_message(1, RetrieveResponse{}));
        CHECK(mail.as<RetrieveResponse>().messages.empty());
        CHECK(mail.as<RetrieveResponse>().remaining == 0);
    }
}

TEST_CASE("Codec - malformed packets are rejected") {
    auto valid = encode(make_message(42, Send{"alice", "bob", "hello"}));

    SUBCASE("Too short") {
        Message bytes(valid.begin(), valid.begin() + 5);
        CHECK(decode(bytes).is_err());
        CHECK(decode(Message{}).is_err());
    }

    SUBCASE("Unsupported version") {
        auto bytes = valid;
        bytes[0] = 99;
        auto res = decode(bytes);
        REQUIRE(res.is_err());
        CHECK(res.error().message == "malformed packet: unsupported protocol version");
    }

    SUBCASE("Unknown kind") {
        auto bytes = valid;
        bytes[1] = 0;
        CHECK(decode(bytes).is_err());
        bytes[1] = 12;
        CHECK(decode(bytes).is_err());
    }

    SUBCASE("Truncated string") {
        Message bytes(valid.begin(), valid.end() - 1);
        CHECK(decode(bytes).is_err());
    }

    SUBCASE("String length past the end") {
        auto bytes = encode(make_message(1, List{"alice"}));
        bytes[6] = 0xFF;
        bytes[7] = 0xFF;
        CHECK(decode(bytes).is_err());
    }

    SUBCASE("Trailing bytes") {
        auto bytes = valid;
        bytes.push_back(0x00);
        auto res = decode(bytes);
        REQUIRE(res.is_err());
        CHECK(res.error().message == "malformed packet: trailing bytes");
    }

    SUBCASE("List count larger than payload") {
        auto bytes = encode(make_message(1, ListResponse{}));
        // count is the last two bytes of an empty LIST_RESPONSE
        bytes[bytes.size() - 2] = 0x7F;
        bytes[bytes.size() - 1] = 0xFF;
        CHECK(decode(bytes).is_err());
    }

    SUBCASE("Unknown error code") {
        auto bytes = encode(make_message(1, ErrorReply{ErrorCode::MailboxFull, "x"}));
        bytes[HEADER_SIZE] = 0;
        CHECK(decode(bytes).is_err());
        bytes[HEADER_SIZE] = 6;
        CHECK(decode(bytes).is_err());
    }

    SUBCASE("Oversized datagram") {
        Message bytes(MAX_DATAGRAM_SIZE + 1, 0);
        bytes[0] = PROTOCOL_VERSION_1;
        bytes[1] = static_cast<dp::u8>(MessageKind::Ack);
        CHECK(decode(bytes).is_err());
    }
}

TEST_CASE("Codec - random bytes never crash the decoder") {
    std::mt19937 rng(1234);
    std::uniform_int_distribution<int> byte(0, 255);
    std::uniform_int_distribution<int> length(0, 64);

    int accepted = 0;
    for (int i = 0; i < 2000; ++i) {
        Message bytes(static_cast<dp::usize>(length(rng)));
        for (auto &b : bytes) {
            b = static_cast<dp::u8>(byte(rng));
        }
        // Bias toward a valid header so field parsing gets exercised
        if (bytes.size() >= 2 && i % 2 == 0) {
            bytes[0] = PROTOCOL_VERSION_1;
            bytes[1] = static_cast<dp::u8>(1 + i % 11);
        }
        auto res = decode(bytes);
        if (res.is_ok()) {
            accepted++;
            // Whatever decodes must encode back to the same bytes
            CHECK(encode(res.value()) == bytes);
        }
    }
    MESSAGE("random datagrams accepted: " << accepted);
}

TEST_CASE("Codec - list budget leaves room for a full header") {
    UserEntry entry{"user_with_a_32_byte_long_name_xx", "First Name Also Fairly Long"};
    dp::usize fits = LIST_PAYLOAD_BUDGET / wire_size(entry);

    ListResponse list;
    for (dp::usize i = 0; i < fits; ++i) {
        list.users.push_back(entry);
    }
    list.total = static_cast<dp::u32>(list.users.size());
    auto bytes = encode(make_message(1, list));
    CHECK(bytes.size() <= MAX_DATAGRAM_SIZE);
    CHECK(decode(bytes).is_ok());
}
