#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include <mailpipe/common.hpp>

TEST_CASE("encode_u32_be") {
    auto bytes = mailpipe::encode_u32_be(0x12345678);
    CHECK(bytes[0] == 0x12);
    CHECK(bytes[1] == 0x34);
    CHECK(bytes[2] == 0x56);
    CHECK(bytes[3] == 0x78);
}

TEST_CASE("decode_u32_be") {
    dp::Array<dp::u8, 4> bytes = {0x12, 0x34, 0x56, 0x78};
    auto value = mailpipe::decode_u32_be(bytes.data());
    CHECK(value == 0x12345678);
}

TEST_CASE("encode_u16_be / decode_u16_be") {
    auto bytes = mailpipe::encode_u16_be(0xBEEF);
    CHECK(bytes[0] == 0xBE);
    CHECK(bytes[1] == 0xEF);
    CHECK(mailpipe::decode_u16_be(bytes.data()) == 0xBEEF);
}

TEST_CASE("encode_u64_be") {
    auto bytes = mailpipe::encode_u64_be(0x0102030405060708ULL);
    for (dp::usize i = 0; i < 8; ++i) {
        CHECK(bytes[i] == static_cast<dp::u8>(i + 1));
    }
    CHECK(mailpipe::decode_u64_be(bytes.data()) == 0x0102030405060708ULL);
}

TEST_CASE("append helpers write big-endian in order") {
    mailpipe::Message buffer;
    mailpipe::append_u16_be(buffer, 0x0102);
    mailpipe::append_u32_be(buffer, 0x03040506);
    REQUIRE(buffer.size() == 6);
    CHECK(buffer[0] == 0x01);
    CHECK(buffer[1] == 0x02);
    CHECK(buffer[2] == 0x03);
    CHECK(buffer[5] == 0x06);
}
