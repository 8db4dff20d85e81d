#pragma once

#include <datapod/datapod.hpp>
#include <echo/echo.hpp>

namespace mailpipe {

    // Message type - the raw bytes of one datagram
    using Message = dp::Vector<dp::u8>;

    // Largest datagram the transport and codec will produce or accept
    constexpr dp::usize MAX_DATAGRAM_SIZE = 8192;

    // Big-endian encoding helpers for the wire codec
    inline dp::Array<dp::u8, 2> encode_u16_be(dp::u16 value) {
        dp::Array<dp::u8, 2> bytes;
        bytes[0] = static_cast<dp::u8>((value >> 8) & 0xFF);
        bytes[1] = static_cast<dp::u8>(value & 0xFF);
        return bytes;
    }

    inline dp::Array<dp::u8, 4> encode_u32_be(dp::u32 value) {
        dp::Array<dp::u8, 4> bytes;
        bytes[0] = static_cast<dp::u8>((value >> 24) & 0xFF);
        bytes[1] = static_cast<dp::u8>((value >> 16) & 0xFF);
        bytes[2] = static_cast<dp::u8>((value >> 8) & 0xFF);
        bytes[3] = static_cast<dp::u8>(value & 0xFF);
        return bytes;
    }

    inline dp::Array<dp::u8, 8> encode_u64_be(dp::u64 value) {
        dp::Array<dp::u8, 8> bytes;
        for (dp::usize i = 0; i < 8; ++i) {
            bytes[i] = static_cast<dp::u8>((value >> (56 - 8 * i)) & 0xFF);
        }
        return bytes;
    }

    inline dp::u16 decode_u16_be(const dp::u8 *bytes) {
        return static_cast<dp::u16>((static_cast<dp::u16>(bytes[0]) << 8) | static_cast<dp::u16>(bytes[1]));
    }

    inline dp::u32 decode_u32_be(const dp::u8 *bytes) {
        return (static_cast<dp::u32>(bytes[0]) << 24) | (static_cast<dp::u32>(bytes[1]) << 16) |
               (static_cast<dp::u32>(bytes[2]) << 8) | static_cast<dp::u32>(bytes[3]);
    }

    inline dp::u64 decode_u64_be(const dp::u8 *bytes) {
        dp::u64 value = 0;
        for (dp::usize i = 0; i < 8; ++i) {
            value = (value << 8) | static_cast<dp::u64>(bytes[i]);
        }
        return value;
    }

    // Append helpers used while building a datagram
    inline void append_u16_be(Message &buffer, dp::u16 value) {
        auto bytes = encode_u16_be(value);
        buffer.insert(buffer.end(), bytes.begin(), bytes.end());
    }

    inline void append_u32_be(Message &buffer, dp::u32 value) {
        auto bytes = encode_u32_be(value);
        buffer.insert(buffer.end(), bytes.begin(), bytes.end());
    }

    inline void append_u64_be(Message &buffer, dp::u64 value) {
        auto bytes = encode_u64_be(value);
        buffer.insert(buffer.end(), bytes.begin(), bytes.end());
    }

} // namespace mailpipe
