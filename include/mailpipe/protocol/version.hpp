#pragma once

#include <datapod/datapod.hpp>

#include <string>

namespace mailpipe {
    namespace protocol {

        /// First byte of every chat packet. Packets carrying any other value are dropped.
        constexpr dp::u8 PROTOCOL_VERSION_1 = 1;
        constexpr dp::u8 PROTOCOL_VERSION_CURRENT = PROTOCOL_VERSION_1;

        inline bool is_protocol_supported(dp::u8 version) { return version == PROTOCOL_VERSION_CURRENT; }

        // Release of the library itself, logged by the server at startup
        constexpr dp::u8 LIBRARY_MAJOR = 0;
        constexpr dp::u8 LIBRARY_MINOR = 1;
        constexpr dp::u8 LIBRARY_PATCH = 0;

        inline dp::String get_version_string() {
            std::string text = std::to_string(LIBRARY_MAJOR) + "." + std::to_string(LIBRARY_MINOR) + "." +
                               std::to_string(LIBRARY_PATCH);
            return dp::String(text.c_str());
        }

    } // namespace protocol
} // namespace mailpipe
