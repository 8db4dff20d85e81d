#pragma once

#include <mailpipe/endpoint.hpp>

namespace mailpipe {

    /// Unreliable packet transport underneath the chat protocol.
    /// Implementations: UdpDatagram (real socket) and LossyDatagram (fault injection).
    class Datagram {
      public:
        virtual ~Datagram() = default;

        /// Take a local address. Port 0 picks an ephemeral port.
        virtual dp::Res<void> bind(const UdpEndpoint &endpoint) = 0;

        /// Best effort: success means the packet left, not that it arrived
        virtual dp::Res<void> send_to(const Message &msg, const UdpEndpoint &dest) = 0;

        /// Next packet and who sent it. An expired receive timeout is dp::Error::TIMEOUT.
        virtual dp::Res<dp::Pair<Message, UdpEndpoint>> recv_from() = 0;

        /// 0 waits forever
        virtual dp::Res<void> set_recv_timeout(dp::u32 timeout_ms) = 0;

        virtual UdpEndpoint local_endpoint() const = 0;

        virtual void close() = 0;
    };

} // namespace mailpipe
