#pragma once

#include <mailpipe/datagram.hpp>

#include <cerrno>
#include <cstring>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace mailpipe {

    /// IPv4 UDP socket. One datagram is one chat packet, so no framing is done here.
    /// The socket is opened lazily: a sender that never binds gets an ephemeral port
    /// from its first send_to().
    class UdpDatagram : public Datagram {
      private:
        int fd_ = -1;
        bool bound_ = false;
        UdpEndpoint local_{"0.0.0.0", 0};

        static dp::Error os_error(const char *what) {
            return dp::Error::io_error(dp::String(what) + ": " + std::strerror(errno));
        }

        dp::Res<void> open_socket() {
            if (fd_ >= 0) {
                return dp::result::ok();
            }
            int fd = ::socket(AF_INET, SOCK_DGRAM, 0);
            if (fd < 0) {
                auto err = os_error("socket");
                echo::error(err.message.c_str());
                return dp::result::err(err);
            }
            fd_ = fd;
            echo::trace("udp fd=", fd_, " opened");
            return dp::result::ok();
        }

        void release() {
            ::close(fd_);
            fd_ = -1;
            bound_ = false;
        }

      public:
        UdpDatagram() = default;
        ~UdpDatagram() override { close(); }

        UdpDatagram(const UdpDatagram &) = delete;
        UdpDatagram &operator=(const UdpDatagram &) = delete;

        dp::Res<void> bind(const UdpEndpoint &endpoint) override {
            bool any = endpoint.host.empty() || endpoint.host == "0.0.0.0";

            sockaddr_in addr = {};
            if (any) {
                addr.sin_family = AF_INET;
                addr.sin_addr.s_addr = htonl(INADDR_ANY);
                addr.sin_port = htons(endpoint.port);
            } else {
                auto parsed = to_sockaddr(endpoint);
                if (parsed.is_err()) {
                    echo::error("bind: bad local address ", endpoint.to_string());
                    return dp::result::err(dp::Error::invalid_argument("invalid address"));
                }
                addr = parsed.value();
            }

            auto opened = open_socket();
            if (opened.is_err()) {
                return opened;
            }

            int reuse = 1;
            if (::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) != 0) {
                echo::warn("SO_REUSEADDR: ", std::strerror(errno));
            }

            if (::bind(fd_, reinterpret_cast<const sockaddr *>(&addr), sizeof(addr)) != 0) {
                auto err = os_error("bind");
                echo::error(err.message.c_str(), " on ", endpoint.to_string());
                release();
                return dp::result::err(err);
            }

            // Port 0 asks the kernel for a port, read back which one it chose
            sockaddr_in actual = {};
            socklen_t actual_len = sizeof(actual);
            dp::u16 port = endpoint.port;
            if (::getsockname(fd_, reinterpret_cast<sockaddr *>(&actual), &actual_len) == 0) {
                port = ntohs(actual.sin_port);
            }

            local_ = UdpEndpoint{any ? dp::String("0.0.0.0") : endpoint.host, port};
            bound_ = true;
            echo::debug("udp bound ", local_.to_string());
            return dp::result::ok();
        }

        dp::Res<void> send_to(const Message &msg, const UdpEndpoint &dest) override {
            if (msg.size() > MAX_DATAGRAM_SIZE) {
                echo::warn("refusing ", msg.size(), " byte datagram (limit ", MAX_DATAGRAM_SIZE, ")");
                return dp::result::err(dp::Error::invalid_argument(dp::String("message too large: ") +
                                                                   std::to_string(msg.size()).c_str()));
            }

            auto opened = open_socket();
            if (opened.is_err()) {
                return opened;
            }

            auto addr = to_sockaddr(dest);
            if (addr.is_err()) {
                return dp::result::err(addr.error());
            }

            auto sent = ::sendto(fd_, msg.data(), msg.size(), 0, reinterpret_cast<const sockaddr *>(&addr.value()),
                                 sizeof(sockaddr_in));
            if (sent < 0) {
                auto err = os_error("sendto");
                echo::error(err.message.c_str(), " -> ", dest.to_string());
                return dp::result::err(err);
            }
            echo::trace("udp -> ", dest.to_string(), " ", sent, "B");
            return dp::result::ok();
        }

        dp::Res<dp::Pair<Message, UdpEndpoint>> recv_from() override {
            if (!bound_) {
                return dp::result::err(dp::Error::invalid_argument("not bound"));
            }

            Message buffer(MAX_DATAGRAM_SIZE);
            sockaddr_in from = {};
            socklen_t from_len = sizeof(from);
            auto got = ::recvfrom(fd_, buffer.data(), buffer.size(), 0, reinterpret_cast<sockaddr *>(&from), &from_len);
            if (got < 0) {
                // A signal interrupting the wait is reported like an expired timeout,
                // so loops go back and look at their cancel token
                if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
                    return dp::result::err(dp::Error::timeout("recv timeout"));
                }
                auto err = os_error("recvfrom");
                echo::error(err.message.c_str());
                return dp::result::err(err);
            }

            buffer.resize(static_cast<dp::usize>(got));
            UdpEndpoint source = from_sockaddr(from);
            echo::trace("udp <- ", source.to_string(), " ", got, "B");
            return dp::result::ok(dp::Pair<Message, UdpEndpoint>(std::move(buffer), source));
        }

        dp::Res<void> set_recv_timeout(dp::u32 timeout_ms) override {
            auto opened = open_socket();
            if (opened.is_err()) {
                return opened;
            }

            timeval wait = {};
            wait.tv_sec = static_cast<time_t>(timeout_ms / 1000);
            wait.tv_usec = static_cast<suseconds_t>((timeout_ms % 1000) * 1000);
            if (::setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &wait, sizeof(wait)) != 0) {
                auto err = os_error("SO_RCVTIMEO");
                echo::error(err.message.c_str());
                return dp::result::err(err);
            }
            return dp::result::ok();
        }

        UdpEndpoint local_endpoint() const override { return local_; }

        void close() override {
            if (fd_ < 0) {
                return;
            }
            echo::trace("udp fd=", fd_, " closed");
            release();
        }
    };

} // namespace mailpipe
