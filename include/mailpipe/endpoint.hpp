#pragma once

#include <mailpipe/common.hpp>

#include <arpa/inet.h>
#include <netdb.h>
#include <string>
#include <sys/socket.h>

namespace mailpipe {

    // UDP endpoint - host and port
    struct UdpEndpoint {
        dp::String host; // IP address or hostname
        dp::u16 port;

        inline dp::String to_string() const { return host + ":" + dp::String(std::to_string(port).c_str()); }

        inline bool operator==(const UdpEndpoint &other) const { return port == other.port && host == other.host; }
        inline bool operator!=(const UdpEndpoint &other) const { return !(*this == other); }

        // Ordering so endpoints can key the server's per-address tables
        inline bool operator<(const UdpEndpoint &other) const {
            if (host == other.host) {
                return port < other.port;
            }
            return host < other.host;
        }
    };

    /// Build an IPv4 socket address for an endpoint.
    /// Dotted-quad hosts are parsed directly, anything else goes through getaddrinfo.
    inline dp::Res<sockaddr_in> to_sockaddr(const UdpEndpoint &endpoint) {
        if (endpoint.host.empty()) {
            return dp::result::err(dp::Error::invalid_argument("empty host"));
        }

        sockaddr_in addr = {};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(endpoint.port);
        if (::inet_pton(AF_INET, endpoint.host.c_str(), &addr.sin_addr) == 1) {
            return dp::result::ok(addr);
        }

        addrinfo hints = {};
        hints.ai_family = AF_INET;
        hints.ai_socktype = SOCK_DGRAM;
        addrinfo *found = nullptr;
        int rc = ::getaddrinfo(endpoint.host.c_str(), nullptr, &hints, &found);
        if (rc != 0 || found == nullptr) {
            echo::error("cannot resolve ", endpoint.to_string(), ": ", gai_strerror(rc));
            return dp::result::err(dp::Error::not_found(dp::String("cannot resolve host: ") + endpoint.host));
        }
        addr.sin_addr = reinterpret_cast<sockaddr_in *>(found->ai_addr)->sin_addr;
        ::freeaddrinfo(found);
        return dp::result::ok(addr);
    }

    /// Numeric endpoint for a received socket address
    inline UdpEndpoint from_sockaddr(const sockaddr_in &addr) {
        char text[INET_ADDRSTRLEN] = {};
        ::inet_ntop(AF_INET, &addr.sin_addr, text, sizeof(text));
        return UdpEndpoint{dp::String(text), ntohs(addr.sin_port)};
    }

    // Resolve a hostname endpoint to its numeric IPv4 form
    // Replies are matched against the numeric address they arrive from,
    // so "localhost:12000" must be compared as "127.0.0.1:12000"
    inline dp::Res<UdpEndpoint> resolve_endpoint(const UdpEndpoint &endpoint) {
        auto addr = to_sockaddr(endpoint);
        if (addr.is_err()) {
            return dp::result::err(addr.error());
        }
        UdpEndpoint resolved = from_sockaddr(addr.value());
        echo::trace("resolved ", endpoint.to_string(), " -> ", resolved.to_string());
        return dp::result::ok(resolved);
    }

} // namespace mailpipe
