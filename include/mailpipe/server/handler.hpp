#pragma once

#include <mailpipe/protocol/codec.hpp>
#include <mailpipe/reliable/metrics.hpp>
#include <mailpipe/server/directory.hpp>
#include <mailpipe/server/reply_cache.hpp>

#include <chrono>

namespace mailpipe {

    /// Field limits enforced on requests
    constexpr dp::usize MAX_NAME_LENGTH = 32;
    constexpr dp::usize MAX_BODY_LENGTH = 1024;

    /// Usernames: 1..32 bytes, no spaces, control characters or '|'
    inline bool is_valid_username(const dp::String &name) {
        if (name.empty() || name.size() > MAX_NAME_LENGTH) {
            return false;
        }
        for (char c : name) {
            auto byte = static_cast<unsigned char>(c);
            if (byte <= 0x20 || byte == 0x7F || c == '|') {
                return false;
            }
        }
        return true;
    }

    /// First names: 1..32 bytes, spaces allowed, no control characters
    inline bool is_valid_first_name(const dp::String &name) {
        if (name.empty() || name.size() > MAX_NAME_LENGTH) {
            return false;
        }
        for (char c : name) {
            auto byte = static_cast<unsigned char>(c);
            if (byte < 0x20 || byte == 0x7F) {
                return false;
            }
        }
        return true;
    }

    inline bool is_valid_body(const dp::String &body) { return !body.empty() && body.size() <= MAX_BODY_LENGTH; }

    /// Server-side protocol state machine
    /// Each datagram goes RECEIVED -> VALIDATED -> APPLIED -> reply, except that a
    /// correlation id already handled for the same address skips straight to
    /// re-sending the remembered reply, so nothing is applied twice.
    class RequestHandler {
      private:
        Directory &directory_;
        ReplyCache cache_;
        ServerMetrics metrics_;

        static protocol::Payload reject(protocol::ErrorCode code, const char *reason) {
            return protocol::ErrorReply{code, dp::String(reason)};
        }

        static const char *reason_for(protocol::ErrorCode code) {
            switch (code) {
            case protocol::ErrorCode::UsernameTaken:
                return "username taken";
            case protocol::ErrorCode::UnknownRecipient:
                return "no such user";
            case protocol::ErrorCode::NotConnected:
                return "not connected";
            case protocol::ErrorCode::MailboxFull:
                return "recipient mailbox full";
            case protocol::ErrorCode::MalformedRequest:
                return "malformed request";
            }
            return "rejected";
        }

        protocol::Payload apply(const protocol::Connect &req, const UdpEndpoint &source,
                                std::chrono::steady_clock::time_point now) {
            if (!is_valid_username(req.username) || !is_valid_first_name(req.first_name)) {
                return reject(protocol::ErrorCode::MalformedRequest, "invalid username or first name");
            }
            if (auto rejection = directory_.connect(req.username, req.first_name, source, now)) {
                return reject(*rejection, reason_for(*rejection));
            }
            return protocol::ConnectAck{req.username, req.first_name};
        }

        protocol::Payload apply(const protocol::List &req, const UdpEndpoint &source,
                                std::chrono::steady_clock::time_point now) {
            if (auto rejection = directory_.authorize(req.username, source, now)) {
                return reject(*rejection, reason_for(*rejection));
            }
            return directory_.list();
        }

        protocol::Payload apply(const protocol::Send &req, const UdpEndpoint &source,
                                std::chrono::steady_clock::time_point now, dp::u64 wall_ms) {
            if (auto rejection = directory_.authorize(req.sender, source, now)) {
                return reject(*rejection, reason_for(*rejection));
            }
            if (!is_valid_body(req.body)) {
                return reject(protocol::ErrorCode::MalformedRequest, "message body empty or too long");
            }
            if (auto rejection = directory_.deliver(req.sender, req.recipient, req.body, wall_ms)) {
                return reject(*rejection, reason_for(*rejection));
            }
            return protocol::SendAck{};
        }

        protocol::Payload apply(const protocol::Retrieve &req, const UdpEndpoint &source,
                                std::chrono::steady_clock::time_point now) {
            if (auto rejection = directory_.authorize(req.username, source, now)) {
                return reject(*rejection, reason_for(*rejection));
            }
            return directory_.drain(req.username, req.from_filter);
        }

        protocol::Payload apply(const protocol::Disconnect &req, const UdpEndpoint &source) {
            if (!directory_.disconnect(req.username, source)) {
                echo::debug("disconnect for '", req.username.c_str(), "' from ", source.to_string(), " ignored");
            }
            return protocol::Ack{};
        }

      public:
        explicit RequestHandler(Directory &directory, dp::usize replies_per_peer = 32, dp::usize max_peers = 1024)
            : directory_(directory), cache_(replies_per_peer, max_peers) {}

        /// Handle one inbound datagram and produce the reply to send back to `source`
        /// Errors (nothing to send): malformed packet, or a message that is not a request
        dp::Res<Message> handle(const Message &bytes, const UdpEndpoint &source,
                                std::chrono::steady_clock::time_point now, dp::u64 wall_ms) {
            auto decode_res = protocol::decode(bytes);
            if (decode_res.is_err()) {
                metrics_.malformed.fetch_add(1);
                echo::warn("discarding malformed packet from ", source.to_string(), ": ",
                           decode_res.error().message.c_str());
                return dp::result::err(decode_res.error());
            }
            const auto &request = decode_res.value();
            auto kind = request.kind();

            if (!protocol::is_request(kind)) {
                echo::warn("discarding ", protocol::kind_name(kind), " from ", source.to_string(),
                           ": not a request");
                return dp::result::err(dp::Error::invalid_argument("not a request"));
            }

            // Retransmission of something already applied: answer again, do not re-apply
            if (auto cached = cache_.lookup(source, request.correlation_id)) {
                metrics_.duplicates.fetch_add(1);
                echo::debug("duplicate ", protocol::kind_name(kind), " id=", request.correlation_id, " from ",
                            source.to_string(), ", re-sending reply");
                return dp::result::ok(std::move(*cached));
            }

            metrics_.requests.fetch_add(1);
            echo::trace("handling ", protocol::kind_name(kind), " id=", request.correlation_id, " from ",
                        source.to_string());

            protocol::Payload reply;
            switch (kind) {
            case protocol::MessageKind::Connect:
                reply = apply(request.as<protocol::Connect>(), source, now);
                break;
            case protocol::MessageKind::List:
                reply = apply(request.as<protocol::List>(), source, now);
                break;
            case protocol::MessageKind::Send:
                reply = apply(request.as<protocol::Send>(), source, now, wall_ms);
                break;
            case protocol::MessageKind::Retrieve:
                reply = apply(request.as<protocol::Retrieve>(), source, now);
                break;
            case protocol::MessageKind::Disconnect:
                reply = apply(request.as<protocol::Disconnect>(), source);
                break;
            default:
                reply = reject(protocol::ErrorCode::MalformedRequest, "unsupported request");
                break;
            }

            if (std::holds_alternative<protocol::ErrorReply>(reply)) {
                metrics_.rejected.fetch_add(1);
                const auto &error = std::get<protocol::ErrorReply>(reply);
                echo::warn(protocol::kind_name(kind), " id=", request.correlation_id, " from ", source.to_string(),
                           " rejected: ", protocol::error_code_name(error.code));
            }

            Message encoded = protocol::encode(protocol::ProtocolMessage{request.correlation_id, std::move(reply)});
            cache_.store(source, request.correlation_id, encoded);
            return dp::result::ok(std::move(encoded));
        }

        /// Convenience overload using the current clocks
        dp::Res<Message> handle(const Message &bytes, const UdpEndpoint &source) {
            auto wall = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::system_clock::now().time_since_epoch());
            return handle(bytes, source, std::chrono::steady_clock::now(), static_cast<dp::u64>(wall.count()));
        }

        ServerMetrics &metrics() { return metrics_; }
        const ServerMetrics &metrics() const { return metrics_; }

        const ReplyCache &reply_cache() const { return cache_; }
    };

} // namespace mailpipe
