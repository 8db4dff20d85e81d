#pragma once

#include <mailpipe/protocol/message.hpp>
#include <mailpipe/protocol/version.hpp>

#include <limits>

namespace mailpipe {
    namespace protocol {

        /// Wire format, all multi-byte integers big-endian:
        ///   [version:1][kind:1][correlation_id:4][fields...]
        ///   string = [length:2][bytes:N]
        ///   list   = [count:2][element...]
        constexpr dp::usize HEADER_SIZE = 6;

        // ============================================================================
        // Size accounting (used by the server to fill paged replies)
        // ============================================================================

        inline dp::usize wire_size(const dp::String &text) { return 2 + text.size(); }

        inline dp::usize wire_size(const UserEntry &user) { return wire_size(user.username) + wire_size(user.first_name); }

        inline dp::usize wire_size(const MailItem &item) { return wire_size(item.from) + wire_size(item.body) + 8; }

        /// Bytes available for list elements in a LIST_RESPONSE or RETRIEVE_RESPONSE
        /// (header + 4-byte counter + 2-byte list count)
        constexpr dp::usize LIST_PAYLOAD_BUDGET = MAX_DATAGRAM_SIZE - HEADER_SIZE - 4 - 2;

        // ============================================================================
        // Encoding
        // ============================================================================

        namespace detail {

            inline void put_string(Message &out, const dp::String &text) {
                dp::usize len = text.size();
                if (len > std::numeric_limits<dp::u16>::max()) {
                    len = std::numeric_limits<dp::u16>::max();
                }
                append_u16_be(out, static_cast<dp::u16>(len));
                out.insert(out.end(), text.begin(), text.begin() + static_cast<std::ptrdiff_t>(len));
            }

            struct FieldWriter {
                Message &out;

                void operator()(const Connect &m) const {
                    put_string(out, m.username);
                    put_string(out, m.first_name);
                }
                void operator()(const ConnectAck &m) const {
                    put_string(out, m.username);
                    put_string(out, m.first_name);
                }
                void operator()(const List &m) const { put_string(out, m.username); }
                void operator()(const ListResponse &m) const {
                    append_u32_be(out, m.total);
                    append_u16_be(out, static_cast<dp::u16>(m.users.size()));
                    for (const auto &user : m.users) {
                        put_string(out, user.username);
                        put_string(out, user.first_name);
                    }
                }
                void operator()(const Send &m) const {
                    put_string(out, m.sender);
                    put_string(out, m.recipient);
                    put_string(out, m.body);
                }
                void operator()(const SendAck &) const {}
                void operator()(const Retrieve &m) const {
                    put_string(out, m.username);
                    put_string(out, m.from_filter);
                }
                void operator()(const RetrieveResponse &m) const {
                    append_u32_be(out, m.remaining);
                    append_u16_be(out, static_cast<dp::u16>(m.messages.size()));
                    for (const auto &item : m.messages) {
                        put_string(out, item.from);
                        put_string(out, item.body);
                        append_u64_be(out, item.sent_at_ms);
                    }
                }
                void operator()(const Ack &) const {}
                void operator()(const ErrorReply &m) const {
                    out.push_back(static_cast<dp::u8>(m.code));
                    put_string(out, m.reason);
                }
                void operator()(const Disconnect &m) const { put_string(out, m.username); }
            };

        } // namespace detail

        /// Encode a message into one datagram payload
        inline Message encode(const ProtocolMessage &msg) {
            Message out;
            out.reserve(64);

            out.push_back(PROTOCOL_VERSION_CURRENT);
            out.push_back(static_cast<dp::u8>(msg.kind()));
            append_u32_be(out, msg.correlation_id);

            std::visit(detail::FieldWriter{out}, msg.payload);

            echo::trace("encoded ", kind_name(msg.kind()), " id=", msg.correlation_id, " len=", out.size());
            return out;
        }

        // ============================================================================
        // Decoding
        // ============================================================================

        namespace detail {

            /// Bounds-checked cursor over a received datagram
            /// Every read fails instead of running past the end
            class Reader {
              private:
                const Message &buf_;
                dp::usize pos_;

              public:
                explicit Reader(const Message &buf) : buf_(buf), pos_(0) {}

                dp::usize remaining() const { return buf_.size() - pos_; }
                bool at_end() const { return pos_ == buf_.size(); }

                bool u8(dp::u8 &out) {
                    if (remaining() < 1)
                        return false;
                    out = buf_[pos_];
                    pos_ += 1;
                    return true;
                }

                bool u16(dp::u16 &out) {
                    if (remaining() < 2)
                        return false;
                    out = decode_u16_be(buf_.data() + pos_);
                    pos_ += 2;
                    return true;
                }

                bool u32(dp::u32 &out) {
                    if (remaining() < 4)
                        return false;
                    out = decode_u32_be(buf_.data() + pos_);
                    pos_ += 4;
                    return true;
                }

                bool u64(dp::u64 &out) {
                    if (remaining() < 8)
                        return false;
                    out = decode_u64_be(buf_.data() + pos_);
                    pos_ += 8;
                    return true;
                }

                bool string(dp::String &out) {
                    dp::u16 len = 0;
                    if (!u16(len) || remaining() < len)
                        return false;
                    out = dp::String(reinterpret_cast<const char *>(buf_.data() + pos_), len);
                    pos_ += len;
                    return true;
                }
            };

            inline dp::Res<Payload> malformed(const char *what) {
                echo::warn("malformed packet: ", what);
                return dp::result::err(dp::Error::invalid_argument(dp::String("malformed packet: ") + what));
            }

            inline dp::Res<Payload> read_fields(MessageKind kind, Reader &in) {
                switch (kind) {
                case MessageKind::Connect: {
                    Connect m;
                    if (!in.string(m.username) || !in.string(m.first_name))
                        return malformed("truncated CONNECT");
                    return dp::result::ok(Payload(std::move(m)));
                }
                case MessageKind::ConnectAck: {
                    ConnectAck m;
                    if (!in.string(m.username) || !in.string(m.first_name))
                        return malformed("truncated CONNECT_ACK");
                    return dp::result::ok(Payload(std::move(m)));
                }
                case MessageKind::List: {
                    List m;
                    if (!in.string(m.username))
                        return malformed("truncated LIST");
                    return dp::result::ok(Payload(std::move(m)));
                }
                case MessageKind::ListResponse: {
                    ListResponse m;
                    dp::u16 count = 0;
                    if (!in.u32(m.total) || !in.u16(count))
                        return malformed("truncated LIST_RESPONSE header");
                    // Each entry needs at least two length prefixes
                    if (static_cast<dp::usize>(count) * 4 > in.remaining())
                        return malformed("LIST_RESPONSE count exceeds payload");
                    m.users.reserve(count);
                    for (dp::u16 i = 0; i < count; ++i) {
                        UserEntry user;
                        if (!in.string(user.username) || !in.string(user.first_name))
                            return malformed("truncated LIST_RESPONSE entry");
                        m.users.push_back(std::move(user));
                    }
                    return dp::result::ok(Payload(std::move(m)));
                }
                case MessageKind::Send: {
                    Send m;
                    if (!in.string(m.sender) || !in.string(m.recipient) || !in.string(m.body))
                        return malformed("truncated SEND");
                    return dp::result::ok(Payload(std::move(m)));
                }
                case MessageKind::SendAck:
                    return dp::result::ok(Payload(SendAck{}));
                case MessageKind::Retrieve: {
                    Retrieve m;
                    if (!in.string(m.username) || !in.string(m.from_filter))
                        return malformed("truncated RETRIEVE");
                    return dp::result::ok(Payload(std::move(m)));
                }
                case MessageKind::RetrieveResponse: {
                    RetrieveResponse m;
                    dp::u16 count = 0;
                    if (!in.u32(m.remaining) || !in.u16(count))
                        return malformed("truncated RETRIEVE_RESPONSE header");
                    // Each entry needs two length prefixes and a timestamp
                    if (static_cast<dp::usize>(count) * 12 > in.remaining())
                        return malformed("RETRIEVE_RESPONSE count exceeds payload");
                    m.messages.reserve(count);
                    for (dp::u16 i = 0; i < count; ++i) {
                        MailItem item;
                        if (!in.string(item.from) || !in.string(item.body) || !in.u64(item.sent_at_ms))
                            return malformed("truncated RETRIEVE_RESPONSE entry");
                        m.messages.push_back(std::move(item));
                    }
                    return dp::result::ok(Payload(std::move(m)));
                }
                case MessageKind::Ack:
                    return dp::result::ok(Payload(Ack{}));
                case MessageKind::Error: {
                    ErrorReply m;
                    dp::u8 code = 0;
                    if (!in.u8(code) || !in.string(m.reason))
                        return malformed("truncated ERROR");
                    if (code < static_cast<dp::u8>(ErrorCode::UsernameTaken) ||
                        code > static_cast<dp::u8>(ErrorCode::MalformedRequest))
                        return malformed("unknown error code");
                    m.code = static_cast<ErrorCode>(code);
                    return dp::result::ok(Payload(std::move(m)));
                }
                case MessageKind::Disconnect: {
                    Disconnect m;
                    if (!in.string(m.username))
                        return malformed("truncated DISCONNECT");
                    return dp::result::ok(Payload(std::move(m)));
                }
                }
                return malformed("unknown message kind");
            }

        } // namespace detail

        /// Decode one datagram payload
        /// Never throws and never reads out of bounds; any defect yields a
        /// "malformed packet" dp::Error::invalid_argument
        inline dp::Res<ProtocolMessage> decode(const Message &bytes) {
            if (bytes.size() < HEADER_SIZE) {
                echo::warn("malformed packet: too short (", bytes.size(), " bytes)");
                return dp::result::err(dp::Error::invalid_argument("malformed packet: too short"));
            }
            if (bytes.size() > MAX_DATAGRAM_SIZE) {
                echo::warn("malformed packet: too large (", bytes.size(), " bytes)");
                return dp::result::err(dp::Error::invalid_argument("malformed packet: too large"));
            }

            detail::Reader in(bytes);
            dp::u8 version = 0;
            dp::u8 raw_kind = 0;
            dp::u32 correlation_id = 0;
            in.u8(version);
            in.u8(raw_kind);
            in.u32(correlation_id);

            if (!is_protocol_supported(version)) {
                echo::warn("malformed packet: unsupported protocol version ", static_cast<int>(version));
                return dp::result::err(dp::Error::invalid_argument("malformed packet: unsupported protocol version"));
            }
            if (raw_kind < static_cast<dp::u8>(MessageKind::Connect) ||
                raw_kind > static_cast<dp::u8>(MessageKind::Disconnect)) {
                echo::warn("malformed packet: unknown kind ", static_cast<int>(raw_kind));
                return dp::result::err(dp::Error::invalid_argument("malformed packet: unknown kind"));
            }

            auto fields = detail::read_fields(static_cast<MessageKind>(raw_kind), in);
            if (fields.is_err()) {
                return dp::result::err(fields.error());
            }
            if (!in.at_end()) {
                echo::warn("malformed packet: ", in.remaining(), " trailing bytes");
                return dp::result::err(dp::Error::invalid_argument("malformed packet: trailing bytes"));
            }

            ProtocolMessage msg{correlation_id, std::move(fields.value())};
            echo::trace("decoded ", kind_name(msg.kind()), " id=", correlation_id, " len=", bytes.size());
            return dp::result::ok(std::move(msg));
        }

    } // namespace protocol
} // namespace mailpipe
