#pragma once

#include <mailpipe/common.hpp>

#include <type_traits>
#include <variant>

namespace mailpipe {
    namespace protocol {

        /// Wire tag of each message kind
        enum class MessageKind : dp::u8 {
            Connect = 1,
            ConnectAck = 2,
            List = 3,
            ListResponse = 4,
            Send = 5,
            SendAck = 6,
            Retrieve = 7,
            RetrieveResponse = 8,
            Ack = 9,
            Error = 10,
            Disconnect = 11
        };

        /// Application-level failure carried by an ERROR reply
        enum class ErrorCode : dp::u8 {
            UsernameTaken = 1,
            UnknownRecipient = 2,
            NotConnected = 3,
            MailboxFull = 4,
            MalformedRequest = 5
        };

        inline const char *error_code_name(ErrorCode code) {
            switch (code) {
            case ErrorCode::UsernameTaken:
                return "UsernameTaken";
            case ErrorCode::UnknownRecipient:
                return "UnknownRecipient";
            case ErrorCode::NotConnected:
                return "NotConnected";
            case ErrorCode::MailboxFull:
                return "MailboxFull";
            case ErrorCode::MalformedRequest:
                return "MalformedRequest";
            }
            return "Unknown";
        }

        /// One online user as reported by LIST
        struct UserEntry {
            dp::String username;
            dp::String first_name;

            bool operator==(const UserEntry &) const = default;
        };

        /// One queued message as returned by RETRIEVE
        struct MailItem {
            dp::String from;
            dp::String body;
            dp::u64 sent_at_ms = 0; // enqueue time, milliseconds since the Unix epoch

            bool operator==(const MailItem &) const = default;
        };

        // Requests (client -> server)

        struct Connect {
            static constexpr MessageKind kind = MessageKind::Connect;
            dp::String username;
            dp::String first_name;

            bool operator==(const Connect &) const = default;
        };

        struct List {
            static constexpr MessageKind kind = MessageKind::List;
            dp::String username; // requester

            bool operator==(const List &) const = default;
        };

        struct Send {
            static constexpr MessageKind kind = MessageKind::Send;
            dp::String sender;
            dp::String recipient;
            dp::String body;

            bool operator==(const Send &) const = default;
        };

        struct Retrieve {
            static constexpr MessageKind kind = MessageKind::Retrieve;
            dp::String username;    // requester, whose mailbox is drained
            dp::String from_filter; // only drain mail from this sender; empty = everyone

            bool operator==(const Retrieve &) const = default;
        };

        struct Disconnect {
            static constexpr MessageKind kind = MessageKind::Disconnect;
            dp::String username;

            bool operator==(const Disconnect &) const = default;
        };

        // Replies (server -> client)

        struct ConnectAck {
            static constexpr MessageKind kind = MessageKind::ConnectAck;
            dp::String username;
            dp::String first_name;

            bool operator==(const ConnectAck &) const = default;
        };

        struct ListResponse {
            static constexpr MessageKind kind = MessageKind::ListResponse;
            dp::u32 total = 0; // users online; more than users.size() when truncated
            dp::Vector<UserEntry> users;

            bool operator==(const ListResponse &) const = default;
        };

        struct SendAck {
            static constexpr MessageKind kind = MessageKind::SendAck;

            bool operator==(const SendAck &) const = default;
        };

        struct RetrieveResponse {
            static constexpr MessageKind kind = MessageKind::RetrieveResponse;
            dp::u32 remaining = 0; // matching entries still queued after this page
            dp::Vector<MailItem> messages;

            bool operator==(const RetrieveResponse &) const = default;
        };

        struct Ack {
            static constexpr MessageKind kind = MessageKind::Ack;

            bool operator==(const Ack &) const = default;
        };

        struct ErrorReply {
            static constexpr MessageKind kind = MessageKind::Error;
            ErrorCode code = ErrorCode::MalformedRequest;
            dp::String reason;

            bool operator==(const ErrorReply &) const = default;
        };

        /// Tagged union over every message kind
        using Payload = std::variant<Connect, ConnectAck, List, ListResponse, Send, SendAck, Retrieve, RetrieveResponse,
                                     Ack, ErrorReply, Disconnect>;

        /// A decoded datagram: correlation id plus one payload
        struct ProtocolMessage {
            dp::u32 correlation_id = 0;
            Payload payload;

            MessageKind kind() const {
                return std::visit([](const auto &p) { return std::decay_t<decltype(p)>::kind; }, payload);
            }

            template <typename T> bool is() const { return std::holds_alternative<T>(payload); }
            template <typename T> const T &as() const { return std::get<T>(payload); }

            bool operator==(const ProtocolMessage &) const = default;
        };

        /// Requests are handled by the server; everything else is a reply
        inline bool is_request(MessageKind kind) {
            switch (kind) {
            case MessageKind::Connect:
            case MessageKind::List:
            case MessageKind::Send:
            case MessageKind::Retrieve:
            case MessageKind::Disconnect:
                return true;
            default:
                return false;
            }
        }

        inline const char *kind_name(MessageKind kind) {
            switch (kind) {
            case MessageKind::Connect:
                return "CONNECT";
            case MessageKind::ConnectAck:
                return "CONNECT_ACK";
            case MessageKind::List:
                return "LIST";
            case MessageKind::ListResponse:
                return "LIST_RESPONSE";
            case MessageKind::Send:
                return "SEND";
            case MessageKind::SendAck:
                return "SEND_ACK";
            case MessageKind::Retrieve:
                return "RETRIEVE";
            case MessageKind::RetrieveResponse:
                return "RETRIEVE_RESPONSE";
            case MessageKind::Ack:
                return "ACK";
            case MessageKind::Error:
                return "ERROR";
            case MessageKind::Disconnect:
                return "DISCONNECT";
            }
            return "UNKNOWN";
        }

        template <typename T> ProtocolMessage make_message(dp::u32 correlation_id, T payload) {
            return ProtocolMessage{correlation_id, Payload(std::move(payload))};
        }

    } // namespace protocol
} // namespace mailpipe
