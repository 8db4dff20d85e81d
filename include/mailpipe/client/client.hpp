#pragma once

#include <mailpipe/cancel.hpp>
#include <mailpipe/client/session.hpp>
#include <mailpipe/reliable/sender.hpp>

#include <optional>

namespace mailpipe {

    struct ClientConfig {
        UdpEndpoint server{"127.0.0.1", 12000};
        dp::u32 max_retries = 3;
        dp::u32 timeout_ms = 5000;
    };

    /// Outcome of a client operation as shown to the user
    enum class Status {
        Ok,
        UsernameTaken,
        UnknownRecipient,
        NotConnected,
        MailboxFull,
        MalformedRequest,
        DeliveryFailed, // retry budget exhausted
        Cancelled,
        TransportError
    };

    inline const char *status_name(Status status) {
        switch (status) {
        case Status::Ok:
            return "Ok";
        case Status::UsernameTaken:
            return "UsernameTaken";
        case Status::UnknownRecipient:
            return "UnknownRecipient";
        case Status::NotConnected:
            return "NotConnected";
        case Status::MailboxFull:
            return "MailboxFull";
        case Status::MalformedRequest:
            return "MalformedRequest";
        case Status::DeliveryFailed:
            return "DeliveryFailed";
        case Status::Cancelled:
            return "Cancelled";
        case Status::TransportError:
            return "TransportError";
        }
        return "Unknown";
    }

    inline Status status_from(protocol::ErrorCode code) {
        switch (code) {
        case protocol::ErrorCode::UsernameTaken:
            return Status::UsernameTaken;
        case protocol::ErrorCode::UnknownRecipient:
            return Status::UnknownRecipient;
        case protocol::ErrorCode::NotConnected:
            return Status::NotConnected;
        case protocol::ErrorCode::MailboxFull:
            return Status::MailboxFull;
        case protocol::ErrorCode::MalformedRequest:
            return Status::MalformedRequest;
        }
        return Status::MalformedRequest;
    }

    /// Empty value of operations that only succeed or fail
    struct Done {};

    template <typename T> struct Outcome {
        Status status = Status::Ok;
        dp::String detail; // human readable reason on failure
        T value{};

        bool ok() const { return status == Status::Ok; }

        static Outcome success(T v) { return Outcome{Status::Ok, dp::String(), std::move(v)}; }
        static Outcome failure(Status s, dp::String why) { return Outcome{s, std::move(why), T{}}; }
    };

    using ConnectResult = Outcome<Done>;
    using SendResult = Outcome<Done>;
    using ListResult = Outcome<dp::Vector<protocol::UserEntry>>;
    using RetrieveResult = Outcome<dp::Vector<protocol::MailItem>>;

    /// Chat client session
    /// Issues one reliable request per operation and keeps the Session Record in
    /// step with what the server accepted. The datagram must already be bound.
    class ChatClient {
      private:
        ClientConfig config_;
        SessionStore &store_;
        CancelToken &cancel_;
        ReliableSender sender_;

        std::optional<SessionRecord> session_;
        bool dirty_; // record changed but not yet on disk

        /// Raw reply of one reliable exchange, or the Status it failed with
        template <typename Reply> Outcome<Reply> exchange(protocol::Payload request) {
            protocol::ProtocolMessage message{sender_.next_correlation_id(), std::move(request)};
            auto res = sender_.send_reliable(message, config_.server, config_.max_retries, config_.timeout_ms);
            if (res.is_err()) {
                const auto &error = res.error();
                if (error.code == dp::Error::TIMEOUT) {
                    return Outcome<Reply>::failure(Status::DeliveryFailed, dp::String("no reply from server"));
                }
                if (cancel_.is_cancelled() || error.message == "cancelled") {
                    return Outcome<Reply>::failure(Status::Cancelled, dp::String("cancelled"));
                }
                return Outcome<Reply>::failure(Status::TransportError, error.message);
            }

            const auto &reply = res.value();
            if (reply.is<protocol::ErrorReply>()) {
                const auto &error = reply.as<protocol::ErrorReply>();
                return Outcome<Reply>::failure(status_from(error.code), error.reason);
            }
            if (!reply.is<Reply>()) {
                echo::warn("unexpected ", protocol::kind_name(reply.kind()), " reply to ",
                           protocol::kind_name(message.kind()));
                return Outcome<Reply>::failure(Status::TransportError, dp::String("unexpected reply"));
            }
            return Outcome<Reply>::success(reply.as<Reply>());
        }

        /// Like exchange(), but a session the server no longer knows is re-registered
        /// with the stored identity and the request repeated once
        template <typename Reply, typename Build> Outcome<Reply> exchange_registered(Build build) {
            if (!session_) {
                return Outcome<Reply>::failure(Status::NotConnected, dp::String("not connected"));
            }

            auto outcome = exchange<Reply>(build(session_->username));
            if (outcome.status != Status::NotConnected) {
                return outcome;
            }

            echo::info("server does not know '", session_->username.c_str(), "', re-registering");
            auto reconnect = exchange<protocol::ConnectAck>(protocol::Connect{session_->username, session_->first_name});
            if (!reconnect.ok()) {
                if (reconnect.status == Status::UsernameTaken) {
                    echo::warn("username '", session_->username.c_str(), "' taken by another client, dropping session");
                    invalidate();
                    return Outcome<Reply>::failure(Status::NotConnected, dp::String("session lost: username taken"));
                }
                return Outcome<Reply>::failure(reconnect.status, reconnect.detail);
            }
            persist();
            return exchange<Reply>(build(session_->username));
        }

        void persist() {
            session_->last_login = unix_now_seconds();
            auto res = store_.save(*session_);
            if (res.is_err()) {
                echo::warn("session record not saved, will retry on shutdown: ", res.error().message.c_str());
                dirty_ = true;
                return;
            }
            dirty_ = false;
        }

        void invalidate() {
            session_.reset();
            dirty_ = false;
            auto res = store_.clear();
            if (res.is_err()) {
                echo::error("failed to delete session record: ", res.error().message.c_str());
            }
        }

      public:
        ChatClient(Datagram &datagram, ClientConfig config, SessionStore &store, CancelToken &cancel)
            : config_(std::move(config)), store_(store), cancel_(cancel), sender_(datagram, cancel), dirty_(false) {
            echo::trace("ChatClient constructed, server ", config_.server.to_string());
        }

        ~ChatClient() { flush(); }

        ChatClient(const ChatClient &) = delete;
        ChatClient &operator=(const ChatClient &) = delete;

        /// Adopt a stored session for the configured server, skipping CONNECT
        bool resume() {
            if (!store_.exists()) {
                return false;
            }
            auto res = store_.load();
            if (res.is_err()) {
                echo::warn("ignoring session record: ", res.error().message.c_str());
                return false;
            }
            auto record = std::move(res.value());
            if (record.server != config_.server) {
                echo::info("session record is for ", record.server.to_string(), ", not ", config_.server.to_string());
                return false;
            }
            echo::info("resuming session as '", record.username.c_str(), "'");
            session_ = std::move(record);
            dirty_ = false;
            return true;
        }

        ConnectResult connect(const dp::String &username, const dp::String &first_name) {
            auto outcome = exchange<protocol::ConnectAck>(protocol::Connect{username, first_name});
            if (!outcome.ok()) {
                echo::warn("connect as '", username.c_str(), "' failed: ", status_name(outcome.status));
                return ConnectResult::failure(outcome.status, outcome.detail);
            }
            session_ = SessionRecord{outcome.value.username, outcome.value.first_name, config_.server, 0};
            persist();
            echo::info("connected as '", username.c_str(), "'");
            return ConnectResult::success(Done{});
        }

        /// Online users; `detail` notes when the server truncated the list
        ListResult list_users() {
            auto outcome = exchange_registered<protocol::ListResponse>(
                [](const dp::String &me) { return protocol::Payload{protocol::List{me}}; });
            if (!outcome.ok()) {
                return ListResult::failure(outcome.status, outcome.detail);
            }
            auto result = ListResult::success(std::move(outcome.value.users));
            if (outcome.value.total > result.value.size()) {
                result.detail = dp::String("showing ") + dp::String(std::to_string(result.value.size()).c_str()) +
                                " of " + dp::String(std::to_string(outcome.value.total).c_str()) + " users";
            }
            return result;
        }

        SendResult send_message(const dp::String &to, const dp::String &body) {
            auto outcome = exchange_registered<protocol::SendAck>([&](const dp::String &me) {
                return protocol::Payload{protocol::Send{me, to, body}};
            });
            if (!outcome.ok()) {
                return SendResult::failure(outcome.status, outcome.detail);
            }
            return SendResult::success(Done{});
        }

        /// Drain the mailbox (only mail from `from` unless empty), following pages
        /// A failure part way keeps the pages already received in `value`.
        RetrieveResult retrieve_messages(const dp::String &from = dp::String()) {
            RetrieveResult result;
            while (true) {
                auto page = exchange_registered<protocol::RetrieveResponse>(
                    [&](const dp::String &me) { return protocol::Payload{protocol::Retrieve{me, from}}; });
                if (!page.ok()) {
                    result.status = page.status;
                    result.detail = page.detail;
                    return result;
                }
                for (auto &item : page.value.messages) {
                    result.value.push_back(std::move(item));
                }
                if (page.value.remaining == 0 || page.value.messages.empty()) {
                    break;
                }
                echo::debug(page.value.remaining, " message(s) left on the server, fetching next page");
            }
            return result;
        }

        /// Best-effort DISCONNECT and flush of the Session Record
        /// The record stays on disk so the next run can resume.
        void disconnect() {
            if (session_) {
                protocol::ProtocolMessage message{sender_.next_correlation_id(), protocol::Disconnect{session_->username}};
                auto res = sender_.send_unreliable(message, config_.server);
                if (res.is_err()) {
                    echo::warn("disconnect notice not sent: ", res.error().message.c_str());
                }
            }
            flush();
        }

        /// Write the Session Record if an earlier save failed
        void flush() {
            if (dirty_ && session_) {
                persist();
            }
        }

        bool connected() const { return session_.has_value(); }

        const std::optional<SessionRecord> &session() const { return session_; }

        bool dirty() const { return dirty_; }

        const ReliableMetrics &metrics() const { return sender_.metrics(); }
    };

} // namespace mailpipe
