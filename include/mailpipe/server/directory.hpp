#pragma once

#include <mailpipe/endpoint.hpp>
#include <mailpipe/protocol/codec.hpp>

#include <chrono>
#include <deque>
#include <map>
#include <optional>

namespace mailpipe {

    /// A connected user
    struct User {
        dp::String username;
        dp::String first_name;
        UdpEndpoint address;
        std::chrono::steady_clock::time_point last_seen;
    };

    /// Why the directory refused an operation; empty when it was applied
    using Rejection = std::optional<protocol::ErrorCode>;

    /// Undelivered mail by recipient, oldest first
    using Mailboxes = std::map<dp::String, std::deque<protocol::MailItem>>;

    /// Authoritative user directory and per-user mailboxes (server side)
    /// Owned by the server process and handed to the request handler by reference.
    /// Not thread-safe: the server applies one request at a time.
    class Directory {
      private:
        std::map<dp::String, User> users_;                               // keyed and iterated by username
        Mailboxes mailboxes_; // only recipients with mail waiting
        dp::usize max_mailbox_size_;
        dp::u64 revision_ = 0; // bumped whenever mailbox contents change

        void drop_if_empty(const dp::String &username) {
            auto it = mailboxes_.find(username);
            if (it != mailboxes_.end() && it->second.empty()) {
                mailboxes_.erase(it);
            }
        }

      public:
        explicit Directory(dp::usize max_mailbox_size = 1000) : max_mailbox_size_(max_mailbox_size) {
            echo::trace("Directory constructed, max_mailbox_size=", max_mailbox_size);
        }

        /// Register or refresh a user
        /// A username bound to a different address is refused and left untouched
        Rejection connect(const dp::String &username, const dp::String &first_name, const UdpEndpoint &address,
                          std::chrono::steady_clock::time_point now) {
            auto it = users_.find(username);
            if (it != users_.end() && it->second.address != address) {
                echo::warn("username '", username.c_str(), "' taken by ", it->second.address.to_string(),
                           ", refused for ", address.to_string());
                return protocol::ErrorCode::UsernameTaken;
            }

            users_[username] = User{username, first_name, address, now};
            echo::info("user '", username.c_str(), "' connected from ", address.to_string());
            return std::nullopt;
        }

        /// Check that a request naming `username` really comes from that user's address
        /// and refresh its last-seen time
        Rejection authorize(const dp::String &username, const UdpEndpoint &address,
                            std::chrono::steady_clock::time_point now) {
            auto it = users_.find(username);
            if (it == users_.end() || it->second.address != address) {
                echo::debug("request as '", username.c_str(), "' from ", address.to_string(), " not connected");
                return protocol::ErrorCode::NotConnected;
            }
            it->second.last_seen = now;
            return std::nullopt;
        }

        /// Remove a user if it is registered from `address`; undelivered mail is kept
        bool disconnect(const dp::String &username, const UdpEndpoint &address) {
            auto it = users_.find(username);
            if (it == users_.end() || it->second.address != address) {
                return false;
            }
            users_.erase(it);
            drop_if_empty(username);
            echo::info("user '", username.c_str(), "' disconnected");
            return true;
        }

        /// Online users in username order, truncated to what fits `byte_budget`
        protocol::ListResponse list(dp::usize byte_budget = protocol::LIST_PAYLOAD_BUDGET) const {
            protocol::ListResponse response;
            response.total = static_cast<dp::u32>(users_.size());
            dp::usize used = 0;
            for (const auto &[name, user] : users_) {
                protocol::UserEntry entry{user.username, user.first_name};
                dp::usize size = protocol::wire_size(entry);
                if (used + size > byte_budget) {
                    echo::warn("user list truncated at ", response.users.size(), " of ", users_.size());
                    break;
                }
                used += size;
                response.users.push_back(std::move(entry));
            }
            return response;
        }

        /// Queue a message for `recipient`
        Rejection deliver(const dp::String &sender, const dp::String &recipient, const dp::String &body,
                          dp::u64 sent_at_ms) {
            if (users_.find(recipient) == users_.end()) {
                return protocol::ErrorCode::UnknownRecipient;
            }
            if (mailbox_size(recipient) >= max_mailbox_size_) {
                echo::warn("mailbox of '", recipient.c_str(), "' full (", mailbox_size(recipient), ")");
                return protocol::ErrorCode::MailboxFull;
            }
            auto &mailbox = mailboxes_[recipient];
            mailbox.push_back(protocol::MailItem{sender, body, sent_at_ms});
            revision_++;
            echo::debug("queued message ", sender.c_str(), " -> ", recipient.c_str(), " (", mailbox.size(),
                        " waiting)");
            return std::nullopt;
        }

        /// Remove and return queued messages for `username`, oldest first
        /// Only messages from `from_filter` are taken unless it is empty.
        /// Takes what fits `byte_budget`; `remaining` counts matching messages left behind.
        protocol::RetrieveResponse drain(const dp::String &username, const dp::String &from_filter = dp::String(),
                                         dp::usize byte_budget = protocol::LIST_PAYLOAD_BUDGET) {
            protocol::RetrieveResponse response;
            auto it = mailboxes_.find(username);
            if (it == mailboxes_.end() || it->second.empty()) {
                return response;
            }

            std::deque<protocol::MailItem> kept;
            dp::usize used = 0;
            bool full = false;
            for (auto &item : it->second) {
                bool matches = from_filter.empty() || item.from == from_filter;
                if (!matches) {
                    kept.push_back(std::move(item));
                    continue;
                }
                dp::usize size = protocol::wire_size(item);
                if (full || used + size > byte_budget) {
                    full = true;
                    response.remaining++;
                    kept.push_back(std::move(item));
                    continue;
                }
                used += size;
                response.messages.push_back(std::move(item));
            }
            it->second = std::move(kept);
            if (!response.messages.empty()) {
                revision_++;
            }
            if (it->second.empty()) {
                mailboxes_.erase(it);
            }

            echo::debug("drained ", response.messages.size(), " message(s) for '", username.c_str(), "', ",
                        response.remaining, " left");
            return response;
        }

        /// Evict users idle for longer than `ttl`; undelivered mail stays
        dp::Vector<dp::String> evict_idle(std::chrono::steady_clock::time_point now, std::chrono::milliseconds ttl) {
            dp::Vector<dp::String> evicted;
            for (auto it = users_.begin(); it != users_.end();) {
                if (now - it->second.last_seen > ttl) {
                    echo::info("evicting idle user '", it->first.c_str(), "' (", it->second.address.to_string(), ")");
                    evicted.push_back(it->first);
                    drop_if_empty(it->first);
                    it = users_.erase(it);
                } else {
                    ++it;
                }
            }
            return evicted;
        }

        /// Find a connected user
        const User *find(const dp::String &username) const {
            auto it = users_.find(username);
            return it == users_.end() ? nullptr : &it->second;
        }

        dp::usize user_count() const { return users_.size(); }

        /// Recipients with at least one message waiting
        dp::usize mailbox_count() const { return mailboxes_.size(); }

        const Mailboxes &mailboxes() const { return mailboxes_; }

        /// Changes whenever a message is queued or drained
        dp::u64 revision() const { return revision_; }

        /// Replace all mailboxes with a saved snapshot; users are not touched
        void restore(Mailboxes saved) {
            mailboxes_.clear();
            for (auto &[name, items] : saved) {
                if (!items.empty()) {
                    mailboxes_.emplace(name, std::move(items));
                }
            }
            echo::info("restored mail for ", mailboxes_.size(), " recipient(s)");
        }

        /// Number of messages waiting for `username`
        dp::usize mailbox_size(const dp::String &username) const {
            auto it = mailboxes_.find(username);
            return it == mailboxes_.end() ? 0 : it->second.size();
        }
    };

} // namespace mailpipe
