#pragma once

#include <mailpipe/cancel.hpp>
#include <mailpipe/datagram.hpp>
#include <mailpipe/protocol/version.hpp>
#include <mailpipe/server/handler.hpp>
#include <mailpipe/server/mailbox_store.hpp>

#include <chrono>
#include <filesystem>
#include <optional>
#include <thread>

namespace mailpipe {

    struct ServerConfig {
        UdpEndpoint bind{"0.0.0.0", 12000};
        dp::u64 user_ttl_ms = 30 * 60 * 1000; // 0 disables idle eviction
        dp::u64 sweep_interval_ms = 1000;
        dp::usize max_mailbox_size = 1000;
        dp::usize replies_per_peer = 32;
        dp::usize max_peers = 1024;
        std::filesystem::path mailbox_file; // empty keeps mail in memory only
    };

    /// Chat server - single-threaded request loop over one datagram socket
    /// Replies go back to the address each request came from.
    class ChatServer {
      private:
        Datagram &datagram_;
        Directory &directory_;
        ServerConfig config_;
        RequestHandler handler_;
        std::chrono::steady_clock::time_point last_sweep_;
        std::optional<MailboxStore> store_;
        dp::u64 saved_revision_ = 0;

        static constexpr dp::u32 RECV_POLL_MS = 200;

        void sweep(std::chrono::steady_clock::time_point now) {
            if (config_.user_ttl_ms == 0) {
                return;
            }
            if (now - last_sweep_ < std::chrono::milliseconds(config_.sweep_interval_ms)) {
                return;
            }
            last_sweep_ = now;
            auto evicted = directory_.evict_idle(now, std::chrono::milliseconds(config_.user_ttl_ms));
            handler_.metrics().evicted_users.fetch_add(evicted.size());
        }

        // A failed save leaves saved_revision_ behind, so the next request tries again
        void persist() {
            if (!store_ || directory_.revision() == saved_revision_) {
                return;
            }
            auto res = store_->save(directory_.mailboxes());
            if (res.is_err()) {
                echo::error("saving mailboxes failed: ", res.error().message.c_str());
                return;
            }
            saved_revision_ = directory_.revision();
        }

        dp::Res<void> restore() {
            if (!store_->exists()) {
                echo::info("no saved mailboxes at ", store_->path().string());
                return dp::result::ok();
            }
            auto loaded = store_->load();
            if (loaded.is_err()) {
                echo::error("cannot load mailboxes from ", store_->path().string(), ": ",
                            loaded.error().message.c_str());
                return dp::result::err(loaded.error());
            }
            directory_.restore(std::move(loaded.value()));
            saved_revision_ = directory_.revision();
            return dp::result::ok();
        }

      public:
        ChatServer(Datagram &datagram, Directory &directory, ServerConfig config = {})
            : datagram_(datagram), directory_(directory), config_(std::move(config)),
              handler_(directory_, config_.replies_per_peer, config_.max_peers),
              last_sweep_(std::chrono::steady_clock::now()) {
            if (!config_.mailbox_file.empty()) {
                store_.emplace(config_.mailbox_file);
            }
        }

        ChatServer(const ChatServer &) = delete;
        ChatServer &operator=(const ChatServer &) = delete;

        /// Reload saved mailboxes, if configured, and bind the configured endpoint
        /// A mailbox file that exists but cannot be read is an error rather than being overwritten.
        dp::Res<void> bind() {
            if (store_) {
                auto restored = restore();
                if (restored.is_err()) {
                    return restored;
                }
            }
            auto res = datagram_.bind(config_.bind);
            if (res.is_err()) {
                echo::error("server bind to ", config_.bind.to_string(), " failed: ", res.error().message.c_str());
                return res;
            }
            return datagram_.set_recv_timeout(RECV_POLL_MS);
        }

        /// Handle one datagram, if one arrives within the poll interval
        /// Errors: transport failure other than a timeout
        dp::Res<void> poll_once() {
            auto now = std::chrono::steady_clock::now();
            sweep(now);

            auto recv_res = datagram_.recv_from();
            if (recv_res.is_err()) {
                if (recv_res.error().code == dp::Error::TIMEOUT) {
                    return dp::result::ok();
                }
                return dp::result::err(recv_res.error());
            }

            auto [bytes, source] = std::move(recv_res.value());
            auto wall = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::system_clock::now().time_since_epoch());
            auto reply = handler_.handle(bytes, source, std::chrono::steady_clock::now(),
                                         static_cast<dp::u64>(wall.count()));
            persist();
            if (reply.is_err()) {
                // Already logged and counted by the handler; nothing to answer
                return dp::result::ok();
            }

            auto send_res = datagram_.send_to(reply.value(), source);
            if (send_res.is_err()) {
                echo::error("reply to ", source.to_string(), " failed: ", send_res.error().message.c_str());
            }
            return dp::result::ok();
        }

        /// Run until the token is cancelled
        /// Transport errors are logged and the loop keeps going.
        dp::Res<void> serve(CancelToken &cancel) {
            echo::info("mailpipe server ", protocol::get_version_string().c_str(), " listening on ",
                       datagram_.local_endpoint().to_string(), " (protocol v", int(protocol::PROTOCOL_VERSION_CURRENT),
                       ")");

            while (!cancel.is_cancelled()) {
                auto res = poll_once();
                if (res.is_err()) {
                    echo::error("server recv failed: ", res.error().message.c_str());
                    std::this_thread::sleep_for(std::chrono::milliseconds(RECV_POLL_MS));
                }
            }

            const auto &m = handler_.metrics();
            echo::info("server stopping: ", m.requests.load(), " request(s), ", m.duplicates.load(), " duplicate(s), ",
                       m.rejected.load(), " rejected, ", m.malformed.load(), " malformed");
            return dp::result::ok();
        }

        const ServerMetrics &metrics() const { return handler_.metrics(); }

        const ServerConfig &config() const { return config_; }
    };

} // namespace mailpipe
