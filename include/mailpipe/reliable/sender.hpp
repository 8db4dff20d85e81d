#pragma once

#include <mailpipe/cancel.hpp>
#include <mailpipe/datagram.hpp>
#include <mailpipe/protocol/codec.hpp>
#include <mailpipe/reliable/metrics.hpp>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <thread>

namespace mailpipe {

    /// Retry policy of one call site
    struct ReliableOptions {
        dp::u32 max_retries = 3;    // retransmissions after the first send
        dp::u32 timeout_ms = 5000; // wait per transmission
    };

    /// A sent but not yet acknowledged message
    struct PendingRequest {
        dp::u32 correlation_id;
        Message payload; // encoded once, resent verbatim
        UdpEndpoint destination; // numeric form, compared with reply sources
        std::chrono::steady_clock::time_point sent_at;
        dp::u32 retries;

        std::mutex mutex;
        std::condition_variable cv;
        bool completed;
        std::optional<protocol::ProtocolMessage> reply;

        PendingRequest(dp::u32 id, Message bytes, UdpEndpoint dest)
            : correlation_id(id), payload(std::move(bytes)), destination(std::move(dest)), retries(0),
              completed(false) {}
    };

    /// Reliable send engine
    /// Wraps one logical request in send / wait / resend-identical-payload until a reply
    /// with the same correlation id arrives from the destination, the retry budget is
    /// spent, or the CancelToken fires.
    /// A receiver thread owns recv_from() and hands replies to waiting callers, so
    /// several requests may be outstanding at once, each with its own correlation id.
    class ReliableSender {
      private:
        Datagram &datagram_;
        CancelToken &cancel_;
        std::atomic<dp::u32> next_correlation_id_;

        std::map<dp::u32, std::shared_ptr<PendingRequest>> pending_requests_;
        mutable std::mutex pending_mutex_;

        std::thread receiver_thread_;
        std::atomic<bool> running_;
        ReliableMetrics metrics_;

        static constexpr dp::u32 RECV_POLL_MS = 100;

        /// Receiver thread - matches inbound replies to pending requests
        void receiver_loop() {
            echo::debug("reliable sender receiver thread started");

            while (running_) {
                auto recv_res = datagram_.recv_from();
                if (recv_res.is_err()) {
                    // Timeout is expected - just continue to check running_ flag
                    if (recv_res.error().code == dp::Error::TIMEOUT) {
                        continue;
                    }
                    if (!running_) {
                        break;
                    }
                    // Transport errors never end the loop; back off briefly so a dead socket cannot spin
                    echo::error("reliable sender recv failed: ", recv_res.error().message.c_str());
                    std::this_thread::sleep_for(std::chrono::milliseconds(RECV_POLL_MS));
                    continue;
                }

                auto [bytes, source] = std::move(recv_res.value());
                auto decode_res = protocol::decode(bytes);
                if (decode_res.is_err()) {
                    metrics_.discarded.fetch_add(1);
                    echo::warn("discarding undecodable datagram from ", source.to_string());
                    continue;
                }

                handle_reply(std::move(decode_res.value()), source);
            }

            echo::debug("reliable sender receiver thread stopped");
        }

        void handle_reply(protocol::ProtocolMessage reply, const UdpEndpoint &source) {
            if (protocol::is_request(reply.kind())) {
                metrics_.discarded.fetch_add(1);
                echo::warn("discarding ", protocol::kind_name(reply.kind()), " request from ", source.to_string());
                return;
            }

            std::shared_ptr<PendingRequest> pending;
            {
                std::lock_guard<std::mutex> lock(pending_mutex_);
                auto it = pending_requests_.find(reply.correlation_id);
                if (it != pending_requests_.end() && it->second->destination == source) {
                    pending = it->second;
                    pending_requests_.erase(it);
                }
            }

            if (!pending) {
                // Late reply to a finished request, duplicate, or spoofed source
                metrics_.discarded.fetch_add(1);
                echo::debug("no pending request for ", protocol::kind_name(reply.kind()), " id=",
                            reply.correlation_id, " from ", source.to_string());
                return;
            }

            echo::trace("reply ", protocol::kind_name(reply.kind()), " id=", reply.correlation_id, " from ",
                        source.to_string());
            {
                std::lock_guard<std::mutex> lock(pending->mutex);
                pending->reply = std::move(reply);
                pending->completed = true;
            }
            pending->cv.notify_one();
        }

        void forget(dp::u32 correlation_id) {
            std::lock_guard<std::mutex> lock(pending_mutex_);
            pending_requests_.erase(correlation_id);
        }

      public:
        /// The datagram must already be bound (an ephemeral port is enough)
        ReliableSender(Datagram &datagram, CancelToken &cancel)
            : datagram_(datagram), cancel_(cancel), next_correlation_id_(std::random_device{}()), running_(true) {
            echo::trace("ReliableSender constructed on ", datagram_.local_endpoint().to_string());
            // Short receive timeout lets the receiver thread notice shutdown
            auto timeout_res = datagram_.set_recv_timeout(RECV_POLL_MS);
            if (timeout_res.is_err()) {
                echo::warn("failed to set recv timeout: ", timeout_res.error().message.c_str());
            }
            receiver_thread_ = std::thread(&ReliableSender::receiver_loop, this);
        }

        ~ReliableSender() {
            echo::trace("ReliableSender shutting down");
            running_ = false;

            // Wake up all pending requests; they report cancellation
            {
                std::lock_guard<std::mutex> lock(pending_mutex_);
                for (auto &pair : pending_requests_) {
                    std::lock_guard<std::mutex> req_lock(pair.second->mutex);
                    pair.second->completed = true;
                    pair.second->cv.notify_one();
                }
                pending_requests_.clear();
            }

            // DON'T close the datagram - its owner closes it
            if (receiver_thread_.joinable()) {
                receiver_thread_.join();
            }
            echo::trace("ReliableSender destroyed");
        }

        ReliableSender(const ReliableSender &) = delete;
        ReliableSender &operator=(const ReliableSender &) = delete;

        /// Fresh correlation id, unique among this engine's outstanding requests
        dp::u32 next_correlation_id() { return next_correlation_id_.fetch_add(1); }

        /// Send a request and wait for its reply
        /// Transmits at most 1 + max_retries times, waiting timeout_ms after each.
        /// Errors:
        ///   timeout          - delivery failed, every transmission went unanswered
        ///   io_error         - cancelled, engine shutting down, or transport failure
        ///   invalid_argument - correlation id already outstanding
        ///   not_found        - destination host does not resolve
        dp::Res<protocol::ProtocolMessage> send_reliable(const protocol::ProtocolMessage &message,
                                                         const UdpEndpoint &destination, dp::u32 max_retries,
                                                         dp::u32 timeout_ms) {
            if (cancel_.is_cancelled()) {
                metrics_.cancelled.fetch_add(1);
                return dp::result::err(dp::Error::io_error("cancelled"));
            }

            auto resolved = resolve_endpoint(destination);
            if (resolved.is_err()) {
                return dp::result::err(resolved.error());
            }

            dp::u32 id = message.correlation_id;
            auto pending = std::make_shared<PendingRequest>(id, protocol::encode(message), resolved.value());
            {
                std::lock_guard<std::mutex> lock(pending_mutex_);
                if (pending_requests_.count(id) != 0) {
                    echo::error("correlation id already outstanding: ", id);
                    return dp::result::err(dp::Error::invalid_argument("correlation id already outstanding"));
                }
                pending_requests_[id] = pending;
            }
            metrics_.requests.fetch_add(1);
            pending->sent_at = std::chrono::steady_clock::now();

            echo::trace("reliable send ", protocol::kind_name(message.kind()), " id=", id, " to ",
                        pending->destination.to_string(), " retries=", max_retries, " timeout=", timeout_ms, "ms");

            for (dp::u32 attempt = 0; attempt <= max_retries; ++attempt) {
                if (attempt > 0) {
                    {
                        // The previous reply may have landed just after its deadline
                        std::lock_guard<std::mutex> lock(pending->mutex);
                        if (pending->completed && pending->reply) {
                            metrics_.delivered.fetch_add(1);
                            metrics_.record_latency(std::chrono::steady_clock::now() - pending->sent_at);
                            return dp::result::ok(std::move(*pending->reply));
                        }
                    }
                    pending->retries = attempt;
                    metrics_.retransmissions.fetch_add(1);
                    echo::debug("retransmitting id=", id, " (retry ", attempt, "/", max_retries, ")");
                }

                auto send_res = datagram_.send_to(pending->payload, pending->destination);
                if (send_res.is_err()) {
                    forget(id);
                    echo::error("reliable send failed id=", id, ": ", send_res.error().message.c_str());
                    return dp::result::err(send_res.error());
                }
                metrics_.transmissions.fetch_add(1);

                // Race the reply against the per-attempt deadline, re-checking cancellation every slice
                auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
                std::unique_lock<std::mutex> lock(pending->mutex);
                while (!pending->completed) {
                    if (cancel_.is_cancelled() || !running_) {
                        lock.unlock();
                        forget(id);
                        metrics_.cancelled.fetch_add(1);
                        echo::info("reliable send cancelled id=", id);
                        return dp::result::err(dp::Error::io_error("cancelled"));
                    }
                    auto now = std::chrono::steady_clock::now();
                    if (now >= deadline) {
                        break;
                    }
                    auto slice = std::min<std::chrono::steady_clock::duration>(deadline - now, CANCEL_POLL_INTERVAL);
                    pending->cv.wait_for(lock, slice);
                }

                if (pending->completed) {
                    if (!pending->reply) {
                        // Woken by the destructor
                        metrics_.cancelled.fetch_add(1);
                        return dp::result::err(dp::Error::io_error("reliable sender shut down"));
                    }
                    metrics_.delivered.fetch_add(1);
                    metrics_.record_latency(std::chrono::steady_clock::now() - pending->sent_at);
                    echo::trace("delivered id=", id, " after ", attempt + 1, " transmission(s)");
                    return dp::result::ok(std::move(*pending->reply));
                }

                echo::debug("timeout waiting for reply id=", id, " attempt ", attempt + 1);
            }

            forget(id);
            // A reply may have raced in between the last timeout and forget()
            {
                std::lock_guard<std::mutex> lock(pending->mutex);
                if (pending->completed && pending->reply) {
                    metrics_.delivered.fetch_add(1);
                    metrics_.record_latency(std::chrono::steady_clock::now() - pending->sent_at);
                    return dp::result::ok(std::move(*pending->reply));
                }
            }

            metrics_.failed.fetch_add(1);
            echo::warn("delivery failed id=", id, " after ", max_retries + 1, " transmission(s)");
            return dp::result::err(dp::Error::timeout("delivery failed"));
        }

        dp::Res<protocol::ProtocolMessage> send_reliable(const protocol::ProtocolMessage &message,
                                                         const UdpEndpoint &destination,
                                                         const ReliableOptions &options) {
            return send_reliable(message, destination, options.max_retries, options.timeout_ms);
        }

        /// Single fire-and-forget transmission, no reply expected
        dp::Res<void> send_unreliable(const protocol::ProtocolMessage &message, const UdpEndpoint &destination) {
            echo::trace("unreliable send ", protocol::kind_name(message.kind()), " id=", message.correlation_id,
                        " to ", destination.to_string());
            metrics_.transmissions.fetch_add(1);
            return datagram_.send_to(protocol::encode(message), destination);
        }

        /// Get number of requests awaiting a reply
        dp::usize pending_count() const {
            std::lock_guard<std::mutex> lock(pending_mutex_);
            return pending_requests_.size();
        }

        const ReliableMetrics &metrics() const { return metrics_; }

        void reset_metrics() { metrics_.reset(); }
    };

} // namespace mailpipe
