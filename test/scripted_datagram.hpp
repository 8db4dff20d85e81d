#pragma once

#include <mailpipe/datagram.hpp>

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace mailpipe_test {

    /// In-memory Datagram for fault scenarios
    /// Every send_to() is recorded and handed to the responder, which may answer
    /// by calling deliver(); recv_from() returns delivered datagrams in order.
    class ScriptedDatagram : public mailpipe::Datagram {
      public:
        using Responder = std::function<void(const mailpipe::Message &, const mailpipe::UdpEndpoint &)>;

      private:
        mutable std::mutex mutex_;
        std::condition_variable cv_;
        std::deque<std::pair<mailpipe::Message, mailpipe::UdpEndpoint>> inbox_;
        std::vector<std::pair<mailpipe::Message, mailpipe::UdpEndpoint>> sent_;
        Responder responder_;
        dp::u32 timeout_ms_ = 0;
        bool closed_ = false;
        mailpipe::UdpEndpoint local_{"127.0.0.1", 40000};

      public:
        ScriptedDatagram() = default;
        explicit ScriptedDatagram(mailpipe::UdpEndpoint local) : local_(std::move(local)) {}

        void set_responder(Responder responder) {
            std::lock_guard<std::mutex> lock(mutex_);
            responder_ = std::move(responder);
        }

        void deliver(mailpipe::Message msg, mailpipe::UdpEndpoint from) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                inbox_.emplace_back(std::move(msg), std::move(from));
            }
            cv_.notify_all();
        }

        dp::usize sent_count() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return sent_.size();
        }

        mailpipe::Message sent_at(dp::usize index) const {
            std::lock_guard<std::mutex> lock(mutex_);
            return sent_.at(index).first;
        }

        dp::Res<void> bind(const mailpipe::UdpEndpoint &endpoint) override {
            std::lock_guard<std::mutex> lock(mutex_);
            if (endpoint.port != 0) {
                local_ = endpoint;
            }
            return dp::result::ok();
        }

        dp::Res<void> send_to(const mailpipe::Message &msg, const mailpipe::UdpEndpoint &dest) override {
            Responder responder;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (closed_) {
                    return dp::result::err(dp::Error::io_error("closed"));
                }
                sent_.emplace_back(msg, dest);
                responder = responder_;
            }
            if (responder) {
                responder(msg, dest);
            }
            return dp::result::ok();
        }

        dp::Res<dp::Pair<mailpipe::Message, mailpipe::UdpEndpoint>> recv_from() override {
            std::unique_lock<std::mutex> lock(mutex_);
            auto ready = [this]() { return !inbox_.empty() || closed_; };
            if (timeout_ms_ == 0) {
                cv_.wait(lock, ready);
            } else if (!cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms_), ready)) {
                return dp::result::err(dp::Error::timeout("recv timeout"));
            }
            if (inbox_.empty()) {
                return dp::result::err(dp::Error::io_error("closed"));
            }
            auto [msg, src] = std::move(inbox_.front());
            inbox_.pop_front();
            return dp::result::ok(dp::Pair<mailpipe::Message, mailpipe::UdpEndpoint>(std::move(msg), src));
        }

        dp::Res<void> set_recv_timeout(dp::u32 timeout_ms) override {
            std::lock_guard<std::mutex> lock(mutex_);
            timeout_ms_ = timeout_ms;
            return dp::result::ok();
        }

        mailpipe::UdpEndpoint local_endpoint() const override {
            std::lock_guard<std::mutex> lock(mutex_);
            return local_;
        }

        void close() override {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                closed_ = true;
            }
            cv_.notify_all();
        }
    };

} // namespace mailpipe_test
