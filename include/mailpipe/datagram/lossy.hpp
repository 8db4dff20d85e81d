#pragma once

#include <mailpipe/datagram.hpp>

#include <atomic>
#include <functional>
#include <mutex>
#include <random>

namespace mailpipe {

    // Fault-injecting decorator over another Datagram
    // Drops outbound and inbound datagrams and duplicates outbound ones,
    // either at random (seeded, so runs are repeatable) or as decided by a filter.
    // The wrapped transport must outlive the decorator.
    class LossyDatagram : public Datagram {
      public:
        enum class Direction : dp::u8 { Outbound, Inbound };

        /// Return true to drop the datagram
        using DropFilter = std::function<bool(Direction, const Message &, const UdpEndpoint &)>;

        struct Options {
            double drop_rate = 0.0;      // probability of dropping each datagram (both directions)
            double duplicate_rate = 0.0; // probability of sending an outbound datagram twice
            dp::u32 seed = 1;
        };

      private:
        Datagram &inner_;
        Options options_;
        DropFilter filter_;
        std::mt19937 rng_;
        std::mutex rng_mutex_;
        std::atomic<dp::u64> dropped_{0};
        std::atomic<dp::u64> duplicated_{0};

        bool roll(double rate) {
            if (rate <= 0.0) {
                return false;
            }
            std::lock_guard<std::mutex> lock(rng_mutex_);
            std::uniform_real_distribution<double> dist(0.0, 1.0);
            return dist(rng_) < rate;
        }

        bool should_drop(Direction dir, const Message &msg, const UdpEndpoint &peer) {
            if (filter_) {
                return filter_(dir, msg, peer);
            }
            return roll(options_.drop_rate);
        }

      public:
        LossyDatagram(Datagram &inner, Options options) : inner_(inner), options_(options), rng_(options.seed) {
            echo::debug("LossyDatagram constructed drop_rate=", options.drop_rate,
                        " duplicate_rate=", options.duplicate_rate, " seed=", options.seed);
        }

        LossyDatagram(Datagram &inner, DropFilter filter) : inner_(inner), filter_(std::move(filter)), rng_(1) {
            echo::debug("LossyDatagram constructed with drop filter");
        }

        dp::Res<void> bind(const UdpEndpoint &endpoint) override { return inner_.bind(endpoint); }

        dp::Res<void> send_to(const Message &msg, const UdpEndpoint &dest) override {
            if (should_drop(Direction::Outbound, msg, dest)) {
                dropped_.fetch_add(1);
                echo::debug("lossy: dropped outbound datagram to ", dest.to_string(), " len=", msg.size());
                return dp::result::ok();
            }

            auto res = inner_.send_to(msg, dest);
            if (res.is_ok() && roll(options_.duplicate_rate)) {
                duplicated_.fetch_add(1);
                echo::debug("lossy: duplicated outbound datagram to ", dest.to_string());
                return inner_.send_to(msg, dest);
            }
            return res;
        }

        dp::Res<dp::Pair<Message, UdpEndpoint>> recv_from() override {
            while (true) {
                auto res = inner_.recv_from();
                if (res.is_err()) {
                    return res;
                }
                const auto &[msg, src] = res.value();
                if (!should_drop(Direction::Inbound, msg, src)) {
                    return res;
                }
                dropped_.fetch_add(1);
                echo::debug("lossy: dropped inbound datagram from ", src.to_string(), " len=", msg.size());
            }
        }

        dp::Res<void> set_recv_timeout(dp::u32 timeout_ms) override { return inner_.set_recv_timeout(timeout_ms); }

        UdpEndpoint local_endpoint() const override { return inner_.local_endpoint(); }

        void close() override { inner_.close(); }

        /// Number of datagrams dropped so far (both directions)
        dp::u64 dropped() const { return dropped_.load(); }

        /// Number of outbound datagrams sent twice
        dp::u64 duplicated() const { return duplicated_.load(); }
    };

} // namespace mailpipe
