#pragma once

#include <atomic>
#include <chrono>
#include <datapod/datapod.hpp>

namespace mailpipe {

    /// Counters for the reliable send engine
    struct ReliableMetrics {
        std::atomic<dp::u64> requests{0};        // logical sends started
        std::atomic<dp::u64> transmissions{0};   // datagrams put on the wire, retransmissions included
        std::atomic<dp::u64> retransmissions{0}; // resends after a timeout
        std::atomic<dp::u64> delivered{0};
        std::atomic<dp::u64> failed{0};    // retry budget exhausted
        std::atomic<dp::u64> cancelled{0}; // aborted by CancelToken
        std::atomic<dp::u64> discarded{0}; // inbound datagrams that matched no pending request

        // Round trip of delivered requests, first transmission to reply (microseconds)
        std::atomic<dp::u64> total_latency_us{0};
        std::atomic<dp::u64> max_latency_us{0};

        inline void reset() {
            requests = 0;
            transmissions = 0;
            retransmissions = 0;
            delivered = 0;
            failed = 0;
            cancelled = 0;
            discarded = 0;
            total_latency_us = 0;
            max_latency_us = 0;
        }

        /// Get average latency of delivered requests in microseconds
        inline dp::u64 avg_latency_us() const {
            dp::u64 count = delivered.load();
            if (count == 0)
                return 0;
            return total_latency_us.load() / count;
        }

        /// Get delivery rate (0.0 to 1.0) over finished requests
        inline double delivery_rate() const {
            dp::u64 finished = delivered.load() + failed.load();
            if (finished == 0)
                return 0.0;
            return static_cast<double>(delivered.load()) / static_cast<double>(finished);
        }

        inline void record_latency(std::chrono::steady_clock::duration elapsed) {
            dp::u64 us = static_cast<dp::u64>(std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count());
            total_latency_us.fetch_add(us);
            dp::u64 current_max = max_latency_us.load();
            while (us > current_max && !max_latency_us.compare_exchange_weak(current_max, us)) {
            }
        }
    };

    /// Counters for the server request path
    struct ServerMetrics {
        std::atomic<dp::u64> requests{0};   // decodable requests handled
        std::atomic<dp::u64> duplicates{0}; // answered from the reply cache
        std::atomic<dp::u64> malformed{0};  // undecodable datagrams discarded
        std::atomic<dp::u64> rejected{0};   // answered with an ERROR reply
        std::atomic<dp::u64> evicted_users{0};

        inline void reset() {
            requests = 0;
            duplicates = 0;
            malformed = 0;
            rejected = 0;
            evicted_users = 0;
        }
    };

} // namespace mailpipe
