#pragma once

#include <atomic>
#include <chrono>
#include <datapod/datapod.hpp>

namespace mailpipe {

    /// Cooperative cancellation flag shared between a signal handler or
    /// controlling thread and the code that waits on the network.
    /// cancel() is a single lock-free store and may be called from a signal handler.
    class CancelToken {
      private:
        std::atomic<bool> cancelled_{false};

      public:
        CancelToken() = default;
        CancelToken(const CancelToken &) = delete;
        CancelToken &operator=(const CancelToken &) = delete;

        void cancel() noexcept { cancelled_.store(true); }

        bool is_cancelled() const noexcept { return cancelled_.load(); }

        /// Re-arm after a handled cancellation
        void reset() noexcept { cancelled_.store(false); }
    };

    /// Longest single wait before a waiter re-checks its CancelToken
    constexpr std::chrono::milliseconds CANCEL_POLL_INTERVAL{50};

} // namespace mailpipe
