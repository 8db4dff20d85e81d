#pragma once

#include <mailpipe/endpoint.hpp>

#include <deque>
#include <map>
#include <optional>

namespace mailpipe {

    /// Remembers the last replies sent to each source address so a retransmitted
    /// request (same correlation id) is answered again without being re-applied.
    /// Keeps `per_peer` replies per address and at most `max_peers` addresses,
    /// dropping the least recently used address first.
    class ReplyCache {
      private:
        struct Entry {
            dp::u32 correlation_id;
            Message reply;
        };

        struct PeerHistory {
            std::deque<Entry> entries; // oldest first
            dp::u64 last_used;
        };

        std::map<UdpEndpoint, PeerHistory> peers_;
        dp::usize per_peer_;
        dp::usize max_peers_;
        dp::u64 clock_; // logical use counter for LRU

        void evict_least_recent() {
            auto oldest = peers_.begin();
            for (auto it = peers_.begin(); it != peers_.end(); ++it) {
                if (it->second.last_used < oldest->second.last_used) {
                    oldest = it;
                }
            }
            echo::trace("reply cache evicting ", oldest->first.to_string());
            peers_.erase(oldest);
        }

      public:
        explicit ReplyCache(dp::usize per_peer = 32, dp::usize max_peers = 1024)
            : per_peer_(per_peer == 0 ? 1 : per_peer), max_peers_(max_peers == 0 ? 1 : max_peers), clock_(0) {}

        /// Cached reply for a request already handled, if any
        std::optional<Message> lookup(const UdpEndpoint &peer, dp::u32 correlation_id) {
            auto it = peers_.find(peer);
            if (it == peers_.end()) {
                return std::nullopt;
            }
            for (const auto &entry : it->second.entries) {
                if (entry.correlation_id == correlation_id) {
                    it->second.last_used = ++clock_;
                    return entry.reply;
                }
            }
            return std::nullopt;
        }

        /// Remember the reply sent for (peer, correlation_id)
        void store(const UdpEndpoint &peer, dp::u32 correlation_id, const Message &reply) {
            auto it = peers_.find(peer);
            if (it == peers_.end()) {
                if (peers_.size() >= max_peers_) {
                    evict_least_recent();
                }
                it = peers_.emplace(peer, PeerHistory{{}, 0}).first;
            }

            auto &history = it->second;
            history.last_used = ++clock_;
            history.entries.push_back(Entry{correlation_id, reply});
            while (history.entries.size() > per_peer_) {
                history.entries.pop_front();
            }
        }

        dp::usize peer_count() const { return peers_.size(); }

        dp::usize entry_count(const UdpEndpoint &peer) const {
            auto it = peers_.find(peer);
            return it == peers_.end() ? 0 : it->second.entries.size();
        }
    };

} // namespace mailpipe
