#pragma once

#include <atomic>
#include <datapod/datapod.hpp>

namespace ruidapipe {

    /// Counters kept by the relay loop
    /// Written by the loop thread only; atomics so another thread may read them
    struct RelayStats {
        // World-facing traffic
        std::atomic<dp::u64> datagrams_received{0};
        std::atomic<dp::u64> datagrams_admitted{0};
        std::atomic<dp::u64> datagrams_rejected{0};

        // Device-facing traffic
        std::atomic<dp::u64> datagrams_forwarded{0};
        std::atomic<dp::u64> forward_failures{0};
        std::atomic<dp::u64> replies_from_device{0};
        std::atomic<dp::u64> stray_datagrams{0}; // device-facing traffic not from the board

        std::atomic<dp::u64> receive_errors{0};

        // Session lifecycle
        std::atomic<dp::u64> sessions_started{0};
        std::atomic<dp::u64> sessions_completed{0};
        std::atomic<dp::u64> sessions_superseded{0};
        std::atomic<dp::u64> sessions_failed{0};

        std::atomic<dp::u64> bytes_persisted{0};

        /// Reset all counters to zero
        inline void reset() {
            datagrams_received = 0;
            datagrams_admitted = 0;
            datagrams_rejected = 0;
            datagrams_forwarded = 0;
            forward_failures = 0;
            replies_from_device = 0;
            stray_datagrams = 0;
            receive_errors = 0;
            sessions_started = 0;
            sessions_completed = 0;
            sessions_superseded = 0;
            sessions_failed = 0;
            bytes_persisted = 0;
        }

        /// Fraction of world datagrams turned away (0.0 to 1.0)
        inline double rejection_rate() const {
            dp::u64 total = datagrams_received.load();
            if (total == 0)
                return 0.0;
            return static_cast<double>(datagrams_rejected.load()) / static_cast<double>(total);
        }
    };

} // namespace ruidapipe
