#pragma once

#include <atomic>
#include <cstdint>

namespace h2_pool {

    /// @brief Counters for monitoring connection manager behavior
    struct ConnectionManagerMetrics {
        std::atomic<std::uint64_t> connection_created{0};  ///< Published
        std::atomic<std::uint64_t> connection_reused{0};   ///< Cache hits
        std::atomic<std::uint64_t> attempt_joined{
            0};  ///< Callers that waited on someone else's attempt
        std::atomic<std::uint64_t> connection_evicted{0};  ///< Idle timeout
        std::atomic<std::uint64_t> connection_stale_replaced{
            0};  ///< Cached transport found closed
        std::atomic<std::uint64_t> connection_removed{
            0};  ///< remove_connection() hits
        std::atomic<std::uint64_t> establish_failed{0};  ///< Attempt failed
        std::atomic<std::uint64_t> establish_discarded{
            0};  ///< Finished after a forced close, never published
        std::atomic<std::uint64_t> rejected_closed{
            0};  ///< get_connection() after close()
    };

}  // namespace h2_pool
