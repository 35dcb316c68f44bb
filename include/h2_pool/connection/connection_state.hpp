#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <functional>
#include <memory>

#include "h2_pool/transport.hpp"

namespace h2_pool {

    /**
     * @brief One pooled transport plus the bookkeeping that decides when it
     * has been idle long enough to close.
     *
     * INVARIANTS:
     * 1. is_active() is true while at least one stream is open on the
     *    transport, and after every hand-out through activate()
     * 2. latest_idle_timestamp() is the instant activity last dropped to zero
     *    (or the last hand-out)
     * 3. Once disposed, no timer callback and no on_idle callback ever runs
     *
     * Not thread-safe: all calls and all timer handlers run on the executor
     * passed to create().
     */
    class ConnectionState
        : public std::enable_shared_from_this<ConnectionState> {
       public:
        using clock_type = std::chrono::steady_clock;
        using IdleCallback = std::function<void()>;

        /// @brief Create a state owning @p transport and subscribe to its
        /// active-state signal.
        static std::shared_ptr<ConnectionState> create(
            boost::asio::any_io_executor ex,
            std::shared_ptr<Transport> transport);

       private:
        struct Passkey {
            explicit Passkey() = default;
        };

       public:
        /// @brief Use create(); the subscription needs a shared owner.
        ConnectionState(Passkey, boost::asio::any_io_executor ex,
                        std::shared_ptr<Transport> transport);

        ConnectionState(const ConnectionState&) = delete;
        ConnectionState& operator=(const ConnectionState&) = delete;

        ~ConnectionState();

        const std::shared_ptr<Transport>& transport() const noexcept {
            return m_transport;
        }

        /// @brief Mark the connection as in use and return its transport.
        std::shared_ptr<Transport> activate();

        bool is_active() const noexcept { return m_active; }

        clock_type::time_point latest_idle_timestamp() const noexcept {
            return m_latest_idle;
        }

        /// @brief Arm the idle-eviction timer.
        /// @param idle_timeout How long the connection must stay inactive;
        /// raised to kMinimumIdleTimeout when smaller.
        /// @param on_idle Runs once when the connection is evicted, right
        /// before the transport is finished.
        void delay_close(std::chrono::milliseconds idle_timeout,
                         IdleCallback on_idle);

        /// @brief The effective idle timeout, zero until delay_close().
        std::chrono::milliseconds idle_timeout() const noexcept {
            return m_idle_timeout;
        }

        /// @brief Cancel the timer, drop the subscription and finish the
        /// transport. Idempotent.
        void dispose() noexcept;

        bool disposed() const noexcept { return m_disposed; }

       private:
        void on_active_state_changed(bool active);
        void start_timer(clock_type::duration after);
        void on_timer_fired();

        std::shared_ptr<Transport> m_transport;
        boost::asio::steady_timer m_timer;
        Transport::HandlerId m_subscription{0};

        bool m_active{true};
        clock_type::time_point m_latest_idle{clock_type::now()};

        std::chrono::milliseconds m_idle_timeout{0};
        IdleCallback m_on_idle;
        bool m_disposed{false};
    };

}  // namespace h2_pool
