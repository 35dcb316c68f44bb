#include "h2_pool/connection/connection_state.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <boost/asio/error.hpp>
#include <exception>
#include <utility>

#include "h2_pool/config.hpp"

namespace h2_pool {

    std::shared_ptr<ConnectionState> ConnectionState::create(
        boost::asio::any_io_executor ex, std::shared_ptr<Transport> transport) {
        auto state = std::make_shared<ConnectionState>(
            Passkey{}, std::move(ex), std::move(transport));

        std::weak_ptr<ConnectionState> weak = state;
        state->m_subscription =
            state->m_transport->subscribe_active_state([weak](bool active) {
                if (auto self = weak.lock()) self->on_active_state_changed(active);
            });
        return state;
    }

    ConnectionState::ConnectionState(Passkey, boost::asio::any_io_executor ex,
                                     std::shared_ptr<Transport> transport)
        : m_transport(std::move(transport)), m_timer(std::move(ex)) {}

    ConnectionState::~ConnectionState() {
        // A state dropped without dispose() still must not leak its handler.
        if (!m_disposed && m_transport) {
            m_transport->unsubscribe_active_state(m_subscription);
        }
    }

    std::shared_ptr<Transport> ConnectionState::activate() {
        m_active = true;
        m_latest_idle = clock_type::now();
        return m_transport;
    }

    void ConnectionState::on_active_state_changed(bool active) {
        if (m_disposed) return;
        m_active = active;
        if (!active) m_latest_idle = clock_type::now();
    }

    void ConnectionState::delay_close(std::chrono::milliseconds idle_timeout,
                                      IdleCallback on_idle) {
        if (m_disposed) return;
        m_idle_timeout = std::max(idle_timeout, kMinimumIdleTimeout);
        m_on_idle = std::move(on_idle);
        start_timer(m_idle_timeout);
    }

    void ConnectionState::start_timer(clock_type::duration after) {
        m_timer.expires_after(after);
        m_timer.async_wait([weak = weak_from_this()](
                               const boost::system::error_code& ec) {
            if (ec == boost::asio::error::operation_aborted) return;
            if (auto self = weak.lock()) self->on_timer_fired();
        });
    }

    void ConnectionState::on_timer_fired() {
        if (m_disposed) return;

        // Activity resets the clock.
        if (m_active) {
            start_timer(m_idle_timeout);
            return;
        }

        const auto elapsed = clock_type::now() - m_latest_idle;
        if (elapsed < m_idle_timeout) {
            // Went idle after the timer was armed: wait out the remainder only.
            start_timer(m_idle_timeout - elapsed);
            return;
        }

        SPDLOG_DEBUG("Connection idle for {} ms, closing",
                     std::chrono::duration_cast<std::chrono::milliseconds>(
                         elapsed)
                         .count());

        // on_idle may drop the last owning reference to this state.
        auto keep_alive = shared_from_this();
        auto on_idle = std::move(m_on_idle);
        m_on_idle = nullptr;
        if (on_idle) on_idle();
        dispose();
    }

    void ConnectionState::dispose() noexcept {
        if (m_disposed) return;
        m_disposed = true;
        m_on_idle = nullptr;

        m_timer.cancel();

        if (!m_transport) return;
        m_transport->unsubscribe_active_state(m_subscription);
        try {
            m_transport->finish();
        } catch (const std::exception& e) {
            SPDLOG_WARN("Finishing transport failed: {}", e.what());
        }
    }

}  // namespace h2_pool
