#pragma once

// Boost 1.74 awaitable.hpp uses std::exchange without including <utility>.
#include <utility>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

#include "h2_pool/authority.hpp"
#include "h2_pool/config.hpp"
#include "h2_pool/connection/connection_manager_types.hpp"
#include "h2_pool/connection/connection_state.hpp"
#include "h2_pool/connection/connector.hpp"
#include "h2_pool/error.hpp"
#include "h2_pool/result.hpp"
#include "h2_pool/transport.hpp"

namespace h2_pool {

    /**
     * Per-authority cache of multiplexed transports.
     *
     * SAFETY:
     * - Not thread-safe. All public methods, and every coroutine they spawn,
     *   must run on the executor passed to the constructor (a single-threaded
     *   io_context or a strand)
     * - Interleaving at suspension points (resolve, connect, handshake,
     *   proxy exchange, waiting on an attempt) is expected and handled
     *
     * INVARIANTS:
     * 1. At most one cache entry per authority
     * 2. At most one establishment in flight per authority; every concurrent
     *    caller for that authority shares its outcome
     * 3. A ConnectionState belongs to exactly one cache slot, or to none once
     *    disposed
     * 4. Nothing established after close(true) is ever published
     *
     * ERRORS:
     * - ManagerClosed: close() was called; permanent
     * - InvalidUrl: the request uri has no usable authority
     * - ConnectTimeout / ConnectionFailed / ProxyTunnelFailed /
     *   TlsHandshakeFailed / NetworkError / Unknown: establishment failed;
     *   a later call retries
     *
     * LIFECYCLE:
     * 1. Construction: open, empty cache
     * 2. get_connection() populates the cache; idle connections evict
     *    themselves after the idle timeout
     * 3. close(): rejects new requests; drain shortens the idle timeout of
     *    connections still being established, force disposes everything
     * 4. Destruction: close(true)
     */
    class ConnectionManager {
       public:
        using executor_type = boost::asio::any_io_executor;
        using TransportPtr = std::shared_ptr<Transport>;

        /**
         * @brief Constructs a manager establishing connections with
         * @p connector.
         */
        ConnectionManager(executor_type ex, std::shared_ptr<Connector> connector,
                          ConnectionManagerConfiguration cfg = {});

        /**
         * @brief Constructs a manager with a TlsConnector over @p factory.
         * @throws std::runtime_error if the system trust store cannot be
         * loaded.
         */
        ConnectionManager(executor_type ex,
                          std::shared_ptr<TransportFactory> factory,
                          ConnectionManagerConfiguration cfg,
                          TlsConnectorConfiguration tls_cfg = {});

        ConnectionManager(const ConnectionManager&) = delete;
        ConnectionManager& operator=(const ConnectionManager&) = delete;

        ~ConnectionManager();

        /**
         * @brief Get a transport to the authority of @p options.uri.
         *
         * Reuses the cached transport when it is still open, joins an
         * in-flight attempt for the same authority, or starts a new one.
         * The returned transport is marked active; the manager keeps
         * ownership and closes it once idle.
         */
        boost::asio::awaitable<Result<TransportPtr>> get_connection(
            RequestOptions options);

        /// @brief Drop and finish the cached entry holding @p transport, so
        /// the next request for its authority reconnects. No-op when absent.
        void remove_connection(const TransportPtr& transport);

        /// @brief Stop handing out connections.
        /// @param force Finish every cached connection now instead of letting
        /// them drain.
        void close(bool force = false);

        bool is_closed() const noexcept { return m_state->closed; }

        std::size_t cached_count() const noexcept {
            return m_state->cache.size();
        }

        std::size_t pending_count() const noexcept {
            return m_state->pending.size();
        }

        bool has_connection(const Authority& authority) const;

        /// @brief Idle timeout given to connections established while open.
        std::chrono::milliseconds idle_timeout() const noexcept {
            return m_state->cfg.idle_timeout;
        }

        ConnectionManagerMetrics const& metrics() const noexcept {
            return m_state->metrics;
        }

       private:
        using StateOutcome = Result<std::shared_ptr<ConnectionState>>;

        /// @brief One establishment shared by every caller of an authority.
        /// Waiters park on `signal`, which never expires and is canceled once
        /// `outcome` is set.
        struct PendingAttempt {
            boost::asio::steady_timer signal;
            std::optional<StateOutcome> outcome;

            explicit PendingAttempt(const executor_type& ex) : signal(ex) {
                signal.expires_at(std::chrono::steady_clock::time_point::max());
            }
        };

        // Shared with spawned attempts and idle callbacks, which may outlive
        // the manager object itself.
        struct State {
            executor_type ex;
            std::shared_ptr<Connector> connector;
            ConnectionManagerConfiguration cfg;

            bool closed = false;
            bool force_closed = false;

            std::unordered_map<Authority, std::shared_ptr<ConnectionState>>
                cache;
            std::unordered_map<Authority, std::shared_ptr<PendingAttempt>>
                pending;

            ConnectionManagerMetrics metrics;

            State(executor_type ex_, std::shared_ptr<Connector> connector_,
                  ConnectionManagerConfiguration cfg_)
                : ex(std::move(ex_)),
                  connector(std::move(connector_)),
                  cfg(std::move(cfg_)) {}
        };

        static std::shared_ptr<PendingAttempt> start_attempt(
            const std::shared_ptr<State>& s, const Authority& authority,
            const UrlComponents& url, const RequestOptions& options);

        static boost::asio::awaitable<void> establish(
            std::shared_ptr<State> s, Authority authority, UrlComponents url,
            RequestOptions options, std::shared_ptr<PendingAttempt> attempt);

        static void resolve_attempt(State& s, const Authority& authority,
                                    const std::shared_ptr<PendingAttempt>& attempt,
                                    StateOutcome outcome);

        static std::shared_ptr<ConnectionState> publish(
            const std::shared_ptr<State>& s, const Authority& authority,
            TransportPtr transport);

        static boost::asio::awaitable<StateOutcome> wait_for(
            std::shared_ptr<PendingAttempt> attempt);

        std::shared_ptr<State> m_state;
    };

}  // namespace h2_pool
