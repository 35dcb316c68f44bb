#include "h2_pool/connection/connection_manager.hpp"

#include <spdlog/spdlog.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>
#include <exception>
#include <stdexcept>
#include <utility>

#include "h2_pool/url.hpp"

namespace h2_pool {

    using awaitable_transport =
        boost::asio::awaitable<Result<ConnectionManager::TransportPtr>>;

    ConnectionManager::ConnectionManager(executor_type ex,
                                         std::shared_ptr<Connector> connector,
                                         ConnectionManagerConfiguration cfg)
        : m_state(std::make_shared<State>(std::move(ex), std::move(connector),
                                          std::move(cfg))) {
        if (!m_state->connector) {
            throw std::invalid_argument("ConnectionManager requires a Connector");
        }
    }

    ConnectionManager::ConnectionManager(executor_type ex,
                                         std::shared_ptr<TransportFactory> factory,
                                         ConnectionManagerConfiguration cfg,
                                         TlsConnectorConfiguration tls_cfg)
        : ConnectionManager(ex,
                            std::make_shared<TlsConnector>(
                                ex, std::move(factory), std::move(tls_cfg)),
                            std::move(cfg)) {}

    ConnectionManager::~ConnectionManager() {
        // Attempts still in flight keep the shared state alive and will see
        // force_closed when they finish.
        close(true);
    }

    awaitable_transport ConnectionManager::get_connection(
        RequestOptions options) {
        using R = Result<TransportPtr>;
        // Only `s` is used past the first suspension; the manager itself may
        // be gone by then.
        auto s = m_state;

        if (s->closed) {
            s->metrics.rejected_closed.fetch_add(1, std::memory_order_relaxed);
            co_return R::err(Error::Code::ManagerClosed,
                             "Connection manager is closed");
        }

        auto parsed = parse_url(options.uri);
        if (parsed.has_error()) co_return R::err(std::move(parsed).error());
        UrlComponents url = std::move(parsed).value();

        const Authority authority = Authority::from_url(url);
        const std::string key = authority.key();

        if (auto it = s->cache.find(authority); it != s->cache.end()) {
            auto state = it->second;
            if (state->transport()->is_open()) {
                s->metrics.connection_reused.fetch_add(
                    1, std::memory_order_relaxed);
                SPDLOG_DEBUG("Reusing connection to {}", key);
                co_return R::ok(state->activate());
            }

            SPDLOG_DEBUG("Cached connection to {} is closed, replacing it", key);
            s->cache.erase(it);
            state->dispose();
            s->metrics.connection_stale_replaced.fetch_add(
                1, std::memory_order_relaxed);
        }

        std::shared_ptr<PendingAttempt> attempt;
        if (auto it = s->pending.find(authority); it != s->pending.end()) {
            attempt = it->second;
            s->metrics.attempt_joined.fetch_add(1, std::memory_order_relaxed);
            SPDLOG_DEBUG("Joining in-flight connection attempt to {}", key);
        } else {
            attempt = start_attempt(s, authority, url, options);
        }

        auto outcome = co_await wait_for(std::move(attempt));
        if (outcome.has_error()) co_return R::err(std::move(outcome).error());

        auto state = std::move(outcome).value();
        if (state->disposed()) {
            // Forced close (or removal) between publication and this resume.
            co_return R::err(s->force_closed ? Error::Code::ManagerClosed
                                             : Error::Code::NetworkError,
                             "Connection to " + key +
                                 " was closed before it could be handed out");
        }
        co_return R::ok(state->activate());
    }

    std::shared_ptr<ConnectionManager::PendingAttempt>
    ConnectionManager::start_attempt(const std::shared_ptr<State>& s,
                                     const Authority& authority,
                                     const UrlComponents& url,
                                     const RequestOptions& options) {
        auto attempt = std::make_shared<PendingAttempt>(s->ex);
        s->pending.emplace(authority, attempt);

        SPDLOG_DEBUG("Opening new connection to {}", authority.key());

        // Detached: a waiter that goes away must not strand the others.
        boost::asio::co_spawn(
            s->ex, establish(s, authority, url, options, attempt),
            [s, authority, attempt](std::exception_ptr e) {
                if (!e || attempt->outcome) return;
                std::string what = "Connection attempt aborted";
                try {
                    std::rethrow_exception(e);
                } catch (const std::exception& ex) {
                    what += ": ";
                    what += ex.what();
                }
                resolve_attempt(*s, authority, attempt,
                                StateOutcome::err(Error::Code::Unknown, what));
            });

        return attempt;
    }

    boost::asio::awaitable<void> ConnectionManager::establish(
        std::shared_ptr<State> s, Authority authority, UrlComponents url,
        RequestOptions options, std::shared_ptr<PendingAttempt> attempt) {
        const std::string key = authority.key();
        ClientSetting setting;
        if (s->cfg.on_client_create) s->cfg.on_client_create(url, setting);

        Result<TransportPtr> connected =
            Result<TransportPtr>::err(Error::Code::Unknown, "Not connected");
        try {
            connected = co_await s->connector->connect(authority, options,
                                                       setting);
        } catch (const std::exception& ex) {
            connected = Result<TransportPtr>::err(
                Error::Code::Unknown,
                std::string("Connector threw: ") + ex.what());
        }

        if (connected.has_error()) {
            s->metrics.establish_failed.fetch_add(1, std::memory_order_relaxed);
            SPDLOG_WARN("Connecting to {} failed ({}): {}", key,
                        to_string(connected.error().code),
                        connected.error().message);
            resolve_attempt(*s, authority, attempt,
                            StateOutcome::err(std::move(connected).error()));
            co_return;
        }

        auto transport = std::move(connected).value();

        if (s->force_closed) {
            // Never publish after a forced close.
            ConnectionState::create(s->ex, std::move(transport))->dispose();
            s->metrics.establish_discarded.fetch_add(1,
                                                     std::memory_order_relaxed);
            SPDLOG_DEBUG("Discarding connection to {}: manager force-closed",
                         key);
            resolve_attempt(*s, authority, attempt,
                            StateOutcome::err(Error::Code::ManagerClosed,
                                              "Connection manager was closed "
                                              "while connecting to " +
                                                  key));
            co_return;
        }

        auto state = publish(s, authority, std::move(transport));
        resolve_attempt(*s, authority, attempt,
                        StateOutcome::ok(std::move(state)));
    }

    std::shared_ptr<ConnectionState> ConnectionManager::publish(
        const std::shared_ptr<State>& s, const Authority& authority,
        TransportPtr transport) {
        auto state = ConnectionState::create(s->ex, std::move(transport));

        const auto timeout =
            s->closed ? s->cfg.drain_idle_timeout : s->cfg.idle_timeout;

        std::weak_ptr<State> weak_s = s;
        std::weak_ptr<ConnectionState> weak_state = state;
        state->delay_close(timeout, [weak_s, weak_state, authority] {
            auto s = weak_s.lock();
            auto state = weak_state.lock();
            if (!s || !state) return;

            auto it = s->cache.find(authority);
            if (it == s->cache.end() || it->second != state) return;
            s->cache.erase(it);
            s->metrics.connection_evicted.fetch_add(1,
                                                    std::memory_order_relaxed);
            SPDLOG_DEBUG("Evicting idle connection to {}", authority.key());
        });

        auto [it, inserted] = s->cache.try_emplace(authority, state);
        if (!inserted) {
            auto previous = std::exchange(it->second, state);
            previous->dispose();
        }
        s->metrics.connection_created.fetch_add(1, std::memory_order_relaxed);
        return state;
    }

    void ConnectionManager::resolve_attempt(
        State& s, const Authority& authority,
        const std::shared_ptr<PendingAttempt>& attempt, StateOutcome outcome) {
        if (auto it = s.pending.find(authority);
            it != s.pending.end() && it->second == attempt) {
            s.pending.erase(it);
        }
        attempt->outcome.emplace(std::move(outcome));
        attempt->signal.cancel();
    }

    boost::asio::awaitable<ConnectionManager::StateOutcome>
    ConnectionManager::wait_for(std::shared_ptr<PendingAttempt> attempt) {
        while (!attempt->outcome) {
            boost::system::error_code ec;
            co_await attempt->signal.async_wait(
                boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        }
        co_return *attempt->outcome;
    }

    void ConnectionManager::remove_connection(const TransportPtr& transport) {
        if (!transport) return;
        auto& cache = m_state->cache;

        for (auto it = cache.begin(); it != cache.end(); ++it) {
            if (it->second->transport() != transport) continue;

            auto state = it->second;
            SPDLOG_DEBUG("Removing connection to {}", it->first.key());
            cache.erase(it);
            state->dispose();
            m_state->metrics.connection_removed.fetch_add(
                1, std::memory_order_relaxed);
            return;
        }
    }

    void ConnectionManager::close(bool force) {
        auto& s = *m_state;
        if (s.closed && (!force || s.force_closed)) return;

        s.closed = true;
        s.force_closed = s.force_closed || force;
        SPDLOG_INFO("Closing connection manager ({}; {} cached, {} pending)",
                    force ? "force" : "drain", s.cache.size(), s.pending.size());

        if (!force) return;

        auto cache = std::move(s.cache);
        s.cache.clear();
        for (auto& [authority, state] : cache) {
            (void)authority;
            state->dispose();
        }
    }

    bool ConnectionManager::has_connection(const Authority& authority) const {
        Authority normalized = authority;
        normalized.normalize_host();
        return m_state->cache.count(normalized) != 0;
    }

}  // namespace h2_pool
