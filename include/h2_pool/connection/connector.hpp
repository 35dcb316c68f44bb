#pragma once

// Boost 1.74 awaitable.hpp uses std::exchange without including <utility>.
#include <utility>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ssl/context.hpp>
#include <chrono>
#include <memory>

#include "h2_pool/authority.hpp"
#include "h2_pool/config.hpp"
#include "h2_pool/result.hpp"
#include "h2_pool/transport.hpp"

namespace h2_pool {

    /**
     * @brief Establishes a new transport to an authority.
     *
     * The ConnectionManager calls connect() at most once at a time per
     * authority and shares the outcome with every caller waiting on it.
     */
    class Connector {
       public:
        virtual ~Connector() = default;

        /**
         * @brief Establish a transport to @p target.
         * @param target Authority to connect to.
         * @param options Carries the connect timeout.
         * @param setting TLS material and optional proxy for this attempt.
         */
        virtual boost::asio::awaitable<Result<std::shared_ptr<Transport>>>
        connect(const Authority& target, const RequestOptions& options,
                const ClientSetting& setting) = 0;
    };

    /**
     * @brief Connects over TLS, directly or through an HTTP CONNECT proxy,
     * and hands the handshaken stream to a TransportFactory.
     *
     * The peer certificate is always verified against the target host when
     * the ClientSetting carries its own context; the default context verifies
     * unless TlsConnectorConfiguration::verify_tls is false. A peer that does
     * not select the configured ALPN protocol fails the attempt with
     * TlsHandshakeFailed.
     */
    class TlsConnector : public Connector {
       public:
        /**
         * @brief Constructs a TlsConnector.
         * @param ex Executor for sockets and timers.
         * @param factory Wraps each TLS stream into a transport.
         * @param cfg TLS options for the default context and ALPN.
         * @throws std::runtime_error if the system trust store cannot be
         * loaded.
         */
        TlsConnector(boost::asio::any_io_executor ex,
                     std::shared_ptr<TransportFactory> factory,
                     TlsConnectorConfiguration cfg = {});

        boost::asio::awaitable<Result<std::shared_ptr<Transport>>> connect(
            const Authority& target, const RequestOptions& options,
            const ClientSetting& setting) override;

        /// @brief Context used when a ClientSetting carries none.
        boost::asio::ssl::context& default_context() noexcept {
            return m_ssl_ctx;
        }

       private:
        using StreamResult = Result<std::unique_ptr<TlsStream>>;

        boost::asio::awaitable<StreamResult> connect_direct(
            const Authority& target, std::chrono::milliseconds timeout,
            const ClientSetting& setting);

        boost::asio::awaitable<StreamResult> connect_via_proxy(
            const Authority& target, std::chrono::milliseconds timeout,
            const ClientSetting& setting);

        boost::asio::awaitable<StreamResult> handshake(
            std::unique_ptr<TlsStream> stream, const Authority& target,
            std::chrono::milliseconds timeout, const ClientSetting& setting);

        boost::asio::ssl::context& context_for(
            const ClientSetting& setting) noexcept;

        boost::asio::any_io_executor m_ex;
        std::shared_ptr<TransportFactory> m_factory;
        TlsConnectorConfiguration m_cfg;
        boost::asio::ssl::context m_ssl_ctx;
    };

}  // namespace h2_pool
