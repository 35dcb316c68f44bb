#include "h2_pool/connection/connector.hpp"

#include <openssl/x509.h>
#include <spdlog/spdlog.h>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/ssl/verify_context.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <stdexcept>
#include <utility>

#include "h2_pool/connection/connect_support.hpp"
#include "h2_pool/connection/proxy_tunnel.hpp"

namespace beast = boost::beast;

namespace h2_pool {

    using tcp = boost::asio::ip::tcp;

    TlsConnector::TlsConnector(boost::asio::any_io_executor ex,
                               std::shared_ptr<TransportFactory> factory,
                               TlsConnectorConfiguration cfg)
        : m_ex(std::move(ex)),
          m_factory(std::move(factory)),
          m_cfg(std::move(cfg)),
          m_ssl_ctx(boost::asio::ssl::context::tls_client) {
        if (!m_factory) {
            throw std::invalid_argument("TlsConnector requires a TransportFactory");
        }

        init_tls_on_ssl_context(m_ssl_ctx);

        m_ssl_ctx.set_verify_mode(m_cfg.verify_tls
                                      ? boost::asio::ssl::verify_peer
                                      : boost::asio::ssl::verify_none);
    }

    boost::asio::ssl::context& TlsConnector::context_for(
        const ClientSetting& setting) noexcept {
        return setting.context ? *setting.context : m_ssl_ctx;
    }

    boost::asio::awaitable<Result<std::shared_ptr<Transport>>>
    TlsConnector::connect(const Authority& target, const RequestOptions& options,
                          const ClientSetting& setting) {
        using R = Result<std::shared_ptr<Transport>>;

        StreamResult stream_res =
            StreamResult::err(Error::Code::Unknown, "Not connected");
        if (setting.proxy) {
            stream_res = co_await connect_via_proxy(
                target, options.connect_timeout, setting);
        } else {
            stream_res = co_await connect_direct(
                target, options.connect_timeout, setting);
        }
        if (stream_res.has_error()) {
            co_return R::err(std::move(stream_res).error());
        }

        auto transport = m_factory->wrap(std::move(stream_res).value());
        if (!transport) {
            co_return R::err(Error::Code::Unknown,
                             "Transport factory returned no transport for " +
                                 target.key());
        }
        co_return R::ok(std::move(transport));
    }

    boost::asio::awaitable<TlsConnector::StreamResult>
    TlsConnector::connect_direct(const Authority& target,
                                 std::chrono::milliseconds timeout,
                                 const ClientSetting& setting) {
        boost::system::error_code ec;

        tcp::resolver resolver(m_ex);
        auto results = co_await resolver.async_resolve(
            target.host, target.port,
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec) {
            co_return StreamResult::err(error_from_ec(
                ec, Error::Code::ConnectionFailed, "Resolving " + target.key()));
        }

        auto stream = std::make_unique<TlsStream>(m_ex, context_for(setting));
        auto& lowest = beast::get_lowest_layer(*stream);
        arm_connect_timeout(lowest, timeout);

        co_await lowest.async_connect(
            results, boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec) {
            co_return StreamResult::err(error_from_ec(
                ec, Error::Code::ConnectionFailed, "Connecting " + target.key()));
        }

        co_return co_await handshake(std::move(stream), target, timeout, setting);
    }

    boost::asio::awaitable<TlsConnector::StreamResult>
    TlsConnector::connect_via_proxy(const Authority& target,
                                    std::chrono::milliseconds timeout,
                                    const ClientSetting& setting) {
        auto tunnel =
            co_await open_proxy_tunnel(m_ex, *setting.proxy, target, timeout);
        if (tunnel.has_error()) {
            co_return StreamResult::err(std::move(tunnel).error());
        }

        // Reuse the tunneled socket; the handshake addresses the target.
        auto stream = std::make_unique<TlsStream>(std::move(tunnel).value(),
                                                  context_for(setting));
        co_return co_await handshake(std::move(stream), target, timeout, setting);
    }

    boost::asio::awaitable<TlsConnector::StreamResult> TlsConnector::handshake(
        std::unique_ptr<TlsStream> stream, const Authority& target,
        std::chrono::milliseconds timeout, const ClientSetting& setting) {
        boost::system::error_code ec;

        if (!set_sni(*stream, target.host, ec) ||
            !set_alpn_protocol(*stream, m_cfg.alpn_protocol, ec)) {
            co_return StreamResult::err(error_from_ec(
                ec, Error::Code::TlsHandshakeFailed,
                "Preparing TLS for " + target.key()));
        }

        // A caller-supplied context defaults to SSL_VERIFY_NONE, which would
        // make OpenSSL ignore the callback below.
        const bool verify = setting.context || m_cfg.verify_tls;
        stream->set_verify_mode(verify ? boost::asio::ssl::verify_peer
                                       : boost::asio::ssl::verify_none);

        stream->set_verify_callback(
            [verify_host = boost::asio::ssl::host_name_verification(target.host),
             on_bad = setting.on_bad_certificate](
                bool preverified, boost::asio::ssl::verify_context& vctx) {
                if (verify_host(preverified, vctx)) return true;
                if (!on_bad) return false;
                X509* cert = X509_STORE_CTX_get_current_cert(vctx.native_handle());
                return on_bad(cert);
            });

        auto& lowest = beast::get_lowest_layer(*stream);
        arm_connect_timeout(lowest, timeout);

        co_await stream->async_handshake(
            boost::asio::ssl::stream_base::client,
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec) {
            co_return StreamResult::err(error_from_ec(
                ec, Error::Code::TlsHandshakeFailed,
                "TLS handshake with " + target.key()));
        }
        lowest.expires_never();

        // The transport speaks only the offered protocol; an HTTP/1.1 peer
        // would reject its first frame anyway.
        const auto selected = negotiated_alpn_protocol(*stream);
        if (selected != m_cfg.alpn_protocol) {
            SPDLOG_WARN("{} did not select ALPN protocol {} (got '{}')",
                        target.key(), m_cfg.alpn_protocol, selected);
            co_return StreamResult::err(
                Error::Code::TlsHandshakeFailed,
                target.key() + " did not negotiate " + m_cfg.alpn_protocol);
        }

        co_return StreamResult::ok(std::move(stream));
    }

}  // namespace h2_pool
