#include "h2_pool/connection/proxy_tunnel.hpp"

#include <openssl/evp.h>
#include <spdlog/spdlog.h>

#include <array>
#include <boost/asio/buffer.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/http/verb.hpp>
#include <boost/beast/http/write.hpp>
#include <vector>

#include "h2_pool/connection/connect_support.hpp"

namespace beast = boost::beast;
namespace http = beast::http;

namespace h2_pool {

    namespace {

        using tcp = boost::asio::ip::tcp;

        std::string connect_target(const Authority& target) {
            // IPv6 literals need brackets in an authority-form target.
            if (target.host.find(':') != std::string::npos)
                return "[" + target.host + "]:" + target.port;
            return target.key();
        }

    }  // namespace

    std::string encode_proxy_credentials(std::string_view user_info) {
        if (user_info.empty()) return {};

        std::vector<unsigned char> out(4 * ((user_info.size() + 2) / 3) + 1);
        const int n = EVP_EncodeBlock(
            out.data(), reinterpret_cast<const unsigned char*>(user_info.data()),
            static_cast<int>(user_info.size()));
        return std::string(reinterpret_cast<const char*>(out.data()),
                           static_cast<std::size_t>(n));
    }

    ConnectRequest make_connect_request(const Authority& target,
                                        std::string_view user_info) {
        const std::string authority = connect_target(target);

        ConnectRequest req{http::verb::connect, authority, 11};
        req.set(http::field::host, authority);
        if (!user_info.empty()) {
            req.set(http::field::proxy_authorization,
                    "Basic " + encode_proxy_credentials(user_info));
        }
        return req;
    }

    bool is_tunnel_established(std::string_view first_chunk) noexcept {
        std::string_view status_line = first_chunk;
        if (auto eol = first_chunk.find("\r\n"); eol != std::string_view::npos)
            status_line = first_chunk.substr(0, eol);
        return status_line.rfind("HTTP/1.1 200", 0) == 0;
    }

    boost::asio::awaitable<Result<beast::tcp_stream>> open_proxy_tunnel(
        boost::asio::any_io_executor ex, const ProxySetting& proxy,
        const Authority& target, std::chrono::milliseconds timeout) {
        using R = Result<beast::tcp_stream>;
        const std::string proxy_name = proxy.host + ":" + proxy.port;
        boost::system::error_code ec;

        tcp::resolver resolver(ex);
        auto results = co_await resolver.async_resolve(
            proxy.host, proxy.port,
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec) {
            co_return R::err(error_from_ec(ec, Error::Code::ConnectionFailed,
                                           "Resolving proxy " + proxy_name));
        }

        beast::tcp_stream stream(ex);
        arm_connect_timeout(stream, timeout);

        co_await stream.async_connect(
            results, boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec) {
            co_return R::err(error_from_ec(ec, Error::Code::ConnectionFailed,
                                           "Connecting proxy " + proxy_name));
        }

        auto req = make_connect_request(target, proxy.user_info);
        co_await http::async_write(
            stream, req,
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec) {
            co_return R::err(error_from_ec(ec, Error::Code::NetworkError,
                                           "Writing CONNECT to " + proxy_name));
        }

        // One-shot exchange: only the status line of the first chunk matters.
        std::array<char, 1024> chunk{};
        const std::size_t n = co_await stream.async_read_some(
            boost::asio::buffer(chunk),
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec) {
            co_return R::err(error_from_ec(ec, Error::Code::ProxyTunnelFailed,
                                           "Reading proxy response from " +
                                               proxy_name));
        }

        const std::string_view response(chunk.data(), n);
        if (!is_tunnel_established(response)) {
            auto eol = response.find("\r\n");
            SPDLOG_WARN("Proxy {} refused CONNECT {}: {}", proxy_name,
                        target.key(), response.substr(0, eol));
            co_return R::err(Error::Code::ProxyTunnelFailed,
                             "Proxy cannot be initialized: " +
                                 std::string(response.substr(0, eol)));
        }

        SPDLOG_DEBUG("Tunnel to {} established through {}", target.key(),
                     proxy_name);
        stream.expires_never();
        co_return R::ok(std::move(stream));
    }

}  // namespace h2_pool
