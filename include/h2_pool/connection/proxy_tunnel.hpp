#pragma once

// Boost 1.74 awaitable.hpp uses std::exchange without including <utility>.
#include <utility>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/empty_body.hpp>
#include <boost/beast/http/message.hpp>
#include <chrono>
#include <string>
#include <string_view>

#include "h2_pool/authority.hpp"
#include "h2_pool/config.hpp"
#include "h2_pool/result.hpp"

namespace h2_pool {

    using ConnectRequest =
        boost::beast::http::request<boost::beast::http::empty_body>;

    /// @brief Build the `CONNECT host:port HTTP/1.1` request for @p target.
    /// Adds `Proxy-Authorization: Basic ...` when @p user_info is non-empty.
    ConnectRequest make_connect_request(const Authority& target,
                                        std::string_view user_info);

    /// @brief Base64 of @p user_info as used by Basic authorization.
    std::string encode_proxy_credentials(std::string_view user_info);

    /// @brief Whether the first chunk of a proxy response starts with a
    /// `HTTP/1.1 200` status line.
    bool is_tunnel_established(std::string_view first_chunk) noexcept;

    /**
     * @brief Open a plain TCP connection to @p proxy and ask it to relay to
     * @p target.
     *
     * @p timeout bounds connecting, writing the request and reading the
     * response; <= 0 disables it. Only the status line of the first response
     * chunk is inspected.
     *
     * @return The tunneled stream, ready for a TLS handshake addressed to
     * @p target, or ConnectTimeout / ConnectionFailed / ProxyTunnelFailed /
     * NetworkError.
     */
    boost::asio::awaitable<Result<boost::beast::tcp_stream>> open_proxy_tunnel(
        boost::asio::any_io_executor ex, const ProxySetting& proxy,
        const Authority& target, std::chrono::milliseconds timeout);

}  // namespace h2_pool
