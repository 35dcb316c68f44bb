#pragma once

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <algorithm>
#include <boost/asio/error.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <boost/system/error_code.hpp>
#include <cctype>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "url.hpp"

namespace h2_pool {

    /// @brief The (host, port) pair a pooled connection is keyed by.
    struct Authority {
        std::string host;
        std::string port;

        static Authority from_url(const UrlComponents& u) {
            Authority a{u.host, u.port};
            if (a.port.empty()) a.port = url_utils::default_port(u.https);
            a.normalize_host();
            return a;
        }

        inline void normalize_host() {
            std::transform(host.begin(), host.end(), host.begin(),
                           [](unsigned char c) { return std::tolower(c); });
        }

        /// @brief Cache key, "host:port".
        std::string key() const { return host + ":" + port; }

        friend bool operator==(Authority const& a, Authority const& b) noexcept {
            return a.host == b.host && a.port == b.port;
        }
    };

    inline bool set_sni(
        boost::beast::ssl_stream<boost::beast::tcp_stream>& stream,
        const std::string& host, boost::system::error_code& ec) {
        if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str())) {
            ec = boost::system::error_code(
                static_cast<int>(::ERR_get_error()),
                boost::asio::error::get_ssl_category());
            return false;
        }
        return true;
    }

    /// @brief Offer a single ALPN protocol (e.g. "h2") on the stream.
    inline bool set_alpn_protocol(
        boost::beast::ssl_stream<boost::beast::tcp_stream>& stream,
        std::string_view protocol, boost::system::error_code& ec) {
        if (protocol.empty() || protocol.size() > 255) {
            ec = boost::asio::error::invalid_argument;
            return false;
        }
        // Wire format: length-prefixed protocol names.
        std::vector<unsigned char> wire;
        wire.reserve(protocol.size() + 1);
        wire.push_back(static_cast<unsigned char>(protocol.size()));
        wire.insert(wire.end(), protocol.begin(), protocol.end());

        // SSL_set_alpn_protos returns 0 on success.
        if (SSL_set_alpn_protos(stream.native_handle(), wire.data(),
                                static_cast<unsigned int>(wire.size())) != 0) {
            ec = boost::system::error_code(
                static_cast<int>(::ERR_get_error()),
                boost::asio::error::get_ssl_category());
            return false;
        }
        return true;
    }

    /// @brief The protocol the server selected via ALPN, empty if none.
    inline std::string negotiated_alpn_protocol(
        boost::beast::ssl_stream<boost::beast::tcp_stream>& stream) {
        const unsigned char* data = nullptr;
        unsigned int len = 0;
        SSL_get0_alpn_selected(stream.native_handle(), &data, &len);
        if (data == nullptr || len == 0) return {};
        return std::string(reinterpret_cast<const char*>(data), len);
    }

    void inline init_tls_on_ssl_context(
        boost::asio::ssl::context&
            ssl_context) {  // Load system default CA certificates
        try {
            ssl_context.set_default_verify_paths();
        } catch (const boost::system::system_error& e) {
            throw std::runtime_error(
                std::string("Failed to set default verify paths: ") + e.what());
        }

        /// Configure verification mode + throw out the old one
        static_cast<void>(
            ssl_context.set_verify_mode(boost::asio::ssl::verify_peer));
    }

}  // namespace h2_pool

namespace std {
    template <>
    struct hash<h2_pool::Authority> {
        size_t operator()(h2_pool::Authority const& a) const noexcept {
            size_t h = 1469598103934665603ull;
            auto mix = [&](std::string_view s) {
                for (unsigned char c : s) {
                    h ^= c;
                    h *= 1099511628211ull;
                }
            };
            mix(a.host);
            h ^= static_cast<unsigned char>(':');
            h *= 1099511628211ull;
            mix(a.port);
            return h;
        }
    };
}  // namespace std
