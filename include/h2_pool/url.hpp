#pragma once

#include <string>
#include <string_view>

#include "result.hpp"

namespace h2_pool {

    struct UrlComponents {
        bool https{false};
        std::string host;
        std::string port;
        // Raw "user:password" part preceding '@', empty when absent.
        std::string user_info;
        // Path + optional query, "/" when the url has none.
        std::string target;
    };

    namespace url_utils {

        /// @brief Check if a URL is an absolute HTTP or HTTPS URL.
        inline bool is_absolute_url_with_protocol(std::string_view s) {
            return (s.rfind("https://", 0) == 0) ||
                   (s.rfind("http://", 0) == 0);
        }

        /// @brief Default port for a scheme.
        inline const char* default_port(bool https) noexcept {
            return https ? "443" : "80";
        }

    }  // namespace url_utils

    /// @brief Parse an absolute URL into its components.
    /// @param url The URL string to parse, e.g.
    /// "https://user:pw@example.com:8443/path?q=1".
    /// @return The components, or an InvalidUrl error.
    inline Result<UrlComponents> parse_url(std::string_view url) {
        auto make_err = [&](std::string msg) -> Result<UrlComponents> {
            return Result<UrlComponents>::err(Error::Code::InvalidUrl,
                                              std::move(msg));
        };

        std::string_view s(url);

        bool https = false;
        if (s.rfind("https://", 0) == 0) {
            https = true;
            s.remove_prefix(std::string_view("https://").size());
        } else if (s.rfind("http://", 0) == 0) {
            s.remove_prefix(std::string_view("http://").size());
        } else {
            return make_err("URL must start with http:// or https://");
        }

        // Split authority from path
        std::string_view authority = s;
        std::string_view path = "/";
        if (auto slash = s.find_first_of("/?"); slash != std::string_view::npos) {
            authority = s.substr(0, slash);
            path = s.substr(slash);
        }

        std::string user_info;
        if (auto at = authority.rfind('@'); at != std::string_view::npos) {
            user_info = std::string(authority.substr(0, at));
            authority.remove_prefix(at + 1);
        }

        if (authority.empty()) {
            return make_err("URL missing host");
        }

        std::string host;
        std::string port;

        if (authority.front() == '[') {
            // IPv6 literal: [addr] or [addr]:port
            auto close = authority.find(']');
            if (close == std::string_view::npos) {
                return make_err("URL has unterminated IPv6 literal");
            }
            host = std::string(authority.substr(1, close - 1));
            auto rest = authority.substr(close + 1);
            if (!rest.empty()) {
                if (rest.front() != ':') {
                    return make_err("URL has garbage after IPv6 literal");
                }
                port = std::string(rest.substr(1));
                if (port.empty()) return make_err("URL has empty port");
            }
        } else if (auto colon = authority.rfind(':');
                   colon != std::string_view::npos) {
            host = std::string(authority.substr(0, colon));
            port = std::string(authority.substr(colon + 1));
            if (port.empty()) {
                return make_err("URL has empty port");
            }
        } else {
            host = std::string(authority);
        }

        if (host.empty()) {
            return make_err("URL has empty host");
        }

        if (port.empty()) {
            port = url_utils::default_port(https);
        } else if (port.find_first_not_of("0123456789") != std::string::npos) {
            return make_err("URL port is not numeric: " + port);
        }

        UrlComponents out;
        out.https = https;
        out.host = std::move(host);
        out.port = std::move(port);
        out.user_info = std::move(user_info);
        out.target = path.empty() ? "/" : std::string(path);
        if (out.target.front() == '?') out.target.insert(out.target.begin(), '/');
        return Result<UrlComponents>::ok(std::move(out));
    }

}  // namespace h2_pool
