#pragma once
#include <string>

namespace h2_pool {
    /**
     * @brief Describes why a connection could not be handed out.
     */
    struct Error {
        /** @brief Enumeration of error codes. */
        enum class Code {
            InvalidUrl,         /**< The request uri is malformed. */
            ManagerClosed,      /**< Request made after the manager closed. */
            ConnectTimeout,     /**< Connect or tunnel setup exceeded its bound. */
            ProxyTunnelFailed,  /**< Proxy refused CONNECT or dropped the socket. */
            ConnectionFailed,   /**< Failed to resolve or connect a TCP socket. */
            TlsHandshakeFailed, /**< Failed to perform TLS handshake. */
            NetworkError,       /**< General network error. */
            Unknown,            /**< An unknown error occurred. */
        };

        /** @brief The error code. */
        Code code;
        /** @brief A descriptive error message. */
        std::string message;
    };

    /// @brief Convert an error code to string for logging or diagnostics
    inline const char* to_string(Error::Code code) {
        switch (code) {
            case Error::Code::InvalidUrl:
                return "InvalidUrl";
            case Error::Code::ManagerClosed:
                return "ManagerClosed";
            case Error::Code::ConnectTimeout:
                return "ConnectTimeout";
            case Error::Code::ProxyTunnelFailed:
                return "ProxyTunnelFailed";
            case Error::Code::ConnectionFailed:
                return "ConnectionFailed";
            case Error::Code::TlsHandshakeFailed:
                return "TlsHandshakeFailed";
            case Error::Code::NetworkError:
                return "NetworkError";
            case Error::Code::Unknown:
                return "Unknown";
        }
        return "Unknown";
    }
}  // namespace h2_pool
