#pragma once

#include <boost/asio/error.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/system/error_code.hpp>
#include <chrono>
#include <string>

#include "h2_pool/error.hpp"

namespace h2_pool {

    /// @brief Map an Asio/Beast error from connection setup onto an Error.
    /// A tcp_stream expiry always becomes ConnectTimeout; everything else
    /// gets @p fallback.
    inline Error error_from_ec(const boost::system::error_code& ec,
                               Error::Code fallback, const std::string& what) {
        if (ec == boost::beast::error::timeout ||
            ec == boost::asio::error::timed_out) {
            return Error{Error::Code::ConnectTimeout, what + " timed out"};
        }
        return Error{fallback, what + ": " + ec.message()};
    }

    /// @brief Apply a connect timeout to @p stream; <= 0 means none.
    inline void arm_connect_timeout(boost::beast::tcp_stream& stream,
                                    std::chrono::milliseconds timeout) {
        if (timeout.count() > 0)
            stream.expires_after(timeout);
        else
            stream.expires_never();
    }

}  // namespace h2_pool
