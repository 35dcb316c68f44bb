#pragma once

#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>

namespace h2_pool {

    /** @brief A connected, handshaken TLS stream. */
    using TlsStream = boost::beast::ssl_stream<boost::beast::tcp_stream>;

    /**
     * @brief A multiplexed connection able to carry many concurrent streams.
     *
     * The manager only needs to know whether the transport is still open, how
     * to finish it, and when its number of in-flight streams moves between
     * zero and non-zero. The framing protocol itself lives behind this
     * interface.
     */
    class Transport {
       public:
        /// @brief Receives true when the first stream opens and false when the
        /// last one closes.
        using ActiveStateHandler = std::function<void(bool active)>;
        using HandlerId = std::uint64_t;

        virtual ~Transport() = default;

        /// @brief Whether the transport can still carry new streams.
        [[nodiscard]] virtual bool is_open() const = 0;

        /// @brief Gracefully close the transport. Must be idempotent.
        virtual void finish() = 0;

        /// @brief Register @p handler for active-state transitions.
        /// @return An id for unsubscribe_active_state().
        virtual HandlerId subscribe_active_state(ActiveStateHandler handler) = 0;

        virtual void unsubscribe_active_state(HandlerId id) noexcept = 0;
    };

    /**
     * @brief Implements the active-state subscription on top of a stream
     * counter. Concrete transports call stream_opened() / stream_closed() as
     * logical streams come and go.
     */
    class TransportBase : public Transport {
       public:
        HandlerId subscribe_active_state(ActiveStateHandler handler) override;
        void unsubscribe_active_state(HandlerId id) noexcept override;

        /// @brief Number of streams currently open.
        std::size_t active_streams() const noexcept { return m_active_streams; }

        /// @brief Number of registered active-state handlers.
        std::size_t subscriber_count() const noexcept { return m_handlers.size(); }

       protected:
        void stream_opened();
        void stream_closed();

       private:
        void notify_active_state(bool active);

        std::map<HandlerId, ActiveStateHandler> m_handlers;
        HandlerId m_next_handler{1};
        std::size_t m_active_streams{0};
    };

    /**
     * @brief Wraps an established TLS stream into a Transport (e.g. an HTTP/2
     * client session).
     */
    class TransportFactory {
       public:
        virtual ~TransportFactory() = default;

        /// @brief Take ownership of @p stream and build a transport on it.
        /// @return The transport, or null if none could be built.
        virtual std::shared_ptr<Transport> wrap(
            std::unique_ptr<TlsStream> stream) = 0;
    };

}  // namespace h2_pool
