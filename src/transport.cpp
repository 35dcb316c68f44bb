#include "h2_pool/transport.hpp"

#include <utility>
#include <vector>

namespace h2_pool {

    Transport::HandlerId TransportBase::subscribe_active_state(
        ActiveStateHandler handler) {
        const auto id = m_next_handler++;
        m_handlers.emplace(id, std::move(handler));
        return id;
    }

    void TransportBase::unsubscribe_active_state(HandlerId id) noexcept {
        m_handlers.erase(id);
    }

    void TransportBase::stream_opened() {
        if (m_active_streams++ == 0) notify_active_state(true);
    }

    void TransportBase::stream_closed() {
        if (m_active_streams == 0) return;
        if (--m_active_streams == 0) notify_active_state(false);
    }

    void TransportBase::notify_active_state(bool active) {
        // Handlers may unsubscribe while being notified.
        std::vector<ActiveStateHandler> handlers;
        handlers.reserve(m_handlers.size());
        for (auto const& [_, h] : m_handlers) handlers.push_back(h);

        for (auto& h : handlers) {
            if (h) h(active);
        }
    }

}  // namespace h2_pool
