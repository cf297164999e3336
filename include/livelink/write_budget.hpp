#pragma once

#include <chrono>
#include <cstddef>
#include <optional>

namespace realtime
{

    /**
     * Outbound backlog accounting for one connection whose transport queues writes without limit.
     *
     * Every frame handed to the transport counts against the backlog until the peer proves it
     * has read it. Proof comes from a websocket ping queued behind the frames: the peer can
     * only answer it after reading everything queued before it, so the pong clears the bytes
     * that ping covered. At most one ping is outstanding.
     *
     * Once the backlog exceeds the limit a clock starts; if it is still over the limit when the
     * write timeout has elapsed, admit() refuses further frames and the connection is treated
     * as too slow. Not thread-safe; the owner serializes access.
     */
    class WriteBudget
    {
      public:
        using Clock = std::chrono::steady_clock;

        explicit WriteBudget(std::size_t limitBytes) : m_limit(limitBytes) {}

        // false when the backlog has stayed over the limit for longer than timeout
        bool admit(std::size_t bytes, Clock::time_point now, std::chrono::milliseconds timeout);

        // true when the caller should queue a ping now; it covers the current backlog
        bool startPing();
        void acknowledge();

        std::size_t backlog() const { return m_backlog; }
        bool        overLimit() const { return m_overSince.has_value(); }
        bool        pingOutstanding() const { return m_pingOutstanding; }

      private:
        const std::size_t                m_limit;
        std::size_t                      m_backlog{0};
        std::size_t                      m_pingCovers{0};
        bool                             m_pingOutstanding{false};
        std::optional<Clock::time_point> m_overSince;
    };

} // namespace realtime
