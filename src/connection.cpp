#include "connection.hpp"

namespace realtime
{

    std::atomic<ConnectionId> Connection::s_nextId{1};

    const char* sendStatusToString(SendStatus status)
    {
        switch (status)
        {
        case SendStatus::Ok:
            return "ok";
        case SendStatus::Timeout:
            return "timeout";
        case SendStatus::Closed:
            return "closed";
        case SendStatus::TransportError:
            return "transport error";
        }
        return "unknown";
    }

    Connection::Connection()
        : m_id(s_nextId.fetch_add(1)), m_lastActivity(Clock::now().time_since_epoch().count())
    {
    }

    void Connection::touch()
    {
        touch(Clock::now());
    }

    void Connection::touch(Clock::time_point at)
    {
        m_lastActivity.store(at.time_since_epoch().count());
    }

    Connection::Clock::time_point Connection::lastActivity() const
    {
        return Clock::time_point(Clock::duration(m_lastActivity.load()));
    }

} // namespace realtime
