#include "connection_registry.hpp"

namespace realtime
{

    bool ConnectionRegistry::add(const ConnectionPtr& conn)
    {
        if (!conn)
            return false;
        return m_conns.emplace(conn->id(), conn).second;
    }

    bool ConnectionRegistry::remove(ConnectionId id)
    {
        return m_conns.erase(id) > 0;
    }

    bool ConnectionRegistry::contains(ConnectionId id) const
    {
        return m_conns.find(id) != m_conns.end();
    }

    ConnectionPtr ConnectionRegistry::find(ConnectionId id) const
    {
        auto it = m_conns.find(id);
        if (it == m_conns.end())
            return nullptr;
        return it->second.lock();
    }

    std::vector<ConnectionId> ConnectionRegistry::ids() const
    {
        std::vector<ConnectionId> out;
        out.reserve(m_conns.size());
        for (const auto& [id, ref] : m_conns)
            out.push_back(id);
        return out;
    }

    std::vector<ConnectionPtr> ConnectionRegistry::lockAll() const
    {
        std::vector<ConnectionPtr> out;
        out.reserve(m_conns.size());
        for (const auto& [id, ref] : m_conns)
        {
            if (auto locked = ref.lock())
                out.push_back(std::move(locked));
        }
        return out;
    }

} // namespace realtime
