#pragma once

#include <unordered_map>
#include <vector>

#include "connection.hpp"

namespace realtime
{

    /**
     * Live handles keyed by id. Owned by the hub's control loop; not thread safe.
     * Entries are weak so a handle torn down by its transport simply fails to lock.
     */
    class ConnectionRegistry
    {
      public:
        // Returns false if the id is already present.
        bool add(const ConnectionPtr& conn);
        // Returns false if the id was not present.
        bool remove(ConnectionId id);

        bool          contains(ConnectionId id) const;
        ConnectionPtr find(ConnectionId id) const;
        std::size_t   size() const { return m_conns.size(); }
        bool          empty() const { return m_conns.empty(); }

        std::vector<ConnectionId>  ids() const;
        std::vector<ConnectionPtr> lockAll() const;
        void                       clear() { m_conns.clear(); }

      private:
        std::unordered_map<ConnectionId, ConnectionRef> m_conns;
    };

} // namespace realtime
