#pragma once

#include <map>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "connection.hpp"

namespace realtime
{

    /**
     * Topic -> subscriber ids, plus the reverse id -> topics map so that dropping a
     * connection only touches the topics it was in. Topics with no subscribers are erased.
     * Owned by the hub's control loop; not thread safe.
     */
    class SubscriptionIndex
    {
      public:
        // Returns true only when the pair was newly added.
        bool subscribe(ConnectionId id, const std::string& topic);
        // Returns true only when the pair existed.
        bool unsubscribe(ConnectionId id, const std::string& topic);
        // Returns the number of topics the id was removed from.
        std::size_t unregisterAll(ConnectionId id);

        bool                      isSubscribed(ConnectionId id, const std::string& topic) const;
        std::vector<ConnectionId> subscribers(const std::string& topic) const;
        std::vector<std::string>  topics() const;
        std::vector<std::string>  topicsOf(ConnectionId id) const;

        std::map<std::string, std::size_t> subscriberCounts() const;
        std::size_t                        topicCount() const { return m_byTopic.size(); }
        std::size_t                        subscriptionCount() const { return m_pairs; }

        void clear();

      private:
        std::unordered_map<std::string, std::set<ConnectionId>> m_byTopic;
        std::unordered_map<ConnectionId, std::set<std::string>> m_byConn;
        std::size_t                                             m_pairs{0};
    };

} // namespace realtime
