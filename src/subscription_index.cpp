#include "subscription_index.hpp"

namespace realtime
{

    bool SubscriptionIndex::subscribe(ConnectionId id, const std::string& topic)
    {
        if (!m_byTopic[topic].insert(id).second)
            return false;
        m_byConn[id].insert(topic);
        ++m_pairs;
        return true;
    }

    bool SubscriptionIndex::unsubscribe(ConnectionId id, const std::string& topic)
    {
        auto it = m_byTopic.find(topic);
        if (it == m_byTopic.end() || it->second.erase(id) == 0)
            return false;
        if (it->second.empty())
            m_byTopic.erase(it);

        auto connIt = m_byConn.find(id);
        if (connIt != m_byConn.end())
        {
            connIt->second.erase(topic);
            if (connIt->second.empty())
                m_byConn.erase(connIt);
        }
        --m_pairs;
        return true;
    }

    std::size_t SubscriptionIndex::unregisterAll(ConnectionId id)
    {
        auto connIt = m_byConn.find(id);
        if (connIt == m_byConn.end())
            return 0;

        std::size_t removed = 0;
        for (const auto& topic : connIt->second)
        {
            auto it = m_byTopic.find(topic);
            if (it == m_byTopic.end())
                continue;
            removed += it->second.erase(id);
            if (it->second.empty())
                m_byTopic.erase(it);
        }
        m_byConn.erase(connIt);
        m_pairs -= removed;
        return removed;
    }

    bool SubscriptionIndex::isSubscribed(ConnectionId id, const std::string& topic) const
    {
        auto it = m_byTopic.find(topic);
        return it != m_byTopic.end() && it->second.count(id) > 0;
    }

    std::vector<ConnectionId> SubscriptionIndex::subscribers(const std::string& topic) const
    {
        auto it = m_byTopic.find(topic);
        if (it == m_byTopic.end())
            return {};
        return {it->second.begin(), it->second.end()};
    }

    std::vector<std::string> SubscriptionIndex::topics() const
    {
        std::vector<std::string> out;
        out.reserve(m_byTopic.size());
        for (const auto& [topic, ids] : m_byTopic)
            out.push_back(topic);
        return out;
    }

    std::vector<std::string> SubscriptionIndex::topicsOf(ConnectionId id) const
    {
        auto it = m_byConn.find(id);
        if (it == m_byConn.end())
            return {};
        return {it->second.begin(), it->second.end()};
    }

    std::map<std::string, std::size_t> SubscriptionIndex::subscriberCounts() const
    {
        std::map<std::string, std::size_t> out;
        for (const auto& [topic, ids] : m_byTopic)
            out[topic] = ids.size();
        return out;
    }

    void SubscriptionIndex::clear()
    {
        m_byTopic.clear();
        m_byConn.clear();
        m_pairs = 0;
    }

} // namespace realtime
