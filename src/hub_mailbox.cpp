#include "hub_mailbox.hpp"

namespace realtime
{

    HubCommand HubCommand::registerConn(const ConnectionPtr& conn)
    {
        HubCommand cmd;
        cmd.kind = Kind::Register;
        cmd.id   = conn ? conn->id() : 0;
        cmd.conn = conn;
        return cmd;
    }

    HubCommand HubCommand::unregisterConn(ConnectionId id)
    {
        HubCommand cmd;
        cmd.kind = Kind::Unregister;
        cmd.id   = id;
        return cmd;
    }

    HubCommand HubCommand::subscribe(ConnectionId id, const std::string& topic)
    {
        HubCommand cmd;
        cmd.kind  = Kind::Subscribe;
        cmd.id    = id;
        cmd.topic = topic;
        return cmd;
    }

    HubCommand HubCommand::unsubscribe(ConnectionId id, const std::string& topic)
    {
        HubCommand cmd;
        cmd.kind  = Kind::Unsubscribe;
        cmd.id    = id;
        cmd.topic = topic;
        return cmd;
    }

    HubCommand HubCommand::snapshotReady(Update update)
    {
        HubCommand cmd;
        cmd.kind   = Kind::SnapshotReady;
        cmd.topic  = update.topic;
        cmd.update = std::move(update);
        return cmd;
    }

    HubCommand HubCommand::snapshotFailed(const std::string& topic)
    {
        HubCommand cmd;
        cmd.kind  = Kind::SnapshotFailed;
        cmd.topic = topic;
        return cmd;
    }

    HubMailbox::HubMailbox(std::size_t controlCapacity, std::size_t broadcastCapacity)
        : m_controlCapacity(controlCapacity), m_broadcastCapacity(broadcastCapacity)
    {
    }

    bool HubMailbox::postControl(HubCommand cmd)
    {
        {
            std::unique_lock<std::mutex> lk(m_mtx);
            m_spaceCv.wait(lk, [this]() { return m_closed || m_control.size() < m_controlCapacity; });
            if (m_closed)
                return false;
            m_control.push_back(std::move(cmd));
        }
        m_inputCv.notify_one();
        return true;
    }

    void HubMailbox::postControlInternal(HubCommand cmd)
    {
        {
            std::lock_guard<std::mutex> lk(m_mtx);
            if (m_closed)
                return;
            m_control.push_back(std::move(cmd));
        }
        m_inputCv.notify_one();
    }

    bool HubMailbox::tryPostBroadcast(Update update)
    {
        {
            std::lock_guard<std::mutex> lk(m_mtx);
            if (m_closed || m_broadcasts.size() >= m_broadcastCapacity)
                return false;
            m_broadcasts.push_back(std::move(update));
        }
        m_inputCv.notify_one();
        return true;
    }

    HubInput HubMailbox::waitNext(Clock::time_point keepaliveDue)
    {
        std::unique_lock<std::mutex> lk(m_mtx);
        for (;;)
        {
            if (m_closed)
                return HubInput{};
            if (Clock::now() >= keepaliveDue)
            {
                HubInput in;
                in.kind = HubInput::Kind::KeepaliveDue;
                return in;
            }
            if (auto in = popLocked())
            {
                lk.unlock();
                m_spaceCv.notify_one();
                return std::move(*in);
            }
            m_inputCv.wait_until(lk, keepaliveDue);
        }
    }

    std::optional<HubInput> HubMailbox::tryNext()
    {
        std::optional<HubInput> in;
        {
            std::lock_guard<std::mutex> lk(m_mtx);
            in = popLocked();
        }
        if (in)
            m_spaceCv.notify_one();
        return in;
    }

    std::optional<HubInput> HubMailbox::popLocked()
    {
        const bool haveControl   = !m_control.empty();
        const bool haveBroadcast = !m_broadcasts.empty();
        if (!haveControl && !haveBroadcast)
            return std::nullopt;

        const bool takeBroadcast = haveBroadcast && (!haveControl || m_preferBroadcast);
        m_preferBroadcast        = !takeBroadcast;

        HubInput in;
        if (takeBroadcast)
        {
            in.kind   = HubInput::Kind::Broadcast;
            in.update = std::move(m_broadcasts.front());
            m_broadcasts.pop_front();
        }
        else
        {
            in.kind    = HubInput::Kind::Control;
            in.command = std::move(m_control.front());
            m_control.pop_front();
        }
        return in;
    }

    void HubMailbox::close()
    {
        {
            std::lock_guard<std::mutex> lk(m_mtx);
            m_closed = true;
            m_control.clear();
            m_broadcasts.clear();
        }
        m_inputCv.notify_all();
        m_spaceCv.notify_all();
    }

    bool HubMailbox::isClosed() const
    {
        std::lock_guard<std::mutex> lk(m_mtx);
        return m_closed;
    }

    std::size_t HubMailbox::controlDepth() const
    {
        std::lock_guard<std::mutex> lk(m_mtx);
        return m_control.size();
    }

    std::size_t HubMailbox::broadcastDepth() const
    {
        std::lock_guard<std::mutex> lk(m_mtx);
        return m_broadcasts.size();
    }

} // namespace realtime
