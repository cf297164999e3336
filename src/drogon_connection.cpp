#include "drogon_connection.hpp"

namespace realtime
{

    DrogonConnection::DrogonConnection(const drogon::WebSocketConnectionPtr& ws, std::size_t sendBufferBytes)
        : m_ws(ws), m_peer(ws ? ws->peerAddr().toIpPort() : std::string("unknown")), m_budget(sendBufferBytes)
    {
    }

    SendStatus DrogonConnection::send(const std::string& frame, std::chrono::milliseconds timeout)
    {
        if (m_closed.load() || !m_ws)
            return SendStatus::Closed;
        if (!m_ws->connected())
            return SendStatus::Closed;

        bool ping = false;
        {
            std::lock_guard<std::mutex> lk(m_budgetMtx);
            if (!m_budget.admit(frame.size(), WriteBudget::Clock::now(), timeout))
                return SendStatus::Timeout;
            ping = m_budget.startPing();
        }

        m_ws->send(frame, drogon::WebSocketMessageType::Text);
        if (ping)
            m_ws->send(std::string{}, drogon::WebSocketMessageType::Ping);
        return SendStatus::Ok;
    }

    void DrogonConnection::onPong()
    {
        std::lock_guard<std::mutex> lk(m_budgetMtx);
        m_budget.acknowledge();
    }

    void DrogonConnection::close()
    {
        if (m_closed.exchange(true) || !m_ws)
            return;
        if (m_ws->connected())
            m_ws->shutdown(drogon::CloseCode::kNormalClosure);
    }

    bool DrogonConnection::isOpen() const
    {
        return !m_closed.load() && m_ws && m_ws->connected();
    }

} // namespace realtime
