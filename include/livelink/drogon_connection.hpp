#pragma once

#include <drogon/WebSocketConnection.h>

#include <atomic>
#include <mutex>
#include <string>

#include "connection.hpp"
#include "write_budget.hpp"

namespace realtime
{

    /**
     * Connection handle over a drogon websocket. drogon queues outbound frames on the
     * connection's event loop without limit, so the handle keeps its own WriteBudget: a ping
     * control frame follows queued data and the peer's pong acknowledges it. send() reports
     * Timeout once the unacknowledged backlog has stayed above sendBufferBytes for longer than
     * the write timeout.
     */
    class DrogonConnection : public Connection
    {
      public:
        DrogonConnection(const drogon::WebSocketConnectionPtr& ws, std::size_t sendBufferBytes);

        SendStatus  send(const std::string& frame, std::chrono::milliseconds timeout) override;
        void        close() override;
        bool        isOpen() const override;
        std::string peer() const override { return m_peer; }

        // Called from the connection's event loop when a pong frame arrives.
        void onPong();

      private:
        drogon::WebSocketConnectionPtr m_ws;
        std::string                    m_peer;
        std::atomic<bool>              m_closed{false};

        std::mutex  m_budgetMtx;
        WriteBudget m_budget;
    };

} // namespace realtime
