#pragma once

#include <drogon/WebSocketController.h>

#include "realtime_hub.hpp"

class RealtimeStream : public drogon::WebSocketController<RealtimeStream>
{
  public:
    RealtimeStream() = default;

    static void bootstrap(realtime::RealtimeHub* hub, diag::DiagnosticManager* diag, std::size_t sendBufferBytes);

    void handleNewConnection(const drogon::HttpRequestPtr& req, const drogon::WebSocketConnectionPtr& conn) override;
    void handleConnectionClosed(const drogon::WebSocketConnectionPtr& conn) override;
    void handleNewMessage(const drogon::WebSocketConnectionPtr& conn, std::string&& message,
                          const drogon::WebSocketMessageType& type) override;

    WS_PATH_LIST_BEGIN
    WS_PATH_ADD("/api/v1/realtime/ws", drogon::Get);
    WS_PATH_LIST_END

  private:
    static realtime::RealtimeHub*   s_hub;
    static diag::DiagnosticManager* s_diag;
    static std::size_t              s_sendBufferBytes;
};
