#include "realtime_stream.hpp"

#include <drogon/drogon.h>

#include "drogon_connection.hpp"

realtime::RealtimeHub*   RealtimeStream::s_hub             = nullptr;
diag::DiagnosticManager* RealtimeStream::s_diag            = nullptr;
std::size_t              RealtimeStream::s_sendBufferBytes = 1048576;

void RealtimeStream::bootstrap(realtime::RealtimeHub* hub, diag::DiagnosticManager* diag, std::size_t sendBufferBytes)
{
    s_hub             = hub;
    s_diag            = diag;
    s_sendBufferBytes = sendBufferBytes;
}

void RealtimeStream::handleNewConnection(const drogon::HttpRequestPtr& req, const drogon::WebSocketConnectionPtr& conn)
{
    if (!s_hub)
    {
        conn->shutdown(drogon::CloseCode::kUnexpectedCondition);
        return;
    }

    auto handle = std::make_shared<realtime::DrogonConnection>(conn, s_sendBufferBytes);
    if (!s_hub->registerConnection(handle))
    {
        handle->close();
        return;
    }
    conn->setContext(handle);

    // /realtime/ws?short_code=abc123 subscribes on connect
    const auto code = req->getParameter("short_code");
    if (!code.empty())
    {
        if (realtime::isValidShortCode(code))
            s_hub->subscribe(handle->id(), code);
        else if (s_diag)
            s_diag->log(diag::Severity::DEBUG, "RealtimeStream", "ignoring invalid short_code from " + handle->peer());
    }
}

void RealtimeStream::handleConnectionClosed(const drogon::WebSocketConnectionPtr& conn)
{
    auto handle = conn->getContext<realtime::DrogonConnection>();
    if (!handle)
        return;
    handle->close();
    if (s_hub)
        s_hub->unregisterConnection(handle->id());
    conn->clearContext();
}

void RealtimeStream::handleNewMessage(const drogon::WebSocketConnectionPtr& conn, std::string&& message,
                                      const drogon::WebSocketMessageType& type)
{
    auto handle = conn->getContext<realtime::DrogonConnection>();
    if (!handle)
        return;

    switch (type)
    {
    case drogon::WebSocketMessageType::Text:
        handle->touch();
        if (s_hub)
            s_hub->handleClientMessage(handle, message);
        break;
    case drogon::WebSocketMessageType::Ping:
        handle->touch();
        break;
    case drogon::WebSocketMessageType::Pong:
        handle->touch();
        handle->onPong();
        break;
    default:
        break;
    }
}
