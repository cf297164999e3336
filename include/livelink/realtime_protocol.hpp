#pragma once

#include <optional>
#include <string>
#include <variant>

#include <nlohmann/json.hpp>

#include "time_format.hpp"

namespace realtime
{

    enum class UpdateKind
    {
        Click,
        Conversion,
        AnalyticsSnapshot,
        InitialSnapshot,
        Ping,
        Pong
    };

    // Wire name of an update kind ("click", "analytics_update", "initial_analytics", ...).
    const char* wireType(UpdateKind kind);

    /**
     * One message for the subscribers of a topic. Built once by a producer or fetch worker,
     * consumed once by the hub, then encoded and copied out to every subscriber.
     */
    struct Update
    {
        UpdateKind         kind{UpdateKind::Click};
        std::string        topic;
        nlohmann::json     payload;
        livelink::WallTime timestamp{};
    };

    Update makeUpdate(UpdateKind kind, const std::string& topic, nlohmann::json payload);

    // {"type", "short_code", "data", "timestamp"}
    std::string encodeUpdate(const Update& update);

    struct SubscribeRequest
    {
        std::string topic;
    };

    struct UnsubscribeRequest
    {
        std::string topic;
    };

    struct PingRequest
    {
    };

    using ClientMessage = std::variant<SubscribeRequest, UnsubscribeRequest, PingRequest>;

    // Returns nullopt for anything that is not a well-formed subscribe/unsubscribe/ping object.
    std::optional<ClientMessage> decodeClientMessage(const std::string& text);

    // 1-64 characters of [A-Za-z0-9_-]
    bool isValidShortCode(const std::string& code);

} // namespace realtime
