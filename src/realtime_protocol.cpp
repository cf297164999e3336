#include "realtime_protocol.hpp"

#include <cctype>

namespace realtime
{

    namespace
    {
        constexpr std::size_t kMaxShortCodeLength = 64;
        constexpr std::size_t kMaxClientFrameSize = 4096;
    } // namespace

    const char* wireType(UpdateKind kind)
    {
        switch (kind)
        {
        case UpdateKind::Click:
            return "click";
        case UpdateKind::Conversion:
            return "conversion";
        case UpdateKind::AnalyticsSnapshot:
            return "analytics_update";
        case UpdateKind::InitialSnapshot:
            return "initial_analytics";
        case UpdateKind::Ping:
            return "ping";
        case UpdateKind::Pong:
            return "pong";
        }
        return "unknown";
    }

    Update makeUpdate(UpdateKind kind, const std::string& topic, nlohmann::json payload)
    {
        Update u;
        u.kind      = kind;
        u.topic     = topic;
        u.payload   = std::move(payload);
        u.timestamp = livelink::WallClock::now();
        return u;
    }

    std::string encodeUpdate(const Update& update)
    {
        nlohmann::json j;
        j["type"]       = wireType(update.kind);
        j["short_code"] = update.topic;
        j["data"]       = update.payload;
        j["timestamp"]  = livelink::formatRfc3339(update.timestamp);
        return j.dump();
    }

    bool isValidShortCode(const std::string& code)
    {
        if (code.empty() || code.size() > kMaxShortCodeLength)
            return false;
        for (unsigned char c : code)
        {
            if (!std::isalnum(c) && c != '_' && c != '-')
                return false;
        }
        return true;
    }

    std::optional<ClientMessage> decodeClientMessage(const std::string& text)
    {
        if (text.empty() || text.size() > kMaxClientFrameSize)
            return std::nullopt;

        const auto j = nlohmann::json::parse(text, nullptr, false);
        if (j.is_discarded() || !j.is_object())
            return std::nullopt;

        auto typeIt = j.find("type");
        if (typeIt == j.end() || !typeIt->is_string())
            return std::nullopt;
        const auto type = typeIt->get<std::string>();

        if (type == "ping")
            return ClientMessage{PingRequest{}};

        auto codeIt = j.find("short_code");
        if (codeIt == j.end() || !codeIt->is_string())
            return std::nullopt;
        auto code = codeIt->get<std::string>();
        if (!isValidShortCode(code))
            return std::nullopt;

        if (type == "subscribe")
            return ClientMessage{SubscribeRequest{std::move(code)}};
        if (type == "unsubscribe")
            return ClientMessage{UnsubscribeRequest{std::move(code)}};
        return std::nullopt;
    }

} // namespace realtime
