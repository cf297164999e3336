#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "time_format.hpp"

namespace livelink
{

    struct DailyClicks
    {
        std::string date;
        int64_t     clicks{0};
    };

    struct CountryClicks
    {
        std::string countryCode;
        int64_t     clicks{0};
    };

    // Aggregate view of one short code over a window of days, as served by the analytics store.
    struct AggregateAnalytics
    {
        std::string                shortCode;
        std::string                originalUrl;
        int64_t                    totalClicks{0};
        std::optional<WallTime>    createdAt;
        std::optional<WallTime>    lastClickAt;
        std::vector<DailyClicks>   dailyClicks;
        std::vector<CountryClicks> countryStats;
    };

    // Zero-value snapshot used when the store has nothing recorded for a code.
    AggregateAnalytics emptyAnalytics(const std::string& shortCode);

    struct ClickEvent
    {
        std::string shortCode;
        std::string clientIp;
        std::string userAgent;
        std::string referrer;
        std::string country{"Unknown"};
        std::string city{"Unknown"};
        std::string device{"Unknown"};
        std::string browser{"Unknown"};
        std::string os{"Unknown"};
        WallTime    timestamp{};
    };

    struct ConversionEvent
    {
        int64_t                id{0};
        std::string            shortCode;
        int64_t                goalId{0};
        std::string            conversionId;
        std::string            conversionType;
        double                 conversionValue{0.0};
        std::string            sessionId;
        std::optional<int64_t> clickId;
        WallTime               conversionTime{};
        std::string            attributionModel{"last_click"};
        int                    timeToConversionMinutes{0};
    };

    void to_json(nlohmann::json& j, const DailyClicks& v);
    void from_json(const nlohmann::json& j, DailyClicks& v);
    void to_json(nlohmann::json& j, const CountryClicks& v);
    void from_json(const nlohmann::json& j, CountryClicks& v);
    void to_json(nlohmann::json& j, const AggregateAnalytics& v);
    void from_json(const nlohmann::json& j, AggregateAnalytics& v);
    void to_json(nlohmann::json& j, const ClickEvent& v);
    void to_json(nlohmann::json& j, const ConversionEvent& v);
    void from_json(const nlohmann::json& j, ConversionEvent& v);

} // namespace livelink
