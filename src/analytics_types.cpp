#include "analytics_types.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>

namespace livelink
{

    namespace
    {

        nlohmann::json timeOrNull(const std::optional<WallTime>& tp)
        {
            if (!tp)
                return nullptr;
            return formatRfc3339(*tp);
        }

        std::optional<WallTime> optionalTime(const nlohmann::json& j, const char* key)
        {
            auto it = j.find(key);
            if (it == j.end() || it->is_null())
                return std::nullopt;
            auto parsed = parseRfc3339(it->get<std::string>());
            if (!parsed)
                throw std::invalid_argument(std::string("invalid timestamp in '") + key + "'");
            return parsed;
        }

    } // namespace

    AggregateAnalytics emptyAnalytics(const std::string& shortCode)
    {
        AggregateAnalytics a;
        a.shortCode = shortCode;
        return a;
    }

    void to_json(nlohmann::json& j, const DailyClicks& v)
    {
        j = nlohmann::json{{"date", v.date}, {"clicks", v.clicks}};
    }

    void from_json(const nlohmann::json& j, DailyClicks& v)
    {
        v.date   = j.at("date").get<std::string>();
        v.clicks = j.value("clicks", int64_t{0});
    }

    void to_json(nlohmann::json& j, const CountryClicks& v)
    {
        j = nlohmann::json{{"country_code", v.countryCode}, {"clicks", v.clicks}};
    }

    void from_json(const nlohmann::json& j, CountryClicks& v)
    {
        v.countryCode = j.at("country_code").get<std::string>();
        v.clicks      = j.value("clicks", int64_t{0});
    }

    void to_json(nlohmann::json& j, const AggregateAnalytics& v)
    {
        j                  = nlohmann::json::object();
        j["short_code"]    = v.shortCode;
        j["original_url"]  = v.originalUrl;
        j["total_clicks"]  = v.totalClicks;
        j["created_at"]    = timeOrNull(v.createdAt);
        j["last_click_at"] = timeOrNull(v.lastClickAt);
        j["daily_clicks"]  = v.dailyClicks;
        j["country_stats"] = v.countryStats;
    }

    void from_json(const nlohmann::json& j, AggregateAnalytics& v)
    {
        v.shortCode   = j.value("short_code", std::string{});
        v.originalUrl = j.value("original_url", std::string{});
        v.totalClicks = j.value("total_clicks", int64_t{0});
        v.createdAt   = optionalTime(j, "created_at");
        v.lastClickAt = optionalTime(j, "last_click_at");
        v.dailyClicks.clear();
        v.countryStats.clear();
        if (auto it = j.find("daily_clicks"); it != j.end() && it->is_array())
            v.dailyClicks = it->get<std::vector<DailyClicks>>();
        if (auto it = j.find("country_stats"); it != j.end() && it->is_array())
            v.countryStats = it->get<std::vector<CountryClicks>>();
    }

    void to_json(nlohmann::json& j, const ClickEvent& v)
    {
        j = nlohmann::json{{"short_code", v.shortCode}, {"client_ip", v.clientIp}, {"user_agent", v.userAgent},
                           {"referrer", v.referrer},    {"country", v.country},    {"city", v.city},
                           {"device", v.device},        {"browser", v.browser},    {"os", v.os},
                           {"timestamp", formatRfc3339(v.timestamp)}};
    }

    void to_json(nlohmann::json& j, const ConversionEvent& v)
    {
        j                       = nlohmann::json::object();
        j["id"]                 = v.id;
        j["short_code"]         = v.shortCode;
        j["goal_id"]            = v.goalId;
        j["conversion_id"]      = v.conversionId;
        j["conversion_type"]    = v.conversionType;
        j["conversion_value"]   = v.conversionValue;
        j["session_id"]         = v.sessionId;
        j["click_id"]           = v.clickId ? nlohmann::json(*v.clickId) : nlohmann::json(nullptr);
        j["conversion_time"]    = formatRfc3339(v.conversionTime);
        j["attribution_model"]  = v.attributionModel;
        j["time_to_conversion"] = v.timeToConversionMinutes;
    }

    void from_json(const nlohmann::json& j, ConversionEvent& v)
    {
        v.id                      = j.value("id", int64_t{0});
        v.shortCode               = j.value("short_code", std::string{});
        v.goalId                  = j.value("goal_id", int64_t{0});
        v.conversionId            = j.value("conversion_id", std::string{});
        v.conversionType          = j.value("conversion_type", std::string{});
        v.conversionValue         = j.value("conversion_value", 0.0);
        v.sessionId               = j.value("session_id", std::string{});
        v.attributionModel        = j.value("attribution_model", std::string{"last_click"});
        v.timeToConversionMinutes = j.value("time_to_conversion", 0);
        if (auto it = j.find("click_id"); it != j.end() && !it->is_null())
            v.clickId = it->get<int64_t>();
        else
            v.clickId.reset();
        auto when        = optionalTime(j, "conversion_time");
        v.conversionTime = when ? *when : WallClock::now();
    }

} // namespace livelink
