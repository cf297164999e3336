#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace config
{

    struct SchemaIssue
    {
        std::string message;
        int         line{0};
    };

    class ConfigError : public std::runtime_error
    {
      public:
        ConfigError(const std::string& filePath, int line, const std::string& message);

        int                line() const { return m_line; }
        const std::string& file() const { return m_file; }

      private:
        std::string m_file;
        int         m_line{};
    };

    struct ServerConfig
    {
        std::string host{"0.0.0.0"};
        uint16_t    port{8080};
        uint32_t    threads{0}; // 0: one per core
    };

    struct RealtimeConfig
    {
        uint32_t broadcastQueue{1000};
        uint32_t controlQueue{4096};
        uint32_t writeTimeoutMs{1000};
        uint32_t keepaliveSec{54};
        uint32_t readTimeoutSec{60};
        uint32_t refreshSec{30};
        uint32_t initialWindowDays{30};
        uint32_t refreshWindowDays{1};
        uint32_t fetchWorkers{4};
        uint32_t sendBufferBytes{1048576}; // unacknowledged outbound bytes per connection
    };

    struct AnalyticsConfig
    {
        std::string baseUrl{"http://127.0.0.1:8081"};
        uint32_t    timeoutMs{5000};
        uint32_t    cacheTtlSec{0};
        std::string apiKey;
    };

    struct DebugConfig
    {
        std::string fileName;
        uint32_t    fileSize{};
        char        level{'I'};
    };

    struct HubConfig
    {
        std::string                name{"livelink"};
        ServerConfig               server;
        RealtimeConfig             realtime;
        AnalyticsConfig            analytics;
        std::optional<DebugConfig> debug;
    };

    class ConfigManager
    {
      public:
        HubConfig loadHubConfigFromXml(const std::string& path, bool validateSchema = true);
        void      validateHubConfig(const HubConfig& cfg);

        std::vector<SchemaIssue> validateXmlSchema(const std::string& path);
    };

} // namespace config
