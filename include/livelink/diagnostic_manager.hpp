#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace diag
{

    enum class Severity
    {
        DEBUG,
        INFO,
        WARN,
        ERROR,
        FATAL
    };

    struct Event
    {
        std::chrono::system_clock::time_point timestamp;
        Severity                              severity;
        std::string                           component;
        std::string                           message;
        std::optional<std::string>            extraJson;
    };

    struct HubMetrics
    {
        std::size_t connections{0};
        std::size_t topics{0};
        std::size_t subscriptions{0};
        uint64_t    broadcastsAccepted{0};
        uint64_t    broadcastsDropped{0};
        uint64_t    deliveries{0};
        uint64_t    failedSends{0};
        uint64_t    evictions{0};
        uint64_t    fetchFailures{0};
    };

    struct MetricsSnapshot
    {
        std::chrono::system_clock::time_point timestamp;
        bool                                  diagThreadRunning{false};
        HubMetrics                            hub;
        uint64_t                              discardedLogEvents{0};
    };

    struct LogConfig
    {
        Severity                   minimumSeverity{Severity::INFO};
        bool                       logToStdout{true};
        std::optional<std::string> filePath{};
        std::size_t                maxFileSizeBytes{0};
        std::size_t                maxQueuedEvents{10000};
        std::size_t                recentCapacity{512};
    };

    Severity    severityFromChar(char c);
    std::string severityToString(Severity sev);

    class DiagnosticManager
    {
      public:
        using MetricsSource = std::function<HubMetrics()>;

        explicit DiagnosticManager(const LogConfig& cfg = {});
        ~DiagnosticManager();

        void start();
        void stop();

        void log(Severity sev, const std::string& component, const std::string& message,
                 const std::optional<std::string>& extraJson = std::nullopt);

        // Newest first.
        std::vector<Event> fetchRecent(std::size_t maxEvents) const;
        MetricsSnapshot    getMetrics() const;
        void               updateLogConfig(const LogConfig& cfg);
        LogConfig          logConfig() const;
        void               setMetricsSource(MetricsSource source);

        // Writes everything still pending; used on shutdown and by tests.
        void flush();

        std::optional<std::filesystem::path> logFilePath() const;

      private:
        void        workerThreadFn();
        void        rotateLogIfNeeded(const std::filesystem::path& path, std::size_t maxSize);
        void        persistEvent(const Event& ev);
        void        pollMetrics();
        bool        shouldLog(Severity sev) const;
        std::string formatTimestamp(const std::chrono::system_clock::time_point& tp) const;

        LogConfig             m_logCfg{};
        mutable std::mutex    m_logCfgMtx;
        std::filesystem::path m_logPath;
        std::ofstream         m_logFile;
        std::mutex            m_fileMtx;

        mutable std::mutex      m_mtx;
        std::condition_variable m_cv;
        std::deque<Event>       m_queue;
        std::deque<Event>       m_recent;
        uint64_t                m_discarded{0};
        std::atomic<bool>       m_running{false};
        std::thread             m_thread;

        mutable std::mutex                    m_metricsMtx;
        MetricsSource                         m_metricsSource;
        MetricsSnapshot                       m_metrics{};
        std::chrono::steady_clock::time_point m_lastPoll{};
        std::chrono::milliseconds             m_pollInterval{std::chrono::milliseconds(10000)};
    };

} // namespace diag
