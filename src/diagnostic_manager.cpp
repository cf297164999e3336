#include "diagnostic_manager.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <system_error>

namespace diag {

Severity severityFromChar(char c)
{
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    switch (c) {
    case 'D': return Severity::DEBUG;
    case 'I': return Severity::INFO;
    case 'W': return Severity::WARN;
    case 'E': return Severity::ERROR;
    case 'F': return Severity::FATAL;
    default: return Severity::INFO;
    }
}

std::string severityToString(Severity sev)
{
    switch (sev) {
    case Severity::DEBUG: return "DEBUG";
    case Severity::INFO: return "INFO";
    case Severity::WARN: return "WARN";
    case Severity::ERROR: return "ERROR";
    case Severity::FATAL: return "FATAL";
    }
    return "UNKNOWN";
}

DiagnosticManager::DiagnosticManager(const LogConfig& cfg)
    : m_logCfg(cfg)
{
    if (m_logCfg.filePath)
        m_logPath = *m_logCfg.filePath;
}

DiagnosticManager::~DiagnosticManager()
{
    stop();
    std::lock_guard<std::mutex> lk(m_fileMtx);
    if (m_logFile.is_open())
        m_logFile.close();
}

void DiagnosticManager::start()
{
    if (m_running.exchange(true))
        return;
    m_thread = std::thread(&DiagnosticManager::workerThreadFn, this);
}

void DiagnosticManager::stop()
{
    if (!m_running.exchange(false))
        return;
    m_cv.notify_all();
    if (m_thread.joinable())
        m_thread.join();
    flush();
}

void DiagnosticManager::log(Severity sev, const std::string& component,
                            const std::string& message,
                            const std::optional<std::string>& extraJson)
{
    if (!shouldLog(sev))
        return;

    Event ev;
    ev.timestamp = std::chrono::system_clock::now();
    ev.severity = sev;
    ev.component = component;
    ev.message = message;
    ev.extraJson = extraJson;

    std::size_t maxQueued = 0;
    std::size_t recentCap = 0;
    {
        std::lock_guard<std::mutex> cfgLock(m_logCfgMtx);
        maxQueued = m_logCfg.maxQueuedEvents;
        recentCap = m_logCfg.recentCapacity;
    }

    {
        std::lock_guard<std::mutex> lock(m_mtx);
        if (recentCap > 0) {
            if (m_recent.size() >= recentCap)
                m_recent.pop_front();
            m_recent.push_back(ev);
        }
        if (maxQueued > 0 && m_queue.size() >= maxQueued) {
            m_queue.pop_front();
            ++m_discarded;
        }
        m_queue.push_back(std::move(ev));
    }
    m_cv.notify_one();
}

std::vector<Event> DiagnosticManager::fetchRecent(std::size_t maxEvents) const
{
    std::lock_guard<std::mutex> lock(m_mtx);
    std::vector<Event> out;
    maxEvents = std::min(maxEvents, m_recent.size());
    out.reserve(maxEvents);
    auto it = m_recent.end();
    for (std::size_t i = 0; i < maxEvents; ++i) {
        --it;
        out.push_back(*it);
    }
    return out;
}

MetricsSnapshot DiagnosticManager::getMetrics() const
{
    std::lock_guard<std::mutex> lk(m_metricsMtx);
    return m_metrics;
}

void DiagnosticManager::updateLogConfig(const LogConfig& cfg)
{
    std::lock_guard<std::mutex> lk(m_logCfgMtx);
    m_logCfg = cfg;
    if (m_logCfg.filePath)
        m_logPath = *m_logCfg.filePath;
}

LogConfig DiagnosticManager::logConfig() const
{
    std::lock_guard<std::mutex> lk(m_logCfgMtx);
    return m_logCfg;
}

void DiagnosticManager::setMetricsSource(MetricsSource source)
{
    std::lock_guard<std::mutex> lk(m_metricsMtx);
    m_metricsSource = std::move(source);
}

std::optional<std::filesystem::path> DiagnosticManager::logFilePath() const
{
    std::lock_guard<std::mutex> lk(m_logCfgMtx);
    if (!m_logCfg.filePath)
        return std::nullopt;
    return m_logPath;
}

void DiagnosticManager::flush()
{
    std::deque<Event> pending;
    {
        std::lock_guard<std::mutex> lock(m_mtx);
        pending.swap(m_queue);
    }
    for (const auto& ev : pending)
        persistEvent(ev);
}

void DiagnosticManager::workerThreadFn()
{
    while (m_running.load()) {
        std::deque<Event> pending;
        {
            std::unique_lock<std::mutex> lock(m_mtx);
            m_cv.wait_for(lock, std::chrono::milliseconds(200),
                          [this]() { return !m_queue.empty() || !m_running.load(); });
            pending.swap(m_queue);
        }
        for (const auto& ev : pending)
            persistEvent(ev);

        auto now = std::chrono::steady_clock::now();
        if (m_lastPoll.time_since_epoch().count() == 0 || now - m_lastPoll >= m_pollInterval) {
            pollMetrics();
            m_lastPoll = now;
        }
    }
}

void DiagnosticManager::rotateLogIfNeeded(const std::filesystem::path& path, std::size_t maxSize)
{
    if (maxSize == 0)
        return;

    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
        return;

    auto size = std::filesystem::file_size(path, ec);
    if (ec || size < maxSize)
        return;

    std::filesystem::path rotated = path;
    rotated += ".1";
    m_logFile.close();
    std::filesystem::remove(rotated, ec);
    std::filesystem::rename(path, rotated, ec);
    if (ec)
        std::cerr << "log rotation failed for " << path << ": " << ec.message() << std::endl;
    m_logFile.open(path, std::ios::out | std::ios::trunc);
}

void DiagnosticManager::persistEvent(const Event& ev)
{
    auto line = formatTimestamp(ev.timestamp) + " [" + severityToString(ev.severity) + "] " + ev.component + ": " + ev.message;
    if (ev.extraJson)
        line += " " + *ev.extraJson;

    bool toStdout = false;
    bool toFile = false;
    std::filesystem::path logPath;
    std::size_t maxSize = 0;
    {
        std::lock_guard<std::mutex> cfgLock(m_logCfgMtx);
        toStdout = m_logCfg.logToStdout;
        toFile = m_logCfg.filePath.has_value();
        logPath = m_logPath;
        maxSize = m_logCfg.maxFileSizeBytes;
    }

    std::lock_guard<std::mutex> fileLock(m_fileMtx);
    if (toStdout)
        std::cout << line << std::endl;

    if (toFile) {
        if (!m_logFile.is_open()) {
            std::error_code ec;
            if (logPath.has_parent_path())
                std::filesystem::create_directories(logPath.parent_path(), ec);
            m_logFile.open(logPath, std::ios::out | std::ios::app);
        }
        m_logFile << line << std::endl;
        m_logFile.flush();
        rotateLogIfNeeded(logPath, maxSize);
    }
}

void DiagnosticManager::pollMetrics()
{
    MetricsSource source;
    {
        std::lock_guard<std::mutex> lk(m_metricsMtx);
        source = m_metricsSource;
    }

    MetricsSnapshot snapshot;
    snapshot.timestamp = std::chrono::system_clock::now();
    snapshot.diagThreadRunning = m_running.load();
    if (source)
        snapshot.hub = source();
    {
        std::lock_guard<std::mutex> lock(m_mtx);
        snapshot.discardedLogEvents = m_discarded;
    }

    {
        std::lock_guard<std::mutex> lk(m_metricsMtx);
        m_metrics = snapshot;
    }

    std::ostringstream oss;
    oss << "hub(conns=" << snapshot.hub.connections
        << ", topics=" << snapshot.hub.topics
        << ", subs=" << snapshot.hub.subscriptions
        << ") broadcast(accepted=" << snapshot.hub.broadcastsAccepted
        << ", dropped=" << snapshot.hub.broadcastsDropped
        << ", delivered=" << snapshot.hub.deliveries
        << ", failed=" << snapshot.hub.failedSends
        << ") evictions=" << snapshot.hub.evictions
        << " fetchFailures=" << snapshot.hub.fetchFailures
        << " logDiscards=" << snapshot.discardedLogEvents;
    log(Severity::DEBUG, "Diagnostics", oss.str());
}

bool DiagnosticManager::shouldLog(Severity sev) const
{
    std::lock_guard<std::mutex> lk(m_logCfgMtx);
    return static_cast<int>(sev) >= static_cast<int>(m_logCfg.minimumSeverity);
}

std::string DiagnosticManager::formatTimestamp(const std::chrono::system_clock::time_point& tp) const
{
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tmStruct {};
#if defined(_WIN32)
    localtime_s(&tmStruct, &t);
#else
    localtime_r(&t, &tmStruct);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tmStruct, "%F %T");
    return oss.str();
}

} // namespace diag
