#include "config_manager.hpp"

#include <limits>
#include <sstream>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

#include <tinyxml2.h>

namespace config
{

    ConfigError::ConfigError(const std::string& filePath, int line, const std::string& message)
        : std::runtime_error([&]() {
            std::ostringstream oss;
            if (!filePath.empty())
                oss << filePath << ':';
            if (line > 0)
                oss << line << ' ';
            oss << message;
            return oss.str();
        }()),
          m_file(filePath), m_line(line)
    {
    }

    namespace
    {

        using tinyxml2::XMLElement;

        [[noreturn]] void throwError(const std::string& path, int line, const std::string& message)
        {
            throw ConfigError(path, line, message);
        }

        template <typename T>
        T parseUnsigned(const std::string& path, XMLElement* elem, const char* attr, T defaultValue)
        {
            const char* txt = elem->Attribute(attr);
            if (!txt)
                return defaultValue;

            const std::string s(txt);
            if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos)
                throwError(path, elem->GetLineNum(),
                           std::string(elem->Name()) + " attribute '" + attr + "' is not an unsigned integer: " + s);

            unsigned long long v = 0;
            try
            {
                v = std::stoull(s);
            }
            catch (const std::out_of_range&)
            {
                throwError(path, elem->GetLineNum(), std::string(elem->Name()) + " attribute '" + attr + "' out of range");
            }
            if (v > std::numeric_limits<T>::max())
                throwError(path, elem->GetLineNum(), std::string(elem->Name()) + " attribute '" + attr + "' out of range");
            return static_cast<T>(v);
        }

        std::string parseString(const std::string& path, XMLElement* elem, const char* attr, bool required,
                                const std::string& defaultValue = {})
        {
            const char* txt = elem->Attribute(attr);
            if (!txt)
            {
                if (required)
                    throwError(path, elem->GetLineNum(), std::string("Missing required attribute '") + attr + "'");
                return defaultValue;
            }
            return txt;
        }

        ServerConfig parseServer(const std::string& path, XMLElement* elem)
        {
            ServerConfig s;
            if (!elem)
                return s;
            s.host    = parseString(path, elem, "host", false, s.host);
            s.port    = parseUnsigned<uint16_t>(path, elem, "port", s.port);
            s.threads = parseUnsigned<uint32_t>(path, elem, "threads", s.threads);
            return s;
        }

        RealtimeConfig parseRealtime(const std::string& path, XMLElement* elem)
        {
            RealtimeConfig r;
            if (!elem)
                return r;
            r.broadcastQueue    = parseUnsigned<uint32_t>(path, elem, "broadcastQueue", r.broadcastQueue);
            r.controlQueue      = parseUnsigned<uint32_t>(path, elem, "controlQueue", r.controlQueue);
            r.writeTimeoutMs    = parseUnsigned<uint32_t>(path, elem, "writeTimeoutMs", r.writeTimeoutMs);
            r.keepaliveSec      = parseUnsigned<uint32_t>(path, elem, "keepaliveSec", r.keepaliveSec);
            r.readTimeoutSec    = parseUnsigned<uint32_t>(path, elem, "readTimeoutSec", r.readTimeoutSec);
            r.refreshSec        = parseUnsigned<uint32_t>(path, elem, "refreshSec", r.refreshSec);
            r.initialWindowDays = parseUnsigned<uint32_t>(path, elem, "initialWindowDays", r.initialWindowDays);
            r.refreshWindowDays = parseUnsigned<uint32_t>(path, elem, "refreshWindowDays", r.refreshWindowDays);
            r.fetchWorkers      = parseUnsigned<uint32_t>(path, elem, "fetchWorkers", r.fetchWorkers);
            r.sendBufferBytes   = parseUnsigned<uint32_t>(path, elem, "sendBufferBytes", r.sendBufferBytes);
            return r;
        }

        AnalyticsConfig parseAnalytics(const std::string& path, XMLElement* elem)
        {
            AnalyticsConfig a;
            if (!elem)
                return a;
            a.baseUrl     = parseString(path, elem, "baseUrl", true);
            a.timeoutMs   = parseUnsigned<uint32_t>(path, elem, "timeoutMs", a.timeoutMs);
            a.cacheTtlSec = parseUnsigned<uint32_t>(path, elem, "cacheTtlSec", a.cacheTtlSec);
            a.apiKey      = parseString(path, elem, "apiKey", false, {});
            return a;
        }

        std::optional<DebugConfig> parseDebug(const std::string& path, XMLElement* dbgElem)
        {
            if (!dbgElem)
                return std::nullopt;
            DebugConfig d;
            d.fileName    = parseString(path, dbgElem, "fileName", true);
            d.fileSize    = parseUnsigned<uint32_t>(path, dbgElem, "fileSize", 0);
            auto levelStr = parseString(path, dbgElem, "level", false, "I");
            d.level       = levelStr.empty() ? 'I' : levelStr[0];
            return d;
        }

        std::vector<SchemaIssue> validateSchemaDoc(tinyxml2::XMLDocument& doc)
        {
            std::vector<SchemaIssue> issues;
            auto addIssue = [&issues](int line, const std::string& msg) { issues.push_back({msg, line}); };

            auto checkAttrs = [&addIssue](XMLElement* elem, const std::unordered_set<std::string>& allowed)
            {
                for (auto* a = elem->FirstAttribute(); a; a = a->Next())
                {
                    if (!allowed.count(a->Name()))
                        addIssue(elem->GetLineNum(),
                                 std::string("Unknown attribute on <") + elem->Name() + ">: " + a->Name());
                }
            };

            auto requireAttr = [&addIssue](XMLElement* elem, const char* attr)
            {
                if (!elem->Attribute(attr))
                    addIssue(elem->GetLineNum(), std::string(elem->Name()) + " missing required attribute '" + attr + "'");
            };

            auto* hubElem = doc.FirstChildElement("Hub");
            if (!hubElem)
            {
                addIssue(doc.ErrorLineNum(), "Missing <Hub> root element");
                return issues;
            }

            static const std::unordered_map<std::string, std::unordered_set<std::string>> allowedChildren = {
                {"Server", {"host", "port", "threads"}},
                {"Realtime",
                 {"broadcastQueue", "controlQueue", "writeTimeoutMs", "keepaliveSec", "readTimeoutSec", "refreshSec",
                  "initialWindowDays", "refreshWindowDays", "fetchWorkers", "sendBufferBytes"}},
                {"Analytics", {"baseUrl", "timeoutMs", "cacheTtlSec", "apiKey"}},
                {"Debug", {"fileName", "fileSize", "level"}},
            };

            checkAttrs(hubElem, {"name"});

            std::unordered_set<std::string> seen;
            for (auto* child = hubElem->FirstChildElement(); child; child = child->NextSiblingElement())
            {
                auto it = allowedChildren.find(child->Name());
                if (it == allowedChildren.end())
                {
                    addIssue(child->GetLineNum(), std::string("Unknown element under <Hub>: ") + child->Name());
                    continue;
                }
                if (!seen.insert(child->Name()).second)
                    addIssue(child->GetLineNum(), std::string("Duplicate <") + child->Name() + "> element");
                checkAttrs(child, it->second);
            }

            if (auto* analytics = hubElem->FirstChildElement("Analytics"))
                requireAttr(analytics, "baseUrl");
            else
                addIssue(hubElem->GetLineNum(), "Missing <Analytics> definition");

            if (auto* dbg = hubElem->FirstChildElement("Debug"))
                requireAttr(dbg, "fileName");

            return issues;
        }

    } // namespace

    HubConfig ConfigManager::loadHubConfigFromXml(const std::string& path, bool validateSchema)
    {
        tinyxml2::XMLDocument doc;
        if (doc.LoadFile(path.c_str()) != tinyxml2::XML_SUCCESS)
            throw ConfigError(path, doc.ErrorLineNum(), "Failed to load configuration XML");

        auto* hubElem = doc.FirstChildElement("Hub");
        if (!hubElem)
            throw ConfigError(path, doc.ErrorLineNum(), "Missing <Hub> root element in XML");

        if (validateSchema)
        {
            auto issues = validateSchemaDoc(doc);
            if (!issues.empty())
            {
                std::ostringstream oss;
                oss << "Schema validation failed with " << issues.size() << " issue(s):";
                for (const auto& issue : issues)
                {
                    oss << "\n";
                    if (issue.line > 0)
                        oss << "line " << issue.line << ": ";
                    oss << issue.message;
                }
                throw ConfigError(path, issues.front().line, oss.str());
            }
        }

        HubConfig cfg;
        cfg.name      = parseString(path, hubElem, "name", false, cfg.name);
        cfg.server    = parseServer(path, hubElem->FirstChildElement("Server"));
        cfg.realtime  = parseRealtime(path, hubElem->FirstChildElement("Realtime"));
        cfg.analytics = parseAnalytics(path, hubElem->FirstChildElement("Analytics"));
        cfg.debug     = parseDebug(path, hubElem->FirstChildElement("Debug"));
        return cfg;
    }

    std::vector<SchemaIssue> ConfigManager::validateXmlSchema(const std::string& path)
    {
        tinyxml2::XMLDocument doc;
        if (doc.LoadFile(path.c_str()) != tinyxml2::XML_SUCCESS)
            return {{"Failed to load configuration XML", doc.ErrorLineNum()}};

        return validateSchemaDoc(doc);
    }

    void ConfigManager::validateHubConfig(const HubConfig& cfg)
    {
        if (cfg.server.port == 0)
            throw std::runtime_error("Server port must be non-zero");

        const auto& rt = cfg.realtime;
        if (rt.broadcastQueue == 0)
            throw std::runtime_error("Realtime broadcastQueue must be non-zero");
        if (rt.controlQueue == 0)
            throw std::runtime_error("Realtime controlQueue must be non-zero");
        if (rt.writeTimeoutMs == 0 || rt.writeTimeoutMs > 60000)
            throw std::runtime_error("Realtime writeTimeoutMs must be within 1..60000, got " +
                                     std::to_string(rt.writeTimeoutMs));
        if (rt.keepaliveSec == 0)
            throw std::runtime_error("Realtime keepaliveSec must be non-zero");
        if (rt.keepaliveSec >= rt.readTimeoutSec)
            throw std::runtime_error("Realtime keepaliveSec (" + std::to_string(rt.keepaliveSec) +
                                     ") must be shorter than readTimeoutSec (" + std::to_string(rt.readTimeoutSec) +
                                     ")");
        if (rt.refreshSec == 0)
            throw std::runtime_error("Realtime refreshSec must be non-zero");
        if (rt.initialWindowDays < 1 || rt.initialWindowDays > 365)
            throw std::runtime_error("Realtime initialWindowDays must be within 1..365");
        if (rt.refreshWindowDays < 1 || rt.refreshWindowDays > 365)
            throw std::runtime_error("Realtime refreshWindowDays must be within 1..365");
        if (rt.fetchWorkers == 0)
            throw std::runtime_error("Realtime fetchWorkers must be at least 1");
        if (rt.sendBufferBytes < 4096)
            throw std::runtime_error("Realtime sendBufferBytes must be at least 4096, got " +
                                     std::to_string(rt.sendBufferBytes));

        const auto& url = cfg.analytics.baseUrl;
        if (url.rfind("http://", 0) != 0 && url.rfind("https://", 0) != 0)
            throw std::runtime_error("Analytics baseUrl must start with http:// or https://: " + url);
        if (cfg.analytics.timeoutMs == 0)
            throw std::runtime_error("Analytics timeoutMs must be non-zero");

        if (cfg.debug && cfg.debug->fileName.empty())
            throw std::runtime_error("Debug fileName must not be empty");
    }

} // namespace config
