#include "user_agent.hpp"

#include <algorithm>
#include <cctype>

namespace livelink
{

    namespace
    {

        std::string toLower(std::string s)
        {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return s;
        }

        bool has(const std::string& haystack, const char* needle)
        {
            return haystack.find(needle) != std::string::npos;
        }

        std::string detectOs(const std::string& ua)
        {
            if (has(ua, "windows"))
                return "Windows";
            if (has(ua, "iphone") || has(ua, "ipad") || has(ua, "ipod"))
                return "iOS";
            if (has(ua, "android"))
                return "Android";
            if (has(ua, "cros"))
                return "ChromeOS";
            if (has(ua, "mac os x") || has(ua, "macintosh"))
                return "macOS";
            if (has(ua, "linux"))
                return "Linux";
            return "Unknown";
        }

        std::string detectBrowser(const std::string& ua)
        {
            if (has(ua, "edg/") || has(ua, "edge/"))
                return "Edge";
            if (has(ua, "opr/") || has(ua, "opera"))
                return "Opera";
            if (has(ua, "firefox/") || has(ua, "fxios/"))
                return "Firefox";
            if (has(ua, "chrome/") || has(ua, "crios/"))
                return "Chrome";
            if (has(ua, "safari/"))
                return "Safari";
            if (has(ua, "msie") || has(ua, "trident/"))
                return "Internet Explorer";
            return "Unknown";
        }

        std::string detectDevice(const std::string& ua)
        {
            if (has(ua, "bot") || has(ua, "crawler") || has(ua, "spider") || has(ua, "curl/") || has(ua, "wget/"))
                return "bot";
            if (has(ua, "ipad") || has(ua, "tablet") || (has(ua, "android") && !has(ua, "mobile")))
                return "tablet";
            if (has(ua, "mobi") || has(ua, "iphone") || has(ua, "ipod"))
                return "mobile";
            return "desktop";
        }

    } // namespace

    DeviceInfo classifyUserAgent(const std::string& userAgent)
    {
        DeviceInfo info;
        if (userAgent.empty())
            return info;

        const auto ua   = toLower(userAgent);
        info.deviceType = detectDevice(ua);
        info.browser    = detectBrowser(ua);
        info.os         = detectOs(ua);
        return info;
    }

} // namespace livelink
