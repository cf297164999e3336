#pragma once

#include <string>

namespace livelink
{

    struct DeviceInfo
    {
        std::string deviceType{"Unknown"}; // desktop, mobile, tablet, bot
        std::string browser{"Unknown"};
        std::string os{"Unknown"};
    };

    // Coarse keyword classification of a User-Agent header. Order of the checks matters:
    // Edge and Opera carry "Chrome", Chrome carries "Safari", Android carries "Linux".
    DeviceInfo classifyUserAgent(const std::string& userAgent);

} // namespace livelink
