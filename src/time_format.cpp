#include "time_format.hpp"

#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace livelink
{

    namespace
    {

        bool readDigits(const std::string& text, std::size_t& pos, std::size_t count, int& out)
        {
            if (pos + count > text.size())
                return false;
            int value = 0;
            for (std::size_t i = 0; i < count; ++i)
            {
                const auto c = static_cast<unsigned char>(text[pos + i]);
                if (!std::isdigit(c))
                    return false;
                value = value * 10 + (c - '0');
            }
            pos += count;
            out = value;
            return true;
        }

        bool expect(const std::string& text, std::size_t& pos, char c)
        {
            if (pos >= text.size() || text[pos] != c)
                return false;
            ++pos;
            return true;
        }

    } // namespace

    std::string formatRfc3339(WallTime tp)
    {
        const auto millis =
            std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
        std::time_t t = WallClock::to_time_t(tp);
        std::tm     tmStruct{};
        gmtime_r(&t, &tmStruct);

        std::ostringstream oss;
        oss << std::put_time(&tmStruct, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
            << (millis < 0 ? millis + 1000 : millis) << 'Z';
        return oss.str();
    }

    std::optional<WallTime> parseRfc3339(const std::string& text)
    {
        std::size_t pos = 0;
        std::tm     tmStruct{};
        int         year{}, month{}, day{}, hour{}, minute{}, second{};
        if (!readDigits(text, pos, 4, year) || !expect(text, pos, '-') || !readDigits(text, pos, 2, month) ||
            !expect(text, pos, '-') || !readDigits(text, pos, 2, day))
            return std::nullopt;
        if (pos >= text.size() || (text[pos] != 'T' && text[pos] != 't' && text[pos] != ' '))
            return std::nullopt;
        ++pos;
        if (!readDigits(text, pos, 2, hour) || !expect(text, pos, ':') || !readDigits(text, pos, 2, minute) ||
            !expect(text, pos, ':') || !readDigits(text, pos, 2, second))
            return std::nullopt;
        if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60)
            return std::nullopt;

        long long nanos = 0;
        if (pos < text.size() && text[pos] == '.')
        {
            ++pos;
            long long scale  = 100000000;
            bool      digits = false;
            while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])))
            {
                nanos += (text[pos] - '0') * scale;
                scale /= 10;
                digits = true;
                ++pos;
            }
            if (!digits)
                return std::nullopt;
        }

        long offsetSeconds = 0;
        if (pos < text.size() && (text[pos] == 'Z' || text[pos] == 'z'))
        {
            ++pos;
        }
        else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-'))
        {
            const int sign = text[pos] == '-' ? -1 : 1;
            ++pos;
            int offHours{}, offMinutes{};
            if (!readDigits(text, pos, 2, offHours) || !expect(text, pos, ':') || !readDigits(text, pos, 2, offMinutes))
                return std::nullopt;
            offsetSeconds = sign * (offHours * 3600L + offMinutes * 60L);
        }
        else
        {
            return std::nullopt;
        }
        if (pos != text.size())
            return std::nullopt;

        tmStruct.tm_year = year - 1900;
        tmStruct.tm_mon  = month - 1;
        tmStruct.tm_mday = day;
        tmStruct.tm_hour = hour;
        tmStruct.tm_min  = minute;
        tmStruct.tm_sec  = second;
        const std::time_t utc = timegm(&tmStruct);

        auto tp = WallClock::from_time_t(utc - offsetSeconds);
        tp += std::chrono::duration_cast<WallClock::duration>(std::chrono::nanoseconds(nanos));
        return tp;
    }

} // namespace livelink
