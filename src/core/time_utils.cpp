#include "core/time_utils.hpp"
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

Timestamp TimeUtils::now()
{
    return std::chrono::time_point_cast<std::chrono::seconds>(std::chrono::system_clock::now());
}

std::string TimeUtils::toIso8601(const Timestamp &ts)
{
    std::time_t t = std::chrono::system_clock::to_time_t(ts);
    std::tm tm_utc{};
    gmtime_r(&t, &tm_utc);

    std::ostringstream ss;
    ss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

std::optional<Timestamp> TimeUtils::fromIso8601(const std::string &text)
{
    if (text.size() < 10)
        return std::nullopt;

    std::tm tm_utc{};
    std::istringstream ss(text);
    if (text.size() > 10 && (text[10] == 'T' || text[10] == ' '))
    {
        const char *format = text[10] == 'T' ? "%Y-%m-%dT%H:%M:%S" : "%Y-%m-%d %H:%M:%S";
        ss >> std::get_time(&tm_utc, format);
    }
    else
    {
        ss >> std::get_time(&tm_utc, "%Y-%m-%d");
    }
    if (ss.fail())
        return std::nullopt;

    // Fractional seconds and the trailing zone designator are accepted but ignored
    std::string rest;
    std::getline(ss, rest);
    if (!rest.empty())
    {
        size_t pos = 0;
        if (rest[pos] == '.')
        {
            ++pos;
            while (pos < rest.size() && std::isdigit(static_cast<unsigned char>(rest[pos])))
                ++pos;
        }
        if (pos < rest.size() && (rest[pos] == 'Z' || rest[pos] == 'z'))
            ++pos;
        if (pos != rest.size())
            return std::nullopt;
    }

    std::time_t t = timegm(&tm_utc);
    if (t == static_cast<std::time_t>(-1))
        return std::nullopt;
    return std::chrono::system_clock::from_time_t(t);
}

std::string TimeUtils::monthKey(const Timestamp &ts)
{
    std::time_t t = std::chrono::system_clock::to_time_t(ts);
    std::tm tm_utc{};
    gmtime_r(&t, &tm_utc);

    std::ostringstream ss;
    ss << std::put_time(&tm_utc, "%Y_%m");
    return ss.str();
}
