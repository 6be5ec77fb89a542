#pragma once

#include <chrono>
#include <optional>
#include <string>

using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief UTC timestamp formatting used by the persisted documents
 */
class TimeUtils
{
public:
    static Timestamp now();

    /**
     * @brief Format as ISO-8601 UTC with second precision ("2024-03-01T12:00:00Z")
     */
    static std::string toIso8601(const Timestamp &ts);

    /**
     * @brief Parse "YYYY-MM-DD", "YYYY-MM-DDTHH:MM:SS" with optional fraction and "Z"
     * @return Empty when the text is not a recognised date
     */
    static std::optional<Timestamp> fromIso8601(const std::string &text);

    /**
     * @brief Month bucket key ("2024_03") used for audit partitioning
     */
    static std::string monthKey(const Timestamp &ts);
};
