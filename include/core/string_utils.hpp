#pragma once

#include <cstddef>
#include <string>
#include <vector>

/**
 * @brief ASCII case helpers shared by the matching and scoring code
 *
 * Bytes outside the ASCII range are passed through unchanged, so UTF-8
 * titles survive case folding intact.
 */
class StringUtils
{
public:
    static std::string toLower(const std::string &value);
    static std::string toUpper(const std::string &value);

    static bool equalsIgnoreCase(const std::string &a, const std::string &b);
    static bool containsIgnoreCase(const std::string &haystack, const std::string &needle);

    /**
     * @brief True when the string is empty or only whitespace
     */
    static bool isBlank(const std::string &value);

    /**
     * @brief Append non-empty values not already present (case-insensitive), keeping first spelling
     * @return Number of values appended
     */
    static size_t appendUniqueIgnoreCase(std::vector<std::string> &target,
                                         const std::vector<std::string> &values);
};
