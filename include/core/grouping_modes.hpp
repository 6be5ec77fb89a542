#pragma once

#include <algorithm>
#include <cctype>
#include <string>

/**
 * @brief How above-threshold pairs inside a title bucket become groups
 */
enum class GroupingMode
{
    EDGE,     // every item with at least one matching pair joins one group per bucket
    COMPONENT // one group per connected component of matching pairs
};

class GroupingModes
{
public:
    /**
     * @brief Get the mode name as string
     * @param mode The grouping mode
     * @return String representation of the mode
     */
    static std::string getModeName(GroupingMode mode)
    {
        switch (mode)
        {
        case GroupingMode::EDGE:
            return "EDGE";
        case GroupingMode::COMPONENT:
            return "COMPONENT";
        default:
            return "UNKNOWN";
        }
    }

    /**
     * @brief Get a short description of the mode's trade-off
     */
    static std::string getModeDescription(GroupingMode mode)
    {
        switch (mode)
        {
        case GroupingMode::EDGE:
            return "Higher recall; dissimilar items can chain through a shared match";
        case GroupingMode::COMPONENT:
            return "Separate groups for unconnected matches within a title";
        default:
            return "Unknown mode";
        }
    }

    /**
     * @brief Convert string to GroupingMode enum
     * @param mode_str String representation of the mode
     * @return GroupingMode enum value, EDGE when unrecognised
     */
    static GroupingMode fromString(const std::string &mode_str)
    {
        return isValidName(mode_str) && normalize(mode_str) == "COMPONENT" ? GroupingMode::COMPONENT
                                                                           : GroupingMode::EDGE;
    }

    /**
     * @brief True for "EDGE" or "COMPONENT" in any letter case
     */
    static bool isValidName(const std::string &mode_str)
    {
        std::string upper = normalize(mode_str);
        return upper == "EDGE" || upper == "COMPONENT";
    }

private:
    static std::string normalize(const std::string &mode_str)
    {
        std::string upper = mode_str;
        std::transform(upper.begin(), upper.end(), upper.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::toupper(c)); });
        return upper;
    }
};
