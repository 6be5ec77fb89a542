#include "core/string_utils.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_set>

namespace
{
    char lowerAscii(char c)
    {
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
    }

    char upperAscii(char c)
    {
        return (c >= 'a' && c <= 'z') ? static_cast<char>(c - 'a' + 'A') : c;
    }
}

std::string StringUtils::toLower(const std::string &value)
{
    std::string result(value);
    std::transform(result.begin(), result.end(), result.begin(), lowerAscii);
    return result;
}

std::string StringUtils::toUpper(const std::string &value)
{
    std::string result(value);
    std::transform(result.begin(), result.end(), result.begin(), upperAscii);
    return result;
}

bool StringUtils::equalsIgnoreCase(const std::string &a, const std::string &b)
{
    if (a.size() != b.size())
        return false;
    for (size_t i = 0; i < a.size(); ++i)
    {
        if (lowerAscii(a[i]) != lowerAscii(b[i]))
            return false;
    }
    return true;
}

bool StringUtils::containsIgnoreCase(const std::string &haystack, const std::string &needle)
{
    if (needle.empty())
        return true;
    return toUpper(haystack).find(toUpper(needle)) != std::string::npos;
}

bool StringUtils::isBlank(const std::string &value)
{
    return std::all_of(value.begin(), value.end(), [](unsigned char c)
                       { return std::isspace(c) != 0; });
}

size_t StringUtils::appendUniqueIgnoreCase(std::vector<std::string> &target,
                                           const std::vector<std::string> &values)
{
    std::unordered_set<std::string> seen;
    for (const auto &existing : target)
        seen.insert(toLower(existing));

    size_t appended = 0;
    for (const auto &value : values)
    {
        if (value.empty())
            continue;
        if (seen.insert(toLower(value)).second)
        {
            target.push_back(value);
            ++appended;
        }
    }
    return appended;
}
