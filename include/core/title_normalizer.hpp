#pragma once

#include <string>

/**
 * @brief Canonical comparison key for display titles
 */
class TitleNormalizer
{
public:
    /**
     * @brief Lower-case, drop everything but letters, digits and whitespace,
     *        collapse whitespace runs to one space, trim
     *
     * Input is decoded as UTF-8 and classified per code point, so accented
     * capitals fold and typographic dashes and quotes are stripped.
     * Malformed byte sequences are dropped.
     * Blank input yields an empty key, which never takes part in grouping.
     */
    static std::string normalize(const std::string &title);
};
