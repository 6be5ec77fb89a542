#pragma once

#include <string>

/**
 * @brief Random RFC 4122 version 4 identifiers for groups, jobs and audit records
 */
class IdGenerator
{
public:
    /**
     * @brief Generate a lower-case "xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx" string
     * @throws std::runtime_error if the OpenSSL random generator is not seeded
     */
    static std::string newUuid();

    /**
     * @brief Check the canonical 8-4-4-4-12 hexadecimal layout
     */
    static bool isUuid(const std::string &value);
};
