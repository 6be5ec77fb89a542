#include "core/id_generator.hpp"
#include <openssl/rand.h>
#include <openssl/err.h>
#include <array>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

std::string IdGenerator::newUuid()
{
    std::array<unsigned char, 16> bytes{};
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1)
    {
        throw std::runtime_error("RAND_bytes failed: " + std::to_string(ERR_get_error()));
    }

    // Version 4, variant RFC 4122
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);

    std::ostringstream ss;
    ss << std::hex << std::setfill('0');
    for (size_t i = 0; i < bytes.size(); ++i)
    {
        if (i == 4 || i == 6 || i == 8 || i == 10)
            ss << '-';
        ss << std::setw(2) << static_cast<int>(bytes[i]);
    }
    return ss.str();
}

bool IdGenerator::isUuid(const std::string &value)
{
    if (value.size() != 36)
        return false;
    for (size_t i = 0; i < value.size(); ++i)
    {
        if (i == 8 || i == 13 || i == 18 || i == 23)
        {
            if (value[i] != '-')
                return false;
        }
        else if (!std::isxdigit(static_cast<unsigned char>(value[i])))
        {
            return false;
        }
    }
    return true;
}
