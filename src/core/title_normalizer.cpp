#include "core/title_normalizer.hpp"
#include <Poco/Ascii.h>
#include <Poco/TextIterator.h>
#include <Poco/UTF8Encoding.h>
#include <Poco/Unicode.h>

namespace
{
    // Unicode separators do not cover tab, newline and the other ASCII controls
    bool isWhitespace(int ch)
    {
        return Poco::Ascii::isSpace(ch) || Poco::Unicode::isSpace(ch);
    }

    // Combining accents stay attached to the letter they decorate
    bool isMark(int ch)
    {
        Poco::Unicode::CharacterProperties props;
        Poco::Unicode::properties(ch, props);
        return props.category == Poco::Unicode::UCP_MARK;
    }
}

std::string TitleNormalizer::normalize(const std::string &title)
{
    Poco::UTF8Encoding encoding;
    std::string result;
    result.reserve(title.size());

    bool pending_space = false;
    Poco::TextIterator it(title, encoding);
    Poco::TextIterator end(title);
    for (; it != end; ++it)
    {
        int ch = *it;
        if (ch < 0)
            continue; // malformed sequence

        if (isWhitespace(ch))
        {
            pending_space = !result.empty();
            continue;
        }

        if (!Poco::Unicode::isAlpha(ch) && !Poco::Unicode::isDigit(ch) && !isMark(ch))
            continue;

        if (pending_space)
        {
            result.push_back(' ');
            pending_space = false;
        }

        unsigned char buffer[4];
        int length = encoding.convert(Poco::Unicode::toLower(ch), buffer, sizeof(buffer));
        if (length > 0 && length <= static_cast<int>(sizeof(buffer)))
            result.append(reinterpret_cast<const char *>(buffer), static_cast<std::size_t>(length));
    }
    return result;
}
