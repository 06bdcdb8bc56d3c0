#pragma once
#include <cstddef>
#include <string>
#include <string_view>

namespace finbot::text
{
    // Lengths and offsets below are in code points, not bytes. Input is
    // expected to be valid UTF-8; stray continuation bytes are not counted.

    inline bool IsUtf8Continuation(unsigned char c) noexcept
    {
        return (c & 0xC0u) == 0x80u;
    }

    inline std::size_t Utf8Length(std::string_view s) noexcept
    {
        std::size_t n = 0;
        for (unsigned char c : s)
        {
            if (!IsUtf8Continuation(c))
                ++n;
        }
        return n;
    }

    // Last `count` code points of `s` (the whole string if it is shorter).
    inline std::string Utf8Suffix(std::string_view s, std::size_t count)
    {
        if (count == 0)
            return {};
        std::size_t pos = s.size();
        std::size_t seen = 0;
        while (pos > 0)
        {
            --pos;
            if (!IsUtf8Continuation(static_cast<unsigned char>(s[pos])))
            {
                if (++seen == count)
                    break;
            }
        }
        return std::string(s.substr(pos));
    }
} // namespace finbot::text
