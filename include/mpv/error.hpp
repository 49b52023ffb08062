#pragma once

#include <cstddef>

namespace mpv
{
    /**
     * @brief Input could not be decoded.
     *
     * `byte` is the offset, from the start of the buffer handed to `decode`, of the first
     * byte that made decoding impossible: the tag itself for an empty slice or the reserved
     * 0xc1 tag, the byte after the tag for a truncated length field or fixed-width body, the
     * first payload byte for a truncated payload or invalid UTF-8.
     */
    struct ParseError
    {
        std::size_t byte { 0 };

        /**
         * @brief Copy of this error shifted forward by `value` bytes.
         * @param value Number of bytes consumed before the slice this error refers to
         * @return ParseError
         */
        ParseError offset( const std::size_t value ) const
        {
            return ParseError { byte + value };
        }
    };

    inline bool operator==( const ParseError &lhs, const ParseError &rhs )
    {
        return lhs.byte == rhs.byte;
    }

    inline bool operator!=( const ParseError &lhs, const ParseError &rhs )
    {
        return !( lhs == rhs );
    }
}
