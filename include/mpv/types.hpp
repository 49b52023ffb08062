#pragma once

#include <cstddef>

#ifdef _MSC_VER
#include <intrin.h>
#define MPV_BSWAP16( v ) ( _byteswap_ushort( v ) )
#define MPV_BSWAP32( v ) ( _byteswap_ulong( v ) )
#define MPV_BSWAP64( v ) ( _byteswap_uint64( v ) )
#elif defined(__GNUC__) || defined(__clang__)
#define MPV_BSWAP16( v ) ( __builtin_bswap16( v ) )
#define MPV_BSWAP32( v ) ( __builtin_bswap32( v ) )
#define MPV_BSWAP64( v ) ( __builtin_bswap64( v ) )
#endif

/*
 * Default container nesting limit applied by `decode`. Zero disables the limit.
 */
#ifndef MPV_DEFAULT_MAX_DEPTH
#define MPV_DEFAULT_MAX_DEPTH 0
#endif

namespace mpv
{
    using mp_u32 = unsigned int;
    using mp_u64 = unsigned long long;

    using mp_i32 = signed int;
    using mp_i64 = signed long long;

    using mp_u16 = unsigned short;
    using mp_i16 = signed short;

    using mp_u8 = unsigned char;
    using mp_i8 = signed char;

    static_assert(
        sizeof( mp_u32 ) == 4,
        "incorrectly sized `unsigned int` type."
    );

    static_assert(
        sizeof( mp_u64 ) == 8,
        "incorrectly sized `unsigned long long` type."
    );

    static_assert(
        sizeof( mp_u16 ) == 2,
        "incorrectly sized `unsigned short` type."
    );

    static_assert(
        sizeof( mp_u8 ) == 1,
        "incorrectly sized `unsigned char` type."
    );

    static_assert(
        sizeof( double ) == 8 && sizeof( float ) == 4,
        "IEEE-754 binary32/binary64 floating point types are required."
    );

    namespace limits
    {
        constexpr mp_i64 int8_min = -128;
        constexpr mp_i64 int16_min = -32768;
        constexpr mp_i64 int32_min = -2147483647LL - 1;
        constexpr mp_i64 int8_max = 127;
        constexpr mp_i64 int16_max = 32767;
        constexpr mp_i64 int32_max = 2147483647LL;
        constexpr mp_u64 uint8_max = 0xffULL;
        constexpr mp_u64 uint16_max = 0xffffULL;
        constexpr mp_u64 uint32_max = 0xffffffffULL;
    }

    namespace value_limits
    {
        constexpr mp_i64 PosFixIntMax = 127;
        constexpr mp_i64 NegFixIntMin = -32;

        constexpr std::size_t FixStrMax = 31;
        constexpr std::size_t FixArrayMax = 15;
        constexpr std::size_t FixMapMax = 15;
    }

    /*
     * Leading byte of every encoded value. Fixed families (fixint, fixmap, fixarray,
     * fixstr) are listed by their lowest tag; the low bits carry the value or length.
     */
    enum class Marker : mp_u8
    {
        PosFixInt = 0x00,
        FixMap    = 0x80,
        FixArray  = 0x90,
        FixStr    = 0xa0,
        Nil       = 0xc0,
        Unused    = 0xc1,
        False     = 0xc2,
        True      = 0xc3,
        Bin8      = 0xc4,
        Bin16     = 0xc5,
        Bin32     = 0xc6,
        Ext8      = 0xc7,
        Ext16     = 0xc8,
        Ext32     = 0xc9,
        Float32   = 0xca,
        Float64   = 0xcb,
        Uint8     = 0xcc,
        Uint16    = 0xcd,
        Uint32    = 0xce,
        Uint64    = 0xcf,
        Int8      = 0xd0,
        Int16     = 0xd1,
        Int32     = 0xd2,
        Int64     = 0xd3,
        FixExt1   = 0xd4,
        FixExt2   = 0xd5,
        FixExt4   = 0xd6,
        FixExt8   = 0xd7,
        FixExt16  = 0xd8,
        Str8      = 0xd9,
        Str16     = 0xda,
        Str32     = 0xdb,
        Array16   = 0xdc,
        Array32   = 0xdd,
        Map16     = 0xde,
        Map32     = 0xdf,
        NegFixInt = 0xe0
    };

    /**
     * @brief Raw byte value of `marker`.
     * @param marker Tag to convert
     * @return mp_u8
     */
    constexpr mp_u8 marker_byte( const Marker marker )
    {
        return static_cast< mp_u8 >( marker );
    }
}
