#pragma once

#include <iterator>
#include <ostream>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "error.hpp"
#include "value.hpp"

/*
 * Human readable rendering. Not a serialization: strings are not escaped and the output
 * cannot be parsed back.
 *
 *  nil, true, false, 42, 1.5, "text", bin:42ff, ext:2:324a6711, [1, 2], {"a": 1}
 */

namespace mpv
{
    namespace detail
    {
        template < typename OutputIt >
        OutputIt render_hex( OutputIt out, const Bytes &bytes )
        {
            for ( const auto byte : bytes )
                out = fmt::format_to( out, "{:02x}", byte );

            return out;
        }

        template < typename OutputIt >
        OutputIt render_to( OutputIt out, const Value &value )
        {
            switch ( value.kind ( ) )
            {
            case Kind::Nil:
                return fmt::format_to( out, "nil" );
            case Kind::Int:
                return fmt::format_to( out, "{}", *value.as_int ( ) );
            case Kind::Uint:
                return fmt::format_to( out, "{}", *value.as_uint ( ) );
            case Kind::Float:
                return fmt::format_to( out, "{}", *value.as_float ( ) );
            case Kind::Boolean:
                return fmt::format_to( out, "{}", *value.as_boolean ( ) );
            case Kind::String:
                return fmt::format_to( out, "\"{}\"", *value.as_string ( ) );
            case Kind::Binary:
                return render_hex( fmt::format_to( out, "bin:" ), *value.as_binary ( ) );
            case Kind::Extension:
                {
                    const auto &extension = *value.as_extension ( );

                    out = fmt::format_to( out, "ext:{}:", static_cast< int >( extension.type_id ) );

                    return render_hex( out, extension.value );
                }
            case Kind::Array:
                {
                    out = fmt::format_to( out, "[" );

                    bool first = true;

                    for ( const auto &element : *value.as_array ( ) )
                    {
                        if ( !first )
                            out = fmt::format_to( out, ", " );

                        first = false;
                        out = render_to( out, element );
                    }

                    return fmt::format_to( out, "]" );
                }
            case Kind::Map:
                {
                    out = fmt::format_to( out, "{{" );

                    bool first = true;

                    for ( const auto &entry : *value.as_map ( ) )
                    {
                        if ( !first )
                            out = fmt::format_to( out, ", " );

                        first = false;
                        out = render_to( out, entry.key );
                        out = fmt::format_to( out, ": " );
                        out = render_to( out, entry.value );
                    }

                    return fmt::format_to( out, "}}" );
                }
            }

            return out;
        }
    }

    /**
     * @brief Render `value` for humans: logs, test failure output, debugging.
     * @param value Value to render
     * @return std::string
     */
    inline std::string render( const Value &value )
    {
        fmt::memory_buffer buffer;
        detail::render_to( std::back_inserter( buffer ), value );

        return fmt::to_string( buffer );
    }

    inline std::string message( const ParseError &error )
    {
        return fmt::format( "MsgPack parse error at byte {}", error.byte );
    }

    inline std::string message( const ConversionError &error )
    {
        return fmt::format(
            "MsgPack conversion error: cannot use {} as {}",
            kind_name( error.original.kind ( ) ),
            error.attempted
        );
    }

    inline std::ostream &operator<<( std::ostream &os, const Value &value )
    {
        return os << render( value );
    }

    inline std::ostream &operator<<( std::ostream &os, const ParseError &error )
    {
        return os << message( error );
    }

    inline std::ostream &operator<<( std::ostream &os, const ConversionError &error )
    {
        return os << message( error );
    }
}

template < >
struct fmt::formatter< mpv::Value >
{
    constexpr auto parse( fmt::format_parse_context &ctx ) -> decltype( ctx.begin ( ) )
    {
        return ctx.begin ( );
    }

    template < typename FormatContext >
    auto format( const mpv::Value &value, FormatContext &ctx ) const -> decltype( ctx.out ( ) )
    {
        return mpv::detail::render_to( ctx.out ( ), value );
    }
};

template < >
struct fmt::formatter< mpv::ParseError > : fmt::formatter< std::string_view >
{
    template < typename FormatContext >
    auto format( const mpv::ParseError &error, FormatContext &ctx ) -> decltype( ctx.out ( ) )
    {
        return fmt::formatter< std::string_view >::format( mpv::message( error ), ctx );
    }
};

template < >
struct fmt::formatter< mpv::ConversionError > : fmt::formatter< std::string_view >
{
    template < typename FormatContext >
    auto format( const mpv::ConversionError &error, FormatContext &ctx ) -> decltype( ctx.out ( ) )
    {
        return fmt::formatter< std::string_view >::format( mpv::message( error ), ctx );
    }
};
