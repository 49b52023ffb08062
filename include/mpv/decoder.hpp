#pragma once

#include <algorithm>
#include <string>
#include <string_view>
#include <utility>

#include "error.hpp"
#include "log.hpp"
#include "result.hpp"
#include "stream.hpp"
#include "types.hpp"
#include "value.hpp"

namespace mpv
{
    struct DecodeOptions
    {
        /**
         * @brief Maximum container nesting accepted. A top-level array or map is at depth 1.
         * Zero accepts any depth; the wire format itself sets no limit.
         */
        mp_u32 max_depth { MPV_DEFAULT_MAX_DEPTH };
    };

    /**
     * @brief A decoded top-level value and the number of bytes it occupied.
     */
    struct Decoded
    {
        Value value { };
        std::size_t size { 0 };
    };

    namespace detail
    {
        /**
         * @brief Strict UTF-8 validation: rejects overlong forms, surrogates, code points above
         * U+10FFFF and truncated sequences.
         * @param data Bytes to validate
         * @param size Number of bytes in `data`
         * @return bool
         */
        inline bool is_valid_utf8( const mp_u8 *data, const std::size_t size )
        {
            std::size_t index = 0;

            while ( index < size )
            {
                const auto lead = data[ index ];

                if ( lead < 0x80 )
                {
                    index++;
                    continue;
                }

                std::size_t trailing = 0;
                mp_u8 low = 0x80;
                mp_u8 high = 0xbf;

                if ( lead >= 0xc2 && lead <= 0xdf )
                {
                    trailing = 1;
                }
                else if ( lead >= 0xe0 && lead <= 0xef )
                {
                    trailing = 2;

                    if ( lead == 0xe0 )
                        low = 0xa0;     // overlong
                    else if ( lead == 0xed )
                        high = 0x9f;    // surrogates
                }
                else if ( lead >= 0xf0 && lead <= 0xf4 )
                {
                    trailing = 3;

                    if ( lead == 0xf0 )
                        low = 0x90;     // overlong
                    else if ( lead == 0xf4 )
                        high = 0x8f;    // above U+10FFFF
                }
                else
                {
                    return false;
                }

                if ( size - index <= trailing )
                    return false;

                const auto second = data[ index + 1 ];

                if ( second < low || second > high )
                    return false;

                for ( std::size_t n = 2; n <= trailing; n++ )
                {
                    if ( ( data[ index + n ] & 0xc0 ) != 0x80 )
                        return false;
                }

                index += trailing + 1;
            }

            return true;
        }

        /**
         * @brief Recursive-descent MessagePack reader.
         *
         * Every call works on its own slice and reports errors relative to that slice; the
         * enclosing call shifts nested errors by the bytes it consumed before the nested
         * value, so the error returned from the outermost call is relative to the input.
         */
        class Decoder
        {
            DecodeOptions options_;

        public:
            explicit Decoder( const DecodeOptions &options )
                : options_( options )
            {
            }

            /**
             * @brief Decode exactly one value from the start of `data`.
             * @param data Start of the slice
             * @param size Size, in bytes, of the slice
             * @param depth Number of containers enclosing this value
             * @return The value and its encoded size, or the offset of the failure within the slice
             */
            Result< Decoded, ParseError > decode_value( const mp_u8 *data, const std::size_t size, const mp_u32 depth ) const
            {
                stream::ByteReader sr( data, size );

                if ( !sr.has( 1 ) )
                {
                    MPV_LOG_TRACE( "no bytes left for a value at depth {}", depth );
                    return ParseError { 0 };
                }

                auto result = _decode_body( sr, sr.read_u8 ( ), depth );

                if ( !result )
                    return std::move( result ).error ( );

                return Decoded { std::move( result ).value ( ), sr.position ( ) };
            }

        private:
            /**
             * @brief Dispatch on the tag byte `raw`, already consumed from `sr`.
             */
            Result< Value, ParseError > _decode_body( stream::ByteReader &sr, const mp_u8 raw, const mp_u32 depth ) const
            {
                /*
                 * Start with the families whose low bits carry the value or length.
                 */

                if ( raw <= 0x7f )
                    return Value::integer( raw );

                if ( raw >= marker_byte( Marker::NegFixInt ) )
                    return Value::integer( static_cast< mp_i64 >( raw ) - 0x100 );

                if ( raw < marker_byte( Marker::FixArray ) )
                    return _decode_map( sr, raw & 0x0f, depth );

                if ( raw < marker_byte( Marker::FixStr ) )
                    return _decode_array( sr, raw & 0x0f, depth );

                if ( raw < marker_byte( Marker::Nil ) )
                    return _decode_str( sr, raw, raw & 0x1f );

                switch ( static_cast< Marker >( raw ) )
                {
                case Marker::Nil:
                    return Value::nil ( );
                case Marker::False:
                    return Value::boolean( false );
                case Marker::True:
                    return Value::boolean( true );
                case Marker::Bin8:
                    return _decode_bin( sr, raw, sizeof( mp_u8 ) );
                case Marker::Bin16:
                    return _decode_bin( sr, raw, sizeof( mp_u16 ) );
                case Marker::Bin32:
                    return _decode_bin( sr, raw, sizeof( mp_u32 ) );
                case Marker::Ext8:
                    return _decode_ext( sr, raw, sizeof( mp_u8 ) );
                case Marker::Ext16:
                    return _decode_ext( sr, raw, sizeof( mp_u16 ) );
                case Marker::Ext32:
                    return _decode_ext( sr, raw, sizeof( mp_u32 ) );
                case Marker::Float32:
                    {
                        if ( !sr.has( sizeof( mp_u32 ) ) )
                            return _truncated( sr, raw );

                        const auto single = stream::detail::bit_cast< float >( sr.read_u32 ( ) );

                        return Value::floating( static_cast< double >( single ) );
                    }
                case Marker::Float64:
                    {
                        if ( !sr.has( sizeof( mp_u64 ) ) )
                            return _truncated( sr, raw );

                        return Value::floating( stream::detail::bit_cast< double >( sr.read_u64 ( ) ) );
                    }
                case Marker::Uint8:
                    {
                        if ( !sr.has( sizeof( mp_u8 ) ) )
                            return _truncated( sr, raw );

                        return Value::uint( sr.read_u8 ( ) );
                    }
                case Marker::Uint16:
                    {
                        if ( !sr.has( sizeof( mp_u16 ) ) )
                            return _truncated( sr, raw );

                        return Value::uint( sr.read_u16 ( ) );
                    }
                case Marker::Uint32:
                    {
                        if ( !sr.has( sizeof( mp_u32 ) ) )
                            return _truncated( sr, raw );

                        return Value::uint( sr.read_u32 ( ) );
                    }
                case Marker::Uint64:
                    {
                        if ( !sr.has( sizeof( mp_u64 ) ) )
                            return _truncated( sr, raw );

                        return Value::uint( sr.read_u64 ( ) );
                    }
                case Marker::Int8:
                    {
                        if ( !sr.has( sizeof( mp_i8 ) ) )
                            return _truncated( sr, raw );

                        return Value::integer( sr.read_i8 ( ) );
                    }
                case Marker::Int16:
                    {
                        if ( !sr.has( sizeof( mp_i16 ) ) )
                            return _truncated( sr, raw );

                        return Value::integer( sr.read_i16 ( ) );
                    }
                case Marker::Int32:
                    {
                        if ( !sr.has( sizeof( mp_i32 ) ) )
                            return _truncated( sr, raw );

                        return Value::integer( sr.read_i32 ( ) );
                    }
                case Marker::Int64:
                    {
                        if ( !sr.has( sizeof( mp_i64 ) ) )
                            return _truncated( sr, raw );

                        return Value::integer( sr.read_i64 ( ) );
                    }
                case Marker::FixExt1:
                    return _decode_fixext( sr, raw, 1 );
                case Marker::FixExt2:
                    return _decode_fixext( sr, raw, 2 );
                case Marker::FixExt4:
                    return _decode_fixext( sr, raw, 4 );
                case Marker::FixExt8:
                    return _decode_fixext( sr, raw, 8 );
                case Marker::FixExt16:
                    return _decode_fixext( sr, raw, 16 );
                case Marker::Str8:
                case Marker::Str16:
                case Marker::Str32:
                    {
                        const auto width = _length_width( raw, Marker::Str8 );

                        if ( !sr.has( width ) )
                            return _truncated( sr, raw );

                        return _decode_str( sr, raw, _read_length( sr, width ) );
                    }
                case Marker::Array16:
                case Marker::Array32:
                    {
                        const auto width = raw == marker_byte( Marker::Array16 ) ? sizeof( mp_u16 ) : sizeof( mp_u32 );

                        if ( !sr.has( width ) )
                            return _truncated( sr, raw );

                        return _decode_array( sr, _read_length( sr, width ), depth );
                    }
                case Marker::Map16:
                case Marker::Map32:
                    {
                        const auto width = raw == marker_byte( Marker::Map16 ) ? sizeof( mp_u16 ) : sizeof( mp_u32 );

                        if ( !sr.has( width ) )
                            return _truncated( sr, raw );

                        return _decode_map( sr, _read_length( sr, width ), depth );
                    }
                case Marker::Unused:
                default:
                    break;
                }

                MPV_LOG_TRACE( "reserved tag {:#04x}", raw );

                return ParseError { 0 };
            }

            /**
             * @brief Width, in bytes, of the length field of the 8/16/32 family starting at `first`.
             */
            static std::size_t _length_width( const mp_u8 raw, const Marker first )
            {
                const auto step = raw - marker_byte( first );

                return step == 0 ? sizeof( mp_u8 ) : step == 1 ? sizeof( mp_u16 ) : sizeof( mp_u32 );
            }

            /**
             * @brief Read a big-endian length field of `width` bytes. The caller checks bounds.
             */
            static std::size_t _read_length( stream::ByteReader &sr, const std::size_t width )
            {
                switch ( width )
                {
                case sizeof( mp_u8 ):
                    return sr.read_u8 ( );
                case sizeof( mp_u16 ):
                    return sr.read_u16 ( );
                default:
                    return sr.read_u32 ( );
                }
            }

            /**
             * @brief Failure at the cursor: the next field of the value tagged `raw` is missing.
             */
            static ParseError _truncated( const stream::ByteReader &sr, const mp_u8 raw )
            {
                MPV_LOG_TRACE( "value tagged {:#04x} truncated at relative byte {}", raw, sr.position ( ) );

                return ParseError { sr.position ( ) };
            }

            Result< Value, ParseError > _decode_bin( stream::ByteReader &sr, const mp_u8 raw, const std::size_t width ) const
            {
                if ( !sr.has( width ) )
                    return _truncated( sr, raw );

                const auto length = _read_length( sr, width );

                if ( !sr.has( length ) )
                    return _truncated( sr, raw );

                return Value::binary( sr.read_bytes( length ) );
            }

            Result< Value, ParseError > _decode_str( stream::ByteReader &sr, const mp_u8 raw, const std::size_t length ) const
            {
                if ( !sr.has( length ) )
                    return _truncated( sr, raw );

                if ( !is_valid_utf8( sr.cursor ( ), length ) )
                {
                    MPV_LOG_TRACE( "invalid UTF-8 in string of {} bytes", length );
                    return ParseError { sr.position ( ) };
                }

                return Value::string( sr.read_string( length ) );
            }

            /**
             * @brief ext 8/16/32: length field, then the type byte, then the payload.
             */
            Result< Value, ParseError > _decode_ext( stream::ByteReader &sr, const mp_u8 raw, const std::size_t width ) const
            {
                if ( !sr.has( width + sizeof( mp_i8 ) ) )
                    return _truncated( sr, raw );

                const auto length = _read_length( sr, width );
                const auto type_id = sr.read_i8 ( );

                if ( !sr.has( length ) )
                    return _truncated( sr, raw );

                return Value::extension( type_id, sr.read_bytes( length ) );
            }

            /**
             * @brief fixext 1/2/4/8/16: the type byte, then exactly `length` payload bytes.
             */
            Result< Value, ParseError > _decode_fixext( stream::ByteReader &sr, const mp_u8 raw, const std::size_t length ) const
            {
                if ( !sr.has( sizeof( mp_i8 ) + length ) )
                    return _truncated( sr, raw );

                const auto type_id = sr.read_i8 ( );

                return Value::extension( type_id, sr.read_bytes( length ) );
            }

            /**
             * @brief Decode `count` consecutive values starting at the cursor of `sr`.
             */
            Result< Array, ParseError > _decode_sequence( stream::ByteReader &sr, const std::size_t count, const mp_u32 depth ) const
            {
                Array elements { };

                /* every element takes at least one byte, so a bogus count cannot over-allocate */
                elements.reserve( std::min( count, sr.remaining ( ) ) );

                for ( std::size_t index = 0; index < count; index++ )
                {
                    auto element = decode_value( sr.cursor ( ), sr.remaining ( ), depth );

                    if ( !element )
                        return element.error ( ).offset( sr.position ( ) );

                    sr.skip( element->size );
                    elements.push_back( std::move( element->value ) );
                }

                return elements;
            }

            /**
             * @brief Check the nesting limit before entering a container. The failure points at
             * the container tag.
             */
            bool _too_deep( const mp_u32 depth ) const
            {
                return options_.max_depth != 0 && depth >= options_.max_depth;
            }

            Result< Value, ParseError > _decode_array( stream::ByteReader &sr, const std::size_t count, const mp_u32 depth ) const
            {
                if ( _too_deep( depth ) )
                {
                    MPV_LOG_TRACE( "array nesting exceeds {}", options_.max_depth );
                    return ParseError { 0 };
                }

                MPV_LOG_TRACE( "array of {} elements at depth {}", count, depth + 1 );

                auto elements = _decode_sequence( sr, count, depth + 1 );

                if ( !elements )
                    return std::move( elements ).error ( );

                return Value::array( std::move( elements ).value ( ) );
            }

            /**
             * @brief A map is `2 * count` consecutive values paired positionally: entry i is
             * ( value[ 2i ], value[ 2i + 1 ] ). Keys are neither sorted nor deduplicated.
             */
            Result< Value, ParseError > _decode_map( stream::ByteReader &sr, const std::size_t count, const mp_u32 depth ) const
            {
                if ( _too_deep( depth ) )
                {
                    MPV_LOG_TRACE( "map nesting exceeds {}", options_.max_depth );
                    return ParseError { 0 };
                }

                MPV_LOG_TRACE( "map of {} entries at depth {}", count, depth + 1 );

                auto elements = _decode_sequence( sr, count * 2, depth + 1 );

                if ( !elements )
                    return std::move( elements ).error ( );

                auto &flat = elements.value ( );

                Map entries { };
                entries.reserve( count );

                for ( std::size_t index = 0; index + 1 < flat.size ( ); index += 2 )
                    entries.push_back( MapEntry { std::move( flat[ index ] ), std::move( flat[ index + 1 ] ) } );

                return Value::map( std::move( entries ) );
            }
        };
    }

    /**
     * @brief Decode exactly one value from the start of `data`. Bytes after it are left alone,
     * so a value embedded in a larger buffer can be decoded in place.
     * @param data Pointer to at least `size` bytes
     * @param size Size, in bytes, of `data`
     * @param options Decoding limits
     * @return The value and the number of bytes it occupied, or a `ParseError` whose `byte` is relative to `data`
     */
    inline Result< Decoded, ParseError > decode( const mp_u8 *data, const std::size_t size, const DecodeOptions &options = { } )
    {
        auto result = detail::Decoder( options ).decode_value( data, size, 0 );

        if ( !result )
            MPV_LOG_DEBUG( "decode of {} bytes failed at byte {}", size, result.error ( ).byte );

        return result;
    }

    inline Result< Decoded, ParseError > decode( const Bytes &buffer, const DecodeOptions &options = { } )
    {
        return decode( buffer.data ( ), buffer.size ( ), options );
    }

    inline Result< Decoded, ParseError > decode( const std::string_view buffer, const DecodeOptions &options = { } )
    {
        return decode( reinterpret_cast< const mp_u8* >( buffer.data ( ) ), buffer.size ( ), options );
    }

    /**
     * @brief Same as `decode`, without the consumed length.
     */
    inline Result< Value, ParseError > parse( const mp_u8 *data, const std::size_t size, const DecodeOptions &options = { } )
    {
        auto result = decode( data, size, options );

        if ( !result )
            return std::move( result ).error ( );

        return std::move( result.value ( ).value );
    }

    inline Result< Value, ParseError > parse( const Bytes &buffer, const DecodeOptions &options = { } )
    {
        return parse( buffer.data ( ), buffer.size ( ), options );
    }

    inline Result< Value, ParseError > parse( const std::string_view buffer, const DecodeOptions &options = { } )
    {
        return parse( reinterpret_cast< const mp_u8* >( buffer.data ( ) ), buffer.size ( ), options );
    }
}
