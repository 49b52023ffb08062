#pragma once

#include <string>

#include "stream.hpp"
#include "types.hpp"
#include "value.hpp"

namespace mpv
{
    /**
     * @brief Writes MessagePack into a caller owned byte vector.
     * @note Every writer is opportunistic and always picks the smallest representation able
     * to hold the value or length, except for floats, which are always written as float64,
     * and unsigned integers, which never use the fixint form so they decode back as `Uint`.
     */
    class Encoder
    {
        stream::ByteWriter wr_;

    public:
        explicit Encoder( Bytes &buffer )
            : wr_( buffer )
        {
        }

        Encoder &write_nil( )
        {
            wr_.write_marker( Marker::Nil );
            return *this;
        }

        /**
         * @brief Write `true` or `false` to the stream depending on `value`.
         * @param value Boolean value to write
         * @return Encoder&
         */
        Encoder &write_boolean( const bool value )
        {
            wr_.write_marker( value ? Marker::True : Marker::False );
            return *this;
        }

        /**
         * @brief Write a signed integer using the smallest of fixint, int8, int16, int32 and int64.
         * @param value Integer value to write
         * @return Encoder&
         */
        Encoder &write_int( const mp_i64 value )
        {
            if ( value >= 0 && value <= value_limits::PosFixIntMax )
            {
                wr_.write_u8( static_cast< mp_u8 >( value ) );
            }
            else if ( value < 0 && value >= value_limits::NegFixIntMin )
            {
                wr_.write_i8( static_cast< mp_i8 >( value ) );
            }
            else if ( value >= limits::int8_min && value <= limits::int8_max )
            {
                wr_.write_marker( Marker::Int8 ).write_i8( static_cast< mp_i8 >( value ) );
            }
            else if ( value >= limits::int16_min && value <= limits::int16_max )
            {
                wr_.write_marker( Marker::Int16 ).write_i16( static_cast< mp_i16 >( value ) );
            }
            else if ( value >= limits::int32_min && value <= limits::int32_max )
            {
                wr_.write_marker( Marker::Int32 ).write_i32( static_cast< mp_i32 >( value ) );
            }
            else
            {
                wr_.write_marker( Marker::Int64 ).write_i64( value );
            }

            return *this;
        }

        /**
         * @brief Write an unsigned integer using the smallest of uint8, uint16, uint32 and uint64.
         * @param value Integer value to write
         * @return Encoder&
         */
        Encoder &write_uint( const mp_u64 value )
        {
            if ( value <= limits::uint8_max )
                wr_.write_marker( Marker::Uint8 ).write_u8( static_cast< mp_u8 >( value ) );
            else if ( value <= limits::uint16_max )
                wr_.write_marker( Marker::Uint16 ).write_u16( static_cast< mp_u16 >( value ) );
            else if ( value <= limits::uint32_max )
                wr_.write_marker( Marker::Uint32 ).write_u32( static_cast< mp_u32 >( value ) );
            else
                wr_.write_marker( Marker::Uint64 ).write_u64( value );

            return *this;
        }

        Encoder &write_float( const double value )
        {
            wr_.write_marker( Marker::Float64 ).write_u64( stream::detail::bit_cast< mp_u64 >( value ) );
            return *this;
        }

        /**
         * @brief Write a UTF-8 string of `length` bytes as fixstr, str8, str16 or str32.
         * @param string Pointer to `length` bytes of UTF-8
         * @param length Size, in bytes, of the string in memory
         * @return Encoder&
         */
        Encoder &write_str( const char *string, const std::size_t length )
        {
            wr_.reserve( length + 5 );

            if ( length <= value_limits::FixStrMax )
            {
                wr_.write_u8( marker_byte( Marker::FixStr ) | static_cast< mp_u8 >( length ) );
            }
            else if ( length <= limits::uint8_max )
            {
                wr_.write_marker( Marker::Str8 ).write_u8( static_cast< mp_u8 >( length ) );
            }
            else if ( length <= limits::uint16_max )
            {
                wr_.write_marker( Marker::Str16 ).write_u16( static_cast< mp_u16 >( length ) );
            }
            else
            {
                wr_.write_marker( Marker::Str32 ).write_u32( static_cast< mp_u32 >( length ) );
            }

            wr_.write( length, reinterpret_cast< const mp_u8* >( string ) );

            return *this;
        }

        /**
         * @brief Write a byte array of `count` bytes as bin8, bin16 or bin32.
         * @param bytes Pointer to a byte array of `count` bytes
         * @param count Size, in bytes, of the byte array
         * @return Encoder&
         */
        Encoder &write_bin( const mp_u8 *bytes, const std::size_t count )
        {
            wr_.reserve( count + 5 );

            if ( count <= limits::uint8_max )
                wr_.write_marker( Marker::Bin8 ).write_u8( static_cast< mp_u8 >( count ) );
            else if ( count <= limits::uint16_max )
                wr_.write_marker( Marker::Bin16 ).write_u16( static_cast< mp_u16 >( count ) );
            else
                wr_.write_marker( Marker::Bin32 ).write_u32( static_cast< mp_u32 >( count ) );

            wr_.write( count, bytes );

            return *this;
        }

        /**
         * @brief Write an extension payload. Payloads of exactly 1, 2, 4, 8 or 16 bytes use the
         * matching fixext tag; anything else uses ext8, ext16 or ext32.
         * @param type_id Application defined type of the payload
         * @param bytes Pointer to `count` payload bytes
         * @param count Size, in bytes, of the payload
         * @return Encoder&
         */
        Encoder &write_ext( const mp_i8 type_id, const mp_u8 *bytes, const std::size_t count )
        {
            wr_.reserve( count + 6 );

            switch ( count )
            {
            case 1:
                wr_.write_marker( Marker::FixExt1 );
                break;
            case 2:
                wr_.write_marker( Marker::FixExt2 );
                break;
            case 4:
                wr_.write_marker( Marker::FixExt4 );
                break;
            case 8:
                wr_.write_marker( Marker::FixExt8 );
                break;
            case 16:
                wr_.write_marker( Marker::FixExt16 );
                break;
            default:
                {
                    if ( count <= limits::uint8_max )
                        wr_.write_marker( Marker::Ext8 ).write_u8( static_cast< mp_u8 >( count ) );
                    else if ( count <= limits::uint16_max )
                        wr_.write_marker( Marker::Ext16 ).write_u16( static_cast< mp_u16 >( count ) );
                    else
                        wr_.write_marker( Marker::Ext32 ).write_u32( static_cast< mp_u32 >( count ) );

                    break;
                }
            }

            wr_.write_i8( type_id ).write( count, bytes );

            return *this;
        }

        /**
         * @brief Mark the start of an array of `num_elem` values. Write the elements afterwards.
         * @param num_elem Number of elements in the array
         * @return Encoder&
         */
        Encoder &start_array( const std::size_t num_elem )
        {
            if ( num_elem <= value_limits::FixArrayMax )
                wr_.write_u8( marker_byte( Marker::FixArray ) | static_cast< mp_u8 >( num_elem ) );
            else if ( num_elem <= limits::uint16_max )
                wr_.write_marker( Marker::Array16 ).write_u16( static_cast< mp_u16 >( num_elem ) );
            else
                wr_.write_marker( Marker::Array32 ).write_u32( static_cast< mp_u32 >( num_elem ) );

            return *this;
        }

        /**
         * @brief Mark the start of a map of `num_pairs` entries. Write key, value, key, value... afterwards.
         * @param num_pairs Number of key-value pairs in this map. Both keys and values can be any MessagePack type.
         * @return Encoder&
         */
        Encoder &start_map( const std::size_t num_pairs )
        {
            if ( num_pairs <= value_limits::FixMapMax )
                wr_.write_u8( marker_byte( Marker::FixMap ) | static_cast< mp_u8 >( num_pairs ) );
            else if ( num_pairs <= limits::uint16_max )
                wr_.write_marker( Marker::Map16 ).write_u16( static_cast< mp_u16 >( num_pairs ) );
            else
                wr_.write_marker( Marker::Map32 ).write_u32( static_cast< mp_u32 >( num_pairs ) );

            return *this;
        }

        /**
         * @brief Write `value` and, recursively, everything it contains.
         * @param value Value to encode
         * @return Encoder&
         */
        Encoder &write_value( const Value &value )
        {
            switch ( value.kind ( ) )
            {
            case Kind::Nil:
                return write_nil ( );
            case Kind::Int:
                return write_int( *value.as_int ( ) );
            case Kind::Uint:
                return write_uint( *value.as_uint ( ) );
            case Kind::Float:
                return write_float( *value.as_float ( ) );
            case Kind::Boolean:
                return write_boolean( *value.as_boolean ( ) );
            case Kind::String:
                {
                    const auto &string = *value.as_string ( );
                    return write_str( string.data ( ), string.size ( ) );
                }
            case Kind::Binary:
                {
                    const auto &bytes = *value.as_binary ( );
                    return write_bin( bytes.data ( ), bytes.size ( ) );
                }
            case Kind::Extension:
                {
                    const auto &extension = *value.as_extension ( );
                    return write_ext( extension.type_id, extension.value.data ( ), extension.value.size ( ) );
                }
            case Kind::Array:
                {
                    const auto &elements = *value.as_array ( );

                    start_array( elements.size ( ) );

                    for ( const auto &element : elements )
                        write_value( element );

                    return *this;
                }
            case Kind::Map:
                {
                    const auto &entries = *value.as_map ( );

                    start_map( entries.size ( ) );

                    for ( const auto &entry : entries )
                        write_value( entry.key ).write_value( entry.value );

                    return *this;
                }
            }

            return *this;
        }
    };

    /**
     * @brief Append the encoding of `value` to `buffer`.
     * @param value Value to encode
     * @param buffer Output buffer; existing contents are kept
     */
    inline void encode_into( const Value &value, Bytes &buffer )
    {
        Encoder( buffer ).write_value( value );
    }

    inline Bytes encode( const Value &value )
    {
        Bytes buffer { };
        encode_into( value, buffer );

        return buffer;
    }
}
