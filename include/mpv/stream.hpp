#pragma once

#include <cstring>
#include <string>
#include <vector>

#include "types.hpp"

#if defined(__BYTE_ORDER__) && defined(__ORDER_BIG_ENDIAN__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
#define MPV_NATIVE_BIG_ENDIAN 1
#endif

/*
 * Note: `ByteReader` never takes ownership of the underlying memory. The slice handed
 * to it must outlive the reader. `ByteWriter` appends into a caller owned vector.
 *
 *  Notes:
 *      1) Not thread safe. Each decode/encode call owns its own stream object;
 *      2) Reads past the end return zero and leave the cursor untouched. Callers that need
 *         to distinguish a short buffer check `has( )` first.
 */

namespace mpv
{
    using Bytes = std::vector< mp_u8 >;
}

namespace mpv::stream
{
    namespace detail
    {
        template < typename Ty >
        Ty from_big_endian( Ty value )
        {
#ifdef MPV_NATIVE_BIG_ENDIAN
            return value;
#else
            if constexpr ( sizeof( Ty ) == 2 )
                return static_cast< Ty >( MPV_BSWAP16( static_cast< mp_u16 >( value ) ) );
            else if constexpr ( sizeof( Ty ) == 4 )
                return static_cast< Ty >( MPV_BSWAP32( static_cast< mp_u32 >( value ) ) );
            else if constexpr ( sizeof( Ty ) == 8 )
                return static_cast< Ty >( MPV_BSWAP64( static_cast< mp_u64 >( value ) ) );
            else
                return value;
#endif
        }

        /**
         * @brief Reinterpret the bits of `from` as a `To` of the same size, e.g. a raw IEEE-754
         * pattern read from the wire as a float.
         */
        template < typename To, typename From >
        To bit_cast( const From &from )
        {
            static_assert( sizeof( To ) == sizeof( From ), "bit_cast requires equally sized types." );

            To to { };
            std::memcpy( &to, &from, sizeof( To ) );

            return to;
        }

        template < typename Ty >
        Ty to_big_endian( Ty value )
        {
            /* byte swapping is its own inverse */
            return from_big_endian< Ty >( value );
        }
    }

    struct ByteReader
    {
    private:
        const mp_u8 *buffer_ { nullptr };
        std::size_t stream_size_ { 0 };
        std::size_t position_ { 0 };

    public:
        ByteReader( ) = default;

        ByteReader( const mp_u8 *buffer, const std::size_t stream_size, const std::size_t position = 0 )
            : buffer_( buffer ), stream_size_( stream_size ), position_( position )
        {
        }

        /* Disallow copies. */
        ByteReader( const ByteReader &other ) = delete;
        ByteReader &operator=( const ByteReader &other ) = delete;

        /**
         * @brief Current cursor position, relative to the start of the slice.
         * @return std::size_t
         */
        std::size_t position( ) const
        {
            return position_;
        }

        /**
         * @brief Total size of the slice. Does not take into account the current cursor position.
         * @return std::size_t
         */
        std::size_t stream_size( ) const
        {
            return stream_size_;
        }

        /**
         * @brief Number of bytes between the cursor and the end of the slice.
         * @return std::size_t
         */
        std::size_t remaining( ) const
        {
            return stream_size_ - position_;
        }

        /**
         * @brief Check whether at least `count` bytes can be read from the cursor.
         * @param count Number of bytes the caller is about to consume
         * @return bool
         */
        bool has( const std::size_t count ) const
        {
            return count <= remaining ( );
        }

        /**
         * @brief Address of the byte under the cursor.
         * @return const mp_u8 *
         */
        const mp_u8 *cursor( ) const
        {
            return buffer_ + position_;
        }

        /**
         * @brief Move the cursor forward by `count` bytes, clamped to the end of the slice.
         * @param count Number of bytes to skip
         */
        void skip( const std::size_t count )
        {
            position_ += has( count ) ? count : remaining ( );
        }

    private:
        /**
         * @brief Copies `count` bytes from the slice into `dst` and advances the cursor.
         * @param count Number of bytes to read.
         * @param dst Buffer of at least `count` bytes to copy into.
         * @param peek Read without advancing the cursor
         * @return `false` if the slice does not hold `count` more bytes
         */
        bool _read_and_advance( const std::size_t count, mp_u8 *dst, const bool peek = false )
        {
            if ( !count || !dst || !buffer_ || !has( count ) )
                return false;

            std::memcpy( dst, cursor ( ), count );

            if ( !peek )
                position_ += count;

            return true;
        }

        /**
         * @brief Read a big-endian plain old data value from the slice.
         * @tparam Ty One of `mp_i8`, `mp_u8`, `mp_i16`, `mp_u16`, `mp_i32`, `mp_u32`, `mp_i64` and `mp_u64`
         * @param peek Read the data without advancing the cursor
         * @return Ty in host byte order, or zero past the end of the slice
         */
        template < typename Ty >
        Ty _read_pod( const bool peek = false )
        {
            Ty pod { };

            if ( !_read_and_advance( sizeof( Ty ), reinterpret_cast< mp_u8* >( &pod ), peek ) )
                return Ty { };

            return detail::from_big_endian< Ty >( pod );
        }

    public:
        mp_u8 read_u8( )
        {
            return _read_pod< mp_u8 > ( );
        }

        mp_i8 read_i8( )
        {
            return _read_pod< mp_i8 > ( );
        }

        /**
         * @brief Read an unsigned 2 byte big-endian value and advance the cursor by 2 bytes.
         * @return mp_u16
         */
        mp_u16 read_u16( )
        {
            return _read_pod< mp_u16 > ( );
        }

        /**
         * @brief Read a signed 2 byte big-endian value and advance the cursor by 2 bytes.
         * @return mp_i16
         */
        mp_i16 read_i16( )
        {
            return _read_pod< mp_i16 > ( );
        }

        /**
         * @brief Read an unsigned 4 byte big-endian value and advance the cursor by 4 bytes.
         * @return mp_u32
         */
        mp_u32 read_u32( )
        {
            return _read_pod< mp_u32 > ( );
        }

        /**
         * @brief Read a signed 4 byte big-endian value and advance the cursor by 4 bytes.
         * @return mp_i32
         */
        mp_i32 read_i32( )
        {
            return _read_pod< mp_i32 > ( );
        }

        /**
         * @brief Read an unsigned 8 byte big-endian value and advance the cursor by 8 bytes.
         * @return mp_u64
         */
        mp_u64 read_u64( )
        {
            return _read_pod< mp_u64 > ( );
        }

        /**
         * @brief Read a signed 8 byte big-endian value and advance the cursor by 8 bytes.
         * @return mp_i64
         */
        mp_i64 read_i64( )
        {
            return _read_pod< mp_i64 > ( );
        }

        /**
         * @brief Read a byte without advancing the cursor.
         * @return mp_u8
         */
        mp_u8 peek_u8( )
        {
            return _read_pod< mp_u8 >( true );
        }

        /**
         * @brief Copy `count` bytes into a new byte vector and advance the cursor.
         * @param count Number of bytes to copy. Must satisfy `has( count )`.
         * @return Bytes
         */
        Bytes read_bytes( const std::size_t count )
        {
            if ( !has( count ) )
                return { };

            Bytes bytes( cursor ( ), cursor ( ) + count );
            position_ += count;

            return bytes;
        }

        /**
         * @brief Copy `count` bytes into a new string and advance the cursor.
         * @param count Number of bytes to copy. Must satisfy `has( count )`.
         * @return std::string
         */
        std::string read_string( const std::size_t count )
        {
            if ( !has( count ) )
                return { };

            std::string string( reinterpret_cast< const char* >( cursor ( ) ), count );
            position_ += count;

            return string;
        }
    };

    struct ByteWriter
    {
    private:
        Bytes &buffer_;

    public:
        explicit ByteWriter( Bytes &buffer )
            : buffer_( buffer )
        {
        }

        /* Disallow copies. */
        ByteWriter( const ByteWriter &other ) = delete;
        ByteWriter &operator=( const ByteWriter &other ) = delete;

        /**
         * @brief Number of bytes in the output buffer, including bytes written before this writer was attached.
         * @return std::size_t
         */
        std::size_t position( ) const
        {
            return buffer_.size ( );
        }

        /**
         * @brief Reserve room for `count` more bytes.
         * @param count Expected number of bytes still to be written
         */
        void reserve( const std::size_t count )
        {
            buffer_.reserve( buffer_.size ( ) + count );
        }

        /**
         * @brief Write a plain old data value in big-endian byte order.
         * @tparam Ty One of `mp_i8`, `mp_u8`, `mp_i16`, `mp_u16`, `mp_i32`, `mp_u32`, `mp_i64` and `mp_u64`
         * @param value Value to write, in host byte order
         */
        template < typename Ty >
        void write_pod( const Ty value )
        {
            const Ty pod { detail::to_big_endian< Ty >( value ) };
            const auto *bytes = reinterpret_cast< const mp_u8* >( &pod );

            buffer_.insert( buffer_.end ( ), bytes, bytes + sizeof( Ty ) );
        }

        ByteWriter &write_u8( const mp_u8 value )
        {
            buffer_.push_back( value );
            return *this;
        }

        ByteWriter &write_i8( const mp_i8 value )
        {
            buffer_.push_back( static_cast< mp_u8 >( value ) );
            return *this;
        }

        ByteWriter &write_u16( const mp_u16 value )
        {
            write_pod< mp_u16 >( value );
            return *this;
        }

        ByteWriter &write_i16( const mp_i16 value )
        {
            write_pod< mp_i16 >( value );
            return *this;
        }

        ByteWriter &write_u32( const mp_u32 value )
        {
            write_pod< mp_u32 >( value );
            return *this;
        }

        ByteWriter &write_i32( const mp_i32 value )
        {
            write_pod< mp_i32 >( value );
            return *this;
        }

        ByteWriter &write_u64( const mp_u64 value )
        {
            write_pod< mp_u64 >( value );
            return *this;
        }

        ByteWriter &write_i64( const mp_i64 value )
        {
            write_pod< mp_i64 >( value );
            return *this;
        }

        /**
         * @brief Append `count` bytes from `src`.
         * @param count Size, in bytes, of the data pointed to by `src`.
         * @param src Buffer containing at least `count` bytes.
         * @return ByteWriter&
         */
        ByteWriter &write( const std::size_t count, const mp_u8 *src )
        {
            if ( count && src )
                buffer_.insert( buffer_.end ( ), src, src + count );

            return *this;
        }

        ByteWriter &write_marker( const Marker marker )
        {
            return write_u8( marker_byte( marker ) );
        }
    };
}
