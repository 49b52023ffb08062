#include <cmath>
#include <limits>
#include <sstream>
#include <string>

#include "mpv/mpv.hpp"
#include "gtest/gtest.h"

namespace
{
    /**
     * @brief Common helpers for every fixture: encode a value, decode a buffer and report
     * the failing offset.
     */
    class CodecFixture : public testing::Test
    {
    protected:
        mpv::Bytes buffer { };

        mpv::Bytes encode( const mpv::Value &value )
        {
            buffer.clear ( );
            mpv::encode_into( value, buffer );

            return buffer;
        }

        mpv::Value decode_single( const mpv::Bytes &raw )
        {
            auto result = mpv::decode( raw );

            EXPECT_TRUE( result ) << "unexpected " << ( result ? "" : mpv::message( result.error ( ) ) );

            if ( !result )
                return mpv::Value::nil ( );

            EXPECT_LE( result->size, raw.size ( ) );

            return std::move( result ).value ( ).value;
        }

        std::size_t failing_byte( const mpv::Bytes &raw, const mpv::DecodeOptions &options = { } )
        {
            const auto result = mpv::decode( raw, options );

            EXPECT_FALSE( result ) << "decoded " << ( result ? mpv::render( result->value ) : "" );

            return result ? std::numeric_limits< std::size_t >::max ( ) : result.error ( ).byte;
        }

        void expect_round_trip( const mpv::Value &value )
        {
            const auto raw = encode( value );
            const auto result = mpv::decode( raw );

            ASSERT_TRUE( result ) << mpv::render( value );
            EXPECT_EQ( value, result->value );
            EXPECT_EQ( raw.size ( ), result->size );
        }
    };

    mpv::Bytes repeated( const std::size_t count, const mpv::mp_u8 byte )
    {
        return mpv::Bytes( count, byte );
    }

    mpv::Bytes concat( mpv::Bytes head, const mpv::Bytes &tail )
    {
        head.insert( head.end ( ), tail.begin ( ), tail.end ( ) );
        return head;
    }
}

namespace integers
{
    class IntegerFixture : public CodecFixture
    {
    };

    TEST_F( IntegerFixture, TestFixInt )
    {
        EXPECT_EQ( mpv::Bytes( { 0x2a } ), encode( mpv::Value::integer( 42 ) ) );
        EXPECT_EQ( mpv::Bytes( { 0x00 } ), encode( mpv::Value::integer( 0 ) ) );
        EXPECT_EQ( mpv::Bytes( { 0x7f } ), encode( mpv::Value::integer( 127 ) ) );
        EXPECT_EQ( mpv::Bytes( { 0xff } ), encode( mpv::Value::integer( -1 ) ) );
        EXPECT_EQ( mpv::Bytes( { 0xec } ), encode( mpv::Value::integer( -20 ) ) );
        EXPECT_EQ( mpv::Bytes( { 0xe0 } ), encode( mpv::Value::integer( -32 ) ) );

        EXPECT_EQ( mpv::Value::integer( 0x7f ), decode_single( { 0x7f } ) );
        EXPECT_EQ( mpv::Value::integer( -20 ), decode_single( { 0xec } ) );
        EXPECT_EQ( mpv::Value::integer( -32 ), decode_single( { 0xe0 } ) );
        EXPECT_EQ( mpv::Value::integer( -1 ), decode_single( { 0xff } ) );
    }

    TEST_F( IntegerFixture, Test8 )
    {
        EXPECT_EQ( mpv::Bytes( { 0xd0, 0xdf } ), encode( mpv::Value::integer( -33 ) ) );
        EXPECT_EQ( mpv::Bytes( { 0xd0, 0x80 } ), encode( mpv::Value::integer( -128 ) ) );
        EXPECT_EQ( mpv::Bytes( { 0xcc, 0x00 } ), encode( mpv::Value::uint( 0 ) ) );
        EXPECT_EQ( mpv::Bytes( { 0xcc, 0x0a } ), encode( mpv::Value::uint( 0xa ) ) );
        EXPECT_EQ( mpv::Bytes( { 0xcc, 0xff } ), encode( mpv::Value::uint( 0xff ) ) );

        EXPECT_EQ( mpv::Value::integer( -125 ), decode_single( { 0xd0, 0x83 } ) );
        EXPECT_EQ( mpv::Value::integer( -1 ), decode_single( { 0xd0, 0xff } ) );
        EXPECT_EQ( mpv::Value::integer( 5 ), decode_single( { 0xd0, 0x05 } ) );
        EXPECT_EQ( mpv::Value::uint( 0xa ), decode_single( { 0xcc, 0x0a } ) );
    }

    TEST_F( IntegerFixture, Test16 )
    {
        EXPECT_EQ( mpv::Bytes( { 0xd1, 0x00, 0x80 } ), encode( mpv::Value::integer( 128 ) ) );
        EXPECT_EQ( mpv::Bytes( { 0xd1, 0xff, 0x7f } ), encode( mpv::Value::integer( -129 ) ) );
        EXPECT_EQ( mpv::Bytes( { 0xd1, 0x7f, 0xff } ), encode( mpv::Value::integer( 32767 ) ) );
        EXPECT_EQ( mpv::Bytes( { 0xd1, 0x80, 0x00 } ), encode( mpv::Value::integer( -32768 ) ) );
        EXPECT_EQ( mpv::Bytes( { 0xcd, 0x01, 0x00 } ), encode( mpv::Value::uint( 0x100 ) ) );
        EXPECT_EQ( mpv::Bytes( { 0xcd, 0xff, 0xff } ), encode( mpv::Value::uint( 0xffff ) ) );

        EXPECT_EQ( mpv::Value::uint( 0xffff ), decode_single( { 0xcd, 0xff, 0xff } ) );
        EXPECT_EQ( mpv::Value::integer( -2 ), decode_single( { 0xd1, 0xff, 0xfe } ) );
    }

    TEST_F( IntegerFixture, Test32 )
    {
        EXPECT_EQ( mpv::Bytes( { 0xd2, 0x00, 0x00, 0x80, 0x00 } ), encode( mpv::Value::integer( 32768 ) ) );
        EXPECT_EQ( mpv::Bytes( { 0xd2, 0x80, 0x00, 0x00, 0x00 } ), encode( mpv::Value::integer( -2147483647LL - 1 ) ) );
        EXPECT_EQ( mpv::Bytes( { 0xce, 0x00, 0x01, 0x00, 0x00 } ), encode( mpv::Value::uint( 0x10000 ) ) );
        EXPECT_EQ( mpv::Bytes( { 0xce, 0xff, 0xff, 0xff, 0xff } ), encode( mpv::Value::uint( 0xffffffff ) ) );

        EXPECT_EQ( mpv::Value::uint( 0xffffffff ), decode_single( { 0xce, 0xff, 0xff, 0xff, 0xff } ) );
        EXPECT_EQ( mpv::Value::integer( -2 ), decode_single( { 0xd2, 0xff, 0xff, 0xff, 0xfe } ) );
        EXPECT_EQ( mpv::Value::integer( 0x424242 ), decode_single( { 0xd2, 0x00, 0x42, 0x42, 0x42 } ) );
    }

    TEST_F( IntegerFixture, Test64 )
    {
        EXPECT_EQ(
            mpv::Bytes( { 0xd3, 0x00, 0x00, 0x00, 0x00, 0x80, 0x00, 0x00, 0x00 } ),
            encode( mpv::Value::integer( 2147483648LL ) )
        );

        EXPECT_EQ(
            mpv::Bytes( { 0xd3, 0x80, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00 } ),
            encode( mpv::Value::integer( std::numeric_limits< mpv::mp_i64 >::min ( ) ) )
        );

        EXPECT_EQ(
            mpv::Bytes( { 0xcf, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00 } ),
            encode( mpv::Value::uint( 0x100000000ULL ) )
        );

        EXPECT_EQ(
            mpv::Value::uint( 0xffffffffffffffffULL ),
            decode_single( { 0xcf, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff } )
        );

        EXPECT_EQ(
            mpv::Value::integer( -2 ),
            decode_single( { 0xd3, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xfe } )
        );
    }

    TEST_F( IntegerFixture, SignednessSurvivesRoundTrip )
    {
        expect_round_trip( mpv::Value::uint( 5 ) );
        expect_round_trip( mpv::Value::integer( 5 ) );
        expect_round_trip( mpv::Value::uint( std::numeric_limits< mpv::mp_u64 >::max ( ) ) );
        expect_round_trip( mpv::Value::integer( std::numeric_limits< mpv::mp_i64 >::max ( ) ) );
        expect_round_trip( mpv::Value::integer( std::numeric_limits< mpv::mp_i64 >::min ( ) ) );

        EXPECT_NE( mpv::Value::uint( 5 ), mpv::Value::integer( 5 ) );
    }
}

namespace floats
{
    class FloatFixture : public CodecFixture
    {
    };

    TEST_F( FloatFixture, TestFloat64 )
    {
        const mpv::Bytes raw { 0xcb, 0x3f, 0xf6, 0xb8, 0x51, 0xeb, 0x85, 0x1e, 0xb8 };
        const auto result = mpv::decode( raw );

        ASSERT_TRUE( result );
        EXPECT_EQ( 9u, result->size );
        ASSERT_TRUE( result->value.is_float ( ) );
        EXPECT_EQ( 1.42, *result->value.as_float ( ) );
    }

    TEST_F( FloatFixture, TestFloat32IsPromoted )
    {
        const auto result = mpv::decode( mpv::Bytes { 0xca, 0x3f, 0xc0, 0x00, 0x00 } );

        ASSERT_TRUE( result );
        EXPECT_EQ( 5u, result->size );
        EXPECT_EQ( mpv::Value::floating( 1.5 ), result->value );

        /* 0.1f is not 0.1: promotion keeps the single precision value */
        EXPECT_EQ(
            mpv::Value::floating( static_cast< double >( 0.1f ) ),
            decode_single( { 0xca, 0x3d, 0xcc, 0xcc, 0xcd } )
        );
    }

    TEST_F( FloatFixture, AlwaysEncodesFloat64 )
    {
        EXPECT_EQ(
            mpv::Bytes( { 0xcb, 0x3f, 0xf8, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00 } ),
            encode( mpv::Value::floating( 1.5 ) )
        );

        EXPECT_EQ( 9u, encode( mpv::Value::floating( 0.0 ) ).size ( ) );

        expect_round_trip( mpv::Value::floating( -0.25 ) );
        expect_round_trip( mpv::Value::floating( 1.32 ) );
        expect_round_trip( mpv::Value::floating( std::numeric_limits< double >::infinity ( ) ) );
        expect_round_trip( mpv::Value::floating( std::numeric_limits< double >::denorm_min ( ) ) );
    }

    TEST_F( FloatFixture, NaNKeepsItsBits )
    {
        const auto raw = encode( mpv::Value::floating( std::numeric_limits< double >::quiet_NaN ( ) ) );
        const auto decoded = decode_single( raw );

        ASSERT_TRUE( decoded.is_float ( ) );
        EXPECT_TRUE( std::isnan( *decoded.as_float ( ) ) );
        EXPECT_EQ( raw, encode( decoded ) );
    }
}

namespace strings
{
    class StringFixture : public CodecFixture
    {
    };

    TEST_F( StringFixture, TestFixStr )
    {
        const mpv::Bytes raw { 0xaa, 0x48, 0x65, 0x6c, 0x6c, 0x6f, 0x20, 0x52, 0x75, 0x73, 0x74, 0x00 };
        const auto result = mpv::decode( raw );

        ASSERT_TRUE( result );
        EXPECT_EQ( 11u, result->size );
        EXPECT_EQ( mpv::Value::string( "Hello Rust" ), result->value );

        EXPECT_EQ( mpv::Bytes( { 0xa0 } ), encode( mpv::Value::string( "" ) ) );
        EXPECT_EQ( mpv::Bytes( { 0xa1, 0x61 } ), encode( mpv::Value::string( "a" ) ) );
        EXPECT_EQ( 0xbf, encode( mpv::Value::string( std::string( 31, 'x' ) ) ).front ( ) );
    }

    TEST_F( StringFixture, TestLengthFamilies )
    {
        auto raw = encode( mpv::Value::string( std::string( 32, 'x' ) ) );
        EXPECT_EQ( mpv::Bytes( { 0xd9, 0x20 } ), mpv::Bytes( raw.begin ( ), raw.begin ( ) + 2 ) );

        raw = encode( mpv::Value::string( std::string( 255, 'x' ) ) );
        EXPECT_EQ( mpv::Bytes( { 0xd9, 0xff } ), mpv::Bytes( raw.begin ( ), raw.begin ( ) + 2 ) );

        raw = encode( mpv::Value::string( std::string( 256, 'x' ) ) );
        EXPECT_EQ( mpv::Bytes( { 0xda, 0x01, 0x00 } ), mpv::Bytes( raw.begin ( ), raw.begin ( ) + 3 ) );
        EXPECT_EQ( 259u, raw.size ( ) );

        raw = encode( mpv::Value::string( std::string( 0x10000, 'x' ) ) );
        EXPECT_EQ( mpv::Bytes( { 0xdb, 0x00, 0x01, 0x00, 0x00 } ), mpv::Bytes( raw.begin ( ), raw.begin ( ) + 5 ) );
        EXPECT_EQ( 0x10005u, raw.size ( ) );

        expect_round_trip( mpv::Value::string( std::string( 300, 'y' ) ) );
        expect_round_trip( mpv::Value::string( std::string( 0x10001, 'z' ) ) );
    }

    TEST_F( StringFixture, AcceptsMultiByteUtf8 )
    {
        EXPECT_EQ( mpv::Value::string( "\xc3\xa9" ), decode_single( { 0xa2, 0xc3, 0xa9 } ) );
        EXPECT_EQ( mpv::Value::string( "\xe2\x82\xac" ), decode_single( { 0xa3, 0xe2, 0x82, 0xac } ) );
        EXPECT_EQ( mpv::Value::string( "\xf0\x9f\x98\x80" ), decode_single( { 0xa4, 0xf0, 0x9f, 0x98, 0x80 } ) );

        expect_round_trip( mpv::Value::string( "h\xc3\xa9llo \xe2\x82\xac" ) );
    }

    TEST_F( StringFixture, RejectsInvalidUtf8AtPayloadStart )
    {
        EXPECT_EQ( 1u, failing_byte( { 0xa2, 0xc3, 0x28 } ) );             // bad continuation
        EXPECT_EQ( 1u, failing_byte( { 0xa2, 0xc0, 0xaf } ) );             // overlong
        EXPECT_EQ( 1u, failing_byte( { 0xa3, 0xed, 0xa0, 0x80 } ) );       // surrogate
        EXPECT_EQ( 1u, failing_byte( { 0xa4, 0xf4, 0x90, 0x80, 0x80 } ) ); // above U+10FFFF
        EXPECT_EQ( 1u, failing_byte( { 0xa1, 0xe2 } ) );                   // truncated sequence
        EXPECT_EQ( 2u, failing_byte( { 0xd9, 0x02, 0xff, 0xfe } ) );
        EXPECT_EQ( 3u, failing_byte( { 0xda, 0x00, 0x01, 0x80 } ) );
        EXPECT_EQ( 5u, failing_byte( { 0xdb, 0x00, 0x00, 0x00, 0x01, 0xff } ) );
    }

    TEST_F( StringFixture, TruncatedStrings )
    {
        EXPECT_EQ( 1u, failing_byte( { 0xa5, 0x61, 0x62 } ) );
        EXPECT_EQ( 1u, failing_byte( { 0xd9 } ) );
        EXPECT_EQ( 2u, failing_byte( { 0xd9, 0x05, 0x61 } ) );
        EXPECT_EQ( 1u, failing_byte( { 0xda, 0x00 } ) );
        EXPECT_EQ( 3u, failing_byte( { 0xda, 0x00, 0x02, 0x61 } ) );
        EXPECT_EQ( 1u, failing_byte( { 0xdb, 0x00, 0x00, 0x00 } ) );
        EXPECT_EQ( 5u, failing_byte( { 0xdb, 0x00, 0x00, 0x00, 0x03, 0x61 } ) );
    }
}

namespace binary
{
    class BinaryFixture : public CodecFixture
    {
    };

    TEST_F( BinaryFixture, TestBin8 )
    {
        const auto result = mpv::decode( mpv::Bytes { 0xc4, 0x02, 0x42, 0xff, 0xc0 } );

        ASSERT_TRUE( result );
        EXPECT_EQ( 4u, result->size );
        EXPECT_EQ( mpv::Value::binary( { 0x42, 0xff } ), result->value );

        EXPECT_EQ( mpv::Bytes( { 0xc4, 0x00 } ), encode( mpv::Value::binary( { } ) ) );
        EXPECT_EQ( mpv::Bytes( { 0xc4, 0x02, 0x42, 0xff } ), encode( mpv::Value::binary( { 0x42, 0xff } ) ) );
    }

    TEST_F( BinaryFixture, TestLengthFamilies )
    {
        EXPECT_EQ( concat( { 0xc4, 0xff }, repeated( 0xff, 0x01 ) ), encode( mpv::Value::binary( repeated( 0xff, 0x01 ) ) ) );
        EXPECT_EQ( concat( { 0xc5, 0x01, 0x00 }, repeated( 0x100, 0x02 ) ), encode( mpv::Value::binary( repeated( 0x100, 0x02 ) ) ) );

        const auto raw = encode( mpv::Value::binary( repeated( 0x10000, 0x03 ) ) );

        EXPECT_EQ( mpv::Bytes( { 0xc6, 0x00, 0x01, 0x00, 0x00 } ), mpv::Bytes( raw.begin ( ), raw.begin ( ) + 5 ) );
        EXPECT_EQ( 0x10005u, raw.size ( ) );

        expect_round_trip( mpv::Value::binary( repeated( 0x1234, 0xab ) ) );
    }

    TEST_F( BinaryFixture, OffsetOfTruncation )
    {
        EXPECT_EQ( 1u, failing_byte( { 0xc4 } ) );
        EXPECT_EQ( 2u, failing_byte( { 0xc4, 0x05 } ) );
        EXPECT_EQ( 1u, failing_byte( { 0xc5, 0x00 } ) );
        EXPECT_EQ( 3u, failing_byte( { 0xc5, 0x00, 0x02, 0xaa } ) );
        EXPECT_EQ( 1u, failing_byte( { 0xc6, 0x00, 0x00, 0x01 } ) );
        EXPECT_EQ( 5u, failing_byte( { 0xc6, 0x00, 0x00, 0x00, 0x01 } ) );
    }
}

namespace fixext
{
    class FixExtFixture : public CodecFixture
    {
    };

    TEST_F( FixExtFixture, TestFixExt1 )
    {
        const auto result = mpv::decode( mpv::Bytes { 0xd4, 0x0a, 0x0b } );

        ASSERT_TRUE( result );
        EXPECT_EQ( 3u, result->size );

        const auto *extension = result->value.as_extension ( );

        ASSERT_NE( nullptr, extension );
        EXPECT_EQ( 0x0a, extension->type_id );
        EXPECT_EQ( mpv::Bytes( { 0x0b } ), extension->value );
    }

    TEST_F( FixExtFixture, TestFixExt2 )
    {
        EXPECT_EQ( mpv::Value::extension( 0x0a, { 0x0b, 0x0c } ), decode_single( { 0xd5, 0x0a, 0x0b, 0x0c } ) );
        EXPECT_EQ( mpv::Bytes( { 0xd5, 0x0a, 0x0b, 0x0c } ), encode( mpv::Value::extension( 0x0a, { 0x0b, 0x0c } ) ) );
    }

    TEST_F( FixExtFixture, TestFixExt4 )
    {
        const mpv::Bytes valid_fixext4 { 0xd6, 0x0a, 0x0b, 0x0c, 0x0d, 0x0e };

        EXPECT_EQ( mpv::Value::extension( 0x0a, { 0x0b, 0x0c, 0x0d, 0x0e } ), decode_single( valid_fixext4 ) );

        EXPECT_EQ(
            mpv::Bytes( { 0xd6, 0x02, 0x32, 0x4a, 0x67, 0x11 } ),
            encode( mpv::Value::extension( 2, { 0x32, 0x4a, 0x67, 0x11 } ) )
        );

        /* payload one byte short of four */
        EXPECT_EQ( 1u, failing_byte( { 0xd6, 0x0a, 0x0b, 0x0c, 0x0d } ) );
    }

    TEST_F( FixExtFixture, TestFixExt8 )
    {
        const mpv::Bytes fix_ext8 {
            0xd7, 0x0a,             /* 0 */
            0x0b, 0x0c, 0x0d, 0x0e, /* 4 */
            0x0f, 0x0a, 0x0b, 0x0c  /* 8 */
        };

        const auto result = mpv::decode( fix_ext8 );

        ASSERT_TRUE( result );
        EXPECT_EQ( 10u, result->size );
        EXPECT_EQ( mpv::Value::extension( 0x0a, { 0x0b, 0x0c, 0x0d, 0x0e, 0x0f, 0x0a, 0x0b, 0x0c } ), result->value );
        EXPECT_EQ( fix_ext8, encode( result->value ) );
    }

    TEST_F( FixExtFixture, TestFixExt16 )
    {
        const mpv::Bytes fix_ext16 {
            0xd8, 0x0a,             /* 0 */
            0x0b, 0x0c, 0x0d, 0x0e, /* 4 */
            0x0f, 0x0a, 0x0b, 0x0c, /* 8 */
            0x6a, 0x7b, 0x5e, 0x3c, /* 12 */
            0x6b, 0x7c, 0x5f, 0x3d  /* 16 */
        };

        const auto result = mpv::decode( fix_ext16 );

        ASSERT_TRUE( result );
        EXPECT_EQ( 18u, result->size );
        EXPECT_EQ( 16u, result->value.as_extension ( )->value.size ( ) );
        EXPECT_EQ( 0x3d, result->value.as_extension ( )->value.back ( ) );
        EXPECT_EQ( fix_ext16, encode( result->value ) );

        EXPECT_EQ( 1u, failing_byte( mpv::Bytes( fix_ext16.begin ( ), fix_ext16.end ( ) - 1 ) ) );
    }

    TEST_F( FixExtFixture, OtherLengthsUseExt )
    {
        EXPECT_EQ( mpv::Bytes( { 0xc7, 0x00, 0x05 } ), encode( mpv::Value::extension( 5, { } ) ) );
        EXPECT_EQ( mpv::Bytes( { 0xc7, 0x03, 0xfe, 0x01, 0x02, 0x03 } ), encode( mpv::Value::extension( -2, { 0x01, 0x02, 0x03 } ) ) );
        EXPECT_EQ( concat( { 0xc7, 0x11, 0x01 }, repeated( 17, 0x00 ) ), encode( mpv::Value::extension( 1, repeated( 17, 0x00 ) ) ) );

        auto raw = encode( mpv::Value::extension( 1, repeated( 0x100, 0x00 ) ) );
        EXPECT_EQ( mpv::Bytes( { 0xc8, 0x01, 0x00, 0x01 } ), mpv::Bytes( raw.begin ( ), raw.begin ( ) + 4 ) );

        raw = encode( mpv::Value::extension( 1, repeated( 0x10000, 0x00 ) ) );
        EXPECT_EQ( mpv::Bytes( { 0xc9, 0x00, 0x01, 0x00, 0x00, 0x01 } ), mpv::Bytes( raw.begin ( ), raw.begin ( ) + 6 ) );

        EXPECT_EQ( mpv::Value::extension( -2, { 0x01, 0x02, 0x03 } ), decode_single( { 0xc7, 0x03, 0xfe, 0x01, 0x02, 0x03 } ) );

        expect_round_trip( mpv::Value::extension( -1, repeated( 3, 0x7f ) ) );
        expect_round_trip( mpv::Value::extension( 127, repeated( 0x100, 0x7f ) ) );
        expect_round_trip( mpv::Value::extension( -128, repeated( 0x10000, 0x7f ) ) );
    }

    TEST_F( FixExtFixture, OffsetOfTruncation )
    {
        EXPECT_EQ( 1u, failing_byte( { 0xc7, 0x03 } ) );
        EXPECT_EQ( 3u, failing_byte( { 0xc7, 0x03, 0x01, 0xaa } ) );
        EXPECT_EQ( 1u, failing_byte( { 0xc8, 0x00, 0x02 } ) );
        EXPECT_EQ( 4u, failing_byte( { 0xc8, 0x00, 0x02, 0x05 } ) );
        EXPECT_EQ( 1u, failing_byte( { 0xc9, 0x00, 0x00, 0x00, 0x01 } ) );
        EXPECT_EQ( 6u, failing_byte( { 0xc9, 0x00, 0x00, 0x00, 0x01, 0x05 } ) );
        EXPECT_EQ( 1u, failing_byte( { 0xd4, 0x01 } ) );
    }
}

namespace containers
{
    class ContainerFixture : public CodecFixture
    {
    };

    TEST_F( ContainerFixture, MapEntriesArePositional )
    {
        const mpv::Bytes raw { 0x82, 0xa1, 0x61, 0x01, 0xa1, 0x62, 0x02 };
        const auto result = mpv::decode( raw );

        ASSERT_TRUE( result );
        EXPECT_EQ( 7u, result->size );

        const mpv::Value expected = mpv::Value::map( {
            { mpv::Value::string( "a" ), mpv::Value::integer( 1 ) },
            { mpv::Value::string( "b" ), mpv::Value::integer( 2 ) }
        } );

        EXPECT_EQ( expected, result->value );
        EXPECT_EQ( raw, encode( expected ) );

        const mpv::Value swapped = mpv::Value::map( {
            { mpv::Value::string( "b" ), mpv::Value::integer( 2 ) },
            { mpv::Value::string( "a" ), mpv::Value::integer( 1 ) }
        } );

        EXPECT_NE( swapped, result->value );
    }

    TEST_F( ContainerFixture, DuplicateAndCompositeKeys )
    {
        const auto duplicates = decode_single( { 0x82, 0xa1, 0x61, 0x01, 0xa1, 0x61, 0x02 } );
        const auto *entries = duplicates.as_map ( );

        ASSERT_NE( nullptr, entries );
        ASSERT_EQ( 2u, entries->size ( ) );
        EXPECT_EQ( ( *entries )[ 0 ].key, ( *entries )[ 1 ].key );
        EXPECT_EQ( mpv::Value::integer( 2 ), ( *entries )[ 1 ].value );

        const mpv::Value composite = mpv::Value::map( {
            {
                mpv::Value::array( { mpv::Value::integer( 1 ), mpv::Value::integer( 2 ) } ),
                mpv::Value::boolean( true )
            },
            {
                mpv::Value::map( { { mpv::Value::nil ( ), mpv::Value::nil ( ) } } ),
                mpv::Value::extension( 3, { 0x01 } )
            }
        } );

        EXPECT_EQ( mpv::Bytes( { 0x82, 0x92, 0x01, 0x02, 0xc3, 0x81, 0xc0, 0xc0, 0xd4, 0x03, 0x01 } ), encode( composite ) );
        expect_round_trip( composite );
    }

    TEST_F( ContainerFixture, DecodesDocument )
    {
        const mpv::Bytes raw {
            0x82, 0xa7, 0x63, 0x6f, 0x6d, 0x70, 0x61, 0x63, 0x74, 0xc3, 0xa6, 0x73, 0x63, 0x68, 0x65, 0x6d,
            0x61, 0x93, 0x01, 0x02, 0xcb, 0x3f, 0xf5, 0x1e, 0xb8, 0x51, 0xeb, 0x85, 0x1f
        };

        auto parsed = mpv::parse( raw );
        ASSERT_TRUE( parsed );

        auto map = std::move( parsed ).value ( ).into_map ( );
        ASSERT_TRUE( map );
        ASSERT_EQ( 2u, map->size ( ) );

        auto &first = map.value ( )[ 0 ];
        auto &second = map.value ( )[ 1 ];

        EXPECT_EQ( mpv::Value::string( "compact" ), first.key );
        EXPECT_EQ( mpv::Value::boolean( true ), first.value );
        EXPECT_EQ( mpv::Value::string( "schema" ), second.key );

        auto array = std::move( second.value ).into_array ( );
        ASSERT_TRUE( array );
        ASSERT_EQ( 3u, array->size ( ) );

        auto one = std::move( array.value ( )[ 0 ] ).into_some_int ( );
        auto two = std::move( array.value ( )[ 1 ] ).into_some_int ( );
        auto third = std::move( array.value ( )[ 2 ] ).into_float ( );

        ASSERT_TRUE( one );
        ASSERT_TRUE( two );
        ASSERT_TRUE( third );

        EXPECT_EQ( 1, one.value ( ) );
        EXPECT_EQ( 2, two.value ( ) );
        EXPECT_EQ( 1.32, third.value ( ) );
    }

    TEST_F( ContainerFixture, EncodesDocument )
    {
        const mpv::Value message = mpv::Value::map( {
            { mpv::Value::string( "hello" ), mpv::Value::integer( 0x424242 ) },
            {
                mpv::Value::string( "world" ),
                mpv::Value::array( {
                    mpv::Value::boolean( true ),
                    mpv::Value::nil ( ),
                    mpv::Value::binary( { 0x42, 0xff } ),
                    mpv::Value::extension( 2, { 0x32, 0x4a, 0x67, 0x11 } )
                } )
            }
        } );

        const mpv::Bytes expected {
            0x82,
            0xa5, 0x68, 0x65, 0x6c, 0x6c, 0x6f,
            0xd2, 0x00, 0x42, 0x42, 0x42,
            0xa5, 0x77, 0x6f, 0x72, 0x6c, 0x64,
            0x94, 0xc3, 0xc0, 0xc4, 0x02, 0x42, 0xff, 0xd6, 0x02, 0x32, 0x4a, 0x67, 0x11
        };

        EXPECT_EQ( expected, encode( message ) );
        expect_round_trip( message );
    }

    TEST_F( ContainerFixture, TestLengthFamilies )
    {
        mpv::Array elements( 16, mpv::Value::nil ( ) );

        EXPECT_EQ( concat( { 0x9f }, repeated( 15, 0xc0 ) ), encode( mpv::Value::array( mpv::Array( 15, mpv::Value::nil ( ) ) ) ) );
        EXPECT_EQ( concat( { 0xdc, 0x00, 0x10 }, repeated( 16, 0xc0 ) ), encode( mpv::Value::array( elements ) ) );
        EXPECT_EQ( mpv::Bytes( { 0x90 } ), encode( mpv::Value::array( { } ) ) );
        EXPECT_EQ( mpv::Bytes( { 0x80 } ), encode( mpv::Value::map( { } ) ) );

        mpv::Map entries( 16, mpv::MapEntry { mpv::Value::nil ( ), mpv::Value::boolean( false ) } );
        auto raw = encode( mpv::Value::map( entries ) );

        EXPECT_EQ( mpv::Bytes( { 0xde, 0x00, 0x10, 0xc0, 0xc2 } ), mpv::Bytes( raw.begin ( ), raw.begin ( ) + 5 ) );
        EXPECT_EQ( 3u + 32u, raw.size ( ) );

        raw = encode( mpv::Value::array( mpv::Array( 0x10000, mpv::Value::integer( 1 ) ) ) );
        EXPECT_EQ( mpv::Bytes( { 0xdd, 0x00, 0x01, 0x00, 0x00, 0x01 } ), mpv::Bytes( raw.begin ( ), raw.begin ( ) + 6 ) );

        raw = encode( mpv::Value::map( mpv::Map( 0x10000, mpv::MapEntry { } ) ) );
        EXPECT_EQ( mpv::Bytes( { 0xdf, 0x00, 0x01, 0x00, 0x00, 0xc0 } ), mpv::Bytes( raw.begin ( ), raw.begin ( ) + 6 ) );

        expect_round_trip( mpv::Value::array( elements ) );
        expect_round_trip( mpv::Value::map( entries ) );
    }

    TEST_F( ContainerFixture, NestedOffsetsAreAbsolute )
    {
        EXPECT_EQ( 2u, failing_byte( { 0x91, 0xc4 } ) );
        EXPECT_EQ( 1u, failing_byte( { 0x91 } ) );
        EXPECT_EQ( 4u, failing_byte( { 0x92, 0x01, 0xc4, 0x01 } ) );
        EXPECT_EQ( 2u, failing_byte( { 0x81, 0x01 } ) );
        EXPECT_EQ( 4u, failing_byte( { 0xdc, 0x00, 0x02, 0xc0 } ) );
        EXPECT_EQ( 1u, failing_byte( { 0xdc, 0x00 } ) );
        EXPECT_EQ( 1u, failing_byte( { 0xdf, 0x00, 0x00 } ) );
        EXPECT_EQ( 4u, failing_byte( { 0x81, 0xa1, 0x6b, 0x91, 0xc1 } ) );
        EXPECT_EQ( 6u, failing_byte( { 0x92, 0x91, 0x01, 0x91, 0x92, 0x02 } ) );
    }

    TEST_F( ContainerFixture, HugeCountDoesNotAllocate )
    {
        EXPECT_EQ( 5u, failing_byte( { 0xdd, 0xff, 0xff, 0xff, 0xff } ) );
        EXPECT_EQ( 5u, failing_byte( { 0xdf, 0xff, 0xff, 0xff, 0xff } ) );
    }

    TEST_F( ContainerFixture, TrailingBytesAreNotConsumed )
    {
        const auto result = mpv::decode( mpv::Bytes { 0x92, 0x01, 0x02, 0xc0, 0xff } );

        ASSERT_TRUE( result );
        EXPECT_EQ( 3u, result->size );

        const mpv::Bytes stream { 0x01, 0xa1, 0x61, 0xc0 };
        std::size_t position = 0;
        mpv::Array values { };

        while ( position < stream.size ( ) )
        {
            auto next = mpv::decode( stream.data ( ) + position, stream.size ( ) - position );
            ASSERT_TRUE( next );

            position += next->size;
            values.push_back( std::move( next ).value ( ).value );
        }

        EXPECT_EQ( mpv::Array( { mpv::Value::integer( 1 ), mpv::Value::string( "a" ), mpv::Value::nil ( ) } ), values );
    }

    TEST_F( ContainerFixture, DeepNestingWithoutLimit )
    {
        const std::size_t depth = 1000;
        const auto raw = concat( repeated( depth, 0x91 ), { 0x01 } );
        const auto result = mpv::decode( raw );

        ASSERT_TRUE( result );
        EXPECT_EQ( depth + 1, result->size );
        EXPECT_EQ( raw, encode( result->value ) );
    }

    TEST_F( ContainerFixture, DepthLimit )
    {
        const mpv::DecodeOptions options { 2 };

        EXPECT_TRUE( mpv::decode( mpv::Bytes { 0x91, 0x91, 0x01 }, options ) );
        EXPECT_EQ( 2u, failing_byte( { 0x91, 0x91, 0x91, 0x01 }, options ) );
        EXPECT_EQ( 3u, failing_byte( { 0x81, 0xc0, 0x81, 0x80, 0xc0 }, options ) );
        EXPECT_TRUE( mpv::decode( concat( repeated( 64, 0x91 ), { 0x01 } ), mpv::DecodeOptions { 0 } ) );
    }
}

namespace errors
{
    class ErrorFixture : public CodecFixture
    {
    };

    TEST_F( ErrorFixture, EmptyAndReserved )
    {
        EXPECT_EQ( 0u, failing_byte( { } ) );
        EXPECT_EQ( 0u, failing_byte( { 0xc1 } ) );
        EXPECT_EQ( 0u, failing_byte( { 0xc1, 0x00, 0x00 } ) );
        EXPECT_EQ( 0u, mpv::decode( nullptr, 0 ).error ( ).byte );
    }

    TEST_F( ErrorFixture, TruncatedFixedWidthBodies )
    {
        for ( const mpv::mp_u8 tag : { 0xca, 0xcb, 0xcc, 0xcd, 0xce, 0xcf, 0xd0, 0xd1, 0xd2, 0xd3, 0xd4, 0xd5, 0xd6, 0xd7, 0xd8 } )
            EXPECT_EQ( 1u, failing_byte( { tag } ) ) << "tag " << static_cast< int >( tag );

        EXPECT_EQ( 1u, failing_byte( { 0xcb, 0x3f, 0xf6, 0xb8, 0x51, 0xeb, 0x85, 0x1e } ) );
        EXPECT_EQ( 1u, failing_byte( { 0xcd, 0x01 } ) );
    }

    TEST_F( ErrorFixture, ParseErrorOffsetAndMessage )
    {
        const mpv::ParseError error { 5 };

        EXPECT_EQ( 8u, error.offset( 3 ).byte );
        EXPECT_EQ( "MsgPack parse error at byte 42", mpv::message( mpv::ParseError { 42 } ) );
        EXPECT_EQ( "MsgPack parse error at byte 42", fmt::format( "{}", mpv::ParseError { 42 } ) );

        std::ostringstream os;
        os << mpv::ParseError { 7 };
        EXPECT_EQ( "MsgPack parse error at byte 7", os.str ( ) );
    }

    TEST_F( ErrorFixture, ParseDiscardsLength )
    {
        const auto parsed = mpv::parse( mpv::Bytes { 0xc3, 0xc0 } );

        ASSERT_TRUE( parsed );
        EXPECT_EQ( mpv::Value::boolean( true ), parsed.value ( ) );

        const auto failed = mpv::parse( mpv::Bytes { 0x91, 0xc4 } );

        ASSERT_FALSE( failed );
        EXPECT_EQ( 2u, failed.error ( ).byte );
    }

    TEST_F( ErrorFixture, LoggingDoesNotChangeResults )
    {
        mpv::log::set_level( spdlog::level::trace );
        EXPECT_EQ( 2u, failing_byte( { 0x91, 0xc4 } ) );

        mpv::log::set_level( spdlog::level::off );
        EXPECT_EQ( 2u, failing_byte( { 0x91, 0xc4 } ) );

        EXPECT_EQ( "mpv", mpv::log::get ( ).name ( ) );
        mpv::log::set_level( spdlog::level::warn );
    }
}

namespace accessors
{
    TEST( Accessors, PredicatesMatchKind )
    {
        EXPECT_TRUE( mpv::Value::string( "x" ).is_string ( ) );
        EXPECT_FALSE( mpv::Value::string( "x" ).is_binary ( ) );
        EXPECT_TRUE( mpv::Value ( ).is_nil ( ) );
        EXPECT_TRUE( mpv::Value::uint( 1 ).is_some_int ( ) );
        EXPECT_TRUE( mpv::Value::integer( 1 ).is_some_int ( ) );
        EXPECT_FALSE( mpv::Value::floating( 1.0 ).is_some_int ( ) );
        EXPECT_EQ( mpv::Kind::Extension, mpv::Value::extension( 1, { } ).kind ( ) );
        EXPECT_STREQ( "boolean", mpv::kind_name( mpv::Value::boolean( false ).kind ( ) ) );

        EXPECT_EQ( nullptr, mpv::Value::string( "x" ).as_int ( ) );
        EXPECT_EQ( "x", *mpv::Value::string( "x" ).as_string ( ) );
    }

    TEST( Accessors, FailedConversionRecoversOriginal )
    {
        auto result = mpv::Value::string( "x" ).into_int ( );

        ASSERT_FALSE( result );
        EXPECT_STREQ( "int", result.error ( ).attempted );
        EXPECT_EQ( "MsgPack conversion error: cannot use string as int", mpv::message( result.error ( ) ) );

        auto recovered = std::move( result ).error ( ).recover ( );

        EXPECT_EQ( mpv::Value::string( "x" ), recovered );

        auto retried = std::move( recovered ).into_string ( );

        ASSERT_TRUE( retried );
        EXPECT_EQ( "x", retried.value ( ) );
    }

    TEST( Accessors, ConversionErrorMessage )
    {
        auto result = mpv::Value::floating( 4.2 ).into_int ( );

        ASSERT_FALSE( result );
        EXPECT_EQ( "MsgPack conversion error: cannot use float as int", fmt::format( "{}", result.error ( ) ) );

        auto recovered = std::move( result ).error ( ).recover ( );

        ASSERT_TRUE( recovered.is_float ( ) );
        EXPECT_EQ( 4.2, std::move( recovered ).into_float ( ).value ( ) );
    }

    TEST( Accessors, EveryAccessorLabelsItsKind )
    {
        EXPECT_STREQ( "uint", mpv::Value::nil ( ).into_uint ( ).error ( ).attempted );
        EXPECT_STREQ( "float", mpv::Value::nil ( ).into_float ( ).error ( ).attempted );
        EXPECT_STREQ( "boolean", mpv::Value::nil ( ).into_boolean ( ).error ( ).attempted );
        EXPECT_STREQ( "string", mpv::Value::nil ( ).into_string ( ).error ( ).attempted );
        EXPECT_STREQ( "binary", mpv::Value::nil ( ).into_binary ( ).error ( ).attempted );
        EXPECT_STREQ( "array", mpv::Value::nil ( ).into_array ( ).error ( ).attempted );
        EXPECT_STREQ( "map", mpv::Value::nil ( ).into_map ( ).error ( ).attempted );
        EXPECT_STREQ( "extension", mpv::Value::nil ( ).into_extension ( ).error ( ).attempted );
        EXPECT_STREQ( "int", mpv::Value::nil ( ).into_some_int ( ).error ( ).attempted );
    }

    TEST( Accessors, IntoSomeIntAcceptsBothSignedness )
    {
        EXPECT_EQ( 5, mpv::Value::uint( 5 ).into_some_int ( ).value ( ) );
        EXPECT_EQ( -3, mpv::Value::integer( -3 ).into_some_int ( ).value ( ) );
        EXPECT_EQ( -1, mpv::Value::uint( 0xffffffffffffffffULL ).into_some_int ( ).value ( ) );

        EXPECT_FALSE( mpv::Value::uint( 5 ).into_int ( ) );
        EXPECT_FALSE( mpv::Value::integer( 5 ).into_uint ( ) );
    }

    TEST( Accessors, IntoMovesPayloadOut )
    {
        auto extension = mpv::Value::extension( -5, { 0x01, 0x02 } ).into_extension ( );

        ASSERT_TRUE( extension );
        EXPECT_EQ( -5, extension->type_id );
        EXPECT_EQ( mpv::Bytes( { 0x01, 0x02 } ), extension->value );

        auto binary = mpv::Value::binary( { 0x09 } ).into_binary ( );

        ASSERT_TRUE( binary );
        EXPECT_EQ( mpv::Bytes( { 0x09 } ), binary.value ( ) );

        EXPECT_TRUE( mpv::Value::boolean( false ).into_boolean ( ) );
        EXPECT_FALSE( mpv::Value::boolean( false ).into_boolean ( ).value ( ) );
    }
}

namespace rendering
{
    TEST( Rendering, Scalars )
    {
        EXPECT_EQ( "nil", mpv::render( mpv::Value::nil ( ) ) );
        EXPECT_EQ( "true", mpv::render( mpv::Value::boolean( true ) ) );
        EXPECT_EQ( "false", mpv::render( mpv::Value::boolean( false ) ) );
        EXPECT_EQ( "-5", mpv::render( mpv::Value::integer( -5 ) ) );
        EXPECT_EQ( "18446744073709551615", mpv::render( mpv::Value::uint( 0xffffffffffffffffULL ) ) );
        EXPECT_EQ( "1.5", mpv::render( mpv::Value::floating( 1.5 ) ) );
        EXPECT_EQ( "\"hi\"", mpv::render( mpv::Value::string( "hi" ) ) );
        EXPECT_EQ( "bin:42ff", mpv::render( mpv::Value::binary( { 0x42, 0xff } ) ) );
        EXPECT_EQ( "bin:", mpv::render( mpv::Value::binary( { } ) ) );
        EXPECT_EQ( "ext:2:324a6711", mpv::render( mpv::Value::extension( 2, { 0x32, 0x4a, 0x67, 0x11 } ) ) );
        EXPECT_EQ( "ext:-1:0a", mpv::render( mpv::Value::extension( -1, { 0x0a } ) ) );
    }

    TEST( Rendering, Containers )
    {
        EXPECT_EQ( "[]", mpv::render( mpv::Value::array( { } ) ) );
        EXPECT_EQ( "{}", mpv::render( mpv::Value::map( { } ) ) );

        const mpv::Value value = mpv::Value::map( {
            { mpv::Value::string( "a" ), mpv::Value::integer( 1 ) },
            {
                mpv::Value::string( "b" ),
                mpv::Value::array( { mpv::Value::boolean( true ), mpv::Value::nil ( ) } )
            }
        } );

        EXPECT_EQ( "{\"a\": 1, \"b\": [true, nil]}", mpv::render( value ) );
        EXPECT_EQ( "{\"a\": 1, \"b\": [true, nil]}", fmt::format( "{}", value ) );

        std::ostringstream os;
        os << mpv::Value::array( { mpv::Value::integer( 1 ), mpv::Value::string( "a" ) } );
        EXPECT_EQ( "[1, \"a\"]", os.str ( ) );
    }
}

/**
 * @brief Test `mpv::stream::Byte(Reader|Writer)` behaviour.
 */
namespace streams
{
    TEST( Streams, ReadBigEndian )
    {
        const mpv::Bytes raw { 0x12, 0x34, 0xde, 0xad, 0xbe, 0xef, 0xff };
        mpv::stream::ByteReader sr( raw.data ( ), raw.size ( ) );

        EXPECT_EQ( 0x12, sr.peek_u8 ( ) );
        EXPECT_EQ( 0x1234, sr.read_u16 ( ) );
        EXPECT_EQ( 0xdeadbeefu, sr.read_u32 ( ) );
        EXPECT_EQ( -1, sr.read_i8 ( ) );
        EXPECT_EQ( sr.stream_size ( ), sr.position ( ) );
    }

    TEST( Streams, ReadOOB )
    {
        const mpv::Bytes raw { 0x01, 0x02, 0x03 };
        mpv::stream::ByteReader sr( raw.data ( ), raw.size ( ) );

        EXPECT_FALSE( sr.has( 4 ) );
        EXPECT_EQ( 0u, sr.read_u32 ( ) ); // reads past the end return zero
        EXPECT_EQ( 0u, sr.position ( ) );

        EXPECT_EQ( 0x01, sr.read_u8 ( ) );
        EXPECT_EQ( 2u, sr.remaining ( ) );
        EXPECT_TRUE( sr.read_bytes( 3 ).empty ( ) );
        EXPECT_EQ( mpv::Bytes( { 0x02, 0x03 } ), sr.read_bytes( 2 ) );
        EXPECT_LE( sr.position ( ), sr.stream_size ( ) );
    }

    TEST( Streams, WriteBigEndian )
    {
        mpv::Bytes out { 0xaa };
        mpv::stream::ByteWriter wr( out );

        wr.write_u16( 0x0102 ).write_u32( 0xdeadbeef ).write_i64( -2 ).write_marker( mpv::Marker::Nil );

        EXPECT_EQ(
            mpv::Bytes( {
                0xaa, 0x01, 0x02, 0xde, 0xad, 0xbe, 0xef,
                0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xfe, 0xc0
            } ),
            out
        );

        EXPECT_EQ( out.size ( ), wr.position ( ) );
    }
}
