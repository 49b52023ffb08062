#pragma once

#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "result.hpp"
#include "stream.hpp"
#include "types.hpp"

namespace mpv
{
    /*
     * Order matches the alternatives of `Value::Storage`; `Value::kind( )` relies on it.
     */
    enum class Kind : mp_u32
    {
        Nil,
        Int,
        Uint,
        Float,
        Boolean,
        String,
        Binary,
        Array,
        Map,
        Extension
    };

    /**
     * @brief Lowercase label for `kind`, as used in conversion error messages.
     * @param kind Value kind
     * @return const char *
     */
    inline const char *kind_name( const Kind kind )
    {
        switch ( kind )
        {
        case Kind::Nil:       return "nil";
        case Kind::Int:       return "int";
        case Kind::Uint:      return "uint";
        case Kind::Float:     return "float";
        case Kind::Boolean:   return "boolean";
        case Kind::String:    return "string";
        case Kind::Binary:    return "binary";
        case Kind::Array:     return "array";
        case Kind::Map:       return "map";
        case Kind::Extension: return "extension";
        }

        return "unknown";
    }

    struct Nil
    {
    };

    inline bool operator==( const Nil &, const Nil & ) { return true; }
    inline bool operator!=( const Nil &, const Nil & ) { return false; }

    /**
     * @brief Application defined extension payload. The codec never looks inside `value`.
     */
    struct Extension
    {
        mp_i8 type_id { 0 };
        Bytes value { };
    };

    inline bool operator==( const Extension &lhs, const Extension &rhs )
    {
        return lhs.type_id == rhs.type_id && lhs.value == rhs.value;
    }

    inline bool operator!=( const Extension &lhs, const Extension &rhs )
    {
        return !( lhs == rhs );
    }

    class Value;
    struct MapEntry;
    struct ConversionError;

    using Array = std::vector< Value >;

    /*
     * A map is an ordered association list: keys may repeat and may be of any kind.
     */
    using Map = std::vector< MapEntry >;

    /**
     * @brief A single decoded MessagePack value. Owns its whole subtree.
     *
     * Build values through the named factories (`Value::integer( 42 )`,
     * `Value::string( "x" )`, ...). Inspect them with `is_*( )` and `as_*( )`, or take the
     * payload out with the consuming `into_*( )` accessors, which hand the value back inside
     * a `ConversionError` when the kind does not match.
     */
    class Value
    {
    public:
        using Storage = std::variant<
            Nil,
            mp_i64,
            mp_u64,
            double,
            bool,
            std::string,
            Bytes,
            Array,
            Map,
            Extension
        >;

        Value( ) = default;

        static Value nil( ) { return Value { }; }
        static Value integer( const mp_i64 value ) { return Value( Storage( std::in_place_index< 1 >, value ) ); }
        static Value uint( const mp_u64 value ) { return Value( Storage( std::in_place_index< 2 >, value ) ); }
        static Value floating( const double value ) { return Value( Storage( std::in_place_index< 3 >, value ) ); }
        static Value boolean( const bool value ) { return Value( Storage( std::in_place_index< 4 >, value ) ); }
        static Value string( std::string value ) { return Value( Storage( std::in_place_index< 5 >, std::move( value ) ) ); }
        static Value binary( Bytes value ) { return Value( Storage( std::in_place_index< 6 >, std::move( value ) ) ); }
        static Value array( Array value ) { return Value( Storage( std::in_place_index< 7 >, std::move( value ) ) ); }
        static Value map( Map value ) { return Value( Storage( std::in_place_index< 8 >, std::move( value ) ) ); }
        static Value extension( Extension value ) { return Value( Storage( std::in_place_index< 9 >, std::move( value ) ) ); }

        static Value extension( const mp_i8 type_id, Bytes value )
        {
            return extension( Extension { type_id, std::move( value ) } );
        }

        Kind kind( ) const
        {
            return static_cast< Kind >( storage_.index ( ) );
        }

        const Storage &storage( ) const
        {
            return storage_;
        }

        bool is_nil( ) const { return kind ( ) == Kind::Nil; }
        bool is_int( ) const { return kind ( ) == Kind::Int; }
        bool is_uint( ) const { return kind ( ) == Kind::Uint; }
        bool is_float( ) const { return kind ( ) == Kind::Float; }
        bool is_boolean( ) const { return kind ( ) == Kind::Boolean; }
        bool is_string( ) const { return kind ( ) == Kind::String; }
        bool is_binary( ) const { return kind ( ) == Kind::Binary; }
        bool is_array( ) const { return kind ( ) == Kind::Array; }
        bool is_map( ) const { return kind ( ) == Kind::Map; }
        bool is_extension( ) const { return kind ( ) == Kind::Extension; }

        /**
         * @brief Check if this value holds either a signed or an unsigned integer.
         * @return bool
         */
        bool is_some_int( ) const
        {
            return is_int ( ) || is_uint ( );
        }

        /*
         * Non-consuming views. Each returns null when the kind does not match.
         */
        const mp_i64 *as_int( ) const { return std::get_if< 1 >( &storage_ ); }
        const mp_u64 *as_uint( ) const { return std::get_if< 2 >( &storage_ ); }
        const double *as_float( ) const { return std::get_if< 3 >( &storage_ ); }
        const bool *as_boolean( ) const { return std::get_if< 4 >( &storage_ ); }
        const std::string *as_string( ) const { return std::get_if< 5 >( &storage_ ); }
        const Bytes *as_binary( ) const { return std::get_if< 6 >( &storage_ ); }
        const Array *as_array( ) const { return std::get_if< 7 >( &storage_ ); }
        const Map *as_map( ) const { return std::get_if< 8 >( &storage_ ); }
        const Extension *as_extension( ) const { return std::get_if< 9 >( &storage_ ); }

        Result< mp_i64, ConversionError > into_int( ) &&;
        Result< mp_u64, ConversionError > into_uint( ) &&;

        /**
         * @brief Take an integer out regardless of signedness. Unsigned values above the
         * signed range wrap, as a two's complement reinterpretation.
         * @return The integer, or a `ConversionError` labelled `int` holding this value
         */
        Result< mp_i64, ConversionError > into_some_int( ) &&;

        Result< double, ConversionError > into_float( ) &&;
        Result< bool, ConversionError > into_boolean( ) &&;
        Result< std::string, ConversionError > into_string( ) &&;
        Result< Bytes, ConversionError > into_binary( ) &&;
        Result< Array, ConversionError > into_array( ) &&;
        Result< Map, ConversionError > into_map( ) &&;
        Result< Extension, ConversionError > into_extension( ) &&;

    private:
        explicit Value( Storage storage )
            : storage_( std::move( storage ) )
        {
        }

        template < std::size_t Index >
        Result< std::variant_alternative_t< Index, Storage >, ConversionError > _into( const char *attempted ) &&;

        Storage storage_ { };
    };

    inline bool operator==( const Value &lhs, const Value &rhs );

    struct MapEntry
    {
        Value key { };
        Value value { };
    };

    inline bool operator==( const MapEntry &lhs, const MapEntry &rhs )
    {
        return lhs.key == rhs.key && lhs.value == rhs.value;
    }

    inline bool operator!=( const MapEntry &lhs, const MapEntry &rhs )
    {
        return !( lhs == rhs );
    }

    inline bool operator==( const Value &lhs, const Value &rhs )
    {
        return lhs.storage ( ) == rhs.storage ( );
    }

    inline bool operator!=( const Value &lhs, const Value &rhs )
    {
        return !( lhs == rhs );
    }

    /**
     * @brief Returned by the consuming accessors of `Value` when the requested kind does not
     * match. Carries the untouched original so the caller can retry with another accessor.
     */
    struct ConversionError
    {
        Value original { };
        const char *attempted { "" };

        /**
         * @brief Give back the value the failed conversion was attempted on.
         * @return Value
         */
        Value recover( ) &&
        {
            return std::move( original );
        }
    };

    template < std::size_t Index >
    Result< std::variant_alternative_t< Index, Value::Storage >, ConversionError > Value::_into( const char *attempted ) &&
    {
        if ( auto *held = std::get_if< Index >( &storage_ ) )
            return std::move( *held );

        return ConversionError { std::move( *this ), attempted };
    }

    inline Result< mp_i64, ConversionError > Value::into_int( ) &&
    {
        return std::move( *this )._into< 1 >( "int" );
    }

    inline Result< mp_u64, ConversionError > Value::into_uint( ) &&
    {
        return std::move( *this )._into< 2 >( "uint" );
    }

    inline Result< mp_i64, ConversionError > Value::into_some_int( ) &&
    {
        if ( const auto *held = as_uint ( ) )
            return static_cast< mp_i64 >( *held );

        return std::move( *this ).into_int ( );
    }

    inline Result< double, ConversionError > Value::into_float( ) &&
    {
        return std::move( *this )._into< 3 >( "float" );
    }

    inline Result< bool, ConversionError > Value::into_boolean( ) &&
    {
        return std::move( *this )._into< 4 >( "boolean" );
    }

    inline Result< std::string, ConversionError > Value::into_string( ) &&
    {
        return std::move( *this )._into< 5 >( "string" );
    }

    inline Result< Bytes, ConversionError > Value::into_binary( ) &&
    {
        return std::move( *this )._into< 6 >( "binary" );
    }

    inline Result< Array, ConversionError > Value::into_array( ) &&
    {
        return std::move( *this )._into< 7 >( "array" );
    }

    inline Result< Map, ConversionError > Value::into_map( ) &&
    {
        return std::move( *this )._into< 8 >( "map" );
    }

    inline Result< Extension, ConversionError > Value::into_extension( ) &&
    {
        return std::move( *this )._into< 9 >( "extension" );
    }
}
