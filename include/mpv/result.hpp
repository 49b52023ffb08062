#pragma once

#include <cassert>
#include <type_traits>
#include <utility>
#include <variant>

#ifndef MPV_ASSERT
#define MPV_ASSERT( cond ) assert( cond )
#endif

namespace mpv
{
    /**
     * @brief Outcome of a fallible operation: either a `Ty` or an `Err`, never both.
     * @remark Test with `explicit operator bool` before calling `value( )`. Reading the side
     * that is not held is a programming error.
     */
    template < typename Ty, typename Err >
    class Result
    {
        static_assert( !std::is_same_v< Ty, Err >, "value and error types must differ." );

        std::variant< Ty, Err > storage_;

    public:
        Result( Ty value )
            : storage_( std::in_place_index< 0 >, std::move( value ) )
        {
        }

        Result( Err error )
            : storage_( std::in_place_index< 1 >, std::move( error ) )
        {
        }

        explicit operator bool( ) const
        {
            return storage_.index ( ) == 0;
        }

        bool has_value( ) const
        {
            return storage_.index ( ) == 0;
        }

        Ty &value( ) &
        {
            MPV_ASSERT( has_value ( ) );
            return *std::get_if< 0 >( &storage_ );
        }

        const Ty &value( ) const &
        {
            MPV_ASSERT( has_value ( ) );
            return *std::get_if< 0 >( &storage_ );
        }

        Ty &&value( ) &&
        {
            MPV_ASSERT( has_value ( ) );
            return std::move( *std::get_if< 0 >( &storage_ ) );
        }

        Err &error( ) &
        {
            MPV_ASSERT( !has_value ( ) );
            return *std::get_if< 1 >( &storage_ );
        }

        const Err &error( ) const &
        {
            MPV_ASSERT( !has_value ( ) );
            return *std::get_if< 1 >( &storage_ );
        }

        Err &&error( ) &&
        {
            MPV_ASSERT( !has_value ( ) );
            return std::move( *std::get_if< 1 >( &storage_ ) );
        }

        Ty *operator->( )
        {
            return &value ( );
        }

        const Ty *operator->( ) const
        {
            return &value ( );
        }
    };
}
