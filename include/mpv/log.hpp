#pragma once

#include <memory>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

/*
 * Library logging. Records go to the spdlog logger named "mpv". An application that wants
 * them elsewhere registers its own logger under that name before the first decode, or
 * adjusts the level through `mpv::log::set_level`.
 *
 * Define `MPV_NO_LOGGING` to compile every record out.
 */

namespace mpv::log
{
    constexpr auto logger_name = "mpv";

    /**
     * @brief The library logger. Reuses a logger registered as "mpv" if one exists when this
     * is first called, otherwise creates a stderr logger at `warn` level.
     * @return spdlog::logger&
     */
    inline spdlog::logger &get( )
    {
        static const std::shared_ptr< spdlog::logger > logger = [ ]
        {
            if ( auto registered = spdlog::get( logger_name ) )
                return registered;

            auto created = std::make_shared< spdlog::logger >(
                logger_name,
                std::make_shared< spdlog::sinks::stderr_color_sink_mt > ( )
            );

            created->set_level( spdlog::level::warn );

            return created;
        }( );

        return *logger;
    }

    inline void set_level( const spdlog::level::level_enum level )
    {
        get ( ).set_level( level );
    }
}

#ifdef MPV_NO_LOGGING
#define MPV_LOG_TRACE( ... ) ( void ) 0
#define MPV_LOG_DEBUG( ... ) ( void ) 0
#else
#define MPV_LOG_TRACE( ... ) ( ::mpv::log::get ( ).trace( __VA_ARGS__ ) )
#define MPV_LOG_DEBUG( ... ) ( ::mpv::log::get ( ).debug( __VA_ARGS__ ) )
#endif
