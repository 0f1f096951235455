/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#pragma once
#ifndef GROVE_UTIL_RESULT_HPP
#define GROVE_UTIL_RESULT_HPP

#include <common.hpp>
#include <util/log/log.hpp>

#include <boost/json.hpp>

#include <string>
#include <variant>
#include <vector>

// Opens a function's breadcrumb log. While call stack capture is on, the function gets a frame and pushed values
// land in it.
#define GM_RESULT_PROLOG() \
    auto gm_result_local_state = grove::result::LocalState{};
#define GM_RESULT_PUSH_HANDLE( name, handle ) \
    gm_result_local_state.log.push( { name, grove::Handle{ handle } } );
#define GM_RESULT_PUSH_STR( name, str ) \
    gm_result_local_state.log.push( { name, std::string{ str } } );

namespace grove::result {

class LocalLog
{
public:
    struct Entry
    {
        std::string key = {};
        std::variant< std::string, Handle > value = {};
    };

    LocalLog() = default;
#if GROVE_LOG
    LocalLog( const char* function
            , const char* file
            , unsigned line );
#endif // GROVE_LOG

    auto push( Entry const& entry )
        -> void;
    auto values() const
        -> std::vector< Entry > const&;

private:
    std::vector< Entry > entries_ = {};
#if GROVE_LOG
    util::log::ScopedFunctionLog scoped_log_;
#endif // GROVE_LOG
};

struct LocalState
{
#if GROVE_LOG
    LocalState( const char* function = __builtin_FUNCTION()
              , const char* file = __builtin_FILE()
              , unsigned line = __builtin_LINE() );
#else
    LocalState() = default;
#endif // GROVE_LOG

    LocalLog log;
};

auto to_json( LocalLog const& log )
    -> boost::json::array;
/// Renders the pushed values as a JSON array of single-key objects. A null handle renders as `null`.
auto to_string( LocalLog const& log )
    -> std::string;

template< typename T >
auto value_or( Result< T > const& res
             , T const& alt )
    -> T
{
    return res ? res.value() : alt;
}

} // namespace grove::result

#endif // GROVE_UTIL_RESULT_HPP
