/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#pragma once
#ifndef GROVE_EC_MASTER_HPP
#define GROVE_EC_MASTER_HPP

#include <boost/outcome.hpp>
#include <boost/system/error_code.hpp>
#include <fmt/format.h>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

#define GROVE_MAKE_RESULT_STACK_ELEM_MSG( msg ) \
    grove::error_code::StackElement{ __LINE__, __PRETTY_FUNCTION__, __FILE__, ( msg ) }
#define GROVE_MAKE_ERROR_MSG( ec, msg ) \
    grove::error_code::Payload{ ( ec ), { GROVE_MAKE_RESULT_STACK_ELEM_MSG( msg ) } }
// A Result that reads as failed until something assigns it.
#define GROVE_MAKE_RESULT( type ) \
    grove::error_code::Result< type >{ GROVE_MAKE_ERROR_MSG( grove::error_code::common::uncategorized, "" ) }
#define GROVE_ENSURE_MSG( pred, ec, msg ) \
    { \
        if( !( pred ) ) \
        { \
            return GROVE_MAKE_ERROR_MSG( ( ec ), fmt::format( "predicate: {}\n\tmessage: {}", #pred, ( msg ) ) ); \
        } \
    }
#define GROVE_ENSURE( pred, ec ) GROVE_ENSURE_MSG( pred, ec, "" )

#if GROVE_LOG_GTRY
    #define GROVE_GTRY_LOG() grove::log_gtry_line( __FUNCTION__, __LINE__, __FILE__ )
#else
    #define GROVE_GTRY_LOG()
#endif // GROVE_LOG_GTRY

// Unwraps a Result or returns its failure from the enclosing function, one stack element the richer.
#define GTRY( ... ) \
    ({ \
        GROVE_GTRY_LOG(); \
        auto&& res = ( __VA_ARGS__ ); \
        if( !BOOST_OUTCOME_V2_NAMESPACE::try_operation_has_value( res ) ) \
        { \
            res.error().stack.emplace_back( GROVE_MAKE_RESULT_STACK_ELEM_MSG( "" ) ); \
            return BOOST_OUTCOME_V2_NAMESPACE::try_operation_return_as( static_cast< decltype( res )&& >( res ) ); \
        } \
        BOOST_OUTCOME_V2_NAMESPACE::try_operation_extract_value( static_cast< decltype( res )&& >( res ) ); \
    })
// As GTRY, but a failure is thrown as std::runtime_error. For top-level code that has nowhere to return to.
#define GTRYE( ... ) \
    ({ \
        auto&& res = ( __VA_ARGS__ ); \
        if( !BOOST_OUTCOME_V2_NAMESPACE::try_operation_has_value( res ) ) \
        { \
            res.error().stack.emplace_back( GROVE_MAKE_RESULT_STACK_ELEM_MSG( "" ) ); \
            grove::error_code::throw_payload( res.error() ); \
        } \
        BOOST_OUTCOME_V2_NAMESPACE::try_operation_extract_value( static_cast< decltype( res )&& >( res ) ); \
    })

#if GROVE_DEBUG
    #define GROVE_DISABLE_EXCEPTION_LOG_SCOPED() \
        auto const disable_exception_log = grove::error_code::ScopedExceptionLogPause{}
#else
    #define GROVE_DISABLE_EXCEPTION_LOG_SCOPED() (void)0
#endif // GROVE_DEBUG

namespace outcome = BOOST_OUTCOME_V2_NAMESPACE;

namespace grove::error_code {

struct StackElement
{
    uint32_t line = {};
    std::string function = {};
    std::string file = {};
    std::string message = {};
};

struct Payload
{
    boost::system::error_code ec = {};
    std::vector< StackElement > stack = {};
};

template< typename T >
using Result = outcome::result< T, Payload >;

enum class common
{
    uncategorized = 1 // 0 means success to boost::system.
,   conversion_failed
};

inline auto log_exceptions = true;

// Silences GROVE_DEBUG's stderr dump of thrown payloads for the life of the object.
struct ScopedExceptionLogPause
{
    bool prev = log_exceptions;

    ScopedExceptionLogPause() { log_exceptions = false; }
    ~ScopedExceptionLogPause() { log_exceptions = prev; }
};

auto to_string( Payload const& sp )
    -> std::string;

[[ noreturn ]]
auto throw_payload( Payload const& payload )
    -> void;

inline
auto make_error_code( Payload const& sp )
    -> boost::system::error_code
{
     return sp.ec;
}

// Found by Outcome through ADL when value() is called on a failed Result.
inline
auto outcome_throw_as_system_error_with_payload( Payload const& payload )
    -> void
{
    throw_payload( payload );
}

} // namespace grove::error_code

namespace boost::system {

template <>
struct is_error_code_enum< grove::error_code::common > : std::true_type
{
};

} // namespace boost::system

namespace grove::error_code {

namespace detail {

class common_category : public boost::system::error_category
{
public:
    const char* name() const noexcept override final { return "common error"; }
    std::string message( int c ) const override final
    {
        switch( static_cast< common >( c ) )
        {
        case common::uncategorized: return "uncategorized";
        case common::conversion_failed: return "conversion failed";
        }

        return "unknown common error";
    }
};

} // namespace detail

inline
auto common_category()
    -> detail::common_category const&
{
    static detail::common_category c;

    return c;
}

inline
auto make_error_code( common ec )
    -> boost::system::error_code
{
    return { static_cast< int >( ec ), common_category() };
}

} // namespace grove::error_code

namespace grove {

auto log_gtry_line( std::string const& func
                  , uint32_t const& line
                  , std::string const& file )
    -> void;

} // namespace grove

#endif // GROVE_EC_MASTER_HPP
