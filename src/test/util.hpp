/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#pragma once
#ifndef GROVE_TEST_UTIL_HPP
#define GROVE_TEST_UTIL_HPP

// Assumes REQUIRE halts flow on failure.
#define REQUIRE_TRY( ... ) \
    ({ \
        auto&& res = ( __VA_ARGS__ ); \
        REQUIRE( grove::test::succ( res ) ); \
        res.value(); \
    })
#define REQUIRE_RES( ... ) REQUIRE( grove::test::succ( __VA_ARGS__ ) )
#define REQUIRE_RFAIL( ... ) REQUIRE( grove::test::fail( __VA_ARGS__ ) )

#include <common.hpp>

#include <fmt/format.h>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/transform.hpp>

#include <string>
#include <vector>

namespace grove::test {

template< typename T >
auto succ( Result< T > const& res
         , const char* file = __builtin_FILE()
         , unsigned line = __builtin_LINE() )
    -> bool
{
    if( !res )
    {
        fmt::print( stderr, "Expected Result 'success' at {}:{}:\n{}\n", file, line, to_string( res.error() ) );
    }

    return static_cast< bool >( res );
}
template< typename T >
auto fail( Result< T > const& res )
    -> bool
{
    return !res;
}

/// Error code carried by a failed Result; empty on success.
template< typename T >
auto error_of( Result< T > const& res )
    -> boost::system::error_code
{
    return res ? boost::system::error_code{} : res.error().ec;
}

/// Content values of a traversal, in visiting order.
template< typename Range >
auto values( Range&& rng )
    -> std::vector< std::string >
{
    return rng
         | ranges::views::transform( []( auto const& visit ){ return visit.node->content().value(); } )
         | ranges::to< std::vector >();
}

/// Handles of a traversal, in visiting order.
template< typename Range >
auto handles( Range&& rng )
    -> std::vector< Handle >
{
    return rng
         | ranges::views::transform( []( auto const& visit ){ return visit.handle; } )
         | ranges::to< std::vector >();
}

} // namespace grove::test

#endif // GROVE_TEST_UTIL_HPP
