/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#include "utility.hpp"

#include "contract.hpp"
#include "error/master.hpp"

#include <range/v3/algorithm/all_of.hpp>

#include <cctype>
#include <limits>
#include <string>

namespace grove {

auto trim( std::string_view const s )
    -> std::string_view
{
    auto const is_space = []( char const c ){ return std::isspace( static_cast< unsigned char >( c ) ) != 0; };
    auto first = std::size_t{ 0 };
    auto last = s.size();

    while( first < last && is_space( s[ first ] ) )
    {
        ++first;
    }
    while( last > first && is_space( s[ last - 1 ] ) )
    {
        --last;
    }

    return s.substr( first, last - first );
}

auto to_uint32( std::string_view const s )
    -> Result< uint32_t >
{
    auto rv = GROVE_MAKE_RESULT( uint32_t );

    BC_CONTRACT()
        BC_POST([ & ]
        {
            if( rv )
            {
                BC_ASSERT( std::to_string( rv.value() ).size() <= s.size() );
            }
        })
    ;

    auto const is_digit = []( char const c ){ return std::isdigit( static_cast< unsigned char >( c ) ) != 0; };

    // stoull alone would accept signs, leading whitespace, and trailing garbage.
    GROVE_ENSURE_MSG( !s.empty() && ranges::all_of( s, is_digit )
                    , error_code::common::conversion_failed
                    , fmt::format( "not an unsigned integer: '{}'", s ) );

    try
    {
        auto const v = std::stoull( std::string{ s } );

        GROVE_ENSURE_MSG( v <= std::numeric_limits< uint32_t >::max()
                        , error_code::common::conversion_failed
                        , fmt::format( "out of range: '{}'", s ) );

        rv = static_cast< uint32_t >( v );
    }
    catch( std::out_of_range const& e )
    {
        rv = GROVE_MAKE_ERROR_MSG( error_code::common::conversion_failed, e.what() );
    }

    return rv;
}

} // namespace grove
