/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#include "error/master.hpp"

#include <range/v3/view/enumerate.hpp>

#include <string>

namespace grove {

auto log_gtry_line( std::string const& func
                  , uint32_t const& line
                  , std::string const& file )
    -> void
{
    auto const sep = file.find_last_of( '/' );
    auto const filename = ( sep == std::string::npos ) ? file : file.substr( sep + 1 );

    fmt::print( stderr, "[log.line] {}|{}|{}\n", func, line, filename );
}

} // namespace grove

namespace grove::error_code {

auto to_string( Payload const& sp )
    -> std::string
{
    auto rv = fmt::format( "category: {}\nitem: {}\nresult stack:\n"
                         , sp.ec.category().name()
                         , sp.ec.message() );

    for( auto const& [ index, e ] : sp.stack | ranges::views::enumerate )
    {
        rv += fmt::format( "-------stack_item[{}]-------\n\tmessage: {}\n{}|{}|{}\n"
                         , index
                         , e.message
                         , e.line
                         , e.function
                         , e.file );
    }

    return rv;
}

auto throw_payload( Payload const& payload )
    -> void
{
    auto const what = to_string( payload );

#if GROVE_DEBUG
    if( log_exceptions )
    {
        fmt::print( stderr, "exception:\n{}\n", what );
    }
#endif // GROVE_DEBUG

    throw std::runtime_error( what );
}

} // namespace grove::error_code
