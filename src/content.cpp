/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#include "content.hpp"

#include "contract.hpp"
#include "error/tree.hpp"
#include "utility.hpp"

#include <range/v3/algorithm/count.hpp>

namespace grove {

RawContent::RawContent( std::string_view const raw )
    : content_{ raw }
{
}

auto RawContent::parse( std::string_view const raw )
    -> Result< RawContent >
{
    return RawContent{ raw };
}

auto RawContent::value() const
    -> std::string const&
{
    return content_;
}

WeightedContent::WeightedContent( uint32_t const weight
                                , std::string_view const text )
    : weight_{ weight }
    , text_{ text }
{
}

auto WeightedContent::parse( std::string_view const raw )
    -> Result< WeightedContent >
{
    auto rv = GROVE_MAKE_RESULT( WeightedContent );

    BC_CONTRACT()
        BC_POST([ & ]
        {
            if( rv )
            {
                BC_ASSERT( rv.value().serialize().find( rv.value().value() ) != std::string::npos );
            }
        })
    ;

    GROVE_ENSURE_MSG( ranges::count( raw, separator ) == 1
                    , error_code::tree::content_parse_failed
                    , fmt::format( "expected exactly one '{}' in '{}'", separator, raw ) );

    auto const sep = raw.find( separator );

    if( auto const weight = to_uint32( trim( raw.substr( 0, sep ) ) )
      ; weight )
    {
        rv = WeightedContent{ weight.value(), raw.substr( sep + 1 ) };
    }
    else
    {
        rv = GROVE_MAKE_ERROR_MSG( error_code::tree::content_parse_failed
                                 , fmt::format( "invalid weight in '{}'", raw ) );
    }

    return rv;
}

auto WeightedContent::value() const
    -> std::string const&
{
    return text_;
}

auto WeightedContent::weight() const
    -> uint32_t
{
    return weight_;
}

auto WeightedContent::serialize() const
    -> std::string
{
    return fmt::format( "{}{}{}", weight_, separator, text_ );
}

} // namespace grove
