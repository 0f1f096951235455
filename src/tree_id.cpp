/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#include "tree_id.hpp"

#include "error/forest.hpp"
#include "utility.hpp"

namespace grove {

TreeName::TreeName( std::string_view const raw )
    : name_{ raw }
{
}

auto TreeName::parse( std::string_view const raw )
    -> Result< TreeName >
{
    GROVE_ENSURE_MSG( !raw.empty()
                    , error_code::forest::tree_id_parse_failed
                    , "empty tree name" );
    GROVE_ENSURE_MSG( trim( raw ).size() == raw.size()
                    , error_code::forest::tree_id_parse_failed
                    , fmt::format( "surrounding whitespace in tree name '{}'", raw ) );

    return TreeName{ raw };
}

auto TreeName::id() const
    -> std::string const&
{
    return name_;
}

auto hash_value( TreeName const& name )
    -> std::size_t
{
    return hash_by_id( name );
}

} // namespace grove
