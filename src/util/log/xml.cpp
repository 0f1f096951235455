/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#include <util/log/xml.hpp>

#if GROVE_LOG

namespace grove::util::log {

auto to_xml( std::string const& x )
    -> boost::property_tree::ptree
{
    return boost::property_tree::ptree{ x };
}

auto to_xml( Handle const& x )
    -> boost::property_tree::ptree
{
    auto n = boost::property_tree::ptree{};

    if( x == null_handle )
    {
        n.put( "handle", "null" );
    }
    else
    {
        n.put( "handle", x );
    }

    return n;
}

} // namespace grove::util::log

#endif // GROVE_LOG
