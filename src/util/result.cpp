/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#include <util/result.hpp>

#include <util/log/xml.hpp>
#include <utility.hpp>

#include <boost/json.hpp>

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace grove::result {

#if GROVE_LOG
LocalLog::LocalLog( const char* function
                  , const char* file
                  , unsigned line )
    : scoped_log_{ function, file, line }
{
}

LocalState::LocalState( const char* function
                      , const char* file
                      , unsigned line )
    : log{ function, file, line }
{
}
#endif // GROVE_LOG

auto LocalLog::push( Entry const& entry )
    -> void
{
#if GROVE_LOG
    auto& linst = util::log::Singleton::instance();

    if( linst.flags.enable_logging
     && linst.flags.enable_call_stack )
    {
        auto value = util::log::CallStack::Node{};

        value.put( "<xmlattr>.key", entry.key );
        value.put_child( "value", std::visit( []( auto const& e ){ return util::log::to_xml( e ); }, entry.value ) );

        linst.call_stack.add( "fvalue", value );
    }
#endif // GROVE_LOG

    entries_.emplace_back( entry );
}

auto LocalLog::values() const
    -> std::vector< Entry > const&
{
    return entries_;
}

auto to_json( LocalLog const& log )
    -> boost::json::array
{
    auto rv = boost::json::array{};

    for( auto const& entry : log.values() )
    {
        auto obj = boost::json::object{};

        std::visit( util::Dispatch
                    {
                        [ & ]( std::string const& arg )
                        {
                            obj[ entry.key ] = arg;
                        }
                    ,   [ & ]( Handle const& arg )
                        {
                            if( arg == null_handle )
                            {
                                obj[ entry.key ] = nullptr;
                            }
                            else
                            {
                                obj[ entry.key ] = static_cast< std::uint64_t >( arg );
                            }
                        }
                    }
                  , entry.value );

        rv.emplace_back( std::move( obj ) );
    }

    return rv;
}

auto to_string( LocalLog const& log )
    -> std::string
{
    return boost::json::serialize( to_json( log ) );
}

} // namespace grove::result
