/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#include <util/log/log.hpp>

#if GROVE_LOG

#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>
#include <fmt/format.h>

#include <fstream>

namespace grove::util::log {

CallStack::CallStack()
    : current_{ root_.put( "log.callstack", "" ) }
{
}

auto CallStack::add( std::string const& name
                   , Node const& node )
    -> void
{
    current_.get().add_child( name, node );
}

auto CallStack::enter( std::string const& name
                     , Node const& node )
    -> Node&
{
    auto& prev = current_.get();

    current_ = prev.add_child( name, node );

    return prev;
}

auto CallStack::leave( Node& frame )
    -> void
{
    current_ = frame;
}

auto CallStack::current()
    -> Node&
{
    return current_;
}

auto CallStack::reset()
    -> void
{
    root_.clear();
    current_ = root_.put( "log.callstack", "" );
}

auto CallStack::root() const
    -> Node const&
{
    return root_;
}

auto GlobalState::push( std::string const& tags
                      , std::string const& msg )
    -> void
{
    if( flags.enable_logging )
    {
        fmt::print( "[log][{}] {}\n", tags, msg );
    }
}

std::unique_ptr< GlobalState > Singleton::inst_ = {};

GlobalState& Singleton::instance()
{
    if( !inst_ )
    {
        inst_ = std::make_unique< GlobalState >();
    }

    return *inst_;
}

ScopedFunctionLog::ScopedFunctionLog( const char* function
                                    , const char* file
                                    , unsigned line )
{
    auto& linst = Singleton::instance();

    if( linst.flags.enable_logging
     && linst.flags.enable_call_stack )
    {
        auto frame = CallStack::Node{};

        frame.put( "<xmlattr>.function", function );
        frame.put( "<xmlattr>.line", line );
        frame.put( "<xmlattr>.file", file );

        parent_ = &linst.call_stack.enter( "call", frame );
    }
}

ScopedFunctionLog::~ScopedFunctionLog()
{
    auto& linst = Singleton::instance();

    if( parent_
     && linst.flags.enable_call_stack )
    {
        linst.call_stack.leave( *parent_ );
    }
}

ScopedPauser::ScopedPauser()
    : logging_enabled_{ GROVE_LOG_IS_ENABLED() }
{
    GROVE_LOG_DISABLE();
}

ScopedPauser::~ScopedPauser()
{
    Singleton::instance().flags.enable_logging = logging_enabled_;
}

ScopedCallStack::ScopedCallStack()
    : call_stack_enabled_{ Singleton::instance().flags.enable_call_stack }
{
    Singleton::instance().flags.enable_call_stack = true;
}

ScopedCallStack::~ScopedCallStack()
{
    auto& linst = Singleton::instance();

    linst.flags.enable_call_stack = call_stack_enabled_;

    if( call_stack_enabled_ ) // Nested: the outermost scope owns the dump.
    {
        return;
    }

    if( !linst.call_stack_file.empty() )
    {
        if( auto ofs = std::ofstream{ linst.call_stack_file }
          ; ofs.good() )
        {
            write_call_stack( ofs );
        }
        else
        {
            fmt::print( stderr, "[log] unable to open call stack file: {}\n", linst.call_stack_file );
        }
    }

    linst.call_stack.reset();
}

auto write_call_stack( std::ostream& os )
    -> void
{
    boost::property_tree::write_xml( os, Singleton::instance().call_stack.root() );
}

} // namespace grove::util::log

#endif // GROVE_LOG
