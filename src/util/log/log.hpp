/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#pragma once
#ifndef GROVE_UTIL_LOG_LOG_HPP
#define GROVE_UTIL_LOG_LOG_HPP

#if GROVE_LOG

#include <boost/property_tree/ptree.hpp>

#include <functional>
#include <memory>
#include <ostream>
#include <string>

    #define GROVE_LOG_ENABLE() grove::util::log::Singleton::instance().flags.enable_logging = true;
    #define GROVE_LOG_DISABLE() grove::util::log::Singleton::instance().flags.enable_logging = false;
    #define GROVE_LOG_IS_ENABLED() grove::util::log::Singleton::instance().flags.enable_logging
    #define GROVE_LOG_PAUSE_SCOPE() auto grove_log_scoped_pauser = grove::util::log::ScopedPauser{};
    #define GROVE_LOG_CALL_STACK_SCOPE() auto grove_log_scoped_call_stack = grove::util::log::ScopedCallStack{};
    #define GROVE_LOG_MSG( tags, msg ) grove::util::log::Singleton::instance().push( tags, msg );

namespace grove::util::log {

/**
 * @brief Call frames and logged values, captured as a property tree rooted at `log.callstack`.
 *
 * Frames nest under whichever frame is current; values attach to the current frame.
 */
class CallStack
{
public:
    using Node = boost::property_tree::ptree;

    CallStack();

    /// Attaches `node` under the current frame without descending into it.
    auto add( std::string const& name
            , Node const& node )
        -> void;
    /// Attaches `node` under the current frame and makes it current. Returns the frame that was current.
    auto enter( std::string const& name
              , Node const& node )
        -> Node&;
    auto leave( Node& frame )
        -> void;
    auto current()
        -> Node&;
    auto reset()
        -> void;
    auto root() const
        -> Node const&;

private:
    Node root_ = {};
    std::reference_wrapper< Node > current_;
};

class GlobalState
{
public:
    struct
    {
        bool enable_logging = false;
        bool enable_call_stack = false;
    } flags;
    CallStack call_stack = {};
    // Where the outermost ScopedCallStack writes its XML. Empty means nowhere.
    std::string call_stack_file = {};

    auto push( std::string const& tags
             , std::string const& msg )
        -> void;
};

class Singleton
{
    static std::unique_ptr< GlobalState > inst_;

public:
    static GlobalState& instance();
};

// Records a "call" frame for its lifetime while call stack capture is on.
class ScopedFunctionLog
{
    CallStack::Node* parent_ = nullptr;

public:
    ScopedFunctionLog( const char* function = __builtin_FUNCTION()
                     , const char* file = __builtin_FILE()
                     , unsigned line = __builtin_LINE() );
    ~ScopedFunctionLog();
};

class ScopedPauser
{
    bool logging_enabled_;

public:
    ScopedPauser();
    ~ScopedPauser();
};

/**
 * @brief Turns call stack capture on for its lifetime.
 *
 * When the outermost scope ends, the captured stack is written to `GlobalState::call_stack_file` (if set) and then
 * cleared, so successive scopes start from an empty stack.
 */
class ScopedCallStack
{
    bool call_stack_enabled_;

public:
    ScopedCallStack();
    ~ScopedCallStack();
};

auto write_call_stack( std::ostream& os )
    -> void;

} // namespace grove::util::log

#else // GROVE_LOG
    #define GROVE_LOG_ENABLE()
    #define GROVE_LOG_DISABLE()
    #define GROVE_LOG_IS_ENABLED() false
    #define GROVE_LOG_PAUSE_SCOPE()
    #define GROVE_LOG_CALL_STACK_SCOPE()
    #define GROVE_LOG_MSG( tags, msg )
#endif // GROVE_LOG

#endif // GROVE_UTIL_LOG_LOG_HPP
