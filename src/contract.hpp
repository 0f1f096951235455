/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#pragma once
#ifndef GROVE_CONTRACT_HPP
#define GROVE_CONTRACT_HPP

#include <boost/contract.hpp>
#include <boost/contract_macro.hpp>
#include <fmt/format.h>

#include <exception>

#define BC_CONTRACT( ... ) BOOST_CONTRACT_FUNCTION( __VA_ARGS__ )
#define BC_POST( ... ) BOOST_CONTRACT_POSTCONDITION( __VA_ARGS__ )
#define BC_ASSERT( ... ) BOOST_CONTRACT_ASSERT( __VA_ARGS__ )

namespace grove {

// A broken postcondition terminates, except in a destructor, where it is reported and dropped.
inline
auto configure_contract_failure_handlers()
    -> void
{
    boost::contract::set_postcondition_failure( []( boost::contract::from const where )
    {
        if( where == boost::contract::from_destructor )
        {
            fmt::print( stderr, "[contract] ignoring destructor postcondition failure\n" );
        }
        else
        {
            std::terminate();
        }
    } );
}

} // namespace grove

#endif // GROVE_CONTRACT_HPP
