/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#pragma once
#ifndef GROVE_UTILITY_HPP
#define GROVE_UTILITY_HPP

#include "common.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace grove {

namespace util
{
    template< typename... Ts > struct Dispatch : Ts... { using Ts::operator()...; };
    template< typename... Ts > Dispatch( Ts... ) -> Dispatch< Ts... >; // Deducation guide.
}

auto trim( std::string_view const s )
    -> std::string_view;
auto to_uint32( std::string_view const s )
    -> Result< uint32_t >;

} // namespace grove

#endif // GROVE_UTILITY_HPP
