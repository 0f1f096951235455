/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#pragma once
#ifndef GROVE_COMMON_HPP
#define GROVE_COMMON_HPP

#include "error/master.hpp"
#include <util/log/log.hpp> // Make logging common to all.

#include <boost/container_hash/hash.hpp>
#include <boost/optional.hpp>
#include <boost/optional/optional_io.hpp>
#include <boost/outcome.hpp>

#include <cstddef>
#include <limits>
#include <map>
#include <string>
#include <vector>

namespace grove {

using StringVec = std::vector< std::string >;
using Handle = std::size_t;
using HandleVec = std::vector< Handle >;
using HandleMap = std::map< Handle, Handle >;
template< typename T > using Optional = boost::optional< T >;
template< typename T > using Result = error_code::Result< T >;
inline auto const nullopt = boost::none; // To be replaced by std::nullopt if boost::optional is replaced with std::optional.

// Marks a severed slot in a parent's children sequence.
inline constexpr Handle null_handle = std::numeric_limits< Handle >::max();
inline constexpr Handle root_handle = 0;

} // namespace grove

#endif // GROVE_COMMON_HPP
