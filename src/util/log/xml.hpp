/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#pragma once
#ifndef GROVE_UTIL_LOG_XML_HPP
#define GROVE_UTIL_LOG_XML_HPP

#if GROVE_LOG

#include <common.hpp>

#include <boost/property_tree/ptree.hpp>

#include <string>

namespace grove::util::log {

auto to_xml( std::string const& x )
    -> boost::property_tree::ptree;
// Null handles render as <handle>null</handle>.
auto to_xml( Handle const& x )
    -> boost::property_tree::ptree;

} // namespace grove::util::log

#endif // GROVE_LOG

#endif // GROVE_UTIL_LOG_XML_HPP
