/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#pragma once
#ifndef GROVE_EC_TREE_HPP
#define GROVE_EC_TREE_HPP

#include "../common.hpp"

namespace grove::error_code
{

enum class tree
{
    success = 0
,   child_already_exists
,   child_not_found
,   content_parse_failed
,   invalid_root
,   node_not_found
,   parent_not_found
,   root_already_exists
};

} // namespace grove::error_code

namespace boost::system
{

template <>
struct is_error_code_enum< grove::error_code::tree > : std::true_type
{
};

} // namespace boost::system

namespace grove::error_code::detail
{

class tree_category : public boost::system::error_category
{
public:
    // Return a short descriptive name for the category
    virtual const char* name() const noexcept override final { return "tree error"; }
    // Return what each enum means in text
    virtual std::string message( int c ) const override final
    {
        using namespace grove::error_code;

        switch ( static_cast< tree >( c ) )
        {
        case tree::success: return "success";
        case tree::child_already_exists: return "child already exists";
        case tree::child_not_found: return "child not found";
        case tree::content_parse_failed: return "content parse failed";
        case tree::invalid_root: return "invalid root; operation requires a parent";
        case tree::node_not_found: return "node not found";
        case tree::parent_not_found: return "parent not found";
        case tree::root_already_exists: return "root already exists";
        }

        return "unknown tree error";
    }
};

} // namespace grove::error_code::detail

// Note: Ensure this is in global scope
extern inline
auto tree_category()
    -> grove::error_code::detail::tree_category const&
{
  static grove::error_code::detail::tree_category c;

  return c;
}

namespace grove::error_code
{
// Note: make_error_code must be declared in same namespace as enum, for ADL.

inline
auto make_error_code( tree ec )
    -> boost::system::error_code
{
  return { static_cast< int >( ec )
         , ::tree_category() };
}

} // namespace grove::error_code

#endif // GROVE_EC_TREE_HPP
