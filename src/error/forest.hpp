/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#pragma once
#ifndef GROVE_EC_FOREST_HPP
#define GROVE_EC_FOREST_HPP

#include "../common.hpp"

namespace grove::error_code
{

enum class forest
{
    success = 0
,   tree_id_already_exists
,   tree_id_parse_failed
,   tree_not_found
};

} // namespace grove::error_code

namespace boost::system
{

template <>
struct is_error_code_enum< grove::error_code::forest > : std::true_type
{
};

} // namespace boost::system

namespace grove::error_code::detail
{

class forest_category : public boost::system::error_category
{
public:
    // Return a short descriptive name for the category
    virtual const char* name() const noexcept override final { return "forest error"; }
    // Return what each enum means in text
    virtual std::string message( int c ) const override final
    {
        using namespace grove::error_code;

        switch ( static_cast< forest >( c ) )
        {
        case forest::success: return "success";
        case forest::tree_id_already_exists: return "tree ID already exists";
        case forest::tree_id_parse_failed: return "tree ID parse failed";
        case forest::tree_not_found: return "tree not found";
        }

        return "unknown forest error";
    }
};

} // namespace grove::error_code::detail

// Note: Ensure this is in global scope
extern inline
auto forest_category()
    -> grove::error_code::detail::forest_category const&
{
  static grove::error_code::detail::forest_category c;

  return c;
}

namespace grove::error_code
{

inline
auto make_error_code( forest ec )
    -> boost::system::error_code
{
  return { static_cast< int >( ec )
         , ::forest_category() };
}

} // namespace grove::error_code

#endif // GROVE_EC_FOREST_HPP
