/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#pragma once
#ifndef GROVE_TREE_ID_HPP
#define GROVE_TREE_ID_HPP

#include "common.hpp"

#include <boost/container_hash/hash.hpp>

#include <concepts>
#include <string>
#include <string_view>

namespace grove {

/**
 * @brief Key type of a Forest: fallibly parsed from text, compared and hashed by its canonical id string.
 */
template< typename T >
concept TreeId = std::equality_comparable< T >
              && requires( std::string_view raw
                         , T const& t )
{
    { T::parse( raw ) } -> std::same_as< Result< T > >;
    { t.id() } -> std::convertible_to< std::string const& >;
    { boost::hash< T >{}( t ) } -> std::convertible_to< std::size_t >;
};

template< typename T >
auto equals_by_id( T const& lhs
                 , T const& rhs )
    -> bool
{
    return lhs.id() == rhs.id();
}

template< typename T >
auto hash_by_id( T const& t )
    -> std::size_t
{
    return boost::hash< std::string >{}( t.id() );
}

/// Default tree identifier: any non-empty text without leading or trailing whitespace.
class TreeName
{
public:
    static auto parse( std::string_view const raw )
        -> Result< TreeName >;

    auto id() const
        -> std::string const&;

    friend auto operator==( TreeName const& lhs
                          , TreeName const& rhs )
        -> bool
    {
        return equals_by_id( lhs, rhs );
    }

private:
    explicit TreeName( std::string_view const raw );

    std::string name_;
};

auto hash_value( TreeName const& name )
    -> std::size_t;

} // namespace grove

#endif // GROVE_TREE_ID_HPP
