/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#pragma once
#ifndef GROVE_NODE_HPP
#define GROVE_NODE_HPP

#include "common.hpp"
#include "content.hpp"
#include "error/tree.hpp"

#include <boost/container_hash/hash.hpp>
#include <range/v3/view/filter.hpp>

#include <string>
#include <unordered_map>
#include <utility>

namespace grove {

/**
 * @brief One arena slot of a Tree.
 *
 * A node knows other nodes only by Handle. `children` keeps sibling order; a severed child leaves `null_handle` in
 * its slot so that the `position` of every other sibling stays valid.
 */
template< NodeContent C >
class Node
{
public:
    using ChildIndex = std::unordered_map< std::string
                                         , Handle
                                         , boost::hash< std::string > >;

    Node( C content
        , std::size_t const level )
        : content_{ std::move( content ) }
        , level_{ level }
    {
    }
    Node( C content
        , std::size_t const level
        , Handle const parent
        , std::size_t const position )
        : content_{ std::move( content ) }
        , level_{ level }
        , parent_{ parent }
        , position_{ position }
    {
    }

    auto add_child( std::string const& name
                  , Handle const handle )
        -> void
    {
        children_.emplace_back( handle );
        child_index_.insert_or_assign( name, handle );
    }
    auto remove_child( std::string const& name
                     , std::size_t const position )
        -> void
    {
        if( position < children_.size() )
        {
            if( auto const it = child_index_.find( name )
              ; it != child_index_.end() && it->second == children_[ position ] )
            {
                child_index_.erase( it );
            }

            children_[ position ] = null_handle;
        }
    }
    auto update_child( std::string const& old_name
                     , std::string const& new_name )
        -> Result< Handle >
    {
        auto rv = GROVE_MAKE_RESULT( Handle );
        auto const it = child_index_.find( old_name );

        GROVE_ENSURE_MSG( it != child_index_.end()
                        , error_code::tree::child_not_found
                        , fmt::format( "no child named '{}'", old_name ) );

        auto const handle = it->second;

        child_index_.erase( it );
        child_index_.insert_or_assign( new_name, handle );

        rv = handle;

        return rv;
    }
    [[ nodiscard ]]
    auto fetch_child( std::string const& name ) const
        -> Optional< Handle >
    {
        if( auto const it = child_index_.find( name )
          ; it != child_index_.end() )
        {
            return it->second;
        }
        else
        {
            return nullopt;
        }
    }
    [[ nodiscard ]]
    auto has_child( std::string const& name ) const
        -> bool
    {
        return child_index_.contains( name );
    }

    auto content() const
        -> C const&
    {
        return content_;
    }
    auto content( C content )
        -> void
    {
        content_ = std::move( content );
    }
    auto level() const
        -> std::size_t
    {
        return level_;
    }
    auto parent() const
        -> Optional< Handle >
    {
        return parent_;
    }
    auto position() const
        -> Optional< std::size_t >
    {
        return position_;
    }
    auto is_root() const
        -> bool
    {
        return !parent_;
    }
    /// Raw child slots, severed ones included.
    auto children() const
        -> HandleVec const&
    {
        return children_;
    }
    auto num_children() const
        -> std::size_t
    {
        return children_.size();
    }
    auto live_children() const
    {
        return children_
             | ranges::views::filter( []( Handle const h ){ return h != null_handle; } );
    }
    auto child_index() const
        -> ChildIndex const&
    {
        return child_index_;
    }

private:
    C content_;
    std::size_t level_ = {};
    Optional< Handle > parent_ = {};
    Optional< std::size_t > position_ = {};
    HandleVec children_ = {};
    ChildIndex child_index_ = {};
};

} // namespace grove

#endif // GROVE_NODE_HPP
