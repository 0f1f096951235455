/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#pragma once
#ifndef GROVE_FOREST_HPP
#define GROVE_FOREST_HPP

#include "common.hpp"
#include "content.hpp"
#include "error/forest.hpp"
#include "tree.hpp"
#include "tree_id.hpp"
#include "util/result.hpp"

#include <boost/container_hash/hash.hpp>
#include <fmt/format.h>

#include <functional>
#include <string_view>
#include <unordered_map>
#include <utility>

namespace grove {

/**
 * @brief Owns a set of trees, each under a unique identifier.
 *
 * Identifiers are given as text and parsed through `Id::parse` on every call; two texts naming the same id refer to
 * the same tree.
 */
template< TreeId Id = TreeName
        , NodeContent C = RawContent >
class Forest
{
public:
    using id_type = Id;
    using tree_type = Tree< C >;
    using TreeMap = std::unordered_map< Id
                                      , Tree< C >
                                      , boost::hash< Id > >;

    /// Inserts an empty tree.
    auto create( std::string_view const id )
        -> Result< void >
    {
        return add( id, Tree< C >{} );
    }
    auto add( std::string_view const id
            , Tree< C > tree )
        -> Result< void >
    {
        GM_RESULT_PROLOG();
        GM_RESULT_PUSH_STR( "id", id );

        auto rv = GROVE_MAKE_RESULT( void );
        auto key = GTRY( parse_id( id ) );

        GROVE_ENSURE_MSG( !trees_.contains( key )
                        , error_code::forest::tree_id_already_exists
                        , fmt::format( "tree '{}' already exists", key.id() ) );

        GROVE_LOG_MSG( "forest", fmt::format( "add: '{}' with {} nodes", key.id(), tree.node_count() ) );

        trees_.emplace( std::move( key ), std::move( tree ) );

        rv = outcome::success();

        return rv;
    }
    /// Takes the tree out of the forest.
    auto remove( std::string_view const id )
        -> Result< Tree< C > >
    {
        GM_RESULT_PROLOG();
        GM_RESULT_PUSH_STR( "id", id );

        auto rv = GROVE_MAKE_RESULT( Tree< C > );
        auto const key = GTRY( parse_id( id ) );
        auto it = trees_.find( key );

        GROVE_ENSURE_MSG( it != trees_.end()
                        , error_code::forest::tree_not_found
                        , fmt::format( "no tree '{}'", key.id() ) );

        rv = std::move( it->second );

        trees_.erase( it );

        GROVE_LOG_MSG( "forest", fmt::format( "remove: '{}'", key.id() ) );

        return rv;
    }
    auto get( std::string_view const id ) const
        -> Result< std::reference_wrapper< Tree< C > const > >
    {
        auto rv = GROVE_MAKE_RESULT( std::reference_wrapper< Tree< C > const > );
        auto const key = GTRY( parse_id( id ) );

        if( auto const it = trees_.find( key )
          ; it != trees_.end() )
        {
            rv = std::cref( it->second );
        }
        else
        {
            rv = GROVE_MAKE_ERROR_MSG( error_code::forest::tree_not_found, fmt::format( "no tree '{}'", key.id() ) );
        }

        return rv;
    }
    auto get_mut( std::string_view const id )
        -> Result< std::reference_wrapper< Tree< C > > >
    {
        auto rv = GROVE_MAKE_RESULT( std::reference_wrapper< Tree< C > > );
        auto const key = GTRY( parse_id( id ) );

        if( auto const it = trees_.find( key )
          ; it != trees_.end() )
        {
            rv = std::ref( it->second );
        }
        else
        {
            rv = GROVE_MAKE_ERROR_MSG( error_code::forest::tree_not_found, fmt::format( "no tree '{}'", key.id() ) );
        }

        return rv;
    }
    auto contains( std::string_view const id ) const
        -> bool
    {
        if( auto const key = Id::parse( id )
          ; key )
        {
            return trees_.contains( key.value() );
        }
        else
        {
            return false;
        }
    }
    /// All (id, tree) pairs, in no particular order.
    auto iterate() const
        -> TreeMap const&
    {
        return trees_;
    }
    auto size() const
        -> std::size_t
    {
        return trees_.size();
    }
    auto empty() const
        -> bool
    {
        return trees_.empty();
    }

private:
    // Id rejections are reported as tree_id_parse_failed whatever category the id type used.
    static auto parse_id( std::string_view const id )
        -> Result< Id >
    {
        auto rv = GROVE_MAKE_RESULT( Id );

        if( auto parsed = Id::parse( id )
          ; parsed )
        {
            rv = std::move( parsed ).value();
        }
        else
        {
            auto payload = parsed.error();

            payload.ec = make_error_code( error_code::forest::tree_id_parse_failed );
            payload.stack.emplace_back( GROVE_MAKE_RESULT_STACK_ELEM_MSG( fmt::format( "rejected tree id: '{}'", id ) ) );

            rv = std::move( payload );
        }

        return rv;
    }

    TreeMap trees_ = {};
};

} // namespace grove

#endif // GROVE_FOREST_HPP
