/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#pragma once
#ifndef GROVE_TREE_HPP
#define GROVE_TREE_HPP

#include "common.hpp"
#include "content.hpp"
#include "contract.hpp"
#include "error/tree.hpp"
#include "node.hpp"
#include "traversal.hpp"
#include "util/result.hpp"

#include <fmt/format.h>

#include <concepts>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace grove {

template< NodeContent C >
struct Regenerated;

/**
 * @brief Arena-backed n-ary tree.
 *
 * Nodes are addressed by Handle, their index in the arena. Nodes are only ever appended, so a handle stays valid for
 * the lifetime of the tree. `unlink` severs the arc from a node to its parent in O(1) and leaves the node and its
 * subtree in the arena; they are no longer reachable from the root. `regenerate` produces a compacted copy.
 *
 * Every mutator checks all failure conditions before touching the arena: a failed call leaves the tree unchanged.
 */
template< NodeContent C = RawContent >
class Tree
{
public:
    using content_type = C;
    using node_type = Node< C >;
    using Arena = std::vector< Node< C > >;

    auto set_root( std::string_view const raw )
        -> Result< Handle >
    {
        GM_RESULT_PROLOG();
        GM_RESULT_PUSH_STR( "raw", raw );

        auto rv = GROVE_MAKE_RESULT( Handle );

        BC_CONTRACT()
            BC_POST([ & ]
            {
                if( rv )
                {
                    BC_ASSERT( rv.value() == root_handle );
                    BC_ASSERT( nodes_.size() == 1 );
                    BC_ASSERT( nodes_[ root_handle ].level() == 1 );
                }
            })
        ;

        GROVE_ENSURE_MSG( nodes_.empty()
                        , error_code::tree::root_already_exists
                        , fmt::format( "root already holds '{}'", nodes_.empty() ? "" : nodes_[ root_handle ].content().value() ) );

        auto content = GTRY( parse_content( raw ) );

        nodes_.emplace_back( std::move( content ), 1 );

        GROVE_LOG_MSG( "tree", fmt::format( "set_root: '{}'", raw ) );

        rv = root_handle;

        return rv;
    }

    auto link( std::string_view const raw
             , Handle const parent )
        -> Result< Handle >
    {
        GM_RESULT_PROLOG();
        GM_RESULT_PUSH_STR( "raw", raw );
        GM_RESULT_PUSH_HANDLE( "parent", parent );

        auto rv = GROVE_MAKE_RESULT( Handle );

        BC_CONTRACT()
            BC_POST([ & ]
            {
                if( rv )
                {
                    auto const& n = nodes_[ rv.value() ];

                    BC_ASSERT( n.parent() && n.parent().value() == parent );
                    BC_ASSERT( n.level() == nodes_[ parent ].level() + 1 );
                    BC_ASSERT( nodes_[ parent ].children()[ n.position().value() ] == rv.value() );
                }
            })
        ;

        GROVE_ENSURE_MSG( parent < nodes_.size()
                        , error_code::tree::parent_not_found
                        , fmt::format( "parent handle {} outside arena of {}", parent, nodes_.size() ) );

        auto content = GTRY( parse_content( raw ) );

        GROVE_ENSURE_MSG( !nodes_[ parent ].has_child( content.value() )
                        , error_code::tree::child_already_exists
                        , fmt::format( "'{}' already under parent {}", content.value(), parent ) );

        auto const child = append_child( parent, std::move( content ) );

        GROVE_LOG_MSG( "tree", fmt::format( "link: '{}' under {} as {}", raw, parent, child ) );

        rv = child;

        return rv;
    }

    /**
     * Severs `node` from its parent. The node keeps its parent handle and position, and its subtree is left intact,
     * but none of it is reachable from the root anymore.
     */
    auto unlink( Handle const node )
        -> Result< Handle >
    {
        GM_RESULT_PROLOG();
        GM_RESULT_PUSH_HANDLE( "node", node );

        auto rv = GROVE_MAKE_RESULT( Handle );

        BC_CONTRACT()
            BC_POST([ & ]
            {
                if( rv )
                {
                    BC_ASSERT( !is_linked( node ) );
                }
            })
        ;

        GROVE_ENSURE_MSG( node < nodes_.size()
                        , error_code::tree::child_not_found
                        , fmt::format( "handle {} outside arena of {}", node, nodes_.size() ) );

        auto const& target = nodes_[ node ];

        GROVE_ENSURE_MSG( !target.is_root()
                        , error_code::tree::child_not_found
                        , "the root is nobody's child" );
        GROVE_ENSURE_MSG( is_attached( node )
                        , error_code::tree::child_not_found
                        , fmt::format( "node {} already unlinked", node ) );

        auto& parent = nodes_[ target.parent().value() ];

        parent.remove_child( target.content().value(), target.position().value() );

        GROVE_LOG_MSG( "tree", fmt::format( "unlink: {} from {}", node, target.parent().value() ) );

        rv = node;

        return rv;
    }

    auto update_content( std::string_view const raw
                       , Handle const node )
        -> Result< Handle >
    {
        GM_RESULT_PROLOG();
        GM_RESULT_PUSH_STR( "raw", raw );
        GM_RESULT_PUSH_HANDLE( "node", node );

        auto rv = GROVE_MAKE_RESULT( Handle );

        BC_CONTRACT()
            BC_POST([ & ]
            {
                if( rv && !nodes_[ node ].is_root() )
                {
                    auto const& n = nodes_[ node ];

                    BC_ASSERT( nodes_[ n.parent().value() ].fetch_child( n.content().value() ) == node );
                }
            })
        ;

        GROVE_ENSURE_MSG( node < nodes_.size()
                        , error_code::tree::child_not_found
                        , fmt::format( "handle {} outside arena of {}", node, nodes_.size() ) );

        auto content = GTRY( parse_content( raw ) );
        auto& target = nodes_[ node ];

        if( auto const parent = target.parent()
          ; parent )
        {
            auto& pnode = nodes_[ parent.value() ];
            auto const& old_name = target.content().value();
            auto const& new_name = content.value();

            // The index entry must still point at this node: an unlinked node's name may since have been reused.
            GROVE_ENSURE_MSG( pnode.fetch_child( old_name ) == node
                            , error_code::tree::child_not_found
                            , fmt::format( "node {} is not indexed under parent {} as '{}'", node, parent.value(), old_name ) );

            if( old_name != new_name )
            {
                GROVE_ENSURE_MSG( !pnode.has_child( new_name )
                                , error_code::tree::child_already_exists
                                , fmt::format( "'{}' already under parent {}", new_name, parent.value() ) );

                GTRY( pnode.update_child( old_name, new_name ) );
            }
        }

        target.content( std::move( content ) );

        GROVE_LOG_MSG( "tree", fmt::format( "update_content: {} to '{}'", node, raw ) );

        rv = node;

        return rv;
    }

    /**
     * Resolves `path`, one child name per hop, starting below `start`. `path` does not include `start`'s own name;
     * an empty path resolves to `start` itself.
     */
    auto find_path( Handle const start
                  , StringVec const& path ) const
        -> Optional< Handle >
    {
        if( start >= nodes_.size() )
        {
            return nullopt;
        }

        auto current = start;

        for( auto const& name : path )
        {
            if( auto const child = nodes_[ current ].fetch_child( name )
              ; child )
            {
                current = child.value();
            }
            else
            {
                return nullopt;
            }
        }

        return current;
    }

    auto content( Handle const node ) const
        -> Optional< C const& >
    {
        if( node < nodes_.size() )
        {
            return nodes_[ node ].content();
        }
        else
        {
            return nullopt;
        }
    }
    auto node( Handle const node ) const
        -> Optional< Node< C > const& >
    {
        if( node < nodes_.size() )
        {
            return nodes_[ node ];
        }
        else
        {
            return nullopt;
        }
    }
    auto level( Handle const node ) const
        -> Optional< std::size_t >
    {
        if( node < nodes_.size() )
        {
            return nodes_[ node ].level();
        }
        else
        {
            return nullopt;
        }
    }
    auto fetch_parent( Handle const node ) const
        -> Result< Handle >
    {
        GROVE_ENSURE_MSG( node < nodes_.size()
                        , error_code::tree::node_not_found
                        , fmt::format( "handle {} outside arena of {}", node, nodes_.size() ) );
        GROVE_ENSURE( !nodes_[ node ].is_root(), error_code::tree::invalid_root );

        return nodes_[ node ].parent().value();
    }
    /// True when every arc from `node` up to the root is intact.
    auto is_linked( Handle node ) const
        -> bool
    {
        if( node >= nodes_.size() )
        {
            return false;
        }

        while( !nodes_[ node ].is_root() )
        {
            if( !is_attached( node ) )
            {
                return false;
            }

            node = nodes_[ node ].parent().value();
        }

        return node == root_handle;
    }
    auto node_count() const
        -> std::size_t
    {
        return nodes_.size();
    }
    auto empty() const
        -> bool
    {
        return nodes_.empty();
    }
    auto nodes() const
        -> Arena const&
    {
        return nodes_;
    }

    auto traverse() const
        -> Traversals< C >
    {
        return Traversals< C >{ nodes_ };
    }
    auto traverse( Handle const start ) const
        -> Traversals< C >
    {
        return Traversals< C >{ nodes_, start };
    }

    /**
     * @brief Compacted copy: only the nodes reachable from the root, renumbered in BFS order, without severed slots.
     *
     * The tree itself is left untouched. Handles of this tree are not valid in the result; `remap` translates them.
     */
    auto regenerate() const
        -> Regenerated< C >
        requires std::copy_constructible< C >
    {
        auto rv = Regenerated< C >{};

        for( auto const& [ node, handle ] : traverse().bfs() )
        {
            auto const fresh = [ &, node = node ]
            {
                if( node->is_root() )
                {
                    rv.tree.nodes_.emplace_back( node->content(), 1 );

                    return root_handle;
                }
                else
                {
                    return rv.tree.append_child( rv.remap.at( node->parent().value() ), node->content() );
                }
            }();

            rv.remap.emplace( handle, fresh );
        }

        GROVE_LOG_MSG( "tree", fmt::format( "regenerate: {} of {} nodes kept", rv.tree.node_count(), node_count() ) );

        return rv;
    }

private:
    // Codec rejections are reported as content_parse_failed whatever category the codec used.
    static auto parse_content( std::string_view const raw )
        -> Result< C >
    {
        auto rv = GROVE_MAKE_RESULT( C );

        if( auto parsed = C::parse( raw )
          ; parsed )
        {
            rv = std::move( parsed ).value();
        }
        else
        {
            auto payload = parsed.error();

            payload.ec = make_error_code( error_code::tree::content_parse_failed );
            payload.stack.emplace_back( GROVE_MAKE_RESULT_STACK_ELEM_MSG( fmt::format( "rejected content: '{}'", raw ) ) );

            rv = std::move( payload );
        }

        return rv;
    }

    // Whether the parent's slot at this node's position still holds it.
    auto is_attached( Handle const node ) const
        -> bool
    {
        auto const& n = nodes_[ node ];

        if( auto const parent = n.parent()
          ; parent )
        {
            auto const& siblings = nodes_[ parent.value() ].children();
            auto const pos = n.position().value();

            return pos < siblings.size() && siblings[ pos ] == node;
        }
        else
        {
            return false;
        }
    }

    // Unchecked. Appends a node to the arena and registers it under `parent`.
    auto append_child( Handle const parent
                     , C content )
        -> Handle
    {
        auto const child = nodes_.size();
        auto const level = nodes_[ parent ].level() + 1;
        auto const position = nodes_[ parent ].num_children();
        auto name = content.value();

        nodes_.emplace_back( std::move( content ), level, parent, position );
        nodes_[ parent ].add_child( name, child ); // Index after emplace_back, which may reallocate.

        return child;
    }

    Arena nodes_ = {};
};

template< NodeContent C >
struct Regenerated
{
    Tree< C > tree = {};
    HandleMap remap = {}; // Old handle => new handle, for every node carried over.
};

/// Indented outline of the nodes reachable from the root, one serialized node per line.
template< NodeContent C >
auto to_string( Tree< C > const& tree )
    -> std::string
{
    auto rv = std::string{};

    for( auto const& [ node, handle ] : tree.traverse().pre_dfs() )
    {
        rv += fmt::format( "{:{}}{}\n", "", ( node->level() - 1 ) * 2, serialize( node->content() ) );
    }

    return rv;
}

} // namespace grove

#endif // GROVE_TREE_HPP
