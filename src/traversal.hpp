/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#pragma once
#ifndef GROVE_TRAVERSAL_HPP
#define GROVE_TRAVERSAL_HPP

#include "common.hpp"
#include "node.hpp"

#include <range/v3/view/facade.hpp>

#include <deque>
#include <utility>
#include <vector>

/**
 * Lazy, single-pass traversals over a Tree's node arena.
 *
 * Each traversal is a range-v3 view that acts as its own cursor: the view holds a pointer to the arena and the
 * frontier (queue/stack) of handles still to visit, and yields `Visit{ node, handle }` pairs. Structural traversals
 * follow live child links only, so unlinked subtrees are never reached; the sequential ones walk the raw arena and do
 * yield unlinked nodes.
 *
 * The arena must not be modified while a traversal is alive.
 */
namespace grove::traversal {

template< NodeContent C >
using Arena = std::vector< Node< C > >;

template< NodeContent C >
struct Visit
{
    Node< C > const* node = nullptr;
    Handle handle = null_handle;
};

namespace detail {

template< NodeContent C >
auto in_range( Arena< C > const* nodes
             , Handle const h )
    -> bool
{
    return nodes != nullptr && h < nodes->size();
}

// Visits live children of `h`, left-to-right unless `reversed`.
template< NodeContent C
        , typename Fn >
auto for_each_child( Arena< C > const& nodes
                   , Handle const h
                   , bool const reversed
                   , Fn&& fn )
    -> void
{
    auto const& children = nodes[ h ].children();

    if( reversed )
    {
        for( auto it = children.rbegin(); it != children.rend(); ++it )
        {
            if( *it != null_handle )
            {
                fn( *it );
            }
        }
    }
    else
    {
        for( auto const c : children )
        {
            if( c != null_handle )
            {
                fn( c );
            }
        }
    }
}

} // namespace detail

/// Arena order from `start`, unlinked nodes included.
template< NodeContent C >
class Sequential : public ranges::view_facade< Sequential< C >, ranges::finite >
{
    friend ranges::range_access;

    Arena< C > const* nodes_ = nullptr;
    Handle current_ = 0;

    auto read() const
        -> Visit< C >
    {
        return { &( *nodes_ )[ current_ ], current_ };
    }
    auto next()
        -> void
    {
        ++current_;
    }
    auto equal( ranges::default_sentinel_t ) const
        -> bool
    {
        return !detail::in_range( nodes_, current_ );
    }

public:
    Sequential() = default;
    Sequential( Arena< C > const& nodes
              , Handle const start )
        : nodes_{ &nodes }
        , current_{ start }
    {
    }
};

/// Reverse arena order from `start` down to 0, unlinked nodes included.
template< NodeContent C >
class InvSequential : public ranges::view_facade< InvSequential< C >, ranges::finite >
{
    friend ranges::range_access;

    Arena< C > const* nodes_ = nullptr;
    Handle current_ = 0;
    bool done_ = true;

    auto read() const
        -> Visit< C >
    {
        return { &( *nodes_ )[ current_ ], current_ };
    }
    auto next()
        -> void
    {
        if( current_ == 0 )
        {
            done_ = true;
        }
        else
        {
            --current_;
        }
    }
    auto equal( ranges::default_sentinel_t ) const
        -> bool
    {
        return done_;
    }

public:
    InvSequential() = default;
    InvSequential( Arena< C > const& nodes
                 , Handle const start )
        : nodes_{ &nodes }
        , current_{ start }
        , done_{ !detail::in_range( nodes_, start ) }
    {
    }
};

/// Level order. `Inverse` visits each node's children right-to-left.
template< NodeContent C
        , bool Inverse >
class BreadthFirst : public ranges::view_facade< BreadthFirst< C, Inverse >, ranges::finite >
{
    friend ranges::range_access;

    Arena< C > const* nodes_ = nullptr;
    std::deque< Handle > queue_ = {};

    auto read() const
        -> Visit< C >
    {
        auto const h = queue_.front();

        return { &( *nodes_ )[ h ], h };
    }
    auto next()
        -> void
    {
        auto const h = queue_.front();

        queue_.pop_front();

        detail::for_each_child( *nodes_, h, Inverse, [ & ]( Handle const c ){ queue_.emplace_back( c ); } );
    }
    auto equal( ranges::default_sentinel_t ) const
        -> bool
    {
        return queue_.empty();
    }

public:
    BreadthFirst() = default;
    BreadthFirst( Arena< C > const& nodes
                , Handle const start )
        : nodes_{ &nodes }
    {
        if( detail::in_range( nodes_, start ) )
        {
            queue_.emplace_back( start );
        }
    }
};

/// Node before its children. Children left-to-right, or right-to-left when `Inverse`.
template< NodeContent C
        , bool Inverse >
class PreOrderDepthFirst : public ranges::view_facade< PreOrderDepthFirst< C, Inverse >, ranges::finite >
{
    friend ranges::range_access;

    Arena< C > const* nodes_ = nullptr;
    std::vector< Handle > stack_ = {};

    auto read() const
        -> Visit< C >
    {
        auto const h = stack_.back();

        return { &( *nodes_ )[ h ], h };
    }
    auto next()
        -> void
    {
        auto const h = stack_.back();

        stack_.pop_back();

        // Pushed opposite to visiting order, so the first child to visit ends on top.
        detail::for_each_child( *nodes_, h, !Inverse, [ & ]( Handle const c ){ stack_.emplace_back( c ); } );
    }
    auto equal( ranges::default_sentinel_t ) const
        -> bool
    {
        return stack_.empty();
    }

public:
    PreOrderDepthFirst() = default;
    PreOrderDepthFirst( Arena< C > const& nodes
                      , Handle const start )
        : nodes_{ &nodes }
    {
        if( detail::in_range( nodes_, start ) )
        {
            stack_.emplace_back( start );
        }
    }
};

/// Children before their node. Children left-to-right, or right-to-left when `Inverse`.
template< NodeContent C
        , bool Inverse >
class PostOrderDepthFirst : public ranges::view_facade< PostOrderDepthFirst< C, Inverse >, ranges::finite >
{
    friend ranges::range_access;

    struct Frame
    {
        Handle handle = null_handle;
        bool expanded = false;
    };

    Arena< C > const* nodes_ = nullptr;
    std::vector< Frame > stack_ = {};

    // Expands frames until the top one has had its children pushed (or has none), making it the next to yield.
    auto settle()
        -> void
    {
        while( !stack_.empty() && !stack_.back().expanded )
        {
            auto const h = stack_.back().handle;

            stack_.back().expanded = true;

            detail::for_each_child( *nodes_, h, !Inverse, [ & ]( Handle const c ){ stack_.emplace_back( Frame{ c, false } ); } );
        }
    }
    auto read() const
        -> Visit< C >
    {
        auto const h = stack_.back().handle;

        return { &( *nodes_ )[ h ], h };
    }
    auto next()
        -> void
    {
        stack_.pop_back();

        settle();
    }
    auto equal( ranges::default_sentinel_t ) const
        -> bool
    {
        return stack_.empty();
    }

public:
    PostOrderDepthFirst() = default;
    PostOrderDepthFirst( Arena< C > const& nodes
                       , Handle const start )
        : nodes_{ &nodes }
    {
        if( detail::in_range( nodes_, start ) )
        {
            stack_.emplace_back( Frame{ start, false } );

            settle();
        }
    }
};

/**
 * In-order generalized to n-ary nodes: first child's subtree, then the node, then the remaining children's subtrees.
 * `Inverse` is the exact mirror: last child's subtree, the node, then the remaining children right-to-left.
 */
template< NodeContent C
        , bool Inverse >
class InOrderDepthFirst : public ranges::view_facade< InOrderDepthFirst< C, Inverse >, ranges::finite >
{
    friend ranges::range_access;

    struct Frame
    {
        Handle handle = null_handle;
        std::size_t next = 0; // Ordinal of the next child slot to scan, in visiting direction.
        bool started = false;
        bool visited = false;
    };

    Arena< C > const* nodes_ = nullptr;
    std::vector< Frame > stack_ = {};

    // Returns the next live child at or after ordinal `from` along with the ordinal following it.
    auto next_child( Handle const h
                   , std::size_t from ) const
        -> Optional< std::pair< Handle, std::size_t > >
    {
        auto const& children = ( *nodes_ )[ h ].children();
        auto const count = children.size();

        for( ; from < count; ++from )
        {
            auto const slot = Inverse ? count - 1 - from : from;

            if( children[ slot ] != null_handle )
            {
                return std::pair{ children[ slot ], from + 1 };
            }
        }

        return nullopt;
    }
    auto settle()
        -> void
    {
        while( !stack_.empty() )
        {
            auto& top = stack_.back();

            if( !top.visited )
            {
                if( top.started )
                {
                    return; // Back from the first child's subtree.
                }

                top.started = true;

                if( auto const child = next_child( top.handle, 0 )
                  ; child )
                {
                    top.next = child->second;

                    stack_.emplace_back( Frame{ child->first } ); // Invalidates `top`.
                }
                else
                {
                    return; // Leaf.
                }
            }
            else if( auto const child = next_child( top.handle, top.next )
                   ; child )
            {
                top.next = child->second;

                stack_.emplace_back( Frame{ child->first } ); // Invalidates `top`.
            }
            else
            {
                stack_.pop_back();
            }
        }
    }
    auto read() const
        -> Visit< C >
    {
        auto const h = stack_.back().handle;

        return { &( *nodes_ )[ h ], h };
    }
    auto next()
        -> void
    {
        stack_.back().visited = true;

        settle();
    }
    auto equal( ranges::default_sentinel_t ) const
        -> bool
    {
        return stack_.empty();
    }

public:
    InOrderDepthFirst() = default;
    InOrderDepthFirst( Arena< C > const& nodes
                     , Handle const start )
        : nodes_{ &nodes }
    {
        if( detail::in_range( nodes_, start ) )
        {
            stack_.emplace_back( Frame{ start } );

            settle();
        }
    }
};

/// Immediate live children of a node, left-to-right.
template< NodeContent C >
class Children : public ranges::view_facade< Children< C >, ranges::finite >
{
    friend ranges::range_access;

    Arena< C > const* nodes_ = nullptr;
    Handle parent_ = null_handle;
    std::size_t slot_ = 0;

    auto skip_severed()
        -> void
    {
        auto const& children = ( *nodes_ )[ parent_ ].children();

        while( slot_ < children.size() && children[ slot_ ] == null_handle )
        {
            ++slot_;
        }
    }
    auto read() const
        -> Visit< C >
    {
        auto const h = ( *nodes_ )[ parent_ ].children()[ slot_ ];

        return { &( *nodes_ )[ h ], h };
    }
    auto next()
        -> void
    {
        ++slot_;

        skip_severed();
    }
    auto equal( ranges::default_sentinel_t ) const
        -> bool
    {
        return !detail::in_range( nodes_, parent_ )
            || slot_ >= ( *nodes_ )[ parent_ ].children().size();
    }

public:
    Children() = default;
    Children( Arena< C > const& nodes
            , Handle const parent )
        : nodes_{ &nodes }
        , parent_{ parent }
    {
        if( detail::in_range( nodes_, parent_ ) )
        {
            skip_severed();
        }
    }
};

template< NodeContent C > using Bfs = BreadthFirst< C, false >;
template< NodeContent C > using InvBfs = BreadthFirst< C, true >;
template< NodeContent C > using PreDfs = PreOrderDepthFirst< C, false >;
template< NodeContent C > using InvPreDfs = PreOrderDepthFirst< C, true >;
template< NodeContent C > using PostDfs = PostOrderDepthFirst< C, false >;
template< NodeContent C > using InvPostDfs = PostOrderDepthFirst< C, true >;
template< NodeContent C > using InDfs = InOrderDepthFirst< C, false >;
template< NodeContent C > using InvInDfs = InOrderDepthFirst< C, true >;

} // namespace grove::traversal

namespace grove {

/**
 * @brief Entry point to the traversals of one tree, optionally anchored at a start handle.
 *
 * Without an explicit start every traversal begins at the root, except `inv_sequential`, which begins at the last
 * arena index. An explicit start outside the arena yields empty traversals.
 */
template< NodeContent C >
class Traversals
{
public:
    using Arena = traversal::Arena< C >;

    explicit Traversals( Arena const& nodes )
        : nodes_{ nodes }
    {
    }
    Traversals( Arena const& nodes
              , Handle const start )
        : nodes_{ nodes }
        , start_{ start }
    {
    }

    auto sequential() const
        -> traversal::Sequential< C >
    {
        return { nodes_, start_.value_or( root_handle ) };
    }
    auto inv_sequential() const
        -> traversal::InvSequential< C >
    {
        if( start_ )
        {
            return { nodes_, start_.value() };
        }
        else if( nodes_.empty() )
        {
            return {};
        }
        else
        {
            return { nodes_, nodes_.size() - 1 };
        }
    }
    auto bfs() const
        -> traversal::Bfs< C >
    {
        return { nodes_, start_.value_or( root_handle ) };
    }
    auto inv_bfs() const
        -> traversal::InvBfs< C >
    {
        return { nodes_, start_.value_or( root_handle ) };
    }
    auto pre_dfs() const
        -> traversal::PreDfs< C >
    {
        return { nodes_, start_.value_or( root_handle ) };
    }
    auto inv_pre_dfs() const
        -> traversal::InvPreDfs< C >
    {
        return { nodes_, start_.value_or( root_handle ) };
    }
    auto post_dfs() const
        -> traversal::PostDfs< C >
    {
        return { nodes_, start_.value_or( root_handle ) };
    }
    auto inv_post_dfs() const
        -> traversal::InvPostDfs< C >
    {
        return { nodes_, start_.value_or( root_handle ) };
    }
    auto children() const
        -> traversal::Children< C >
    {
        return { nodes_, start_.value_or( root_handle ) };
    }
    auto in_dfs() const
        -> traversal::InDfs< C >
    {
        return { nodes_, start_.value_or( root_handle ) };
    }
    auto inv_in_dfs() const
        -> traversal::InvInDfs< C >
    {
        return { nodes_, start_.value_or( root_handle ) };
    }

private:
    Arena const& nodes_;
    Optional< Handle > start_ = {};
};

} // namespace grove

#endif // GROVE_TRAVERSAL_HPP
