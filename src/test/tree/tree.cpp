/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#include "content.hpp"
#include "error/tree.hpp"
#include "test/master.hpp"
#include "test/util.hpp"
#include "tree.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace grove;
using namespace grove::test;

SCENARIO( "Tree root", "[tree]" )
{
    GROVE_QUIET_LOG_FIXTURE_SCOPED();

    GIVEN( "an empty tree" )
    {
        auto tree = Tree< RawContent >{};

        THEN( "it has no nodes" )
        {
            REQUIRE( tree.empty() );
            REQUIRE( tree.node_count() == 0 );
            REQUIRE( !tree.content( root_handle ) );
        }
        THEN( "link has no parent to attach to" )
        {
            auto const res = tree.link( "x", root_handle );

            REQUIRE_RFAIL( res );
            REQUIRE( error_of( res ) == error_code::tree::parent_not_found );
            REQUIRE( tree.empty() );
        }

        WHEN( "the root is set" )
        {
            auto const root = REQUIRE_TRY( tree.set_root( "root" ) );

            THEN( "it occupies handle 0 at level 1" )
            {
                REQUIRE( root == root_handle );
                REQUIRE( tree.node_count() == 1 );
                REQUIRE( tree.level( root ) == std::size_t{ 1 } );
                REQUIRE( tree.content( root )->value() == "root" );
                REQUIRE( tree.is_linked( root ) );
            }
            THEN( "a second root is refused" )
            {
                auto const res = tree.set_root( "other" );

                REQUIRE_RFAIL( res );
                REQUIRE( error_of( res ) == error_code::tree::root_already_exists );
                REQUIRE( tree.node_count() == 1 );
                REQUIRE( tree.content( root_handle )->value() == "root" );
            }
            THEN( "the root cannot be unlinked, as it is nobody's child" )
            {
                auto const res = tree.unlink( root );

                REQUIRE_RFAIL( res );
                REQUIRE( error_of( res ) == error_code::tree::child_not_found );
                REQUIRE( tree.is_linked( root ) );
            }
            THEN( "the root has no parent" )
            {
                REQUIRE( error_of( tree.fetch_parent( root ) ) == error_code::tree::invalid_root );
                REQUIRE( error_of( tree.fetch_parent( 100 ) ) == error_code::tree::node_not_found );
            }
        }
    }
    GIVEN( "a weighted tree" )
    {
        auto tree = Tree< WeightedContent >{};

        THEN( "a malformed root is refused and the tree stays empty" )
        {
            auto const res = tree.set_root( "no weight" );

            REQUIRE_RFAIL( res );
            REQUIRE( error_of( res ) == error_code::tree::content_parse_failed );
            REQUIRE( tree.empty() );
        }
    }
}

SCENARIO( "Tree link", "[tree]" )
{
    GROVE_QUIET_LOG_FIXTURE_SCOPED();

    GIVEN( "the fixture tree" )
    {
        auto fx = FixtureTree{};
        auto& tree = fx.tree;

        THEN( "handles follow link order" )
        {
            REQUIRE( fx[ "A" ] == 0 );
            REQUIRE( fx[ "B" ] == 1 );
            REQUIRE( fx[ "H" ] == 7 );
            REQUIRE( tree.node_count() == 8 );
        }
        THEN( "every non-root node sits one level below its parent, at its recorded position" )
        {
            for( auto const& [ node, handle ] : tree.traverse().sequential() )
            {
                if( node->is_root() )
                {
                    REQUIRE( node->level() == 1 );
                }
                else
                {
                    auto const parent = REQUIRE_TRY( tree.fetch_parent( handle ) );
                    auto const& pnode = tree.node( parent ).value();

                    REQUIRE( node->level() == pnode.level() + 1 );
                    REQUIRE( pnode.children()[ node->position().value() ] == handle );
                }
            }
        }

        WHEN( "a child is linked" )
        {
            auto const nodes_before = tree.node_count();
            auto const i = REQUIRE_TRY( tree.link( "I", fx[ "H" ] ) );

            THEN( "its handle is the previous arena size" )
            {
                REQUIRE( i == nodes_before );
            }
            THEN( "existing handles are unaffected" )
            {
                for( auto const& [ name, handle ] : fx.handles )
                {
                    REQUIRE( tree.content( handle )->value() == name );
                }
            }
            THEN( "it is reachable by path" )
            {
                REQUIRE( tree.find_path( fx[ "A" ], { "B", "E", "H", "I" } ) == i );
                REQUIRE( tree.level( i ) == std::size_t{ 5 } );
            }
        }
        WHEN( "a duplicate sibling is linked" )
        {
            auto const res = tree.link( "D", fx[ "B" ] );

            THEN( "it is refused and the tree is unchanged" )
            {
                REQUIRE_RFAIL( res );
                REQUIRE( error_of( res ) == error_code::tree::child_already_exists );
                REQUIRE( tree.node_count() == 8 );
                REQUIRE( tree.node( fx[ "B" ] )->num_children() == 2 );
            }
        }
        WHEN( "the same name is linked under different parents" )
        {
            THEN( "both succeed" )
            {
                REQUIRE_RES( tree.link( "X", fx[ "D" ] ) );
                REQUIRE_RES( tree.link( "X", fx[ "F" ] ) );
            }
        }
        WHEN( "a parent outside the arena is given" )
        {
            auto const res = tree.link( "X", 100 );

            THEN( "it fails with parent_not_found" )
            {
                REQUIRE_RFAIL( res );
                REQUIRE( error_of( res ) == error_code::tree::parent_not_found );
                REQUIRE( tree.node_count() == 8 );
            }
        }
    }
}

SCENARIO( "Tree find_path", "[tree]" )
{
    GROVE_QUIET_LOG_FIXTURE_SCOPED();

    GIVEN( "the fixture tree" )
    {
        auto const fx = FixtureTree{};
        auto const& tree = fx.tree;

        THEN( "a full path resolves" )
        {
            REQUIRE( tree.find_path( fx[ "A" ], { "B", "E", "H" } ) == fx[ "H" ] );
        }
        THEN( "a path relative to an inner node resolves" )
        {
            REQUIRE( tree.find_path( fx[ "B" ], { "E", "H" } ) == fx[ "H" ] );
        }
        THEN( "a missing hop is absent" )
        {
            REQUIRE( !tree.find_path( fx[ "A" ], { "B", "Z" } ) );
            REQUIRE( !tree.find_path( fx[ "A" ], { "Z", "E", "H" } ) );
        }
        THEN( "the start's own name is not part of the path" )
        {
            REQUIRE( !tree.find_path( fx[ "A" ], { "A", "B" } ) );
        }
        THEN( "an empty path is the start itself" )
        {
            REQUIRE( tree.find_path( fx[ "C" ], {} ) == fx[ "C" ] );
        }
        THEN( "a start outside the arena is absent" )
        {
            REQUIRE( !tree.find_path( 100, { "B" } ) );
        }
    }
}

SCENARIO( "Tree unlink", "[tree]" )
{
    GROVE_QUIET_LOG_FIXTURE_SCOPED();

    GIVEN( "the fixture tree" )
    {
        auto fx = FixtureTree{};
        auto& tree = fx.tree;

        WHEN( "E is unlinked" )
        {
            auto const e = REQUIRE_TRY( tree.unlink( fx[ "E" ] ) );

            THEN( "it returns the unlinked handle" )
            {
                REQUIRE( e == fx[ "E" ] );
            }
            THEN( "nothing leaves the arena" )
            {
                REQUIRE( tree.node_count() == 8 );
                REQUIRE( tree.content( fx[ "E" ] )->value() == "E" );
                REQUIRE( tree.content( fx[ "H" ] )->value() == "H" );
            }
            THEN( "E and its subtree are no longer reachable" )
            {
                REQUIRE( !tree.find_path( fx[ "A" ], { "B", "E" } ) );
                REQUIRE( !tree.find_path( fx[ "A" ], { "B", "E", "H" } ) );
                REQUIRE( !tree.is_linked( fx[ "E" ] ) );
                REQUIRE( !tree.is_linked( fx[ "H" ] ) );
            }
            THEN( "H keeps its own arc to E" )
            {
                REQUIRE( tree.fetch_parent( fx[ "H" ] ).value() == fx[ "E" ] );
                REQUIRE( tree.find_path( fx[ "E" ], { "H" } ) == fx[ "H" ] );
            }
            THEN( "the sibling's position is untouched" )
            {
                auto const& b = tree.node( fx[ "B" ] ).value();

                REQUIRE( b.children()[ 0 ] == fx[ "D" ] );
                REQUIRE( b.children()[ 1 ] == null_handle );
                REQUIRE( tree.is_linked( fx[ "D" ] ) );
            }
            THEN( "unlinking it again fails with child_not_found" )
            {
                auto const res = tree.unlink( fx[ "E" ] );

                REQUIRE_RFAIL( res );
                REQUIRE( error_of( res ) == error_code::tree::child_not_found );
            }
            THEN( "its name can be reused under the former parent" )
            {
                auto const e2 = REQUIRE_TRY( tree.link( "E", fx[ "B" ] ) );

                REQUIRE( tree.find_path( fx[ "A" ], { "B", "E" } ) == e2 );
                REQUIRE( tree.node( e2 )->position() == std::size_t{ 2 } );
            }
        }
        WHEN( "a handle outside the arena is unlinked" )
        {
            auto const res = tree.unlink( 100 );

            THEN( "it fails with child_not_found and nothing is severed" )
            {
                REQUIRE_RFAIL( res );
                REQUIRE( error_of( res ) == error_code::tree::child_not_found );
                REQUIRE( values( tree.traverse().bfs() ).size() == 8 );
            }
        }
    }
}

SCENARIO( "Tree update_content", "[tree]" )
{
    GROVE_QUIET_LOG_FIXTURE_SCOPED();

    GIVEN( "the fixture tree" )
    {
        auto fx = FixtureTree{};
        auto& tree = fx.tree;

        WHEN( "B is renamed to Z" )
        {
            auto const b = REQUIRE_TRY( tree.update_content( "Z", fx[ "B" ] ) );

            THEN( "the handle is unchanged" )
            {
                REQUIRE( b == fx[ "B" ] );
                REQUIRE( tree.content( b )->value() == "Z" );
            }
            THEN( "the parent finds it under the new name only" )
            {
                REQUIRE( tree.find_path( fx[ "A" ], { "Z", "E", "H" } ) == fx[ "H" ] );
                REQUIRE( !tree.find_path( fx[ "A" ], { "B" } ) );
            }
            THEN( "its level is unchanged" )
            {
                REQUIRE( tree.level( b ) == std::size_t{ 2 } );
            }
        }
        WHEN( "B is updated to its current value" )
        {
            THEN( "it succeeds" )
            {
                REQUIRE_RES( tree.update_content( "B", fx[ "B" ] ) );
                REQUIRE( tree.find_path( fx[ "A" ], { "B" } ) == fx[ "B" ] );
            }
        }
        WHEN( "B is renamed to its sibling's name" )
        {
            auto const res = tree.update_content( "C", fx[ "B" ] );

            THEN( "it is refused and nothing changes" )
            {
                REQUIRE_RFAIL( res );
                REQUIRE( error_of( res ) == error_code::tree::child_already_exists );
                REQUIRE( tree.content( fx[ "B" ] )->value() == "B" );
                REQUIRE( tree.find_path( fx[ "A" ], { "B" } ) == fx[ "B" ] );
                REQUIRE( tree.find_path( fx[ "A" ], { "C" } ) == fx[ "C" ] );
            }
        }
        WHEN( "the root is renamed" )
        {
            REQUIRE_RES( tree.update_content( "root", fx[ "A" ] ) );

            THEN( "only its content changes" )
            {
                REQUIRE( tree.content( fx[ "A" ] )->value() == "root" );
                REQUIRE( tree.find_path( fx[ "A" ], { "B", "E" } ) == fx[ "E" ] );
            }
        }
        WHEN( "an unlinked node is renamed" )
        {
            REQUIRE_RES( tree.unlink( fx[ "E" ] ) );

            auto const res = tree.update_content( "Q", fx[ "E" ] );

            THEN( "it fails with child_not_found and keeps its content" )
            {
                REQUIRE_RFAIL( res );
                REQUIRE( error_of( res ) == error_code::tree::child_not_found );
                REQUIRE( tree.content( fx[ "E" ] )->value() == "E" );
            }
        }
        WHEN( "an unlinked node's name was reused before renaming it" )
        {
            REQUIRE_RES( tree.unlink( fx[ "E" ] ) );

            auto const e2 = REQUIRE_TRY( tree.link( "E", fx[ "B" ] ) );
            auto const res = tree.update_content( "Q", fx[ "E" ] );

            THEN( "the new sibling keeps its index entry" )
            {
                REQUIRE_RFAIL( res );
                REQUIRE( tree.find_path( fx[ "A" ], { "B", "E" } ) == e2 );
            }
        }
        WHEN( "a handle outside the arena is updated" )
        {
            auto const res = tree.update_content( "Q", 100 );

            THEN( "it fails with child_not_found" )
            {
                REQUIRE_RFAIL( res );
                REQUIRE( error_of( res ) == error_code::tree::child_not_found );
                REQUIRE( tree.node_count() == 8 );
            }
        }
    }
    GIVEN( "a weighted tree" )
    {
        auto tree = Tree< WeightedContent >{};
        auto const root = REQUIRE_TRY( tree.set_root( "0:root" ) );
        auto const child = REQUIRE_TRY( tree.link( "5:child", root ) );

        THEN( "children are indexed by text, not weight" )
        {
            REQUIRE( tree.find_path( root, { "child" } ) == child );
            REQUIRE( error_of( tree.link( "9:child", root ) ) == error_code::tree::child_already_exists );
        }
        THEN( "a weight-only change keeps the index entry" )
        {
            REQUIRE_RES( tree.update_content( "7:child", child ) );
            REQUIRE( tree.content( child )->weight() == 7 );
            REQUIRE( tree.find_path( root, { "child" } ) == child );
        }
        THEN( "malformed content is refused without change" )
        {
            auto const res = tree.update_content( "bad", child );

            REQUIRE_RFAIL( res );
            REQUIRE( error_of( res ) == error_code::tree::content_parse_failed );
            REQUIRE( tree.content( child )->weight() == 5 );
        }
        THEN( "malformed content cannot be linked" )
        {
            REQUIRE( error_of( tree.link( "x:y", root ) ) == error_code::tree::content_parse_failed );
            REQUIRE( tree.node_count() == 2 );
        }
    }
}

SCENARIO( "Tree regenerate", "[tree]" )
{
    GROVE_QUIET_LOG_FIXTURE_SCOPED();

    GIVEN( "the fixture tree with E unlinked" )
    {
        auto fx = FixtureTree{};

        REQUIRE_RES( fx.tree.unlink( fx[ "E" ] ) );

        WHEN( "it is regenerated" )
        {
            auto const [ fresh, remap ] = fx.tree.regenerate();

            THEN( "only reachable nodes remain" )
            {
                REQUIRE( fresh.node_count() == 6 );
                REQUIRE( values( fresh.traverse().sequential() ) == StringVec{ "A", "B", "C", "D", "F", "G" } );
            }
            THEN( "the remap covers exactly the reachable nodes" )
            {
                REQUIRE( remap.size() == 6 );
                REQUIRE( !remap.contains( fx[ "E" ] ) );
                REQUIRE( !remap.contains( fx[ "H" ] ) );
                REQUIRE( remap.at( fx[ "F" ] ) == 4 );
            }
            THEN( "structure is preserved without severed slots" )
            {
                REQUIRE( fresh.find_path( root_handle, { "C", "G" } ) == remap.at( fx[ "G" ] ) );
                REQUIRE( fresh.node( remap.at( fx[ "B" ] ) )->children() == HandleVec{ remap.at( fx[ "D" ] ) } );
                REQUIRE( values( fresh.traverse().pre_dfs() ) == StringVec{ "A", "B", "D", "C", "F", "G" } );
            }
            THEN( "the original is untouched" )
            {
                REQUIRE( fx.tree.node_count() == 8 );
            }
        }
    }
    GIVEN( "an empty tree" )
    {
        auto const tree = Tree< RawContent >{};

        THEN( "regenerating yields an empty tree" )
        {
            auto const regen = tree.regenerate();

            REQUIRE( regen.tree.empty() );
            REQUIRE( regen.remap.empty() );
        }
    }
}

SCENARIO( "Tree outline", "[tree]" )
{
    GROVE_QUIET_LOG_FIXTURE_SCOPED();

    GIVEN( "a small weighted tree" )
    {
        auto tree = Tree< WeightedContent >{};
        auto const root = REQUIRE_TRY( tree.set_root( "1:top" ) );
        auto const mid = REQUIRE_TRY( tree.link( "2:mid", root ) );

        REQUIRE_RES( tree.link( "3:leaf", mid ) );
        REQUIRE_RES( tree.link( "4:side", root ) );

        THEN( "to_string indents two spaces per level" )
        {
            REQUIRE( to_string( tree ) == "1:top\n  2:mid\n    3:leaf\n  4:side\n" );
        }
    }
}
