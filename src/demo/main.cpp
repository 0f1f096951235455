/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#include "contract.hpp"
#include "grove.hpp"
#include "util/log/log.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/transform.hpp>

#include <exception>
#include <string>

using namespace grove;

namespace {

template< typename Range >
auto join_values( Range&& rng )
    -> std::string
{
    auto const vals = rng
                    | ranges::views::transform( []( auto const& v ){ return v.node->content().value(); } )
                    | ranges::to< StringVec >();

    return fmt::format( "{}", fmt::join( vals, ", " ) );
}

auto print_forest( Forest<> const& forest )
    -> void
{
    fmt::print( "forest of {} tree(s)\n", forest.size() );

    for( auto const& [ id, tree ] : forest.iterate() )
    {
        fmt::print( "[{}] {} node(s)\n{}", id.id(), tree.node_count(), to_string( tree ) );
    }
}

auto print_orders( Tree<> const& tree )
    -> void
{
    auto const trav = tree.traverse();

    fmt::print( "  bfs:          {}\n", join_values( trav.bfs() ) );
    fmt::print( "  inv_bfs:      {}\n", join_values( trav.inv_bfs() ) );
    fmt::print( "  pre_dfs:      {}\n", join_values( trav.pre_dfs() ) );
    fmt::print( "  inv_pre_dfs:  {}\n", join_values( trav.inv_pre_dfs() ) );
    fmt::print( "  post_dfs:     {}\n", join_values( trav.post_dfs() ) );
    fmt::print( "  inv_post_dfs: {}\n", join_values( trav.inv_post_dfs() ) );
    fmt::print( "  in_dfs:       {}\n", join_values( trav.in_dfs() ) );
    fmt::print( "  inv_in_dfs:   {}\n", join_values( trav.inv_in_dfs() ) );
    fmt::print( "  sequential:   {}\n", join_values( trav.sequential() ) );
}

auto run()
    -> void
{
    auto forest = Forest<>{};

    GTRYE( forest.create( "my_tree" ) );

    print_forest( forest );

    auto& tree = GTRYE( forest.get_mut( "my_tree" ) ).get();
    auto const root = GTRYE( tree.set_root( "my root node" ) );
    auto const child_1 = GTRYE( tree.link( "child node 1", root ) );
    auto const grandchild = GTRYE( tree.link( "grandchild node", child_1 ) );
    auto const child_2 = GTRYE( tree.link( "child node 2", root ) );

    print_forest( forest );

    fmt::print( "root content = '{}'\n", tree.content( root )->value() );
    fmt::print( "child 1 content = '{}'\n", tree.content( child_1 )->value() );
    fmt::print( "child 2 content = '{}'\n", tree.content( child_2 )->value() );
    fmt::print( "grandchild content = '{}'\n", tree.content( grandchild )->value() );
    fmt::print( "traversals:\n" );
    print_orders( tree );

    GTRYE( tree.update_content( "new child 1 content", child_1 ) );

    fmt::print( "new child 1 content = '{}'\n", tree.content( child_1 )->value() );

    if( auto const found = tree.find_path( root, { "new child 1 content", "grandchild node" } )
      ; found )
    {
        fmt::print( "path to grandchild resolves to handle {}\n", found.value() );
    }

    GTRYE( tree.unlink( child_1 ) );

    fmt::print( "after unlink of handle {}:\n", child_1 );
    print_forest( forest );
    print_orders( tree );

    auto const regen = tree.regenerate();

    fmt::print( "regenerated: {} of {} node(s) kept\n{}", regen.tree.node_count(), tree.node_count(), to_string( regen.tree ) );
}

} // namespace

auto main( int argc
         , char* argv[] )
    -> int
{
    grove::configure_contract_failure_handlers();

    auto const log = argc > 1 && std::string{ argv[ 1 ] } == "--log";

#if GROVE_LOG
    if( log )
    {
        GROVE_LOG_ENABLE();

        util::log::Singleton::instance().call_stack_file = "call_stack.xml";
    }
#endif // GROVE_LOG

    try
    {
        if( log )
        {
            GROVE_LOG_CALL_STACK_SCOPE();

            run();
        }
        else
        {
            run();
        }
    }
    catch( std::exception const& e )
    {
        fmt::print( stderr, "{}\n", e.what() );

        return 1;
    }

    return 0;
}
