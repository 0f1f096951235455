/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#include "common.hpp"
#include "error/master.hpp"
#include "error/tree.hpp"
#include "test/util.hpp"
#include "util/result.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <string>

using namespace grove;
using namespace grove::test;

namespace {

auto fails_with_not_found()
    -> Result< int >
{
    return GROVE_MAKE_ERROR_MSG( error_code::tree::node_not_found, "inner" );
}

auto propagates()
    -> Result< int >
{
    auto const v = GTRY( fails_with_not_found() );

    return v + 1;
}

auto ensures( bool const pred )
    -> Result< int >
{
    GROVE_ENSURE_MSG( pred, error_code::common::conversion_failed, "pred was false" );

    return 7;
}

} // namespace

SCENARIO( "test grove::Result", "[result]" )
{
    GIVEN( "default Result< void >" )
    {
        auto r = GROVE_MAKE_RESULT( void );

        THEN( "explicit bool false" )
        {
            REQUIRE( fail( r ) );
        }
        THEN( "has_error" )
        {
            REQUIRE( r.has_error() );
        }
        THEN( "error is uncategorized" )
        {
            REQUIRE( r.error().ec == error_code::common::uncategorized );
        }
        THEN( "doesn't have value")
        {
            REQUIRE( !r.has_value() );
        }

        WHEN( "set to success" )
        {
            r = outcome::success();

            THEN( "explicit bool true" )
            {
                REQUIRE( succ( r ) );
            }
            THEN( "doesn't have error" )
            {
                REQUIRE( !r.has_error() );
            }
        }
    }
    GIVEN( "a failing call propagated with GTRY" )
    {
        auto const r = propagates();

        THEN( "the original error code survives" )
        {
            REQUIRE( error_of( r ) == error_code::tree::node_not_found );
        }
        THEN( "each hop adds a stack element" )
        {
            REQUIRE( r.error().stack.size() == 2 );
            REQUIRE( r.error().stack.front().message == "inner" );
        }
        THEN( "to_string renders category, message and stack" )
        {
            auto const s = to_string( r.error() );

            REQUIRE( s.find( "tree error" ) != std::string::npos );
            REQUIRE( s.find( "node not found" ) != std::string::npos );
            REQUIRE( s.find( "stack_item[1]" ) != std::string::npos );
            REQUIRE( s.find( "inner" ) != std::string::npos );
        }
    }
    GIVEN( "GROVE_ENSURE_MSG" )
    {
        THEN( "a true predicate falls through" )
        {
            auto const v = REQUIRE_TRY( ensures( true ) );

            REQUIRE( v == 7 );
        }
        THEN( "a false predicate returns the given error" )
        {
            auto const r = ensures( false );

            REQUIRE_RFAIL( r );
            REQUIRE( error_of( r ) == error_code::common::conversion_failed );
            REQUIRE( r.error().stack.front().message.find( "pred was false" ) != std::string::npos );
        }
    }
    GIVEN( "GTRYE" )
    {
        THEN( "a failure becomes an exception" )
        {
            GROVE_DISABLE_EXCEPTION_LOG_SCOPED();

            REQUIRE_THROWS_AS( GTRYE( fails_with_not_found() ), std::runtime_error );
        }
        THEN( "the exception text carries the rendered payload" )
        {
            GROVE_DISABLE_EXCEPTION_LOG_SCOPED();

            REQUIRE_THROWS_WITH( GTRYE( fails_with_not_found() ), Catch::Matchers::ContainsSubstring( "node not found" ) );
        }
        THEN( "a success yields the value" )
        {
            REQUIRE( GTRYE( ensures( true ) ) == 7 );
        }
    }
    GIVEN( "result::value_or" )
    {
        THEN( "the alternative stands in for a failure" )
        {
            REQUIRE( result::value_or( fails_with_not_found(), 3 ) == 3 );
            REQUIRE( result::value_or( ensures( true ), 3 ) == 7 );
        }
    }
}

SCENARIO( "error categories", "[result]" )
{
    GIVEN( "each error enum" )
    {
        THEN( "codes render through their own category" )
        {
            auto const tree_ec = boost::system::error_code{ error_code::tree::child_already_exists };
            auto const forest_ec = boost::system::error_code{ error_code::forest::tree_not_found };
            auto const common_ec = boost::system::error_code{ error_code::common::conversion_failed };

            REQUIRE( std::string{ tree_ec.category().name() } == "tree error" );
            REQUIRE( tree_ec.message() == "child already exists" );
            REQUIRE( std::string{ forest_ec.category().name() } == "forest error" );
            REQUIRE( forest_ec.message() == "tree not found" );
            REQUIRE( std::string{ common_ec.category().name() } == "common error" );
            REQUIRE( common_ec.message() == "conversion failed" );
            REQUIRE( tree_ec != forest_ec );
        }
    }
}

SCENARIO( "result local log", "[result][log]" )
{
    GIVEN( "a local log with pushed values" )
    {
        auto log = result::LocalLog{};

        log.push( { "name", std::string{ "A" } } );
        log.push( { "handle", Handle{ 3 } } );
        log.push( { "none", null_handle } );

        THEN( "values are kept in push order" )
        {
            REQUIRE( log.values().size() == 3 );
            REQUIRE( log.values().front().key == "name" );
        }
        THEN( "to_string renders them as json" )
        {
            REQUIRE( result::to_string( log ) == R"([{"name":"A"},{"handle":3},{"none":null}])" );
        }
    }
}
