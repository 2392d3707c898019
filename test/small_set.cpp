////////////////////////////////////////////////////////////////////////////////
/// psi::coll::small_set unit tests
////////////////////////////////////////////////////////////////////////////////

#include <psi/coll/small_set.hpp>

#include <gtest/gtest.h>

#include <string>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::coll {
//------------------------------------------------------------------------------

namespace
{
    template <typename Range>
    std::vector<int> collect( Range const & r ) { return { r.begin(), r.end() }; }
} // anonymous namespace

TEST( small_set, insert_reports_new_elements )
{
    small_set<int, 2> s;
    EXPECT_TRUE ( s.insert( 7 ) );
    EXPECT_FALSE( s.insert( 7 ) );
    EXPECT_TRUE ( s.insert( 3 ) );
    EXPECT_TRUE ( s.is_inline() );
    EXPECT_TRUE ( s.insert( 5 ) );
    EXPECT_FALSE( s.is_inline() );
    EXPECT_FALSE( s.insert( 3 ) );
    EXPECT_EQ   ( s.size(), 3 );
    EXPECT_EQ   ( collect( s ), ( std::vector<int>{ 7, 3, 5 } ) );

    auto const [ pos, inserted ]{ s.insert_full( 3 ) };
    EXPECT_EQ   ( pos, 1 );
    EXPECT_FALSE( inserted );
}

TEST( small_set, lookup_and_removal )
{
    small_set<std::string, 4> s{ "a", "b", "c" };
    EXPECT_TRUE ( s.contains( "b" ) );
    EXPECT_FALSE( s.contains( "z" ) );
    EXPECT_EQ   ( s.get_index_of( "c" ), 2 );
    ASSERT_NE   ( s.nth( 0 ), nullptr );
    EXPECT_EQ   ( *s.nth( 0 ), "a" );
    EXPECT_EQ   ( s.nth( 3 ), nullptr );

    EXPECT_TRUE ( s.remove( "a" ) );
    EXPECT_FALSE( s.remove( "a" ) );
    EXPECT_EQ   ( s.get_index_of( "b" ), 0 );
    EXPECT_TRUE ( s.swap_remove( "b" ) );
    EXPECT_EQ   ( s.get_index_of( "c" ), 0 );
}

TEST( small_set, lazy_set_operations )
{
    small_set<int, 4> const a{ 1, 2, 3, 4 };
    small_set<int, 8> const b{ 3, 4, 5, 6 };

    EXPECT_EQ( collect( a.set_union               ( b ) ), ( std::vector<int>{ 1, 2, 3, 4, 5, 6 } ) );
    EXPECT_EQ( collect( a.set_intersection        ( b ) ), ( std::vector<int>{ 3, 4 } ) );
    EXPECT_EQ( collect( a.set_difference          ( b ) ), ( std::vector<int>{ 1, 2 } ) );
    EXPECT_EQ( collect( a.set_symmetric_difference( b ) ), ( std::vector<int>{ 1, 2, 5, 6 } ) );
    EXPECT_EQ( collect( b.set_difference          ( a ) ), ( std::vector<int>{ 5, 6 } ) );
}

TEST( small_set, set_operations_with_empty_operands )
{
    small_set<int, 4> const empty;
    small_set<int, 4> const a{ 1, 2 };

    EXPECT_TRUE( a.set_intersection( empty ).empty() );
    EXPECT_EQ  ( collect( a.set_union( empty ) ), ( std::vector<int>{ 1, 2 } ) );
    EXPECT_EQ  ( collect( empty.set_union( a ) ), ( std::vector<int>{ 1, 2 } ) );
    EXPECT_TRUE( empty.set_difference( a ).empty() );
    EXPECT_EQ  ( collect( a.set_symmetric_difference( a ) ), std::vector<int>{} );
}

TEST( small_set, set_operations_observe_later_changes )
{
    small_set<int, 4> a{ 1, 2 };
    small_set<int, 4> b{ 2 };
    auto const difference{ a.set_difference( b ) };
    EXPECT_EQ( collect( difference ), ( std::vector<int>{ 1 } ) );
    b.insert( 1 );
    EXPECT_TRUE( difference.empty() );
}

TEST( small_set, relations )
{
    small_set<int, 4> const a{ 1, 2 };
    small_set<int, 4> const b{ 2, 1, 3 };
    small_set<int, 4> const c{ 7, 8 };

    EXPECT_TRUE ( a.is_subset  ( b ) );
    EXPECT_FALSE( b.is_subset  ( a ) );
    EXPECT_TRUE ( b.is_superset( a ) );
    EXPECT_TRUE ( a.is_disjoint( c ) );
    EXPECT_FALSE( a.is_disjoint( b ) );
    EXPECT_TRUE ( ( small_set<int, 4>{}.is_subset( c ) ) );
}

TEST( small_set, equality_ignores_order_and_representation )
{
    small_set<int, 2> a{ 1, 2 };
    small_set<int, 2> b{ 2, 1, 3 };
    b.remove( 3 );
    ASSERT_TRUE ( a.is_inline() );
    ASSERT_FALSE( b.is_inline() );
    EXPECT_TRUE ( a == b );
    b.insert( 4 );
    EXPECT_FALSE( a == b );
}

//------------------------------------------------------------------------------
} // namespace psi::coll
//------------------------------------------------------------------------------
