////////////////////////////////////////////////////////////////////////////////
/// psi::coll multiset unit tests
////////////////////////////////////////////////////////////////////////////////

#include <psi/coll/multiset.hpp>

#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::coll {
//------------------------------------------------------------------------------

template <typename Multiset>
class multiset_common : public ::testing::Test {};

using all_multisets = ::testing::Types<hash_multiset<std::string>, index_multiset<std::string>>;
TYPED_TEST_SUITE( multiset_common, all_multisets );

TYPED_TEST( multiset_common, counts_occurrences )
{
    TypeParam ms;
    EXPECT_EQ( ms.insert( "a" ), 1 );
    EXPECT_EQ( ms.insert( "a" ), 2 );
    EXPECT_EQ( ms.insert( "b" ), 1 );
    EXPECT_EQ( ms.insert_n( "c", 5 ), 5 );
    EXPECT_EQ( ms.size(), 8 );
    EXPECT_EQ( ms.unique_size(), 3 );
    EXPECT_EQ( ms.count( "a" ), 2 );
    EXPECT_EQ( ms.count( "z" ), 0 );
    EXPECT_TRUE ( ms.contains( "c" ) );
    EXPECT_FALSE( ms.contains( "z" ) );
}

TYPED_TEST( multiset_common, insert_zero_only_queries )
{
    TypeParam ms{ "x", "x" };
    EXPECT_EQ   ( ms.insert_n( "x", 0 ), 2 );
    EXPECT_EQ   ( ms.insert_n( "y", 0 ), 0 );
    EXPECT_FALSE( ms.contains( "y" ) );
    EXPECT_EQ   ( ms.size(), 2 );
}

TYPED_TEST( multiset_common, remove_decrements_then_removes )
{
    TypeParam ms;
    ms.insert_n( "a", 3 );
    ms.insert( "b" );

    auto const partial{ ms.remove_n( "a", 2 ) };
    ASSERT_TRUE ( partial.has_value() );
    EXPECT_EQ   ( partial->original_count, 3 );
    EXPECT_FALSE( partial->removed.has_value() );
    EXPECT_EQ   ( ms.count( "a" ), 1 );
    EXPECT_EQ   ( ms.size(), 2 );

    auto const last{ ms.remove( "a" ) };
    ASSERT_TRUE( last.has_value() );
    EXPECT_EQ  ( last->original_count, 1 );
    EXPECT_EQ  ( last->removed, "a" );
    EXPECT_FALSE( ms.contains( "a" ) );
    EXPECT_EQ  ( ms.size(), 1 );

    EXPECT_FALSE( ms.remove( "a" ).has_value() );
}

TYPED_TEST( multiset_common, remove_more_than_present_removes_element )
{
    TypeParam ms;
    ms.insert_n( "a", 2 );
    auto const removed{ ms.remove_n( "a", 10 ) };
    ASSERT_TRUE( removed.has_value() );
    EXPECT_EQ  ( removed->original_count, 2 );
    EXPECT_EQ  ( removed->removed, "a" );
    EXPECT_TRUE( ms.empty() );
    EXPECT_EQ  ( ms.unique_size(), 0 );
}

TYPED_TEST( multiset_common, size_is_sum_of_counts )
{
    TypeParam ms{ "a", "b", "a", "c", "a" };
    std::size_t total{ 0 };
    for ( auto const & entry : ms )
    {
        EXPECT_GE( entry.second, 1 );
        total += entry.second;
    }
    EXPECT_EQ( total, ms.size() );
    EXPECT_EQ( ms.count( "a" ), 3 );
}

TYPED_TEST( multiset_common, from_counts_last_count_wins )
{
    std::vector<std::pair<std::string, std::size_t>> const counts{ { "a", 2 }, { "b", 0 }, { "a", 5 }, { "c", 1 } };
    auto const ms{ TypeParam::from_counts( counts.begin(), counts.end() ) };
    EXPECT_EQ   ( ms.count( "a" ), 5 );
    EXPECT_FALSE( ms.contains( "b" ) );
    EXPECT_EQ   ( ms.size(), 6 );
    EXPECT_EQ   ( ms.unique_size(), 2 );
}

TYPED_TEST( multiset_common, equality_and_clear )
{
    TypeParam a{ "x", "y", "x" };
    TypeParam b{ "y", "x", "x" };
    TypeParam c{ "x", "y", "y" };
    EXPECT_TRUE ( a == b );
    EXPECT_FALSE( a == c );

    a.clear();
    EXPECT_TRUE( a.empty() );
    EXPECT_EQ  ( a.count( "x" ), 0 );
}

TYPED_TEST( multiset_common, into_map_keeps_counts )
{
    TypeParam ms{ "q", "q" };
    auto map{ std::move( ms ).into_map() };
    EXPECT_EQ( map.size(), 1 );
    EXPECT_EQ( map.find( "q" )->second, 2 );
}

TEST( multiset, index_multiset_keeps_first_insertion_order )
{
    index_multiset<int> ms{ 3, 1, 3, 2 };
    std::vector<int> order;
    for ( auto const & entry : ms )
        order.push_back( entry.first );
    EXPECT_EQ( order, ( std::vector<int>{ 3, 1, 2 } ) );

    // removal of a whole element preserves the relative order of the rest
    ms.remove( 1 );
    EXPECT_EQ( ms.as_map().get_index_of( 2 ), 1 );
}

//------------------------------------------------------------------------------
} // namespace psi::coll
//------------------------------------------------------------------------------
