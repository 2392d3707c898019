////////////////////////////////////////////////////////////////////////////////
/// psi::coll multimap unit tests
////////////////////////////////////////////////////////////////////////////////

#include <psi/coll/multimap.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::coll {
//------------------------------------------------------------------------------

namespace
{
    template <typename Multimap>
    std::size_t counted_size( Multimap const & mm )
    {
        std::size_t total{ 0 };
        for ( auto const & [ key, values ] : mm.as_map() )
            total += values.size();
        return total;
    }

    template <typename Range>
    auto sorted( Range const & r )
    {
        std::vector<std::ranges::range_value_t<Range>> result( r.begin(), r.end() );
        std::sort( result.begin(), result.end() );
        return result;
    }
} // anonymous namespace

//==============================================================================
// Behaviour shared by all four configurations
//==============================================================================

template <typename Multimap>
class multimap_common : public ::testing::Test {};

using all_multimaps = ::testing::Types
<
    hash_set_multimap <int, int>,
    hash_vec_multimap <int, int>,
    index_set_multimap<int, int>,
    index_vec_multimap<int, int>
>;
TYPED_TEST_SUITE( multimap_common, all_multimaps );

TYPED_TEST( multimap_common, empty_by_default )
{
    TypeParam mm;
    EXPECT_TRUE( mm.empty() );
    EXPECT_EQ  ( mm.size(), 0 );
    EXPECT_EQ  ( mm.keys_size(), 0 );
    EXPECT_EQ  ( mm.get( 1 ), nullptr );
    EXPECT_TRUE( mm.begin() == mm.end() );
}

TYPED_TEST( multimap_common, size_tracks_total_values )
{
    TypeParam mm;
    EXPECT_TRUE( mm.insert( 1, 10 ) );
    EXPECT_TRUE( mm.insert( 1, 11 ) );
    EXPECT_TRUE( mm.insert( 2, 20 ) );
    EXPECT_EQ  ( mm.size(), 3 );
    EXPECT_EQ  ( mm.keys_size(), 2 );
    EXPECT_EQ  ( mm.size(), counted_size( mm ) );

    EXPECT_TRUE ( mm.remove( 1, 10 ) );
    EXPECT_FALSE( mm.remove( 1, 99 ) );
    EXPECT_FALSE( mm.remove( 9, 10 ) );
    EXPECT_EQ   ( mm.size(), 2 );
    EXPECT_EQ   ( mm.size(), counted_size( mm ) );
}

TYPED_TEST( multimap_common, last_value_removal_removes_key )
{
    TypeParam mm{ { 1, 10 }, { 2, 20 } };
    EXPECT_TRUE ( mm.remove( 1, 10 ) );
    EXPECT_FALSE( mm.contains_key( 1 ) );
    EXPECT_EQ   ( mm.keys_size(), 1 );
    for ( auto const & [ key, values ] : mm.as_map() )
        EXPECT_FALSE( values.empty() );
}

TYPED_TEST( multimap_common, remove_key_returns_collection )
{
    TypeParam mm{ { 1, 10 }, { 1, 11 }, { 2, 20 } };
    auto const removed{ mm.remove_key( 1 ) };
    ASSERT_TRUE( removed.has_value() );
    EXPECT_EQ  ( removed->size(), 2 );
    EXPECT_EQ  ( mm.size(), 1 );
    EXPECT_FALSE( mm.remove_key( 1 ).has_value() );

    auto const entry{ mm.remove_key_entry( 2 ) };
    ASSERT_TRUE( entry.has_value() );
    EXPECT_EQ  ( entry->first, 2 );
    EXPECT_TRUE( mm.empty() );
}

TYPED_TEST( multimap_common, contains_pair )
{
    TypeParam mm{ { 1, 10 }, { 2, 20 } };
    EXPECT_TRUE ( mm.contains( 1, 10 ) );
    EXPECT_FALSE( mm.contains( 1, 20 ) );
    EXPECT_FALSE( mm.contains( 3, 10 ) );
}

TYPED_TEST( multimap_common, retain_drops_emptied_keys )
{
    TypeParam mm{ { 1, 10 }, { 1, 11 }, { 2, 21 }, { 3, 30 } };
    mm.retain( []( int const key, int const value ) { return key != 3 && value % 2 != 0; } );
    EXPECT_EQ   ( mm.size(), 2 );
    EXPECT_EQ   ( mm.size(), counted_size( mm ) );
    EXPECT_FALSE( mm.contains_key( 3 ) );
    EXPECT_TRUE ( mm.contains( 1, 11 ) );
    EXPECT_TRUE ( mm.contains( 2, 21 ) );
}

TYPED_TEST( multimap_common, iteration_visits_every_pair )
{
    TypeParam mm{ { 1, 10 }, { 1, 11 }, { 2, 20 } };
    std::vector<std::pair<int, int>> pairs;
    for ( auto const & [ key, value ] : mm )
        pairs.emplace_back( key, value );
    std::sort( pairs.begin(), pairs.end() );
    EXPECT_EQ( pairs, ( std::vector<std::pair<int, int>>{ { 1, 10 }, { 1, 11 }, { 2, 20 } } ) );
    EXPECT_EQ( pairs.size(), mm.size() );

    EXPECT_EQ( sorted( mm.keys  () ), ( std::vector<int>{ 1, 2 } ) );
    EXPECT_EQ( sorted( mm.values() ), ( std::vector<int>{ 10, 11, 20 } ) );
}

TYPED_TEST( multimap_common, round_trip_through_pairs )
{
    TypeParam const original{ { 3, 30 }, { 1, 10 }, { 3, 31 }, { 2, 20 } };
    std::vector<std::pair<int, int>> pairs;
    for ( auto const & [ key, value ] : original )
        pairs.emplace_back( key, value );
    TypeParam const rebuilt( pairs.begin(), pairs.end() );
    EXPECT_TRUE( rebuilt == original );
}

TYPED_TEST( multimap_common, adopt_map_drops_empty_collections )
{
    using values_traits = detail::value_collection_traits<typename TypeParam::values_type>;
    typename TypeParam::map_type map;
    map[ 1 ];
    values_traits::insert( map[ 2 ], 20 );
    TypeParam const mm{ std::move( map ) };
    EXPECT_EQ   ( mm.size(), 1 );
    EXPECT_EQ   ( mm.keys_size(), 1 );
    EXPECT_FALSE( mm.contains_key( 1 ) );
}

TYPED_TEST( multimap_common, clear_and_capacity )
{
    TypeParam mm;
    mm.reserve( 64 );
    EXPECT_GE( mm.key_capacity(), 64 );
    for ( int i{ 0 }; i < 10; ++i )
        mm.insert( i, i );
    mm.clear();
    EXPECT_TRUE( mm.empty() );
    EXPECT_EQ  ( mm.keys_size(), 0 );
    mm.shrink_keys_to_fit();
    mm.shrink_values_to_fit();
    EXPECT_TRUE( mm.insert( 1, 1 ) );
}

//==============================================================================
// Collection semantics
//==============================================================================

TEST( multimap, lookup_arguments_pass_small_types_by_value )
{
    static_assert( std::is_same_v<hash_set_multimap<int, std::string>::key_const_arg  , int const> );
    static_assert( std::is_same_v<hash_set_multimap<int, std::string>::value_const_arg, std::string const &> );
    static_assert( std::is_same_v<index_vec_multimap<std::string, char>::key_const_arg, std::string const &> );

    hash_set_multimap<int, std::string> mm;
    std::string const value{ "value" };
    mm.insert( 7, value );
    EXPECT_TRUE ( mm.contains( 7, value ) );
    EXPECT_TRUE ( mm.remove  ( 7, value ) );
    EXPECT_FALSE( mm.contains_key( 7 ) );
}

TEST( multimap, set_variants_deduplicate )
{
    hash_set_multimap<std::string, int> hashed;
    EXPECT_TRUE ( hashed.insert( "a", 1 ) );
    EXPECT_FALSE( hashed.insert( "a", 1 ) );
    EXPECT_EQ   ( hashed.size(), 1 );

    index_set_multimap<std::string, int> indexed;
    EXPECT_TRUE ( indexed.insert( "a", 1 ) );
    EXPECT_FALSE( indexed.insert( "a", 1 ) );
    EXPECT_TRUE ( indexed.insert( "a", 2 ) );
    EXPECT_EQ   ( indexed.size(), 2 );

    auto const full{ indexed.insert_full( "a", 1 ) };
    EXPECT_EQ   ( full.key_index  , 0 );
    EXPECT_EQ   ( full.value_index, 0 );
    EXPECT_FALSE( full.inserted );
}

TEST( multimap, vec_variants_keep_duplicates_in_order )
{
    index_vec_multimap<std::string, int> mm;
    EXPECT_TRUE( mm.insert( "k", 3 ) );
    EXPECT_TRUE( mm.insert( "k", 1 ) );
    EXPECT_TRUE( mm.insert( "k", 3 ) );
    EXPECT_EQ  ( mm.size(), 3 );
    ASSERT_NE  ( mm.get( "k" ), nullptr );
    EXPECT_EQ  ( *mm.get( "k" ), ( std::vector<int>{ 3, 1, 3 } ) );

    // removes the first occurrence only
    EXPECT_TRUE( mm.remove( "k", 3 ) );
    EXPECT_EQ  ( *mm.get( "k" ), ( std::vector<int>{ 1, 3 } ) );

    auto const full{ mm.insert_full( "k", 1 ) };
    EXPECT_EQ  ( full.value_index, 2 );
    EXPECT_TRUE( full.inserted );

    hash_vec_multimap<int, int> hashed{ { 1, 5 }, { 1, 5 } };
    EXPECT_EQ( hashed.size(), 2 );
    EXPECT_EQ( *hashed.get( 1 ), ( std::vector<int>{ 5, 5 } ) );
}

//==============================================================================
// Insertion ordered variants
//==============================================================================

TEST( multimap, index_variants_keep_key_insertion_order )
{
    index_set_multimap<int, char> mm{ { 3, 'a' }, { 1, 'b' }, { 3, 'c' }, { 2, 'd' } };
    EXPECT_EQ( std::vector<int>( mm.keys().begin(), mm.keys().end() ), ( std::vector<int>{ 3, 1, 2 } ) );
    EXPECT_EQ( std::vector<char>( mm.values().begin(), mm.values().end() ), ( std::vector<char>{ 'a', 'c', 'b', 'd' } ) );

    auto const second{ mm.nth( 1 ) };
    ASSERT_TRUE( second.has_value() );
    EXPECT_EQ  ( second->first, 1 );
    EXPECT_FALSE( mm.nth( 3 ).has_value() );

    auto const full{ mm.get_full( 2 ) };
    ASSERT_TRUE( full.has_value() );
    EXPECT_EQ  ( full->index, 2 );
    EXPECT_EQ  ( full->values.size(), 1 );
}

TEST( multimap, shift_removal_preserves_key_positions )
{
    index_vec_multimap<int, int> mm{ { 1, 1 }, { 2, 2 }, { 3, 3 }, { 4, 4 } };
    EXPECT_TRUE( mm.shift_remove( 2, 2 ) );
    EXPECT_EQ  ( mm.get_key_index( 3 ), 1 );
    EXPECT_EQ  ( mm.get_key_index( 4 ), 2 );

    EXPECT_TRUE( mm.shift_remove_key( 1 ).has_value() );
    EXPECT_EQ  ( mm.get_key_index( 3 ), 0 );
    EXPECT_EQ  ( mm.get_key_index( 4 ), 1 );
    EXPECT_EQ  ( mm.size(), 2 );
}

TEST( multimap, swap_removal_moves_last_key )
{
    index_vec_multimap<int, int> mm{ { 1, 1 }, { 2, 2 }, { 3, 3 }, { 4, 4 } };
    EXPECT_TRUE( mm.swap_remove( 1, 1 ) );
    EXPECT_EQ  ( mm.get_key_index( 4 ), 0 );
    EXPECT_EQ  ( mm.get_key_index( 2 ), 1 );

    auto const removed{ mm.swap_remove_key( 2 ) };
    ASSERT_TRUE( removed.has_value() );
    EXPECT_EQ  ( *removed, std::vector<int>{ 2 } );
    EXPECT_EQ  ( mm.get_key_index( 3 ), 1 );
    EXPECT_FALSE( mm.get_key_index( 2 ).has_value() );
    EXPECT_EQ  ( mm.size(), 2 );
}

TEST( multimap, default_removal_is_order_preserving )
{
    index_set_multimap<int, int> mm{ { 1, 1 }, { 2, 2 }, { 3, 3 } };
    EXPECT_TRUE( mm.remove( 1, 1 ) );
    EXPECT_EQ  ( mm.get_key_index( 2 ), 0 );
    EXPECT_EQ  ( mm.get_key_index( 3 ), 1 );
}

TEST( multimap, equality_ignores_order )
{
    index_vec_multimap<int, int> const a{ { 1, 1 }, { 1, 2 }, { 2, 3 } };
    index_vec_multimap<int, int> const b{ { 2, 3 }, { 1, 2 }, { 1, 1 } };
    index_vec_multimap<int, int> const c{ { 1, 1 }, { 1, 1 }, { 2, 3 } };
    EXPECT_TRUE ( a == b );
    EXPECT_FALSE( a == c );
}

TEST( multimap, vec_equality_compares_length_and_containment )
{
    // each value of the left collection must occur in the right one, occurrence counts are not compared
    hash_vec_multimap<int, int> const a{ { 1, 1 }, { 1, 1 }, { 1, 2 } };
    hash_vec_multimap<int, int> const b{ { 1, 1 }, { 1, 2 }, { 1, 2 } };
    hash_vec_multimap<int, int> const c{ { 1, 1 }, { 1, 2 } };
    hash_vec_multimap<int, int> const d{ { 1, 1 }, { 1, 1 }, { 1, 3 } };
    EXPECT_TRUE ( a == b );
    EXPECT_FALSE( a == c );
    EXPECT_FALSE( a == d );
}

//------------------------------------------------------------------------------
} // namespace psi::coll
//------------------------------------------------------------------------------
