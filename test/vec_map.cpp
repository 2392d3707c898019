////////////////////////////////////////////////////////////////////////////////
/// psi::coll::vec_map unit tests
////////////////////////////////////////////////////////////////////////////////

#include <psi/coll/vec_map.hpp>

#include <gtest/gtest.h>

#include <concepts>
#include <cstdint>
#include <iterator>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::coll
{
//------------------------------------------------------------------------------

namespace test
{
    struct node_id
    {
        std::uint32_t value;
        friend bool operator==( node_id, node_id ) = default;
    };

    enum class colour : std::uint8_t { red, green, blue };
} // namespace test

template <>
struct index_key_traits<test::node_id>
{
    static std::size_t  to_index  ( test::node_id const id    ) noexcept { return id.value; }
    static test::node_id from_index( std::size_t   const index ) noexcept { return { static_cast<std::uint32_t>( index ) }; }
}; // struct index_key_traits<node_id>

static_assert( index_key<int> );
static_assert( index_key<test::colour> );
static_assert( index_key<test::node_id> );
static_assert( !index_key<std::string> );

namespace
{
    template <typename K, typename V>
    std::vector<K> key_order( vec_map<K, V> const & m ) { return { m.keys().begin(), m.keys().end() }; }
} // anonymous namespace

//==============================================================================
// Key conversion
//==============================================================================

TEST( index_key, integral_conversion )
{
    EXPECT_EQ   ( index_key_traits<int>::to_index( 42 ), 42 );
    EXPECT_EQ   ( index_key_traits<int>::from_index( 7 ), 7 );
    EXPECT_FALSE( index_key_traits<int>::try_to_index( -1 ).has_value() );
    EXPECT_THROW( (void)index_key_traits<int>::to_index( -1 ), std::out_of_range );
    EXPECT_THROW( (void)index_key_traits<std::int64_t>::to_index( std::numeric_limits<std::int64_t>::min() ), std::out_of_range );
    EXPECT_EQ   ( index_key_traits<test::colour>::to_index( test::colour::blue ), 2 );
    EXPECT_EQ   ( index_key_traits<test::colour>::from_index( 1 ), test::colour::green );
}

//==============================================================================
// Basic operations
//==============================================================================

TEST( vec_map, insert_and_lookup )
{
    vec_map<std::size_t, std::string> m;
    EXPECT_FALSE( m.insert( 3, "three" ).has_value() );
    EXPECT_EQ   ( m.size(), 1 );
    EXPECT_EQ   ( m.capacity(), 4 );
    EXPECT_FALSE( m.contains_key( 0 ) );
    EXPECT_TRUE ( m.contains_key( 3 ) );
    EXPECT_EQ   ( *m.get( 3 ), "three" );
    EXPECT_EQ   ( m.get( 100 ), nullptr );

    EXPECT_EQ( m.insert( 3, "THREE" ), "three" );
    EXPECT_EQ( m.size(), 1 );
    *m.get_mut( 3 ) += "!";
    EXPECT_EQ( m.at( 3 ), "THREE!" );
    EXPECT_THROW( (void)m.at( 1 ), std::out_of_range );
}

TEST( vec_map, unconvertible_keys )
{
    vec_map<int, int> m{ { 0, 0 }, { 1, 10 } };
    EXPECT_EQ   ( m.get( -1 ), nullptr );
    EXPECT_FALSE( m.contains_key( -1 ) );
    EXPECT_FALSE( m.remove( -1 ).has_value() );
    EXPECT_THROW( m.insert( -1, 0 ), std::out_of_range );
    EXPECT_THROW( (void)m.entry( -5 ), std::out_of_range );
    EXPECT_EQ   ( m.size(), 2 );
}

TEST( vec_map, slots_are_reused_and_never_shrink )
{
    vec_map<int, int> m;
    m.insert( 10, 1 );
    EXPECT_EQ( m.capacity(), 11 );
    EXPECT_EQ( m.remove( 10 ), 1 );
    EXPECT_TRUE( m.empty() );
    EXPECT_EQ( m.capacity(), 11 );
    EXPECT_FALSE( m.remove( 10 ).has_value() );

    m.insert( 10, 2 );
    EXPECT_EQ( m.capacity(), 11 );
    EXPECT_EQ( m.size(), 1 );
    EXPECT_EQ( m.at( 10 ), 2 );
}

TEST( vec_map, iteration_in_key_order_skips_holes )
{
    vec_map<int, char> m;
    m.insert( 5, 'e' );
    m.insert( 1, 'a' );
    m.insert( 3, 'c' );
    EXPECT_EQ( key_order( m ), ( std::vector<int>{ 1, 3, 5 } ) );
    EXPECT_EQ( std::vector<char>( m.values().begin(), m.values().end() ), ( std::vector<char>{ 'a', 'c', 'e' } ) );

    std::vector<int> reversed;
    for ( auto it{ m.rbegin() }; it != m.rend(); ++it )
        reversed.push_back( ( *it ).first );
    EXPECT_EQ( reversed, ( std::vector<int>{ 5, 3, 1 } ) );

    for ( auto && [ key, value ] : m )
        value = static_cast<char>( value - 'a' + 'A' );
    EXPECT_EQ( m.at( 5 ), 'E' );

    std::size_t visited{ 0 };
    for ( auto const & entry : std::as_const( m ) )
    {
        EXPECT_TRUE( m.contains_key( entry.first ) );
        ++visited;
    }
    EXPECT_EQ( visited, m.size() );
}

TEST( vec_map, mutable_iterators_copy_and_convert )
{
    vec_map<int, int> m{ { 0, 1 }, { 4, 5 }, { 2, 3 } };
    static_assert( std::copy_constructible<vec_map<int, int>::iterator> );
    static_assert( std::bidirectional_iterator<vec_map<int, int>::iterator> );

    auto       it  { m.begin() };
    auto const copy{ it };
    ++it;
    EXPECT_EQ( ( *copy ).first, 0 );
    EXPECT_EQ( ( *it   ).first, 2 );
    EXPECT_EQ( it.index(), 2 );

    vec_map<int, int>::const_iterator const converted{ it };
    EXPECT_EQ( ( *converted ).second, 3 );
    EXPECT_TRUE( converted != m.cend() );

    for ( auto r{ m.rbegin() }; r != m.rend(); ++r )
        ( *r ).second *= 10;
    EXPECT_EQ( m.at( 0 ), 10 );
    EXPECT_EQ( m.at( 4 ), 50 );
    EXPECT_EQ( std::distance( m.rbegin(), m.rend() ), 3 );
}

TEST( vec_map, pop_removes_highest_key )
{
    vec_map<int, int> m{ { 2, 20 }, { 7, 70 }, { 4, 40 } };
    auto const popped{ m.pop() };
    ASSERT_TRUE( popped.has_value() );
    EXPECT_EQ  ( popped->first , 7 );
    EXPECT_EQ  ( popped->second, 70 );
    EXPECT_EQ  ( m.size(), 2 );
    m.pop();
    m.pop();
    EXPECT_FALSE( m.pop().has_value() );
}

TEST( vec_map, retain_visits_in_order )
{
    vec_map<int, int> m{ { 0, 0 }, { 1, 1 }, { 2, 2 }, { 3, 3 } };
    std::vector<int> visited;
    m.retain( [ &visited ]( int const key, int & value ) { visited.push_back( key ); value *= 10; return key % 2 == 0; } );
    EXPECT_EQ( visited, ( std::vector<int>{ 0, 1, 2, 3 } ) );
    EXPECT_EQ( key_order( m ), ( std::vector<int>{ 0, 2 } ) );
    EXPECT_EQ( m.at( 2 ), 20 );
    EXPECT_EQ( m.size(), 2 );
}

//==============================================================================
// Entry API
//==============================================================================

TEST( vec_map, entry )
{
    vec_map<test::colour, int> m;
    m.entry( test::colour::green ).or_insert( 1 ) += 1;
    m.entry( test::colour::green ).or_insert( 1 ) += 1;
    EXPECT_EQ( m.at( test::colour::green ), 3 );

    m.entry( test::colour::red ).and_modify( []( int & v ) { v = 100; } ).or_default();
    EXPECT_EQ( m.at( test::colour::red ), 0 );

    auto occupied{ m.entry( test::colour::green ) };
    ASSERT_TRUE( occupied.is_occupied() );
    EXPECT_EQ  ( occupied.key(), test::colour::green );
    EXPECT_EQ  ( occupied.occupied().remove(), 3 );
    EXPECT_FALSE( m.contains_key( test::colour::green ) );
    EXPECT_EQ  ( m.size(), 1 );

    m[ test::colour::blue ] = 7;
    EXPECT_EQ( m.size(), 2 );
    EXPECT_EQ( m.at( test::colour::blue ), 7 );
}

TEST( vec_map, user_defined_key )
{
    vec_map<test::node_id, std::string> m;
    m.insert( test::node_id{ 2 }, "two" );
    m.insert( test::node_id{ 0 }, "zero" );
    EXPECT_EQ( m.size(), 2 );
    EXPECT_EQ( *m.get( test::node_id{ 2 } ), "two" );
    auto const first{ *m.begin() };
    EXPECT_EQ( first.first.value, 0 );
    EXPECT_EQ( first.second, "zero" );
}

//==============================================================================
// Construction and comparison
//==============================================================================

TEST( vec_map, construction )
{
    vec_map<int, int> const with_capacity( 16 );
    EXPECT_TRUE( with_capacity.empty() );
    EXPECT_EQ  ( with_capacity.capacity(), 16 );

    auto const filled{ vec_map<int, std::string>::from_elem( "x", 3 ) };
    EXPECT_EQ( filled.size(), 3 );
    EXPECT_EQ( filled.at( 2 ), "x" );

    std::vector<std::optional<int>> slots{ 1, std::nullopt, 3 };
    vec_map<int, int> const adopted{ std::move( slots ) };
    EXPECT_EQ   ( adopted.size(), 2 );
    EXPECT_FALSE( adopted.contains_key( 1 ) );
    EXPECT_EQ   ( adopted.at( 2 ), 3 );
}

TEST( vec_map, equality_ignores_trailing_empty_slots )
{
    vec_map<int, int> a{ { 1, 10 } };
    vec_map<int, int> b( 32 );
    b.insert( 1, 10 );
    EXPECT_TRUE( a == b );

    b.insert( 20, 0 );
    EXPECT_FALSE( a == b );
    b.remove( 20 );
    EXPECT_TRUE( a == b );

    a.reserve( 100 );
    a.clear();
    EXPECT_EQ   ( a.capacity(), 102 );
    EXPECT_FALSE( a == b );
}

//------------------------------------------------------------------------------
} // namespace psi::coll
//------------------------------------------------------------------------------
