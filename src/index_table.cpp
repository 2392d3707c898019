////////////////////////////////////////////////////////////////////////////////
///
/// Copyright (c) Domagoj Saric.
///
/// Use, modification and distribution is subject to the
/// Boost Software License, Version 1.0.
/// (See accompanying file LICENSE_1_0.txt or copy at
/// http://www.boost.org/LICENSE_1_0.txt)
///
/// For more information, see http://www.boost.org
///
////////////////////////////////////////////////////////////////////////////////
//------------------------------------------------------------------------------
#include <psi/coll/detail/index_table.hpp>
#include <psi/coll/abi.hpp>

#include <algorithm>
#include <bit>
#include <limits>
//------------------------------------------------------------------------------
namespace psi::coll::detail
{
//------------------------------------------------------------------------------

namespace
{
    constexpr index_table::size_type min_slot_count{ 8 };
    // keeps positions * 100 and the power of two rounding in range
    constexpr index_table::size_type max_positions { std::numeric_limits<index_table::size_type>::max() / 256 };
} // anonymous namespace

index_table::size_type index_table::slots_for( size_type const positions, std::uint8_t const max_load_percent ) noexcept
{
    // smallest power of two that keeps the load at or below the limit
    auto const required{ ( positions * 100 + max_load_percent - 1 ) / max_load_percent + 1 };
    return std::max( min_slot_count, std::bit_ceil( required ) );
}

index_table::size_type index_table::find_slot_of( std::size_t const hash, size_type const position ) const noexcept
{
    BOOST_ASSERT( size_ != 0 );
    auto const mask{ slots_.size() - 1 };
    for ( auto i{ home_slot( hash ) }; ; i = ( i + 1 ) & mask )
    {
        BOOST_ASSERT_MSG( !slots_[ i ].empty(), "Position not registered in the index table" );
        if ( slots_[ i ].position_plus_one == position + 1 )
            return i;
    }
}

void index_table::insert_unique( std::size_t const hash, size_type const position )
{
    if ( size_ + 1 > capacity() ) [[ unlikely ]]
        rehash( std::max( slots_for( size_ + 1, max_load_percent_ ), slots_.size() * 2 ) );
    auto const mask{ slots_.size() - 1 };
    auto i{ home_slot( hash ) };
    while ( !slots_[ i ].empty() )
        i = ( i + 1 ) & mask;
    slots_[ i ] = { hash, position + 1 };
    ++size_;
}

void index_table::erase( std::size_t const hash, size_type const position ) noexcept
{
    auto const mask{ slots_.size() - 1 };
    auto hole{ find_slot_of( hash, position ) };
    // backward shift: pull later members of the probe run into the hole as
    // long as that does not move them in front of their home slot
    for ( auto j{ ( hole + 1 ) & mask }; !slots_[ j ].empty(); j = ( j + 1 ) & mask )
    {
        auto const home{ home_slot( slots_[ j ].hash ) };
        auto const distance_from_home{ ( j    - home ) & mask };
        auto const distance_to_hole  { ( j    - hole ) & mask };
        if ( distance_from_home >= distance_to_hole )
        {
            slots_[ hole ] = slots_[ j ];
            hole = j;
        }
    }
    slots_[ hole ].position_plus_one = 0;
    --size_;
}

void index_table::replace( std::size_t const hash, size_type const old_position, size_type const new_position ) noexcept
{
    slots_[ find_slot_of( hash, old_position ) ].position_plus_one = new_position + 1;
}

void index_table::shift_down_after( size_type const position ) noexcept
{
    for ( auto & s : slots_ )
    {
        if ( s.position_plus_one > position + 1 )
            --s.position_plus_one;
    }
}

void index_table::reserve( size_type const positions )
{
    if ( positions > max_positions ) [[ unlikely ]]
        throw_length_error( "psi::coll::index_map::reserve: requested capacity too large" );
    if ( positions > capacity() )
        rehash( slots_for( positions, max_load_percent_ ) );
}

void index_table::clear() noexcept
{
    for ( auto & s : slots_ )
        s.position_plus_one = 0;
    size_ = 0;
}

void index_table::shrink_to_fit( size_type const positions )
{
    BOOST_ASSERT( positions >= size_ );
    if ( positions == 0 )
    {
        slots_.clear();
        slots_.shrink_to_fit();
        shift_ = 64;
        return;
    }
    auto const target{ slots_for( positions, max_load_percent_ ) };
    if ( target < slots_.size() )
        rehash( target );
}

void index_table::rehash( size_type const new_slot_count )
{
    BOOST_ASSERT( std::has_single_bit( new_slot_count ) );
    BOOST_ASSERT( new_slot_count * max_load_percent_ / 100 >= size_ );
    std::vector<slot> old_slots( new_slot_count, slot{ 0, 0 } );
    old_slots.swap( slots_ );
    shift_ = static_cast<std::uint8_t>( 64 - std::countr_zero( new_slot_count ) );
    auto const mask{ new_slot_count - 1 };
    for ( auto const & s : old_slots )
    {
        if ( s.empty() )
            continue;
        auto i{ home_slot( s.hash ) };
        while ( !slots_[ i ].empty() )
            i = ( i + 1 ) & mask;
        slots_[ i ] = s;
    }
}

//------------------------------------------------------------------------------
} // namespace psi::coll::detail
//------------------------------------------------------------------------------
