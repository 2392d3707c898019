////////////////////////////////////////////////////////////////////////////////
/// Position table backing the insertion ordered index_map/index_set.
///
/// The table does not own keys: every occupied slot holds the cached hash of a
/// key and that key's position in the owning container's contiguous key
/// array. Lookups are parameterized with a position predicate so that keys are
/// only ever compared through the owner.
///
/// Layout: open addressing, linear probing, power-of-two slot count, home slot
/// selected with Fibonacci hashing (so weak hashers, e.g. the identity
/// boost::hash<int>, still spread over the whole table), backward shift
/// deletion (no tombstones). Cached hashes make growth independent of the key
/// type (growth never calls the hasher).
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
#pragma once

#include <boost/assert.hpp>
#include <boost/config.hpp>

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::coll
{
//------------------------------------------------------------------------------

struct index_map_options
{
    std::uint8_t max_load_percent{ 80 };
}; // struct index_map_options

namespace detail
{
//------------------------------------------------------------------------------

class index_table
{
public:
    using size_type = std::size_t;

    static size_type constexpr npos{ static_cast<size_type>( -1 ) };

    explicit index_table( std::uint8_t const max_load_percent = index_map_options{}.max_load_percent ) noexcept
        : max_load_percent_{ max_load_percent }
    {
        BOOST_ASSERT_MSG( max_load_percent_ > 0 && max_load_percent_ < 100, "Index table load factor must be in (0, 100)%" );
    }

    index_table( index_table const & ) = default;
    index_table( index_table && other ) noexcept
        : slots_{ std::move( other.slots_ ) }, size_{ other.size_ }, shift_{ other.shift_ }, max_load_percent_{ other.max_load_percent_ }
    {
        other.size_  = 0;
        other.shift_ = 64;
    }
    index_table & operator=( index_table const & ) = default;
    index_table & operator=( index_table && other ) noexcept
    {
        slots_            = std::move( other.slots_ );
        size_             = other.size_;
        shift_            = other.shift_;
        max_load_percent_ = other.max_load_percent_;
        other.size_  = 0;
        other.shift_ = 64;
        return *this;
    }

    [[ nodiscard ]] size_type size      () const noexcept { return size_; }
    [[ nodiscard ]] size_type slot_count() const noexcept { return slots_.size(); }
    /// Number of positions the table can index without growing.
    [[ nodiscard ]] size_type capacity  () const noexcept { return slots_.size() * max_load_percent_ / 100; }

    /// Returns the position of the entry with the given hash for which
    /// equal_at( position ) holds, npos if there is none.
    template <typename EqualAt>
    [[ nodiscard ]] size_type find( std::size_t const hash, EqualAt && equal_at ) const
    {
        if ( size_ == 0 )
            return npos;
        auto const mask{ slots_.size() - 1 };
        for ( auto i{ home_slot( hash ) }; ; i = ( i + 1 ) & mask )
        {
            auto const & s{ slots_[ i ] };
            if ( s.empty() )
                return npos;
            if ( ( s.hash == hash ) && equal_at( s.position() ) )
                return s.position();
        }
    }

    /// Registers a position known not to be present yet (the caller has
    /// already performed the lookup).
    void insert_unique( std::size_t hash, size_type position );

    /// Unregisters the given position (which must be present for this hash).
    void erase( std::size_t hash, size_type position ) noexcept;

    /// Relocates a registered position (used after swap removal/swaps).
    void replace( std::size_t hash, size_type old_position, size_type new_position ) noexcept;

    /// Decrements every registered position greater than the given one (used
    /// after order preserving removal).
    void shift_down_after( size_type position ) noexcept;

    void reserve      ( size_type positions );
    void clear        () noexcept;
    void shrink_to_fit( size_type positions );

private:
    struct slot
    {
        std::size_t hash;
        size_type   position_plus_one; // 0 <=> empty

        bool      empty   () const noexcept { return position_plus_one == 0; }
        size_type position() const noexcept { BOOST_ASSERT( !empty() ); return position_plus_one - 1; }
    }; // struct slot

    size_type home_slot( std::size_t const hash ) const noexcept
    {
        // Fibonacci hashing: multiply by 2^64/phi and keep the top bits
        auto const mixed{ static_cast<std::uint64_t>( hash ) * UINT64_C( 0x9E3779B97F4A7C15 ) };
        return static_cast<size_type>( mixed >> shift_ );
    }

    size_type find_slot_of( std::size_t hash, size_type position ) const noexcept;

    [[ gnu::cold ]] void rehash( size_type new_slot_count );

    static size_type slots_for( size_type positions, std::uint8_t max_load_percent ) noexcept;

private:
    std::vector<slot> slots_;
    size_type         size_            { 0 };
    std::uint8_t      shift_           { 64 };
    std::uint8_t      max_load_percent_;
}; // class index_table

//------------------------------------------------------------------------------
} // namespace detail
//------------------------------------------------------------------------------
} // namespace psi::coll
//------------------------------------------------------------------------------
