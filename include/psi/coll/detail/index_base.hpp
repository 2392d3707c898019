////////////////////////////////////////////////////////////////////////////////
/// detail::index_base: the key half shared by index_map and index_set
///
/// Owns the contiguous key array, the parallel array of cached key hashes and
/// the position table, and keeps the three in sync for every structural
/// operation (append, swap removal, shift removal, position swaps, bulk
/// reordering). Mapped values (index_map) are kept in a further parallel
/// array by the derived class which mirrors the same positional operations.
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

#include "index_table.hpp"
#include "../lookup.hpp"

#include <boost/assert.hpp>

#include <algorithm>
#include <cstddef>
#include <optional>
#include <span>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::coll::detail
{
//------------------------------------------------------------------------------

template <typename K, typename Hash, typename KeyEqual, index_map_options Options>
class index_base
{
public:
    using key_type        = K;
    using size_type       = std::size_t;
    using difference_type = std::ptrdiff_t;
    using hasher          = Hash;
    using key_equal       = KeyEqual;

    static bool constexpr transparent{ transparent_lookup<Hash, KeyEqual> };

    index_base() = default;
    explicit index_base( Hash const & hash, KeyEqual const & eq = KeyEqual{} )
        : hash_{ hash }, eq_{ eq } {}

    index_base( index_base const & ) = default;
    index_base( index_base && ) noexcept = default;
    index_base & operator=( index_base const & ) = default;
    index_base & operator=( index_base && ) noexcept = default;

    [[ nodiscard ]] size_type size () const noexcept { BOOST_ASSERT( table_.size() == keys_.size() ); return keys_.size(); }
    [[ nodiscard ]] bool      empty() const noexcept { return keys_.empty(); }
    [[ nodiscard ]] size_type capacity() const noexcept { return std::min( keys_.capacity(), table_.capacity() ); }

    [[ nodiscard ]] std::span<K const> keys() const noexcept { return keys_; }

    hasher    hash_function() const { return hash_; }
    key_equal key_eq       () const { return eq_  ; }

    template <LookupType<transparent, K> K2 = K>
    [[ nodiscard ]] std::optional<size_type> get_index_of( K2 const & key ) const
    {
        auto const pos{ find_position( hash_of( key ), key ) };
        if ( pos == index_table::npos )
            return std::nullopt;
        return pos;
    }

    template <LookupType<transparent, K> K2 = K>
    [[ nodiscard ]] bool contains( K2 const & key ) const { return find_position( hash_of( key ), key ) != index_table::npos; }

    /// Reserves room for a total of n entries.
    void reserve( size_type const n )
    {
        table_ .reserve( n );
        keys_  .reserve( n );
        hashes_.reserve( n );
    }

protected:
    template <typename K2>
    std::size_t hash_of( K2 const & key ) const { return static_cast<std::size_t>( hash_( key ) ); }

    template <typename K2>
    size_type find_position( std::size_t const hash, K2 const & key ) const
    {
        return table_.find( hash, [ this, &key ]( size_type const pos ) { return static_cast<bool>( eq_( keys_[ pos ], key ) ); } );
    }

    /// Appends a key known to be absent. On failure nothing is appended.
    template <typename KArg>
    void push_key( std::size_t const hash, KArg && key )
    {
        keys_.emplace_back( std::forward<KArg>( key ) );
        try
        {
            hashes_.push_back( hash );
            table_ .insert_unique( hash, keys_.size() - 1 );
        }
        catch ( ... )
        {
            if ( hashes_.size() == keys_.size() )
                hashes_.pop_back();
            keys_.pop_back();
            throw;
        }
    }

    /// Removes the key at pos moving the last key into its place.
    void swap_remove_key_at( size_type const pos ) noexcept
    {
        BOOST_ASSERT( pos < size() );
        auto const last{ size() - 1 };
        table_.erase( hashes_[ pos ], pos );
        if ( pos != last )
        {
            table_.replace( hashes_[ last ], last, pos );
            keys_  [ pos ] = std::move( keys_[ last ] );
            hashes_[ pos ] = hashes_[ last ];
        }
        keys_  .pop_back();
        hashes_.pop_back();
    }

    /// Removes the key at pos shifting all following keys down by one.
    void shift_remove_key_at( size_type const pos ) noexcept
    {
        BOOST_ASSERT( pos < size() );
        auto const last{ keys_.size() - 1 };
        table_.erase( hashes_[ pos ], pos );
        if ( pos != last )
            table_.shift_down_after( pos );
        auto const p{ static_cast<difference_type>( pos ) };
        keys_  .erase( keys_  .begin() + p );
        hashes_.erase( hashes_.begin() + p );
    }

    void swap_key_positions( size_type const a, size_type const b ) noexcept
    {
        BOOST_ASSERT( ( a < size() ) && ( b < size() ) );
        if ( a == b )
            return;
        auto const parked{ size() }; // not a valid position: used as a temporary
        table_.replace( hashes_[ a ], a, parked );
        table_.replace( hashes_[ b ], b, a      );
        table_.replace( hashes_[ a ], parked, b );
        using std::swap;
        swap( keys_  [ a ], keys_  [ b ] );
        swap( hashes_[ a ], hashes_[ b ] );
    }

    void truncate_keys( size_type const new_size ) noexcept
    {
        BOOST_ASSERT( new_size <= size() );
        keys_  .erase( keys_  .begin() + static_cast<difference_type>( new_size ), keys_  .end() );
        hashes_.erase( hashes_.begin() + static_cast<difference_type>( new_size ), hashes_.end() );
    }

    /// Re-registers every position (after bulk reordering of the arrays).
    void rebuild_table() noexcept
    {
        BOOST_ASSERT( hashes_.size() == keys_.size() );
        table_.clear();
        for ( size_type pos{ 0 }; pos < hashes_.size(); ++pos )
            table_.insert_unique( hashes_[ pos ], pos ); // cannot grow: the table already indexed at least as many
    }

    /// Reorders keys and cached hashes so that new position i holds old
    /// position order[ i ].
    void permute_keys( std::span<size_type const> const order )
    {
        BOOST_ASSERT( order.size() == size() );
        std::vector<K>           keys  ; keys  .reserve( order.size() );
        std::vector<std::size_t> hashes; hashes.reserve( order.size() );
        for ( auto const old_pos : order )
        {
            keys  .push_back( std::move( keys_[ old_pos ] ) );
            hashes.push_back( hashes_[ old_pos ] );
        }
        keys_  .swap( keys   );
        hashes_.swap( hashes );
    }

    void clear_keys() noexcept
    {
        keys_  .clear();
        hashes_.clear();
        table_ .clear();
    }

    void shrink_keys_to_fit()
    {
        keys_  .shrink_to_fit();
        hashes_.shrink_to_fit();
        table_ .shrink_to_fit( keys_.size() );
    }

protected:
    std::vector<K>           keys_;
    std::vector<std::size_t> hashes_;
    index_table              table_{ Options.max_load_percent };
#ifdef _MSC_VER
    [[ msvc::no_unique_address ]]
#else
    [[ no_unique_address ]]
#endif
    Hash hash_;
#ifdef _MSC_VER
    [[ msvc::no_unique_address ]]
#else
    [[ no_unique_address ]]
#endif
    KeyEqual eq_;
}; // class index_base

//------------------------------------------------------------------------------
} // namespace psi::coll::detail
//------------------------------------------------------------------------------
