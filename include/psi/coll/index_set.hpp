////////////////////////////////////////////////////////////////////////////////
/// Insertion ordered hash set with positional access (the set counterpart of
/// index_map: a single contiguous element array plus the position table).
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

#include "abi.hpp"
#include "lookup.hpp"
#include "detail/index_base.hpp"

#include <boost/assert.hpp>
#include <boost/container_hash/hash.hpp>

#include <algorithm>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <numeric>
#include <optional>
#include <span>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::coll
{
//------------------------------------------------------------------------------

template
<
    typename T,
    typename Hash             = boost::hash<T>,
    typename KeyEqual         = std::equal_to<T>,
    index_map_options Options = index_map_options{}
>
class index_set : private detail::index_base<T, Hash, KeyEqual, Options>
{
private:
    using base = detail::index_base<T, Hash, KeyEqual, Options>;
    using base::transparent;

public:
    using key_type        = T;
    using value_type      = T;
    using size_type       = typename base::size_type;
    using difference_type = typename base::difference_type;
    using hasher          = Hash;
    using key_equal       = KeyEqual;
    using reference       = T const &;
    using const_reference = T const &;

    using iterator               = typename std::vector<T>::const_iterator;
    using const_iterator         = iterator;
    using reverse_iterator       = std::reverse_iterator<iterator>;
    using const_reverse_iterator = reverse_iterator;

    index_set() = default;

    explicit index_set( size_type const capacity, Hash const & hash = Hash{}, KeyEqual const & eq = KeyEqual{} )
        : base{ hash, eq }
    {
        reserve( capacity );
    }

    explicit index_set( Hash const & hash, KeyEqual const & eq = KeyEqual{} ) : base{ hash, eq } {}

    template <std::input_iterator It>
    index_set( It first, It const last ) { insert( first, last ); }

    index_set( std::initializer_list<T> const il ) { insert( il.begin(), il.end() ); }

    using base::size;
    using base::empty;
    using base::capacity;
    using base::reserve;
    using base::hash_function;
    using base::key_eq;
    using base::contains;
    using base::get_index_of;

    void shrink_to_fit() { base::shrink_keys_to_fit(); }
    void clear() noexcept { base::clear_keys(); }

    iterator begin() const noexcept { return this->keys_.begin(); }
    iterator end  () const noexcept { return this->keys_.end  (); }
    reverse_iterator rbegin() const noexcept { return reverse_iterator{ end  () }; }
    reverse_iterator rend  () const noexcept { return reverse_iterator{ begin() }; }

    /// The elements as a contiguous span in insertion order.
    std::span<T const> as_span() const noexcept { return base::keys(); }

    template <LookupType<transparent, T> K2 = T>
    [[ nodiscard ]] T const * get( K2 const & value ) const
    {
        auto const pos{ find_pos( value ) };
        return ( pos != detail::index_table::npos ) ? &this->keys_[ pos ] : nullptr;
    }

    template <LookupType<transparent, T> K2 = T>
    [[ nodiscard ]] iterator find( K2 const & value ) const
    {
        auto const pos{ find_pos( value ) };
        return ( pos != detail::index_table::npos ) ? begin() + static_cast<difference_type>( pos ) : end();
    }

    [[ nodiscard ]] T const * nth( size_type const pos ) const noexcept { return ( pos < size() ) ? &this->keys_[ pos ] : nullptr; }

    /// Returns true if the value was not present yet (an existing equal value
    /// is left untouched).
    bool insert( T value ) { return insert_full( std::move( value ) ).second; }

    /// As insert() but also returns the position of the (new or existing)
    /// element.
    std::pair<size_type, bool> insert_full( T value )
    {
        auto const hash{ this->hash_of( value ) };
        auto const pos { this->find_position( hash, value ) };
        if ( pos != detail::index_table::npos )
            return { pos, false };
        this->push_key( hash, std::move( value ) );
        return { size() - 1, true };
    }

    template <std::input_iterator It>
    void insert( It first, It const last )
    {
        if constexpr ( std::forward_iterator<It> )
            reserve( size() + static_cast<size_type>( std::distance( first, last ) ) );
        for ( ; first != last; ++first )
            insert( T( *first ) );
    }

    template <LookupType<transparent, T> K2 = T>
    bool swap_remove( K2 const & value )
    {
        auto const pos{ find_pos( value ) };
        if ( pos == detail::index_table::npos )
            return false;
        this->swap_remove_key_at( pos );
        return true;
    }
    template <LookupType<transparent, T> K2 = T>
    bool shift_remove( K2 const & value )
    {
        auto const pos{ find_pos( value ) };
        if ( pos == detail::index_table::npos )
            return false;
        this->shift_remove_key_at( pos );
        return true;
    }
    /// Order preserving removal.
    template <LookupType<transparent, T> K2 = T>
    bool remove( K2 const & value ) { return shift_remove( value ); }

    template <LookupType<transparent, T> K2 = T>
    std::optional<T> take( K2 const & value )
    {
        auto const pos{ find_pos( value ) };
        if ( pos == detail::index_table::npos )
            return std::nullopt;
        return shift_remove_at( pos );
    }

    std::optional<T> swap_remove_index( size_type const pos )
    {
        if ( pos >= size() )
            return std::nullopt;
        T removed{ std::move( this->keys_[ pos ] ) };
        this->swap_remove_key_at( pos );
        return removed;
    }
    std::optional<T> shift_remove_index( size_type const pos )
    {
        if ( pos >= size() )
            return std::nullopt;
        return shift_remove_at( pos );
    }

    std::optional<T> pop()
    {
        if ( empty() )
            return std::nullopt;
        return shift_remove_at( size() - 1 );
    }

    /// Keeps only the elements satisfying pred, preserving their relative order.
    template <typename Pred>
    void retain( Pred && pred )
    {
        auto & keys{ this->keys_ };
        auto const sz{ keys.size() };
        size_type kept{ 0 };
        size_type pos { 0 };
        try
        {
            for ( ; pos < sz; ++pos )
            {
                if ( !pred( std::as_const( keys[ pos ] ) ) )
                    continue;
                move_element( pos, kept++ );
            }
        }
        catch ( ... )
        {
            for ( ; pos < sz; ++pos )
                move_element( pos, kept++ );
            this->truncate_keys( kept );
            this->rebuild_table();
            throw;
        }
        this->truncate_keys( kept );
        this->rebuild_table();
    }

    void swap_indices( size_type const a, size_type const b ) noexcept { this->swap_key_positions( a, b ); }

    void reverse() noexcept
    {
        std::reverse( this->keys_  .begin(), this->keys_  .end() );
        std::reverse( this->hashes_.begin(), this->hashes_.end() );
        this->rebuild_table();
    }

    template <typename Compare = std::less<>>
    void sort( Compare comp = {} )
    {
        std::vector<size_type> order( size() );
        std::iota( order.begin(), order.end(), size_type{ 0 } );
        std::sort
        (
            order.begin(), order.end(),
            [ &, pred = make_trivially_copyable_predicate( comp ) ]( size_type const a, size_type const b ) { return pred( this->keys_[ a ], this->keys_[ b ] ); }
        );
        this->permute_keys( order );
        this->rebuild_table();
    }

    /// Order insensitive.
    friend bool operator==( index_set const & a, index_set const & b )
    {
        if ( a.size() != b.size() )
            return false;
        return std::all_of( a.begin(), a.end(), [ &b ]( T const & x ) { return b.contains( x ); } );
    }

private:
    template <typename K2>
    size_type find_pos( K2 const & value ) const { return this->find_position( this->hash_of( value ), value ); }

    T shift_remove_at( size_type const pos )
    {
        T removed{ std::move( this->keys_[ pos ] ) };
        this->shift_remove_key_at( pos );
        return removed;
    }

    void move_element( size_type const from, size_type const to ) noexcept
    {
        if ( from == to )
            return;
        this->keys_  [ to ] = std::move( this->keys_[ from ] );
        this->hashes_[ to ] = this->hashes_[ from ];
    }
}; // class index_set

//------------------------------------------------------------------------------
} // namespace psi::coll
//------------------------------------------------------------------------------
