////////////////////////////////////////////////////////////////////////////////
/// Multisets (bags): element -> number of occurrences
///
///   hash_multiset  : over boost::unordered_map<T, std::size_t>
///   index_multiset : over index_map<T, std::size_t> (distinct elements kept
///                    in first insertion order)
///
/// Every stored count is at least one (an element whose count drops to zero
/// is removed) and size() is the sum of all counts.
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
#include "index_map.hpp"
#include "detail/multimap_traits.hpp"

#include <boost/assert.hpp>
#include <boost/container_hash/hash.hpp>
#include <boost/unordered_map.hpp>

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <optional>
#include <type_traits>
#include <utility>
//------------------------------------------------------------------------------
namespace psi::coll
{
//------------------------------------------------------------------------------

template <typename T>
struct remove_result
{
    /// Number of occurrences before the removal.
    std::size_t      original_count;
    /// The element itself, if its last occurrence was removed.
    std::optional<T> removed;
}; // struct remove_result

template <typename Map>
class multiset
{
private:
    using store_traits = detail::key_store_traits<Map>;

public:
    using map_type       = Map;
    using key_type       = typename Map::key_type;
    using value_type     = key_type;
    using size_type      = std::size_t;
    using hasher         = typename Map::hasher;
    using key_equal      = typename Map::key_equal;
    using key_const_arg  = const_arg_t<key_type>;
    using const_iterator = typename Map::const_iterator;
    using iterator       = const_iterator;

    multiset() = default;

    explicit multiset( size_type const capacity, hasher const & hash = hasher{}, key_equal const & eq = key_equal{} )
        : map_( capacity, hash, eq ) {}

    explicit multiset( hasher const & hash, key_equal const & eq = key_equal{} )
        : map_( 0, hash, eq ) {}

    /// Counts the given elements.
    template <std::input_iterator It>
    multiset( It first, It const last )
    {
        for ( ; first != last; ++first )
            insert( key_type( *first ) );
    }

    multiset( std::initializer_list<key_type> const il ) : multiset( il.begin(), il.end() ) {}

    /// Adopts a bare element -> count map (zero counts are dropped).
    explicit multiset( Map map )
        : map_{ std::move( map ) }
    {
        store_traits::retain( map_, []( key_type const &, size_type const count ) { return count != 0; } );
        for ( auto const & entry : map_ )
            size_ += entry.second;
    }

    /// Builds a multiset from ( element, count ) pairs. For repeated elements
    /// the last count wins.
    template <std::input_iterator It>
    static multiset from_counts( It first, It const last )
    {
        Map map;
        for ( ; first != last; ++first )
        {
            auto && [ element, count ]{ *first };
            auto const n{ static_cast<size_type>( count ) };
            auto const [ pos, inserted ]{ map.try_emplace( key_type( element ), n ) };
            if ( !inserted )
                pos->second = n;
        }
        return multiset{ std::move( map ) };
    }

    multiset( multiset const & ) = default;
    multiset( multiset && other ) noexcept( std::is_nothrow_move_constructible_v<Map> )
        : map_{ std::move( other.map_ ) }, size_{ std::exchange( other.size_, 0 ) } {}
    multiset & operator=( multiset const & ) = default;
    multiset & operator=( multiset && other ) noexcept( std::is_nothrow_move_assignable_v<Map> )
    {
        map_  = std::move( other.map_ );
        size_ = std::exchange( other.size_, 0 );
        return *this;
    }

    /// Total number of occurrences.
    [[ nodiscard ]] size_type size       () const noexcept { return size_; }
    /// Number of distinct elements.
    [[ nodiscard ]] size_type unique_size() const noexcept { return map_.size(); }
    [[ nodiscard ]] bool      empty      () const noexcept { return size_ == 0; }

    [[ nodiscard ]] size_type capacity() const noexcept { return store_traits::capacity( map_ ); }

    void reserve( size_type const additional ) { map_.reserve( map_.size() + additional ); }
    void shrink_to_fit() { store_traits::shrink_to_fit( map_ ); }

    void clear() noexcept
    {
        map_.clear();
        size_ = 0;
    }

    [[ nodiscard ]] size_type count( key_const_arg element ) const
    {
        auto const pos{ map_.find( element ) };
        return ( pos != map_.end() ) ? pos->second : 0;
    }

    [[ nodiscard ]] bool contains( key_const_arg element ) const { return map_.find( element ) != map_.end(); }

    /// Adds one occurrence, returns the resulting count.
    size_type insert( key_type element ) { return insert_n( std::move( element ), 1 ); }

    /// Adds n occurrences, returns the resulting count (n == 0 only queries
    /// the current count).
    size_type insert_n( key_type element, size_type const n )
    {
        if ( n == 0 )
            return count( element );
        auto const [ pos, inserted ]{ map_.try_emplace( std::move( element ), n ) };
        if ( !inserted )
            pos->second += n;
        size_ += n;
        return pos->second;
    }

    std::optional<remove_result<key_type>> remove( key_const_arg element ) { return remove_n( element, 1 ); }

    /// Removes min( n, count ) occurrences. The element itself is removed
    /// (and returned) when no occurrences remain.
    std::optional<remove_result<key_type>> remove_n( key_const_arg element, size_type const n )
    {
        auto const pos{ map_.find( element ) };
        if ( pos == map_.end() )
            return std::nullopt;
        auto const original_count{ static_cast<size_type>( pos->second ) };
        if ( original_count <= n )
        {
            size_ -= original_count;
            return remove_result<key_type>{ original_count, std::move( store_traits::extract( map_, pos ).first ) };
        }
        pos->second -= n;
        size_       -= n;
        return remove_result<key_type>{ original_count, std::nullopt };
    }

    /// Iterates over ( element, count ) pairs in the backing map's order.
    const_iterator begin() const noexcept { return map_.begin(); }
    const_iterator end  () const noexcept { return map_.end  (); }

    Map const & as_map  () const & noexcept { return map_; }
    Map         into_map() &&               { size_ = 0; return std::move( map_ ); }

    friend bool operator==( multiset const & a, multiset const & b ) { return ( a.size_ == b.size_ ) && ( a.map_ == b.map_ ); }

private:
    Map       map_;
    size_type size_{ 0 };
}; // class multiset

template <typename T, typename Hash = boost::hash<T>, typename KeyEqual = std::equal_to<T>>
using hash_multiset = multiset<boost::unordered_map<T, std::size_t, Hash, KeyEqual>>;

template <typename T, typename Hash = boost::hash<T>, typename KeyEqual = std::equal_to<T>>
using index_multiset = multiset<index_map<T, std::size_t, Hash, KeyEqual>>;

//------------------------------------------------------------------------------
} // namespace psi::coll
//------------------------------------------------------------------------------
