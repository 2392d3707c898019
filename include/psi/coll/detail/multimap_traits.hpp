////////////////////////////////////////////////////////////////////////////////
/// Key-store and value-collection traits behind the generic multimap.
///
/// key_store_traits<Map>: the outer key -> collection map
///   - boost::unordered_map : hashed, no observable order
///   - index_map            : insertion ordered, positional, two removal modes
///
/// value_collection_traits<Collection>: the per key collection
///   - boost::unordered_set : set semantics (deduplicating)
///   - index_set            : insertion ordered set semantics
///   - std::vector          : list semantics (insertion order, duplicates)
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

#include "../index_map.hpp"
#include "../index_set.hpp"

#include <boost/unordered_map.hpp>
#include <boost/unordered_set.hpp>

#include <algorithm>
#include <cstddef>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::coll::detail
{
//------------------------------------------------------------------------------

//==============================================================================
// Value collections
//==============================================================================

template <typename Collection>
struct value_collection_traits;

template <typename V, typename Hash, typename Equal, typename Allocator>
struct value_collection_traits<boost::unordered_set<V, Hash, Equal, Allocator>>
{
    using collection = boost::unordered_set<V, Hash, Equal, Allocator>;

    static bool constexpr is_set{ true };

    static bool insert  ( collection       & c, V && value ) { return c.insert( std::move( value ) ).second; }
    static bool remove  ( collection       & c, V const & value ) { return c.erase( value ) != 0; }
    static bool contains( collection const & c, V const & value ) { return c.find( value ) != c.end(); }

    template <typename Pred>
    static std::size_t retain( collection & c, Pred && keep )
    {
        std::size_t removed{ 0 };
        for ( auto it{ c.begin() }; it != c.end(); )
        {
            if ( keep( *it ) ) { ++it; }
            else               { it = c.erase( it ); ++removed; }
        }
        return removed;
    }

    static void shrink_to_fit( collection & c ) { c.rehash( 0 ); }
}; // value_collection_traits<boost::unordered_set>

template <typename V, typename Hash, typename Equal, index_map_options Options>
struct value_collection_traits<index_set<V, Hash, Equal, Options>>
{
    using collection = index_set<V, Hash, Equal, Options>;

    static bool constexpr is_set{ true };

    static bool                            insert     ( collection       & c, V && value ) { return c.insert( std::move( value ) ); }
    static std::pair<std::size_t, bool>    insert_full( collection       & c, V && value ) { return c.insert_full( std::move( value ) ); }
    // order preserving: the remaining values keep their relative order
    static bool                            remove     ( collection       & c, V const & value ) { return c.shift_remove( value ); }
    static bool                            contains   ( collection const & c, V const & value ) { return c.contains( value ); }

    template <typename Pred>
    static std::size_t retain( collection & c, Pred && keep )
    {
        auto const before{ c.size() };
        c.retain( std::forward<Pred>( keep ) );
        return before - c.size();
    }

    static void shrink_to_fit( collection & c ) { c.shrink_to_fit(); }
}; // value_collection_traits<index_set>

template <typename V, typename Allocator>
struct value_collection_traits<std::vector<V, Allocator>>
{
    using collection = std::vector<V, Allocator>;

    static bool constexpr is_set{ false };

    static bool insert( collection & c, V && value ) { c.push_back( std::move( value ) ); return true; }
    static std::pair<std::size_t, bool> insert_full( collection & c, V && value )
    {
        c.push_back( std::move( value ) );
        return { c.size() - 1, true };
    }

    /// Removes the first occurrence, preserving the order of the rest.
    static bool remove( collection & c, V const & value )
    {
        auto const pos{ std::find( c.begin(), c.end(), value ) };
        if ( pos == c.end() )
            return false;
        c.erase( pos );
        return true;
    }

    static bool contains( collection const & c, V const & value ) { return std::find( c.begin(), c.end(), value ) != c.end(); }

    template <typename Pred>
    static std::size_t retain( collection & c, Pred && keep )
    {
        return static_cast<std::size_t>( std::erase_if( c, [ &keep ]( V const & value ) { return !keep( value ); } ) );
    }

    static void shrink_to_fit( collection & c ) { c.shrink_to_fit(); }
}; // value_collection_traits<std::vector>


/// Converts into a collection holding a single value. Passed to try_emplace
/// so that the collection (and the move from the value) is only materialized
/// when the key is actually inserted.
template <typename Collection, typename V>
struct singleton_collection
{
    V & value;

    operator Collection() const
    {
        Collection c;
        value_collection_traits<Collection>::insert( c, std::move( value ) );
        return c;
    }
}; // struct singleton_collection

//==============================================================================
// Key stores
//==============================================================================

template <typename Map>
struct key_store_traits;

template <typename K, typename C, typename Hash, typename Equal, typename Allocator>
struct key_store_traits<boost::unordered_map<K, C, Hash, Equal, Allocator>>
{
    using map = boost::unordered_map<K, C, Hash, Equal, Allocator>;

    static bool constexpr indexed{ false };

    static void erase( map & m, typename map::iterator const pos ) { m.erase( pos ); }

    static std::pair<K, C> extract( map & m, typename map::iterator const pos )
    {
        auto node{ m.extract( pos ) };
        return { std::move( node.key() ), std::move( node.mapped() ) };
    }

    /// Keeps the entries for which keep( key, collection & ) holds.
    template <typename Pred>
    static void retain( map & m, Pred && keep )
    {
        for ( auto it{ m.begin() }; it != m.end(); )
        {
            if ( keep( std::as_const( it->first ), it->second ) ) { ++it; }
            else                                                  { it = m.erase( it ); }
        }
    }

    static std::size_t capacity     ( map const & m ) noexcept { return static_cast<std::size_t>( static_cast<float>( m.bucket_count() ) * m.max_load_factor() ); }
    static void        shrink_to_fit( map       & m )          { m.rehash( 0 ); }
}; // key_store_traits<boost::unordered_map>

template <typename K, typename C, typename Hash, typename Equal, index_map_options Options>
struct key_store_traits<index_map<K, C, Hash, Equal, Options>>
{
    using map = index_map<K, C, Hash, Equal, Options>;

    static bool constexpr indexed{ true };

    // default removal discipline: order preserving
    static void erase( map & m, typename map::iterator const pos ) { m.shift_remove_index( pos.index() ); }

    static std::pair<K, C> extract( map & m, typename map::iterator const pos ) { return *m.shift_remove_index( pos.index() ); }

    template <typename Pred>
    static void retain( map & m, Pred && keep ) { m.retain( std::forward<Pred>( keep ) ); }

    static std::size_t capacity     ( map const & m ) noexcept { return m.capacity(); }
    static void        shrink_to_fit( map       & m )          { m.shrink_to_fit(); }
}; // key_store_traits<index_map>

//------------------------------------------------------------------------------
} // namespace psi::coll::detail
//------------------------------------------------------------------------------
