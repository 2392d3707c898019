////////////////////////////////////////////////////////////////////////////////
/// Generic multimap: key -> non-empty collection of values
///
/// multimap<Map> is parameterized by the outer map type; the key store and the
/// per key collection are driven by detail::key_store_traits and
/// detail::value_collection_traits. Four configurations are provided as
/// aliases:
///
///   alias                 | key store            | collection
///   ----------------------+----------------------+----------------------
///   hash_set_multimap     | boost::unordered_map | boost::unordered_set
///   hash_vec_multimap     | boost::unordered_map | std::vector
///   index_set_multimap    | index_map            | index_set
///   index_vec_multimap    | index_map            | std::vector
///
/// Invariants: a present key always has at least one value (inserting the
/// first value creates the collection, removing the last one removes the key)
/// and size() is the total number of values across all keys.
///
/// Insertion ordered variants (index_*) additionally offer positional access
/// and two key removal disciplines: shift_* (order preserving, O(n), the
/// default of remove()/remove_key()) and swap_* (O(1), the last key moves into
/// the gap).
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
#include "index_set.hpp"
#include "detail/multimap_traits.hpp"

#include <boost/assert.hpp>
#include <boost/container_hash/hash.hpp>
#include <boost/stl_interfaces/iterator_interface.hpp>
#include <boost/unordered_map.hpp>
#include <boost/unordered_set.hpp>

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <optional>
#include <ranges>
#include <type_traits>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::coll
{
//------------------------------------------------------------------------------

namespace detail
{
//------------------------------------------------------------------------------

template <typename MapIterator>
struct outer_element
{
    using reference      = decltype( *std::declval<MapIterator const &>() );
    using key_type       = std::remove_cvref_t<decltype( std::declval<reference>().first  )>;
    using collection     = std::remove_cvref_t<decltype( std::declval<reference>().second )>;
    using inner_iterator = typename collection::const_iterator;
    using value_type     = typename collection::value_type;
}; // struct outer_element

////////////////////////////////////////////////////////////////////////////////
// \class key_iterator
// Projects the keys out of an outer map iterator.
////////////////////////////////////////////////////////////////////////////////

template <typename MapIterator>
class key_iterator
    : public boost::stl_interfaces::iterator_interface
    <
#   if !BOOST_STL_INTERFACES_USE_DEDUCED_THIS
        key_iterator<MapIterator>,
#   endif
        std::forward_iterator_tag,
        typename outer_element<MapIterator>::key_type const
    >
{
private:
    using impl = boost::stl_interfaces::iterator_interface
    <
#   if !BOOST_STL_INTERFACES_USE_DEDUCED_THIS
        key_iterator<MapIterator>,
#   endif
        std::forward_iterator_tag,
        typename outer_element<MapIterator>::key_type const
    >;
    using key_type = typename outer_element<MapIterator>::key_type;

public:
    constexpr key_iterator() = default;
    explicit key_iterator( MapIterator const pos ) : pos_{ pos } {}

    key_type const & operator*() const { return ( *pos_ ).first; }

    key_iterator & operator++() { ++pos_; return *this; }
    using impl::operator++;

    friend bool operator==( key_iterator const & left, key_iterator const & right ) { return left.pos_ == right.pos_; }

private:
    MapIterator pos_{};
}; // class key_iterator

////////////////////////////////////////////////////////////////////////////////
// \class flatten_iterator
// Walks every value of every collection in key order. With WithKey the
// iterator yields ( key, value ) proxy pairs, otherwise plain values.
////////////////////////////////////////////////////////////////////////////////

template <typename MapIterator, bool WithKey>
struct flatten_iterator_types
{
    using element    = outer_element<MapIterator>;
    using value_type = std::conditional_t<WithKey, std::pair<typename element::key_type, typename element::value_type>, typename element::value_type>;
    using reference  = std::conditional_t<WithKey, std::pair<typename element::key_type const &, typename element::value_type const &>, typename element::value_type const &>;
    using pointer    = std::conditional_t<WithKey, boost::stl_interfaces::proxy_arrow_result<reference>, typename element::value_type const *>;
}; // struct flatten_iterator_types

template <typename MapIterator, bool WithKey>
class flatten_iterator
    : public boost::stl_interfaces::iterator_interface
    <
#   if !BOOST_STL_INTERFACES_USE_DEDUCED_THIS
        flatten_iterator<MapIterator, WithKey>,
#   endif
        std::forward_iterator_tag,
        typename flatten_iterator_types<MapIterator, WithKey>::value_type,
        typename flatten_iterator_types<MapIterator, WithKey>::reference,
        typename flatten_iterator_types<MapIterator, WithKey>::pointer
    >
{
private:
    using types = flatten_iterator_types<MapIterator, WithKey>;
    using impl  = boost::stl_interfaces::iterator_interface
    <
#   if !BOOST_STL_INTERFACES_USE_DEDUCED_THIS
        flatten_iterator<MapIterator, WithKey>,
#   endif
        std::forward_iterator_tag,
        typename types::value_type,
        typename types::reference,
        typename types::pointer
    >;
    using inner_iterator = typename types::element::inner_iterator;

public:
    constexpr flatten_iterator() = default;

    flatten_iterator( MapIterator const outer, MapIterator const outer_end )
        : outer_{ outer }, outer_end_{ outer_end }
    {
        if ( outer_ != outer_end_ )
        {
            BOOST_ASSERT_MSG( !( *outer_ ).second.empty(), "Empty collection registered in a multimap" );
            inner_ = ( *outer_ ).second.begin();
        }
    }

    typename types::reference operator*() const
    {
        if constexpr ( WithKey )
            return { ( *outer_ ).first, *inner_ };
        else
            return *inner_;
    }

    flatten_iterator & operator++()
    {
        BOOST_ASSERT( outer_ != outer_end_ );
        if ( ++inner_ == ( *outer_ ).second.end() )
        {
            if ( ++outer_ != outer_end_ )
            {
                BOOST_ASSERT_MSG( !( *outer_ ).second.empty(), "Empty collection registered in a multimap" );
                inner_ = ( *outer_ ).second.begin();
            }
            else
            {
                inner_ = inner_iterator{};
            }
        }
        return *this;
    }
    using impl::operator++;

    friend bool operator==( flatten_iterator const & left, flatten_iterator const & right )
    {
        if ( left.outer_ != right.outer_ )
            return false;
        return ( left.outer_ == left.outer_end_ ) || ( left.inner_ == right.inner_ );
    }

private:
    MapIterator    outer_    {};
    MapIterator    outer_end_{};
    inner_iterator inner_    {};
}; // class flatten_iterator

//------------------------------------------------------------------------------
} // namespace detail

/// ( key position, value position within the key's collection, inserted ).
struct insert_full_result
{
    std::size_t key_index;
    std::size_t value_index;
    bool        inserted;
}; // struct insert_full_result

template <typename Map>
class multimap
{
private:
    using store_traits  = detail::key_store_traits<Map>;
    using values_traits = detail::value_collection_traits<typename Map::mapped_type>;

public:
    using map_type        = Map;
    using key_type        = typename Map::key_type;
    using values_type     = typename Map::mapped_type;
    using mapped_type     = typename values_type::value_type;
    using value_type      = std::pair<key_type, mapped_type>;
    using size_type       = std::size_t;
    using hasher          = typename Map::hasher;
    using key_equal       = typename Map::key_equal;
    using key_const_arg   = const_arg_t<key_type   >;
    using value_const_arg = const_arg_t<mapped_type>;

    static bool constexpr indexed{ store_traits ::indexed };
    static bool constexpr is_set { values_traits::is_set  };

    using const_iterator = detail::flatten_iterator<typename Map::const_iterator, true>;
    using iterator       = const_iterator;

    /// ( key position, key, collection ) of an insertion ordered multimap entry.
    struct full_ref
    {
        size_type           index;
        key_type    const & key;
        values_type const & values;
    }; // struct full_ref

    //--------------------------------------------------------------------------
    // Construction
    //--------------------------------------------------------------------------

    multimap() = default;

    explicit multimap( size_type const key_capacity, hasher const & hash = hasher{}, key_equal const & eq = key_equal{} )
        : map_( key_capacity, hash, eq ) {}

    explicit multimap( hasher const & hash, key_equal const & eq = key_equal{} )
        : map_( 0, hash, eq ) {}

    template <std::input_iterator It>
    multimap( It first, It const last ) { insert( first, last ); }

    multimap( std::initializer_list<value_type> const il ) { insert( il.begin(), il.end() ); }

    /// Adopts a bare map: keys with empty collections are dropped and the
    /// total size is recomputed.
    explicit multimap( Map map )
        : map_{ std::move( map ) }
    {
        store_traits::retain( map_, []( key_type const &, values_type & values ) { return !values.empty(); } );
        for ( auto const & [ key, values ] : map_ )
            size_ += values.size();
    }

    multimap( multimap const & ) = default;
    multimap( multimap && other ) noexcept( std::is_nothrow_move_constructible_v<Map> )
        : map_{ std::move( other.map_ ) }, size_{ std::exchange( other.size_, 0 ) } {}
    multimap & operator=( multimap const & ) = default;
    multimap & operator=( multimap && other ) noexcept( std::is_nothrow_move_assignable_v<Map> )
    {
        map_  = std::move( other.map_ );
        size_ = std::exchange( other.size_, 0 );
        return *this;
    }

    //--------------------------------------------------------------------------
    // Size and capacity
    //--------------------------------------------------------------------------

    /// Total number of values.
    [[ nodiscard ]] size_type size     () const noexcept { return size_; }
    /// Number of distinct keys.
    [[ nodiscard ]] size_type keys_size() const noexcept { return map_.size(); }
    [[ nodiscard ]] bool      empty    () const noexcept { return size_ == 0; }

    void reserve( size_type const additional_keys ) { map_.reserve( map_.size() + additional_keys ); }

    [[ nodiscard ]] size_type key_capacity() const noexcept { return store_traits::capacity( map_ ); }

    void shrink_keys_to_fit() { store_traits::shrink_to_fit( map_ ); }

    void shrink_values_to_fit()
    {
        for ( auto && [ key, values ] : map_ )
            values_traits::shrink_to_fit( values );
    }

    void clear() noexcept
    {
        map_.clear();
        size_ = 0;
    }

    //--------------------------------------------------------------------------
    // Insertion
    //--------------------------------------------------------------------------

    /// Returns whether size() grew (false for set variants when the pair was
    /// already present).
    bool insert( key_type key, mapped_type value )
    {
        auto const [ pos, key_inserted ]{ map_.try_emplace( std::move( key ), detail::singleton_collection<values_type, mapped_type>{ value } ) };
        auto const inserted{ key_inserted || values_traits::insert( pos->second, std::move( value ) ) };
        size_ += inserted;
        return inserted;
    }

    insert_full_result insert_full( key_type key, mapped_type value ) requires indexed
    {
        auto const [ pos, key_inserted ]{ map_.try_emplace( std::move( key ), detail::singleton_collection<values_type, mapped_type>{ value } ) };
        if ( key_inserted )
        {
            ++size_;
            return { pos.index(), 0, true };
        }
        auto const [ value_index, inserted ]{ values_traits::insert_full( pos->second, std::move( value ) ) };
        size_ += inserted;
        return { pos.index(), value_index, inserted };
    }

    template <std::input_iterator It>
    void insert( It first, It const last )
    {
        for ( ; first != last; ++first )
        {
            auto && [ key, value ]{ *first };
            insert( key, value );
        }
    }

    //--------------------------------------------------------------------------
    // Lookup
    //--------------------------------------------------------------------------

    [[ nodiscard ]] values_type const * get( key_const_arg key ) const
    {
        auto const pos{ map_.find( key ) };
        return ( pos != map_.end() ) ? &pos->second : nullptr;
    }

    [[ nodiscard ]] bool contains_key( key_const_arg key ) const { return map_.find( key ) != map_.end(); }

    [[ nodiscard ]] bool contains( key_const_arg key, value_const_arg value ) const
    {
        auto const p_values{ get( key ) };
        return p_values && values_traits::contains( *p_values, value );
    }

    [[ nodiscard ]] std::optional<full_ref> get_full( key_const_arg key ) const requires indexed
    {
        auto const full{ map_.get_full( key ) };
        if ( !full )
            return std::nullopt;
        auto const & [ index, k, values ]{ *full };
        return full_ref{ index, k, values };
    }

    [[ nodiscard ]] std::optional<size_type> get_key_index( key_const_arg key ) const requires indexed { return map_.get_index_of( key ); }

    [[ nodiscard ]] std::optional<std::pair<key_type const &, values_type const &>> nth( size_type const key_index ) const requires indexed
    {
        return map_.nth( key_index );
    }

    //--------------------------------------------------------------------------
    // Removal
    //--------------------------------------------------------------------------

    /// Removes one occurrence of the pair, and the key itself if this was its
    /// last value (order preserving on insertion ordered variants).
    bool remove( key_const_arg key, value_const_arg value ) { return remove_impl( key, value, &store_traits::erase ); }

    std::optional<values_type> remove_key( key_const_arg key )
    {
        auto entry{ remove_key_entry( key ) };
        if ( !entry )
            return std::nullopt;
        return std::move( entry->second );
    }

    std::optional<std::pair<key_type, values_type>> remove_key_entry( key_const_arg key )
    {
        auto const pos{ map_.find( key ) };
        if ( pos == map_.end() )
            return std::nullopt;
        size_ -= pos->second.size();
        return store_traits::extract( map_, pos );
    }

    bool shift_remove( key_const_arg key, value_const_arg value ) requires indexed { return remove_impl( key, value, &shift_erase ); }
    bool swap_remove ( key_const_arg key, value_const_arg value ) requires indexed { return remove_impl( key, value, &swap_erase  ); }

    std::optional<values_type> shift_remove_key( key_const_arg key ) requires indexed { return remove_key( key ); }
    std::optional<values_type> swap_remove_key ( key_const_arg key ) requires indexed
    {
        auto const pos{ map_.find( key ) };
        if ( pos == map_.end() )
            return std::nullopt;
        size_ -= pos->second.size();
        return std::move( map_.swap_remove_index( pos.index() )->second );
    }

    /// Keeps the pairs for which pred( key, value ) holds; keys left without
    /// values are removed (preserving the order of the remaining keys).
    template <typename Pred>
    void retain( Pred && pred )
    {
        store_traits::retain
        (
            map_,
            [ this, &pred ]( key_type const & key, values_type & values )
            {
                size_ -= values_traits::retain( values, [ &key, &pred ]( mapped_type const & value ) { return static_cast<bool>( pred( key, value ) ); } );
                return !values.empty();
            }
        );
    }

    //--------------------------------------------------------------------------
    // Iteration
    //--------------------------------------------------------------------------

    const_iterator begin() const { return { map_.begin(), map_.end() }; }
    const_iterator end  () const { return { map_.end  (), map_.end() }; }

    /// Distinct keys in key store order.
    auto keys() const
    {
        using key_it = detail::key_iterator<typename Map::const_iterator>;
        return std::ranges::subrange<key_it>{ key_it{ map_.begin() }, key_it{ map_.end() } };
    }

    /// All values, flattened in key order.
    auto values() const
    {
        using value_it = detail::flatten_iterator<typename Map::const_iterator, false>;
        return std::ranges::subrange<value_it>{ value_it{ map_.begin(), map_.end() }, value_it{ map_.end(), map_.end() } };
    }

    //--------------------------------------------------------------------------
    // Backing store
    //--------------------------------------------------------------------------

    Map const & as_map  () const & noexcept { return map_; }
    Map         into_map() &&               { size_ = 0; return std::move( map_ ); }

    /// Same total size and every pair of one contained in the other.
    friend bool operator==( multimap const & a, multimap const & b )
    {
        if ( ( a.size() != b.size() ) || ( a.keys_size() != b.keys_size() ) )
            return false;
        for ( auto const & [ key, values ] : a.map_ )
        {
            auto const p_other{ b.get( key ) };
            if ( !p_other || ( p_other->size() != values.size() ) )
                return false;
            for ( auto const & value : values )
            {
                if ( !values_traits::contains( *p_other, value ) )
                    return false;
            }
        }
        return true;
    }

private:
    static void shift_erase( Map & map, typename Map::iterator const pos ) { map.shift_remove_index( pos.index() ); }
    static void swap_erase ( Map & map, typename Map::iterator const pos ) { map.swap_remove_index ( pos.index() ); }

    bool remove_impl( key_const_arg key, value_const_arg value, void ( * const erase_key )( Map &, typename Map::iterator ) )
    {
        auto const pos{ map_.find( key ) };
        if ( pos == map_.end() )
            return false;
        auto & values{ pos->second };
        if ( !values_traits::remove( values, value ) )
            return false;
        --size_;
        if ( values.empty() )
            erase_key( map_, pos );
        return true;
    }

private:
    Map       map_;
    size_type size_{ 0 };
}; // class multimap

//------------------------------------------------------------------------------
// The four configurations
//------------------------------------------------------------------------------

template
<
    typename K, typename V,
    typename KeyHash    = boost::hash<K>, typename ValueHash  = boost::hash<V>,
    typename KeyEqual   = std::equal_to<K>, typename ValueEqual = std::equal_to<V>
>
using hash_set_multimap = multimap<boost::unordered_map<K, boost::unordered_set<V, ValueHash, ValueEqual>, KeyHash, KeyEqual>>;

template <typename K, typename V, typename KeyHash = boost::hash<K>, typename KeyEqual = std::equal_to<K>>
using hash_vec_multimap = multimap<boost::unordered_map<K, std::vector<V>, KeyHash, KeyEqual>>;

template
<
    typename K, typename V,
    typename KeyHash    = boost::hash<K>, typename ValueHash  = boost::hash<V>,
    typename KeyEqual   = std::equal_to<K>, typename ValueEqual = std::equal_to<V>
>
using index_set_multimap = multimap<index_map<K, index_set<V, ValueHash, ValueEqual>, KeyHash, KeyEqual>>;

template <typename K, typename V, typename KeyHash = boost::hash<K>, typename KeyEqual = std::equal_to<K>>
using index_vec_multimap = multimap<index_map<K, std::vector<V>, KeyHash, KeyEqual>>;

//------------------------------------------------------------------------------
} // namespace psi::coll
//------------------------------------------------------------------------------
