////////////////////////////////////////////////////////////////////////////////
/// Insertion ordered hash map with positional access
///
/// Entries live in two contiguous parallel arrays (keys, values) in insertion
/// order; a detail::index_table maps key hashes to positions. Insertion order
/// is observable (iteration, nth(), get_index_of()) and only changes through
/// explicit reordering operations: swap removal, swap_indices(), reverse(),
/// sort_keys().
///
/// Two removal disciplines are offered for every removing operation:
///   - swap_*  : O(1), the last entry is moved into the gap
///   - shift_* : O(n), all following entries move down by one position
///               (relative order preserved)
///
/// Heterogeneous lookup is enabled when both Hash and KeyEqual are
/// transparent (see LookupType).
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
#include "detail/entry.hpp"
#include "detail/index_base.hpp"
#include "detail/paired_iterator.hpp"

#include <boost/assert.hpp>
#include <boost/container_hash/hash.hpp>

#include <algorithm>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <numeric>
#include <optional>
#include <span>
#include <tuple>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::coll
{
//------------------------------------------------------------------------------

template
<
    typename K,
    typename V,
    typename Hash                 = boost::hash<K>,
    typename KeyEqual             = std::equal_to<K>,
    index_map_options Options     = index_map_options{}
>
class index_map : private detail::index_base<K, Hash, KeyEqual, Options>
{
private:
    using base = detail::index_base<K, Hash, KeyEqual, Options>;
    using base::transparent;

public:
    using key_type        = K;
    using mapped_type     = V;
    using value_type      = std::pair<K, V>;
    using size_type       = typename base::size_type;
    using difference_type = typename base::difference_type;
    using hasher          = Hash;
    using key_equal       = KeyEqual;
    using reference       = std::pair<K const &, V       &>;
    using const_reference = std::pair<K const &, V const &>;

    using iterator               = detail::paired_iterator<K, V, false>;
    using const_iterator         = detail::paired_iterator<K, V, true >;
    using reverse_iterator       = std::reverse_iterator<iterator>;
    using const_reverse_iterator = std::reverse_iterator<const_iterator>;

    //--------------------------------------------------------------------------
    // Entry handles
    //--------------------------------------------------------------------------

    class occupied_entry
    {
    public:
        using key_type    = K;
        using mapped_type = V;

        K const &  key  () const noexcept { return map_->keys_  [ pos_ ]; }
        V       &  get  () const noexcept { return map_->values_[ pos_ ]; }
        size_type  index() const noexcept { return pos_; }

        /// Replaces the value returning the old one.
        V insert( V value ) { return std::exchange( get(), std::move( value ) ); }

        V                 swap_remove       () { return std::move( map_->swap_remove_at ( pos_ ).second ); }
        V                 shift_remove      () { return std::move( map_->shift_remove_at( pos_ ).second ); }
        std::pair<K, V>   swap_remove_entry () { return map_->swap_remove_at ( pos_ ); }
        std::pair<K, V>   shift_remove_entry() { return map_->shift_remove_at( pos_ ); }

    private: friend class index_map;
        occupied_entry( index_map & map, size_type const pos ) noexcept : map_{ &map }, pos_{ pos } {}

        index_map * map_;
        size_type   pos_;
    }; // class occupied_entry

    class vacant_entry
    {
    public:
        using key_type    = K;
        using mapped_type = V;

        K const & key     () const noexcept { return key_; }
        K         into_key() &&             { return std::move( key_ ); }
        size_type index   () const noexcept { return map_->size(); }

        V & insert( V value ) { return map_->push_new( hash_, std::move( key_ ), std::move( value ) ).second; }

    private: friend class index_map;
        vacant_entry( index_map & map, std::size_t const hash, K && key ) : map_{ &map }, hash_{ hash }, key_{ std::move( key ) } {}

        index_map * map_;
        std::size_t hash_;
        K           key_;
    }; // class vacant_entry

    using entry_type = detail::entry<occupied_entry, vacant_entry>;

    //--------------------------------------------------------------------------
    // Construction
    //--------------------------------------------------------------------------

    index_map() = default;

    explicit index_map( size_type const capacity, Hash const & hash = Hash{}, KeyEqual const & eq = KeyEqual{} )
        : base{ hash, eq }
    {
        reserve( capacity );
    }

    explicit index_map( Hash const & hash, KeyEqual const & eq = KeyEqual{} ) : base{ hash, eq } {}

    template <std::input_iterator It>
    index_map( It first, It const last ) { insert( first, last ); }

    index_map( std::initializer_list<value_type> const il ) { insert( il.begin(), il.end() ); }

    index_map( index_map const & ) = default;
    index_map( index_map && ) noexcept = default;
    index_map & operator=( index_map const & ) = default;
    index_map & operator=( index_map && ) noexcept = default;

    //--------------------------------------------------------------------------
    // Capacity
    //--------------------------------------------------------------------------

    using base::size;
    using base::empty;
    using base::capacity;
    using base::hash_function;
    using base::key_eq;

    /// Reserves room for a total of n entries.
    void reserve( size_type const n )
    {
        base::reserve( n );
        values_.reserve( n );
    }

    void shrink_to_fit()
    {
        base::shrink_keys_to_fit();
        values_.shrink_to_fit();
    }

    void clear() noexcept
    {
        base::clear_keys();
        values_.clear();
    }

    //--------------------------------------------------------------------------
    // Iteration and views
    //--------------------------------------------------------------------------

    iterator       begin()       noexcept { return { this->keys_.data(), values_.data(), 0 }; }
    const_iterator begin() const noexcept { return { this->keys_.data(), values_.data(), 0 }; }
    iterator       end  ()       noexcept { return begin() + static_cast<difference_type>( size() ); }
    const_iterator end  () const noexcept { return begin() + static_cast<difference_type>( size() ); }

    const_iterator cbegin() const noexcept { return begin(); }
    const_iterator cend  () const noexcept { return end  (); }

    reverse_iterator       rbegin()       noexcept { return reverse_iterator      { end() }; }
    const_reverse_iterator rbegin() const noexcept { return const_reverse_iterator{ end() }; }
    reverse_iterator       rend  ()       noexcept { return reverse_iterator      { begin() }; }
    const_reverse_iterator rend  () const noexcept { return const_reverse_iterator{ begin() }; }

    using base::keys;
    std::span<V const> values() const noexcept { return values_; }
    std::span<V      > values()       noexcept { return values_; }

    //--------------------------------------------------------------------------
    // Lookup
    //--------------------------------------------------------------------------

    using base::contains;
    using base::get_index_of;

    template <LookupType<transparent, K> K2 = K>
    [[ nodiscard ]] V const * get( K2 const & key ) const
    {
        auto const pos{ find_pos( key ) };
        return ( pos != detail::index_table::npos ) ? &values_[ pos ] : nullptr;
    }
    template <LookupType<transparent, K> K2 = K>
    [[ nodiscard ]] V * get( K2 const & key )
    {
        return const_cast<V *>( std::as_const( *this ).get( key ) );
    }

    template <LookupType<transparent, K> K2 = K>
    [[ nodiscard ]] const_iterator find( K2 const & key ) const { return iterator_at( find_pos( key ) ); }
    template <LookupType<transparent, K> K2 = K>
    [[ nodiscard ]] iterator       find( K2 const & key )       { return iterator_at( find_pos( key ) ); }

    /// (position, key, value) of the given key.
    template <LookupType<transparent, K> K2 = K>
    [[ nodiscard ]] std::optional<std::tuple<size_type, K const &, V const &>> get_full( K2 const & key ) const
    {
        auto const pos{ find_pos( key ) };
        if ( pos == detail::index_table::npos )
            return std::nullopt;
        return std::tuple<size_type, K const &, V const &>{ pos, this->keys_[ pos ], values_[ pos ] };
    }
    template <LookupType<transparent, K> K2 = K>
    [[ nodiscard ]] std::optional<std::tuple<size_type, K const &, V &>> get_full( K2 const & key )
    {
        auto const pos{ find_pos( key ) };
        if ( pos == detail::index_table::npos )
            return std::nullopt;
        return std::tuple<size_type, K const &, V &>{ pos, this->keys_[ pos ], values_[ pos ] };
    }

    /// Entry at the given position (std::nullopt if out of range).
    [[ nodiscard ]] std::optional<const_reference> nth( size_type const pos ) const noexcept
    {
        if ( pos >= size() )
            return std::nullopt;
        return const_reference{ this->keys_[ pos ], values_[ pos ] };
    }
    [[ nodiscard ]] std::optional<reference> nth( size_type const pos ) noexcept
    {
        if ( pos >= size() )
            return std::nullopt;
        return reference{ this->keys_[ pos ], values_[ pos ] };
    }

    [[ nodiscard ]] std::optional<const_reference> front() const noexcept { return nth( 0 ); }
    [[ nodiscard ]] std::optional<const_reference> back () const noexcept { return empty() ? std::nullopt : nth( size() - 1 ); }

    template <LookupType<transparent, K> K2 = K>
    V const & at( K2 const & key ) const
    {
        auto const p_value{ get( key ) };
        if ( !p_value ) [[ unlikely ]]
            detail::throw_out_of_range( "psi::coll::index_map::at: key not found" );
        return *p_value;
    }
    template <LookupType<transparent, K> K2 = K>
    V & at( K2 const & key ) { return const_cast<V &>( std::as_const( *this ).at( key ) ); }

    V & operator[]( K const & key ) requires std::default_initializable<V> { return try_emplace( key ).first->second; }
    V & operator[]( K &&      key ) requires std::default_initializable<V> { return try_emplace( std::move( key ) ).first->second; }

    //--------------------------------------------------------------------------
    // Insertion
    //--------------------------------------------------------------------------

    /// Inserts or overwrites. An existing key keeps its position and the
    /// replaced value is returned.
    std::optional<V> insert( K key, V value ) { return insert_full( std::move( key ), std::move( value ) ).second; }

    /// As insert() but also returns the position of the entry.
    std::pair<size_type, std::optional<V>> insert_full( K key, V value )
    {
        auto const hash{ this->hash_of( key ) };
        auto const pos { this->find_position( hash, key ) };
        if ( pos != detail::index_table::npos )
            return { pos, std::exchange( values_[ pos ], std::move( value ) ) };
        push_new( hash, std::move( key ), std::move( value ) );
        return { size() - 1, std::nullopt };
    }

    /// Inserts a value constructed from args only if the key is absent.
    template <typename... Args>
    std::pair<iterator, bool> try_emplace( K const & key, Args &&... args ) { return try_emplace_impl( key, std::forward<Args>( args )... ); }
    template <typename... Args>
    std::pair<iterator, bool> try_emplace( K &&      key, Args &&... args ) { return try_emplace_impl( std::move( key ), std::forward<Args>( args )... ); }

    /// Bulk insertion of (key, value) pairs with insert() semantics (later
    /// duplicates overwrite earlier values).
    template <std::input_iterator It>
    void insert( It first, It const last )
    {
        if constexpr ( std::forward_iterator<It> )
            reserve( size() + static_cast<size_type>( std::distance( first, last ) ) );
        for ( ; first != last; ++first )
        {
            auto && [ key, value ]{ *first };
            insert( key, value );
        }
    }

    /// Appends an entry whose key the caller guarantees to be absent (skips
    /// the lookup).
    reference insert_unique_unchecked( K key, V value )
    {
        BOOST_ASSERT_MSG( !contains( key ), "Key already present" );
        auto const hash{ this->hash_of( key ) };
        return push_new( hash, std::move( key ), std::move( value ) );
    }
    /// As above with hash == hash_function()( key ) computed by the caller.
    /// Does not throw when the capacity suffices and K and V are nothrow
    /// move constructible.
    reference insert_unique_unchecked( std::size_t const hash, K key, V value )
    {
        BOOST_ASSERT( hash == this->hash_of( key ) );
        BOOST_ASSERT_MSG( !contains( key ), "Key already present" );
        return push_new( hash, std::move( key ), std::move( value ) );
    }

    [[ nodiscard ]] entry_type entry( K key )
    {
        auto const hash{ this->hash_of( key ) };
        auto const pos { this->find_position( hash, key ) };
        if ( pos != detail::index_table::npos )
            return occupied_entry{ *this, pos };
        return vacant_entry{ *this, hash, std::move( key ) };
    }

    //--------------------------------------------------------------------------
    // Removal
    //--------------------------------------------------------------------------

    template <LookupType<transparent, K> K2 = K>
    std::optional<V> swap_remove( K2 const & key )
    {
        auto const pos{ find_pos( key ) };
        if ( pos == detail::index_table::npos )
            return std::nullopt;
        return std::move( swap_remove_at( pos ).second );
    }
    template <LookupType<transparent, K> K2 = K>
    std::optional<V> shift_remove( K2 const & key )
    {
        auto const pos{ find_pos( key ) };
        if ( pos == detail::index_table::npos )
            return std::nullopt;
        return std::move( shift_remove_at( pos ).second );
    }

    template <LookupType<transparent, K> K2 = K>
    std::optional<value_type> swap_remove_entry( K2 const & key )
    {
        auto const pos{ find_pos( key ) };
        if ( pos == detail::index_table::npos )
            return std::nullopt;
        return swap_remove_at( pos );
    }
    template <LookupType<transparent, K> K2 = K>
    std::optional<value_type> shift_remove_entry( K2 const & key )
    {
        auto const pos{ find_pos( key ) };
        if ( pos == detail::index_table::npos )
            return std::nullopt;
        return shift_remove_at( pos );
    }

    std::optional<value_type> swap_remove_index( size_type const pos )
    {
        if ( pos >= size() )
            return std::nullopt;
        return swap_remove_at( pos );
    }
    std::optional<value_type> shift_remove_index( size_type const pos )
    {
        if ( pos >= size() )
            return std::nullopt;
        return shift_remove_at( pos );
    }

    /// Removes and returns the last entry.
    std::optional<value_type> pop()
    {
        if ( empty() )
            return std::nullopt;
        return swap_remove_at( size() - 1 );
    }

    /// Keeps only the entries for which pred( key, value ) holds, preserving
    /// their relative order.
    template <typename Pred>
    void retain( Pred && pred )
    {
        auto const sz{ size() };
        size_type kept{ 0 };
        size_type pos { 0 };
        try
        {
            for ( ; pos < sz; ++pos )
            {
                if ( !pred( std::as_const( this->keys_[ pos ] ), values_[ pos ] ) )
                    continue;
                move_entry( pos, kept );
                ++kept;
            }
        }
        catch ( ... )
        {
            // keep the entries not visited yet
            for ( ; pos < sz; ++pos, ++kept )
                move_entry( pos, kept );
            truncate( kept );
            throw;
        }
        truncate( kept );
    }

    //--------------------------------------------------------------------------
    // Reordering
    //--------------------------------------------------------------------------

    void swap_indices( size_type const a, size_type const b ) noexcept
    {
        this->swap_key_positions( a, b );
        using std::swap;
        swap( values_[ a ], values_[ b ] );
    }

    void reverse() noexcept
    {
        std::reverse( this->keys_  .begin(), this->keys_  .end() );
        std::reverse( this->hashes_.begin(), this->hashes_.end() );
        std::reverse(       values_.begin(),       values_.end() );
        this->rebuild_table();
    }

    /// Sorts the entries by key.
    template <typename Compare = std::less<>>
    void sort_keys( Compare comp = {} )
    {
        std::vector<size_type> order( size() );
        std::iota( order.begin(), order.end(), size_type{ 0 } );
        std::sort
        (
            order.begin(), order.end(),
            [ &, pred = make_trivially_copyable_predicate( comp ) ]( size_type const a, size_type const b ) { return pred( this->keys_[ a ], this->keys_[ b ] ); }
        );
        permute( order );
    }

    /// Sorts the entries with a comparator receiving ( key_a, value_a, key_b, value_b ).
    template <typename Compare>
    void sort_by( Compare comp )
    {
        std::vector<size_type> order( size() );
        std::iota( order.begin(), order.end(), size_type{ 0 } );
        std::sort
        (
            order.begin(), order.end(),
            [ & ]( size_type const a, size_type const b ) { return comp( this->keys_[ a ], values_[ a ], this->keys_[ b ], values_[ b ] ); }
        );
        permute( order );
    }

    //--------------------------------------------------------------------------
    // Comparison
    //--------------------------------------------------------------------------

    /// Order insensitive: equal sizes and every entry of one found in the
    /// other with an equal value.
    friend bool operator==( index_map const & a, index_map const & b )
    {
        if ( a.size() != b.size() )
            return false;
        for ( size_type pos{ 0 }; pos < a.size(); ++pos )
        {
            auto const p_value{ b.get( a.keys_[ pos ] ) };
            if ( !p_value || !( *p_value == a.values_[ pos ] ) )
                return false;
        }
        return true;
    }

private:
    template <typename K2>
    size_type find_pos( K2 const & key ) const { return this->find_position( this->hash_of( key ), key ); }

    iterator       iterator_at( size_type const pos )       noexcept { return ( pos != detail::index_table::npos ) ? begin() + static_cast<difference_type>( pos ) : end(); }
    const_iterator iterator_at( size_type const pos ) const noexcept { return ( pos != detail::index_table::npos ) ? begin() + static_cast<difference_type>( pos ) : end(); }

    template <typename KArg, typename... Args>
    std::pair<iterator, bool> try_emplace_impl( KArg && key, Args &&... args )
    {
        auto const hash{ this->hash_of( key ) };
        auto const pos { this->find_position( hash, key ) };
        if ( pos != detail::index_table::npos )
            return { iterator_at( pos ), false };
        values_.emplace_back( std::forward<Args>( args )... );
        try { this->push_key( hash, std::forward<KArg>( key ) ); }
        catch ( ... ) { values_.pop_back(); throw; }
        return { iterator_at( size() - 1 ), true };
    }

    reference push_new( std::size_t const hash, K && key, V && value )
    {
        values_.push_back( std::move( value ) );
        try { this->push_key( hash, std::move( key ) ); }
        catch ( ... ) { values_.pop_back(); throw; }
        return { this->keys_.back(), values_.back() };
    }

    value_type swap_remove_at( size_type const pos )
    {
        BOOST_ASSERT( pos < size() );
        value_type removed{ std::move( this->keys_[ pos ] ), std::move( values_[ pos ] ) };
        this->swap_remove_key_at( pos );
        if ( pos != values_.size() - 1 )
            values_[ pos ] = std::move( values_.back() );
        values_.pop_back();
        return removed;
    }

    value_type shift_remove_at( size_type const pos )
    {
        BOOST_ASSERT( pos < size() );
        value_type removed{ std::move( this->keys_[ pos ] ), std::move( values_[ pos ] ) };
        this->shift_remove_key_at( pos );
        values_.erase( values_.begin() + static_cast<difference_type>( pos ) );
        return removed;
    }

    void move_entry( size_type const from, size_type const to ) noexcept
    {
        if ( from == to )
            return;
        this->keys_  [ to ] = std::move( this->keys_[ from ] );
        this->hashes_[ to ] = this->hashes_[ from ];
        values_      [ to ] = std::move( values_[ from ] );
    }

    void truncate( size_type const new_size ) noexcept
    {
        this->truncate_keys( new_size );
        values_.erase( values_.begin() + static_cast<difference_type>( new_size ), values_.end() );
        this->rebuild_table();
    }

    void permute( std::span<size_type const> const order )
    {
        std::vector<V> values; values.reserve( order.size() );
        for ( auto const old_pos : order )
            values.push_back( std::move( values_[ old_pos ] ) );
        this->permute_keys( order );
        values_.swap( values );
        this->rebuild_table();
    }

private:
    std::vector<V> values_;
}; // class index_map

//------------------------------------------------------------------------------
} // namespace psi::coll
//------------------------------------------------------------------------------
