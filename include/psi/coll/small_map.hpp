////////////////////////////////////////////////////////////////////////////////
/// Insertion ordered map which keeps up to C entries inline (no allocation,
/// linear search) and switches to a heap allocated index_map once a new
/// distinct key would exceed that capacity.
///
/// Representation: std::variant of
///   - inline_storage: two boost::container::static_vector<_, C> arrays
///                     (keys, values) in insertion order
///   - spilled_map   : index_map<K, V, Hash, KeyEqual>
/// The switch (promotion) is one way: removals never move the entries back
/// inline. Both representations expose contiguous parallel key and value
/// arrays so iteration (detail::paired_iterator) and positional access do not
/// depend on the active representation.
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
#include "lookup.hpp"
#include "detail/entry.hpp"
#include "detail/paired_iterator.hpp"

#include <boost/assert.hpp>
#include <boost/container/static_vector.hpp>
#include <boost/container_hash/hash.hpp>

#include <array>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <optional>
#include <span>
#include <type_traits>
#include <utility>
#include <variant>
//------------------------------------------------------------------------------
namespace psi::coll
{
//------------------------------------------------------------------------------

template
<
    typename K,
    typename V,
    std::uint32_t C,
    typename Hash     = boost::hash<K>,
    typename KeyEqual = std::equal_to<K>
>
class small_map
{
    static_assert( C > 0, "Zero inline capacity: use index_map directly" );

public:
    using key_type        = K;
    using mapped_type     = V;
    using value_type      = std::pair<K, V>;
    using size_type       = std::size_t;
    using difference_type = std::ptrdiff_t;
    using hasher          = Hash;
    using key_equal       = KeyEqual;
    using reference       = std::pair<K const &, V       &>;
    using const_reference = std::pair<K const &, V const &>;

    using spilled_map = index_map<K, V, Hash, KeyEqual>;

    using iterator               = detail::paired_iterator<K, V, false>;
    using const_iterator         = detail::paired_iterator<K, V, true >;
    using reverse_iterator       = std::reverse_iterator<iterator>;
    using const_reverse_iterator = std::reverse_iterator<const_iterator>;

private:
    static bool      constexpr transparent{ transparent_lookup<Hash, KeyEqual> };
    static size_type constexpr npos       { static_cast<size_type>( -1 ) };

    // move only types are moved even when the move may throw (as with std::move_if_noexcept)
    template <typename T>
    static bool constexpr relocate_by_move{ std::is_nothrow_move_constructible_v<T> || !std::is_copy_constructible_v<T> };
    static bool constexpr relocate_entries_by_move{ relocate_by_move<K> && relocate_by_move<V> };

    struct inline_storage
    {
        boost::container::static_vector<K, C> keys;
        boost::container::static_vector<V, C> values;
    }; // struct inline_storage

public:
    //--------------------------------------------------------------------------
    // Entry handles
    //--------------------------------------------------------------------------

    class occupied_entry
    {
    public:
        using key_type    = K;
        using mapped_type = V;

        K const & key  () const noexcept { return map_->key_data  ()[ pos_ ]; }
        V       & get  () const noexcept { return map_->value_data()[ pos_ ]; }
        size_type index() const noexcept { return pos_; }

        V insert( V value ) { return std::exchange( get(), std::move( value ) ); }

        V swap_remove () { return std::move( map_->swap_remove_at ( pos_ ).second ); }
        V shift_remove() { return std::move( map_->shift_remove_at( pos_ ).second ); }
        V remove      () { return shift_remove(); }

    private: friend class small_map;
        occupied_entry( small_map & map, size_type const pos ) noexcept : map_{ &map }, pos_{ pos } {}

        small_map * map_;
        size_type   pos_;
    }; // class occupied_entry

    class vacant_entry
    {
    public:
        using key_type    = K;
        using mapped_type = V;

        K const & key() const noexcept
        {
            if ( auto const p_key{ std::get_if<0>( &state_ ) } )
                return *p_key;
            return std::get_if<1>( &state_ )->key();
        }
        size_type index() const noexcept { return map_->size(); }

        /// Inserts applying the promotion rule (the map may switch to the
        /// spilled representation).
        V & insert( V value )
        {
            if ( auto const p_key{ std::get_if<0>( &state_ ) } )
                return map_->insert_absent( std::move( *p_key ), std::move( value ) ).second;
            return std::get_if<1>( &state_ )->insert( std::move( value ) );
        }

    private: friend class small_map;
        vacant_entry( small_map & map, K && key ) : map_{ &map }, state_{ std::in_place_index<0>, std::move( key ) } {}
        vacant_entry( small_map & map, typename spilled_map::vacant_entry && spilled ) : map_{ &map }, state_{ std::in_place_index<1>, std::move( spilled ) } {}

        small_map * map_;
        std::variant<K, typename spilled_map::vacant_entry> state_;
    }; // class vacant_entry

    using entry_type = detail::entry<occupied_entry, vacant_entry>;

    //--------------------------------------------------------------------------
    // Construction
    //--------------------------------------------------------------------------

    small_map() = default;

    explicit small_map( Hash const & hash, KeyEqual const & eq = KeyEqual{} ) : hash_{ hash }, eq_{ eq } {}

    template <std::input_iterator It>
    small_map( It first, It const last ) { insert( first, last ); }

    small_map( std::initializer_list<value_type> const il ) { insert( il.begin(), il.end() ); }

    //--------------------------------------------------------------------------
    // State
    //--------------------------------------------------------------------------

    [[ nodiscard ]] size_type size() const noexcept
    {
        if ( auto const p_inline{ std::get_if<0>( &storage_ ) } )
            return p_inline->keys.size();
        return std::get_if<1>( &storage_ )->size();
    }
    [[ nodiscard ]] bool empty() const noexcept { return size() == 0; }

    [[ nodiscard ]] bool is_inline() const noexcept { return storage_.index() == 0; }
    [[ nodiscard ]] static constexpr size_type inline_capacity() noexcept { return C; }

    /// Removes all entries keeping the current representation.
    void clear() noexcept
    {
        if ( auto const p_inline{ std::get_if<0>( &storage_ ) } )
        {
            p_inline->keys  .clear();
            p_inline->values.clear();
        }
        else
        {
            std::get_if<1>( &storage_ )->clear();
        }
    }

    //--------------------------------------------------------------------------
    // Iteration and views
    //--------------------------------------------------------------------------

    iterator       begin()       noexcept { return { key_data(), value_data(), 0 }; }
    const_iterator begin() const noexcept { return { key_data(), value_data(), 0 }; }
    iterator       end  ()       noexcept { return begin() + static_cast<difference_type>( size() ); }
    const_iterator end  () const noexcept { return begin() + static_cast<difference_type>( size() ); }

    reverse_iterator       rbegin()       noexcept { return reverse_iterator      { end() }; }
    const_reverse_iterator rbegin() const noexcept { return const_reverse_iterator{ end() }; }
    reverse_iterator       rend  ()       noexcept { return reverse_iterator      { begin() }; }
    const_reverse_iterator rend  () const noexcept { return const_reverse_iterator{ begin() }; }

    std::span<K const> keys  () const noexcept { return { key_data  (), size() }; }
    std::span<V const> values() const noexcept { return { value_data(), size() }; }
    std::span<V      > values()       noexcept { return { value_data(), size() }; }

    //--------------------------------------------------------------------------
    // Lookup
    //--------------------------------------------------------------------------

    template <LookupType<transparent, K> K2 = K>
    [[ nodiscard ]] V const * get( K2 const & key ) const
    {
        auto const pos{ find_pos( key ) };
        return ( pos != npos ) ? &value_data()[ pos ] : nullptr;
    }
    template <LookupType<transparent, K> K2 = K>
    [[ nodiscard ]] V * get( K2 const & key ) { return const_cast<V *>( std::as_const( *this ).get( key ) ); }

    template <LookupType<transparent, K> K2 = K>
    [[ nodiscard ]] V * get_mut( K2 const & key ) { return get( key ); }

    template <LookupType<transparent, K> K2 = K>
    [[ nodiscard ]] bool contains_key( K2 const & key ) const { return find_pos( key ) != npos; }

    template <LookupType<transparent, K> K2 = K>
    [[ nodiscard ]] std::optional<size_type> get_index_of( K2 const & key ) const
    {
        auto const pos{ find_pos( key ) };
        if ( pos == npos )
            return std::nullopt;
        return pos;
    }

    [[ nodiscard ]] std::optional<const_reference> nth( size_type const pos ) const noexcept
    {
        if ( pos >= size() )
            return std::nullopt;
        return const_reference{ key_data()[ pos ], value_data()[ pos ] };
    }
    [[ nodiscard ]] std::optional<reference> nth( size_type const pos ) noexcept
    {
        if ( pos >= size() )
            return std::nullopt;
        return reference{ key_data()[ pos ], value_data()[ pos ] };
    }

    //--------------------------------------------------------------------------
    // Insertion
    //--------------------------------------------------------------------------

    /// Inserts or overwrites returning the replaced value. An existing key
    /// keeps its position; a new key is appended (promoting the map if the
    /// inline capacity is exhausted).
    std::optional<V> insert( K key, V value ) { return insert_full( std::move( key ), std::move( value ) ).second; }

    std::pair<size_type, std::optional<V>> insert_full( K key, V value )
    {
        if ( auto const p_spilled{ std::get_if<1>( &storage_ ) } )
            return p_spilled->insert_full( std::move( key ), std::move( value ) );

        auto const pos{ find_inline( key ) };
        if ( pos != npos )
            return { pos, std::exchange( value_data()[ pos ], std::move( value ) ) };
        insert_absent( std::move( key ), std::move( value ) );
        return { size() - 1, std::nullopt };
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

    [[ nodiscard ]] entry_type entry( K key )
    {
        if ( auto const p_spilled{ std::get_if<1>( &storage_ ) } )
        {
            auto spilled_entry{ p_spilled->entry( std::move( key ) ) };
            if ( spilled_entry.is_occupied() )
                return occupied_entry{ *this, spilled_entry.occupied().index() };
            return vacant_entry{ *this, std::move( spilled_entry.vacant() ) };
        }
        auto const pos{ find_inline( key ) };
        if ( pos != npos )
            return occupied_entry{ *this, pos };
        return vacant_entry{ *this, std::move( key ) };
    }

    //--------------------------------------------------------------------------
    // Removal (never demotes)
    //--------------------------------------------------------------------------

    template <LookupType<transparent, K> K2 = K>
    std::optional<V> swap_remove( K2 const & key )
    {
        auto const pos{ find_pos( key ) };
        if ( pos == npos )
            return std::nullopt;
        return std::move( swap_remove_at( pos ).second );
    }

    template <LookupType<transparent, K> K2 = K>
    std::optional<V> shift_remove( K2 const & key )
    {
        auto const pos{ find_pos( key ) };
        if ( pos == npos )
            return std::nullopt;
        return std::move( shift_remove_at( pos ).second );
    }

    /// Order preserving removal.
    template <LookupType<transparent, K> K2 = K>
    std::optional<V> remove( K2 const & key ) { return shift_remove( key ); }

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

    //--------------------------------------------------------------------------
    // Comparison
    //--------------------------------------------------------------------------

    /// Order and representation insensitive.
    friend bool operator==( small_map const & a, small_map const & b )
    {
        if ( a.size() != b.size() )
            return false;
        for ( auto const & [ key, value ] : a )
        {
            auto const p_value{ b.get( key ) };
            if ( !p_value || !( *p_value == value ) )
                return false;
        }
        return true;
    }

private:
    K const * key_data() const noexcept
    {
        if ( auto const p_inline{ std::get_if<0>( &storage_ ) } )
            return p_inline->keys.data();
        return std::get_if<1>( &storage_ )->keys().data();
    }
    V const * value_data() const noexcept
    {
        if ( auto const p_inline{ std::get_if<0>( &storage_ ) } )
            return p_inline->values.data();
        return std::get_if<1>( &storage_ )->values().data();
    }
    V * value_data() noexcept { return const_cast<V *>( std::as_const( *this ).value_data() ); }

    template <typename K2>
    size_type find_inline( K2 const & key ) const
    {
        auto const & keys{ std::get_if<0>( &storage_ )->keys };
        for ( size_type pos{ 0 }; pos < keys.size(); ++pos )
        {
            if ( eq_( keys[ pos ], key ) )
                return pos;
        }
        return npos;
    }

    template <typename K2>
    size_type find_pos( K2 const & key ) const
    {
        if ( is_inline() )
            return find_inline( key );
        return std::get_if<1>( &storage_ )->get_index_of( key ).value_or( npos );
    }

    /// Appends a key known to be absent.
    reference insert_absent( K && key, V && value )
    {
        auto const p_inline{ std::get_if<0>( &storage_ ) };
        if ( !p_inline )
            return std::get_if<1>( &storage_ )->insert_unique_unchecked( std::move( key ), std::move( value ) );
        if ( p_inline->keys.size() == C )
            return promote_and_insert( *p_inline, std::move( key ), std::move( value ) );

        p_inline->keys.push_back( std::move( key ) );
        try { p_inline->values.push_back( std::move( value ) ); }
        catch ( ... ) { p_inline->keys.pop_back(); throw; }
        return { p_inline->keys.back(), p_inline->values.back() };
    }

    /// Moves the (full) inline buffer into a spilled map, in order, then
    /// appends the new entry. Hashing and allocation happen before the buffer
    /// is touched and entries are copied unless both K and V move without
    /// throwing, so a failed promotion leaves the map unchanged.
    [[ gnu::cold ]] reference promote_and_insert( inline_storage & buffer, K && key, V && value )
    {
        BOOST_ASSERT( buffer.keys.size() == C );
        std::array<std::size_t, C + 1> hashes;
        for ( size_type pos{ 0 }; pos < C; ++pos )
            hashes[ pos ] = static_cast<std::size_t>( hash_( buffer.keys[ pos ] ) );
        hashes[ C ] = static_cast<std::size_t>( hash_( key ) );

        spilled_map spilled( C + 1, hash_, eq_ );
        for ( size_type pos{ 0 }; pos < C; ++pos )
        {
            if constexpr ( relocate_entries_by_move )
                spilled.insert_unique_unchecked( hashes[ pos ], std::move( buffer.keys[ pos ] ), std::move( buffer.values[ pos ] ) );
            else
                spilled.insert_unique_unchecked( hashes[ pos ], std::as_const( buffer.keys[ pos ] ), std::as_const( buffer.values[ pos ] ) );
        }
        spilled.insert_unique_unchecked( hashes[ C ], std::move( key ), std::move( value ) );
        auto & promoted{ storage_.template emplace<1>( std::move( spilled ) ) };
        auto   last    { promoted.end() - 1 };
        return *last;
    }

    value_type swap_remove_at( size_type const pos )
    {
        BOOST_ASSERT( pos < size() );
        if ( auto const p_spilled{ std::get_if<1>( &storage_ ) } )
            return *p_spilled->swap_remove_index( pos );
        auto & buffer{ *std::get_if<0>( &storage_ ) };
        value_type removed{ std::move( buffer.keys[ pos ] ), std::move( buffer.values[ pos ] ) };
        if ( pos != buffer.keys.size() - 1 )
        {
            buffer.keys  [ pos ] = std::move( buffer.keys  .back() );
            buffer.values[ pos ] = std::move( buffer.values.back() );
        }
        buffer.keys  .pop_back();
        buffer.values.pop_back();
        return removed;
    }

    value_type shift_remove_at( size_type const pos )
    {
        BOOST_ASSERT( pos < size() );
        if ( auto const p_spilled{ std::get_if<1>( &storage_ ) } )
            return *p_spilled->shift_remove_index( pos );
        auto & buffer{ *std::get_if<0>( &storage_ ) };
        value_type removed{ std::move( buffer.keys[ pos ] ), std::move( buffer.values[ pos ] ) };
        auto const p{ static_cast<difference_type>( pos ) };
        buffer.keys  .erase( buffer.keys  .begin() + p );
        buffer.values.erase( buffer.values.begin() + p );
        return removed;
    }

private:
    std::variant<inline_storage, spilled_map> storage_;
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
}; // class small_map

//------------------------------------------------------------------------------
} // namespace psi::coll
//------------------------------------------------------------------------------
