////////////////////////////////////////////////////////////////////////////////
/// Dense map over small integer-like keys
///
/// vec_map<K, V> stores an optional value per slot, the slot being the key's
/// integer index. Lookup, insertion and removal are O(1) direct indexing;
/// iteration visits the occupied slots in ascending key order. The slot array
/// grows to max inserted index + 1 and never shrinks on removal.
///
/// Keys: any integral or enumeration type, or a type for which
/// index_key_traits<K> is specialized with to_index() and from_index()
/// (try_to_index() is optional for user types).
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
#include "detail/entry.hpp"

#include <boost/assert.hpp>
#include <boost/stl_interfaces/iterator_interface.hpp>

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <iterator>
#include <limits>
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
    template <typename K> struct index_key_integer { using type = K; };
    template <typename K> requires std::is_enum_v<K>
    struct index_key_integer<K> { using type = std::underlying_type_t<K>; };

    inline std::size_t constexpr max_slot_index{ static_cast<std::size_t>( std::numeric_limits<std::ptrdiff_t>::max() ) - 1 };
} // namespace detail

template <typename K>
struct index_key_traits;

/// Built-in conversion for integers and enumerations: negative values and
/// values beyond the addressable slot range have no index.
template <typename K>
requires std::integral<K> || std::is_enum_v<K>
struct index_key_traits<K>
{
    using integer = typename detail::index_key_integer<K>::type;

    static constexpr std::optional<std::size_t> try_to_index( K const key ) noexcept
    {
        auto const value{ static_cast<integer>( key ) };
        if constexpr ( std::is_signed_v<integer> )
        {
            if ( value < 0 )
                return std::nullopt;
        }
        if ( static_cast<std::uintmax_t>( value ) > detail::max_slot_index )
            return std::nullopt;
        return static_cast<std::size_t>( value );
    }

    static std::size_t to_index( K const key )
    {
        if ( auto const index{ try_to_index( key ) } ) [[ likely ]]
            return *index;
        detail::throw_out_of_range( "psi::coll::index_key_traits::to_index: key has no slot index" );
    }

    static constexpr K from_index( std::size_t const index ) noexcept { return static_cast<K>( static_cast<integer>( index ) ); }
}; // struct index_key_traits<integral/enum>

template <typename K>
concept index_key = std::copyable<K> && requires( K const key, std::size_t const index )
{
    { index_key_traits<K>::to_index  ( key   ) } -> std::convertible_to<std::size_t>;
    { index_key_traits<K>::from_index( index ) } -> std::convertible_to<K>;
};

namespace detail
{
//------------------------------------------------------------------------------

template <index_key K>
std::optional<std::size_t> try_index_of( K const & key )
{
    if constexpr ( requires { { index_key_traits<K>::try_to_index( key ) } -> std::convertible_to<std::optional<std::size_t>>; } )
        return index_key_traits<K>::try_to_index( key );
    else
        return static_cast<std::size_t>( index_key_traits<K>::to_index( key ) );
}

////////////////////////////////////////////////////////////////////////////////
// \class slot_iterator
// Bidirectional walk over the occupied slots, yielding ( key, value & ) pairs.
////////////////////////////////////////////////////////////////////////////////

template <typename K, typename V, bool IsConst>
class slot_iterator
    : public boost::stl_interfaces::iterator_interface
    <
#   if !BOOST_STL_INTERFACES_USE_DEDUCED_THIS
        slot_iterator<K, V, IsConst>,
#   endif
        std::bidirectional_iterator_tag,
        std::pair<K, V>,
        std::pair<K, std::conditional_t<IsConst, V const, V> &>,
        boost::stl_interfaces::proxy_arrow_result<std::pair<K, std::conditional_t<IsConst, V const, V> &>>
    >
{
private:
    using slot       = std::conditional_t<IsConst, std::optional<V> const, std::optional<V>>;
    using value_ref  = std::conditional_t<IsConst, V const, V> &;
    using impl       = boost::stl_interfaces::iterator_interface
    <
#   if !BOOST_STL_INTERFACES_USE_DEDUCED_THIS
        slot_iterator<K, V, IsConst>,
#   endif
        std::bidirectional_iterator_tag,
        std::pair<K, V>,
        std::pair<K, value_ref>,
        boost::stl_interfaces::proxy_arrow_result<std::pair<K, value_ref>>
    >;

public:
    constexpr slot_iterator() noexcept = default;

    slot_iterator( slot * const first, slot * const last, slot * const pos ) noexcept
        : first_{ first }, last_{ last }, pos_{ pos }
    {
        while ( ( pos_ != last_ ) && !pos_->has_value() )
            ++pos_;
    }

    template <bool OtherConst> requires ( IsConst && !OtherConst )
    slot_iterator( slot_iterator<K, V, OtherConst> const & other ) noexcept
        : first_{ other.first_ }, last_{ other.last_ }, pos_{ other.pos_ } {}

    std::pair<K, value_ref> operator*() const
    {
        BOOST_ASSERT( ( pos_ != last_ ) && pos_->has_value() );
        return { index_key_traits<K>::from_index( static_cast<std::size_t>( pos_ - first_ ) ), **pos_ };
    }

    slot_iterator & operator++() noexcept
    {
        BOOST_ASSERT( pos_ != last_ );
        do { ++pos_; } while ( ( pos_ != last_ ) && !pos_->has_value() );
        return *this;
    }

    slot_iterator & operator--() noexcept
    {
        do { BOOST_ASSERT( pos_ != first_ ); --pos_; } while ( !pos_->has_value() );
        return *this;
    }

    using impl::operator++;
    using impl::operator--;

    friend bool operator==( slot_iterator const & left, slot_iterator const & right ) noexcept { return left.pos_ == right.pos_; }

    /// Slot index of the current element.
    std::size_t index() const noexcept { return static_cast<std::size_t>( pos_ - first_ ); }

private: template <typename, typename, bool> friend class slot_iterator;
    slot * first_{ nullptr };
    slot * last_ { nullptr };
    slot * pos_  { nullptr };
}; // class slot_iterator

////////////////////////////////////////////////////////////////////////////////
// \class slot_projection_iterator
// Keys (by value) or values of the occupied slots.
////////////////////////////////////////////////////////////////////////////////

template <typename K, typename V, bool Keys>
struct slot_projection_types
{
    using value_type = std::conditional_t<Keys, K, V const>;
    using reference  = std::conditional_t<Keys, K, V const &>;
    using pointer    = std::conditional_t<Keys, boost::stl_interfaces::proxy_arrow_result<K>, V const *>;
}; // struct slot_projection_types

template <typename K, typename V, bool Keys>
class slot_projection_iterator
    : public boost::stl_interfaces::iterator_interface
    <
#   if !BOOST_STL_INTERFACES_USE_DEDUCED_THIS
        slot_projection_iterator<K, V, Keys>,
#   endif
        std::bidirectional_iterator_tag,
        typename slot_projection_types<K, V, Keys>::value_type,
        typename slot_projection_types<K, V, Keys>::reference,
        typename slot_projection_types<K, V, Keys>::pointer
    >
{
private:
    using types = slot_projection_types<K, V, Keys>;
    using impl  = boost::stl_interfaces::iterator_interface
    <
#   if !BOOST_STL_INTERFACES_USE_DEDUCED_THIS
        slot_projection_iterator<K, V, Keys>,
#   endif
        std::bidirectional_iterator_tag,
        typename types::value_type,
        typename types::reference,
        typename types::pointer
    >;

public:
    constexpr slot_projection_iterator() noexcept = default;
    explicit slot_projection_iterator( slot_iterator<K, V, true> const pos ) noexcept : pos_{ pos } {}

    typename types::reference operator*() const
    {
        if constexpr ( Keys )
            return ( *pos_ ).first;
        else
            return ( *pos_ ).second;
    }

    slot_projection_iterator & operator++() noexcept { ++pos_; return *this; }
    slot_projection_iterator & operator--() noexcept { --pos_; return *this; }
    using impl::operator++;
    using impl::operator--;

    friend bool operator==( slot_projection_iterator const & left, slot_projection_iterator const & right ) noexcept { return left.pos_ == right.pos_; }

private:
    slot_iterator<K, V, true> pos_;
}; // class slot_projection_iterator

//------------------------------------------------------------------------------
} // namespace detail

template <index_key K, typename V>
class vec_map
{
public:
    using key_type        = K;
    using mapped_type     = V;
    using value_type      = std::pair<K, V>;
    using size_type       = std::size_t;
    using difference_type = std::ptrdiff_t;
    using reference       = std::pair<K, V       &>;
    using const_reference = std::pair<K, V const &>;

    using iterator               = detail::slot_iterator<K, V, false>;
    using const_iterator         = detail::slot_iterator<K, V, true >;
    using reverse_iterator       = std::reverse_iterator<iterator>;
    using const_reverse_iterator = std::reverse_iterator<const_iterator>;

    class occupied_entry
    {
    public:
        using key_type    = K;
        using mapped_type = V;

        K const &   key  () const noexcept { return key_; }
        std::size_t index() const noexcept { return index_; }
        V &         get  () const noexcept { return *map_->slots_[ index_ ]; }

        /// Replaces the value, returns the old one.
        V insert( V value ) { return std::exchange( get(), std::move( value ) ); }

        V remove()
        {
            auto value{ std::move( get() ) };
            map_->slots_[ index_ ].reset();
            --map_->len_;
            return value;
        }

    private: friend class vec_map;
        occupied_entry( vec_map & map, K const key, std::size_t const index ) noexcept : map_{ &map }, key_{ key }, index_{ index } {}

        vec_map *   map_;
        K           key_;
        std::size_t index_;
    }; // class occupied_entry

    class vacant_entry
    {
    public:
        using key_type    = K;
        using mapped_type = V;

        K const &   key  () const noexcept { return key_; }
        std::size_t index() const noexcept { return index_; }

        V & insert( V value ) { return map_->emplace_at( index_, std::move( value ) ); }

    private: friend class vec_map;
        vacant_entry( vec_map & map, K const key, std::size_t const index ) noexcept : map_{ &map }, key_{ key }, index_{ index } {}

        vec_map *   map_;
        K           key_;
        std::size_t index_;
    }; // class vacant_entry

    using entry_type = detail::entry<occupied_entry, vacant_entry>;

    vec_map() = default;

    /// Pre-sizes the slot array to n (unoccupied) slots.
    explicit vec_map( size_type const slot_count ) : slots_( slot_count ) {}

    explicit vec_map( std::vector<std::optional<V>> slots ) noexcept
        : slots_{ std::move( slots ) },
          len_{ static_cast<size_type>( std::ranges::count_if( slots_, []( std::optional<V> const & slot ) { return slot.has_value(); } ) ) }
    {}

    template <std::input_iterator It>
    vec_map( It first, It const last ) { insert( first, last ); }

    vec_map( std::initializer_list<value_type> const il ) { insert( il.begin(), il.end() ); }

    /// n occupied slots (keys 0 to n - 1), each holding a copy of value.
    static vec_map from_elem( V const & value, size_type const n ) requires std::copy_constructible<V>
    {
        return vec_map{ std::vector<std::optional<V>>( n, std::optional<V>{ value } ) };
    }

    vec_map( vec_map const & ) = default;
    vec_map( vec_map && other ) noexcept : slots_{ std::move( other.slots_ ) }, len_{ std::exchange( other.len_, 0 ) } {}
    vec_map & operator=( vec_map const & ) = default;
    vec_map & operator=( vec_map && other ) noexcept
    {
        slots_ = std::move( other.slots_ );
        len_   = std::exchange( other.len_, 0 );
        return *this;
    }

    [[ nodiscard ]] size_type size () const noexcept { return len_; }
    [[ nodiscard ]] bool      empty() const noexcept { return len_ == 0; }

    /// Slot count (one past the highest key storable without growth).
    [[ nodiscard ]] size_type capacity() const noexcept { return slots_.size(); }

    /// Adds additional unoccupied slots.
    void reserve( size_type const additional ) { slots_.resize( slots_.size() + additional ); }

    /// Empties every slot, keeping the slot count.
    void clear() noexcept
    {
        for ( auto & slot : slots_ )
            slot.reset();
        len_ = 0;
    }

    //--------------------------------------------------------------------------
    // Iteration
    //--------------------------------------------------------------------------

    iterator       begin()       noexcept { return { slots_.data(), slots_.data() + slots_.size(), slots_.data() }; }
    const_iterator begin() const noexcept { return { slots_.data(), slots_.data() + slots_.size(), slots_.data() }; }
    iterator       end  ()       noexcept { return { slots_.data(), slots_.data() + slots_.size(), slots_.data() + slots_.size() }; }
    const_iterator end  () const noexcept { return { slots_.data(), slots_.data() + slots_.size(), slots_.data() + slots_.size() }; }

    const_iterator cbegin() const noexcept { return begin(); }
    const_iterator cend  () const noexcept { return end  (); }

    reverse_iterator       rbegin()       noexcept { return reverse_iterator      { end() }; }
    const_reverse_iterator rbegin() const noexcept { return const_reverse_iterator{ end() }; }
    reverse_iterator       rend  ()       noexcept { return reverse_iterator      { begin() }; }
    const_reverse_iterator rend  () const noexcept { return const_reverse_iterator{ begin() }; }

    /// Occupied keys in ascending order.
    auto keys() const
    {
        using key_it = detail::slot_projection_iterator<K, V, true>;
        return std::ranges::subrange<key_it>{ key_it{ begin() }, key_it{ end() } };
    }

    auto values() const
    {
        using value_it = detail::slot_projection_iterator<K, V, false>;
        return std::ranges::subrange<value_it>{ value_it{ begin() }, value_it{ end() } };
    }

    //--------------------------------------------------------------------------
    // Lookup
    //--------------------------------------------------------------------------

    [[ nodiscard ]] V const * get( K const & key ) const { return find_slot( key ); }
    [[ nodiscard ]] V       * get( K const & key ) { return const_cast<V *>( std::as_const( *this ).find_slot( key ) ); }
    [[ nodiscard ]] V       * get_mut( K const & key ) { return get( key ); }

    [[ nodiscard ]] bool contains_key( K const & key ) const { return find_slot( key ) != nullptr; }

    V const & at( K const & key ) const
    {
        if ( auto const value{ find_slot( key ) } ) [[ likely ]]
            return *value;
        detail::throw_out_of_range( "psi::coll::vec_map::at: key not found" );
    }
    V & at( K const & key ) { return const_cast<V &>( std::as_const( *this ).at( key ) ); }

    V & operator[]( K const & key ) requires std::default_initializable<V> { return entry( key ).or_default(); }

    //--------------------------------------------------------------------------
    // Modifiers
    //--------------------------------------------------------------------------

    /// Stores value under key (growing the slot array as needed) and returns
    /// the previous value, if any.
    std::optional<V> insert( K const & key, V value )
    {
        auto const index{ index_key_traits<K>::to_index( key ) };
        if ( index < slots_.size() && slots_[ index ] )
            return std::exchange( *slots_[ index ], std::move( value ) );
        emplace_at( index, std::move( value ) );
        return std::nullopt;
    }

    template <std::input_iterator It>
    void insert( It first, It const last )
    {
        for ( ; first != last; ++first )
        {
            auto && [ key, value ]{ *first };
            insert( key, V( value ) );
        }
    }

    entry_type entry( K const & key )
    {
        auto const index{ index_key_traits<K>::to_index( key ) };
        if ( index < slots_.size() && slots_[ index ] )
            return occupied_entry{ *this, key, index };
        return vacant_entry{ *this, key, index };
    }

    std::optional<V> remove( K const & key )
    {
        auto const index{ detail::try_index_of( key ) };
        if ( !index || *index >= slots_.size() || !slots_[ *index ] )
            return std::nullopt;
        auto & slot{ slots_[ *index ] };
        std::optional<V> removed{ std::move( slot ) };
        slot.reset();
        --len_;
        return removed;
    }

    /// Removes the entry with the highest key.
    std::optional<value_type> pop()
    {
        if ( empty() )
            return std::nullopt;
        for ( auto index{ slots_.size() }; index-- != 0; )
        {
            if ( auto & slot{ slots_[ index ] } )
            {
                value_type popped{ index_key_traits<K>::from_index( index ), std::move( *slot ) };
                slot.reset();
                --len_;
                return popped;
            }
        }
        BOOST_ASSERT_MSG( false, "Occupied count out of sync with the slots" );
        return std::nullopt;
    }

    /// Keeps the entries for which keep( key, value & ) holds, visiting them in
    /// ascending key order.
    template <typename Pred>
    void retain( Pred && keep )
    {
        for ( std::size_t index{ 0 }; index != slots_.size(); ++index )
        {
            auto & slot{ slots_[ index ] };
            if ( slot && !keep( index_key_traits<K>::from_index( index ), *slot ) )
            {
                slot.reset();
                --len_;
            }
        }
    }

    /// Equal occupied slots; trailing unoccupied slots are ignored.
    friend bool operator==( vec_map const & a, vec_map const & b )
    {
        if ( a.len_ != b.len_ )
            return false;
        auto const shared{ std::min( a.slots_.size(), b.slots_.size() ) };
        auto const unoccupied{ []( std::optional<V> const & slot ) { return !slot.has_value(); } };
        return std::equal( a.slots_.begin(), a.slots_.begin() + shared, b.slots_.begin() ) &&
               std::all_of( a.slots_.begin() + shared, a.slots_.end(), unoccupied ) &&
               std::all_of( b.slots_.begin() + shared, b.slots_.end(), unoccupied );
    }

private:
    V const * find_slot( K const & key ) const
    {
        auto const index{ detail::try_index_of( key ) };
        if ( !index || *index >= slots_.size() || !slots_[ *index ] )
            return nullptr;
        return &*slots_[ *index ];
    }

    V & emplace_at( std::size_t const index, V && value )
    {
        BOOST_ASSERT( index >= slots_.size() || !slots_[ index ] );
        if ( index >= slots_.size() )
            slots_.resize( index + 1 );
        auto & stored{ slots_[ index ].emplace( std::move( value ) ) };
        ++len_;
        return stored;
    }

    std::vector<std::optional<V>> slots_;
    size_type                     len_{ 0 };
}; // class vec_map

//------------------------------------------------------------------------------
} // namespace psi::coll
//------------------------------------------------------------------------------
