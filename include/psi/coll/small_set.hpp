////////////////////////////////////////////////////////////////////////////////
/// Insertion ordered set with inline capacity C (a small_map<T, unit, C>) and
/// lazy set algebra.
///
/// The set operations return views which evaluate membership while being
/// iterated (no intermediate collection is built):
///   - set_union               : elements of a, then elements of b not in a
///   - set_intersection        : elements of a also in b
///   - set_difference          : elements of a not in b
///   - set_symmetric_difference: elements of a not in b, then elements of b
///                               not in a
/// Each view yields the elements in the insertion order of the set they come
/// from.
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
#include "small_map.hpp"

#include <boost/assert.hpp>
#include <boost/container_hash/hash.hpp>
#include <boost/stl_interfaces/iterator_interface.hpp>
#include <boost/stl_interfaces/view_interface.hpp>

#include <algorithm>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <optional>
#include <span>
#include <utility>
//------------------------------------------------------------------------------
namespace psi::coll
{
//------------------------------------------------------------------------------

enum class set_operation : std::uint8_t
{
    union_,
    intersection,
    difference,
    symmetric_difference
}; // enum class set_operation

namespace detail
{
//------------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
// \class set_operation_view
// Walks the elements of the first set (filtered by membership in the second)
// and then, for union and symmetric difference, the elements of the second set
// that are not in the first.
////////////////////////////////////////////////////////////////////////////////

template <set_operation Op, typename SetA, typename SetB>
class set_operation_view
    : public boost::stl_interfaces::view_interface<set_operation_view<Op, SetA, SetB>>
{
public:
    using value_type = typename SetA::value_type;

    class iterator
        : public boost::stl_interfaces::iterator_interface
        <
#       if !BOOST_STL_INTERFACES_USE_DEDUCED_THIS
            iterator,
#       endif
            std::forward_iterator_tag,
            value_type const
        >
    {
    private:
        using impl = boost::stl_interfaces::iterator_interface
        <
#       if !BOOST_STL_INTERFACES_USE_DEDUCED_THIS
            iterator,
#       endif
            std::forward_iterator_tag,
            value_type const
        >;

    public:
        constexpr iterator() noexcept = default;

        value_type const & operator*() const noexcept
        {
            return second_phase() ? b_->keys()[ pos_ - a_->size() ] : a_->keys()[ pos_ ];
        }

        iterator & operator++()
        {
            ++pos_;
            skip_excluded();
            return *this;
        }
        using impl::operator++;

        friend bool operator==( iterator const & left, iterator const & right ) noexcept { return left.pos_ == right.pos_; }

    private: friend class set_operation_view;
        iterator( SetA const & a, SetB const & b, std::size_t const pos ) : a_{ &a }, b_{ &b }, pos_{ pos } { skip_excluded(); }

        static bool constexpr has_second_phase{ ( Op == set_operation::union_ ) || ( Op == set_operation::symmetric_difference ) };

        std::size_t end_pos() const noexcept { return a_->size() + ( has_second_phase ? b_->size() : 0 ); }

        bool second_phase() const noexcept { return pos_ >= a_->size(); }

        bool included() const
        {
            if ( !second_phase() )
            {
                auto const & x{ a_->keys()[ pos_ ] };
                switch ( Op )
                {
                    case set_operation::union_              : return true;
                    case set_operation::intersection        : return  b_->contains( x );
                    case set_operation::difference          :
                    case set_operation::symmetric_difference: return !b_->contains( x );
                }
            }
            return !a_->contains( b_->keys()[ pos_ - a_->size() ] );
        }

        void skip_excluded()
        {
            auto const end{ end_pos() };
            while ( ( pos_ < end ) && !included() )
                ++pos_;
        }

        SetA const * a_  { nullptr };
        SetB const * b_  { nullptr };
        std::size_t  pos_{ 0 };
    }; // class iterator

    set_operation_view( SetA const & a, SetB const & b ) noexcept : a_{ &a }, b_{ &b } {}

    iterator begin() const { return { *a_, *b_, 0 }; }
    iterator end  () const { return { *a_, *b_, iterator::has_second_phase ? a_->size() + b_->size() : a_->size() }; }

private:
    SetA const * a_;
    SetB const * b_;
}; // class set_operation_view

//------------------------------------------------------------------------------
} // namespace detail

template
<
    typename T,
    std::uint32_t C,
    typename Hash     = boost::hash<T>,
    typename KeyEqual = std::equal_to<T>
>
class small_set
{
private:
    using map_type = small_map<T, unit, C, Hash, KeyEqual>;

    static bool constexpr transparent{ transparent_lookup<Hash, KeyEqual> };

public:
    using key_type        = T;
    using value_type      = T;
    using size_type       = std::size_t;
    using difference_type = std::ptrdiff_t;
    using hasher          = Hash;
    using key_equal       = KeyEqual;
    using reference       = T const &;
    using const_reference = T const &;

    using iterator               = T const *;
    using const_iterator         = iterator;
    using reverse_iterator       = std::reverse_iterator<iterator>;
    using const_reverse_iterator = reverse_iterator;

    small_set() = default;

    explicit small_set( Hash const & hash, KeyEqual const & eq = KeyEqual{} ) : map_{ hash, eq } {}

    template <std::input_iterator It>
    small_set( It first, It const last ) { insert( first, last ); }

    small_set( std::initializer_list<T> const il ) { insert( il.begin(), il.end() ); }

    /// Wraps a map with unit values.
    explicit small_set( map_type keys ) noexcept : map_{ std::move( keys ) } {}

    [[ nodiscard ]] size_type size () const noexcept { return map_.size(); }
    [[ nodiscard ]] bool      empty() const noexcept { return map_.empty(); }

    [[ nodiscard ]] bool is_inline() const noexcept { return map_.is_inline(); }
    [[ nodiscard ]] static constexpr size_type inline_capacity() noexcept { return C; }

    void clear() noexcept { map_.clear(); }

    iterator begin() const noexcept { return keys().data(); }
    iterator end  () const noexcept { return keys().data() + size(); }
    reverse_iterator rbegin() const noexcept { return reverse_iterator{ end  () }; }
    reverse_iterator rend  () const noexcept { return reverse_iterator{ begin() }; }

    std::span<T const> keys() const noexcept { return map_.keys(); }

    /// Returns true if the value was not present yet (an existing equal
    /// element is left in place).
    bool insert( T value ) { return insert_full( std::move( value ) ).second; }

    /// Position of the (new or existing) element and whether it was inserted.
    std::pair<size_type, bool> insert_full( T value )
    {
        auto entry{ map_.entry( std::move( value ) ) };
        if ( entry.is_occupied() )
            return { entry.index(), false };
        auto const pos{ entry.index() };
        entry.vacant().insert( unit{} );
        return { pos, true };
    }

    template <std::input_iterator It>
    void insert( It first, It const last )
    {
        for ( ; first != last; ++first )
            insert( T( *first ) );
    }

    template <LookupType<transparent, T> K2 = T>
    [[ nodiscard ]] bool contains( K2 const & value ) const { return map_.contains_key( value ); }

    template <LookupType<transparent, T> K2 = T>
    [[ nodiscard ]] std::optional<size_type> get_index_of( K2 const & value ) const { return map_.get_index_of( value ); }

    [[ nodiscard ]] T const * nth( size_type const pos ) const noexcept { return ( pos < size() ) ? &keys()[ pos ] : nullptr; }

    /// Order preserving removal.
    template <LookupType<transparent, T> K2 = T>
    bool remove( K2 const & value ) { return map_.shift_remove( value ).has_value(); }
    template <LookupType<transparent, T> K2 = T>
    bool swap_remove( K2 const & value ) { return map_.swap_remove( value ).has_value(); }
    template <LookupType<transparent, T> K2 = T>
    bool shift_remove( K2 const & value ) { return map_.shift_remove( value ).has_value(); }

    //--------------------------------------------------------------------------
    // Set algebra
    //--------------------------------------------------------------------------

    template <std::uint32_t C2, typename H2, typename E2>
    auto set_union( small_set<T, C2, H2, E2> const & other ) const noexcept { return detail::set_operation_view<set_operation::union_, small_set, small_set<T, C2, H2, E2>>{ *this, other }; }

    template <std::uint32_t C2, typename H2, typename E2>
    auto set_intersection( small_set<T, C2, H2, E2> const & other ) const noexcept { return detail::set_operation_view<set_operation::intersection, small_set, small_set<T, C2, H2, E2>>{ *this, other }; }

    template <std::uint32_t C2, typename H2, typename E2>
    auto set_difference( small_set<T, C2, H2, E2> const & other ) const noexcept { return detail::set_operation_view<set_operation::difference, small_set, small_set<T, C2, H2, E2>>{ *this, other }; }

    template <std::uint32_t C2, typename H2, typename E2>
    auto set_symmetric_difference( small_set<T, C2, H2, E2> const & other ) const noexcept { return detail::set_operation_view<set_operation::symmetric_difference, small_set, small_set<T, C2, H2, E2>>{ *this, other }; }

    template <std::uint32_t C2, typename H2, typename E2>
    [[ nodiscard ]] bool is_disjoint( small_set<T, C2, H2, E2> const & other ) const
    {
        if ( size() <= other.size() )
            return std::none_of( begin(), end(), [ &other ]( T const & x ) { return other.contains( x ); } );
        return std::none_of( other.begin(), other.end(), [ this ]( T const & x ) { return contains( x ); } );
    }

    template <std::uint32_t C2, typename H2, typename E2>
    [[ nodiscard ]] bool is_subset( small_set<T, C2, H2, E2> const & other ) const
    {
        return ( size() <= other.size() ) && std::all_of( begin(), end(), [ &other ]( T const & x ) { return other.contains( x ); } );
    }

    template <std::uint32_t C2, typename H2, typename E2>
    [[ nodiscard ]] bool is_superset( small_set<T, C2, H2, E2> const & other ) const { return other.is_subset( *this ); }

    /// Order and representation insensitive.
    friend bool operator==( small_set const & a, small_set const & b ) { return a.map_ == b.map_; }

    map_type const & as_map() const noexcept { return map_; }

private:
    map_type map_;
}; // class small_set

//------------------------------------------------------------------------------
} // namespace psi::coll
//------------------------------------------------------------------------------
