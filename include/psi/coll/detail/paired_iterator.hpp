////////////////////////////////////////////////////////////////////////////////
/// Random access iterator over a pair of parallel contiguous arrays (keys and
/// values) yielding std::pair<K const &, V &> proxies.
///
/// Shared by index_map and both representations of small_map so that
/// iteration does not depend on the active storage.
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

#include <compare>
#include <cstddef>
#include <iterator>
#include <type_traits>
#include <utility>
//------------------------------------------------------------------------------
namespace psi::coll::detail
{
//------------------------------------------------------------------------------

template <typename K, typename V, bool IsConst>
class paired_iterator
{
public:
    using iterator_concept  = std::random_access_iterator_tag;
    using iterator_category = std::random_access_iterator_tag;
    using value_type        = std::pair<K, V>;
    using difference_type   = std::ptrdiff_t;
    using mapped_pointer    = std::conditional_t<IsConst, V const *, V *>;
    using reference         = std::pair<K const &, std::conditional_t<IsConst, V const &, V &>>;

    struct arrow_proxy {
        reference ref;
        constexpr reference       * operator->()       noexcept { return &ref; }
        constexpr reference const * operator->() const noexcept { return &ref; }
    };
    using pointer = arrow_proxy;

private:
    friend paired_iterator<K, V, !IsConst>;

    K const *       keys_  { nullptr };
    mapped_pointer  values_{ nullptr };
    difference_type idx_   { 0 };

public:
    constexpr paired_iterator() noexcept = default;
    constexpr paired_iterator( K const * const keys, mapped_pointer const values, difference_type const i ) noexcept
        : keys_{ keys }, values_{ values }, idx_{ i } {}

    constexpr paired_iterator( paired_iterator<K, V, !IsConst> const & other ) noexcept requires IsConst
        : keys_{ other.keys_ }, values_{ other.values_ }, idx_{ other.idx_ } {}

    constexpr reference operator*() const noexcept { return { keys_[ idx_ ], values_[ idx_ ] }; }

    constexpr arrow_proxy operator->() const noexcept { return { **this }; }

    constexpr reference operator[]( difference_type const n ) const noexcept { return *( *this + n ); }

    /// Position of the current element within the container.
    constexpr std::size_t index() const noexcept { return static_cast<std::size_t>( idx_ ); }

    constexpr paired_iterator & operator++(     ) noexcept { ++idx_; return *this; }
    constexpr paired_iterator   operator++( int ) noexcept { auto tmp{ *this }; ++idx_; return tmp; }
    constexpr paired_iterator & operator--(     ) noexcept { --idx_; return *this; }
    constexpr paired_iterator   operator--( int ) noexcept { auto tmp{ *this }; --idx_; return tmp; }

    constexpr paired_iterator & operator+=( difference_type const n ) noexcept { idx_ += n; return *this; }
    constexpr paired_iterator & operator-=( difference_type const n ) noexcept { idx_ -= n; return *this; }

    friend constexpr paired_iterator operator+( paired_iterator it, difference_type const n ) noexcept { it.idx_ += n; return it; }
    friend constexpr paired_iterator operator+( difference_type const n, paired_iterator it ) noexcept { it.idx_ += n; return it; }
    friend constexpr paired_iterator operator-( paired_iterator it, difference_type const n ) noexcept { it.idx_ -= n; return it; }

    friend constexpr difference_type operator-( paired_iterator const & a, paired_iterator const & b ) noexcept { return a.idx_ - b.idx_; }

    friend constexpr bool operator== ( paired_iterator const & a, paired_iterator const & b ) noexcept { return a.idx_ == b.idx_; }
    friend constexpr auto operator<=>( paired_iterator const & a, paired_iterator const & b ) noexcept { return a.idx_ <=> b.idx_; }
}; // class paired_iterator

//------------------------------------------------------------------------------
} // namespace psi::coll::detail
//------------------------------------------------------------------------------
