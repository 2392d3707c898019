////////////////////////////////////////////////////////////////////////////////
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

#include <boost/config.hpp>

#include <cstddef>
#include <type_traits>
#include <utility>
//------------------------------------------------------------------------------
namespace psi::coll
{
//------------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
// Lightweight call_traits: keys, index keys and predicates that fit into a
// register pair are passed by value, everything else by const reference.
////////////////////////////////////////////////////////////////////////////////

template <typename T>
bool constexpr can_be_passed_in_reg
{
    std::is_trivially_copyable_v<T> &&
    ( sizeof( T ) <= 2 * sizeof( void * ) ) // assuming a sane ABI like SysV (ignoring the MS x64 disaster)
}; // can_be_passed_in_reg

template <typename T>
using const_arg_t = std::conditional_t<can_be_passed_in_reg<T>, T const, T const &>;


// utility for passing non trivial predicates to algorithms which pass them around by-val
template <typename Pred>
constexpr decltype( auto ) make_trivially_copyable_predicate( Pred && __restrict pred ) noexcept {
    if constexpr ( can_be_passed_in_reg<std::remove_cvref_t<Pred>> ) {
        return std::forward<Pred>( pred );
    } else {
        return [&pred]( auto && ... args ) noexcept( noexcept( pred( std::forward<decltype( args )>( args )... ) ) ) {
            return pred( std::forward<decltype( args )>( args )... );
        };
    }
} // make_trivially_copyable_predicate


/// Stand-in mapped type for set-shaped containers built on top of maps.
struct unit
{
    friend constexpr bool operator==( unit, unit ) noexcept { return true; }
}; // struct unit


namespace detail
{
    [[ noreturn, gnu::cold ]] void throw_out_of_range( char const * msg );
    [[ noreturn, gnu::cold ]] void throw_length_error( char const * msg );
} // namespace detail

//------------------------------------------------------------------------------
} // namespace psi::coll
//------------------------------------------------------------------------------
