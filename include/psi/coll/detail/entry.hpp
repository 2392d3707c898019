////////////////////////////////////////////////////////////////////////////////
/// Generic entry handle: the result of a single lookup which is either an
/// occupied entry (the key is present) or a vacant entry (it is not, and the
/// handle holds the key and whatever the container needs to insert it without
/// looking it up again).
///
/// The Occupied type must provide key(), get() and index(); the Vacant type
/// key(), index() and insert( mapped_type ) returning a reference to the
/// inserted value. The handle borrows its container: it is invalidated by any
/// other modification of the container.
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

#include <boost/assert.hpp>

#include <concepts>
#include <cstddef>
#include <utility>
#include <variant>
//------------------------------------------------------------------------------
namespace psi::coll::detail
{
//------------------------------------------------------------------------------

template <typename Occupied, typename Vacant>
class entry
{
public:
    using key_type    = typename Occupied::key_type;
    using mapped_type = typename Occupied::mapped_type;

    entry( Occupied const & occupied ) noexcept : state_{ std::in_place_index<0>, occupied } {}
    entry( Vacant         && vacant  )          : state_{ std::in_place_index<1>, std::move( vacant ) } {}

    [[ nodiscard ]] bool is_occupied() const noexcept { return state_.index() == 0; }
    [[ nodiscard ]] bool is_vacant  () const noexcept { return state_.index() == 1; }

    Occupied & occupied() noexcept { BOOST_ASSERT( is_occupied() ); return *std::get_if<0>( &state_ ); }
    Vacant   & vacant  () noexcept { BOOST_ASSERT( is_vacant  () ); return *std::get_if<1>( &state_ ); }

    key_type const & key() const noexcept
    {
        if ( is_occupied() )
            return std::get_if<0>( &state_ )->key();
        return std::get_if<1>( &state_ )->key();
    }

    /// Position the entry has (occupied) or will have (vacant).
    std::size_t index() const noexcept
    {
        if ( is_occupied() )
            return std::get_if<0>( &state_ )->index();
        return std::get_if<1>( &state_ )->index();
    }

    mapped_type & or_insert( mapped_type default_value )
    {
        if ( is_occupied() )
            return occupied().get();
        return vacant().insert( std::move( default_value ) );
    }

    template <typename F>
    mapped_type & or_insert_with( F && make_value )
    {
        if ( is_occupied() )
            return occupied().get();
        return vacant().insert( std::forward<F>( make_value )() );
    }

    template <typename F>
    mapped_type & or_insert_with_key( F && make_value )
    {
        if ( is_occupied() )
            return occupied().get();
        auto & v{ vacant() };
        return v.insert( std::forward<F>( make_value )( v.key() ) );
    }

    mapped_type & or_default() requires std::default_initializable<mapped_type>
    {
        if ( is_occupied() )
            return occupied().get();
        return vacant().insert( mapped_type{} );
    }

    template <typename F>
    entry & and_modify( F && modify ) &
    {
        if ( is_occupied() )
            std::forward<F>( modify )( occupied().get() );
        return *this;
    }

    template <typename F>
    entry && and_modify( F && modify ) &&
    {
        if ( is_occupied() )
            std::forward<F>( modify )( occupied().get() );
        return std::move( *this );
    }

private:
    std::variant<Occupied, Vacant> state_;
}; // class entry

//------------------------------------------------------------------------------
} // namespace psi::coll::detail
//------------------------------------------------------------------------------
