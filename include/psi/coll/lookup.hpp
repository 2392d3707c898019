////////////////////////////////////////////////////////////////////////////////
/// Shared lookup infrastructure for psi::coll hashed containers.
///
/// Provides:
///   - transparent_lookup: hasher and key-equality both opt into
///                         heterogeneous lookup (is_transparent tag)
///   - LookupType concept: constrains heterogeneous lookup key types
///
/// Used by index_map, index_set, small_map and the multimap family to merge
/// the traditional two-overload lookup pattern (non-template + constrained
/// template) into a single constrained template per function.
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

#include <concepts>
#include <type_traits>
//------------------------------------------------------------------------------
namespace psi::coll
{
//------------------------------------------------------------------------------

template <typename Hash, typename KeyEqual>
bool constexpr transparent_lookup
{
    requires{ typename Hash    ::is_transparent; } &&
    requires{ typename KeyEqual::is_transparent; }
};

/// LookupType: constrains which key types a hashed container's lookup
/// functions accept.
///
/// A type K is a valid lookup key if either:
///   (a) both the hasher and the key-equality functor are transparent,
///       allowing heterogeneous lookup with any hashable/comparable type, or
///   (b) K is implicitly convertible to key_type (this subsumes the
///       K == key_type case via identity conversion).
///
/// This replaces the usual pair of overloads:
///   iterator find( key_type const & );                               // always
///   template<class K> iterator find( K const & ) requires transparent; // conditional
/// with a single constrained template:
///   template <LookupType<transparent, key_type> K = key_type>
///   iterator find( K const & );
template <typename K, bool transparent, typename StoredKeyType>
concept LookupType =
    transparent ||
    std::convertible_to<K const &, StoredKeyType const &>;

//------------------------------------------------------------------------------
} // namespace psi::coll
//------------------------------------------------------------------------------
