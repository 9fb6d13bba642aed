////////////////////////////////////////////////////////////////////////////////
/// map_store - the key->value storage capability ordered_map delegates to.
///
/// Any associative container with unique keys and the usual node-map
/// interface qualifies: std::unordered_map (the default), std::map,
/// boost::unordered_map, boost::container::map...
/// ordered_map only ever uses find/end, emplace, erase(key), size, clear,
/// reserve (when present), == and (for construction from a plain map)
/// iteration; the store's own iteration order is never relied upon otherwise.
///
/// Copyright (c) 2026 The omap authors.
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

#include <concepts>
#include <cstddef>
#include <utility>
//------------------------------------------------------------------------------
namespace omap
{
//------------------------------------------------------------------------------

template <typename Store>
concept map_store = requires( Store & store, Store const & cstore, typename Store::key_type const & key, typename Store::mapped_type && value )
{
    typename Store::key_type;
    typename Store::mapped_type;

    {  cstore.find( key ) == cstore.end() } -> std::convertible_to<bool>;
    {  store .find( key )->second         } -> std::same_as<typename Store::mapped_type &>;
    {  store .emplace( key, std::move( value ) ).second } -> std::convertible_to<bool>;
    {  store .erase( key )                } -> std::convertible_to<std::size_t>;
    {  cstore.size()                      } -> std::convertible_to<std::size_t>;
       store .clear();
    {  cstore == cstore                   } -> std::convertible_to<bool>;
    {  cstore.begin()->first              } -> std::convertible_to<typename Store::key_type const &>;
};

/// Stores that can preallocate for a known number of entries (hash maps).
template <typename Store>
concept reservable_map_store = map_store<Store> && requires( Store & store, std::size_t const n ) { store.reserve( n ); };

//------------------------------------------------------------------------------
} // namespace omap
//------------------------------------------------------------------------------
