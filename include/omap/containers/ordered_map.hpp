////////////////////////////////////////////////////////////////////////////////
/// omap::ordered_map - hash (or any map_store) map with a deterministic,
/// reorderable entry order and list-like positional access
///
/// Architecture:
///   ordered_map owns a key_order (the sequence of keys, defining iteration
///   and positions) and a map_store (key -> mapped value, std::unordered_map
///   by default). Every mutation decides the effect on the order first (new,
///   moved or removed key) and then applies the matching change to the store,
///   undoing the order change if the store throws. The two always hold the
///   same key set, each key exactly once in the order.
///
/// Complexity:
///   - by-key lookup, set/try_emplace/operator[]:  store lookup (O(1) avg.)
///   - erase(key), insert_at, position_of:         O(n) (linear order scan)
///   - at_position:                                O(1) + store lookup
///   - erase_at:                                   O(n) (order shift)
///
/// Positional indices are signed: negative values count from the end (-1 is
/// the last entry). Reads (at_position) throw index_out_of_range and removals
/// (erase_at) return false for indices outside the order; insertions
/// (insert_at) clamp to the front/back.
///
/// Iterators are positional (map + index): they stay valid across
/// value-only modifications but not across insertions/removals/reordering.
/// Dereferencing looks the mapped value up in the store at that moment.
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

#include "errors.hpp"
#include "key_order.hpp"
#include "map_store.hpp"

#include <omap/config.hpp>

#include <boost/assert.hpp>

#include <algorithm>
#include <compare>
#include <concepts>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <ranges>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace omap
{
//------------------------------------------------------------------------------

template
<
    typename Key,
    typename T,
    typename Store        = std::unordered_map<Key, T>,
    typename KeyContainer = std::vector<Key>
>
requires map_store<Store>
class ordered_map
{
    static_assert( std::is_same_v<Key, typename Store::key_type   >, "Store::key_type must be Key"  );
    static_assert( std::is_same_v<T,   typename Store::mapped_type>, "Store::mapped_type must be T" );

public:
    //--------------------------------------------------------------------------
    // Member types
    //--------------------------------------------------------------------------
    using key_type           = Key;
    using mapped_type        = T;
    using value_type         = std::pair<key_type, mapped_type>;
    using reference          = std::pair<key_type const &, mapped_type       &>;
    using const_reference    = std::pair<key_type const &, mapped_type const &>;
    using store_type         = Store;
    using key_container_type = KeyContainer;
    using order_type         = key_order<Key, KeyContainer>;
    using size_type          = typename order_type::size_type;
    using difference_type    = typename order_type::difference_type;

    static size_type constexpr npos{ order_type::npos };

    //--------------------------------------------------------------------------
    // Iterator
    //--------------------------------------------------------------------------
private:
    template <bool IsConst>
    class iterator_impl
    {
    public:
        using iterator_concept  = std::random_access_iterator_tag;
        using iterator_category = std::random_access_iterator_tag;
        using value_type        = ordered_map::value_type;
        using difference_type   = ordered_map::difference_type;
        using reference         = std::conditional_t<IsConst, ordered_map::const_reference, ordered_map::reference>;

        struct arrow_proxy {
            reference ref;
            constexpr reference       * operator->()       noexcept { return &ref; }
            constexpr reference const * operator->() const noexcept { return &ref; }
        };
        using pointer = arrow_proxy;

    private:
        friend ordered_map;
        friend iterator_impl<!IsConst>;

        using map_ptr = std::conditional_t<IsConst, ordered_map const *, ordered_map *>;

        map_ptr         map_{ nullptr };
        difference_type idx_{ 0 };

        constexpr iterator_impl( map_ptr const m, difference_type const i ) noexcept : map_{ m }, idx_{ i } {}

    public:
        constexpr iterator_impl() noexcept = default;
        constexpr iterator_impl( iterator_impl const & ) noexcept = default;
        constexpr iterator_impl & operator=( iterator_impl const & ) noexcept = default;

        constexpr iterator_impl( iterator_impl<!IsConst> const & other ) noexcept requires IsConst
            : map_{ other.map_ }, idx_{ other.idx_ } {}

        reference operator*() const {
            auto const & key{ map_->order_[ static_cast<size_type>( idx_ ) ] };
            return { key, map_->mapped( key ) };
        }

        arrow_proxy operator->() const { return { **this }; }

        reference operator[]( difference_type const n ) const { return *( *this + n ); }

        constexpr iterator_impl & operator++(     ) noexcept { ++idx_; return *this; }
        constexpr iterator_impl   operator++( int ) noexcept { auto tmp{ *this }; ++idx_; return tmp; }
        constexpr iterator_impl & operator--(     ) noexcept { --idx_; return *this; }
        constexpr iterator_impl   operator--( int ) noexcept { auto tmp{ *this }; --idx_; return tmp; }

        constexpr iterator_impl & operator+=( difference_type const n ) noexcept { idx_ += n; return *this; }
        constexpr iterator_impl & operator-=( difference_type const n ) noexcept { idx_ -= n; return *this; }

        friend constexpr iterator_impl operator+( iterator_impl it, difference_type const n ) noexcept { return { it.map_, it.idx_ + n }; }
        friend constexpr iterator_impl operator+( difference_type const n, iterator_impl it ) noexcept { return { it.map_, it.idx_ + n }; }
        friend constexpr iterator_impl operator-( iterator_impl it, difference_type const n ) noexcept { return { it.map_, it.idx_ - n }; }

        friend constexpr difference_type operator-( iterator_impl const & a, iterator_impl const & b ) noexcept { return a.idx_ - b.idx_; }

        friend constexpr bool operator==( iterator_impl const & a, iterator_impl const & b ) noexcept { return a.idx_ == b.idx_; }
        friend constexpr auto operator<=>( iterator_impl const & a, iterator_impl const & b ) noexcept { return a.idx_ <=> b.idx_; }
    }; // iterator_impl

public:
    using iterator               = iterator_impl<false>;
    using const_iterator         = iterator_impl<true>;
    using reverse_iterator       = std::reverse_iterator<iterator>;
    using const_reverse_iterator = std::reverse_iterator<const_iterator>;

    //--------------------------------------------------------------------------
    // Constructors
    //--------------------------------------------------------------------------
    ordered_map() = default;

    /// Adopts a plain map: the order is a snapshot of the map's own iteration
    /// order (unspecified for hash maps).
    explicit ordered_map( store_type plain )
        : store_{ std::move( plain ) }
    {
        order_.reserve( static_cast<size_type>( store_.size() ) );
        for ( auto const & entry : store_ )
            order_.push_back( entry.first );
        check_sizes();
    }

    /// Copies a plain map of a different type, in that map's iteration order.
    /// Source keys that convert to the same key_type collapse into one entry
    /// (first position, last value).
    template <map_store PlainMap>
    requires( !std::is_same_v<PlainMap, store_type> && std::is_convertible_v<typename PlainMap::key_type const &, key_type> && std::is_convertible_v<typename PlainMap::mapped_type const &, mapped_type> )
    explicit ordered_map( PlainMap const & plain )
    {
        reserve( static_cast<size_type>( plain.size() ) );
        for ( auto const & [key, value] : plain )
            set( static_cast<key_type>( key ), value );
    }

    /// Builds from a sequence of (key, value) pairs, in sequence order. A key
    /// repeated in the sequence keeps the position of its first occurrence
    /// and the value of its last one.
    template <std::input_iterator InputIt>
    ordered_map( InputIt first, InputIt const last )
    {
        if constexpr ( std::forward_iterator<InputIt> )
            reserve( static_cast<size_type>( std::distance( first, last ) ) );
        for ( ; first != last; ++first )
        {
            auto && [key, value]{ *first };
            set( key, value );
        }
    }

    ordered_map( std::initializer_list<value_type> const il )
        : ordered_map( il.begin(), il.end() ) {}

    ordered_map( ordered_map const & ) = default;
    ordered_map( ordered_map && )      = default;

    ordered_map & operator=( ordered_map const & ) = default;
    ordered_map & operator=( ordered_map && )      = default;

    ordered_map & operator=( std::initializer_list<value_type> const il ) {
        ordered_map tmp( il );
        swap( tmp );
        return *this;
    }

    //--------------------------------------------------------------------------
    // Iterators
    //--------------------------------------------------------------------------
    iterator       begin()       noexcept { return { this, 0 }; }
    const_iterator begin() const noexcept { return { this, 0 }; }
    iterator       end  ()       noexcept { return { this, order_.ssize() }; }
    const_iterator end  () const noexcept { return { this, order_.ssize() }; }

    const_iterator cbegin() const noexcept { return begin(); }
    const_iterator cend  () const noexcept { return end  (); }

    reverse_iterator       rbegin()       noexcept { return reverse_iterator      { end  () }; }
    const_reverse_iterator rbegin() const noexcept { return const_reverse_iterator{ end  () }; }
    reverse_iterator       rend  ()       noexcept { return reverse_iterator      { begin() }; }
    const_reverse_iterator rend  () const noexcept { return const_reverse_iterator{ begin() }; }

    //--------------------------------------------------------------------------
    // Ordered views and snapshots
    //--------------------------------------------------------------------------
    /// Lazy (key, value) reference pairs in order; values are looked up when
    /// an element is dereferenced.
    auto pairs()       noexcept { return std::ranges::subrange( begin(), end() ); }
    auto pairs() const noexcept { return std::ranges::subrange( begin(), end() ); }

    /// Lazy mapped values in order; restartable, each pass follows the
    /// current order.
    auto values()       { return std::views::transform( order_.keys(), [ this ]( key_type const & key ) -> mapped_type       & { return mapped( key ); } ); }
    auto values() const { return std::views::transform( order_.keys(), [ this ]( key_type const & key ) -> mapped_type const & { return mapped( key ); } ); }

    /// Snapshot copy of the keys in order.
    [[nodiscard]] key_container_type keys() const { return order_.keys(); }

    /// Snapshot copy of all entries in order.
    [[nodiscard]] std::vector<value_type> to_vector() const
    {
        std::vector<value_type> result;
        result.reserve( order_.size() );
        for ( auto const & key : order_ )
            result.emplace_back( key, mapped( key ) );
        return result;
    }

    [[nodiscard]] order_type const & order() const noexcept { return order_; }

    //--------------------------------------------------------------------------
    // Capacity
    //--------------------------------------------------------------------------
    [[nodiscard]] bool      empty() const noexcept { return order_.empty(); }
    [[nodiscard]] size_type size () const noexcept { return order_.size (); }

    void reserve( size_type const n )
    {
        order_.reserve( n );
        if constexpr ( reservable_map_store<store_type> )
            store_.reserve( n );
    }

    //--------------------------------------------------------------------------
    // Lookup by key
    //--------------------------------------------------------------------------
    mapped_type & at( key_type const & key )
    {
        auto const hit{ store_.find( key ) };
        if ( hit == store_.end() ) [[ unlikely ]]
            detail::throw_key_not_found( "omap::ordered_map::at" );
        return hit->second;
    }
    mapped_type const & at( key_type const & key ) const
    {
        auto const hit{ store_.find( key ) };
        if ( hit == store_.end() ) [[ unlikely ]]
            detail::throw_key_not_found( "omap::ordered_map::at" );
        return hit->second;
    }

    mapped_type       * find( key_type const & key )       { auto const hit{ store_.find( key ) }; return ( hit != store_.end() ) ? &hit->second : nullptr; }
    mapped_type const * find( key_type const & key ) const { auto const hit{ store_.find( key ) }; return ( hit != store_.end() ) ? &hit->second : nullptr; }

    [[nodiscard]] bool      contains( key_type const & key ) const { return store_.find( key ) != store_.end(); }
    [[nodiscard]] size_type count   ( key_type const & key ) const { return contains( key ) ? 1 : 0; }

    /// Position of key in the order or npos (linear scan).
    [[nodiscard]] size_type position_of( key_type const & key ) const noexcept { return order_.find( key ); }

    //--------------------------------------------------------------------------
    // Lookup by position
    //--------------------------------------------------------------------------
    reference at_position( difference_type const index )
    {
        auto const & key{ order_[ checked_position( index ) ] };
        return { key, mapped( key ) };
    }
    const_reference at_position( difference_type const index ) const
    {
        auto const & key{ order_[ checked_position( index ) ] };
        return { key, mapped( key ) };
    }

    //--------------------------------------------------------------------------
    // Insertion
    //--------------------------------------------------------------------------
    mapped_type & operator[]( key_type const & key ) { return try_emplace(            key   ).first; }
    mapped_type & operator[]( key_type &&      key ) { return try_emplace( std::move( key ) ).first; }

    /// Appends key with a value constructed from args unless already present
    /// (in which case nothing changes). Returns the mapped value and whether
    /// an insertion took place.
    template <typename K, typename... Args>
    std::pair<mapped_type &, bool> try_emplace( K && key, Args &&... args )
    {
        auto const hit{ store_.find( key ) };
        if ( hit != store_.end() )
            return { hit->second, false };
        auto & value{ append( std::forward<K>( key ), std::forward<Args>( args )... ) };
        return { value, true };
    }

    /// Upsert: a new key is appended, an existing key keeps its position and
    /// gets its value overwritten. Returns true if the key was new.
    template <typename K, typename M>
    bool set( K && key, M && value )
    {
        auto const hit{ store_.find( key ) };
        if ( hit != store_.end() )
        {
            hit->second = std::forward<M>( value );
            return false;
        }
        append( std::forward<K>( key ), std::forward<M>( value ) );
        return true;
    }

    /// Positional upsert: puts key at index (after taking out its current
    /// occurrence, if any, against which shortened order a negative index is
    /// then resolved) and stores value for it. Out of range indices clamp to
    /// the front resp. the back. Returns the resulting position of key.
    template <typename K, typename M>
    size_type insert_at( difference_type const index, K && key, M && value )
    {
        auto const hit { store_.find( key ) };
        auto const from{ order_.find( key ) };
        bool const stored { hit  != store_.end() };
        bool const ordered{ from != npos         };
        if ( stored != ordered ) [[ unlikely ]]
        {
            detail::throw_internal_inconsistency
            (
                stored
                    ? "omap::ordered_map::insert_at: stored key has no position"
                    : "omap::ordered_map::insert_at: positioned key is not stored"
            );
        }

        if ( stored )
        {
            auto const to{ order_type::insertion_position( index, order_.size() - 1 ) };
            hit->second = std::forward<M>( value );
            order_.relocate( from, to );
            return to;
        }

        auto const to{ order_.insertion_position( index ) };
        order_.insert( to, key );
        try {
            store_.emplace( std::forward<K>( key ), std::forward<M>( value ) );
        } catch ( ... ) {
            order_.erase_at( to );
            throw;
        }
        check_sizes();
        return to;
    }

    //--------------------------------------------------------------------------
    // Removal
    //--------------------------------------------------------------------------
    /// Returns false (and changes nothing) if key is not present.
    bool erase( key_type const & key )
    {
        auto const pos{ order_.find( key ) };
        if ( pos == npos )
            return false;
        remove_position( pos );
        return true;
    }

    /// Returns false (and changes nothing) if index, after wrapping negative
    /// values, is outside the order.
    bool erase_at( difference_type const index )
    {
        auto const pos{ order_.position( index ) };
        if ( !pos )
            return false;
        remove_position( *pos );
        return true;
    }

    void clear() noexcept
    {
        order_.clear();
        store_.clear();
    }

    void swap( ordered_map & other ) noexcept
    {
        using std::swap;
        swap( order_, other.order_ );
        swap( store_, other.store_ );
    }

    friend void swap( ordered_map & a, ordered_map & b ) noexcept { a.swap( b ); }

    //--------------------------------------------------------------------------
    // Reordering (values and the key set stay untouched)
    //--------------------------------------------------------------------------
    template <typename Compare = std::less<>>
    void sort_by_key( Compare comp = {} ) { order_.sort( std::move( comp ) ); }

    /// Stable sort with a comparator over const_reference (key, value) pairs,
    /// e.g. to order by value.
    template <typename Compare>
    void sort_by( Compare comp )
    {
        order_.stable_sort
        (
            [ this, &comp ]( key_type const & a, key_type const & b ) {
                return comp( const_reference{ a, mapped( a ) }, const_reference{ b, mapped( b ) } );
            }
        );
    }

    void reverse() noexcept { order_.reverse(); }

    //--------------------------------------------------------------------------
    // Comparison
    //--------------------------------------------------------------------------
    // Content equality (as for plain maps): the order is not compared.
    friend bool operator==( ordered_map const & a, ordered_map const & b ) { return a.store_ == b.store_; }
    friend bool operator==( ordered_map const & a, store_type  const & b ) { return a.store_ == b;        }

    /// Order-sensitive equality: same keys at the same positions, equal values.
    [[nodiscard]] bool same_sequence( ordered_map const & other ) const
    {
        return ( order_ == other.order_ ) && std::ranges::equal( values(), other.values() );
    }

    //--------------------------------------------------------------------------
    // Diagnostics
    //--------------------------------------------------------------------------
    /// Full order/store bijection check (O(n^2) because of the duplicate
    /// check); for tests and debugging.
    [[nodiscard]] bool consistent() const
    {
        if ( order_.size() != static_cast<size_type>( store_.size() ) )
            return false;
        if ( !std::ranges::all_of( order_, [ this ]( key_type const & key ) { return store_.find( key ) != store_.end(); } ) )
            return false;
        return order_.unique();
    }

    //--------------------------------------------------------------------------
    // Private helpers
    //--------------------------------------------------------------------------
private:
    mapped_type & mapped( key_type const & key )
    {
        auto const hit{ store_.find( key ) };
        BOOST_ASSERT_MSG( hit != store_.end(), "ordered key missing from the store" );
        return hit->second;
    }
    mapped_type const & mapped( key_type const & key ) const
    {
        auto const hit{ store_.find( key ) };
        BOOST_ASSERT_MSG( hit != store_.end(), "ordered key missing from the store" );
        return hit->second;
    }

    size_type checked_position( difference_type const index ) const
    {
        auto const pos{ order_.position( index ) };
        if ( !pos ) [[ unlikely ]]
            detail::throw_index_out_of_range( "omap::ordered_map::at_position" );
        return *pos;
    }

    // key must not be present
    template <typename K, typename... Args>
    mapped_type & append( K && key, Args &&... args )
    {
        order_.push_back( key );
        mapped_type * p_value;
        try {
            auto const result{ store_.emplace( std::forward<K>( key ), mapped_type( std::forward<Args>( args )... ) ) };
            BOOST_ASSERT_MSG( result.second, "appended key already stored" );
            p_value = &result.first->second;
        } catch ( ... ) {
            order_.pop_back();
            throw;
        }
        check_sizes();
        return *p_value;
    }

    void remove_position( size_type const pos )
    {
        auto const key{ order_.erase_at( pos ) };
        BOOST_VERIFY( store_.erase( key ) == 1 );
        check_sizes();
    }

    void check_sizes() const
    {
        OMAP_CHECK_INVARIANT( order_.size() == static_cast<size_type>( store_.size() ), "omap::ordered_map: order/store size mismatch" );
    }

    //--------------------------------------------------------------------------
    // Data members
    //--------------------------------------------------------------------------
    order_type order_;
    store_type store_;
}; // class ordered_map

//------------------------------------------------------------------------------
// Deduction guides
//------------------------------------------------------------------------------

template <typename Key, typename T>
ordered_map( std::initializer_list<std::pair<Key, T>> ) -> ordered_map<Key, T>;

template <std::input_iterator InputIt>
ordered_map( InputIt, InputIt )
    -> ordered_map<std::remove_const_t<typename std::iterator_traits<InputIt>::value_type::first_type>,
                   typename std::iterator_traits<InputIt>::value_type::second_type>;

//------------------------------------------------------------------------------
} // namespace omap
//------------------------------------------------------------------------------
