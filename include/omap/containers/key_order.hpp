////////////////////////////////////////////////////////////////////////////////
/// omap::key_order - duplicate-free ordered sequence of keys
///
/// The positional backbone of ordered_map: defines iteration order and the
/// meaning of integer positions. It knows nothing about mapped values; keeping
/// it in sync with the key->value store is the owner's job (uniqueness is
/// asserted, not enforced, by the modifiers).
///
/// Positional conventions shared by all users of this class:
///   - a position (size_type) is a zero-based offset, always in range;
///   - an index (difference_type) may be negative and then counts from the
///     end (-1 = last, -size() = first), see wrap();
///   - an insertion index is clamped rather than rejected, see
///     insertion_position().
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

#include <boost/assert.hpp>
#include <boost/sort/pdqsort/pdqsort.hpp>

#include <algorithm>
#include <cstddef>
#include <functional>
#include <iterator>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace omap
{
//------------------------------------------------------------------------------

template <typename Key, typename KeyContainer = std::vector<Key>>
class key_order
{
    static_assert( std::is_same_v<Key, typename KeyContainer::value_type>, "KeyContainer::value_type must be Key" );

public:
    using key_type               = Key;
    using container_type         = KeyContainer;
    using size_type              = typename KeyContainer::size_type;
    using difference_type        = std::ptrdiff_t;
    using const_iterator         = typename KeyContainer::const_iterator;
    using const_reverse_iterator = std::reverse_iterator<const_iterator>;

    static size_type constexpr npos{ static_cast<size_type>( -1 ) };

    key_order() = default;

    // keys must already be duplicate-free
    explicit key_order( KeyContainer keys ) noexcept( std::is_nothrow_move_constructible_v<KeyContainer> )
        : keys_{ std::move( keys ) }
    {
        BOOST_ASSERT_MSG( unique(), "duplicate keys" );
    }

    key_order( key_order const & ) = default;
    key_order( key_order && )      = default;

    key_order & operator=( key_order const & ) = default;
    key_order & operator=( key_order && )      = default;

    //--------------------------------------------------------------------------
    // Iterators (read-only: the sequence may only be permuted through the
    // dedicated member functions)
    //--------------------------------------------------------------------------
    const_iterator begin () const noexcept { return keys_.begin(); }
    const_iterator end   () const noexcept { return keys_.end  (); }
    const_iterator cbegin() const noexcept { return keys_.begin(); }
    const_iterator cend  () const noexcept { return keys_.end  (); }

    const_reverse_iterator rbegin() const noexcept { return const_reverse_iterator{ end  () }; }
    const_reverse_iterator rend  () const noexcept { return const_reverse_iterator{ begin() }; }

    //--------------------------------------------------------------------------
    // Capacity & element access
    //--------------------------------------------------------------------------
    [[nodiscard]] bool            empty() const noexcept { return keys_.empty(); }
    [[nodiscard]] size_type       size () const noexcept { return keys_.size (); }
    [[nodiscard]] difference_type ssize() const noexcept { return static_cast<difference_type>( keys_.size() ); }

    [[nodiscard]] key_type const & operator[]( size_type const pos ) const noexcept { BOOST_ASSERT( pos < size() ); return keys_[ pos ]; }
    [[nodiscard]] key_type const & front() const noexcept { BOOST_ASSERT( !empty() ); return keys_.front(); }
    [[nodiscard]] key_type const & back () const noexcept { BOOST_ASSERT( !empty() ); return keys_.back (); }

    [[nodiscard]] container_type const & keys() const noexcept { return keys_; }

    //--------------------------------------------------------------------------
    // Lookup (linear)
    //--------------------------------------------------------------------------
    [[nodiscard]] size_type find( key_type const & key ) const noexcept
    {
        auto const it{ std::find( keys_.begin(), keys_.end(), key ) };
        return ( it == keys_.end() ) ? npos : static_cast<size_type>( it - keys_.begin() );
    }

    [[nodiscard]] bool contains( key_type const & key ) const noexcept { return find( key ) != npos; }

    // O(n^2), for diagnostics only
    [[nodiscard]] bool unique() const noexcept
    {
        for ( auto it{ keys_.begin() }; it != keys_.end(); ++it )
        {
            if ( std::find( std::next( it ), keys_.end(), *it ) != keys_.end() )
                return false;
        }
        return true;
    }

    //--------------------------------------------------------------------------
    // Index normalization
    //--------------------------------------------------------------------------
    [[nodiscard]] difference_type wrap( difference_type const index ) const noexcept
    {
        return ( index < 0 ) ? ssize() + index : index;
    }

    [[nodiscard]] std::optional<size_type> position( difference_type const index ) const noexcept
    {
        auto const wrapped{ wrap( index ) };
        if ( wrapped < 0 || wrapped >= ssize() )
            return std::nullopt;
        return static_cast<size_type>( wrapped );
    }

    /// Where an element inserted at index should land in a sequence of the
    /// given length: negative indices count from the end, the result is then
    /// clamped to [0, length] (the front resp. an append).
    [[nodiscard]] static size_type insertion_position( difference_type index, size_type const length ) noexcept
    {
        auto const slength{ static_cast<difference_type>( length ) };
        if ( index < 0 )
            index += slength;
        return static_cast<size_type>( std::clamp<difference_type>( index, 0, slength ) );
    }

    [[nodiscard]] size_type insertion_position( difference_type const index ) const noexcept { return insertion_position( index, size() ); }

    //--------------------------------------------------------------------------
    // Modifiers
    //--------------------------------------------------------------------------
    template <typename K>
    void push_back( K && key ) { keys_.emplace_back( std::forward<K>( key ) ); }

    template <typename K>
    void insert( size_type const pos, K && key )
    {
        BOOST_ASSERT( pos <= size() );
        keys_.emplace( keys_.begin() + static_cast<difference_type>( pos ), std::forward<K>( key ) );
    }

    /// Removes and returns the key at pos.
    key_type erase_at( size_type const pos )
    {
        BOOST_ASSERT( pos < size() );
        auto const it{ keys_.begin() + static_cast<difference_type>( pos ) };
        key_type key{ std::move( *it ) };
        keys_.erase( it );
        return key;
    }

    bool erase( key_type const & key )
    {
        auto const pos{ find( key ) };
        if ( pos == npos )
            return false;
        keys_.erase( keys_.begin() + static_cast<difference_type>( pos ) );
        return true;
    }

    void pop_back() noexcept { BOOST_ASSERT( !empty() ); keys_.pop_back(); }

    /// Moves the key at position from so that it ends up at position to of the
    /// resulting sequence (the one element shorter sequence with the key taken
    /// out, plus the key reinserted at to). Everything in between shifts by
    /// one; no element is created or destroyed.
    void relocate( size_type const from, size_type const to ) noexcept
    {
        BOOST_ASSERT( from < size() );
        BOOST_ASSERT( to   < size() );
        auto const first{ keys_.begin() };
        auto const f    { static_cast<difference_type>( from ) };
        auto const t    { static_cast<difference_type>( to   ) };
        if ( from < to )
            std::rotate( first + f, first + f + 1, first + t + 1 );
        else
        if ( from > to )
            std::rotate( first + t, first + f, first + f + 1 );
    }

    void clear() noexcept { keys_.clear(); }

    // no-op for containers without capacity (e.g. std::deque)
    void reserve( size_type const n )
    {
        if constexpr ( requires { keys_.reserve( n ); } )
            keys_.reserve( n );
    }

    void swap( key_order & other ) noexcept { using std::swap; swap( keys_, other.keys_ ); }
    friend void swap( key_order & a, key_order & b ) noexcept { a.swap( b ); }

    //--------------------------------------------------------------------------
    // Permutation
    //--------------------------------------------------------------------------
    // keys are unique so an unstable sort is as good as a stable one here
    template <typename Compare = std::less<>>
    void sort( Compare comp = {} ) { boost::sort::pdqsort( keys_.begin(), keys_.end(), comp ); }

    template <typename Compare>
    void stable_sort( Compare comp ) { std::stable_sort( keys_.begin(), keys_.end(), comp ); }

    void reverse() noexcept { std::reverse( keys_.begin(), keys_.end() ); }

    //--------------------------------------------------------------------------
    // Comparison
    //--------------------------------------------------------------------------
    friend bool operator==( key_order const & a, key_order const & b ) { return a.keys_ == b.keys_; }

private:
    KeyContainer keys_;
}; // class key_order

//------------------------------------------------------------------------------
} // namespace omap
//------------------------------------------------------------------------------
