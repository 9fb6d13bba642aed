////////////////////////////////////////////////////////////////////////////////
/// Compile-time configuration of the omap library.
///
/// OMAP_CHECK_INVARIANTS - verify that order and store agree in size after
///                         every mutating ordered_map operation (O(1)).
///                         Defaults to on in debug (!NDEBUG) builds.
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

#include <omap/containers/errors.hpp>

#include <boost/assert.hpp>
//------------------------------------------------------------------------------

#ifndef OMAP_CHECK_INVARIANTS
#   ifdef NDEBUG
#       define OMAP_CHECK_INVARIANTS 0
#   else
#       define OMAP_CHECK_INVARIANTS 1
#   endif
#endif // OMAP_CHECK_INVARIANTS

// Asserts in debug builds; in release builds with forced checks a violation
// is reported through omap::detail::throw_internal_inconsistency (errors.hpp).
#if !OMAP_CHECK_INVARIANTS
#   define OMAP_CHECK_INVARIANT( condition, msg ) static_cast<void>( 0 )
#elif defined( NDEBUG ) || defined( BOOST_DISABLE_ASSERTS )
#   define OMAP_CHECK_INVARIANT( condition, msg ) \
        do { if ( !( condition ) ) [[ unlikely ]] ::omap::detail::throw_internal_inconsistency( msg ); } while ( false )
#else
#   define OMAP_CHECK_INVARIANT( condition, msg ) BOOST_ASSERT_MSG( condition, msg )
#endif
//------------------------------------------------------------------------------
