////////////////////////////////////////////////////////////////////////////////
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
#include <omap/containers/errors.hpp>
//------------------------------------------------------------------------------
namespace omap
{
//------------------------------------------------------------------------------

namespace detail
{
    [[ noreturn, gnu::cold ]] void throw_key_not_found         ( char const * const msg ) { throw key_not_found         ( msg ); }
    [[ noreturn, gnu::cold ]] void throw_index_out_of_range    ( char const * const msg ) { throw index_out_of_range    ( msg ); }
    [[ noreturn, gnu::cold ]] void throw_internal_inconsistency( char const * const msg ) { throw internal_inconsistency( msg ); }
} // namespace detail

//------------------------------------------------------------------------------
} // namespace omap
//------------------------------------------------------------------------------
