////////////////////////////////////////////////////////////////////////////////
/// Exception types reported by omap containers.
///
/// key_not_found and index_out_of_range are ordinary lookup failures (both are
/// std::out_of_range so generic at()-style handlers catch them).
/// internal_inconsistency signals a broken order/store bijection: a defect,
/// never a user-facing condition.
///
/// The throwing helpers are out-of-line and cold so that the (inlined)
/// container fast paths carry no exception construction code.
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

#include <stdexcept>
//------------------------------------------------------------------------------
namespace omap
{
//------------------------------------------------------------------------------

struct key_not_found          : std::out_of_range { using std::out_of_range::out_of_range; };
struct index_out_of_range     : std::out_of_range { using std::out_of_range::out_of_range; };
struct internal_inconsistency : std::logic_error  { using std::logic_error ::logic_error ; };

namespace detail
{
    [[ noreturn, gnu::cold ]] void throw_key_not_found         ( char const * msg );
    [[ noreturn, gnu::cold ]] void throw_index_out_of_range    ( char const * msg );
    [[ noreturn, gnu::cold ]] void throw_internal_inconsistency( char const * msg );
} // namespace detail

//------------------------------------------------------------------------------
} // namespace omap
//------------------------------------------------------------------------------
