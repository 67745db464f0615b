//
// Copyright (c) 2026 The Boost.Gather Authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_GATHER_DETAIL_EXCEPT_HPP
#define BOOST_GATHER_DETAIL_EXCEPT_HPP

#include <boost/gather/detail/config.hpp>
#include <boost/gather/error.hpp>
#include <boost/assert/source_location.hpp>

namespace boost {
namespace gather {
namespace detail {

/** Throw a `std::logic_error`.

    Used for violations of sequencing preconditions, such
    as stepping a serializer whose batch was never consumed.
*/
BOOST_GATHER_DECL void BOOST_NORETURN throw_logic_error(
    char const* what,
    source_location const& loc = BOOST_CURRENT_LOCATION);

/** Throw a `std::out_of_range`.

    Used when an offset and length do not fit inside
    the buffer they refer to.
*/
BOOST_GATHER_DECL void BOOST_NORETURN throw_out_of_range(
    char const* what,
    source_location const& loc = BOOST_CURRENT_LOCATION);

/** Throw a `system::system_error` holding a library error.

    The thrown code compares equal to `e`, and its
    `what()` begins with the operation name.

    @param e The condition that was detected.
    @param op Name of the operation that detected it.
    @param loc Source location for diagnostics.
*/
BOOST_GATHER_DECL void BOOST_NORETURN throw_error(
    error e,
    char const* op,
    source_location const& loc = BOOST_CURRENT_LOCATION);

} // detail
} // gather
} // boost

#endif
