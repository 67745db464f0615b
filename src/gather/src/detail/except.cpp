//
// Copyright (c) 2026 The Boost.Gather Authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/gather/detail/except.hpp>
#include <boost/system/system_error.hpp>
#include <boost/throw_exception.hpp>
#include <stdexcept>

namespace boost::gather::detail {

void throw_logic_error(
    char const* what,
    source_location const& loc)
{
    throw_exception(std::logic_error(what), loc);
}

void throw_out_of_range(
    char const* what,
    source_location const& loc)
{
    throw_exception(std::out_of_range(what), loc);
}

void throw_error(
    error e,
    char const* op,
    source_location const& loc)
{
    throw_exception(system::system_error(
        make_error_code(e), op), loc);
}

} // namespace boost::gather::detail
