//
// Copyright (c) 2026 The Boost.Gather Authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_GATHER_ERROR_HPP
#define BOOST_GATHER_ERROR_HPP

#include <boost/gather/detail/config.hpp>
#include <boost/system/error_code.hpp>

#include <type_traits>

namespace boost {
namespace gather {

/** Error codes reported by writers and serializers.

    These are thrown as `system::system_error`; compare the
    caught code against the enumerators directly:

    @code
    catch(system::system_error const& e)
    {
        if(e.code() == error::closed_writer)
            ...
    }
    @endcode
*/
enum class error
{
    /// A write or schedule was attempted after `close()`.
    closed_writer = 1,

    /// An io_vec was shifted by at least its remaining length.
    invalid_shift,

    /** More bytes were consumed than the last batch presented.

        The writer's byte accounting is no longer meaningful
        after this error and the writer must be discarded.
    */
    overconsumption
};

/// Return the error category used by @ref error.
BOOST_GATHER_DECL
system::error_category const&
gather_category() noexcept;

/// Return an error code for the given @ref error.
BOOST_GATHER_DECL
system::error_code
make_error_code(error e) noexcept;

} // gather

namespace system {

template<>
struct is_error_code_enum<::boost::gather::error>
    : std::true_type
{
};

} // system
} // boost

#endif
