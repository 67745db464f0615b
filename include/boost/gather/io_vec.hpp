//
// Copyright (c) 2026 The Boost.Gather Authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_GATHER_IO_VEC_HPP
#define BOOST_GATHER_IO_VEC_HPP

#include <boost/gather/detail/config.hpp>
#include <boost/gather/buffer.hpp>

#include <cstddef>
#include <span>

namespace boost {
namespace gather {

/** A range of unconsumed bytes inside a @ref buffer.

    An io_vec is one element of the scatter-gather list
    handed to an I/O driver. It holds a copy of the buffer
    handle, so a text buffer stays alive for as long as an
    io_vec refers to it.

    @par Invariant
    `offset() + size() <= get_buffer().size()`
*/
class BOOST_GATHER_DECL io_vec
{
    gather::buffer b_;
    std::size_t off_ = 0;
    std::size_t len_ = 0;

public:
    /// Construct an empty io_vec.
    io_vec() = default;

    /// Construct an io_vec covering all of `b`.
    explicit
    io_vec(gather::buffer b) noexcept;

    /** Construct an io_vec covering part of `b`.

        @throws std::out_of_range if `offset + length`
        exceeds `b.size()`.
    */
    io_vec(
        gather::buffer b,
        std::size_t offset,
        std::size_t length);

    gather::buffer const&
    get_buffer() const noexcept
    {
        return b_;
    }

    std::size_t
    offset() const noexcept
    {
        return off_;
    }

    /// Return the number of bytes remaining.
    std::size_t
    size() const noexcept
    {
        return len_;
    }

    /// Return the bytes remaining.
    std::span<char const>
    data() const noexcept
    {
        return b_.span().subspan(off_, len_);
    }

    /** Return this io_vec with its first `n` bytes removed.

        @throws system::system_error with
        @ref error::invalid_shift if `n >= size()`.
    */
    io_vec
    shift(std::size_t n) const;
};

/// Return the sum of the sizes of a sequence of io_vecs.
BOOST_GATHER_DECL
std::size_t
total_size(std::span<io_vec const> v) noexcept;

} // gather
} // boost

#endif
