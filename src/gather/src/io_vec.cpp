//
// Copyright (c) 2026 The Boost.Gather Authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/gather/io_vec.hpp>
#include <boost/gather/error.hpp>
#include <boost/gather/detail/except.hpp>

#include <utility>

namespace boost::gather {

io_vec::
io_vec(gather::buffer b) noexcept
    : b_(std::move(b))
    , len_(b_.size())
{
}

io_vec::
io_vec(
    gather::buffer b,
    std::size_t offset,
    std::size_t length)
    : b_(std::move(b))
    , off_(offset)
    , len_(length)
{
    auto const n = b_.size();
    if(off_ > n || len_ > n - off_)
        detail::throw_out_of_range(
            "io_vec: range exceeds buffer");
}

io_vec
io_vec::
shift(std::size_t n) const
{
    if(n >= len_)
        detail::throw_error(
            error::invalid_shift, "io_vec::shift");
    io_vec v(*this);
    v.off_ += n;
    v.len_ -= n;
    return v;
}

std::size_t
total_size(std::span<io_vec const> v) noexcept
{
    std::size_t n = 0;
    for(auto const& iov : v)
        n += iov.size();
    return n;
}

} // namespace boost::gather
