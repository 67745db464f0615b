//
// Copyright (c) 2026 The Boost.Gather Authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_GATHER_SERIALIZER_HPP
#define BOOST_GATHER_SERIALIZER_HPP

#include <boost/gather/detail/config.hpp>
#include <boost/gather/io_vec.hpp>
#include <boost/gather/writer.hpp>

#include <cstddef>
#include <span>
#include <string>
#include <vector>

namespace boost {
namespace gather {

/// The outcome of one step of a @ref serializer.
enum class action
{
    /** Data is ready.

        Write the buffers returned by `serializer::buffers()`
        and report the number of bytes transferred with
        `serializer::consume()`.
    */
    write,

    /** Nothing to do right now.

        Wait for more output or for the descriptor to become
        writable, then call `serializer::next()` again.
    */
    yield,

    /// The writer is closed and fully drained. Stop stepping.
    close
};

/** Drives the output of a @ref writer.

    The serializer is polled by an I/O driver. Each call to
    @ref next reports one @ref action. After `action::write`
    the driver performs a vectored write of @ref buffers and
    must then call @ref consume exactly once with the number
    of bytes actually transferred, which may be less than
    offered. Unconsumed bytes are presented again, starting
    at the exact byte where the transfer stopped.

    @par Example
    @code
    serializer sr(w);
    for(auto a = sr.next(); a != action::close;)
    {
        if(a == action::yield)
        {
            wait_for_output();
            a = sr.next();
            continue;
        }
        auto n = do_writev(fd, sr.buffers());
        a = sr.consume(n);
    }
    @endcode

    The referenced writer must outlive the serializer.
*/
class BOOST_GATHER_DECL serializer
{
    writer& w_;
    std::vector<io_vec> batch_;
    std::size_t total_ = 0;
    bool outstanding_ = false;

public:
    explicit
    serializer(writer& w) noexcept
        : w_(w)
    {
    }

    serializer(serializer const&) = delete;
    serializer& operator=(serializer const&) = delete;

    /** Advance to the next step.

        Pending bytes in the writer's internal buffer are
        queued first, so they are part of any batch.

        @throws std::logic_error if a batch returned by an
        earlier step has not been consumed.
    */
    action
    next();

    /** Return the batch of the current write step.

        The io_vecs are in output order. They remain valid
        until @ref consume is called.
    */
    std::span<io_vec const>
    buffers() const noexcept
    {
        return batch_;
    }

    /// Return the total size of the current batch.
    std::size_t
    buffer_size() const noexcept
    {
        return total_;
    }

    /** Acknowledge the bytes written from the current batch.

        Fully written entries are removed and their cleanups
        invoked; a partially written entry remains at the front.

        @param n The number of bytes transferred, at most
        @ref buffer_size.

        @return The next step, as if by calling @ref next.

        @throws std::logic_error if no batch is outstanding.

        @throws system::system_error with
        @ref error::overconsumption if `n > buffer_size()`.
        The batch then remains outstanding and unchanged.
    */
    action
    consume(std::size_t n);
};

/** Close a writer and return all of its output.

    The writer is closed, then drained through a
    @ref serializer with every batch consumed in full.

    @throws std::logic_error if the serializer yields.
*/
BOOST_GATHER_DECL
std::string
serialize_to_string(writer& w);

} // gather
} // boost

#endif
