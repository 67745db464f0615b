//
// Copyright (c) 2026 The Boost.Gather Authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_GATHER_WRITER_HPP
#define BOOST_GATHER_WRITER_HPP

#include <boost/gather/detail/config.hpp>
#include <boost/gather/detail/cleanup_fn.hpp>
#include <boost/gather/detail/ring_queue.hpp>
#include <boost/gather/buffer.hpp>
#include <boost/gather/io_vec.hpp>
#include <boost/endian/conversion.hpp>

#include <concepts>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

namespace boost {
namespace gather {

class serializer;

/** An output buffer which accumulates writes for vectored I/O.

    Data reaches the writer in one of two ways:

    @li <em>Written</em> data is copied. Small writes land in
        an internal buffer; a write which does not fit is
        copied into its own owned text buffer instead.

    @li <em>Scheduled</em> data is not copied. The caller's
        @ref buffer is queued as-is, optionally together with
        a cleanup which runs once every byte of it has been
        consumed.

    Whichever path is taken, bytes are emitted in the order
    the calls were made. The queued data is drained by a
    @ref serializer, which presents it to an I/O driver and
    accounts for the bytes the driver reports as written.

    @par Buffer Lifetime
    A buffer passed to @ref schedule is borrowed from the
    time of the call until its cleanup runs. The caller must
    not modify or release it during that window.

    @par Thread Safety
    Distinct objects: Safe.@n
    Shared objects: Unsafe.

    @par Example
    @code
    writer w(1024);
    w.write("GET / HTTP/1.1\r\n\r\n");
    w.schedule(buffer::region(body.data(), body.size()),
        [&]{ pool.release(body); });
    w.close();
    @endcode
*/
class BOOST_GATHER_DECL writer
{
public:
    /** A single-shot action bound to a scheduled buffer.

        It is invoked exactly once, when the bytes of the
        entry it is attached to have been fully consumed.
        It must not throw. Any callable taking no arguments
        may be used, including move-only ones.
    */
    using cleanup = detail::cleanup_fn;

    /** Constructor.

        @param capacity The size in bytes of the internal copy
        buffer. It does not change over the writer's lifetime.
    */
    explicit
    writer(std::size_t capacity = BOOST_GATHER_DEFAULT_BUFFER_SIZE);

    writer(writer const&) = delete;
    writer& operator=(writer const&) = delete;

    /** Destructor.

        Cleanups of entries that were never fully consumed
        are destroyed without being invoked.
    */
    ~writer();

    /** Copy bytes into the output.

        If the bytes fit in the free space of the internal
        buffer they are appended there. Otherwise the pending
        part of the internal buffer is queued, followed by a
        private copy of `s`.

        @throws system::system_error with
        @ref error::closed_writer if the writer is closed.
    */
    void
    write(std::string_view s);

    /** Copy part of a string into the output.

        @throws std::out_of_range if `offset + length`
        exceeds `s.size()`.

        @throws system::system_error with
        @ref error::closed_writer if the writer is closed.
    */
    void
    write(
        std::string_view s,
        std::size_t offset,
        std::size_t length);

    /// Copy `size` bytes at `data` into the output.
    void
    write(void const* data, std::size_t size);

    /// Copy one character into the output.
    void
    write_char(char c);

    /// Copy an integer into the output, most significant byte first.
    template<std::integral T>
    void
    write_be(T v)
    {
        auto const x = endian::native_to_big(v);
        write(&x, sizeof(x));
    }

    /// Copy an integer into the output, least significant byte first.
    template<std::integral T>
    void
    write_le(T v)
    {
        auto const x = endian::native_to_little(v);
        write(&x, sizeof(x));
    }

    /** Queue a buffer for output without copying it.

        Any bytes pending in the internal buffer are queued
        first. An empty buffer queues nothing; its cleanup, if
        any, is invoked immediately.

        @param b The buffer to queue.
        @param f An optional cleanup to invoke once all of `b`
        has been consumed.

        @throws system::system_error with
        @ref error::closed_writer if the writer is closed.
    */
    void
    schedule(gather::buffer b, cleanup f = {});

    /** Queue part of a buffer for output without copying it.

        @throws std::out_of_range if `offset + length`
        exceeds `b.size()`.

        @throws system::system_error with
        @ref error::closed_writer if the writer is closed.
    */
    void
    schedule(
        gather::buffer b,
        std::size_t offset,
        std::size_t length,
        cleanup f = {});

    /** Queue the tail of a buffer, starting at `offset`.

        @throws std::out_of_range if `offset > b.size()`.

        @throws system::system_error with
        @ref error::closed_writer if the writer is closed.
    */
    void
    schedule(
        gather::buffer b,
        std::size_t offset,
        cleanup f = {});

    /// Queue a string for output, taking ownership of it.
    void
    schedule(std::string s)
    {
        schedule(gather::buffer::text(std::move(s)));
    }

    /** Stop accepting new output.

        Pending bytes are queued. Data already queued is still
        presented until it is consumed, after which the
        serializer reports @ref action::close. Closing an
        already closed writer has no effect.
    */
    void
    close();

    /** Ask the serializer to yield once.

        The next step of the serializer reports a yield even
        if data is ready. Nothing queued is discarded. The
        request is ignored once the writer is closed.
    */
    void
    request_yield() noexcept
    {
        yield_ = true;
    }

    bool
    is_closed() const noexcept
    {
        return closed_;
    }

    bool
    yield_requested() const noexcept
    {
        return yield_;
    }

    /// Return the size of the internal copy buffer.
    std::size_t
    buffer_capacity() const noexcept
    {
        return cap_;
    }

    /// Return the bytes that can still be copied into the internal buffer.
    std::size_t
    free_capacity() const noexcept
    {
        return cap_ - write_pos_;
    }

    /// Return the number of bytes written or scheduled but not yet consumed.
    std::size_t
    pending_bytes() const noexcept
    {
        return queued_ + (write_pos_ - scheduled_pos_);
    }

    bool
    has_pending_output() const noexcept
    {
        return pending_bytes() != 0;
    }

private:
    friend class serializer;

    struct entry
    {
        io_vec iov;
        cleanup fn;
    };

    void check_writable() const;
    void flush_buffer();
    void enqueue(io_vec iov, cleanup f);
    void mark_consumed(std::size_t n);

    std::unique_ptr<char[]> buf_;
    std::size_t cap_;
    std::size_t write_pos_ = 0;
    std::size_t scheduled_pos_ = 0;
    detail::ring_queue<entry> queue_;

    // bytes held by queue_
    std::size_t queued_ = 0;

    // total of the batch awaiting acknowledgement
    std::size_t presented_ = 0;

    bool closed_ = false;
    bool yield_ = false;
};

} // gather
} // boost

#endif
