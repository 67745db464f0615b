//
// Copyright (c) 2026 The Boost.Gather Authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/gather/writer.hpp>
#include <boost/gather/error.hpp>
#include <boost/gather/detail/except.hpp>

#include <cstring>
#include <utility>

namespace boost::gather {

writer::
writer(std::size_t capacity)
    : buf_(new char[capacity])
    , cap_(capacity)
    , queue_(BOOST_GATHER_DEFAULT_QUEUE_CAPACITY)
{
}

writer::
~writer() = default;

void
writer::
write(std::string_view s)
{
    write(s.data(), s.size());
}

void
writer::
write(
    std::string_view s,
    std::size_t offset,
    std::size_t length)
{
    if(offset > s.size() || length > s.size() - offset)
        detail::throw_out_of_range(
            "writer::write: range exceeds input");
    write(s.data() + offset, length);
}

void
writer::
write(void const* data, std::size_t size)
{
    check_writable();
    if(size == 0)
        return;
    if(free_capacity() >= size)
    {
        std::memcpy(buf_.get() + write_pos_, data, size);
        write_pos_ += size;
        return;
    }
    flush_buffer();
    enqueue(io_vec(gather::buffer::text(std::string(
        static_cast<char const*>(data), size))), {});
}

void
writer::
write_char(char c)
{
    write(&c, 1);
}

void
writer::
schedule(gather::buffer b, cleanup f)
{
    check_writable();
    io_vec iov(std::move(b));
    if(iov.size() > 0)
        flush_buffer();
    enqueue(std::move(iov), std::move(f));
}

void
writer::
schedule(
    gather::buffer b,
    std::size_t offset,
    std::size_t length,
    cleanup f)
{
    check_writable();
    io_vec iov(std::move(b), offset, length);
    if(iov.size() > 0)
        flush_buffer();
    enqueue(std::move(iov), std::move(f));
}

void
writer::
schedule(
    gather::buffer b,
    std::size_t offset,
    cleanup f)
{
    check_writable();
    auto const n = b.size();
    if(offset > n)
        detail::throw_out_of_range(
            "writer::schedule: offset exceeds buffer");
    schedule(std::move(b), offset, n - offset, std::move(f));
}

void
writer::
close()
{
    closed_ = true;
    flush_buffer();
}

//------------------------------------------------

void
writer::
check_writable() const
{
    if(closed_)
        detail::throw_error(
            error::closed_writer, "writer");
}

// Queue the bytes written since the last flush
void
writer::
flush_buffer()
{
    auto const n = write_pos_ - scheduled_pos_;
    if(n == 0)
        return;
    enqueue(io_vec(gather::buffer::region(
        buf_.get(), cap_), scheduled_pos_, n), {});
    scheduled_pos_ = write_pos_;
}

void
writer::
enqueue(io_vec iov, cleanup f)
{
    auto const n = iov.size();
    if(n == 0)
    {
        // nothing will ever be borrowed
        if(f)
            f();
        return;
    }
    queue_.push_back(entry{std::move(iov), std::move(f)});
    queued_ += n;
}

void
writer::
mark_consumed(std::size_t n)
{
    if(n > presented_)
        detail::throw_error(
            error::overconsumption, "writer::mark_consumed");
    presented_ = 0;
    while(n > 0)
    {
        auto e = queue_.pop_front();
        if(! e)
            detail::throw_error(
                error::overconsumption, "writer::mark_consumed");
        auto const len = e->iov.size();
        if(len > n)
        {
            queue_.push_front(entry{
                e->iov.shift(n), std::move(e->fn)});
            queued_ -= n;
            break;
        }
        n -= len;
        queued_ -= len;
        if(e->fn)
            e->fn();
    }

    if(! queue_.empty())
        return;

    // Nothing refers to the internal buffer anymore, so
    // bytes still pending can move back to the start.
    auto const pending = write_pos_ - scheduled_pos_;
    if(pending > 0 && scheduled_pos_ > 0)
        std::memmove(buf_.get(), buf_.get() + scheduled_pos_, pending);
    scheduled_pos_ = 0;
    write_pos_ = pending;
}

} // namespace boost::gather
