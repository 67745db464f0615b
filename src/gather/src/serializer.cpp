//
// Copyright (c) 2026 The Boost.Gather Authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/gather/serializer.hpp>
#include <boost/gather/detail/except.hpp>

namespace boost::gather {

action
serializer::
next()
{
    if(outstanding_)
        detail::throw_logic_error(
            "serializer::next: batch not consumed");

    if(w_.closed_)
        w_.yield_ = false;
    w_.flush_buffer();

    bool const idle = w_.queue_.empty();
    if(w_.closed_ && idle)
        return action::close;
    if(w_.yield_ || idle)
    {
        w_.yield_ = false;
        return action::yield;
    }

    batch_.clear();
    w_.queue_.for_each(
        [this](writer::entry const& e)
        {
            batch_.push_back(e.iov);
        });
    total_ = w_.queued_;
    w_.presented_ = total_;
    outstanding_ = true;
    return action::write;
}

action
serializer::
consume(std::size_t n)
{
    if(! outstanding_)
        detail::throw_logic_error(
            "serializer::consume: no batch outstanding");
    // a rejected count leaves the batch outstanding
    w_.mark_consumed(n);
    outstanding_ = false;
    batch_.clear();
    total_ = 0;
    return next();
}

//------------------------------------------------

std::string
serialize_to_string(writer& w)
{
    w.close();
    std::string s;
    serializer sr(w);
    auto a = sr.next();
    for(;;)
    {
        switch(a)
        {
        case action::close:
            return s;

        case action::yield:
            detail::throw_logic_error(
                "serialize_to_string: closed writer yielded");

        case action::write:
            break;
        }
        s.reserve(s.size() + sr.buffer_size());
        for(auto const& iov : sr.buffers())
            s.append(iov.data().data(), iov.size());
        a = sr.consume(sr.buffer_size());
    }
}

} // namespace boost::gather
