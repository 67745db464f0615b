//
// Copyright (c) 2026 The Boost.Gather Authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_GATHER_DETAIL_RING_QUEUE_HPP
#define BOOST_GATHER_DETAIL_RING_QUEUE_HPP

#include <boost/gather/detail/except.hpp>

#include <algorithm>
#include <cstddef>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

namespace boost::gather::detail {

//------------------------------------------------

/** A growable FIFO queue stored in a contiguous array.

    Live elements occupy the slots `[front_, back_)`. When
    `push_back` finds no free slot at the end, the live
    elements are first slid down to index zero; only when
    they already start at zero is the storage doubled.
    Pushes are amortized O(1).

    Unlike a general deque, @ref push_front is only valid
    directly after a @ref pop_front. This is enough to put
    back a partially consumed front element, which is the
    only thing it is used for.

    @tparam T The element type. Must be default constructible
    and move assignable.
*/
template<class T>
class ring_queue
{
    std::vector<T> v_;
    std::size_t front_ = 0;
    std::size_t back_ = 0;
    bool popped_ = false;

public:
    explicit
    ring_queue(std::size_t capacity)
        : v_(capacity > 0 ? capacity : 1)
    {
    }

    ring_queue(ring_queue const&) = delete;
    ring_queue& operator=(ring_queue const&) = delete;

    bool
    empty() const noexcept
    {
        return front_ == back_;
    }

    std::size_t
    size() const noexcept
    {
        return back_ - front_;
    }

    std::size_t
    capacity() const noexcept
    {
        return v_.size();
    }

    void
    push_back(T t)
    {
        ensure_space();
        v_[back_++] = std::move(t);
        popped_ = false;
    }

    /** Remove and return the front element.

        @return The element, or an empty optional if the
        queue is empty.
    */
    std::optional<T>
    pop_front()
    {
        if(empty())
            return std::nullopt;
        popped_ = true;
        return std::optional<T>(std::move(v_[front_++]));
    }

    /** Return an element to the front of the queue.

        @par Preconditions
        The previous mutating call on this queue was a
        successful @ref pop_front.

        @throws std::logic_error if the precondition is violated.
    */
    void
    push_front(T t)
    {
        if(! popped_ || front_ == 0)
            throw_logic_error(
                "ring_queue::push_front: not preceded by pop_front");
        v_[--front_] = std::move(t);
        popped_ = false;
    }

    /// Invoke `f` on each element, front to back.
    template<class F>
    void
    for_each(F&& f) const
    {
        for(auto i = front_; i != back_; ++i)
            f(v_[i]);
    }

    /** Return `f` applied to each element, front to back.

        The queue is not modified.
    */
    template<class F>
    auto
    snapshot(F f) const
        -> std::vector<std::decay_t<
            std::invoke_result_t<F&, T const&>>>
    {
        std::vector<std::decay_t<
            std::invoke_result_t<F&, T const&>>> result;
        result.reserve(size());
        for_each([&](T const& t)
            {
                result.push_back(f(t));
            });
        return result;
    }

private:
    void
    ensure_space()
    {
        if(back_ < v_.size())
            return;
        auto const n = size();
        if(front_ > 0)
        {
            std::move(
                v_.begin() + front_,
                v_.begin() + back_,
                v_.begin());
        }
        else
        {
            std::vector<T> v(v_.size() * 2);
            std::move(
                v_.begin(),
                v_.begin() + back_,
                v.begin());
            v_.swap(v);
        }
        front_ = 0;
        back_ = n;
    }
};

} // namespace boost::gather::detail

#endif
