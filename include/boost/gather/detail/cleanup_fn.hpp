//
// Copyright (c) 2026 The Boost.Gather Authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_GATHER_DETAIL_CLEANUP_FN_HPP
#define BOOST_GATHER_DETAIL_CLEANUP_FN_HPP

#include <concepts>
#include <memory>
#include <type_traits>
#include <utility>

namespace boost::gather::detail {

/** A move-only, type-erased nullary callable.

    The target is held through a unique_ptr with a function
    pointer deleter, so it only has to be move constructible.
    This lets a cleanup own the storage it releases.
*/
class cleanup_fn
{
    std::unique_ptr<void, void(*)(void const*)> p_;
    void (*call_)(void*) = nullptr;

    template<class T>
    static
    void
    destroy(void const* p) noexcept
    {
        delete static_cast<T const*>(p);
    }

    template<class T>
    static
    void
    invoke(void* p)
    {
        (*static_cast<T*>(p))();
    }

public:
    cleanup_fn() noexcept
        : p_(nullptr, nullptr)
    {
    }

    template<class F>
        requires (! std::same_as<std::decay_t<F>, cleanup_fn>) &&
            std::invocable<std::decay_t<F>&>
    cleanup_fn(F&& f)
        : p_(new std::decay_t<F>(std::forward<F>(f)),
            &destroy<std::decay_t<F>>)
        , call_(&invoke<std::decay_t<F>>)
    {
    }

    cleanup_fn(cleanup_fn&&) noexcept = default;
    cleanup_fn& operator=(cleanup_fn&&) noexcept = default;

    explicit
    operator bool() const noexcept
    {
        return p_ != nullptr;
    }

    /// Invoke the target. The object must not be empty.
    void
    operator()()
    {
        call_(p_.get());
    }
};

} // namespace boost::gather::detail

#endif
