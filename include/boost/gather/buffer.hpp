//
// Copyright (c) 2026 The Boost.Gather Authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_GATHER_BUFFER_HPP
#define BOOST_GATHER_BUFFER_HPP

#include <boost/gather/detail/config.hpp>

#include <cstddef>
#include <memory>
#include <span>
#include <string>
#include <variant>

namespace boost {
namespace gather {

/// The kinds of storage a @ref buffer can refer to.
enum class buffer_kind
{
    /// Immutable text owned by the buffer.
    text,

    /// A mutable byte block borrowed from the caller.
    bytes,

    /// A raw memory region borrowed from the caller.
    region
};

/** A reference to one of three kinds of byte storage.

    A buffer is either owned immutable text, or a borrowed
    byte block or memory region whose lifetime is managed by
    whoever created it. Copies of a text buffer share the
    same string. Whatever the kind, the contents can be
    borrowed as a flat span of bytes with @ref span.

    @par Example
    @code
    std::array<char, 4> block{'a', 'b', 'c', 'd'};

    auto t = buffer::text("hello");            // owned
    auto b = buffer::bytes(block);             // borrowed
    auto r = buffer::region(block.data(), 2);  // borrowed
    @endcode
*/
class BOOST_GATHER_DECL buffer
{
    struct region_type
    {
        void const* data;
        std::size_t size;
    };

    std::variant<
        std::shared_ptr<std::string const>,
        std::span<char>,
        region_type> v_;

    template<class T>
    explicit
    buffer(std::in_place_type_t<T> tag, T t) noexcept
        : v_(tag, std::move(t))
    {
    }

public:
    /// Construct an empty memory region.
    buffer() noexcept
        : v_(region_type{nullptr, 0})
    {
    }

    /// Return a buffer owning the given text.
    static
    buffer
    text(std::string s);

    /// Return a buffer sharing ownership of the given text.
    static
    buffer
    text(std::shared_ptr<std::string const> s) noexcept;

    /** Return a buffer borrowing a mutable byte block.

        The block must remain valid, and unmodified, for as
        long as any copy of the buffer is in use.
    */
    static
    buffer
    bytes(std::span<char> b) noexcept;

    /** Return a buffer borrowing a raw memory region.

        The region must remain valid, and unmodified, for as
        long as any copy of the buffer is in use.
    */
    static
    buffer
    region(void const* data, std::size_t size) noexcept;

    /// Return which kind of storage is referenced.
    buffer_kind
    kind() const noexcept
    {
        return static_cast<buffer_kind>(v_.index());
    }

    /// Return the referenced bytes.
    std::span<char const>
    span() const noexcept;

    /// Return the number of referenced bytes.
    std::size_t
    size() const noexcept
    {
        return span().size();
    }
};

} // gather
} // boost

#endif
