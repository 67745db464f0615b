//
// Copyright (c) 2026 The Boost.Gather Authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/gather/buffer.hpp>

#include <type_traits>

namespace boost::gather {

buffer
buffer::
text(std::string s)
{
    return text(std::make_shared<
        std::string const>(std::move(s)));
}

buffer
buffer::
text(std::shared_ptr<std::string const> s) noexcept
{
    return buffer(std::in_place_type<
        std::shared_ptr<std::string const>>, std::move(s));
}

buffer
buffer::
bytes(std::span<char> b) noexcept
{
    return buffer(std::in_place_type<std::span<char>>, b);
}

buffer
buffer::
region(void const* data, std::size_t size) noexcept
{
    return buffer(std::in_place_type<region_type>,
        region_type{data, size});
}

std::span<char const>
buffer::
span() const noexcept
{
    return std::visit(
        [](auto const& v) -> std::span<char const>
        {
            using T = std::decay_t<decltype(v)>;
            if constexpr(std::is_same_v<T, std::span<char>>)
            {
                return v;
            }
            else if constexpr(std::is_same_v<T, region_type>)
            {
                return { static_cast<char const*>(v.data), v.size };
            }
            else
            {
                if(! v)
                    return {};
                return { v->data(), v->size() };
            }
        }, v_);
}

} // namespace boost::gather
