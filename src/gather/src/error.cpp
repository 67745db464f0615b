//
// Copyright (c) 2026 The Boost.Gather Authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/gather/error.hpp>

#include <string>

namespace boost::gather {

namespace {

class error_cat_type : public system::error_category
{
public:
    char const*
    name() const noexcept override
    {
        return "boost.gather";
    }

    std::string
    message(int ev) const override
    {
        switch(static_cast<error>(ev))
        {
        case error::closed_writer:
            return "write to closed writer";
        case error::invalid_shift:
            return "io_vec shifted past its end";
        case error::overconsumption:
            return "consumed more bytes than were presented";
        }
        return "unknown boost.gather error";
    }
};

} // (anon)

system::error_category const&
gather_category() noexcept
{
    static error_cat_type const cat{};
    return cat;
}

system::error_code
make_error_code(error e) noexcept
{
    return system::error_code(
        static_cast<int>(e), gather_category());
}

} // namespace boost::gather
