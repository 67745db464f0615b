//
// Copyright (c) 2026 The Boost.Gather Authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_GATHER_HPP
#define BOOST_GATHER_HPP

#include <boost/gather/buffer.hpp>
#include <boost/gather/error.hpp>
#include <boost/gather/io_vec.hpp>
#include <boost/gather/serializer.hpp>
#include <boost/gather/writer.hpp>

#endif
