//
// Copyright (c) 2026 The Boost.Gather Authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_GATHER_DETAIL_CONFIG_HPP
#define BOOST_GATHER_DETAIL_CONFIG_HPP

#include <boost/config.hpp>

#if defined(BOOST_GATHER_DYN_LINK) || defined(BOOST_ALL_DYN_LINK)
# if defined(BOOST_GATHER_SOURCE)
#  define BOOST_GATHER_DECL BOOST_SYMBOL_EXPORT
# else
#  define BOOST_GATHER_DECL BOOST_SYMBOL_IMPORT
# endif
#else
# define BOOST_GATHER_DECL
#endif

// Size of the internal copy buffer of a default-constructed writer
#ifndef BOOST_GATHER_DEFAULT_BUFFER_SIZE
#define BOOST_GATHER_DEFAULT_BUFFER_SIZE 4096
#endif

// Initial number of slots in a writer's scheduled-entry queue
#ifndef BOOST_GATHER_DEFAULT_QUEUE_CAPACITY
#define BOOST_GATHER_DEFAULT_QUEUE_CAPACITY 4
#endif

#endif
