//
// Copyright (c) 2026 The Boost.Gather Authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/gather.hpp>
#include <boost/system/error_code.hpp>

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <sys/uio.h>
#include <unistd.h>

namespace gather = boost::gather;

namespace {

constexpr std::size_t max_buffers = 16;

boost::system::error_code
make_err(int errn) noexcept
{
    return boost::system::error_code(errn, boost::system::system_category());
}

// Write as much of the batch as the descriptor accepts.
// EAGAIN is reported as zero bytes written.
boost::system::error_code
write_some(int fd, gather::serializer const& sr, std::size_t& n)
{
    iovec iovecs[max_buffers];
    auto const bufs = sr.buffers();
    auto const count = std::min(bufs.size(), max_buffers);
    for(std::size_t i = 0; i < count; ++i)
    {
        auto const d = bufs[i].data();
        iovecs[i].iov_base = const_cast<char*>(d.data());
        iovecs[i].iov_len = d.size();
    }

    n = 0;
    for(;;)
    {
        ssize_t rv = ::writev(fd, iovecs, static_cast<int>(count));
        if(rv >= 0)
        {
            n = static_cast<std::size_t>(rv);
            return {};
        }
        if(errno == EINTR)
            continue;
        if(errno == EAGAIN || errno == EWOULDBLOCK)
            return {};
        return make_err(errno);
    }
}

boost::system::error_code
wait_writable(int fd)
{
    pollfd p{};
    p.fd = fd;
    p.events = POLLOUT;
    for(;;)
    {
        if(::poll(&p, 1, -1) >= 0)
            return {};
        if(errno != EINTR)
            return make_err(errno);
    }
}

// Puts a descriptor in non-blocking mode and restores its
// original flags on destruction. The flags belong to the open
// file description, which the parent process shares.
class nonblocking_guard
{
    int fd_;
    int flags_;

public:
    explicit
    nonblocking_guard(int fd) noexcept
        : fd_(fd)
        , flags_(::fcntl(fd, F_GETFL))
    {
        if (flags_ >= 0 && !(flags_ & O_NONBLOCK))
            ::fcntl(fd_, F_SETFL, flags_ | O_NONBLOCK);
    }

    nonblocking_guard(nonblocking_guard const&) = delete;
    nonblocking_guard& operator=(nonblocking_guard const&) = delete;

    ~nonblocking_guard()
    {
        if (flags_ >= 0 && !(flags_ & O_NONBLOCK))
            ::fcntl(fd_, F_SETFL, flags_);
    }
};

} // (anon)

int main(int argc, char* argv[])
{
    if (argc != 3)
    {
        std::cerr <<
            "Usage: writev_driver <records> <payload-size>\n"
            "Example:\n"
            "    writev_driver 1000 8192 > out.bin\n";
        return EXIT_FAILURE;
    }

    int records = std::atoi(argv[1]);
    if (records <= 0)
    {
        std::cerr << "Invalid records: " << argv[1] << "\n";
        return EXIT_FAILURE;
    }

    int payload_size = std::atoi(argv[2]);
    if (payload_size <= 0)
    {
        std::cerr << "Invalid payload-size: " << argv[2] << "\n";
        return EXIT_FAILURE;
    }

    int const fd = STDOUT_FILENO;
    nonblocking_guard nb(fd);

    // Payloads are scheduled without copying and stay
    // borrowed until their cleanup runs.
    std::vector<std::string> payloads(static_cast<std::size_t>(records));
    int released = 0;

    gather::writer w;
    for (int i = 0; i < records; ++i)
    {
        auto& p = payloads[static_cast<std::size_t>(i)];
        p.assign(static_cast<std::size_t>(payload_size),
            static_cast<char>('a' + i % 26));

        // Small framing header goes through the copy path
        w.write_be(static_cast<std::uint32_t>(i));
        w.write_be(static_cast<std::uint32_t>(p.size()));
        w.schedule(
            gather::buffer::region(p.data(), p.size()),
            [&p, &released]
            {
                p.clear();
                p.shrink_to_fit();
                ++released;
            });
    }
    w.close();

    gather::serializer sr(w);
    std::size_t total = 0;
    auto a = sr.next();
    while (a != gather::action::close)
    {
        if (a == gather::action::yield)
        {
            if (auto ec = wait_writable(fd))
            {
                std::cerr << "poll failed: " << ec.message() << "\n";
                return EXIT_FAILURE;
            }
            a = sr.next();
            continue;
        }

        std::size_t n = 0;
        if (auto ec = write_some(fd, sr, n))
        {
            std::cerr << "writev failed: " << ec.message() << "\n";
            return EXIT_FAILURE;
        }
        if (n == 0)
        {
            // Descriptor is full; report nothing written once it drains
            if (auto ec = wait_writable(fd))
            {
                std::cerr << "poll failed: " << ec.message() << "\n";
                return EXIT_FAILURE;
            }
        }
        total += n;
        a = sr.consume(n);
    }

    std::cerr << "wrote " << total << " bytes, released "
              << released << " payloads\n";
    return EXIT_SUCCESS;
}
