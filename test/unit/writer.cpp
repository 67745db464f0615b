//
// Copyright (c) 2026 The Boost.Gather Authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Test that header file is self-contained.
#include <boost/gather/writer.hpp>

#include <boost/gather/error.hpp>
#include <boost/gather/serializer.hpp>
#include <boost/system/system_error.hpp>

#include <cstdint>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

#include "test_suite.hpp"

namespace boost::gather {

struct writer_test
{
    static
    std::string_view
    view(io_vec const& v)
    {
        auto s = v.data();
        return std::string_view(s.data(), s.size());
    }

    template<class F>
    static
    void
    checkClosed(F const& f)
    {
        try
        {
            f();
            BOOST_ERROR("expected closed_writer");
        }
        catch(system::system_error const& e)
        {
            BOOST_TEST(e.code() == error::closed_writer);
        }
    }

    //--------------------------------------------

    void
    testConstruct()
    {
        writer w;
        BOOST_TEST_EQ(w.buffer_capacity(),
            std::size_t(BOOST_GATHER_DEFAULT_BUFFER_SIZE));
        BOOST_TEST_EQ(w.free_capacity(), w.buffer_capacity());
        BOOST_TEST_EQ(w.pending_bytes(), 0u);
        BOOST_TEST(! w.has_pending_output());
        BOOST_TEST(! w.is_closed());
        BOOST_TEST(! w.yield_requested());

        writer w2(16);
        BOOST_TEST_EQ(w2.buffer_capacity(), 16u);
    }

    void
    testWriteCopies()
    {
        writer w(16);
        std::string s = "abc";
        w.write(s);
        s[0] = 'z';
        BOOST_TEST_EQ(w.free_capacity(), 13u);
        BOOST_TEST_EQ(w.pending_bytes(), 3u);
        BOOST_TEST(w.has_pending_output());
        BOOST_TEST_EQ(serialize_to_string(w), "abc");
    }

    void
    testWriteOffsetLength()
    {
        writer w(16);
        w.write("hello world", 6, 5);
        w.write("hello world", 11, 0);
        BOOST_TEST_THROWS(
            w.write("hello", 3, 10), std::out_of_range);
        BOOST_TEST_THROWS(
            w.write("hello", 6, 0), std::out_of_range);
        BOOST_TEST_EQ(w.pending_bytes(), 5u);
        BOOST_TEST_EQ(serialize_to_string(w), "world");
    }

    void
    testWritePointer()
    {
        writer w(16);
        char const data[] = { 'x', '\0', 'y' };
        w.write(data, sizeof(data));
        BOOST_TEST_EQ(serialize_to_string(w),
            std::string_view(data, sizeof(data)));
    }

    void
    testWriteOverflow()
    {
        writer w(4);
        w.write("ab");

        // does not fit in the two free bytes
        std::string big = "cdefg";
        w.write(big);
        big[0] = '!';
        BOOST_TEST_EQ(w.free_capacity(), 2u);

        // fits again
        w.write("h");
        BOOST_TEST_EQ(w.free_capacity(), 1u);
        BOOST_TEST_EQ(w.pending_bytes(), 8u);

        serializer sr(w);
        BOOST_TEST(sr.next() == action::write);
        auto b = sr.buffers();
        BOOST_TEST_EQ(b.size(), 3u);
        BOOST_TEST_EQ(view(b[0]), "ab");
        BOOST_TEST(b[0].get_buffer().kind() == buffer_kind::region);
        BOOST_TEST_EQ(view(b[1]), "cdefg");
        BOOST_TEST(b[1].get_buffer().kind() == buffer_kind::text);
        BOOST_TEST_EQ(view(b[2]), "h");
    }

    void
    testWriteChar()
    {
        writer w(2);
        w.write_char('a');
        w.write_char('b');
        w.write_char('c');
        BOOST_TEST_EQ(serialize_to_string(w), "abc");
    }

    void
    testWriteIntegers()
    {
        writer w(16);
        w.write_be(std::uint16_t(0x0102));
        w.write_le(std::uint32_t(0x01020304));
        w.write_be(std::int8_t(-1));
        BOOST_TEST_EQ(serialize_to_string(w),
            std::string("\x01\x02\x04\x03\x02\x01\xff", 7));
    }

    void
    testScheduleZeroCopy()
    {
        char data[] = "payload";
        writer w(16);
        w.schedule(buffer::region(data, 7));
        BOOST_TEST_EQ(w.pending_bytes(), 7u);

        serializer sr(w);
        BOOST_TEST(sr.next() == action::write);
        BOOST_TEST_EQ(sr.buffers().size(), 1u);
        BOOST_TEST(sr.buffers()[0].data().data() == data);
    }

    void
    testScheduleBytes()
    {
        char data[] = { 'q', 'r', 's' };
        int released = 0;
        writer w(16);
        w.schedule(buffer::bytes(data), [&]{ ++released; });
        BOOST_TEST_EQ(serialize_to_string(w), "qrs");
        BOOST_TEST_EQ(released, 1);
    }

    void
    testScheduleOrdering()
    {
        writer w(16);
        w.write("a");
        w.schedule(buffer::text("b"));
        w.write("c");

        serializer sr(w);
        BOOST_TEST(sr.next() == action::write);
        auto b = sr.buffers();
        BOOST_TEST_EQ(b.size(), 3u);
        BOOST_TEST_EQ(view(b[0]), "a");
        BOOST_TEST_EQ(view(b[1]), "b");
        BOOST_TEST_EQ(view(b[2]), "c");
    }

    void
    testScheduleOffsetLength()
    {
        writer w(16);
        w.schedule(buffer::text("0123456789"), 2, 3);
        BOOST_TEST_THROWS(
            w.schedule(buffer::text("0123456789"), 8, 5),
            std::out_of_range);
        BOOST_TEST_EQ(w.pending_bytes(), 3u);
        BOOST_TEST_EQ(serialize_to_string(w), "234");
    }

    void
    testScheduleOffset()
    {
        int released = 0;
        writer w(16);
        w.schedule(buffer::text("0123456789"), 7,
            [&]{ ++released; });

        // the tail is empty
        w.schedule(buffer::text("abc"), 3,
            [&]{ ++released; });
        BOOST_TEST_EQ(released, 1);

        BOOST_TEST_THROWS(
            w.schedule(buffer::text("abc"), 4),
            std::out_of_range);
        BOOST_TEST_EQ(w.pending_bytes(), 3u);
        BOOST_TEST_EQ(serialize_to_string(w), "789");
        BOOST_TEST_EQ(released, 2);
    }

    void
    testMoveOnlyCleanup()
    {
        auto block = std::make_unique<char[]>(3);
        std::memcpy(block.get(), "mno", 3);
        char const* const p = block.get();
        bool released = false;

        writer w(16);
        w.schedule(buffer::region(p, 3),
            [b = std::move(block), &released]() mutable
            {
                b.reset();
                released = true;
            });
        BOOST_TEST(! released);
        BOOST_TEST_EQ(serialize_to_string(w), "mno");
        BOOST_TEST(released);
    }

    void
    testScheduleString()
    {
        writer w(16);
        std::string s(64, 'o');
        auto const p = s.data();
        w.schedule(std::move(s));

        serializer sr(w);
        BOOST_TEST(sr.next() == action::write);
        BOOST_TEST(sr.buffers()[0].get_buffer().kind() == buffer_kind::text);
        BOOST_TEST_EQ(sr.buffers()[0].size(), 64u);
        // moved, not copied
        BOOST_TEST(sr.buffers()[0].data().data() == p);
    }

    void
    testZeroLength()
    {
        writer w(16);
        int released = 0;
        w.write("a");
        w.write("");
        w.write("xyz", 1, 0);
        w.schedule(buffer::text(""), [&]{ ++released; });
        w.schedule(buffer::text("abc"), 3, 0, [&]{ ++released; });
        w.schedule(buffer::region(nullptr, 0));
        w.write("b");

        // zero length cleanups have nothing to wait for
        BOOST_TEST_EQ(released, 2);

        // and the pending bytes were never split
        serializer sr(w);
        BOOST_TEST(sr.next() == action::write);
        BOOST_TEST_EQ(sr.buffers().size(), 1u);
        BOOST_TEST_EQ(view(sr.buffers()[0]), "ab");
    }

    void
    testClose()
    {
        writer w(16);
        w.write("x");
        w.close();
        BOOST_TEST(w.is_closed());
        BOOST_TEST_EQ(w.pending_bytes(), 1u);

        checkClosed([&]{ w.write("y"); });
        checkClosed([&]{ w.write(""); });
        checkClosed([&]{ w.write_char('y'); });
        checkClosed([&]{ w.write_be(std::uint32_t(1)); });
        checkClosed([&]{ w.schedule(buffer::text("y")); });
        checkClosed([&]{ w.schedule(std::string("y")); });
        checkClosed([&]{ w.schedule(buffer::text("y"), 5); });

        int released = 0;
        checkClosed([&]
            {
                w.schedule(buffer::text("y"), [&]{ ++released; });
            });
        BOOST_TEST_EQ(released, 0);

        // closing twice is harmless
        w.close();
        BOOST_TEST_EQ(serialize_to_string(w), "x");
    }

    void
    testRequestYield()
    {
        writer w(16);
        w.request_yield();
        BOOST_TEST(w.yield_requested());
        w.write("abc");
        BOOST_TEST(w.yield_requested());
        BOOST_TEST_EQ(w.pending_bytes(), 3u);
    }

    void
    testPendingBytes()
    {
        writer w(16);
        w.write("abc");
        w.schedule(buffer::text("defg"));
        BOOST_TEST_EQ(w.pending_bytes(), 7u);

        serializer sr(w);
        BOOST_TEST(sr.next() == action::write);
        BOOST_TEST(sr.consume(5) == action::write);
        BOOST_TEST_EQ(w.pending_bytes(), 2u);
        BOOST_TEST(sr.consume(2) == action::yield);
        BOOST_TEST_EQ(w.pending_bytes(), 0u);
        BOOST_TEST(! w.has_pending_output());
    }

    void
    testBufferRecycled()
    {
        writer w(4);
        w.write("abcd");
        BOOST_TEST_EQ(w.free_capacity(), 0u);

        serializer sr(w);
        BOOST_TEST(sr.next() == action::write);
        BOOST_TEST_EQ(w.free_capacity(), 0u);
        BOOST_TEST(sr.consume(3) == action::write);
        BOOST_TEST_EQ(w.free_capacity(), 0u);
        BOOST_TEST(sr.consume(1) == action::yield);
        BOOST_TEST_EQ(w.free_capacity(), 4u);

        // the space is reused by the copy path
        w.write("efgh");
        BOOST_TEST(sr.next() == action::write);
        BOOST_TEST_EQ(sr.buffers().size(), 1u);
        BOOST_TEST_EQ(view(sr.buffers()[0]), "efgh");
    }

    void
    testPendingKeptOnRecycle()
    {
        writer w(8);
        w.write("abcd");

        serializer sr(w);
        BOOST_TEST(sr.next() == action::write);

        // written while the batch is in flight
        w.write("ef");
        BOOST_TEST_EQ(w.free_capacity(), 2u);

        BOOST_TEST(sr.consume(4) == action::write);
        BOOST_TEST_EQ(w.free_capacity(), 6u);
        BOOST_TEST_EQ(sr.buffers().size(), 1u);
        BOOST_TEST_EQ(view(sr.buffers()[0]), "ef");
        BOOST_TEST_EQ(sr.buffers()[0].offset(), 0u);
    }

    void
    testDestroyWithoutConsuming()
    {
        int released = 0;
        auto token = std::make_shared<int>(0);
        std::weak_ptr<int> observer = token;
        {
            writer w(16);
            w.schedule(buffer::text("abc"), [&]{ ++released; });
            w.schedule(buffer::text("def"),
                [t = std::move(token), &released]{ ++released; });
            w.close();
            BOOST_TEST(! observer.expired());
        }
        BOOST_TEST_EQ(released, 0);

        // the cleanup itself was destroyed
        BOOST_TEST(observer.expired());
    }

    void
    run()
    {
        testConstruct();
        testWriteCopies();
        testWriteOffsetLength();
        testWritePointer();
        testWriteOverflow();
        testWriteChar();
        testWriteIntegers();
        testScheduleZeroCopy();
        testScheduleBytes();
        testScheduleOrdering();
        testScheduleOffsetLength();
        testScheduleOffset();
        testMoveOnlyCleanup();
        testScheduleString();
        testZeroLength();
        testClose();
        testRequestYield();
        testPendingBytes();
        testBufferRecycled();
        testPendingKeptOnRecycle();
        testDestroyWithoutConsuming();
    }
};

TEST_SUITE(
    writer_test,
    "boost.gather.writer");

} // namespace boost::gather
