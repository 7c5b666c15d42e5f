//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Test that header file is self-contained.
#include <audiostream/storage/memory_store.hpp>
#include <audiostream/error.hpp>

#include "test_helpers.hpp"

namespace audiostream {

struct memory_store_test
{
    static
    std::string
    drain(byte_source& src, std::size_t step)
    {
        std::string out;
        std::string buf(step, '\0');
        for(;;)
        {
            system::error_code ec;
            auto n = src.read(&buf[0], buf.size(), ec);
            BOOST_TEST_NOT(ec);
            if(n == 0)
                break;
            out.append(buf.data(), n);
        }
        return out;
    }

    void
    testMetadata()
    {
        memory_store ms;
        ms.put("a.mp3", "0123456789");
        ms.put("b.bin", "xyz", std::string("audio/x-test"));

        auto md = ms.get_metadata("a.mp3");
        if(BOOST_TEST(md.has_value()))
        {
            BOOST_TEST_EQ(md->size, 10u);
            BOOST_TEST_NOT(md->content_type.has_value());
        }

        md = ms.get_metadata("b.bin");
        if(BOOST_TEST(md.has_value()))
            BOOST_TEST_EQ(*md->content_type, "audio/x-test");

        md = ms.get_metadata("missing.mp3");
        if(BOOST_TEST(md.has_error()))
            BOOST_TEST(md.error() == error::object_not_found);
    }

    void
    testRange()
    {
        memory_store ms;
        ms.put("a.mp3", "0123456789");

        auto src = ms.get_range("a.mp3", { 2, 6 });
        if(BOOST_TEST(src.has_value()))
            BOOST_TEST_EQ(drain(**src, 2), "23456");

        src = ms.get_range("a.mp3", { 0, 9 });
        if(BOOST_TEST(src.has_value()))
            BOOST_TEST_EQ(drain(**src, 64), "0123456789");

        src = ms.get_range("a.mp3", { 5, 10 });
        if(BOOST_TEST(src.has_error()))
            BOOST_TEST(src.error() == error::unsatisfiable_range);

        src = ms.get_range("nope", { 0, 0 });
        if(BOOST_TEST(src.has_error()))
            BOOST_TEST(src.error() == error::object_not_found);
    }

    void
    testReplace()
    {
        memory_store ms;
        ms.put("a.mp3", "old");
        auto src = ms.get_range("a.mp3", { 0, 2 });

        // an open source keeps its bytes
        ms.put("a.mp3", "newer");
        BOOST_TEST_EQ(ms.get_metadata("a.mp3")->size, 5u);
        if(BOOST_TEST(src.has_value()))
            BOOST_TEST_EQ(drain(**src, 8), "old");

        BOOST_TEST(ms.erase("a.mp3"));
        BOOST_TEST_NOT(ms.erase("a.mp3"));
        BOOST_TEST(ms.get_metadata("a.mp3").has_error());
    }

    void
    run()
    {
        testMetadata();
        testRange();
        testReplace();
    }
};

} // audiostream

TEST_SUITE(
    audiostream::memory_store_test,
    "audiostream.storage.memory_store")
