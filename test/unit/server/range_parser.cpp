//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Test that header file is self-contained.
#include <audiostream/server/range_parser.hpp>
#include <audiostream/error.hpp>

#include "test_helpers.hpp"

namespace audiostream {

struct range_parser_test
{
    static
    void
    ok(
        std::uint64_t size,
        core::string_view s,
        std::uint64_t start,
        std::uint64_t end)
    {
        auto r = parse_range(size, s);
        if(! BOOST_TEST(r.has_value()))
            return;
        BOOST_TEST_EQ(r->start, start);
        BOOST_TEST_EQ(r->end, end);
    }

    static
    void
    bad(
        std::uint64_t size,
        core::string_view s)
    {
        auto r = parse_range(size, s);
        if(! BOOST_TEST(r.has_error()))
            return;
        BOOST_TEST(r.error() == error::unsatisfiable_range);
    }

    void
    testValid()
    {
        ok(10000, "bytes=0-499", 0, 499);
        ok(10000, "bytes=100-", 100, 9999);
        ok(10000, "bytes=9999-9999", 9999, 9999);
        ok(10000, "bytes=0-", 0, 9999);
        ok(4194304, "bytes=2097152-2097663", 2097152, 2097663);

        // missing start means zero, not a suffix
        ok(10000, "bytes=-500", 0, 500);
        ok(10000, "bytes=-", 0, 9999);

        // optional whitespace around the value
        ok(10000, "  bytes=5-10\t", 5, 10);
    }

    void
    testInvalid()
    {
        bad(10000, "");
        bad(10000, "bytes");
        bad(10000, "bytes=");
        bad(10000, "bytes=abc");
        bad(10000, "Bytes=0-1");
        bad(10000, "items=0-1");
        bad(10000, "bytes=0-1,5-6");
        bad(10000, "bytes= 0-1");
        bad(10000, "bytes=1-2-3");
        bad(10000, "bytes=10-5");
        bad(10000, "bytes=10000-");
        bad(10000, "bytes=0-10000");
        bad(4194304, "bytes=5000000-");
        bad(10000, "bytes=99999999999999999999-");
        bad(10000, "bytes=0-99999999999999999999");
        bad(0, "bytes=0-");
        bad(0, "bytes=-");
    }

    void
    run()
    {
        testValid();
        testInvalid();
    }
};

} // audiostream

TEST_SUITE(
    audiostream::range_parser_test,
    "audiostream.server.range_parser")
