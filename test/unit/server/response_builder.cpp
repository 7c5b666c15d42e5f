//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Test that header file is self-contained.
#include <audiostream/server/response_builder.hpp>

#include "test_helpers.hpp"

namespace audiostream {

struct response_builder_test
{
    static constexpr std::uint64_t MB = 1024 * 1024;

    void
    testCachePolicy()
    {
        BOOST_TEST(select_cache_policy(true, 20 * MB, true) ==
            cache_policy::short_revalidate);
        BOOST_TEST(select_cache_policy(true, 10 * MB + 1, true) ==
            cache_policy::short_revalidate);
        BOOST_TEST(select_cache_policy(true, 10 * MB, true) ==
            cache_policy::immutable);
        BOOST_TEST(select_cache_policy(true, 4 * MB, true) ==
            cache_policy::immutable);
        BOOST_TEST(select_cache_policy(true, 20 * MB, false) ==
            cache_policy::short_revalidate);
        BOOST_TEST(select_cache_policy(true, 100, false) ==
            cache_policy::medium_revalidate);
        BOOST_TEST(select_cache_policy(false, 4 * MB, true) ==
            cache_policy::immutable);
        BOOST_TEST(select_cache_policy(false, 20 * MB, true) ==
            cache_policy::immutable);
        BOOST_TEST(select_cache_policy(false, 4 * MB, false) ==
            cache_policy::medium_revalidate);

        BOOST_TEST_EQ(to_string(cache_policy::short_revalidate),
            "public, max-age=7200, stale-while-revalidate=3600");
        BOOST_TEST_EQ(to_string(cache_policy::medium_revalidate),
            "public, max-age=86400, stale-while-revalidate=3600");
        BOOST_TEST_EQ(to_string(cache_policy::immutable),
            "public, max-age=31536000, immutable");
    }

    void
    testNextRange()
    {
        auto n = next_range({ 0, 1048576 }, 4 * MB, true);
        if(BOOST_TEST(n.has_value()))
        {
            BOOST_TEST_EQ(n->start, 1048577u);
            BOOST_TEST_EQ(n->end, 2097153u);
        }

        // clamped at the end
        n = next_range({ 0, 2999 }, 5000, true);
        if(BOOST_TEST(n.has_value()))
        {
            BOOST_TEST_EQ(n->start, 3000u);
            BOOST_TEST_EQ(n->end, 4999u);
        }

        BOOST_TEST_NOT(next_range({ 4000, 4999 }, 5000, true));
        BOOST_TEST_NOT(next_range({ 0, 4999 }, 5000, false));
        BOOST_TEST_NOT(next_range({ 0, 99 }, 5000, false));
    }

    void
    testFirstChunk()
    {
        // 4 MB, no Range header
        response_builder rb;
        auto rd = rb.build({ 0, 1048576 }, 4194304, true, true,
            std::nullopt, "intro.mp3");
        auto const& h = rd.headers;

        BOOST_TEST_EQ(rd.status, 206u);
        BOOST_TEST(rd.partial);
        BOOST_TEST_EQ(rd.content_length, 1048577u);
        BOOST_TEST_EQ(h.value_or("Content-Type"), "audio/mpeg");
        BOOST_TEST_EQ(h.value_or("Content-Length"), "1048577");
        BOOST_TEST_EQ(h.value_or("Accept-Ranges"), "bytes");
        BOOST_TEST_EQ(h.value_or("Cache-Control"),
            "public, max-age=31536000, immutable");
        BOOST_TEST_EQ(h.value_or("Content-Range"),
            "bytes 0-1048576/4194304");
        BOOST_TEST_EQ(h.value_or("Access-Control-Allow-Origin"), "*");
        BOOST_TEST_EQ(h.value_or("X-Content-Type-Options"), "nosniff");
        BOOST_TEST_EQ(h.value_or("X-Frame-Options"), "DENY");
        BOOST_TEST_EQ(h.value_or("Referrer-Policy"),
            "strict-origin-when-cross-origin");
        BOOST_TEST_EQ(h.value_or("Content-Disposition"), "inline");
        BOOST_TEST_EQ(h.value_or("Link"),
            "</stream?file=intro.mp3>; rel=prefetch; as=audio");
        BOOST_TEST_EQ(h.value_or("X-Next-Range"),
            "bytes=1048577-2097153");
    }

    void
    testLargeFirstChunk()
    {
        // 20 MB, no Range header
        response_builder rb;
        auto rd = rb.build({ 0, 3145728 }, 20971520, true, true,
            std::nullopt, "long mix.flac");
        BOOST_TEST_EQ(rd.status, 206u);
        BOOST_TEST_EQ(rd.headers.value_or("Content-Type"), "audio/flac");
        BOOST_TEST_EQ(rd.headers.value_or("Cache-Control"),
            "public, max-age=7200, stale-while-revalidate=3600");
        BOOST_TEST_EQ(rd.headers.value_or("Content-Range"),
            "bytes 0-3145728/20971520");
        BOOST_TEST_EQ(rd.headers.value_or("Link"),
            "</stream?file=long%20mix.flac>; rel=prefetch; as=audio");
        BOOST_TEST_EQ(rd.headers.value_or("X-Next-Range"),
            "bytes=3145729-6291457");
    }

    void
    testSteadyChunk()
    {
        response_builder rb;
        auto rd = rb.build({ 2097152, 2621439 }, 4194304, false, true,
            std::string("audio/x-custom"), "track");
        BOOST_TEST_EQ(rd.status, 206u);
        BOOST_TEST_EQ(rd.content_length, 524288u);
        BOOST_TEST_EQ(rd.headers.value_or("Content-Type"),
            "audio/x-custom");
        BOOST_TEST_EQ(rd.headers.value_or("Cache-Control"),
            "public, max-age=31536000, immutable");
        BOOST_TEST_EQ(rd.headers.value_or("X-Next-Range"),
            "bytes=2621440-3145727");
    }

    void
    testLastChunk()
    {
        response_builder rb;
        auto rd = rb.build({ 4000000, 4194303 }, 4194304, false, true,
            std::nullopt, "intro.mp3");
        BOOST_TEST_EQ(rd.status, 206u);
        BOOST_TEST_EQ(rd.headers.value_or("Content-Range"),
            "bytes 4000000-4194303/4194304");
        BOOST_TEST_NOT(rd.headers.contains("Link"));
        BOOST_TEST_NOT(rd.headers.contains("X-Next-Range"));
    }

    void
    testFullObject()
    {
        response_builder rb;
        auto rd = rb.build({ 0, 99 }, 100, true, false,
            std::nullopt, "tiny.wav");
        BOOST_TEST_EQ(rd.status, 200u);
        BOOST_TEST_NOT(rd.partial);
        BOOST_TEST_EQ(rd.headers.value_or("Content-Type"), "audio/wav");
        BOOST_TEST_EQ(rd.headers.value_or("Content-Length"), "100");
        BOOST_TEST_EQ(rd.headers.value_or("Cache-Control"),
            "public, max-age=86400, stale-while-revalidate=3600");
        BOOST_TEST_NOT(rd.headers.contains("Content-Range"));
        BOOST_TEST_NOT(rd.headers.contains("Link"));
    }

    void
    testOptions()
    {
        response_options opts;
        opts.route = "/api/audio/stream";
        opts.cors.origin = "https://app.example.com";
        response_builder rb(opts);

        auto rd = rb.build({ 0, 1048576 }, 4194304, true, true,
            std::nullopt, "a/b.mp3");
        BOOST_TEST_EQ(rd.headers.value_or("Link"),
            "</api/audio/stream?file=a%2Fb.mp3>; rel=prefetch; as=audio");
        BOOST_TEST_EQ(rd.headers.value_or("Access-Control-Allow-Origin"),
            "https://app.example.com");
        BOOST_TEST_EQ(rd.headers.value_or("Vary"), "Origin");
    }

    void
    testPreflight()
    {
        response_builder rb;
        auto rd = rb.preflight();
        BOOST_TEST_EQ(rd.status, 200u);
        BOOST_TEST_EQ(rd.content_length, 0u);
        BOOST_TEST_EQ(rd.headers.value_or("Access-Control-Allow-Origin"), "*");
        BOOST_TEST_EQ(rd.headers.value_or("Access-Control-Allow-Methods"),
            "GET, OPTIONS");
        BOOST_TEST_EQ(rd.headers.value_or("Access-Control-Allow-Headers"),
            "Content-Type, Range");
        BOOST_TEST_EQ(rd.headers.value_or("Access-Control-Max-Age"), "86400");
        BOOST_TEST_EQ(rd.headers.value_or("Content-Length"), "0");
    }

    void
    testError()
    {
        response_builder rb;
        auto rd = rb.error(404, "application/json", 32);
        BOOST_TEST_EQ(rd.status, 404u);
        BOOST_TEST_EQ(rd.content_length, 32u);
        BOOST_TEST_EQ(rd.headers.value_or("Content-Type"), "application/json");
        BOOST_TEST_EQ(rd.headers.value_or("Content-Length"), "32");
        BOOST_TEST_EQ(rd.headers.value_or("Access-Control-Allow-Origin"), "*");
        BOOST_TEST_EQ(rd.headers.value_or("X-Content-Type-Options"), "nosniff");
        BOOST_TEST_NOT(rd.headers.contains("Cache-Control"));
    }

    void
    run()
    {
        testCachePolicy();
        testNextRange();
        testFirstChunk();
        testLargeFirstChunk();
        testSteadyChunk();
        testLastChunk();
        testFullObject();
        testOptions();
        testPreflight();
        testError();
    }
};

} // audiostream

TEST_SUITE(
    audiostream::response_builder_test,
    "audiostream.server.response_builder")
