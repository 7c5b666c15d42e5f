//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Test that header file is self-contained.
#include <audiostream/server/rate_limiter.hpp>

#include "test_helpers.hpp"

#include <atomic>
#include <thread>
#include <vector>

namespace audiostream {

struct rate_limiter_test
{
    using clock_type = fixed_window_limiter::clock_type;
    using time_point = fixed_window_limiter::time_point;

    time_point now_ = time_point() + std::chrono::hours(1);

    fixed_window_limiter
    make(rate_limit_options const& opts = {})
    {
        return fixed_window_limiter(
            opts, [this]{ return now_; });
    }

    void
    testCapacity()
    {
        auto rl = make();
        for(int i = 0; i < 30; ++i)
            BOOST_TEST(rl.admit("10.0.0.1"));
        BOOST_TEST_NOT(rl.admit("10.0.0.1"));
        BOOST_TEST_NOT(rl.admit("10.0.0.1"));

        // other identifiers are independent
        BOOST_TEST(rl.admit("10.0.0.2"));
        BOOST_TEST_EQ(rl.size(), 2u);
    }

    void
    testWindow()
    {
        auto rl = make();
        for(int i = 0; i < 30; ++i)
            rl.admit("a");
        BOOST_TEST_NOT(rl.admit("a"));

        now_ += std::chrono::seconds(59);
        BOOST_TEST_NOT(rl.admit("a"));

        // still rejected exactly at reset time
        now_ += std::chrono::seconds(1);
        BOOST_TEST_NOT(rl.admit("a"));
        BOOST_TEST(rl.retry_after("a") == std::chrono::seconds(1));

        // the window ends once reset time has passed
        now_ += std::chrono::milliseconds(1);
        BOOST_TEST(rl.admit("a"));

        // the new window counts from one
        for(int i = 0; i < 29; ++i)
            BOOST_TEST(rl.admit("a"));
        BOOST_TEST_NOT(rl.admit("a"));
    }

    void
    testRetryAfter()
    {
        auto rl = make();
        BOOST_TEST(rl.retry_after("a") == std::chrono::seconds(0));
        for(int i = 0; i < 30; ++i)
            rl.admit("a");
        BOOST_TEST(rl.retry_after("a") == std::chrono::seconds(60));

        now_ += std::chrono::milliseconds(20500);
        BOOST_TEST(rl.retry_after("a") == std::chrono::seconds(40));

        now_ += std::chrono::milliseconds(39500);
        BOOST_TEST(rl.retry_after("a") == std::chrono::seconds(1));

        now_ += std::chrono::seconds(1);
        BOOST_TEST(rl.retry_after("a") == std::chrono::seconds(0));
    }

    void
    testOptions()
    {
        rate_limit_options opts;
        opts.limit = 2;
        opts.window = std::chrono::seconds(5);
        auto rl = make(opts);
        BOOST_TEST(rl.admit("a"));
        BOOST_TEST(rl.admit("a"));
        BOOST_TEST_NOT(rl.admit("a"));
        now_ += std::chrono::seconds(5);
        BOOST_TEST_NOT(rl.admit("a"));
        now_ += std::chrono::seconds(1);
        BOOST_TEST(rl.admit("a"));
        BOOST_TEST_EQ(rl.options().limit, 2u);
    }

    void
    testCleanup()
    {
        auto rl = make();
        rl.admit("a");
        now_ += std::chrono::seconds(30);
        rl.admit("b");
        BOOST_TEST_EQ(rl.cleanup(), 0u);
        BOOST_TEST_EQ(rl.size(), 2u);

        // an entry at its reset time is kept
        now_ += std::chrono::seconds(30);
        BOOST_TEST_EQ(rl.cleanup(), 0u);

        now_ += std::chrono::seconds(1);
        BOOST_TEST_EQ(rl.cleanup(), 1u);
        BOOST_TEST_EQ(rl.size(), 1u);

        now_ += std::chrono::seconds(30);
        BOOST_TEST_EQ(rl.cleanup(), 1u);
        BOOST_TEST_EQ(rl.size(), 0u);
    }

    void
    testConcurrency()
    {
        fixed_window_limiter rl;
        std::atomic<int> admitted{0};
        std::vector<std::thread> v;
        for(int t = 0; t < 8; ++t)
            v.emplace_back([&]
            {
                for(int i = 0; i < 20; ++i)
                    if(rl.admit("shared"))
                        ++admitted;
            });
        for(auto& t : v)
            t.join();
        BOOST_TEST_EQ(admitted.load(), 30);
    }

    void
    testInterface()
    {
        auto rl = std::make_shared<fixed_window_limiter>();
        std::shared_ptr<rate_limiter> p = rl;
        BOOST_TEST(p->admit("a"));
        BOOST_TEST(p->retry_after("a") == std::chrono::seconds(0));
    }

    void
    run()
    {
        testCapacity();
        testWindow();
        testRetryAfter();
        testOptions();
        testCleanup();
        testConcurrency();
        testInterface();
    }
};

} // audiostream

TEST_SUITE(
    audiostream::rate_limiter_test,
    "audiostream.server.rate_limiter")
