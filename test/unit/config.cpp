//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Test that header file is self-contained.
#include <audiostream/config.hpp>

#include "test_helpers.hpp"

#include <map>
#include <stdexcept>

namespace audiostream {

struct config_test
{
    static
    env_lookup
    from(std::map<std::string, std::string> m)
    {
        return [m](char const* name) -> std::optional<std::string>
        {
            auto it = m.find(name);
            if(it == m.end())
                return std::nullopt;
            return it->second;
        };
    }

    void
    testDefaults()
    {
        auto cfg = load_config(from({}));
        BOOST_TEST_EQ(cfg.server.address, "0.0.0.0");
        BOOST_TEST_EQ(cfg.server.port, 8080);
        BOOST_TEST_GE(cfg.server.threads, 1u);
        BOOST_TEST(cfg.server.io_timeout == std::chrono::seconds(30));
        BOOST_TEST_EQ(cfg.root, ".");
        BOOST_TEST_EQ(cfg.stream.response.route, "/stream");
        BOOST_TEST_EQ(cfg.stream.response.cors.origin, "*");
        BOOST_TEST(cfg.stream.signing_secret.empty());
        BOOST_TEST_EQ(cfg.rate_limit.limit, 30u);
        BOOST_TEST(cfg.rate_limit.window == std::chrono::seconds(60));
        BOOST_TEST_EQ(cfg.log_level, "info");
    }

    void
    testOverrides()
    {
        auto cfg = load_config(from({
            { "AUDIOSTREAM_ADDRESS", "127.0.0.1" },
            { "AUDIOSTREAM_PORT", "9000" },
            { "AUDIOSTREAM_THREADS", "4" },
            { "AUDIOSTREAM_ROOT", "/srv/audio" },
            { "AUDIOSTREAM_ROUTE", "/api/audio/stream" },
            { "AUDIOSTREAM_ALLOW_ORIGIN", "https://app.example.com" },
            { "AUDIOSTREAM_RATE_LIMIT", "100" },
            { "AUDIOSTREAM_RATE_WINDOW", "10" },
            { "AUDIOSTREAM_SIGNING_SECRET", "s3cret" },
            { "AUDIOSTREAM_LOG_LEVEL", "debug" },
        }));
        BOOST_TEST_EQ(cfg.server.address, "127.0.0.1");
        BOOST_TEST_EQ(cfg.server.port, 9000);
        BOOST_TEST_EQ(cfg.server.threads, 4u);
        BOOST_TEST_EQ(cfg.root, "/srv/audio");
        BOOST_TEST_EQ(cfg.stream.response.route, "/api/audio/stream");
        BOOST_TEST_EQ(cfg.stream.response.cors.origin,
            "https://app.example.com");
        BOOST_TEST_EQ(cfg.rate_limit.limit, 100u);
        BOOST_TEST(cfg.rate_limit.window == std::chrono::seconds(10));
        BOOST_TEST_EQ(cfg.stream.signing_secret, "s3cret");
        BOOST_TEST_EQ(cfg.log_level, "debug");
    }

    void
    testMalformed()
    {
        BOOST_TEST_THROWS(load_config(from({
            { "AUDIOSTREAM_PORT", "http" } })), std::invalid_argument);
        BOOST_TEST_THROWS(load_config(from({
            { "AUDIOSTREAM_PORT", "70000" } })), std::invalid_argument);
        BOOST_TEST_THROWS(load_config(from({
            { "AUDIOSTREAM_PORT", "80x" } })), std::invalid_argument);
        BOOST_TEST_THROWS(load_config(from({
            { "AUDIOSTREAM_THREADS", "0" } })), std::invalid_argument);
        BOOST_TEST_THROWS(load_config(from({
            { "AUDIOSTREAM_RATE_LIMIT", "-1" } })), std::invalid_argument);
        BOOST_TEST_THROWS(load_config(from({
            { "AUDIOSTREAM_RATE_WINDOW", "" } })), std::invalid_argument);
        BOOST_TEST_THROWS(load_config(from({
            { "AUDIOSTREAM_ROUTE", "stream" } })), std::invalid_argument);

        try
        {
            load_config(from({ { "AUDIOSTREAM_PORT", "http" } }));
        }
        catch(std::invalid_argument const& e)
        {
            BOOST_TEST(std::string(e.what()).find(
                "AUDIOSTREAM_PORT") != std::string::npos);
        }
    }

    void
    run()
    {
        testDefaults();
        testOverrides();
        testMalformed();
    }
};

} // audiostream

TEST_SUITE(
    audiostream::config_test,
    "audiostream.config")
