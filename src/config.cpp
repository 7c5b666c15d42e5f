//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <audiostream/config.hpp>
#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <thread>

namespace audiostream {

namespace {

template<class T>
T
parse_number(
    char const* name,
    std::string const& s,
    T min_value,
    T max_value)
{
    T v{};
    auto const* first = s.data();
    auto const* last = s.data() + s.size();
    auto r = std::from_chars(first, last, v);
    if( r.ec != std::errc() ||
        r.ptr != last ||
        v < min_value ||
        v > max_value)
        throw std::invalid_argument(
            std::string(name) + ": invalid value \"" + s + "\"");
    return v;
}

} // (anon)

server_config
load_config()
{
    return load_config(
        [](char const* name) -> std::optional<std::string>
        {
            auto const* v = std::getenv(name);
            if(! v)
                return std::nullopt;
            return std::string(v);
        });
}

server_config
load_config(env_lookup const& env)
{
    server_config cfg;
    cfg.server.threads = std::max(
        std::thread::hardware_concurrency(), 1u);
    cfg.stream.response.cors.origin = "*";

    if(auto v = env("AUDIOSTREAM_ADDRESS"))
        cfg.server.address = *v;
    if(auto v = env("AUDIOSTREAM_PORT"))
        cfg.server.port = parse_number<unsigned short>(
            "AUDIOSTREAM_PORT", *v, 0,
            std::numeric_limits<unsigned short>::max());
    if(auto v = env("AUDIOSTREAM_THREADS"))
        cfg.server.threads = parse_number<unsigned>(
            "AUDIOSTREAM_THREADS", *v, 1, 1024);
    if(auto v = env("AUDIOSTREAM_ROOT"))
        cfg.root = *v;
    if(auto v = env("AUDIOSTREAM_ROUTE"))
    {
        if(v->empty() || v->front() != '/')
            throw std::invalid_argument(
                "AUDIOSTREAM_ROUTE: must start with '/'");
        cfg.stream.response.route = *v;
    }
    if(auto v = env("AUDIOSTREAM_ALLOW_ORIGIN"))
        cfg.stream.response.cors.origin = *v;
    if(auto v = env("AUDIOSTREAM_RATE_LIMIT"))
        cfg.rate_limit.limit = parse_number<std::size_t>(
            "AUDIOSTREAM_RATE_LIMIT", *v, 1,
            std::numeric_limits<std::size_t>::max());
    if(auto v = env("AUDIOSTREAM_RATE_WINDOW"))
        cfg.rate_limit.window = std::chrono::seconds(
            parse_number<long>(
                "AUDIOSTREAM_RATE_WINDOW", *v, 1, 86400));
    if(auto v = env("AUDIOSTREAM_SIGNING_SECRET"))
        cfg.stream.signing_secret = *v;
    if(auto v = env("AUDIOSTREAM_LOG_LEVEL"))
        cfg.log_level = *v;

    return cfg;
}

} // audiostream
