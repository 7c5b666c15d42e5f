//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef AUDIOSTREAM_CONFIG_HPP
#define AUDIOSTREAM_CONFIG_HPP

#include <audiostream/detail/config.hpp>
#include <audiostream/server/http_server.hpp>
#include <audiostream/server/rate_limiter.hpp>
#include <audiostream/server/stream_handler.hpp>
#include <functional>
#include <optional>
#include <string>

namespace audiostream {

/** Settings for the streaming server.

    @see @ref load_config.
*/
struct server_config
{
    /// Transport settings.
    server_options server;

    /// Handler settings: route, CORS origin, chunk policy, signing secret.
    stream_options stream;

    /// Admission limits per client.
    rate_limit_options rate_limit;

    /// Directory holding the audio objects.
    std::string root = ".";

    /// Name of the spdlog level.
    std::string log_level = "info";
};

/** A function returning the value of an environment variable.
*/
using env_lookup = std::function<
    std::optional<std::string>(char const* name)>;

/** Load settings from the process environment.

    Each `AUDIOSTREAM_*` variable overrides one default:
    `ADDRESS`, `PORT`, `THREADS`, `ROOT`, `ROUTE`,
    `ALLOW_ORIGIN`, `RATE_LIMIT`, `RATE_WINDOW`,
    `SIGNING_SECRET` and `LOG_LEVEL`.

    @throws std::invalid_argument if a numeric
    variable is malformed or out of range.
*/
AUDIOSTREAM_DECL
server_config
load_config();

/** Load settings using the given variable lookup.

    @throws std::invalid_argument if a numeric
    variable is malformed or out of range.
*/
AUDIOSTREAM_DECL
server_config
load_config(env_lookup const& env);

} // audiostream

#endif
