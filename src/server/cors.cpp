//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <audiostream/server/cors.hpp>
#include <utility>

namespace audiostream {

cors::
cors(
    cors_options options) noexcept
    : options_(std::move(options))
{
}

// Access-Control-Allow-Origin
static void setOrigin(
    header_list& h,
    cors_options const& options)
{
    if( options.origin.empty() ||
        options.origin == "*")
    {
        h.set("Access-Control-Allow-Origin", "*");
        return;
    }

    h.set(
        "Access-Control-Allow-Origin",
        options.origin);
    h.append("Vary", "Origin");
}

// Access-Control-Allow-Methods
static void setMethods(
    header_list& h,
    cors_options const& options)
{
    if(options.methods.empty())
        return;
    h.set(
        "Access-Control-Allow-Methods",
        options.methods);
}

// Access-Control-Allow-Headers
static void setAllowedHeaders(
    header_list& h,
    cors_options const& options)
{
    if(options.allowed_headers.empty())
        return;
    h.set(
        "Access-Control-Allow-Headers",
        options.allowed_headers);
}

// Access-Control-Expose-Headers
static void setExposeHeaders(
    header_list& h,
    cors_options const& options)
{
    if(options.exposed_headers.empty())
        return;
    h.set(
        "Access-Control-Expose-Headers",
        options.exposed_headers);
}

// Access-Control-Max-Age
static void setMaxAge(
    header_list& h,
    cors_options const& options)
{
    if(options.max_age.count() == 0)
        return;
    h.set(
        "Access-Control-Max-Age",
        std::to_string(
            options.max_age.count()));
}

void
cors::
apply(header_list& h) const
{
    setOrigin(h, options_);
    setExposeHeaders(h, options_);
}

unsigned
cors::
preflight(header_list& h) const
{
    setOrigin(h, options_);
    setMethods(h, options_);
    setAllowedHeaders(h, options_);
    setMaxAge(h, options_);
    setExposeHeaders(h, options_);
    return options_.result;
}

} // audiostream
