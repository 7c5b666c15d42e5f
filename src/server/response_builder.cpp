//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <audiostream/server/response_builder.hpp>
#include <audiostream/server/encode_url.hpp>
#include <audiostream/server/mime_types.hpp>
#include <boost/assert.hpp>
#include <utility>

namespace audiostream {

core::string_view
to_string(cache_policy p) noexcept
{
    switch(p)
    {
    case cache_policy::short_revalidate:
        return "public, max-age=7200, stale-while-revalidate=3600";
    case cache_policy::medium_revalidate:
        return "public, max-age=86400, stale-while-revalidate=3600";
    case cache_policy::immutable:
    default:
        return "public, max-age=31536000, immutable";
    }
}

cache_policy
select_cache_policy(
    bool first_request,
    std::uint64_t size,
    bool partial,
    std::uint64_t large_object) noexcept
{
    if(first_request && size > large_object)
        return cache_policy::short_revalidate;
    if(partial)
        return cache_policy::immutable;
    return cache_policy::medium_revalidate;
}

std::optional<byte_range>
next_range(
    byte_range served,
    std::uint64_t size,
    bool partial) noexcept
{
    if(! partial || size == 0 || served.end >= size - 1)
        return std::nullopt;

    auto const last = size - 1;
    auto const n = served.size();
    byte_range next;
    next.start = served.end + 1;
    next.end = last;
    if(n - 1 < last - next.start)
        next.end = next.start + n - 1;
    return next;
}

//------------------------------------------------

namespace {

std::string
format_range(
    core::string_view prefix,
    byte_range r)
{
    std::string s(prefix);
    s += std::to_string(r.start);
    s += '-';
    s += std::to_string(r.end);
    return s;
}

} // (anon)

response_builder::
response_builder(
    response_options opts)
    : opts_(std::move(opts))
    , cors_(opts_.cors)
    , helmet_(opts_.helmet)
{
}

response_descriptor
response_builder::
build(
    byte_range range,
    std::uint64_t size,
    bool first_request,
    bool partial,
    std::optional<std::string> const& stored_type,
    core::string_view name) const
{
    BOOST_ASSERT(range.start <= range.end);
    BOOST_ASSERT(range.end < size);

    response_descriptor rd;
    rd.status = partial ? 206 : 200;
    rd.range = range;
    rd.content_length = range.size();
    rd.partial = partial;

    auto& h = rd.headers;
    h.set("Content-Type", mime_types::content_type(name, stored_type));
    h.set("Content-Length", std::to_string(rd.content_length));
    h.set("Accept-Ranges", "bytes");
    h.set("Cache-Control", to_string(select_cache_policy(
        first_request, size, partial, opts_.large_object)));
    cors_.apply(h);
    helmet_.apply(h);
    h.set("Content-Disposition", "inline");

    if(auto next = next_range(range, size, partial))
    {
        std::string link = "<";
        link += opts_.route;
        link += "?file=";
        link += encode_component(name);
        link += ">; rel=prefetch; as=audio";
        h.set("Link", link);
        h.set("X-Next-Range", format_range("bytes=", *next));
    }

    if(partial)
    {
        auto cr = format_range("bytes ", range);
        cr += '/';
        cr += std::to_string(size);
        h.set("Content-Range", cr);
    }

    return rd;
}

response_descriptor
response_builder::
preflight() const
{
    response_descriptor rd;
    rd.status = cors_.preflight(rd.headers);
    rd.headers.set("Content-Length", "0");
    return rd;
}

response_descriptor
response_builder::
error(
    unsigned status,
    core::string_view content_type,
    std::uint64_t body_size) const
{
    response_descriptor rd;
    rd.status = status;
    rd.content_length = body_size;
    rd.headers.set("Content-Type", content_type);
    rd.headers.set("Content-Length", std::to_string(body_size));
    cors_.apply(rd.headers);
    rd.headers.set("X-Content-Type-Options", "nosniff");
    return rd;
}

} // audiostream
