//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <audiostream/server/stream_handler.hpp>
#include <audiostream/error.hpp>
#include <boost/json/object.hpp>
#include <boost/json/serialize.hpp>
#include <boost/url/parse.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <exception>
#include <stdexcept>
#include <utility>

namespace audiostream {

namespace {

char const*
method_name(request_method m) noexcept
{
    switch(m)
    {
    case request_method::get: return "GET";
    case request_method::head: return "HEAD";
    case request_method::options: return "OPTIONS";
    case request_method::other:
    default:
        return "OTHER";
    }
}

core::string_view
error_message(system::error_code const& ec) noexcept
{
    if(ec == error::missing_parameter)
        return "Missing file parameter";
    if(ec == error::rate_exceeded)
        return "Too many requests";
    if(ec == error::invalid_signature)
        return "Invalid signature";
    if(ec == error::link_expired)
        return "Link expired";
    if(ec == error::metadata_unavailable)
        return "Unable to determine file size";
    if(ec == error::object_not_found)
        return "Audio file not found";
    return "Internal server error";
}

} // (anon)

stream_handler::
stream_handler(
    std::shared_ptr<object_store> store,
    std::shared_ptr<rate_limiter> limiter,
    stream_options opts)
    : store_(std::move(store))
    , limiter_(std::move(limiter))
    , opts_(std::move(opts))
    , builder_(opts_.response)
{
    if(! store_)
        throw std::invalid_argument("stream_handler: null object_store");
    if(! opts_.signing_secret.empty())
        signer_.emplace(opts_.signing_secret);
}

stream_response
stream_handler::
operator()(stream_request const& req) const
{
    try
    {
        return handle(req);
    }
    catch(std::exception const& e)
    {
        spdlog::error("{} {}: unexpected failure: {}",
            method_name(req.method), req.target, e.what());
        return fail(AUDIOSTREAM_ERR(error::internal));
    }
    catch(...)
    {
        spdlog::error("{} {}: unexpected failure",
            method_name(req.method), req.target);
        return fail(AUDIOSTREAM_ERR(error::internal));
    }
}

stream_response
stream_handler::
handle(stream_request const& req) const
{
    auto u = urls::parse_origin_form(req.target);
    if(! u)
        return fail(AUDIOSTREAM_ERR(error::missing_parameter));
    if(u->path() != opts_.response.route)
        return fail(404, "Not found");

    if(req.method == request_method::options)
    {
        stream_response res;
        res.head = builder_.preflight();
        return res;
    }

    if( req.method != request_method::get &&
        req.method != request_method::head)
    {
        auto res = fail(405, "Method not allowed");
        res.head.headers.set("Allow", "GET, HEAD, OPTIONS");
        return res;
    }

    // ValidateInput
    auto const params = u->params();
    auto const it = params.find("file");
    if(it == params.end() || (*it).value.empty())
        return fail(AUDIOSTREAM_ERR(error::missing_parameter));
    std::string const name = (*it).value;

    // Admit
    if(limiter_ && ! limiter_->admit(req.client))
    {
        spdlog::warn("rate limit exceeded for {}", req.client);
        auto res = fail(AUDIOSTREAM_ERR(error::rate_exceeded));
        auto const wait = (std::max)(
            limiter_->retry_after(req.client),
            std::chrono::seconds(1));
        res.head.headers.set("Retry-After",
            std::to_string(wait.count()));
        return res;
    }

    // VerifySignature
    if(signer_)
    {
        std::string token;
        std::string expires;
        auto t = params.find("token");
        if(t != params.end())
            token = (*t).value;
        auto x = params.find("expires");
        if(x != params.end())
            expires = (*x).value;

        auto ec = signer_->verify(name, token, expires, unix_now());
        if(ec)
        {
            spdlog::warn("rejected link for {} from {}: {}",
                name, req.client, ec.message());
            return fail(ec);
        }
    }

    // FetchMetadata
    auto md = store_->get_metadata(name);
    if(! md || md->size == 0)
    {
        if(! md)
            spdlog::error("metadata for {} unavailable: {}",
                name, md.error().message());
        else
            spdlog::error("metadata for {} has no size", name);
        return fail(AUDIOSTREAM_ERR(error::metadata_unavailable));
    }
    auto const size = md->size;

    // ParseRange + Optimize
    byte_range served;
    bool partial;
    bool first_request;
    if(req.range)
    {
        auto parsed = parse_range(size, *req.range);
        if(! parsed)
        {
            auto const body = core::string_view("Invalid range");
            stream_response res;
            res.head = builder_.error(416, "text/plain", body.size());
            res.head.headers.set("Content-Range",
                "bytes */" + std::to_string(size));
            res.body = std::string(body);
            spdlog::info("{} {} -> 416 ({})",
                method_name(req.method), name, *req.range);
            return res;
        }
        partial = true;
        first_request = parsed->start == 0;
        served = optimize_range(
            *parsed, size, first_request, opts_.chunks);
        spdlog::debug("{}: range {}-{} optimized to {}-{} of {}",
            name, parsed->start, parsed->end,
            served.start, served.end, size);
    }
    else
    {
        first_request = true;
        served = optimize_range(
            { 0, size - 1 }, size, true, opts_.chunks);
        partial = served.end < size - 1;
        spdlog::debug("{}: first request optimized to {}-{} of {}",
            name, served.start, served.end, size);
    }

    stream_response res;

    // FetchBytes
    if(req.method == request_method::get)
    {
        auto src = store_->get_range(name, served);
        if(! src || ! *src)
        {
            if(! src)
                spdlog::error("range {}-{} of {} unavailable: {}",
                    served.start, served.end, name,
                    src.error().message());
            return fail(AUDIOSTREAM_ERR(error::object_not_found));
        }
        res.source = std::move(*src);
    }

    // BuildResponse
    res.head = builder_.build(
        served, size, first_request, partial,
        md->content_type, name);

    spdlog::info("{} {} -> {} bytes {}-{}/{}",
        method_name(req.method), name, res.head.status,
        served.start, served.end, size);
    return res;
}

stream_response
stream_handler::
fail(system::error_code const& ec) const
{
    return fail(to_status(ec), error_message(ec));
}

stream_response
stream_handler::
fail(unsigned status, core::string_view message) const
{
    json::object obj;
    obj["error"] = message;

    stream_response res;
    res.body = json::serialize(obj);
    res.head = builder_.error(
        status, "application/json", res.body.size());
    return res;
}

std::int64_t
stream_handler::
unix_now() const
{
    if(opts_.now)
        return opts_.now();
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // audiostream
