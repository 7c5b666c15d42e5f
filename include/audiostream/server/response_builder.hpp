//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef AUDIOSTREAM_SERVER_RESPONSE_BUILDER_HPP
#define AUDIOSTREAM_SERVER_RESPONSE_BUILDER_HPP

#include <audiostream/detail/config.hpp>
#include <audiostream/server/cors.hpp>
#include <audiostream/server/header_list.hpp>
#include <audiostream/server/helmet.hpp>
#include <audiostream/server/range_parser.hpp>
#include <boost/core/detail/string_view.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace audiostream {

/** Cache-Control policies for stream responses.
*/
enum class cache_policy
{
    /// `public, max-age=7200, stale-while-revalidate=3600`
    short_revalidate,

    /// `public, max-age=86400, stale-while-revalidate=3600`
    medium_revalidate,

    /// `public, max-age=31536000, immutable`
    immutable
};

/** Return the Cache-Control header value for a policy.
*/
AUDIOSTREAM_DECL
core::string_view
to_string(cache_policy p) noexcept;

/** Choose the cache policy of a response.

    @li The first chunk of an object larger than
    `large_object` (10 MiB by default) gets a short,
    revalidatable lifetime.

    @li Every other partial response is immutable.

    @li A response carrying the whole object gets a
    medium, revalidatable lifetime.

    @param first_request `true` for the first request of
    a stream.

    @param size The size of the object.

    @param partial `true` for a 206 response.

    @param large_object Size above which a first chunk
    is short-lived.
*/
AUDIOSTREAM_DECL
cache_policy
select_cache_policy(
    bool first_request,
    std::uint64_t size,
    bool partial,
    std::uint64_t large_object = 10 * 1024 * 1024) noexcept;

/** Return the range a client is expected to request next.

    The next range starts right after `served` and has
    the same length, clamped to the object.

    @return The next range, or no value if the response
    is not partial or `served` reaches the last byte.
*/
AUDIOSTREAM_DECL
std::optional<byte_range>
next_range(
    byte_range served,
    std::uint64_t size,
    bool partial) noexcept;

/** Options for building stream responses.
*/
struct response_options
{
    /// Path of the stream route, used in prefetch links.
    std::string route = "/stream";

    /// Cross-origin policy.
    cors_options cors;

    /// Hardening headers.
    helmet_options helmet;

    /// Objects above this size get short-lived first chunks.
    std::uint64_t large_object = 10 * 1024 * 1024;
};

/** The status and headers of a response.
*/
struct response_descriptor
{
    /// The HTTP status code.
    unsigned status = 200;

    /// The header fields, in the order they are sent.
    header_list headers;

    /// The bytes of the object carried in the body.
    byte_range range;

    /// The length of the body.
    std::uint64_t content_length = 0;

    /// `true` for a 206 response.
    bool partial = false;
};

/** Assembles stream response headers.

    @par Example
    @code
    response_builder rb;
    auto rd = rb.build( { 0, 1048576 }, 4194304, true, true,
        std::nullopt, "intro.mp3" );
    // rd.status == 206
    // rd.headers.value_or( "Content-Range" ) == "bytes 0-1048576/4194304"
    // rd.headers.value_or( "X-Next-Range" ) == "bytes=1048577-2097153"
    @endcode
*/
class AUDIOSTREAM_DECL response_builder
{
    response_options opts_;
    cors cors_;
    helmet helmet_;

public:
    explicit
    response_builder(
        response_options opts = {});

    /** Build the response for a served range.

        @param range The range carried in the body.

        @param size The size of the object.

        @param first_request `true` for the first request
        of a stream.

        @param partial `true` if the response is 206.

        @param stored_type The content type reported by
        storage, if any.

        @param name The object name, used for the
        content type and the prefetch link.
    */
    response_descriptor
    build(
        byte_range range,
        std::uint64_t size,
        bool first_request,
        bool partial,
        std::optional<std::string> const& stored_type,
        core::string_view name) const;

    /** Build the response to a CORS preflight request.
    */
    response_descriptor
    preflight() const;

    /** Build the head of an error response.

        @param status The status code.

        @param content_type The type of the error body.

        @param body_size The length of the error body.
    */
    response_descriptor
    error(
        unsigned status,
        core::string_view content_type,
        std::uint64_t body_size) const;

    response_options const&
    options() const noexcept
    {
        return opts_;
    }
};

} // audiostream

#endif
