//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef AUDIOSTREAM_SERVER_STREAM_HANDLER_HPP
#define AUDIOSTREAM_SERVER_STREAM_HANDLER_HPP

#include <audiostream/detail/config.hpp>
#include <audiostream/server/chunk_optimizer.hpp>
#include <audiostream/server/rate_limiter.hpp>
#include <audiostream/server/response_builder.hpp>
#include <audiostream/server/url_signer.hpp>
#include <audiostream/storage/object_store.hpp>
#include <boost/system/error_code.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace audiostream {

/** The request methods the stream route distinguishes.
*/
enum class request_method
{
    get,
    head,
    options,
    other
};

/** A request as seen by the stream handler.
*/
struct stream_request
{
    /// The request method.
    request_method method = request_method::get;

    /// The request target in origin-form, e.g. "/stream?file=a.mp3".
    std::string target;

    /// The value of the Range header, if present.
    std::optional<std::string> range;

    /// Identifies the client for admission control.
    std::string client;
};

/** A response produced by the stream handler.

    Exactly one of `source` and `body` carries the
    payload. `source` is set for successful `GET`
    requests; every other response carries its
    (possibly empty) payload in `body`.
*/
struct stream_response
{
    /// Status and headers.
    response_descriptor head;

    /// Bytes of the object, for successful `GET` requests.
    std::unique_ptr<byte_source> source;

    /// Payload of every other response.
    std::string body;
};

/** Options for @ref stream_handler.
*/
struct stream_options
{
    /// Response headers and route.
    response_options response;

    /// Chunk sizing constants.
    chunk_policy chunks;

    /// Secret for signed links. Empty disables verification.
    std::string signing_secret;

    /// Returns the current Unix time in seconds. Empty uses the system clock.
    std::function<std::int64_t()> now;
};

/** Serves byte ranges of audio objects.

    Each call runs one request through these steps,
    stopping at the first failure:

    @li answer `OPTIONS` with a CORS preflight response,
    and reject methods other than `GET` and `HEAD`;

    @li require a non-empty `file` query parameter;

    @li admit the client through the rate limiter;

    @li verify `token` and `expires` when a signing
    secret is configured;

    @li fetch the object metadata;

    @li parse and optimize the Range header, or choose
    the first chunk when there is none;

    @li open the byte range (skipped for `HEAD`);

    @li build the response headers.

    Failures become error responses. Unexpected
    exceptions are logged and reported as 500 without
    detail.

    @par Thread Safety
    `operator()` may be called concurrently.
*/
class AUDIOSTREAM_DECL stream_handler
{
public:
    /** Construct a handler.

        @param store The storage gateway. Must not be null.

        @param limiter The admission control, or null to
        admit every request.

        @param opts Configuration options.

        @throws std::invalid_argument if `store` is null.
    */
    stream_handler(
        std::shared_ptr<object_store> store,
        std::shared_ptr<rate_limiter> limiter,
        stream_options opts = {});

    /** Handle a request.
    */
    stream_response
    operator()(stream_request const& req) const;

    stream_options const&
    options() const noexcept
    {
        return opts_;
    }

private:
    stream_response handle(stream_request const& req) const;
    stream_response fail(system::error_code const& ec) const;
    stream_response fail(unsigned status, core::string_view message) const;
    std::int64_t unix_now() const;

    std::shared_ptr<object_store> store_;
    std::shared_ptr<rate_limiter> limiter_;
    stream_options opts_;
    response_builder builder_;
    std::optional<url_signer> signer_;
};

} // audiostream

#endif
