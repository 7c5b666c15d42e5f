//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef AUDIOSTREAM_SERVER_CORS_HPP
#define AUDIOSTREAM_SERVER_CORS_HPP

#include <audiostream/detail/config.hpp>
#include <audiostream/server/header_list.hpp>
#include <chrono>
#include <string>

namespace audiostream {

/** Options for cross-origin resource sharing.
*/
struct cors_options
{
    /// Allowed origin, or "*" for any. Empty defaults to "*".
    std::string origin;

    /// Allowed HTTP methods for preflight responses.
    std::string methods = "GET, OPTIONS";

    /// Allowed request headers for preflight responses.
    std::string allowed_headers = "Content-Type, Range";

    /// Response headers exposed to client. Empty sends nothing.
    std::string exposed_headers;

    /// Max age for preflight cache. Zero sends nothing.
    std::chrono::seconds max_age{ 86400 };

    /// Status code for preflight response.
    unsigned result = 200;
};

/** Cross-origin header policy for the stream route.

    @par Example
    @code
    cors_options opts;
    opts.origin = "https://player.example.com";

    cors c( opts );
    header_list h;
    c.apply( h );
    // h.value_or( "Access-Control-Allow-Origin" ) == "https://player.example.com"
    // h.value_or( "Vary" ) == "Origin"
    @endcode

    @see cors_options
*/
class AUDIOSTREAM_DECL cors
{
    cors_options options_;

public:
    /** Construct a CORS policy.

        @param options Configuration options.
    */
    explicit cors(cors_options options = {}) noexcept;

    /** Set the headers of an actual (non-preflight) response.
    */
    void apply(header_list& h) const;

    /** Set the headers of a preflight response.

        @return The status code of the preflight response.
    */
    unsigned preflight(header_list& h) const;

    cors_options const&
    options() const noexcept
    {
        return options_;
    }
};

} // audiostream

#endif
