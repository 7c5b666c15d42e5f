//
// Copyright (c) 2025 Amlal El Mahrouss (amlal at nekernel dot org)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef AUDIOSTREAM_SERVER_HELMET_HPP
#define AUDIOSTREAM_SERVER_HELMET_HPP

#include <audiostream/detail/config.hpp>
#include <audiostream/server/header_list.hpp>
#include <string>
#include <utility>
#include <vector>

namespace audiostream {

/** Header name and values pair */
using option_pair = std::pair<std::string, std::vector<std::string>>;

/** Configuration options for the hardening headers.

    This structure holds the security headers applied
    to every stream response. A default-constructed
    object sets `X-Content-Type-Options: nosniff`,
    `X-Frame-Options: DENY` and
    `Referrer-Policy: strict-origin-when-cross-origin`.

    @see helmet
*/
struct AUDIOSTREAM_DECL helmet_options
{
    using pair_type = option_pair;
    using map_type  = std::vector<pair_type>;

    /** Collection of security headers to apply */
    map_type headers;

    /** Set or update a security header.

        If a header with the same name already exists, it will be replaced.
        Otherwise, the new header is appended to the collection.
        An empty name is ignored.

        @param helmet_hdr The header name and values to set.

        @return A reference to this object for chaining.
    */
    helmet_options& set(const pair_type& helmet_hdr);

    helmet_options();
    ~helmet_options();
};

/** Frame origin policy for X-Frame-Options header.

    Controls whether the page can be embedded in frames.
*/
enum class helmet_origin_type
{
    /** Prevent all framing */
    deny,

    /** Allow framing from same origin only */
    sameorigin
};

/** Referrer-Policy values.

    Controls how much referrer information is sent with requests.
*/
enum class referrer_policy_type
{
    /** Never send referrer */
    no_referrer,

    /** Send referrer for same-origin requests only */
    same_origin,

    /** Send origin only for HTTPS to HTTPS */
    strict_origin,

    /** Send origin only for HTTPS to HTTPS, nothing for HTTPS to HTTP */
    strict_origin_when_cross_origin
};

/** Applies hardening headers to responses.

    @par Example
    @code
    helmet_options opts;
    opts.set(x_frame_origin(helmet_origin_type::sameorigin));

    header_list h;
    helmet(opts).apply(h);
    @endcode

    @see helmet_options
*/
class AUDIOSTREAM_DECL helmet
{
    std::vector<std::pair<std::string, std::string>> cached_headers_;

public:
    explicit
    helmet(
        helmet_options const& options = {});

    /** Set every configured header on `h`.

        A header configured with no values is removed.
    */
    void apply(header_list& h) const;
};

AUDIOSTREAM_DECL
option_pair x_content_type_options();

AUDIOSTREAM_DECL
option_pair x_frame_origin(const helmet_origin_type& origin);

AUDIOSTREAM_DECL
option_pair referrer_policy(
    const referrer_policy_type& policy = referrer_policy_type::no_referrer);

} // audiostream

#endif
