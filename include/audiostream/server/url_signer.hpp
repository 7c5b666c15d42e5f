//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef AUDIOSTREAM_SERVER_URL_SIGNER_HPP
#define AUDIOSTREAM_SERVER_URL_SIGNER_HPP

#include <audiostream/detail/config.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/system/error_code.hpp>
#include <cstdint>
#include <string>

namespace audiostream {

/** Signs and verifies expiring stream links.

    A link carries `expires`, a Unix time in seconds,
    and `token`, the lowercase hex HMAC-SHA256 of
    `<file>:<expires>` under the shared secret.

    @par Example
    @code
    url_signer signer( "s3cret" );
    auto token = signer.sign( "intro.mp3", 1760000000 );
    auto ec = signer.verify( "intro.mp3", token, "1760000000", 1750000000 );
    // ! ec
    @endcode
*/
class AUDIOSTREAM_DECL url_signer
{
    std::string secret_;

public:
    /** Construct a signer.

        @param secret The shared secret. Must not be empty.

        @throws std::invalid_argument if `secret` is empty.
    */
    explicit url_signer(core::string_view secret);

    /** Return the token for a file and expiry time.
    */
    std::string
    sign(
        core::string_view file,
        std::int64_t expires) const;

    /** Check the token and expiry of a link.

        @param file The `file` query parameter.

        @param token The `token` query parameter.

        @param expires The `expires` query parameter.

        @param now The current Unix time in seconds.

        @return @ref error::invalid_signature if the token
        is missing, malformed or does not match, or
        @ref error::link_expired if `expires` is not after
        `now`.
    */
    system::error_code
    verify(
        core::string_view file,
        core::string_view token,
        core::string_view expires,
        std::int64_t now) const;
};

} // audiostream

#endif
