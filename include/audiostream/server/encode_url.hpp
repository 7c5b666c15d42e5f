//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef AUDIOSTREAM_SERVER_ENCODE_URL_HPP
#define AUDIOSTREAM_SERVER_ENCODE_URL_HPP

#include <audiostream/detail/config.hpp>
#include <boost/core/detail/string_view.hpp>
#include <string>

namespace audiostream {

/** Percent-encode a string for use as one URL component.

    Every octet is encoded except the unreserved
    characters and `! ' ( ) *`, so the result can be
    placed in a query parameter value without changing
    the meaning of the surrounding URL.

    @par Example
    @code
    std::string s = encode_component( "my song & more.mp3" );
    // s == "my%20song%20%26%20more.mp3"
    @endcode

    @param s The component to encode.

    @return A new string with unsafe octets percent-encoded.
*/
AUDIOSTREAM_DECL
std::string
encode_component(core::string_view s);

} // audiostream

#endif
