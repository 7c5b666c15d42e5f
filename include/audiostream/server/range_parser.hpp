//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef AUDIOSTREAM_SERVER_RANGE_PARSER_HPP
#define AUDIOSTREAM_SERVER_RANGE_PARSER_HPP

#include <audiostream/detail/config.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/system/result.hpp>
#include <cstdint>

namespace audiostream {

/** A single byte range.

    Represents an inclusive byte range within an object.
    Both `start` and `end` are zero-based byte offsets.
*/
struct byte_range
{
    /// Start of range (inclusive).
    std::uint64_t start = 0;

    /// End of range (inclusive).
    std::uint64_t end = 0;

    /// Return the number of bytes in the range.
    std::uint64_t
    size() const noexcept
    {
        return end - start + 1;
    }

    friend
    bool
    operator==(
        byte_range const& a,
        byte_range const& b) noexcept
    {
        return a.start == b.start && a.end == b.end;
    }

    friend
    bool
    operator!=(
        byte_range const& a,
        byte_range const& b) noexcept
    {
        return !(a == b);
    }
};

/** Parse an HTTP Range header.

    Parses a single-range header value of the form
    `bytes=<start>-<end>` and returns the interval,
    validated against the object size. Either bound
    may be omitted: a missing start means offset 0,
    and a missing end means the last byte of the object.
    Suffix ranges are not supported, so `bytes=-500`
    is the interval `[0, 500]`. Multiple ranges are
    rejected.

    @par Example
    @code
    auto r = parse_range( 10000, "bytes=100-" );
    // r->start == 100
    // r->end == 9999
    @endcode

    @param size The size of the object in bytes.

    @param header The Range header value.

    @return The requested interval, or
    @ref error::unsatisfiable_range if the header is
    malformed, `start > end`, or either bound is not
    less than `size`.
*/
AUDIOSTREAM_DECL
system::result<byte_range>
parse_range(std::uint64_t size, core::string_view header);

} // audiostream

#endif
