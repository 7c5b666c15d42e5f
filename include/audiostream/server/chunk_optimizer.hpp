//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef AUDIOSTREAM_SERVER_CHUNK_OPTIMIZER_HPP
#define AUDIOSTREAM_SERVER_CHUNK_OPTIMIZER_HPP

#include <audiostream/detail/config.hpp>
#include <audiostream/server/range_parser.hpp>
#include <cstdint>

namespace audiostream {

/** Size classification of an object.
*/
enum class size_tier
{
    /// Smaller than `chunk_policy::medium_threshold`.
    small,

    /// Up to but excluding `chunk_policy::large_threshold`.
    medium,

    /// At least `chunk_policy::large_threshold`.
    large
};

/** Chunk sizing constants.

    The defaults favor a quick start of playback on
    large objects without over-fetching small ones.
*/
struct chunk_policy
{
    /// Objects at least this large are medium.
    std::uint64_t medium_threshold = 5 * 1024 * 1024;

    /// Objects at least this large are large.
    std::uint64_t large_threshold = 15 * 1024 * 1024;

    /// Bytes served on the first request, by tier.
    std::uint64_t initial_small = 1024 * 1024;
    std::uint64_t initial_medium = 2 * 1024 * 1024;
    std::uint64_t initial_large = 3 * 1024 * 1024;

    /// Minimum span served on later requests, by tier.
    std::uint64_t chunk_small = 512 * 1024;
    std::uint64_t chunk_medium = 1024 * 1024;
    std::uint64_t chunk_large = 1536 * 1024;
};

/** Return the size tier of an object.
*/
AUDIOSTREAM_DECL
size_tier
classify_size(
    std::uint64_t size,
    chunk_policy const& policy = {}) noexcept;

/** Return the number of bytes served on a first request.
*/
AUDIOSTREAM_DECL
std::uint64_t
initial_chunk_size(
    size_tier tier,
    chunk_policy const& policy = {}) noexcept;

/** Return the minimum span served on a later request.
*/
AUDIOSTREAM_DECL
std::uint64_t
optimal_chunk_size(
    size_tier tier,
    chunk_policy const& policy = {}) noexcept;

/** Choose the byte range actually served.

    On a first request starting at offset zero the
    requested end is ignored and the end bound becomes
    the initial chunk size of the object's tier, clamped
    to the last byte of the object.

    Otherwise a request smaller than the optimal chunk
    is expanded forward, unless it already reaches the
    last byte of the object. A request is never shrunk
    and never extended past the end of the object.

    @par Example
    @code
    // 4 MiB object, 512 byte request
    auto r = optimize_range( { 2097152, 2097663 }, 4194304, false );
    // r.start == 2097152
    // r.end == 2621439
    @endcode

    @param requested A validated range within the object.

    @param size The size of the object. Must not be zero.

    @param first_request `true` if this is the first
    request of the stream.

    @param policy The sizing constants.

    @return A range satisfying `start <= end < size`.
*/
AUDIOSTREAM_DECL
byte_range
optimize_range(
    byte_range requested,
    std::uint64_t size,
    bool first_request,
    chunk_policy const& policy = {}) noexcept;

} // audiostream

#endif
