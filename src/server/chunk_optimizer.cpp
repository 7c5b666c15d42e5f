//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <audiostream/server/chunk_optimizer.hpp>
#include <boost/assert.hpp>
#include <algorithm>

namespace audiostream {

size_tier
classify_size(
    std::uint64_t size,
    chunk_policy const& policy) noexcept
{
    if(size < policy.medium_threshold)
        return size_tier::small;
    if(size < policy.large_threshold)
        return size_tier::medium;
    return size_tier::large;
}

std::uint64_t
initial_chunk_size(
    size_tier tier,
    chunk_policy const& policy) noexcept
{
    switch(tier)
    {
    case size_tier::small:
        return policy.initial_small;
    case size_tier::medium:
        return policy.initial_medium;
    case size_tier::large:
    default:
        return policy.initial_large;
    }
}

std::uint64_t
optimal_chunk_size(
    size_tier tier,
    chunk_policy const& policy) noexcept
{
    switch(tier)
    {
    case size_tier::small:
        return policy.chunk_small;
    case size_tier::medium:
        return policy.chunk_medium;
    case size_tier::large:
    default:
        return policy.chunk_large;
    }
}

byte_range
optimize_range(
    byte_range requested,
    std::uint64_t size,
    bool first_request,
    chunk_policy const& policy) noexcept
{
    BOOST_ASSERT(size > 0);
    BOOST_ASSERT(requested.start <= requested.end);
    BOOST_ASSERT(requested.end < size);

    auto const last = size - 1;
    auto const tier = classify_size(size, policy);

    if(first_request && requested.start == 0)
    {
        auto const n = (std::max)(
            initial_chunk_size(tier, policy),
            std::uint64_t(1));
        return { 0, (std::min)(n, last) };
    }

    auto const chunk = optimal_chunk_size(tier, policy);
    if( requested.size() < chunk &&
        requested.end < last)
    {
        // expand forward, never past the last byte
        auto end = last;
        if(chunk - 1 < last - requested.start)
            end = requested.start + chunk - 1;
        return { requested.start, end };
    }

    return requested;
}

} // audiostream
