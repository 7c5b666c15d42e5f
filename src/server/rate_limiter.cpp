//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <audiostream/server/rate_limiter.hpp>
#include <utility>

namespace audiostream {

fixed_window_limiter::
fixed_window_limiter(
    rate_limit_options const& options)
    : fixed_window_limiter(
        options,
        []{ return clock_type::now(); })
{
}

fixed_window_limiter::
fixed_window_limiter(
    rate_limit_options const& options,
    std::function<time_point()> now)
    : options_(options)
    , now_(std::move(now))
{
}

bool
fixed_window_limiter::
admit(core::string_view id)
{
    auto const now = now_();
    std::lock_guard<std::mutex> lock(m_);

    auto it = entries_.find(std::string(id));
    if( it == entries_.end() ||
        now > it->second.reset_at)
    {
        entry e;
        e.count = 1;
        e.reset_at = now + options_.window;
        entries_.insert_or_assign(std::string(id), e);
        return true;
    }

    auto& e = it->second;
    if(e.count >= options_.limit)
        return false;
    ++e.count;
    return true;
}

std::chrono::seconds
fixed_window_limiter::
retry_after(core::string_view id)
{
    auto const now = now_();
    std::lock_guard<std::mutex> lock(m_);

    auto it = entries_.find(std::string(id));
    if( it == entries_.end() ||
        now > it->second.reset_at ||
        it->second.count < options_.limit)
        return std::chrono::seconds(0);

    // round up so clients never retry early
    auto const remain = it->second.reset_at - now;
    auto s = std::chrono::duration_cast<
        std::chrono::seconds>(remain);
    if(s < remain || s.count() == 0)
        ++s;
    return s;
}

std::size_t
fixed_window_limiter::
cleanup()
{
    auto const now = now_();
    std::lock_guard<std::mutex> lock(m_);

    std::size_t n = 0;
    for(auto it = entries_.begin(); it != entries_.end();)
    {
        if(now > it->second.reset_at)
        {
            it = entries_.erase(it);
            ++n;
        }
        else
        {
            ++it;
        }
    }
    return n;
}

std::size_t
fixed_window_limiter::
size() const
{
    std::lock_guard<std::mutex> lock(m_);
    return entries_.size();
}

} // audiostream
