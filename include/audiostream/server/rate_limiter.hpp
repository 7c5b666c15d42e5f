//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef AUDIOSTREAM_SERVER_RATE_LIMITER_HPP
#define AUDIOSTREAM_SERVER_RATE_LIMITER_HPP

#include <audiostream/detail/config.hpp>
#include <boost/core/detail/string_view.hpp>
#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>

namespace audiostream {

/** Admission control for inbound requests.

    Implementations decide whether a request from a
    given client identifier may proceed. They must be
    safe to call concurrently.
*/
class rate_limiter
{
public:
    virtual ~rate_limiter() = default;

    /** Record a request and decide whether to admit it.

        @param id The client identifier, such as the
        remote address.

        @return `true` if the request is admitted.
    */
    virtual bool admit(core::string_view id) = 0;

    /** Return how long a rejected client should wait.

        @return The time until `id` would be admitted
        again, or zero if it would be admitted now. A
        rejected client is never told to wait less than
        one second.
    */
    virtual std::chrono::seconds retry_after(core::string_view id) = 0;
};

/** Options for @ref fixed_window_limiter.
*/
struct rate_limit_options
{
    /// Admissions allowed per identifier and window.
    std::size_t limit = 30;

    /// Length of the window.
    std::chrono::seconds window{ 60 };
};

/** Fixed-window request counter keyed by identifier.

    The first request from an identifier opens a
    window of `options.window` and counts as one
    admission. Further requests are admitted until
    `options.limit` is reached; later ones are rejected
    without being counted. Once the current time is
    past the end of the window, the next request
    replaces the entry with a fresh window.

    Expired entries are replaced lazily. Call
    @ref cleanup periodically to drop identifiers that
    have gone quiet.

    @par Thread Safety
    All member functions may be called concurrently.
*/
class AUDIOSTREAM_DECL fixed_window_limiter
    : public rate_limiter
{
public:
    using clock_type = std::chrono::steady_clock;
    using time_point = clock_type::time_point;

    /** Construct a limiter using the steady clock.
    */
    explicit
    fixed_window_limiter(
        rate_limit_options const& options = {});

    /** Construct a limiter with a custom time source.

        @param options The limits to apply.

        @param now A function returning the current time.
    */
    fixed_window_limiter(
        rate_limit_options const& options,
        std::function<time_point()> now);

    bool admit(core::string_view id) override;

    std::chrono::seconds retry_after(core::string_view id) override;

    /** Remove every entry whose window has passed.

        @return The number of entries removed.
    */
    std::size_t cleanup();

    /** Return the number of tracked identifiers.
    */
    std::size_t size() const;

    rate_limit_options const&
    options() const noexcept
    {
        return options_;
    }

private:
    struct entry
    {
        std::size_t count = 0;
        time_point reset_at;
    };

    rate_limit_options options_;
    std::function<time_point()> now_;
    mutable std::mutex m_;
    std::unordered_map<std::string, entry> entries_;
};

} // audiostream

#endif
