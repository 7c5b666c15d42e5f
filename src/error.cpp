//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <audiostream/error.hpp>

namespace audiostream {
namespace detail {

const char*
error_cat_type::
name() const noexcept
{
    return "audiostream";
}

std::string
error_cat_type::
message(int ev) const
{
    return message(ev, nullptr, 0);
}

char const*
error_cat_type::
message(
    int ev,
    char*,
    std::size_t) const noexcept
{
    switch(static_cast<error>(ev))
    {
    case error::ok: return "success";
    case error::missing_parameter: return "missing parameter";
    case error::unsatisfiable_range: return "unsatisfiable range";
    case error::metadata_unavailable: return "metadata unavailable";
    case error::object_not_found: return "object not found";
    case error::rate_exceeded: return "rate exceeded";
    case error::invalid_signature: return "invalid signature";
    case error::link_expired: return "link expired";
    case error::invalid_name: return "invalid object name";
    case error::internal: return "internal error";
    default:
        return "unknown";
    }
}

#if defined(__cpp_constinit) && __cpp_constinit >= 201907L
constinit error_cat_type error_cat;
#else
error_cat_type error_cat;
#endif

} // detail

unsigned
to_status(system::error_code const& ec) noexcept
{
    if(! ec)
        return 200;
    if(ec.category() != detail::error_cat)
        return 500;

    switch(static_cast<error>(ec.value()))
    {
    case error::missing_parameter:
        return 400;
    case error::unsatisfiable_range:
        return 416;
    case error::object_not_found:
    case error::invalid_name:
        return 404;
    case error::rate_exceeded:
        return 429;
    case error::invalid_signature:
    case error::link_expired:
        return 403;
    case error::metadata_unavailable:
    case error::internal:
    default:
        return 500;
    }
}

} // audiostream
