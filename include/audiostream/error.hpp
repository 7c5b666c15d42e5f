//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef AUDIOSTREAM_ERROR_HPP
#define AUDIOSTREAM_ERROR_HPP

#include <audiostream/detail/config.hpp>
#include <boost/assert/source_location.hpp>
#include <boost/system/error_category.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/is_error_code_enum.hpp>
#include <system_error>

namespace audiostream {

/** Error codes returned by the stream service.

    Each value corresponds to one way a request can
    fail. Use @ref to_status to obtain the HTTP status
    code sent to the client for a given error.
*/
enum class error
{
    /// Success
    ok = 0,

    /// A required query parameter is missing or empty
    missing_parameter,

    /// The Range header is malformed or out of bounds
    unsatisfiable_range,

    /// The backend cannot report the size of the object
    metadata_unavailable,

    /// The backend has no bytes to return for the object
    object_not_found,

    /// The client exceeded its request allowance
    rate_exceeded,

    /// The request signature is missing or does not match
    invalid_signature,

    /// The signed link is past its expiry time
    link_expired,

    /// The object name cannot be mapped to a storage key
    invalid_name,

    /// Any other failure
    internal
};

} // audiostream

namespace boost {
namespace system {
template<>
struct is_error_code_enum<
    ::audiostream::error>
{
    static bool const value = true;
};
} // system
} // boost

namespace std {
template<>
struct is_error_code_enum<
    ::audiostream::error>
    : std::true_type {};
} // std

namespace audiostream {

namespace detail {

struct BOOST_SYMBOL_VISIBLE
    error_cat_type
    : system::error_category
{
    AUDIOSTREAM_DECL const char* name(
        ) const noexcept override;
    AUDIOSTREAM_DECL std::string message(
        int) const override;
    AUDIOSTREAM_DECL char const* message(
        int, char*, std::size_t
            ) const noexcept override;
    BOOST_SYSTEM_CONSTEXPR error_cat_type()
        : error_category(0x9d3e5a71c2b84f06)
    {
    }
};

AUDIOSTREAM_DECL extern
    error_cat_type error_cat;

} // detail

inline
BOOST_SYSTEM_CONSTEXPR
system::error_code
make_error_code(
    error ev) noexcept
{
    return system::error_code{
        static_cast<std::underlying_type<
            error>::type>(ev),
        detail::error_cat};
}

/** Return the HTTP status code for an error.

    Codes of the `audiostream` category map to the
    status listed for each enumerator. Any other
    failure maps to 500.

    @param ec The error to translate.

    @return The status code, or 200 if `ec` holds no error.
*/
AUDIOSTREAM_DECL
unsigned
to_status(system::error_code const& ec) noexcept;

} // audiostream

#endif
