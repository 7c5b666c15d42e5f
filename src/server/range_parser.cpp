//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <audiostream/server/range_parser.hpp>
#include <audiostream/error.hpp>
#include <charconv>

namespace audiostream {

namespace {

bool
is_ws( char c ) noexcept
{
    return c == ' ' || c == '\t';
}

// Trim surrounding whitespace
void
trim_ws( core::string_view& s ) noexcept
{
    while( ! s.empty() && is_ws( s.front() ) )
        s.remove_prefix( 1 );
    while( ! s.empty() && is_ws( s.back() ) )
        s.remove_suffix( 1 );
}

bool
is_digit( char c ) noexcept
{
    return c >= '0' && c <= '9';
}

// Parse an optional run of digits.
// Returns false on overflow.
bool
parse_bound(
    core::string_view& s,
    bool& present,
    std::uint64_t& out ) noexcept
{
    std::size_t n = 0;
    while( n < s.size() && is_digit( s[n] ) )
        ++n;
    present = n > 0;
    if( ! present )
        return true;

    auto const* begin = s.data();
    auto [ptr, ec] = std::from_chars( begin, begin + n, out );
    if( ec != std::errc() || ptr != begin + n )
        return false;

    s.remove_prefix( n );
    return true;
}

} // (anon)

system::result<byte_range>
parse_range( std::uint64_t size, core::string_view header )
{
    trim_ws( header );

    constexpr core::string_view prefix = "bytes=";
    if( ! header.starts_with( prefix ) )
        return AUDIOSTREAM_ERR( error::unsatisfiable_range );
    header.remove_prefix( prefix.size() );

    bool has_start;
    std::uint64_t start = 0;
    if( ! parse_bound( header, has_start, start ) )
        return AUDIOSTREAM_ERR( error::unsatisfiable_range );

    if( header.empty() || header.front() != '-' )
        return AUDIOSTREAM_ERR( error::unsatisfiable_range );
    header.remove_prefix( 1 ); // consume '-'

    bool has_end;
    std::uint64_t end = 0;
    if( ! parse_bound( header, has_end, end ) )
        return AUDIOSTREAM_ERR( error::unsatisfiable_range );

    // one interval only
    if( ! header.empty() )
        return AUDIOSTREAM_ERR( error::unsatisfiable_range );

    if( ! has_start )
        start = 0;
    if( ! has_end )
    {
        if( size == 0 )
            return AUDIOSTREAM_ERR( error::unsatisfiable_range );
        end = size - 1;
    }

    if( start >= size || end >= size || start > end )
        return AUDIOSTREAM_ERR( error::unsatisfiable_range );

    return byte_range{ start, end };
}

} // audiostream
