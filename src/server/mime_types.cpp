//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <audiostream/server/mime_types.hpp>
#include <algorithm>
#include <cctype>

namespace audiostream {
namespace mime_types {

namespace {

struct ext_entry
{
    core::string_view ext;
    core::string_view type;
};

// Sorted by extension for binary search
constexpr ext_entry ext_db[] = {
    { "flac", "audio/flac" },
    { "m4a", "audio/mp4" },
    { "mp3", "audio/mpeg" },
    { "ogg", "audio/ogg" },
    { "wav", "audio/wav" },
};

constexpr std::size_t ext_db_size = sizeof( ext_db ) / sizeof( ext_db[0] );

// Case-insensitive comparison
int
compare_icase( core::string_view a, core::string_view b ) noexcept
{
    auto const n = ( std::min )( a.size(), b.size() );
    for( std::size_t i = 0; i < n; ++i )
    {
        auto const ca = static_cast<unsigned char>(
            std::tolower( static_cast<unsigned char>( a[i] ) ) );
        auto const cb = static_cast<unsigned char>(
            std::tolower( static_cast<unsigned char>( b[i] ) ) );
        if( ca < cb )
            return -1;
        if( ca > cb )
            return 1;
    }
    if( a.size() < b.size() )
        return -1;
    if( a.size() > b.size() )
        return 1;
    return 0;
}

// Extract extension from path
core::string_view
get_extension( core::string_view path ) noexcept
{
    auto const pos = path.rfind( '.' );
    if( pos == core::string_view::npos )
        return path; // Assume it's just an extension
    return path.substr( pos + 1 );
}

core::string_view
lookup_ext( core::string_view ext ) noexcept
{
    std::size_t lo = 0;
    std::size_t hi = ext_db_size;
    while( lo < hi )
    {
        auto const mid = lo + ( hi - lo ) / 2;
        auto const cmp = compare_icase( ext_db[mid].ext, ext );
        if( cmp < 0 )
            lo = mid + 1;
        else if( cmp > 0 )
            hi = mid;
        else
            return ext_db[mid].type;
    }
    return {};
}

} // (anon)

core::string_view
lookup( core::string_view path_or_ext ) noexcept
{
    if( path_or_ext.empty() )
        return {};

    return lookup_ext( get_extension( path_or_ext ) );
}

std::string
content_type(
    core::string_view name,
    std::optional<std::string> const& stored )
{
    auto const type = lookup( name );
    if( ! type.empty() )
        return std::string( type );
    if( stored && ! stored->empty() )
        return *stored;
    return default_type;
}

} // mime_types
} // audiostream
