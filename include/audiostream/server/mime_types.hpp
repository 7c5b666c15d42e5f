//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef AUDIOSTREAM_SERVER_MIME_TYPES_HPP
#define AUDIOSTREAM_SERVER_MIME_TYPES_HPP

#include <audiostream/detail/config.hpp>
#include <boost/core/detail/string_view.hpp>
#include <optional>
#include <string>

namespace audiostream {

/** MIME type lookup for audio objects.

    @par Example
    @code
    auto type = mime_types::lookup( "album/track01.FLAC" );
    // type == "audio/flac"

    auto ct = mime_types::content_type( "clip.bin", std::nullopt );
    // ct == "audio/mpeg"
    @endcode
*/
namespace mime_types {

/// The type used when nothing better is known.
constexpr char const* default_type = "audio/mpeg";

/** Look up a MIME type by file path or extension.

    The extension is the text after the last dot, or
    the whole string when there is no dot. The lookup
    is case-insensitive and covers `mp3`, `wav`, `ogg`,
    `flac` and `m4a`.

    @param path_or_ext A file path (e.g. "song.mp3") or
    extension (e.g. ".mp3" or "mp3").

    @return The MIME type string, or an empty string if
    the extension is not recognized.
*/
AUDIOSTREAM_DECL
core::string_view
lookup(core::string_view path_or_ext) noexcept;

/** Choose the Content-Type for an object.

    The extension of `name` wins. Otherwise the type
    reported by storage is used, and failing that
    @ref default_type.

    @param name The object name.

    @param stored The content type reported by storage.

    @return The Content-Type header value.
*/
AUDIOSTREAM_DECL
std::string
content_type(
    core::string_view name,
    std::optional<std::string> const& stored);

} // mime_types
} // audiostream

#endif
