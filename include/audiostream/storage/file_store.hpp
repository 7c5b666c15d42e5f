//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef AUDIOSTREAM_STORAGE_FILE_STORE_HPP
#define AUDIOSTREAM_STORAGE_FILE_STORE_HPP

#include <audiostream/detail/config.hpp>
#include <audiostream/storage/object_store.hpp>
#include <string>

namespace audiostream {

/** An object store backed by a directory.

    Object names are relative paths below the root
    directory, using `/` as the separator. Names that
    are empty, absolute, contain a `..` segment or a
    NUL, or whose last segment starts with a dot are
    rejected with @ref error::invalid_name.

    The content type of an object is derived from its
    extension.

    @par Example
    @code
    file_store fs( "/srv/audio" );
    auto md = fs.get_metadata( "albums/intro.mp3" );
    @endcode
*/
class AUDIOSTREAM_DECL file_store
    : public object_store
{
    std::string root_;

public:
    /** Construct a store serving files below `root`.
    */
    explicit file_store(core::string_view root);

    system::result<object_metadata>
    get_metadata(core::string_view name) override;

    system::result<std::unique_ptr<byte_source>>
    get_range(
        core::string_view name,
        byte_range range) override;

    std::string const&
    root() const noexcept
    {
        return root_;
    }
};

} // audiostream

#endif
