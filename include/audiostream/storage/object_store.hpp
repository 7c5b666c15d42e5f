//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef AUDIOSTREAM_STORAGE_OBJECT_STORE_HPP
#define AUDIOSTREAM_STORAGE_OBJECT_STORE_HPP

#include <audiostream/detail/config.hpp>
#include <audiostream/server/range_parser.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/result.hpp>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace audiostream {

/** Metadata reported by storage for one object.
*/
struct object_metadata
{
    /// Size of the object in bytes.
    std::uint64_t size = 0;

    /// Content type recorded by storage, if any.
    std::optional<std::string> content_type;
};

/** A readable sequence of bytes produced by storage.

    The bytes of one range are delivered by repeated
    calls to @ref read. Destroying the source abandons
    any bytes not yet read.
*/
class byte_source
{
public:
    virtual ~byte_source() = default;

    /** Read up to `n` bytes into `dest`.

        @param dest The destination buffer.

        @param n The size of the destination buffer.

        @param ec Set to the error, if any occurred.

        @return The number of bytes read, or zero when
        the source is exhausted or on error.
    */
    virtual
    std::size_t
    read(
        void* dest,
        std::size_t n,
        system::error_code& ec) = 0;
};

/** The storage gateway consumed by the stream handler.

    Implementations adapt a backing store such as a
    directory, memory, or an object-storage service.
    Calls may block and may be made concurrently from
    several threads. Failures are reported, never
    retried by the caller.
*/
class object_store
{
public:
    virtual ~object_store() = default;

    /** Return the size and content type of an object.
    */
    virtual
    system::result<object_metadata>
    get_metadata(core::string_view name) = 0;

    /** Open a byte range of an object for reading.

        @param name The object name.

        @param range A range within the object.

        @return A source producing exactly the bytes of
        `range`, or an error.
    */
    virtual
    system::result<std::unique_ptr<byte_source>>
    get_range(
        core::string_view name,
        byte_range range) = 0;
};

} // audiostream

#endif
