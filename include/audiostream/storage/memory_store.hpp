//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef AUDIOSTREAM_STORAGE_MEMORY_STORE_HPP
#define AUDIOSTREAM_STORAGE_MEMORY_STORE_HPP

#include <audiostream/detail/config.hpp>
#include <audiostream/storage/object_store.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace audiostream {

/** An object store holding objects in memory.

    Readers share ownership of an object's bytes, so
    replacing or erasing an object does not disturb
    ranges already being read.

    @par Thread Safety
    All member functions may be called concurrently.
*/
class AUDIOSTREAM_DECL memory_store
    : public object_store
{
public:
    /** Add or replace an object.
    */
    void
    put(
        std::string name,
        std::string data,
        std::optional<std::string> content_type = std::nullopt);

    /** Remove an object.

        @return `true` if the object existed.
    */
    bool
    erase(core::string_view name);

    system::result<object_metadata>
    get_metadata(core::string_view name) override;

    system::result<std::unique_ptr<byte_source>>
    get_range(
        core::string_view name,
        byte_range range) override;

private:
    struct object
    {
        std::shared_ptr<std::string const> data;
        std::optional<std::string> content_type;
    };

    std::mutex m_;
    std::map<std::string, object, std::less<>> objects_;
};

} // audiostream

#endif
