//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <audiostream/storage/memory_store.hpp>
#include <audiostream/error.hpp>
#include <algorithm>
#include <cstring>
#include <string_view>
#include <utility>

namespace audiostream {

namespace {

class memory_source : public byte_source
{
    std::shared_ptr<std::string const> data_;
    std::size_t pos_;
    std::size_t end_;

public:
    memory_source(
        std::shared_ptr<std::string const> data,
        byte_range range) noexcept
        : data_(std::move(data))
        , pos_(static_cast<std::size_t>(range.start))
        , end_(static_cast<std::size_t>(range.end) + 1)
    {
    }

    std::size_t
    read(
        void* dest,
        std::size_t n,
        system::error_code& ec) override
    {
        ec = {};
        auto const k = (std::min)(n, end_ - pos_);
        if(k == 0)
            return 0;
        std::memcpy(dest, data_->data() + pos_, k);
        pos_ += k;
        return k;
    }
};

std::string_view
key(core::string_view name) noexcept
{
    return std::string_view(name.data(), name.size());
}

} // (anon)

void
memory_store::
put(
    std::string name,
    std::string data,
    std::optional<std::string> content_type)
{
    object obj;
    obj.data = std::make_shared<std::string const>(std::move(data));
    obj.content_type = std::move(content_type);

    std::lock_guard<std::mutex> lock(m_);
    objects_.insert_or_assign(std::move(name), std::move(obj));
}

bool
memory_store::
erase(core::string_view name)
{
    std::lock_guard<std::mutex> lock(m_);
    auto it = objects_.find(key(name));
    if(it == objects_.end())
        return false;
    objects_.erase(it);
    return true;
}

system::result<object_metadata>
memory_store::
get_metadata(core::string_view name)
{
    std::lock_guard<std::mutex> lock(m_);
    auto it = objects_.find(key(name));
    if(it == objects_.end())
        return AUDIOSTREAM_ERR(error::object_not_found);

    object_metadata md;
    md.size = it->second.data->size();
    md.content_type = it->second.content_type;
    return md;
}

system::result<std::unique_ptr<byte_source>>
memory_store::
get_range(
    core::string_view name,
    byte_range range)
{
    std::shared_ptr<std::string const> data;
    {
        std::lock_guard<std::mutex> lock(m_);
        auto it = objects_.find(key(name));
        if(it == objects_.end())
            return AUDIOSTREAM_ERR(error::object_not_found);
        data = it->second.data;
    }

    if( range.start > range.end ||
        range.end >= data->size())
        return AUDIOSTREAM_ERR(error::unsatisfiable_range);

    return std::unique_ptr<byte_source>(
        new memory_source(std::move(data), range));
}

} // audiostream
