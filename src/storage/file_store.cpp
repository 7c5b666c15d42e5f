//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <audiostream/storage/file_store.hpp>
#include <audiostream/server/mime_types.hpp>
#include <audiostream/error.hpp>
#include <algorithm>
#include <cerrno>
#include <filesystem>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace audiostream {

namespace {

// Reject names that could escape the root
bool
is_valid_name(core::string_view name) noexcept
{
    if(name.empty() || name.front() == '/')
        return false;
    if(name.find('\0') != core::string_view::npos)
        return false;

    std::size_t pos = 0;
    for(;;)
    {
        auto const next = name.find('/', pos);
        auto const seg = name.substr(pos,
            next == core::string_view::npos ?
                core::string_view::npos : next - pos);
        if(seg == "..")
            return false;
        if(next == core::string_view::npos)
        {
            // dotfiles are never served
            if(seg.empty() || seg.front() == '.')
                return false;
            return true;
        }
        pos = next + 1;
    }
}

// Append an object name to the root directory.
void
path_cat(
    std::string& result,
    core::string_view prefix,
    core::string_view suffix)
{
    result = prefix;
    char constexpr path_separator = '/';
    if(! result.empty() && result.back() == path_separator)
        result.resize(result.size() - 1);
    result.push_back(path_separator);
    result.append(suffix.data(), suffix.size());
}

class file_source : public byte_source
{
    int fd_;
    std::uint64_t pos_;
    std::uint64_t end_;

public:
    file_source(
        int fd,
        byte_range range) noexcept
        : fd_(fd)
        , pos_(range.start)
        , end_(range.end + 1)
    {
    }

    ~file_source()
    {
        ::close(fd_);
    }

    file_source(file_source const&) = delete;
    file_source& operator=(file_source const&) = delete;

    std::size_t
    read(
        void* dest,
        std::size_t n,
        system::error_code& ec) override
    {
        ec = {};
        auto const want = static_cast<std::size_t>(
            (std::min)(static_cast<std::uint64_t>(n), end_ - pos_));
        if(want == 0)
            return 0;

        for(;;)
        {
            auto const result = ::pread(
                fd_, dest, want, static_cast<off_t>(pos_));
            if(result == -1)
            {
                if(errno == EINTR)
                    continue;
                ec.assign(errno, system::generic_category());
                return 0;
            }
            if(result == 0)
            {
                // file shrank underneath us
                ec = AUDIOSTREAM_ERR(error::object_not_found);
                return 0;
            }
            pos_ += static_cast<std::uint64_t>(result);
            return static_cast<std::size_t>(result);
        }
    }
};

} // (anon)

file_store::
file_store(core::string_view root)
    : root_(root)
{
}

system::result<object_metadata>
file_store::
get_metadata(core::string_view name)
{
    if(! is_valid_name(name))
        return AUDIOSTREAM_ERR(error::invalid_name);

    std::string path;
    path_cat(path, root_, name);

    std::error_code fec;
    if(! std::filesystem::is_regular_file(path, fec))
        return AUDIOSTREAM_ERR(error::object_not_found);

    auto const size = std::filesystem::file_size(path, fec);
    if(fec)
        return system::error_code(fec);

    object_metadata md;
    md.size = size;
    auto const type = mime_types::lookup(name);
    if(! type.empty())
        md.content_type = std::string(type);
    return md;
}

system::result<std::unique_ptr<byte_source>>
file_store::
get_range(
    core::string_view name,
    byte_range range)
{
    if(! is_valid_name(name))
        return AUDIOSTREAM_ERR(error::invalid_name);
    if(range.start > range.end)
        return AUDIOSTREAM_ERR(error::unsatisfiable_range);

    std::string path;
    path_cat(path, root_, name);

    int fd;
    for(;;)
    {
        fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
        if(fd != -1)
            break;
        if(errno == EINTR)
            continue;
        if(errno == ENOENT || errno == ENOTDIR)
            return AUDIOSTREAM_ERR(error::object_not_found);
        return system::error_code(errno, system::generic_category());
    }

    std::unique_ptr<byte_source> src(
        new file_source(fd, range));

    struct stat st;
    if(::fstat(fd, &st) != 0)
        return system::error_code(errno, system::generic_category());
    if(! S_ISREG(st.st_mode))
        return AUDIOSTREAM_ERR(error::object_not_found);
    if(range.end >= static_cast<std::uint64_t>(st.st_size))
        return AUDIOSTREAM_ERR(error::unsatisfiable_range);

    return src;
}

} // audiostream
