//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef AUDIOSTREAM_SERVER_HEADER_LIST_HPP
#define AUDIOSTREAM_SERVER_HEADER_LIST_HPP

#include <audiostream/detail/config.hpp>
#include <boost/core/detail/string_view.hpp>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace audiostream {

/** An ordered list of response header fields.

    Field names are compared case-insensitively. Each
    name appears at most once when fields are added
    with @ref set.
*/
class AUDIOSTREAM_DECL header_list
{
public:
    using value_type = std::pair<std::string, std::string>;
    using const_iterator = std::vector<value_type>::const_iterator;

    /** Set a field, replacing any existing value.
    */
    header_list&
    set(core::string_view name, core::string_view value);

    /** Append to a comma-separated field.

        If the field is absent it is created.
    */
    header_list&
    append(core::string_view name, core::string_view value);

    /** Remove a field.

        @return `true` if the field was present.
    */
    bool
    erase(core::string_view name) noexcept;

    /** Return the value of a field, or an empty string.
    */
    core::string_view
    value_or(
        core::string_view name,
        core::string_view def = {}) const noexcept;

    /** Return `true` if the field is present.
    */
    bool
    contains(core::string_view name) const noexcept;

    std::size_t
    size() const noexcept
    {
        return v_.size();
    }

    bool
    empty() const noexcept
    {
        return v_.empty();
    }

    const_iterator
    begin() const noexcept
    {
        return v_.begin();
    }

    const_iterator
    end() const noexcept
    {
        return v_.end();
    }

private:
    std::vector<value_type>::iterator
    find(core::string_view name) noexcept;

    std::vector<value_type> v_;
};

} // audiostream

#endif
