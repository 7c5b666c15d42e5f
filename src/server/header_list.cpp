//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <audiostream/server/header_list.hpp>
#include <algorithm>
#include <cctype>

namespace audiostream {

namespace {

bool
iequals(
    core::string_view a,
    core::string_view b) noexcept
{
    if(a.size() != b.size())
        return false;
    for(std::size_t i = 0; i < a.size(); ++i)
    {
        if( std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    }
    return true;
}

} // (anon)

std::vector<header_list::value_type>::iterator
header_list::
find(core::string_view name) noexcept
{
    return std::find_if(v_.begin(), v_.end(),
        [name](value_type const& f)
        {
            return iequals(f.first, name);
        });
}

header_list&
header_list::
set(core::string_view name, core::string_view value)
{
    auto it = find(name);
    if(it != v_.end())
    {
        it->second.assign(value.data(), value.size());
        return *this;
    }
    v_.emplace_back(
        std::string(name), std::string(value));
    return *this;
}

header_list&
header_list::
append(core::string_view name, core::string_view value)
{
    auto it = find(name);
    if(it == v_.end())
    {
        v_.emplace_back(
        std::string(name), std::string(value));
        return *this;
    }
    it->second += ", ";
    it->second.append(value.data(), value.size());
    return *this;
}

bool
header_list::
erase(core::string_view name) noexcept
{
    auto it = find(name);
    if(it == v_.end())
        return false;
    v_.erase(it);
    return true;
}

core::string_view
header_list::
value_or(
    core::string_view name,
    core::string_view def) const noexcept
{
    for(auto const& f : v_)
        if(iequals(f.first, name))
            return f.second;
    return def;
}

bool
header_list::
contains(core::string_view name) const noexcept
{
    return std::any_of(v_.begin(), v_.end(),
        [name](value_type const& f)
        {
            return iequals(f.first, name);
        });
}

} // audiostream
