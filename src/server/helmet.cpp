//
// Copyright (c) 2025 Amlal El Mahrouss (amlal at nekernel dot org)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <audiostream/server/helmet.hpp>
#include <algorithm>

namespace audiostream {

namespace detail {

    auto joinHeaderValues(const std::vector<std::string>& fields_value) -> std::string
    {
        std::string cached_fields;

        for (const auto& field : fields_value)
        {
            if (!cached_fields.empty())
                cached_fields += "; ";
            cached_fields += field;
        }

        return cached_fields;
    }

}

helmet_options::helmet_options()
{
    this->set(x_content_type_options());
    this->set(x_frame_origin(helmet_origin_type::deny));
    this->set(referrer_policy(referrer_policy_type::strict_origin_when_cross_origin));
}

helmet_options::~helmet_options() = default;

helmet_options& helmet_options::set(const pair_type& helmet_hdr)
{
    if (helmet_hdr.first.empty())
        return *this;

    auto it_hdr = std::find_if(headers.begin(), headers.end(), [&helmet_hdr](const pair_type& pair) {
        return pair.first == helmet_hdr.first;
    });

    if (it_hdr != headers.end())
    {
        *it_hdr = helmet_hdr;

        return *this;
    }

    headers.emplace_back(helmet_hdr);
    return *this;
}

helmet::
helmet(
    helmet_options const& options)
{
    std::for_each(options.headers.begin(), options.headers.end(),
        [this] (const helmet_options::pair_type& hdr)
    {
        cached_headers_.emplace_back(hdr.first,
                                     detail::joinHeaderValues(hdr.second));
    });
}

void
helmet::
apply(header_list& h) const
{
    std::for_each(cached_headers_.begin(), cached_headers_.end(),
        [&h] (const std::pair<std::string, std::string>& hdr)
    {
        // An empty value means the header must not be sent
        if (hdr.second.empty())
        {
            h.erase(hdr.first);
        }
        else
        {
            h.set(hdr.first, hdr.second);
        }
    });
}

option_pair x_content_type_options()
{
    return {"X-Content-Type-Options", {"nosniff"}};
}

option_pair x_frame_origin(const helmet_origin_type& origin)
{
    if (origin == helmet_origin_type::sameorigin)
    {
        return {"X-Frame-Options", {"SAMEORIGIN"}};
    }
    else if (origin == helmet_origin_type::deny)
    {
        return {"X-Frame-Options", {"DENY"}};
    }
    return {};
}

option_pair referrer_policy(const referrer_policy_type& policy)
{
    std::string value;
    switch (policy)
    {
        case referrer_policy_type::no_referrer:
            value = "no-referrer";
            break;
        case referrer_policy_type::same_origin:
            value = "same-origin";
            break;
        case referrer_policy_type::strict_origin:
            value = "strict-origin";
            break;
        case referrer_policy_type::strict_origin_when_cross_origin:
            value = "strict-origin-when-cross-origin";
            break;
        default:
            return {};
    }
    return {"Referrer-Policy", {value}};
}

} // audiostream
