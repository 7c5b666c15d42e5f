//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <audiostream/server/url_signer.hpp>
#include <audiostream/error.hpp>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <charconv>
#include <stdexcept>

namespace audiostream {

namespace {

constexpr char hex_chars[] = "0123456789abcdef";

std::string
hmac_hex(
    core::string_view key,
    core::string_view msg)
{
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    auto const* p = ::HMAC(
        EVP_sha256(),
        key.data(), static_cast<int>(key.size()),
        reinterpret_cast<unsigned char const*>(msg.data()), msg.size(),
        md, &len);
    if(! p)
        throw std::runtime_error("HMAC-SHA256 failed");

    std::string s;
    s.reserve(len * 2);
    for(unsigned int i = 0; i < len; ++i)
    {
        s.push_back(hex_chars[md[i] >> 4]);
        s.push_back(hex_chars[md[i] & 0x0F]);
    }
    return s;
}

std::string
make_message(
    core::string_view file,
    core::string_view expires)
{
    std::string m(file);
    m += ':';
    m.append(expires.data(), expires.size());
    return m;
}

} // (anon)

url_signer::
url_signer(core::string_view secret)
    : secret_(secret)
{
    if(secret_.empty())
        throw std::invalid_argument("url_signer: empty secret");
}

std::string
url_signer::
sign(
    core::string_view file,
    std::int64_t expires) const
{
    return hmac_hex(secret_,
        make_message(file, std::to_string(expires)));
}

system::error_code
url_signer::
verify(
    core::string_view file,
    core::string_view token,
    core::string_view expires,
    std::int64_t now) const
{
    if(token.empty() || expires.empty())
        return AUDIOSTREAM_ERR(error::invalid_signature);

    std::int64_t t = 0;
    auto const* end = expires.data() + expires.size();
    auto [ptr, ec] = std::from_chars(expires.data(), end, t);
    if(ec != std::errc() || ptr != end)
        return AUDIOSTREAM_ERR(error::invalid_signature);

    auto const expected = hmac_hex(secret_, make_message(file, expires));
    if( token.size() != expected.size() ||
        CRYPTO_memcmp(token.data(), expected.data(), expected.size()) != 0)
        return AUDIOSTREAM_ERR(error::invalid_signature);

    if(t <= now)
        return AUDIOSTREAM_ERR(error::link_expired);

    return {};
}

} // audiostream
