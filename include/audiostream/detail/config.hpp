//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef AUDIOSTREAM_DETAIL_CONFIG_HPP
#define AUDIOSTREAM_DETAIL_CONFIG_HPP

#include <boost/config.hpp>
#include <stdint.h>

namespace audiostream {

//------------------------------------------------

# if (defined(AUDIOSTREAM_DYN_LINK) || defined(BOOST_ALL_DYN_LINK)) && !defined(AUDIOSTREAM_STATIC_LINK)
#  if defined(AUDIOSTREAM_SOURCE)
#   define AUDIOSTREAM_DECL        BOOST_SYMBOL_EXPORT
#   define AUDIOSTREAM_BUILD_DLL
#  else
#   define AUDIOSTREAM_DECL        BOOST_SYMBOL_IMPORT
#  endif
# endif // shared lib

# ifndef  AUDIOSTREAM_DECL
#  define AUDIOSTREAM_DECL
# endif

#if defined(__MINGW32__)
    #define AUDIOSTREAM_SYMBOL_VISIBLE AUDIOSTREAM_DECL
#else
    #define AUDIOSTREAM_SYMBOL_VISIBLE BOOST_SYMBOL_VISIBLE
#endif

//-----------------------------------------------

// Add source location to error codes
#ifdef AUDIOSTREAM_NO_SOURCE_LOCATION
# define AUDIOSTREAM_ERR(ev) (::boost::system::error_code(ev))
#else
# define AUDIOSTREAM_ERR(ev) ( \
    ::boost::system::error_code( (ev), [] { \
    static constexpr auto loc((BOOST_CURRENT_LOCATION)); \
    return &loc; }()))
#endif

} // audiostream

// lift the Boost namespaces we use into ours
namespace boost {
namespace core {}
namespace system {}
namespace urls {}
namespace json {}
} // boost

namespace audiostream {
namespace core = ::boost::core;
namespace system = ::boost::system;
namespace urls = ::boost::urls;
namespace json = ::boost::json;
} // audiostream

#endif
