//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef AUDIOSTREAM_TEST_HELPERS_HPP
#define AUDIOSTREAM_TEST_HELPERS_HPP

#include <boost/core/lightweight_test.hpp>
#include <cstdio>

// Defines main() for a test executable holding one suite.
#define TEST_SUITE(type, name) \
    int main() \
    { \
        std::printf("%s\n", name); \
        type().run(); \
        return ::boost::report_errors(); \
    }

#endif
