//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef AUDIOSTREAM_LOGGING_HPP
#define AUDIOSTREAM_LOGGING_HPP

#include <audiostream/detail/config.hpp>
#include <boost/core/detail/string_view.hpp>

namespace audiostream {

/** Install the default logger.

    Replaces spdlog's default logger with a colored
    stdout logger at the named level.

    @param level One of `trace`, `debug`, `info`,
    `warn`, `error`, `critical` or `off`.

    @throws std::invalid_argument if the level is
    not recognized.
*/
AUDIOSTREAM_DECL
void
setup_logging(core::string_view level);

} // audiostream

#endif
