//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <audiostream/logging.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <stdexcept>
#include <string>

namespace audiostream {

void
setup_logging(core::string_view level)
{
    std::string const name(level);
    auto const lvl = spdlog::level::from_str(name);
    // from_str maps unknown names to off
    if(lvl == spdlog::level::off && name != "off")
        throw std::invalid_argument(
            "unknown log level \"" + name + "\"");

    spdlog::drop("audiostream");
    auto logger = spdlog::stdout_color_mt("audiostream");
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    logger->set_level(lvl);
    spdlog::set_default_logger(std::move(logger));
}

} // audiostream
