//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <audiostream.hpp>
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>

int
main(int argc, char** argv)
{
    using namespace audiostream;

    if(argc > 2)
    {
        std::cerr <<
            "Usage: audiostream_server [<root>]\n"
            "Settings are read from AUDIOSTREAM_* variables.\n";
        return EXIT_FAILURE;
    }

    try
    {
        auto cfg = load_config();
        if(argc == 2)
            cfg.root = argv[1];
        setup_logging(cfg.log_level);

        auto store = std::make_shared<file_store>(cfg.root);
        auto limiter = std::make_shared<fixed_window_limiter>(
            cfg.rate_limit);
        auto handler = std::make_shared<stream_handler const>(
            store, limiter, cfg.stream);

        if(cfg.stream.signing_secret.empty())
            spdlog::warn("no signing secret set, links are not verified");
        spdlog::info("serving {} on route {}",
            store->root(), cfg.stream.response.route);

        http_server srv(cfg.server, handler, limiter);
        srv.run();
    }
    catch(std::exception const& e)
    {
        spdlog::critical("fatal: {}", e.what());
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
