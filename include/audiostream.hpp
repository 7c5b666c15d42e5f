//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef AUDIOSTREAM_HPP
#define AUDIOSTREAM_HPP

#include <audiostream/config.hpp>
#include <audiostream/error.hpp>
#include <audiostream/logging.hpp>

#include <audiostream/server/chunk_optimizer.hpp>
#include <audiostream/server/cors.hpp>
#include <audiostream/server/encode_url.hpp>
#include <audiostream/server/header_list.hpp>
#include <audiostream/server/helmet.hpp>
#include <audiostream/server/http_server.hpp>
#include <audiostream/server/mime_types.hpp>
#include <audiostream/server/range_parser.hpp>
#include <audiostream/server/rate_limiter.hpp>
#include <audiostream/server/response_builder.hpp>
#include <audiostream/server/stream_handler.hpp>
#include <audiostream/server/url_signer.hpp>

#include <audiostream/storage/file_store.hpp>
#include <audiostream/storage/memory_store.hpp>
#include <audiostream/storage/object_store.hpp>

#endif
