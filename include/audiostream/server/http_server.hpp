//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef AUDIOSTREAM_SERVER_HTTP_SERVER_HPP
#define AUDIOSTREAM_SERVER_HTTP_SERVER_HPP

#include <audiostream/detail/config.hpp>
#include <audiostream/server/rate_limiter.hpp>
#include <audiostream/server/stream_handler.hpp>
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

namespace audiostream {

/** Options for the HTTP transport.
*/
struct server_options
{
    /// Address to listen on.
    std::string address = "0.0.0.0";

    /// Port to listen on. Zero picks an ephemeral port.
    unsigned short port = 8080;

    /// Number of threads running the I/O context.
    unsigned threads = 1;

    /// Timeout applied to each read and write.
    std::chrono::seconds io_timeout{30};

    /// Interval between sweeps of stale limiter entries.
    std::chrono::seconds cleanup_interval{60};

    /// Size of each body write.
    std::size_t chunk_size = 64 * 1024;

    /// Largest request body accepted.
    std::size_t body_limit = 64 * 1024;
};

/** An HTTP/1.1 server which feeds a stream handler.

    The server accepts connections, reads each request,
    passes it to the handler and writes the response.
    Bodies are drained from the handler's byte source
    in bounded chunks; a failed write releases the
    source so no more storage reads are issued.

    @par Example
    @code
    auto h = std::make_shared< stream_handler >( store, limiter );
    http_server srv( {}, h, limiter );
    srv.run();
    @endcode
*/
class AUDIOSTREAM_DECL http_server
{
    struct impl;
    std::unique_ptr<impl> impl_;

public:
    /** Construct a server and bind its listening socket.

        @param opts The transport options.

        @param handler The handler invoked for each request.

        @param limiter The limiter swept periodically, or null.

        @throws system::system_error if the address cannot
        be bound.
    */
    http_server(
        server_options opts,
        std::shared_ptr<stream_handler const> handler,
        std::shared_ptr<fixed_window_limiter> limiter = nullptr);

    ~http_server();

    http_server(http_server const&) = delete;
    http_server& operator=(http_server const&) = delete;

    /** Run the server until @ref stop is called.

        The calling thread is one of the I/O threads.
        `SIGINT` and `SIGTERM` also stop the server.
    */
    void run();

    /** Stop the server.

        This function may be called from any thread.
    */
    void stop() noexcept;

    /** Return the port the server is listening on.
    */
    unsigned short port() const noexcept;
};

} // audiostream

#endif
