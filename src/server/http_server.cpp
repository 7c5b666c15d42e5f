//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <audiostream/server/http_server.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <csignal>
#include <optional>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

namespace audiostream {

namespace {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

request_method
to_method(http::verb v) noexcept
{
    switch(v)
    {
    case http::verb::get: return request_method::get;
    case http::verb::head: return request_method::head;
    case http::verb::options: return request_method::options;
    default:
        return request_method::other;
    }
}

template<class Body>
void
copy_head(
    http::response<Body>& res,
    response_descriptor const& rd,
    unsigned version,
    bool keep_alive)
{
    res.result(rd.status);
    res.version(version);
    for(auto const& f : rd.headers)
        res.set(f.first, f.second);
    res.keep_alive(keep_alive);
}

//------------------------------------------------

class session
    : public std::enable_shared_from_this<session>
{
    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    std::shared_ptr<server_options const> opts_;
    std::shared_ptr<stream_handler const> handler_;
    std::optional<http::request_parser<http::string_body>> parser_;

    // streaming state of the current response
    std::unique_ptr<byte_source> source_;
    std::uint64_t remaining_ = 0;
    std::vector<char> chunk_;
    std::optional<http::response<http::buffer_body>> res_;
    std::optional<http::response_serializer<http::buffer_body>> sr_;

public:
    session(
        tcp::socket&& socket,
        std::shared_ptr<server_options const> opts,
        std::shared_ptr<stream_handler const> handler)
        : stream_(std::move(socket))
        , opts_(std::move(opts))
        , handler_(std::move(handler))
        , chunk_(opts_->chunk_size)
    {
    }

    void
    start()
    {
        do_read();
    }

private:
    void
    do_read()
    {
        parser_.emplace();
        parser_->body_limit(opts_->body_limit);
        stream_.expires_after(opts_->io_timeout);
        http::async_read(stream_, buffer_, *parser_,
            beast::bind_front_handler(
                &session::on_read, shared_from_this()));
    }

    void
    on_read(beast::error_code ec, std::size_t)
    {
        if(ec == http::error::end_of_stream)
            return do_close();
        if(ec)
        {
            if(ec != beast::error::timeout)
                spdlog::debug("read failed from {}: {}",
                    remote_address(), ec.message());
            return;
        }

        auto const& req = parser_->get();
        stream_request sreq;
        sreq.method = to_method(req.method());
        sreq.target = std::string(req.target());
        auto it = req.find(http::field::range);
        if(it != req.end())
            sreq.range = std::string(it->value());
        sreq.client = remote_address();

        auto res = (*handler_)(sreq);
        send(std::move(res), req.version(), req.keep_alive(),
            sreq.method == request_method::head);
    }

    void
    send(
        stream_response res,
        unsigned version,
        bool keep_alive,
        bool head_only)
    {
        if(res.source && ! head_only)
        {
            source_ = std::move(res.source);
            remaining_ = res.head.content_length;
            res_.emplace();
            copy_head(*res_, res.head, version, keep_alive);
            res_->body().data = nullptr;
            res_->body().more = true;
            sr_.emplace(*res_);
            stream_.expires_after(opts_->io_timeout);
            http::async_write_header(stream_, *sr_,
                beast::bind_front_handler(
                    &session::on_write_header, shared_from_this()));
            return;
        }

        auto sp = std::make_shared<
            http::response<http::string_body>>();
        copy_head(*sp, res.head, version, keep_alive);
        if(! head_only)
            sp->body() = std::move(res.body);
        stream_.expires_after(opts_->io_timeout);
        http::async_write(stream_, *sp,
            beast::bind_front_handler(
                &session::on_write, shared_from_this(),
                sp->need_eof(), sp));
    }

    void
    on_write(
        bool close,
        std::shared_ptr<void>,
        beast::error_code ec,
        std::size_t)
    {
        if(ec)
        {
            spdlog::debug("write failed to {}: {}",
                remote_address(), ec.message());
            return;
        }
        if(close)
            return do_close();
        do_read();
    }

    void
    on_write_header(beast::error_code ec, std::size_t)
    {
        if(ec)
            return abandon(ec);
        write_chunk();
    }

    void
    write_chunk()
    {
        auto& body = res_->body();
        if(remaining_ == 0)
        {
            body.data = nullptr;
            body.size = 0;
            body.more = false;
        }
        else
        {
            auto const n = static_cast<std::size_t>(
                std::min<std::uint64_t>(chunk_.size(), remaining_));
            system::error_code ec;
            std::size_t got = 0;
            while(got < n)
            {
                auto const k = source_->read(
                    chunk_.data() + got, n - got, ec);
                if(ec || k == 0)
                    break;
                got += k;
            }
            if(ec || got == 0)
            {
                // the header is out, so the
                // connection cannot be reused
                spdlog::error("storage read failed with {} bytes left: {}",
                    remaining_, ec ? ec.message() : "short body");
                source_.reset();
                beast::error_code ignored;
                stream_.socket().shutdown(
                    tcp::socket::shutdown_both, ignored);
                return;
            }
            remaining_ -= got;
            body.data = chunk_.data();
            body.size = got;
            body.more = remaining_ > 0;
        }
        stream_.expires_after(opts_->io_timeout);
        http::async_write(stream_, *sr_,
            beast::bind_front_handler(
                &session::on_write_chunk, shared_from_this()));
    }

    void
    on_write_chunk(beast::error_code ec, std::size_t)
    {
        if(ec == http::error::need_buffer)
            ec = {};
        if(ec)
            return abandon(ec);
        if(! sr_->is_done())
            return write_chunk();

        source_.reset();
        bool const close = res_->need_eof();
        sr_.reset();
        res_.reset();
        if(close)
            return do_close();
        do_read();
    }

    void
    abandon(beast::error_code const& ec)
    {
        spdlog::debug("client {} went away with {} bytes unsent: {}",
            remote_address(), remaining_, ec.message());
        source_.reset();
    }

    void
    do_close()
    {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    }

    std::string
    remote_address() const
    {
        beast::error_code ec;
        auto ep = stream_.socket().remote_endpoint(ec);
        if(ec)
            return "unknown";
        return ep.address().to_string();
    }
};

} // (anon)

//------------------------------------------------

struct http_server::impl
{
    std::shared_ptr<server_options const> opts;
    std::shared_ptr<stream_handler const> handler;
    std::shared_ptr<fixed_window_limiter> limiter;
    net::io_context ioc;
    tcp::acceptor acceptor;
    net::steady_timer sweep;
    net::signal_set signals;

    impl(
        server_options opts_,
        std::shared_ptr<stream_handler const> handler_,
        std::shared_ptr<fixed_window_limiter> limiter_)
        : opts(std::make_shared<server_options const>(
            std::move(opts_)))
        , handler(std::move(handler_))
        , limiter(std::move(limiter_))
        , ioc(static_cast<int>(std::max(opts->threads, 1u)))
        , acceptor(ioc)
        , sweep(ioc)
        , signals(ioc, SIGINT, SIGTERM)
    {
        tcp::endpoint const ep(
            net::ip::make_address(opts->address), opts->port);
        acceptor.open(ep.protocol());
        acceptor.set_option(net::socket_base::reuse_address(true));
        acceptor.bind(ep);
        acceptor.listen(net::socket_base::max_listen_connections);
    }

    void
    do_accept()
    {
        acceptor.async_accept(
            net::make_strand(ioc),
            beast::bind_front_handler(
                &impl::on_accept, this));
    }

    void
    on_accept(beast::error_code ec, tcp::socket socket)
    {
        if(ec == net::error::operation_aborted)
            return;
        if(ec)
            spdlog::error("accept failed: {}", ec.message());
        else
            std::make_shared<session>(
                std::move(socket), opts, handler)->start();
        do_accept();
    }

    void
    schedule_sweep()
    {
        if(! limiter)
            return;
        sweep.expires_after(opts->cleanup_interval);
        sweep.async_wait(
            [this](beast::error_code const& ec)
            {
                if(ec)
                    return;
                auto const n = limiter->cleanup();
                if(n > 0)
                    spdlog::debug("removed {} stale rate limit entries", n);
                schedule_sweep();
            });
    }
};

http_server::
http_server(
    server_options opts,
    std::shared_ptr<stream_handler const> handler,
    std::shared_ptr<fixed_window_limiter> limiter)
    : impl_(new impl(
        std::move(opts), std::move(handler), std::move(limiter)))
{
    if(! impl_->handler)
        throw std::invalid_argument("http_server: null handler");
}

http_server::
~http_server() = default;

void
http_server::
run()
{
    impl_->signals.async_wait(
        [this](beast::error_code const& ec, int sig)
        {
            if(ec)
                return;
            spdlog::info("received signal {}, stopping", sig);
            stop();
        });
    impl_->do_accept();
    impl_->schedule_sweep();

    auto const n = std::max(impl_->opts->threads, 1u);
    spdlog::info("listening on {}:{} with {} thread(s)",
        impl_->opts->address, port(), n);

    std::vector<std::thread> v;
    v.reserve(n - 1);
    for(unsigned i = 1; i < n; ++i)
        v.emplace_back([this]{ impl_->ioc.run(); });
    impl_->ioc.run();
    for(auto& t : v)
        t.join();
}

void
http_server::
stop() noexcept
{
    impl_->ioc.stop();
}

unsigned short
http_server::
port() const noexcept
{
    beast::error_code ec;
    auto ep = impl_->acceptor.local_endpoint(ec);
    if(ec)
        return 0;
    return ep.port();
}

} // audiostream
