/*
 * File: src/greet_http.hpp
 * Project: Greet Service
 * Purpose: HTTP routing and handlers
 * Notes:
 *  - GET/HEAD / and /health; everything else is a JSON 404
 *  - Handlers keep no shared state; each connection runs on its own strand
 *  - Bind failures surface as StartupError from the HttpServer constructor
 * Last updated: 2026-10-18
 */

#pragma once
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

#include "common/responses.hpp"
#include "greet_config.hpp"
#include "greet_log.hpp"
#include "greet_state.hpp"

namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

constexpr const char *SERVER_NAME = "greet-beast";
constexpr const char *JSON_CONTENT_TYPE = "application/json; charset=utf-8";
constexpr auto IDLE_TIMEOUT = std::chrono::seconds(30);
constexpr auto ACCEPT_BACKOFF = std::chrono::milliseconds(100);

struct StartupError : std::runtime_error
{
    using std::runtime_error::runtime_error;
};

using Request = http::request<http::string_body>;
using Response = http::response<http::string_body>;

// -------- routing --------

inline Response json_response(const Request &req, http::status status, std::string body)
{
    Response res{status, req.version()};
    res.set(http::field::server, SERVER_NAME);
    res.set(http::field::content_type, JSON_CONTENT_TYPE);
    res.keep_alive(req.keep_alive());
    res.body() = std::move(body);
    res.prepare_payload();
    return res;
}

inline Response handle_request(const Request &req)
{
    // HEAD is answered like GET; the session drops the body on the way out
    const bool readable = req.method() == http::verb::get || req.method() == http::verb::head;

    beast::string_view path = req.target();
    auto q = path.find('?');
    if (q != beast::string_view::npos)
        path = path.substr(0, q);

    // GET /
    if (readable && path == "/")
        return json_response(req, http::status::ok, greeting_to_json(make_greeting()).dump());

    // GET /health
    if (readable && path == "/health")
        return json_response(req, http::status::ok, health_to_json(HealthResponse{}).dump());

    // 404 fallback
    return json_response(req, http::status::not_found, R"({"error":"not found"})");
}

// -------- HTTP server --------

// Delay before re-arming accept after `ec`. A peer that gave up before we
// accepted is retried at once; anything else (EMFILE, ENFILE, ENOBUFS...)
// leaves the listen socket readable and would spin without a pause.
inline std::chrono::milliseconds accept_retry_delay(const beast::error_code &ec)
{
    if (!ec || ec == boost::asio::error::connection_aborted || ec == boost::asio::error::interrupted ||
        ec == boost::asio::error::try_again || ec == boost::asio::error::would_block)
        return std::chrono::milliseconds(0);
    return ACCEPT_BACKOFF;
}

class HttpServer
{
    boost::asio::io_context &ioc_;
    tcp::acceptor acceptor_;
    boost::asio::steady_timer retry_timer_;
    ServiceState &state_;

public:
    HttpServer(boost::asio::io_context &ioc, const ServiceConfig &cfg, ServiceState &s)
        : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), retry_timer_(acceptor_.get_executor()), state_(s)
    {
        const std::string where = cfg.host + ":" + std::to_string(cfg.port);

        beast::error_code ec;
        auto address = boost::asio::ip::make_address(cfg.host, ec);
        if (ec)
            throw StartupError("invalid listen address '" + cfg.host + "': " + ec.message());
        tcp::endpoint ep{address, cfg.port};

        acceptor_.open(ep.protocol(), ec);
        if (ec)
            throw StartupError("open " + where + " failed: " + ec.message());
        acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
        if (ec)
            throw StartupError("set reuse_address on " + where + " failed: " + ec.message());
        acceptor_.bind(ep, ec);
        if (ec)
            throw StartupError("bind " + where + " failed: " + ec.message());
        acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
        if (ec)
            throw StartupError("listen on " + where + " failed: " + ec.message());

        state_.phase = ServicePhase::serving;
        do_accept();
    }

    HttpServer(const HttpServer &) = delete;
    HttpServer &operator=(const HttpServer &) = delete;

    tcp::endpoint local_endpoint() const { return acceptor_.local_endpoint(); }
    unsigned short port() const { return local_endpoint().port(); }
    const ServiceState &state() const { return state_; }

    // Closes the listen socket on the acceptor's strand, then runs on_closed
    // there. Connections already open finish on their own.
    void stop(std::function<void()> on_closed = {})
    {
        boost::asio::dispatch(acceptor_.get_executor(), [this, on_closed = std::move(on_closed)]
                              {
            retry_timer_.cancel();
            beast::error_code ec;
            acceptor_.close(ec);
            if (ec)
                greet_log::warn("closing acceptor: " + ec.message());
            if (on_closed)
                on_closed(); });
    }

private:
    void do_accept()
    {
        acceptor_.async_accept(boost::asio::make_strand(ioc_), [this](beast::error_code ec, tcp::socket socket)
                               {
            if (ec == boost::asio::error::operation_aborted || !acceptor_.is_open())
                return;
            if (!ec)
                std::make_shared<Session>(std::move(socket))->run();
            else
                greet_log::warn("accept: " + ec.message());

            auto delay = accept_retry_delay(ec);
            if (delay.count() == 0)
                return do_accept();
            retry_timer_.expires_after(delay);
            retry_timer_.async_wait([this](beast::error_code tec)
                                    {
                if (tec == boost::asio::error::operation_aborted || !acceptor_.is_open())
                    return;
                do_accept(); }); });
    }

    struct Session : std::enable_shared_from_this<Session>
    {
        beast::tcp_stream stream;
        beast::flat_buffer buffer;
        Request req;

        explicit Session(tcp::socket &&s)
            : stream(std::move(s)) {}

        void run()
        {
            boost::asio::dispatch(stream.get_executor(), [self = shared_from_this()]
                                  { self->do_read(); });
        }

        void do_read()
        {
            req = {};
            stream.expires_after(IDLE_TIMEOUT);
            auto self = shared_from_this();
            http::async_read(stream, buffer, req, [self](beast::error_code ec, std::size_t)
                             { self->on_read(ec); });
        }

        void on_read(beast::error_code ec)
        {
            if (ec == http::error::end_of_stream)
                return do_close();
            if (ec)
            {
                if (ec != beast::error::timeout && ec != boost::asio::error::operation_aborted)
                    greet_log::warn("read: " + ec.message());
                return;
            }

            auto res = handle_request(req);
            if (req.method() == http::verb::head)
            {
                // same status and headers, Content-Length included; no body
                http::response<http::empty_body> head;
                head.base() = res.base();
                return respond(std::move(head));
            }
            respond(std::move(res));
        }

        // keep response alive through async_write
        template <class Body>
        void respond(http::response<Body> &&res)
        {
            auto self = shared_from_this();
            auto sp = std::make_shared<http::response<Body>>(std::move(res));

            http::async_write(stream, *sp, [self, sp](beast::error_code ec, std::size_t)
                              {
                if (ec)
                {
                    greet_log::warn("write: " + ec.message());
                    return;
                }
                if (sp->need_eof())
                    return self->do_close();
                self->do_read(); });
        }

        void do_close()
        {
            beast::error_code ignored;
            stream.socket().shutdown(tcp::socket::shutdown_send, ignored);
        }
    };
};
