/*
 * File: src/inventory_http.hpp
 * Project: Book Inventory
 * Purpose: HTTP routing and handlers
 * Notes:
 *  - POST /addBook, GET /books/{id}, GET /health
 *  - handle_request() is transport-free; HttpServer only moves bytes
 *  - Sessions keep the connection open while the client asks for keep-alive
 * Last updated: 2026-10-19
 */

#pragma once
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio.hpp>
#include <boost/asio/strand.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "inventory_state.hpp"
#include "common/book.hpp" // Book, book_to_json, book_from_json

namespace http = boost::beast::http;

using HttpRequest = http::request<http::string_body>;
using HttpResponse = http::response<http::string_body>;

// -------- response helpers --------

inline HttpResponse json_response(const HttpRequest &req, http::status status, const nlohmann::json &body,
                                  const char *content_type = "application/json")
{
    HttpResponse res{status, req.version()};
    res.set(http::field::content_type, content_type);
    res.keep_alive(req.keep_alive());
    // request bytes echoed back (ids) may not be valid UTF-8
    res.body() = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    res.prepare_payload();
    return res;
}

// RFC 9457 problem details
inline HttpResponse problem_response(const HttpRequest &req, http::status status, const std::string &detail)
{
    nlohmann::json body{
        {"type", "https://tools.ietf.org/html/rfc9110#section-15.6.1"},
        {"title", "An error occurred while processing your request."},
        {"status", static_cast<unsigned>(status)},
        {"detail", detail}};
    return json_response(req, status, body, "application/problem+json");
}

// -------- handlers --------

// POST /addBook
// Body (JSON): { "Title": "...", "Author": "...", "ISBN": "..." }
inline HttpResponse handle_add_book(InventoryState &state, const HttpRequest &req)
{
    using nlohmann::json;

    json body = json::parse(req.body(), nullptr, false);
    if (body.is_discarded())
        return json_response(req, http::status::bad_request, json{{"error", "bad json"}, {"what", "body is not valid JSON"}});

    if (!has_book_fields(body))
        return json_response(req, http::status::bad_request,
                             json{{"error", "missing fields"}, {"required", {"Title", "Author", "ISBN"}}});

    InsertResult r = state.books.insert(book_from_json(body));
    if (!r.ok())
        return problem_response(req, http::status::internal_server_error, "Failed to add book");

    return json_response(req, http::status::ok, json{{"BookId", r.id}});
}

// GET /books/{id}
inline HttpResponse handle_get_book(InventoryState &state, const HttpRequest &req, const std::string &id)
{
    auto book = state.books.lookup(id);
    if (!book)
        return json_response(req, http::status::not_found, nlohmann::json{{"message", "Book not found"}, {"id", id}});
    return json_response(req, http::status::ok, book_to_json(*book));
}

// GET /health
inline HttpResponse handle_health(InventoryState &state, const HttpRequest &req)
{
    auto up = std::chrono::duration<double>(std::chrono::steady_clock::now() - state.start).count();
    return json_response(req, http::status::ok,
                         nlohmann::json{{"status", "ok"}, {"uptime_s", up}, {"books", state.books.size()}});
}

inline HttpResponse handle_request(InventoryState &state, const HttpRequest &req)
{
    std::string path(req.target());
    auto qpos = path.find('?');
    if (qpos != std::string::npos)
        path.resize(qpos);

    const std::string books_prefix = "/books/";

    if (path == "/addBook")
    {
        if (req.method() != http::verb::post)
            return json_response(req, http::status::method_not_allowed, nlohmann::json{{"error", "method not allowed"}});
        return handle_add_book(state, req);
    }

    if (path.rfind(books_prefix, 0) == 0 && path.size() > books_prefix.size() &&
        path.find('/', books_prefix.size()) == std::string::npos)
    {
        if (req.method() != http::verb::get)
            return json_response(req, http::status::method_not_allowed, nlohmann::json{{"error", "method not allowed"}});
        return handle_get_book(state, req, path.substr(books_prefix.size()));
    }

    if (path == "/health")
    {
        if (req.method() != http::verb::get)
            return json_response(req, http::status::method_not_allowed, nlohmann::json{{"error", "method not allowed"}});
        return handle_health(state, req);
    }

    // 404 fallback
    return json_response(req, http::status::not_found, nlohmann::json{{"error", "not found"}});
}

// -------- HTTP server --------

class HttpServer
{
    boost::asio::io_context &ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    InventoryState &state_;

public:
    // throws std::runtime_error if the endpoint cannot be bound
    HttpServer(boost::asio::io_context &ioc, boost::asio::ip::tcp::endpoint ep, InventoryState &s)
        : ioc_(ioc), acceptor_(ioc), state_(s)
    {
        boost::system::error_code ec;
        acceptor_.open(ep.protocol(), ec);
        if (ec)
            throw std::runtime_error("open failed: " + ec.message());
        acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
        if (ec)
            throw std::runtime_error("set_option failed: " + ec.message());
        acceptor_.bind(ep, ec);
        if (ec)
            throw std::runtime_error("bind failed: " + ec.message());
        acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
        if (ec)
            throw std::runtime_error("listen failed: " + ec.message());
        do_accept();
    }

    unsigned short port() const { return acceptor_.local_endpoint().port(); }

private:
    void do_accept()
    {
        // each session gets its own strand so the io_context can run on many threads
        acceptor_.async_accept(boost::asio::make_strand(ioc_), [this](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket)
                               {
            if (!ec) std::make_shared<Session>(std::move(socket), state_)->run();
            else if (ec != boost::asio::error::operation_aborted)
                std::cerr << "[inventory] accept: " << ec.message() << "\n";
            if (acceptor_.is_open()) do_accept(); });
    }

    struct Session : std::enable_shared_from_this<Session>
    {
        boost::beast::tcp_stream stream;
        boost::beast::flat_buffer buffer;
        HttpRequest req;
        InventoryState &state;

        Session(boost::asio::ip::tcp::socket &&s, InventoryState &st)
            : stream(std::move(s)), state(st) {}

        void run()
        {
            auto self = shared_from_this();
            boost::asio::dispatch(stream.get_executor(), [self]
                                  { self->do_read(); });
        }

        void do_read()
        {
            req = {};
            stream.expires_after(std::chrono::seconds(30));
            auto self = shared_from_this();
            http::async_read(stream, buffer, req, [self](boost::beast::error_code ec, std::size_t)
                             {
                if (ec == http::error::end_of_stream) return self->close();
                if (ec)
                {
                    if (ec != boost::beast::error::timeout && ec != boost::asio::error::operation_aborted)
                        std::cerr << "[inventory] read: " << ec.message() << "\n";
                    return;
                }
                self->dispatch_request(); });
        }

        void dispatch_request()
        {
            HttpResponse res;
            try
            {
                res = handle_request(state, req);
            }
            catch (const std::exception &e)
            {
                std::cerr << "[inventory] handler: " << e.what() << "\n";
                res = problem_response(req, http::status::internal_server_error, "Request failed");
                res.keep_alive(false);
            }
            respond(std::move(res));
        }

        // keep response alive through async_write
        void respond(HttpResponse &&res)
        {
            auto self = shared_from_this();
            auto sp = std::make_shared<HttpResponse>(std::move(res));
            sp->set(http::field::server, "inventory-beast");

            http::async_write(stream, *sp, [self, sp](boost::beast::error_code ec, std::size_t)
                              {
                if (ec)
                {
                    std::cerr << "[inventory] write: " << ec.message() << "\n";
                    return;
                }
                if (sp->need_eof()) return self->close();
                self->do_read(); });
        }

        void close()
        {
            boost::system::error_code ignored;
            stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
        }
    };
};
