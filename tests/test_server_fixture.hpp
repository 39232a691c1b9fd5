/*
 * File: tests/test_server_fixture.hpp
 * Project: Book Inventory
 * Purpose: Runs a real HttpServer on 127.0.0.1:<ephemeral> for a test
 * Last updated: 2026-10-19
 */

#pragma once
#include <boost/asio.hpp>
#include <string>
#include <thread>
#include <utility>
#include "inventory_http.hpp"
#include "inventory_state.hpp"
#include "common/http_json_client.hpp"


struct TestServer {
InventoryState state;
boost::asio::io_context ioc;
HttpServer server;
std::thread runner;

TestServer() : TestServer(BookStore::IdGenerator(generate_book_id)) {}

explicit TestServer(BookStore::IdGenerator gen)
    : state(std::move(gen)),
      server(ioc, {boost::asio::ip::make_address("127.0.0.1"), 0}, state),
      runner([this]{ ioc.run(); }) {}

~TestServer(){ ioc.stop(); runner.join(); }

TestServer(const TestServer&) = delete;
TestServer& operator=(const TestServer&) = delete;

std::string host() const { return "127.0.0.1"; }
std::string port() const { return std::to_string(server.port()); }

JsonReply post(const std::string& target, const nlohmann::json& body) const { return post_json(host(), port(), target, body); }
JsonReply get(const std::string& target) const { return get_json(host(), port(), target); }
};
