/*
 * File: tests/test_config.cpp
 * Project: Book Inventory
 * Purpose: Server command-line parsing
 * Last updated: 2026-10-19
 */

#include <catch2/catch.hpp>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <vector>
#include "inventory_config.hpp"


static std::string parse_error(std::initializer_list<const char*> args){
std::vector<const char*> argv{"inventory_server"};
argv.insert(argv.end(), args.begin(), args.end());
try { parse_args(static_cast<int>(argv.size()), argv.data()); }
catch (const std::runtime_error& e) { return e.what(); }
return {};
}


TEST_CASE("defaults without arguments"){
const char* argv[] = {"inventory_server"};
auto cfg = parse_args(1, argv);
REQUIRE(cfg.host == "0.0.0.0");
REQUIRE(cfg.port == 8080);
REQUIRE(cfg.threads >= 1);
}

TEST_CASE("http and threads are applied"){
const char* argv[] = {"inventory_server", "--http", "127.0.0.1:0", "--threads", "3"};
auto cfg = parse_args(5, argv);
REQUIRE(cfg.host == "127.0.0.1");
REQUIRE(cfg.port == 0);
REQUIRE(cfg.threads == 3);
}

TEST_CASE("flag without a value is reported as missing"){
REQUIRE(parse_error({"--http"}) == "missing value for '--http'");
REQUIRE(parse_error({"--threads", "2", "--threads"}) == "missing value for '--threads'");
}

TEST_CASE("bad values are rejected"){
REQUIRE(parse_error({"--bogus"}) == "unknown argument '--bogus'");
REQUIRE(parse_error({"--http", "nohost"}) == "expected host:port, got 'nohost'");
REQUIRE(parse_error({"--http", "h:99999"}) == "port out of range in 'h:99999'");
REQUIRE(parse_error({"--threads", "many"}) == "bad thread count 'many'");
}
