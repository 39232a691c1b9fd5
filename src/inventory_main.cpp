/*
 * File: src/inventory_main.cpp
 * Project: Book Inventory
 * Purpose: Main server binary: HTTP /addBook and /books/{id} endpoints
 * Notes:
 *  - One BookStore for the process lifetime, nothing persisted
 *  - --http host:port (port 0 picks a free port), --threads N
 * Last updated: 2026-10-19
 */

#include <iostream>
#include <string>
#include <thread>
#include <vector>
#include <boost/asio.hpp>
#include "inventory_config.hpp"
#include "inventory_http.hpp"
#include "inventory_state.hpp"

int main(int argc, char **argv)
{
    try
    {
        ServerConfig cfg = parse_args(argc, argv);
        const std::string &http_host = cfg.host;
        const unsigned threads = cfg.threads;

        boost::asio::io_context ioc{static_cast<int>(threads)};
        InventoryState state;

        boost::asio::ip::tcp::endpoint http_ep{boost::asio::ip::make_address(http_host), cfg.port};
        HttpServer http{ioc, http_ep, state};

        std::cout << "inventory listening http=" << http_host << ":" << http.port()
                  << " threads=" << threads << std::endl;

        std::vector<std::thread> pool;
        pool.reserve(threads - 1);
        for (unsigned i = 1; i < threads; ++i)
            pool.emplace_back([&ioc]
                              { ioc.run(); });
        ioc.run();
        for (auto &t : pool)
            t.join();
    }
    catch (const std::exception &e)
    {
        std::cerr << "inventory error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
