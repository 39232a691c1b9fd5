/*
 * File: src/inventory_config.hpp
 * Project: Book Inventory
 * Purpose: Command-line options for the server binary
 * Notes:
 *  - --http host:port (port 0 picks a free port), --threads N
 *  - Bad or incomplete arguments throw std::runtime_error
 * Last updated: 2026-10-19
 */

#pragma once
#include <algorithm>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

struct ServerConfig
{
    std::string host = "0.0.0.0";
    unsigned short port = 8080;
    unsigned threads = std::max(1u, std::thread::hardware_concurrency());
};

inline std::pair<std::string, unsigned short> split_host_port(const std::string &s)
{
    auto p = s.rfind(':');
    if (p == std::string::npos || p == 0 || p + 1 == s.size())
        throw std::runtime_error("expected host:port, got '" + s + "'");
    int port = 0;
    try
    {
        port = std::stoi(s.substr(p + 1));
    }
    catch (const std::exception &)
    {
        throw std::runtime_error("bad port in '" + s + "'");
    }
    if (port < 0 || port > 65535)
        throw std::runtime_error("port out of range in '" + s + "'");
    return {s.substr(0, p), static_cast<unsigned short>(port)};
}

inline ServerConfig parse_args(int argc, const char *const *argv)
{
    ServerConfig cfg;
    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if ((a == "--http" || a == "--threads") && i + 1 >= argc)
            throw std::runtime_error("missing value for '" + a + "'");
        if (a == "--http")
        {
            auto [host, port] = split_host_port(argv[++i]);
            cfg.host = host;
            cfg.port = port;
        }
        else if (a == "--threads")
        {
            std::string v = argv[++i];
            int n = 0;
            try
            {
                n = std::stoi(v);
            }
            catch (const std::exception &)
            {
                throw std::runtime_error("bad thread count '" + v + "'");
            }
            cfg.threads = static_cast<unsigned>(std::max(1, n));
        }
        else
            throw std::runtime_error("unknown argument '" + a + "'");
    }
    return cfg;
}
