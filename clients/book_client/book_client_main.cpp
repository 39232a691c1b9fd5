/*
 * File: clients/book_client/book_client_main.cpp
 * Project: Book Inventory
 * Purpose: Example HTTP consumer client
 * Notes:
 *  - Adds one book then reads it back, or fetches an id with --get
 * Last updated: 2026-10-19
 */

#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

#include "common/http_json_client.hpp"

using json = nlohmann::json;

static void print_reply(const char *what, const JsonReply &r, bool pretty)
{
    std::cout << "[book_client] " << what << " status=" << r.status;
    if (r.body.is_discarded())
    {
        std::cout << " raw body=" << r.raw << std::endl;
        return;
    }
    std::cout << " body:\n"
              << (pretty ? r.body.dump(2) : r.body.dump()) << std::endl;
}

int main(int argc, char **argv)
{
    bool pretty = false;
    std::string base = "http://localhost:8080";
    std::string get_id;
    json book{{"Title", "AI Engineering"}, {"Author", "Chip Huyen"}, {"ISBN", "1098166302"}};
    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--http" && i + 1 < argc)
            base = argv[++i];
        else if (a == "--title" && i + 1 < argc)
            book["Title"] = argv[++i];
        else if (a == "--author" && i + 1 < argc)
            book["Author"] = argv[++i];
        else if (a == "--isbn" && i + 1 < argc)
            book["ISBN"] = argv[++i];
        else if (a == "--get" && i + 1 < argc)
            get_id = argv[++i];
        else if (a == "--pretty")
            pretty = true;
        else
        {
            std::cerr << "usage: book_client [--http http://host:port] [--title T] [--author A] [--isbn I] [--get ID] [--pretty]\n";
            return 2;
        }
    }

    auto pos = base.find("//");
    auto hp = (pos == std::string::npos) ? base : base.substr(pos + 2);
    auto colon = hp.find(':');
    auto host = hp.substr(0, colon);
    auto port = (colon == std::string::npos) ? std::string("80") : hp.substr(colon + 1);

    try
    {
        if (get_id.empty())
        {
            auto added = post_json(host, port, "/addBook", book);
            print_reply("POST /addBook", added, pretty);
            if (added.status != 200 || !added.body.is_object() || !added.body.contains("BookId"))
                return 1;
            get_id = added.body["BookId"].get<std::string>();
        }

        auto fetched = get_json(host, port, "/books/" + get_id);
        print_reply(("GET /books/" + get_id).c_str(), fetched, pretty);
        return fetched.status == 200 ? 0 : 1;
    }
    catch (const std::exception &e)
    {
        std::cerr << "book_client error: " << e.what() << "\n";
        return 1;
    }
}
