/*
 * File: include/common/book.hpp
 * Project: Book Inventory
 * Purpose: Book record and its JSON form
 * Notes:
 *  - JSON keys are "Title", "Author", "ISBN"
 *  - Fields are not validated beyond presence
 * Last updated: 2026-10-19
 */

#pragma once
#include <string>
#include <nlohmann/json.hpp>


struct Book {
std::string title;
std::string author;
std::string isbn;
};


inline bool operator==(const Book& a, const Book& b){
return a.title == b.title && a.author == b.author && a.isbn == b.isbn;
}
inline bool operator!=(const Book& a, const Book& b){ return !(a == b); }


inline nlohmann::json book_to_json(const Book& book){
using nlohmann::json;
return json{
{"Title", book.title},
{"Author", book.author},
{"ISBN", book.isbn}
};
}


// true when all three keys are present and hold strings
inline bool has_book_fields(const nlohmann::json& j){
if (!j.is_object()) return false;
for (const char* k : {"Title", "Author", "ISBN"}) {
    auto it = j.find(k);
    if (it == j.end() || !it->is_string()) return false;
}
return true;
}


// throws nlohmann::json::exception if a field is missing or not a string
inline Book book_from_json(const nlohmann::json& j){
Book b;
b.title = j.at("Title").get<std::string>();
b.author = j.at("Author").get<std::string>();
b.isbn = j.at("ISBN").get<std::string>();
return b;
}
