/*
 * File: include/common/book_store.hpp
 * Project: Book Inventory
 * Purpose: In-memory book store keyed by generated ids
 * Notes:
 *  - Entries are write-once; no update or delete
 *  - Collision and miss are return values, never exceptions
 * Last updated: 2026-10-19
 */

#pragma once
#include <array>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <boost/uuid/random_generator.hpp>

#include "common/book.hpp"


using BookId = std::string;

enum class InsertError { none, collision };

struct InsertResult {
BookId id;
InsertError error = InsertError::none;
bool ok() const { return error == InsertError::none; }
};


// random v4 uuid, canonical text form; one generator per thread so no lock
inline BookId generate_book_id(){
thread_local boost::uuids::random_generator gen;
return boost::uuids::to_string(gen());
}


/*
 * Thread-safe map BookId -> Book.
 * Keys are spread over independently locked shards; a lock is held for one
 * key's insert or lookup only. The store never retries a failed insert.
 */
class BookStore {
public:
using IdGenerator = std::function<BookId()>;

// gen is called concurrently from every inserting thread
explicit BookStore(IdGenerator gen = generate_book_id) : gen_(std::move(gen)) {}

BookStore(const BookStore&) = delete;
BookStore& operator=(const BookStore&) = delete;

InsertResult insert(Book book){
BookId id = gen_();
Shard& s = shard_for(id);
std::scoped_lock lk(s.m);
// try_emplace leaves both the map and `book` untouched when the key exists
auto [it, inserted] = s.books.try_emplace(id, std::move(book));
if (!inserted) return InsertResult{std::move(id), InsertError::collision};
return InsertResult{it->first, InsertError::none};
}

std::optional<Book> lookup(const BookId& id) const {
const Shard& s = shard_for(id);
std::shared_lock lk(s.m);
auto it = s.books.find(id);
if (it == s.books.end()) return std::nullopt;
return it->second;
}

std::size_t size() const {
std::size_t n = 0;
for (const auto& s : shards_) {
    std::shared_lock lk(s.m);
    n += s.books.size();
}
return n;
}

private:
static constexpr std::size_t kShards = 16;

struct Shard {
mutable std::shared_mutex m;
std::unordered_map<BookId, Book> books;
};

Shard& shard_for(const BookId& id){ return shards_[std::hash<BookId>{}(id) % kShards]; }
const Shard& shard_for(const BookId& id) const { return shards_[std::hash<BookId>{}(id) % kShards]; }

IdGenerator gen_;
std::array<Shard, kShards> shards_;
};
