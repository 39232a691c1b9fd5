/*
 * File: src/inventory_state.hpp
 * Project: Book Inventory
 * Purpose: Process-wide state shared by all HTTP sessions
 * Notes:
 *  - Constructed once in main, passed by reference to the server
 * Last updated: 2026-10-19
 */

#pragma once
#include <chrono>
#include <utility>
#include "common/book_store.hpp"


struct InventoryState {
InventoryState() = default;
explicit InventoryState(BookStore::IdGenerator gen) : books(std::move(gen)) {}

BookStore books;
std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();
};
