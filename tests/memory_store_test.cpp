// file: tests/memory_store_test.cpp
// Checks the in-memory storage provider.

#include "storage_contract.hpp"

#include <thread>

static void test_cursor_bookkeeping() {
    kvt::MemoryStore store;
    const kvt::Handle h = store.create_handle();
    store.insert(h, contract::b("k"), contract::b("v"));

    const kvt::CursorId c1 = store.open_cursor(h, std::nullopt, std::nullopt, kvt::Direction::ASCENDING);
    const kvt::CursorId c2 = store.open_cursor(h, std::nullopt, std::nullopt, kvt::Direction::DESCENDING);
    assert(c1 != c2);
    assert(store.open_cursors() == 2);
    store.close_cursor(c1);
    store.close_cursor(c2);
    assert(store.open_cursors() == 0);
}

static void test_removed_under_cursor() {
    kvt::MemoryStore store;
    const kvt::Handle h = store.create_handle();
    store.insert(h, contract::b("a"), contract::b("1"));
    store.insert(h, contract::b("b"), contract::b("2"));

    const kvt::CursorId c = store.open_cursor(h, std::nullopt, std::nullopt, kvt::Direction::ASCENDING);
    assert(store.advance(c));
    store.remove(h, contract::b("a"));
    expect_error(kvt::TableErrc::STORAGE_ERROR, [&] { store.read(c); });
    // the cursor continues after the last position it visited
    assert(store.advance(c));
    assert(store.read(c).first == contract::b("b"));
    store.close_cursor(c);
}

static void test_unit_of_work_owner() {
    kvt::MemoryStore store;
    store.begin();
    bool other_thread_in_txn = true;
    std::thread worker([&] { other_thread_in_txn = store.in_transaction(); });
    worker.join();
    assert(!other_thread_in_txn);
    store.commit();
}

int main() try {
    {
        kvt::MemoryStore store;
        contract::run_storage_contract(store);
    }
    test_cursor_bookkeeping();
    test_removed_under_cursor();
    test_unit_of_work_owner();

    std::cout << "[result] memory store tests passed\n";
    return 0;
}
catch (const std::exception& e) {
    std::cerr << "[error] " << e.what() << "\n";
    return 1;
}
