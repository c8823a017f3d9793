// file: tests/storage_contract.hpp
// Behaviour every StorageProvider implementation must share.
#pragma once

#include <stdexcept>
#include <vector>

#include "test_utils.hpp"

namespace contract {

using kvt::Bytes;
using kvt::Direction;
using kvt::StorageProvider;
using kvt::TableErrc;

static Bytes b(const std::string& s) {
    return Bytes(s.begin(), s.end());
}

static std::vector<Bytes> collect(StorageProvider& store, kvt::CursorId cursor) {
    std::vector<Bytes> keys;
    while (store.advance(cursor)) {
        keys.push_back(store.read(cursor).first);
    }
    store.close_cursor(cursor);
    return keys;
}

static void test_primitives(StorageProvider& store) {
    const kvt::Handle h1 = store.create_handle();
    const kvt::Handle h2 = store.create_handle();
    assert(h1 != h2);
    assert(store.count(h1) == 0);

    store.insert(h1, b("alpha"), b("1"));
    store.insert(h1, b("beta"), b("2"));
    store.insert(h2, b("alpha"), b("other"));

    assert(store.exists(h1, b("alpha")));
    assert(!store.exists(h1, b("gamma")));
    assert(store.lookup(h1, b("alpha")) == b("1"));
    assert(store.lookup(h2, b("alpha")) == b("other"));
    assert(store.count(h1) == 2);
    assert(store.count(h2) == 1);

    expect_error(TableErrc::ALREADY_EXISTS, [&] { store.insert(h1, b("alpha"), b("x")); });
    assert(store.lookup(h1, b("alpha")) == b("1"));
    expect_error(TableErrc::NOT_FOUND, [&] { store.lookup(h1, b("gamma")); });

    store.lookup_mut(h1, b("beta"), [](Bytes& value) { value.push_back('!'); });
    assert(store.lookup(h1, b("beta")) == b("2!"));

    // a failing mutator leaves the value untouched
    bool thrown = false;
    try {
        store.lookup_mut(h1, b("beta"), [](Bytes& value) {
            value.clear();
            throw std::runtime_error("mutator failed");
        });
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    assert(thrown);
    assert(store.lookup(h1, b("beta")) == b("2!"));
    expect_error(TableErrc::NOT_FOUND, [&] {
        store.lookup_mut(h1, b("gamma"), [](Bytes&) {});
    });

    assert(store.remove(h1, b("alpha")) == b("1"));
    assert(!store.exists(h1, b("alpha")));
    assert(store.count(h1) == 1);
    expect_error(TableErrc::NOT_FOUND, [&] { store.remove(h1, b("alpha")); });

    // a handle that still holds entries is not released
    expect_error(TableErrc::NOT_EMPTY, [&] { store.release_handle(h1); });
    assert(store.lookup(h1, b("beta")) == b("2!"));
    store.remove(h1, b("beta"));
    store.release_handle(h1);
    expect_error(TableErrc::STORAGE_ERROR, [&] { store.count(h1); });
    expect_error(TableErrc::STORAGE_ERROR, [&] { store.insert(h1, b("k"), b("v")); });
    assert(store.lookup(h2, b("alpha")) == b("other"));
    store.remove(h2, b("alpha"));
    store.release_handle(h2);
}

static void test_cursors(StorageProvider& store) {
    const kvt::Handle h = store.create_handle();
    for (const char* k : {"a", "b", "ba", "c", "d"}) {
        store.insert(h, b(k), b(std::string("v_") + k));
    }

    auto all = collect(store, store.open_cursor(h, std::nullopt, std::nullopt, Direction::ASCENDING));
    assert((all == std::vector<Bytes>{b("a"), b("b"), b("ba"), b("c"), b("d")}));

    auto bounded = collect(store, store.open_cursor(h, b("b"), b("d"), Direction::ASCENDING));
    assert((bounded == std::vector<Bytes>{b("b"), b("ba"), b("c")}));

    auto reversed = collect(store, store.open_cursor(h, b("b"), b("d"), Direction::DESCENDING));
    assert((reversed == std::vector<Bytes>{b("c"), b("ba"), b("b")}));

    auto tail = collect(store, store.open_cursor(h, std::nullopt, std::nullopt, Direction::DESCENDING));
    assert((tail == std::vector<Bytes>{b("d"), b("c"), b("ba"), b("b"), b("a")}));

    // bounds that fall between keys
    auto between = collect(store, store.open_cursor(h, b("bb"), b("cc"), Direction::DESCENDING));
    assert((between == std::vector<Bytes>{b("c")}));

    // start above end gives an empty range in both directions
    assert(collect(store, store.open_cursor(h, b("d"), b("a"), Direction::ASCENDING)).empty());
    assert(collect(store, store.open_cursor(h, b("d"), b("a"), Direction::DESCENDING)).empty());

    const kvt::CursorId cursor = store.open_cursor(h, std::nullopt, std::nullopt, Direction::ASCENDING);
    expect_error(TableErrc::USAGE_ERROR, [&] { store.read(cursor); });
    assert(store.advance(cursor));
    auto entry = store.read(cursor);
    assert(entry.first == b("a"));
    assert(entry.second == b("v_a"));
    while (store.advance(cursor)) {}
    assert(!store.advance(cursor));
    store.close_cursor(cursor);

    expect_error(TableErrc::STORAGE_ERROR, [&] { store.advance(cursor); });
    store.close_cursor(cursor); // unknown ids are ignored

    for (const char* k : {"a", "b", "ba", "c", "d"}) {
        store.remove(h, b(k));
    }
    store.release_handle(h);
}

static void test_units_of_work(StorageProvider& store) {
    const kvt::Handle h = store.create_handle();
    assert(!store.in_transaction());

    store.begin();
    assert(store.in_transaction());
    expect_error(TableErrc::USAGE_ERROR, [&] { store.begin(); });
    store.insert(h, b("temp"), b("1"));
    assert(store.exists(h, b("temp")));
    store.rollback();
    assert(!store.in_transaction());
    assert(!store.exists(h, b("temp")));
    assert(store.count(h) == 0);

    const uint64_t generation = store.generation();
    store.begin();
    store.insert(h, b("kept"), b("1"));
    store.commit();
    assert(store.lookup(h, b("kept")) == b("1"));
    assert(store.generation() == generation);

    expect_error(TableErrc::USAGE_ERROR, [&] { store.commit(); });
    expect_error(TableErrc::USAGE_ERROR, [&] { store.rollback(); });

    // handles created inside a rolled-back unit of work disappear with it
    store.begin();
    const kvt::Handle scratch = store.create_handle();
    store.insert(scratch, b("x"), b("y"));
    store.rollback();
    expect_error(TableErrc::STORAGE_ERROR, [&] { store.count(scratch); });
    assert(store.generation() != generation);

    bool thrown = false;
    try {
        kvt::execute_in_transaction(store, [&] {
            store.insert(h, b("doomed"), b("1"));
            store.remove(h, b("kept"));
            throw std::runtime_error("abort");
        });
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    assert(thrown);
    assert(!store.in_transaction());
    assert(!store.exists(h, b("doomed")));
    assert(store.exists(h, b("kept")));

    kvt::execute_in_transaction(store, [&] {
        store.insert(h, b("second"), b("2"));
    });
    assert(store.count(h) == 2);

    store.remove(h, b("kept"));
    store.remove(h, b("second"));
    store.release_handle(h);
}

// runs the shared checks against a freshly created provider
static void run_storage_contract(StorageProvider& store) {
    test_primitives(store);
    test_cursors(store);
    test_units_of_work(store);
}

} // namespace contract
