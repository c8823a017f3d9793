// file: tests/table_test.cpp
// Table operations, run against both storage backends.

#include <cstring>
#include <deque>
#include <functional>
#include <list>
#include <stdexcept>

#include "test_utils.hpp"
#include <kv_tables/testing/TableTestUtils.hpp>

using kvt::Table;
using kvt::TableErrc;

// ---- sample serializable struct ----
struct Position {
    int32_t x{};
    int32_t y{};

    Position() = default;
    Position(int32_t x_, int32_t y_) : x(x_), y(y_) {}

    std::vector<uint8_t> to_bytes() const {
        std::vector<uint8_t> bytes(sizeof(x) + sizeof(y));
        std::memcpy(bytes.data(), &x, sizeof(x));
        std::memcpy(bytes.data() + sizeof(x), &y, sizeof(y));
        return bytes;
    }
    static Position from_bytes(const void* data, size_t size) {
        if (size != sizeof(int32_t) * 2)
            throw std::runtime_error("Invalid data size for Position");
        const uint8_t* ptr = static_cast<const uint8_t*>(data);
        Position p;
        std::memcpy(&p.x, ptr, sizeof(p.x));
        std::memcpy(&p.y, ptr + sizeof(p.x), sizeof(p.y));
        return p;
    }
    bool operator==(const Position& other) const {
        return x == other.x && y == other.y;
    }
};

using ProviderFactory = std::function<std::shared_ptr<kvt::StorageProvider>()>;

// counts the keys visible through a full scan
template <class K, class V>
static std::size_t scanned_entries(const Table<K, V>& table) {
    std::size_t n = 0;
    auto it = table.iter();
    while (it.try_next()) ++n;
    return n;
}

static void test_new_table(const ProviderFactory& make) {
    auto table = Table<int, int>::create(make());
    assert(table.length() == 0);
    assert(table.empty());
    assert(!table.contains(1));
    std::move(table).destroy_empty();
}

static void test_add_borrow_remove(const ProviderFactory& make) {
    auto table = Table<std::string, std::string>::create(make());
    table.add("apple", "red");
    table.add("banana", "yellow");
    assert(table.length() == 2);
    assert(table.contains("apple"));
    assert(table.borrow("apple") == "red");

    expect_error(TableErrc::ALREADY_EXISTS, [&] { table.add("apple", "green"); });
    assert(table.length() == 2);
    assert(table.borrow("apple") == "red");

    expect_error(TableErrc::NOT_FOUND, [&] { table.borrow("cherry"); });

    assert(table.remove("apple") == "red");
    assert(table.length() == 1);
    assert(!table.contains("apple"));
    expect_error(TableErrc::NOT_FOUND, [&] { table.remove("apple"); });
    assert(table.length() == 1);
    assert(scanned_entries(table) == table.length());

    expect_error(TableErrc::NOT_EMPTY, [&] { std::move(table).destroy_empty(); });
    assert(table.length() == 1);
    table.remove("banana");
    std::move(table).destroy_empty();
    expect_error(TableErrc::USAGE_ERROR, [&] { table.length(); });
    expect_error(TableErrc::USAGE_ERROR, [&] { table.add("apple", "red"); });
}

static void test_upsert_scenario(const ProviderFactory& make) {
    auto table = Table<uint64_t, int>::create(make());
    table.upsert(111, 12);
    assert(table.borrow(111) == 12);
    assert(table.length() == 1);
    table.upsert(111, 23);
    assert(table.borrow(111) == 23);
    assert(table.length() == 1);
    table.remove(111);
    std::move(table).destroy_empty();
}

static void test_default_scenario(const ProviderFactory& make) {
    auto table = Table<uint64_t, int>::create(make());
    assert(table.borrow_with_default(100, 12) == 12);
    assert(!table.contains(100));
    assert(table.length() == 0);
    table.add(100, 1);
    assert(table.borrow_with_default(100, 12) == 1);
    table.remove(100);
    std::move(table).destroy_empty();
}

static void test_remove_scenario(const ProviderFactory& make) {
    auto table = Table<int, std::string>::create(make());
    table.add(1, "first");
    const std::size_t before = table.length();
    table.add(5, "x");
    assert(table.remove(5) == "x");
    assert(table.length() == before);
    assert(!table.contains(5));
    table.remove(1);
    std::move(table).destroy_empty();
}

static void test_borrow_mut(const ProviderFactory& make) {
    auto table = Table<std::string, std::vector<int>>::create(make());
    table.add("numbers", {1, 2, 3});

    table.borrow_mut("numbers", [](std::vector<int>& v) { v.push_back(4); });
    assert((table.borrow("numbers") == std::vector<int>{1, 2, 3, 4}));

    const std::size_t size = table.borrow_mut("numbers", [](std::vector<int>& v) {
        v.erase(v.begin());
        return v.size();
    });
    assert(size == 3);
    assert((table.borrow("numbers") == std::vector<int>{2, 3, 4}));

    // nothing is written when the callback throws
    bool thrown = false;
    try {
        table.borrow_mut("numbers", [](std::vector<int>& v) {
            v.clear();
            throw std::runtime_error("abort");
        });
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    assert(thrown);
    assert((table.borrow("numbers") == std::vector<int>{2, 3, 4}));

    expect_error(TableErrc::NOT_FOUND, [&] {
        table.borrow_mut("missing", [](std::vector<int>&) {});
    });

    table.borrow_mut_with_default("counter", std::vector<int>{0}, [](std::vector<int>& v) { v[0] += 5; });
    assert(table.length() == 2);
    assert((table.borrow("counter") == std::vector<int>{5}));
    table.borrow_mut_with_default("counter", std::vector<int>{0}, [](std::vector<int>& v) { v[0] += 5; });
    assert(table.length() == 2);
    assert((table.borrow("counter") == std::vector<int>{10}));

    // the default is stored only once the callback has returned
    thrown = false;
    try {
        table.borrow_mut_with_default("fresh", std::vector<int>{7}, [](std::vector<int>& v) {
            v.push_back(8);
            throw std::runtime_error("abort");
        });
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    assert(thrown);
    assert(!table.contains("fresh"));
    assert(table.length() == 2);

    const std::size_t sized = table.borrow_mut_with_default("sized", std::vector<int>{1, 2},
        [](std::vector<int>& v) {
            v.push_back(3);
            return v.size();
        });
    assert(sized == 3);
    assert((table.borrow("sized") == std::vector<int>{1, 2, 3}));
    assert(table.length() == 3);

    kvt::testing::destroy_unchecked(std::move(table));
    expect_error(TableErrc::USAGE_ERROR, [&] { table.contains("numbers"); });
}

static void test_struct_values(const ProviderFactory& make) {
    auto table = Table<std::pair<std::string, int>, Position>::create(make());
    table.add({"map", 1}, Position(3, -4));
    table.add({"map", 2}, Position(0, 7));
    assert(table.borrow({"map", 1}) == Position(3, -4));
    table.upsert({"map", 1}, Position(1, 1));
    assert(table.borrow({"map", 1}) == Position(1, 1));
    assert(table.length() == 2);
    kvt::testing::destroy_unchecked(std::move(table));
}

static void test_stored_layout(const ProviderFactory& make) {
    auto store = make();
    auto table = Table<int, int>::create(store);
    table.add(1, 42);

    const kvt::Bytes stored = store->lookup(table.handle(), kvt::serialize_key(1));
    assert(stored.size() == 1 + sizeof(int));
    assert(stored[0] == kvt::Box<int>::TAG);

    // bytes that were not written through a table are rejected
    store->insert(table.handle(), kvt::serialize_key(2), kvt::Bytes{1, 2, 3, 4, 5});
    expect_error(TableErrc::STORAGE_ERROR, [&] { table.borrow(2); });
    kvt::testing::destroy_unchecked(std::move(table));
}

// stored value with a hand-written length-prefixed record
static kvt::Bytes boxed_record(uint32_t len, const std::string& payload) {
    kvt::Bytes out;
    out.push_back(kvt::Box<std::string>::TAG);
    const uint8_t* p = reinterpret_cast<const uint8_t*>(&len);
    out.insert(out.end(), p, p + sizeof(len));
    out.insert(out.end(), payload.begin(), payload.end());
    return out;
}

static void test_sequence_values(const ProviderFactory& make) {
    auto store = make();

    auto words = Table<int, std::vector<std::string>>::create(store);
    words.add(1, {"alpha", "", "gamma"});
    words.add(2, {});
    assert((words.borrow(1) == std::vector<std::string>{"alpha", "", "gamma"}));
    assert(words.borrow(2).empty());
    words.borrow_mut(2, [](std::vector<std::string>& v) { v.push_back(std::string("a\0b", 3)); });
    assert(words.borrow(2).front() == std::string("a\0b", 3));

    // a record longer than the remaining bytes, then bytes after the last record
    store->insert(words.handle(), kvt::serialize_key(3), boxed_record(5, "ab"));
    expect_error(TableErrc::STORAGE_ERROR, [&] { words.borrow(3); });
    kvt::Bytes trailing = boxed_record(1, "a");
    trailing.push_back(0x01);
    trailing.push_back(0x02);
    store->insert(words.handle(), kvt::serialize_key(4), trailing);
    expect_error(TableErrc::STORAGE_ERROR, [&] { words.borrow(4); });
    expect_error(TableErrc::STORAGE_ERROR, [&] {
        words.borrow_mut(4, [](std::vector<std::string>& v) { v.clear(); });
    });
    assert(store->lookup(words.handle(), kvt::serialize_key(4)) == trailing);
    kvt::testing::destroy_unchecked(std::move(words));

    auto queue = Table<std::string, std::deque<std::string>>::create(store);
    queue.add("jobs", {"build", "test"});
    queue.borrow_mut("jobs", [](std::deque<std::string>& q) {
        q.pop_front();
        q.push_back("deploy");
    });
    assert((queue.borrow("jobs") == std::deque<std::string>{"test", "deploy"}));
    assert((queue.remove("jobs") == std::deque<std::string>{"test", "deploy"}));
    std::move(queue).destroy_empty();

    auto names = Table<int, std::list<std::string>>::create(store);
    names.upsert(1, {"x"});
    names.upsert(1, {"y", "z"});
    assert((names.borrow(1) == std::list<std::string>{"y", "z"}));
    assert(names.length() == 1);
    names.remove(1);
    std::move(names).destroy_empty();

    auto samples = Table<int, std::deque<int32_t>>::create(store);
    samples.add(1, {-1, 0, 65536});
    assert((samples.borrow(1) == std::deque<int32_t>{-1, 0, 65536}));
    // three bytes cannot hold whole int32 elements
    store->insert(samples.handle(), kvt::serialize_key(2), kvt::Bytes{kvt::Box<int>::TAG, 1, 2, 3});
    expect_error(TableErrc::STORAGE_ERROR, [&] { samples.borrow(2); });
    kvt::testing::destroy_unchecked(std::move(samples));

    auto readings = Table<int, std::list<double>>::create(store);
    readings.add(1, {0.25, -1.5});
    readings.borrow_mut(1, [](std::list<double>& l) { l.push_front(9.0); });
    assert((readings.borrow(1) == std::list<double>{9.0, 0.25, -1.5}));
    assert((readings.remove(1) == std::list<double>{9.0, 0.25, -1.5}));
    std::move(readings).destroy_empty();
}

static void test_rollback_keeps_length(const ProviderFactory& make) {
    auto store = make();
    auto table = Table<int, int>::create(store);
    table.add(1, 10);

    store->begin();
    table.add(2, 20);
    table.upsert(3, 30);
    assert(table.length() == 3);
    store->rollback();
    assert(table.length() == 1);
    assert(!table.contains(2));

    for (int round = 0; round < 2; ++round) {
        bool thrown = false;
        try {
            kvt::execute_in_transaction(*store, [&] {
                assert(table.remove(1) == 10);
                assert(table.empty());
                throw std::runtime_error("abort");
            });
        } catch (const std::runtime_error&) {
            thrown = true;
        }
        assert(thrown);
        assert(table.contains(1));
        assert(table.length() == 1);
        assert(store->count(table.handle()) == 1);
    }

    expect_error(TableErrc::NOT_EMPTY, [&] { std::move(table).destroy_empty(); });
    assert(table.borrow(1) == 10);
    assert(scanned_entries(table) == table.length());

    assert(table.remove(1) == 10);
    expect_error(TableErrc::NOT_FOUND, [&] { table.remove(1); });
    assert(table.length() == 0);
    std::move(table).destroy_empty();
}

static void test_signed_zero_key(const ProviderFactory& make) {
    auto table = Table<double, int>::create(make());
    table.add(-0.0, 1);
    expect_error(TableErrc::ALREADY_EXISTS, [&] { table.add(0.0, 2); });
    assert(table.contains(0.0));
    assert(table.borrow(0.0) == 1);
    assert(table.remove(0.0) == 1);
    std::move(table).destroy_empty();
}

static void test_move_and_attach(const ProviderFactory& make) {
    auto store = make();
    auto table = Table<int16_t, double>::create(store);
    table.add(-3, 0.5);
    table.add(3, 1.5);

    Table<int16_t, double> moved = std::move(table);
    expect_error(TableErrc::USAGE_ERROR, [&] { table.borrow(-3); });
    expect_error(TableErrc::USAGE_ERROR, [&] { table.iter(); });
    assert(moved.length() == 2);

    kvt::testing::TableBackdoor::set_length(moved, 7);
    auto attached = Table<int16_t, double>::attach(store, moved.handle());
    assert(attached.length() == 2);
    assert(attached.borrow(3) == 1.5);

    expect_error(TableErrc::STORAGE_ERROR, [&] {
        Table<int16_t, double>::attach(store, moved.handle() + 1000);
    });
    expect_error(TableErrc::USAGE_ERROR, [&] {
        Table<int16_t, double>::create(nullptr);
    });
    kvt::testing::destroy_unchecked(std::move(attached));
}

static void run_table_suite(const char* name, const ProviderFactory& make) {
    test_new_table(make);
    test_add_borrow_remove(make);
    test_upsert_scenario(make);
    test_default_scenario(make);
    test_remove_scenario(make);
    test_borrow_mut(make);
    test_struct_values(make);
    test_stored_layout(make);
    test_sequence_values(make);
    test_rollback_keeps_length(make);
    test_signed_zero_key(make);
    test_move_and_attach(make);
    std::cout << "[table] " << name << " backend passed\n";
}

int main() try {
    kvt::Config memory_cfg;
    memory_cfg.backend = kvt::StorageBackend::MEMORY;
    run_table_suite("memory", [&] { return kvt::make_storage(memory_cfg); });

    TempDb db("table_test");
    auto mdbx_store = kvt::make_storage(db.config());
    run_table_suite("mdbx", [&] { return mdbx_store; });

    std::cout << "[result] table tests passed\n";
    return 0;
}
catch (const std::exception& e) {
    std::cerr << "[error] " << e.what() << "\n";
    return 1;
}
