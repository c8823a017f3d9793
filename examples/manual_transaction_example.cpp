/**
 * \ingroup kvt_examples
 * Demonstrates units of work: commit and rollback.
 */

#include <kv_tables.hpp>
#include <iostream>
#include <stdexcept>

int main() {
    kvt::Config config;
    config.pathname = "manual_txn_db";

    auto store = kvt::make_storage(config);
    auto table = kvt::Table<int, std::string>::create(store);

    // Start a unit of work manually
    store->begin();
    table.add(10, "ten");
    table.add(20, "twenty");
    store->commit();

    // A failing unit of work leaves the store untouched
    try {
        kvt::execute_in_transaction(*store, [&]() {
            table.add(30, "thirty");
            table.remove(10);
            throw std::runtime_error("something went wrong");
        });
    } catch (const std::exception& e) {
        std::cout << "Rolled back: " << e.what() << std::endl;
    }

    // length follows the rollback: still 2
    std::cout << "Length after rollback: " << table.length() << std::endl;
    std::cout << "Key 10: " << table.borrow(10) << std::endl;
    std::cout << "Contains 30: " << table.contains(30) << std::endl;

    table.remove(10);
    table.remove(20);
    std::move(table).destroy_empty();
    return 0;
}
