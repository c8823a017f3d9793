/**
 * \ingroup kvt_examples
 * Walks through every Table operation on a persistent MDBX store.
 */

#include <kv_tables.hpp>
#include <iostream>
#include <string>

int main() {
    kvt::Config config;
    config.pathname = "full_methods_db";
    config.log_level = kvt::LogLevel::Debug;

    auto store = kvt::make_storage(config);
    auto table = kvt::Table<int, std::string>::create(store);

    // add
    table.add(1, "one");
    table.add(2, "two");
    try {
        table.add(2, "TWO");
    } catch (const kvt::TableException& e) {
        std::cout << "add(2) again: " << e.what() << std::endl;
    }

    // upsert
    table.upsert(3, "three");
    table.upsert(3, "THREE");

    // contains / borrow
    std::cout << "Contains key 1: " << table.contains(1) << std::endl;
    std::cout << "Contains key 4: " << table.contains(4) << std::endl;
    std::cout << "Key 3: " << table.borrow(3) << std::endl;
    std::cout << "Key 4 (default): " << table.borrow_with_default(4, "none") << std::endl;

    // borrow_mut
    table.borrow_mut(1, [](std::string& value) { value += "!"; });
    table.borrow_mut_with_default(4, "", [](std::string& value) { value = "four"; });
    std::cout << "Key 1: " << table.borrow(1) << ", key 4: " << table.borrow(4) << std::endl;

    // iteration
    auto it = table.iter();
    while (it.prepare()) {
        auto [key, value] = it.next();
        std::cout << key << ": " << value << std::endl;
    }

    // remove / length
    std::cout << "Removed: " << table.remove(2) << std::endl;
    std::cout << "Length: " << table.length() << std::endl;

    for (int key : {1, 3, 4}) table.remove(key);
    std::cout << "Empty: " << table.empty() << std::endl;
    std::move(table).destroy_empty();
    return 0;
}
