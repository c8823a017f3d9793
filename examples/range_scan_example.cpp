/**
 * \ingroup kvt_examples
 * Range scans over composite keys in both directions, using the in-memory backend.
 */

#include <kv_tables.hpp>
#include <iostream>
#include <tuple>

int main() {
    kvt::Config config;
    config.backend = kvt::StorageBackend::MEMORY;
    auto store = kvt::make_storage(config);

    // (symbol, timestamp) -> price
    using Key = std::tuple<std::string, int64_t>;
    auto prices = kvt::Table<Key, double>::create(store);
    prices.add(Key("BTC", 1000), 64000.0);
    prices.add(Key("BTC", 1060), 64120.5);
    prices.add(Key("BTC", 1120), 63990.0);
    prices.add(Key("ETH", 1000), 3100.0);
    prices.add(Key("ETH", 1060), 3104.2);

    std::cout << "BTC from 1000 to 1100:" << std::endl;
    auto it = prices.iter(Key("BTC", 1000), Key("BTC", 1100));
    while (auto entry = it.try_next()) {
        std::cout << "  " << std::get<1>(entry->first) << " -> " << entry->second << std::endl;
    }

    std::cout << "ETH, newest first:" << std::endl;
    auto rev = prices.iter(Key("ETH", INT64_MIN), Key("ETH", INT64_MAX), kvt::Direction::DESCENDING);
    while (rev.prepare()) {
        auto [key, price] = rev.next();
        std::cout << "  " << std::get<1>(key) << " -> " << price << std::endl;
    }
    return 0;
}
