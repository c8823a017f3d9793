/**
 * \ingroup kvt_examples
 * Stores a user-defined struct that provides to_bytes() and from_bytes().
 */

#include <kv_tables.hpp>
#include <cstring>
#include <iostream>

struct Account {
    int64_t balance = 0;
    uint32_t operations = 0;

    std::vector<uint8_t> to_bytes() const {
        std::vector<uint8_t> bytes(sizeof(balance) + sizeof(operations));
        std::memcpy(bytes.data(), &balance, sizeof(balance));
        std::memcpy(bytes.data() + sizeof(balance), &operations, sizeof(operations));
        return bytes;
    }

    static Account from_bytes(const void* data, size_t size) {
        if (size != sizeof(int64_t) + sizeof(uint32_t))
            throw std::runtime_error("Invalid data size for Account");
        const uint8_t* ptr = static_cast<const uint8_t*>(data);
        Account a;
        std::memcpy(&a.balance, ptr, sizeof(a.balance));
        std::memcpy(&a.operations, ptr + sizeof(a.balance), sizeof(a.operations));
        return a;
    }
};

int main() {
    kvt::Config config;
    config.pathname = "accounts_db";

    auto store = kvt::make_storage(config);
    auto accounts = kvt::Table<std::string, Account>::create(store);

    for (const char* name : {"alice", "bob", "alice"}) {
        accounts.borrow_mut_with_default(name, Account{}, [](Account& a) {
            a.balance += 100;
            ++a.operations;
        });
    }

    const Account alice = accounts.borrow("alice");
    std::cout << "alice: " << alice.balance << " after " << alice.operations << " operations" << std::endl;
    std::cout << "accounts: " << accounts.length() << std::endl;
    std::cout << "table handle: " << accounts.handle() << std::endl;
    return 0;
}
