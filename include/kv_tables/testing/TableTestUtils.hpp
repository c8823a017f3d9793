#pragma once
#ifndef _KV_TABLES_TABLE_TEST_UTILS_HPP_INCLUDED
#define _KV_TABLES_TABLE_TEST_UTILS_HPP_INCLUDED

/// \file TableTestUtils.hpp
/// \brief Helpers that bypass table invariants. Test builds only.

#ifndef KV_TABLES_ENABLE_TEST_UTILS
#error "kv_tables/testing/TableTestUtils.hpp requires KV_TABLES_ENABLE_TEST_UTILS"
#endif

#include "../Table.hpp"

namespace kvt {
namespace testing {

    /// \class TableBackdoor
    /// \brief Grants test code access to table internals.
    class TableBackdoor {
    public:
        /// \brief Releases the handle of \a table even if entries remain.
        ///
        /// Remaining entries are removed first; their bytes are never decoded.
        template<class KeyT, class ValueT>
        static void destroy_unchecked(Table<KeyT, ValueT>&& table) {
            StorageProvider& store = table.provider();
            std::vector<Bytes> keys;
            const CursorId cursor = store.open_cursor(table.m_handle, std::nullopt, std::nullopt,
                                                      Direction::ASCENDING);
            try {
                while (store.advance(cursor)) {
                    keys.push_back(store.read(cursor).first);
                }
            } catch (...) {
                store.close_cursor(cursor);
                throw;
            }
            store.close_cursor(cursor);

            KVT_LOG_WARN("table {} destroyed unchecked with {} entries", table.m_handle, keys.size());
            for (const Bytes& key : keys) {
                store.remove(table.m_handle, key);
            }
            store.release_handle(table.m_handle);
            table.m_provider.reset();
            table.m_length = 0;
        }

        /// \brief Overwrites the cached length of \a table.
        template<class KeyT, class ValueT>
        static void set_length(Table<KeyT, ValueT>& table, std::size_t length) {
            table.m_length = length;
        }
    };

    /// \brief Discards a table regardless of its contents.
    template<class KeyT, class ValueT>
    void destroy_unchecked(Table<KeyT, ValueT>&& table) {
        TableBackdoor::destroy_unchecked(std::move(table));
    }

} // namespace testing
} // namespace kvt

#endif // _KV_TABLES_TABLE_TEST_UTILS_HPP_INCLUDED
