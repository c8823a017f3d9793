#pragma once
#ifndef _KV_TABLES_TABLE_HPP_INCLUDED
#define _KV_TABLES_TABLE_HPP_INCLUDED

/// \file Table.hpp
/// \brief Declaration of the Table class, a typed key-value table over a storage provider.

#include "common.hpp"
#include "TableIterator.hpp"

namespace kvt {

#ifdef KV_TABLES_ENABLE_TEST_UTILS
    namespace testing {
        class TableBackdoor;
    }
#endif

    /// \class Table
    /// \ingroup kvt_tables
    /// \brief Typed key-value table occupying one handle of a storage provider.
    /// \tparam KeyT Type of the keys; must be supported by KeyCodec.
    /// \tparam ValueT Type of the values; must be supported by the value codec.
    ///
    /// Keys are encoded with an order-preserving codec, so equality, existence
    /// and range bounds are all decided on the encoded bytes. Values are stored
    /// inside a Box that is created only when a value enters the table and
    /// unwrapped only when it leaves through remove().
    ///
    /// The table caches its entry count. Every successful mutation keeps the
    /// cache equal to the number of entries under the handle; a failed call
    /// leaves it untouched. When the provider reports a rollback (its
    /// generation changed) the count is re-read before it is used again.
    ///
    /// Tables are move-only. A moved-from table, or one consumed by
    /// destroy_empty(), rejects every operation with USAGE_ERROR. Dropping a
    /// table object does not release its handle: the entries stay in the
    /// store and can be reached again through attach().
    template<class KeyT, class ValueT>
    class Table {
    public:
        using key_type = KeyT;
        using mapped_type = ValueT;
        using iterator = TableIterator<KeyT, ValueT>;

        /// \brief Creates an empty table under a freshly allocated handle.
        /// \param provider Store the table lives in.
        /// \throws TableException USAGE_ERROR if \a provider is null.
        static Table create(std::shared_ptr<StorageProvider> provider) {
            if (!provider) {
                throw TableException(TableErrc::USAGE_ERROR, "table requires a storage provider");
            }
            const uint64_t generation = provider->generation();
            const Handle handle = provider->create_handle();
            KVT_LOG_DEBUG("table {} created", handle);
            return Table(std::move(provider), handle, 0, generation);
        }

        /// \brief Binds a table object to an existing handle.
        ///
        /// The cached length is re-derived from the provider, which makes this
        /// the way to resume a table after reopening a persistent store.
        /// \throws TableException STORAGE_ERROR if the handle is unknown.
        static Table attach(std::shared_ptr<StorageProvider> provider, Handle handle) {
            if (!provider) {
                throw TableException(TableErrc::USAGE_ERROR, "table requires a storage provider");
            }
            const uint64_t generation = provider->generation();
            const std::size_t length = provider->count(handle);
            KVT_LOG_DEBUG("table {} attached with {} entries", handle, length);
            return Table(std::move(provider), handle, length, generation);
        }

        Table(const Table&) = delete;
        Table& operator=(const Table&) = delete;

        Table(Table&& other) noexcept
            : m_provider(std::move(other.m_provider)),
              m_handle(other.m_handle),
              m_length(other.m_length),
              m_generation(other.m_generation) {
            other.m_length = 0;
        }

        Table& operator=(Table&& other) noexcept {
            if (this != &other) {
                m_provider = std::move(other.m_provider);
                m_handle = other.m_handle;
                m_length = other.m_length;
                m_generation = other.m_generation;
                other.m_length = 0;
            }
            return *this;
        }

        ~Table() = default;

        /// \brief Inserts a new entry.
        /// \throws TableException ALREADY_EXISTS if the key is present.
        void add(const KeyT& key, ValueT value) {
            StorageProvider& store = synced();
            const Bytes key_bytes = serialize_key(key);
            insert_boxed(store, key_bytes, std::move(value));
        }

        /// \brief Returns a copy of the value stored under \a key.
        /// \throws TableException NOT_FOUND if the key is absent.
        ValueT borrow(const KeyT& key) const {
            const Bytes stored = provider().lookup(m_handle, serialize_key(key));
            return read_value(stored);
        }

        /// \brief Lets \a fn modify the value stored under \a key.
        ///
        /// The value is written back when \a fn returns; if \a fn throws the
        /// stored value is left as it was.
        /// \param fn Callable taking `ValueT&`.
        /// \return Whatever \a fn returns (by value).
        /// \throws TableException NOT_FOUND if the key is absent.
        template<class F>
        auto borrow_mut(const KeyT& key, F&& fn) {
            using ResultT = std::decay_t<std::invoke_result_t<F&, ValueT&>>;
            StorageProvider& store = provider();
            const Bytes key_bytes = serialize_key(key);
            KVT_LOG_TRACE("table {}: borrow_mut", m_handle);

            if constexpr (std::is_void_v<ResultT>) {
                store.lookup_mut(m_handle, key_bytes, [&fn](Bytes& stored) {
                    ValueT value = Box<ValueT>::peek(stored);
                    fn(value);
                    stored = Box<ValueT>::pack(value);
                });
            } else {
                std::optional<ResultT> result;
                store.lookup_mut(m_handle, key_bytes, [&fn, &result](Bytes& stored) {
                    ValueT value = Box<ValueT>::peek(stored);
                    result.emplace(fn(value));
                    stored = Box<ValueT>::pack(value);
                });
                return std::move(*result);
            }
        }

        /// \brief Returns the stored value, or \a default_value if the key is absent.
        ///
        /// Never modifies the table.
        ValueT borrow_with_default(const KeyT& key, const ValueT& default_value) const {
            StorageProvider& store = provider();
            const Bytes key_bytes = serialize_key(key);
            if (!store.exists(m_handle, key_bytes)) {
                return default_value;
            }
            return read_value(store.lookup(m_handle, key_bytes));
        }

        /// \brief Behaves as borrow_mut(), starting from \a default_value if the key is absent.
        ///
        /// An absent key is inserted only after \a fn returns, holding the value
        /// \a fn left in \a default_value. If \a fn throws nothing is stored.
        template<class F>
        auto borrow_mut_with_default(const KeyT& key, ValueT default_value, F&& fn) {
            using ResultT = std::decay_t<std::invoke_result_t<F&, ValueT&>>;
            StorageProvider& store = synced();
            const Bytes key_bytes = serialize_key(key);
            if (store.exists(m_handle, key_bytes)) {
                return borrow_mut(key, std::forward<F>(fn));
            }
            if constexpr (std::is_void_v<ResultT>) {
                fn(default_value);
                insert_boxed(store, key_bytes, std::move(default_value));
            } else {
                ResultT result = fn(default_value);
                insert_boxed(store, key_bytes, std::move(default_value));
                return result;
            }
        }

        /// \brief Inserts the entry, or replaces the stored value if the key is present.
        ///
        /// Replacing leaves the length unchanged.
        void upsert(const KeyT& key, ValueT value) {
            StorageProvider& store = synced();
            const Bytes key_bytes = serialize_key(key);
            if (!store.exists(m_handle, key_bytes)) {
                insert_boxed(store, key_bytes, std::move(value));
                return;
            }
            KVT_LOG_TRACE("table {}: replace", m_handle);
            store.lookup_mut(m_handle, key_bytes, [&value](Bytes& stored) {
                Box<ValueT>::check_tag(stored);
                stored = Box<ValueT>::pack(value);
            });
        }

        /// \brief Removes an entry and returns its value.
        /// \throws TableException NOT_FOUND if the key is absent.
        ValueT remove(const KeyT& key) {
            StorageProvider& store = synced();
            Bytes stored = store.remove(m_handle, serialize_key(key));
            --m_length;
            KVT_LOG_TRACE("table {}: remove, length {}", m_handle, m_length);
            return Box<ValueT>::from_bytes(stored).unwrap();
        }

        /// \brief Checks whether \a key is present.
        bool contains(const KeyT& key) const {
            return provider().exists(m_handle, serialize_key(key));
        }

        /// \brief Number of entries in the table.
        std::size_t length() const {
            synced();
            return m_length;
        }

        /// \brief Checks whether the table has no entries.
        bool empty() const {
            return length() == 0;
        }

        /// \brief Handle of the table inside its provider.
        Handle handle() const {
            provider();
            return m_handle;
        }

        /// \brief Releases the handle of an empty table and consumes the table.
        /// \throws TableException NOT_EMPTY if the table still has entries.
        void destroy_empty() && {
            StorageProvider& store = synced();
            if (m_length != 0) {
                throw TableException(TableErrc::NOT_EMPTY,
                    "table " + std::to_string(m_handle) + " still holds " +
                    std::to_string(m_length) + " entries");
            }
            store.release_handle(m_handle);
            KVT_LOG_DEBUG("table {} destroyed", m_handle);
            m_provider.reset();
        }

        /// \brief Opens a range iterator over keys in [start, end).
        /// \param start Inclusive lower bound; unbounded if empty.
        /// \param end Exclusive upper bound; unbounded if empty.
        /// \param direction Traversal order.
        iterator iter(const std::optional<KeyT>& start = std::nullopt,
                      const std::optional<KeyT>& end = std::nullopt,
                      Direction direction = Direction::ASCENDING) const {
            StorageProvider& store = provider();
            std::optional<Bytes> start_bytes;
            std::optional<Bytes> end_bytes;
            if (start) start_bytes = serialize_key(*start);
            if (end) end_bytes = serialize_key(*end);
            const CursorId cursor = store.open_cursor(m_handle, start_bytes, end_bytes, direction);
            KVT_LOG_DEBUG("table {}: cursor {} opened", m_handle, cursor);
            return iterator(m_provider, cursor, direction);
        }

    private:
        friend class TableIterator<KeyT, ValueT>;
#ifdef KV_TABLES_ENABLE_TEST_UTILS
        friend class testing::TableBackdoor;
#endif

        std::shared_ptr<StorageProvider> m_provider; ///< Null once moved from or destroyed.
        Handle m_handle = 0;
        mutable std::size_t m_length = 0;
        mutable uint64_t m_generation = 0; ///< Provider generation m_length was derived at.

        Table(std::shared_ptr<StorageProvider> provider, Handle handle,
              std::size_t length, uint64_t generation)
            : m_provider(std::move(provider)), m_handle(handle),
              m_length(length), m_generation(generation) {}

        StorageProvider& provider() const {
            if (!m_provider) {
                throw TableException(TableErrc::USAGE_ERROR, "table was moved from or destroyed");
            }
            return *m_provider;
        }

        /// \brief Returns the provider after refreshing a length invalidated by a rollback.
        StorageProvider& synced() const {
            StorageProvider& store = provider();
            const uint64_t generation = store.generation();
            if (generation != m_generation) {
                m_length = store.count(m_handle);
                m_generation = generation;
                KVT_LOG_DEBUG("table {}: length re-read after rollback, {} entries", m_handle, m_length);
            }
            return store;
        }

        void insert_boxed(StorageProvider& store, const Bytes& key_bytes, ValueT value) {
            Box<ValueT> box(std::move(value));
            store.insert(m_handle, key_bytes, box.to_bytes());
            ++m_length;
            KVT_LOG_TRACE("table {}: insert, length {}", m_handle, m_length);
        }

        /// \brief Decodes a copy of a stored value.
        static ValueT read_value(const Bytes& stored) {
            return Box<ValueT>::peek(stored);
        }
    };

} // namespace kvt

#endif // _KV_TABLES_TABLE_HPP_INCLUDED
