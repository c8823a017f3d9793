#pragma once
#ifndef _KV_TABLES_MEMORY_STORE_HPP_INCLUDED
#define _KV_TABLES_MEMORY_STORE_HPP_INCLUDED

/// \file MemoryStore.hpp
/// \brief In-memory storage provider backed by ordered byte maps.

namespace kvt {

    /// \class MemoryStore
    /// \ingroup kvt_storage
    /// \brief Keeps every handle in a std::map ordered by key bytes.
    ///
    /// Nothing is persisted. A unit of work snapshots all maps on begin() and
    /// restores them on rollback(); only one unit of work may be active at a time.
    class MemoryStore final : public StorageProvider {
    public:
        MemoryStore() = default;
        ~MemoryStore() override = default;

        MemoryStore(const MemoryStore&) = delete;
        MemoryStore& operator=(const MemoryStore&) = delete;

        Handle create_handle() override;
        void insert(Handle handle, const Bytes& key, const Bytes& value) override;
        Bytes lookup(Handle handle, const Bytes& key) const override;
        void lookup_mut(Handle handle, const Bytes& key,
                        const std::function<void(Bytes&)>& mutator) override;
        Bytes remove(Handle handle, const Bytes& key) override;
        bool exists(Handle handle, const Bytes& key) const override;
        std::size_t count(Handle handle) const override;
        void release_handle(Handle handle) override;

        CursorId open_cursor(Handle handle,
                             const std::optional<Bytes>& start,
                             const std::optional<Bytes>& end,
                             Direction direction) override;
        bool advance(CursorId cursor) override;
        std::pair<Bytes, Bytes> read(CursorId cursor) const override;
        void close_cursor(CursorId cursor) noexcept override;

        void begin() override;
        void commit() override;
        void rollback() override;
        bool in_transaction() const override;
        uint64_t generation() const noexcept override;

        /// \brief Returns the number of open cursors.
        std::size_t open_cursors() const;

    private:
        using Map = std::map<Bytes, Bytes>;

        struct CursorState {
            Handle handle;
            std::optional<Bytes> start;   ///< Inclusive lower bound.
            std::optional<Bytes> end;     ///< Exclusive upper bound.
            Direction direction;
            std::optional<Bytes> current; ///< Key under the cursor, if positioned.
            bool exhausted = false;
        };

        struct Snapshot {
            std::unordered_map<Handle, Map> tables;
            Handle next_handle;
        };

        mutable std::mutex m_mutex;
        std::unordered_map<Handle, Map> m_tables;
        std::unordered_map<CursorId, CursorState> m_cursors;
        Handle m_next_handle = 1;
        CursorId m_next_cursor = 1;
        std::optional<Snapshot> m_snapshot;   ///< State at begin() of the active unit of work.
        std::thread::id m_txn_owner;          ///< Thread that owns the active unit of work.
        std::atomic<uint64_t> m_generation{0};

        Map& table(Handle handle);
        const Map& table(Handle handle) const;
        CursorState& cursor_state(CursorId cursor);
        const CursorState& cursor_state(CursorId cursor) const;
    };

} // namespace kvt

#ifdef KV_TABLES_HEADER_ONLY
#include "MemoryStore.ipp"
#endif

#endif // _KV_TABLES_MEMORY_STORE_HPP_INCLUDED
