#pragma once
#ifndef _KV_TABLES_MDBX_STORE_HPP_INCLUDED
#define _KV_TABLES_MDBX_STORE_HPP_INCLUDED

/// \file MdbxStore.hpp
/// \brief Storage provider persisting tables in a libmdbx environment.

namespace kvt {

    /// \class MdbxStore
    /// \ingroup kvt_storage
    /// \brief Maps every handle to one named MDBX table (DBI).
    ///
    /// Handles are allocated from a counter kept in the `kvt_meta` table, so
    /// they stay unique across process restarts. Key bytes are stored as-is
    /// and compared with the default MDBX comparator (memcmp, shorter first).
    ///
    /// Cursors keep only the last visited key and re-position on every
    /// advance(), so an open cursor never pins a read transaction.
    class MdbxStore final : public StorageProvider {
    public:
        /// \brief Opens the environment described by \a config.
        explicit MdbxStore(const Config& config);

        /// \brief Uses an already opened environment.
        explicit MdbxStore(std::shared_ptr<Connection> connection);

        ~MdbxStore() override = default;

        MdbxStore(const MdbxStore&) = delete;
        MdbxStore& operator=(const MdbxStore&) = delete;

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

        /// \brief Abort count of the shared connection.
        uint64_t generation() const noexcept override;

        /// \brief Returns the underlying connection.
        std::shared_ptr<Connection> connection() const noexcept;

    private:
        struct CursorState {
            Handle handle;
            std::optional<Bytes> start;   ///< Inclusive lower bound.
            std::optional<Bytes> end;     ///< Exclusive upper bound.
            Direction direction;
            std::optional<Bytes> current; ///< Last key returned, if positioned.
            bool exhausted = false;
        };

        std::shared_ptr<Connection> m_connection; ///< Shared connection to MDBX environment.
        MDBX_dbi m_meta_dbi{};                    ///< DBI holding the handle counter.
        mutable std::mutex m_mutex;               ///< Guards m_dbis and m_cursors.
        mutable std::unordered_map<Handle, MDBX_dbi> m_dbis;
        std::unordered_map<CursorId, CursorState> m_cursors;
        CursorId m_next_cursor = 1;

        /// \brief Executes a functor within a transaction context.
        ///
        /// Joins the transaction bound to the calling thread if there is one,
        /// otherwise runs \a action in its own transaction.
        template<typename F>
        void with_transaction(F&& action, TransactionMode mode) const;

        /// \brief Returns the DBI of \a handle, opening it on first use.
        /// \throws TableException (STORAGE_ERROR) if the handle does not exist.
        MDBX_dbi open_dbi(MDBX_txn* txn, Handle handle, bool create) const;

        void forget_dbis() const;

        CursorState cursor_state(CursorId cursor) const;

        static std::string table_name(Handle handle);
    };

} // namespace kvt

#ifdef KV_TABLES_HEADER_ONLY
#include "MdbxStore.ipp"
#endif

#endif // _KV_TABLES_MDBX_STORE_HPP_INCLUDED
