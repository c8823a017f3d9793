#pragma once
#ifndef _KV_TABLES_STORAGE_PROVIDER_HPP_INCLUDED
#define _KV_TABLES_STORAGE_PROVIDER_HPP_INCLUDED

/// \file StorageProvider.hpp
/// \brief Primitive handle-addressed store that tables are built on.

namespace kvt {

    using Handle = uint64_t;   ///< Identifies one table region inside a provider.
    using CursorId = uint64_t; ///< Identifies one open range cursor.

    /// \enum Direction
    /// \brief Traversal order of a range cursor.
    enum class Direction {
        ASCENDING,  ///< From the lowest key upwards.
        DESCENDING  ///< From the highest key downwards.
    };

    /// \class StorageProvider
    /// \ingroup kvt_storage
    /// \brief Abstract primitive store addressed by handle and key bytes.
    ///
    /// Keys are compared as unsigned bytes (memcmp order, shorter prefix first).
    /// Values are opaque wrapped bytes. Every method throws TableException:
    /// ALREADY_EXISTS and NOT_FOUND as documented, STORAGE_ERROR for unknown
    /// handles or cursors and for backend failures.
    ///
    /// Outside a unit of work (\ref begin / \ref commit) every call runs in its
    /// own transaction; inside one, all calls from the owning thread join it.
    class StorageProvider {
    public:
        virtual ~StorageProvider() = default;

        /// \brief Allocates a fresh, empty handle.
        virtual Handle create_handle() = 0;

        /// \brief Inserts a new entry.
        /// \throws TableException ALREADY_EXISTS if \a key is present.
        virtual void insert(Handle handle, const Bytes& key, const Bytes& value) = 0;

        /// \brief Returns a copy of the stored value.
        /// \throws TableException NOT_FOUND if \a key is absent.
        virtual Bytes lookup(Handle handle, const Bytes& key) const = 0;

        /// \brief Lets \a mutator edit the stored value in place, then persists it.
        ///
        /// Nothing is written if \a mutator throws.
        /// \throws TableException NOT_FOUND if \a key is absent.
        virtual void lookup_mut(Handle handle, const Bytes& key,
                                const std::function<void(Bytes&)>& mutator) = 0;

        /// \brief Deletes an entry and returns its value.
        /// \throws TableException NOT_FOUND if \a key is absent.
        virtual Bytes remove(Handle handle, const Bytes& key) = 0;

        /// \brief Checks whether \a key is present.
        virtual bool exists(Handle handle, const Bytes& key) const = 0;

        /// \brief Returns the number of entries stored under \a handle.
        virtual std::size_t count(Handle handle) const = 0;

        /// \brief Releases an empty handle.
        /// \throws TableException NOT_EMPTY if entries are still stored under \a handle.
        virtual void release_handle(Handle handle) = 0;

        /// \brief Opens a cursor over keys in [start, end).
        /// \param start Inclusive lower bound; unbounded if empty.
        /// \param end Exclusive upper bound; unbounded if empty.
        /// \param direction Traversal order.
        virtual CursorId open_cursor(Handle handle,
                                     const std::optional<Bytes>& start,
                                     const std::optional<Bytes>& end,
                                     Direction direction) = 0;

        /// \brief Moves the cursor to the next entry in bounds.
        /// \return false once the range is exhausted.
        virtual bool advance(CursorId cursor) = 0;

        /// \brief Reads the entry at the cursor position.
        /// \throws TableException USAGE_ERROR if the cursor is not positioned.
        virtual std::pair<Bytes, Bytes> read(CursorId cursor) const = 0;

        /// \brief Closes the cursor. Unknown ids are ignored.
        virtual void close_cursor(CursorId cursor) noexcept = 0;

        /// \brief Starts a unit of work bound to the calling thread.
        /// \throws TableException USAGE_ERROR if one is already active.
        virtual void begin() = 0;

        /// \brief Makes all changes of the current unit of work permanent.
        /// \throws TableException USAGE_ERROR if no unit of work is active.
        virtual void commit() = 0;

        /// \brief Discards all changes of the current unit of work.
        /// \throws TableException USAGE_ERROR if no unit of work is active.
        virtual void rollback() = 0;

        /// \brief Checks whether the calling thread has an active unit of work.
        virtual bool in_transaction() const = 0;

        /// \brief Counter that changes every time written data is discarded.
        ///
        /// Increases on each rollback, so state cached from earlier reads
        /// (such as a table length) is stale once the value differs.
        virtual uint64_t generation() const noexcept = 0;
    };

    /// \brief Executes an operation inside a unit of work.
    ///
    /// Commits when \a operation returns; rolls back and rethrows when it throws.
    /// Tables changed by a rolled-back operation re-read their length on next use.
    /// \param provider Store to run the unit of work on.
    /// \param operation The function to execute.
    template<typename Func>
    void execute_in_transaction(StorageProvider& provider, Func operation) {
        provider.begin();
        try {
            operation();
        } catch(...) {
            try {
                provider.rollback();
            } catch (const std::exception& e) {
                KVT_LOG_WARN("rollback after failed unit of work also failed: {}", e.what());
            }
            throw;
        }
        provider.commit();
    }

} // namespace kvt

#endif // _KV_TABLES_STORAGE_PROVIDER_HPP_INCLUDED
