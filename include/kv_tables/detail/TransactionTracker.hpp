#pragma once
#ifndef _KV_TABLES_TRANSACTION_TRACKER_HPP_INCLUDED
#define _KV_TABLES_TRANSACTION_TRACKER_HPP_INCLUDED

/// \file TransactionTracker.hpp
/// \brief Tracks the MDBX transaction each thread is currently running.

namespace kvt {

    /// \class TransactionTracker
    /// \ingroup kvt_core
    /// \brief Associates MDBX transactions with threads.
    ///
    /// A storage call that finds a transaction bound to its thread joins it
    /// instead of starting its own; this is how nested calls and units of work
    /// share one MDBX transaction.
    class TransactionTracker {
        friend class Transaction;
    public:
        virtual ~TransactionTracker() = default;

        /// \brief Retrieves the transaction bound to the current thread.
        /// \return Pointer to the MDBX transaction, or nullptr if none.
        MDBX_txn* thread_txn() const;

        /// \brief Number of writable transactions aborted so far.
        ///
        /// Changes whenever data written through this tracker may have been
        /// discarded; callers caching derived state compare it before use.
        uint64_t abort_generation() const noexcept;

    protected:
        /// \brief Binds a transaction to the current thread.
        /// \param txn Pointer to the MDBX transaction.
        void bind_txn(MDBX_txn* txn);

        /// \brief Unbinds \a txn from the current thread if it is the bound one.
        void unbind_txn(MDBX_txn* txn);

        /// \brief Records that a writable transaction was aborted.
        void note_abort() noexcept;

    private:
        mutable std::mutex m_mutex;  ///< Protects access to m_thread_txns.
        std::unordered_map<std::thread::id, MDBX_txn*> m_thread_txns; ///< Thread id to bound transaction.
        std::atomic<uint64_t> m_aborts{0};
    };

} // namespace kvt

#ifdef KV_TABLES_HEADER_ONLY
#include "TransactionTracker.ipp"
#endif

#endif // _KV_TABLES_TRANSACTION_TRACKER_HPP_INCLUDED
