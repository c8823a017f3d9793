#pragma once
#ifndef _KV_TABLES_TRANSACTION_HPP_INCLUDED
#define _KV_TABLES_TRANSACTION_HPP_INCLUDED

/// \file Transaction.hpp
/// \brief Declares the Transaction class, a wrapper for managing MDBX transactions.

namespace kvt {

    /// \enum TransactionMode
    /// \brief Specifies the access mode of a transaction.
    enum class TransactionMode {
        READ_ONLY,  ///< Read-only transaction (no write operations allowed).
        WRITABLE    ///< Writable transaction (allows inserts, updates, deletes).
    };

    /// \class Transaction
    /// \brief RAII guard over one MDBX transaction.
    ///
    /// The transaction is started by the constructor and bound to the calling
    /// thread until it is committed or rolled back. A transaction that is still
    /// active when the guard is destroyed is aborted.
    class Transaction {
        friend class Connection;
    public:

        /// \brief Starts a new transaction.
        /// \param tracker Registry the transaction is bound in.
        /// \param env Pointer to the MDBX environment handle.
        /// \param mode Access mode of the transaction.
        /// \throws TableException if beginning fails.
        Transaction(TransactionTracker* tracker, MDBX_env* env, TransactionMode mode);

        /// \brief Aborts the transaction if it is still active.
        ~Transaction();

        Transaction(const Transaction&) = delete;
        Transaction& operator=(const Transaction&) = delete;

        /// \brief Commits the transaction.
        /// \throws TableException if no transaction is active or the commit fails.
        void commit();

        /// \brief Rolls back the transaction.
        /// \throws TableException if no transaction is active or the abort fails.
        void rollback();

        /// \brief Returns the internal MDBX transaction handle.
        /// \return Raw pointer to MDBX_txn, or nullptr if not active.
        MDBX_txn* handle() const noexcept;

        /// \brief Returns the access mode.
        TransactionMode mode() const noexcept;

    private:
        TransactionTracker* m_tracker = nullptr;
        MDBX_txn*       m_txn = nullptr;            ///< MDBX transaction handle.
        TransactionMode m_mode;                     ///< Transaction mode.

        /// \brief Commits or aborts the transaction and unbinds it from the thread.
        void finish(bool commit);
    }; // Transaction

} // namespace kvt

#ifdef KV_TABLES_HEADER_ONLY
#include "Transaction.ipp"
#endif

#endif // _KV_TABLES_TRANSACTION_HPP_INCLUDED
