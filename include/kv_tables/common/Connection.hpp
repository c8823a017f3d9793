#pragma once
#ifndef _KV_TABLES_CONNECTION_HPP_INCLUDED
#define _KV_TABLES_CONNECTION_HPP_INCLUDED

/// \file Connection.hpp
/// \brief Manages an MDBX environment opened from a Config.

namespace kvt {

    /// \class Connection
    /// \ingroup kvt_core
    /// \brief Owns a single MDBX environment and the per-thread units of work on it.
    class Connection : public TransactionTracker {
    public:

        /// \brief Constructs a connection and opens the environment.
        /// \param config Configuration used to initialize the environment.
        /// \throws TableException on configuration or environment errors.
        explicit Connection(const Config& config);

        /// \brief Destructor. Closes the MDBX environment.
        ~Connection() override;

        Connection(const Connection&) = delete;
        Connection& operator=(const Connection&) = delete;

        /// \brief Creates and connects a new shared Connection instance.
        /// \param config Configuration to use for initialization.
        /// \return Shared pointer to the created Connection.
        static std::shared_ptr<Connection> create(const Config& config);

        /// \brief Opens the environment again after disconnect().
        /// \throws TableException on environment errors.
        void connect();

        /// \brief Closes the MDBX environment and releases resources.
        /// \throws TableException if a unit of work is active or closing fails.
        void disconnect();

        /// \brief Checks whether the environment is currently open.
        /// \return true if connected, false otherwise.
        bool is_connected() const;

        /// \brief Creates a RAII transaction object.
        /// \param mode Transaction mode to open (default: WRITABLE).
        /// \throws TableException on MDBX errors.
        /// \return Transaction guard managing the MDBX_txn handle.
        Transaction transaction(TransactionMode mode = TransactionMode::WRITABLE);

        /// \brief Begins a manual transaction bound to the calling thread.
        /// \param mode The transaction mode (default: WRITABLE).
        /// \throws TableException if the thread already has one or beginning fails.
        void begin(TransactionMode mode = TransactionMode::WRITABLE);

        /// \brief Commits the manual transaction of the calling thread.
        /// \throws TableException if none is active or the commit fails.
        void commit();

        /// \brief Rolls back the manual transaction of the calling thread.
        /// \throws TableException if none is active or the abort fails.
        void rollback();

        /// \brief Returns the manual transaction of the calling thread.
        /// \return Shared pointer to the active Transaction or nullptr.
        std::shared_ptr<Transaction> current_txn() const;

        /// \brief Returns the environment handle.
        /// \return MDBX environment pointer.
        MDBX_env* env_handle() noexcept;

        /// \brief Returns the configuration the environment was opened with.
        const Config& config() const noexcept;

    private:
        MDBX_env* m_env = nullptr;          ///< Pointer to the MDBX environment handle.
        mutable std::mutex m_mdbx_mutex;    ///< Mutex for thread-safe access.
        std::unordered_map<std::thread::id, std::shared_ptr<Transaction>> m_transactions;
        Config m_config;                    ///< Database configuration object.

        /// \brief Creates directories and opens the environment.
        void initialize();

        /// \brief Safely closes the environment.
        /// \param use_throw If true, throw on error; otherwise log and continue.
        void cleanup(bool use_throw = true);

        /// \brief Applies geometry and flags and opens the MDBX environment.
        void db_init();

    }; // Connection

} // namespace kvt

#ifdef KV_TABLES_HEADER_ONLY
#include "Connection.ipp"
#endif

#endif // _KV_TABLES_CONNECTION_HPP_INCLUDED
