namespace kvt {

    inline Transaction::Transaction(TransactionTracker* tracker, MDBX_env* env, TransactionMode mode)
        : m_tracker(tracker), m_mode(mode) {
        if (!env) {
            throw TableException(TableErrc::USAGE_ERROR, "MDBX environment is not open");
        }
        MDBX_txn_flags_t flags = (m_mode == TransactionMode::READ_ONLY) ? MDBX_TXN_RDONLY : MDBX_TXN_READWRITE;
        check_mdbx(mdbx_txn_begin(env, nullptr, flags, &m_txn), "Failed to begin transaction");
        m_tracker->bind_txn(m_txn);
    }

    inline Transaction::~Transaction() {
        if (!m_txn) return;
        m_tracker->unbind_txn(m_txn);
        if (m_mode == TransactionMode::WRITABLE) m_tracker->note_abort();
        int rc = mdbx_txn_abort(m_txn);
        if (rc != MDBX_SUCCESS) {
            KVT_LOG_WARN("Failed to abort transaction: ({}) {}", rc, mdbx_strerror(rc));
        }
        m_txn = nullptr;
    }

    inline void Transaction::commit() {
        finish(true);
    }

    inline void Transaction::rollback() {
        finish(false);
    }

    inline void Transaction::finish(bool commit) {
        if (!m_txn) {
            throw TableException(TableErrc::USAGE_ERROR,
                commit ? "No active transaction to commit." : "No active transaction to rollback.");
        }
        MDBX_txn* txn = m_txn;
        m_txn = nullptr;
        m_tracker->unbind_txn(txn);
        // MDBX releases the handle even when the commit fails
        if (commit) {
            const int rc = mdbx_txn_commit(txn);
            if (rc != MDBX_SUCCESS && m_mode == TransactionMode::WRITABLE) m_tracker->note_abort();
            check_mdbx(rc, m_mode == TransactionMode::WRITABLE
                ? "Failed to commit writable transaction"
                : "Failed to finish read-only transaction");
        } else {
            if (m_mode == TransactionMode::WRITABLE) m_tracker->note_abort();
            check_mdbx(mdbx_txn_abort(txn), "Failed to abort transaction");
        }
    }

    inline MDBX_txn* Transaction::handle() const noexcept {
        return m_txn;
    }

    inline TransactionMode Transaction::mode() const noexcept {
        return m_mode;
    }

} // namespace kvt
