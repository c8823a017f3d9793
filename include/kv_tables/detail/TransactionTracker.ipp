namespace kvt {

    inline void TransactionTracker::bind_txn(MDBX_txn* txn) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_thread_txns[std::this_thread::get_id()] = txn;
    }

    inline void TransactionTracker::unbind_txn(MDBX_txn* txn) {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_thread_txns.find(std::this_thread::get_id());
        if (it != m_thread_txns.end() && it->second == txn) {
            m_thread_txns.erase(it);
        }
    }

    inline MDBX_txn* TransactionTracker::thread_txn() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_thread_txns.find(std::this_thread::get_id());
        return (it != m_thread_txns.end()) ? it->second : nullptr;
    }

    inline uint64_t TransactionTracker::abort_generation() const noexcept {
        return m_aborts.load(std::memory_order_acquire);
    }

    inline void TransactionTracker::note_abort() noexcept {
        m_aborts.fetch_add(1, std::memory_order_acq_rel);
    }

} // namespace kvt
