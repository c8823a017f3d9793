namespace kvt {

    namespace detail {

        constexpr const char* META_TABLE = "kvt_meta";
        constexpr const char* NEXT_HANDLE_KEY = "next_handle";

        /// \brief Closes an MDBX cursor on scope exit.
        struct MdbxCursorGuard {
            MDBX_cursor* cursor = nullptr;

            MdbxCursorGuard(MDBX_txn* txn, MDBX_dbi dbi) {
                check_mdbx(mdbx_cursor_open(txn, dbi, &cursor), "Failed to open MDBX cursor");
            }

            ~MdbxCursorGuard() {
                if (cursor) mdbx_cursor_close(cursor);
            }

            MdbxCursorGuard(const MdbxCursorGuard&) = delete;
            MdbxCursorGuard& operator=(const MdbxCursorGuard&) = delete;
        };

    } // namespace detail

    inline MdbxStore::MdbxStore(const Config& config)
        : MdbxStore(Connection::create(config)) {}

    inline MdbxStore::MdbxStore(std::shared_ptr<Connection> connection)
        : m_connection(std::move(connection)) {
        if (!m_connection) {
            throw TableException(TableErrc::USAGE_ERROR, "MdbxStore requires a connection");
        }
        const bool read_only = m_connection->config().read_only;
        with_transaction([this, read_only](MDBX_txn* txn) {
            check_mdbx(
                mdbx_dbi_open(txn, detail::META_TABLE, read_only ? MDBX_DB_DEFAULTS : MDBX_CREATE, &m_meta_dbi),
                "Failed to open metadata table"
            );
        }, read_only ? TransactionMode::READ_ONLY : TransactionMode::WRITABLE);
    }

    inline Handle MdbxStore::create_handle() {
        Handle handle = 0;
        with_transaction([this, &handle](MDBX_txn* txn) {
            const std::string name(detail::NEXT_HANDLE_KEY);
            MDBX_val db_key;
            db_key.iov_base = const_cast<char*>(name.data());
            db_key.iov_len = name.size();

            uint64_t next = 1;
            MDBX_val db_val;
            int rc = mdbx_get(txn, m_meta_dbi, &db_key, &db_val);
            if (rc == MDBX_SUCCESS) {
                next = deserialize_value<uint64_t>(static_cast<const uint8_t*>(db_val.iov_base), db_val.iov_len);
            } else if (rc != MDBX_NOTFOUND) {
                check_mdbx(rc, "Failed to read handle counter");
            }

            Bytes counter;
            serialize_value(static_cast<uint64_t>(next + 1), counter);
            MDBX_val counter_val = to_mdbx_val(counter);
            check_mdbx(
                mdbx_put(txn, m_meta_dbi, &db_key, &counter_val, MDBX_UPSERT),
                "Failed to write handle counter"
            );
            open_dbi(txn, next, true);
            handle = next;
        }, TransactionMode::WRITABLE);
        KVT_LOG_DEBUG("mdbx: created handle {}", handle);
        return handle;
    }

    inline void MdbxStore::insert(Handle handle, const Bytes& key, const Bytes& value) {
        with_transaction([this, handle, &key, &value](MDBX_txn* txn) {
            MDBX_dbi dbi = open_dbi(txn, handle, false);
            MDBX_val db_key = to_mdbx_val(key);
            MDBX_val db_val = to_mdbx_val(value);
            int rc = mdbx_put(txn, dbi, &db_key, &db_val, MDBX_NOOVERWRITE);
            if (rc == MDBX_KEYEXIST) {
                throw TableException(TableErrc::ALREADY_EXISTS, "key already present", rc);
            }
            check_mdbx(rc, "Failed to insert key-value pair");
        }, TransactionMode::WRITABLE);
    }

    inline Bytes MdbxStore::lookup(Handle handle, const Bytes& key) const {
        Bytes value;
        with_transaction([this, handle, &key, &value](MDBX_txn* txn) {
            MDBX_dbi dbi = open_dbi(txn, handle, false);
            MDBX_val db_key = to_mdbx_val(key);
            MDBX_val db_val;
            int rc = mdbx_get(txn, dbi, &db_key, &db_val);
            if (rc == MDBX_NOTFOUND) {
                throw TableException(TableErrc::NOT_FOUND, "key not found", rc);
            }
            check_mdbx(rc, "Failed to retrieve value");
            value = to_bytes(db_val);
        }, TransactionMode::READ_ONLY);
        return value;
    }

    inline void MdbxStore::lookup_mut(Handle handle, const Bytes& key,
                                      const std::function<void(Bytes&)>& mutator) {
        with_transaction([this, handle, &key, &mutator](MDBX_txn* txn) {
            MDBX_dbi dbi = open_dbi(txn, handle, false);
            MDBX_val db_key = to_mdbx_val(key);
            MDBX_val db_val;
            int rc = mdbx_get(txn, dbi, &db_key, &db_val);
            if (rc == MDBX_NOTFOUND) {
                throw TableException(TableErrc::NOT_FOUND, "key not found", rc);
            }
            check_mdbx(rc, "Failed to retrieve value");

            // the page behind db_val may move once the mutator writes elsewhere
            Bytes value = to_bytes(db_val);
            mutator(value);

            MDBX_val new_val = to_mdbx_val(value);
            check_mdbx(
                mdbx_put(txn, dbi, &db_key, &new_val, MDBX_UPSERT),
                "Failed to write modified value"
            );
        }, TransactionMode::WRITABLE);
    }

    inline Bytes MdbxStore::remove(Handle handle, const Bytes& key) {
        Bytes value;
        with_transaction([this, handle, &key, &value](MDBX_txn* txn) {
            MDBX_dbi dbi = open_dbi(txn, handle, false);
            MDBX_val db_key = to_mdbx_val(key);
            MDBX_val db_val;
            int rc = mdbx_get(txn, dbi, &db_key, &db_val);
            if (rc == MDBX_NOTFOUND) {
                throw TableException(TableErrc::NOT_FOUND, "key not found", rc);
            }
            check_mdbx(rc, "Failed to retrieve value");
            value = to_bytes(db_val);
            check_mdbx(mdbx_del(txn, dbi, &db_key, nullptr), "Failed to erase key");
        }, TransactionMode::WRITABLE);
        return value;
    }

    inline bool MdbxStore::exists(Handle handle, const Bytes& key) const {
        bool res = false;
        with_transaction([this, handle, &key, &res](MDBX_txn* txn) {
            MDBX_dbi dbi = open_dbi(txn, handle, false);
            MDBX_val db_key = to_mdbx_val(key);
            MDBX_val db_val; // dummy
            int rc = mdbx_get(txn, dbi, &db_key, &db_val);
            if (rc == MDBX_NOTFOUND) return;
            check_mdbx(rc, "Failed to check key presence");
            res = true;
        }, TransactionMode::READ_ONLY);
        return res;
    }

    inline std::size_t MdbxStore::count(Handle handle) const {
        std::size_t res = 0;
        with_transaction([this, handle, &res](MDBX_txn* txn) {
            MDBX_dbi dbi = open_dbi(txn, handle, false);
            MDBX_stat stat;
#           if MDBX_VERSION_MAJOR > 0 || MDBX_VERSION_MINOR >= 14
            check_mdbx(mdbx_dbi_stat(txn, dbi, &stat, sizeof(stat)), "Failed to query database statistics");
#           else
            check_mdbx(mdbx_dbi_stat(txn, dbi, &stat), "Failed to query database statistics");
#           endif
            res = static_cast<std::size_t>(stat.ms_entries);
        }, TransactionMode::READ_ONLY);
        return res;
    }

    inline void MdbxStore::release_handle(Handle handle) {
        with_transaction([this, handle](MDBX_txn* txn) {
            MDBX_dbi dbi = open_dbi(txn, handle, false);
            MDBX_stat stat;
#           if MDBX_VERSION_MAJOR > 0 || MDBX_VERSION_MINOR >= 14
            check_mdbx(mdbx_dbi_stat(txn, dbi, &stat, sizeof(stat)), "Failed to query database statistics");
#           else
            check_mdbx(mdbx_dbi_stat(txn, dbi, &stat), "Failed to query database statistics");
#           endif
            if (stat.ms_entries != 0) {
                throw TableException(TableErrc::NOT_EMPTY,
                    fmt::format("handle {} still holds {} entries", handle, stat.ms_entries));
            }
            check_mdbx(mdbx_drop(txn, dbi, true), "Failed to drop table");
            std::lock_guard<std::mutex> lock(m_mutex);
            m_dbis.erase(handle);
        }, TransactionMode::WRITABLE);
        KVT_LOG_DEBUG("mdbx: released handle {}", handle);
    }

    inline CursorId MdbxStore::open_cursor(Handle handle,
                                           const std::optional<Bytes>& start,
                                           const std::optional<Bytes>& end,
                                           Direction direction) {
        with_transaction([this, handle](MDBX_txn* txn) {
            open_dbi(txn, handle, false);
        }, TransactionMode::READ_ONLY);
        std::lock_guard<std::mutex> lock(m_mutex);
        CursorId id = m_next_cursor++;
        m_cursors.emplace(id, CursorState{handle, start, end, direction, std::nullopt, false});
        return id;
    }

    inline bool MdbxStore::advance(CursorId cursor) {
        CursorState c = cursor_state(cursor);
        if (c.exhausted) return false;

        std::optional<Bytes> next;
        with_transaction([this, &c, &next](MDBX_txn* txn) {
            MDBX_dbi dbi = open_dbi(txn, c.handle, false);
            detail::MdbxCursorGuard guard(txn, dbi);
            MDBX_val db_key;
            MDBX_val db_val;
            int rc;

            if (c.direction == Direction::ASCENDING) {
                if (!c.current) {
                    if (c.start) {
                        db_key = to_mdbx_val(*c.start);
                        rc = mdbx_cursor_get(guard.cursor, &db_key, &db_val, MDBX_SET_RANGE);
                    } else {
                        rc = mdbx_cursor_get(guard.cursor, &db_key, &db_val, MDBX_FIRST);
                    }
                } else {
                    db_key = to_mdbx_val(*c.current);
                    rc = mdbx_cursor_get(guard.cursor, &db_key, &db_val, MDBX_SET_RANGE);
                    if (rc == MDBX_SUCCESS && compare_key(db_key, *c.current) == 0) {
                        rc = mdbx_cursor_get(guard.cursor, &db_key, &db_val, MDBX_NEXT);
                    }
                }
                if (rc == MDBX_NOTFOUND) return;
                check_mdbx(rc, "Failed to advance cursor");
                if (c.end && compare_key(db_key, *c.end) >= 0) return;
            } else {
                // position on the first key not below the upper limit, then step back
                const Bytes* limit = c.current ? &*c.current : (c.end ? &*c.end : nullptr);
                if (limit) {
                    db_key = to_mdbx_val(*limit);
                    rc = mdbx_cursor_get(guard.cursor, &db_key, &db_val, MDBX_SET_RANGE);
                    if (rc == MDBX_SUCCESS) {
                        rc = mdbx_cursor_get(guard.cursor, &db_key, &db_val, MDBX_PREV);
                    } else if (rc == MDBX_NOTFOUND) {
                        rc = mdbx_cursor_get(guard.cursor, &db_key, &db_val, MDBX_LAST);
                    }
                } else {
                    rc = mdbx_cursor_get(guard.cursor, &db_key, &db_val, MDBX_LAST);
                }
                if (rc == MDBX_NOTFOUND) return;
                check_mdbx(rc, "Failed to advance cursor");
                if (c.start && compare_key(db_key, *c.start) < 0) return;
            }
            next = to_bytes(db_key);
        }, TransactionMode::READ_ONLY);

        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_cursors.find(cursor);
        if (it == m_cursors.end()) {
            throw TableException(TableErrc::STORAGE_ERROR, "unknown cursor " + std::to_string(cursor));
        }
        if (!next) {
            it->second.exhausted = true;
            it->second.current.reset();
            return false;
        }
        it->second.current = std::move(next);
        return true;
    }

    inline std::pair<Bytes, Bytes> MdbxStore::read(CursorId cursor) const {
        CursorState c = cursor_state(cursor);
        if (!c.current) {
            throw TableException(TableErrc::USAGE_ERROR, "cursor is not positioned on an entry");
        }
        std::pair<Bytes, Bytes> entry;
        with_transaction([this, &c, &entry](MDBX_txn* txn) {
            MDBX_dbi dbi = open_dbi(txn, c.handle, false);
            MDBX_val db_key = to_mdbx_val(*c.current);
            MDBX_val db_val;
            int rc = mdbx_get(txn, dbi, &db_key, &db_val);
            if (rc == MDBX_NOTFOUND) {
                throw TableException(TableErrc::STORAGE_ERROR, "entry under cursor was removed", rc);
            }
            check_mdbx(rc, "Failed to read entry under cursor");
            entry.first = *c.current;
            entry.second = to_bytes(db_val);
        }, TransactionMode::READ_ONLY);
        return entry;
    }

    inline void MdbxStore::close_cursor(CursorId cursor) noexcept {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_cursors.erase(cursor);
    }

    inline void MdbxStore::begin() {
        m_connection->begin(TransactionMode::WRITABLE);
    }

    inline void MdbxStore::commit() {
        m_connection->commit();
    }

    inline void MdbxStore::rollback() {
        // handles opened by the aborted transaction are closed by MDBX
        forget_dbis();
        m_connection->rollback();
    }

    inline uint64_t MdbxStore::generation() const noexcept {
        return m_connection->abort_generation();
    }

    inline bool MdbxStore::in_transaction() const {
        return m_connection->current_txn() != nullptr;
    }

    inline std::shared_ptr<Connection> MdbxStore::connection() const noexcept {
        return m_connection;
    }

    template<typename F>
    void MdbxStore::with_transaction(F&& action, TransactionMode mode) const {
        MDBX_txn* txn = m_connection->thread_txn(); // reuse transaction bound to this thread if any
        if (txn) {
            action(txn);
            return;
        }

        auto txn_guard = m_connection->transaction(mode);
        try {
            action(txn_guard.handle());
            txn_guard.commit();
        } catch (...) {
            if (txn_guard.handle()) {
                try {
                    txn_guard.rollback();
                } catch (const TableException& e) {
                    KVT_LOG_WARN("mdbx: rollback failed: {}", e.what());
                }
            }
            if (mode == TransactionMode::WRITABLE) forget_dbis();
            throw;
        }
    }

    inline MDBX_dbi MdbxStore::open_dbi(MDBX_txn* txn, Handle handle, bool create) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_dbis.find(handle);
        if (it != m_dbis.end()) return it->second;

        MDBX_dbi dbi{};
        const std::string name = table_name(handle);
        int rc = mdbx_dbi_open(txn, name.c_str(), create ? MDBX_CREATE : MDBX_DB_DEFAULTS, &dbi);
        if (rc == MDBX_NOTFOUND) {
            throw TableException(TableErrc::STORAGE_ERROR, "unknown handle " + std::to_string(handle), rc);
        }
        check_mdbx(rc, "Failed to open table " + name);
        m_dbis.emplace(handle, dbi);
        return dbi;
    }

    inline void MdbxStore::forget_dbis() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_dbis.clear();
    }

    inline MdbxStore::CursorState MdbxStore::cursor_state(CursorId cursor) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_cursors.find(cursor);
        if (it == m_cursors.end()) {
            throw TableException(TableErrc::STORAGE_ERROR, "unknown cursor " + std::to_string(cursor));
        }
        return it->second;
    }

    inline std::string MdbxStore::table_name(Handle handle) {
        return fmt::format("kvt_{:016x}", handle);
    }

} // namespace kvt
