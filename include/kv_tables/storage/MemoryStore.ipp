namespace kvt {

    inline Handle MemoryStore::create_handle() {
        std::lock_guard<std::mutex> lock(m_mutex);
        Handle handle = m_next_handle++;
        m_tables.emplace(handle, Map());
        return handle;
    }

    inline void MemoryStore::insert(Handle handle, const Bytes& key, const Bytes& value) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!table(handle).emplace(key, value).second) {
            throw TableException(TableErrc::ALREADY_EXISTS, "key already present");
        }
    }

    inline Bytes MemoryStore::lookup(Handle handle, const Bytes& key) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        const Map& map = table(handle);
        auto it = map.find(key);
        if (it == map.end()) {
            throw TableException(TableErrc::NOT_FOUND, "key not found");
        }
        return it->second;
    }

    inline void MemoryStore::lookup_mut(Handle handle, const Bytes& key,
                                        const std::function<void(Bytes&)>& mutator) {
        Bytes value = lookup(handle, key);
        // the mutator runs unlocked, it may call back into the store
        mutator(value);
        std::lock_guard<std::mutex> lock(m_mutex);
        Map& map = table(handle);
        auto it = map.find(key);
        if (it == map.end()) {
            throw TableException(TableErrc::NOT_FOUND, "key removed while being modified");
        }
        it->second = std::move(value);
    }

    inline Bytes MemoryStore::remove(Handle handle, const Bytes& key) {
        std::lock_guard<std::mutex> lock(m_mutex);
        Map& map = table(handle);
        auto it = map.find(key);
        if (it == map.end()) {
            throw TableException(TableErrc::NOT_FOUND, "key not found");
        }
        Bytes value = std::move(it->second);
        map.erase(it);
        return value;
    }

    inline bool MemoryStore::exists(Handle handle, const Bytes& key) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        const Map& map = table(handle);
        return map.find(key) != map.end();
    }

    inline std::size_t MemoryStore::count(Handle handle) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return table(handle).size();
    }

    inline void MemoryStore::release_handle(Handle handle) {
        std::lock_guard<std::mutex> lock(m_mutex);
        const Map& map = table(handle);
        if (!map.empty()) {
            throw TableException(TableErrc::NOT_EMPTY,
                "handle " + std::to_string(handle) + " still holds " + std::to_string(map.size()) + " entries");
        }
        m_tables.erase(handle);
    }

    inline CursorId MemoryStore::open_cursor(Handle handle,
                                             const std::optional<Bytes>& start,
                                             const std::optional<Bytes>& end,
                                             Direction direction) {
        std::lock_guard<std::mutex> lock(m_mutex);
        table(handle);
        CursorId id = m_next_cursor++;
        m_cursors.emplace(id, CursorState{handle, start, end, direction, std::nullopt, false});
        return id;
    }

    inline bool MemoryStore::advance(CursorId cursor) {
        std::lock_guard<std::mutex> lock(m_mutex);
        CursorState& c = cursor_state(cursor);
        if (c.exhausted) return false;
        const Map& map = table(c.handle);

        Map::const_iterator it;
        bool found = false;
        if (c.direction == Direction::ASCENDING) {
            if (!c.current) {
                it = c.start ? map.lower_bound(*c.start) : map.begin();
            } else {
                it = map.upper_bound(*c.current);
            }
            found = it != map.end() && (!c.end || it->first < *c.end);
        } else {
            if (!c.current) {
                it = c.end ? map.lower_bound(*c.end) : map.end();
            } else {
                it = map.lower_bound(*c.current);
            }
            if (it != map.begin()) {
                --it;
                found = !c.start || !(it->first < *c.start);
            }
        }

        if (!found) {
            c.exhausted = true;
            c.current.reset();
            return false;
        }
        c.current = it->first;
        return true;
    }

    inline std::pair<Bytes, Bytes> MemoryStore::read(CursorId cursor) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        const CursorState& c = cursor_state(cursor);
        if (!c.current) {
            throw TableException(TableErrc::USAGE_ERROR, "cursor is not positioned on an entry");
        }
        const Map& map = table(c.handle);
        auto it = map.find(*c.current);
        if (it == map.end()) {
            throw TableException(TableErrc::STORAGE_ERROR, "entry under cursor was removed");
        }
        return std::make_pair(it->first, it->second);
    }

    inline void MemoryStore::close_cursor(CursorId cursor) noexcept {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_cursors.erase(cursor);
    }

    inline std::size_t MemoryStore::open_cursors() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_cursors.size();
    }

    inline void MemoryStore::begin() {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_snapshot) {
            throw TableException(TableErrc::USAGE_ERROR, "unit of work already active");
        }
        m_snapshot = Snapshot{m_tables, m_next_handle};
        m_txn_owner = std::this_thread::get_id();
    }

    inline void MemoryStore::commit() {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_snapshot || m_txn_owner != std::this_thread::get_id()) {
            throw TableException(TableErrc::USAGE_ERROR, "no active unit of work to commit");
        }
        m_snapshot.reset();
        m_txn_owner = std::thread::id();
    }

    inline void MemoryStore::rollback() {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_snapshot || m_txn_owner != std::this_thread::get_id()) {
            throw TableException(TableErrc::USAGE_ERROR, "no active unit of work to rollback");
        }
        m_tables = std::move(m_snapshot->tables);
        m_next_handle = m_snapshot->next_handle;
        m_snapshot.reset();
        m_txn_owner = std::thread::id();
        m_generation.fetch_add(1, std::memory_order_acq_rel);
    }

    inline bool MemoryStore::in_transaction() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_snapshot.has_value() && m_txn_owner == std::this_thread::get_id();
    }

    inline uint64_t MemoryStore::generation() const noexcept {
        return m_generation.load(std::memory_order_acquire);
    }

    inline MemoryStore::Map& MemoryStore::table(Handle handle) {
        auto it = m_tables.find(handle);
        if (it == m_tables.end()) {
            throw TableException(TableErrc::STORAGE_ERROR, "unknown handle " + std::to_string(handle));
        }
        return it->second;
    }

    inline const MemoryStore::Map& MemoryStore::table(Handle handle) const {
        auto it = m_tables.find(handle);
        if (it == m_tables.end()) {
            throw TableException(TableErrc::STORAGE_ERROR, "unknown handle " + std::to_string(handle));
        }
        return it->second;
    }

    inline MemoryStore::CursorState& MemoryStore::cursor_state(CursorId cursor) {
        auto it = m_cursors.find(cursor);
        if (it == m_cursors.end()) {
            throw TableException(TableErrc::STORAGE_ERROR, "unknown cursor " + std::to_string(cursor));
        }
        return it->second;
    }

    inline const MemoryStore::CursorState& MemoryStore::cursor_state(CursorId cursor) const {
        auto it = m_cursors.find(cursor);
        if (it == m_cursors.end()) {
            throw TableException(TableErrc::STORAGE_ERROR, "unknown cursor " + std::to_string(cursor));
        }
        return it->second;
    }

} // namespace kvt
