namespace kvt {

    inline Connection::Connection(const Config& config)
        : m_config(config) {
        if (!m_config.validate() || m_config.pathname.empty()) {
            throw TableException(TableErrc::INVALID_CONFIG, "invalid MDBX configuration");
        }
        std::lock_guard<std::mutex> locker(m_mdbx_mutex);
        initialize();
    }

    inline Connection::~Connection() {
        std::lock_guard<std::mutex> locker(m_mdbx_mutex);
        m_transactions.clear();
        cleanup(false);
    }

    inline std::shared_ptr<Connection> Connection::create(const Config& config) {
        return std::make_shared<Connection>(config);
    }

    inline void Connection::connect() {
        std::lock_guard<std::mutex> locker(m_mdbx_mutex);
        if (m_env) return;
        initialize();
    }

    inline void Connection::disconnect() {
        std::lock_guard<std::mutex> locker(m_mdbx_mutex);
        if (!m_transactions.empty()) {
            throw TableException(TableErrc::USAGE_ERROR, "Cannot disconnect with an active unit of work.");
        }
        cleanup();
    }

    inline bool Connection::is_connected() const {
        std::lock_guard<std::mutex> locker(m_mdbx_mutex);
        return m_env != nullptr;
    }

    inline Transaction Connection::transaction(TransactionMode mode) {
        return Transaction(static_cast<TransactionTracker*>(this), m_env, mode);
    }

    inline void Connection::begin(TransactionMode mode) {
        std::lock_guard<std::mutex> lock(m_mdbx_mutex);
        auto tid = std::this_thread::get_id();
        if (m_transactions.find(tid) != m_transactions.end()) {
            throw TableException(TableErrc::USAGE_ERROR, "Transaction already started for this thread.");
        }
        auto txn = std::make_shared<Transaction>(static_cast<TransactionTracker*>(this), m_env, mode);
        m_transactions[tid] = txn;
    }

    inline void Connection::commit() {
        std::lock_guard<std::mutex> lock(m_mdbx_mutex);
        auto it = m_transactions.find(std::this_thread::get_id());
        if (it == m_transactions.end()) {
            throw TableException(TableErrc::USAGE_ERROR, "No transaction for this thread.");
        }
        auto txn = it->second;
        m_transactions.erase(it);
        txn->commit();
    }

    inline void Connection::rollback() {
        std::lock_guard<std::mutex> lock(m_mdbx_mutex);
        auto it = m_transactions.find(std::this_thread::get_id());
        if (it == m_transactions.end()) {
            throw TableException(TableErrc::USAGE_ERROR, "No transaction for this thread.");
        }
        auto txn = it->second;
        m_transactions.erase(it);
        txn->rollback();
    }

    inline std::shared_ptr<Transaction> Connection::current_txn() const {
        std::lock_guard<std::mutex> lock(m_mdbx_mutex);
        auto it = m_transactions.find(std::this_thread::get_id());
        return (it != m_transactions.end()) ? it->second : nullptr;
    }

    inline MDBX_env* Connection::env_handle() noexcept {
        return m_env;
    }

    inline const Config& Connection::config() const noexcept {
        return m_config;
    }

    inline void Connection::initialize() {
        try {
            create_directories(resolve_db_path(m_config.pathname, m_config.relative_to_exe));
            db_init();
        } catch (...) {
            if (m_env && mdbx_env_close(m_env) == MDBX_SUCCESS) {
                m_env = nullptr;
            }
            throw;
        }
        KVT_LOG_INFO("MDBX environment opened: {}", m_config.pathname);
    }

    inline void Connection::cleanup(bool use_throw) {
        if (!m_env) return;
        int rc = mdbx_env_close(m_env);
        m_env = nullptr;
        if (rc != MDBX_SUCCESS) {
            if (use_throw) {
                check_mdbx(rc, "Failed to close environment");
            }
            KVT_LOG_WARN("Failed to close environment: ({}) {}", rc, mdbx_strerror(rc));
            return;
        }
        KVT_LOG_INFO("MDBX environment closed: {}", m_config.pathname);
    }

    inline void Connection::db_init() {
        check_mdbx(
            mdbx_env_create(&m_env),
            "Failed to create environment"
        );

        check_mdbx(
            mdbx_env_set_geometry(
                m_env,
                m_config.size_lower,
                m_config.size_now,
                m_config.size_upper,
                m_config.growth_step,
                m_config.shrink_threshold,
                m_config.page_size
            ),
            "Failed to set environment geometry"
        );

        check_mdbx(
            mdbx_env_set_maxdbs(m_env, static_cast<MDBX_dbi>(m_config.max_dbs)),
            "Failed to set max databases"
        );

        int readers = m_config.max_readers > 0
            ? static_cast<int>(m_config.max_readers)
            : static_cast<int>(std::thread::hardware_concurrency()) * 2;
        check_mdbx(
            mdbx_env_set_maxreaders(m_env, static_cast<unsigned>(readers)),
            "Failed to set max readers"
        );

        MDBX_env_flags_t env_flags = MDBX_ACCEDE;
        if (m_config.no_subdir)     env_flags |= MDBX_NOSUBDIR;
        if (m_config.sync_durable)  env_flags |= MDBX_SYNC_DURABLE;
        if (m_config.read_only)     env_flags |= MDBX_RDONLY;
        if (!m_config.readahead)    env_flags |= MDBX_NORDAHEAD;
        if (m_config.writemap_mode) env_flags |= MDBX_WRITEMAP;

        const std::string pathname = resolve_db_path(m_config.pathname, m_config.relative_to_exe);

#ifdef _WIN32
        fs::path file_path = fs::u8path(pathname);
        check_mdbx(
            mdbx_env_openW(m_env, file_path.c_str(), env_flags, 0664),
            "Failed to open environment"
        );
#else
        check_mdbx(
            mdbx_env_open(m_env, pathname.c_str(), env_flags, 0664),
            "Failed to open environment"
        );
#endif
    }

} // namespace kvt
