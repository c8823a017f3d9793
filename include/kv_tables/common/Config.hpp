#pragma once
#ifndef _KV_TABLES_CONFIG_HPP_INCLUDED
#define _KV_TABLES_CONFIG_HPP_INCLUDED

/// \file Config.hpp
/// \brief Configuration options used to select and open a storage backend.

namespace kvt {

    /// \enum StorageBackend
    /// \brief Storage adapter created by \ref make_storage.
    enum class StorageBackend {
        MDBX,   ///< Persistent libmdbx environment (production).
        MEMORY  ///< Process-local ordered maps (tests, scratch tables).
    };

    /// \brief Returns the backend name.
    inline const char* to_str(StorageBackend backend) noexcept {
        switch (backend) {
            case StorageBackend::MDBX:   return "MDBX";
            case StorageBackend::MEMORY: return "MEMORY";
        }
        return "UNKNOWN";
    }

    /// \class Config
    /// \brief Parameters used by \ref make_storage to create a storage provider.
    ///
    /// Most options correspond to an MDBX flag or setting and are ignored by
    /// the in-memory backend.
    class Config {
    public:
        StorageBackend backend = StorageBackend::MDBX; ///< Backend to construct.
        std::string pathname;                   ///< Path to the database file or directory containing the database.
        int64_t size_lower  = -1;               ///< Lower bound for database size.
        int64_t size_now    = -1;               ///< Current size of the database.
        int64_t size_upper  = -1;               ///< Upper bound for database size.
        int64_t growth_step = 16 * 1024 * 1024; ///< Step size for database growth.
        int64_t shrink_threshold = 16 * 1024 * 1024; ///< Threshold for database shrinking.
        int64_t page_size   = 0;                ///< Page size (must be a power of two).
        int64_t max_readers = 0;                ///< Maximum reader slots; use 0 for the default (twice the CPU count).
        int64_t max_dbs = 128;                  ///< Maximum number of named databases; every table handle uses one.
        bool read_only = false;                 ///< Whether to open the environment in read-only mode.
        bool readahead = true;                  ///< Whether to enable OS readahead for sequential access.
        bool no_subdir = true;                  ///< Whether to store the database in a single file instead of a directory.
        bool sync_durable = true;               ///< Whether to enforce synchronous durable writes (MDBX_SYNC_DURABLE).
        bool writemap_mode = false;             ///< Whether to map the database with MDBX_WRITEMAP for direct modification.
        bool relative_to_exe = false;           ///< Whether to resolve a relative path relative to the executable directory.
        LogLevel log_level = LogLevel::Warn;    ///< Minimum level written by the library logger.

        /// \brief Validate the configuration.
        /// \return True if the configuration is valid, false otherwise.
        bool validate() const {
            if (backend == StorageBackend::MEMORY) return true;
            const bool page_ok = (page_size == 0) || ((page_size & (page_size - 1)) == 0);
            const bool size_ok = (size_lower <= size_now || size_now == -1) &&
                                 (size_now <= size_upper || size_now == -1);
            // one DBI is reserved for the handle counter
            const bool dbs_ok = max_dbs >= 2;
            return !pathname.empty() && page_ok && size_ok && dbs_ok;
        }
    };

} // namespace kvt

#endif // _KV_TABLES_CONFIG_HPP_INCLUDED
