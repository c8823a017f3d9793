#pragma once
#ifndef _KV_TABLES_STORAGE_FACTORY_HPP_INCLUDED
#define _KV_TABLES_STORAGE_FACTORY_HPP_INCLUDED

/// \file StorageFactory.hpp
/// \brief Selects the storage provider named by a Config.

namespace kvt {

    /// \brief Creates the storage provider selected by \a config.
    ///
    /// Validates the configuration and applies its log level before the
    /// provider is constructed.
    /// \param config Backend selection and backend settings.
    /// \return Shared provider ready to be injected into tables.
    /// \throws TableException INVALID_CONFIG if validation fails,
    ///         STORAGE_ERROR if the MDBX environment cannot be opened.
    inline std::shared_ptr<StorageProvider> make_storage(const Config& config) {
        if (!config.validate()) {
            throw TableException(TableErrc::INVALID_CONFIG,
                std::string("invalid configuration for backend ") + to_str(config.backend));
        }
        Logger::instance().set_level(config.log_level);

        switch (config.backend) {
            case StorageBackend::MEMORY:
                KVT_LOG_DEBUG("using in-memory storage");
                return std::make_shared<MemoryStore>();
            case StorageBackend::MDBX:
                KVT_LOG_DEBUG("using MDBX storage at {}", config.pathname);
                return std::make_shared<MdbxStore>(config);
        }
        throw TableException(TableErrc::INVALID_CONFIG, "unknown storage backend");
    }

} // namespace kvt

#endif // _KV_TABLES_STORAGE_FACTORY_HPP_INCLUDED
