#pragma once
#ifndef _KV_TABLES_TABLE_EXCEPTION_HPP_INCLUDED
#define _KV_TABLES_TABLE_EXCEPTION_HPP_INCLUDED

/// \file TableException.hpp
/// \brief Defines the exception type thrown by tables and storage providers.

namespace kvt {

    /// \enum TableErrc
    /// \brief Category of a failed table or storage operation.
    enum class TableErrc {
        ALREADY_EXISTS, ///< Key is already present (add).
        NOT_FOUND,      ///< Key is absent (borrow, borrow_mut, remove).
        NOT_EMPTY,      ///< destroy_empty() called on a table with entries.
        USAGE_ERROR,    ///< API misuse, e.g. next() without a successful prepare().
        STORAGE_ERROR,  ///< Backend failure or malformed stored data.
        INVALID_CONFIG  ///< Configuration rejected by Config::validate().
    };

    /// \brief Returns a printable name of the error category.
    inline const char* to_str(TableErrc code) noexcept {
        switch (code) {
        case TableErrc::ALREADY_EXISTS: return "AlreadyExists";
        case TableErrc::NOT_FOUND:      return "NotFound";
        case TableErrc::NOT_EMPTY:      return "NotEmpty";
        case TableErrc::USAGE_ERROR:    return "UsageError";
        case TableErrc::STORAGE_ERROR:  return "StorageError";
        case TableErrc::INVALID_CONFIG: return "InvalidConfig";
        };
        return "Unknown";
    }

    /// \class TableException
    /// \brief Represents a failed table or storage operation.
    ///
    /// Every failure aborts the calling operation; the table is left unchanged.
    /// Errors coming from MDBX additionally keep the raw MDBX return code.
    class TableException : public std::runtime_error {
    public:
        /// \brief Constructs a new TableException.
        /// \param code Error category.
        /// \param message The error message describing the exception.
        /// \param storage_code The MDBX error code, if any (default: 0).
        TableException(TableErrc code, const std::string& message, int storage_code = 0)
            : std::runtime_error(std::string("KVT ") + to_str(code) + ": " + message),
              m_code(code), m_storage_code(storage_code) {}

        /// \brief Returns the error category.
        TableErrc code() const noexcept {
            return m_code;
        }

        /// \brief Returns the MDBX error code associated with this exception.
        /// \return The MDBX error code, or 0 when the error did not come from MDBX.
        int storage_code() const noexcept {
            return m_storage_code;
        }

    private:
        TableErrc m_code;       ///< Error category.
        int m_storage_code = 0; ///< The MDBX error code associated with the exception.
    };

} // namespace kvt

#endif // _KV_TABLES_TABLE_EXCEPTION_HPP_INCLUDED
