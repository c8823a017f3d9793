#pragma once
#ifndef _KV_TABLES_PATH_UTILS_HPP_INCLUDED
#define _KV_TABLES_PATH_UTILS_HPP_INCLUDED

/// \file path_utils.hpp
/// \ingroup kvt_utils
/// \brief Path helpers used to resolve the database location.

#include <string>
#include <vector>
#include <filesystem>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#else
#include <unistd.h>
#include <limits.h>
#endif

namespace kvt {
    namespace fs = std::filesystem;

    /// \brief Converts a filesystem path to a UTF-8 std::string.
    inline std::string path_to_utf8(const fs::path& path) {
#       if __cplusplus >= 202002L
        auto s = path.u8string();
        return std::string(s.begin(), s.end());
#       else
        return path.u8string();
#       endif
    }

    /// \brief Checks whether the path is absolute.
    /// \param path UTF-8 path to check.
    inline bool is_absolute_path(const std::string& path) {
        return fs::u8path(path).is_absolute();
    }

    /// \brief Returns the parent directory of \a file_path.
    inline std::string get_parent_path(const std::string& file_path) {
        return path_to_utf8(fs::u8path(file_path).parent_path());
    }

    /// \brief Returns the directory of the running executable.
    /// \throws TableException (INVALID_CONFIG) if the path cannot be determined.
    inline std::string get_exec_dir() {
#ifdef _WIN32
        std::vector<wchar_t> buffer(MAX_PATH);
        DWORD size = GetModuleFileNameW(nullptr, buffer.data(), static_cast<DWORD>(buffer.size()));
        while (size == buffer.size() && GetLastError() == ERROR_INSUFFICIENT_BUFFER) {
            buffer.resize(buffer.size() * 2);
            size = GetModuleFileNameW(nullptr, buffer.data(), static_cast<DWORD>(buffer.size()));
        }
        if (size == 0) {
            throw TableException(TableErrc::INVALID_CONFIG, "Failed to get executable path.");
        }
        return path_to_utf8(fs::path(std::wstring(buffer.data(), size)).parent_path());
#else
        char result[PATH_MAX];
        ssize_t count = readlink("/proc/self/exe", result, PATH_MAX);
        if (count == -1) {
            throw TableException(TableErrc::INVALID_CONFIG, "Failed to get executable path.");
        }
        return path_to_utf8(fs::path(std::string(result, static_cast<size_t>(count))).parent_path());
#endif
    }

    /// \brief Resolves \a pathname against the executable directory when requested.
    /// \param pathname Configured database path.
    /// \param relative_to_exe Whether relative paths are anchored at the executable.
    inline std::string resolve_db_path(const std::string& pathname, bool relative_to_exe) {
        if (!relative_to_exe || is_absolute_path(pathname)) return pathname;
        return path_to_utf8(fs::u8path(get_exec_dir()) / fs::u8path(pathname));
    }

    /// \brief Creates the parent directories of the database file.
    /// \param path Database file path.
    /// \throws TableException (STORAGE_ERROR) if the directories cannot be created.
    inline void create_directories(const std::string& path) {
        fs::path parent_dir = fs::u8path(get_parent_path(path));
        if (parent_dir.empty() || fs::exists(parent_dir)) return;
        std::error_code ec;
        if (!fs::create_directories(parent_dir, ec)) {
            throw TableException(TableErrc::STORAGE_ERROR,
                "Failed to create directories for path: " + path_to_utf8(parent_dir) + " (" + ec.message() + ")");
        }
    }

} // namespace kvt

#endif // _KV_TABLES_PATH_UTILS_HPP_INCLUDED
