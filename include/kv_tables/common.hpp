#pragma once
#ifndef _KV_TABLES_COMMON_HPP_INCLUDED
#define _KV_TABLES_COMMON_HPP_INCLUDED

/// \file common.hpp
/// \brief Publicly usable low-level components of the kv_tables library.
///
/// Includes building blocks such as the storage providers, Connection,
/// Transaction, Config, logging and exceptions.

#include <string>
#include <vector>
#include <deque>
#include <list>
#include <map>
#include <array>
#include <tuple>
#include <utility>
#include <unordered_map>
#include <type_traits>
#include <optional>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <atomic>
#include <chrono>
#include <algorithm>
#include <filesystem>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <cstdlib>
#include <mdbx.h>
#include <fmt/format.h>
#include <fmt/chrono.h>

#ifndef KV_TABLES_SEPARATE_COMPILATION
#define KV_TABLES_HEADER_ONLY
#endif

#include "common/TableException.hpp"
#include "common/Logger.hpp"
#include "common/Config.hpp"
#include "detail/utils.hpp"
#include "detail/KeyCodec.hpp"
#include "detail/Box.hpp"
#include "detail/path_utils.hpp"
#include "detail/TransactionTracker.hpp"
#include "common/Transaction.hpp"
#include "common/Connection.hpp"
#include "storage/StorageProvider.hpp"
#include "storage/MemoryStore.hpp"
#include "storage/MdbxStore.hpp"
#include "storage/StorageFactory.hpp"

#endif // _KV_TABLES_COMMON_HPP_INCLUDED
