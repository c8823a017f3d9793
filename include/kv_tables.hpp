#pragma once
#ifndef _KV_TABLES_HPP_INCLUDED
#define _KV_TABLES_HPP_INCLUDED

/// \file kv_tables.hpp
/// \brief Main include file for the kv_tables library.
///
/// Provides typed persistent tables over an injected storage provider,
/// with an in-memory backend and a libmdbx backend.

#include "kv_tables/Table.hpp"

#endif // _KV_TABLES_HPP_INCLUDED
