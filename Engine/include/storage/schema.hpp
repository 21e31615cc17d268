/**
 * @file schema.hpp
 * @brief Store schema creation and version check
 */

#pragma once

#include <database/sqlite_connection.hpp>

namespace Lexicore {

constexpr int SCHEMA_VERSION = 1;

/**
 * @brief Create tables on an empty store, or verify the version of an existing one.
 *
 * Must run inside a write transaction. A store written by a different schema
 * version throws CorruptStoreError; it is never migrated or repaired in place.
 */
void ensure_schema(SqliteConnection& db);

} // namespace Lexicore
