#pragma once
#include <memory>
#include <string>

#include <tl/expected.hpp>

#include "raftkit/errors.hpp"
#include "raftkit/log_store.hpp"

namespace raftkit::fs
{
    /// Creates a SQLite-based log store.
    ///
    /// This function opens a SQLite database at the specified path and creates the tables for
    /// the hard state, the log boundaries and the log entries. The database will be created if
    /// it doesn't exist. Each LogTransaction is committed as one SQLite transaction.
    /// @param path The file path where the SQLite database should be stored.
    /// @return A shared pointer to the log store on success, or an error on failure.
    tl::expected<std::shared_ptr<LogStore>, Error> createSQLiteLogStore(const std::string& path);
}  // namespace raftkit::fs
