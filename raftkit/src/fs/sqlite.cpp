#include "raftkit/fs/sqlite.hpp"

#include <mutex>

#include <spdlog/spdlog.h>

#include "SQLiteCpp/Database.h"
#include "SQLiteCpp/Transaction.h"
#include "raftkit/data.hpp"
#include "utils/serialize.hpp"

namespace raftkit::fs
{
    namespace
    {
        class SQLiteLogStore final : public LogStore
        {
          public:
            explicit SQLiteLogStore(const std::string& path)
                : path_(path)
            {
            }

            tl::expected<void, Error> init()
            {
                try
                {
                    db_.emplace(path_, SQLite::OPEN_READWRITE | SQLite::OPEN_CREATE);
                    db_->exec("PRAGMA synchronous = FULL;");
                    db_->exec(
                        "CREATE TABLE IF NOT EXISTS raft_hard_state ("
                        "id INTEGER PRIMARY KEY CHECK (id = 1),"
                        "state BLOB NOT NULL);");

                    // A NULL purge boundary means nothing was ever purged.
                    db_->exec(
                        "CREATE TABLE IF NOT EXISTS raft_log_state ("
                        "id INTEGER PRIMARY KEY CHECK (id = 1),"
                        "last_purged_term INTEGER,"
                        "last_purged_index INTEGER);");

                    db_->exec(
                        "CREATE TABLE IF NOT EXISTS log_entries ("
                        "log_index INTEGER PRIMARY KEY,"
                        "term INTEGER NOT NULL,"
                        "entry BLOB NOT NULL);");

                    // This will only insert if no row with id=1 exists
                    db_->exec("INSERT OR IGNORE INTO raft_log_state (id) VALUES (1);");
                }
                catch (const SQLite::Exception& e)
                {
                    spdlog::error("[{}] {}", path_, e.what());
                    return tl::make_unexpected(errors::FailedToStart {});
                }
                return {};
            }

            tl::expected<std::optional<data::HardState>, Error> readHardState() override
            {
                std::lock_guard lock {mutex_};
                try
                {
                    SQLite::Statement query(*db_, "SELECT state FROM raft_hard_state WHERE id = 1");
                    if (!query.executeStep())
                    {
                        return std::nullopt;
                    }
                    auto column = query.getColumn(0);
                    auto state = data::deserializeHardState(column.getBlob(),
                                                            static_cast<size_t>(column.getBytes()));
                    if (!state)
                    {
                        return tl::make_unexpected(state.error());
                    }
                    return *state;
                }
                catch (const std::exception& e)
                {
                    return tl::make_unexpected(errors::PersistenceFailed {.message = e.what()});
                }
            }

            tl::expected<LogState, Error> getLogState() override
            {
                std::lock_guard lock {mutex_};
                try
                {
                    LogState state;
                    SQLite::Statement purged(
                        *db_,
                        "SELECT last_purged_term, last_purged_index FROM raft_log_state WHERE id = 1");
                    if (purged.executeStep() && !purged.getColumn(1).isNull())
                    {
                        state.lastPurged = data::LogId {
                            .term = static_cast<uint64_t>(purged.getColumn(0).getInt64()),
                            .index = static_cast<uint64_t>(purged.getColumn(1).getInt64()),
                        };
                    }
                    state.lastLogId = state.lastPurged;

                    SQLite::Statement last(
                        *db_, "SELECT term, log_index FROM log_entries ORDER BY log_index DESC LIMIT 1");
                    if (last.executeStep())
                    {
                        state.lastLogId = data::LogId {
                            .term = static_cast<uint64_t>(last.getColumn(0).getInt64()),
                            .index = static_cast<uint64_t>(last.getColumn(1).getInt64()),
                        };
                    }
                    return state;
                }
                catch (const std::exception& e)
                {
                    return tl::make_unexpected(errors::PersistenceFailed {.message = e.what()});
                }
            }

            tl::expected<std::vector<data::LogEntry>, Error> getEntries(uint64_t first,
                                                                       uint64_t last) override
            {
                std::lock_guard lock {mutex_};
                try
                {
                    SQLite::Statement query(*db_,
                                            "SELECT entry FROM log_entries WHERE log_index >= ? AND "
                                            "log_index <= ? ORDER BY log_index");
                    query.bind(1, static_cast<int64_t>(first));
                    query.bind(2, static_cast<int64_t>(last));

                    std::vector<data::LogEntry> entries;
                    while (query.executeStep())
                    {
                        auto entry = readEntry(query.getColumn(0));
                        if (!entry)
                        {
                            return tl::make_unexpected(entry.error());
                        }
                        entries.push_back(std::move(*entry));
                    }
                    return entries;
                }
                catch (const std::exception& e)
                {
                    return tl::make_unexpected(errors::PersistenceFailed {.message = e.what()});
                }
            }

            tl::expected<std::optional<data::LogEntry>, Error> getEntry(uint64_t index) override
            {
                std::lock_guard lock {mutex_};
                try
                {
                    SQLite::Statement query(*db_, "SELECT entry FROM log_entries WHERE log_index = ?");
                    query.bind(1, static_cast<int64_t>(index));
                    if (!query.executeStep())
                    {
                        return std::nullopt;
                    }
                    auto entry = readEntry(query.getColumn(0));
                    if (!entry)
                    {
                        return tl::make_unexpected(entry.error());
                    }
                    return *entry;
                }
                catch (const std::exception& e)
                {
                    return tl::make_unexpected(errors::PersistenceFailed {.message = e.what()});
                }
            }

            tl::expected<void, Error> apply(LogTransaction const& transaction) override
            {
                std::lock_guard lock {mutex_};
                try
                {
                    SQLite::Transaction dbTransaction(*db_);

                    if (transaction.hardState)
                    {
                        auto state = data::serialize(*transaction.hardState);
                        SQLite::Statement update(
                            *db_, "INSERT OR REPLACE INTO raft_hard_state (id, state) VALUES (1, ?)");
                        update.bind(1, state.data(), static_cast<int>(state.size()));
                        update.exec();
                    }

                    if (transaction.truncate)
                    {
                        SQLite::Statement deleteEntries(
                            *db_, "DELETE FROM log_entries WHERE log_index > ?");
                        // -1 deletes the whole log.
                        deleteEntries.bind(1,
                                           transaction.truncateAfter
                                               ? static_cast<int64_t>(*transaction.truncateAfter)
                                               : int64_t {-1});
                        deleteEntries.exec();
                    }

                    for (const auto& entry : transaction.entries)
                    {
                        auto bytes = data::serialize(entry);
                        SQLite::Statement insertEntry(
                            *db_,
                            "INSERT OR REPLACE INTO log_entries (log_index, term, entry) VALUES (?, ?, "
                            "?)");
                        insertEntry.bind(1, static_cast<int64_t>(entry.logId.index));
                        insertEntry.bind(2, static_cast<int64_t>(entry.logId.term));
                        insertEntry.bind(3, bytes.data(), static_cast<int>(bytes.size()));
                        insertEntry.exec();
                    }

                    if (transaction.purgeUpTo)
                    {
                        SQLite::Statement deleteEntries(
                            *db_, "DELETE FROM log_entries WHERE log_index <= ?");
                        deleteEntries.bind(1, static_cast<int64_t>(transaction.purgeUpTo->index));
                        deleteEntries.exec();

                        SQLite::Statement updateState(*db_,
                                                      "UPDATE raft_log_state SET last_purged_term = ?, "
                                                      "last_purged_index = ? WHERE id = 1");
                        updateState.bind(1, static_cast<int64_t>(transaction.purgeUpTo->term));
                        updateState.bind(2, static_cast<int64_t>(transaction.purgeUpTo->index));
                        updateState.exec();
                    }

                    dbTransaction.commit();
                }
                catch (const std::exception& e)
                {
                    spdlog::error("[{}] transaction failed: {}", path_, e.what());
                    return tl::make_unexpected(errors::PersistenceFailed {.message = e.what()});
                }
                return {};
            }

          private:
            static tl::expected<data::LogEntry, Error> readEntry(const SQLite::Column& column)
            {
                return data::deserializeEntry(column.getBlob(), static_cast<size_t>(column.getBytes()));
            }

            std::string path_;
            // The server reads on its own thread at startup and writes from the persistence
            // thread afterwards.
            std::mutex mutex_;
            std::optional<SQLite::Database> db_;
        };
    }  // namespace

    tl::expected<std::shared_ptr<LogStore>, Error> createSQLiteLogStore(const std::string& path)
    {
        auto store = std::make_shared<SQLiteLogStore>(path);
        auto initResult = store->init();
        if (!initResult.has_value())
        {
            return tl::make_unexpected(initResult.error());
        }
        return store;
    }
}  // namespace raftkit::fs
