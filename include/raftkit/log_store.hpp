#pragma once

#include <optional>
#include <vector>

#include <tl/expected.hpp>

#include "raftkit/data.hpp"
#include "raftkit/errors.hpp"

namespace raftkit
{
    /// A set of changes to the durable log and hard state that must be applied atomically.
    ///
    /// The operations are applied in this order: hard state, truncation, append, purge. A store
    /// must not acknowledge a transaction before every change in it is durable.
    struct LogTransaction
    {
        /// The new hard state, if it changed.
        std::optional<data::HardState> hardState;

        /// Whether entries after truncateAfter should be deleted.
        bool truncate = false;
        /// Entries with an index greater than this are deleted. std::nullopt deletes every
        /// entry. Only used if truncate is true.
        std::optional<uint64_t> truncateAfter;

        /// Entries to append after the last remaining entry.
        std::vector<data::LogEntry> entries;

        /// Entries up to and including this log id are deleted, and it becomes the last purged
        /// log id. The purge point may lie beyond the last stored entry when a snapshot replaces
        /// the whole log.
        std::optional<data::LogId> purgeUpTo;

        /// Configures the transaction to persist a new hard state.
        /// @param state The state to persist.
        void setHardState(data::HardState state) { hardState = std::move(state); }

        /// Configures the transaction to delete every entry after the given index.
        /// @param index The last index to keep, or std::nullopt to delete all entries.
        void truncateFrom(std::optional<uint64_t> index)
        {
            truncate = true;
            truncateAfter = index;
        }

        /// Configures the transaction to append entries.
        /// @param newEntries The entries to append. Their indices must be contiguous.
        void append(std::vector<data::LogEntry> newEntries)
        {
            entries.insert(entries.end(),
                           std::make_move_iterator(newEntries.begin()),
                           std::make_move_iterator(newEntries.end()));
        }

        /// Configures the transaction to purge the log prefix up to and including logId.
        void purge(data::LogId logId) { purgeUpTo = logId; }

        /// Whether the transaction changes anything.
        [[nodiscard]] bool empty() const
        {
            return !hardState && !truncate && entries.empty() && !purgeUpTo;
        }
    };

    /// The boundaries of the stored log.
    struct LogState
    {
        std::optional<data::LogId> lastPurged;  ///< The last purged log id.
        std::optional<data::LogId> lastLogId;  ///< The last stored entry, or lastPurged if the
                                               ///< log is empty.

        bool operator==(LogState const& other) const = default;
    };

    /// The interface for durable storage of the Raft log and hard state.
    ///
    /// Implementations must apply transactions atomically and durably, and must be safe to call
    /// from a thread other than the one that created them. Reads are only issued while no
    /// transaction is running.
    class LogStore
    {
      public:
        virtual ~LogStore() = default;

        /// Reads the persisted hard state.
        /// @return The hard state, or std::nullopt if none was ever saved.
        [[nodiscard]] virtual tl::expected<std::optional<data::HardState>, Error> readHardState() = 0;

        /// Reads the boundaries of the stored log.
        [[nodiscard]] virtual tl::expected<LogState, Error> getLogState() = 0;

        /// Retrieves the entries with indices in [first, last].
        /// @return The entries that are present in the range, in index order.
        [[nodiscard]] virtual tl::expected<std::vector<data::LogEntry>, Error> getEntries(
            uint64_t first, uint64_t last) = 0;

        /// Retrieves a single entry.
        /// @return The entry, or std::nullopt if it is not stored.
        [[nodiscard]] virtual tl::expected<std::optional<data::LogEntry>, Error> getEntry(
            uint64_t index) = 0;

        /// Applies a set of changes atomically.
        /// @param transaction The changes to persist.
        /// @return Success or the reason for failure.
        virtual tl::expected<void, Error> apply(LogTransaction const& transaction) = 0;
    };
}  // namespace raftkit
