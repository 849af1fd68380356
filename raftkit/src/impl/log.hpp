#pragma once

#include <deque>
#include <optional>
#include <vector>

#include "raftkit/data.hpp"

namespace raftkit::impl
{
    // The in-memory mirror of the durable log. Every change is made here first and then
    // persisted through the storage worker, so reads never touch the log store.
    //
    // Indices below firstIndex() have been purged. lastPurged() remembers the id of the last
    // purged entry so that the log can still answer consistency checks at its boundary.
    class Log
    {
      public:
        Log() = default;

        // Replaces the whole log.
        void reset(std::optional<data::LogId> lastPurged, std::vector<data::LogEntry> entries);

        [[nodiscard]] std::optional<data::LogId> lastPurged() const { return lastPurged_; }

        // The first index that is still stored.
        [[nodiscard]] uint64_t firstIndex() const { return data::nextIndex(lastPurged_); }

        // The id of the last entry, or lastPurged() if the log is empty.
        [[nodiscard]] std::optional<data::LogId> lastLogId() const;

        // The index the next appended entry receives.
        [[nodiscard]] uint64_t nextIndex() const { return firstIndex() + entries_.size(); }

        [[nodiscard]] bool empty() const { return entries_.empty(); }

        [[nodiscard]] data::LogEntry const* get(uint64_t index) const;

        // Returns the id at the given index, including the purge boundary.
        [[nodiscard]] std::optional<data::LogId> logIdAt(uint64_t index) const;

        // Whether the log contains logId. The empty id and any purged id are always contained,
        // since only committed entries are ever purged.
        [[nodiscard]] bool contains(const std::optional<data::LogId>& logId) const;

        // Returns up to maxCount entries starting at first.
        [[nodiscard]] std::vector<data::LogEntry> range(uint64_t first, size_t maxCount) const;

        // Returns the last index whose entry has the given term.
        [[nodiscard]] std::optional<uint64_t> lastIndexOfTerm(uint64_t term) const;

        // Describes how the log diverges from prevLogId, which it must not contain.
        [[nodiscard]] data::ConflictHint conflictHint(const data::LogId& prevLogId) const;

        // Appends entries. Their indices must start at nextIndex().
        void append(std::vector<data::LogEntry> entries);
        void append(data::LogEntry entry);

        // Removes every entry with an index greater than index, or every entry if index is not
        // set. Purged entries are never removed.
        void truncateAfter(std::optional<uint64_t> index);

        // Removes every entry up to and including upTo and records it as the last purged id.
        void purge(const data::LogId& upTo);

        // The latest membership entry in the log.
        [[nodiscard]] std::optional<data::StoredMembership> lastMembership() const;

        // The latest membership entry at or before the given index.
        [[nodiscard]] std::optional<data::StoredMembership> lastMembershipAtOrBefore(
            uint64_t index) const;

        // The approximate size of the stored entries in bytes.
        [[nodiscard]] size_t bytes() const { return bytes_; }

      private:
        std::deque<data::LogEntry> entries_;
        std::optional<data::LogId> lastPurged_;
        size_t bytes_ = 0;
    };

    // The approximate size of an entry in bytes.
    size_t calculateSize(const data::LogEntry& entry);
}  // namespace raftkit::impl
