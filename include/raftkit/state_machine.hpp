#pragma once

#include <optional>
#include <vector>

#include <tl/expected.hpp>

#include "raftkit/data.hpp"
#include "raftkit/errors.hpp"

namespace raftkit
{
    /// What the state machine has applied so far.
    struct AppliedState
    {
        std::optional<data::LogId> lastApplied;  ///< The last applied entry.
        data::StoredMembership lastMembership;  ///< The last membership entry applied.
    };

    /// The application state machine that committed entries are applied to.
    ///
    /// All calls are made sequentially from a single strand, never concurrently.
    class StateMachine
    {
      public:
        virtual ~StateMachine() = default;

        /// Returns what has been applied, including state restored from a snapshot.
        [[nodiscard]] virtual tl::expected<AppliedState, Error> appliedState() = 0;

        /// Applies committed entries in index order.
        /// @param entries The entries to apply. Blank and membership entries are included so
        /// that the state machine can track its last applied log id.
        /// @return One response per entry. Responses for non-command entries are ignored.
        virtual tl::expected<std::vector<std::vector<std::byte>>, Error> apply(
            const std::vector<data::LogEntry>& entries) = 0;

        /// Serves a read against the current state.
        /// @param request The opaque read request.
        /// @return The opaque result.
        virtual tl::expected<std::vector<std::byte>, Error> query(
            const std::vector<std::byte>& request) = 0;

        /// Materializes the state as of meta.lastLogId, which is always the last applied entry,
        /// and stores it as the current snapshot.
        /// @param meta The description of the snapshot to build.
        /// @return The built snapshot.
        virtual tl::expected<data::Snapshot, Error> buildSnapshot(const data::SnapshotMeta& meta) = 0;

        /// Replaces the entire state with the snapshot and stores it as the current snapshot.
        /// Must be atomic: after a failure, the previous state must remain intact.
        virtual tl::expected<void, Error> installSnapshot(const data::SnapshotMeta& meta,
                                                          std::vector<std::byte> data) = 0;

        /// Returns the current snapshot, if one has been built or installed.
        [[nodiscard]] virtual tl::expected<std::optional<data::Snapshot>, Error>
        getCurrentSnapshot() = 0;
    };
}  // namespace raftkit
