#pragma once

#include <memory>
#include <optional>
#include <string>

#include <tl/expected.hpp>

#include "raftkit/data.hpp"
#include "raftkit/errors.hpp"
#include "raftkit/options.hpp"

namespace raftkit::impl
{
    // Tracks the current snapshot, decides when to build a new one and assembles snapshots that
    // arrive in chunks.
    class SnapshotCoordinator
    {
      public:
        SnapshotCoordinator() = default;

        [[nodiscard]] std::shared_ptr<const data::Snapshot> current() const { return current_; }
        void setCurrent(std::shared_ptr<const data::Snapshot> snapshot);

        // The last log id covered by the current snapshot.
        [[nodiscard]] std::optional<data::LogId> lastIncluded() const;

        [[nodiscard]] bool building() const { return building_; }
        void setBuilding(bool building) { building_ = building; }

        // Whether enough has been applied since the current snapshot, or the log has grown
        // large enough, to build a new one.
        [[nodiscard]] bool shouldBuild(const std::optional<data::LogId>& lastApplied,
                                       size_t logBytes,
                                       const Options& options) const;

        // Returns the index up to which the log may be purged after a snapshot at lastIncluded,
        // keeping logsToKeep entries behind it.
        [[nodiscard]] static std::optional<uint64_t> purgeIndex(const data::LogId& lastIncluded,
                                                                uint64_t logsToKeep);

        // Adds a received chunk. Returns the complete snapshot once the last chunk arrived,
        // std::nullopt while more chunks are expected, or InvalidArgument if the chunk does not
        // continue the snapshot being assembled.
        tl::expected<std::optional<data::Snapshot>, Error> receive(
            const data::InstallSnapshotRequest& request);

        // Discards a partially received snapshot.
        void abortReceive() { receiving_.reset(); }

      private:
        std::shared_ptr<const data::Snapshot> current_;
        bool building_ = false;

        std::optional<data::Snapshot> receiving_;
        // The ID of the last fully received snapshot, so that a repeated final chunk is
        // acknowledged instead of rejected.
        std::optional<std::string> lastReceivedID_;
    };
}  // namespace raftkit::impl
