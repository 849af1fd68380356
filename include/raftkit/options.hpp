#pragma once

#include <cstdint>
#include <random>

#include <tl/expected.hpp>

#include "raftkit/errors.hpp"

namespace raftkit
{
    /// The default election timeout range in milliseconds.
    constexpr std::pair<uint64_t, uint64_t> DEFAULT_TIMEOUT_INTERVAL_RANGE = {500, 1000};
    /// The default heartbeat interval in milliseconds.
    constexpr uint64_t DEFAULT_HEARTBEAT_INTERVAL = 50;
    /// The longest accepted duration in milliseconds (one day). Longer values would overflow
    /// the steady clock when added to the current time.
    constexpr uint64_t MAX_DURATION = 24 * 60 * 60 * 1000;

    struct TimeoutInterval
    {
        uint64_t min = DEFAULT_TIMEOUT_INTERVAL_RANGE.first;
        uint64_t max = DEFAULT_TIMEOUT_INTERVAL_RANGE.second;

        /// Returns a random timeout interval between min and max.
        /// @param rng The random number generator to use.
        [[nodiscard]] uint64_t sample(std::mt19937& rng) const
        {
            std::uniform_int_distribution dist(min, max);
            return dist(rng);
        }
    };

    /// How linearizable reads confirm that the leader is still the leader.
    enum class ReadPolicy
    {
        /// Commit a blank barrier entry before serving the read.
        CommitConfirmed,
        /// Serve the read without a log write while a quorum acknowledged the leader recently.
        LeaderLease,
    };

    /// Tunables for a Raft server. Durations are in milliseconds.
    struct Options
    {
        TimeoutInterval electionTimeout;  ///< The randomized election timeout.
        uint64_t heartbeatInterval = DEFAULT_HEARTBEAT_INTERVAL;  ///< Idle replication interval.
        uint64_t maxEntriesPerAppend = 64;  ///< The most entries sent in one AppendEntries.

        uint64_t snapshotLogThreshold = 1000;  ///< Applied entries since the last snapshot that
                                               ///< trigger a new one.
        uint64_t snapshotMaxLogBytes = 0;  ///< Log size in bytes that triggers a snapshot. 0
                                           ///< disables the check.
        uint64_t logsToKeepAfterSnapshot = 16;  ///< Entries kept behind a new snapshot so that
                                                ///< slow followers can catch up without it.
        uint64_t snapshotChunkSize = 64 * 1024;  ///< The size of one InstallSnapshot chunk.

        ReadPolicy readPolicy = ReadPolicy::CommitConfirmed;  ///< How reads are confirmed.
        uint64_t leaseDuration = 400;  ///< How long a quorum acknowledgement keeps the lease.

        uint64_t commitTimeout = 5000;  ///< How long a write may wait to be committed.
        uint64_t maxPendingWrites = 4096;  ///< The most uncommitted client writes.
        uint64_t rpcTimeout = 200;  ///< The deadline for a single RPC.
        uint64_t maxBackoff = 1000;  ///< The longest retry delay after a failed RPC.

        /// Checks cross-field constraints.
        /// @return Success or an InvalidArgument describing the first violation.
        [[nodiscard]] tl::expected<void, Error> validate() const;
    };
}  // namespace raftkit
