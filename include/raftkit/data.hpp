#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "raftkit/membership.hpp"

namespace raftkit::data
{
    /// Identifies a position in the log. Log ids order by term first, then by index.
    struct LogId
    {
        uint64_t term = 0;  ///< The term of the leader that created the entry.
        uint64_t index = 0;  ///< The index of the entry. The first entry has index 0.

        auto operator<=>(LogId const& other) const = default;
    };

    /// A vote cast by a node. A committed vote is held by a leader that won the election.
    struct Vote
    {
        uint64_t term = 0;  ///< The term the vote was cast in.
        std::string nodeID;  ///< The candidate that received the vote.
        bool committed = false;  ///< Whether the candidate was granted a quorum.

        bool operator==(Vote const& other) const = default;
    };

    /// The state a node must persist before acting on a term or vote change.
    struct HardState
    {
        uint64_t currentTerm = 0;  ///< The latest term the node has seen.
        std::optional<Vote> vote;  ///< The vote cast in currentTerm, if any.

        bool operator==(HardState const& other) const = default;
    };

    /// An empty entry. Every new leader appends one in its term, and linearizable reads use them
    /// as barriers.
    struct Blank
    {
        bool operator==(Blank const& other) const = default;
    };

    /// An application command.
    struct Command
    {
        std::vector<std::byte> data;  ///< The opaque command bytes.

        bool operator==(Command const& other) const = default;
    };

    /// A membership change record. The membership takes effect as soon as it is appended.
    struct MembershipChange
    {
        Membership membership;  ///< The new membership.

        bool operator==(MembershipChange const& other) const = default;
    };

    using Payload = std::variant<Blank, Command, MembershipChange>;

    /// LogEntry represents a single log entry in the Raft log.
    struct LogEntry
    {
        LogId logId;  ///< The position of the entry.
        Payload payload;  ///< The entry payload.

        bool operator==(LogEntry const& other) const = default;
    };

    /// A membership together with the log position that introduced it. The log id is
    /// std::nullopt for the bootstrap membership.
    struct StoredMembership
    {
        std::optional<LogId> logId;  ///< Where the membership was introduced.
        Membership membership;  ///< The membership.

        bool operator==(StoredMembership const& other) const = default;
    };

    /// Describes a snapshot.
    struct SnapshotMeta
    {
        std::optional<LogId> lastLogId;  ///< The last log entry included in the snapshot.
        StoredMembership lastMembership;  ///< The membership in effect at lastLogId.
        std::string snapshotID;  ///< A unique identifier for this snapshot.

        bool operator==(SnapshotMeta const& other) const = default;
    };

    /// A snapshot of the state machine.
    struct Snapshot
    {
        SnapshotMeta meta;  ///< The snapshot description.
        std::vector<std::byte> data;  ///< The serialized state machine.

        bool operator==(Snapshot const& other) const = default;
    };

    /// Where a follower's log diverges from the leader's.
    struct ConflictHint
    {
        std::optional<uint64_t> term;  ///< The term of the follower's entry at the conflict, if it
                                       ///< has one.
        uint64_t index = 0;  ///< The first index of that term in the follower's log, or the
                             ///< follower's next free index if it has no entry there.

        bool operator==(ConflictHint const& other) const = default;
    };

    /// The request message for AppendEntries.
    struct AppendEntriesRequest
    {
        uint64_t term = 0;  ///< The leader's term.
        std::string leaderID;  ///< The leader's ID.
        std::optional<LogId> prevLogId;  ///< The entry immediately preceding the new ones.
        std::vector<LogEntry> entries;  ///< The log entries to store. Empty for a heartbeat.
        std::optional<LogId> leaderCommit;  ///< The leader's commit index.

        bool operator==(AppendEntriesRequest const& other) const = default;
    };

    /// The reply message for AppendEntries.
    struct AppendEntriesResponse
    {
        uint64_t term = 0;  ///< The responder's term.
        bool success = false;  ///< True if the follower contained prevLogId and stored the entries.
        std::optional<ConflictHint> conflict;  ///< Set when prevLogId did not match.

        bool operator==(AppendEntriesResponse const& other) const = default;
    };

    /// The request message for RequestVote.
    struct RequestVoteRequest
    {
        uint64_t term = 0;  ///< The candidate's term, or its next term for a pre-vote.
        std::string candidateID;  ///< The candidate's ID.
        std::optional<LogId> lastLogId;  ///< The candidate's last log entry.
        bool isPreVote = false;  ///< Whether this is a non-binding pre-vote.

        bool operator==(RequestVoteRequest const& other) const = default;
    };

    /// The reply message for RequestVote.
    struct RequestVoteResponse
    {
        uint64_t term = 0;  ///< The voter's term.
        bool voteGranted = false;  ///< True if the candidate received the vote.
        bool isPreVote = false;  ///< Echoes the request's isPreVote.

        bool operator==(RequestVoteResponse const& other) const = default;
    };

    /// The request message for InstallSnapshot. Snapshots are sent in chunks.
    struct InstallSnapshotRequest
    {
        uint64_t term = 0;  ///< The leader's term.
        std::string leaderID;  ///< The leader's ID.
        SnapshotMeta meta;  ///< The snapshot being sent.
        uint64_t offset = 0;  ///< The byte offset of this chunk.
        std::vector<std::byte> data;  ///< The chunk.
        bool done = false;  ///< Whether this is the last chunk.

        bool operator==(InstallSnapshotRequest const& other) const = default;
    };

    /// The reply message for InstallSnapshot.
    struct InstallSnapshotResponse
    {
        uint64_t term = 0;  ///< The responder's term.

        bool operator==(InstallSnapshotResponse const& other) const = default;
    };

    /// Returns the index following logId, which is 0 when logId is empty.
    inline uint64_t nextIndex(const std::optional<LogId>& logId)
    {
        return logId ? logId->index + 1 : 0;
    }

    /// Returns the index of logId, if it is set.
    inline std::optional<uint64_t> indexOf(const std::optional<LogId>& logId)
    {
        if (!logId)
        {
            return std::nullopt;
        }
        return logId->index;
    }
}  // namespace raftkit::data
