#pragma once

#include <cstring>

#include "raftkit/data.hpp"
#include "raftkit_protos/raftkit.pb.h"

namespace raftkit::data
{
    inline std::vector<std::byte> toBytes(const std::string& str)
    {
        std::vector<std::byte> bytes(str.size());
        std::memcpy(bytes.data(), str.data(), str.size());
        return bytes;
    }

    inline std::string toString(const std::vector<std::byte>& bytes)
    {
        return {reinterpret_cast<const char*>(bytes.data()), bytes.size()};
    }

    inline raftkit_protos::LogId toProto(LogId const& logId)
    {
        raftkit_protos::LogId proto;
        proto.set_term(logId.term);
        proto.set_index(logId.index);
        return proto;
    }

    inline LogId fromProto(const raftkit_protos::LogId& proto)
    {
        return LogId {.term = proto.term(), .index = proto.index()};
    }

    inline raftkit_protos::Vote toProto(Vote const& vote)
    {
        raftkit_protos::Vote proto;
        proto.set_term(vote.term);
        proto.set_node_id(vote.nodeID);
        proto.set_committed(vote.committed);
        return proto;
    }

    inline Vote fromProto(const raftkit_protos::Vote& proto)
    {
        return Vote {.term = proto.term(), .nodeID = proto.node_id(), .committed = proto.committed()};
    }

    inline raftkit_protos::HardState toProto(HardState const& state)
    {
        raftkit_protos::HardState proto;
        proto.set_current_term(state.currentTerm);
        if (state.vote)
        {
            *proto.mutable_vote() = toProto(*state.vote);
        }
        return proto;
    }

    inline HardState fromProto(const raftkit_protos::HardState& proto)
    {
        HardState state {.currentTerm = proto.current_term()};
        if (proto.has_vote())
        {
            state.vote = fromProto(proto.vote());
        }
        return state;
    }

    inline raftkit_protos::Membership toProto(Membership const& membership)
    {
        raftkit_protos::Membership proto;
        for (const auto& config : membership.configs())
        {
            auto* voters = proto.add_configs();
            for (const auto& id : config)
            {
                voters->add_ids(id);
            }
        }
        for (const auto& [id, address] : membership.nodes())
        {
            (*proto.mutable_nodes())[id] = address;
        }
        return proto;
    }

    inline Membership fromProto(const raftkit_protos::Membership& proto)
    {
        std::vector<std::set<std::string>> configs;
        for (const auto& voters : proto.configs())
        {
            configs.emplace_back(voters.ids().begin(), voters.ids().end());
        }
        std::map<std::string, std::string> nodes(proto.nodes().begin(), proto.nodes().end());
        return Membership {std::move(configs), std::move(nodes)};
    }

    inline raftkit_protos::StoredMembership toProto(StoredMembership const& stored)
    {
        raftkit_protos::StoredMembership proto;
        // The bootstrap membership has no log id and leaves the field absent.
        if (stored.logId)
        {
            *proto.mutable_log_id() = toProto(*stored.logId);
        }
        *proto.mutable_membership() = toProto(stored.membership);
        return proto;
    }

    inline StoredMembership fromProto(const raftkit_protos::StoredMembership& proto)
    {
        StoredMembership stored {.membership = fromProto(proto.membership())};
        if (proto.has_log_id())
        {
            stored.logId = fromProto(proto.log_id());
        }
        return stored;
    }

    inline raftkit_protos::LogEntry toProto(LogEntry const& entry)
    {
        raftkit_protos::LogEntry proto;
        *proto.mutable_log_id() = toProto(entry.logId);

        std::visit(
            [&proto](auto const& payload)
            {
                using T = std::decay_t<decltype(payload)>;
                if constexpr (std::is_same_v<T, Command>)
                {
                    proto.set_command(toString(payload.data));
                }
                else if constexpr (std::is_same_v<T, MembershipChange>)
                {
                    *proto.mutable_membership() = toProto(payload.membership);
                }
                else if constexpr (std::is_same_v<T, Blank>)
                {
                    proto.mutable_blank();
                }
            },
            entry.payload);

        return proto;
    }

    inline LogEntry fromProto(const raftkit_protos::LogEntry& proto)
    {
        LogEntry entry {.logId = fromProto(proto.log_id())};

        switch (proto.payload_case())
        {
            case raftkit_protos::LogEntry::kCommand:
                entry.payload = Command {toBytes(proto.command())};
                break;
            case raftkit_protos::LogEntry::kMembership:
                entry.payload = MembershipChange {fromProto(proto.membership())};
                break;
            case raftkit_protos::LogEntry::kBlank:
            case raftkit_protos::LogEntry::PAYLOAD_NOT_SET:
                entry.payload = Blank {};
                break;
        }

        return entry;
    }

    inline raftkit_protos::SnapshotMeta toProto(SnapshotMeta const& meta)
    {
        raftkit_protos::SnapshotMeta proto;
        if (meta.lastLogId)
        {
            *proto.mutable_last_log_id() = toProto(*meta.lastLogId);
        }
        *proto.mutable_last_membership() = toProto(meta.lastMembership);
        proto.set_snapshot_id(meta.snapshotID);
        return proto;
    }

    inline SnapshotMeta fromProto(const raftkit_protos::SnapshotMeta& proto)
    {
        SnapshotMeta meta {
            .lastMembership = fromProto(proto.last_membership()),
            .snapshotID = proto.snapshot_id(),
        };
        if (proto.has_last_log_id())
        {
            meta.lastLogId = fromProto(proto.last_log_id());
        }
        return meta;
    }

    inline raftkit_protos::AppendEntriesRequest toProto(AppendEntriesRequest const& request)
    {
        raftkit_protos::AppendEntriesRequest proto;
        proto.set_term(request.term);
        proto.set_leader_id(request.leaderID);
        if (request.prevLogId)
        {
            *proto.mutable_prev_log_id() = toProto(*request.prevLogId);
        }
        for (auto const& entry : request.entries)
        {
            *proto.add_entries() = toProto(entry);
        }
        if (request.leaderCommit)
        {
            *proto.mutable_leader_commit() = toProto(*request.leaderCommit);
        }
        return proto;
    }

    inline AppendEntriesRequest fromProto(const raftkit_protos::AppendEntriesRequest& proto)
    {
        AppendEntriesRequest request {
            .term = proto.term(),
            .leaderID = proto.leader_id(),
        };
        if (proto.has_prev_log_id())
        {
            request.prevLogId = fromProto(proto.prev_log_id());
        }
        for (auto const& entry : proto.entries())
        {
            request.entries.push_back(fromProto(entry));
        }
        if (proto.has_leader_commit())
        {
            request.leaderCommit = fromProto(proto.leader_commit());
        }
        return request;
    }

    inline raftkit_protos::AppendEntriesResponse toProto(AppendEntriesResponse const& response)
    {
        raftkit_protos::AppendEntriesResponse proto;
        proto.set_term(response.term);
        proto.set_success(response.success);
        if (response.conflict)
        {
            auto* conflict = proto.mutable_conflict();
            if (response.conflict->term)
            {
                conflict->set_term(*response.conflict->term);
            }
            conflict->set_index(response.conflict->index);
        }
        return proto;
    }

    inline AppendEntriesResponse fromProto(const raftkit_protos::AppendEntriesResponse& proto)
    {
        AppendEntriesResponse response {
            .term = proto.term(),
            .success = proto.success(),
        };
        if (proto.has_conflict())
        {
            ConflictHint hint {.index = proto.conflict().index()};
            if (proto.conflict().has_term())
            {
                hint.term = proto.conflict().term();
            }
            response.conflict = hint;
        }
        return response;
    }

    inline raftkit_protos::RequestVoteRequest toProto(RequestVoteRequest const& request)
    {
        raftkit_protos::RequestVoteRequest proto;
        proto.set_term(request.term);
        proto.set_candidate_id(request.candidateID);
        if (request.lastLogId)
        {
            *proto.mutable_last_log_id() = toProto(*request.lastLogId);
        }
        proto.set_is_pre_vote(request.isPreVote);
        return proto;
    }

    inline RequestVoteRequest fromProto(const raftkit_protos::RequestVoteRequest& proto)
    {
        RequestVoteRequest request {
            .term = proto.term(),
            .candidateID = proto.candidate_id(),
            .isPreVote = proto.is_pre_vote(),
        };
        if (proto.has_last_log_id())
        {
            request.lastLogId = fromProto(proto.last_log_id());
        }
        return request;
    }

    inline raftkit_protos::RequestVoteResponse toProto(RequestVoteResponse const& response)
    {
        raftkit_protos::RequestVoteResponse proto;
        proto.set_term(response.term);
        proto.set_vote_granted(response.voteGranted);
        proto.set_is_pre_vote(response.isPreVote);
        return proto;
    }

    inline RequestVoteResponse fromProto(const raftkit_protos::RequestVoteResponse& proto)
    {
        return RequestVoteResponse {
            .term = proto.term(),
            .voteGranted = proto.vote_granted(),
            .isPreVote = proto.is_pre_vote(),
        };
    }

    inline raftkit_protos::InstallSnapshotRequest toProto(InstallSnapshotRequest const& request)
    {
        raftkit_protos::InstallSnapshotRequest proto;
        proto.set_term(request.term);
        proto.set_leader_id(request.leaderID);
        *proto.mutable_meta() = toProto(request.meta);
        proto.set_offset(request.offset);
        proto.set_data(toString(request.data));
        proto.set_done(request.done);
        return proto;
    }

    inline InstallSnapshotRequest fromProto(const raftkit_protos::InstallSnapshotRequest& proto)
    {
        return InstallSnapshotRequest {
            .term = proto.term(),
            .leaderID = proto.leader_id(),
            .meta = fromProto(proto.meta()),
            .offset = proto.offset(),
            .data = toBytes(proto.data()),
            .done = proto.done(),
        };
    }

    inline raftkit_protos::InstallSnapshotResponse toProto(InstallSnapshotResponse const& response)
    {
        raftkit_protos::InstallSnapshotResponse proto;
        proto.set_term(response.term);
        return proto;
    }

    inline InstallSnapshotResponse fromProto(const raftkit_protos::InstallSnapshotResponse& proto)
    {
        return InstallSnapshotResponse {.term = proto.term()};
    }
}  // namespace raftkit::data
