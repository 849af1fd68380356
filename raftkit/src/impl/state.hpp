#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>

#include <fmt/core.h>
#include <fmt/ranges.h>

#include "election.hpp"
#include "raftkit/server.hpp"
#include "replication.hpp"

namespace raftkit
{
    struct FollowerInfo
    {
    };

    // PreCandidateInfo collects non-binding grants for the next term without changing any
    // persistent state.
    struct PreCandidateInfo
    {
        impl::VoteTally tally;
    };

    struct CandidateInfo
    {
        impl::VoteTally tally;
        // Whether the self-vote has been persisted and the requests were sent.
        bool requested = false;
    };

    struct LeaderInfo
    {
        std::map<std::string, std::shared_ptr<impl::ReplicationStream>>
            streams;  // The replication stream of each other member by ID.
        uint64_t blankIndex = 0;  // The index of the blank entry appended when elected.
        std::optional<uint64_t> barrierIndex;  // The read barrier still waiting for commit.
    };

    using State = std::variant<FollowerInfo, PreCandidateInfo, CandidateInfo, LeaderInfo>;

    constexpr std::string_view roleName(Role role)
    {
        switch (role)
        {
            case Role::Follower:
                return "follower";
            case Role::Learner:
                return "learner";
            case Role::PreCandidate:
                return "pre-candidate";
            case Role::Candidate:
                return "candidate";
            case Role::Leader:
                return "leader";
        }
        return "unknown";
    }
}  // namespace raftkit

template<>
struct fmt::formatter<raftkit::Role>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(raftkit::Role role, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", raftkit::roleName(role));
    }
};

template<>
struct fmt::formatter<raftkit::impl::ReplicationStream>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const raftkit::impl::ReplicationStream& stream, FormatContext& ctx) const
    {
        if (stream.matched())
        {
            return fmt::format_to(ctx.out(),
                                  "{{target: {}, nextIndex: {}, matched: {}, snapshot: {}}}",
                                  stream.target(),
                                  stream.nextIndex(),
                                  *stream.matched(),
                                  stream.sendingSnapshot());
        }
        return fmt::format_to(ctx.out(),
                              "{{target: {}, nextIndex: {}, matched: None, snapshot: {}}}",
                              stream.target(),
                              stream.nextIndex(),
                              stream.sendingSnapshot());
    }
};

template<>
struct fmt::formatter<raftkit::CandidateInfo>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const raftkit::CandidateInfo& info, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(), "{{term: {}, granted: {}}}", info.tally.term(), info.tally.granted());
    }
};

template<>
struct fmt::formatter<raftkit::LeaderInfo>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const raftkit::LeaderInfo& info, FormatContext& ctx) const
    {
        auto out = fmt::format_to(ctx.out(), "{{blankIndex: {}, streams: [", info.blankIndex);
        bool first = true;
        for (const auto& [_, stream] : info.streams)
        {
            if (!first)
            {
                out = fmt::format_to(out, ", ");
            }
            out = fmt::format_to(out, "{}", *stream);
            first = false;
        }
        return fmt::format_to(out, "]}}");
    }
};
