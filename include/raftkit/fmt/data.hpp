#pragma once

#include <optional>

#include <fmt/core.h>
#include <fmt/ranges.h>

#include "raftkit/data.hpp"

template<>
struct fmt::formatter<raftkit::data::LogId>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(raftkit::data::LogId const& id, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "T{}-{}", id.term, id.index);
    }
};

template<>
struct fmt::formatter<std::optional<raftkit::data::LogId>>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(std::optional<raftkit::data::LogId> const& id, FormatContext& ctx) const
    {
        if (!id)
        {
            return fmt::format_to(ctx.out(), "None");
        }
        return fmt::format_to(ctx.out(), "{}", *id);
    }
};

template<>
struct fmt::formatter<raftkit::data::Vote>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(raftkit::data::Vote const& vote, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(),
                              "{{term: {}, nodeID: {}, committed: {}}}",
                              vote.term,
                              vote.nodeID,
                              vote.committed);
    }
};

template<>
struct fmt::formatter<raftkit::Membership>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(raftkit::Membership const& membership, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(),
                              "{{voters: {}, learners: {}}}",
                              membership.configs(),
                              membership.learnerIDs());
    }
};
