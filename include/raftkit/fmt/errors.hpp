#pragma once

#include <fmt/core.h>

#include "raftkit/errors.hpp"

namespace raftkit::errors::detail
{
    template<typename T>
    constexpr std::string_view getMessage()
    {
        if constexpr (std::is_same_v<T, Timeout>)
        {
            return "timeout";
        }
        if constexpr (std::is_same_v<T, AlreadyRunning>)
        {
            return "already running";
        }
        if constexpr (std::is_same_v<T, NotRunning>)
        {
            return "not running";
        }
        if constexpr (std::is_same_v<T, FailedToStart>)
        {
            return "failed to start";
        }
        if constexpr (std::is_same_v<T, Deserialization>)
        {
            return "deserialization";
        }
        if constexpr (std::is_same_v<T, Overloaded>)
        {
            return "overloaded";
        }
        if constexpr (std::is_same_v<T, ChangeInProgress>)
        {
            return "membership change in progress";
        }
        return "unknown error";
    }

    template<typename T>
    concept SimpleError = std::is_same_v<T, Timeout> || std::is_same_v<T, AlreadyRunning>
        || std::is_same_v<T, NotRunning> || std::is_same_v<T, FailedToStart>
        || std::is_same_v<T, Deserialization> || std::is_same_v<T, Overloaded>
        || std::is_same_v<T, ChangeInProgress>;
}  // namespace raftkit::errors::detail

template<>
struct fmt::formatter<raftkit::errors::Unknown>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(raftkit::errors::Unknown const& err, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "unknown error: {}", err.message);
    }
};

template<>
struct fmt::formatter<raftkit::errors::InvalidArgument>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(raftkit::errors::InvalidArgument const& err, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "invalid argument: {}", err.message);
    }
};

template<>
struct fmt::formatter<raftkit::errors::PersistenceFailed>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(raftkit::errors::PersistenceFailed const& err, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "persistence failed: {}", err.message);
    }
};

template<>
struct fmt::formatter<raftkit::errors::Faulted>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(raftkit::errors::Faulted const& err, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "faulted: {}", err.message);
    }
};

template<>
struct fmt::formatter<raftkit::errors::ConfigError>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(raftkit::errors::ConfigError const& err, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "config error: {}", err.message);
    }
};

template<>
struct fmt::formatter<raftkit::errors::NotLeader>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(raftkit::errors::NotLeader const& err, FormatContext& ctx) const
    {
        if (!err.leaderID)
        {
            return fmt::format_to(ctx.out(), "not leader");
        }
        return fmt::format_to(ctx.out(),
                              "not leader (leader: {} at {})",
                              *err.leaderID,
                              err.leaderAddress.value_or("unknown address"));
    }
};

template<raftkit::errors::detail::SimpleError T>
struct fmt::formatter<T>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(T const& err, FormatContext& ctx) const
    {
        (void)err;
        return fmt::format_to(ctx.out(), "{}", raftkit::errors::detail::getMessage<T>());
    }
};

template<>
struct fmt::formatter<raftkit::Error>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(raftkit::Error const& err, FormatContext& ctx) const
    {
        return std::visit([&ctx](auto const& e) { return fmt::format_to(ctx.out(), "{}", e); },
                          err);
    }
};
