#include "raftkit/config.hpp"

#include <filesystem>
#include <string>

#include <fmt/core.h>
#include <toml++/toml.hpp>

namespace raftkit::config
{
    namespace
    {
        // Reads an optional non-negative integer from the table into target.
        tl::expected<void, Error> readUnsigned(const toml::table& table,
                                               std::string_view key,
                                               uint64_t& target)
        {
            auto node = table[key];
            if (!node)
            {
                return {};
            }
            auto value = node.as_integer();
            if (!value || value->get() < 0)
            {
                return tl::make_unexpected(errors::ConfigError {
                    fmt::format("invalid {} in [raft] - must be a non-negative integer", key)});
            }
            target = static_cast<uint64_t>(value->get());
            return {};
        }

        tl::expected<ReadPolicy, Error> parseReadPolicy(std::string_view value)
        {
            if (value == "commit_confirmed")
            {
                return ReadPolicy::CommitConfirmed;
            }
            if (value == "leader_lease")
            {
                return ReadPolicy::LeaderLease;
            }
            return tl::make_unexpected(errors::ConfigError {fmt::format(
                "invalid read_policy '{}' - must be commit_confirmed or leader_lease", value)});
        }

        tl::expected<Options, Error> parseTable(const toml::table& config)
        {
            Options options;

            auto raftTable = config["raft"].as_table();
            if (!raftTable)
            {
                return tl::make_unexpected(errors::ConfigError {"missing [raft] section"});
            }

            std::pair<std::string_view, uint64_t*> fields[] = {
                {"min_election_timeout_ms", &options.electionTimeout.min},
                {"max_election_timeout_ms", &options.electionTimeout.max},
                {"heartbeat_interval_ms", &options.heartbeatInterval},
                {"max_entries_per_append", &options.maxEntriesPerAppend},
                {"snapshot_log_threshold", &options.snapshotLogThreshold},
                {"snapshot_max_log_bytes", &options.snapshotMaxLogBytes},
                {"logs_to_keep_after_snapshot", &options.logsToKeepAfterSnapshot},
                {"snapshot_chunk_size", &options.snapshotChunkSize},
                {"lease_duration_ms", &options.leaseDuration},
                {"commit_timeout_ms", &options.commitTimeout},
                {"max_pending_writes", &options.maxPendingWrites},
                {"rpc_timeout_ms", &options.rpcTimeout},
                {"max_backoff_ms", &options.maxBackoff},
            };
            for (auto& [key, target] : fields)
            {
                auto result = readUnsigned(*raftTable, key, *target);
                if (!result)
                {
                    return tl::make_unexpected(result.error());
                }
            }

            if (auto policyNode = (*raftTable)["read_policy"])
            {
                if (!policyNode.as_string())
                {
                    return tl::make_unexpected(
                        errors::ConfigError {"invalid read_policy in [raft] - must be a string"});
                }
                auto policy = parseReadPolicy(policyNode.as_string()->get());
                if (!policy)
                {
                    return tl::make_unexpected(policy.error());
                }
                options.readPolicy = *policy;
            }

            auto valid = options.validate();
            if (!valid)
            {
                auto* invalid = std::get_if<errors::InvalidArgument>(&valid.error());
                return tl::make_unexpected(
                    errors::ConfigError {invalid ? invalid->message : "invalid options"});
            }
            return options;
        }
    }  // namespace

    tl::expected<Options, Error> parseOptions(std::string_view text)
    {
        toml::table config;
        try
        {
            config = toml::parse(text);
        }
        catch (const toml::parse_error& err)
        {
            return tl::make_unexpected(
                errors::ConfigError {"failed to parse TOML: " + std::string(err.what())});
        }
        return parseTable(config);
    }

    tl::expected<Options, Error> loadOptions(std::string_view path)
    {
        if (!std::filesystem::exists(path))
        {
            return tl::make_unexpected(
                errors::ConfigError {"config file not found: " + std::string(path)});
        }

        toml::table config;
        try
        {
            config = toml::parse_file(path);
        }
        catch (const toml::parse_error& err)
        {
            return tl::make_unexpected(
                errors::ConfigError {"failed to parse TOML file: " + std::string(err.what())});
        }
        return parseTable(config);
    }
}  // namespace raftkit::config
