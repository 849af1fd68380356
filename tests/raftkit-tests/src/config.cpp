#include <filesystem>
#include <fstream>
#include <limits>

#include <fmt/format.h>
#include <gtest/gtest.h>

#include "raftkit/config.hpp"
#include "raftkit/fmt/errors.hpp"

namespace
{
    std::string configErrorMessage(const raftkit::Error& error)
    {
        auto* configError = std::get_if<raftkit::errors::ConfigError>(&error);
        return configError ? configError->message : "";
    }
}  // namespace

TEST(OptionsTest, DefaultsAreValid)
{
    raftkit::Options options;
    EXPECT_TRUE(options.validate().has_value());
}

TEST(OptionsTest, RejectsInvalidCombinations)
{
    auto expectInvalid = [](raftkit::Options options, const char* what)
    {
        auto result = options.validate();
        ASSERT_FALSE(result.has_value()) << what;
        EXPECT_TRUE(std::holds_alternative<raftkit::errors::InvalidArgument>(result.error()))
            << what << ": " << fmt::format("{}", result.error());
    };

    raftkit::Options options;
    options.electionTimeout = {.min = 300, .max = 200};
    expectInvalid(options, "inverted election timeout");

    options = {};
    options.electionTimeout.min = 0;
    expectInvalid(options, "zero election timeout");

    options = {};
    options.heartbeatInterval = options.electionTimeout.min;
    expectInvalid(options, "heartbeat not below election timeout");

    options = {};
    options.leaseDuration = options.electionTimeout.min;
    expectInvalid(options, "lease as long as the election timeout");

    options = {};
    options.maxEntriesPerAppend = 0;
    expectInvalid(options, "zero batch size");

    options = {};
    options.snapshotChunkSize = 0;
    expectInvalid(options, "zero chunk size");

    options = {};
    options.maxPendingWrites = 0;
    expectInvalid(options, "zero pending writes");

    options = {};
    options.maxBackoff = options.heartbeatInterval - 1;
    expectInvalid(options, "backoff below heartbeat");

    options = {};
    options.electionTimeout.max = raftkit::MAX_DURATION + 1;
    expectInvalid(options, "election timeout beyond a day");

    options = {};
    options.commitTimeout = std::numeric_limits<uint64_t>::max();
    expectInvalid(options, "unbounded commit timeout");

    options = {};
    options.rpcTimeout = raftkit::MAX_DURATION + 1;
    expectInvalid(options, "rpc timeout beyond a day");

    options = {};
    options.maxBackoff = raftkit::MAX_DURATION + 1;
    expectInvalid(options, "backoff beyond a day");

    options = {};
    options.commitTimeout = raftkit::MAX_DURATION;
    EXPECT_TRUE(options.validate().has_value());
}

TEST(ConfigTest, EmptyRaftTableUsesDefaults)
{
    auto options = raftkit::config::parseOptions("[raft]\n");
    ASSERT_TRUE(options.has_value()) << fmt::format("{}", options.error());
    raftkit::Options defaults;
    EXPECT_EQ(options->electionTimeout.min, defaults.electionTimeout.min);
    EXPECT_EQ(options->electionTimeout.max, defaults.electionTimeout.max);
    EXPECT_EQ(options->heartbeatInterval, defaults.heartbeatInterval);
    EXPECT_EQ(options->snapshotLogThreshold, defaults.snapshotLogThreshold);
    EXPECT_EQ(options->readPolicy, raftkit::ReadPolicy::CommitConfirmed);
}

TEST(ConfigTest, ParsesValues)
{
    auto options = raftkit::config::parseOptions(R"(
[raft]
min_election_timeout_ms = 150
max_election_timeout_ms = 300
heartbeat_interval_ms = 30
max_entries_per_append = 8
snapshot_log_threshold = 50
snapshot_max_log_bytes = 4096
logs_to_keep_after_snapshot = 4
snapshot_chunk_size = 512
read_policy = "leader_lease"
lease_duration_ms = 100
commit_timeout_ms = 2500
max_pending_writes = 10
rpc_timeout_ms = 75
max_backoff_ms = 600
)");
    ASSERT_TRUE(options.has_value()) << fmt::format("{}", options.error());
    EXPECT_EQ(options->electionTimeout.min, 150u);
    EXPECT_EQ(options->electionTimeout.max, 300u);
    EXPECT_EQ(options->heartbeatInterval, 30u);
    EXPECT_EQ(options->maxEntriesPerAppend, 8u);
    EXPECT_EQ(options->snapshotLogThreshold, 50u);
    EXPECT_EQ(options->snapshotMaxLogBytes, 4096u);
    EXPECT_EQ(options->logsToKeepAfterSnapshot, 4u);
    EXPECT_EQ(options->snapshotChunkSize, 512u);
    EXPECT_EQ(options->readPolicy, raftkit::ReadPolicy::LeaderLease);
    EXPECT_EQ(options->leaseDuration, 100u);
    EXPECT_EQ(options->commitTimeout, 2500u);
    EXPECT_EQ(options->maxPendingWrites, 10u);
    EXPECT_EQ(options->rpcTimeout, 75u);
    EXPECT_EQ(options->maxBackoff, 600u);
}

TEST(ConfigTest, RejectsUnknownReadPolicy)
{
    auto options = raftkit::config::parseOptions("[raft]\nread_policy = \"eventual\"\n");
    ASSERT_FALSE(options.has_value());
    EXPECT_NE(configErrorMessage(options.error()).find("eventual"), std::string::npos);
}

TEST(ConfigTest, RejectsNegativeValue)
{
    auto options = raftkit::config::parseOptions("[raft]\nheartbeat_interval_ms = -5\n");
    ASSERT_FALSE(options.has_value());
    EXPECT_NE(configErrorMessage(options.error()).find("heartbeat_interval_ms"),
              std::string::npos);
}

TEST(ConfigTest, RejectsWrongType)
{
    auto options = raftkit::config::parseOptions("[raft]\nrpc_timeout_ms = \"fast\"\n");
    ASSERT_FALSE(options.has_value());
    EXPECT_TRUE(std::holds_alternative<raftkit::errors::ConfigError>(options.error()));
}

TEST(ConfigTest, RequiresRaftSection)
{
    auto options = raftkit::config::parseOptions("[server]\nport = 1\n");
    ASSERT_FALSE(options.has_value());
    EXPECT_EQ(configErrorMessage(options.error()), "missing [raft] section");
}

TEST(ConfigTest, ReportsSyntaxErrors)
{
    auto options = raftkit::config::parseOptions("[raft\n");
    ASSERT_FALSE(options.has_value());
    EXPECT_TRUE(std::holds_alternative<raftkit::errors::ConfigError>(options.error()));
}

TEST(ConfigTest, ValidationFailureIsConfigError)
{
    auto options = raftkit::config::parseOptions(R"(
[raft]
min_election_timeout_ms = 100
max_election_timeout_ms = 200
lease_duration_ms = 150
)");
    ASSERT_FALSE(options.has_value());
    EXPECT_NE(configErrorMessage(options.error()).find("lease duration"), std::string::npos);
}

TEST(ConfigTest, RejectsDurationThatWouldOverflowTheClock)
{
    auto options =
        raftkit::config::parseOptions("[raft]\ncommit_timeout_ms = 9223372036854775807\n");
    ASSERT_FALSE(options.has_value());
    EXPECT_TRUE(std::holds_alternative<raftkit::errors::ConfigError>(options.error()));
    EXPECT_NE(configErrorMessage(options.error()).find("must not exceed"), std::string::npos)
        << configErrorMessage(options.error());
}

TEST(ConfigTest, LoadMissingFile)
{
    auto options = raftkit::config::loadOptions("/nonexistent/raftkit.toml");
    ASSERT_FALSE(options.has_value());
    EXPECT_EQ(configErrorMessage(options.error()),
              "config file not found: /nonexistent/raftkit.toml");
}

TEST(ConfigTest, LoadFromFile)
{
    auto path = std::filesystem::temp_directory_path()
        / fmt::format("raftkit_config_{}.toml", ::testing::UnitTest::GetInstance()->random_seed());
    {
        std::ofstream file(path);
        file << "[raft]\nmax_entries_per_append = 3\nread_policy = \"commit_confirmed\"\n";
    }

    auto options = raftkit::config::loadOptions(path.string());
    std::filesystem::remove(path);
    ASSERT_TRUE(options.has_value()) << fmt::format("{}", options.error());
    EXPECT_EQ(options->maxEntriesPerAppend, 3u);
    EXPECT_EQ(options->readPolicy, raftkit::ReadPolicy::CommitConfirmed);
}
