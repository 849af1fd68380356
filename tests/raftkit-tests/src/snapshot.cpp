#include <map>
#include <thread>

#include <fmt/format.h>
#include <gtest/gtest.h>

#include "raftkit/fmt/errors.hpp"
#include "raftkit/server.hpp"
#include "server_tester.hpp"

using raftkit::testing::ServerTester;
using raftkit::testing::toBytes;

namespace
{
    constexpr int WRITE_COUNT = 30;

    raftkit::Options compactingOptions()
    {
        auto options = ServerTester::defaultOptions();
        options.snapshotLogThreshold = 10;
        options.logsToKeepAfterSnapshot = 2;
        options.snapshotChunkSize = 16;
        return options;
    }

    // Writes key0..keyN through whichever node leads and returns the last log index.
    uint64_t writeMany(ServerTester& tester, int count)
    {
        uint64_t last = 0;
        for (int i = 0; i < count; i++)
        {
            auto result = tester.write(fmt::format("key{}", i), fmt::format("value{}", i));
            EXPECT_TRUE(result.has_value()) << fmt::format("write {}: {}", i, result.error());
            if (result)
            {
                last = result->logId.index;
            }
        }
        return last;
    }

    std::optional<uint64_t> lastPurgedIndex(raftkit::testing::ServerAndNetwork& node)
    {
        auto state = node.logStore->getLogState();
        if (!state || !state->lastPurged)
        {
            return std::nullopt;
        }
        return state->lastPurged->index;
    }

    bool valuesMatch(ServerTester& tester)
    {
        std::optional<std::map<std::string, std::string>> reference;
        for (auto& node : tester.servers)
        {
            if (!node.running())
            {
                continue;
            }
            auto values = node.stateMachine->values();
            if (!reference)
            {
                reference = std::move(values);
            }
            else if (values != *reference)
            {
                return false;
            }
        }
        return true;
    }
}  // namespace

TEST(SnapshotTest, LogIsCompactedAfterThreshold)
{
    ServerTester tester({"A", "B", "C"}, compactingOptions());
    std::string leader;
    tester.checkOneLeader(leader);

    auto last = writeMany(tester, WRITE_COUNT);
    ASSERT_TRUE(tester.waitForApplied(last));
    ASSERT_TRUE(tester.waitFor(
        [&tester]
        {
            for (auto& node : tester.servers)
            {
                if (node.stateMachine->snapshotsBuilt() == 0 || !lastPurgedIndex(node))
                {
                    return false;
                }
            }
            return true;
        }))
        << "Not every node compacted its log";

    for (auto& node : tester.servers)
    {
        auto purged = lastPurgedIndex(node);
        ASSERT_TRUE(purged.has_value());
        EXPECT_LT(*purged, last) << node.id;
        EXPECT_FALSE(node.stateMachine->appliedOutOfOrder()) << node.id;
    }
    EXPECT_TRUE(valuesMatch(tester));
}

TEST(SnapshotTest, LaggingFollowerInstallsSnapshot)
{
    ServerTester tester({"A", "B", "C"}, compactingOptions());
    std::string leader;
    tester.checkOneLeader(leader);
    ASSERT_TRUE(tester.write("early", "1").has_value());

    std::string follower = leader == "A" ? "B" : "A";
    auto followerState = tester.node(follower).logStore->getLogState();
    ASSERT_TRUE(followerState.has_value());
    tester.crash(follower);

    auto last = writeMany(tester, WRITE_COUNT);
    ASSERT_TRUE(tester.waitFor(
        [&tester, &leader, &followerState]
        {
            auto purged = lastPurgedIndex(tester.node(leader));
            auto followerLast = followerState->lastLogId ? followerState->lastLogId->index : 0;
            return purged && *purged > followerLast;
        }))
        << "The leader never purged the entries the follower is missing";

    tester.restart(follower);
    ASSERT_TRUE(tester.waitForApplied(follower, last)) << follower << " did not catch up";
    EXPECT_GT(tester.node(follower).stateMachine->snapshotsInstalled(), 0u);
    EXPECT_EQ(tester.node(follower).stateMachine->get(fmt::format("key{}", WRITE_COUNT - 1)),
              fmt::format("value{}", WRITE_COUNT - 1));
    ASSERT_TRUE(tester.waitFor([&tester] { return valuesMatch(tester); }));
}

TEST(SnapshotTest, NewLearnerStartsFromSnapshot)
{
    ServerTester tester({"A", "B", "C"}, compactingOptions());
    std::string leader;
    tester.checkOneLeader(leader);
    auto last = writeMany(tester, WRITE_COUNT);
    ASSERT_TRUE(tester.waitForApplied(last));
    ASSERT_TRUE(tester.waitFor([&tester, &leader]
                               { return lastPurgedIndex(tester.node(leader)).has_value(); }));

    tester.addNode("D");
    auto added = tester.node(leader).server->addLearner(raftkit::Peer {.id = "D", .address = "D"});
    ASSERT_TRUE(added.has_value()) << fmt::format("{}", added.error());
    ASSERT_TRUE(tester.waitForApplied("D", added->index));

    auto& learner = tester.node("D");
    EXPECT_GT(learner.stateMachine->snapshotsInstalled(), 0u);
    EXPECT_EQ(learner.stateMachine->get("key0"), "value0");
    auto status = learner.server->getStatus();
    ASSERT_TRUE(status.has_value());
    EXPECT_TRUE(status->membership.isLearner("D"));
}

TEST(SnapshotTest, ClusterRestartsOnTopOfSnapshots)
{
    ServerTester tester({"A", "B", "C"}, compactingOptions());
    std::string leader;
    tester.checkOneLeader(leader);
    auto last = writeMany(tester, WRITE_COUNT);
    ASSERT_TRUE(tester.waitForApplied(last));
    ASSERT_TRUE(tester.waitFor(
        [&tester]
        {
            for (auto& node : tester.servers)
            {
                if (!lastPurgedIndex(node))
                {
                    return false;
                }
            }
            return true;
        }));

    std::vector<std::string> ids;
    for (auto& node : tester.servers)
    {
        ids.push_back(node.id);
    }
    for (const auto& id : ids)
    {
        tester.crash(id);
    }
    for (const auto& id : ids)
    {
        tester.restart(id);
    }

    tester.checkOneLeader(leader);
    auto result = tester.write("key0", "rewritten");
    ASSERT_TRUE(result.has_value()) << fmt::format("{}", result.error());
    EXPECT_EQ(raftkit::testing::toString(result->response), "value0");
    ASSERT_TRUE(tester.waitForApplied(result->logId.index));
    EXPECT_TRUE(valuesMatch(tester));
}

TEST(SnapshotTest, SnapshotFailureFaultsTheNode)
{
    ServerTester tester({"A", "B", "C"}, compactingOptions());
    std::string leader;
    tester.checkOneLeader(leader);
    std::string follower = leader == "A" ? "B" : "A";
    tester.node(follower).stateMachine->setFailSnapshot(true);

    writeMany(tester, WRITE_COUNT);
    ASSERT_TRUE(tester.waitFor(
        [&tester, &follower]
        {
            auto result = tester.node(follower).server->read(toBytes("key0"));
            return !result && std::holds_alternative<raftkit::errors::Faulted>(result.error());
        }))
        << "The follower kept running without its snapshot";

    // The remaining majority keeps serving writes.
    auto result = tester.write("after", "1");
    EXPECT_TRUE(result.has_value()) << fmt::format("{}", result.error());
}
