#include <future>
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
    // Whether every running node has applied a final membership with exactly these voters.
    bool membershipReached(ServerTester& tester, const std::set<std::string>& voters)
    {
        for (auto& node : tester.servers)
        {
            if (!node.running())
            {
                continue;
            }
            auto status = node.server->getStatus();
            if (!status || status->membership.isJoint() || status->membership.voterIDs() != voters)
            {
                return false;
            }
        }
        return true;
    }
}  // namespace

TEST(ReconfigurationTest, GrowFromThreeToFiveVoters)
{
    ServerTester tester({"A", "B", "C"});
    std::string leader;
    tester.checkOneLeader(leader);
    auto before = tester.write("before", "1");
    ASSERT_TRUE(before.has_value()) << fmt::format("{}", before.error());

    tester.addNode("D");
    tester.addNode("E");
    auto& server = *tester.node(leader).server;
    for (const auto* id : {"D", "E"})
    {
        auto added = server.addLearner(raftkit::Peer {.id = id, .address = id});
        ASSERT_TRUE(added.has_value()) << fmt::format("adding {}: {}", id, added.error());
        ASSERT_TRUE(tester.waitForApplied(id, added->index)) << id << " did not catch up";
    }
    auto learners = server.getStatus();
    ASSERT_TRUE(learners.has_value());
    EXPECT_EQ(learners->membership.learnerIDs(), (std::set<std::string> {"D", "E"}));

    std::set<std::string> voters {"A", "B", "C", "D", "E"};
    auto changed = server.changeMembership(voters);
    ASSERT_TRUE(changed.has_value()) << fmt::format("{}", changed.error());
    ASSERT_TRUE(tester.waitFor([&tester, &voters] { return membershipReached(tester, voters); }))
        << "Not every node adopted the new membership";

    // The new voters hold the whole history and take part in commits.
    EXPECT_EQ(tester.node("E").stateMachine->get("before"), "1");
    auto after = tester.write("after", "2");
    ASSERT_TRUE(after.has_value()) << fmt::format("{}", after.error());
    ASSERT_TRUE(tester.waitForApplied(after->logId.index));

    // Three of five voters still form a quorum.
    auto current = tester.currentLeader();
    ASSERT_TRUE(current.has_value());
    int detached = 0;
    for (auto& node : tester.servers)
    {
        if (node.id != *current && detached < 2)
        {
            ASSERT_TRUE(tester.manager->detachNetwork(node.id).has_value());
            detached++;
        }
    }
    auto degraded = tester.node(*current).server->write(toBytes("degraded=1"));
    EXPECT_TRUE(degraded.has_value()) << fmt::format("{}", degraded.error());
}

TEST(ReconfigurationTest, RemovingTheLeaderMakesItStepDown)
{
    ServerTester tester({"A", "B", "C"});
    std::string leader;
    tester.checkOneLeader(leader);

    std::set<std::string> remaining;
    for (auto& node : tester.servers)
    {
        if (node.id != leader)
        {
            remaining.insert(node.id);
        }
    }
    auto changed = tester.node(leader).server->changeMembership(remaining);
    ASSERT_TRUE(changed.has_value()) << fmt::format("{}", changed.error());

    ASSERT_TRUE(tester.waitFor(
        [&tester, &leader]
        {
            auto status = tester.node(leader).server->getStatus();
            return status && !status->isLeader;
        }))
        << "Removed leader did not step down";

    std::string newLeader;
    ASSERT_TRUE(tester.waitFor(
        [&tester, &leader, &newLeader]
        {
            auto current = tester.currentLeader();
            if (current && *current != leader)
            {
                newLeader = *current;
                return true;
            }
            return false;
        }))
        << "The remaining voters did not elect a leader";
    EXPECT_TRUE(remaining.contains(newLeader));

    auto result = tester.node(newLeader).server->write(toBytes("k=v"));
    ASSERT_TRUE(result.has_value()) << fmt::format("{}", result.error());

    // The removed node no longer campaigns.
    std::this_thread::sleep_for(std::chrono::milliseconds(ServerTester::MAX_ELECTION_TIMEOUT * 2));
    auto removed = tester.node(leader).server->getStatus();
    ASSERT_TRUE(removed.has_value());
    EXPECT_FALSE(removed->isLeader);
    EXPECT_NE(removed->role, raftkit::Role::Candidate);
}

TEST(ReconfigurationTest, OneChangeAtATime)
{
    ServerTester tester({"A", "B", "C"});
    std::string leader;
    tester.checkOneLeader(leader);
    auto& server = *tester.node(leader).server;

    // Keep the change from committing so that it stays in flight.
    for (auto& node : tester.servers)
    {
        if (node.id != leader)
        {
            ASSERT_TRUE(tester.manager->detachNetwork(node.id).has_value());
        }
    }

    using ChangePromise = std::promise<tl::expected<raftkit::data::LogId, raftkit::Error>>;
    auto promise = std::make_shared<ChangePromise>();
    auto future = promise->get_future();
    std::set<std::string> voters;
    for (auto& node : tester.servers)
    {
        voters.insert(node.id);
    }
    voters.erase(leader == "A" ? "B" : "A");
    server.changeMembership(voters,
                            [promise](tl::expected<raftkit::data::LogId, raftkit::Error> result)
                            { promise->set_value(std::move(result)); });

    auto second = server.changeMembership({leader});
    ASSERT_FALSE(second.has_value());
    EXPECT_TRUE(std::holds_alternative<raftkit::errors::ChangeInProgress>(second.error()))
        << fmt::format("{}", second.error());
    auto learner = server.addLearner(raftkit::Peer {.id = "Z", .address = "Z"});
    ASSERT_FALSE(learner.has_value());
    EXPECT_TRUE(std::holds_alternative<raftkit::errors::ChangeInProgress>(learner.error()));

    // Once the quorum is back the first change completes.
    for (auto& node : tester.servers)
    {
        if (node.id != leader)
        {
            ASSERT_TRUE(tester.manager->attachNetwork(node.id).has_value());
        }
    }
    ASSERT_EQ(future.wait_for(ServerTester::COMMIT_WAIT_PERIOD), std::future_status::ready);
    auto result = future.get();
    ASSERT_TRUE(result.has_value()) << fmt::format("{}", result.error());
    ASSERT_TRUE(tester.waitFor([&tester, &voters] { return membershipReached(tester, voters); }));
}

TEST(ReconfigurationTest, RejectsUnknownVoters)
{
    ServerTester tester({"A", "B", "C"});
    std::string leader;
    tester.checkOneLeader(leader);

    auto result = tester.node(leader).server->changeMembership({"A", "B", "C", "X"});
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(std::holds_alternative<raftkit::errors::InvalidArgument>(result.error()))
        << fmt::format("{}", result.error());

    auto empty = tester.node(leader).server->changeMembership({});
    ASSERT_FALSE(empty.has_value());
    EXPECT_TRUE(std::holds_alternative<raftkit::errors::InvalidArgument>(empty.error()));

    // A rejected change leaves the membership untouched.
    auto status = tester.node(leader).server->getStatus();
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->membership.voterIDs(), (std::set<std::string> {"A", "B", "C"}));
}

TEST(ReconfigurationTest, FollowerRejectsChanges)
{
    ServerTester tester({"A", "B", "C"});
    std::string leader;
    tester.checkOneLeader(leader);
    std::string follower = leader == "A" ? "B" : "A";

    auto result = tester.node(follower).server->addLearner(raftkit::Peer {.id = "D", .address = "D"});
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(std::holds_alternative<raftkit::errors::NotLeader>(result.error()));
}
