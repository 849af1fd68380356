#include <atomic>
#include <future>
#include <map>
#include <thread>

#include <fmt/format.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "mocks/client.hpp"
#include "mocks/kv_state_machine.hpp"
#include "raftkit/fmt/errors.hpp"
#include "raftkit/inmemory/log_store.hpp"
#include "raftkit/server.hpp"
#include "server_tester.hpp"

using raftkit::data::LogEntry;
using raftkit::data::LogId;
using raftkit::testing::KVStateMachine;
using raftkit::testing::MockClientFactory;
using raftkit::testing::ServerTester;
using raftkit::testing::toBytes;

namespace
{
    LogEntry command(uint64_t term, uint64_t index, const std::string& text)
    {
        return LogEntry {.logId = {.term = term, .index = index},
                         .payload = raftkit::data::Command {toBytes(text)}};
    }

    LogEntry blank(uint64_t term, uint64_t index)
    {
        return LogEntry {.logId = {.term = term, .index = index}, .payload = raftkit::data::Blank {}};
    }
}  // namespace

// A single server whose peers are gmock clients, driven directly through its RPC handlers.
class ServerCoreTest : public ::testing::Test
{
  protected:
    void TearDown() override
    {
        if (server_)
        {
            server_->shutdown();
        }
    }

    void start(const std::string& id, raftkit::Options options)
    {
        std::vector<raftkit::Peer> peers;
        for (const auto* peer : {"A", "B", "C"})
        {
            if (peer != id)
            {
                peers.push_back(raftkit::Peer {.id = peer, .address = peer});
            }
        }
        raftkit::ServerCreateConfig config {
            .id = id,
            .address = id,
            .peers = peers,
            .clientFactory = clients_,
            .logStore = logStore_,
            .stateMachine = stateMachine_,
            .options = options,
            .threadCount = 2,
        };
        auto server = raftkit::createServer(config);
        ASSERT_TRUE(server.has_value()) << fmt::format("{}", server.error());
        server_ = *server;
        auto started = server_->start();
        ASSERT_TRUE(started.has_value()) << fmt::format("{}", started.error());
    }

    // A follower that never times out, so only the requests of the test move it.
    void startFollower()
    {
        auto options = ServerTester::defaultOptions();
        options.electionTimeout = {.min = 30000, .max = 40000};
        start("B", options);
    }

    tl::expected<raftkit::data::AppendEntriesResponse, raftkit::Error> appendEntries(
        raftkit::data::AppendEntriesRequest request)
    {
        std::promise<tl::expected<raftkit::data::AppendEntriesResponse, raftkit::Error>> promise;
        auto future = promise.get_future();
        server_->handleAppendEntries(
            request,
            [&promise](tl::expected<raftkit::data::AppendEntriesResponse, raftkit::Error> result)
            { promise.set_value(std::move(result)); });
        if (future.wait_for(ServerTester::COMMIT_WAIT_PERIOD) != std::future_status::ready)
        {
            return tl::make_unexpected(raftkit::errors::Timeout {});
        }
        return future.get();
    }

    tl::expected<raftkit::data::InstallSnapshotResponse, raftkit::Error> installSnapshot(
        raftkit::data::InstallSnapshotRequest request)
    {
        std::promise<tl::expected<raftkit::data::InstallSnapshotResponse, raftkit::Error>> promise;
        auto future = promise.get_future();
        server_->handleInstallSnapshot(
            request,
            [&promise](tl::expected<raftkit::data::InstallSnapshotResponse, raftkit::Error> result)
            { promise.set_value(std::move(result)); });
        if (future.wait_for(ServerTester::COMMIT_WAIT_PERIOD) != std::future_status::ready)
        {
            return tl::make_unexpected(raftkit::errors::Timeout {});
        }
        return future.get();
    }

    bool waitForApplied(uint64_t index)
    {
        return ServerTester::waitFor(
            [this, index]
            {
                auto status = server_->getStatus();
                return status && status->lastApplied && *status->lastApplied >= index;
            });
    }

    std::vector<LogEntry> storedLog()
    {
        auto entries = logStore_->getEntries(0, 100);
        EXPECT_TRUE(entries.has_value());
        return entries.value_or(std::vector<LogEntry> {});
    }

    std::shared_ptr<MockClientFactory> clients_ = std::make_shared<MockClientFactory>();
    std::shared_ptr<raftkit::inmemory::LogStore> logStore_ = raftkit::inmemory::createLogStore();
    std::shared_ptr<KVStateMachine> stateMachine_ = std::make_shared<KVStateMachine>();
    std::shared_ptr<raftkit::Server> server_;
};

TEST_F(ServerCoreTest, EarlierTermEntryCommitsOnlyThroughCurrentTermEntry)
{
    // A crashed in term 2 after storing an entry that never reached a quorum.
    raftkit::LogTransaction transaction;
    transaction.setHardState({.currentTerm = 2});
    transaction.append({blank(1, 0), command(2, 1, "old=1")});
    ASSERT_TRUE(logStore_->apply(transaction).has_value());

    // Both peers grant every vote, so A wins term 3. The flags are shared with the mocks, which
    // the server may still call until it is shut down.
    std::map<std::string, std::shared_ptr<std::atomic<bool>>> holdsOldEntry;
    auto acceptCurrentTerm = std::make_shared<std::atomic<bool>>(false);
    for (const auto* peer : {"B", "C"})
    {
        auto holdsOld = std::make_shared<std::atomic<bool>>(false);
        holdsOldEntry[peer] = holdsOld;
        auto client = clients_->client(peer);
        ON_CALL(*client, requestVote)
            .WillByDefault(testing::Invoke(
                [](raftkit::data::RequestVoteRequest request,
                   raftkit::RequestConfig,
                   raftkit::ResponseCallback<raftkit::data::RequestVoteResponse> callback)
                {
                    callback(raftkit::data::RequestVoteResponse {
                        .term = request.isPreVote ? 2 : request.term,
                        .voteGranted = true,
                        .isPreVote = request.isPreVote});
                }));
        // The peers only hold the blank at index 0. They accept the term-2 entry but cannot be
        // reached with the term-3 blank until the test allows it.
        ON_CALL(*client, appendEntries)
            .WillByDefault(testing::Invoke(
                [holdsOld, acceptCurrentTerm](
                    raftkit::data::AppendEntriesRequest request,
                    raftkit::RequestConfig,
                    raftkit::ResponseCallback<raftkit::data::AppendEntriesResponse> callback)
                {
                    if (request.prevLogId && request.prevLogId->index >= 1 && !*holdsOld)
                    {
                        callback(raftkit::data::AppendEntriesResponse {
                            .term = request.term,
                            .success = false,
                            .conflict = raftkit::data::ConflictHint {.term = std::nullopt,
                                                                     .index = 1}});
                        return;
                    }
                    for (const auto& entry : request.entries)
                    {
                        if (entry.logId.term == 3 && !*acceptCurrentTerm)
                        {
                            callback(tl::make_unexpected(raftkit::errors::Timeout {}));
                            return;
                        }
                    }
                    for (const auto& entry : request.entries)
                    {
                        if (entry.logId.index == 1)
                        {
                            *holdsOld = true;
                        }
                    }
                    callback(
                        raftkit::data::AppendEntriesResponse {.term = request.term, .success = true});
                }));
    }

    auto options = ServerTester::defaultOptions();
    options.maxEntriesPerAppend = 1;
    start("A", options);

    ASSERT_TRUE(ServerTester::waitFor(
        [this]
        {
            auto status = server_->getStatus();
            return status && status->isLeader;
        }))
        << "A was not elected";
    auto term = server_->getTerm();
    ASSERT_TRUE(term.has_value());
    ASSERT_EQ(*term, 3u);

    ASSERT_TRUE(ServerTester::waitFor([&holdsOldEntry]
                                      { return *holdsOldEntry["B"] && *holdsOldEntry["C"]; }))
        << "The peers never received the term-2 entry";

    // Every node holds index 1, yet it is from an earlier term and stays uncommitted.
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    auto commitIndex = server_->getCommitIndex();
    ASSERT_TRUE(commitIndex.has_value());
    EXPECT_FALSE(commitIndex->has_value() && **commitIndex >= 1)
        << "committed index " << **commitIndex << " before any term-3 entry was replicated";
    EXPECT_TRUE(stateMachine_->commands().empty());

    // Once the term-3 blank reaches the peers, it commits and carries index 1 with it.
    *acceptCurrentTerm = true;
    ASSERT_TRUE(ServerTester::waitFor(
        [this]
        {
            auto commit = server_->getCommitIndex();
            return commit && commit->has_value() && **commit >= 2;
        }))
        << "The term-3 blank never committed";
    ASSERT_TRUE(waitForApplied(2));
    EXPECT_EQ(stateMachine_->commands(), (std::vector<std::string> {"old=1"}));
}

TEST_F(ServerCoreTest, ReplayedAppendEntriesChangeNothing)
{
    startFollower();

    raftkit::data::AppendEntriesRequest first {
        .term = 1,
        .leaderID = "A",
        .prevLogId = std::nullopt,
        .entries = {blank(1, 0), command(1, 1, "x=1"), command(1, 2, "y=2")},
        .leaderCommit = LogId {.term = 1, .index = 2}};
    auto response = appendEntries(first);
    ASSERT_TRUE(response.has_value()) << fmt::format("{}", response.error());
    ASSERT_TRUE(response->success);
    ASSERT_TRUE(waitForApplied(2));
    auto logAfterFirst = storedLog();
    ASSERT_EQ(logAfterFirst.size(), 3u);

    // The same request again.
    response = appendEntries(first);
    ASSERT_TRUE(response.has_value()) << fmt::format("{}", response.error());
    EXPECT_TRUE(response->success);
    EXPECT_EQ(storedLog(), logAfterFirst);
    EXPECT_EQ(server_->getCommitIndex().value(), std::optional<uint64_t>(2));

    raftkit::data::AppendEntriesRequest second {
        .term = 1,
        .leaderID = "A",
        .prevLogId = LogId {.term = 1, .index = 2},
        .entries = {command(1, 3, "z=3")},
        .leaderCommit = LogId {.term = 1, .index = 3}};
    response = appendEntries(second);
    ASSERT_TRUE(response.has_value() && response->success);
    ASSERT_TRUE(waitForApplied(3));
    auto logAfterSecond = storedLog();
    ASSERT_EQ(logAfterSecond.size(), 4u);

    // Older requests delivered after newer ones neither truncate nor move the commit back.
    for (const auto& stale : {first,
                              raftkit::data::AppendEntriesRequest {
                                  .term = 1,
                                  .leaderID = "A",
                                  .prevLogId = LogId {.term = 1, .index = 0},
                                  .entries = {command(1, 1, "x=1")},
                                  .leaderCommit = LogId {.term = 1, .index = 1}}})
    {
        response = appendEntries(stale);
        ASSERT_TRUE(response.has_value()) << fmt::format("{}", response.error());
        EXPECT_TRUE(response->success);
        EXPECT_EQ(storedLog(), logAfterSecond);
        EXPECT_EQ(server_->getCommitIndex().value(), std::optional<uint64_t>(3));
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_EQ(stateMachine_->commands(), (std::vector<std::string> {"x=1", "y=2", "z=3"}));
    EXPECT_FALSE(stateMachine_->appliedOutOfOrder());
}

TEST_F(ServerCoreTest, ReplayedSnapshotIsNotInstalledTwice)
{
    startFollower();

    raftkit::data::InstallSnapshotRequest snapshot {
        .term = 1,
        .leaderID = "A",
        .meta =
            {
                .lastLogId = LogId {.term = 1, .index = 5},
                .lastMembership = {.logId = std::nullopt,
                                   .membership = raftkit::Membership::uniform(
                                       {{"A", "A"}, {"B", "B"}, {"C", "C"}})},
                .snapshotID = "1-5-1",
            },
        .offset = 0,
        .data = toBytes("a=1\nb=2\n"),
        .done = true};
    auto response = installSnapshot(snapshot);
    ASSERT_TRUE(response.has_value()) << fmt::format("{}", response.error());
    EXPECT_EQ(response->term, 1u);
    ASSERT_EQ(stateMachine_->snapshotsInstalled(), 1u);
    EXPECT_EQ(stateMachine_->get("a"), "1");
    EXPECT_EQ(server_->getCommitIndex().value(), std::optional<uint64_t>(5));

    // The whole transfer again, done chunk included.
    response = installSnapshot(snapshot);
    ASSERT_TRUE(response.has_value()) << fmt::format("{}", response.error());
    EXPECT_EQ(stateMachine_->snapshotsInstalled(), 1u);

    // Entries after the snapshot survive a later replay of it.
    auto appended = appendEntries(raftkit::data::AppendEntriesRequest {
        .term = 1,
        .leaderID = "A",
        .prevLogId = LogId {.term = 1, .index = 5},
        .entries = {command(1, 6, "c=3")},
        .leaderCommit = LogId {.term = 1, .index = 6}});
    ASSERT_TRUE(appended.has_value() && appended->success);
    ASSERT_TRUE(waitForApplied(6));

    response = installSnapshot(snapshot);
    ASSERT_TRUE(response.has_value()) << fmt::format("{}", response.error());
    EXPECT_EQ(stateMachine_->snapshotsInstalled(), 1u);
    EXPECT_EQ(stateMachine_->get("c"), "3");
    auto state = logStore_->getLogState();
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->lastLogId, (LogId {.term = 1, .index = 6}));
}
