#include "impl/log.hpp"

#include <gtest/gtest.h>

using raftkit::data::LogEntry;
using raftkit::data::LogId;
using raftkit::impl::Log;

namespace
{
    LogEntry command(uint64_t term, uint64_t index, std::byte value = std::byte {0x01})
    {
        return LogEntry {.logId = {.term = term, .index = index},
                         .payload = raftkit::data::Command {{value}}};
    }

    LogEntry membership(uint64_t term, uint64_t index, std::map<std::string, std::string> nodes)
    {
        return LogEntry {
            .logId = {.term = term, .index = index},
            .payload = raftkit::data::MembershipChange {raftkit::Membership::uniform(nodes)}};
    }

    // Terms 1 1 2 2 2 3 at indices 0 to 5.
    Log sampleLog()
    {
        Log log;
        log.append({command(1, 0),
                    command(1, 1),
                    command(2, 2),
                    command(2, 3),
                    command(2, 4),
                    command(3, 5)});
        return log;
    }
}  // namespace

TEST(LogTest, EmptyLog)
{
    Log log;
    EXPECT_TRUE(log.empty());
    EXPECT_EQ(log.firstIndex(), 0u);
    EXPECT_EQ(log.nextIndex(), 0u);
    EXPECT_EQ(log.lastLogId(), std::nullopt);
    EXPECT_EQ(log.get(0), nullptr);
    // The empty id is contained by every log.
    EXPECT_TRUE(log.contains(std::nullopt));
    EXPECT_FALSE(log.contains(LogId {.term = 1, .index = 0}));
}

TEST(LogTest, AppendAndLookup)
{
    auto log = sampleLog();
    EXPECT_EQ(log.nextIndex(), 6u);
    EXPECT_EQ(log.lastLogId(), (LogId {.term = 3, .index = 5}));
    ASSERT_NE(log.get(3), nullptr);
    EXPECT_EQ(log.get(3)->logId, (LogId {.term = 2, .index = 3}));
    EXPECT_EQ(log.logIdAt(6), std::nullopt);
    EXPECT_TRUE(log.contains(LogId {.term = 2, .index = 4}));
    EXPECT_FALSE(log.contains(LogId {.term = 3, .index = 4}));
    EXPECT_FALSE(log.contains(LogId {.term = 3, .index = 6}));
}

TEST(LogTest, AppendRejectsGap)
{
    auto log = sampleLog();
    log.append(command(3, 8));
    EXPECT_EQ(log.nextIndex(), 6u);
}

TEST(LogTest, RangeIsBounded)
{
    auto log = sampleLog();
    auto entries = log.range(2, 3);
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries.front().logId.index, 2u);
    EXPECT_EQ(entries.back().logId.index, 4u);
    EXPECT_EQ(log.range(4, 10).size(), 2u);
    EXPECT_TRUE(log.range(6, 10).empty());
}

TEST(LogTest, TruncateAfter)
{
    auto log = sampleLog();
    auto bytes = log.bytes();
    log.truncateAfter(2);
    EXPECT_EQ(log.lastLogId(), (LogId {.term = 2, .index = 2}));
    EXPECT_LT(log.bytes(), bytes);

    log.truncateAfter(std::nullopt);
    EXPECT_TRUE(log.empty());
    EXPECT_EQ(log.bytes(), 0u);
}

TEST(LogTest, PurgeKeepsBoundary)
{
    auto log = sampleLog();
    log.purge(LogId {.term = 2, .index = 3});
    EXPECT_EQ(log.firstIndex(), 4u);
    EXPECT_EQ(log.lastPurged(), (LogId {.term = 2, .index = 3}));
    EXPECT_EQ(log.get(3), nullptr);
    EXPECT_EQ(log.logIdAt(3), (LogId {.term = 2, .index = 3}));
    // Everything before the boundary was committed and is treated as contained.
    EXPECT_TRUE(log.contains(LogId {.term = 1, .index = 1}));
    EXPECT_TRUE(log.contains(LogId {.term = 2, .index = 3}));
    EXPECT_EQ(log.range(2, 10).size(), 0u);

    // Purged entries survive a truncation request.
    log.truncateAfter(std::nullopt);
    EXPECT_EQ(log.firstIndex(), 4u);
    EXPECT_EQ(log.lastLogId(), (LogId {.term = 2, .index = 3}));
}

TEST(LogTest, PurgeBeyondLastEntry)
{
    auto log = sampleLog();
    log.purge(LogId {.term = 4, .index = 9});
    EXPECT_TRUE(log.empty());
    EXPECT_EQ(log.nextIndex(), 10u);
    EXPECT_EQ(log.lastLogId(), (LogId {.term = 4, .index = 9}));

    // Purging backwards is ignored.
    log.purge(LogId {.term = 1, .index = 1});
    EXPECT_EQ(log.lastPurged(), (LogId {.term = 4, .index = 9}));
}

TEST(LogTest, LastIndexOfTerm)
{
    auto log = sampleLog();
    EXPECT_EQ(log.lastIndexOfTerm(1), 1u);
    EXPECT_EQ(log.lastIndexOfTerm(2), 4u);
    EXPECT_EQ(log.lastIndexOfTerm(3), 5u);
    EXPECT_EQ(log.lastIndexOfTerm(4), std::nullopt);

    log.purge(LogId {.term = 1, .index = 1});
    EXPECT_EQ(log.lastIndexOfTerm(1), 1u);
}

TEST(LogTest, ConflictHintBeyondEnd)
{
    auto log = sampleLog();
    auto hint = log.conflictHint(LogId {.term = 3, .index = 9});
    EXPECT_EQ(hint.term, std::nullopt);
    EXPECT_EQ(hint.index, 6u);
}

TEST(LogTest, ConflictHintPointsToFirstIndexOfTerm)
{
    auto log = sampleLog();
    // The follower has term 2 at index 4, the leader expected term 3.
    auto hint = log.conflictHint(LogId {.term = 3, .index = 4});
    EXPECT_EQ(hint.term, 2u);
    EXPECT_EQ(hint.index, 2u);
}

TEST(LogTest, ConflictHintStopsAtPurgeBoundary)
{
    auto log = sampleLog();
    log.purge(LogId {.term = 2, .index = 2});
    auto hint = log.conflictHint(LogId {.term = 3, .index = 4});
    EXPECT_EQ(hint.term, 2u);
    EXPECT_EQ(hint.index, 3u);
}

TEST(LogTest, LastMembership)
{
    Log log;
    log.append({command(1, 0),
                membership(1, 1, {{"A", "a"}, {"B", "b"}}),
                command(1, 2),
                membership(2, 3, {{"A", "a"}}),
                command(2, 4)});

    auto last = log.lastMembership();
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(last->logId, (LogId {.term = 2, .index = 3}));
    EXPECT_EQ(last->membership.voterIDs(), (std::set<std::string> {"A"}));

    auto atTwo = log.lastMembershipAtOrBefore(2);
    ASSERT_TRUE(atTwo.has_value());
    EXPECT_EQ(atTwo->logId, (LogId {.term = 1, .index = 1}));

    EXPECT_EQ(log.lastMembershipAtOrBefore(0), std::nullopt);

    // Truncating a membership entry falls back to the previous one.
    log.truncateAfter(2);
    EXPECT_EQ(log.lastMembership()->logId, (LogId {.term = 1, .index = 1}));
}

TEST(LogTest, ResetReplacesEverything)
{
    auto log = sampleLog();
    log.reset(LogId {.term = 5, .index = 20}, {command(5, 21), command(6, 22)});
    EXPECT_EQ(log.firstIndex(), 21u);
    EXPECT_EQ(log.lastLogId(), (LogId {.term = 6, .index = 22}));
    EXPECT_EQ(log.get(5), nullptr);
}
