#include <atomic>
#include <future>
#include <mutex>
#include <numeric>
#include <thread>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "impl/persistence.hpp"
#include "mocks/log_store.hpp"

using raftkit::testing::MockLogStore;

namespace
{
    raftkit::LogTransaction termTransaction(uint64_t term)
    {
        raftkit::LogTransaction transaction;
        transaction.setHardState(raftkit::data::HardState {.currentTerm = term});
        return transaction;
    }

    MATCHER_P(HasTerm, term, "")
    {
        return arg.hardState && arg.hardState->currentTerm == term;
    }
}  // namespace

TEST(PersistenceHandler, AppliesTransaction)
{
    auto store = std::make_shared<MockLogStore>();
    EXPECT_CALL(*store, apply(HasTerm(3u)))
        .Times(1)
        .WillOnce(testing::Return(tl::expected<void, raftkit::Error> {}));

    std::promise<tl::expected<void, raftkit::Error>> promise;
    auto future = promise.get_future();
    raftkit::impl::PersistenceHandler handler {store};
    handler.addRequest(raftkit::impl::PersistenceRequest {
        .transaction = termTransaction(3),
        .callback = [&promise](tl::expected<void, raftkit::Error> result)
        { promise.set_value(result); },
    });

    ASSERT_EQ(future.wait_for(std::chrono::seconds(1)), std::future_status::ready);
    EXPECT_TRUE(future.get().has_value());
}

TEST(PersistenceHandler, EmptyTransactionSkipsStore)
{
    auto store = std::make_shared<MockLogStore>();
    EXPECT_CALL(*store, apply(testing::_)).Times(0);

    std::promise<tl::expected<void, raftkit::Error>> promise;
    auto future = promise.get_future();
    raftkit::impl::PersistenceHandler handler {store};
    handler.addRequest(raftkit::impl::PersistenceRequest {
        .transaction = {},
        .callback = [&promise](tl::expected<void, raftkit::Error> result)
        { promise.set_value(result); },
    });

    ASSERT_EQ(future.wait_for(std::chrono::seconds(1)), std::future_status::ready);
    EXPECT_TRUE(future.get().has_value());
}

TEST(PersistenceHandler, ReportsFailure)
{
    auto store = std::make_shared<MockLogStore>();
    EXPECT_CALL(*store, apply(testing::_))
        .WillOnce(testing::Return(tl::expected<void, raftkit::Error> {
            tl::make_unexpected(raftkit::errors::PersistenceFailed {"disk full"})}));

    std::promise<tl::expected<void, raftkit::Error>> promise;
    auto future = promise.get_future();
    raftkit::impl::PersistenceHandler handler {store};
    handler.addRequest(raftkit::impl::PersistenceRequest {
        .transaction = termTransaction(1),
        .callback = [&promise](tl::expected<void, raftkit::Error> result)
        { promise.set_value(result); },
    });

    ASSERT_EQ(future.wait_for(std::chrono::seconds(1)), std::future_status::ready);
    auto result = future.get();
    ASSERT_FALSE(result.has_value());
    ASSERT_TRUE(std::holds_alternative<raftkit::errors::PersistenceFailed>(result.error()));
    EXPECT_EQ(std::get<raftkit::errors::PersistenceFailed>(result.error()).message, "disk full");
}

TEST(PersistenceHandler, AppliesInSubmissionOrder)
{
    auto store = std::make_shared<MockLogStore>();
    std::vector<uint64_t> applied;
    std::mutex mutex;
    EXPECT_CALL(*store, apply(testing::_))
        .Times(20)
        .WillRepeatedly(testing::Invoke(
            [&applied, &mutex](const raftkit::LogTransaction& transaction)
            {
                std::lock_guard lock {mutex};
                applied.push_back(transaction.hardState->currentTerm);
                return tl::expected<void, raftkit::Error> {};
            }));

    std::vector<uint64_t> completed;
    {
        raftkit::impl::PersistenceHandler handler {store};
        for (uint64_t term = 0; term < 20; term++)
        {
            handler.addRequest(raftkit::impl::PersistenceRequest {
                .transaction = termTransaction(term),
                // Callbacks run on the handler thread one at a time.
                .callback = [&completed, term](tl::expected<void, raftkit::Error>)
                { completed.push_back(term); },
            });
        }
        // Requests queued before destruction are still applied.
    }

    std::vector<uint64_t> expected(20);
    std::iota(expected.begin(), expected.end(), 0);
    EXPECT_EQ(applied, expected);
    EXPECT_EQ(completed, expected);
}

TEST(PersistenceHandler, ConcurrentRequests)
{
    auto store = std::make_shared<MockLogStore>();
    EXPECT_CALL(*store, apply(testing::_))
        .Times(50)
        .WillRepeatedly(testing::Return(tl::expected<void, raftkit::Error> {}));

    std::atomic<int> totalCallbacks {0};
    {
        raftkit::impl::PersistenceHandler handler {store};

        std::vector<std::thread> threads;
        const int numThreads = 5;
        const int requestsPerThread = 10;
        for (int t = 0; t < numThreads; ++t)
        {
            threads.emplace_back(
                [&handler, &totalCallbacks, t]()
                {
                    for (int i = 0; i < requestsPerThread; ++i)
                    {
                        handler.addRequest(raftkit::impl::PersistenceRequest {
                            .transaction = termTransaction(static_cast<uint64_t>(t)),
                            .callback = [&totalCallbacks](tl::expected<void, raftkit::Error>)
                            { totalCallbacks++; },
                        });
                    }
                });
        }
        for (auto& thread : threads)
        {
            thread.join();
        }
    }
    EXPECT_EQ(totalCallbacks, 50);
}
