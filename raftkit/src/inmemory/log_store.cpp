#include "raftkit/inmemory/log_store.hpp"

#include <algorithm>
#include <map>
#include <mutex>

namespace raftkit::inmemory
{
    namespace
    {
        class LogStoreImpl final : public LogStore
        {
          public:
            tl::expected<std::optional<data::HardState>, Error> readHardState() override
            {
                std::lock_guard lock {mutex_};
                return hardState_;
            }

            tl::expected<LogState, Error> getLogState() override
            {
                std::lock_guard lock {mutex_};
                LogState state {.lastPurged = lastPurged_, .lastLogId = lastPurged_};
                if (!entries_.empty())
                {
                    state.lastLogId = entries_.rbegin()->second.logId;
                }
                return state;
            }

            tl::expected<std::vector<data::LogEntry>, Error> getEntries(uint64_t first,
                                                                       uint64_t last) override
            {
                std::lock_guard lock {mutex_};
                std::vector<data::LogEntry> entries;
                for (auto it = entries_.lower_bound(first); it != entries_.end() && it->first <= last;
                     ++it)
                {
                    entries.push_back(it->second);
                }
                return entries;
            }

            tl::expected<std::optional<data::LogEntry>, Error> getEntry(uint64_t index) override
            {
                std::lock_guard lock {mutex_};
                auto it = entries_.find(index);
                if (it == entries_.end())
                {
                    return std::nullopt;
                }
                return it->second;
            }

            tl::expected<void, Error> apply(LogTransaction const& transaction) override
            {
                std::lock_guard lock {mutex_};
                if (failWrites_)
                {
                    return tl::make_unexpected(
                        errors::PersistenceFailed {.message = "injected write failure"});
                }

                // Validate before changing anything so that a failed transaction leaves no trace.
                auto next = data::nextIndex(lastPurged_);
                if (!entries_.empty())
                {
                    next = entries_.rbegin()->first + 1;
                }
                if (transaction.truncate)
                {
                    next = std::max(data::nextIndex(lastPurged_),
                                    std::min(next, transaction.truncateAfter
                                                       ? *transaction.truncateAfter + 1
                                                       : uint64_t {0}));
                }
                for (const auto& entry : transaction.entries)
                {
                    if (entry.logId.index != next)
                    {
                        return tl::make_unexpected(errors::PersistenceFailed {
                            .message = "appended entries are not contiguous with the log"});
                    }
                    next++;
                }

                if (transaction.hardState)
                {
                    hardState_ = transaction.hardState;
                }
                if (transaction.truncate)
                {
                    auto from = transaction.truncateAfter ? *transaction.truncateAfter + 1 : 0;
                    entries_.erase(entries_.lower_bound(from), entries_.end());
                }
                for (const auto& entry : transaction.entries)
                {
                    entries_[entry.logId.index] = entry;
                }
                if (transaction.purgeUpTo && lastPurged_ < transaction.purgeUpTo)
                {
                    entries_.erase(entries_.begin(),
                                   entries_.upper_bound(transaction.purgeUpTo->index));
                    lastPurged_ = transaction.purgeUpTo;
                }
                transactions_++;
                return {};
            }

            void setFailWrites(bool fail) override
            {
                std::lock_guard lock {mutex_};
                failWrites_ = fail;
            }

            size_t transactionCount() const override
            {
                std::lock_guard lock {mutex_};
                return transactions_;
            }

          private:
            mutable std::mutex mutex_;
            std::optional<data::HardState> hardState_;
            std::map<uint64_t, data::LogEntry> entries_;
            std::optional<data::LogId> lastPurged_;
            bool failWrites_ = false;
            size_t transactions_ = 0;
        };
    }  // namespace

    std::shared_ptr<LogStore> createLogStore()
    {
        return std::make_shared<LogStoreImpl>();
    }
}  // namespace raftkit::inmemory
