#include "snapshot.hpp"

#include <fmt/core.h>

namespace raftkit::impl
{
    void SnapshotCoordinator::setCurrent(std::shared_ptr<const data::Snapshot> snapshot)
    {
        current_ = std::move(snapshot);
    }

    std::optional<data::LogId> SnapshotCoordinator::lastIncluded() const
    {
        if (current_ == nullptr)
        {
            return std::nullopt;
        }
        return current_->meta.lastLogId;
    }

    bool SnapshotCoordinator::shouldBuild(const std::optional<data::LogId>& lastApplied,
                                          size_t logBytes,
                                          const Options& options) const
    {
        if (building_ || !lastApplied)
        {
            return false;
        }
        auto included = lastIncluded();
        if (included && included->index >= lastApplied->index)
        {
            return false;
        }
        uint64_t sinceSnapshot = included ? lastApplied->index - included->index
                                          : lastApplied->index + 1;
        if (sinceSnapshot >= options.snapshotLogThreshold)
        {
            return true;
        }
        return options.snapshotMaxLogBytes > 0 && logBytes > options.snapshotMaxLogBytes;
    }

    std::optional<uint64_t> SnapshotCoordinator::purgeIndex(const data::LogId& lastIncluded,
                                                            uint64_t logsToKeep)
    {
        if (lastIncluded.index < logsToKeep)
        {
            return std::nullopt;
        }
        return lastIncluded.index - logsToKeep;
    }

    tl::expected<std::optional<data::Snapshot>, Error> SnapshotCoordinator::receive(
        const data::InstallSnapshotRequest& request)
    {
        const auto& id = request.meta.snapshotID;
        if (request.offset == 0)
        {
            receiving_ = data::Snapshot {.meta = request.meta, .data = {}};
            lastReceivedID_.reset();
        }
        else if (!receiving_ || receiving_->meta.snapshotID != id)
        {
            if (lastReceivedID_ == id)
            {
                return std::nullopt;
            }
            return tl::make_unexpected(errors::InvalidArgument {
                fmt::format("chunk at offset {} of snapshot {} has no start", request.offset, id)});
        }

        auto& assembled = receiving_->data;
        if (request.offset > assembled.size())
        {
            auto received = assembled.size();
            receiving_.reset();
            return tl::make_unexpected(errors::InvalidArgument {
                fmt::format("gap in snapshot {}: expected offset {} but got {}",
                            id,
                            received,
                            request.offset)});
        }

        // Repeated chunks only contribute the bytes that are new.
        auto overlap = assembled.size() - request.offset;
        if (overlap < request.data.size())
        {
            assembled.insert(assembled.end(),
                             request.data.begin() + static_cast<std::ptrdiff_t>(overlap),
                             request.data.end());
        }
        if (!request.done)
        {
            return std::nullopt;
        }

        auto snapshot = std::move(*receiving_);
        receiving_.reset();
        lastReceivedID_ = id;
        return snapshot;
    }
}  // namespace raftkit::impl
