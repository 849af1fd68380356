#include "replication.hpp"

#include <spdlog/spdlog.h>

#include "raftkit/fmt/data.hpp"
#include "raftkit/fmt/errors.hpp"

namespace raftkit::impl
{
    ReplicationStream::ReplicationStream(std::string leaderID,
                                         std::string target,
                                         std::shared_ptr<Client> client,
                                         ReplicationHost& host,
                                         Strand strand,
                                         const Options& options,
                                         uint64_t nextIndex)
        : leaderID_(std::move(leaderID))
        , target_(std::move(target))
        , client_(std::move(client))
        , host_(host)
        , strand_(std::move(strand))
        , options_(options)
        , nextIndex_(nextIndex)
        , backoff_(options.heartbeatInterval)
        , timer_(strand_)
    {
    }

    void ReplicationStream::start()
    {
        sendNext();
    }

    void ReplicationStream::cancel()
    {
        cancelled_ = true;
        timerGeneration_++;
        timer_.cancel();
    }

    void ReplicationStream::notify()
    {
        if (!inflight_)
        {
            sendNext();
        }
    }

    void ReplicationStream::schedule(uint64_t delay)
    {
        if (cancelled_)
        {
            return;
        }
        auto generation = ++timerGeneration_;
        timer_.expires_after(std::chrono::milliseconds(delay));
        timer_.async_wait(
            [weak = weak_from_this(), generation](asio::error_code ec)
            {
                auto self = weak.lock();
                if (ec || !self || self->cancelled_ || self->timerGeneration_ != generation)
                {
                    return;
                }
                self->sendNext();
            });
    }

    void ReplicationStream::sendNext()
    {
        if (cancelled_ || inflight_)
        {
            return;
        }
        if (!client_)
        {
            schedule(options_.heartbeatInterval);
            return;
        }
        // Any pending heartbeat or retry is superseded by this send.
        timerGeneration_++;
        if (snapshot_ != nullptr || nextIndex_ < host_.log().firstIndex())
        {
            sendSnapshotChunk();
            return;
        }
        sendAppendEntries();
    }

    void ReplicationStream::sendAppendEntries()
    {
        const auto& log = host_.log();
        nextIndex_ = std::min(nextIndex_, log.nextIndex());

        std::optional<data::LogId> prevLogId;
        if (nextIndex_ > 0)
        {
            prevLogId = log.logIdAt(nextIndex_ - 1);
            if (!prevLogId)
            {
                spdlog::error(
                    "[{}] no entry before index {} for {}", leaderID_, nextIndex_, target_);
                schedule(options_.heartbeatInterval);
                return;
            }
        }

        data::AppendEntriesRequest request {
            .term = host_.leaderTerm(),
            .leaderID = leaderID_,
            .prevLogId = prevLogId,
            .entries = log.range(nextIndex_, options_.maxEntriesPerAppend),
            .leaderCommit = host_.committed(),
        };
        spdlog::trace("[{}] sending {} entries after {} to {}",
                      leaderID_,
                      request.entries.size(),
                      request.prevLogId,
                      target_);

        inflight_ = true;
        auto sentAt = Clock::now();
        client_->appendEntries(
            request,
            RequestConfig {.timeout = options_.rpcTimeout},
            [weak = weak_from_this(),
             strand = strand_,
             guard = asio::make_work_guard(strand_),
             request,
             sentAt](tl::expected<data::AppendEntriesResponse, Error> response)
            {
                (void)guard;
                asio::post(strand,
                           [weak, request, sentAt, response = std::move(response)]() mutable
                           {
                               if (auto self = weak.lock())
                               {
                                   self->onAppendEntriesResponse(
                                       request, sentAt, std::move(response));
                               }
                           });
            });
    }

    void ReplicationStream::sendSnapshotChunk()
    {
        auto current = host_.currentSnapshot();
        if (current == nullptr || !current->meta.lastLogId)
        {
            spdlog::debug("[{}] {} needs a snapshot but none exists yet", leaderID_, target_);
            host_.requestSnapshot();
            schedule(options_.heartbeatInterval);
            return;
        }
        if (snapshot_ != current)
        {
            // A newer snapshot replaces a transfer that is still in progress.
            snapshot_ = std::move(current);
            snapshotOffset_ = 0;
        }

        const auto& bytes = snapshot_->data;
        auto offset = std::min<uint64_t>(snapshotOffset_, bytes.size());
        auto length = std::min<uint64_t>(options_.snapshotChunkSize, bytes.size() - offset);

        data::InstallSnapshotRequest request {
            .term = host_.leaderTerm(),
            .leaderID = leaderID_,
            .meta = snapshot_->meta,
            .offset = offset,
            .data = std::vector<std::byte>(bytes.begin() + static_cast<std::ptrdiff_t>(offset),
                                           bytes.begin()
                                               + static_cast<std::ptrdiff_t>(offset + length)),
            .done = offset + length == bytes.size(),
        };
        spdlog::trace("[{}] sending snapshot {} chunk at {} to {}",
                      leaderID_,
                      request.meta.snapshotID,
                      offset,
                      target_);

        inflight_ = true;
        auto sentAt = Clock::now();
        client_->installSnapshot(
            request,
            RequestConfig {.timeout = options_.rpcTimeout},
            [weak = weak_from_this(),
             strand = strand_,
             guard = asio::make_work_guard(strand_),
             request,
             sentAt](tl::expected<data::InstallSnapshotResponse, Error> response)
            {
                (void)guard;
                asio::post(strand,
                           [weak, request, sentAt, response = std::move(response)]() mutable
                           {
                               if (auto self = weak.lock())
                               {
                                   self->onInstallSnapshotResponse(
                                       request, sentAt, std::move(response));
                               }
                           });
            });
    }

    void ReplicationStream::onAppendEntriesResponse(
        const data::AppendEntriesRequest& request,
        Clock::time_point sentAt,
        tl::expected<data::AppendEntriesResponse, Error> response)
    {
        inflight_ = false;
        if (cancelled_)
        {
            return;
        }
        if (!response)
        {
            onFailure(response.error());
            return;
        }
        if (response->term > request.term)
        {
            host_.onHigherTerm(response->term);
            return;
        }
        acknowledge(sentAt);

        uint64_t sentNextIndex = data::nextIndex(request.prevLogId);
        if (!response->success)
        {
            if (!response->conflict)
            {
                spdlog::error("[{}] {} rejected AppendEntries without a conflict", leaderID_, target_);
                schedule(backoff_);
                return;
            }
            onConflict(*response->conflict, sentNextIndex);
            return;
        }

        backoff_ = options_.heartbeatInterval;
        if (!request.entries.empty() || request.prevLogId)
        {
            uint64_t lastIndex = request.entries.empty() ? request.prevLogId->index
                                                         : request.entries.back().logId.index;
            // Reordered responses never move matched backwards.
            if (!matched_ || lastIndex > *matched_)
            {
                matched_ = lastIndex;
                host_.onReplicationProgress(target_);
            }
            nextIndex_ = std::max(nextIndex_, lastIndex + 1);
        }

        if (cancelled_)
        {
            return;
        }
        if (nextIndex_ < host_.log().nextIndex())
        {
            sendNext();
            return;
        }
        schedule(options_.heartbeatInterval);
    }

    void ReplicationStream::onConflict(const data::ConflictHint& hint, uint64_t sentNextIndex)
    {
        // A stale rejection must not undo progress made by a later response.
        if (sentNextIndex != nextIndex_)
        {
            sendNext();
            return;
        }

        uint64_t candidate = hint.index;
        if (hint.term)
        {
            if (auto last = host_.log().lastIndexOfTerm(*hint.term))
            {
                candidate = *last + 1;
            }
        }
        uint64_t lowest = matched_ ? *matched_ + 1 : 0;
        uint64_t highest = nextIndex_ > 0 ? nextIndex_ - 1 : 0;
        nextIndex_ = std::max(lowest, std::min(candidate, highest));
        spdlog::debug("[{}] log of {} diverges, retrying from index {}", leaderID_, target_, nextIndex_);
        sendNext();
    }

    void ReplicationStream::onInstallSnapshotResponse(
        const data::InstallSnapshotRequest& request,
        Clock::time_point sentAt,
        tl::expected<data::InstallSnapshotResponse, Error> response)
    {
        inflight_ = false;
        if (cancelled_)
        {
            return;
        }
        if (!response)
        {
            onFailure(response.error());
            return;
        }
        if (response->term > request.term)
        {
            host_.onHigherTerm(response->term);
            return;
        }
        acknowledge(sentAt);
        backoff_ = options_.heartbeatInterval;

        if (snapshot_ == nullptr || snapshot_->meta.snapshotID != request.meta.snapshotID)
        {
            sendNext();
            return;
        }
        if (!request.done)
        {
            snapshotOffset_ = request.offset + request.data.size();
            sendNext();
            return;
        }

        auto lastIndex = request.meta.lastLogId->index;
        spdlog::info("[{}] {} installed snapshot {} up to {}",
                     leaderID_,
                     target_,
                     request.meta.snapshotID,
                     request.meta.lastLogId);
        snapshot_.reset();
        snapshotOffset_ = 0;
        nextIndex_ = std::max(nextIndex_, lastIndex + 1);
        if (!matched_ || lastIndex > *matched_)
        {
            matched_ = lastIndex;
            host_.onReplicationProgress(target_);
        }
        if (!cancelled_)
        {
            sendNext();
        }
    }

    void ReplicationStream::onFailure(const Error& error)
    {
        spdlog::debug("[{}] replication to {} failed: {}", leaderID_, target_, error);
        // An interrupted snapshot transfer starts over.
        snapshotOffset_ = 0;
        schedule(backoff_);
        backoff_ = std::min(backoff_ * 2, options_.maxBackoff);
    }

    void ReplicationStream::acknowledge(Clock::time_point sentAt)
    {
        if (!lastAckSendTime_ || sentAt > *lastAckSendTime_)
        {
            lastAckSendTime_ = sentAt;
        }
    }
}  // namespace raftkit::impl
