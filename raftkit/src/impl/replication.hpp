#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <asio.hpp>

#include "log.hpp"
#include "raftkit/client.hpp"
#include "raftkit/data.hpp"
#include "raftkit/options.hpp"

namespace raftkit::impl
{
    using Strand = asio::strand<asio::io_context::executor_type>;
    using Clock = std::chrono::steady_clock;

    // The leader state a replication stream reads and reports to. All calls are made on the core
    // strand.
    class ReplicationHost
    {
      public:
        virtual ~ReplicationHost() = default;

        [[nodiscard]] virtual const Log& log() const = 0;
        [[nodiscard]] virtual uint64_t leaderTerm() const = 0;
        [[nodiscard]] virtual std::optional<data::LogId> committed() const = 0;
        [[nodiscard]] virtual std::shared_ptr<const data::Snapshot> currentSnapshot() const = 0;

        // Asks for a snapshot to be built because the stream needs one and none exists.
        virtual void requestSnapshot() = 0;
        // Called whenever the target acknowledged more of the log.
        virtual void onReplicationProgress(const std::string& target) = 0;
        // Called when the target answered with a greater term.
        virtual void onHigherTerm(uint64_t term) = 0;
    };

    // Replicates the leader's log to a single follower or learner. Runs on the core strand and
    // keeps its own timer, so that a slow target never delays the others.
    class ReplicationStream : public std::enable_shared_from_this<ReplicationStream>
    {
      public:
        ReplicationStream(std::string leaderID,
                          std::string target,
                          std::shared_ptr<Client> client,
                          ReplicationHost& host,
                          Strand strand,
                          const Options& options,
                          uint64_t nextIndex);

        ReplicationStream(const ReplicationStream&) = delete;
        ReplicationStream& operator=(const ReplicationStream&) = delete;

        // Sends the first request.
        void start();
        // Stops the stream. Completions that arrive afterwards are dropped.
        void cancel();
        // Sends at once if no request is in flight. Used when new entries are appended or the
        // commit index moves.
        void notify();

        void setClient(std::shared_ptr<Client> client) { client_ = std::move(client); }

        [[nodiscard]] const std::string& target() const { return target_; }
        [[nodiscard]] std::optional<uint64_t> matched() const { return matched_; }
        [[nodiscard]] uint64_t nextIndex() const { return nextIndex_; }
        [[nodiscard]] bool sendingSnapshot() const { return snapshot_ != nullptr; }

        // The send time of the latest request the target acknowledged in this term.
        [[nodiscard]] std::optional<Clock::time_point> lastAckSendTime() const
        {
            return lastAckSendTime_;
        }

      private:
        void sendNext();
        void sendAppendEntries();
        void sendSnapshotChunk();

        void onAppendEntriesResponse(const data::AppendEntriesRequest& request,
                                     Clock::time_point sentAt,
                                     tl::expected<data::AppendEntriesResponse, Error> response);
        void onInstallSnapshotResponse(const data::InstallSnapshotRequest& request,
                                       Clock::time_point sentAt,
                                       tl::expected<data::InstallSnapshotResponse, Error> response);
        void onConflict(const data::ConflictHint& hint, uint64_t sentNextIndex);
        void onFailure(const Error& error);
        void acknowledge(Clock::time_point sentAt);

        // Waits for delay, then calls sendNext.
        void schedule(uint64_t delay);

        std::string leaderID_;
        std::string target_;
        std::shared_ptr<Client> client_;
        ReplicationHost& host_;
        Strand strand_;
        const Options& options_;

        std::optional<uint64_t> matched_;
        uint64_t nextIndex_;
        bool inflight_ = false;
        bool cancelled_ = false;
        uint64_t backoff_;
        std::optional<Clock::time_point> lastAckSendTime_;

        // The snapshot being transferred and the offset of the next chunk.
        std::shared_ptr<const data::Snapshot> snapshot_;
        uint64_t snapshotOffset_ = 0;

        asio::steady_timer timer_;
        // Incremented on every schedule so that a timer that already fired is ignored.
        uint64_t timerGeneration_ = 0;
    };
}  // namespace raftkit::impl
