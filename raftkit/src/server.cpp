#include "raftkit/server.hpp"

#include <atomic>
#include <future>
#include <mutex>
#include <random>
#include <thread>

#include <asio.hpp>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "impl/election.hpp"
#include "impl/log.hpp"
#include "impl/persistence.hpp"
#include "impl/replication.hpp"
#include "impl/snapshot.hpp"
#include "impl/state.hpp"
#include "raftkit/fmt/data.hpp"
#include "raftkit/fmt/errors.hpp"

namespace raftkit
{
    using impl::Clock;
    using impl::Log;

    namespace
    {
        enum class Lifecycle : uint8_t
        {
            Initialized,
            Running,
            Faulted,
            Stopping,
            Stopped
        };

        struct ClientInfo
        {
            std::shared_ptr<Client> client;
            std::string address;
        };

        struct PendingWrite
        {
            data::LogId logId;
            WriteCallback callback;
            std::unique_ptr<asio::steady_timer> timer;
        };

        struct PendingRead
        {
            // The read is served once this index is applied.
            std::optional<uint64_t> readIndex;
            // Whether readIndex is a barrier that still has to commit.
            bool waitForCommit = false;
            std::vector<std::byte> request;
            ReadCallback callback;
        };

        struct PendingMembershipChange
        {
            MembershipCallback callback;
            // The entry whose commit completes the change. Unset while a joint entry commits.
            std::optional<data::LogId> target;
        };

        // ServerImpl is the implementation of the Raft server. All consensus state is owned by
        // the core strand. State machine calls run in order on the apply strand, and log store
        // transactions run in order on the persistence thread.
        class ServerImpl final
            : public Server
            , public impl::ReplicationHost
        {
          public:
            ServerImpl(std::string id,
                       std::string address,
                       std::shared_ptr<ClientFactory> clientFactory,
                       std::shared_ptr<LogStore> logStore,
                       std::shared_ptr<StateMachine> stateMachine,
                       Options options,
                       std::optional<LeaderChangedCallback> leaderChangedCallback);

            ~ServerImpl() override;

            tl::expected<void, Error> init(const std::vector<Peer>& peers, uint16_t threadCount);

            tl::expected<void, Error> start() override;
            void shutdown() override;

            void handleAppendEntries(
                const data::AppendEntriesRequest& request,
                std::function<void(tl::expected<data::AppendEntriesResponse, Error>)> callback)
                override;

            void handleRequestVote(
                const data::RequestVoteRequest& request,
                std::function<void(tl::expected<data::RequestVoteResponse, Error>)> callback)
                override;

            void handleInstallSnapshot(
                const data::InstallSnapshotRequest& request,
                std::function<void(tl::expected<data::InstallSnapshotResponse, Error>)> callback)
                override;

            [[nodiscard]] tl::expected<Peer, Error> getLeader() const override;

            tl::expected<WriteResult, Error> write(std::vector<std::byte> command) override;
            void write(std::vector<std::byte> command, WriteCallback callback) override;

            tl::expected<std::vector<std::byte>, Error> read(std::vector<std::byte> request) override;
            void read(std::vector<std::byte> request, ReadCallback callback) override;

            tl::expected<data::LogId, Error> changeMembership(std::set<std::string> voters) override;
            void changeMembership(std::set<std::string> voters,
                                  MembershipCallback callback) override;

            tl::expected<data::LogId, Error> addLearner(Peer peer) override;
            void addLearner(Peer peer, MembershipCallback callback) override;

            void setLeaderChangedCallback(LeaderChangedCallback callback) override;
            void clearLeaderChangedCallback() override;

            [[nodiscard]] tl::expected<uint64_t, Error> getTerm() const override;
            [[nodiscard]] tl::expected<std::optional<uint64_t>, Error> getCommitIndex()
                const override;
            [[nodiscard]] std::string getId() const override;
            [[nodiscard]] tl::expected<Status, Error> getStatus() const override;

            // ReplicationHost
            [[nodiscard]] const Log& log() const override { return log_; }
            [[nodiscard]] uint64_t leaderTerm() const override { return term_; }
            [[nodiscard]] std::optional<data::LogId> committed() const override
            {
                return committed_;
            }
            [[nodiscard]] std::shared_ptr<const data::Snapshot> currentSnapshot() const override
            {
                return snapshots_.current();
            }
            void requestSnapshot() override;
            void onReplicationProgress(const std::string& target) override;
            void onHigherTerm(uint64_t term) override;

          private:
            bool shutdownCalled() const
            {
                return lifecycle_ == Lifecycle::Stopped || lifecycle_ == Lifecycle::Stopping;
            }
            // Returns the error every request fails with when the node cannot serve it, if any.
            // Must be called on the strand.
            [[nodiscard]] std::optional<Error> unavailable() const;

            // Runs fn on the strand and blocks for its result.
            template<typename T, typename Fn>
            tl::expected<T, Error> query(Fn fn) const;

            tl::expected<void, Error> loadState(const std::vector<Peer>& peers);

            [[nodiscard]] Role role() const;
            [[nodiscard]] bool isLeader() const
            {
                return std::holds_alternative<LeaderInfo>(state_);
            }
            [[nodiscard]] errors::NotLeader notLeader() const;
            [[nodiscard]] bool leaderLeaseActive() const;

            std::shared_ptr<Client> clientFor(const std::string& id);

            // Resets the election timer and schedules it to run at a newly sampled timeout.
            void scheduleElectionTimeout();
            void cancelElectionTimeout();
            void processElectionTimeout();
            void startPreVote();
            void startElection();
            void sendVoteRequests(const data::RequestVoteRequest& request);
            void onVoteResponse(const std::string& from,
                                const data::RequestVoteRequest& request,
                                tl::expected<data::RequestVoteResponse, Error> response);

            void becomeFollower(uint64_t term, std::optional<std::string> leaderID);
            void becomeLeader();
            void stepDown(const Error& reason);
            void updateLeader(std::optional<std::string> leaderID);

            void processInboundAppendEntries(
                const data::AppendEntriesRequest& request,
                std::function<void(tl::expected<data::AppendEntriesResponse, Error>)> callback);
            void processInboundRequestVote(
                const data::RequestVoteRequest& request,
                std::function<void(tl::expected<data::RequestVoteResponse, Error>)> callback);
            void processInboundInstallSnapshot(
                const data::InstallSnapshotRequest& request,
                std::function<void(tl::expected<data::InstallSnapshotResponse, Error>)> callback);
            // Follows a leader that contacted this node in term. Returns false if the request
            // comes from a stale term.
            bool acceptLeader(uint64_t term, const std::string& leaderID);

            // Appends an entry stamped with the current term and persists it.
            data::LogId appendEntry(data::Payload payload);
            // Sets the effective membership from the log, or from committed state if the log
            // holds no membership entry.
            void refreshMembership();
            void syncStreams();

            void processWrite(std::vector<std::byte> command, WriteCallback callback);
            void processRead(std::vector<std::byte> request, ReadCallback callback);
            void processChangeMembership(std::set<std::string> voters,
                                         MembershipCallback callback);
            void processAddLearner(Peer peer, MembershipCallback callback);
            [[nodiscard]] bool leaseReadAllowed() const;
            void serveReads();

            // Recomputes the commit index from the acknowledgements of the effective membership.
            void advanceCommitIndex();
            void setCommitted(const data::LogId& logId);
            void onCommitAdvanced();
            void dispatchApply();
            void onApplied(std::vector<data::LogId> logIds,
                           tl::expected<std::vector<std::vector<std::byte>>, Error> responses);
            [[nodiscard]] data::StoredMembership membershipAt(uint64_t index) const;

            void maybeBuildSnapshot();
            void onSnapshotBuilt(tl::expected<data::Snapshot, Error> snapshot);
            void installSnapshot(data::Snapshot snapshot,
                                 std::function<void(tl::expected<void, Error>)> callback);

            void invokeLeaderChangedCallback(const std::optional<std::string>& leaderID,
                                             bool isLeader,
                                             bool lostLeadership);

            // postPersist hands a transaction to the persistence handler and runs the callback
            // on the strand once it is durable.
            void postPersist(LogTransaction transaction,
                             std::function<void(tl::expected<void, Error>)> callback);
            void persistHardState(std::function<void()> callback);
            [[nodiscard]] data::HardState hardState() const
            {
                return data::HardState {.currentTerm = term_, .vote = vote_};
            }

            // Moves the node to the faulted state after an unrecoverable storage or state
            // machine failure.
            void fault(const Error& error);
            void failPending(const Error& error);

            std::atomic<Lifecycle> lifecycle_ {Lifecycle::Initialized};
            std::once_flag startFlag_;
            // Protects the leader changed callback.
            mutable std::mutex mutex_;
            mutable asio::io_context io_;
            asio::executor_work_guard<asio::io_context::executor_type> work_;

            std::random_device rng_;
            std::mt19937 gen_ {rng_()};

            // The ID and address. These are constant throughout the lifetime of the server.
            std::string id_;
            std::string address_;
            Options options_;
            std::shared_ptr<ClientFactory> clientFactory_;
            std::map<std::string, ClientInfo> clients_;
            std::shared_ptr<LogStore> logStore_;
            std::shared_ptr<StateMachine> stateMachine_;
            std::optional<LeaderChangedCallback> leaderChangedCallback_;

            uint64_t term_ = 0;
            std::optional<data::Vote> vote_;
            Log log_;
            // The last log id known to be durable.
            std::optional<data::LogId> flushed_;
            std::optional<data::LogId> committed_;
            // The last entry handed to the state machine.
            std::optional<data::LogId> applyDispatched_;
            std::optional<data::LogId> lastApplied_;
            // The effective membership is the latest one in the log, committed or not.
            data::StoredMembership membership_;
            data::StoredMembership committedMembership_;
            impl::SnapshotCoordinator snapshots_;
            uint64_t snapshotCounter_ = 0;

            State state_ = FollowerInfo {};
            std::optional<std::string> leaderID_;
            Clock::time_point lastLeaderContact_;
            std::string faultMessage_;

            std::map<uint64_t, PendingWrite> pendingWrites_;
            std::vector<PendingRead> pendingReads_;
            std::optional<PendingMembershipChange> pendingMembership_;

            mutable impl::Strand strand_;
            impl::Strand applyStrand_;
            std::vector<std::thread> threads_;

            std::unique_ptr<impl::PersistenceHandler> persistenceHandler_;
            std::unique_ptr<asio::steady_timer> electionTimer_;
            uint64_t electionGeneration_ = 0;
        };
    }  // namespace

    ServerImpl::ServerImpl(std::string id,
                           std::string address,
                           std::shared_ptr<ClientFactory> clientFactory,
                           std::shared_ptr<LogStore> logStore,
                           std::shared_ptr<StateMachine> stateMachine,
                           Options options,
                           std::optional<LeaderChangedCallback> leaderChangedCallback)
        : work_(io_.get_executor())
        , id_(std::move(id))
        , address_(std::move(address))
        , options_(options)
        , clientFactory_(std::move(clientFactory))
        , logStore_(std::move(logStore))
        , stateMachine_(std::move(stateMachine))
        , leaderChangedCallback_(std::move(leaderChangedCallback))
        , strand_(io_.get_executor())
        , applyStrand_(io_.get_executor())
    {
    }

    ServerImpl::~ServerImpl()
    {
        shutdown();
    }

    tl::expected<void, Error> ServerImpl::init(const std::vector<Peer>& peers, uint16_t threadCount)
    {
        if (threadCount < 1)
        {
            return tl::make_unexpected(errors::InvalidArgument {"threadCount must be >= 1"});
        }
        if (!clientFactory_ || !logStore_ || !stateMachine_)
        {
            return tl::make_unexpected(errors::InvalidArgument {
                "client factory, log store and state machine are required"});
        }
        if (auto valid = options_.validate(); !valid)
        {
            return tl::make_unexpected(valid.error());
        }
        for (const auto& peer : peers)
        {
            if (peer.id == id_)
            {
                return tl::make_unexpected(
                    errors::InvalidArgument {fmt::format("peer list contains self: {}", id_)});
            }
        }
        if (auto result = loadState(peers); !result)
        {
            return tl::make_unexpected(result.error());
        }

        persistenceHandler_ = std::make_unique<impl::PersistenceHandler>(logStore_);
        electionTimer_ = std::make_unique<asio::steady_timer>(strand_);

        // Start the asio threads here, even though Raft consensus has not started yet. This is so
        // that we can handle simple requests like getTerm and getStatus immediately.
        for (uint16_t i = 0; i < threadCount; i++)
        {
            threads_.emplace_back([this] { io_.run(); });
        }
        return {};
    }

    tl::expected<void, Error> ServerImpl::loadState(const std::vector<Peer>& peers)
    {
        auto hardState = logStore_->readHardState();
        if (!hardState)
        {
            return tl::make_unexpected(hardState.error());
        }
        if (*hardState)
        {
            term_ = (*hardState)->currentTerm;
            vote_ = (*hardState)->vote;
        }

        auto logState = logStore_->getLogState();
        if (!logState)
        {
            return tl::make_unexpected(logState.error());
        }
        std::vector<data::LogEntry> entries;
        auto first = data::nextIndex(logState->lastPurged);
        if (logState->lastLogId && logState->lastLogId->index >= first)
        {
            auto stored = logStore_->getEntries(first, logState->lastLogId->index);
            if (!stored)
            {
                return tl::make_unexpected(stored.error());
            }
            entries = std::move(*stored);
        }
        log_.reset(logState->lastPurged, std::move(entries));

        auto snapshot = stateMachine_->getCurrentSnapshot();
        if (!snapshot)
        {
            return tl::make_unexpected(snapshot.error());
        }
        auto applied = stateMachine_->appliedState();
        if (!applied)
        {
            return tl::make_unexpected(applied.error());
        }

        if (*snapshot && (*snapshot)->meta.lastLogId)
        {
            auto snapshotLast = *(*snapshot)->meta.lastLogId;
            // A crash between installing a snapshot and resetting the log leaves a log that does
            // not reach the snapshot. Such a log is discarded.
            if (!log_.contains(snapshotLast) || snapshotLast.index >= log_.nextIndex())
            {
                spdlog::info("[{}] resetting log to start after snapshot {}", id_, snapshotLast);
                LogTransaction transaction;
                transaction.truncateFrom(std::nullopt);
                transaction.purge(snapshotLast);
                if (auto result = logStore_->apply(transaction); !result)
                {
                    return tl::make_unexpected(result.error());
                }
                log_.reset(snapshotLast, {});
            }
            if (applied->lastApplied < snapshotLast)
            {
                spdlog::info("[{}] restoring state machine from snapshot {}",
                             id_,
                             (*snapshot)->meta.snapshotID);
                if (auto result =
                        stateMachine_->installSnapshot((*snapshot)->meta, (*snapshot)->data);
                    !result)
                {
                    return tl::make_unexpected(result.error());
                }
                applied->lastApplied = snapshotLast;
                applied->lastMembership = (*snapshot)->meta.lastMembership;
            }
            snapshots_.setCurrent(std::make_shared<const data::Snapshot>(std::move(**snapshot)));
        }

        if (data::nextIndex(applied->lastApplied) < log_.firstIndex())
        {
            return tl::make_unexpected(errors::PersistenceFailed {
                fmt::format("state machine applied up to {} but the log starts at {}",
                            applied->lastApplied,
                            log_.firstIndex())});
        }
        lastApplied_ = applied->lastApplied;
        applyDispatched_ = lastApplied_;
        committed_ = lastApplied_;
        flushed_ = log_.lastLogId();

        // The bootstrap membership is used only when nothing was ever persisted.
        if (applied->lastMembership.logId || !applied->lastMembership.membership.empty())
        {
            committedMembership_ = applied->lastMembership;
        }
        else if (!peers.empty())
        {
            std::map<std::string, std::string> nodes {{id_, address_}};
            for (const auto& peer : peers)
            {
                nodes.emplace(peer.id, peer.address);
            }
            committedMembership_ =
                data::StoredMembership {.logId = std::nullopt,
                                        .membership = Membership::uniform(std::move(nodes))};
        }
        if (committed_)
        {
            if (auto atCommit = log_.lastMembershipAtOrBefore(committed_->index))
            {
                committedMembership_ = *atCommit;
            }
        }
        refreshMembership();

        spdlog::debug("[{}] loaded term {}, log up to {}, applied {}, membership {}",
                      id_,
                      term_,
                      log_.lastLogId(),
                      lastApplied_,
                      membership_.membership);
        return {};
    }

    void ServerImpl::shutdown()
    {
        if (shutdownCalled())
        {
            return;
        }
        if (lifecycle_ != Lifecycle::Initialized && !threads_.empty())
        {
            std::promise<void> stopped;
            auto future = stopped.get_future();
            asio::post(strand_,
                       [this, &stopped]
                       {
                           lifecycle_ = Lifecycle::Stopping;
                           cancelElectionTimeout();
                           failPending(errors::NotRunning {});
                           if (auto* leaderInfo = std::get_if<LeaderInfo>(&state_))
                           {
                               for (auto& [_, stream] : leaderInfo->streams)
                               {
                                   stream->cancel();
                               }
                           }
                           state_ = FollowerInfo {};
                           stopped.set_value();
                       });
            future.wait();
        }
        lifecycle_ = Lifecycle::Stopping;

        work_.reset();
        for (auto& thread : threads_)
        {
            thread.join();
        }
        threads_.clear();
        persistenceHandler_.reset();
        lifecycle_ = Lifecycle::Stopped;
    }

    tl::expected<void, Error> ServerImpl::start()
    {
        if (shutdownCalled())
        {
            return tl::make_unexpected(errors::NotRunning {});
        }

        std::call_once(startFlag_,
                       [this]
                       {
                           lifecycle_ = Lifecycle::Running;
                           asio::post(strand_,
                                      [this]
                                      {
                                          spdlog::info("[{}] starting as {} in term {}",
                                                       id_,
                                                       role(),
                                                       term_);
                                          scheduleElectionTimeout();
                                          dispatchApply();
                                      });
                       });
        return {};
    }

    std::optional<Error> ServerImpl::unavailable() const
    {
        switch (lifecycle_.load())
        {
            case Lifecycle::Running:
                return std::nullopt;
            case Lifecycle::Faulted:
                return errors::Faulted {faultMessage_};
            default:
                return errors::NotRunning {};
        }
    }

    template<typename T, typename Fn>
    tl::expected<T, Error> ServerImpl::query(Fn fn) const
    {
        auto guard = work_;
        if (shutdownCalled())
        {
            return tl::make_unexpected(errors::NotRunning {});
        }
        std::promise<tl::expected<T, Error>> promise;
        auto future = promise.get_future();
        asio::post(strand_, [&promise, &fn] { promise.set_value(fn()); });
        return future.get();
    }

    Role ServerImpl::role() const
    {
        return std::visit(errors::overloaded {[this](const FollowerInfo&)
                                              {
                                                  return membership_.membership.isVoter(id_)
                                                      ? Role::Follower
                                                      : Role::Learner;
                                              },
                                              [](const PreCandidateInfo&)
                                              { return Role::PreCandidate; },
                                              [](const CandidateInfo&) { return Role::Candidate; },
                                              [](const LeaderInfo&) { return Role::Leader; }},
                          state_);
    }

    errors::NotLeader ServerImpl::notLeader() const
    {
        errors::NotLeader error {.leaderID = leaderID_};
        if (leaderID_)
        {
            error.leaderAddress = membership_.membership.address(*leaderID_);
        }
        return error;
    }

    bool ServerImpl::leaderLeaseActive() const
    {
        if (isLeader())
        {
            return true;
        }
        if (!leaderID_)
        {
            return false;
        }
        return Clock::now() - lastLeaderContact_
            < std::chrono::milliseconds(options_.electionTimeout.min);
    }

    std::shared_ptr<Client> ServerImpl::clientFor(const std::string& id)
    {
        auto address = membership_.membership.address(id);
        if (!address)
        {
            address = committedMembership_.membership.address(id);
        }
        if (!address)
        {
            spdlog::error("[{}] no address for {}", id_, id);
            return nullptr;
        }
        auto it = clients_.find(id);
        if (it != clients_.end() && it->second.address == *address)
        {
            return it->second.client;
        }
        auto client = clientFactory_->createClient(*address);
        if (!client)
        {
            spdlog::error("[{}] failed to create client for {} at {}: {}",
                          id_,
                          id,
                          *address,
                          client.error());
            return nullptr;
        }
        std::shared_ptr<Client> shared = std::move(*client);
        clients_[id] = ClientInfo {.client = shared, .address = *address};
        return shared;
    }

    // Public API

    void ServerImpl::handleAppendEntries(
        const data::AppendEntriesRequest& request,
        std::function<void(tl::expected<data::AppendEntriesResponse, Error>)> callback)
    {
        auto guard = work_;
        if (shutdownCalled())
        {
            callback(tl::make_unexpected(errors::NotRunning {}));
            return;
        }
        asio::post(strand_,
                   [this, request, callback = std::move(callback)]
                   {
                       if (auto error = unavailable())
                       {
                           callback(tl::make_unexpected(*error));
                           return;
                       }
                       processInboundAppendEntries(request, callback);
                   });
    }

    void ServerImpl::handleRequestVote(
        const data::RequestVoteRequest& request,
        std::function<void(tl::expected<data::RequestVoteResponse, Error>)> callback)
    {
        auto guard = work_;
        if (shutdownCalled())
        {
            callback(tl::make_unexpected(errors::NotRunning {}));
            return;
        }
        asio::post(strand_,
                   [this, request, callback = std::move(callback)]
                   {
                       if (auto error = unavailable())
                       {
                           callback(tl::make_unexpected(*error));
                           return;
                       }
                       processInboundRequestVote(request, callback);
                   });
    }

    void ServerImpl::handleInstallSnapshot(
        const data::InstallSnapshotRequest& request,
        std::function<void(tl::expected<data::InstallSnapshotResponse, Error>)> callback)
    {
        auto guard = work_;
        if (shutdownCalled())
        {
            callback(tl::make_unexpected(errors::NotRunning {}));
            return;
        }
        asio::post(strand_,
                   [this, request, callback = std::move(callback)]
                   {
                       if (auto error = unavailable())
                       {
                           callback(tl::make_unexpected(*error));
                           return;
                       }
                       processInboundInstallSnapshot(request, callback);
                   });
    }

    tl::expected<Peer, Error> ServerImpl::getLeader() const
    {
        auto result = query<std::optional<Peer>>(
            [this]() -> tl::expected<std::optional<Peer>, Error>
            {
                if (!leaderID_)
                {
                    return std::nullopt;
                }
                auto address = membership_.membership.address(*leaderID_);
                return Peer {.id = *leaderID_, .address = address.value_or("")};
            });
        if (!result)
        {
            return tl::make_unexpected(result.error());
        }
        if (!*result)
        {
            return tl::make_unexpected(errors::NotLeader {});
        }
        return **result;
    }

    tl::expected<uint64_t, Error> ServerImpl::getTerm() const
    {
        return query<uint64_t>([this]() -> tl::expected<uint64_t, Error> { return term_; });
    }

    tl::expected<std::optional<uint64_t>, Error> ServerImpl::getCommitIndex() const
    {
        return query<std::optional<uint64_t>>(
            [this]() -> tl::expected<std::optional<uint64_t>, Error>
            { return data::indexOf(committed_); });
    }

    // This is thread-safe since ID is a constant.
    std::string ServerImpl::getId() const
    {
        return id_;
    }

    tl::expected<Status, Error> ServerImpl::getStatus() const
    {
        return query<Status>(
            [this]() -> tl::expected<Status, Error>
            {
                std::optional<Peer> leader;
                if (leaderID_)
                {
                    leader = Peer {
                        .id = *leaderID_,
                        .address = membership_.membership.address(*leaderID_).value_or(""),
                    };
                }
                return Status {
                    .role = role(),
                    .isLeader = isLeader(),
                    .leader = leader,
                    .term = term_,
                    .commitIndex = data::indexOf(committed_),
                    .lastLogIndex = data::indexOf(log_.lastLogId()),
                    .lastApplied = data::indexOf(lastApplied_),
                    .membership = membership_.membership,
                };
            });
    }

    tl::expected<WriteResult, Error> ServerImpl::write(std::vector<std::byte> command)
    {
        std::promise<tl::expected<WriteResult, Error>> promise;
        auto future = promise.get_future();
        write(std::move(command),
              [&promise](tl::expected<WriteResult, Error> result)
              { promise.set_value(std::move(result)); });
        return future.get();
    }

    void ServerImpl::write(std::vector<std::byte> command, WriteCallback callback)
    {
        auto guard = work_;
        if (shutdownCalled())
        {
            callback(tl::make_unexpected(errors::NotRunning {}));
            return;
        }
        asio::post(strand_,
                   [this, command = std::move(command), callback = std::move(callback)]() mutable
                   { processWrite(std::move(command), std::move(callback)); });
    }

    tl::expected<std::vector<std::byte>, Error> ServerImpl::read(std::vector<std::byte> request)
    {
        std::promise<tl::expected<std::vector<std::byte>, Error>> promise;
        auto future = promise.get_future();
        read(std::move(request),
             [&promise](tl::expected<std::vector<std::byte>, Error> result)
             { promise.set_value(std::move(result)); });
        return future.get();
    }

    void ServerImpl::read(std::vector<std::byte> request, ReadCallback callback)
    {
        auto guard = work_;
        if (shutdownCalled())
        {
            callback(tl::make_unexpected(errors::NotRunning {}));
            return;
        }
        asio::post(strand_,
                   [this, request = std::move(request), callback = std::move(callback)]() mutable
                   { processRead(std::move(request), std::move(callback)); });
    }

    tl::expected<data::LogId, Error> ServerImpl::changeMembership(std::set<std::string> voters)
    {
        std::promise<tl::expected<data::LogId, Error>> promise;
        auto future = promise.get_future();
        changeMembership(std::move(voters),
                         [&promise](tl::expected<data::LogId, Error> result)
                         { promise.set_value(std::move(result)); });
        return future.get();
    }

    void ServerImpl::changeMembership(std::set<std::string> voters, MembershipCallback callback)
    {
        auto guard = work_;
        if (shutdownCalled())
        {
            callback(tl::make_unexpected(errors::NotRunning {}));
            return;
        }
        asio::post(strand_,
                   [this, voters = std::move(voters), callback = std::move(callback)]() mutable
                   { processChangeMembership(std::move(voters), std::move(callback)); });
    }

    tl::expected<data::LogId, Error> ServerImpl::addLearner(Peer peer)
    {
        std::promise<tl::expected<data::LogId, Error>> promise;
        auto future = promise.get_future();
        addLearner(std::move(peer),
                   [&promise](tl::expected<data::LogId, Error> result)
                   { promise.set_value(std::move(result)); });
        return future.get();
    }

    void ServerImpl::addLearner(Peer peer, MembershipCallback callback)
    {
        auto guard = work_;
        if (shutdownCalled())
        {
            callback(tl::make_unexpected(errors::NotRunning {}));
            return;
        }
        asio::post(strand_,
                   [this, peer = std::move(peer), callback = std::move(callback)]() mutable
                   { processAddLearner(std::move(peer), std::move(callback)); });
    }

    void ServerImpl::setLeaderChangedCallback(LeaderChangedCallback callback)
    {
        std::lock_guard lock {mutex_};
        leaderChangedCallback_ = callback;
    }

    void ServerImpl::clearLeaderChangedCallback()
    {
        std::lock_guard lock {mutex_};
        leaderChangedCallback_.reset();
    }

    // Elections

    void ServerImpl::scheduleElectionTimeout()
    {
        auto generation = ++electionGeneration_;
        if (lifecycle_ != Lifecycle::Running || isLeader()
            || !membership_.membership.isVoter(id_))
        {
            return;
        }
        auto timeout = options_.electionTimeout.sample(gen_);
        electionTimer_->expires_after(std::chrono::milliseconds(timeout));
        electionTimer_->async_wait(
            [this, guard = work_, generation](asio::error_code ec)
            {
                (void)guard;
                if (ec || generation != electionGeneration_)
                {
                    return;
                }
                processElectionTimeout();
            });
    }

    void ServerImpl::cancelElectionTimeout()
    {
        electionGeneration_++;
        if (electionTimer_)
        {
            electionTimer_->cancel();
        }
    }

    void ServerImpl::processElectionTimeout()
    {
        if (lifecycle_ != Lifecycle::Running || isLeader())
        {
            return;
        }
        if (!membership_.membership.isVoter(id_))
        {
            state_ = FollowerInfo {};
            return;
        }
        startPreVote();
    }

    void ServerImpl::startPreVote()
    {
        spdlog::debug("[{}] election timeout in term {}, starting pre-vote", id_, term_);
        state_ = PreCandidateInfo {.tally = impl::VoteTally(term_ + 1, membership_.membership)};
        scheduleElectionTimeout();

        auto& info = std::get<PreCandidateInfo>(state_);
        if (info.tally.grant(id_))
        {
            startElection();
            return;
        }
        sendVoteRequests(data::RequestVoteRequest {
            .term = term_ + 1,
            .candidateID = id_,
            .lastLogId = log_.lastLogId(),
            .isPreVote = true,
        });
    }

    void ServerImpl::startElection()
    {
        term_++;
        vote_ = data::Vote {.term = term_, .nodeID = id_, .committed = false};
        state_ = CandidateInfo {.tally = impl::VoteTally(term_, membership_.membership)};
        updateLeader(std::nullopt);
        scheduleElectionTimeout();
        spdlog::info("[{}] starting election for term {}", id_, term_);

        auto term = term_;
        persistHardState(
            [this, term]
            {
                auto* info = std::get_if<CandidateInfo>(&state_);
                if (info == nullptr || term_ != term)
                {
                    return;
                }
                info->requested = true;
                // Our own vote only counts once it is durable.
                if (info->tally.grant(id_))
                {
                    becomeLeader();
                    return;
                }
                sendVoteRequests(data::RequestVoteRequest {
                    .term = term_,
                    .candidateID = id_,
                    .lastLogId = log_.lastLogId(),
                    .isPreVote = false,
                });
            });
    }

    void ServerImpl::sendVoteRequests(const data::RequestVoteRequest& request)
    {
        for (const auto& id : membership_.membership.voterIDs())
        {
            if (id == id_)
            {
                continue;
            }
            auto client = clientFor(id);
            if (!client)
            {
                continue;
            }
            client->requestVote(
                request,
                RequestConfig {.timeout = options_.rpcTimeout},
                [this, guard = work_, id, request](
                    tl::expected<data::RequestVoteResponse, Error> response)
                {
                    (void)guard;
                    asio::post(strand_,
                               [this, id, request, response = std::move(response)]() mutable
                               { onVoteResponse(id, request, std::move(response)); });
                });
        }
    }

    void ServerImpl::onVoteResponse(const std::string& from,
                                    const data::RequestVoteRequest& request,
                                    tl::expected<data::RequestVoteResponse, Error> response)
    {
        if (lifecycle_ != Lifecycle::Running)
        {
            return;
        }
        if (!response)
        {
            spdlog::debug("[{}] RequestVote to {} failed: {}", id_, from, response.error());
            return;
        }
        if (response->term > term_ && !response->voteGranted)
        {
            spdlog::info(
                "[{}] {} is at term {}, stepping down from term {}", id_, from, response->term, term_);
            becomeFollower(response->term, std::nullopt);
            return;
        }
        if (!response->voteGranted)
        {
            return;
        }

        if (request.isPreVote)
        {
            auto* info = std::get_if<PreCandidateInfo>(&state_);
            if (info == nullptr || info->tally.term() != request.term || term_ + 1 != request.term)
            {
                return;
            }
            if (info->tally.grant(from))
            {
                startElection();
            }
            return;
        }

        auto* info = std::get_if<CandidateInfo>(&state_);
        if (info == nullptr || term_ != request.term || response->term != term_)
        {
            return;
        }
        bool won = info->tally.grant(from);
        spdlog::debug("[{}] vote from {}, candidate state {}", id_, from, *info);
        if (won && info->requested)
        {
            becomeLeader();
        }
    }

    void ServerImpl::becomeFollower(uint64_t term, std::optional<std::string> leaderID)
    {
        bool termChanged = term > term_;
        if (termChanged)
        {
            term_ = term;
            vote_.reset();
        }
        if (isLeader())
        {
            spdlog::info("[{}] stepping down as leader in term {}", id_, term_);
            auto& leaderInfo = std::get<LeaderInfo>(state_);
            spdlog::debug("[{}] leader state at step-down: {}", id_, leaderInfo);
            for (auto& [_, stream] : leaderInfo.streams)
            {
                stream->cancel();
            }
            state_ = FollowerInfo {};
            leaderID_ = leaderID;
            failPending(notLeader());
            invokeLeaderChangedCallback(leaderID_, false, true);
        }
        else
        {
            state_ = FollowerInfo {};
            updateLeader(leaderID);
        }
        scheduleElectionTimeout();
        if (termChanged)
        {
            persistHardState([] {});
        }
    }

    void ServerImpl::updateLeader(std::optional<std::string> leaderID)
    {
        if (leaderID_ == leaderID)
        {
            return;
        }
        leaderID_ = std::move(leaderID);
        if (leaderID_)
        {
            spdlog::info("[{}] following leader {} in term {}", id_, *leaderID_, term_);
        }
        invokeLeaderChangedCallback(leaderID_, false, false);
    }

    void ServerImpl::becomeLeader()
    {
        spdlog::info("[{}] elected leader for term {} with log up to {}", id_, term_, log_.lastLogId());
        cancelElectionTimeout();
        vote_->committed = true;
        leaderID_ = id_;
        state_ = LeaderInfo {};
        auto& leaderInfo = std::get<LeaderInfo>(state_);

        auto nextIndex = log_.nextIndex();
        for (const auto& [id, _] : membership_.membership.nodes())
        {
            if (id == id_)
            {
                continue;
            }
            leaderInfo.streams.emplace(
                id,
                std::make_shared<impl::ReplicationStream>(
                    id_, id, clientFor(id), *this, strand_, options_, nextIndex));
        }

        // The blank entry commits everything from earlier terms, and its commit tells lease
        // reads that the commit index is current.
        LogTransaction transaction;
        transaction.setHardState(hardState());
        data::LogEntry blank {.logId = {.term = term_, .index = log_.nextIndex()},
                              .payload = data::Blank {}};
        leaderInfo.blankIndex = blank.logId.index;
        transaction.append({blank});
        log_.append(blank);
        postPersist(std::move(transaction),
                    [this, logId = blank.logId](tl::expected<void, Error> result)
                    {
                        if (!result)
                        {
                            return;
                        }
                        if (log_.contains(logId) && flushed_ < logId)
                        {
                            flushed_ = logId;
                        }
                        advanceCommitIndex();
                    });

        for (auto& [_, stream] : leaderInfo.streams)
        {
            stream->start();
        }
        invokeLeaderChangedCallback(id_, true, false);
    }

    void ServerImpl::stepDown(const Error& reason)
    {
        if (!isLeader())
        {
            return;
        }
        auto& leaderInfo = std::get<LeaderInfo>(state_);
        spdlog::info("[{}] stepping down as leader in term {}: {}", id_, term_, reason);
        spdlog::debug("[{}] leader state at step-down: {}", id_, leaderInfo);
        for (auto& [_, stream] : leaderInfo.streams)
        {
            stream->cancel();
        }
        state_ = FollowerInfo {};
        leaderID_.reset();
        failPending(reason);
        invokeLeaderChangedCallback(std::nullopt, false, true);
        scheduleElectionTimeout();
    }

    // ReplicationHost

    void ServerImpl::requestSnapshot()
    {
        if (snapshots_.building())
        {
            return;
        }
        if (!lastApplied_ || (snapshots_.lastIncluded() && *snapshots_.lastIncluded() >= *lastApplied_))
        {
            return;
        }
        snapshots_.setBuilding(true);
        auto lastLogId = *applyDispatched_;
        data::SnapshotMeta meta {
            .lastLogId = lastLogId,
            .lastMembership = membershipAt(lastLogId.index),
            .snapshotID = fmt::format("{}-{}-{}", lastLogId.term, lastLogId.index, ++snapshotCounter_),
        };
        spdlog::debug("[{}] building snapshot {} up to {}", id_, meta.snapshotID, lastLogId);
        asio::post(applyStrand_,
                   [this, guard = work_, meta]
                   {
                       (void)guard;
                       auto result = stateMachine_->buildSnapshot(meta);
                       asio::post(strand_,
                                  [this, result = std::move(result)]() mutable
                                  { onSnapshotBuilt(std::move(result)); });
                   });
    }

    void ServerImpl::onReplicationProgress(const std::string&)
    {
        advanceCommitIndex();
    }

    void ServerImpl::onHigherTerm(uint64_t term)
    {
        if (term <= term_)
        {
            return;
        }
        spdlog::info("[{}] discovered term {} while at term {}", id_, term, term_);
        becomeFollower(term, std::nullopt);
    }

    // Inbound RPCs

    bool ServerImpl::acceptLeader(uint64_t term, const std::string& leaderID)
    {
        if (term < term_)
        {
            return false;
        }
        if (term > term_ || !std::holds_alternative<FollowerInfo>(state_))
        {
            if (term == term_ && isLeader())
            {
                spdlog::error("[{}] {} claims leadership of my own term {}", id_, leaderID, term_);
                return false;
            }
            becomeFollower(term, leaderID);
        }
        else
        {
            updateLeader(leaderID);
        }
        lastLeaderContact_ = Clock::now();
        scheduleElectionTimeout();
        return true;
    }

    void ServerImpl::processInboundAppendEntries(
        const data::AppendEntriesRequest& request,
        std::function<void(tl::expected<data::AppendEntriesResponse, Error>)> callback)
    {
        if (!acceptLeader(request.term, request.leaderID))
        {
            callback(data::AppendEntriesResponse {.term = term_, .success = false});
            return;
        }

        if (!log_.contains(request.prevLogId))
        {
            auto hint = log_.conflictHint(*request.prevLogId);
            spdlog::debug("[{}] log does not contain {}, hinting {}", id_, request.prevLogId, hint.index);
            persistHardState(
                [this, callback, hint]
                {
                    callback(data::AppendEntriesResponse {
                        .term = term_, .success = false, .conflict = hint});
                });
            return;
        }

        // Find the first entry that is not already stored. Entries that are stored with the
        // same term are identical and are skipped, so stale or repeated requests never truncate.
        size_t offset = 0;
        std::optional<uint64_t> truncateAfter;
        bool truncate = false;
        for (; offset < request.entries.size(); offset++)
        {
            const auto& entry = request.entries[offset];
            if (entry.logId.index < log_.firstIndex())
            {
                continue;
            }
            auto stored = log_.logIdAt(entry.logId.index);
            if (!stored)
            {
                break;
            }
            if (stored->term != entry.logId.term)
            {
                if (committed_ && entry.logId.index <= committed_->index)
                {
                    spdlog::error("[{}] refusing to truncate committed entry {}", id_, *stored);
                    callback(tl::make_unexpected(errors::InvalidArgument {
                        fmt::format("entry {} conflicts with a committed entry", entry.logId)}));
                    return;
                }
                truncate = true;
                truncateAfter = entry.logId.index == 0
                    ? std::nullopt
                    : std::optional<uint64_t>(entry.logId.index - 1);
                break;
            }
        }

        LogTransaction transaction;
        transaction.setHardState(hardState());
        if (truncate)
        {
            spdlog::info("[{}] truncating log after index {}",
                         id_,
                         truncateAfter ? fmt::to_string(*truncateAfter) : "None");
            transaction.truncateFrom(truncateAfter);
            log_.truncateAfter(truncateAfter);
            if (flushed_ && (!truncateAfter || flushed_->index > *truncateAfter))
            {
                flushed_ = log_.lastLogId();
            }
        }
        std::vector<data::LogEntry> newEntries(
            request.entries.begin() + static_cast<std::ptrdiff_t>(offset), request.entries.end());
        bool membershipChanged = truncate;
        for (const auto& entry : newEntries)
        {
            membershipChanged =
                membershipChanged || std::holds_alternative<data::MembershipChange>(entry.payload);
        }
        log_.append(newEntries);
        transaction.append(std::move(newEntries));
        if (membershipChanged)
        {
            refreshMembership();
        }

        std::optional<data::LogId> lastVerified =
            request.entries.empty() ? request.prevLogId : request.entries.back().logId;
        auto term = term_;
        postPersist(
            std::move(transaction),
            [this, callback, lastVerified, leaderCommit = request.leaderCommit, term](
                tl::expected<void, Error> result)
            {
                if (!result)
                {
                    callback(tl::make_unexpected(result.error()));
                    return;
                }
                if (lastVerified && log_.contains(lastVerified) && flushed_ < lastVerified)
                {
                    flushed_ = lastVerified;
                }
                if (term_ == term && leaderCommit && lastVerified)
                {
                    auto index = std::min(leaderCommit->index, lastVerified->index);
                    if (auto logId = log_.logIdAt(index))
                    {
                        setCommitted(*logId);
                    }
                }
                callback(data::AppendEntriesResponse {.term = term_, .success = true});
            });
    }

    void ServerImpl::processInboundRequestVote(
        const data::RequestVoteRequest& request,
        std::function<void(tl::expected<data::RequestVoteResponse, Error>)> callback)
    {
        auto decision = impl::decideVote(
            impl::VoterView {
                .currentTerm = term_,
                .vote = vote_,
                .lastLogId = log_.lastLogId(),
                .leaderLeaseActive = leaderLeaseActive(),
            },
            request);
        spdlog::debug("[{}] {} {} for {} in term {}",
                      id_,
                      decision.granted ? "granting" : "rejecting",
                      request.isPreVote ? "pre-vote" : "vote",
                      request.candidateID,
                      request.term);

        if (request.isPreVote)
        {
            callback(data::RequestVoteResponse {
                .term = term_, .voteGranted = decision.granted, .isPreVote = true});
            return;
        }
        if (decision.adoptTerm)
        {
            becomeFollower(request.term, std::nullopt);
        }
        if (decision.recordVote)
        {
            vote_ = data::Vote {.term = term_, .nodeID = request.candidateID, .committed = false};
            scheduleElectionTimeout();
        }
        persistHardState(
            [this, callback, granted = decision.granted]
            {
                callback(data::RequestVoteResponse {
                    .term = term_, .voteGranted = granted, .isPreVote = false});
            });
    }

    void ServerImpl::processInboundInstallSnapshot(
        const data::InstallSnapshotRequest& request,
        std::function<void(tl::expected<data::InstallSnapshotResponse, Error>)> callback)
    {
        if (!acceptLeader(request.term, request.leaderID))
        {
            callback(data::InstallSnapshotResponse {.term = term_});
            return;
        }
        auto ack = [this, callback] { callback(data::InstallSnapshotResponse {.term = term_}); };

        if (!request.meta.lastLogId)
        {
            callback(tl::make_unexpected(errors::InvalidArgument {"snapshot has no last log id"}));
            return;
        }
        // Everything in the snapshot is already committed here.
        if (committed_ && request.meta.lastLogId->index <= committed_->index)
        {
            snapshots_.abortReceive();
            persistHardState(ack);
            return;
        }

        auto received = snapshots_.receive(request);
        if (!received)
        {
            spdlog::debug("[{}] rejecting snapshot chunk: {}", id_, received.error());
            callback(tl::make_unexpected(received.error()));
            return;
        }
        if (!*received)
        {
            persistHardState(ack);
            return;
        }

        spdlog::info("[{}] received snapshot {} up to {}",
                     id_,
                     (*received)->meta.snapshotID,
                     (*received)->meta.lastLogId);
        installSnapshot(std::move(**received),
                        [callback, ack](tl::expected<void, Error> result)
                        {
                            if (!result)
                            {
                                callback(tl::make_unexpected(result.error()));
                                return;
                            }
                            ack();
                        });
    }

    void ServerImpl::installSnapshot(data::Snapshot snapshot,
                                     std::function<void(tl::expected<void, Error>)> callback)
    {
        auto shared = std::make_shared<const data::Snapshot>(std::move(snapshot));
        asio::post(
            applyStrand_,
            [this, guard = work_, shared, callback = std::move(callback)]
            {
                (void)guard;
                auto result = stateMachine_->installSnapshot(shared->meta, shared->data);
                asio::post(
                    strand_,
                    [this, shared, callback, result = std::move(result)]
                    {
                        if (!result)
                        {
                            fault(result.error());
                            callback(tl::make_unexpected(errors::Faulted {faultMessage_}));
                            return;
                        }
                        const auto& meta = shared->meta;
                        auto lastLogId = *meta.lastLogId;

                        LogTransaction transaction;
                        // The suffix after the snapshot is kept only if it extends the snapshot.
                        if (!log_.contains(lastLogId) || lastLogId.index >= log_.nextIndex())
                        {
                            transaction.truncateFrom(std::nullopt);
                            log_.reset(std::nullopt, {});
                        }
                        transaction.purge(lastLogId);
                        log_.purge(lastLogId);
                        if (flushed_ < log_.lastLogId())
                        {
                            flushed_ = log_.lastLogId();
                        }

                        if (committed_ < lastLogId)
                        {
                            committed_ = lastLogId;
                        }
                        if (applyDispatched_ < lastLogId)
                        {
                            applyDispatched_ = lastLogId;
                        }
                        if (lastApplied_ < lastLogId)
                        {
                            lastApplied_ = lastLogId;
                        }
                        committedMembership_ = meta.lastMembership;
                        refreshMembership();
                        snapshots_.setCurrent(shared);

                        postPersist(std::move(transaction), callback);
                    });
            });
    }

    // Log and membership

    data::LogId ServerImpl::appendEntry(data::Payload payload)
    {
        data::LogEntry entry {.logId = {.term = term_, .index = log_.nextIndex()},
                              .payload = std::move(payload)};
        auto logId = entry.logId;
        bool isMembership = std::holds_alternative<data::MembershipChange>(entry.payload);
        log_.append(entry);
        if (isMembership)
        {
            refreshMembership();
        }

        LogTransaction transaction;
        transaction.append({std::move(entry)});
        postPersist(std::move(transaction),
                    [this, logId](tl::expected<void, Error> result)
                    {
                        if (!result)
                        {
                            return;
                        }
                        if (log_.contains(logId) && flushed_ < logId)
                        {
                            flushed_ = logId;
                        }
                        if (isLeader())
                        {
                            advanceCommitIndex();
                        }
                    });

        if (auto* leaderInfo = std::get_if<LeaderInfo>(&state_))
        {
            for (auto& [_, stream] : leaderInfo->streams)
            {
                stream->notify();
            }
        }
        return logId;
    }

    void ServerImpl::refreshMembership()
    {
        auto previous = membership_;
        if (auto latest = log_.lastMembership())
        {
            membership_ = *latest;
        }
        else
        {
            membership_ = committedMembership_;
        }
        if (previous == membership_)
        {
            return;
        }
        spdlog::info("[{}] membership is now {}", id_, membership_.membership);
        if (isLeader())
        {
            syncStreams();
            return;
        }
        if (lifecycle_ == Lifecycle::Running && !previous.membership.isVoter(id_)
            && membership_.membership.isVoter(id_))
        {
            // Promoted from learner.
            scheduleElectionTimeout();
        }
    }

    void ServerImpl::syncStreams()
    {
        auto* leaderInfo = std::get_if<LeaderInfo>(&state_);
        if (leaderInfo == nullptr)
        {
            return;
        }
        // Nodes that are leaving keep receiving the log until their removal is committed.
        auto targets = membership_.membership.nodes();
        for (const auto& [id, address] : committedMembership_.membership.nodes())
        {
            targets.emplace(id, address);
        }

        for (auto it = leaderInfo->streams.begin(); it != leaderInfo->streams.end();)
        {
            if (!targets.contains(it->first))
            {
                spdlog::info("[{}] stopping replication to removed node {}", id_, it->first);
                it->second->cancel();
                it = leaderInfo->streams.erase(it);
                continue;
            }
            ++it;
        }
        for (const auto& [id, _] : targets)
        {
            if (id == id_ || leaderInfo->streams.contains(id))
            {
                if (id != id_)
                {
                    leaderInfo->streams[id]->setClient(clientFor(id));
                }
                continue;
            }
            spdlog::info("[{}] starting replication to {}", id_, id);
            auto stream = std::make_shared<impl::ReplicationStream>(
                id_, id, clientFor(id), *this, strand_, options_, log_.nextIndex());
            leaderInfo->streams.emplace(id, stream);
            stream->start();
        }
    }

    // Client requests

    void ServerImpl::processWrite(std::vector<std::byte> command, WriteCallback callback)
    {
        if (auto error = unavailable())
        {
            callback(tl::make_unexpected(*error));
            return;
        }
        if (!isLeader())
        {
            callback(tl::make_unexpected(notLeader()));
            return;
        }
        if (pendingWrites_.size() >= options_.maxPendingWrites)
        {
            callback(tl::make_unexpected(errors::Overloaded {}));
            return;
        }

        auto logId = appendEntry(data::Command {std::move(command)});
        auto timer = std::make_unique<asio::steady_timer>(strand_);
        timer->expires_after(std::chrono::milliseconds(options_.commitTimeout));
        timer->async_wait(
            [this, guard = work_, logId](asio::error_code ec)
            {
                (void)guard;
                if (ec)
                {
                    return;
                }
                auto it = pendingWrites_.find(logId.index);
                if (it == pendingWrites_.end() || it->second.logId != logId)
                {
                    return;
                }
                spdlog::debug("[{}] write at {} timed out", id_, logId);
                auto pending = std::move(it->second);
                pendingWrites_.erase(it);
                pending.callback(tl::make_unexpected(errors::Timeout {}));
            });
        pendingWrites_.emplace(
            logId.index,
            PendingWrite {.logId = logId, .callback = std::move(callback), .timer = std::move(timer)});
    }

    void ServerImpl::processRead(std::vector<std::byte> request, ReadCallback callback)
    {
        if (auto error = unavailable())
        {
            callback(tl::make_unexpected(*error));
            return;
        }
        if (!isLeader())
        {
            callback(tl::make_unexpected(notLeader()));
            return;
        }

        auto& leaderInfo = std::get<LeaderInfo>(state_);
        PendingRead read {.request = std::move(request), .callback = std::move(callback)};
        if (options_.readPolicy == ReadPolicy::LeaderLease && leaseReadAllowed())
        {
            read.readIndex = data::indexOf(committed_);
        }
        else
        {
            if (!leaderInfo.barrierIndex)
            {
                leaderInfo.barrierIndex = appendEntry(data::Blank {}).index;
            }
            read.readIndex = leaderInfo.barrierIndex;
            read.waitForCommit = true;
        }
        pendingReads_.push_back(std::move(read));
        serveReads();
    }

    bool ServerImpl::leaseReadAllowed() const
    {
        const auto& leaderInfo = std::get<LeaderInfo>(state_);
        if (!committed_ || committed_->index < leaderInfo.blankIndex)
        {
            return false;
        }
        auto deadline = Clock::now() - std::chrono::milliseconds(options_.leaseDuration);
        std::set<std::string> acknowledged {id_};
        for (const auto& [id, stream] : leaderInfo.streams)
        {
            auto ackTime = stream->lastAckSendTime();
            if (ackTime && *ackTime >= deadline)
            {
                acknowledged.insert(id);
            }
        }
        return membership_.membership.isQuorum(acknowledged);
    }

    void ServerImpl::serveReads()
    {
        auto* leaderInfo = std::get_if<LeaderInfo>(&state_);
        if (leaderInfo != nullptr && leaderInfo->barrierIndex && committed_
            && committed_->index >= *leaderInfo->barrierIndex)
        {
            // Reads that arrive from now on need a new barrier.
            leaderInfo->barrierIndex.reset();
        }

        std::vector<PendingRead> ready;
        for (auto it = pendingReads_.begin(); it != pendingReads_.end();)
        {
            bool committedEnough = !it->waitForCommit
                || (committed_ && it->readIndex && committed_->index >= *it->readIndex);
            bool appliedEnough = !it->readIndex
                || (lastApplied_ && lastApplied_->index >= *it->readIndex);
            if (committedEnough && appliedEnough)
            {
                ready.push_back(std::move(*it));
                it = pendingReads_.erase(it);
                continue;
            }
            ++it;
        }
        for (auto& read : ready)
        {
            asio::post(applyStrand_,
                       [this, guard = work_, read = std::move(read)]
                       {
                           (void)guard;
                           read.callback(stateMachine_->query(read.request));
                       });
        }
    }

    void ServerImpl::processChangeMembership(std::set<std::string> voters,
                                             MembershipCallback callback)
    {
        if (auto error = unavailable())
        {
            callback(tl::make_unexpected(*error));
            return;
        }
        if (!isLeader())
        {
            callback(tl::make_unexpected(notLeader()));
            return;
        }
        if (pendingMembership_ || membership_.membership.isJoint() || committed_ < membership_.logId)
        {
            callback(tl::make_unexpected(errors::ChangeInProgress {}));
            return;
        }
        auto joint = membership_.membership.toJoint(voters);
        if (!joint)
        {
            callback(tl::make_unexpected(joint.error()));
            return;
        }
        auto logId = appendEntry(data::MembershipChange {std::move(*joint)});
        spdlog::info("[{}] proposed joint membership at {}", id_, logId);
        pendingMembership_ = PendingMembershipChange {.callback = std::move(callback)};
    }

    void ServerImpl::processAddLearner(Peer peer, MembershipCallback callback)
    {
        if (auto error = unavailable())
        {
            callback(tl::make_unexpected(*error));
            return;
        }
        if (!isLeader())
        {
            callback(tl::make_unexpected(notLeader()));
            return;
        }
        if (pendingMembership_ || membership_.membership.isJoint() || committed_ < membership_.logId)
        {
            callback(tl::make_unexpected(errors::ChangeInProgress {}));
            return;
        }
        auto updated = membership_.membership.withLearner(peer.id, peer.address);
        if (!updated)
        {
            callback(tl::make_unexpected(updated.error()));
            return;
        }
        auto logId = appendEntry(data::MembershipChange {std::move(*updated)});
        spdlog::info("[{}] adding learner {} at {}", id_, peer.id, logId);
        pendingMembership_ = PendingMembershipChange {.callback = std::move(callback), .target = logId};
    }

    // Commit and apply

    void ServerImpl::advanceCommitIndex()
    {
        if (!isLeader())
        {
            return;
        }
        const auto& leaderInfo = std::get<LeaderInfo>(state_);
        auto index = membership_.membership.committedIndex(
            [this, &leaderInfo](const std::string& id) -> std::optional<uint64_t>
            {
                if (id == id_)
                {
                    return data::indexOf(flushed_);
                }
                auto it = leaderInfo.streams.find(id);
                if (it == leaderInfo.streams.end())
                {
                    return std::nullopt;
                }
                return it->second->matched();
            });
        if (!index || (committed_ && *index <= committed_->index))
        {
            return;
        }
        auto logId = log_.logIdAt(*index);
        // Only entries of the current term are committed by counting replicas.
        if (!logId || logId->term != term_)
        {
            return;
        }
        setCommitted(*logId);
    }

    void ServerImpl::setCommitted(const data::LogId& logId)
    {
        if (committed_ >= logId)
        {
            return;
        }
        spdlog::trace("[{}] committed up to {}", id_, logId);
        committed_ = logId;
        onCommitAdvanced();
    }

    void ServerImpl::onCommitAdvanced()
    {
        if (auto atCommit = log_.lastMembershipAtOrBefore(committed_->index);
            atCommit && atCommit != committedMembership_)
        {
            committedMembership_ = *atCommit;
            spdlog::info("[{}] committed membership {} at {}",
                         id_,
                         committedMembership_.membership,
                         committedMembership_.logId);
            syncStreams();
        }
        dispatchApply();

        if (!isLeader())
        {
            return;
        }
        for (auto& [_, stream] : std::get<LeaderInfo>(state_).streams)
        {
            stream->notify();
        }
        serveReads();

        // A committed joint membership moves on to its final membership.
        if (membership_.membership.isJoint() && committed_ >= membership_.logId)
        {
            auto logId = appendEntry(data::MembershipChange {membership_.membership.toFinal()});
            spdlog::info("[{}] proposed final membership at {}", id_, logId);
            if (pendingMembership_ && !pendingMembership_->target)
            {
                pendingMembership_->target = logId;
            }
        }

        if (pendingMembership_ && pendingMembership_->target
            && committed_ >= pendingMembership_->target)
        {
            auto pending = std::move(*pendingMembership_);
            pendingMembership_.reset();
            pending.callback(*pending.target);
        }

        if (!committedMembership_.membership.isVoter(id_) && committed_ >= membership_.logId)
        {
            spdlog::info("[{}] no longer a voter, stepping down", id_);
            stepDown(errors::NotLeader {});
        }
    }

    void ServerImpl::dispatchApply()
    {
        if (lifecycle_ != Lifecycle::Running || !committed_ || applyDispatched_ >= committed_)
        {
            return;
        }
        auto first = data::nextIndex(applyDispatched_);
        auto entries = log_.range(first, committed_->index - first + 1);
        if (entries.empty())
        {
            return;
        }
        applyDispatched_ = entries.back().logId;

        std::vector<data::LogId> logIds;
        logIds.reserve(entries.size());
        for (const auto& entry : entries)
        {
            logIds.push_back(entry.logId);
        }
        asio::post(applyStrand_,
                   [this, guard = work_, entries = std::move(entries), logIds = std::move(logIds)]
                   {
                       (void)guard;
                       auto responses = stateMachine_->apply(entries);
                       asio::post(strand_,
                                  [this, logIds, responses = std::move(responses)]() mutable
                                  { onApplied(logIds, std::move(responses)); });
                   });
    }

    void ServerImpl::onApplied(std::vector<data::LogId> logIds,
                               tl::expected<std::vector<std::vector<std::byte>>, Error> responses)
    {
        if (!responses)
        {
            fault(responses.error());
            return;
        }
        if (lastApplied_ < logIds.back())
        {
            lastApplied_ = logIds.back();
        }
        for (size_t i = 0; i < logIds.size(); i++)
        {
            auto it = pendingWrites_.find(logIds[i].index);
            if (it == pendingWrites_.end() || it->second.logId != logIds[i])
            {
                continue;
            }
            auto pending = std::move(it->second);
            pendingWrites_.erase(it);
            pending.timer->cancel();
            std::vector<std::byte> response;
            if (i < responses->size())
            {
                response = std::move((*responses)[i]);
            }
            pending.callback(WriteResult {.logId = logIds[i], .response = std::move(response)});
        }
        serveReads();
        maybeBuildSnapshot();
    }

    data::StoredMembership ServerImpl::membershipAt(uint64_t index) const
    {
        if (auto stored = log_.lastMembershipAtOrBefore(index))
        {
            return *stored;
        }
        if (auto snapshot = snapshots_.current())
        {
            return snapshot->meta.lastMembership;
        }
        return committedMembership_;
    }

    // Snapshots

    void ServerImpl::maybeBuildSnapshot()
    {
        if (lifecycle_ != Lifecycle::Running)
        {
            return;
        }
        if (snapshots_.shouldBuild(lastApplied_, log_.bytes(), options_))
        {
            requestSnapshot();
        }
    }

    void ServerImpl::onSnapshotBuilt(tl::expected<data::Snapshot, Error> snapshot)
    {
        snapshots_.setBuilding(false);
        if (!snapshot)
        {
            fault(snapshot.error());
            return;
        }
        auto lastLogId = snapshot->meta.lastLogId;
        spdlog::info("[{}] built snapshot {} up to {}", id_, snapshot->meta.snapshotID, lastLogId);
        snapshots_.setCurrent(std::make_shared<const data::Snapshot>(std::move(*snapshot)));
        if (!lastLogId)
        {
            return;
        }

        auto purgeIndex =
            impl::SnapshotCoordinator::purgeIndex(*lastLogId, options_.logsToKeepAfterSnapshot);
        if (!purgeIndex || *purgeIndex < log_.firstIndex())
        {
            return;
        }
        auto purgeId = log_.logIdAt(*purgeIndex);
        if (!purgeId)
        {
            return;
        }
        spdlog::debug("[{}] purging log up to {}", id_, *purgeId);
        log_.purge(*purgeId);
        LogTransaction transaction;
        transaction.purge(*purgeId);
        postPersist(std::move(transaction), [](tl::expected<void, Error>) {});
    }

    // Callbacks and persistence

    void ServerImpl::invokeLeaderChangedCallback(const std::optional<std::string>& leaderID,
                                                 bool isLeader,
                                                 bool lostLeadership)
    {
        std::optional<Peer> leader;
        if (leaderID)
        {
            leader = Peer {.id = *leaderID,
                           .address = membership_.membership.address(*leaderID).value_or("")};
        }
        std::lock_guard lock {mutex_};
        if (leaderChangedCallback_)
        {
            (*leaderChangedCallback_)(leader, isLeader, lostLeadership);
        }
    }

    void ServerImpl::postPersist(LogTransaction transaction,
                                 std::function<void(tl::expected<void, Error>)> callback)
    {
        // We need the guard to keep the threads alive until the callback is invoked.
        auto cb = [this, guard = work_, callback = std::move(callback)](
                      tl::expected<void, Error> result)
        {
            (void)guard;
            // PersistenceHandler runs the callback on its own thread, so we post it back to the
            // strand.
            asio::post(strand_,
                       [this, callback, result = std::move(result)]
                       {
                           if (!result)
                           {
                               fault(result.error());
                               callback(tl::make_unexpected(errors::Faulted {faultMessage_}));
                               return;
                           }
                           callback(result);
                       });
        };
        persistenceHandler_->addRequest(
            impl::PersistenceRequest {.transaction = std::move(transaction), .callback = cb});
    }

    void ServerImpl::persistHardState(std::function<void()> callback)
    {
        LogTransaction transaction;
        transaction.setHardState(hardState());
        postPersist(std::move(transaction),
                    [callback = std::move(callback)](tl::expected<void, Error> result)
                    {
                        if (result)
                        {
                            callback();
                        }
                    });
    }

    void ServerImpl::fault(const Error& error)
    {
        if (lifecycle_ != Lifecycle::Running)
        {
            return;
        }
        faultMessage_ = fmt::format("{}", error);
        spdlog::critical("[{}] unrecoverable failure, leaving the cluster: {}", id_, faultMessage_);
        lifecycle_ = Lifecycle::Faulted;
        cancelElectionTimeout();
        bool wasLeader = isLeader();
        if (auto* leaderInfo = std::get_if<LeaderInfo>(&state_))
        {
            for (auto& [_, stream] : leaderInfo->streams)
            {
                stream->cancel();
            }
        }
        state_ = FollowerInfo {};
        leaderID_.reset();
        failPending(errors::Faulted {faultMessage_});
        if (wasLeader)
        {
            invokeLeaderChangedCallback(std::nullopt, false, true);
        }
    }

    void ServerImpl::failPending(const Error& error)
    {
        auto writes = std::move(pendingWrites_);
        pendingWrites_.clear();
        for (auto& [_, pending] : writes)
        {
            pending.timer->cancel();
            pending.callback(tl::make_unexpected(error));
        }

        auto reads = std::move(pendingReads_);
        pendingReads_.clear();
        for (auto& read : reads)
        {
            read.callback(tl::make_unexpected(error));
        }

        if (pendingMembership_)
        {
            auto pending = std::move(*pendingMembership_);
            pendingMembership_.reset();
            pending.callback(tl::make_unexpected(error));
        }
    }

    tl::expected<std::shared_ptr<Server>, Error> createServer(ServerCreateConfig& config)
    {
        auto server = std::make_shared<ServerImpl>(config.id,
                                                   config.address,
                                                   config.clientFactory,
                                                   config.logStore,
                                                   config.stateMachine,
                                                   config.options,
                                                   config.leaderChangedCallback);
        if (auto result = server->init(config.peers, config.threadCount); !result)
        {
            return tl::make_unexpected(result.error());
        }
        return server;
    }
}  // namespace raftkit
