#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "raftkit/client.hpp"
#include "raftkit/data.hpp"
#include "raftkit/log_store.hpp"
#include "raftkit/membership.hpp"
#include "raftkit/options.hpp"
#include "raftkit/state_machine.hpp"

namespace raftkit
{
    /// The role a node currently plays in the cluster.
    enum class Role : uint8_t
    {
        Follower,
        Learner,
        PreCandidate,
        Candidate,
        Leader,
    };

    /// A peer in the Raft cluster.
    struct Peer
    {
        std::string id;  ///< The ID of the peer.
        std::string address;  ///< The address of the peer.

        bool operator==(Peer const& other) const = default;
    };

    /**
     * The callback when the server's known leader changes.
     * @param leader The peer information of the new leader, or std::nullopt if there is no leader.
     * @param isLeader Whether this server is the new leader.
     * @param lostLeadership If this server was the previous leader, this will be true.
     */
    using LeaderChangedCallback =
        std::function<void(std::optional<Peer> leader, bool isLeader, bool lostLeadership)>;

    /// Configuration for creating a Raft server.
    struct ServerCreateConfig
    {
        std::string id;  ///< The ID of the server.
        std::string address;  ///< The address other nodes reach this server at.
        std::vector<Peer> peers;  ///< The other voters of the bootstrap membership. Ignored when
                                  ///< the log store or state machine already holds a membership.
                                  ///< Leave empty for a node that joins as a learner.
        std::shared_ptr<ClientFactory> clientFactory;  ///< The client factory to use.
        std::shared_ptr<LogStore> logStore;  ///< The durable log.
        std::shared_ptr<StateMachine> stateMachine;  ///< The application state machine.
        Options options;  ///< Tunables.
        std::optional<LeaderChangedCallback>
            leaderChangedCallback;  ///< The leader changed callback to use.
        uint16_t threadCount = 1;  ///< The number of threads to use for network I/O and consensus.
    };

    /// A service handler for the Raft server.
    class ServiceHandler
    {
      public:
        virtual ~ServiceHandler() = default;

        /// Handles an AppendEntries request.
        /// @param request The AppendEntries request to handle.
        /// @param callback The callback to invoke with the response or error.
        virtual void handleAppendEntries(
            const data::AppendEntriesRequest& request,
            std::function<void(tl::expected<data::AppendEntriesResponse, Error>)> callback) = 0;

        /// Handles a RequestVote request.
        /// @param request The RequestVote request to handle.
        /// @param callback The callback to invoke with the response or error.
        virtual void handleRequestVote(
            const data::RequestVoteRequest& request,
            std::function<void(tl::expected<data::RequestVoteResponse, Error>)> callback) = 0;

        /// Handles one InstallSnapshot chunk.
        /// @param request The chunk to handle.
        /// @param callback The callback to invoke with the response or error.
        virtual void handleInstallSnapshot(
            const data::InstallSnapshotRequest& request,
            std::function<void(tl::expected<data::InstallSnapshotResponse, Error>)> callback) = 0;
    };

    /// A consistent snapshot of the server's state.
    struct Status
    {
        Role role;  ///< The current role.
        bool isLeader;  ///< Whether this server is currently the leader.
        std::optional<Peer>
            leader;  ///< The current leader peer information, or std::nullopt if unknown.
        uint64_t term;  ///< The current term of the server.
        std::optional<uint64_t> commitIndex;  ///< The index of the last committed log entry.
        std::optional<uint64_t> lastLogIndex;  ///< The index of the last log entry.
        std::optional<uint64_t> lastApplied;  ///< The index of the last applied log entry.
        Membership membership;  ///< The effective membership.
    };

    /// The outcome of a committed write.
    struct WriteResult
    {
        data::LogId logId;  ///< Where the command was stored.
        std::vector<std::byte> response;  ///< The state machine's response.
    };

    using WriteCallback = std::function<void(tl::expected<WriteResult, Error>)>;
    using ReadCallback = std::function<void(tl::expected<std::vector<std::byte>, Error>)>;
    using MembershipCallback = std::function<void(tl::expected<data::LogId, Error>)>;

    /// The Raft server interface. This is the main interface for the Raft server.
    ///
    /// All functions are thread-safe. Callbacks run on internal threads and must not block.
    class Server : public ServiceHandler
    {
      public:
        /// Starts Raft consensus.
        virtual tl::expected<void, Error> start() = 0;
        /// Shuts down the Raft server. Pending requests fail with NotRunning.
        virtual void shutdown() = 0;

        /// Returns the last-known leader.
        /// @return The leader peer information or NotLeader if no leader is known.
        [[nodiscard]] virtual tl::expected<Peer, Error> getLeader() const = 0;

        /// If the server is the leader, appends a command and waits until it is committed and
        /// applied. Otherwise, returns a NotLeader error.
        /// @param command The command to append to the log.
        /// @return Where the command was stored and the state machine's response.
        virtual tl::expected<WriteResult, Error> write(std::vector<std::byte> command) = 0;

        /// The asynchronous form of write.
        virtual void write(std::vector<std::byte> command, WriteCallback callback) = 0;

        /// Serves a linearizable read through StateMachine::query.
        /// @param request The opaque read request.
        /// @return The result of the query.
        virtual tl::expected<std::vector<std::byte>, Error> read(std::vector<std::byte> request) = 0;

        /// The asynchronous form of read.
        virtual void read(std::vector<std::byte> request, ReadCallback callback) = 0;

        /// Moves the cluster to a new voter set through joint consensus. Every new voter must
        /// already be a member or a learner.
        /// @param voters The IDs of the new voters.
        /// @return The log id of the final membership entry once it is committed.
        virtual tl::expected<data::LogId, Error> changeMembership(std::set<std::string> voters) = 0;

        /// The asynchronous form of changeMembership.
        virtual void changeMembership(std::set<std::string> voters,
                                      MembershipCallback callback) = 0;

        /// Adds a non-voting learner that receives the log.
        /// @param peer The learner to add.
        /// @return The log id of the membership entry once it is committed.
        virtual tl::expected<data::LogId, Error> addLearner(Peer peer) = 0;

        /// The asynchronous form of addLearner.
        virtual void addLearner(Peer peer, MembershipCallback callback) = 0;

        /// Sets the leader changed callback, which runs when the leader changes.
        /// The callback may be called on a different thread.
        /// @param callback The callback function to set.
        virtual void setLeaderChangedCallback(LeaderChangedCallback callback) = 0;

        /// Clears the leader changed callback.
        virtual void clearLeaderChangedCallback() = 0;

        /// Returns the current term.
        /// @return The current term if the server has not been shut down.
        [[nodiscard]] virtual tl::expected<uint64_t, Error> getTerm() const = 0;

        /// Returns the current commit index.
        /// @return The index of the last committed entry, or std::nullopt if nothing is committed.
        [[nodiscard]] virtual tl::expected<std::optional<uint64_t>, Error> getCommitIndex()
            const = 0;

        /// Returns the ID of the server.
        /// @return The server's ID.
        [[nodiscard]] virtual std::string getId() const = 0;

        /// Returns a consistent snapshot of the server's current state.
        /// @return The server's status if it has not been shut down.
        [[nodiscard]] virtual tl::expected<Status, Error> getStatus() const = 0;
    };

    /// Creates a new Raft server with the given configuration.
    /// On creation, the server reads its state from the log store and the state machine.
    /// @param config The configuration for the server.
    /// @return A shared pointer to the server or an error.
    tl::expected<std::shared_ptr<Server>, Error> createServer(ServerCreateConfig& config);
}  // namespace raftkit
