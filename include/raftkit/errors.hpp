#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <variant>

namespace raftkit
{
    namespace errors
    {
        // Helper for std::visit with multiple lambdas
        template<class... Ts>
        struct overloaded : Ts...
        {
            using Ts::operator()...;
        };
        template<class... Ts>
        overloaded(Ts...) -> overloaded<Ts...>;

        /// An unknown error.
        struct Unknown
        {
            std::string message;  ///< The error message.
        };

        /// A timeout has occurred.
        struct Timeout
        {
        };

        /// An invalid argument error.
        struct InvalidArgument
        {
            std::string message;  ///< The error message.
        };

        /// The node is not the leader. Carries the last known leader, if any, so that the
        /// caller can redirect.
        struct NotLeader
        {
            std::optional<std::string> leaderID;  ///< The ID of the known leader.
            std::optional<std::string> leaderAddress;  ///< The address of the known leader.
        };

        /// The network interface or server is already running.
        struct AlreadyRunning
        {
        };

        /// The network interface or server is not running.
        struct NotRunning
        {
        };

        /// The server failed to start.
        struct FailedToStart
        {
        };

        /// Deserialization error.
        struct Deserialization
        {
        };

        /// A log store or state machine operation failed.
        struct PersistenceFailed
        {
            std::string message;  ///< The error message.
        };

        /// Too many client requests are waiting to be committed.
        struct Overloaded
        {
        };

        /// A membership change is already in progress.
        struct ChangeInProgress
        {
        };

        /// The node hit an unrecoverable error and stopped participating in the cluster.
        struct Faulted
        {
            std::string message;  ///< The original failure.
        };

        /// A configuration value is missing or invalid.
        struct ConfigError
        {
            std::string message;  ///< The error message.
        };
    }  // namespace errors

    using Error = std::variant<errors::Unknown,
                               errors::Timeout,
                               errors::InvalidArgument,
                               errors::NotLeader,
                               errors::AlreadyRunning,
                               errors::NotRunning,
                               errors::FailedToStart,
                               errors::Deserialization,
                               errors::PersistenceFailed,
                               errors::Overloaded,
                               errors::ChangeInProgress,
                               errors::Faulted,
                               errors::ConfigError>;

}  // namespace raftkit
