#pragma once

#include <grpcpp/grpcpp.h>

#include "raftkit/errors.hpp"

namespace raftkit::errors
{
    inline Error fromGrpcStatus(const grpc::Status& status)
    {
        switch (status.error_code())
        {
            case grpc::StatusCode::DEADLINE_EXCEEDED:
            case grpc::StatusCode::UNAVAILABLE:
            case grpc::StatusCode::CANCELLED:
                return Timeout {};

            case grpc::StatusCode::INVALID_ARGUMENT:
            case grpc::StatusCode::OUT_OF_RANGE:
                return InvalidArgument {.message = status.error_message()};

            case grpc::StatusCode::FAILED_PRECONDITION:
                return NotRunning {};

            case grpc::StatusCode::ABORTED:
                return Faulted {.message = status.error_message()};

            case grpc::StatusCode::DATA_LOSS:
                return PersistenceFailed {.message = status.error_message()};

            default:
                return Unknown {.message = status.error_message()};
        }
    }

    // This attempts to match an error to a gRPC status code.
    inline grpc::Status toGrpcStatus(Error const& error)
    {
        return std::visit(
            overloaded {
                [](Unknown const& e) { return grpc::Status(grpc::StatusCode::UNKNOWN, e.message); },
                [](Timeout const&)
                { return grpc::Status(grpc::StatusCode::DEADLINE_EXCEEDED, "Timeout occurred"); },
                [](InvalidArgument const& e)
                { return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, e.message); },
                [](NotLeader const&)
                { return grpc::Status(grpc::StatusCode::FAILED_PRECONDITION, "Not leader"); },
                [](AlreadyRunning const&)
                { return grpc::Status(grpc::StatusCode::ALREADY_EXISTS, "Already running"); },
                [](NotRunning const&)
                { return grpc::Status(grpc::StatusCode::FAILED_PRECONDITION, "Not running"); },
                [](FailedToStart const&)
                { return grpc::Status(grpc::StatusCode::INTERNAL, "Failed to start"); },
                [](Deserialization const&)
                { return grpc::Status(grpc::StatusCode::DATA_LOSS, "Deserialization failed"); },
                [](PersistenceFailed const& e)
                { return grpc::Status(grpc::StatusCode::DATA_LOSS, e.message); },
                [](Overloaded const&)
                { return grpc::Status(grpc::StatusCode::RESOURCE_EXHAUSTED, "Overloaded"); },
                [](ChangeInProgress const&)
                {
                    return grpc::Status(grpc::StatusCode::FAILED_PRECONDITION,
                                        "Membership change in progress");
                },
                [](Faulted const& e) { return grpc::Status(grpc::StatusCode::ABORTED, e.message); },
                [](ConfigError const& e)
                { return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, e.message); }},
            error);
    }
}  // namespace raftkit::errors
