#include "raftkit/network.hpp"

#include <mutex>

#include <grpcpp/grpcpp.h>

#include "raftkit_protos/raftkit.grpc.pb.h"
#include "utils/grpc_data.hpp"
#include "utils/grpc_errors.hpp"

namespace raftkit
{
    namespace
    {
        // Finishes a reactor with the handler's response or error.
        template<typename Response, typename Proto>
        auto finishWith(grpc::ServerUnaryReactor* reactor, Proto* response)
        {
            return [reactor, response](tl::expected<Response, Error> result)
            {
                if (!result)
                {
                    reactor->Finish(errors::toGrpcStatus(result.error()));
                    return;
                }
                *response = data::toProto(*result);
                reactor->Finish(grpc::Status::OK);
            };
        }

        // GrpcServiceImpl forwards requests to the ServiceHandler and converts the data between the
        // internal and external representations.
        class GrpcServiceImpl final : public raftkit_protos::Raft::CallbackService
        {
          public:
            explicit GrpcServiceImpl(std::shared_ptr<ServiceHandler> handler)
                : handler_(std::move(handler))
            {
            }

            grpc::ServerUnaryReactor* AppendEntries(
                grpc::CallbackServerContext* context,
                const raftkit_protos::AppendEntriesRequest* request,
                raftkit_protos::AppendEntriesResponse* response) override
            {
                auto* reactor = context->DefaultReactor();
                handler_->handleAppendEntries(
                    data::fromProto(*request),
                    finishWith<data::AppendEntriesResponse>(reactor, response));
                return reactor;
            }

            grpc::ServerUnaryReactor* RequestVote(
                grpc::CallbackServerContext* context,
                const raftkit_protos::RequestVoteRequest* request,
                raftkit_protos::RequestVoteResponse* response) override
            {
                auto* reactor = context->DefaultReactor();
                handler_->handleRequestVote(data::fromProto(*request),
                                            finishWith<data::RequestVoteResponse>(reactor, response));
                return reactor;
            }

            grpc::ServerUnaryReactor* InstallSnapshot(
                grpc::CallbackServerContext* context,
                const raftkit_protos::InstallSnapshotRequest* request,
                raftkit_protos::InstallSnapshotResponse* response) override
            {
                auto* reactor = context->DefaultReactor();
                handler_->handleInstallSnapshot(
                    data::fromProto(*request),
                    finishWith<data::InstallSnapshotResponse>(reactor, response));
                return reactor;
            }

          private:
            std::shared_ptr<ServiceHandler> handler_;
        };

        class GrpcNetwork final : public Network
        {
          public:
            explicit GrpcNetwork(std::shared_ptr<ServiceHandler> handler)
                : service_(std::move(handler))
            {
            }

            ~GrpcNetwork() override
            {
                std::lock_guard lock {mutex_};
                shutdown();
            }

            tl::expected<std::string, Error> start(const std::string& address) override
            {
                std::lock_guard lock {mutex_};
                if (server_)
                {
                    return tl::make_unexpected(errors::AlreadyRunning {});
                }

                grpc::ServerBuilder builder;

                int port = 0;
                builder.AddListeningPort(address, grpc::InsecureServerCredentials(), &port);
                builder.RegisterService(&service_);

                server_ = builder.BuildAndStart();
                if (!server_ || port == 0)
                {
                    server_.reset();
                    return tl::make_unexpected(errors::FailedToStart {});
                }

                auto colon = address.rfind(':');
                if (colon == std::string::npos)
                {
                    return address;
                }
                return address.substr(0, colon + 1) + std::to_string(port);
            }

            tl::expected<void, Error> stop() override
            {
                std::lock_guard lock {mutex_};
                if (!server_)
                {
                    return tl::make_unexpected(errors::NotRunning {});
                }
                shutdown();
                return {};
            }

          private:
            // Must be called with the mutex held.
            void shutdown()
            {
                if (!server_)
                {
                    return;
                }
                server_->Shutdown();
                server_->Wait();
                server_.reset();
            }

            std::mutex mutex_;
            GrpcServiceImpl service_;
            std::unique_ptr<grpc::Server> server_;
        };
    }  // namespace

    tl::expected<std::shared_ptr<Network>, Error> createNetwork(const NetworkCreateConfig& config)
    {
        if (!config.handler)
        {
            return tl::make_unexpected(errors::InvalidArgument {"handler is required"});
        }
        return std::make_shared<GrpcNetwork>(config.handler);
    }
}  // namespace raftkit
