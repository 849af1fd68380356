#include <chrono>
#include <memory>

#include "raftkit/client.hpp"

#include <grpcpp/grpcpp.h>

#include "raftkit_protos/raftkit.grpc.pb.h"
#include "utils/grpc_data.hpp"
#include "utils/grpc_errors.hpp"

namespace raftkit
{
    namespace
    {
        // Keeps the request, the reply and the context alive until the call completes.
        template<typename ProtoRequest, typename ProtoReply, typename Response>
        struct Call
        {
            grpc::ClientContext context;
            ProtoRequest request;
            ProtoReply reply;
            ResponseCallback<Response> callback;
        };

        class GrpcClient final : public Client
        {
          public:
            explicit GrpcClient(const std::shared_ptr<grpc::Channel>& channel)
                : stub_(raftkit_protos::Raft::NewStub(channel))
            {
            }

            void appendEntries(data::AppendEntriesRequest request,
                               RequestConfig config,
                               ResponseCallback<data::AppendEntriesResponse> callback) override
            {
                auto call = start<raftkit_protos::AppendEntriesResponse, data::AppendEntriesResponse>(
                    data::toProto(request), config, std::move(callback));
                stub_->async()->AppendEntries(
                    &call->context, &call->request, &call->reply, completion(call));
            }

            void requestVote(data::RequestVoteRequest request,
                             RequestConfig config,
                             ResponseCallback<data::RequestVoteResponse> callback) override
            {
                auto call = start<raftkit_protos::RequestVoteResponse, data::RequestVoteResponse>(
                    data::toProto(request), config, std::move(callback));
                stub_->async()->RequestVote(
                    &call->context, &call->request, &call->reply, completion(call));
            }

            void installSnapshot(data::InstallSnapshotRequest request,
                                 RequestConfig config,
                                 ResponseCallback<data::InstallSnapshotResponse> callback) override
            {
                auto call =
                    start<raftkit_protos::InstallSnapshotResponse, data::InstallSnapshotResponse>(
                        data::toProto(request), config, std::move(callback));
                stub_->async()->InstallSnapshot(
                    &call->context, &call->request, &call->reply, completion(call));
            }

          private:
            template<typename ProtoReply, typename Response, typename ProtoRequest>
            static std::shared_ptr<Call<ProtoRequest, ProtoReply, Response>> start(
                ProtoRequest request, const RequestConfig& config, ResponseCallback<Response> callback)
            {
                auto call = std::make_shared<Call<ProtoRequest, ProtoReply, Response>>();
                call->request = std::move(request);
                call->callback = std::move(callback);
                call->context.set_deadline(std::chrono::system_clock::now()
                                           + std::chrono::milliseconds(config.timeout));
                return call;
            }

            template<typename CallType>
            static auto completion(std::shared_ptr<CallType> call)
            {
                return [call](grpc::Status status)
                {
                    if (status.ok())
                    {
                        call->callback(data::fromProto(call->reply));
                    }
                    else
                    {
                        call->callback(tl::unexpected(errors::fromGrpcStatus(status)));
                    }
                };
            }

            std::unique_ptr<raftkit_protos::Raft::Stub> stub_;
        };

        class GrpcClientFactory final : public ClientFactory
        {
          public:
            ~GrpcClientFactory() override = default;

            tl::expected<std::unique_ptr<Client>, Error> createClient(
                const std::string& address) override
            {
                return std::make_unique<GrpcClient>(
                    grpc::CreateChannel(address, grpc::InsecureChannelCredentials()));
            }
        };
    }  // namespace

    tl::expected<std::unique_ptr<Client>, Error> createClient(const std::string& address)
    {
        return GrpcClientFactory().createClient(address);
    }

    std::shared_ptr<ClientFactory> createClientFactory()
    {
        return std::make_shared<GrpcClientFactory>();
    }
}  // namespace raftkit
