#include <memory>
#include <mutex>
#include <set>
#include <unordered_map>
#include <utility>

#include "raftkit/inmemory/manager.hpp"

namespace raftkit::inmemory
{
    namespace
    {
        class ManagerImpl;

        // The network registers its handler with the manager and unregisters when destroyed.
        class Network : public raftkit::Network
        {
          public:
            Network(std::shared_ptr<ServiceHandler> handler, std::shared_ptr<ManagerImpl> manager)
                : handler_(std::move(handler))
                , manager_(std::move(manager))
            {
            }

            ~Network() override { shutdown(); }

            void shutdown();

            tl::expected<std::string, Error> start(const std::string& address) override;

            tl::expected<void, Error> stop() override;

          private:
            std::shared_ptr<ServiceHandler> handler_;
            std::shared_ptr<ManagerImpl> manager_;

            std::mutex mutex_;
            bool running_ = false;
            std::string address_;
        };

        class Client final : public raftkit::Client
        {
          public:
            Client(std::shared_ptr<ManagerImpl> manager, std::string source, std::string address)
                : manager_(std::move(manager))
                , source_(std::move(source))
                , address_(std::move(address))
            {
            }

            ~Client() override = default;

            void appendEntries(data::AppendEntriesRequest request,
                               RequestConfig config,
                               ResponseCallback<data::AppendEntriesResponse> callback) override;

            void requestVote(data::RequestVoteRequest request,
                             RequestConfig config,
                             ResponseCallback<data::RequestVoteResponse> callback) override;

            void installSnapshot(data::InstallSnapshotRequest request,
                                 RequestConfig config,
                                 ResponseCallback<data::InstallSnapshotResponse> callback) override;

          private:
            std::shared_ptr<ManagerImpl> manager_;
            std::string source_;
            std::string address_;
        };

        class ClientFactory final : public raftkit::ClientFactory
        {
          public:
            ClientFactory(std::shared_ptr<ManagerImpl> manager, std::string source)
                : manager_(std::move(manager))
                , source_(std::move(source))
            {
            }

            tl::expected<std::unique_ptr<raftkit::Client>, Error> createClient(
                const std::string& address) override
            {
                return std::make_unique<Client>(manager_, source_, address);
            }

          private:
            std::shared_ptr<ManagerImpl> manager_;
            std::string source_;
        };

        class ManagerImpl final
            : public Manager
            , public std::enable_shared_from_this<ManagerImpl>
        {
          public:
            ManagerImpl() = default;
            ~ManagerImpl() override = default;

            tl::expected<std::shared_ptr<raftkit::Network>, Error> createNetwork(
                const NetworkCreateConfig& config) override
            {
                if (!config.handler)
                {
                    return tl::make_unexpected(errors::InvalidArgument {"handler is required"});
                }
                return std::make_shared<Network>(config.handler, shared_from_this());
            }

            tl::expected<std::shared_ptr<raftkit::ClientFactory>, Error> createClientFactory(
                const std::string& clientAddress) override
            {
                return std::make_shared<ClientFactory>(shared_from_this(), clientAddress);
            }

            tl::expected<void, Error> detachNetwork(const std::string& address) override;
            tl::expected<void, Error> attachNetwork(const std::string& address) override;

            tl::expected<void, Error> registerNetwork(
                const std::string& address, const std::shared_ptr<ServiceHandler>& handler);
            void unregisterNetwork(const std::string& address);

            // Returns the handler at address if a message from source can reach it.
            std::shared_ptr<ServiceHandler> route(const std::string& source,
                                                  const std::string& address);

            // Whether a response can travel from address back to source.
            bool reachable(const std::string& source, const std::string& address);

            // Delivers a request through the given handler method. The response is dropped if
            // either end was detached while the request was being handled.
            template<typename Request, typename Response, typename Method>
            void call(const std::string& source,
                      const std::string& address,
                      const Request& request,
                      ResponseCallback<Response> callback,
                      Method method)
            {
                auto handler = route(source, address);
                if (!handler)
                {
                    callback(tl::make_unexpected(errors::Unknown {.message = "network not found"}));
                    return;
                }
                ((*handler).*method)(
                    request,
                    [self = shared_from_this(), source, address, callback = std::move(callback)](
                        tl::expected<Response, Error> response)
                    {
                        if (!self->reachable(source, address))
                        {
                            callback(tl::make_unexpected(
                                errors::Unknown {.message = "network not found"}));
                            return;
                        }
                        callback(std::move(response));
                    });
            }

          private:
            std::mutex mutex_;
            std::unordered_map<std::string, std::weak_ptr<ServiceHandler>> networks_;
            std::set<std::string> detached_;
        };

        tl::expected<std::string, Error> Network::start(const std::string& address)
        {
            std::lock_guard lock {mutex_};
            if (running_)
            {
                return tl::make_unexpected(errors::AlreadyRunning {});
            }
            if (auto result = manager_->registerNetwork(address, handler_); !result)
            {
                return tl::make_unexpected(result.error());
            }
            running_ = true;
            address_ = address;
            return address;
        }

        void Network::shutdown()
        {
            std::lock_guard lock {mutex_};
            if (!running_)
            {
                return;
            }
            running_ = false;
            manager_->unregisterNetwork(address_);
        }

        tl::expected<void, Error> Network::stop()
        {
            shutdown();
            return {};
        }

        void Client::appendEntries(data::AppendEntriesRequest request,
                                   RequestConfig config,
                                   ResponseCallback<data::AppendEntriesResponse> callback)
        {
            (void)config;
            manager_->call<data::AppendEntriesRequest, data::AppendEntriesResponse>(
                source_, address_, request, std::move(callback), &ServiceHandler::handleAppendEntries);
        }

        void Client::requestVote(data::RequestVoteRequest request,
                                 RequestConfig config,
                                 ResponseCallback<data::RequestVoteResponse> callback)
        {
            (void)config;
            manager_->call<data::RequestVoteRequest, data::RequestVoteResponse>(
                source_, address_, request, std::move(callback), &ServiceHandler::handleRequestVote);
        }

        void Client::installSnapshot(data::InstallSnapshotRequest request,
                                     RequestConfig config,
                                     ResponseCallback<data::InstallSnapshotResponse> callback)
        {
            (void)config;
            manager_->call<data::InstallSnapshotRequest, data::InstallSnapshotResponse>(
                source_,
                address_,
                request,
                std::move(callback),
                &ServiceHandler::handleInstallSnapshot);
        }

        tl::expected<void, Error> ManagerImpl::registerNetwork(
            const std::string& address, const std::shared_ptr<ServiceHandler>& handler)
        {
            std::lock_guard lock {mutex_};
            if (networks_.contains(address))
            {
                return tl::make_unexpected(errors::FailedToStart {});
            }
            networks_.insert({address, handler});
            return {};
        }

        void ManagerImpl::unregisterNetwork(const std::string& address)
        {
            std::lock_guard lock {mutex_};
            networks_.erase(address);
        }

        tl::expected<void, Error> ManagerImpl::detachNetwork(const std::string& address)
        {
            std::lock_guard lock {mutex_};
            if (!detached_.insert(address).second)
            {
                return tl::make_unexpected(
                    errors::InvalidArgument {.message = "network already detached"});
            }
            return {};
        }

        tl::expected<void, Error> ManagerImpl::attachNetwork(const std::string& address)
        {
            std::lock_guard lock {mutex_};
            if (detached_.erase(address) == 0)
            {
                return tl::make_unexpected(
                    errors::InvalidArgument {.message = "network is not detached"});
            }
            return {};
        }

        std::shared_ptr<ServiceHandler> ManagerImpl::route(const std::string& source,
                                                           const std::string& address)
        {
            std::lock_guard lock {mutex_};
            if (detached_.contains(source) || detached_.contains(address))
            {
                return nullptr;
            }
            auto it = networks_.find(address);
            if (it == networks_.end())
            {
                return nullptr;
            }
            return it->second.lock();
        }

        bool ManagerImpl::reachable(const std::string& source, const std::string& address)
        {
            std::lock_guard lock {mutex_};
            return !detached_.contains(source) && !detached_.contains(address);
        }
    }  // namespace

    std::shared_ptr<Manager> createManager()
    {
        return std::make_shared<ManagerImpl>();
    }
}  // namespace raftkit::inmemory
