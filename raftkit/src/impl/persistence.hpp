#pragma once

#include <functional>
#include <memory>
#include <thread>

#include "common/mpsc_queue.hpp"
#include "raftkit/log_store.hpp"

namespace raftkit::impl
{
    using PersistCallback = std::function<void(tl::expected<void, Error>)>;

    struct PersistenceRequest
    {
        LogTransaction transaction;
        PersistCallback callback;
    };

    // Applies log store transactions on a dedicated thread, one at a time and in submission
    // order. Each callback runs on that thread once its transaction is durable or has failed.
    // Requests queued before destruction are still applied. Later ones fail with NotRunning.
    class PersistenceHandler
    {
      public:
        explicit PersistenceHandler(std::shared_ptr<LogStore> store);

        ~PersistenceHandler();

        PersistenceHandler(const PersistenceHandler&) = delete;
        PersistenceHandler& operator=(const PersistenceHandler&) = delete;

        void addRequest(PersistenceRequest request);

      private:
        void run();

        std::shared_ptr<LogStore> store_;
        common::MPSCQueue<PersistenceRequest> queue_;
        std::thread thread_;
    };
}  // namespace raftkit::impl
