#include "persistence.hpp"

#include <spdlog/spdlog.h>

#include "raftkit/fmt/errors.hpp"

namespace raftkit::impl
{
    PersistenceHandler::PersistenceHandler(std::shared_ptr<LogStore> store)
        : store_(std::move(store))
    {
        thread_ = std::thread {&PersistenceHandler::run, this};
    }

    PersistenceHandler::~PersistenceHandler()
    {
        queue_.close();
        thread_.join();
    }

    void PersistenceHandler::addRequest(PersistenceRequest request)
    {
        auto callback = request.callback;
        if (!queue_.push(std::move(request)) && callback)
        {
            callback(tl::make_unexpected(errors::NotRunning {}));
        }
    }

    void PersistenceHandler::run()
    {
        spdlog::trace("[PersistenceHandler {}] background thread started",
                      static_cast<void*>(this));
        while (auto request = queue_.pop())
        {
            tl::expected<void, Error> result;
            if (!request->transaction.empty())
            {
                result = store_->apply(request->transaction);
                if (!result)
                {
                    spdlog::error("[PersistenceHandler {}] failed to apply transaction: {}",
                                  static_cast<void*>(this),
                                  result.error());
                }
            }
            if (request->callback)
            {
                request->callback(std::move(result));
            }
        }
        spdlog::trace("[PersistenceHandler {}] background thread stopped",
                      static_cast<void*>(this));
    }
}  // namespace raftkit::impl
