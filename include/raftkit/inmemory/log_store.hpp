#pragma once

#include <memory>

#include "raftkit/log_store.hpp"

namespace raftkit::inmemory
{
    /// A LogStore that keeps everything in memory.
    ///
    /// It is thread-safe and outlives the servers that use it, so a test can shut a server
    /// down and create a new one over the same store to simulate a crash and restart.
    class LogStore : public raftkit::LogStore
    {
      public:
        /// While set, every transaction fails with PersistenceFailed and changes nothing.
        virtual void setFailWrites(bool fail) = 0;

        /// Returns the number of transactions applied so far.
        [[nodiscard]] virtual size_t transactionCount() const = 0;
    };

    /// Creates an empty in-memory log store.
    std::shared_ptr<LogStore> createLogStore();
}  // namespace raftkit::inmemory
