#include "raftkit/options.hpp"

#include <fmt/core.h>

namespace raftkit
{
    tl::expected<void, Error> Options::validate() const
    {
        if (electionTimeout.min == 0 || electionTimeout.min > electionTimeout.max)
        {
            return tl::make_unexpected(errors::InvalidArgument {fmt::format(
                "invalid election timeout range [{}, {}]", electionTimeout.min, electionTimeout.max)});
        }
        if (electionTimeout.max > MAX_DURATION || commitTimeout > MAX_DURATION
            || rpcTimeout > MAX_DURATION || maxBackoff > MAX_DURATION)
        {
            return tl::make_unexpected(errors::InvalidArgument {
                fmt::format("durations must not exceed {} ms", MAX_DURATION)});
        }
        if (heartbeatInterval == 0 || heartbeatInterval >= electionTimeout.min)
        {
            return tl::make_unexpected(errors::InvalidArgument {
                fmt::format("heartbeat interval {} must be positive and below the election timeout",
                            heartbeatInterval)});
        }
        if (leaseDuration >= electionTimeout.min)
        {
            return tl::make_unexpected(errors::InvalidArgument {
                fmt::format("lease duration {} must be below the minimum election timeout {}",
                            leaseDuration,
                            electionTimeout.min)});
        }
        if (maxEntriesPerAppend == 0)
        {
            return tl::make_unexpected(
                errors::InvalidArgument {"max entries per append must be positive"});
        }
        if (snapshotChunkSize == 0)
        {
            return tl::make_unexpected(
                errors::InvalidArgument {"snapshot chunk size must be positive"});
        }
        if (snapshotLogThreshold == 0)
        {
            return tl::make_unexpected(
                errors::InvalidArgument {"snapshot log threshold must be positive"});
        }
        if (maxPendingWrites == 0)
        {
            return tl::make_unexpected(
                errors::InvalidArgument {"max pending writes must be positive"});
        }
        if (rpcTimeout == 0 || commitTimeout == 0)
        {
            return tl::make_unexpected(errors::InvalidArgument {"timeouts must be positive"});
        }
        if (maxBackoff < heartbeatInterval)
        {
            return tl::make_unexpected(errors::InvalidArgument {
                fmt::format("max backoff {} must not be below the heartbeat interval {}",
                            maxBackoff,
                            heartbeatInterval)});
        }
        return {};
    }
}  // namespace raftkit
