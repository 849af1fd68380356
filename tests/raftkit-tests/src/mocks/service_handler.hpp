#pragma once

#include <gmock/gmock.h>

#include "raftkit/server.hpp"

namespace raftkit::testing
{
    class MockServiceHandler : public raftkit::ServiceHandler
    {
      public:
        MOCK_METHOD(void,
                    handleAppendEntries,
                    (const data::AppendEntriesRequest& request,
                     std::function<void(tl::expected<data::AppendEntriesResponse, Error>)>
                         callback),
                    (override));

        MOCK_METHOD(
            void,
            handleRequestVote,
            (const data::RequestVoteRequest& request,
             std::function<void(tl::expected<data::RequestVoteResponse, Error>)> callback),
            (override));

        MOCK_METHOD(
            void,
            handleInstallSnapshot,
            (const data::InstallSnapshotRequest& request,
             std::function<void(tl::expected<data::InstallSnapshotResponse, Error>)> callback),
            (override));
    };
}  // namespace raftkit::testing
