#pragma once

#include <cstddef>
#include <vector>

#include <tl/expected.hpp>

#include "raftkit/data.hpp"
#include "raftkit/errors.hpp"

namespace raftkit::data
{
    // Binary encodings used by the storage backends.
    std::vector<std::byte> serialize(const LogEntry& entry);
    std::vector<std::byte> serialize(const HardState& state);

    tl::expected<LogEntry, Error> deserializeEntry(const void* data, size_t size);
    tl::expected<HardState, Error> deserializeHardState(const void* data, size_t size);
}  // namespace raftkit::data
