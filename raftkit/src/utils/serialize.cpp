#include "serialize.hpp"

#include <spdlog/spdlog.h>

#include "utils/grpc_data.hpp"

namespace raftkit::data
{
    namespace
    {
        template<typename Proto>
        std::vector<std::byte> serializeProto(const Proto& proto)
        {
            std::string serialized;
            if (!proto.SerializeToString(&serialized))
            {
                // Should never happen.
                spdlog::error("Failed to serialize {}", proto.GetTypeName());
            }
            return toBytes(serialized);
        }

        template<typename Proto>
        tl::expected<Proto, Error> parseProto(const void* data, size_t size)
        {
            Proto proto;
            if (!proto.ParseFromArray(data, static_cast<int>(size)))
            {
                return tl::make_unexpected(errors::Deserialization {});
            }
            return proto;
        }
    }  // namespace

    std::vector<std::byte> serialize(const LogEntry& entry)
    {
        return serializeProto(toProto(entry));
    }

    std::vector<std::byte> serialize(const HardState& state)
    {
        return serializeProto(toProto(state));
    }

    tl::expected<LogEntry, Error> deserializeEntry(const void* data, size_t size)
    {
        return parseProto<raftkit_protos::LogEntry>(data, size).map(
            [](const raftkit_protos::LogEntry& proto) { return fromProto(proto); });
    }

    tl::expected<HardState, Error> deserializeHardState(const void* data, size_t size)
    {
        return parseProto<raftkit_protos::HardState>(data, size).map(
            [](const raftkit_protos::HardState& proto) { return fromProto(proto); });
    }
}  // namespace raftkit::data
