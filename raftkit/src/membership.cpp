#include "raftkit/membership.hpp"

#include <algorithm>

#include <fmt/core.h>

namespace raftkit
{
    namespace
    {
        bool isMajority(const std::set<std::string>& config, const std::set<std::string>& granted)
        {
            if (config.empty())
            {
                return false;
            }
            auto count = std::count_if(
                config.begin(), config.end(), [&granted](const auto& id) { return granted.contains(id); });
            return static_cast<size_t>(count) >= config.size() / 2 + 1;
        }

        // The committed index of a single majority config. Nodes without an acknowledged index
        // sort below every real index.
        std::optional<uint64_t> majorityIndex(const std::set<std::string>& config,
                                              const AckedIndexLookup& acked)
        {
            if (config.empty())
            {
                return std::nullopt;
            }
            std::vector<std::optional<uint64_t>> indices;
            indices.reserve(config.size());
            for (const auto& id : config)
            {
                indices.push_back(acked(id));
            }
            std::sort(indices.begin(), indices.end(), std::greater<> {});
            return indices[config.size() / 2];
        }
    }  // namespace

    Membership::Membership(std::vector<std::set<std::string>> configs,
                           std::map<std::string, std::string> nodes)
        : configs_(std::move(configs))
        , nodes_(std::move(nodes))
    {
    }

    Membership Membership::uniform(std::map<std::string, std::string> nodes)
    {
        std::set<std::string> voters;
        for (const auto& [id, _] : nodes)
        {
            voters.insert(id);
        }
        return Membership {{std::move(voters)}, std::move(nodes)};
    }

    bool Membership::empty() const
    {
        return std::all_of(
            configs_.begin(), configs_.end(), [](const auto& config) { return config.empty(); });
    }

    bool Membership::isVoter(const std::string& id) const
    {
        return std::any_of(configs_.begin(),
                           configs_.end(),
                           [&id](const auto& config) { return config.contains(id); });
    }

    bool Membership::isLearner(const std::string& id) const
    {
        return nodes_.contains(id) && !isVoter(id);
    }

    std::set<std::string> Membership::voterIDs() const
    {
        std::set<std::string> ids;
        for (const auto& config : configs_)
        {
            ids.insert(config.begin(), config.end());
        }
        return ids;
    }

    std::set<std::string> Membership::learnerIDs() const
    {
        std::set<std::string> ids;
        for (const auto& [id, _] : nodes_)
        {
            if (!isVoter(id))
            {
                ids.insert(id);
            }
        }
        return ids;
    }

    std::optional<std::string> Membership::address(const std::string& id) const
    {
        auto it = nodes_.find(id);
        if (it == nodes_.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    bool Membership::isQuorum(const std::set<std::string>& granted) const
    {
        if (configs_.empty())
        {
            return false;
        }
        return std::all_of(configs_.begin(),
                           configs_.end(),
                           [&granted](const auto& config) { return isMajority(config, granted); });
    }

    std::optional<uint64_t> Membership::committedIndex(const AckedIndexLookup& acked) const
    {
        if (configs_.empty())
        {
            return std::nullopt;
        }
        std::optional<uint64_t> result = majorityIndex(configs_.front(), acked);
        for (size_t i = 1; i < configs_.size(); i++)
        {
            // An index is jointly committed only if it is committed in every config.
            result = std::min(result, majorityIndex(configs_[i], acked));
        }
        return result;
    }

    tl::expected<Membership, Error> Membership::toJoint(const std::set<std::string>& newVoters) const
    {
        if (newVoters.empty())
        {
            return tl::make_unexpected(errors::InvalidArgument {"new voter set is empty"});
        }
        if (isJoint())
        {
            return tl::make_unexpected(errors::ChangeInProgress {});
        }
        for (const auto& id : newVoters)
        {
            if (!nodes_.contains(id))
            {
                return tl::make_unexpected(errors::InvalidArgument {
                    fmt::format("node {} has no known address; add it as a learner first", id)});
            }
        }
        std::vector<std::set<std::string>> configs;
        if (!configs_.empty())
        {
            configs.push_back(configs_.back());
        }
        configs.push_back(newVoters);
        return Membership {std::move(configs), nodes_};
    }

    Membership Membership::toFinal() const
    {
        if (!isJoint())
        {
            return *this;
        }
        const auto& oldVoters = configs_.front();
        const auto& newVoters = configs_.back();
        std::map<std::string, std::string> nodes;
        for (const auto& [id, address] : nodes_)
        {
            // Removed voters are dropped. Learners stay learners.
            if (newVoters.contains(id) || !oldVoters.contains(id))
            {
                nodes.emplace(id, address);
            }
        }
        return Membership {{newVoters}, std::move(nodes)};
    }

    tl::expected<Membership, Error> Membership::withLearner(const std::string& id,
                                                            const std::string& address) const
    {
        if (isVoter(id))
        {
            return tl::make_unexpected(
                errors::InvalidArgument {fmt::format("node {} is already a voter", id)});
        }
        auto nodes = nodes_;
        nodes[id] = address;
        return Membership {configs_, std::move(nodes)};
    }
}  // namespace raftkit
