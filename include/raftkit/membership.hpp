#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <tl/expected.hpp>

#include "raftkit/errors.hpp"

namespace raftkit
{
    /// Returns the highest log index a node is known to have stored, or std::nullopt if it is not
    /// known to have stored anything.
    using AckedIndexLookup = std::function<std::optional<uint64_t>(const std::string& id)>;

    /// The cluster membership: one voter set, or two voter sets (old, new) while a joint
    /// reconfiguration is in progress, plus the addresses of every voter and learner.
    ///
    /// A learner is a node that has an address in `nodes()` but is not part of any voter set. It
    /// receives the log but never votes and never counts toward a quorum.
    class Membership
    {
      public:
        Membership() = default;

        /// Creates a membership from explicit voter sets and node addresses. Every voter must be
        /// present in nodes.
        Membership(std::vector<std::set<std::string>> configs,
                   std::map<std::string, std::string> nodes);

        /// Creates a uniform membership where every given node is a voter.
        /// @param nodes A map from node ID to address.
        static Membership uniform(std::map<std::string, std::string> nodes);

        [[nodiscard]] const std::vector<std::set<std::string>>& configs() const { return configs_; }
        [[nodiscard]] const std::map<std::string, std::string>& nodes() const { return nodes_; }

        /// Whether this is a joint (old, new) membership.
        [[nodiscard]] bool isJoint() const { return configs_.size() > 1; }

        /// Whether there are no voters at all.
        [[nodiscard]] bool empty() const;

        [[nodiscard]] bool isVoter(const std::string& id) const;
        [[nodiscard]] bool isLearner(const std::string& id) const;
        [[nodiscard]] bool contains(const std::string& id) const { return nodes_.contains(id); }

        /// The union of all voter sets.
        [[nodiscard]] std::set<std::string> voterIDs() const;
        [[nodiscard]] std::set<std::string> learnerIDs() const;
        [[nodiscard]] std::optional<std::string> address(const std::string& id) const;

        /// Whether the given set of nodes forms a quorum, which requires a majority of every voter
        /// set independently.
        [[nodiscard]] bool isQuorum(const std::set<std::string>& granted) const;

        /// Computes the largest log index that is acknowledged by a majority of every voter set.
        /// @param acked Returns the highest acknowledged index for a node.
        /// @return The committed index, or std::nullopt if no index has a quorum.
        [[nodiscard]] std::optional<uint64_t> committedIndex(const AckedIndexLookup& acked) const;

        /// Builds the joint membership that transitions from the last voter set to newVoters.
        /// Every new voter must already have an address (be a voter or learner).
        [[nodiscard]] tl::expected<Membership, Error> toJoint(
            const std::set<std::string>& newVoters) const;

        /// Builds the final membership of a joint transition: only the new voter set remains and
        /// nodes that are no longer voters or learners are dropped. Learners that were never
        /// voters in the old set are kept.
        [[nodiscard]] Membership toFinal() const;

        /// Returns a copy of this membership with a learner added.
        [[nodiscard]] tl::expected<Membership, Error> withLearner(const std::string& id,
                                                                  const std::string& address) const;

        bool operator==(Membership const& other) const = default;

      private:
        std::vector<std::set<std::string>> configs_;
        std::map<std::string, std::string> nodes_;
    };
}  // namespace raftkit
