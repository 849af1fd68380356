#pragma once

#include <optional>
#include <set>
#include <string>

#include "raftkit/data.hpp"
#include "raftkit/membership.hpp"

namespace raftkit::impl
{
    // What a voter knows when it decides on a RequestVote.
    struct VoterView
    {
        uint64_t currentTerm = 0;
        std::optional<data::Vote> vote;
        std::optional<data::LogId> lastLogId;
        // Whether the voter has heard from a live leader within the lease window, or is the
        // leader itself.
        bool leaderLeaseActive = false;
    };

    struct VoteDecision
    {
        bool granted = false;
        // Whether the voter must move to the request's term before answering.
        bool adoptTerm = false;
        // Whether the voter must persist a vote for the candidate.
        bool recordVote = false;

        bool operator==(VoteDecision const& other) const = default;
    };

    // Decides on a vote or pre-vote. A vote is granted only if the request's term is current,
    // the voter has not voted for someone else in it, the candidate's log is at least as
    // up-to-date and no live leader is known. Pre-votes never change the voter's state, and a
    // request rejected because of a live leader never makes the voter adopt its term.
    VoteDecision decideVote(const VoterView& voter, const data::RequestVoteRequest& request);

    // Collects the grants of one election round.
    class VoteTally
    {
      public:
        VoteTally(uint64_t term, Membership membership)
            : term_(term)
            , membership_(std::move(membership))
        {
        }

        [[nodiscard]] uint64_t term() const { return term_; }

        // Records a grant and returns whether the granted set now forms a quorum. Grants from
        // nodes that are not voters are ignored.
        bool grant(const std::string& id);

        [[nodiscard]] bool hasQuorum() const { return membership_.isQuorum(granted_); }

        [[nodiscard]] const std::set<std::string>& granted() const { return granted_; }

      private:
        uint64_t term_;
        Membership membership_;
        std::set<std::string> granted_;
    };
}  // namespace raftkit::impl
