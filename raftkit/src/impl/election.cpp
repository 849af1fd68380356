#include "election.hpp"

namespace raftkit::impl
{
    VoteDecision decideVote(const VoterView& voter, const data::RequestVoteRequest& request)
    {
        // An empty log is behind every non-empty one.
        bool logIsUpToDate = request.lastLogId >= voter.lastLogId;

        if (voter.leaderLeaseActive)
        {
            return VoteDecision {};
        }

        if (request.isPreVote)
        {
            return VoteDecision {.granted = request.term > voter.currentTerm && logIsUpToDate};
        }

        if (request.term < voter.currentTerm)
        {
            return VoteDecision {};
        }

        VoteDecision decision {.adoptTerm = request.term > voter.currentTerm};
        bool canVote = decision.adoptTerm || !voter.vote || voter.vote->term < request.term
            || voter.vote->nodeID == request.candidateID;
        decision.granted = canVote && logIsUpToDate;
        decision.recordVote = decision.granted;
        return decision;
    }

    bool VoteTally::grant(const std::string& id)
    {
        if (membership_.isVoter(id))
        {
            granted_.insert(id);
        }
        return hasQuorum();
    }
}  // namespace raftkit::impl
