#include "log.hpp"

#include <spdlog/spdlog.h>

#include "raftkit/errors.hpp"
#include "raftkit/fmt/data.hpp"

namespace raftkit::impl
{
    size_t calculateSize(const data::LogEntry& entry)
    {
        return sizeof(entry.logId)
            + std::visit(errors::overloaded {[](const data::Command& command)
                                             { return command.data.size(); },
                                             [](const data::MembershipChange& change)
                                             {
                                                 size_t size = 0;
                                                 for (const auto& [id, address] :
                                                      change.membership.nodes())
                                                 {
                                                     size += id.size() + address.size();
                                                 }
                                                 return size;
                                             },
                                             [](const data::Blank&) { return size_t {0}; }},
                         entry.payload);
    }

    void Log::reset(std::optional<data::LogId> lastPurged, std::vector<data::LogEntry> entries)
    {
        lastPurged_ = lastPurged;
        entries_.clear();
        bytes_ = 0;
        append(std::move(entries));
    }

    std::optional<data::LogId> Log::lastLogId() const
    {
        if (entries_.empty())
        {
            return lastPurged_;
        }
        return entries_.back().logId;
    }

    data::LogEntry const* Log::get(uint64_t index) const
    {
        if (index < firstIndex())
        {
            return nullptr;
        }
        size_t offset = index - firstIndex();
        if (offset >= entries_.size())
        {
            return nullptr;
        }
        return &entries_[offset];
    }

    std::optional<data::LogId> Log::logIdAt(uint64_t index) const
    {
        if (lastPurged_ && lastPurged_->index == index)
        {
            return lastPurged_;
        }
        const auto* entry = get(index);
        if (entry == nullptr)
        {
            return std::nullopt;
        }
        return entry->logId;
    }

    bool Log::contains(const std::optional<data::LogId>& logId) const
    {
        if (!logId)
        {
            return true;
        }
        if (lastPurged_ && logId->index < lastPurged_->index)
        {
            return true;
        }
        auto stored = logIdAt(logId->index);
        return stored && stored->term == logId->term;
    }

    std::vector<data::LogEntry> Log::range(uint64_t first, size_t maxCount) const
    {
        std::vector<data::LogEntry> result;
        if (first < firstIndex())
        {
            return result;
        }
        for (auto index = first; index < nextIndex() && result.size() < maxCount; index++)
        {
            result.push_back(*get(index));
        }
        return result;
    }

    std::optional<uint64_t> Log::lastIndexOfTerm(uint64_t term) const
    {
        for (auto it = entries_.rbegin(); it != entries_.rend(); ++it)
        {
            if (it->logId.term == term)
            {
                return it->logId.index;
            }
            if (it->logId.term < term)
            {
                return std::nullopt;
            }
        }
        if (lastPurged_ && lastPurged_->term == term)
        {
            return lastPurged_->index;
        }
        return std::nullopt;
    }

    data::ConflictHint Log::conflictHint(const data::LogId& prevLogId) const
    {
        if (prevLogId.index >= nextIndex())
        {
            return data::ConflictHint {.term = std::nullopt, .index = nextIndex()};
        }
        auto stored = logIdAt(prevLogId.index);
        if (!stored)
        {
            return data::ConflictHint {.term = std::nullopt, .index = firstIndex()};
        }
        // Skip back to the first entry of the conflicting term.
        auto index = prevLogId.index;
        while (index > firstIndex())
        {
            const auto* previous = get(index - 1);
            if (previous == nullptr || previous->logId.term != stored->term)
            {
                break;
            }
            index--;
        }
        return data::ConflictHint {.term = stored->term, .index = index};
    }

    void Log::append(std::vector<data::LogEntry> entries)
    {
        for (auto& entry : entries)
        {
            append(std::move(entry));
        }
    }

    void Log::append(data::LogEntry entry)
    {
        if (entry.logId.index != nextIndex())
        {
            spdlog::error("[Log] appending {} but the next index is {}", entry.logId, nextIndex());
            return;
        }
        bytes_ += calculateSize(entry);
        entries_.push_back(std::move(entry));
    }

    void Log::truncateAfter(std::optional<uint64_t> index)
    {
        auto keep = index ? *index + 1 : 0;
        if (keep < firstIndex())
        {
            spdlog::error("[Log] refusing to truncate purged entries before {}", firstIndex());
            keep = firstIndex();
        }
        while (nextIndex() > keep)
        {
            bytes_ -= calculateSize(entries_.back());
            entries_.pop_back();
        }
    }

    void Log::purge(const data::LogId& upTo)
    {
        if (lastPurged_ && upTo.index <= lastPurged_->index)
        {
            return;
        }
        while (!entries_.empty() && entries_.front().logId.index <= upTo.index)
        {
            bytes_ -= calculateSize(entries_.front());
            entries_.pop_front();
        }
        lastPurged_ = upTo;
    }

    std::optional<data::StoredMembership> Log::lastMembership() const
    {
        if (entries_.empty())
        {
            return std::nullopt;
        }
        return lastMembershipAtOrBefore(entries_.back().logId.index);
    }

    std::optional<data::StoredMembership> Log::lastMembershipAtOrBefore(uint64_t index) const
    {
        for (auto it = entries_.rbegin(); it != entries_.rend(); ++it)
        {
            if (it->logId.index > index)
            {
                continue;
            }
            if (const auto* change = std::get_if<data::MembershipChange>(&it->payload))
            {
                return data::StoredMembership {.logId = it->logId, .membership = change->membership};
            }
        }
        return std::nullopt;
    }
}  // namespace raftkit::impl
