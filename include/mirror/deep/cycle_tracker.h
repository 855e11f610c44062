#pragma once

#include <cstddef>
#include <unordered_map>
#include <unordered_set>

#include "mirror/heap.h"

namespace mirror::deep {
    // Records (left, right) composite pairs already under comparison within
    // one top-level call. A revisited pair is assumed consistent.
    class CycleTracker {
    public:
        CycleTracker();

        bool IsSeen(ValueHeap::Handle left, ValueHeap::Handle right) const;
        void MarkSeen(ValueHeap::Handle left, ValueHeap::Handle right);

        std::size_t PairCount() const noexcept;

    private:
        std::unordered_map<ValueHeap::Handle, std::unordered_set<ValueHeap::Handle> > m_Seen;
        std::size_t m_PairCount;
    };
}
