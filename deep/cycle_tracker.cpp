#include "mirror/deep/cycle_tracker.h"

namespace mirror::deep {
    CycleTracker::CycleTracker()
        : m_Seen(),
          m_PairCount(0) {
    }

    bool CycleTracker::IsSeen(ValueHeap::Handle left, ValueHeap::Handle right) const {
        auto it = m_Seen.find(left);
        if (it == m_Seen.end()) {
            return false;
        }
        return it->second.find(right) != it->second.end();
    }

    void CycleTracker::MarkSeen(ValueHeap::Handle left, ValueHeap::Handle right) {
        if (m_Seen[left].insert(right).second) {
            m_PairCount += 1;
        }
    }

    std::size_t CycleTracker::PairCount() const noexcept {
        return m_PairCount;
    }
}
