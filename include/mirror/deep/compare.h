#pragma once

#include <cstdint>

#include "mirror/config.h"
#include "mirror/heap.h"
#include "mirror/value.h"
#include "mirror/deep/result.h"

namespace mirror::deep {
    enum class CompareMode : std::uint8_t {
        Equality,
        // Deep equality plus no shared composite references.
        Clone
    };

    struct ComparisonStats {
        std::uint64_t nodesVisited;
        std::uint64_t cycleHits;
        std::uint64_t trialMatches;
        // Distinct (actual, expected) composite pairs marked during the call,
        // including pairs from failed trial matches.
        std::uint64_t trackedPairs;

        ComparisonStats() noexcept;
    };

    // Walks both values in lockstep and reports the first divergence. The
    // path and detail of an unequal result describe `actual` relative to
    // `expected`. Never mutates the heap.
    ComparisonResult DeepCompare(const ValueHeap &heap,
                                 const Value &actual,
                                 const Value &expected,
                                 CompareMode mode,
                                 const CloneOptions &options = CloneOptions(),
                                 ComparisonStats *stats = nullptr);

    bool IsDeepEqual(const ValueHeap &heap,
                     const Value &actual,
                     const Value &expected,
                     const ComparisonOptions &options = ComparisonOptions());

    bool IsDeepClone(const ValueHeap &heap,
                     const Value &actual,
                     const Value &expected,
                     const CloneOptions &options = CloneOptions());

    // Host String() conversion used in mismatch details.
    std::string DescribePrimitive(const ValueHeap &heap, const Value &value);
}
