#pragma once

#include <cstdint>

namespace mirror {
    struct ComparisonOptions {
        bool compareSetOrder;
        bool compareMapOrder;
        bool strictNumbers;

        ComparisonOptions() noexcept;
    };

    struct CloneOptions : ComparisonOptions {
        bool allowSharedFunctions;
        bool allowSharedErrors;

        CloneOptions() noexcept;
    };

    struct HeapConfig {
        std::uint32_t maxRecords;
        std::uint64_t maxBufferBytes;
    };

    HeapConfig MakeDefaultHeapConfig();
}
