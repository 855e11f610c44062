#include "mirror/config.h"

namespace mirror {

ComparisonOptions::ComparisonOptions() noexcept
    : compareSetOrder(false),
      compareMapOrder(false),
      strictNumbers(true) {
}

CloneOptions::CloneOptions() noexcept
    : ComparisonOptions(),
      allowSharedFunctions(true),
      allowSharedErrors(true) {
}

HeapConfig MakeDefaultHeapConfig() {
    HeapConfig config{};
    config.maxRecords = 1u << 20;
    config.maxBufferBytes = 256 * 1024 * 1024ULL;
    return config;
}

}
