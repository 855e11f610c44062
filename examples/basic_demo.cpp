#include <iostream>

#include "mirror/config.h"
#include "mirror/heap.h"
#include "mirror/status.h"
#include "mirror/deep/assert.h"
#include "mirror/deep/compare.h"
#include "mirror/deep/structured_clone.h"

int main() {
    mirror::ValueHeap heap(mirror::MakeDefaultHeapConfig());

    mirror::Value tags;
    mirror::Value source;
    if (heap.CreateArray(tags) != mirror::StatusCode::Ok || heap.CreateObject(source) != mirror::StatusCode::Ok) {
        std::cout << "Heap allocation failed" << std::endl;
        return 1;
    }
    heap.ArrayPush(tags, mirror::Value::String("alpha"));
    heap.ArrayPush(tags, mirror::Value::String("beta"));
    heap.SetProperty(source, mirror::PropertyKey::Named("tags"), tags);
    heap.SetProperty(source, mirror::PropertyKey::Named("self"), source);

    mirror::Value copy;
    auto status = mirror::deep::StructuredClone(heap, source, copy);
    if (status != mirror::StatusCode::Ok) {
        std::cout << "Clone failed" << std::endl;
        return 1;
    }
    std::cout << "Clone is deep clone: " << std::boolalpha << mirror::deep::IsDeepClone(heap, copy, source)
              << std::endl;

    mirror::Value copiedTags;
    heap.GetProperty(copy, mirror::PropertyKey::Named("tags"), copiedTags);
    heap.ArraySet(copiedTags, 1, mirror::Value::String("gamma"));

    mirror::deep::AssertOptions options;
    options.path = mirror::deep::Path({mirror::deep::PathSegment::FromKey("root")});
    options.label = "demo";
    mirror::deep::AssertionReport report;
    status = mirror::deep::AssertDeepEqual(heap, copy, source, mirror::ComparisonOptions(), options, &report);
    if (status == mirror::StatusCode::AssertionFailed) {
        std::cout << report.message << std::endl;
    }

    const auto &metrics = heap.GetMetrics();
    std::cout << "Live records: " << metrics.liveRecords << " property writes: " << metrics.propertyWrites
              << std::endl;
    return 0;
}
