#pragma once

#include "mirror/heap.h"
#include "mirror/status.h"
#include "mirror/value.h"

namespace mirror::deep {
    // Copies `input` into fresh records of the same heap. Internal sharing and
    // cycles are preserved; functions and errors are shared with the source.
    // Views over one buffer keep sharing a single copied buffer.
    StatusCode StructuredClone(ValueHeap &heap, const Value &input, Value &outValue);
}
