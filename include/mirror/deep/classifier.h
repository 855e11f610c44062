#pragma once

#include <cstdint>
#include <string_view>

#include "mirror/heap.h"
#include "mirror/value.h"

namespace mirror::deep {
    // Comparison strategy of a composite value. Declaration order is the
    // precedence used when the two sides disagree.
    enum class Shape : std::uint8_t {
        Date,
        RegExp,
        ArrayBuffer,
        DataView,
        TypedArray,
        Array,
        Map,
        Set,
        Object,
        Detached
    };

    Shape Classify(const ValueHeap &heap, const Value &value) noexcept;

    // Detail reported when the shapes of two composites differ, naming the
    // shape that takes precedence.
    std::string_view ShapeMismatchDetail(Shape left, Shape right) noexcept;
}
