#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "mirror/deep/path.h"

namespace mirror::deep {
    enum class ReasonCode : std::uint8_t {
        None = 0,
        SharedReference,
        NumberValueMismatch,
        TypeMismatch,
        NullMismatch,
        ValueMismatch,
        InstanceMismatch,
        DateMismatch,
        RegExpMismatch,
        BufferLengthMismatch,
        BufferByteMismatch,
        DataViewLengthMismatch,
        DataViewByteMismatch,
        TypedArrayCtorMismatch,
        TypedArrayLengthMismatch,
        TypedArrayElementMismatch,
        ArrayLengthMismatch,
        MapSizeMismatch,
        MapEntryMismatch,
        SetSizeMismatch,
        SetElementMismatch,
        ObjectKeyCountMismatch,
        ObjectMissingKey
    };

    // Stable identifier, e.g. "typedArrayCtorMismatch".
    std::string_view ReasonName(ReasonCode reason) noexcept;

    struct ComparisonResult {
        ComparisonResult();

        static ComparisonResult Equal();
        static ComparisonResult Unequal(Path path, ReasonCode reason, std::string detail = {});

        explicit operator bool() const noexcept {
            return equal;
        }

        bool equal;
        Path path;
        ReasonCode reason;
        std::string detail;
    };
}
