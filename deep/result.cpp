#include "mirror/deep/result.h"

#include <utility>

namespace mirror::deep {
    std::string_view ReasonName(ReasonCode reason) noexcept {
        switch (reason) {
            case ReasonCode::None:
                return "none";
            case ReasonCode::SharedReference:
                return "sharedReference";
            case ReasonCode::NumberValueMismatch:
                return "numberValueMismatch";
            case ReasonCode::TypeMismatch:
                return "typeMismatch";
            case ReasonCode::NullMismatch:
                return "nullMismatch";
            case ReasonCode::ValueMismatch:
                return "valueMismatch";
            case ReasonCode::InstanceMismatch:
                return "instanceMismatch";
            case ReasonCode::DateMismatch:
                return "dateMismatch";
            case ReasonCode::RegExpMismatch:
                return "regexpMismatch";
            case ReasonCode::BufferLengthMismatch:
                return "bufferLengthMismatch";
            case ReasonCode::BufferByteMismatch:
                return "bufferByteMismatch";
            case ReasonCode::DataViewLengthMismatch:
                return "dataViewLengthMismatch";
            case ReasonCode::DataViewByteMismatch:
                return "dataViewByteMismatch";
            case ReasonCode::TypedArrayCtorMismatch:
                return "typedArrayCtorMismatch";
            case ReasonCode::TypedArrayLengthMismatch:
                return "typedArrayLengthMismatch";
            case ReasonCode::TypedArrayElementMismatch:
                return "typedArrayElementMismatch";
            case ReasonCode::ArrayLengthMismatch:
                return "arrayLengthMismatch";
            case ReasonCode::MapSizeMismatch:
                return "mapSizeMismatch";
            case ReasonCode::MapEntryMismatch:
                return "mapEntryMismatch";
            case ReasonCode::SetSizeMismatch:
                return "setSizeMismatch";
            case ReasonCode::SetElementMismatch:
                return "setElementMismatch";
            case ReasonCode::ObjectKeyCountMismatch:
                return "objectKeyCountMismatch";
            case ReasonCode::ObjectMissingKey:
                return "objectMissingKey";
        }
        return "none";
    }

    ComparisonResult::ComparisonResult()
        : equal(true),
          path(),
          reason(ReasonCode::None),
          detail() {
    }

    ComparisonResult ComparisonResult::Equal() {
        return ComparisonResult();
    }

    ComparisonResult ComparisonResult::Unequal(Path path, ReasonCode reason, std::string detail) {
        ComparisonResult result;
        result.equal = false;
        result.path = std::move(path);
        result.reason = reason;
        result.detail = std::move(detail);
        return result;
    }
}
