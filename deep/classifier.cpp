#include "mirror/deep/classifier.h"

#include <algorithm>

namespace mirror::deep {
    Shape Classify(const ValueHeap &heap, const Value &value) noexcept {
        const auto *record = heap.Find(value);
        if (!record) {
            return Shape::Detached;
        }
        switch (record->kind) {
            case Value::HandleKind::Date:
                return Shape::Date;
            case Value::HandleKind::RegExp:
                return Shape::RegExp;
            case Value::HandleKind::ArrayBuffer:
                return Shape::ArrayBuffer;
            case Value::HandleKind::DataView:
                return Shape::DataView;
            case Value::HandleKind::TypedArray:
                return Shape::TypedArray;
            case Value::HandleKind::Array:
                return Shape::Array;
            case Value::HandleKind::Map:
                return Shape::Map;
            case Value::HandleKind::Set:
                return Shape::Set;
            case Value::HandleKind::Object:
            case Value::HandleKind::Function:
            case Value::HandleKind::Error:
                return Shape::Object;
        }
        return Shape::Object;
    }

    std::string_view ShapeMismatchDetail(Shape left, Shape right) noexcept {
        if (left == Shape::Detached || right == Shape::Detached) {
            return "One side refers to a destroyed value";
        }
        switch (std::min(left, right)) {
            case Shape::Date:
                return "One is Date, the other is not";
            case Shape::RegExp:
                return "One is RegExp, the other is not";
            case Shape::ArrayBuffer:
                return "One is ArrayBuffer, the other is not";
            case Shape::DataView:
                return "One is DataView, the other is not";
            case Shape::TypedArray:
                return "One is a TypedArray/DataView, the other is not";
            case Shape::Array:
                return "One is Array, the other is not";
            case Shape::Map:
                return "One is Map, the other is not";
            case Shape::Set:
                return "One is Set, the other is not";
            case Shape::Object:
            case Shape::Detached:
                break;
        }
        return "One is Object, the other is not";
    }
}
