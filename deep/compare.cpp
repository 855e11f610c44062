#include "mirror/deep/compare.h"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>
#include <vector>

#include "mirror/deep/classifier.h"
#include "mirror/deep/cycle_tracker.h"

namespace mirror::deep {
    namespace {
        std::string ExpectedButGot(std::string_view prefix, const std::string &expected, const std::string &actual) {
            std::string detail("Expected ");
            detail.append(prefix);
            detail.append(expected);
            detail.append(" but got ");
            detail.append(actual);
            return detail;
        }

        std::string FormatNumber(double value) {
            // String() prints both zeros as "0"; other numbers follow
            // Number::toString.
            if (value == 0.0) {
                return "0";
            }
            return Value::Number(value).ToString();
        }

        std::string DescribeKey(const ValueHeap &heap, const PropertyKey &key) {
            if (key.IsSymbol()) {
                std::string text("Symbol(");
                text.append(heap.SymbolDescription(key.symbol));
                text.push_back(')');
                return text;
            }
            return key.name;
        }

        class Comparator {
        public:
            Comparator(const ValueHeap &heap, CompareMode mode, const CloneOptions &options, ComparisonStats *stats)
                : m_Heap(heap),
                  m_IdentityMustDiffer(mode == CompareMode::Clone),
                  m_Options(options),
                  m_Stats(stats),
                  m_Tracker() {
            }

            ComparisonResult Compare(const Value &x, const Value &y, const Path &path) {
                if (m_Stats) {
                    m_Stats->nodesVisited += 1;
                }
                if (m_IdentityMustDiffer && x.IsHandle() && y.IsHandle() && x == y) {
                    bool allowed = (m_Options.allowSharedFunctions && x.IsFunction())
                                   || (m_Options.allowSharedErrors && x.IsError());
                    if (!allowed) {
                        return ComparisonResult::Unequal(path, ReasonCode::SharedReference,
                                                         "Both sides reference the same object");
                    }
                }

                if (x == y) {
                    if (m_Options.strictNumbers && x.IsNumber() && !x.SameValue(y)) {
                        return NumberMismatch(x, y, path);
                    }
                    return ComparisonResult::Equal();
                }

                if (x.IsNumber() && y.IsNumber()) {
                    if (std::isnan(x.AsNumber()) && std::isnan(y.AsNumber())) {
                        return ComparisonResult::Equal();
                    }
                    return NumberMismatch(x, y, path);
                }

                auto typeX = x.TypeOf();
                auto typeY = y.TypeOf();
                if (typeX != typeY) {
                    return ComparisonResult::Unequal(path, ReasonCode::TypeMismatch,
                                                     ExpectedButGot("type ", std::string(typeY), std::string(typeX)));
                }

                if (x.IsNull() || y.IsNull()) {
                    return ComparisonResult::Unequal(path, ReasonCode::NullMismatch, "One is null, the other is not");
                }

                if (typeX != "object") {
                    if (x.SameValue(y)) {
                        return ComparisonResult::Equal();
                    }
                    return ComparisonResult::Unequal(path, ReasonCode::ValueMismatch,
                                                     ExpectedButGot("", DescribePrimitive(m_Heap, y),
                                                                    DescribePrimitive(m_Heap, x)));
                }

                return CompareComposite(x, y, path);
            }

            std::size_t TrackedPairs() const noexcept {
                return m_Tracker.PairCount();
            }

        private:
            const ValueHeap &m_Heap;
            bool m_IdentityMustDiffer;
            const CloneOptions &m_Options;
            ComparisonStats *m_Stats;
            CycleTracker m_Tracker;

            ComparisonResult NumberMismatch(const Value &x, const Value &y, const Path &path) const {
                return ComparisonResult::Unequal(path, ReasonCode::NumberValueMismatch,
                                                 ExpectedButGot("number ", FormatNumber(y.AsNumber()),
                                                                FormatNumber(x.AsNumber())));
            }

            ComparisonResult CompareComposite(const Value &x, const Value &y, const Path &path) {
                if (m_Tracker.IsSeen(x.AsHandle(), y.AsHandle())) {
                    if (m_Stats) {
                        m_Stats->cycleHits += 1;
                    }
                    return ComparisonResult::Equal();
                }
                m_Tracker.MarkSeen(x.AsHandle(), y.AsHandle());

                auto shapeX = Classify(m_Heap, x);
                auto shapeY = Classify(m_Heap, y);
                if (shapeX != shapeY || shapeX == Shape::Detached) {
                    return ComparisonResult::Unequal(path, ReasonCode::InstanceMismatch,
                                                     std::string(ShapeMismatchDetail(shapeX, shapeY)));
                }

                const auto &left = *m_Heap.Find(x);
                const auto &right = *m_Heap.Find(y);
                switch (shapeX) {
                    case Shape::Date:
                        return CompareDates(left, right, path);
                    case Shape::RegExp:
                        return CompareRegExps(left, right, path);
                    case Shape::ArrayBuffer:
                        return CompareBytes(x, y, path, ReasonCode::BufferLengthMismatch,
                                            ReasonCode::BufferByteMismatch);
                    case Shape::DataView:
                        return CompareBytes(x, y, path, ReasonCode::DataViewLengthMismatch,
                                            ReasonCode::DataViewByteMismatch);
                    case Shape::TypedArray:
                        return CompareTypedArrays(x, y, left, right, path);
                    case Shape::Array:
                        return CompareArrays(left, right, path);
                    case Shape::Map:
                        return m_Options.compareMapOrder ? CompareMapsOrdered(x, y, path)
                                                         : CompareMapsUnordered(x, y, path);
                    case Shape::Set:
                        return m_Options.compareSetOrder ? CompareSetsOrdered(x, y, path)
                                                         : CompareSetsUnordered(x, y, path);
                    case Shape::Object:
                        return CompareObjects(x, y, path);
                    case Shape::Detached:
                        break;
                }
                return ComparisonResult::Unequal(path, ReasonCode::InstanceMismatch,
                                                 std::string(ShapeMismatchDetail(shapeX, shapeY)));
            }

            ComparisonResult CompareDates(const ValueHeap::Record &left,
                                          const ValueHeap::Record &right,
                                          const Path &path) const {
                // Invalid dates hold NaN and never compare equal.
                if (left.timeValue == right.timeValue) {
                    return ComparisonResult::Equal();
                }
                return ComparisonResult::Unequal(path, ReasonCode::DateMismatch,
                                                 ExpectedButGot("time ", FormatNumber(right.timeValue),
                                                                FormatNumber(left.timeValue)));
            }

            ComparisonResult CompareRegExps(const ValueHeap::Record &left,
                                            const ValueHeap::Record &right,
                                            const Path &path) const {
                if (left.source == right.source && left.flags == right.flags) {
                    return ComparisonResult::Equal();
                }
                return ComparisonResult::Unequal(path, ReasonCode::RegExpMismatch,
                                                 ExpectedButGot("", "/" + right.source + "/" + right.flags,
                                                                "/" + left.source + "/" + left.flags));
            }

            ComparisonResult CompareBytes(const Value &x,
                                          const Value &y,
                                          const Path &path,
                                          ReasonCode lengthReason,
                                          ReasonCode byteReason) const {
                const std::uint8_t *bytesX = nullptr;
                const std::uint8_t *bytesY = nullptr;
                std::size_t sizeX = 0;
                std::size_t sizeY = 0;
                m_Heap.ResolveBytes(x, bytesX, sizeX);
                m_Heap.ResolveBytes(y, bytesY, sizeY);
                if (sizeX != sizeY) {
                    return ComparisonResult::Unequal(path, lengthReason,
                                                     ExpectedButGot("byteLength ", std::to_string(sizeY),
                                                                    std::to_string(sizeX)));
                }
                for (std::size_t i = 0; i < sizeX; ++i) {
                    if (bytesX[i] != bytesY[i]) {
                        return ComparisonResult::Unequal(path.Extend(PathSegment::FromIndex(i)), byteReason,
                                                         ExpectedButGot("", std::to_string(bytesY[i]),
                                                                        std::to_string(bytesX[i])));
                    }
                }
                return ComparisonResult::Equal();
            }

            ComparisonResult CompareTypedArrays(const Value &x,
                                                const Value &y,
                                                const ValueHeap::Record &left,
                                                const ValueHeap::Record &right,
                                                const Path &path) const {
                if (left.view.type != right.view.type) {
                    return ComparisonResult::Unequal(path, ReasonCode::TypedArrayCtorMismatch,
                                                     ExpectedButGot("", std::string(ElementTypeName(right.view.type)),
                                                                    std::string(ElementTypeName(left.view.type))));
                }
                auto lengthX = m_Heap.TypedArrayLength(x);
                auto lengthY = m_Heap.TypedArrayLength(y);
                if (lengthX != lengthY) {
                    return ComparisonResult::Unequal(path, ReasonCode::TypedArrayLengthMismatch,
                                                     ExpectedButGot("length ", std::to_string(lengthY),
                                                                    std::to_string(lengthX)));
                }
                Value elementX;
                Value elementY;
                for (std::size_t i = 0; i < lengthX; ++i) {
                    m_Heap.TypedArrayGet(x, i, elementX);
                    m_Heap.TypedArrayGet(y, i, elementY);
                    if (!elementX.SameValue(elementY)) {
                        return ComparisonResult::Unequal(path.Extend(PathSegment::FromIndex(i)),
                                                         ReasonCode::TypedArrayElementMismatch,
                                                         "Element " + std::to_string(i) + " differs");
                    }
                }
                return ComparisonResult::Equal();
            }

            ComparisonResult CompareArrays(const ValueHeap::Record &left,
                                           const ValueHeap::Record &right,
                                           const Path &path) {
                if (left.elements.size() != right.elements.size()) {
                    return ComparisonResult::Unequal(path, ReasonCode::ArrayLengthMismatch,
                                                     ExpectedButGot("length ", std::to_string(right.elements.size()),
                                                                    std::to_string(left.elements.size())));
                }
                for (std::size_t i = 0; i < left.elements.size(); ++i) {
                    auto result = Compare(left.elements[i], right.elements[i], path.Extend(PathSegment::FromIndex(i)));
                    if (!result.equal) {
                        return result;
                    }
                }
                return ComparisonResult::Equal();
            }

            ComparisonResult CheckCollectionSize(const Value &x, const Value &y, const Path &path,
                                                 ReasonCode reason) const {
                auto sizeX = m_Heap.CollectionSize(x);
                auto sizeY = m_Heap.CollectionSize(y);
                if (sizeX == sizeY) {
                    return ComparisonResult::Equal();
                }
                return ComparisonResult::Unequal(path, reason,
                                                 ExpectedButGot("size ", std::to_string(sizeY), std::to_string(sizeX)));
            }

            ComparisonResult CompareMapsOrdered(const Value &x, const Value &y, const Path &path) {
                auto sized = CheckCollectionSize(x, y, path, ReasonCode::MapSizeMismatch);
                if (!sized.equal) {
                    return sized;
                }
                std::vector<std::pair<Value, Value> > entriesX;
                std::vector<std::pair<Value, Value> > entriesY;
                m_Heap.MapEntries(x, entriesX);
                m_Heap.MapEntries(y, entriesY);
                for (std::size_t i = 0; i < entriesX.size(); ++i) {
                    auto keyMarker = PathSegment::FromMarker("@key(" + std::to_string(i) + ")");
                    auto result = Compare(entriesX[i].first, entriesY[i].first, path.Extend(std::move(keyMarker)));
                    if (!result.equal) {
                        return result;
                    }
                    result = Compare(entriesX[i].second, entriesY[i].second, path.Extend(PathSegment::FromIndex(i)));
                    if (!result.equal) {
                        return result;
                    }
                }
                return ComparisonResult::Equal();
            }

            // Greedy first-fit: each left entry claims the first unused right
            // entry whose key and value both match. No backtracking.
            ComparisonResult CompareMapsUnordered(const Value &x, const Value &y, const Path &path) {
                auto sized = CheckCollectionSize(x, y, path, ReasonCode::MapSizeMismatch);
                if (!sized.equal) {
                    return sized;
                }
                std::vector<std::pair<Value, Value> > entriesX;
                std::vector<std::pair<Value, Value> > entriesY;
                m_Heap.MapEntries(x, entriesX);
                m_Heap.MapEntries(y, entriesY);
                auto keyPath = path.Extend(PathSegment::FromMarker("@key"));
                auto valuePath = path.Extend(PathSegment::FromMarker("@value"));
                std::vector<bool> used(entriesY.size(), false);
                for (const auto &entryX: entriesX) {
                    bool matched = false;
                    for (std::size_t j = 0; j < entriesY.size(); ++j) {
                        if (used[j]) {
                            continue;
                        }
                        if (m_Stats) {
                            m_Stats->trialMatches += 1;
                        }
                        if (!Compare(entryX.first, entriesY[j].first, keyPath).equal) {
                            continue;
                        }
                        if (!Compare(entryX.second, entriesY[j].second, valuePath).equal) {
                            continue;
                        }
                        used[j] = true;
                        matched = true;
                        break;
                    }
                    if (!matched) {
                        return ComparisonResult::Unequal(path, ReasonCode::MapEntryMismatch,
                                                         "No matching [key,value] found in target Map");
                    }
                }
                return ComparisonResult::Equal();
            }

            ComparisonResult CompareSetsOrdered(const Value &x, const Value &y, const Path &path) {
                auto sized = CheckCollectionSize(x, y, path, ReasonCode::SetSizeMismatch);
                if (!sized.equal) {
                    return sized;
                }
                std::vector<Value> valuesX;
                std::vector<Value> valuesY;
                m_Heap.SetValues(x, valuesX);
                m_Heap.SetValues(y, valuesY);
                for (std::size_t i = 0; i < valuesX.size(); ++i) {
                    auto result = Compare(valuesX[i], valuesY[i], path.Extend(PathSegment::FromIndex(i)));
                    if (!result.equal) {
                        return result;
                    }
                }
                return ComparisonResult::Equal();
            }

            ComparisonResult CompareSetsUnordered(const Value &x, const Value &y, const Path &path) {
                auto sized = CheckCollectionSize(x, y, path, ReasonCode::SetSizeMismatch);
                if (!sized.equal) {
                    return sized;
                }
                std::vector<Value> valuesX;
                std::vector<Value> valuesY;
                m_Heap.SetValues(x, valuesX);
                m_Heap.SetValues(y, valuesY);
                std::vector<bool> used(valuesY.size(), false);
                for (const auto &valueX: valuesX) {
                    bool matched = false;
                    for (std::size_t j = 0; j < valuesY.size(); ++j) {
                        if (used[j]) {
                            continue;
                        }
                        if (m_Stats) {
                            m_Stats->trialMatches += 1;
                        }
                        if (Compare(valueX, valuesY[j], path.Extend(PathSegment::FromIndex(j))).equal) {
                            used[j] = true;
                            matched = true;
                            break;
                        }
                    }
                    if (!matched) {
                        return ComparisonResult::Unequal(path, ReasonCode::SetElementMismatch,
                                                         "No matching element found in target Set");
                    }
                }
                return ComparisonResult::Equal();
            }

            ComparisonResult CompareObjects(const Value &x, const Value &y, const Path &path) {
                std::vector<PropertyKey> keysX;
                std::vector<PropertyKey> keysY;
                m_Heap.OwnKeys(x, keysX);
                m_Heap.OwnKeys(y, keysY);
                if (keysX.size() != keysY.size()) {
                    return ComparisonResult::Unequal(path, ReasonCode::ObjectKeyCountMismatch,
                                                     "Expected " + std::to_string(keysY.size()) + " keys but got "
                                                     + std::to_string(keysX.size()));
                }
                for (const auto &key: keysX) {
                    if (std::find(keysY.begin(), keysY.end(), key) == keysY.end()) {
                        return ComparisonResult::Unequal(path, ReasonCode::ObjectMissingKey,
                                                         "Key " + DescribeKey(m_Heap, key) + " missing in target");
                    }
                }
                Value valueX;
                Value valueY;
                for (const auto &key: keysX) {
                    m_Heap.GetProperty(x, key, valueX);
                    m_Heap.GetProperty(y, key, valueY);
                    auto result = Compare(valueX, valueY, path.Extend(PathSegment::FromPropertyKey(m_Heap, key)));
                    if (!result.equal) {
                        return result;
                    }
                }
                return ComparisonResult::Equal();
            }
        };
    }

    ComparisonStats::ComparisonStats() noexcept
        : nodesVisited(0),
          cycleHits(0),
          trialMatches(0),
          trackedPairs(0) {
    }

    std::string DescribePrimitive(const ValueHeap &heap, const Value &value) {
        switch (value.kind) {
            case Value::Kind::Number:
                return FormatNumber(value.AsNumber());
            case Value::Kind::BigInt:
                return std::string(value.BigIntDigits());
            case Value::Kind::String:
                return std::string(value.AsString());
            case Value::Kind::Symbol: {
                std::string text("Symbol(");
                text.append(heap.SymbolDescription(value.AsSymbol()));
                text.push_back(')');
                return text;
            }
            case Value::Kind::Handle: {
                const auto *record = heap.Find(value);
                if (value.IsFunction()) {
                    std::string text("function ");
                    if (record) {
                        text.append(record->name);
                    }
                    text.append("() { [native code] }");
                    return text;
                }
                if (record && record->kind == Value::HandleKind::Error) {
                    return record->message.empty() ? record->name : record->name + ": " + record->message;
                }
                return "[object Object]";
            }
            default:
                return value.ToString();
        }
    }

    ComparisonResult DeepCompare(const ValueHeap &heap,
                                 const Value &actual,
                                 const Value &expected,
                                 CompareMode mode,
                                 const CloneOptions &options,
                                 ComparisonStats *stats) {
        Comparator comparator(heap, mode, options, stats);
        auto result = comparator.Compare(actual, expected, Path());
        if (stats) {
            stats->trackedPairs = comparator.TrackedPairs();
        }
        return result;
    }

    bool IsDeepEqual(const ValueHeap &heap,
                     const Value &actual,
                     const Value &expected,
                     const ComparisonOptions &options) {
        CloneOptions cloneOptions;
        static_cast<ComparisonOptions &>(cloneOptions) = options;
        return DeepCompare(heap, actual, expected, CompareMode::Equality, cloneOptions).equal;
    }

    bool IsDeepClone(const ValueHeap &heap,
                     const Value &actual,
                     const Value &expected,
                     const CloneOptions &options) {
        return DeepCompare(heap, actual, expected, CompareMode::Clone, options).equal;
    }
}
