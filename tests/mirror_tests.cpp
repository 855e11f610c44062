#include <iostream>
#include <limits>
#include <string>
#include <cmath>
#include <cstdint>
#include <initializer_list>
#include <utility>
#include <vector>

#include "mirror/config.h"
#include "mirror/heap.h"
#include "mirror/status.h"
#include "mirror/value.h"
#include "mirror/deep/assert.h"
#include "mirror/deep/compare.h"
#include "mirror/deep/path.h"
#include "mirror/deep/result.h"
#include "mirror/deep/structured_clone.h"

namespace {
    using mirror::CloneOptions;
    using mirror::ComparisonOptions;
    using mirror::ElementType;
    using mirror::HeapConfig;
    using mirror::PropertyKey;
    using mirror::StatusCode;
    using mirror::Value;
    using mirror::ValueHeap;
    using mirror::deep::AssertionReport;
    using mirror::deep::AssertOptions;
    using mirror::deep::CompareMode;
    using mirror::deep::ComparisonResult;
    using mirror::deep::ComparisonStats;
    using mirror::deep::Path;
    using mirror::deep::PathSegment;
    using mirror::deep::ReasonCode;

    bool ExpectTrue(bool condition, const std::string &message) {
        if (!condition) {
            std::cout << "    assertion failed: " << message << std::endl;
        }
        return condition;
    }

    bool ExpectStatus(StatusCode status, StatusCode expected, const std::string &message) {
        if (status != expected) {
            std::cout << "    status mismatch: " << message << std::endl;
            std::cout << "    expected " << static_cast<int>(expected)
                    << " got " << static_cast<int>(status) << std::endl;
            return false;
        }
        return true;
    }

    bool ExpectReason(const ComparisonResult &result, ReasonCode expected, const std::string &message) {
        if (result.equal || result.reason != expected) {
            std::cout << "    reason mismatch: " << message << std::endl;
            std::cout << "    expected " << mirror::deep::ReasonName(expected)
                    << " got " << (result.equal ? "equal" : mirror::deep::ReasonName(result.reason))
                    << std::endl;
            return false;
        }
        return true;
    }

    Value Num(double value) {
        return Value::Number(value);
    }

    Value Str(std::string_view value) {
        return Value::String(value);
    }

    Value MakeObject(ValueHeap &heap, std::initializer_list<std::pair<const char *, Value> > properties) {
        Value object;
        heap.CreateObject(object);
        for (const auto &property: properties) {
            heap.SetProperty(object, PropertyKey::Named(property.first), property.second);
        }
        return object;
    }

    Value MakeArray(ValueHeap &heap, std::initializer_list<Value> elements) {
        Value array;
        heap.CreateArray(array);
        for (const auto &element: elements) {
            heap.ArrayPush(array, element);
        }
        return array;
    }

    Value MakeSet(ValueHeap &heap, std::initializer_list<Value> values) {
        Value set;
        heap.CreateSet(set);
        for (const auto &value: values) {
            heap.SetAdd(set, value);
        }
        return set;
    }

    Value MakeMap(ValueHeap &heap, std::initializer_list<std::pair<Value, Value> > entries) {
        Value map;
        heap.CreateMap(map);
        for (const auto &entry: entries) {
            heap.MapSet(map, entry.first, entry.second);
        }
        return map;
    }

    Value MakeTyped(ValueHeap &heap, ElementType type, std::initializer_list<double> values) {
        Value array;
        heap.CreateTypedArray(type, values.size(), array);
        std::size_t index = 0;
        for (double value: values) {
            heap.TypedArraySet(array, index++, value);
        }
        return array;
    }

    Value MakeBuffer(ValueHeap &heap, std::initializer_list<std::uint8_t> bytes) {
        Value buffer;
        heap.CreateArrayBuffer(bytes.size(), buffer);
        std::vector<std::uint8_t> data(bytes);
        heap.WriteBytes(buffer, 0, data.data(), data.size());
        return buffer;
    }

    Path MakePath(std::initializer_list<PathSegment> segments) {
        return Path(segments);
    }

    ComparisonResult CompareEqual(const ValueHeap &heap, const Value &actual, const Value &expected,
                                  const ComparisonOptions &options = ComparisonOptions()) {
        CloneOptions cloneOptions;
        static_cast<ComparisonOptions &>(cloneOptions) = options;
        return mirror::deep::DeepCompare(heap, actual, expected, CompareMode::Equality, cloneOptions);
    }

    bool DefaultOptionsMatchDocumentedDefaults() {
        ComparisonOptions comparison;
        CloneOptions clone;
        auto config = mirror::MakeDefaultHeapConfig();
        bool ok = ExpectTrue(!comparison.compareSetOrder, "Set order ignored by default");
        ok &= ExpectTrue(!comparison.compareMapOrder, "Map order ignored by default");
        ok &= ExpectTrue(comparison.strictNumbers, "Strict numbers by default");
        ok &= ExpectTrue(clone.allowSharedFunctions, "Shared functions allowed by default");
        ok &= ExpectTrue(clone.allowSharedErrors, "Shared errors allowed by default");
        ok &= ExpectTrue(clone.strictNumbers, "Clone options inherit strict numbers");
        ok &= ExpectTrue(config.maxRecords > 0 && config.maxBufferBytes > 0, "Heap budgets populated");
        return ok;
    }

    bool ValueHeapRejectsStaleHandles() {
        ValueHeap heap;
        Value object;
        bool ok = ExpectStatus(heap.CreateObject(object), StatusCode::Ok, "Create object");
        ok &= ExpectStatus(heap.SetProperty(object, PropertyKey::Named("a"), Num(1)), StatusCode::Ok, "Set a");
        ok &= ExpectTrue(heap.Has(object), "Object live");
        ok &= ExpectTrue(heap.GetMetrics().liveRecords == 1, "One live record");
        ok &= ExpectStatus(heap.Destroy(object), StatusCode::Ok, "Destroy object");
        ok &= ExpectTrue(!heap.Has(object), "Object no longer live");
        ok &= ExpectStatus(heap.Destroy(object), StatusCode::NotFound, "Double destroy rejected");
        Value value;
        ok &= ExpectStatus(heap.GetProperty(object, PropertyKey::Named("a"), value), StatusCode::NotFound,
                           "Stale handle rejected");
        Value replacement;
        ok &= ExpectStatus(heap.CreateObject(replacement), StatusCode::Ok, "Create replacement");
        ok &= ExpectTrue(replacement.AsHandle() != object.AsHandle(), "Reused slot gets a new generation");
        ok &= ExpectTrue(!heap.Has(object), "Old handle stays stale");
        ok &= ExpectTrue(heap.GetMetrics().totalAllocations == 2, "Allocations counted");
        ok &= ExpectTrue(heap.GetMetrics().totalReleases == 1, "Releases counted");

        Value array;
        heap.CreateArray(array);
        ok &= ExpectStatus(heap.SetProperty(array, PropertyKey::Named("x"), Num(1)), StatusCode::NotFound,
                           "Arrays do not take named properties");
        ok &= ExpectStatus(heap.MapSet(array, Num(1), Num(2)), StatusCode::NotFound, "Wrong kind rejected");
        return ok;
    }

    bool ValueHeapOrdersOwnKeys() {
        ValueHeap heap;
        Value object;
        heap.CreateObject(object);
        auto tag = heap.CreateSymbol("tag");
        heap.SetProperty(object, PropertyKey::FromSymbol(tag), Num(0));
        heap.SetProperty(object, PropertyKey::Named("b"), Num(1));
        heap.SetProperty(object, PropertyKey::Named("2"), Num(2));
        heap.SetProperty(object, PropertyKey::Named("a"), Num(3));
        heap.SetProperty(object, PropertyKey::Named("1"), Num(4));
        heap.SetProperty(object, PropertyKey::Named("01"), Num(5));
        heap.DefineProperty(object, PropertyKey::Named("hidden"), Num(6), false);

        std::vector<PropertyKey> keys;
        bool ok = ExpectStatus(heap.OwnKeys(object, keys), StatusCode::Ok, "Enumerate keys");
        ok &= ExpectTrue(keys.size() == 6, "Hidden key skipped");
        if (keys.size() == 6) {
            ok &= ExpectTrue(keys[0].name == "1" && keys[1].name == "2", "Index keys ascend first");
            ok &= ExpectTrue(keys[2].name == "b" && keys[3].name == "a", "String keys keep insertion order");
            ok &= ExpectTrue(keys[4].name == "01", "Non-canonical index is a string key");
            ok &= ExpectTrue(keys[5].IsSymbol() && keys[5].symbol == tag.AsSymbol(), "Symbols last");
        }
        ok &= ExpectStatus(heap.OwnKeys(object, keys, false), StatusCode::Ok, "Enumerate all keys");
        ok &= ExpectTrue(keys.size() == 7, "Hidden key included");
        ok &= ExpectTrue(heap.SymbolDescription(tag.AsSymbol()) == "tag", "Symbol description kept");

        bool deleted = false;
        ok &= ExpectStatus(heap.DeleteProperty(object, PropertyKey::Named("b"), deleted), StatusCode::Ok, "Delete b");
        ok &= ExpectTrue(deleted, "b deleted");
        Value value;
        ok &= ExpectStatus(heap.GetProperty(object, PropertyKey::Named("b"), value), StatusCode::NotFound, "b gone");
        return ok;
    }

    bool ValueHeapCollectionsUseSameValueZero() {
        ValueHeap heap;
        auto map = MakeMap(heap, {});
        auto nan = std::numeric_limits<double>::quiet_NaN();
        bool ok = ExpectStatus(heap.MapSet(map, Num(nan), Str("nan")), StatusCode::Ok, "Set NaN key");
        ok &= ExpectStatus(heap.MapSet(map, Num(-0.0), Str("zero")), StatusCode::Ok, "Set -0 key");
        Value value;
        ok &= ExpectStatus(heap.MapGet(map, Num(nan), value), StatusCode::Ok, "Get NaN key");
        ok &= ExpectTrue(value.AsString() == "nan", "NaN key found");
        ok &= ExpectStatus(heap.MapGet(map, Num(0.0), value), StatusCode::Ok, "Get +0 key");
        ok &= ExpectTrue(value.AsString() == "zero", "+0 finds -0 entry");
        std::vector<std::pair<Value, Value> > entries;
        heap.MapEntries(map, entries);
        ok &= ExpectTrue(entries.size() == 2 && !std::signbit(entries[1].first.AsNumber()), "-0 key normalized");

        for (int i = 0; i < 100; ++i) {
            heap.MapSet(map, Num(i + 1), Num(i));
        }
        ok &= ExpectTrue(heap.CollectionSize(map) == 102, "Map grows");
        ok &= ExpectTrue(heap.GetMetrics().rehashes > 1, "Map rehashed while growing");
        bool deleted = false;
        ok &= ExpectStatus(heap.MapDelete(map, Num(nan), deleted), StatusCode::Ok, "Delete NaN key");
        ok &= ExpectTrue(deleted && !heap.MapHas(map, Num(nan)), "NaN entry removed");
        heap.MapEntries(map, entries);
        ok &= ExpectTrue(entries.front().first.AsNumber() == 0.0, "Order kept after delete");
        ok &= ExpectTrue(entries.back().first.AsNumber() == 100.0, "Tail kept after delete");

        Value object;
        heap.CreateObject(object);
        auto set = MakeSet(heap, {Num(1), Str("1"), object, Num(1)});
        ok &= ExpectTrue(heap.CollectionSize(set) == 3, "Duplicate add ignored");
        ok &= ExpectTrue(heap.SetHas(set, object), "Composite found by identity");
        Value other;
        heap.CreateObject(other);
        ok &= ExpectTrue(!heap.SetHas(set, other), "Distinct composite not found");
        std::vector<Value> values;
        heap.SetValues(set, values);
        ok &= ExpectTrue(values.size() == 3 && values[1].AsString() == "1", "Set keeps insertion order");
        return ok;
    }

    bool ValueHeapTypedArraysConvertElements() {
        ValueHeap heap;
        auto uint8 = MakeTyped(heap, ElementType::Uint8, {257, -1, 3.9});
        Value element;
        heap.TypedArrayGet(uint8, 0, element);
        bool ok = ExpectTrue(element.AsNumber() == 1, "Uint8 wraps 257");
        heap.TypedArrayGet(uint8, 1, element);
        ok &= ExpectTrue(element.AsNumber() == 255, "Uint8 wraps -1");
        heap.TypedArrayGet(uint8, 2, element);
        ok &= ExpectTrue(element.AsNumber() == 3, "Uint8 truncates");

        auto int8 = MakeTyped(heap, ElementType::Int8, {200});
        heap.TypedArrayGet(int8, 0, element);
        ok &= ExpectTrue(element.AsNumber() == -56, "Int8 wraps 200");

        auto clamped = MakeTyped(heap, ElementType::Uint8Clamped, {300, 1.5, 2.5, -4});
        heap.TypedArrayGet(clamped, 0, element);
        ok &= ExpectTrue(element.AsNumber() == 255, "Clamped saturates");
        heap.TypedArrayGet(clamped, 1, element);
        ok &= ExpectTrue(element.AsNumber() == 2, "Clamped rounds half to even upward");
        heap.TypedArrayGet(clamped, 2, element);
        ok &= ExpectTrue(element.AsNumber() == 2, "Clamped rounds half to even downward");
        heap.TypedArrayGet(clamped, 3, element);
        ok &= ExpectTrue(element.AsNumber() == 0, "Clamped floors at zero");

        auto floats = MakeTyped(heap, ElementType::Float32, {0.1});
        heap.TypedArrayGet(floats, 0, element);
        ok &= ExpectTrue(element.AsNumber() == static_cast<double>(0.1f), "Float32 narrows");

        Value bigints;
        heap.CreateTypedArray(ElementType::BigUint64, 2, bigints);
        ok &= ExpectStatus(heap.TypedArraySetBigInt(bigints, 0, -1), StatusCode::Ok, "Set BigUint64");
        heap.TypedArrayGet(bigints, 0, element);
        ok &= ExpectTrue(element.IsBigInt() && element.BigIntDigits() == "18446744073709551615",
                         "BigUint64 reads unsigned");
        ok &= ExpectStatus(heap.TypedArraySet(bigints, 1, 1.0), StatusCode::InvalidArgument,
                           "Number rejected by bigint array");
        ok &= ExpectStatus(heap.TypedArraySetBigInt(uint8, 0, 1), StatusCode::InvalidArgument,
                           "BigInt rejected by number array");
        ok &= ExpectStatus(heap.TypedArraySet(uint8, 3, 1.0), StatusCode::InvalidArgument, "Index out of range");

        auto buffer = MakeBuffer(heap, {0, 1, 2, 0, 1, 0});
        Value view;
        ok &= ExpectStatus(heap.CreateTypedArrayView(buffer, ElementType::Uint16, 2, 2, view), StatusCode::Ok,
                           "Create Uint16 view");
        heap.TypedArrayGet(view, 0, element);
        ok &= ExpectTrue(element.AsNumber() == 2, "View reads little endian");
        ok &= ExpectStatus(heap.CreateTypedArrayView(buffer, ElementType::Uint16, 1, 1, view),
                           StatusCode::InvalidArgument, "Misaligned view rejected");
        ok &= ExpectStatus(heap.CreateDataView(buffer, 4, 3, view), StatusCode::InvalidArgument,
                           "Overlong window rejected");
        return ok;
    }

    bool ValueHeapEnforcesBudgets() {
        HeapConfig config = mirror::MakeDefaultHeapConfig();
        config.maxRecords = 2;
        config.maxBufferBytes = 8;
        ValueHeap heap(config);
        Value first;
        Value second;
        Value third;
        bool ok = ExpectStatus(heap.CreateArrayBuffer(8, first), StatusCode::Ok, "Buffer within budget");
        ok &= ExpectStatus(heap.CreateArrayBuffer(1, second), StatusCode::CapacityExceeded, "Byte budget enforced");
        ok &= ExpectStatus(heap.CreateObject(second), StatusCode::Ok, "Second record");
        ok &= ExpectStatus(heap.CreateObject(third), StatusCode::CapacityExceeded, "Record budget enforced");
        ok &= ExpectTrue(heap.GetMetrics().bytesInUse == 8, "Bytes tracked");
        heap.Destroy(first);
        ok &= ExpectTrue(heap.GetMetrics().bytesInUse == 0, "Bytes released");
        ok &= ExpectTrue(heap.GetMetrics().peakBytesInUse == 8, "Peak bytes kept");
        ok &= ExpectStatus(heap.CreateObject(third), StatusCode::Ok, "Slot reusable after destroy");
        return ok;
    }

    bool SignedZeroAndNaNPolicy() {
        ValueHeap heap;
        ComparisonOptions loose;
        loose.strictNumbers = false;
        auto nan = std::numeric_limits<double>::quiet_NaN();
        bool ok = ExpectTrue(!mirror::deep::IsDeepEqual(heap, Num(0.0), Num(-0.0)), "0 and -0 differ by default");
        ok &= ExpectTrue(mirror::deep::IsDeepEqual(heap, Num(0.0), Num(-0.0), loose), "0 and -0 equal when loose");
        ok &= ExpectTrue(mirror::deep::IsDeepEqual(heap, Num(nan), Num(nan)), "NaN equals NaN");
        ok &= ExpectTrue(mirror::deep::IsDeepEqual(heap, Num(nan), Num(nan), loose), "NaN equals NaN when loose");
        ok &= ExpectTrue(!mirror::deep::IsDeepEqual(heap, Num(1), Num(2), loose), "Loose mode has no tolerance");
        ok &= ExpectTrue(!mirror::deep::IsDeepEqual(heap, Num(nan), Num(0), loose), "NaN differs from numbers");

        auto result = CompareEqual(heap, Num(0.0), Num(-0.0));
        ok &= ExpectReason(result, ReasonCode::NumberValueMismatch, "Signed zero reason");
        ok &= ExpectTrue(result.path.Empty(), "Root mismatch has empty path");
        ok &= ExpectTrue(result.detail == "Expected number 0 but got 0", "Zero detail uses host formatting");
        result = CompareEqual(heap, Num(1.5), Num(2));
        ok &= ExpectTrue(result.detail == "Expected number 2 but got 1.5", "Number detail");
        result = CompareEqual(heap, Num(1e-7), Num(1));
        ok &= ExpectTrue(result.detail == "Expected number 1 but got 1e-7", "Small exponent has no padding");
        result = CompareEqual(heap, Num(1e20), Num(0.000001));
        ok &= ExpectTrue(result.detail == "Expected number 0.000001 but got 100000000000000000000",
                         "Positional notation below 1e21");
        result = CompareEqual(heap, Num(1e21), Num(-1.5e-10));
        ok &= ExpectTrue(result.detail == "Expected number -1.5e-10 but got 1e+21", "Exponent notation from 1e21");
        result = CompareEqual(heap, Num(123.456), Num(1.25e25));
        ok &= ExpectTrue(result.detail == "Expected number 1.25e+25 but got 123.456", "Fractional digits");

        auto left = MakeArray(heap, {Num(-0.0)});
        auto right = MakeArray(heap, {Num(0.0)});
        ok &= ExpectTrue(!mirror::deep::IsDeepEqual(heap, left, right), "Nested signed zero differs");
        ok &= ExpectTrue(mirror::deep::IsDeepEqual(heap, left, right, loose), "Nested signed zero loose");
        return ok;
    }

    bool PrimitiveMismatchReasons() {
        ValueHeap heap;
        auto result = CompareEqual(heap, Str("1"), Num(1));
        bool ok = ExpectReason(result, ReasonCode::TypeMismatch, "String vs number");
        ok &= ExpectTrue(result.detail == "Expected type number but got string", "Type detail");

        result = CompareEqual(heap, Value::Undefined(), Value::Null());
        ok &= ExpectReason(result, ReasonCode::TypeMismatch, "Undefined vs null");

        Value object;
        heap.CreateObject(object);
        result = CompareEqual(heap, Value::Null(), object);
        ok &= ExpectReason(result, ReasonCode::NullMismatch, "Null vs object");
        ok &= ExpectTrue(result.detail == "One is null, the other is not", "Null detail");

        auto first = heap.CreateSymbol("id");
        auto second = heap.CreateSymbol("id");
        result = CompareEqual(heap, first, second);
        ok &= ExpectReason(result, ReasonCode::ValueMismatch, "Distinct symbols");
        ok &= ExpectTrue(result.detail == "Expected Symbol(id) but got Symbol(id)", "Symbol detail");
        ok &= ExpectTrue(mirror::deep::IsDeepEqual(heap, first, first), "Symbol equals itself");

        result = CompareEqual(heap, Value::BigInt(10), Value::BigInt(11));
        ok &= ExpectReason(result, ReasonCode::ValueMismatch, "BigInt values");
        ok &= ExpectTrue(result.detail == "Expected 11 but got 10", "BigInt detail");
        Value parsed;
        ok &= ExpectTrue(Value::ParseBigInt("-0010", parsed), "Parse bigint");
        ok &= ExpectTrue(mirror::deep::IsDeepEqual(heap, parsed, Value::BigInt(-10)), "BigInt compares by value");

        result = CompareEqual(heap, Str("a"), Str("b"));
        ok &= ExpectReason(result, ReasonCode::ValueMismatch, "Strings");
        ok &= ExpectTrue(result.detail == "Expected b but got a", "String detail");
        ok &= ExpectTrue(mirror::deep::IsDeepEqual(heap, Str("a"), Str("a")), "Equal strings");

        Value f;
        Value g;
        heap.CreateFunction("f", f);
        heap.CreateFunction("g", g);
        result = CompareEqual(heap, f, g);
        ok &= ExpectReason(result, ReasonCode::ValueMismatch, "Distinct functions");
        result = CompareEqual(heap, f, object);
        ok &= ExpectReason(result, ReasonCode::TypeMismatch, "Function vs object");
        ok &= ExpectTrue(result.detail == "Expected type object but got function", "Function type detail");
        return ok;
    }

    bool SetsCompareWithOptionalOrder() {
        ValueHeap heap;
        auto sa = MakeSet(heap, {Num(1), Num(2), Num(3)});
        auto sb = MakeSet(heap, {Num(3), Num(2), Num(1)});
        ComparisonOptions ordered;
        ordered.compareSetOrder = true;
        bool ok = ExpectTrue(mirror::deep::IsDeepEqual(heap, sa, sb), "Unordered sets equal");
        ok &= ExpectTrue(!mirror::deep::IsDeepEqual(heap, sa, sb, ordered), "Ordered sets differ");
        auto result = CompareEqual(heap, sa, sb, ordered);
        ok &= ExpectReason(result, ReasonCode::NumberValueMismatch, "Ordered element reason");
        ok &= ExpectTrue(result.path == MakePath({PathSegment::FromIndex(0)}), "Ordered path names position");

        auto sc = MakeSet(heap, {Num(1), Num(2)});
        result = CompareEqual(heap, sa, sc);
        ok &= ExpectReason(result, ReasonCode::SetSizeMismatch, "Set size");
        ok &= ExpectTrue(result.detail == "Expected size 2 but got 3", "Set size detail");

        auto sd = MakeSet(heap, {Num(1), Num(2), Num(4)});
        result = CompareEqual(heap, sa, sd);
        ok &= ExpectReason(result, ReasonCode::SetElementMismatch, "Unmatched element");
        ok &= ExpectTrue(result.path.Empty(), "Unordered failure reported at the set");
        ok &= ExpectTrue(result.detail == "No matching element found in target Set", "Set element detail");

        auto o1 = MakeObject(heap, {{"k", Num(1)}});
        auto o2 = MakeObject(heap, {{"k", Num(1)}});
        auto p1 = MakeObject(heap, {{"k", Num(1)}});
        auto p2 = MakeObject(heap, {{"k", Num(2)}});
        ComparisonStats stats;
        result = mirror::deep::DeepCompare(heap, MakeSet(heap, {o1, o2}), MakeSet(heap, {p1, p2}),
                                           CompareMode::Equality, CloneOptions(), &stats);
        ok &= ExpectReason(result, ReasonCode::SetElementMismatch, "Structural duplicates need distinct partners");
        ok &= ExpectTrue(stats.trialMatches == 2, "Each candidate tried once");
        return ok;
    }

    bool MapsWithCompositeKeys() {
        ValueHeap heap;
        auto ma = MakeMap(heap, {
                              {MakeObject(heap, {{"k", Num(1)}}), Str("a")},
                              {MakeObject(heap, {{"k", Num(2)}}), Str("b")}
                          });
        auto mb = MakeMap(heap, {
                              {MakeObject(heap, {{"k", Num(2)}}), Str("b")},
                              {MakeObject(heap, {{"k", Num(1)}}), Str("a")}
                          });
        ComparisonOptions ordered;
        ordered.compareMapOrder = true;
        bool ok = ExpectTrue(mirror::deep::IsDeepEqual(heap, ma, mb), "Unordered maps equal");
        ok &= ExpectTrue(!mirror::deep::IsDeepEqual(heap, ma, mb, ordered), "Ordered maps differ");

        auto result = CompareEqual(heap, ma, mb, ordered);
        ok &= ExpectReason(result, ReasonCode::NumberValueMismatch, "Ordered key reason");
        ok &= ExpectTrue(result.path == MakePath({PathSegment::FromMarker("@key(0)"), PathSegment::FromKey("k")}),
                         "Ordered key path");
        ok &= ExpectTrue(mirror::deep::RenderPath(result.path) == "[\"@key(0)\"].k", "Key marker rendering");

        auto mc = MakeMap(heap, {{Str("x"), Num(1)}, {Str("y"), Num(2)}});
        auto md = MakeMap(heap, {{Str("x"), Num(1)}, {Str("y"), Num(3)}});
        result = CompareEqual(heap, mc, md, ordered);
        ok &= ExpectTrue(result.path == MakePath({PathSegment::FromIndex(1)}), "Ordered value path");
        result = CompareEqual(heap, mc, md);
        ok &= ExpectReason(result, ReasonCode::MapEntryMismatch, "Unordered entry mismatch");
        ok &= ExpectTrue(result.path.Empty(), "Entry mismatch reported at the map");
        ok &= ExpectTrue(result.detail == "No matching [key,value] found in target Map", "Map entry detail");

        auto me = MakeMap(heap, {{Str("x"), Num(1)}});
        result = CompareEqual(heap, mc, me);
        ok &= ExpectReason(result, ReasonCode::MapSizeMismatch, "Map size");
        ok &= ExpectTrue(result.detail == "Expected size 1 but got 2", "Map size detail");
        return ok;
    }

    bool CyclicGraphsTerminate() {
        ValueHeap heap;
        auto a = MakeObject(heap, {{"x", Num(1)}});
        auto b = MakeObject(heap, {{"x", Num(1)}});
        heap.SetProperty(a, PropertyKey::Named("self"), a);
        heap.SetProperty(b, PropertyKey::Named("self"), b);
        ComparisonStats stats;
        auto result = mirror::deep::DeepCompare(heap, a, b, CompareMode::Equality, CloneOptions(), &stats);
        bool ok = ExpectTrue(result.equal, "Isomorphic cycles equal");
        ok &= ExpectTrue(stats.cycleHits == 1, "Cycle short-circuited once");
        ok &= ExpectTrue(mirror::deep::IsDeepEqual(heap, a, a), "Cyclic value equals itself");

        heap.SetProperty(b, PropertyKey::Named("x"), Num(2));
        result = CompareEqual(heap, a, b);
        ok &= ExpectReason(result, ReasonCode::NumberValueMismatch, "Cycle with differing leaf");
        ok &= ExpectTrue(result.path == MakePath({PathSegment::FromKey("x")}), "Leaf path");

        auto list = MakeArray(heap, {});
        heap.ArrayPush(list, list);
        auto other = MakeArray(heap, {});
        heap.ArrayPush(other, other);
        ok &= ExpectTrue(mirror::deep::IsDeepEqual(heap, list, other), "Self-containing arrays equal");

        auto one = MakeObject(heap, {{"k", Num(1)}});
        auto two = MakeObject(heap, {{"k", Num(2)}});
        auto twoAgain = MakeObject(heap, {{"k", Num(2)}});
        auto oneAgain = MakeObject(heap, {{"k", Num(1)}});
        ComparisonStats trial;
        result = mirror::deep::DeepCompare(heap, MakeSet(heap, {one, two}), MakeSet(heap, {twoAgain, oneAgain}),
                                           CompareMode::Equality, CloneOptions(), &trial);
        ok &= ExpectTrue(result.equal, "Reordered set of objects equal");
        ok &= ExpectTrue(trial.trialMatches == 3, "First element needs two candidates");
        ok &= ExpectTrue(trial.trackedPairs == 4, "Failed trial pair stays marked");
        return ok;
    }

    bool CloneChecksRejectSharedReferences() {
        ValueHeap heap;
        auto x = MakeObject(heap, {{"a", Num(1)}});
        auto result = mirror::deep::DeepCompare(heap, x, x, CompareMode::Clone);
        bool ok = ExpectReason(result, ReasonCode::SharedReference, "Same object is not a clone");
        ok &= ExpectTrue(result.detail == "Both sides reference the same object", "Shared detail");
        ok &= ExpectTrue(mirror::deep::IsDeepClone(heap, MakeArray(heap, {}), MakeArray(heap, {})),
                         "Distinct empty arrays are clones");

        Value date;
        heap.CreateDate(0.0, date);
        auto buffer = MakeBuffer(heap, {1, 2});
        Value view;
        heap.CreateDataView(buffer, 0, 2, view);
        const std::pair<const char *, Value> aliased[] = {
            {"Array", MakeArray(heap, {Num(1)})},
            {"Map", MakeMap(heap, {{Str("k"), Num(1)}})},
            {"Set", MakeSet(heap, {Num(1)})},
            {"Date", date},
            {"ArrayBuffer", buffer},
            {"DataView", view},
            {"TypedArray", MakeTyped(heap, ElementType::Int16, {1, 2})}
        };
        for (const auto &entry: aliased) {
            ok &= ExpectTrue(mirror::deep::IsDeepEqual(heap, entry.second, entry.second),
                             std::string(entry.first) + " equals itself");
            result = mirror::deep::DeepCompare(heap, entry.second, entry.second, CompareMode::Clone);
            ok &= ExpectReason(result, ReasonCode::SharedReference, std::string(entry.first) + " is not its own clone");
            ok &= ExpectTrue(result.path.Empty(), std::string(entry.first) + " aliasing reported at the root");
        }

        auto shared = MakeObject(heap, {});
        auto left = MakeObject(heap, {{"x", shared}});
        auto right = MakeObject(heap, {{"x", shared}});
        ok &= ExpectTrue(mirror::deep::IsDeepEqual(heap, left, right), "Shared child is still equal");
        result = mirror::deep::DeepCompare(heap, left, right, CompareMode::Clone);
        ok &= ExpectReason(result, ReasonCode::SharedReference, "Shared child rejected");
        ok &= ExpectTrue(result.path == MakePath({PathSegment::FromKey("x")}), "Shared child path");

        Value fn;
        heap.CreateFunction("fn", fn);
        auto withFnA = MakeObject(heap, {{"fn", fn}});
        auto withFnB = MakeObject(heap, {{"fn", fn}});
        CloneOptions strict;
        strict.allowSharedFunctions = false;
        strict.allowSharedErrors = false;
        ok &= ExpectTrue(mirror::deep::IsDeepClone(heap, withFnA, withFnB), "Shared function allowed");
        ok &= ExpectTrue(!mirror::deep::IsDeepClone(heap, withFnA, withFnB, strict), "Shared function rejected");

        Value error;
        heap.CreateError("TypeError", "boom", error);
        auto withErrA = MakeObject(heap, {{"error", error}});
        auto withErrB = MakeObject(heap, {{"error", error}});
        ok &= ExpectTrue(mirror::deep::IsDeepClone(heap, withErrA, withErrB), "Shared error allowed");
        ok &= ExpectTrue(!mirror::deep::IsDeepClone(heap, withErrA, withErrB, strict), "Shared error rejected");

        ok &= ExpectTrue(mirror::deep::IsDeepClone(heap, Num(1), Num(1)), "Primitives may be identical");
        ok &= ExpectTrue(mirror::deep::IsDeepClone(heap, Str("s"), Str("s")), "Strings may be identical");
        ok &= ExpectTrue(!mirror::deep::IsDeepClone(heap, Num(0.0), Num(-0.0)), "Clone checks keep number policy");
        return ok;
    }

    bool PathPinpointsFirstDivergence() {
        ValueHeap heap;
        auto left = MakeObject(heap, {{"a", MakeArray(heap, {Num(1), Num(2)})}});
        auto right = MakeObject(heap, {{"a", MakeArray(heap, {Num(1), Num(3)})}});
        auto result = CompareEqual(heap, left, right);
        bool ok = ExpectReason(result, ReasonCode::NumberValueMismatch, "Leaf reason");
        ok &= ExpectTrue(result.path == MakePath({PathSegment::FromKey("a"), PathSegment::FromIndex(1)}),
                         "Path is [a, 1]");
        ok &= ExpectTrue(result.path.Size() == 2, "Path length equals depth");
        ok &= ExpectTrue(result.detail == "Expected number 3 but got 2", "Leaf detail");
        ok &= ExpectTrue(mirror::deep::RenderPath(result.path) == "a[1]", "Rendered path");

        auto again = CompareEqual(heap, left, right);
        ok &= ExpectTrue(again.path == result.path && again.reason == result.reason, "Deterministic result");
        ok &= ExpectTrue(mirror::deep::IsDeepEqual(heap, right, left) == mirror::deep::IsDeepEqual(heap, left, right),
                         "Symmetric outcome");
        return ok;
    }

    bool TypedArraysRequireSameConstructor() {
        ValueHeap heap;
        auto bytes = MakeTyped(heap, ElementType::Uint8, {1, 2});
        auto words = MakeTyped(heap, ElementType::Uint16, {1, 2});
        auto result = CompareEqual(heap, bytes, words);
        bool ok = ExpectReason(result, ReasonCode::TypedArrayCtorMismatch, "Element type differs");
        ok &= ExpectTrue(result.detail == "Expected Uint16Array but got Uint8Array", "Constructor detail");

        auto longer = MakeTyped(heap, ElementType::Uint8, {1, 2, 3});
        result = CompareEqual(heap, bytes, longer);
        ok &= ExpectReason(result, ReasonCode::TypedArrayLengthMismatch, "Length differs");
        ok &= ExpectTrue(result.detail == "Expected length 3 but got 2", "Length detail");

        auto changed = MakeTyped(heap, ElementType::Uint8, {1, 5});
        result = CompareEqual(heap, bytes, changed);
        ok &= ExpectReason(result, ReasonCode::TypedArrayElementMismatch, "Element differs");
        ok &= ExpectTrue(result.path == MakePath({PathSegment::FromIndex(1)}), "Element path");
        ok &= ExpectTrue(result.detail == "Element 1 differs", "Element detail");

        auto nan = std::numeric_limits<double>::quiet_NaN();
        ok &= ExpectTrue(mirror::deep::IsDeepEqual(heap, MakeTyped(heap, ElementType::Float64, {nan}),
                                                   MakeTyped(heap, ElementType::Float64, {nan})),
                         "NaN elements equal");
        ComparisonOptions loose;
        loose.strictNumbers = false;
        ok &= ExpectTrue(!mirror::deep::IsDeepEqual(heap, MakeTyped(heap, ElementType::Float64, {0.0}),
                                                    MakeTyped(heap, ElementType::Float64, {-0.0}), loose),
                         "Signed zero elements always differ");

        auto array = MakeArray(heap, {Num(1), Num(2)});
        result = CompareEqual(heap, bytes, array);
        ok &= ExpectReason(result, ReasonCode::InstanceMismatch, "Typed array vs array");
        ok &= ExpectTrue(result.detail == "One is a TypedArray/DataView, the other is not", "View instance detail");
        return ok;
    }

    bool BinaryBuffersAndViews() {
        ValueHeap heap;
        auto a = MakeBuffer(heap, {1, 2, 3});
        auto b = MakeBuffer(heap, {1, 2, 3});
        auto c = MakeBuffer(heap, {1, 2, 9});
        auto d = MakeBuffer(heap, {1, 2, 3, 4});
        bool ok = ExpectTrue(mirror::deep::IsDeepEqual(heap, a, b), "Equal buffers");
        auto result = CompareEqual(heap, a, c);
        ok &= ExpectReason(result, ReasonCode::BufferByteMismatch, "Byte differs");
        ok &= ExpectTrue(result.path == MakePath({PathSegment::FromIndex(2)}), "Byte path");
        ok &= ExpectTrue(result.detail == "Expected 9 but got 3", "Byte detail");
        result = CompareEqual(heap, a, d);
        ok &= ExpectReason(result, ReasonCode::BufferLengthMismatch, "Buffer length");
        ok &= ExpectTrue(result.detail == "Expected byteLength 4 but got 3", "Buffer length detail");

        auto wide = MakeBuffer(heap, {0, 7, 8, 0});
        auto narrow = MakeBuffer(heap, {7, 8});
        Value wideView;
        Value narrowView;
        heap.CreateDataView(wide, 1, 2, wideView);
        heap.CreateDataView(narrow, 0, 2, narrowView);
        ok &= ExpectTrue(mirror::deep::IsDeepEqual(heap, wideView, narrowView), "Views compare their windows");
        Value shortView;
        heap.CreateDataView(narrow, 0, 1, shortView);
        result = CompareEqual(heap, wideView, shortView);
        ok &= ExpectReason(result, ReasonCode::DataViewLengthMismatch, "View length");
        Value shiftedView;
        heap.CreateDataView(wide, 0, 2, shiftedView);
        result = CompareEqual(heap, shiftedView, narrowView);
        ok &= ExpectReason(result, ReasonCode::DataViewByteMismatch, "View byte");
        ok &= ExpectTrue(result.path == MakePath({PathSegment::FromIndex(0)}), "View byte path");

        auto typed = MakeTyped(heap, ElementType::Uint8, {7, 8});
        result = CompareEqual(heap, narrowView, typed);
        ok &= ExpectReason(result, ReasonCode::InstanceMismatch, "DataView vs typed array");
        ok &= ExpectTrue(result.detail == "One is DataView, the other is not", "DataView instance detail");
        result = CompareEqual(heap, narrow, typed);
        ok &= ExpectTrue(result.detail == "One is ArrayBuffer, the other is not", "Buffer instance detail");
        return ok;
    }

    bool DatesAndRegExps() {
        ValueHeap heap;
        Value first;
        Value second;
        Value third;
        heap.CreateDate(1000, first);
        heap.CreateDate(1000, second);
        heap.CreateDate(2000, third);
        bool ok = ExpectTrue(mirror::deep::IsDeepEqual(heap, first, second), "Same instant equal");
        auto result = CompareEqual(heap, first, third);
        ok &= ExpectReason(result, ReasonCode::DateMismatch, "Instant differs");
        ok &= ExpectTrue(result.detail == "Expected time 2000 but got 1000", "Date detail");

        Value invalidA;
        Value invalidB;
        heap.CreateDate(std::numeric_limits<double>::quiet_NaN(), invalidA);
        heap.CreateDate(std::numeric_limits<double>::infinity(), invalidB);
        result = CompareEqual(heap, invalidA, invalidB);
        ok &= ExpectReason(result, ReasonCode::DateMismatch, "Invalid dates never equal");
        ok &= ExpectTrue(result.detail == "Expected time NaN but got NaN", "Invalid date detail");

        auto object = MakeObject(heap, {});
        result = CompareEqual(heap, first, object);
        ok &= ExpectReason(result, ReasonCode::InstanceMismatch, "Date vs object");
        ok &= ExpectTrue(result.detail == "One is Date, the other is not", "Date instance detail");

        Value re1;
        Value re2;
        Value re3;
        heap.CreateRegExp("a+", "gi", re1);
        heap.CreateRegExp("a+", "ig", re2);
        heap.CreateRegExp("b", "g", re3);
        ok &= ExpectTrue(mirror::deep::IsDeepEqual(heap, re1, re2), "Flags are canonical");
        Value re4;
        heap.CreateRegExp("a", "g", re4);
        result = CompareEqual(heap, re4, re3);
        ok &= ExpectReason(result, ReasonCode::RegExpMismatch, "Source differs");
        ok &= ExpectTrue(result.detail == "Expected /b/g but got /a/g", "RegExp detail");
        result = CompareEqual(heap, re1, first);
        ok &= ExpectTrue(result.detail == "One is Date, the other is not", "Date takes precedence");
        return ok;
    }

    bool ObjectKeysAndSymbols() {
        ValueHeap heap;
        auto one = MakeObject(heap, {{"a", Num(1)}});
        auto two = MakeObject(heap, {{"a", Num(1)}, {"b", Num(2)}});
        auto result = CompareEqual(heap, one, two);
        bool ok = ExpectReason(result, ReasonCode::ObjectKeyCountMismatch, "Key count");
        ok &= ExpectTrue(result.detail == "Expected 2 keys but got 1", "Key count detail");

        auto other = MakeObject(heap, {{"a", Num(1)}, {"c", Num(2)}});
        result = CompareEqual(heap, two, other);
        ok &= ExpectReason(result, ReasonCode::ObjectMissingKey, "Missing key");
        ok &= ExpectTrue(result.detail == "Key b missing in target", "Missing key detail");

        auto reordered = MakeObject(heap, {{"b", Num(2)}, {"a", Num(1)}});
        ok &= ExpectTrue(mirror::deep::IsDeepEqual(heap, two, reordered), "Key order ignored");

        auto tag = heap.CreateSymbol("tag");
        auto left = MakeObject(heap, {});
        auto right = MakeObject(heap, {});
        heap.SetProperty(left, PropertyKey::FromSymbol(tag), Num(1));
        heap.SetProperty(right, PropertyKey::FromSymbol(tag), Num(2));
        result = CompareEqual(heap, left, right);
        ok &= ExpectReason(result, ReasonCode::NumberValueMismatch, "Symbol-keyed value");
        ok &= ExpectTrue(mirror::deep::RenderPath(result.path) == "[Symbol(tag)]", "Symbol path rendering");

        heap.DefineProperty(left, PropertyKey::Named("hidden"), Num(1), false);
        heap.SetProperty(right, PropertyKey::FromSymbol(tag), Num(1));
        ok &= ExpectTrue(mirror::deep::IsDeepEqual(heap, left, right), "Non-enumerable keys ignored");

        Value errorA;
        Value errorB;
        heap.CreateError("TypeError", "one", errorA);
        heap.CreateError("RangeError", "two", errorB);
        ok &= ExpectTrue(mirror::deep::IsDeepEqual(heap, errorA, errorB), "Error name and message are hidden");
        heap.SetProperty(errorA, PropertyKey::Named("code"), Num(1));
        result = CompareEqual(heap, errorA, errorB);
        ok &= ExpectReason(result, ReasonCode::ObjectKeyCountMismatch, "Error own properties compared");

        auto shortArray = MakeArray(heap, {Num(1), Num(2)});
        auto longArray = MakeArray(heap, {Num(1), Num(2), Num(3)});
        result = CompareEqual(heap, shortArray, longArray);
        ok &= ExpectReason(result, ReasonCode::ArrayLengthMismatch, "Array length");
        ok &= ExpectTrue(result.detail == "Expected length 3 but got 2", "Array length detail");
        result = CompareEqual(heap, shortArray, one);
        ok &= ExpectReason(result, ReasonCode::InstanceMismatch, "Array vs object");
        ok &= ExpectTrue(result.detail == "One is Array, the other is not", "Array instance detail");
        result = CompareEqual(heap, MakeSet(heap, {}), MakeMap(heap, {}));
        ok &= ExpectTrue(result.detail == "One is Map, the other is not", "Map takes precedence over Set");
        return ok;
    }

    bool StaleHandlesCompareUnequal() {
        ValueHeap heap;
        auto stale = MakeObject(heap, {});
        heap.Destroy(stale);
        auto live = MakeObject(heap, {});
        auto result = CompareEqual(heap, stale, live);
        bool ok = ExpectReason(result, ReasonCode::InstanceMismatch, "Stale vs live");
        ok &= ExpectTrue(result.detail == "One side refers to a destroyed value", "Stale detail");
        ok &= ExpectTrue(mirror::deep::IsDeepEqual(heap, stale, stale), "Stale handle equals itself");
        auto other = MakeObject(heap, {});
        heap.Destroy(other);
        ok &= ExpectTrue(!mirror::deep::IsDeepEqual(heap, stale, other), "Distinct stale handles differ");

        auto retagged = Value::Handle(live.AsHandle(), Value::HandleKind::Array);
        result = CompareEqual(heap, retagged, MakeArray(heap, {}));
        ok &= ExpectReason(result, ReasonCode::InstanceMismatch, "Handle with a foreign kind tag");
        ok &= ExpectTrue(result.detail == "One side refers to a destroyed value", "Foreign tag resolves to nothing");
        return ok;
    }

    bool AssertionReportsRenderPaths() {
        ValueHeap heap;
        auto left = MakeObject(heap, {{"a", MakeArray(heap, {Num(1), Num(2)})}});
        auto right = MakeObject(heap, {{"a", MakeArray(heap, {Num(1), Num(3)})}});
        AssertOptions options;
        options.path = MakePath({PathSegment::FromKey("root")});
        options.label = "payload";
        options.hint = "compare fixtures";
        AssertionReport report;
        bool ok = ExpectStatus(mirror::deep::AssertDeepEqual(heap, left, right, ComparisonOptions(), options, &report),
                               StatusCode::AssertionFailed, "Assertion fails");
        ok &= ExpectTrue(report.renderedPath == "root.a[1]", "Prefixed path rendered");
        ok &= ExpectTrue(report.reason == ReasonCode::NumberValueMismatch, "Reason carried");
        ok &= ExpectTrue(report.receivedType == "object" && report.receivedTag == "[object Object]", "Received type");
        ok &= ExpectTrue(report.message ==
                         "ValidationError: expected deep equality to expected value (numberValueMismatch: "
                         "Expected number 3 but got 2) at root.a[1] (payload) | received.type=object "
                         "tag=[object Object] preview={a} | hint: compare fixtures",
                         "Formatted message");
        ok &= ExpectStatus(mirror::deep::AssertDeepEqual(heap, left, left), StatusCode::Ok, "Equal passes");

        AssertOptions cloneOptions;
        cloneOptions.message = "CloneError";
        ok &= ExpectStatus(mirror::deep::AssertDeepClone(heap, left, left, CloneOptions(), cloneOptions, &report),
                           StatusCode::AssertionFailed, "Clone assertion fails");
        ok &= ExpectTrue(report.message.rfind(
                             "CloneError: expected deep clone (deep equality + no shared references) "
                             "(sharedReference: Both sides reference the same object) | received.type=object", 0) == 0,
                         "Clone message without location");
        ok &= ExpectStatus(mirror::deep::AssertDeepClone(heap, left, right), StatusCode::AssertionFailed,
                           "Report is optional");

        ok &= ExpectTrue(mirror::deep::PreviewValue(heap, Str("hi")) == "\"hi\"", "String preview");
        ok &= ExpectTrue(mirror::deep::ReceivedType(Value::Null()) == "null", "Null type");
        ok &= ExpectTrue(mirror::deep::ReceivedTag(heap, MakeTyped(heap, ElementType::Int8, {})) ==
                         "[object Int8Array]", "Typed array tag");
        return ok;
    }

    bool PathRenderingFollowsAccessSyntax() {
        using mirror::deep::RenderPath;
        bool ok = ExpectTrue(RenderPath(Path()).empty(), "Empty path");
        ok &= ExpectTrue(RenderPath(MakePath({
                             PathSegment::FromKey("meta"), PathSegment::FromKey("tags"), PathSegment::FromIndex(1),
                             PathSegment::FromKey("id")
                         })) == "meta.tags[1].id", "Dotted path");
        ok &= ExpectTrue(RenderPath(MakePath({PathSegment::FromIndex(0), PathSegment::FromKey("x")})) == "[0].x",
                         "Leading index");
        ok &= ExpectTrue(RenderPath(MakePath({PathSegment::FromKey("a-b")})) == "[\"a-b\"]", "Quoted key");
        ok &= ExpectTrue(RenderPath(MakePath({PathSegment::FromKey("q\"t")})) == "[\"q\\\"t\"]", "Escaped key");
        ok &= ExpectTrue(RenderPath(MakePath({PathSegment::FromKey("$ok"), PathSegment::FromKey("1x")})) ==
                         "$ok[\"1x\"]", "Identifier rules");

        auto base = MakePath({PathSegment::FromKey("a")});
        auto left = base.Extend(PathSegment::FromIndex(0));
        auto right = base.Extend(PathSegment::FromIndex(1));
        ok &= ExpectTrue(base.Size() == 1, "Extending leaves base untouched");
        ok &= ExpectTrue(left[1] != right[1], "Siblings see their own segment");
        return ok;
    }

    bool StructuredCloneProducesIndependentCopy() {
        ValueHeap heap;
        auto shared = MakeObject(heap, {{"n", Num(1)}});
        Value fn;
        heap.CreateFunction("handler", fn);
        Value error;
        heap.CreateError("Error", "failed", error);
        Value date;
        heap.CreateDate(86400000, date);
        Value pattern;
        heap.CreateRegExp("^a", "m", pattern);
        auto buffer = MakeBuffer(heap, {1, 2, 3, 4});
        Value bytes;
        Value view;
        heap.CreateTypedArrayView(buffer, ElementType::Uint8, 0, 4, bytes);
        heap.CreateDataView(buffer, 1, 2, view);

        auto source = MakeObject(heap, {
                                     {"first", shared},
                                     {"second", shared},
                                     {"list", MakeArray(heap, {Num(1), Str("two"), Value::Null()})},
                                     {"map", MakeMap(heap, {{Str("k"), shared}})},
                                     {"set", MakeSet(heap, {Num(1), Num(2)})},
                                     {"fn", fn},
                                     {"error", error},
                                     {"date", date},
                                     {"pattern", pattern},
                                     {"bytes", bytes},
                                     {"view", view}
                                 });
        heap.SetProperty(source, PropertyKey::Named("self"), source);

        Value clone;
        bool ok = ExpectStatus(mirror::deep::StructuredClone(heap, source, clone), StatusCode::Ok, "Clone graph");
        ok &= ExpectTrue(clone.AsHandle() != source.AsHandle(), "Fresh root");
        ok &= ExpectTrue(mirror::deep::IsDeepEqual(heap, clone, source), "Clone deep equal");
        ok &= ExpectTrue(mirror::deep::IsDeepClone(heap, clone, source), "Clone shares nothing");
        CloneOptions strict;
        strict.allowSharedFunctions = false;
        ok &= ExpectTrue(!mirror::deep::IsDeepClone(heap, clone, source, strict), "Function stays shared");

        Value first;
        Value second;
        Value self;
        heap.GetProperty(clone, PropertyKey::Named("first"), first);
        heap.GetProperty(clone, PropertyKey::Named("second"), second);
        heap.GetProperty(clone, PropertyKey::Named("self"), self);
        ok &= ExpectTrue(first == second, "Internal sharing preserved");
        ok &= ExpectTrue(first != shared, "Shared child copied");
        ok &= ExpectTrue(self == clone, "Cycle preserved");

        Value clonedBytes;
        Value clonedView;
        heap.GetProperty(clone, PropertyKey::Named("bytes"), clonedBytes);
        heap.GetProperty(clone, PropertyKey::Named("view"), clonedView);
        const auto *bytesRecord = heap.Find(clonedBytes);
        const auto *viewRecord = heap.Find(clonedView);
        ok &= ExpectTrue(bytesRecord && viewRecord && bytesRecord->view.buffer == viewRecord->view.buffer,
                         "Views share one copied buffer");
        ok &= ExpectTrue(bytesRecord && bytesRecord->view.buffer != buffer.AsHandle(), "Buffer copied");

        heap.TypedArraySet(clonedBytes, 1, 42);
        Value element;
        heap.TypedArrayGet(bytes, 1, element);
        ok &= ExpectTrue(element.AsNumber() == 2, "Source bytes untouched");
        auto result = CompareEqual(heap, clone, source);
        ok &= ExpectReason(result, ReasonCode::TypedArrayElementMismatch, "Mutation visible to comparison");
        ok &= ExpectTrue(mirror::deep::RenderPath(result.path) == "bytes[1]", "Mutation located");

        Value primitive;
        ok &= ExpectStatus(mirror::deep::StructuredClone(heap, Str("text"), primitive), StatusCode::Ok,
                           "Clone primitive");
        ok &= ExpectTrue(primitive.AsString() == "text", "Primitive copied");
        heap.Destroy(shared);
        ok &= ExpectStatus(mirror::deep::StructuredClone(heap, shared, primitive), StatusCode::NotFound,
                           "Stale input rejected");
        return ok;
    }

    struct TestCase {
        const char *name;

        bool (*fn)();
    };
}

int main() {
    std::vector<TestCase> tests{
        {"DefaultOptionsMatchDocumentedDefaults", DefaultOptionsMatchDocumentedDefaults},
        {"ValueHeapRejectsStaleHandles", ValueHeapRejectsStaleHandles},
        {"ValueHeapOrdersOwnKeys", ValueHeapOrdersOwnKeys},
        {"ValueHeapCollectionsUseSameValueZero", ValueHeapCollectionsUseSameValueZero},
        {"ValueHeapTypedArraysConvertElements", ValueHeapTypedArraysConvertElements},
        {"ValueHeapEnforcesBudgets", ValueHeapEnforcesBudgets},
        {"SignedZeroAndNaNPolicy", SignedZeroAndNaNPolicy},
        {"PrimitiveMismatchReasons", PrimitiveMismatchReasons},
        {"SetsCompareWithOptionalOrder", SetsCompareWithOptionalOrder},
        {"MapsWithCompositeKeys", MapsWithCompositeKeys},
        {"CyclicGraphsTerminate", CyclicGraphsTerminate},
        {"CloneChecksRejectSharedReferences", CloneChecksRejectSharedReferences},
        {"PathPinpointsFirstDivergence", PathPinpointsFirstDivergence},
        {"TypedArraysRequireSameConstructor", TypedArraysRequireSameConstructor},
        {"BinaryBuffersAndViews", BinaryBuffersAndViews},
        {"DatesAndRegExps", DatesAndRegExps},
        {"ObjectKeysAndSymbols", ObjectKeysAndSymbols},
        {"StaleHandlesCompareUnequal", StaleHandlesCompareUnequal},
        {"AssertionReportsRenderPaths", AssertionReportsRenderPaths},
        {"PathRenderingFollowsAccessSyntax", PathRenderingFollowsAccessSyntax},
        {"StructuredCloneProducesIndependentCopy", StructuredCloneProducesIndependentCopy}
    };

    std::size_t passed = 0;
    for (const auto &test: tests) {
        std::cout << "Running " << test.name << std::endl;
        if (test.fn()) {
            ++passed;
            std::cout << "  [PASS]" << std::endl;
        } else {
            std::cout << "  [FAIL]" << std::endl;
            std::cout << "Executed " << passed << " / " << tests.size() << " tests" << std::endl;
            return 1;
        }
    }

    std::cout << "Executed " << passed << " / " << tests.size() << " tests" << std::endl;
    return 0;
}
