#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "mirror/config.h"
#include "mirror/status.h"
#include "mirror/value.h"

namespace mirror {
    enum class ElementType : std::uint8_t {
        Int8,
        Uint8,
        Uint8Clamped,
        Int16,
        Uint16,
        Int32,
        Uint32,
        Float32,
        Float64,
        BigInt64,
        BigUint64
    };

    std::string_view ElementTypeName(ElementType type) noexcept;

    std::size_t ElementSize(ElementType type) noexcept;

    bool IsBigIntElement(ElementType type) noexcept;

    std::string_view HandleKindName(Value::HandleKind kind) noexcept;

    struct PropertyKey {
        enum class Kind : std::uint8_t { String, Symbol };

        Kind kind;
        std::string name;
        std::uint64_t symbol;

        PropertyKey();

        static PropertyKey Named(std::string_view name);

        static PropertyKey FromSymbol(const Value &symbol) noexcept;

        bool IsSymbol() const noexcept;

        // Canonical decimal integer below 2^32 - 1.
        bool IsArrayIndex(std::uint32_t &outIndex) const noexcept;

        bool operator==(const PropertyKey &other) const noexcept;
        bool operator!=(const PropertyKey &other) const noexcept;
    };

    class ValueHeap {
    public:
        using Handle = std::uint64_t;

        static constexpr std::uint32_t kInvalidIndex = 0xffffffffu;
        static constexpr std::uint32_t kDeletedIndex = 0xfffffffeu;

        struct Metrics {
            std::uint64_t liveRecords;
            std::uint64_t totalAllocations;
            std::uint64_t totalReleases;
            std::uint64_t propertyWrites;
            std::uint64_t elementWrites;
            std::uint64_t collectionInserts;
            std::uint64_t collectionDeletes;
            std::uint64_t collisions;
            std::uint64_t rehashes;
            std::uint64_t bytesInUse;
            std::uint64_t peakBytesInUse;
            std::uint64_t symbols;

            Metrics() noexcept;
        };

        struct Property {
            PropertyKey key;
            Value value;
            bool enumerable;
        };

        struct CollectionEntry {
            CollectionEntry();

            std::uint64_t hash;
            bool active;
            Value key;
            Value value;
            std::uint32_t orderPrev;
            std::uint32_t orderNext;
        };

        // Insertion-ordered hash table shared by Map and Set records. Sets
        // only use the key half of each entry.
        struct CollectionTable {
            CollectionTable();

            std::uint32_t size;
            std::uint32_t head;
            std::uint32_t tail;
            std::vector<CollectionEntry> entries;
            std::vector<std::uint32_t> buckets;
            std::vector<std::uint32_t> freeEntries;
        };

        struct ViewInfo {
            ViewInfo() noexcept;

            Handle buffer;
            ElementType type;
            std::size_t byteOffset;
            std::size_t length;
        };

        struct Record {
            Record();

            Value::HandleKind kind;
            Handle handle;
            std::vector<Property> properties;
            std::vector<Value> elements;
            CollectionTable collection;
            std::string name;
            std::string message;
            double timeValue;
            std::string source;
            std::string flags;
            std::vector<std::uint8_t> bytes;
            ViewInfo view;
        };

        explicit ValueHeap(const HeapConfig &config = MakeDefaultHeapConfig());

        ~ValueHeap();

        ValueHeap(const ValueHeap &) = delete;
        ValueHeap &operator=(const ValueHeap &) = delete;

        StatusCode CreateObject(Value &outValue);
        StatusCode CreateArray(Value &outValue);
        StatusCode CreateMap(Value &outValue);
        StatusCode CreateSet(Value &outValue);
        StatusCode CreateFunction(std::string_view name, Value &outValue);
        StatusCode CreateError(std::string_view name, std::string_view message, Value &outValue);
        StatusCode CreateDate(double timeValue, Value &outValue);
        StatusCode CreateRegExp(std::string_view source, std::string_view flags, Value &outValue);
        StatusCode CreateArrayBuffer(std::size_t byteLength, Value &outValue);
        StatusCode CreateDataView(const Value &buffer,
                                  std::size_t byteOffset,
                                  std::size_t byteLength,
                                  Value &outValue);
        StatusCode CreateTypedArray(ElementType type, std::size_t length, Value &outValue);
        StatusCode CreateTypedArrayView(const Value &buffer,
                                        ElementType type,
                                        std::size_t byteOffset,
                                        std::size_t length,
                                        Value &outValue);

        Value CreateSymbol(std::string_view description);
        std::string_view SymbolDescription(std::uint64_t symbol) const noexcept;

        StatusCode Destroy(const Value &value);
        bool Has(const Value &value) const noexcept;

        const Record *Find(Handle handle) const noexcept;
        const Record *Find(const Value &value) const noexcept;

        StatusCode SetProperty(const Value &object, const PropertyKey &key, const Value &value);
        StatusCode DefineProperty(const Value &object,
                                  const PropertyKey &key,
                                  const Value &value,
                                  bool enumerable);
        StatusCode GetProperty(const Value &object, const PropertyKey &key, Value &outValue) const;
        StatusCode DeleteProperty(const Value &object, const PropertyKey &key, bool &outDeleted);
        StatusCode OwnKeys(const Value &object,
                           std::vector<PropertyKey> &outKeys,
                           bool enumerableOnly = true) const;

        StatusCode ArrayPush(const Value &array, const Value &value);
        StatusCode ArraySet(const Value &array, std::size_t index, const Value &value);
        StatusCode ArrayGet(const Value &array, std::size_t index, Value &outValue) const;
        std::size_t ArrayLength(const Value &array) const noexcept;

        StatusCode MapSet(const Value &map, const Value &key, const Value &value);
        StatusCode MapGet(const Value &map, const Value &key, Value &outValue) const;
        bool MapHas(const Value &map, const Value &key) const;
        StatusCode MapDelete(const Value &map, const Value &key, bool &outDeleted);
        StatusCode MapEntries(const Value &map, std::vector<std::pair<Value, Value> > &outEntries) const;

        StatusCode SetAdd(const Value &set, const Value &value);
        bool SetHas(const Value &set, const Value &value) const;
        StatusCode SetValues(const Value &set, std::vector<Value> &outValues) const;

        std::uint32_t CollectionSize(const Value &collection) const noexcept;

        StatusCode WriteBytes(const Value &target, std::size_t offset, const std::uint8_t *data, std::size_t size);
        std::size_t ByteLength(const Value &value) const noexcept;

        // Resolves the byte window backing a buffer, DataView or typed array.
        // A view over a destroyed buffer resolves to an empty window.
        StatusCode ResolveBytes(const Value &value, const std::uint8_t *&outData, std::size_t &outSize) const noexcept;

        StatusCode TypedArraySet(const Value &array, std::size_t index, double value);
        StatusCode TypedArraySetBigInt(const Value &array, std::size_t index, std::int64_t value);
        StatusCode TypedArrayGet(const Value &array, std::size_t index, Value &outValue) const;
        std::size_t TypedArrayLength(const Value &array) const noexcept;

        const Metrics &GetMetrics() const noexcept;

        const HeapConfig &Config() const noexcept;

    private:
        struct SlotRecord {
            SlotRecord();

            bool inUse;
            std::uint32_t generation;
            Record record;
        };

        HeapConfig m_Config;
        Metrics m_Metrics;
        std::vector<SlotRecord> m_Slots;
        std::vector<std::uint32_t> m_FreeSlots;
        std::vector<std::string> m_Symbols;

        StatusCode Allocate(Value::HandleKind kind, Record *&outRecord);
        StatusCode ReserveBytes(std::size_t byteLength);
        void ReleaseBytes(std::size_t byteLength) noexcept;

        Record *FindMutable(const Value &value, Value::HandleKind expected) noexcept;
        const Record *Find(const Value &value, Value::HandleKind expected) const noexcept;
        Record *FindObjectLike(const Value &value) noexcept;
        const Record *FindObjectLike(const Value &value) const noexcept;

        static Handle EncodeHandle(std::uint32_t slot, std::uint32_t generation) noexcept;
        static std::uint32_t DecodeSlot(Handle handle) noexcept;
        static std::uint32_t DecodeGeneration(Handle handle) noexcept;
        static std::uint64_t HashKey(const Value &key) noexcept;

        void EnsureCapacity(CollectionTable &table);
        void Rehash(CollectionTable &table, std::uint32_t newBucketCount);
        std::uint32_t Locate(const CollectionTable &table, const Value &key, std::uint64_t hash,
                             std::uint32_t &bucket, bool &collision) const;
        std::uint32_t AllocateEntry(CollectionTable &table);
        void Upsert(CollectionTable &table, const Value &key, const Value &value);
        bool Remove(CollectionTable &table, const Value &key);
        void LinkTail(CollectionTable &table, std::uint32_t entryIndex);
        void Unlink(CollectionTable &table, std::uint32_t entryIndex);
    };
}
