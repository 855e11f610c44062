#include "mirror/heap.h"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <limits>

namespace mirror {
    namespace {
        constexpr std::uint32_t kInitialBucketCount = 8;

        template<typename T>
        void StoreScalar(std::uint8_t *target, T value) noexcept {
            std::memcpy(target, &value, sizeof(T));
        }

        template<typename T>
        T LoadScalar(const std::uint8_t *source) noexcept {
            T value;
            std::memcpy(&value, source, sizeof(T));
            return value;
        }

        double WrapInteger(double value, double modulus) noexcept {
            if (!std::isfinite(value)) {
                return 0.0;
            }
            auto wrapped = std::fmod(std::trunc(value), modulus);
            if (wrapped < 0.0) {
                wrapped += modulus;
            }
            return wrapped;
        }

        void EncodeElement(ElementType type, double value, std::uint8_t *target) noexcept {
            switch (type) {
                case ElementType::Int8: {
                    auto wrapped = WrapInteger(value, 256.0);
                    StoreScalar<std::int8_t>(target, static_cast<std::int8_t>(wrapped >= 128.0 ? wrapped - 256.0 : wrapped));
                    break;
                }
                case ElementType::Uint8:
                    StoreScalar<std::uint8_t>(target, static_cast<std::uint8_t>(WrapInteger(value, 256.0)));
                    break;
                case ElementType::Uint8Clamped: {
                    double clamped = std::isnan(value) ? 0.0 : std::clamp(value, 0.0, 255.0);
                    StoreScalar<std::uint8_t>(target, static_cast<std::uint8_t>(std::nearbyint(clamped)));
                    break;
                }
                case ElementType::Int16: {
                    auto wrapped = WrapInteger(value, 65536.0);
                    StoreScalar<std::int16_t>(target,
                                              static_cast<std::int16_t>(wrapped >= 32768.0 ? wrapped - 65536.0 : wrapped));
                    break;
                }
                case ElementType::Uint16:
                    StoreScalar<std::uint16_t>(target, static_cast<std::uint16_t>(WrapInteger(value, 65536.0)));
                    break;
                case ElementType::Int32: {
                    auto wrapped = WrapInteger(value, 4294967296.0);
                    StoreScalar<std::int32_t>(target, static_cast<std::int32_t>(
                                                  wrapped >= 2147483648.0 ? wrapped - 4294967296.0 : wrapped));
                    break;
                }
                case ElementType::Uint32:
                    StoreScalar<std::uint32_t>(target, static_cast<std::uint32_t>(WrapInteger(value, 4294967296.0)));
                    break;
                case ElementType::Float32:
                    StoreScalar<float>(target, static_cast<float>(value));
                    break;
                case ElementType::Float64:
                    StoreScalar<double>(target, value);
                    break;
                case ElementType::BigInt64:
                case ElementType::BigUint64:
                    break;
            }
        }

        Value DecodeElement(ElementType type, const std::uint8_t *source) {
            switch (type) {
                case ElementType::Int8:
                    return Value::Number(static_cast<double>(LoadScalar<std::int8_t>(source)));
                case ElementType::Uint8:
                case ElementType::Uint8Clamped:
                    return Value::Number(static_cast<double>(LoadScalar<std::uint8_t>(source)));
                case ElementType::Int16:
                    return Value::Number(static_cast<double>(LoadScalar<std::int16_t>(source)));
                case ElementType::Uint16:
                    return Value::Number(static_cast<double>(LoadScalar<std::uint16_t>(source)));
                case ElementType::Int32:
                    return Value::Number(static_cast<double>(LoadScalar<std::int32_t>(source)));
                case ElementType::Uint32:
                    return Value::Number(static_cast<double>(LoadScalar<std::uint32_t>(source)));
                case ElementType::Float32:
                    return Value::Number(static_cast<double>(LoadScalar<float>(source)));
                case ElementType::Float64:
                    return Value::Number(LoadScalar<double>(source));
                case ElementType::BigInt64:
                    return Value::BigInt(LoadScalar<std::int64_t>(source));
                case ElementType::BigUint64: {
                    Value value;
                    if (!Value::ParseBigInt(std::to_string(LoadScalar<std::uint64_t>(source)), value)) {
                        return Value::Undefined();
                    }
                    return value;
                }
            }
            return Value::Undefined();
        }

        bool IsObjectLike(Value::HandleKind kind) noexcept {
            return kind == Value::HandleKind::Object || kind == Value::HandleKind::Error;
        }
    }

    std::string_view ElementTypeName(ElementType type) noexcept {
        switch (type) {
            case ElementType::Int8:
                return "Int8Array";
            case ElementType::Uint8:
                return "Uint8Array";
            case ElementType::Uint8Clamped:
                return "Uint8ClampedArray";
            case ElementType::Int16:
                return "Int16Array";
            case ElementType::Uint16:
                return "Uint16Array";
            case ElementType::Int32:
                return "Int32Array";
            case ElementType::Uint32:
                return "Uint32Array";
            case ElementType::Float32:
                return "Float32Array";
            case ElementType::Float64:
                return "Float64Array";
            case ElementType::BigInt64:
                return "BigInt64Array";
            case ElementType::BigUint64:
                return "BigUint64Array";
        }
        return "TypedArray";
    }

    std::size_t ElementSize(ElementType type) noexcept {
        switch (type) {
            case ElementType::Int8:
            case ElementType::Uint8:
            case ElementType::Uint8Clamped:
                return 1;
            case ElementType::Int16:
            case ElementType::Uint16:
                return 2;
            case ElementType::Int32:
            case ElementType::Uint32:
            case ElementType::Float32:
                return 4;
            case ElementType::Float64:
            case ElementType::BigInt64:
            case ElementType::BigUint64:
                return 8;
        }
        return 1;
    }

    bool IsBigIntElement(ElementType type) noexcept {
        return type == ElementType::BigInt64 || type == ElementType::BigUint64;
    }

    std::string_view HandleKindName(Value::HandleKind kind) noexcept {
        switch (kind) {
            case Value::HandleKind::Object:
                return "Object";
            case Value::HandleKind::Array:
                return "Array";
            case Value::HandleKind::Map:
                return "Map";
            case Value::HandleKind::Set:
                return "Set";
            case Value::HandleKind::Function:
                return "Function";
            case Value::HandleKind::Error:
                return "Error";
            case Value::HandleKind::Date:
                return "Date";
            case Value::HandleKind::RegExp:
                return "RegExp";
            case Value::HandleKind::ArrayBuffer:
                return "ArrayBuffer";
            case Value::HandleKind::DataView:
                return "DataView";
            case Value::HandleKind::TypedArray:
                return "TypedArray";
        }
        return "Object";
    }

    PropertyKey::PropertyKey()
        : kind(Kind::String),
          name(),
          symbol(0) {
    }

    PropertyKey PropertyKey::Named(std::string_view name) {
        PropertyKey key;
        key.kind = Kind::String;
        key.name.assign(name.begin(), name.end());
        return key;
    }

    PropertyKey PropertyKey::FromSymbol(const Value &symbol) noexcept {
        PropertyKey key;
        key.kind = Kind::Symbol;
        key.symbol = symbol.AsSymbol();
        return key;
    }

    bool PropertyKey::IsSymbol() const noexcept {
        return kind == Kind::Symbol;
    }

    bool PropertyKey::IsArrayIndex(std::uint32_t &outIndex) const noexcept {
        outIndex = 0;
        if (kind != Kind::String || name.empty() || name.size() > 10) {
            return false;
        }
        if (name.size() > 1 && name.front() == '0') {
            return false;
        }
        std::uint64_t value = 0;
        for (char c: name) {
            if (c < '0' || c > '9') {
                return false;
            }
            value = value * 10 + static_cast<std::uint64_t>(c - '0');
        }
        if (value >= 0xffffffffull) {
            return false;
        }
        outIndex = static_cast<std::uint32_t>(value);
        return true;
    }

    bool PropertyKey::operator==(const PropertyKey &other) const noexcept {
        if (kind != other.kind) {
            return false;
        }
        return kind == Kind::Symbol ? symbol == other.symbol : name == other.name;
    }

    bool PropertyKey::operator!=(const PropertyKey &other) const noexcept {
        return !(*this == other);
    }

    ValueHeap::Metrics::Metrics() noexcept
        : liveRecords(0),
          totalAllocations(0),
          totalReleases(0),
          propertyWrites(0),
          elementWrites(0),
          collectionInserts(0),
          collectionDeletes(0),
          collisions(0),
          rehashes(0),
          bytesInUse(0),
          peakBytesInUse(0),
          symbols(0) {
    }

    ValueHeap::CollectionEntry::CollectionEntry()
        : hash(0),
          active(false),
          key(),
          value(),
          orderPrev(kInvalidIndex),
          orderNext(kInvalidIndex) {
    }

    ValueHeap::CollectionTable::CollectionTable()
        : size(0),
          head(kInvalidIndex),
          tail(kInvalidIndex),
          entries(),
          buckets(),
          freeEntries() {
    }

    ValueHeap::ViewInfo::ViewInfo() noexcept
        : buffer(0),
          type(ElementType::Uint8),
          byteOffset(0),
          length(0) {
    }

    ValueHeap::Record::Record()
        : kind(Value::HandleKind::Object),
          handle(0),
          properties(),
          elements(),
          collection(),
          name(),
          message(),
          timeValue(0.0),
          source(),
          flags(),
          bytes(),
          view() {
    }

    ValueHeap::SlotRecord::SlotRecord()
        : inUse(false),
          generation(0),
          record() {
    }

    ValueHeap::ValueHeap(const HeapConfig &config)
        : m_Config(config),
          m_Metrics(),
          m_Slots(),
          m_FreeSlots(),
          m_Symbols() {
    }

    ValueHeap::~ValueHeap() = default;

    StatusCode ValueHeap::CreateObject(Value &outValue) {
        Record *record = nullptr;
        auto status = Allocate(Value::HandleKind::Object, record);
        if (status != StatusCode::Ok) {
            return status;
        }
        outValue = Value::Handle(record->handle, record->kind);
        return StatusCode::Ok;
    }

    StatusCode ValueHeap::CreateArray(Value &outValue) {
        Record *record = nullptr;
        auto status = Allocate(Value::HandleKind::Array, record);
        if (status != StatusCode::Ok) {
            return status;
        }
        outValue = Value::Handle(record->handle, record->kind);
        return StatusCode::Ok;
    }

    StatusCode ValueHeap::CreateMap(Value &outValue) {
        Record *record = nullptr;
        auto status = Allocate(Value::HandleKind::Map, record);
        if (status != StatusCode::Ok) {
            return status;
        }
        EnsureCapacity(record->collection);
        outValue = Value::Handle(record->handle, record->kind);
        return StatusCode::Ok;
    }

    StatusCode ValueHeap::CreateSet(Value &outValue) {
        Record *record = nullptr;
        auto status = Allocate(Value::HandleKind::Set, record);
        if (status != StatusCode::Ok) {
            return status;
        }
        EnsureCapacity(record->collection);
        outValue = Value::Handle(record->handle, record->kind);
        return StatusCode::Ok;
    }

    StatusCode ValueHeap::CreateFunction(std::string_view name, Value &outValue) {
        Record *record = nullptr;
        auto status = Allocate(Value::HandleKind::Function, record);
        if (status != StatusCode::Ok) {
            return status;
        }
        record->name.assign(name.begin(), name.end());
        outValue = Value::Handle(record->handle, record->kind);
        return StatusCode::Ok;
    }

    StatusCode ValueHeap::CreateError(std::string_view name, std::string_view message, Value &outValue) {
        Record *record = nullptr;
        auto status = Allocate(Value::HandleKind::Error, record);
        if (status != StatusCode::Ok) {
            return status;
        }
        record->name.assign(name.begin(), name.end());
        record->message.assign(message.begin(), message.end());
        outValue = Value::Handle(record->handle, record->kind);
        return StatusCode::Ok;
    }

    StatusCode ValueHeap::CreateDate(double timeValue, Value &outValue) {
        Record *record = nullptr;
        auto status = Allocate(Value::HandleKind::Date, record);
        if (status != StatusCode::Ok) {
            return status;
        }
        record->timeValue = std::isfinite(timeValue) ? std::trunc(timeValue)
                                                     : std::numeric_limits<double>::quiet_NaN();
        outValue = Value::Handle(record->handle, record->kind);
        return StatusCode::Ok;
    }

    StatusCode ValueHeap::CreateRegExp(std::string_view source, std::string_view flags, Value &outValue) {
        Record *record = nullptr;
        auto status = Allocate(Value::HandleKind::RegExp, record);
        if (status != StatusCode::Ok) {
            return status;
        }
        record->source = source.empty() ? std::string("(?:)") : std::string(source);
        record->flags.assign(flags.begin(), flags.end());
        std::sort(record->flags.begin(), record->flags.end());
        outValue = Value::Handle(record->handle, record->kind);
        return StatusCode::Ok;
    }

    StatusCode ValueHeap::CreateArrayBuffer(std::size_t byteLength, Value &outValue) {
        auto status = ReserveBytes(byteLength);
        if (status != StatusCode::Ok) {
            return status;
        }
        Record *record = nullptr;
        status = Allocate(Value::HandleKind::ArrayBuffer, record);
        if (status != StatusCode::Ok) {
            ReleaseBytes(byteLength);
            return status;
        }
        record->bytes.assign(byteLength, 0);
        outValue = Value::Handle(record->handle, record->kind);
        return StatusCode::Ok;
    }

    StatusCode ValueHeap::CreateDataView(const Value &buffer,
                                         std::size_t byteOffset,
                                         std::size_t byteLength,
                                         Value &outValue) {
        const auto *bufferRecord = Find(buffer, Value::HandleKind::ArrayBuffer);
        if (!bufferRecord) {
            return StatusCode::NotFound;
        }
        if (byteOffset > bufferRecord->bytes.size() || byteLength > bufferRecord->bytes.size() - byteOffset) {
            return StatusCode::InvalidArgument;
        }
        auto bufferHandle = bufferRecord->handle;
        Record *record = nullptr;
        auto status = Allocate(Value::HandleKind::DataView, record);
        if (status != StatusCode::Ok) {
            return status;
        }
        record->view.buffer = bufferHandle;
        record->view.type = ElementType::Uint8;
        record->view.byteOffset = byteOffset;
        record->view.length = byteLength;
        outValue = Value::Handle(record->handle, record->kind);
        return StatusCode::Ok;
    }

    StatusCode ValueHeap::CreateTypedArray(ElementType type, std::size_t length, Value &outValue) {
        auto elementSize = ElementSize(type);
        if (length > std::numeric_limits<std::size_t>::max() / elementSize) {
            return StatusCode::InvalidArgument;
        }
        Value buffer;
        auto status = CreateArrayBuffer(length * elementSize, buffer);
        if (status != StatusCode::Ok) {
            return status;
        }
        status = CreateTypedArrayView(buffer, type, 0, length, outValue);
        if (status != StatusCode::Ok) {
            Destroy(buffer);
        }
        return status;
    }

    StatusCode ValueHeap::CreateTypedArrayView(const Value &buffer,
                                               ElementType type,
                                               std::size_t byteOffset,
                                               std::size_t length,
                                               Value &outValue) {
        const auto *bufferRecord = Find(buffer, Value::HandleKind::ArrayBuffer);
        if (!bufferRecord) {
            return StatusCode::NotFound;
        }
        auto elementSize = ElementSize(type);
        if (byteOffset % elementSize != 0 || byteOffset > bufferRecord->bytes.size()) {
            return StatusCode::InvalidArgument;
        }
        if (length > (bufferRecord->bytes.size() - byteOffset) / elementSize) {
            return StatusCode::InvalidArgument;
        }
        auto bufferHandle = bufferRecord->handle;
        Record *record = nullptr;
        auto status = Allocate(Value::HandleKind::TypedArray, record);
        if (status != StatusCode::Ok) {
            return status;
        }
        record->view.buffer = bufferHandle;
        record->view.type = type;
        record->view.byteOffset = byteOffset;
        record->view.length = length;
        outValue = Value::Handle(record->handle, record->kind);
        return StatusCode::Ok;
    }

    Value ValueHeap::CreateSymbol(std::string_view description) {
        m_Symbols.emplace_back(description);
        m_Metrics.symbols += 1;
        return Value::Symbol(static_cast<std::uint64_t>(m_Symbols.size()));
    }

    std::string_view ValueHeap::SymbolDescription(std::uint64_t symbol) const noexcept {
        if (symbol == 0 || symbol > m_Symbols.size()) {
            return {};
        }
        return m_Symbols[static_cast<std::size_t>(symbol - 1)];
    }

    StatusCode ValueHeap::Destroy(const Value &value) {
        const auto *record = Find(value);
        if (!record) {
            return StatusCode::NotFound;
        }
        auto slotIndex = DecodeSlot(record->handle);
        ReleaseBytes(record->bytes.size());
        auto &slot = m_Slots[slotIndex];
        slot.inUse = false;
        slot.record = Record();
        m_FreeSlots.push_back(slotIndex);
        if (m_Metrics.liveRecords > 0) {
            m_Metrics.liveRecords -= 1;
        }
        m_Metrics.totalReleases += 1;
        return StatusCode::Ok;
    }

    bool ValueHeap::Has(const Value &value) const noexcept {
        return Find(value) != nullptr;
    }

    const ValueHeap::Record *ValueHeap::Find(Handle handle) const noexcept {
        if (handle == 0) {
            return nullptr;
        }
        auto slotIndex = DecodeSlot(handle);
        if (slotIndex >= m_Slots.size()) {
            return nullptr;
        }
        const auto &slot = m_Slots[slotIndex];
        if (!slot.inUse || slot.generation != DecodeGeneration(handle)) {
            return nullptr;
        }
        return &slot.record;
    }

    const ValueHeap::Record *ValueHeap::Find(const Value &value) const noexcept {
        if (!value.IsHandle()) {
            return nullptr;
        }
        const auto *record = Find(value.AsHandle());
        if (!record || record->kind != value.HandleTag()) {
            return nullptr;
        }
        return record;
    }

    StatusCode ValueHeap::SetProperty(const Value &object, const PropertyKey &key, const Value &value) {
        auto *record = FindObjectLike(object);
        if (!record) {
            return StatusCode::NotFound;
        }
        for (auto &property: record->properties) {
            if (property.key == key) {
                property.value = value;
                m_Metrics.propertyWrites += 1;
                return StatusCode::Ok;
            }
        }
        record->properties.push_back(Property{key, value, true});
        m_Metrics.propertyWrites += 1;
        return StatusCode::Ok;
    }

    StatusCode ValueHeap::DefineProperty(const Value &object,
                                         const PropertyKey &key,
                                         const Value &value,
                                         bool enumerable) {
        auto *record = FindObjectLike(object);
        if (!record) {
            return StatusCode::NotFound;
        }
        for (auto &property: record->properties) {
            if (property.key == key) {
                property.value = value;
                property.enumerable = enumerable;
                m_Metrics.propertyWrites += 1;
                return StatusCode::Ok;
            }
        }
        record->properties.push_back(Property{key, value, enumerable});
        m_Metrics.propertyWrites += 1;
        return StatusCode::Ok;
    }

    StatusCode ValueHeap::GetProperty(const Value &object, const PropertyKey &key, Value &outValue) const {
        outValue.Reset();
        const auto *record = FindObjectLike(object);
        if (!record) {
            return StatusCode::NotFound;
        }
        for (const auto &property: record->properties) {
            if (property.key == key) {
                outValue = property.value;
                return StatusCode::Ok;
            }
        }
        return StatusCode::NotFound;
    }

    StatusCode ValueHeap::DeleteProperty(const Value &object, const PropertyKey &key, bool &outDeleted) {
        outDeleted = false;
        auto *record = FindObjectLike(object);
        if (!record) {
            return StatusCode::NotFound;
        }
        auto it = std::find_if(record->properties.begin(), record->properties.end(),
                               [&key](const Property &property) { return property.key == key; });
        if (it != record->properties.end()) {
            record->properties.erase(it);
            outDeleted = true;
        }
        return StatusCode::Ok;
    }

    StatusCode ValueHeap::OwnKeys(const Value &object,
                                  std::vector<PropertyKey> &outKeys,
                                  bool enumerableOnly) const {
        outKeys.clear();
        const auto *record = FindObjectLike(object);
        if (!record) {
            return StatusCode::NotFound;
        }
        std::vector<std::pair<std::uint32_t, const PropertyKey *> > indices;
        std::vector<const PropertyKey *> strings;
        std::vector<const PropertyKey *> symbols;
        for (const auto &property: record->properties) {
            if (enumerableOnly && !property.enumerable) {
                continue;
            }
            std::uint32_t index = 0;
            if (property.key.IsSymbol()) {
                symbols.push_back(&property.key);
            } else if (property.key.IsArrayIndex(index)) {
                indices.emplace_back(index, &property.key);
            } else {
                strings.push_back(&property.key);
            }
        }
        std::sort(indices.begin(), indices.end(),
                  [](const auto &lhs, const auto &rhs) { return lhs.first < rhs.first; });
        outKeys.reserve(indices.size() + strings.size() + symbols.size());
        for (const auto &index: indices) {
            outKeys.push_back(*index.second);
        }
        for (const auto *key: strings) {
            outKeys.push_back(*key);
        }
        for (const auto *key: symbols) {
            outKeys.push_back(*key);
        }
        return StatusCode::Ok;
    }

    StatusCode ValueHeap::ArrayPush(const Value &array, const Value &value) {
        auto *record = FindMutable(array, Value::HandleKind::Array);
        if (!record) {
            return StatusCode::NotFound;
        }
        record->elements.push_back(value);
        m_Metrics.elementWrites += 1;
        return StatusCode::Ok;
    }

    StatusCode ValueHeap::ArraySet(const Value &array, std::size_t index, const Value &value) {
        auto *record = FindMutable(array, Value::HandleKind::Array);
        if (!record) {
            return StatusCode::NotFound;
        }
        if (index >= m_Config.maxRecords && index >= record->elements.size()) {
            return StatusCode::CapacityExceeded;
        }
        if (index >= record->elements.size()) {
            record->elements.resize(index + 1);
        }
        record->elements[index] = value;
        m_Metrics.elementWrites += 1;
        return StatusCode::Ok;
    }

    StatusCode ValueHeap::ArrayGet(const Value &array, std::size_t index, Value &outValue) const {
        outValue.Reset();
        const auto *record = Find(array, Value::HandleKind::Array);
        if (!record) {
            return StatusCode::NotFound;
        }
        if (index >= record->elements.size()) {
            return StatusCode::InvalidArgument;
        }
        outValue = record->elements[index];
        return StatusCode::Ok;
    }

    std::size_t ValueHeap::ArrayLength(const Value &array) const noexcept {
        const auto *record = Find(array, Value::HandleKind::Array);
        return record ? record->elements.size() : 0;
    }

    StatusCode ValueHeap::MapSet(const Value &map, const Value &key, const Value &value) {
        auto *record = FindMutable(map, Value::HandleKind::Map);
        if (!record) {
            return StatusCode::NotFound;
        }
        Upsert(record->collection, key, value);
        return StatusCode::Ok;
    }

    StatusCode ValueHeap::MapGet(const Value &map, const Value &key, Value &outValue) const {
        outValue.Reset();
        const auto *record = Find(map, Value::HandleKind::Map);
        if (!record) {
            return StatusCode::NotFound;
        }
        std::uint32_t bucket = 0;
        bool collision = false;
        auto index = Locate(record->collection, key, HashKey(key), bucket, collision);
        if (index == kInvalidIndex) {
            return StatusCode::NotFound;
        }
        outValue = record->collection.entries[index].value;
        return StatusCode::Ok;
    }

    bool ValueHeap::MapHas(const Value &map, const Value &key) const {
        Value value;
        return MapGet(map, key, value) == StatusCode::Ok;
    }

    StatusCode ValueHeap::MapDelete(const Value &map, const Value &key, bool &outDeleted) {
        outDeleted = false;
        auto *record = FindMutable(map, Value::HandleKind::Map);
        if (!record) {
            return StatusCode::NotFound;
        }
        outDeleted = Remove(record->collection, key);
        return StatusCode::Ok;
    }

    StatusCode ValueHeap::MapEntries(const Value &map, std::vector<std::pair<Value, Value> > &outEntries) const {
        outEntries.clear();
        const auto *record = Find(map, Value::HandleKind::Map);
        if (!record) {
            return StatusCode::NotFound;
        }
        const auto &table = record->collection;
        outEntries.reserve(table.size);
        auto index = table.head;
        while (index != kInvalidIndex) {
            const auto &entry = table.entries[index];
            if (entry.active) {
                outEntries.emplace_back(entry.key, entry.value);
            }
            index = entry.orderNext;
        }
        return StatusCode::Ok;
    }

    StatusCode ValueHeap::SetAdd(const Value &set, const Value &value) {
        auto *record = FindMutable(set, Value::HandleKind::Set);
        if (!record) {
            return StatusCode::NotFound;
        }
        std::uint32_t bucket = 0;
        bool collision = false;
        if (Locate(record->collection, value, HashKey(value), bucket, collision) != kInvalidIndex) {
            return StatusCode::Ok;
        }
        Upsert(record->collection, value, Value::Undefined());
        return StatusCode::Ok;
    }

    bool ValueHeap::SetHas(const Value &set, const Value &value) const {
        const auto *record = Find(set, Value::HandleKind::Set);
        if (!record) {
            return false;
        }
        std::uint32_t bucket = 0;
        bool collision = false;
        return Locate(record->collection, value, HashKey(value), bucket, collision) != kInvalidIndex;
    }

    StatusCode ValueHeap::SetValues(const Value &set, std::vector<Value> &outValues) const {
        outValues.clear();
        const auto *record = Find(set, Value::HandleKind::Set);
        if (!record) {
            return StatusCode::NotFound;
        }
        const auto &table = record->collection;
        outValues.reserve(table.size);
        auto index = table.head;
        while (index != kInvalidIndex) {
            const auto &entry = table.entries[index];
            if (entry.active) {
                outValues.push_back(entry.key);
            }
            index = entry.orderNext;
        }
        return StatusCode::Ok;
    }

    std::uint32_t ValueHeap::CollectionSize(const Value &collection) const noexcept {
        const auto *record = Find(collection);
        if (!record) {
            return 0;
        }
        if (record->kind != Value::HandleKind::Map && record->kind != Value::HandleKind::Set) {
            return 0;
        }
        return record->collection.size;
    }

    StatusCode ValueHeap::WriteBytes(const Value &target, std::size_t offset, const std::uint8_t *data,
                                     std::size_t size) {
        const std::uint8_t *window = nullptr;
        std::size_t windowSize = 0;
        auto status = ResolveBytes(target, window, windowSize);
        if (status != StatusCode::Ok) {
            return status;
        }
        if (offset > windowSize || size > windowSize - offset || (size > 0 && data == nullptr)) {
            return StatusCode::InvalidArgument;
        }
        if (size > 0) {
            std::memcpy(const_cast<std::uint8_t *>(window) + offset, data, size);
        }
        return StatusCode::Ok;
    }

    std::size_t ValueHeap::ByteLength(const Value &value) const noexcept {
        const std::uint8_t *window = nullptr;
        std::size_t windowSize = 0;
        if (ResolveBytes(value, window, windowSize) != StatusCode::Ok) {
            return 0;
        }
        return windowSize;
    }

    StatusCode ValueHeap::ResolveBytes(const Value &value,
                                       const std::uint8_t *&outData,
                                       std::size_t &outSize) const noexcept {
        outData = nullptr;
        outSize = 0;
        const auto *record = Find(value);
        if (!record) {
            return StatusCode::NotFound;
        }
        switch (record->kind) {
            case Value::HandleKind::ArrayBuffer:
                outData = record->bytes.data();
                outSize = record->bytes.size();
                return StatusCode::Ok;
            case Value::HandleKind::DataView:
            case Value::HandleKind::TypedArray: {
                const auto *buffer = Find(record->view.buffer);
                if (!buffer || buffer->kind != Value::HandleKind::ArrayBuffer) {
                    return StatusCode::Ok;
                }
                auto byteLength = record->kind == Value::HandleKind::DataView
                                      ? record->view.length
                                      : record->view.length * ElementSize(record->view.type);
                if (record->view.byteOffset > buffer->bytes.size()
                    || byteLength > buffer->bytes.size() - record->view.byteOffset) {
                    return StatusCode::Ok;
                }
                outData = buffer->bytes.data() + record->view.byteOffset;
                outSize = byteLength;
                return StatusCode::Ok;
            }
            default:
                return StatusCode::InvalidArgument;
        }
    }

    StatusCode ValueHeap::TypedArraySet(const Value &array, std::size_t index, double value) {
        const auto *record = Find(array, Value::HandleKind::TypedArray);
        if (!record) {
            return StatusCode::NotFound;
        }
        auto type = record->view.type;
        if (IsBigIntElement(type)) {
            return StatusCode::InvalidArgument;
        }
        const std::uint8_t *window = nullptr;
        std::size_t windowSize = 0;
        auto status = ResolveBytes(array, window, windowSize);
        if (status != StatusCode::Ok) {
            return status;
        }
        auto elementSize = ElementSize(type);
        if (index >= windowSize / elementSize) {
            return StatusCode::InvalidArgument;
        }
        EncodeElement(type, value, const_cast<std::uint8_t *>(window) + index * elementSize);
        m_Metrics.elementWrites += 1;
        return StatusCode::Ok;
    }

    StatusCode ValueHeap::TypedArraySetBigInt(const Value &array, std::size_t index, std::int64_t value) {
        const auto *record = Find(array, Value::HandleKind::TypedArray);
        if (!record) {
            return StatusCode::NotFound;
        }
        auto type = record->view.type;
        if (!IsBigIntElement(type)) {
            return StatusCode::InvalidArgument;
        }
        const std::uint8_t *window = nullptr;
        std::size_t windowSize = 0;
        auto status = ResolveBytes(array, window, windowSize);
        if (status != StatusCode::Ok) {
            return status;
        }
        if (index >= windowSize / sizeof(std::int64_t)) {
            return StatusCode::InvalidArgument;
        }
        StoreScalar<std::int64_t>(const_cast<std::uint8_t *>(window) + index * sizeof(std::int64_t), value);
        m_Metrics.elementWrites += 1;
        return StatusCode::Ok;
    }

    StatusCode ValueHeap::TypedArrayGet(const Value &array, std::size_t index, Value &outValue) const {
        outValue.Reset();
        const auto *record = Find(array, Value::HandleKind::TypedArray);
        if (!record) {
            return StatusCode::NotFound;
        }
        const std::uint8_t *window = nullptr;
        std::size_t windowSize = 0;
        auto status = ResolveBytes(array, window, windowSize);
        if (status != StatusCode::Ok) {
            return status;
        }
        auto elementSize = ElementSize(record->view.type);
        if (index >= windowSize / elementSize) {
            return StatusCode::InvalidArgument;
        }
        outValue = DecodeElement(record->view.type, window + index * elementSize);
        return StatusCode::Ok;
    }

    std::size_t ValueHeap::TypedArrayLength(const Value &array) const noexcept {
        const auto *record = Find(array, Value::HandleKind::TypedArray);
        if (!record) {
            return 0;
        }
        return ByteLength(array) / ElementSize(record->view.type);
    }

    const ValueHeap::Metrics &ValueHeap::GetMetrics() const noexcept {
        return m_Metrics;
    }

    const HeapConfig &ValueHeap::Config() const noexcept {
        return m_Config;
    }

    StatusCode ValueHeap::Allocate(Value::HandleKind kind, Record *&outRecord) {
        outRecord = nullptr;
        if (m_Metrics.liveRecords >= m_Config.maxRecords) {
            return StatusCode::CapacityExceeded;
        }
        std::uint32_t slotIndex;
        if (!m_FreeSlots.empty()) {
            slotIndex = m_FreeSlots.back();
            m_FreeSlots.pop_back();
        } else {
            if (m_Slots.size() >= static_cast<std::size_t>(std::numeric_limits<std::uint32_t>::max())) {
                return StatusCode::CapacityExceeded;
            }
            slotIndex = static_cast<std::uint32_t>(m_Slots.size());
            m_Slots.emplace_back();
        }
        auto &slot = m_Slots[slotIndex];
        slot.inUse = true;
        slot.generation += 1;
        slot.record = Record();
        slot.record.kind = kind;
        slot.record.handle = EncodeHandle(slotIndex, slot.generation);
        m_Metrics.liveRecords += 1;
        m_Metrics.totalAllocations += 1;
        outRecord = &slot.record;
        return StatusCode::Ok;
    }

    StatusCode ValueHeap::ReserveBytes(std::size_t byteLength) {
        if (byteLength > m_Config.maxBufferBytes
            || m_Metrics.bytesInUse > m_Config.maxBufferBytes - byteLength) {
            return StatusCode::CapacityExceeded;
        }
        m_Metrics.bytesInUse += byteLength;
        m_Metrics.peakBytesInUse = std::max(m_Metrics.peakBytesInUse, m_Metrics.bytesInUse);
        return StatusCode::Ok;
    }

    void ValueHeap::ReleaseBytes(std::size_t byteLength) noexcept {
        m_Metrics.bytesInUse = byteLength > m_Metrics.bytesInUse ? 0 : m_Metrics.bytesInUse - byteLength;
    }

    ValueHeap::Record *ValueHeap::FindMutable(const Value &value, Value::HandleKind expected) noexcept {
        return const_cast<Record *>(Find(value, expected));
    }

    const ValueHeap::Record *ValueHeap::Find(const Value &value, Value::HandleKind expected) const noexcept {
        const auto *record = Find(value);
        if (!record || record->kind != expected) {
            return nullptr;
        }
        return record;
    }

    ValueHeap::Record *ValueHeap::FindObjectLike(const Value &value) noexcept {
        return const_cast<Record *>(static_cast<const ValueHeap *>(this)->FindObjectLike(value));
    }

    const ValueHeap::Record *ValueHeap::FindObjectLike(const Value &value) const noexcept {
        const auto *record = Find(value);
        if (!record || !IsObjectLike(record->kind)) {
            return nullptr;
        }
        return record;
    }

    ValueHeap::Handle ValueHeap::EncodeHandle(std::uint32_t slot, std::uint32_t generation) noexcept {
        return (static_cast<Handle>(generation) << 32) | static_cast<Handle>(slot);
    }

    std::uint32_t ValueHeap::DecodeSlot(Handle handle) noexcept {
        return static_cast<std::uint32_t>(handle & 0xffffffffull);
    }

    std::uint32_t ValueHeap::DecodeGeneration(Handle handle) noexcept {
        return static_cast<std::uint32_t>((handle >> 32) & 0xffffffffull);
    }

    std::uint64_t ValueHeap::HashKey(const Value &key) noexcept {
        auto hash = key.Hash();
        if (hash == 0) {
            hash = 0x9e3779b97f4a7c15ull;
        }
        return hash;
    }

    void ValueHeap::EnsureCapacity(CollectionTable &table) {
        if (table.buckets.empty()) {
            Rehash(table, kInitialBucketCount);
            return;
        }
        auto capacity = static_cast<std::uint32_t>(table.buckets.size());
        auto limit = (capacity * 3u) / 5u;
        if (limit < 1) {
            limit = 1;
        }
        auto occupied = static_cast<std::uint32_t>(table.entries.size() - table.freeEntries.size());
        if (occupied + 1 > limit) {
            Rehash(table, capacity * 2);
        }
    }

    void ValueHeap::Rehash(CollectionTable &table, std::uint32_t newBucketCount) {
        if (newBucketCount < kInitialBucketCount) {
            newBucketCount = kInitialBucketCount;
        }
        if ((newBucketCount & (newBucketCount - 1)) != 0) {
            std::uint32_t power = 1;
            while (power < newBucketCount && power < (1u << 30)) {
                power <<= 1;
            }
            newBucketCount = power;
        }
        std::vector<std::uint32_t> buckets(newBucketCount, kInvalidIndex);
        auto mask = newBucketCount - 1;
        for (std::uint32_t index = 0; index < table.entries.size(); ++index) {
            const auto &entry = table.entries[index];
            if (!entry.active) {
                continue;
            }
            auto bucket = static_cast<std::uint32_t>(entry.hash) & mask;
            while (buckets[bucket] != kInvalidIndex) {
                bucket = (bucket + 1) & mask;
            }
            buckets[bucket] = index;
        }
        table.buckets.swap(buckets);
        m_Metrics.rehashes += 1;
    }

    std::uint32_t ValueHeap::Locate(const CollectionTable &table, const Value &key, std::uint64_t hash,
                                    std::uint32_t &bucket, bool &collision) const {
        collision = false;
        bucket = 0;
        if (table.buckets.empty()) {
            return kInvalidIndex;
        }
        auto mask = static_cast<std::uint32_t>(table.buckets.size() - 1);
        auto index = static_cast<std::uint32_t>(hash) & mask;
        auto firstDeleted = kInvalidIndex;
        std::uint32_t probes = 0;
        while (true) {
            auto entryIndex = table.buckets[index];
            if (entryIndex == kInvalidIndex) {
                bucket = firstDeleted != kInvalidIndex ? firstDeleted : index;
                collision = probes != 0;
                return kInvalidIndex;
            }
            if (entryIndex == kDeletedIndex) {
                if (firstDeleted == kInvalidIndex) {
                    firstDeleted = index;
                }
            } else {
                const auto &entry = table.entries[entryIndex];
                if (entry.active && entry.hash == hash && entry.key.SameValueZero(key)) {
                    bucket = index;
                    collision = probes != 0;
                    return entryIndex;
                }
            }
            index = (index + 1) & mask;
            ++probes;
            if (probes >= table.buckets.size()) {
                bucket = firstDeleted != kInvalidIndex ? firstDeleted : index;
                collision = true;
                return kInvalidIndex;
            }
        }
    }

    std::uint32_t ValueHeap::AllocateEntry(CollectionTable &table) {
        if (!table.freeEntries.empty()) {
            auto index = table.freeEntries.back();
            table.freeEntries.pop_back();
            table.entries[index] = CollectionEntry();
            table.entries[index].active = true;
            return index;
        }
        table.entries.emplace_back();
        table.entries.back().active = true;
        return static_cast<std::uint32_t>(table.entries.size() - 1);
    }

    void ValueHeap::Upsert(CollectionTable &table, const Value &key, const Value &value) {
        EnsureCapacity(table);
        auto hash = HashKey(key);
        std::uint32_t bucket = 0;
        bool collision = false;
        auto existing = Locate(table, key, hash, bucket, collision);
        if (collision) {
            m_Metrics.collisions += 1;
        }
        if (existing != kInvalidIndex) {
            table.entries[existing].value = value;
            return;
        }
        auto entryIndex = AllocateEntry(table);
        auto &entry = table.entries[entryIndex];
        entry.hash = hash;
        // -0 keys are stored as +0.
        entry.key = key.IsNumber() && key.AsNumber() == 0.0 ? Value::Number(0.0) : key;
        entry.value = value;
        table.buckets[bucket] = entryIndex;
        LinkTail(table, entryIndex);
        table.size += 1;
        m_Metrics.collectionInserts += 1;
    }

    bool ValueHeap::Remove(CollectionTable &table, const Value &key) {
        std::uint32_t bucket = 0;
        bool collision = false;
        auto index = Locate(table, key, HashKey(key), bucket, collision);
        if (index == kInvalidIndex) {
            return false;
        }
        auto &entry = table.entries[index];
        entry.active = false;
        entry.hash = 0;
        entry.key.Reset();
        entry.value.Reset();
        Unlink(table, index);
        table.freeEntries.push_back(index);
        table.buckets[bucket] = kDeletedIndex;
        if (table.size > 0) {
            table.size -= 1;
        }
        m_Metrics.collectionDeletes += 1;
        return true;
    }

    void ValueHeap::LinkTail(CollectionTable &table, std::uint32_t entryIndex) {
        auto &entry = table.entries[entryIndex];
        if (table.tail == kInvalidIndex) {
            table.head = entryIndex;
            table.tail = entryIndex;
            entry.orderPrev = kInvalidIndex;
            entry.orderNext = kInvalidIndex;
            return;
        }
        table.entries[table.tail].orderNext = entryIndex;
        entry.orderPrev = table.tail;
        entry.orderNext = kInvalidIndex;
        table.tail = entryIndex;
    }

    void ValueHeap::Unlink(CollectionTable &table, std::uint32_t entryIndex) {
        auto &entry = table.entries[entryIndex];
        auto prev = entry.orderPrev;
        auto next = entry.orderNext;
        if (prev != kInvalidIndex) {
            table.entries[prev].orderNext = next;
        } else {
            table.head = next;
        }
        if (next != kInvalidIndex) {
            table.entries[next].orderPrev = prev;
        } else {
            table.tail = prev;
        }
        entry.orderPrev = kInvalidIndex;
        entry.orderNext = kInvalidIndex;
    }
}
