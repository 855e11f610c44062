#include "mirror/deep/structured_clone.h"

#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace mirror::deep {
    namespace {
        class Cloner {
        public:
            explicit Cloner(ValueHeap &heap)
                : m_Heap(heap),
                  m_Memo() {
            }

            StatusCode CloneValue(const Value &input, Value &outValue) {
                if (!input.IsHandle() || input.IsFunction() || input.IsError()) {
                    outValue = input;
                    return StatusCode::Ok;
                }
                auto existing = m_Memo.find(input.AsHandle());
                if (existing != m_Memo.end()) {
                    outValue = existing->second;
                    return StatusCode::Ok;
                }
                const auto *record = m_Heap.Find(input);
                if (!record) {
                    return StatusCode::NotFound;
                }
                // Records move when the heap grows, so copy what is needed
                // before allocating.
                switch (record->kind) {
                    case Value::HandleKind::Object:
                        return CloneObject(input, outValue);
                    case Value::HandleKind::Array:
                        return CloneArray(input, outValue);
                    case Value::HandleKind::Map:
                        return CloneMap(input, outValue);
                    case Value::HandleKind::Set:
                        return CloneSet(input, outValue);
                    case Value::HandleKind::Date: {
                        auto status = m_Heap.CreateDate(record->timeValue, outValue);
                        return Remember(input, outValue, status);
                    }
                    case Value::HandleKind::RegExp: {
                        std::string source = record->source;
                        std::string flags = record->flags;
                        auto status = m_Heap.CreateRegExp(source, flags, outValue);
                        return Remember(input, outValue, status);
                    }
                    case Value::HandleKind::ArrayBuffer:
                        return CloneBuffer(input, outValue);
                    case Value::HandleKind::DataView:
                    case Value::HandleKind::TypedArray:
                        return CloneView(input, *record, outValue);
                    case Value::HandleKind::Function:
                    case Value::HandleKind::Error:
                        break;
                }
                return StatusCode::InvalidArgument;
            }

        private:
            ValueHeap &m_Heap;
            std::unordered_map<ValueHeap::Handle, Value> m_Memo;

            StatusCode Remember(const Value &input, const Value &clone, StatusCode status) {
                if (status == StatusCode::Ok) {
                    m_Memo[input.AsHandle()] = clone;
                }
                return status;
            }

            StatusCode CloneObject(const Value &input, Value &outValue) {
                auto properties = m_Heap.Find(input)->properties;
                auto status = Remember(input, outValue, m_Heap.CreateObject(outValue));
                if (status != StatusCode::Ok) {
                    return status;
                }
                Value cloned;
                for (const auto &property: properties) {
                    status = CloneValue(property.value, cloned);
                    if (status != StatusCode::Ok) {
                        return status;
                    }
                    status = m_Heap.DefineProperty(outValue, property.key, cloned, property.enumerable);
                    if (status != StatusCode::Ok) {
                        return status;
                    }
                }
                return StatusCode::Ok;
            }

            StatusCode CloneArray(const Value &input, Value &outValue) {
                auto elements = m_Heap.Find(input)->elements;
                auto status = Remember(input, outValue, m_Heap.CreateArray(outValue));
                if (status != StatusCode::Ok) {
                    return status;
                }
                Value cloned;
                for (const auto &element: elements) {
                    status = CloneValue(element, cloned);
                    if (status != StatusCode::Ok) {
                        return status;
                    }
                    status = m_Heap.ArrayPush(outValue, cloned);
                    if (status != StatusCode::Ok) {
                        return status;
                    }
                }
                return StatusCode::Ok;
            }

            StatusCode CloneMap(const Value &input, Value &outValue) {
                std::vector<std::pair<Value, Value> > entries;
                auto status = m_Heap.MapEntries(input, entries);
                if (status != StatusCode::Ok) {
                    return status;
                }
                status = Remember(input, outValue, m_Heap.CreateMap(outValue));
                if (status != StatusCode::Ok) {
                    return status;
                }
                Value key;
                Value value;
                for (const auto &entry: entries) {
                    status = CloneValue(entry.first, key);
                    if (status != StatusCode::Ok) {
                        return status;
                    }
                    status = CloneValue(entry.second, value);
                    if (status != StatusCode::Ok) {
                        return status;
                    }
                    status = m_Heap.MapSet(outValue, key, value);
                    if (status != StatusCode::Ok) {
                        return status;
                    }
                }
                return StatusCode::Ok;
            }

            StatusCode CloneSet(const Value &input, Value &outValue) {
                std::vector<Value> values;
                auto status = m_Heap.SetValues(input, values);
                if (status != StatusCode::Ok) {
                    return status;
                }
                status = Remember(input, outValue, m_Heap.CreateSet(outValue));
                if (status != StatusCode::Ok) {
                    return status;
                }
                Value cloned;
                for (const auto &value: values) {
                    status = CloneValue(value, cloned);
                    if (status != StatusCode::Ok) {
                        return status;
                    }
                    status = m_Heap.SetAdd(outValue, cloned);
                    if (status != StatusCode::Ok) {
                        return status;
                    }
                }
                return StatusCode::Ok;
            }

            StatusCode CloneBuffer(const Value &input, Value &outValue) {
                auto bytes = m_Heap.Find(input)->bytes;
                auto status = Remember(input, outValue, m_Heap.CreateArrayBuffer(bytes.size(), outValue));
                if (status != StatusCode::Ok) {
                    return status;
                }
                return m_Heap.WriteBytes(outValue, 0, bytes.data(), bytes.size());
            }

            StatusCode CloneView(const Value &input, const ValueHeap::Record &record, Value &outValue) {
                auto kind = record.kind;
                auto view = record.view;
                Value buffer;
                auto status = CloneValue(Value::Handle(view.buffer, Value::HandleKind::ArrayBuffer), buffer);
                if (status != StatusCode::Ok) {
                    return status;
                }
                if (kind == Value::HandleKind::DataView) {
                    status = m_Heap.CreateDataView(buffer, view.byteOffset, view.length, outValue);
                } else {
                    status = m_Heap.CreateTypedArrayView(buffer, view.type, view.byteOffset, view.length, outValue);
                }
                return Remember(input, outValue, status);
            }
        };
    }

    StatusCode StructuredClone(ValueHeap &heap, const Value &input, Value &outValue) {
        outValue.Reset();
        Cloner cloner(heap);
        Value clone;
        auto status = cloner.CloneValue(input, clone);
        if (status != StatusCode::Ok) {
            return status;
        }
        outValue = std::move(clone);
        return StatusCode::Ok;
    }
}
