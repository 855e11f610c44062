#include "mirror/deep/assert.h"

#include <vector>

#include "mirror/deep/compare.h"

namespace mirror::deep {
    namespace {
        constexpr std::size_t kPreviewStringLimit = 40;
        constexpr std::size_t kPreviewKeyLimit = 5;

        std::string SizedPreview(std::string_view name, std::size_t size) {
            std::string text(name);
            text.push_back('(');
            text.append(std::to_string(size));
            text.push_back(')');
            return text;
        }

        std::string PreviewObject(const ValueHeap &heap, const Value &value) {
            std::vector<PropertyKey> keys;
            heap.OwnKeys(value, keys);
            std::string text("{");
            for (std::size_t i = 0; i < keys.size() && i < kPreviewKeyLimit; ++i) {
                if (i > 0) {
                    text.append(", ");
                }
                if (keys[i].IsSymbol()) {
                    text.append("Symbol(");
                    text.append(heap.SymbolDescription(keys[i].symbol));
                    text.push_back(')');
                } else {
                    text.append(keys[i].name);
                }
            }
            if (keys.size() > kPreviewKeyLimit) {
                text.append(", ...");
            }
            text.push_back('}');
            return text;
        }

        StatusCode Report(const ValueHeap &heap,
                          const Value &actual,
                          const ComparisonResult &result,
                          std::string_view expectation,
                          const AssertOptions &assertOptions,
                          AssertionReport *outReport) {
            if (result.equal) {
                return StatusCode::Ok;
            }
            if (!outReport) {
                return StatusCode::AssertionFailed;
            }
            auto &report = *outReport;
            report = AssertionReport();
            report.expected.assign(expectation.begin(), expectation.end());
            report.expected.append(" (");
            report.expected.append(ReasonName(result.reason));
            if (!result.detail.empty()) {
                report.expected.append(": ");
                report.expected.append(result.detail);
            }
            report.expected.push_back(')');
            report.path = assertOptions.path.Concat(result.path);
            report.renderedPath = RenderPath(report.path);
            report.reason = result.reason;
            report.detail = result.detail;
            report.label = assertOptions.label;
            report.hint = assertOptions.hint;
            report.helpUrl = assertOptions.helpUrl;
            report.receivedType = ReceivedType(actual);
            report.receivedTag = ReceivedTag(heap, actual);
            report.receivedPreview = PreviewValue(heap, actual);

            auto &message = report.message;
            message = assertOptions.message.empty() ? std::string("ValidationError") : assertOptions.message;
            message.append(": expected ");
            message.append(report.expected);
            if (!report.renderedPath.empty()) {
                message.append(" at ");
                message.append(report.renderedPath);
            }
            if (!report.label.empty()) {
                message.append(" (");
                message.append(report.label);
                message.push_back(')');
            }
            message.append(" | received.type=");
            message.append(report.receivedType);
            message.append(" tag=");
            message.append(report.receivedTag);
            message.append(" preview=");
            message.append(report.receivedPreview);
            if (!report.hint.empty()) {
                message.append(" | hint: ");
                message.append(report.hint);
            }
            if (!report.helpUrl.empty()) {
                message.append(" | help: ");
                message.append(report.helpUrl);
            }
            return StatusCode::AssertionFailed;
        }
    }

    AssertionReport::AssertionReport()
        : expected(),
          path(),
          renderedPath(),
          reason(ReasonCode::None),
          detail(),
          label(),
          hint(),
          helpUrl(),
          receivedType(),
          receivedTag(),
          receivedPreview(),
          message() {
    }

    StatusCode AssertDeepEqual(const ValueHeap &heap,
                               const Value &actual,
                               const Value &expected,
                               const ComparisonOptions &options,
                               const AssertOptions &assertOptions,
                               AssertionReport *outReport) {
        CloneOptions cloneOptions;
        static_cast<ComparisonOptions &>(cloneOptions) = options;
        auto result = DeepCompare(heap, actual, expected, CompareMode::Equality, cloneOptions);
        return Report(heap, actual, result, "deep equality to expected value", assertOptions, outReport);
    }

    StatusCode AssertDeepClone(const ValueHeap &heap,
                               const Value &actual,
                               const Value &expected,
                               const CloneOptions &options,
                               const AssertOptions &assertOptions,
                               AssertionReport *outReport) {
        auto result = DeepCompare(heap, actual, expected, CompareMode::Clone, options);
        return Report(heap, actual, result, "deep clone (deep equality + no shared references)", assertOptions,
                      outReport);
    }

    std::string ReceivedType(const Value &value) {
        if (value.IsNull()) {
            return "null";
        }
        return std::string(value.TypeOf());
    }

    std::string ReceivedTag(const ValueHeap &heap, const Value &value) {
        std::string_view name;
        switch (value.kind) {
            case Value::Kind::Undefined:
                name = "Undefined";
                break;
            case Value::Kind::Null:
                name = "Null";
                break;
            case Value::Kind::Boolean:
                name = "Boolean";
                break;
            case Value::Kind::Number:
                name = "Number";
                break;
            case Value::Kind::BigInt:
                name = "BigInt";
                break;
            case Value::Kind::String:
                name = "String";
                break;
            case Value::Kind::Symbol:
                name = "Symbol";
                break;
            case Value::Kind::Handle: {
                const auto *record = heap.Find(value);
                if (!record) {
                    name = "Object";
                } else if (record->kind == Value::HandleKind::TypedArray) {
                    name = ElementTypeName(record->view.type);
                } else {
                    name = HandleKindName(record->kind);
                }
                break;
            }
        }
        std::string tag("[object ");
        tag.append(name);
        tag.push_back(']');
        return tag;
    }

    std::string PreviewValue(const ValueHeap &heap, const Value &value) {
        switch (value.kind) {
            case Value::Kind::String: {
                auto text = value.AsString();
                if (text.size() > kPreviewStringLimit) {
                    return QuoteJson(text.substr(0, kPreviewStringLimit)) + "...";
                }
                return QuoteJson(text);
            }
            case Value::Kind::Symbol:
                return DescribePrimitive(heap, value);
            case Value::Kind::Handle:
                break;
            default:
                return value.ToString();
        }
        const auto *record = heap.Find(value);
        if (!record) {
            return "<destroyed>";
        }
        switch (record->kind) {
            case Value::HandleKind::Array:
                return SizedPreview("Array", record->elements.size());
            case Value::HandleKind::Map:
                return SizedPreview("Map", record->collection.size);
            case Value::HandleKind::Set:
                return SizedPreview("Set", record->collection.size);
            case Value::HandleKind::Function:
                return "[Function " + (record->name.empty() ? std::string("anonymous") : record->name) + "]";
            case Value::HandleKind::Error:
                return record->message.empty() ? record->name : record->name + ": " + record->message;
            case Value::HandleKind::Date:
                return "Date(" + Value::Number(record->timeValue).ToString() + ")";
            case Value::HandleKind::RegExp:
                return "/" + record->source + "/" + record->flags;
            case Value::HandleKind::ArrayBuffer:
            case Value::HandleKind::DataView:
                return SizedPreview(HandleKindName(record->kind), heap.ByteLength(value));
            case Value::HandleKind::TypedArray:
                return SizedPreview(ElementTypeName(record->view.type), heap.TypedArrayLength(value));
            case Value::HandleKind::Object:
                break;
        }
        return PreviewObject(heap, value);
    }
}
