#pragma once

#include <string>

#include "mirror/config.h"
#include "mirror/heap.h"
#include "mirror/status.h"
#include "mirror/value.h"
#include "mirror/deep/path.h"
#include "mirror/deep/result.h"

namespace mirror::deep {
    struct AssertOptions {
        // Prepended to the comparison path, e.g. {"root"}.
        Path path;
        std::string label;
        // Replaces the "ValidationError" prefix of the message.
        std::string message;
        std::string hint;
        std::string helpUrl;
    };

    struct AssertionReport {
        AssertionReport();

        std::string expected;
        Path path;
        std::string renderedPath;
        ReasonCode reason;
        std::string detail;
        std::string label;
        std::string hint;
        std::string helpUrl;
        std::string receivedType;
        std::string receivedTag;
        std::string receivedPreview;
        std::string message;
    };

    // Returns AssertionFailed and fills `outReport` (when given) if `actual`
    // is not deeply equal to `expected`.
    StatusCode AssertDeepEqual(const ValueHeap &heap,
                               const Value &actual,
                               const Value &expected,
                               const ComparisonOptions &options = ComparisonOptions(),
                               const AssertOptions &assertOptions = AssertOptions(),
                               AssertionReport *outReport = nullptr);

    StatusCode AssertDeepClone(const ValueHeap &heap,
                               const Value &actual,
                               const Value &expected,
                               const CloneOptions &options = CloneOptions(),
                               const AssertOptions &assertOptions = AssertOptions(),
                               AssertionReport *outReport = nullptr);

    std::string ReceivedType(const Value &value);
    std::string ReceivedTag(const ValueHeap &heap, const Value &value);
    std::string PreviewValue(const ValueHeap &heap, const Value &value);
}
