#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <bit>
#include <charconv>
#include <cmath>
#include <limits>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

namespace mirror {
    struct Value {
        enum class Kind : std::uint8_t {
            Undefined,
            Null,
            Boolean,
            Number,
            BigInt,
            String,
            Symbol,
            Handle
        };

        enum class HandleKind : std::uint8_t {
            Object = 0,
            Array,
            Map,
            Set,
            Function,
            Error,
            Date,
            RegExp,
            ArrayBuffer,
            DataView,
            TypedArray
        };

        Value() noexcept;

        Value(const Value &other);
        Value(Value &&other) noexcept;
        Value &operator=(const Value &other);
        Value &operator=(Value &&other) noexcept;
        ~Value();

        static Value Undefined() noexcept;
        static Value Null() noexcept;
        static Value Boolean(bool v) noexcept;
        static Value Number(double v) noexcept;
        static Value String(std::string_view v);
        static Value Symbol(std::uint64_t id) noexcept;
        static Value BigInt(std::int64_t v);
        static Value Handle(std::uint64_t handle, HandleKind kind) noexcept;

        // Accepts an optional sign followed by decimal digits; leading zeros
        // and the sign of zero are normalized away.
        static bool ParseBigInt(std::string_view text, Value &outValue);

        bool IsUndefined() const noexcept;
        bool IsNull() const noexcept;
        bool IsBoolean() const noexcept;
        bool IsNumber() const noexcept;
        bool IsBigInt() const noexcept;
        bool IsString() const noexcept;
        bool IsSymbol() const noexcept;
        bool IsHandle() const noexcept;
        bool IsFunction() const noexcept;
        bool IsError() const noexcept;
        bool Empty() const noexcept;

        double AsNumber(double fallback = 0.0) const noexcept;
        std::string_view AsString() const noexcept;
        std::string_view BigIntDigits() const noexcept;
        std::uint64_t AsHandle() const noexcept;
        std::uint64_t AsSymbol() const noexcept;
        HandleKind HandleTag() const noexcept;

        // Result of the host typeof operator; null reports "object".
        std::string_view TypeOf() const noexcept;

        void Reset() noexcept;

        // Strict equality: NaN differs from itself, +0 equals -0.
        bool operator==(const Value &other) const noexcept;
        bool operator!=(const Value &other) const noexcept;

        bool SameValue(const Value &other) const noexcept;

        bool SameValueZero(const Value &other) const noexcept;

        std::uint64_t Hash() const noexcept;

        std::string ToString() const;

        Kind kind;

    private:
        union Payload {
            bool booleanValue;
            double numberValue;
            std::uint64_t handleValue;
            Payload() noexcept {
                Reset();
            }
            void Reset() noexcept {
                std::memset(this, 0, sizeof(Payload));
            }
        } m_Payload;

        std::uint8_t m_Tag;
        std::string m_String;

        static std::uint64_t HashBytes(const void *data, std::size_t size) noexcept;
        static std::uint64_t HashString(std::string_view text) noexcept;
        static std::uint64_t HashNormalizedDouble(double value) noexcept;
        static bool SameNumber(double lhs, double rhs) noexcept;
        static std::string FormatNumber(double number);
    };

    inline Value::Value() noexcept
        : kind(Kind::Undefined),
          m_Payload(),
          m_Tag(0),
          m_String() {
    }

    inline Value::Value(const Value &other)
        : kind(other.kind),
          m_Payload(other.m_Payload),
          m_Tag(other.m_Tag),
          m_String(other.m_String) {
    }

    inline Value::Value(Value &&other) noexcept
        : kind(other.kind),
          m_Payload(other.m_Payload),
          m_Tag(other.m_Tag),
          m_String(std::move(other.m_String)) {
        other.kind = Kind::Undefined;
        other.m_Payload.Reset();
        other.m_Tag = 0;
        other.m_String.clear();
    }

    inline Value &Value::operator=(const Value &other) {
        if (this != &other) {
            kind = other.kind;
            m_Payload = other.m_Payload;
            m_Tag = other.m_Tag;
            m_String = other.m_String;
        }
        return *this;
    }

    inline Value &Value::operator=(Value &&other) noexcept {
        if (this != &other) {
            kind = other.kind;
            m_Payload = other.m_Payload;
            m_Tag = other.m_Tag;
            m_String = std::move(other.m_String);
            other.kind = Kind::Undefined;
            other.m_Payload.Reset();
            other.m_Tag = 0;
            other.m_String.clear();
        }
        return *this;
    }

    inline Value::~Value() = default;

    inline Value Value::Undefined() noexcept {
        return Value();
    }

    inline Value Value::Null() noexcept {
        Value value;
        value.kind = Kind::Null;
        return value;
    }

    inline Value Value::Boolean(bool v) noexcept {
        Value value;
        value.kind = Kind::Boolean;
        value.m_Payload.booleanValue = v;
        return value;
    }

    inline Value Value::Number(double v) noexcept {
        Value value;
        value.kind = Kind::Number;
        value.m_Payload.numberValue = v;
        return value;
    }

    inline Value Value::String(std::string_view v) {
        Value value;
        value.kind = Kind::String;
        value.m_String.assign(v.begin(), v.end());
        return value;
    }

    inline Value Value::Symbol(std::uint64_t id) noexcept {
        Value value;
        value.kind = Kind::Symbol;
        value.m_Payload.handleValue = id;
        return value;
    }

    inline Value Value::BigInt(std::int64_t v) {
        Value value;
        value.kind = Kind::BigInt;
        value.m_String = std::to_string(v);
        return value;
    }

    inline Value Value::Handle(std::uint64_t handle, HandleKind kindTag) noexcept {
        Value value;
        value.kind = Kind::Handle;
        value.m_Payload.handleValue = handle;
        value.m_Tag = static_cast<std::uint8_t>(kindTag);
        return value;
    }

    inline bool Value::ParseBigInt(std::string_view text, Value &outValue) {
        bool negative = false;
        if (!text.empty() && (text.front() == '-' || text.front() == '+')) {
            negative = text.front() == '-';
            text.remove_prefix(1);
        }
        if (text.empty()) {
            return false;
        }
        for (char c: text) {
            if (c < '0' || c > '9') {
                return false;
            }
        }
        auto first = text.find_first_not_of('0');
        if (first == std::string_view::npos) {
            text = "0";
            negative = false;
        } else {
            text.remove_prefix(first);
        }
        Value value;
        value.kind = Kind::BigInt;
        if (negative) {
            value.m_String.push_back('-');
        }
        value.m_String.append(text.begin(), text.end());
        outValue = std::move(value);
        return true;
    }

    inline bool Value::IsUndefined() const noexcept {
        return kind == Kind::Undefined;
    }

    inline bool Value::IsNull() const noexcept {
        return kind == Kind::Null;
    }

    inline bool Value::IsBoolean() const noexcept {
        return kind == Kind::Boolean;
    }

    inline bool Value::IsNumber() const noexcept {
        return kind == Kind::Number;
    }

    inline bool Value::IsBigInt() const noexcept {
        return kind == Kind::BigInt;
    }

    inline bool Value::IsString() const noexcept {
        return kind == Kind::String;
    }

    inline bool Value::IsSymbol() const noexcept {
        return kind == Kind::Symbol;
    }

    inline bool Value::IsHandle() const noexcept {
        return kind == Kind::Handle;
    }

    inline bool Value::IsFunction() const noexcept {
        return kind == Kind::Handle && m_Tag == static_cast<std::uint8_t>(HandleKind::Function);
    }

    inline bool Value::IsError() const noexcept {
        return kind == Kind::Handle && m_Tag == static_cast<std::uint8_t>(HandleKind::Error);
    }

    inline bool Value::Empty() const noexcept {
        return kind == Kind::Undefined;
    }

    inline double Value::AsNumber(double fallback) const noexcept {
        switch (kind) {
            case Kind::Number:
                return m_Payload.numberValue;
            case Kind::Boolean:
                return m_Payload.booleanValue ? 1.0 : 0.0;
            default:
                return fallback;
        }
    }

    inline std::string_view Value::AsString() const noexcept {
        if (kind == Kind::String) {
            return std::string_view(m_String);
        }
        return std::string_view();
    }

    inline std::string_view Value::BigIntDigits() const noexcept {
        if (kind == Kind::BigInt) {
            return std::string_view(m_String);
        }
        return std::string_view();
    }

    inline std::uint64_t Value::AsHandle() const noexcept {
        if (kind == Kind::Handle) {
            return m_Payload.handleValue;
        }
        return 0;
    }

    inline std::uint64_t Value::AsSymbol() const noexcept {
        if (kind == Kind::Symbol) {
            return m_Payload.handleValue;
        }
        return 0;
    }

    inline Value::HandleKind Value::HandleTag() const noexcept {
        if (kind == Kind::Handle) {
            return static_cast<HandleKind>(m_Tag);
        }
        return HandleKind::Object;
    }

    inline std::string_view Value::TypeOf() const noexcept {
        switch (kind) {
            case Kind::Undefined:
                return "undefined";
            case Kind::Null:
                return "object";
            case Kind::Boolean:
                return "boolean";
            case Kind::Number:
                return "number";
            case Kind::BigInt:
                return "bigint";
            case Kind::String:
                return "string";
            case Kind::Symbol:
                return "symbol";
            case Kind::Handle:
                return IsFunction() ? "function" : "object";
        }
        return "undefined";
    }

    inline void Value::Reset() noexcept {
        kind = Kind::Undefined;
        m_Payload.Reset();
        m_Tag = 0;
        m_String.clear();
    }

    inline bool Value::operator==(const Value &other) const noexcept {
        if (kind != other.kind) {
            return false;
        }
        switch (kind) {
            case Kind::Undefined:
            case Kind::Null:
                return true;
            case Kind::Boolean:
                return m_Payload.booleanValue == other.m_Payload.booleanValue;
            case Kind::Number:
                return m_Payload.numberValue == other.m_Payload.numberValue;
            case Kind::Symbol:
                return m_Payload.handleValue == other.m_Payload.handleValue;
            case Kind::Handle:
                return m_Payload.handleValue == other.m_Payload.handleValue
                       && m_Tag == other.m_Tag;
            case Kind::BigInt:
            case Kind::String:
                return m_String == other.m_String;
        }
        return false;
    }

    inline bool Value::operator!=(const Value &other) const noexcept {
        return !(*this == other);
    }

    inline bool Value::SameValue(const Value &other) const noexcept {
        if (kind == Kind::Number && other.kind == Kind::Number) {
            return SameNumber(m_Payload.numberValue, other.m_Payload.numberValue);
        }
        return *this == other;
    }

    inline bool Value::SameValueZero(const Value &other) const noexcept {
        if (kind == Kind::Number && other.kind == Kind::Number) {
            double lhs = m_Payload.numberValue;
            double rhs = other.m_Payload.numberValue;
            if (std::isnan(lhs) && std::isnan(rhs)) {
                return true;
            }
            return lhs == rhs;
        }
        return *this == other;
    }

    inline std::uint64_t Value::Hash() const noexcept {
        switch (kind) {
            case Kind::Undefined:
                return 0x53a94d8f3f1b4c15ull;
            case Kind::Null:
                return 0x8c9f4a1be2d76143ull;
            case Kind::Boolean:
                return m_Payload.booleanValue ? 0x9b5f5b1a9bd0d3f5ull : 0x4f5a1c7d5c3e2b19ull;
            case Kind::Number:
                return HashNormalizedDouble(m_Payload.numberValue);
            case Kind::String:
                return HashString(m_String);
            case Kind::BigInt:
                return HashString(m_String) ^ 0x2545f4914f6cdd1dull;
            case Kind::Symbol:
            case Kind::Handle: {
                std::uint64_t buffer[2] = {m_Payload.handleValue,
                                           static_cast<std::uint64_t>(kind) << 8 | m_Tag};
                return HashBytes(buffer, sizeof(buffer));
            }
        }
        return 0;
    }

    inline std::string Value::ToString() const {
        switch (kind) {
            case Kind::Undefined:
                return "undefined";
            case Kind::Null:
                return "null";
            case Kind::Boolean:
                return m_Payload.booleanValue ? "true" : "false";
            case Kind::Number: {
                double number = m_Payload.numberValue;
                if (std::isnan(number)) {
                    return "NaN";
                }
                if (std::isinf(number)) {
                    return number > 0 ? "Infinity" : "-Infinity";
                }
                if (number == 0.0) {
                    return std::signbit(number) ? "-0" : "0";
                }
                return FormatNumber(number);
            }
            case Kind::String:
                return m_String;
            case Kind::BigInt:
                return m_String + "n";
            case Kind::Symbol: {
                std::ostringstream stream;
                stream << "symbol(0x" << std::hex << m_Payload.handleValue << ")";
                return stream.str();
            }
            case Kind::Handle: {
                std::ostringstream stream;
                stream << "handle(" << static_cast<int>(m_Tag) << ":0x"
                       << std::hex << m_Payload.handleValue << ")";
                return stream.str();
            }
        }
        return {};
    }

    inline std::uint64_t Value::HashBytes(const void *data, std::size_t size) noexcept {
        constexpr std::uint64_t kOffset = 1469598103934665603ull;
        constexpr std::uint64_t kPrime = 1099511628211ull;
        const auto *bytes = static_cast<const std::uint8_t *>(data);
        std::uint64_t hash = kOffset;
        for (std::size_t i = 0; i < size; ++i) {
            hash ^= static_cast<std::uint64_t>(bytes[i]);
            hash *= kPrime;
        }
        return hash == 0 ? kOffset : hash;
    }

    inline std::uint64_t Value::HashString(std::string_view text) noexcept {
        return HashBytes(text.data(), text.size());
    }

    inline std::uint64_t Value::HashNormalizedDouble(double value) noexcept {
        std::uint64_t bits = std::bit_cast<std::uint64_t>(value);
        if (std::isnan(value)) {
            bits = 0x7ff8000000000000ull;
        } else if (bits == 0x8000000000000000ull) {
            bits = 0ull;
        }
        return HashBytes(&bits, sizeof(bits));
    }

    // Shortest round-trip digits laid out by the Number::toString rules:
    // positional notation for exponents in [-7, 21), otherwise d.ddde+n.
    inline std::string Value::FormatNumber(double number) {
        std::string text;
        if (number < 0) {
            text.push_back('-');
            number = -number;
        }
        char buffer[32];
        auto result = std::to_chars(buffer, buffer + sizeof(buffer), number, std::chars_format::scientific);
        std::string_view scientific(buffer, static_cast<std::size_t>(result.ptr - buffer));
        auto marker = scientific.find('e');
        std::string digits;
        for (char c: scientific.substr(0, marker)) {
            if (c != '.') {
                digits.push_back(c);
            }
        }
        int exponent = 0;
        auto exponentText = scientific.substr(marker + 1);
        if (!exponentText.empty() && exponentText.front() == '+') {
            exponentText.remove_prefix(1);
        }
        std::from_chars(exponentText.data(), exponentText.data() + exponentText.size(), exponent);

        int k = static_cast<int>(digits.size());
        int n = exponent + 1;
        if (k <= n && n <= 21) {
            text.append(digits);
            text.append(static_cast<std::size_t>(n - k), '0');
        } else if (0 < n && n <= 21) {
            text.append(digits, 0, static_cast<std::size_t>(n));
            text.push_back('.');
            text.append(digits, static_cast<std::size_t>(n), std::string::npos);
        } else if (-6 < n && n <= 0) {
            text.append("0.");
            text.append(static_cast<std::size_t>(-n), '0');
            text.append(digits);
        } else {
            text.push_back(digits.front());
            if (k > 1) {
                text.push_back('.');
                text.append(digits, 1, std::string::npos);
            }
            text.push_back('e');
            text.push_back(n - 1 < 0 ? '-' : '+');
            text.append(std::to_string(n - 1 < 0 ? 1 - n : n - 1));
        }
        return text;
    }

    inline bool Value::SameNumber(double lhs, double rhs) noexcept {
        if (std::isnan(lhs) && std::isnan(rhs)) {
            return true;
        }
        return lhs == rhs && std::signbit(lhs) == std::signbit(rhs);
    }
}
