#include "mirror/deep/path.h"

#include <cstdio>
#include <utility>

namespace mirror::deep {
    namespace {
        bool IsIdentifierStart(char c) noexcept {
            return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || c == '_' || c == '$';
        }

        bool IsIdentifierPart(char c) noexcept {
            return IsIdentifierStart(c) || (c >= '0' && c <= '9');
        }
    }

    PathSegment::PathSegment()
        : kind(Kind::Index),
          text(),
          symbol(0),
          index(0) {
    }

    PathSegment PathSegment::FromKey(std::string_view key) {
        PathSegment segment;
        segment.kind = Kind::Key;
        segment.text.assign(key.begin(), key.end());
        return segment;
    }

    PathSegment PathSegment::FromSymbol(std::uint64_t symbol, std::string_view description) {
        PathSegment segment;
        segment.kind = Kind::Symbol;
        segment.symbol = symbol;
        segment.text.assign(description.begin(), description.end());
        return segment;
    }

    PathSegment PathSegment::FromIndex(std::size_t index) noexcept {
        PathSegment segment;
        segment.kind = Kind::Index;
        segment.index = index;
        return segment;
    }

    PathSegment PathSegment::FromMarker(std::string_view marker) {
        PathSegment segment;
        segment.kind = Kind::Marker;
        segment.text.assign(marker.begin(), marker.end());
        return segment;
    }

    PathSegment PathSegment::FromPropertyKey(const ValueHeap &heap, const PropertyKey &key) {
        if (key.IsSymbol()) {
            return FromSymbol(key.symbol, heap.SymbolDescription(key.symbol));
        }
        return FromKey(key.name);
    }

    bool PathSegment::operator==(const PathSegment &other) const noexcept {
        if (kind != other.kind) {
            return false;
        }
        switch (kind) {
            case Kind::Key:
            case Kind::Marker:
                return text == other.text;
            case Kind::Symbol:
                return symbol == other.symbol;
            case Kind::Index:
                return index == other.index;
        }
        return false;
    }

    bool PathSegment::operator!=(const PathSegment &other) const noexcept {
        return !(*this == other);
    }

    Path::Path()
        : m_Segments() {
    }

    Path::Path(std::initializer_list<PathSegment> segments)
        : m_Segments(segments) {
    }

    Path Path::Extend(PathSegment segment) const {
        Path extended;
        extended.m_Segments.reserve(m_Segments.size() + 1);
        extended.m_Segments = m_Segments;
        extended.m_Segments.push_back(std::move(segment));
        return extended;
    }

    Path Path::Concat(const Path &suffix) const {
        Path combined;
        combined.m_Segments.reserve(m_Segments.size() + suffix.m_Segments.size());
        combined.m_Segments.insert(combined.m_Segments.end(), m_Segments.begin(), m_Segments.end());
        combined.m_Segments.insert(combined.m_Segments.end(), suffix.m_Segments.begin(), suffix.m_Segments.end());
        return combined;
    }

    std::size_t Path::Size() const noexcept {
        return m_Segments.size();
    }

    bool Path::Empty() const noexcept {
        return m_Segments.empty();
    }

    const PathSegment &Path::operator[](std::size_t index) const noexcept {
        return m_Segments[index];
    }

    const std::vector<PathSegment> &Path::Segments() const noexcept {
        return m_Segments;
    }

    bool Path::operator==(const Path &other) const noexcept {
        return m_Segments == other.m_Segments;
    }

    bool Path::operator!=(const Path &other) const noexcept {
        return !(*this == other);
    }

    bool IsIdentifierKey(std::string_view key) noexcept {
        if (key.empty() || !IsIdentifierStart(key.front())) {
            return false;
        }
        for (char c: key.substr(1)) {
            if (!IsIdentifierPart(c)) {
                return false;
            }
        }
        return true;
    }

    std::string QuoteJson(std::string_view text) {
        std::string quoted;
        quoted.reserve(text.size() + 2);
        quoted.push_back('"');
        for (char c: text) {
            switch (c) {
                case '"':
                    quoted.append("\\\"");
                    break;
                case '\\':
                    quoted.append("\\\\");
                    break;
                case '\b':
                    quoted.append("\\b");
                    break;
                case '\f':
                    quoted.append("\\f");
                    break;
                case '\n':
                    quoted.append("\\n");
                    break;
                case '\r':
                    quoted.append("\\r");
                    break;
                case '\t':
                    quoted.append("\\t");
                    break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20) {
                        char buffer[8];
                        std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned>(c));
                        quoted.append(buffer);
                    } else {
                        quoted.push_back(c);
                    }
                    break;
            }
        }
        quoted.push_back('"');
        return quoted;
    }

    std::string RenderPath(const Path &path) {
        std::string rendered;
        for (const auto &segment: path.Segments()) {
            switch (segment.kind) {
                case PathSegment::Kind::Index:
                    rendered.push_back('[');
                    rendered.append(std::to_string(segment.index));
                    rendered.push_back(']');
                    break;
                case PathSegment::Kind::Symbol:
                    rendered.append("[Symbol(");
                    rendered.append(segment.text);
                    rendered.append(")]");
                    break;
                case PathSegment::Kind::Key:
                case PathSegment::Kind::Marker:
                    if (IsIdentifierKey(segment.text)) {
                        if (!rendered.empty()) {
                            rendered.push_back('.');
                        }
                        rendered.append(segment.text);
                    } else {
                        rendered.push_back('[');
                        rendered.append(QuoteJson(segment.text));
                        rendered.push_back(']');
                    }
                    break;
            }
        }
        return rendered;
    }
}
