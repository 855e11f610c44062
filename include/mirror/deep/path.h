#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

#include "mirror/heap.h"

namespace mirror::deep {
    struct PathSegment {
        enum class Kind : std::uint8_t {
            Key,
            Symbol,
            Index,
            Marker
        };

        PathSegment();

        static PathSegment FromKey(std::string_view key);
        static PathSegment FromSymbol(std::uint64_t symbol, std::string_view description);
        static PathSegment FromIndex(std::size_t index) noexcept;
        static PathSegment FromMarker(std::string_view marker);
        static PathSegment FromPropertyKey(const ValueHeap &heap, const PropertyKey &key);

        bool operator==(const PathSegment &other) const noexcept;
        bool operator!=(const PathSegment &other) const noexcept;

        Kind kind;
        // Key name, marker text or symbol description.
        std::string text;
        std::uint64_t symbol;
        std::size_t index;
    };

    // Append-only access path. Extending returns a new path so sibling
    // branches of a traversal never observe each other's segments.
    class Path {
    public:
        Path();
        Path(std::initializer_list<PathSegment> segments);

        Path Extend(PathSegment segment) const;
        Path Concat(const Path &suffix) const;

        std::size_t Size() const noexcept;
        bool Empty() const noexcept;
        const PathSegment &operator[](std::size_t index) const noexcept;
        const std::vector<PathSegment> &Segments() const noexcept;

        bool operator==(const Path &other) const noexcept;
        bool operator!=(const Path &other) const noexcept;

    private:
        std::vector<PathSegment> m_Segments;
    };

    bool IsIdentifierKey(std::string_view key) noexcept;

    std::string QuoteJson(std::string_view text);

    // Renders ["meta", "tags", 1, "id"] as meta.tags[1].id.
    std::string RenderPath(const Path &path);
}
