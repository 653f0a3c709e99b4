#pragma once

/// @file types.hpp
/// @brief Geometry and color types shared by scene and compositor

#include "fwd.hpp"

#include <algorithm>
#include <cstdint>
#include <string>

namespace tableau_render {

// =============================================================================
// IntRect
// =============================================================================

/// Integer rectangle, half-open: [min_x, max_x) x [min_y, max_y)
struct IntRect {
    std::int32_t min_x = 0;
    std::int32_t min_y = 0;
    std::int32_t max_x = 0;
    std::int32_t max_y = 0;

    /// Create from corners
    static constexpr IntRect from_corners(std::int32_t x0, std::int32_t y0, std::int32_t x1, std::int32_t y1) {
        return IntRect{x0, y0, x1, y1};
    }

    /// Create from position and size
    static constexpr IntRect from_xywh(std::int32_t x, std::int32_t y, std::int32_t w, std::int32_t h) {
        return IntRect{x, y, x + w, y + h};
    }

    [[nodiscard]] constexpr std::int32_t width() const { return max_x - min_x; }
    [[nodiscard]] constexpr std::int32_t height() const { return max_y - min_y; }

    /// True when the rectangle covers no pixel
    [[nodiscard]] constexpr bool is_empty() const {
        return min_x >= max_x || min_y >= max_y;
    }

    /// Intersection; empty inputs or disjoint rectangles give the zero rectangle
    [[nodiscard]] constexpr IntRect intersect(const IntRect& other) const {
        IntRect r{
            std::max(min_x, other.min_x),
            std::max(min_y, other.min_y),
            std::min(max_x, other.max_x),
            std::min(max_y, other.max_y),
        };
        if (r.is_empty()) {
            return IntRect{};
        }
        return r;
    }

    /// Smallest rectangle containing both; an empty side is ignored
    [[nodiscard]] constexpr IntRect union_with(const IntRect& other) const {
        if (is_empty()) {
            return other;
        }
        if (other.is_empty()) {
            return *this;
        }
        return IntRect{
            std::min(min_x, other.min_x),
            std::min(min_y, other.min_y),
            std::max(max_x, other.max_x),
            std::max(max_y, other.max_y),
        };
    }

    /// Corner-wise containment of another rectangle
    [[nodiscard]] constexpr bool contains(const IntRect& other) const {
        return min_x <= other.min_x && min_y <= other.min_y &&
               max_x >= other.max_x && max_y >= other.max_y;
    }

    /// Point containment
    [[nodiscard]] constexpr bool contains_point(std::int32_t x, std::int32_t y) const {
        return x >= min_x && x < max_x && y >= min_y && y < max_y;
    }

    /// Shift by an offset
    [[nodiscard]] constexpr IntRect translated(std::int32_t dx, std::int32_t dy) const {
        return IntRect{min_x + dx, min_y + dy, max_x + dx, max_y + dy};
    }

    [[nodiscard]] constexpr bool operator==(const IntRect&) const = default;

    /// Debug string "(x0,y0)-(x1,y1)"
    [[nodiscard]] std::string to_string() const {
        return "(" + std::to_string(min_x) + "," + std::to_string(min_y) + ")-(" +
               std::to_string(max_x) + "," + std::to_string(max_y) + ")";
    }
};

// =============================================================================
// Color
// =============================================================================

/// 8-bit RGBA color (straight alpha)
struct Color {
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;
    std::uint8_t a = 255;

    static constexpr Color rgb(std::uint8_t red, std::uint8_t green, std::uint8_t blue) {
        return Color{red, green, blue, 255};
    }

    static constexpr Color transparent() {
        return Color{0, 0, 0, 0};
    }

    [[nodiscard]] constexpr bool operator==(const Color&) const = default;
};

// =============================================================================
// Vec2
// =============================================================================

/// Float 2D position
struct Vec2 {
    float x = 0.0f;
    float y = 0.0f;

    [[nodiscard]] constexpr Vec2 operator+(const Vec2& o) const { return Vec2{x + o.x, y + o.y}; }
    [[nodiscard]] constexpr bool operator==(const Vec2&) const = default;
};

} // namespace tableau_render
