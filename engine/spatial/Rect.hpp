#pragma once

#include <glm/glm.hpp>
#include <array>

namespace Quadra {

/**
 * @brief Axis-aligned 2D rectangle
 *
 * Screen-style coordinates: x grows to the right, y grows downward, so
 * `min` is the top-left corner and `max` the bottom-right one. Intersection
 * is strict: rectangles that only share an edge do not intersect, which keeps
 * an object lying flush against a quadrant boundary in a single quadrant.
 */
struct Rect {
    glm::vec2 min{0.0f};
    glm::vec2 max{0.0f};

    Rect() noexcept = default;

    Rect(const glm::vec2& minPoint, const glm::vec2& maxPoint) noexcept
        : min(minPoint), max(maxPoint) {}

    /**
     * @brief Create from top-left position and size
     */
    [[nodiscard]] static Rect FromPositionSize(float x, float y, float width, float height) noexcept {
        return Rect(glm::vec2(x, y), glm::vec2(x + width, y + height));
    }

    /**
     * @brief Create from center and half-extents
     */
    [[nodiscard]] static Rect FromCenterExtents(const glm::vec2& center,
                                                const glm::vec2& halfExtents) noexcept {
        return Rect(center - halfExtents, center + halfExtents);
    }

    // =========================================================================
    // Properties
    // =========================================================================

    [[nodiscard]] glm::vec2 GetCenter() const noexcept { return (min + max) * 0.5f; }
    [[nodiscard]] glm::vec2 GetExtents() const noexcept { return (max - min) * 0.5f; }
    [[nodiscard]] glm::vec2 GetSize() const noexcept { return max - min; }
    [[nodiscard]] glm::vec2 GetPosition() const noexcept { return min; }

    [[nodiscard]] float GetWidth() const noexcept { return max.x - min.x; }
    [[nodiscard]] float GetHeight() const noexcept { return max.y - min.y; }
    [[nodiscard]] float GetArea() const noexcept { return GetWidth() * GetHeight(); }

    /**
     * @brief Check if min <= max on both axes
     */
    [[nodiscard]] bool IsValid() const noexcept {
        return min.x <= max.x && min.y <= max.y;
    }

    // =========================================================================
    // Tests
    // =========================================================================

    /**
     * @brief Half-open containment: [min, max)
     */
    [[nodiscard]] bool Contains(const glm::vec2& point) const noexcept {
        return point.x >= min.x && point.x < max.x &&
               point.y >= min.y && point.y < max.y;
    }

    [[nodiscard]] bool Contains(const Rect& other) const noexcept {
        return other.min.x >= min.x && other.max.x <= max.x &&
               other.min.y >= min.y && other.max.y <= max.y;
    }

    [[nodiscard]] bool Intersects(const Rect& other) const noexcept {
        return min.x < other.max.x && other.min.x < max.x &&
               min.y < other.max.y && other.min.y < max.y;
    }

    /**
     * @brief Closest point inside the rectangle to a given point
     */
    [[nodiscard]] glm::vec2 ClosestPoint(const glm::vec2& point) const noexcept {
        return glm::clamp(point, min, max);
    }

    /**
     * @brief Split into four equal quadrants
     *
     * Order: top-left, top-right, bottom-right, bottom-left.
     */
    [[nodiscard]] std::array<Rect, 4> Subdivide() const noexcept;

    [[nodiscard]] bool operator==(const Rect& other) const noexcept {
        return min == other.min && max == other.max;
    }
    [[nodiscard]] bool operator!=(const Rect& other) const noexcept {
        return !(*this == other);
    }
};

} // namespace Quadra
