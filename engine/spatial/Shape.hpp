#pragma once

#include "Rect.hpp"
#include <glm/glm.hpp>
#include <variant>

namespace Quadra {

/**
 * @brief 2D circle
 */
struct Circle {
    glm::vec2 center{0.0f};
    float radius = 0.0f;

    Circle() noexcept = default;
    Circle(const glm::vec2& c, float r) noexcept : center(c), radius(r) {}

    [[nodiscard]] Rect GetBoundingRect() const noexcept {
        return Rect::FromCenterExtents(center, glm::vec2(radius));
    }

    /**
     * @brief Strict overlap test; circles that only touch do not intersect
     */
    [[nodiscard]] bool Intersects(const Circle& other) const noexcept;

    /**
     * @brief Overlap test against a rectangle via its closest point
     */
    [[nodiscard]] bool Intersects(const Rect& rect) const noexcept;

    [[nodiscard]] bool operator==(const Circle& other) const noexcept {
        return center == other.center && radius == other.radius;
    }
};

/**
 * @brief Bounds shape of an indexed actor or of a query region
 */
using Shape = std::variant<Rect, Circle>;

/**
 * @brief Overlap test between any two shapes
 */
[[nodiscard]] bool Intersects(const Shape& a, const Shape& b) noexcept;

/**
 * @brief Overlap test between a node rectangle and a shape
 */
[[nodiscard]] bool Intersects(const Rect& rect, const Shape& shape) noexcept;

/**
 * @brief Tight axis-aligned bounds of a shape
 */
[[nodiscard]] Rect GetBoundingRect(const Shape& shape) noexcept;

/**
 * @brief Origin used for movement detection: top-left for rectangles,
 * center for circles
 */
[[nodiscard]] glm::vec2 GetPosition(const Shape& shape) noexcept;

} // namespace Quadra
