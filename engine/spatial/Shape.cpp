#include "Shape.hpp"
#include <type_traits>

namespace Quadra {

bool Circle::Intersects(const Circle& other) const noexcept {
    const glm::vec2 diff = other.center - center;
    const float radii = radius + other.radius;
    return glm::dot(diff, diff) < radii * radii;
}

bool Circle::Intersects(const Rect& rect) const noexcept {
    const glm::vec2 diff = rect.ClosestPoint(center) - center;
    return glm::dot(diff, diff) < radius * radius;
}

bool Intersects(const Rect& rect, const Shape& shape) noexcept {
    return std::visit([&rect](auto&& arg) -> bool {
        using T = std::decay_t<decltype(arg)>;

        if constexpr (std::is_same_v<T, Rect>) {
            return rect.Intersects(arg);
        } else {
            return arg.Intersects(rect);
        }
    }, shape);
}

bool Intersects(const Shape& a, const Shape& b) noexcept {
    return std::visit([&b](auto&& arg) -> bool {
        using T = std::decay_t<decltype(arg)>;

        if constexpr (std::is_same_v<T, Rect>) {
            return Intersects(arg, b);
        } else if (const auto* rect = std::get_if<Rect>(&b)) {
            return arg.Intersects(*rect);
        } else {
            return arg.Intersects(std::get<Circle>(b));
        }
    }, a);
}

Rect GetBoundingRect(const Shape& shape) noexcept {
    return std::visit([](auto&& arg) -> Rect {
        using T = std::decay_t<decltype(arg)>;

        if constexpr (std::is_same_v<T, Rect>) {
            return arg;
        } else {
            return arg.GetBoundingRect();
        }
    }, shape);
}

glm::vec2 GetPosition(const Shape& shape) noexcept {
    return std::visit([](auto&& arg) -> glm::vec2 {
        using T = std::decay_t<decltype(arg)>;

        if constexpr (std::is_same_v<T, Rect>) {
            return arg.GetPosition();
        } else {
            return arg.center;
        }
    }, shape);
}

} // namespace Quadra
