#include "Rect.hpp"

namespace Quadra {

std::array<Rect, 4> Rect::Subdivide() const noexcept {
    const glm::vec2 center = GetCenter();

    return {{
        Rect(min, center),
        Rect(glm::vec2(center.x, min.y), glm::vec2(max.x, center.y)),
        Rect(center, max),
        Rect(glm::vec2(min.x, center.y), glm::vec2(center.x, max.y))
    }};
}

} // namespace Quadra
