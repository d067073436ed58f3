#pragma once

#include "Shape.hpp"
#include "CollisionLayer.hpp"
#include <cstdint>

namespace Quadra {

/**
 * @brief Movable entity that can be indexed by a Quadtree
 *
 * The index never reads the actor live: bounds, layer and mask are
 * snapshotted into a QuadtreeEntry, so moving an actor requires reinserting
 * its entry.
 */
class ICollisionActor {
public:
    virtual ~ICollisionActor() = default;

    /**
     * @brief Current bounds shape of the actor
     */
    [[nodiscard]] virtual Shape GetBounds() const = 0;

    /**
     * @brief Category bits this actor belongs to
     */
    [[nodiscard]] virtual uint32_t GetLayer() const { return CollisionLayer::Default; }

    /**
     * @brief Category bits this actor tests against
     */
    [[nodiscard]] virtual uint32_t GetMask() const { return CollisionLayer::All; }
};

} // namespace Quadra
