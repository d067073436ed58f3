#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>

namespace Quadra {

/**
 * @brief Collision layer bit flags for category filtering
 *
 * An actor's layer bits say what it is; its mask bits say what it tests
 * against. A querier only sees candidates with (querier.mask & candidate.layer) != 0.
 */
namespace CollisionLayer {
    constexpr uint32_t None       = 0;
    constexpr uint32_t Default    = 1 << 0;
    constexpr uint32_t Terrain    = 1 << 1;
    constexpr uint32_t Unit       = 1 << 2;
    constexpr uint32_t Building   = 1 << 3;
    constexpr uint32_t Projectile = 1 << 4;
    constexpr uint32_t Pickup     = 1 << 5;
    constexpr uint32_t Trigger    = 1 << 6;
    constexpr uint32_t Player     = 1 << 7;
    constexpr uint32_t Enemy      = 1 << 8;
    constexpr uint32_t Effect     = 1 << 9;
    constexpr uint32_t All        = 0xFFFFFFFF;

    /**
     * @brief Get collision layer from string name (unknown names map to Default)
     */
    [[nodiscard]] uint32_t FromString(const std::string& name) noexcept;

    /**
     * @brief Get string name from a single collision layer bit
     */
    [[nodiscard]] const char* ToString(uint32_t layer) noexcept;

    /**
     * @brief Parse layer bits from JSON
     *
     * Accepts a raw integer, a single name, or an array mixing both (ORed
     * together). Anything else yields All. Used for both actor layers and masks.
     */
    [[nodiscard]] uint32_t ParseMask(const nlohmann::json& j);
}

} // namespace Quadra
