#include "CollisionLayer.hpp"
#include <array>

namespace Quadra {
namespace CollisionLayer {

namespace {

struct NamedLayer {
    const char* name;
    uint32_t bits;
};

constexpr std::array<NamedLayer, 12> kNamedLayers = {{
    {"none", None},
    {"default", Default},
    {"terrain", Terrain},
    {"unit", Unit},
    {"building", Building},
    {"projectile", Projectile},
    {"pickup", Pickup},
    {"trigger", Trigger},
    {"player", Player},
    {"enemy", Enemy},
    {"effect", Effect},
    {"all", All},
}};

} // anonymous namespace

uint32_t FromString(const std::string& name) noexcept {
    for (const NamedLayer& layer : kNamedLayers) {
        if (name == layer.name) {
            return layer.bits;
        }
    }
    return Default;
}

const char* ToString(uint32_t layer) noexcept {
    for (const NamedLayer& named : kNamedLayers) {
        if (layer == named.bits) {
            return named.name;
        }
    }
    return "custom";
}

uint32_t ParseMask(const nlohmann::json& j) {
    if (j.is_number_integer()) {
        return j.get<uint32_t>();
    }
    if (j.is_string()) {
        return FromString(j.get<std::string>());
    }
    if (!j.is_array()) {
        return All;
    }

    // Nested arrays and other element types contribute nothing
    uint32_t mask = None;
    for (const auto& item : j) {
        if (item.is_string() || item.is_number_integer()) {
            mask |= ParseMask(item);
        }
    }
    return mask;
}

} // namespace CollisionLayer
} // namespace Quadra
