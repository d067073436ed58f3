/**
 * @file quadtree_tick_demo.cpp
 * @brief Example driving a Quadtree through a fixed-step simulation loop
 *
 * Units wander the world while projectiles look for enemies. Every tick the
 * demo reinserts actors that moved, runs layered queries, and periodically
 * shakes the tree. Tree limits, log settings and the layer/mask of each actor
 * kind come from quadtree_config.json; pass another path as the first argument
 * to override it.
 */

#include "core/Logger.hpp"
#include "spatial/Quadtree.hpp"
#include "spatial/QuadtreeConfig.hpp"
#include "spatial/ICollisionActor.hpp"
#include "spatial/CollisionLayer.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <map>
#include <memory>
#include <random>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

#ifndef QUADRA_EXAMPLE_CONFIG
#define QUADRA_EXAMPLE_CONFIG "quadtree_config.json"
#endif

using namespace Quadra;

namespace {

constexpr int kTickCount = 120;
constexpr int kShakeInterval = 30;
constexpr size_t kUnitCount = 400;
constexpr size_t kProjectileCount = 40;

/**
 * @brief Simple moving actor with a velocity
 */
class DemoActor : public ICollisionActor {
public:
    DemoActor(const Shape& bounds, uint32_t layer, uint32_t mask, const glm::vec2& velocity)
        : m_bounds(bounds), m_layer(layer), m_mask(mask), m_velocity(velocity) {}

    [[nodiscard]] Shape GetBounds() const override { return m_bounds; }
    [[nodiscard]] uint32_t GetLayer() const override { return m_layer; }
    [[nodiscard]] uint32_t GetMask() const override { return m_mask; }

    // Bounce off the world edges
    void Step(const Rect& world, float dt) {
        const Rect box = GetBoundingRect(m_bounds);
        glm::vec2 offset = m_velocity * dt;

        if (box.min.x + offset.x < world.min.x || box.max.x + offset.x > world.max.x) {
            m_velocity.x = -m_velocity.x;
            offset.x = -offset.x;
        }
        if (box.min.y + offset.y < world.min.y || box.max.y + offset.y > world.max.y) {
            m_velocity.y = -m_velocity.y;
            offset.y = -offset.y;
        }

        std::visit([&offset](auto&& arg) {
            using T = std::decay_t<decltype(arg)>;

            if constexpr (std::is_same_v<T, Rect>) {
                arg.min += offset;
                arg.max += offset;
            } else {
                arg.center += offset;
            }
        }, m_bounds);
    }

private:
    Shape m_bounds;
    uint32_t m_layer;
    uint32_t m_mask;
    glm::vec2 m_velocity;
};

/**
 * @brief Layer and mask shared by every actor of one kind
 */
struct ActorCategory {
    uint32_t layer = CollisionLayer::Default;
    uint32_t mask = CollisionLayer::All;
};

nlohmann::json ReadJsonFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return nlohmann::json(nlohmann::json::value_t::discarded);
    }
    return nlohmann::json::parse(file, nullptr, false);
}

LogSettings ReadLogSettings(const nlohmann::json& root) {
    LogSettings settings;
    if (!root.is_object() || !root.contains("logging")) {
        return settings;
    }

    const auto& logging = root.at("logging");
    if (!logging.is_object()) {
        return settings;
    }
    settings.level = spdlog::level::from_str(logging.value("level", std::string("info")));
    settings.file = logging.value("file", std::string());
    return settings;
}

QuadtreeConfig LoadConfig(const nlohmann::json& root, const std::string& path) {
    if (root.is_discarded()) {
        APP_LOG_WARN("Using default quadtree config ({} is missing or malformed)", path);
        return QuadtreeConfig{};
    }

    QuadtreeConfigParser parser;
    auto config = parser.Parse(root);
    if (!config) {
        APP_LOG_WARN("Using default quadtree config ({}: {})",
                     QuadtreeConfigErrorToString(*parser.GetLastError()),
                     parser.GetLastErrorMessage());
        return QuadtreeConfig{};
    }

    APP_LOG_INFO("Loaded quadtree config from {}", path);
    return *config;
}

ActorCategory LoadCategory(const nlohmann::json& root, const std::string& kind,
                           const ActorCategory& fallback) {
    ActorCategory category = fallback;

    if (root.is_object() && root.contains("actors") && root.at("actors").contains(kind)) {
        const auto& j = root.at("actors").at(kind);
        if (j.contains("layer")) {
            category.layer = CollisionLayer::ParseMask(j.at("layer"));
        }
        if (j.contains("mask")) {
            category.mask = CollisionLayer::ParseMask(j.at("mask"));
        }
    }

    APP_LOG_INFO("Actor kind '{}': layer {}, mask {:#010x}",
                 kind, CollisionLayer::ToString(category.layer), category.mask);
    return category;
}

void LogTreeShape(const Quadtree& tree) {
    std::map<int, size_t> leavesPerDepth;
    size_t busiestLeaf = 0;

    tree.VisitNodes([&](const QuadtreeNodeInfo& info) {
        if (info.isLeaf) {
            ++leavesPerDepth[info.depth];
            busiestLeaf = std::max(busiestLeaf, info.occupantCount);
        }
    });

    const QuadtreeStats stats = tree.GetStats();
    APP_LOG_INFO("Tree: {} nodes, {} leaves, depth {}, {} entries, busiest leaf {}",
                 stats.nodeCount, stats.leafCount, stats.maxDepth, stats.entryCount, busiestLeaf);
    for (const auto& [depth, count] : leavesPerDepth) {
        APP_LOG_DEBUG("  depth {}: {} leaves", depth, count);
    }
}

} // anonymous namespace

int main(int argc, char** argv) {
    const std::string configPath = argc > 1 ? argv[1] : QUADRA_EXAMPLE_CONFIG;
    const nlohmann::json root = ReadJsonFile(configPath);

    Logger::Initialize(ReadLogSettings(root));

    const QuadtreeConfig config = LoadConfig(root, configPath);
    const ActorCategory unitKind = LoadCategory(root, "unit",
        {CollisionLayer::Unit, CollisionLayer::Unit | CollisionLayer::Enemy});
    const ActorCategory enemyKind = LoadCategory(root, "enemy",
        {CollisionLayer::Enemy, CollisionLayer::Unit | CollisionLayer::Enemy});
    const ActorCategory projectileKind = LoadCategory(root, "projectile",
        {CollisionLayer::Projectile, CollisionLayer::Enemy});

    Quadtree tree(config);
    const Rect& world = tree.GetWorldBounds();
    const glm::vec2 size = world.GetSize();

    std::mt19937 gen(1337);
    std::uniform_real_distribution<float> xDist(world.min.x, world.max.x - size.x * 0.02f);
    std::uniform_real_distribution<float> yDist(world.min.y, world.max.y - size.y * 0.02f);
    std::uniform_real_distribution<float> speedDist(-size.x * 0.01f, size.x * 0.01f);
    std::bernoulli_distribution enemyDist(0.3);

    // Actors first, entries second: entries must die before their actors
    std::vector<std::unique_ptr<DemoActor>> actors;
    std::vector<std::unique_ptr<QuadtreeEntry>> entries;
    std::vector<QuadtreeEntry*> projectiles;

    const float unitSize = size.x * 0.01f;
    for (size_t i = 0; i < kUnitCount; ++i) {
        const ActorCategory& kind = enemyDist(gen) ? enemyKind : unitKind;
        actors.push_back(std::make_unique<DemoActor>(
            Rect::FromPositionSize(xDist(gen), yDist(gen), unitSize, unitSize),
            kind.layer, kind.mask,
            glm::vec2(speedDist(gen), speedDist(gen))));
        entries.push_back(std::make_unique<QuadtreeEntry>(*actors.back()));
        tree.Insert(*entries.back());
    }

    for (size_t i = 0; i < kProjectileCount; ++i) {
        actors.push_back(std::make_unique<DemoActor>(
            Circle(glm::vec2(xDist(gen), yDist(gen)) + glm::vec2(unitSize), unitSize),
            projectileKind.layer, projectileKind.mask,
            glm::vec2(speedDist(gen), speedDist(gen)) * 3.0f));
        entries.push_back(std::make_unique<QuadtreeEntry>(*actors.back()));
        projectiles.push_back(entries.back().get());
        tree.Insert(*entries.back());
    }

    APP_LOG_INFO("Spawned {} units and {} projectiles", kUnitCount, kProjectileCount);
    LogTreeShape(tree);

    constexpr float dt = 1.0f / 30.0f;
    size_t totalHits = 0;

    for (int tick = 1; tick <= kTickCount; ++tick) {
        for (auto& actor : actors) {
            actor->Step(world, dt);
        }

        size_t moved = 0;
        for (auto& entry : entries) {
            if (entry->IsPositionDirty()) {
                tree.Reinsert(*entry);
                ++moved;
            }
        }

        // Each target counts as hit at most once per tick, however many projectiles overlap it
        std::vector<QuadtreeEntry*> hits;
        {
            DedupScope scope;
            for (QuadtreeEntry* projectile : projectiles) {
                tree.Query(*projectile, scope, hits);
            }
        }
        totalHits += hits.size();

        if (tick % kShakeInterval == 0) {
            tree.Shake();
            APP_LOG_INFO("Tick {}: {} moved, {} targets hit", tick, moved, hits.size());
            LogTreeShape(tree);
        } else {
            APP_LOG_DEBUG("Tick {}: {} moved, {} targets hit", tick, moved, hits.size());
        }
    }

    const Rect center = Rect::FromCenterExtents(world.GetCenter(), world.GetExtents() * 0.25f);
    APP_LOG_INFO("Done: {} hits over {} ticks, {} actors near the center",
                 totalHits, kTickCount, tree.Query(center).size());

    tree.Clear();
    Logger::Shutdown();
    return 0;
}
