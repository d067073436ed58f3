#include "QuadtreeConfig.hpp"
#include "core/Logger.hpp"
#include <cstdint>
#include <fstream>
#include <limits>

namespace Quadra {

// ============================================================================
// Error helpers
// ============================================================================

const char* QuadtreeConfigErrorToString(QuadtreeConfigError error) noexcept {
    switch (error) {
        case QuadtreeConfigError::FileNotFound:  return "File not found";
        case QuadtreeConfigError::ParseError:    return "JSON parse error";
        case QuadtreeConfigError::InvalidFormat: return "Invalid format";
        case QuadtreeConfigError::InvalidValue:  return "Invalid value";
        default: return "Unknown error";
    }
}

// ============================================================================
// QuadtreeConfig
// ============================================================================

nlohmann::json QuadtreeConfig::ToJson() const {
    const glm::vec2 size = worldBounds.GetSize();

    nlohmann::json j;
    j["quadtree"]["bounds"] = {worldBounds.min.x, worldBounds.min.y, size.x, size.y};
    j["quadtree"]["max_depth"] = maxDepth;
    j["quadtree"]["max_objects_per_node"] = maxObjectsPerNode;
    return j;
}

// ============================================================================
// QuadtreeConfigParser
// ============================================================================

void QuadtreeConfigParser::SetError(QuadtreeConfigError error, const std::string& message) const {
    m_lastError = error;
    m_lastErrorMessage = message;
    QUADRA_LOG_WARN("Quadtree config: {} ({})", QuadtreeConfigErrorToString(error), message);
}

std::optional<QuadtreeConfig> QuadtreeConfigParser::Parse(const nlohmann::json& json) const {
    m_lastError.reset();
    m_lastErrorMessage.clear();

    // Check if we have a "quadtree" wrapper
    const nlohmann::json* treeJson = &json;
    if (json.is_object() && json.contains("quadtree")) {
        treeJson = &json["quadtree"];
    }

    if (!treeJson->is_object()) {
        SetError(QuadtreeConfigError::InvalidFormat, "expected a JSON object");
        return std::nullopt;
    }

    QuadtreeConfig config;

    // Parse world bounds as [x, y, width, height]
    if (treeJson->contains("bounds")) {
        const auto& bounds = (*treeJson)["bounds"];
        if (!bounds.is_array() || bounds.size() != 4) {
            SetError(QuadtreeConfigError::InvalidFormat, "'bounds' must be [x, y, width, height]");
            return std::nullopt;
        }
        for (const auto& value : bounds) {
            if (!value.is_number()) {
                SetError(QuadtreeConfigError::InvalidFormat, "'bounds' must contain numbers");
                return std::nullopt;
            }
        }
        config.worldBounds = Rect::FromPositionSize(
            bounds[0].get<float>(), bounds[1].get<float>(),
            bounds[2].get<float>(), bounds[3].get<float>());
    }

    if (treeJson->contains("max_depth")) {
        const auto& maxDepth = (*treeJson)["max_depth"];
        if (!maxDepth.is_number_integer()) {
            SetError(QuadtreeConfigError::InvalidFormat, "'max_depth' must be an integer");
            return std::nullopt;
        }
        // Read wide so oversized values are rejected instead of truncated
        const int64_t depth = maxDepth.get<int64_t>();
        if (depth < 1 || depth > std::numeric_limits<int>::max()) {
            SetError(QuadtreeConfigError::InvalidValue,
                     "'max_depth' out of range: " + maxDepth.dump());
            return std::nullopt;
        }
        config.maxDepth = static_cast<int>(depth);
    }

    if (treeJson->contains("max_objects_per_node")) {
        const auto& maxObjects = (*treeJson)["max_objects_per_node"];
        if (!maxObjects.is_number_integer() || maxObjects.get<int64_t>() < 0) {
            SetError(QuadtreeConfigError::InvalidFormat,
                     "'max_objects_per_node' must be a non-negative integer");
            return std::nullopt;
        }
        config.maxObjectsPerNode = maxObjects.get<size_t>();
    }

    if (!config.IsValid()) {
        SetError(QuadtreeConfigError::InvalidValue,
                 "max_depth and max_objects_per_node must be >= 1 and bounds non-empty");
        return std::nullopt;
    }

    return config;
}

std::optional<QuadtreeConfig> QuadtreeConfigParser::ParseFile(
    const std::filesystem::path& filepath) const
{
    std::ifstream file(filepath);
    if (!file.is_open()) {
        SetError(QuadtreeConfigError::FileNotFound, filepath.string());
        return std::nullopt;
    }

    nlohmann::json json = nlohmann::json::parse(file, nullptr, false);
    if (json.is_discarded()) {
        SetError(QuadtreeConfigError::ParseError, filepath.string());
        return std::nullopt;
    }

    return Parse(json);
}

std::optional<QuadtreeConfig> QuadtreeConfigParser::ParseString(const std::string& jsonString) const {
    nlohmann::json json = nlohmann::json::parse(jsonString, nullptr, false);
    if (json.is_discarded()) {
        SetError(QuadtreeConfigError::ParseError, "malformed JSON string");
        return std::nullopt;
    }

    return Parse(json);
}

} // namespace Quadra
