#pragma once

#include "Rect.hpp"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace Quadra {

/**
 * @brief Tuning parameters of a Quadtree
 */
struct QuadtreeConfig {
    static constexpr int DefaultMaxDepth = 7;
    static constexpr size_t DefaultMaxObjectsPerNode = 25;

    Rect worldBounds = Rect::FromPositionSize(0.0f, 0.0f, 1000.0f, 1000.0f);
    int maxDepth = DefaultMaxDepth;                         // Leaves never split at depth maxDepth - 1
    size_t maxObjectsPerNode = DefaultMaxObjectsPerNode;    // Split threshold

    [[nodiscard]] bool IsValid() const noexcept {
        return maxDepth >= 1 && maxObjectsPerNode >= 1 &&
               worldBounds.IsValid() && worldBounds.GetArea() > 0.0f;
    }

    [[nodiscard]] nlohmann::json ToJson() const;
};

/**
 * @brief Error types for quadtree config parsing
 */
enum class QuadtreeConfigError {
    FileNotFound,
    ParseError,
    InvalidFormat,
    InvalidValue
};

/**
 * @brief Get error description string
 */
[[nodiscard]] const char* QuadtreeConfigErrorToString(QuadtreeConfigError error) noexcept;

/**
 * @brief Quadtree configuration parser
 *
 * Reads a JSON object of the form
 * `{"quadtree": {"bounds": [x, y, w, h], "max_depth": 7, "max_objects_per_node": 25}}`.
 * The "quadtree" wrapper is optional and missing fields keep their defaults.
 */
class QuadtreeConfigParser {
public:
    QuadtreeConfigParser() = default;
    ~QuadtreeConfigParser() = default;

    [[nodiscard]] std::optional<QuadtreeConfig> Parse(const nlohmann::json& json) const;
    [[nodiscard]] std::optional<QuadtreeConfig> ParseFile(const std::filesystem::path& filepath) const;
    [[nodiscard]] std::optional<QuadtreeConfig> ParseString(const std::string& jsonString) const;

    /**
     * @brief Error of the last failed parse, if any
     */
    [[nodiscard]] std::optional<QuadtreeConfigError> GetLastError() const noexcept { return m_lastError; }
    [[nodiscard]] const std::string& GetLastErrorMessage() const noexcept { return m_lastErrorMessage; }

private:
    void SetError(QuadtreeConfigError error, const std::string& message) const;

    mutable std::optional<QuadtreeConfigError> m_lastError;
    mutable std::string m_lastErrorMessage;
};

} // namespace Quadra
