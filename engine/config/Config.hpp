#pragma once

#include <string>
#include <filesystem>
#include <type_traits>
#include <nlohmann/json.hpp>
#include <glm/glm.hpp>
#include "core/Logger.hpp"

namespace Crimson {

/**
 * @brief JSON-based configuration store
 *
 * Holds every tunable value of the combat core. Keys are dot-separated
 * paths into the JSON document ("combat.ultimate.basicGain").
 */
class Config {
public:
    static Config& Instance();

    // Delete copy/move for singleton
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    /**
     * @brief Load configuration from JSON file
     * @param filepath Path to configuration file
     * @return true if loaded successfully
     */
    bool Load(const std::filesystem::path& filepath);

    /**
     * @brief Replace the document with parsed JSON text
     * @return false if the text does not parse (document is left untouched)
     */
    bool LoadFromString(const std::string& text);

    /**
     * @brief Save current configuration to JSON file
     * @param filepath Path to save to (uses loaded path if empty)
     * @return true if saved successfully
     */
    bool Save(const std::filesystem::path& filepath = "");

    /**
     * @brief Reload configuration from disk
     * @return true if reloaded successfully
     */
    bool Reload();

    /**
     * @brief Drop every value and forget the loaded path
     */
    void Clear();

    /**
     * @brief Get a configuration value with type safety
     * @tparam T The expected type
     * @param key Dot-separated key path (e.g., "combat.pool.capacity")
     * @param defaultValue Value to return if key not found or mistyped
     */
    template<typename T>
    [[nodiscard]] T Get(const std::string& key, const T& defaultValue = T{}) const;

    /**
     * @brief Set a configuration value, creating intermediate objects
     */
    template<typename T>
    void Set(const std::string& key, const T& value);

    [[nodiscard]] bool Has(const std::string& key) const;

    /**
     * @brief Sub-document at a key path, or null JSON if missing
     */
    [[nodiscard]] const nlohmann::json& GetSection(const std::string& key) const;

    [[nodiscard]] const nlohmann::json& GetJson() const { return m_data; }

    /**
     * @brief Recursively merge @p overrides into the document
     */
    void Merge(const nlohmann::json& overrides);

private:
    Config() = default;
    ~Config() = default;

    nlohmann::json m_data = nlohmann::json::object();
    std::filesystem::path m_filepath;

    nlohmann::json* NavigateToKey(const std::string& key, bool create);
    const nlohmann::json* NavigateToKey(const std::string& key) const;
};

// Template implementations
template<typename T>
T Config::Get(const std::string& key, const T& defaultValue) const {
    const auto* node = NavigateToKey(key);
    if (!node || node->is_null()) {
        return defaultValue;
    }

    try {
        if constexpr (std::is_same_v<T, glm::vec2>) {
            if (node->is_array() && node->size() >= 2) {
                return glm::vec2((*node)[0].get<float>(), (*node)[1].get<float>());
            }
        } else if constexpr (std::is_same_v<T, glm::vec3>) {
            if (node->is_array() && node->size() >= 3) {
                return glm::vec3(
                    (*node)[0].get<float>(),
                    (*node)[1].get<float>(),
                    (*node)[2].get<float>()
                );
            }
        } else {
            return node->get<T>();
        }
    } catch (const nlohmann::json::exception& e) {
        CRIMSON_LOG_WARN("Config key '{}' has unexpected type: {}", key, e.what());
        return defaultValue;
    }
    return defaultValue;
}

template<typename T>
void Config::Set(const std::string& key, const T& value) {
    auto* node = NavigateToKey(key, true);
    if (node) {
        if constexpr (std::is_same_v<T, glm::vec2>) {
            *node = nlohmann::json::array({value.x, value.y});
        } else if constexpr (std::is_same_v<T, glm::vec3>) {
            *node = nlohmann::json::array({value.x, value.y, value.z});
        } else {
            *node = value;
        }
    }
}

} // namespace Crimson
