#pragma once

#include <expected>
#include <filesystem>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>

namespace Kinetic {

/**
 * @brief Error types for configuration I/O
 */
enum class ConfigError {
    FileNotFound,
    ParseError,
    WriteError
};

[[nodiscard]] const char* ConfigErrorToString(ConfigError error) noexcept;

/**
 * @brief JSON-based configuration store
 *
 * Values are addressed by dot-separated key paths ("motion.tween.duration_ms").
 * Instances are created and passed explicitly; there is no global config.
 */
class Config {
public:
    Config() = default;

    /**
     * @brief Load configuration from JSON file
     *
     * A missing file is created with the default motion configuration first.
     */
    std::expected<void, ConfigError> Load(const std::filesystem::path& filepath);

    /**
     * @brief Load configuration from JSON text
     */
    std::expected<void, ConfigError> LoadFromString(std::string_view text);

    /**
     * @brief Save current configuration to JSON file
     * @param filepath Path to save to (uses loaded path if empty)
     */
    std::expected<void, ConfigError> Save(const std::filesystem::path& filepath = "") const;

    /**
     * @brief Reload configuration from disk
     */
    std::expected<void, ConfigError> Reload();

    /**
     * @brief Get a configuration value with type safety
     * @param key Dot-separated key path
     * @param defaultValue Value returned if the key is missing or has the wrong type
     */
    template<typename T>
    T Get(std::string_view key, const T& defaultValue = T{}) const;

    /**
     * @brief Set a configuration value, creating intermediate objects
     */
    template<typename T>
    void Set(std::string_view key, const T& value);

    /**
     * @brief Check if a key exists
     */
    bool Has(std::string_view key) const;

    /**
     * @brief Get the underlying JSON object for direct access
     */
    const nlohmann::json& GetJson() const { return m_data; }

    /**
     * @brief JSON document holding every motion setting at its default
     */
    static nlohmann::json CreateDefaultJson();

    /**
     * @brief Write the default configuration file
     */
    static std::expected<void, ConfigError> CreateDefault(const std::filesystem::path& filepath);

private:
    nlohmann::json m_data = nlohmann::json::object();
    std::filesystem::path m_filepath;
    mutable std::shared_mutex m_mutex;

    nlohmann::json* NavigateToKey(std::string_view key, bool create);
    const nlohmann::json* NavigateToKey(std::string_view key) const;
};

// Template implementations
template<typename T>
T Config::Get(std::string_view key, const T& defaultValue) const {
    std::shared_lock lock(m_mutex);
    const auto* node = NavigateToKey(key);
    if (!node || node->is_null()) {
        return defaultValue;
    }

    try {
        return node->get<T>();
    } catch (const nlohmann::json::exception&) {
        return defaultValue;
    }
}

template<typename T>
void Config::Set(std::string_view key, const T& value) {
    std::unique_lock lock(m_mutex);
    auto* node = NavigateToKey(key, true);
    if (node) {
        *node = value;
    }
}

} // namespace Kinetic
