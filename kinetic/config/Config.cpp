#include "config/Config.hpp"
#include "core/Logger.hpp"

#include <fstream>
#include <iomanip>
#include <vector>

namespace Kinetic {

namespace {

std::vector<std::string> SplitKey(std::string_view key) {
    std::vector<std::string> parts;
    size_t start = 0;
    size_t end = 0;
    while ((end = key.find('.', start)) != std::string_view::npos) {
        parts.emplace_back(key.substr(start, end - start));
        start = end + 1;
    }
    parts.emplace_back(key.substr(start));
    return parts;
}

} // namespace

const char* ConfigErrorToString(ConfigError error) noexcept {
    switch (error) {
        case ConfigError::FileNotFound: return "File not found";
        case ConfigError::ParseError:   return "JSON parse error";
        case ConfigError::WriteError:   return "Failed to write file";
        default: return "Unknown error";
    }
}

std::expected<void, ConfigError> Config::Load(const std::filesystem::path& filepath) {
    if (!std::filesystem::exists(filepath)) {
        KINETIC_LOG_WARN("Config file not found: {}. Creating default.", filepath.string());
        auto created = CreateDefault(filepath);
        if (!created) {
            return created;
        }
    }

    std::unique_lock lock(m_mutex);
    m_filepath = filepath;

    std::ifstream file(filepath);
    if (!file.is_open()) {
        KINETIC_LOG_ERROR("Failed to open config file: {}", filepath.string());
        return std::unexpected(ConfigError::FileNotFound);
    }

    try {
        m_data = nlohmann::json::parse(file);
        KINETIC_LOG_INFO("Loaded configuration from: {}", filepath.string());
        return {};
    } catch (const nlohmann::json::exception& e) {
        KINETIC_LOG_ERROR("Failed to parse config file: {}", e.what());
        return std::unexpected(ConfigError::ParseError);
    }
}

std::expected<void, ConfigError> Config::LoadFromString(std::string_view text) {
    std::unique_lock lock(m_mutex);
    try {
        m_data = nlohmann::json::parse(text);
        return {};
    } catch (const nlohmann::json::exception& e) {
        KINETIC_LOG_ERROR("Failed to parse config text: {}", e.what());
        return std::unexpected(ConfigError::ParseError);
    }
}

std::expected<void, ConfigError> Config::Save(const std::filesystem::path& filepath) const {
    std::shared_lock lock(m_mutex);
    const auto& path = filepath.empty() ? m_filepath : filepath;
    if (path.empty()) {
        KINETIC_LOG_WARN("No config file path set, cannot save");
        return std::unexpected(ConfigError::WriteError);
    }

    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
    }

    std::ofstream file(path);
    if (!file.is_open()) {
        KINETIC_LOG_ERROR("Failed to open config file for writing: {}", path.string());
        return std::unexpected(ConfigError::WriteError);
    }

    file << std::setw(4) << m_data << std::endl;
    KINETIC_LOG_INFO("Saved configuration to: {}", path.string());
    return {};
}

std::expected<void, ConfigError> Config::Reload() {
    std::filesystem::path path;
    {
        std::shared_lock lock(m_mutex);
        path = m_filepath;
    }
    if (path.empty()) {
        KINETIC_LOG_WARN("No config file path set, cannot reload");
        return std::unexpected(ConfigError::FileNotFound);
    }
    return Load(path);
}

bool Config::Has(std::string_view key) const {
    std::shared_lock lock(m_mutex);
    return NavigateToKey(key) != nullptr;
}

nlohmann::json* Config::NavigateToKey(std::string_view key, bool create) {
    nlohmann::json* current = &m_data;
    for (const auto& part : SplitKey(key)) {
        if (!current->is_object()) {
            if (!create) {
                return nullptr;
            }
            *current = nlohmann::json::object();
        }
        if (!current->contains(part)) {
            if (!create) {
                return nullptr;
            }
            (*current)[part] = nlohmann::json::object();
        }
        current = &(*current)[part];
    }
    return current;
}

const nlohmann::json* Config::NavigateToKey(std::string_view key) const {
    const nlohmann::json* current = &m_data;
    for (const auto& part : SplitKey(key)) {
        if (!current->is_object() || !current->contains(part)) {
            return nullptr;
        }
        current = &(*current)[part];
    }
    return current;
}

nlohmann::json Config::CreateDefaultJson() {
    nlohmann::json config;

    config["logging"]["level"] = "info";
    config["logging"]["file"] = "";
    config["logging"]["console"] = true;

    // Frame loop
    config["motion"]["fps"] = 60;
    config["motion"]["gpu_acceleration"] = true;
    config["motion"]["reduced_motion"] = false;
    config["motion"]["rest_threshold"] = 0.01;
    config["motion"]["compensate_paused_time"] = true;

    // Performance monitoring
    config["motion"]["monitoring"] = false;
    config["motion"]["monitor_interval_ms"] = 1000;
    config["motion"]["dropped_frame_factor"] = 1.5;
    config["motion"]["dropped_frame_warning_threshold"] = 10;

    // Tweens
    config["motion"]["tween"]["duration_ms"] = 300;
    config["motion"]["tween"]["easing"] = "easeInOut";

    // Springs
    config["motion"]["spring"]["default_preset"] = "smooth";
    config["motion"]["springs"]["gentle"] = {{"stiffness", 100}, {"damping", 15}, {"mass", 1.0}};
    config["motion"]["springs"]["snappy"] = {{"stiffness", 300}, {"damping", 25}, {"mass", 0.8}};
    config["motion"]["springs"]["bouncy"] = {{"stiffness", 400}, {"damping", 10}, {"mass", 0.5}};
    config["motion"]["springs"]["stiff"] = {{"stiffness", 500}, {"damping", 30}, {"mass", 1.2}};
    config["motion"]["springs"]["smooth"] = {{"stiffness", 200}, {"damping", 20}, {"mass", 1.0}};

    // Stagger groups
    config["motion"]["stagger"]["delay_ms"] = 50;

    return config;
}

std::expected<void, ConfigError> Config::CreateDefault(const std::filesystem::path& filepath) {
    std::error_code ec;
    if (filepath.has_parent_path()) {
        std::filesystem::create_directories(filepath.parent_path(), ec);
    }

    std::ofstream file(filepath);
    if (!file.is_open()) {
        KINETIC_LOG_ERROR("Failed to create default config file: {}", filepath.string());
        return std::unexpected(ConfigError::WriteError);
    }

    file << std::setw(4) << CreateDefaultJson() << std::endl;
    KINETIC_LOG_INFO("Created default configuration file: {}", filepath.string());
    return {};
}

} // namespace Kinetic
