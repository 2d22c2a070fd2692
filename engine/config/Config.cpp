#include "config/Config.hpp"
#include <fstream>
#include <iomanip>
#include <vector>

namespace Crimson {

namespace {

std::vector<std::string> SplitKey(const std::string& key) {
    std::vector<std::string> parts;
    size_t start = 0;
    size_t end = 0;
    while ((end = key.find('.', start)) != std::string::npos) {
        parts.emplace_back(key.substr(start, end - start));
        start = end + 1;
    }
    parts.emplace_back(key.substr(start));
    return parts;
}

const nlohmann::json kNullJson;

} // anonymous namespace

Config& Config::Instance() {
    static Config instance;
    return instance;
}

bool Config::Load(const std::filesystem::path& filepath) {
    m_filepath = filepath;

    std::ifstream file(filepath);
    if (!file.is_open()) {
        CRIMSON_LOG_ERROR("Failed to open config file: {}", filepath.string());
        return false;
    }

    try {
        nlohmann::json parsed = nlohmann::json::parse(file);
        if (!parsed.is_object()) {
            CRIMSON_LOG_ERROR("Config file {} is not a JSON object", filepath.string());
            return false;
        }
        m_data = std::move(parsed);
    } catch (const nlohmann::json::exception& e) {
        CRIMSON_LOG_ERROR("Failed to parse config file {}: {}", filepath.string(), e.what());
        return false;
    }

    CRIMSON_LOG_INFO("Loaded configuration from: {}", filepath.string());
    return true;
}

bool Config::LoadFromString(const std::string& text) {
    try {
        nlohmann::json parsed = nlohmann::json::parse(text);
        if (!parsed.is_object()) {
            CRIMSON_LOG_ERROR("Config text is not a JSON object");
            return false;
        }
        m_data = std::move(parsed);
    } catch (const nlohmann::json::exception& e) {
        CRIMSON_LOG_ERROR("Failed to parse config text: {}", e.what());
        return false;
    }
    return true;
}

bool Config::Save(const std::filesystem::path& filepath) {
    const auto& path = filepath.empty() ? m_filepath : filepath;
    if (path.empty()) {
        CRIMSON_LOG_WARN("No config file path set, cannot save");
        return false;
    }

    try {
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }
    } catch (const std::filesystem::filesystem_error& e) {
        CRIMSON_LOG_ERROR("Failed to create config directory: {}", e.what());
        return false;
    }

    std::ofstream file(path);
    if (!file.is_open()) {
        CRIMSON_LOG_ERROR("Failed to open config file for writing: {}", path.string());
        return false;
    }

    file << std::setw(4) << m_data << std::endl;
    CRIMSON_LOG_INFO("Saved configuration to: {}", path.string());
    return true;
}

bool Config::Reload() {
    if (m_filepath.empty()) {
        CRIMSON_LOG_WARN("No config file path set, cannot reload");
        return false;
    }
    return Load(m_filepath);
}

void Config::Clear() {
    m_data = nlohmann::json::object();
    m_filepath.clear();
}

bool Config::Has(const std::string& key) const {
    return NavigateToKey(key) != nullptr;
}

const nlohmann::json& Config::GetSection(const std::string& key) const {
    const auto* node = NavigateToKey(key);
    return node ? *node : kNullJson;
}

nlohmann::json* Config::NavigateToKey(const std::string& key, bool create) {
    nlohmann::json* current = &m_data;
    for (const auto& p : SplitKey(key)) {
        if (!current->is_object()) {
            if (!create) {
                return nullptr;
            }
            *current = nlohmann::json::object();
        }
        if (!current->contains(p)) {
            if (!create) {
                return nullptr;
            }
            (*current)[p] = nlohmann::json::object();
        }
        current = &(*current)[p];
    }
    return current;
}

const nlohmann::json* Config::NavigateToKey(const std::string& key) const {
    const nlohmann::json* current = &m_data;
    for (const auto& p : SplitKey(key)) {
        if (!current->is_object()) {
            return nullptr;
        }
        auto it = current->find(p);
        if (it == current->end()) {
            return nullptr;
        }
        current = &(*it);
    }
    return current;
}

void Config::Merge(const nlohmann::json& overrides) {
    if (!overrides.is_object()) {
        CRIMSON_LOG_WARN("Ignoring config merge with a non-object document");
        return;
    }
    m_data.merge_patch(overrides);
}

} // namespace Crimson
