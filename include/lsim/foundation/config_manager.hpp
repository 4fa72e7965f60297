#pragma once

/// @file config_manager.hpp
/// @brief YAML-based configuration with typed dotted-key access.

#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include <yaml-cpp/yaml.h>

#include "lsim/foundation/sim_result.hpp"

namespace lsim::foundation {

/// YAML configuration store.
///
/// Loads a YAML file and flattens it into dotted keys ("goals.draw_bias")
/// so lookups never walk yaml-cpp's reference-semantic node tree.
class ConfigManager {
public:
    ConfigManager() = default;

    /// Load configuration from a YAML file, replacing current entries.
    /// @return Success or ConfigLoadFailed.
    SimResult<void> load(const std::filesystem::path& path);

    /// Load configuration from an in-memory YAML document.
    SimResult<void> loadFromString(std::string_view yaml);

    /// Retrieve a typed value by dotted key.
    /// @return The value or ConfigKeyNotFound / ConfigTypeMismatch.
    template <typename T>
    SimResult<T> get(std::string_view key) const;

    /// Set a leaf value by dotted key.
    template <typename T>
    void set(std::string_view key, const T& value);

    [[nodiscard]] bool hasKey(std::string_view key) const;

private:
    SimResult<void> loadNode(const YAML::Node& root);

    void flatten(const std::string& prefix, const YAML::Node& node);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, YAML::Node> entries_;
};

// --- Template implementations ---

template <typename T>
SimResult<T> ConfigManager::get(std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return SimResult<T>::err(
            SimError(ErrorCode::ConfigKeyNotFound,
                     std::string("config key not found: ") + std::string(key)));
    }
    try {
        return SimResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return SimResult<T>::err(
            SimError(ErrorCode::ConfigTypeMismatch,
                     std::string("type mismatch for key: ") + std::string(key)));
    }
}

template <typename T>
void ConfigManager::set(std::string_view key, const T& value) {
    std::lock_guard lock(mutex_);
    entries_[std::string(key)] = YAML::Node(value);
}

} // namespace lsim::foundation
