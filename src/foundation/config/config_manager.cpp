/// @file config_manager.cpp
/// @brief ConfigManager YAML loading and key flattening.

#include "lsim/foundation/config_manager.hpp"

namespace lsim::foundation {

SimResult<void> ConfigManager::load(const std::filesystem::path& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::BadFile&) {
        return SimResult<void>::err(
            SimError(ErrorCode::ConfigLoadFailed, "failed to open config file: " + path.string()));
    } catch (const YAML::ParserException& e) {
        return SimResult<void>::err(
            SimError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
    return loadNode(root);
}

SimResult<void> ConfigManager::loadFromString(std::string_view yaml) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(yaml));
    } catch (const YAML::ParserException& e) {
        return SimResult<void>::err(
            SimError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
    return loadNode(root);
}

bool ConfigManager::hasKey(std::string_view key) const {
    std::lock_guard lock(mutex_);
    return entries_.count(std::string(key)) > 0;
}

SimResult<void> ConfigManager::loadNode(const YAML::Node& root) {
    if (root && !root.IsNull() && !root.IsMap()) {
        return SimResult<void>::err(
            SimError(ErrorCode::ConfigLoadFailed, "config root must be a mapping"));
    }
    std::lock_guard lock(mutex_);
    entries_.clear();
    if (root && root.IsMap()) {
        flatten("", root);
    }
    return SimResult<void>::ok();
}

void ConfigManager::flatten(const std::string& prefix, const YAML::Node& node) {
    if (node.IsMap()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            auto childKey = it->first.as<std::string>();
            auto fullKey = prefix.empty() ? childKey : prefix + "." + childKey;
            flatten(fullKey, it->second);
        }
    } else {
        // Leaf (scalar, sequence, null) stored under its dotted key.
        entries_[prefix] = YAML::Clone(node);
    }
}

}  // namespace lsim::foundation
