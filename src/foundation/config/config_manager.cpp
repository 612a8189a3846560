/// @file config_manager.cpp
/// @brief ConfigManager loading and flattening of YAML documents.

#include "msim/foundation/config_manager.hpp"

namespace msim::foundation {

GameResult<void> ConfigManager::load(const std::filesystem::path& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::BadFile&) {
        return GameResult<void>::err(
            GameError(ErrorCode::ConfigLoadFailed, "failed to open config file: " + path.string()));
    } catch (const YAML::ParserException& e) {
        return GameResult<void>::err(
            GameError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }

    auto assigned = assign(root);
    if (assigned) {
        std::lock_guard lock(mutex_);
        source_ = path;
    }
    return assigned;
}

GameResult<void> ConfigManager::loadFromString(std::string_view yaml) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(yaml));
    } catch (const YAML::ParserException& e) {
        return GameResult<void>::err(
            GameError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }

    auto assigned = assign(root);
    if (assigned) {
        std::lock_guard lock(mutex_);
        source_.clear();
    }
    return assigned;
}

GameResult<void> ConfigManager::assign(const YAML::Node& root) {
    if (root.IsDefined() && !root.IsNull() && !root.IsMap()) {
        return GameResult<void>::err(
            GameError(ErrorCode::ConfigLoadFailed, "config root must be a mapping"));
    }

    std::lock_guard lock(mutex_);
    entries_.clear();
    if (root.IsMap()) {
        flatten("", root);
    }
    return GameResult<void>::ok();
}

void ConfigManager::watch(std::string_view key, ConfigWatchCallback callback) {
    std::lock_guard lock(mutex_);
    watchers_[std::string(key)].push_back(std::move(callback));
}

bool ConfigManager::hasKey(std::string_view key) const {
    std::lock_guard lock(mutex_);
    return entries_.count(std::string(key)) > 0;
}

std::filesystem::path ConfigManager::sourcePath() const {
    std::lock_guard lock(mutex_);
    return source_;
}

void ConfigManager::flatten(const std::string& prefix, const YAML::Node& node) {
    if (!node.IsMap()) {
        entries_[prefix] = YAML::Clone(node);
        return;
    }
    for (auto it = node.begin(); it != node.end(); ++it) {
        auto childKey = it->first.as<std::string>();
        flatten(prefix.empty() ? childKey : prefix + "." + childKey, it->second);
    }
}

void ConfigManager::notifyWatchers(std::string_view key) {
    std::vector<ConfigWatchCallback> callbacks;
    {
        std::lock_guard lock(mutex_);
        auto it = watchers_.find(std::string(key));
        if (it == watchers_.end()) {
            return;
        }
        callbacks = it->second;
    }
    // Invoked unlocked so a watcher may read the new value back.
    for (auto& cb : callbacks) {
        cb(key);
    }
}

}  // namespace msim::foundation
