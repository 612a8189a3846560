#pragma once

/// @file config_manager.hpp
/// @brief YAML configuration with dotted-key typed access and change watchers.

#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "msim/foundation/game_result.hpp"

namespace msim::foundation {

/// Invoked with the changed key after set().
using ConfigWatchCallback = std::function<void(std::string_view key)>;

/// Flat view over a YAML document.
///
/// Nested maps are flattened into dotted keys (`mobs.ai_update_interval_ms`).
/// Sequences and scalars are stored as leaves; a sequence leaf can be read
/// back as a YAML::Node with get<YAML::Node>().
class ConfigManager {
public:
    ConfigManager() = default;

    /// Replace the current entries with the contents of a YAML file.
    GameResult<void> load(const std::filesystem::path& path);

    /// Replace the current entries with an in-memory YAML document.
    GameResult<void> loadFromString(std::string_view yaml);

    /// Typed value for a dotted key, or ConfigKeyNotFound / ConfigTypeMismatch.
    template <typename T>
    GameResult<T> get(std::string_view key) const;

    /// Typed value for a dotted key, or @p fallback when missing or mistyped.
    template <typename T>
    T getOr(std::string_view key, T fallback) const {
        auto result = get<T>(key);
        return result ? std::move(result).value() : std::move(fallback);
    }

    /// Overwrite a key and notify its watchers.
    template <typename T>
    void set(std::string_view key, const T& value);

    void watch(std::string_view key, ConfigWatchCallback callback);

    [[nodiscard]] bool hasKey(std::string_view key) const;

    /// Path of the last file passed to load(), empty for in-memory documents.
    [[nodiscard]] std::filesystem::path sourcePath() const;

private:
    GameResult<void> assign(const YAML::Node& root);
    void flatten(const std::string& prefix, const YAML::Node& node);
    void notifyWatchers(std::string_view key);

    mutable std::mutex mutex_;
    std::filesystem::path source_;
    std::unordered_map<std::string, YAML::Node> entries_;
    std::unordered_map<std::string, std::vector<ConfigWatchCallback>> watchers_;
};

template <typename T>
GameResult<T> ConfigManager::get(std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return GameResult<T>::err(
            GameError(ErrorCode::ConfigKeyNotFound,
                      "config key not found: " + std::string(key)));
    }
    try {
        return GameResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return GameResult<T>::err(
            GameError(ErrorCode::ConfigTypeMismatch,
                      "type mismatch for key: " + std::string(key)));
    }
}

template <typename T>
void ConfigManager::set(std::string_view key, const T& value) {
    {
        std::lock_guard lock(mutex_);
        entries_[std::string(key)] = YAML::Node(value);
    }
    notifyWatchers(key);
}

} // namespace msim::foundation
