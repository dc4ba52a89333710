#pragma once

#include <string>
#include <string_view>
#include <filesystem>

#include <nlohmann/json.hpp>

#include <streamview/core/error.hpp>

namespace streamview::core {

// JSON-backed key/value configuration. Only the top-level object is addressed
// by key; nested values are read as JSON and converted by the caller.
class Config {
public:
    Config() : root_(nlohmann::json::object()) {}

    Result<void> loadFromFile(const std::filesystem::path& path);
    Result<void> loadFromString(std::string_view data);

    Result<std::string> saveToString() const;

    template<typename T>
    Result<T> get(const std::string& key) const {
        auto it = root_.find(key);
        if (it == root_.end()) {
            return {ErrorCode::InvalidArgument, "Configuration key not found: " + key};
        }

        try {
            return it->template get<T>();
        }
        catch (const nlohmann::json::exception&) {
            return {ErrorCode::InvalidData, "Invalid type for key: " + key};
        }
    }

    // Missing key yields the fallback; a present key of the wrong type is still an error
    template<typename T>
    Result<T> getOr(const std::string& key, T fallback) const {
        if (!has(key)) {
            return fallback;
        }
        return get<T>(key);
    }

    template<typename T>
    void set(const std::string& key, T&& value) {
        root_[key] = std::forward<T>(value);
    }

    bool has(const std::string& key) const {
        return root_.contains(key);
    }

    void remove(const std::string& key) {
        root_.erase(key);
    }

    void clear() {
        root_ = nlohmann::json::object();
    }

    const nlohmann::json& root() const { return root_; }

private:
    Result<void> assign(nlohmann::json json);

    nlohmann::json root_;
};

} // namespace streamview::core
