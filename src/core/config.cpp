#include <streamview/core/config.hpp>
#include <fstream>

namespace streamview::core {

Result<void> Config::assign(nlohmann::json json) {
    if (!json.is_object()) {
        return {ErrorCode::InvalidData, "Root configuration must be an object"};
    }
    root_ = std::move(json);
    return {};
}

Result<void> Config::loadFromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return {ErrorCode::FileNotFound, "Failed to open config file: " + path.string()};
    }

    try {
        nlohmann::json json;
        file >> json;
        return assign(std::move(json));
    }
    catch (const nlohmann::json::exception& e) {
        return {ErrorCode::InvalidData, "Failed to parse config file: " + std::string(e.what())};
    }
}

Result<void> Config::loadFromString(std::string_view data) {
    try {
        return assign(nlohmann::json::parse(data));
    }
    catch (const nlohmann::json::exception& e) {
        return {ErrorCode::InvalidData, "Failed to parse config string: " + std::string(e.what())};
    }
}

Result<std::string> Config::saveToString() const {
    return root_.dump(2);
}

} // namespace streamview::core
