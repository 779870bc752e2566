#include "ConfigParser.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

std::filesystem::path OrganizerOptions::resolvedTarget() const {
    return target.empty() ? source : target;
}

const OrganizerOptions& ConfigParser::getOptions() const {
    return m_options;
}

std::vector<std::string> ConfigParser::builtInDefaultExtensions() {
    return {".mp4", ".mkv", ".avi", ".mov", ".wmv", ".flv", ".rmvb"};
}

bool ConfigParser::load(const std::filesystem::path& filePath) {
    std::ifstream jsonFile(filePath);
    if (!jsonFile) {
        std::cerr << "Failed to open configuration file: " << filePath << std::endl;
        return false;
    }

    json data;
    try {
        jsonFile >> data;
    } catch (const json::parse_error& e) {
        std::cerr << "Failed to parse configuration file: " << e.what() << std::endl;
        return false;
    }

    if (!data.is_object()) {
        std::cerr << "Invalid configuration: the top level of " << filePath << " must be an object." << std::endl;
        return false;
    }

    m_options = OrganizerOptions{};
    std::error_code ec;
    const std::filesystem::path absoluteFile = std::filesystem::absolute(filePath, ec);
    if (ec) {
        std::cerr << "Failed to resolve " << filePath << ": " << ec.message() << std::endl;
        return false;
    }
    m_baseDirectory = absoluteFile.parent_path();

    if (!parsePath(data, "source", m_options.source) || !parsePath(data, "target", m_options.target)) {
        return false;
    }

    std::optional<OperationMode> mode;
    if (!parseMode(data, "mode", mode)) {
        return false;
    }
    if (mode) {
        m_options.mode = *mode;
    }

    if (!parseMode(data, "fallback_on_link_failure", m_options.fallbackMode)) {
        return false;
    }
    if (m_options.fallbackMode == OperationMode::Link) {
        std::cerr << "`fallback_on_link_failure` must be `move` or `copy`." << std::endl;
        return false;
    }

    if (!parseBoolean(data, "dry_run", m_options.dryRun) || !parseBoolean(data, "verbose", m_options.verbose)) {
        return false;
    }

    if (!parseExtensionArray(data)) {
        return false;
    }

    std::cout << "Loaded options from " << filePath << std::endl;
    return true;
}

bool ConfigParser::parsePath(const json& data, const std::string& key, std::filesystem::path& out) const {
    auto it = data.find(key);
    if (it == data.end()) {
        return true;
    }

    if (!it->is_string()) {
        std::cerr << "`" << key << "` must be a string path." << std::endl;
        return false;
    }

    const std::string value = it->get<std::string>();
    if (value.empty()) {
        std::cerr << "`" << key << "` cannot be empty." << std::endl;
        return false;
    }

    return resolvePath(key, value, out);
}

bool ConfigParser::resolvePath(const std::string& key, const std::string& value, std::filesystem::path& out) const {
    std::filesystem::path path(value);

    // Only `~` and `~/...` are expanded; `~name` is an ordinary relative path.
    if (value == "~" || value.rfind("~/", 0) == 0) {
        const char* home = std::getenv("HOME");
        if (home == nullptr || *home == '\0') {
            std::cerr << "`" << key << "` starts with `~` but HOME is not set." << std::endl;
            return false;
        }
        path = std::filesystem::path(home);
        if (value.size() > 2) {
            path /= value.substr(2);
        }
    }

    if (path.is_relative()) {
        path = m_baseDirectory / path;
    }

    out = path.lexically_normal();
    return true;
}

bool ConfigParser::parseMode(const json& data, const std::string& key, std::optional<OperationMode>& out) const {
    auto it = data.find(key);
    if (it == data.end() || it->is_null()) {
        return true;
    }

    if (!it->is_string()) {
        std::cerr << "`" << key << "` must be one of `move`, `copy` or `link`." << std::endl;
        return false;
    }

    out = parseOperationMode(it->get<std::string>());
    if (!out) {
        std::cerr << "Unknown operation mode `" << it->get<std::string>() << "` for `" << key << "`." << std::endl;
        return false;
    }
    return true;
}

bool ConfigParser::parseBoolean(const json& data, const std::string& key, bool& out) const {
    auto it = data.find(key);
    if (it == data.end()) {
        return true;
    }

    if (!it->is_boolean()) {
        std::cerr << "`" << key << "` must be a boolean value." << std::endl;
        return false;
    }

    out = it->get<bool>();
    return true;
}

bool ConfigParser::parseExtensionArray(const json& data) {
    auto it = data.find("include_ext");
    if (it == data.end()) {
        return true;
    }

    if (!it->is_array()) {
        std::cerr << "Invalid configuration: `include_ext` must be an array." << std::endl;
        return false;
    }

    for (const auto& ext : *it) {
        if (!ext.is_string()) {
            std::cerr << "Invalid configuration: each entry of `include_ext` must be a string." << std::endl;
            return false;
        }
        m_options.extensions.push_back(ext.get<std::string>());
    }

    if (m_options.extensions.empty()) {
        std::cout << "`include_ext` is empty; using the built-in video extensions." << std::endl;
    }

    return true;
}
