#include "Config.hpp"

#include <fstream>   // For file operations
#include <iostream>  // For logging
#include <sstream>   // For string stream operations
#include <stdexcept>

#include "utils/StringUtils.hpp"

Config::Config()
{
    ResetToDefaults();
}

Config::~Config() = default;

void Config::ResetToDefaults()
{
    // Used when the config file is missing or keys are absent
    m_values.clear();
    SetString("application.name", "KiCad Layer Viewer");
    SetInt("window.width", 1280);
    SetInt("window.height", 720);
    SetString("renderer.backend", "opengl");
    SetString("viewer.document", "board");
    SetFloat("viewer.dim_alpha", 0.25f);
    SetFloat("viewer.min_zoom", 0.5f);
    SetFloat("viewer.max_zoom", 190.0f);
    SetFloat("stroke.dash_ratio", 12.0f);
    SetFloat("stroke.gap_ratio", 3.0f);
}

void Config::SetString(const std::string& key, const std::string& value)
{
    m_values[key] = value;
}

void Config::SetInt(const std::string& key, int value)
{
    m_values[key] = value;
}

void Config::SetFloat(const std::string& key, float value)
{
    m_values[key] = value;
}

void Config::SetBool(const std::string& key, bool value)
{
    m_values[key] = value;
}

std::string Config::GetString(const std::string& key, const std::string& defaultValue) const
{
    auto it = m_values.find(key);
    if (it == m_values.end()) {
        return defaultValue;
    }
    if (std::holds_alternative<std::string>(it->second)) {
        return std::get<std::string>(it->second);
    }
    return std::visit(
        [](const auto& val_in) -> std::string {
            std::stringstream ss;
            if constexpr (std::is_same_v<std::decay_t<decltype(val_in)>, bool>) {
                ss << (val_in ? "true" : "false");
            } else {
                ss << val_in;
            }
            return ss.str();
        },
        it->second);
}

int Config::GetInt(const std::string& key, int defaultValue) const
{
    auto it = m_values.find(key);
    if (it != m_values.end()) {
        try {
            if (std::holds_alternative<int>(it->second))
                return std::get<int>(it->second);
            if (std::holds_alternative<float>(it->second))
                return static_cast<int>(std::get<float>(it->second));
            if (std::holds_alternative<std::string>(it->second)) {
                return std::stoi(std::get<std::string>(it->second));
            }
        } catch (const std::logic_error&) {
            std::cerr << "Config: '" << key << "' is not an integer, using default" << std::endl;
        }
    }
    return defaultValue;
}

float Config::GetFloat(const std::string& key, float defaultValue) const
{
    auto it = m_values.find(key);
    if (it != m_values.end()) {
        try {
            if (std::holds_alternative<float>(it->second))
                return std::get<float>(it->second);
            if (std::holds_alternative<std::string>(it->second)) {
                return std::stof(std::get<std::string>(it->second));
            }
            if (std::holds_alternative<int>(it->second)) {  // Promote int to float
                return static_cast<float>(std::get<int>(it->second));
            }
        } catch (const std::logic_error&) {
            std::cerr << "Config: '" << key << "' is not a number, using default" << std::endl;
        }
    }
    return defaultValue;
}

bool Config::GetBool(const std::string& key, bool defaultValue) const
{
    auto it = m_values.find(key);
    if (it != m_values.end()) {
        if (std::holds_alternative<bool>(it->second))
            return std::get<bool>(it->second);
        if (std::holds_alternative<int>(it->second))
            return std::get<int>(it->second) != 0;
        if (std::holds_alternative<std::string>(it->second)) {
            std::string const valStr = string_utils::ToLower(std::get<std::string>(it->second));
            if (valStr == "true" || valStr == "1")
                return true;
            if (valStr == "false" || valStr == "0")
                return false;
        }
    }
    return defaultValue;
}

bool Config::HasKey(const std::string& key) const
{
    return m_values.find(key) != m_values.end();
}

std::vector<std::string> Config::KeysWithPrefix(const std::string& prefix) const
{
    std::vector<std::string> keys;
    for (const auto& pair : m_values) {
        if (string_utils::StartsWith(pair.first, prefix)) {
            keys.push_back(pair.first);
        }
    }
    return keys;
}

// --- File I/O Implementation ---

bool Config::SaveToFile(const std::string& filename) const
{
    std::ofstream configFile(filename);
    if (!configFile.is_open()) {
        std::cerr << "Config: Could not open config file for writing: " << filename << std::endl;
        return false;
    }

    for (const auto& pair : m_values) {
        configFile << pair.first << "=";
        std::visit(
            [&configFile](const auto& value) {
                if constexpr (std::is_same_v<std::decay_t<decltype(value)>, bool>) {
                    configFile << (value ? "true" : "false");
                } else {
                    configFile << value;
                }
            },
            pair.second);
        configFile << "\n";
    }
    configFile.close();
    std::cout << "Config: Saved " << m_values.size() << " settings to " << filename << std::endl;
    return true;
}

bool Config::LoadFromFile(const std::string& filename)
{
    std::ifstream configFile(filename);
    if (!configFile.is_open()) {
        std::cout << "Config: No config file at " << filename << ", using defaults" << std::endl;
        return false;
    }

    std::string line;
    int loaded = 0;
    while (std::getline(configFile, line)) {
        std::string key, valueStr;
        size_t delimiterPos = line.find('=');
        if (delimiterPos == std::string::npos) {
            continue;
        }
        key = string_utils::Trim(line.substr(0, delimiterPos));
        valueStr = string_utils::Trim(line.substr(delimiterPos + 1));

        if (key.empty() || key[0] == '#' || key[0] == ';') {
            continue;
        }
        ++loaded;

        std::string const lowerValueStr = string_utils::ToLower(valueStr);
        if (lowerValueStr == "true") {
            SetBool(key, true);
            continue;
        }
        if (lowerValueStr == "false") {
            SetBool(key, false);
            continue;
        }

        try {
            size_t processedChars = 0;
            int intVal = std::stoi(valueStr, &processedChars);
            if (processedChars == valueStr.length()) {
                SetInt(key, intVal);
                continue;
            }
        } catch (const std::logic_error&) {
            // not an integer
        }
        try {
            size_t processedChars = 0;
            float floatVal = std::stof(valueStr, &processedChars);
            if (processedChars == valueStr.length()) {
                SetFloat(key, floatVal);
                continue;
            }
        } catch (const std::logic_error&) {
            // not a number
        }
        SetString(key, valueStr);
    }
    configFile.close();
    std::cout << "Config: Loaded " << loaded << " settings from " << filename << std::endl;
    return true;
}
