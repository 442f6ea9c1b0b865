#pragma once

#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

// Typed key/value settings with key=value file persistence.
class Config
{
public:
    Config();
    ~Config();

    void SetString(const std::string& key, const std::string& value);
    void SetInt(const std::string& key, int value);
    void SetFloat(const std::string& key, float value);
    void SetBool(const std::string& key, bool value);

    std::string GetString(const std::string& key, const std::string& defaultValue = "") const;
    int GetInt(const std::string& key, int defaultValue = 0) const;
    float GetFloat(const std::string& key, float defaultValue = 0.0f) const;
    bool GetBool(const std::string& key, bool defaultValue = false) const;

    bool HasKey(const std::string& key) const;
    // Keys starting with 'prefix', unordered.
    std::vector<std::string> KeysWithPrefix(const std::string& prefix) const;

    bool SaveToFile(const std::string& filename) const;
    // Values in the file replace the current ones; keys absent from the file keep their defaults.
    bool LoadFromFile(const std::string& filename);

    void ResetToDefaults();

private:
    using ConfigValue = std::variant<std::string, int, float, bool>;
    std::unordered_map<std::string, ConfigValue> m_values;
};
