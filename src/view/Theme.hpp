#pragma once

#include <string>
#include <unordered_map>

#include <blend2d.h>

class Config;

// Flat map from semantic role names ("copper.f", "via_hole", "wire") to colors.
class Theme
{
public:
    static constexpr const char* kConfigPrefix = "theme.";

    Theme() = default;

    static Theme DefaultBoard();
    static Theme DefaultSchematic();

    // Opaque white for unknown names.
    [[nodiscard]] BLRgba32 ColorFor(const std::string& name) const;
    [[nodiscard]] bool Has(const std::string& name) const { return m_colors_.count(name) != 0; }
    void Set(const std::string& name, BLRgba32 color) { m_colors_[name] = color; }
    [[nodiscard]] size_t Size() const { return m_colors_.size(); }

    // Applies "theme.<name>" config entries. Returns the number applied.
    int LoadOverrides(const Config& config);

private:
    std::unordered_map<std::string, BLRgba32> m_colors_;
};
