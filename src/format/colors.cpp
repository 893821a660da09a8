/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file colors.cpp
 * @brief Constant color lookup table.
 */

#include "prettylog/format/colors.hpp"

#include "prettylog/core/error.hpp"

#include <array>

namespace prettylog::format {

namespace {

struct ColorEntry {
    Color color;
    std::string_view name;
    std::string_view code;
};

// Indexed by the enumerator value of Color.
constexpr std::array<ColorEntry, 10> kColorTable = {{
    {Color::None, "None", ""},
    {Color::Black, "Black", "\033[30m"},
    {Color::Blue, "Blue", "\033[34m"},
    {Color::Cyan, "Cyan", "\033[36m"},
    {Color::Green, "Green", "\033[32m"},
    {Color::Gray, "Gray", "\033[90m"},
    {Color::Magenta, "Magenta", "\033[35m"},
    {Color::Red, "Red", "\033[31m"},
    {Color::White, "White", "\033[37m"},
    {Color::Yellow, "Yellow", "\033[33m"},
}};

} // namespace

std::string_view color_code(Color color)
{
    return kColorTable[static_cast<size_t>(color)].code;
}

std::string color_text(const std::string& text, Color color)
{
    if (color == Color::None) {
        return text;
    }

    std::string result;
    std::string_view code = color_code(color);
    result.reserve(code.size() + text.size() + kColorReset.size());
    result.append(code);
    result.append(text);
    result.append(kColorReset);
    return result;
}

std::string to_string(Color color)
{
    return std::string(kColorTable[static_cast<size_t>(color)].name);
}

Color color_from_string(const std::string& name)
{
    for (const auto& entry : kColorTable) {
        if (entry.name == name) {
            return entry.color;
        }
    }
    throw core::ConfigError("Unknown color '" + name + "'");
}

} // namespace prettylog::format
