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
 * @file colors.hpp
 * @brief Symbolic terminal colors and their ANSI escape sequences.
 */

#pragma once

#include <string>
#include <string_view>

namespace prettylog::format {

/**
 * @enum Color
 * @brief Header colors understood by the formatter.
 *
 * `None` means "no escape sequence": text passes through untouched.
 */
enum class Color { None, Black, Blue, Cyan, Green, Gray, Magenta, Red, White, Yellow };

/// @brief Sequence that restores the terminal's default attributes.
inline constexpr std::string_view kColorReset = "\033[0m";

/**
 * @brief Returns the ANSI escape sequence that starts `color`.
 *
 * @return An empty view for `Color::None`.
 */
std::string_view color_code(Color color);

/**
 * @brief Wraps `text` in the escape sequence for `color` and a reset.
 *
 * @code
 * color_text("a", Color::Red);  // "\033[31ma\033[0m"
 * color_text("a", Color::None); // "a"
 * @endcode
 */
std::string color_text(const std::string& text, Color color);

std::string to_string(Color color);

/**
 * @brief Parses a canonical color name ("None", "Black", "Blue", ...).
 * @throws prettylog::core::ConfigError If the name is unknown.
 */
Color color_from_string(const std::string& name);

} // namespace prettylog::format
