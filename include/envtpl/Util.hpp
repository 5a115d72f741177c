#pragma once

#include <string>
#include <string_view>

namespace envtpl {

std::string trim(std::string_view s);
std::string toUpper(std::string_view s);

// [A-Za-z0-9_.-], the characters allowed in a placeholder name.
bool isTokenNameChar(char c) noexcept;

bool isAlpha(char c) noexcept;

// Blank, tab, and the other C-locale whitespace characters.
bool isSpace(char c) noexcept;

// Space or tab; the only whitespace allowed inside a placeholder.
bool isBlank(char c) noexcept;

} // namespace envtpl
