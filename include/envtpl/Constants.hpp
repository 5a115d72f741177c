#pragma once

#include <cstddef>
#include <string_view>

namespace envtpl {

inline constexpr std::string_view EXE_NAME = "envtpl";
inline constexpr std::string_view EXE_DESC = "Substitute ${NAME} placeholders from a layered variable environment";
inline constexpr std::string_view VERSION  = "v0.3.0";

inline constexpr std::string_view DEFAULT_EXTENSION = "template";
inline constexpr std::string_view STDIN_PATH        = "-";

// Longest indirection chain followed before giving up.
inline constexpr std::size_t MAX_INDIRECTION_DEPTH = 16;

} // namespace envtpl
