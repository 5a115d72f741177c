#pragma once

#include "envtpl/Error.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>

namespace envtpl {

// One step of store construction, executed in command-line order.
struct VariableSource {
  enum class Kind {
    Assignment, // NAME=VALUE given inline
    File,       // path to a NAME=VALUE file
  };

  Kind        kind_;
  std::string value_;

  [[nodiscard]] static VariableSource assignment(std::string text);
  [[nodiscard]] static VariableSource file(std::string path);

  friend bool operator==(VariableSource const&, VariableSource const&) = default;
};

class VariableStore {
  std::unordered_map<std::string, std::string> vars_;

public:
  VariableStore() = default;

  // Later calls for the same name override earlier ones.
  void set(std::string name, std::string value);

  // Reads NAME=VALUE lines. Blank lines and lines starting with '#' (after
  // leading whitespace) are skipped.
  Result<void> setFromFile(std::filesystem::path const& path, bool must_exist);

  // Loads a NULL-terminated "NAME=VALUE" block such as `environ`.
  void setFromEnvironment(char const* const* envp);

  // Parses an inline NAME=VALUE assignment; NAME is uppercased.
  Result<void> assign(std::string_view assignment);

  // Executes the sources strictly in order.
  Result<void> apply(std::span<VariableSource const> sources);

  [[nodiscard]] std::optional<std::string_view> lookup(std::string const& name) const;
  [[nodiscard]] bool                            contains(std::string const& name) const;
  [[nodiscard]] std::size_t                     size() const noexcept;
};

} // namespace envtpl
