#pragma once

#include "envtpl/Config.hpp"
#include "envtpl/Error.hpp"

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace envtpl {

// One piece of template text and where its rendering goes.
struct TemplateUnit {
  std::string                          label_; // for diagnostics
  std::string                          text_;
  std::optional<std::filesystem::path> output_; // std::nullopt: standard output
};

Result<std::string> readFile(std::filesystem::path const& path);
Result<std::string> readStream(std::istream& in, std::string_view label);

// Files below `root` named "*.<extension>", relative to `root` and sorted.
Result<std::vector<std::filesystem::path>>
listTemplates(std::filesystem::path const& root, std::string_view extension, bool recursive);

// output_root / (relative minus ".<extension>")
std::filesystem::path
outputPathFor(std::filesystem::path const& relative, std::string_view extension, std::filesystem::path const& output_root);

class SourceWalker {
  Config const& config_;
  std::istream& in_;

public:
  SourceWalker(Config const& config, std::istream& in) noexcept;

  [[nodiscard]] Result<std::vector<TemplateUnit>> collect() const;

private:
  [[nodiscard]] Result<std::vector<TemplateUnit>> collectDirectory() const;
};

} // namespace envtpl
