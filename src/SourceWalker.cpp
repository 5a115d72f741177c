#include "envtpl/SourceWalker.hpp"
#include "envtpl/Constants.hpp"
#include "envtpl/Log.hpp"

#include <algorithm>
#include <fstream>
#include <istream>
#include <sstream>
#include <system_error>
#include <utility>

#include <fmt/core.h>

namespace envtpl {

namespace fs = std::filesystem;

namespace {

bool hasExtension(fs::path const& file, std::string_view extension) {
  auto name = file.filename().string();
  // a bare ".template" has nothing left to name the output after
  return name.size() > extension.size() + 1 && name.ends_with(extension) &&
         name[name.size() - extension.size() - 1] == '.';
}

template<typename Iterator>
Result<std::vector<fs::path>> collectMatches(Iterator it, fs::path const& root, std::string_view extension) {
  std::vector<fs::path> matches;
  std::error_code       ec;
  for (; it != Iterator{}; it.increment(ec)) {
    if (ec) {
      return ioError(fmt::format("cannot scan {}: {}", root.string(), ec.message()));
    }
    auto const&     entry = *it;
    std::error_code type_ec;
    if (!entry.is_regular_file(type_ec) || !hasExtension(entry.path(), extension)) {
      continue;
    }
    matches.push_back(entry.path().lexically_relative(root));
  }
  if (ec) {
    return ioError(fmt::format("cannot scan {}: {}", root.string(), ec.message()));
  }
  return matches;
}

} // namespace

Result<std::string> readFile(fs::path const& path) {
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    return notFoundError(fmt::format("no such file: {}", path.string()));
  }
  if (fs::is_directory(path, ec)) {
    return configError(fmt::format("{} is a directory, use --directory to render a tree", path.string()));
  }

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return ioError(fmt::format("cannot open {}", path.string()));
  }
  return readStream(in, path.string());
}

Result<std::string> readStream(std::istream& in, std::string_view label) {
  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    return ioError(fmt::format("error while reading {}", label));
  }
  return std::move(buffer).str();
}

Result<std::vector<fs::path>> listTemplates(fs::path const& scan_root, std::string_view extension, bool recursive) {
  // "dir/" iterates as "dir/x", which does not relativize against "dir/"
  auto root = scan_root;
  if (!root.has_filename() && root.has_relative_path()) {
    root = root.parent_path();
  }

  std::error_code ec;
  if (!fs::is_directory(root, ec)) {
    return notFoundError(fmt::format("no such directory: {}", root.string()));
  }

  auto const options = fs::directory_options::skip_permission_denied;

  Result<std::vector<fs::path>> matches;
  if (recursive) {
    fs::recursive_directory_iterator it(root, options, ec);
    if (ec) {
      return ioError(fmt::format("cannot scan {}: {}", root.string(), ec.message()));
    }
    matches = collectMatches(std::move(it), root, extension);
  } else {
    fs::directory_iterator it(root, options, ec);
    if (ec) {
      return ioError(fmt::format("cannot scan {}: {}", root.string(), ec.message()));
    }
    matches = collectMatches(std::move(it), root, extension);
  }

  if (matches) {
    std::sort(matches->begin(), matches->end());
  }
  return matches;
}

fs::path outputPathFor(fs::path const& relative, std::string_view extension, fs::path const& output_root) {
  auto name = relative.string();
  name.resize(name.size() - extension.size() - 1);
  return output_root / name;
}

SourceWalker::SourceWalker(Config const& config, std::istream& in) noexcept
    : config_(config), in_(in) {}

Result<std::vector<TemplateUnit>> SourceWalker::collect() const {
  std::vector<TemplateUnit> units;

  switch (config_.source_kind_) {
  case SourceKind::Text:
    units.push_back({"<text>", config_.source_, config_.output_});
    break;

  case SourceKind::File:
    if (config_.source_ != STDIN_PATH) {
      auto text = readFile(config_.source_);
      if (!text) {
        return std::unexpected(std::move(text.error()));
      }
      units.push_back({config_.source_, std::move(*text), config_.output_});
      break;
    }
    [[fallthrough]];

  case SourceKind::Stdin: {
    auto text = readStream(in_, "<stdin>");
    if (!text) {
      return std::unexpected(std::move(text.error()));
    }
    units.push_back({"<stdin>", std::move(*text), config_.output_});
    break;
  }

  case SourceKind::Directory:
    return collectDirectory();
  }

  return units;
}

Result<std::vector<TemplateUnit>> SourceWalker::collectDirectory() const {
  fs::path const root{config_.source_};

  if (config_.output_) {
    std::error_code ec;
    if (fs::exists(*config_.output_, ec) && !fs::is_directory(*config_.output_, ec)) {
      return configError(fmt::format("output {} exists and is not a directory", config_.output_->string()));
    }
  }

  auto files = listTemplates(root, config_.extension_, config_.recursive_);
  if (!files) {
    return std::unexpected(std::move(files.error()));
  }
  if (files->empty()) {
    log::debug("no *.{} files under {}", config_.extension_, root.string());
  }

  std::vector<TemplateUnit> units;
  units.reserve(files->size());
  for (auto const& relative : *files) {
    auto text = readFile(root / relative);
    if (!text) {
      return std::unexpected(std::move(text.error()));
    }

    std::optional<fs::path> output;
    if (config_.output_) {
      output = outputPathFor(relative, config_.extension_, *config_.output_);
    }
    units.push_back({(root / relative).string(), std::move(*text), std::move(output)});
  }
  return units;
}

} // namespace envtpl
