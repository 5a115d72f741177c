#include "envtpl/Sink.hpp"
#include "envtpl/Log.hpp"

#include <fstream>
#include <ostream>
#include <system_error>

#include <fmt/core.h>

namespace envtpl {

namespace fs = std::filesystem;

Result<void> writeFile(fs::path const& path, std::string_view content) {
  std::error_code ec;
  if (auto parent = path.parent_path(); !parent.empty()) {
    fs::create_directories(parent, ec);
    if (ec) {
      return ioError(fmt::format("cannot create directory {}: {}", parent.string(), ec.message()));
    }
  }

  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    return ioError(fmt::format("cannot open {} for writing", path.string()));
  }
  out.write(content.data(), static_cast<std::streamsize>(content.size()));
  out.close();
  if (!out) {
    return ioError(fmt::format("error while writing {}", path.string()));
  }
  return {};
}

OutputSink::OutputSink(std::ostream& out) noexcept
    : out_(out) {}

Result<void> OutputSink::write(TemplateUnit const& unit, std::string_view rendered) {
  if (unit.output_) {
    if (auto result = writeFile(*unit.output_, rendered); !result) {
      return result;
    }
    log::debug("{} -> {} ({} bytes)", unit.label_, unit.output_->string(), rendered.size());
    return {};
  }

  out_.write(rendered.data(), static_cast<std::streamsize>(rendered.size()));
  out_.flush();
  if (!out_) {
    return ioError("error while writing to standard output");
  }
  log::debug("{} -> <stdout> ({} bytes)", unit.label_, rendered.size());
  return {};
}

Result<void> DryRunSink::write(TemplateUnit const& unit, std::string_view rendered) {
  auto destination = unit.output_ ? unit.output_->string() : std::string("<stdout>");
  log::info("dry run: would write {} bytes from {} to {}", rendered.size(), unit.label_, destination);
  return {};
}

} // namespace envtpl
