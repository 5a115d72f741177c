#pragma once

#include "envtpl/Error.hpp"
#include "envtpl/SourceWalker.hpp"

#include <filesystem>
#include <iosfwd>
#include <string_view>

namespace envtpl {

class Sink {
public:
  Sink()                       = default;
  Sink(Sink const&)            = delete;
  Sink& operator=(Sink const&) = delete;
  Sink(Sink&&)                 = delete;
  Sink& operator=(Sink&&)      = delete;
  virtual ~Sink()              = default;

  virtual Result<void> write(TemplateUnit const& unit, std::string_view rendered) = 0;
};

// Writes to the unit's output file, or to `out` when it has none.
class OutputSink final : public Sink {
  std::ostream& out_;

public:
  explicit OutputSink(std::ostream& out) noexcept;

  Result<void> write(TemplateUnit const& unit, std::string_view rendered) override;
};

// Reports what would be written without touching anything.
class DryRunSink final : public Sink {
public:
  Result<void> write(TemplateUnit const& unit, std::string_view rendered) override;
};

Result<void> writeFile(std::filesystem::path const& path, std::string_view content);

} // namespace envtpl
