#pragma once

#include <expected>
#include <string>
#include <string_view>

namespace envtpl {

struct Error {
  enum class Kind {
    Config,
    MissingVariable,
    CyclicReference,
    NotFound,
    Io,
  };

  Kind        kind_;
  std::string message_;

  Error(Kind kind, std::string msg);

  Error(Error const&)                = default;
  Error& operator=(Error const&)     = default;
  Error(Error&&) noexcept            = default;
  Error& operator=(Error&&) noexcept = default;
  ~Error()                           = default;

  [[nodiscard]] Kind               kind() const noexcept;
  [[nodiscard]] std::string const& message() const noexcept;
  [[nodiscard]] std::string_view   kind_name() const noexcept;
  [[nodiscard]] int                exit_code() const noexcept;
};

template<typename T>
using Result = std::expected<T, Error>;

[[nodiscard]] std::unexpected<Error> configError(std::string msg);
[[nodiscard]] std::unexpected<Error> missingVariableError(std::string_view token);
[[nodiscard]] std::unexpected<Error> cyclicReferenceError(std::string msg);
[[nodiscard]] std::unexpected<Error> notFoundError(std::string msg);
[[nodiscard]] std::unexpected<Error> ioError(std::string msg);

} // namespace envtpl
