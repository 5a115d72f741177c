#include "envtpl/Error.hpp"

#include <string>
#include <utility>

#include <fmt/core.h>

namespace envtpl {

Error::Error(Kind kind, std::string msg)
    : kind_(kind), message_(std::move(msg)) {}

Error::Kind Error::kind() const noexcept {
  return kind_;
}

std::string const& Error::message() const noexcept {
  return message_;
}

std::string_view Error::kind_name() const noexcept {
  switch (kind_) {
  case Kind::Config:
    return "ConfigError";
  case Kind::MissingVariable:
    return "MissingVariableError";
  case Kind::CyclicReference:
    return "CyclicReferenceError";
  case Kind::NotFound:
    return "NotFoundError";
  case Kind::Io:
    return "IoError";
  }
  return "Error";
}

int Error::exit_code() const noexcept {
  return kind_ == Kind::Config ? 2 : 1;
}

std::unexpected<Error> configError(std::string msg) {
  return std::unexpected(Error{Error::Kind::Config, std::move(msg)});
}

std::unexpected<Error> missingVariableError(std::string_view token) {
  return std::unexpected(Error{Error::Kind::MissingVariable, fmt::format("variable not set: {}", token)});
}

std::unexpected<Error> cyclicReferenceError(std::string msg) {
  return std::unexpected(Error{Error::Kind::CyclicReference, std::move(msg)});
}

std::unexpected<Error> notFoundError(std::string msg) {
  return std::unexpected(Error{Error::Kind::NotFound, std::move(msg)});
}

std::unexpected<Error> ioError(std::string msg) {
  return std::unexpected(Error{Error::Kind::Io, std::move(msg)});
}

} // namespace envtpl
