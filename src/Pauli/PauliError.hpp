#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

#include <fmt/format.h>

#include "Logger.hpp"

namespace qpauli {

class PauliError : public std::invalid_argument {
  public:
    explicit PauliError(const std::string& message) : std::invalid_argument(message) {}
};

// Two sizes which were required to agree did not.
class LengthMismatch : public PauliError {
  public:
    size_t first;
    size_t second;

    LengthMismatch(size_t first, size_t second)
      : PauliError(fmt::format("incompatible length {} and {}", first, second)), first(first), second(second) {}
};

class OutOfBound : public PauliError {
  public:
    size_t position;
    size_t length;

    OutOfBound(size_t position, size_t length)
      : PauliError(fmt::format("position {} is out of bound for length {}", position, length)), position(position), length(length) {}
};

// Records the error in the log before throwing it.
template <typename E>
[[noreturn]] void log_and_throw(const E& error, LogSite site={}) {
  Logger::log_error(error.what(), site);
  throw error;
}

}
