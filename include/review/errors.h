#pragma once

#include <stdexcept>
#include <string>

namespace review {

// Raised when no diff text is available to parse.
class ParseError : public std::runtime_error {
public:
  explicit ParseError(const std::string &message)
      : std::runtime_error(message) {}
};

// Raised by a DiffSource when the referenced diff cannot be produced.
class FetchError : public std::runtime_error {
public:
  explicit FetchError(const std::string &message)
      : std::runtime_error(message) {}
};

} // namespace review
