// errors.hpp
#pragma once

#include <stdexcept>
#include <string>

namespace twistshout {

/* Caller contract violations. Cryptographic rejection is never an exception:
 * every verifier returns false instead. */

// wrong point length, wrong table length, bind position out of range
class ShapeMismatch : public std::invalid_argument {
public:
  explicit ShapeMismatch(const std::string &what)
      : std::invalid_argument("shape mismatch: " + what) {}
};

// polynomial arity disagrees with a commitment key, or operand sizes differ
class SizeMismatch : public std::invalid_argument {
public:
  explicit SizeMismatch(const std::string &what)
      : std::invalid_argument("size mismatch: " + what) {}
};

// sum-check composition of higher degree than the caller's bound
class DegreeViolation : public std::logic_error {
public:
  explicit DegreeViolation(const std::string &what)
      : std::logic_error("degree violation: " + what) {}
};

class TraceOutOfBounds : public std::out_of_range {
public:
  explicit TraceOutOfBounds(const std::string &what)
      : std::out_of_range("trace out of bounds: " + what) {}
};

class IndexOutOfBounds : public std::out_of_range {
public:
  explicit IndexOutOfBounds(const std::string &what)
      : std::out_of_range("index out of bounds: " + what) {}
};

// setup or trim requested for a size the key cannot serve
class UnsupportedSize : public std::invalid_argument {
public:
  explicit UnsupportedSize(const std::string &what)
      : std::invalid_argument("unsupported size: " + what) {}
};

} // namespace twistshout
