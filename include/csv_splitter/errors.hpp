#pragma once
#include <stdexcept>
#include <string>

namespace cs {

// Base for everything the planner throws.
class SplitError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Bad delimiter/separator, lines per split, threads, or an unparsable value.
// Always raised before any file is opened.
class ConfigurationError : public SplitError {
public:
  using SplitError::SplitError;
};

// Input path missing, not a regular file, or a malformed plan document.
class InputError : public SplitError {
public:
  using SplitError::SplitError;
};

// Open/read failure on an underlying stream.
class IoError : public SplitError {
public:
  using SplitError::SplitError;
};

}
