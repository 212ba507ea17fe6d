#pragma once
#include <string_view>

namespace cs {

struct CsvFormat {
  char delimiter = '"';  // quote character
  char separator = ',';  // field separator

  // Builds a format from raw config values. Throws ConfigurationError unless
  // both are exactly one character and differ from each other.
  static CsvFormat from_strings(std::string_view delimiter, std::string_view separator);

  // Same check for an already-built format (delimiter != separator).
  void validate() const;
};

}
