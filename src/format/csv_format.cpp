#include "csv_splitter/csv_format.hpp"
#include "csv_splitter/errors.hpp"

namespace cs {

CsvFormat CsvFormat::from_strings(std::string_view delimiter, std::string_view separator) {
  if (delimiter.size() != 1 || separator.size() != 1) {
    throw ConfigurationError("delimiter/separator can only be a single character");
  }
  CsvFormat f;
  f.delimiter = delimiter.front();
  f.separator = separator.front();
  f.validate();
  return f;
}

void CsvFormat::validate() const {
  if (delimiter == separator) {
    throw ConfigurationError("delimiter and separator cannot be the same character");
  }
}

}
