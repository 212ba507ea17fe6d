#pragma once
#include "csv_splitter/byte_stream.hpp"
#include "csv_splitter/csv_format.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace cs {

// Reads logical lines: a '\n' ends a line only outside a quoted region.
// Every delimiter byte toggles the quoted state, so a doubled delimiter is
// open+close rather than an escaped literal. The stream is owned and closed
// on destruction.
class QuoteLineReader {
public:
  QuoteLineReader(std::unique_ptr<ByteStream> in, CsvFormat fmt);
  ~QuoteLineReader();

  QuoteLineReader(const QuoteLineReader&) = delete;
  QuoteLineReader& operator=(const QuoteLineReader&) = delete;

  // Clears `out`, fills it with the next logical line (terminator excluded)
  // and returns the bytes consumed, terminator included. 0 at end of stream.
  std::size_t read_line(std::string& out);

  // Calls cb(line, bytes_consumed) per logical line until EOF or cb returns false.
  using LineCallback = std::function<bool(std::string_view, std::size_t)>;
  void for_each_line(const LineCallback& cb);

  // True when the last non-empty line hit EOF inside a quoted region.
  bool unterminated_quote() const noexcept;
  std::uint64_t position() const noexcept;

  void close() noexcept;

private:
  struct Impl; Impl* p_;
};

}
