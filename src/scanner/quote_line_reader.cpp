#include "csv_splitter/quote_line_reader.hpp"

#include <utility>

namespace cs {

struct QuoteLineReader::Impl {
  std::unique_ptr<ByteStream> in;
  CsvFormat fmt;
  std::uint64_t consumed{0};
  bool open_quote{false};

  ~Impl() { if (in) in->close(); }

  std::size_t read_line(std::string& out) {
    out.clear();
    if (!in) return 0;

    enum class Mode { Unquoted, Quoted } mode = Mode::Unquoted;
    std::size_t n = 0;
    for (int c = in->get(); c != ByteStream::kEof; c = in->get()) {
      ++n;
      const char ch = static_cast<char>(c);
      if (ch == fmt.delimiter) {
        mode = (mode == Mode::Unquoted) ? Mode::Quoted : Mode::Unquoted;
      } else if (ch == '\n' && mode == Mode::Unquoted) {
        open_quote = false;
        consumed += n;
        return n;
      }
      out.push_back(ch);
    }

    // EOF: whatever was read is the final line, quoted or not.
    // A 0-byte call leaves the flag as the last line set it.
    if (n > 0) open_quote = (mode == Mode::Quoted);
    consumed += n;
    return n;
  }
};

QuoteLineReader::QuoteLineReader(std::unique_ptr<ByteStream> in, CsvFormat fmt)
  : p_(new Impl{std::move(in), fmt}) {}

QuoteLineReader::~QuoteLineReader() { delete p_; }

std::size_t QuoteLineReader::read_line(std::string& out) { return p_->read_line(out); }

void QuoteLineReader::for_each_line(const LineCallback& cb) {
  std::string line;
  line.reserve(256);
  while (std::size_t n = p_->read_line(line)) {
    if (!cb(line, n)) break;
  }
}

bool QuoteLineReader::unterminated_quote() const noexcept { return p_->open_quote; }
std::uint64_t QuoteLineReader::position() const noexcept { return p_->consumed; }

void QuoteLineReader::close() noexcept {
  if (p_->in) { p_->in->close(); p_->in.reset(); }
}

}
