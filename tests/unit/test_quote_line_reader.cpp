#include "csv_splitter/quote_line_reader.hpp"
#include "../test_support.hpp"

#include <memory>
#include <string>
#include <vector>

using cs_test::expect;

namespace {

struct Line { std::string text; std::size_t bytes; };

std::vector<Line> read_all(const std::string& data, cs::CsvFormat fmt = {}) {
  cs::QuoteLineReader r(std::make_unique<cs::MemoryByteStream>(data), fmt);
  std::vector<Line> out;
  std::string buf;
  while (std::size_t n = r.read_line(buf)) out.push_back({buf, n});
  return out;
}

void test_plain_lines() {
  auto v = read_all("a,b\nc,d\ne,f\n");
  expect(v.size() == 3, "plain: 3 lines");
  if (v.size() != 3) return;
  expect(v[0].text == "a,b" && v[0].bytes == 4, "plain: first line a,b / 4 bytes");
  expect(v[2].text == "e,f" && v[2].bytes == 4, "plain: last line e,f / 4 bytes");
}

void test_quoted_newline() {
  auto v = read_all("a,\"b\nc\"\nd,e\n");
  expect(v.size() == 2, "quoted newline: 2 logical lines");
  if (v.size() != 2) return;
  expect(v[0].text == "a,\"b\nc\"", "quoted newline: content kept verbatim");
  expect(v[0].bytes == 8, "quoted newline: first line consumes through closing quote + newline");
  expect(v[1].text == "d,e" && v[1].bytes == 4, "quoted newline: second line d,e");
}

void test_no_trailing_newline() {
  auto v = read_all("a,b\nc,d");
  expect(v.size() == 2, "no trailing newline: 2 lines");
  if (v.size() != 2) return;
  expect(v[1].text == "c,d" && v[1].bytes == 3, "no trailing newline: last line is 3 bytes");
}

void test_unterminated_quote() {
  const std::string data = "x\na,\"b\nc\nd";
  cs::QuoteLineReader r(std::make_unique<cs::MemoryByteStream>(data), {});
  std::string buf;
  expect(r.read_line(buf) == 2, "unterminated: first line 2 bytes");
  expect(!r.unterminated_quote(), "unterminated: closed line not flagged");
  expect(r.read_line(buf) == data.size() - 2, "unterminated: rest of stream is one line");
  expect(buf == "a,\"b\nc\nd", "unterminated: content is everything read");
  expect(r.read_line(buf) == 0, "unterminated: then end of stream");
  expect(r.unterminated_quote(), "unterminated: flag survives the EOF call");
  expect(r.position() == data.size(), "unterminated: position equals size");
}

void test_doubled_delimiter_toggles() {
  // "" is close+open, so the newline after it is still unquoted.
  auto v = read_all("\"a\"\"b\"\nx\n");
  expect(v.size() == 2, "doubled delimiter: toggles cancel, 2 lines");
  if (!v.empty()) expect(v[0].bytes == 7, "doubled delimiter: first line 7 bytes");

  // Here the newline falls after an odd number of quotes: still inside.
  auto w = read_all("\"a\"\"\nb\"\nx\n");
  expect(w.size() == 2, "doubled delimiter: newline inside reopened quote");
  if (!w.empty()) expect(w[0].text == "\"a\"\"\nb\"", "doubled delimiter: spanning content");
}

void test_empty_and_crlf_lines() {
  auto v = read_all("\n\nx");
  expect(v.size() == 3, "empty lines: each counts");
  if (v.size() == 3) expect(v[0].text.empty() && v[0].bytes == 1, "empty lines: 1 byte, no content");

  auto c = read_all("a\r\nb\r\n");
  expect(c.size() == 2, "crlf: 2 lines");
  if (!c.empty()) expect(c[0].text == "a\r" && c[0].bytes == 3, "crlf: CR kept, LF terminates");
}

void test_custom_format() {
  cs::CsvFormat fmt;
  fmt.delimiter = '\'';
  fmt.separator = ';';
  auto v = read_all("a;'x\ny';\"\nz\n", fmt);
  expect(v.size() == 2, "custom format: double quote is ordinary, single quote quotes");
  if (!v.empty()) expect(v[0].text == "a;'x\ny';\"", "custom format: first line content");
}

void test_no_read_ahead() {
  auto s = std::make_unique<cs::MemoryByteStream>("ab\n\"c\nd\"\ne");
  cs::MemoryByteStream* raw = s.get();
  cs::QuoteLineReader r(std::move(s), {});
  std::string buf;
  std::uint64_t total = 0;
  while (std::size_t n = r.read_line(buf)) {
    total += n;
    expect(raw->position() == total, "no read-ahead: stream position tracks consumed bytes");
  }
  expect(total == 10 && r.position() == 10, "no read-ahead: all bytes consumed");
}

void test_for_each_line() {
  cs::QuoteLineReader r(std::make_unique<cs::MemoryByteStream>("1\n2\n3\n4\n"), {});
  std::size_t seen = 0, bytes = 0;
  r.for_each_line([&](std::string_view, std::size_t n){ bytes += n; return ++seen < 2; });
  expect(seen == 2 && bytes == 4, "for_each_line: stops when callback returns false");
}

void test_close_and_errors() {
  bool closed = false;
  {
    cs::QuoteLineReader r(std::make_unique<cs_test::TrackingStream>("a\nb\n", &closed), {});
    std::string buf;
    (void)r.read_line(buf);
  }
  expect(closed, "close: stream released on destruction");

  closed = false;
  bool threw = false;
  try {
    cs::QuoteLineReader r(std::make_unique<cs_test::TrackingStream>("abc\ndef\n", &closed, 5), {});
    std::string buf;
    expect(r.read_line(buf) == 4, "io error: first line readable");
    (void)r.read_line(buf);
  } catch (const cs::IoError&) {
    threw = true;
  }
  expect(threw, "io error: read failure propagates as IoError");
  expect(closed, "io error: stream released on the error path");

  cs::QuoteLineReader r(std::make_unique<cs::MemoryByteStream>("a\n"), {});
  r.close();
  std::string buf;
  expect(r.read_line(buf) == 0, "close: closed reader is at end of stream");
}

}

int main() {
  test_plain_lines();
  test_quoted_newline();
  test_no_trailing_newline();
  test_unterminated_quote();
  test_doubled_delimiter_toggles();
  test_empty_and_crlf_lines();
  test_custom_format();
  test_no_read_ahead();
  test_for_each_line();
  test_close_and_errors();
  return cs_test::finish("quote_line_reader");
}
