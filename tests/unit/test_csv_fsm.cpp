#include "csvlint/token_csv_fsm.hpp"
#include "csvlint/record_view.hpp"
#include <iostream>
#include <string>
#include <vector>

using Rows = std::vector<std::vector<std::string>>;
using Status = csvlint::CsvFsm::Status;

static int failures = 0;

static void expect(bool cond, const std::string& what) {
  if (!cond) { std::cerr << "[FAIL] " << what << "\n"; ++failures; }
}

// Drains the tokenizer; errors become {"!<kind>"} rows so tests can compare in order.
static Rows drain(std::string_view in, csvlint::CsvConfig cfg = {}) {
  Rows out;
  csvlint::CsvFsm fsm(cfg, in);
  csvlint::RecordView rv;
  while (true) {
    Status st = fsm.next(rv);
    if (st == Status::End) break;
    if (st == Status::Error) {
      out.push_back({"!" + std::string(csvlint::kind_name(fsm.error()))});
      if (csvlint::is_fatal(fsm.error())) break;
      continue;
    }
    out.push_back(rv.to_strings());
  }
  return out;
}

static csvlint::CsvConfig lazy() { csvlint::CsvConfig c; c.lazy_quotes = true; return c; }

int main() {
  // plain records, mixed terminators, no trailing newline
  expect(drain("a,b,c\r\nd,e,f\ng,h,i\rj,k,l") ==
         Rows{{"a","b","c"},{"d","e","f"},{"g","h","i"},{"j","k","l"}},
         "mixed terminators");

  // empty fields and empty lines
  expect(drain(",,\r\n\r\n\r\nx,,\r\n") == Rows{{"","",""},{"x","",""}},
         "empty fields, skipped blank lines");

  // quoted fields with delimiter, escaped quote and embedded CRLF
  expect(drain("\"a,b\",\"c\"\"d\",\"e\r\nf\"\r\n") == Rows{{"a,b","c\"d","e\r\nf"}},
         "quoted specials");

  expect(drain("\"\",x\r\n") == Rows{{"", "x"}}, "empty quoted field");

  // alternative delimiter
  {
    csvlint::CsvConfig c; c.delimiter = '\t';
    expect(drain("a\tb,c\r\n", c) == Rows{{"a", "b,c"}}, "tab delimiter keeps commas");
  }

  // bare quote: error, then resync on the next line
  expect(drain("h1,h2\r\na,b\"c\r\nd,e\r\n") == Rows{{"h1","h2"},{"!BareQuote"},{"d","e"}},
         "bare quote resync");

  // stray quote inside a quoted field
  expect(drain("\"ab\"c,d\r\ne,f\r\n") == Rows{{"!Quote"},{"e","f"}},
         "quote in quoted field");

  // backslash-escaped quote
  expect(drain("\"a\\\"b\",c\r\nx,y\r\n") == Rows{{"!InvalidEscape"},{"x","y"}},
         "backslash escape inside quotes");
  expect(drain("a\\\"b,c\r\nx,y\r\n") == Rows{{"!InvalidEscape"},{"x","y"}},
         "backslash escape outside quotes");

  // unterminated quote swallows the rest of the input
  expect(drain("a,b\r\nc,\"d\r\ne,f\r\n") == Rows{{"a","b"},{"!UnterminatedQuote"}},
         "unterminated quote");

  // lazy mode keeps malformed quotes literally
  expect(drain("a,b\"c\r\n", lazy()) == Rows{{"a","b\"c"}}, "lazy bare quote");
  expect(drain("\"ab\"c,d\r\n", lazy()) == Rows{{"ab\"c,d\r\n"}},
         "lazy stray quote stays quoted to end of input");
  expect(drain("x,\"ab\r\n", lazy()) == Rows{{"x","ab\r\n"}}, "lazy unterminated quote");

  // invalid UTF-8 is fatal
  {
    const std::string in = "a,b\r\nc,\xff\r\nd,e\r\n";
    csvlint::CsvFsm fsm(csvlint::CsvConfig{}, in);
    csvlint::RecordView rv;
    expect(fsm.next(rv) == Status::Record, "utf8: first record");
    expect(fsm.next(rv) == Status::Error, "utf8: second record fails");
    expect(csvlint::holds<csvlint::kind::Utf8>(fsm.error()), "utf8: kind");
    const auto& msg = std::get<csvlint::kind::Utf8>(fsm.error()).message;
    expect(msg.find("field 2") != std::string::npos, "utf8: message names field, got " + msg);
    expect(fsm.records() == 1, "utf8: one record yielded");
  }

  // valid multi-byte text passes
  expect(drain("na\xc3\xafve,\xe2\x82\xac\r\n") == Rows{{"na\xc3\xafve","\xe2\x82\xac"}},
         "utf8 multibyte");

  // stream failure: complete records survive, then Io
  {
    const std::string in = "a,b\r\nc,d\r\ne,";
    csvlint::CsvFsm fsm(csvlint::CsvConfig{}, in);
    fsm.set_stream_error("device lost");
    csvlint::RecordView rv;
    expect(fsm.next(rv) == Status::Record, "io: first record");
    expect(fsm.next(rv) == Status::Record, "io: second record");
    expect(fsm.next(rv) == Status::Error, "io: truncated record fails");
    expect(fsm.error() == csvlint::ErrorKind{csvlint::kind::Io{"device lost"}}, "io: kind+message");
  }

  // physical line tracking
  {
    const std::string in = "\"a\r\nb\",c\r\nd\ne";
    csvlint::CsvFsm fsm(csvlint::CsvConfig{}, in);
    csvlint::RecordView rv;
    (void)fsm.next(rv);
    expect(fsm.line() == 3, "line after multi-line record");
    (void)fsm.next(rv);
    expect(fsm.line() == 4, "line after LF record");
  }

  if (failures) return 1;
  std::cout << "[PASS] csv fsm\n";
  return 0;
}
