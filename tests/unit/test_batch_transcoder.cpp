#include "bcp_exorcist/batch_transcoder.hpp"
#include <iostream>
#include <string>
#include <vector>

static const std::string RS = "\x1E"; // default separator
static const std::string GS = "\x1D"; // default terminator
static const std::string NUL(1, '\0');

static int failures = 0;

static std::string show(const std::string& s) {
  std::string out;
  const char* hex = "0123456789ABCDEF";
  for (unsigned char c : s) {
    if (c == '\n') out += "\\n";
    else if (c < 0x20 || c == 0x7f) { out += "\\x"; out += hex[c>>4]; out += hex[c&0xF]; }
    else out.push_back(static_cast<char>(c));
  }
  return out;
}

static std::string run(const std::string& in, char sep = '\x1E', char eol = '\x1D',
                       int prev = bx::kNoPrevByte, bx::BatchCounts* counts = nullptr) {
  std::vector<char> out;
  bx::BatchCounts c = bx::transcode_batch(in, out, sep, eol, prev);
  if (counts) *counts = c;
  return std::string(out.begin(), out.end());
}

static void expect(const char* name, const std::string& got, const std::string& want) {
  if (got == want) return;
  ++failures;
  std::cerr << "[FAIL] " << name << "\n  got:  " << show(got) << "\n  want: " << show(want) << "\n";
}

int main() {
  expect("separators and trailing terminator",
         run("field1" + RS + "field2" + RS + "field3" + GS),
         "field1\",\"field2\",\"field3\"\n\"");

  expect("terminators only",
         run("field1" + GS + "field2" + GS + "field3" + GS),
         "field1\"\n\"field2\"\n\"field3\"\n\"");

  expect("literal quotes are escaped",
         run("\"\"field\",\"field\",field\"" + RS + "field3" + GS),
         "\\\"\\\"field\\\",\\\"field\\\",field\\\"\",\"field3\"\n\"");

  expect("adjacent specials become empty fields",
         run(RS + RS + GS),
         "\",\"\",\"\"\n\"");

  expect("backslash before sep/eol is passed through",
         run("\\" + RS + "\\" + RS + "\\" + GS),
         "\\\\\",\"\\\\\",\"\\\\\"\n\"");

  expect("NUL bytes are plain content",
         run(NUL + RS + NUL + RS + NUL + GS),
         NUL + "\",\"" + NUL + "\",\"" + NUL + "\"\n\"");

  expect("empty haystack", run(""), "");
  expect("no specials is verbatim", run("plain text, with commas"), "plain text, with commas");
  expect("backslash not before a delimiter is content", run("a\\b"), "a\\b");

  // look-back across a chunk boundary only when a previous byte is supplied
  expect("no carry at chunk start", run(RS + "b"), "\",\"b");
  expect("carried backslash at chunk start", run(RS + "b", '\x1E', '\x1D', '\\'), "\\\",\"b");
  expect("carried non-backslash", run(GS + "b", '\x1E', '\x1D', 'x'), "\"\n\"b");

  expect("custom delimiters", run("a|b\nc", '|', '\n'), "a\",\"b\"\n\"c");
  expect("separator wins when sep == eol", run("a;b", ';', ';'), "a\",\"b");

  {
    std::vector<char> out = {'X'};
    bx::transcode_batch("a" + RS + "b", out, '\x1E', '\x1D');
    expect("appends without clearing", std::string(out.begin(), out.end()), "Xa\",\"b");
  }

  {
    bx::BatchCounts c;
    run("a\"b\\" + RS + "c" + GS + "d" + RS, '\x1E', '\x1D', bx::kNoPrevByte, &c);
    if (c.separators != 2 || c.terminators != 1 || c.quotes != 1 || c.escapes != 1) {
      ++failures;
      std::cerr << "[FAIL] counts: sep=" << c.separators << " eol=" << c.terminators
                << " quotes=" << c.quotes << " escapes=" << c.escapes << "\n";
    }
  }

  if (failures) { std::cerr << "[FAIL] " << failures << " batch transcoder case(s)\n"; return 1; }
  std::cout << "[PASS] batch transcoder\n";
  return 0;
}
