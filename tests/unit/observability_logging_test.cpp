#include "internal/observability/logging.hpp"

#include <cassert>
#include <iostream>

namespace {

using uploader::observability::BoolField;
using uploader::observability::FormatLine;
using uploader::observability::IntField;
using uploader::observability::PercentField;
using uploader::observability::StringField;

void TestPlainFields() {
  assert(FormatLine("ledger batch committed", {}) == "ledger batch committed");
  assert(FormatLine("uploaded", {StringField("key", "IMAGE/a.jpg"), IntField("bytes", 42), BoolField("resumed", true)}) ==
         "uploaded key=IMAGE/a.jpg bytes=42 resumed=true");
}

void TestPercentHasOneDecimal() {
  assert(FormatLine("progress", {PercentField("percent", 12.5)}) == "progress percent=12.5");
  assert(FormatLine("progress", {PercentField("percent", 100.0)}) == "progress percent=100.0");
}

void TestValuesWithSpacesAreQuoted() {
  assert(FormatLine("relocated", {StringField("file", "a (1).jpg")}) == "relocated file=\"a (1).jpg\"");
  assert(FormatLine("failed", {StringField("error", "say \"no\"")}) == "failed error=\"say \\\"no\\\"\"");
  assert(FormatLine("x", {StringField("empty", "")}) == "x empty=\"\"");
}

} // namespace

int main() {
  TestPlainFields();
  TestPercentHasOneDecimal();
  TestValuesWithSpacesAreQuoted();
  std::cout << "order_uploader_unit_logging: pass\n";
  return 0;
}
