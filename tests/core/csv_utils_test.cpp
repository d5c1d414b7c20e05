#include "core/csv_utils.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

using namespace glancelab::core::csv;

TEST_CASE("CSV quoting only wraps fields that need it", "[core][csv]") {
  REQUIRE(QuoteField("C4") == "C4");
  REQUIRE(QuoteField("a,b") == "\"a,b\"");
  REQUIRE(QuoteField("say \"hi\"") == "\"say \"\"hi\"\"\"");
  REQUIRE(QuoteField("two\nlines") == "\"two\nlines\"");
}

TEST_CASE("CSV reader follows quoted fields across lines", "[core][csv]") {
  std::istringstream input("id,title\n1,\"first, second\"\n2,\"multi\nline\"\n");
  std::vector<std::string> fields;
  bool has_record = false;
  std::size_t line_number = 0;
  std::string error;

  REQUIRE(ReadRecord(input, fields, has_record, line_number, error));
  REQUIRE(has_record);
  REQUIRE(fields == std::vector<std::string>{"id", "title"});

  REQUIRE(ReadRecord(input, fields, has_record, line_number, error));
  REQUIRE(fields == std::vector<std::string>{"1", "first, second"});
  REQUIRE(line_number == 2U);

  REQUIRE(ReadRecord(input, fields, has_record, line_number, error));
  REQUIRE(fields == std::vector<std::string>{"2", "multi\nline"});
  REQUIRE(line_number == 4U);

  REQUIRE(ReadRecord(input, fields, has_record, line_number, error));
  REQUIRE_FALSE(has_record);
}

TEST_CASE("CSV reader rejects an unterminated quoted field", "[core][csv]") {
  std::istringstream input("1,\"never closed\n");
  std::vector<std::string> fields;
  bool has_record = false;
  std::size_t line_number = 0;
  std::string error;
  REQUIRE_FALSE(ReadRecord(input, fields, has_record, line_number, error));
  REQUIRE(error.find("unterminated") != std::string::npos);
}

TEST_CASE("CSV numeric parsing is strict", "[core][csv]") {
  double value = 0.0;
  REQUIRE(ParseDouble("0.1250", value));
  REQUIRE(value == 0.125);
  REQUIRE_FALSE(ParseDouble("", value));
  REQUIRE_FALSE(ParseDouble("1.5x", value));
  REQUIRE_FALSE(ParseDouble("nan", value));
  REQUIRE_FALSE(ParseDouble("inf", value));
  REQUIRE_FALSE(ParseDouble("-infinity", value));
  REQUIRE_FALSE(ParseDouble("1e400", value));
  REQUIRE(ParseDouble("1e30", value));

  std::int64_t integer = 0;
  REQUIRE(ParseInt64("-42", integer));
  REQUIRE(integer == -42);
  REQUIRE_FALSE(ParseInt64("4.2", integer));
}
