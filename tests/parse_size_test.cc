#include <doctest/doctest.h>

#include <stdexcept>

#include "declutter/parse_size.hh"

using declutter::utils::human_size;
using declutter::utils::parse_size;

TEST_CASE("parse_size") {
  CHECK(parse_size("512") == 512);
  CHECK(parse_size("512B") == 512);
  CHECK(parse_size("4K") == 4000);
  CHECK(parse_size("4k") == 4000);
  CHECK(parse_size("4KiB") == 4096);
  CHECK(parse_size("1GiB") == 1024ULL * 1024ULL * 1024ULL);
  CHECK(parse_size("100MB") == 100000000ULL);
  CHECK(parse_size("16Mib") == 2ULL * 1024ULL * 1024ULL);
  CHECK(parse_size("8b") == 1);

  CHECK_THROWS_AS(parse_size(""), std::invalid_argument);
  CHECK_THROWS_AS(parse_size("K"), std::invalid_argument);
  CHECK_THROWS_AS(parse_size("4X"), std::invalid_argument);
  CHECK_THROWS_AS(parse_size("4iB"), std::invalid_argument);
  CHECK_THROWS_AS(parse_size("4KiBx"), std::invalid_argument);
  CHECK_THROWS_AS(parse_size("99999999999999999999"), std::invalid_argument);
  CHECK_THROWS_AS(parse_size("20000000EiB"), std::invalid_argument);
}

TEST_CASE("human_size") {
  CHECK(human_size(0) == "0.0B");
  CHECK(human_size(1536) == "1.5KiB");
  CHECK(human_size(3ULL << 30U) == "3.0GiB");
}
