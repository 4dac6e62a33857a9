#include <doctest/doctest.h>

#include <stdexcept>

#include "declutter/score.hh"
#include "test_util.hh"

using namespace declutter;
using test_util::record_of;
using test_util::ref_now;

namespace {

score_t score_one(const file_record_t &record,
                  std::optional<cluster_kind_t> kind = std::nullopt,
                  bool representative = false) {
  const config_t config;
  return evaluate(default_rules(config),
                  score_context_t{record, kind, representative, ref_now});
}

}  // namespace

TEST_CASE("age contribution grows until the stale threshold") {
  const auto fresh = score_one(record_of("/h/a", 1, 0));
  const auto month = score_one(record_of("/h/a", 1, 30));
  const auto half = score_one(record_of("/h/a", 1, 90));
  const auto stale = score_one(record_of("/h/a", 1, 180));
  const auto ancient = score_one(record_of("/h/a", 1, 400));

  CHECK(fresh.age == doctest::Approx(0.0));
  CHECK(month.age < half.age);
  CHECK(half.age == doctest::Approx(1.5));
  CHECK(stale.age == doctest::Approx(3.0));
  CHECK(ancient.age == doctest::Approx(3.0));
  CHECK(ancient.total == doctest::Approx(3.0));
}

TEST_CASE("files from the future count as new") {
  CHECK(score_one(record_of("/h/a", 1, -5)).age == doctest::Approx(0.0));
}

TEST_CASE("duplication contribution by membership") {
  const auto rec = record_of("/h/a", 1, 0);
  const auto none = score_one(rec);
  const auto rep = score_one(rec, cluster_kind_t::exact, true);
  const auto near = score_one(rec, cluster_kind_t::near);
  const auto exact = score_one(rec, cluster_kind_t::exact);

  CHECK(none.duplication == doctest::Approx(0.0));
  CHECK(rep.duplication > 0.0);
  CHECK(near.duplication > rep.duplication);
  CHECK(exact.duplication > near.duplication);
}

TEST_CASE("location and size rules") {
  CHECK(score_one(record_of("/home/u/Temp/setup.bin", 1, 0)).location ==
        doctest::Approx(2.0));
  CHECK(score_one(record_of("/home/u/dl/movie.part", 1, 0)).location ==
        doctest::Approx(1.5));
  CHECK(score_one(record_of("/home/u/dl/report.DOCX", 1, 0)).location ==
        doctest::Approx(-5.0));
  CHECK(score_one(record_of("/home/u/tmp.txt", 1, 0)).location ==
        doctest::Approx(0.0));

  const auto big = score_one(
      record_of("/home/u/disk.img", 1, 0, std::nullopt, 2ULL << 30U));
  CHECK(big.location == doctest::Approx(1.5));
  CHECK(big.total == doctest::Approx(big.age + big.duplication + big.location));
}

TEST_CASE("custom rule sets") {
  const rule_vec rules{size_rule_t{10, 4.0},
                       path_rule_t{path_rule_t::match_t::directory, {"old"}, 1.0},
                       age_rule_t{2.0, 10.0}};
  const auto rec = record_of("/x/OLD/y/file", 1, 20, std::nullopt, 10);
  const auto score = evaluate(rules, score_context_t{rec, {}, false, ref_now});
  CHECK(score.location == doctest::Approx(5.0));
  CHECK(score.age == doctest::Approx(2.0));
  CHECK(score.duplication == doctest::Approx(0.0));
  CHECK(score.total == doctest::Approx(7.0));
}

TEST_CASE("score_records is deterministic and needs a reference time") {
  const file_record_vec records{record_of("/s/a", 1, 10),
                                record_of("/s/b", 1, 20),
                                record_of("/s/c", 2, 300)};
  config_t config;
  cluster_vec clusters(1);
  clusters[0].members = {0, 1};
  clusters[0].representative = 1;

  CHECK_THROWS_AS(
      score_records(records, clusters, default_rules(config), config),
      std::invalid_argument);

  config.now = ref_now;
  const auto first =
      score_records(records, clusters, default_rules(config), config);
  const auto second =
      score_records(records, clusters, default_rules(config), config);
  REQUIRE(first.size() == 3);
  for (std::size_t i = 0; i < first.size(); ++i) {
    CHECK(first[i].total == second[i].total);
  }
  CHECK(first[0].duplication == doctest::Approx(5.0));
  CHECK(first[1].duplication == doctest::Approx(1.0));
  CHECK(first[2].duplication == doctest::Approx(0.0));
}
