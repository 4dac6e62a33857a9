#include <doctest/doctest.h>

#include <algorithm>
#include <chrono>
#include <random>
#include <sstream>

#include "declutter/declutter.hh"
#include "declutter/report.hh"
#include "test_util.hh"

using namespace declutter;
using test_util::entry_of;
using test_util::quiet_config;
using test_util::record_of;
using test_util::temp_dir_t;

TEST_CASE("three identical files") {
  temp_dir_t dir("decide_three");
  std::ostringstream log;
  const auto config = quiet_config(log);

  file_entry_vec entries{entry_of(dir.write("c.txt", "same bytes"), 10),
                         entry_of(dir.write("a.txt", "same bytes"), 10),
                         entry_of(dir.write("b.txt", "same bytes"), 10)};
  const auto plan = decide(entries, config);

  REQUIRE(plan.entries.size() == 3);
  REQUIRE(plan.clusters.size() == 1);
  CHECK(plan.clusters[0].kind == cluster_kind_t::exact);
  CHECK(plan.clusters[0].solved);
  CHECK_FALSE(plan.truncated);

  const auto *a = plan.find(dir.path() / "a.txt");
  const auto *b = plan.find(dir.path() / "b.txt");
  const auto *c = plan.find(dir.path() / "c.txt");
  REQUIRE(a != nullptr);
  REQUIRE(b != nullptr);
  REQUIRE(c != nullptr);
  CHECK(a->action == action_t::keep);
  CHECK(a->representative);
  CHECK(b->action == action_t::remove);
  CHECK(c->action == action_t::remove);
  CHECK(b->cluster_id == plan.clusters[0].id);
  CHECK(plan.clusters[0].cost < config.redundancy_penalty);
}

TEST_CASE("stale singleton is archived without search") {
  temp_dir_t dir("decide_stale");
  std::ostringstream log;
  const auto config = quiet_config(log);

  const auto plan = decide({entry_of(dir.write("old.txt", "ancient"), 400),
                            entry_of(dir.write("new.txt", "fresh"), 2)},
                           config);
  CHECK(plan.clusters.empty());
  const auto *old_file = plan.find(dir.path() / "old.txt");
  REQUIRE(old_file != nullptr);
  CHECK(old_file->score.total > config.archive_threshold);
  CHECK(old_file->action == action_t::archive);
  CHECK_FALSE(old_file->cluster_id.has_value());
  CHECK(plan.find(dir.path() / "new.txt")->action == action_t::keep);
}

TEST_CASE("corrupted image joins its exact cluster") {
  temp_dir_t dir("decide_corrupt");
  std::ostringstream log;
  const auto config = quiet_config(log);

  const std::string junk = "\x89PNG\r\n\x1a\n truncated";
  const auto plan = decide({entry_of(dir.write("photo.png", junk), 30),
                            entry_of(dir.write("photo (1).png", junk), 20)},
                           config);
  REQUIRE(plan.clusters.size() == 1);
  CHECK(plan.clusters[0].kind == cluster_kind_t::exact);
  CHECK(plan.clusters[0].size == 2);
  // older copy survives
  CHECK(plan.find(dir.path() / "photo.png")->action == action_t::keep);
  CHECK(plan.find(dir.path() / "photo (1).png")->action == action_t::remove);
}

TEST_CASE("files that can not be verified are kept") {
  temp_dir_t dir("decide_errors");
  std::ostringstream log;
  const auto config = quiet_config(log);

  file_entry_vec entries{
      entry_of(dir.write("empty.tmp", ""), 900),
      file_entry_t(dir.path() / "vanished.tmp", 1024, test_util::days_ago(900)),
      entry_of(dir.write("present.tmp", "x"), 900)};
  const auto plan = decide(entries, config);

  REQUIRE(plan.entries.size() == 3);
  CHECK(plan.find(dir.path() / "empty.tmp")->action == action_t::keep);
  CHECK(plan.find(dir.path() / "empty.tmp")->error == scan_error_t::empty);
  CHECK(plan.find(dir.path() / "vanished.tmp")->action == action_t::keep);
  CHECK(plan.find(dir.path() / "vanished.tmp")->error ==
        scan_error_t::unreadable);
  CHECK(plan.find(dir.path() / "present.tmp")->action == action_t::archive);
  CHECK(plan.warnings.size() == 2);
  CHECK(plan.clusters.empty());

  // one warning per file, not one per stage
  std::size_t unreadable_lines = 0;
  for (auto pos = log.str().find("unreadable: "); pos != std::string::npos;
       pos = log.str().find("unreadable: ", pos + 1)) {
    ++unreadable_lines;
  }
  CHECK(unreadable_lines == 1);
}

TEST_CASE("same input gives the same plan") {
  temp_dir_t dir("decide_determinism");
  std::ostringstream log;
  const auto config = quiet_config(log);

  file_entry_vec entries;
  for (auto i = 0; i < 12; ++i) {
    entries.push_back(entry_of(
        dir.write("tmp/f" + std::to_string(i) + ".bin",
                  "payload " + std::to_string(i % 4)),
        i * 40));
  }
  const auto first = decide(entries, config);
  std::reverse(entries.begin(), entries.end());
  const auto second = decide(entries, config);

  REQUIRE(first.entries.size() == second.entries.size());
  for (std::size_t i = 0; i < first.entries.size(); ++i) {
    CHECK(first.entries[i].path == second.entries[i].path);
    CHECK(first.entries[i].action == second.entries[i].action);
    CHECK(first.entries[i].score.total == second.entries[i].score.total);
    CHECK(first.entries[i].cluster_id == second.entries[i].cluster_id);
  }
  CHECK(first.clusters.size() == 4);
}

TEST_CASE("budgets truncate the plan") {
  temp_dir_t dir("decide_budget");
  std::ostringstream log;
  auto config = quiet_config(log);

  file_entry_vec entries;
  for (auto i = 0; i < 5; ++i) {
    entries.push_back(
        entry_of(dir.write("f" + std::to_string(i), std::to_string(i)), 1));
  }

  SUBCASE("max files") {
    config.max_files = 2;
    const auto plan = decide(entries, config);
    CHECK(plan.truncated);
    REQUIRE(plan.entries.size() == 2);
    CHECK(plan.entries[0].path == dir.path() / "f0");
    CHECK(plan.entries[1].path == dir.path() / "f1");
  }
  SUBCASE("time budget") {
    config.time_budget = std::chrono::milliseconds(0);
    const auto plan = decide(entries, config);
    CHECK(plan.truncated);
    CHECK(plan.entries.empty());
  }
}

TEST_CASE("failed cluster search keeps every member") {
  std::ostringstream log;
  auto config = quiet_config(log);
  config.max_expansions = 0;

  const file_record_vec records{record_of("/f/a", 1, 10),
                                record_of("/f/b", 1, 10),
                                record_of("/f/old", 2, 500)};
  const auto plan = decide_records(records, config);

  REQUIRE(plan.clusters.size() == 1);
  CHECK_FALSE(plan.clusters[0].solved);
  CHECK(plan.find("/f/a")->action == action_t::keep);
  CHECK(plan.find("/f/b")->action == action_t::keep);
  // singletons are unaffected
  CHECK(plan.find("/f/old")->action == action_t::archive);
  CHECK(plan.warnings.size() == 1);
  CHECK(log.str().find("[err] cluster 0") != std::string::npos);
}

TEST_CASE("every cluster keeps a copy") {
  std::ostringstream log;
  const auto config = quiet_config(log);
  std::mt19937_64 rng(7);

  file_record_vec records;
  for (auto i = 0; i < 120; ++i) {
    const auto dir = (i % 3 == 0) ? "/r/tmp/" : "/r/";
    const std::optional<uint64_t> phash =
        i % 2 == 0 ? std::optional<uint64_t>(rng() % 4) : std::nullopt;
    records.push_back(record_of(dir + std::to_string(i) + ".jpg",
                                (uint8_t)(rng() % 30), (double)(rng() % 800),
                                phash));
  }
  const auto plan = decide_records(records, config);
  REQUIRE(plan.entries.size() == records.size());
  REQUIRE_FALSE(plan.clusters.empty());

  auto kept_in = [&](const uint32_t id) {
    std::size_t kept = 0;
    for (const auto &entry : plan.entries) {
      if (entry.cluster_id == id && entry.action == action_t::keep) {
        ++kept;
      }
    }
    return kept;
  };
  for (const auto &summary : plan.clusters) {
    CHECK(summary.solved);
    if (summary.anchors.empty()) {
      CHECK(kept_in(summary.id) >= 1);
      continue;
    }
    // an anchored near cluster relies on its exact clusters
    CHECK(summary.kind == cluster_kind_t::near);
    for (auto anchor : summary.anchors) {
      CHECK(anchor < summary.id);
      CHECK(kept_in(anchor) >= 1);
    }
  }
}

TEST_CASE("resized copy of a duplicated photo is scored as near duplicate") {
  std::ostringstream log;
  const auto config = quiet_config(log);
  const file_record_vec records{record_of("/p/a.jpg", 1, 30, 0x0ULL),
                                record_of("/p/b.jpg", 1, 20, 0x0ULL),
                                record_of("/p/a_small.jpg", 2, 10, 0x1ULL)};
  const auto plan = decide_records(records, config);

  REQUIRE(plan.clusters.size() == 2);
  CHECK(plan.clusters[1].anchors == std::vector<uint32_t>{0});
  const auto *small = plan.find("/p/a_small.jpg");
  REQUIRE(small != nullptr);
  CHECK(small->cluster_kind == cluster_kind_t::near);
  CHECK_FALSE(small->representative);
  CHECK(small->score.duplication == doctest::Approx(2.0));
  // a.jpg is the surviving copy of the photo
  CHECK(plan.find("/p/a.jpg")->action == action_t::keep);
  CHECK(plan.find("/p/a.jpg")->representative);
}

TEST_CASE("rule recommendation is reported beside the search") {
  std::ostringstream log;
  auto config = quiet_config(log);
  const file_record_vec records{record_of("/r/a", 1, 1),
                                record_of("/r/b", 1, 1),
                                record_of("/r/old", 2, 400),
                                record_of("/r/new", 3, 1)};
  const auto plan = decide_records(records, config);

  // exact copy: score 5 archives by rules, search deletes it
  const auto *copy = plan.find("/r/b");
  REQUIRE(copy != nullptr);
  CHECK(copy->action == action_t::remove);
  CHECK(copy->rule_action == action_t::archive);
  CHECK(agreement(*copy) == "disagree");

  // stale singleton: score 3 archives both ways
  const auto *old_file = plan.find("/r/old");
  CHECK(old_file->action == action_t::archive);
  CHECK(old_file->rule_action == action_t::archive);
  CHECK(agreement(*old_file) == "agree_action");

  const auto *fresh = plan.find("/r/new");
  CHECK(fresh->rule_action == action_t::keep);
  CHECK(agreement(*fresh) == "");
  CHECK(plan.disagreements() == 1);

  SUBCASE("thresholds come from the configuration") {
    config.rule_delete_score = 4.0;
    const auto strict = decide_records(records, config);
    CHECK(strict.find("/r/b")->rule_action == action_t::remove);
    CHECK(agreement(*strict.find("/r/b")) == "agree_action");
  }

  std::ostringstream csv;
  write_csv(plan, csv);
  CHECK(csv.str().find(",rule_action,agreement\n") != std::string::npos);
  CHECK(csv.str().find("/r/b,100,1.0,delete,") != std::string::npos);
  CHECK(csv.str().find(",none,archive,disagree\n") != std::string::npos);
  CHECK(csv.str().find(",none,archive,agree_action\n") != std::string::npos);

  std::ostringstream summary;
  write_summary(plan, summary);
  CHECK(summary.str().find("rules disagree: 1 files") != std::string::npos);
}

TEST_CASE("csv report ranks by score") {
  std::ostringstream log;
  const auto config = quiet_config(log);
  const file_record_vec records{record_of("/c/fresh", 1, 1),
                                record_of("/c/old, dusty", 2, 400),
                                record_of("/c/copy", 1, 1)};
  const auto plan = decide_records(records, config);

  std::ostringstream csv;
  write_csv(plan, csv);
  std::istringstream lines(csv.str());
  std::string header, first, second, third;
  std::getline(lines, header);
  std::getline(lines, first);
  std::getline(lines, second);
  std::getline(lines, third);

  CHECK(header.rfind("path,size,age_days,action,score", 0) == 0);
  // /c/copy is the shorter path and survives
  CHECK(first.rfind("/c/fresh,100,", 0) == 0);
  CHECK(first.find(",delete,") != std::string::npos);
  CHECK(second.rfind("\"/c/old, dusty\",100,400.0,archive,", 0) == 0);
  CHECK(third.find(",keep,") != std::string::npos);
  CHECK(third.find(",exact,yes,") != std::string::npos);

  std::ostringstream summary;
  write_summary(plan, summary);
  CHECK(summary.str().find("archive: 1 files, 100.0B") != std::string::npos);
}
