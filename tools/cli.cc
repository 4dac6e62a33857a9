#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <regex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "declutter/config.hh"
#include "declutter/declutter.hh"
#include "declutter/ls_dir_rec.hh"
#include "declutter/parse_size.hh"
#include "declutter/report.hh"

using namespace std::literals;

namespace {

constexpr auto usage =
    "usage: [-i search_dir]... [-e exclude_regex]... [-j jobs] [-o report.csv]\n"
    "       [--stale-days days] [--max-files n] [--time-budget ms]\n"
    "       [--similarity distance] [--large size] [--digest algo] "
    "[-h/--help]";

}  // namespace

int main(int argc, char* argv[]) {
  std::vector<std::filesystem::path> search_dir;
  std::vector<std::regex> exclude_regex;
  std::string report_path;
  declutter::config_t config;
  config.max_thread = 8;

  // value of the current option, nullptr if missing
  auto next = [&](int& i) -> const char* {
    ++i;
    if (i >= argc) {
      std::cerr << "missing value for " << argv[i - 1] << std::endl;
      return nullptr;
    }
    return argv[i];
  };

  try {
    for (int i = 1; i < argc; ++i) {
      const std::string_view opt = argv[i];
      if (opt == "-h"sv || opt == "--help"sv) {
        std::cerr << usage << std::endl;
        return 0;
      }
      const char* val = next(i);
      if (val == nullptr) {
        return 1;
      }
      if (opt == "-i"sv) {
        search_dir.emplace_back(val);
      } else if (opt == "-e"sv) {
        try {
          exclude_regex.emplace_back(val);
        } catch (const std::regex_error&) {
          std::cerr << "invalid exclude_regex: " << val << std::endl;
          return 1;
        }
      } else if (opt == "-j"sv) {
        config.max_thread = (uint32_t)std::stoi(val);
        if (config.max_thread == 0 || config.max_thread > 256) {
          std::cerr << "jobs must be > 0 and <= 256" << std::endl;
          return 1;
        }
      } else if (opt == "-o"sv) {
        report_path = val;
      } else if (opt == "--stale-days"sv) {
        config.stale_days = std::stod(val);
      } else if (opt == "--max-files"sv) {
        config.max_files = (std::size_t)std::stoull(val);
      } else if (opt == "--time-budget"sv) {
        config.time_budget = std::chrono::milliseconds(std::stoll(val));
      } else if (opt == "--similarity"sv) {
        const auto distance = std::stoi(val);
        if (distance < 0 || distance > 64) {
          std::cerr << "similarity must be >= 0 and <= 64" << std::endl;
          return 1;
        }
        config.similarity_threshold = (uint32_t)distance;
      } else if (opt == "--large"sv) {
        config.large_file_bytes = declutter::utils::parse_size(val);
      } else if (opt == "--digest"sv) {
        config.digest_algo = val;
      } else {
        std::cerr << "unknown option: " << opt << std::endl;
        return 1;
      }
    }
  } catch (const std::logic_error& e) {
    // std::invalid_argument and std::out_of_range from the number parsers
    std::cerr << "invalid argument: " << e.what() << std::endl;
    return 1;
  }
  if (search_dir.empty()) {
    std::cerr << usage << std::endl;
    return 1;
  }

  try {
    auto entries = declutter::list_files(search_dir, exclude_regex,
                                         config.max_thread, std::cerr);
    const auto plan = declutter::decide(std::move(entries), config);

    if (report_path.empty()) {
      declutter::write_csv(plan, std::cout);
    } else {
      std::ofstream report(report_path, std::ios::out | std::ios::trunc);
      if (!report.is_open() || !report.good()) {
        std::cerr << "Error opening report: " << report_path << std::endl;
        return 1;
      }
      declutter::write_csv(plan, report);
      std::cerr << "[log] report written to: " << report_path << std::endl;
    }
    declutter::write_summary(plan, std::cerr);
    for (const auto& warning : plan.warnings) {
      std::cerr << "[warn] " << warning << '\n';
    }
  } catch (const std::exception& e) {
    std::cerr << "[err] " << e.what() << std::endl;
    return 1;
  }
}
