#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include "dedup_index.hh"
#include "oss.hh"

using namespace std::literals;

namespace {

constexpr auto usage =
    "usage: undup -d database [-r root] [-e exclude_regex] [-j jobs] [--md5] "
    "[--migrate] [--vacuum] [--link] [--dedup dupdir [--symlink] "
    "[-n/--dry-run]] [-p/--print] [-l logfile] [-h/--help]";

void print_duplicates(undup::dedup_index_t& index) {
  for (const auto& checksum : index.duplicate_checksums()) {
    std::cout << "----\n";
    auto cursor = index.find_duplicates(checksum);
    while (auto rec = cursor.next()) {
      std::cout << rec->path() << (rec->linked() ? " (linked)" : "") << '\n';
    }
  }
  std::cout << "----\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  std::optional<std::filesystem::path> database;
  std::optional<std::filesystem::path> root;
  std::optional<std::filesystem::path> dupdir;
  std::optional<std::filesystem::path> logfile;
  std::vector<std::regex> exclude_regex;
  uint32_t max_thread = undup::default_threads;
  undup::index_options_t options;
  bool migrate = false;
  bool vacuum = false;
  bool link = false;
  bool symlink = false;
  bool dry_run = false;
  bool print_out = false;

  for (int i = 1; i < argc; ++i) {
    if (argv[i] == "-d"sv) {
      ++i;
      if (i >= argc) {
        std::cerr << "missing database" << std::endl;
        return 1;
      }
      database = argv[i];
    } else if (argv[i] == "-r"sv) {
      ++i;
      if (i >= argc) {
        std::cerr << "missing root" << std::endl;
        return 1;
      }
      root = argv[i];
    } else if (argv[i] == "-e"sv) {
      ++i;
      if (i >= argc) {
        std::cerr << "missing exclude_regex" << std::endl;
        return 1;
      }
      try {
        exclude_regex.emplace_back(argv[i]);
      } catch (const std::regex_error& e) {
        std::cerr << "invalid exclude_regex: " << argv[i] << std::endl;
        return 1;
      }
    } else if (argv[i] == "-j"sv) {
      ++i;
      if (i >= argc) {
        std::cerr << "missing max_thread" << std::endl;
        return 1;
      }
      try {
        max_thread = (uint32_t)std::stoi(argv[i]);
      } catch (const std::logic_error& e) {
        std::cerr << "invalid jobs: " << argv[i] << std::endl;
        return 1;
      }
      if (max_thread == 0 || max_thread > 256) {
        std::cerr << "jobs must be > 0 and <= 256" << std::endl;
        return 1;
      }
    } else if (argv[i] == "--md5"sv) {
      options.digest = "md5";
    } else if (argv[i] == "--migrate"sv) {
      migrate = true;
    } else if (argv[i] == "--vacuum"sv) {
      vacuum = true;
    } else if (argv[i] == "--link"sv) {
      link = true;
    } else if (argv[i] == "--dedup"sv) {
      ++i;
      if (i >= argc) {
        std::cerr << "missing dupdir" << std::endl;
        return 1;
      }
      dupdir = argv[i];
    } else if (argv[i] == "--symlink"sv) {
      symlink = true;
    } else if (argv[i] == "-n"sv || argv[i] == "--dry-run"sv) {
      dry_run = true;
    } else if (argv[i] == "-p"sv || argv[i] == "--print"sv) {
      print_out = true;
    } else if (argv[i] == "-l"sv) {
      ++i;
      if (i >= argc) {
        std::cerr << "missing logfile" << std::endl;
        return 1;
      }
      logfile = argv[i];
    } else if (argv[i] == "-h"sv || argv[i] == "--help"sv) {
      std::cerr << usage << std::endl;
      return 0;
    } else {
      std::cerr << "unknown option: " << argv[i] << std::endl;
      return 1;
    }
  }

  if (!database) {
    std::cerr << usage << std::endl;
    return 1;
  }
  if ((symlink || dry_run) && !dupdir) {
    std::cerr << "--symlink and --dry-run need --dedup" << std::endl;
    return 1;
  }

  std::ofstream log_file;
  if (logfile) {
    log_file.open(*logfile, std::ios::app);
    if (!log_file) {
      std::cerr << "cannot open logfile: " << *logfile << std::endl;
      return 1;
    }
    undup::set_log_stream(log_file);
  }

  int ret = 0;
  try {
    // only a scan may create a new store
    options.create_if_missing = root.has_value();
    undup::dedup_index_t index(*database, options);

    if (migrate) {
      index.migrate_schema();
    }
    if (vacuum) {
      index.vacuum();
    }
    if (root) {
      index.rescan(*root, exclude_regex, max_thread);
    }
    if (link) {
      for (const auto& checksum : index.duplicate_checksums()) {
        index.link_duplicates(checksum);
      }
    }
    if (dupdir) {
      const auto action = dry_run   ? undup::dup_action_t::log
                          : symlink ? undup::dup_action_t::move_symlink
                                    : undup::dup_action_t::move;
      index.relocate_duplicates(*dupdir, action);
    }
    if (print_out) {
      print_duplicates(index);
    }
  } catch (const std::exception& e) {
    undup::oss(undup::log_stream()) << "[err] " << e.what() << '\n';
    ret = 1;
  }

  // the log stream must not outlive log_file
  undup::set_log_stream(std::cerr);
  return ret;
}
