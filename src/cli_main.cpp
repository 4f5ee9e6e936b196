#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "walkforage/core/content_loader.h"
#include "walkforage/core/content_validation.h"
#include "walkforage/core/unlock_planner.h"
#include "walkforage/util/json.h"
#include "walkforage/util/log.h"
#include "walkforage/util/strings.h"

namespace {

#ifndef WALKFORAGE_VERSION
#define WALKFORAGE_VERSION "unknown"
#endif

std::string get_str_arg(int argc, char** argv, const std::string& key, const std::string& def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return argv[i + 1];
  }
  return def;
}

bool has_kv_arg(int argc, char** argv, const std::string& key) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return true;
  }
  return false;
}

bool has_flag(int argc, char** argv, const std::string& flag) {
  for (int i = 1; i < argc; ++i) {
    if (argv[i] == flag) return true;
  }
  return false;
}

walkforage::IdSet parse_unlocked(int argc, char** argv) {
  walkforage::IdSet out;
  for (auto& id : walkforage::split_list(get_str_arg(argc, argv, "--unlocked", ""))) out.insert(std::move(id));
  return out;
}

walkforage::json::Array to_json_array(const std::vector<std::string>& ids) {
  walkforage::json::Array out;
  for (const auto& id : ids) out.push_back(walkforage::json::Value(id));
  return out;
}

void print_usage(const char* exe) {
  std::cout << "WalkForage rules CLI v" << WALKFORAGE_VERSION << "\n\n";
  std::cout << "Usage: " << (exe ? exe : "walkforage_cli") << " [options]\n\n";
  std::cout << "Options:\n";
  std::cout << "  --content PATH      Content JSON (default: data/content/lithic_era.json)\n";
  std::cout << "  --validate-content  Validate the content file and exit (1 on errors)\n";
  std::cout << "  --list-techs        Print tech ids, eras and prerequisites, then exit\n";
  std::cout << "  --available         Print techs that can be unlocked next\n";
  std::cout << "  --closure ID        Print every direct and indirect requirement of a tech or craftable\n";
  std::cout << "  --plan TECH         Print the unlock order and total cost to reach TECH\n";
  std::cout << "    --unlocked A,B    Techs already unlocked (for --available and --plan)\n";
  std::cout << "  --json              Print --available / --closure / --plan results as JSON\n";
  std::cout << "  --log-level LEVEL   debug|info|warn|error|off (default: warn)\n";
  std::cout << "  --quiet             Suppress non-essential output\n";
  std::cout << "  -h, --help          Show this help\n";
  std::cout << "  --version           Print version and exit\n";
}

int run_validate(const std::string& content_path, bool quiet) {
  const auto tables = walkforage::load_content_tables_from_file(content_path);
  const auto issues = walkforage::validate_content_detailed(tables);

  int errors = 0;
  for (const auto& is : issues) {
    const bool err = is.severity == walkforage::ContentIssueSeverity::Error;
    if (err) ++errors;
    if (err || !quiet) {
      std::cerr << (err ? "  error: " : "  warning: ") << is.message << " [" << is.code << "]\n";
    }
  }
  if (errors > 0) {
    std::cerr << "Content validation failed with " << errors << " error(s)\n";
    return 1;
  }
  if (!quiet) std::cout << "Content OK (" << issues.size() << " warning(s))\n";
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  try {
    if (has_flag(argc, argv, "--version")) {
      std::cout << WALKFORAGE_VERSION << "\n";
      return 0;
    }
    if (has_flag(argc, argv, "--help") || has_flag(argc, argv, "-h")) {
      print_usage(argv[0]);
      return 0;
    }

    const std::string content_path = get_str_arg(argc, argv, "--content", "data/content/lithic_era.json");
    const bool quiet = has_flag(argc, argv, "--quiet");
    const bool as_json = has_flag(argc, argv, "--json");

    walkforage::log::set_level(walkforage::log::Level::Warn);
    if (has_kv_arg(argc, argv, "--log-level")) {
      const std::string raw = get_str_arg(argc, argv, "--log-level", "");
      walkforage::log::Level lvl = walkforage::log::Level::Warn;
      if (!walkforage::log::parse_level(raw, lvl)) {
        std::cerr << "Unknown --log-level: '" << raw << "'\n\n";
        print_usage(argv[0]);
        return 2;
      }
      walkforage::log::set_level(lvl);
    }
    if (quiet) walkforage::log::set_level(walkforage::log::Level::Error);

    if (has_flag(argc, argv, "--validate-content")) return run_validate(content_path, quiet);

    const auto content = walkforage::load_content_db_from_file(content_path);

    if (has_flag(argc, argv, "--list-techs")) {
      for (const auto& t : content->techs()) {
        std::cout << t.id << "  [" << t.era << "]";
        if (!t.prerequisites.empty()) std::cout << "  requires " << walkforage::join(t.prerequisites);
        std::cout << "\n";
      }
      return 0;
    }

    const walkforage::IdSet unlocked = parse_unlocked(argc, argv);

    if (has_flag(argc, argv, "--available")) {
      const auto ids = content->tech_graph().available_set(unlocked);
      if (as_json) {
        std::cout << walkforage::json::stringify(walkforage::json::Value(to_json_array(ids))) << "\n";
      } else {
        for (const auto& id : ids) std::cout << id << "\n";
      }
      return 0;
    }

    if (has_kv_arg(argc, argv, "--closure")) {
      const std::string id = get_str_arg(argc, argv, "--closure", "");
      const walkforage::DependencyGraph* graph = nullptr;
      if (content->find_tech(id)) {
        graph = &content->tech_graph();
      } else if (content->find_craftable(id)) {
        graph = &content->craftable_graph();
      }
      if (!graph) {
        std::cerr << "Unknown tech or craftable: '" << id << "'\n";
        return 2;
      }
      const auto ids = graph->transitive_closure(id);
      if (as_json) {
        std::cout << walkforage::json::stringify(walkforage::json::Value(to_json_array(ids))) << "\n";
      } else {
        for (const auto& p : ids) std::cout << p << "\n";
      }
      return 0;
    }

    if (has_kv_arg(argc, argv, "--plan")) {
      const std::string target = get_str_arg(argc, argv, "--plan", "");
      const auto res = walkforage::compute_unlock_plan(*content, unlocked, target);
      if (!res.ok()) {
        std::cerr << "Cannot plan '" << target << "':\n";
        for (const auto& e : res.errors) std::cerr << "  - " << e << "\n";
        return 1;
      }

      if (as_json) {
        walkforage::json::Object cost;
        for (const auto& c : res.plan.total_cost) cost[c.resource_type] = walkforage::json::Value(double(c.quantity));
        walkforage::json::Object o;
        o["target"] = walkforage::json::Value(target);
        o["techs"] = walkforage::json::Value(to_json_array(res.plan.tech_ids));
        o["total_cost"] = walkforage::json::Value(std::move(cost));
        std::cout << walkforage::json::stringify(walkforage::json::Value(std::move(o))) << "\n";
        return 0;
      }

      if (res.plan.tech_ids.empty()) {
        std::cout << "'" << target << "' is already unlocked\n";
        return 0;
      }
      for (std::size_t i = 0; i < res.plan.tech_ids.size(); ++i) {
        std::cout << (i + 1) << ". " << res.plan.tech_ids[i] << "\n";
      }
      std::vector<std::string> parts;
      for (const auto& c : res.plan.total_cost) parts.push_back(std::to_string(c.quantity) + " " + c.resource_type);
      std::cout << "Total cost: " << (parts.empty() ? "nothing" : walkforage::join(parts)) << "\n";
      return 0;
    }

    if (!quiet) {
      std::cout << "Loaded " << content->techs().size() << " techs and " << content->craftables().size()
                << " craftables from " << content_path << "\n";
      std::cout << "Run with --help for the available queries.\n";
    }
    return 0;
  } catch (const std::exception& e) {
    walkforage::log::error(std::string("Fatal: ") + e.what());
    return 1;
  }
}
