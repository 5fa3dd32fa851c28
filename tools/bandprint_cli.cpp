/// @file bandprint_cli.cpp
/// @brief Command-line interface for bandprint fingerprinting and take matching.

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "bandprint.h"

using namespace bandprint;
using json = nlohmann::json;
namespace fs = std::filesystem;

// ============================================================================
// CLI Arguments
// ============================================================================

struct CliArgs {
  std::string command;
  std::vector<std::string> inputs;
  bool json_output = false;
  bool quiet = false;
  bool verbose = false;
  bool help = false;

  std::map<std::string, std::string> options;

  bool has(const std::string& k) const { return options.count(k) > 0; }

  std::string get_string(const std::string& k, const std::string& def = "") const {
    auto it = options.find(k);
    return it != options.end() ? it->second : def;
  }

  float get_float(const std::string& k, float def) const {
    auto it = options.find(k);
    return it != options.end() ? std::stof(it->second) : def;
  }

  int get_int(const std::string& k, int def) const {
    auto it = options.find(k);
    return it != options.end() ? std::stoi(it->second) : def;
  }
};

// ============================================================================
// Argument Parser
// ============================================================================

class ArgParser {
 public:
  static CliArgs parse(int argc, char* argv[]) {
    CliArgs args;
    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];
      if (arg == "--help" || arg == "-h") {
        args.help = true;
      } else if (arg == "--json") {
        args.json_output = true;
      } else if (arg == "--quiet" || arg == "-q") {
        args.quiet = true;
      } else if (arg == "--verbose" || arg == "-v") {
        args.verbose = true;
      } else if (arg.size() > 2 && arg.compare(0, 2, "--") == 0) {
        parse_option(args, arg.substr(2), argv, i, argc);
      } else if (args.command.empty()) {
        args.command = arg;
      } else {
        args.inputs.push_back(arg);
      }
    }
    return args;
  }

 private:
  static void parse_option(CliArgs& args, const std::string& key, char* argv[], int& i, int argc) {
    static const std::vector<std::string> bool_flags = {"recursive", "exclude-self", "prune"};
    if (std::find(bool_flags.begin(), bool_flags.end(), key) != bool_flags.end()) {
      args.options[key] = "true";
      return;
    }
    if (i + 1 < argc) {
      args.options[key] = argv[++i];
      return;
    }
    args.options[key] = "true";
  }
};

// ============================================================================
// Settings
// ============================================================================

/// @brief Applies an optional JSON settings file to the service configuration.
/// @details Missing or malformed files are logged and ignored.
void apply_settings_file(const std::string& path, ServiceConfig& config) {
  std::ifstream in(path);
  if (!in.is_open()) {
    spdlog::warn("Settings file {} not found; using defaults", path);
    return;
  }
  try {
    json settings = json::parse(in);
    if (settings.contains("algorithm")) {
      config.default_algorithm = parse_algorithm(settings.at("algorithm").get<std::string>());
    }
    if (settings.contains("threshold")) {
      config.match.threshold = clamp_threshold(settings.at("threshold").get<float>());
    }
    if (settings.contains("reference_weight")) {
      config.match.reference_weight = settings.at("reference_weight").get<float>();
    }
    if (settings.contains("workers")) {
      config.generation.num_workers = settings.at("workers").get<int>();
      config.match.num_threads = GenerationCoordinator::resolve_workers(config.generation.num_workers);
    }
    if (settings.contains("checkpoint_interval")) {
      config.generation.checkpoint_interval = settings.at("checkpoint_interval").get<int>();
    }
  } catch (const json::exception& e) {
    spdlog::warn("Ignoring malformed settings file {}: {}", path, e.what());
  } catch (const BandprintException& e) {
    spdlog::warn("Ignoring settings file {}: {}", path, e.what());
  }
}

/// @brief Builds the service configuration from settings file and flags.
ServiceConfig build_config(const CliArgs& args) {
  ServiceConfig config;
  if (args.has("config")) {
    apply_settings_file(args.get_string("config"), config);
  }
  if (args.has("algorithm")) {
    config.default_algorithm = parse_algorithm(args.get_string("algorithm"));
  }
  if (args.has("threshold")) {
    config.match.threshold = clamp_threshold(args.get_float("threshold", config.match.threshold));
  }
  if (args.has("reference-weight")) {
    config.match.reference_weight = args.get_float("reference-weight", 1.5f);
  }
  if (args.has("workers")) {
    config.generation.num_workers = args.get_int("workers", 0);
    config.match.num_threads = GenerationCoordinator::resolve_workers(config.generation.num_workers);
  }
  if (args.has("checkpoint")) {
    config.generation.checkpoint_interval = args.get_int("checkpoint", 0);
  }
  config.match.include_self = !args.has("exclude-self");
  if (args.has("limit")) {
    config.match.max_results = args.get_int("limit", 0);
  }
  return config;
}

// ============================================================================
// Output Helpers
// ============================================================================

void print_json(const json& j) { std::cout << j.dump(2) << "\n"; }

void clear_progress() { std::cerr << "\r                                                  \r"; }

json folder_info_json(const FolderInfo& info) {
  json coverage = json::object();
  for (const auto& [algorithm, count] : info.coverage) {
    coverage[algorithm_id(algorithm)] = count;
  }
  return {{"folder", info.folder},
          {"total_files", info.total_files},
          {"coverage", coverage},
          {"excluded_count", info.excluded_count},
          {"excluded_files", info.excluded_files},
          {"is_reference_folder", info.is_reference_folder},
          {"ignore_fingerprints", info.ignore_fingerprints}};
}

// ============================================================================
// Command Handler Type
// ============================================================================

using CommandHandler = std::function<int(const CliArgs&, const FingerprintService&)>;

// ============================================================================
// Command Implementations
// ============================================================================

int cmd_version(const CliArgs& args) {
  if (args.json_output) {
    print_json({{"cli_version", "1.0.0"}, {"lib_version", version()}});
  } else {
    std::cout << "bandprint version " << version() << "\n";
  }
  return 0;
}

int cmd_algorithms(const CliArgs& args, const FingerprintService& service) {
  if (args.json_output) {
    json list = json::array();
    for (const auto& info : service.algorithms()) {
      list.push_back({{"id", info.id}, {"name", info.name}, {"description", info.description},
                      {"default", info.algorithm == service.config().default_algorithm}});
    }
    print_json(list);
  } else {
    for (const auto& info : service.algorithms()) {
      std::printf("  %-12s %-20s %s\n", info.id, info.name, info.description);
    }
  }
  return 0;
}

int cmd_generate(const CliArgs& args, const FingerprintService& service) {
  const SignatureAlgorithm algorithm = service.config().default_algorithm;
  const bool recursive = args.has("recursive");

  GenerationRequest request;
  request.algorithm = algorithm;
  request.recursive = recursive;
  for (const auto& input : args.inputs) {
    std::error_code ec;
    if (fs::is_directory(input, ec)) {
      request.folders.push_back(input);
    } else {
      request.files.push_back(input);
    }
  }

  const bool show_progress = !args.quiet && !args.json_output;
  GenerationCoordinator coordinator(service.config().generation);
  coordinator.start(std::move(request), [show_progress](const GenerationProgress& p) {
    if (show_progress) {
      std::cerr << "\rFingerprinting " << p.completed << "/" << p.total << std::flush;
    }
  });
  GenerationResult result = coordinator.wait();
  if (show_progress) clear_progress();

  if (args.json_output) {
    json failures = json::array();
    for (const auto& f : result.failures) {
      failures.push_back({{"path", f.path}, {"code", error_code_name(f.code)}, {"reason", f.reason}});
    }
    json out = {{"algorithm", algorithm_id(result.algorithm)},
                {"succeeded", result.succeeded},
                {"failed", result.failed},
                {"skipped", result.skipped},
                {"cancelled", result.cancelled},
                {"failures", failures}};
    if (!result.ok()) {
      out["error"] = {{"code", error_code_name(result.error)}, {"message", result.error_message}};
    }
    print_json(out);
  } else {
    std::cout << "Algorithm: " << algorithm_info(result.algorithm).name << "\n"
              << "Succeeded: " << result.succeeded << "\n"
              << "Failed:    " << result.failed << "\n"
              << "Skipped:   " << result.skipped << "\n";
    for (const auto& f : result.failures) {
      std::cout << "  " << f.path << ": " << f.reason << "\n";
    }
    if (!result.ok()) {
      std::cerr << "Error: " << result.error_message << "\n";
    }
  }
  return result.ok() ? 0 : 1;
}

int cmd_info(const CliArgs& args, const FingerprintService& service) {
  FolderInfo info = service.get_info(args.inputs.front());
  if (args.json_output) {
    print_json(folder_info_json(info));
    return 0;
  }
  std::cout << "Folder:     " << info.folder << "\n"
            << "Files:      " << info.total_files << "\n"
            << "Reference:  " << (info.is_reference_folder ? "yes" : "no") << "\n"
            << "Ignored:    " << (info.ignore_fingerprints ? "yes" : "no") << "\n"
            << "Excluded:   " << info.excluded_count << "\n"
            << "Coverage:\n";
  for (const auto& [algorithm, count] : info.coverage) {
    std::printf("  %-12s %d/%d\n", algorithm_id(algorithm), count, info.total_files);
  }
  return 0;
}

int cmd_match(const CliArgs& args, const FingerprintService& service) {
  const std::string query = args.inputs.front();
  std::vector<std::string> folders(args.inputs.begin() + 1, args.inputs.end());
  if (folders.empty()) {
    folders.push_back(fs::path(query).has_parent_path() ? fs::path(query).parent_path().string()
                                                        : ".");
  }
  if (args.has("recursive")) {
    std::vector<std::string> expanded;
    for (const auto& folder : folders) {
      auto found = service.discover_folders(folder);
      expanded.insert(expanded.end(), found.begin(), found.end());
    }
    folders = expanded;
  }

  const auto& config = service.config();
  std::vector<MatchResult> matches =
      service.find_matches(query, folders, config.default_algorithm, config.match.threshold);

  if (args.json_output) {
    json list = json::array();
    for (const auto& m : matches) {
      list.push_back({{"candidate", m.candidate_file},
                      {"score", m.score},
                      {"folder_weight", m.folder_weight},
                      {"weighted_score", m.weighted_score()}});
    }
    print_json({{"query", query},
                {"algorithm", algorithm_id(config.default_algorithm)},
                {"threshold", config.match.threshold},
                {"matches", list}});
  } else {
    if (matches.empty()) {
      std::cout << "No matches above " << config.match.threshold << "\n";
    }
    for (const auto& m : matches) {
      std::printf("  %5.1f%%  x%.2f  %s\n", m.score * 100.0f, m.folder_weight,
                  m.candidate_file.c_str());
    }
  }
  return 0;
}

int cmd_duplicates(const CliArgs& args, const FingerprintService& service) {
  std::vector<std::string> folders = args.inputs;
  if (args.has("recursive")) {
    std::vector<std::string> expanded;
    for (const auto& folder : args.inputs) {
      auto found = service.discover_folders(folder);
      expanded.insert(expanded.end(), found.begin(), found.end());
    }
    folders = expanded;
  }

  const auto& config = service.config();
  std::vector<DuplicateCluster> clusters =
      service.find_duplicates(folders, config.default_algorithm, config.match.threshold);

  if (args.json_output) {
    json list = json::array();
    for (const auto& c : clusters) {
      list.push_back(
          {{"files", c.files}, {"max_score", c.max_score}, {"min_edge_score", c.min_edge_score}});
    }
    print_json({{"algorithm", algorithm_id(config.default_algorithm)}, {"clusters", list}});
  } else {
    if (clusters.empty()) {
      std::cout << "No duplicates found\n";
    }
    int index = 1;
    for (const auto& c : clusters) {
      std::printf("Group %d (%.1f%%)\n", index++, c.max_score * 100.0f);
      for (const auto& file : c.files) {
        std::cout << "  " << file << "\n";
      }
    }
  }
  return 0;
}

/// @brief Shared body of the reference/ignore commands: [on|off|toggle].
int run_folder_flag(const CliArgs& args, const char* flag_name,
                    const std::function<void(const std::string&, bool)>& set,
                    const std::function<bool(const std::string&)>& toggle) {
  const std::string folder = args.inputs.front();
  const std::string mode = args.inputs.size() > 1 ? args.inputs[1] : "toggle";
  bool value;
  if (mode == "on") {
    set(folder, true);
    value = true;
  } else if (mode == "off") {
    set(folder, false);
    value = false;
  } else if (mode == "toggle") {
    value = toggle(folder);
  } else {
    std::cerr << "Error: expected on, off or toggle, got '" << mode << "'\n";
    return 1;
  }
  if (args.json_output) {
    print_json({{"folder", folder}, {flag_name, value}});
  } else {
    std::cout << folder << ": " << flag_name << " = " << (value ? "on" : "off") << "\n";
  }
  return 0;
}

int cmd_reference(const CliArgs& args, const FingerprintService& service) {
  return run_folder_flag(
      args, "reference",
      [&service](const std::string& f, bool v) { service.set_reference_folder(f, v); },
      [&service](const std::string& f) { return service.toggle_reference_folder(f); });
}

int cmd_ignore(const CliArgs& args, const FingerprintService& service) {
  return run_folder_flag(
      args, "ignore", [&service](const std::string& f, bool v) { service.set_ignore_folder(f, v); },
      [&service](const std::string& f) { return service.toggle_ignore_folder(f); });
}

int set_exclusion(const CliArgs& args, const FingerprintService& service, bool excluded) {
  for (const auto& file : args.inputs) {
    service.set_file_excluded(file, excluded);
    if (!args.json_output && !args.quiet) {
      std::cout << (excluded ? "Excluded " : "Included ") << file << "\n";
    }
  }
  if (args.json_output) {
    print_json({{"files", args.inputs}, {"excluded", excluded}});
  }
  return 0;
}

int cmd_exclude(const CliArgs& args, const FingerprintService& service) {
  return set_exclusion(args, service, true);
}

int cmd_include(const CliArgs& args, const FingerprintService& service) {
  return set_exclusion(args, service, false);
}

int cmd_discover(const CliArgs& args, const FingerprintService& service) {
  std::vector<std::string> folders = service.discover_folders(args.inputs.front());
  if (args.json_output) {
    print_json(folders);
  } else {
    for (const auto& folder : folders) {
      std::cout << folder << "\n";
    }
  }
  return 0;
}

// ============================================================================
// Command Table
// ============================================================================

struct CommandInfo {
  std::string name;
  std::string description;
  CommandHandler handler;
  int min_inputs;
};

const std::vector<CommandInfo>& get_commands() {
  static std::vector<CommandInfo> commands = {
      {"generate", "Fingerprint files or folders", cmd_generate, 1},
      {"info", "Show a folder's fingerprint coverage", cmd_info, 1},
      {"match", "Find takes matching a file", cmd_match, 1},
      {"duplicates", "Group duplicate recordings", cmd_duplicates, 1},
      {"reference", "Set reference folder flag [on|off|toggle]", cmd_reference, 1},
      {"ignore", "Set ignore folder flag [on|off|toggle]", cmd_ignore, 1},
      {"exclude", "Exclude files from fingerprinting", cmd_exclude, 1},
      {"include", "Re-include excluded files", cmd_include, 1},
      {"discover", "List folders holding fingerprint caches", cmd_discover, 1},
      {"algorithms", "List fingerprint algorithms", cmd_algorithms, 0},
  };
  return commands;
}

const CommandInfo* find_command(const std::string& name) {
  for (const auto& cmd : get_commands()) {
    if (cmd.name == name) return &cmd;
  }
  return nullptr;
}

// ============================================================================
// Usage
// ============================================================================

void print_usage(const char* prog) {
  std::cerr << "Usage: " << prog << " <command> [options] <paths...>\n\nCOMMANDS:\n";
  for (const auto& cmd : get_commands()) {
    std::fprintf(stderr, "  %-14s %s\n", cmd.name.c_str(), cmd.description.c_str());
  }
  std::cerr << "  version        Show library version\n";

  std::cerr << "\nGLOBAL OPTIONS:\n"
            << "  --json                 Output results in JSON format\n"
            << "  --quiet, -q            Only log warnings and errors\n"
            << "  --verbose, -v          Log debug messages\n"
            << "  --config <file>        JSON settings file\n"
            << "  --algorithm <id>       spectral, lightweight, chromaprint, audfprint\n"
            << "  --threshold <float>    Match threshold (clamped to 0.5-0.95, default 0.7)\n"
            << "  --workers <int>        Worker threads (default: cores - 1)\n"
            << "  --recursive            Include sub-folders\n"
            << "  --exclude-self         Drop the query file from match results\n"
            << "  --limit <int>          Maximum number of matches\n"
            << "  --checkpoint <int>     Save every N fingerprinted files\n"
            << "\nExamples:\n"
            << "  " << prog << " generate practice/2024-05-01 --algorithm chromaprint\n"
            << "  " << prog << " match practice/2024-05-01/song1.wav practice --recursive\n"
            << "  " << prog << " duplicates practice --recursive --json\n";
}

// ============================================================================
// Main
// ============================================================================

void setup_logging(const CliArgs& args) {
  // Logs go to stderr so JSON output on stdout stays parseable
  spdlog::set_default_logger(spdlog::stderr_color_mt("bandprint"));
  spdlog::set_pattern("[%l] %v");
  spdlog::set_level(args.quiet ? spdlog::level::warn
                               : (args.verbose ? spdlog::level::debug : spdlog::level::info));
  spdlog::cfg::load_env_levels();
}

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage(argv[0]);
    return 1;
  }

  CliArgs args = ArgParser::parse(argc, argv);
  if (args.help) {
    print_usage(argv[0]);
    return 0;
  }
  if (args.command.empty()) {
    std::cerr << "Error: No command specified\n\n";
    print_usage(argv[0]);
    return 1;
  }
  if (args.command == "version") {
    return cmd_version(args);
  }

  const CommandInfo* cmd = find_command(args.command);
  if (!cmd) {
    std::cerr << "Error: Unknown command '" << args.command << "'\n\n";
    print_usage(argv[0]);
    return 1;
  }
  if (static_cast<int>(args.inputs.size()) < cmd->min_inputs) {
    std::cerr << "Error: Missing path for '" << cmd->name << "'\n\n";
    print_usage(argv[0]);
    return 1;
  }

  setup_logging(args);

  try {
    FingerprintService service(build_config(args));
    return cmd->handler(args, service);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
