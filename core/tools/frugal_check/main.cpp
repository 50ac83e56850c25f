// frugal-check - Frugal IDL checker command line interface
//
// Usage:
//   frugal-check [--config <path>] [--json] [--no-color] [-v] <file>...
//
// Exit status: 0 when no file has errors, 1 when any file has errors,
// 2 on usage, configuration or I/O failure.
//
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "frugal_ls/basic/diagnostic_printer.hpp"
#include "frugal_ls/document/document.hpp"
#include "frugal_ls/lsp/lsp_json.hpp"
#include "frugal_ls/project/project_config.hpp"
#include "frugal_ls/sema/diagnostics_engine.hpp"

namespace fs = std::filesystem;

namespace
{

constexpr int k_exit_ok = 0;
constexpr int k_exit_errors = 1;
constexpr int k_exit_failure = 2;

constexpr const char * k_log_pattern = "[%n][%L] %v";
constexpr const char * k_log_level_env = "FRUGAL_LS_LOG_LEVEL";

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::vector<std::string> input_files;
  std::string config_path;
  std::string log_level;
  bool json_output = false;
  bool no_color = false;
  bool verbose = false;
  bool show_help = false;
  std::string error;
};

void print_usage(const char * program_name)
{
  std::cerr << "Frugal IDL checker\n\n"
            << "Usage: " << program_name << " [options] <file>...\n\n"
            << "Options:\n"
            << "  --config <path>          Use this frugal-ls.yaml instead of searching for one\n"
            << "  --json                   Print diagnostics as JSON on stdout\n"
            << "  --no-color               Disable colored output\n"
            << "  --log-level <level>      trace, debug, info, warn, error, critical or off\n"
            << "  -v, --verbose            Same as --log-level debug\n"
            << "  -h, --help               Show this help message\n";
}

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];

    if (arg == "--config") {
      if (i + 1 >= argc) {
        args.error = "--config requires a path";
        return args;
      }
      args.config_path = argv[++i];
    } else if (arg == "--log-level") {
      if (i + 1 >= argc) {
        args.error = "--log-level requires a level";
        return args;
      }
      args.log_level = argv[++i];
    } else if (arg == "--json") {
      args.json_output = true;
    } else if (arg == "--no-color") {
      args.no_color = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (!arg.empty() && arg[0] == '-') {
      args.error = "unknown option: " + arg;
      return args;
    } else {
      args.input_files.push_back(arg);
    }
  }

  return args;
}

// ============================================================================
// Logging
// ============================================================================

/// Level requested on the command line or in the environment, if any
std::optional<std::string> requested_log_level(const CommandArgs & args)
{
  if (!args.log_level.empty()) return args.log_level;
  if (args.verbose) return std::string("debug");
  if (const char * env = std::getenv(k_log_level_env); env != nullptr && *env != '\0') {
    return std::string(env);
  }
  return std::nullopt;
}

void setup_logging()
{
  auto logger = spdlog::stderr_color_mt("frugal-check");
  logger->set_pattern(k_log_pattern);
  spdlog::set_default_logger(std::move(logger));
  spdlog::set_level(spdlog::level::warn);
}

void apply_log_level(const std::string & level)
{
  spdlog::set_level(spdlog::level::from_str(level));
}

// ============================================================================
// Configuration
// ============================================================================

std::optional<frugal_ls::ProjectConfig> load_config(const CommandArgs & args)
{
  if (!args.config_path.empty()) {
    const auto result = frugal_ls::load_project_config(args.config_path);
    if (!result.success) {
      std::cerr << "error: " << result.error << "\n";
      return std::nullopt;
    }
    return result.config;
  }

  const auto found = frugal_ls::find_project_config(fs::current_path());
  if (!found) {
    spdlog::debug("no {} found, using defaults", frugal_ls::k_project_config_file_name);
    return frugal_ls::ProjectConfig{};
  }

  const auto result = frugal_ls::load_project_config(*found);
  if (!result.success) {
    std::cerr << "error: " << found->string() << ": " << result.error << "\n";
    return std::nullopt;
  }
  return result.config;
}

// ============================================================================
// Checking
// ============================================================================

std::optional<std::string> read_file(const fs::path & path)
{
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    return std::nullopt;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

int run(const CommandArgs & args, const frugal_ls::ProjectConfig & config)
{
  const frugal_ls::DiagnosticsEngine engine(config.diagnostics);
  frugal_ls::ParseOptions parse_options;
  parse_options.max_syntax_errors = config.diagnostics.max_syntax_errors;

  const bool use_color = !args.no_color && isatty(fileno(stderr)) != 0;
  frugal_ls::DiagnosticPrinter printer(std::cerr, use_color);

  nlohmann::json report = nlohmann::json::array();
  bool any_errors = false;
  bool io_failure = false;

  for (const auto & input : args.input_files) {
    const fs::path path(input);

    if (!frugal_ls::is_frugal_file(input, config.files.extensions)) {
      spdlog::warn("skipping {}: not a Frugal file", input);
      continue;
    }

    const auto text = read_file(path);
    if (!text) {
      std::cerr << "error: failed to open file: " << input << "\n";
      io_failure = true;
      continue;
    }

    const frugal_ls::Document doc = frugal_ls::Document::parse(input, *text, parse_options);
    const auto diags = engine.run(doc);

    for (const auto & d : diags) {
      if (d.severity == frugal_ls::Severity::Error) {
        any_errors = true;
        break;
      }
    }

    if (args.json_output) {
      nlohmann::json entry;
      entry["uri"] = input;
      entry["items"] = nlohmann::json::array();
      for (const auto & d : diags) {
        entry["items"].push_back(frugal_ls::lsp::diagnostic_to_json(d, input));
      }
      report.push_back(std::move(entry));
    } else if (!diags.empty()) {
      printer.print_all(diags, doc.source(), input, input);
    } else {
      std::cout << input << ": OK\n";
    }
  }

  if (args.json_output) {
    std::cout << report.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
  }

  if (io_failure) return k_exit_failure;
  return any_errors ? k_exit_errors : k_exit_ok;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return k_exit_ok;
  }

  if (!args.error.empty()) {
    std::cerr << "error: " << args.error << "\n";
    print_usage(argv[0]);
    return k_exit_failure;
  }

  if (args.input_files.empty()) {
    print_usage(argv[0]);
    return k_exit_failure;
  }

  setup_logging();

  const auto cli_level = requested_log_level(args);
  if (cli_level) {
    if (!frugal_ls::is_valid_log_level(*cli_level)) {
      std::cerr << "error: invalid log level: " << *cli_level << "\n";
      return k_exit_failure;
    }
    apply_log_level(*cli_level);
  }

  const auto config = load_config(args);
  if (!config) {
    return k_exit_failure;
  }

  if (!cli_level) {
    apply_log_level(config->logging.level);
  }

  try {
    return run(args, *config);
  } catch (const std::exception & e) {
    std::cerr << "error: " << e.what() << "\n";
    return k_exit_failure;
  }
}
