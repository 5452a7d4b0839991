// jlint - Java lint command line interface
//
// Usage:
//   jlint [options] <file-or-dir>...
//   jlint --list-rules
//
#include <fmt/core.h>

#include <charconv>
#include <filesystem>
#include <iostream>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "jlint/basic/diagnostic_printer.hpp"
#include "jlint/basic/json_report.hpp"
#include "jlint/driver/lint_driver.hpp"
#include "jlint/lint/rule_registry.hpp"
#include "jlint/project/lint_config.hpp"

namespace fs = std::filesystem;

namespace
{

constexpr int k_exit_clean = 0;
constexpr int k_exit_violations = 1;
constexpr int k_exit_usage = 2;

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "jlint - Java static analysis v0.1.0\n\n"
            << "Usage: " << program_name << " [options] <file-or-dir>...\n\n"
            << "Options:\n"
            << "  -c, --config <path>      Configuration file (default: nearest jlint.yaml)\n"
            << "  -f, --format <fmt>       Output format: text | json (default: text)\n"
            << "  -j, --jobs <n>           Worker threads (default: hardware concurrency)\n"
            << "  --fix                    Apply available fixes in place\n"
            << "  --no-color               Disable colored output\n"
            << "  --list-rules             List built-in rules and exit\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

void print_rules()
{
  for (const auto & factory : jlint::builtin_rules()) {
    fmt::print("{:<30} {}\n", factory.name, factory.description);
  }
}

void print_text(const jlint::LintResult & result, bool use_color)
{
  jlint::DiagnosticPrinter printer(std::cout, use_color);

  for (const auto & file : result.files) {
    if (file.status != jlint::FileStatus::Ok) {
      fmt::print(stderr, "error: {}: {}\n", file.path.string(), file.error);
      continue;
    }
    if (!file.error.empty()) {
      fmt::print(stderr, "warning: {}: {}\n", file.path.string(), file.error);
    }
    printer.print_all(file.diagnostics, file.source);
  }

  printer.print_summary(
    result.count(jlint::Severity::Error), result.count(jlint::Severity::Warning),
    result.files.size());
}

void print_json(const jlint::LintResult & result)
{
  nlohmann::json files = nlohmann::json::array();
  for (const auto & file : result.files) {
    nlohmann::json entry{
      {"path", file.path.string()},
      {"status", std::string(jlint::to_string(file.status))},
      {"syntax_errors", file.syntax_errors.size()},
      {"diagnostics", jlint::to_json(file.diagnostics, file.source)}};
    if (!file.error.empty()) {
      entry["error"] = file.error;
    }
    if (file.fixes_applied > 0) {
      entry["fixes_applied"] = file.fixes_applied;
    }
    files.push_back(std::move(entry));
  }
  std::cout << nlohmann::json{{"files", std::move(files)}}.dump(2) << "\n";
}

// ============================================================================
// Argument Parsing
// ============================================================================

enum class OutputFormat { Text, Json };

struct CommandArgs
{
  std::vector<fs::path> inputs;
  std::optional<fs::path> config_path;
  OutputFormat format = OutputFormat::Text;
  size_t jobs = 0;
  bool fix = false;
  bool no_color = false;
  bool verbose = false;
  bool list_rules = false;
  bool show_help = false;

  /// Set when the command line is invalid
  std::string error;
};

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];

    auto value = [&]() -> std::optional<std::string> {
      if (i + 1 < argc) {
        return std::string(argv[++i]);
      }
      args.error = "missing value for " + arg;
      return std::nullopt;
    };

    if (arg == "-c" || arg == "--config") {
      if (auto v = value()) args.config_path = *v;
    } else if (arg == "-f" || arg == "--format") {
      if (auto v = value()) {
        if (*v == "text") {
          args.format = OutputFormat::Text;
        } else if (*v == "json") {
          args.format = OutputFormat::Json;
        } else {
          args.error = "unknown format '" + *v + "' (expected text or json)";
        }
      }
    } else if (arg == "-j" || arg == "--jobs") {
      if (auto v = value()) {
        const auto [ptr, ec] = std::from_chars(v->data(), v->data() + v->size(), args.jobs);
        if (ec != std::errc() || ptr != v->data() + v->size()) {
          args.error = "invalid job count '" + *v + "'";
        }
      }
    } else if (arg == "--fix") {
      args.fix = true;
    } else if (arg == "--no-color") {
      args.no_color = true;
    } else if (arg == "--list-rules") {
      args.list_rules = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (!arg.empty() && arg[0] == '-') {
      args.error = "unknown option " + arg;
    } else {
      args.inputs.emplace_back(arg);
    }

    if (!args.error.empty()) {
      break;
    }
  }

  return args;
}

// ============================================================================
// Commands
// ============================================================================

std::optional<jlint::LintConfig> load_config(const CommandArgs & args)
{
  std::optional<fs::path> config_path = args.config_path;
  if (!config_path) {
    config_path = jlint::find_lint_config(fs::current_path());
  }
  if (!config_path) {
    if (args.verbose) {
      fmt::print(stderr, "jlint: no {} found, running all rules\n", jlint::k_lint_config_file_name);
    }
    return jlint::LintConfig{};
  }

  if (args.verbose) {
    fmt::print(stderr, "jlint: using {}\n", config_path->string());
  }

  auto loaded = jlint::load_lint_config(*config_path);
  if (!loaded.success) {
    fmt::print(stderr, "error: {}\n", loaded.error);
    return std::nullopt;
  }
  for (const auto & w : loaded.warnings) {
    fmt::print(stderr, "warning: {}: {}\n", config_path->string(), w);
  }
  return std::move(loaded.config);
}

int cmd_lint(const CommandArgs & args)
{
  const auto config = load_config(args);
  if (!config) {
    return k_exit_usage;
  }

  std::vector<std::string> input_errors;
  const auto files = jlint::LintDriver::collect_java_files(args.inputs, input_errors);
  for (const auto & e : input_errors) {
    fmt::print(stderr, "error: {}\n", e);
  }
  if (!input_errors.empty()) {
    return k_exit_usage;
  }

  const jlint::RuleSet rules = jlint::build_rule_set(*config);

  jlint::LintOptions options;
  options.jobs = args.jobs;
  options.fix = args.fix;
  options.verbose = args.verbose;

  const jlint::LintDriver driver(rules, options);
  const jlint::LintResult result = driver.lint_files(files);

  if (args.format == OutputFormat::Json) {
    print_json(result);
  } else {
    // Detect if terminal supports colors (simple check for TTY)
    const bool use_color = !args.no_color && isatty(fileno(stdout)) != 0;
    print_text(result, use_color);
  }

  bool all_ok = true;
  for (const auto & f : result.files) {
    all_ok = all_ok && f.status == jlint::FileStatus::Ok;
  }
  return (result.has_errors() || !all_ok) ? k_exit_violations : k_exit_clean;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (!args.error.empty()) {
    fmt::print(stderr, "error: {}\n\n", args.error);
    print_usage(argv[0]);
    return k_exit_usage;
  }

  if (args.show_help) {
    print_usage(argv[0]);
    return k_exit_clean;
  }

  if (args.list_rules) {
    print_rules();
    return k_exit_clean;
  }

  if (args.inputs.empty()) {
    fmt::print(stderr, "error: no input files\n\n");
    print_usage(argv[0]);
    return k_exit_usage;
  }

  return cmd_lint(args);
}
