// jlint/project/lint_config.hpp - Lint configuration (jlint.yaml)
//
// Parses and validates jlint.yaml and turns it into a RuleSet.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "jlint/basic/diagnostic.hpp"
#include "jlint/lint/rule.hpp"
#include "jlint/lint/rule_registry.hpp"

namespace jlint
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * One entry of the `rules:` list.
 */
struct RuleConfig
{
  /// Built-in rule name, e.g. "FinalLocalVariable"
  std::string name;

  /// Overrides LintConfig::default_severity when set
  std::optional<Severity> severity;

  Properties properties;
};

/**
 * Complete lint configuration (jlint.yaml).
 */
struct LintConfig
{
  Severity default_severity = Severity::Error;

  /// Enabled rules in file order. Absent `rules:` key means every built-in rule.
  std::optional<std::vector<RuleConfig>> rules;

  /// Directory containing jlint.yaml (empty for defaults)
  std::filesystem::path config_root;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

/**
 * Result of loading a lint configuration file.
 */
struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  LintConfig config;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  /// Non-fatal problems (unknown rules, bad severities, non-scalar properties)
  std::vector<std::string> warnings;

  static ConfigLoadResult ok(LintConfig cfg, std::vector<std::string> warnings = {})
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.warnings = std::move(warnings);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a lint configuration from a jlint.yaml file.
 *
 * @param config_path Path to jlint.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_lint_config(const std::filesystem::path & config_path);

/**
 * Parse jlint.yaml content held in memory.
 *
 * @param yaml_text YAML document
 * @param config_root Directory reported as LintConfig::config_root
 */
[[nodiscard]] ConfigLoadResult parse_lint_config(
  std::string_view yaml_text, const std::filesystem::path & config_root = {});

/**
 * Find a lint configuration file by searching upward from a directory.
 *
 * @param start_dir Directory (or file) to start searching from
 * @return Path to jlint.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_lint_config(
  const std::filesystem::path & start_dir);

/**
 * Instantiate the configured rules.
 *
 * Rules keep the order of the configuration; unknown names are skipped.
 */
[[nodiscard]] RuleSet build_rule_set(const LintConfig & config);

/**
 * Default name of the lint configuration file.
 */
inline constexpr const char * k_lint_config_file_name = "jlint.yaml";

}  // namespace jlint
