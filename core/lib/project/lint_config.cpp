// jlint/project/lint_config.cpp - Lint configuration implementation
//
#include "jlint/project/lint_config.hpp"

#include <yaml-cpp/yaml.h>

namespace jlint
{

namespace
{

/// Parse a single `rules:` entry: either a bare name or a map
std::optional<RuleConfig> parse_rule(
  const YAML::Node & node, std::vector<std::string> & warnings, std::string & error)
{
  RuleConfig rule;

  if (node.IsScalar()) {
    rule.name = node.as<std::string>();
  } else if (node.IsMap()) {
    if (!node["name"] || !node["name"].IsScalar()) {
      error = "rule entry must have a 'name'";
      return std::nullopt;
    }
    rule.name = node["name"].as<std::string>();

    if (node["severity"]) {
      const auto text = node["severity"].as<std::string>();
      rule.severity = parse_severity(text);
      if (!rule.severity) {
        warnings.push_back("rule '" + rule.name + "': unknown severity '" + text + "' ignored");
      }
    }

    if (node["properties"]) {
      const auto & props_node = node["properties"];
      if (!props_node.IsMap()) {
        error = "rule '" + rule.name + "': properties must be a map";
        return std::nullopt;
      }
      for (const auto & kv : props_node) {
        const auto key = kv.first.as<std::string>();
        if (!kv.second.IsScalar()) {
          warnings.push_back(
            "rule '" + rule.name + "': property '" + key + "' is not a scalar and was ignored");
          continue;
        }
        rule.properties[key] = kv.second.as<std::string>();
      }
    }
  } else {
    error = "rule entry must be a name or a map";
    return std::nullopt;
  }

  return rule;
}

ConfigLoadResult parse_root(const YAML::Node & root, const std::filesystem::path & config_root)
{
  LintConfig config;
  config.config_root = config_root;
  std::vector<std::string> warnings;

  if (!root || root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  // Parse 'severity'
  if (root["severity"]) {
    const auto text = root["severity"].as<std::string>();
    if (const auto severity = parse_severity(text)) {
      config.default_severity = *severity;
    } else {
      warnings.push_back("unknown severity '" + text + "' ignored");
    }
  }

  // Parse 'rules'
  if (root["rules"]) {
    if (!root["rules"].IsSequence()) {
      return ConfigLoadResult::fail("rules must be a list");
    }
    config.rules.emplace();
    for (const auto & rule_node : root["rules"]) {
      std::string rule_error;
      auto rule = parse_rule(rule_node, warnings, rule_error);
      if (!rule) {
        return ConfigLoadResult::fail("invalid rule: " + rule_error);
      }
      const RuleFactory * factory = find_rule_factory(rule->name);
      if (factory == nullptr) {
        warnings.push_back("unknown rule '" + rule->name + "' ignored");
        continue;
      }
      for (const std::string_view key : factory->boolean_properties) {
        if (props::is_malformed_bool(rule->properties, key)) {
          warnings.push_back(
            "rule '" + rule->name + "': property '" + std::string(key) +
            "' must be true or false; using the default");
        }
      }
      config.rules->push_back(std::move(*rule));
    }
  }

  return ConfigLoadResult::ok(std::move(config), std::move(warnings));
}

}  // namespace

ConfigLoadResult load_lint_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  try {
    return parse_root(root, fs::absolute(config_path).parent_path());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("invalid configuration: " + std::string(e.what()));
  }
}

ConfigLoadResult parse_lint_config(
  std::string_view yaml_text, const std::filesystem::path & config_root)
{
  YAML::Node root;
  try {
    root = YAML::Load(std::string(yaml_text));
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  try {
    return parse_root(root, config_root);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("invalid configuration: " + std::string(e.what()));
  }
}

std::optional<std::filesystem::path> find_lint_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_lint_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

RuleSet build_rule_set(const LintConfig & config)
{
  if (!config.rules) {
    return RuleSet::all_builtin(config.default_severity);
  }

  RuleSet set;
  for (const auto & rule : *config.rules) {
    const RuleFactory * factory = find_rule_factory(rule.name);
    if (factory == nullptr) continue;
    set.add(factory->create(rule.properties), rule.severity.value_or(config.default_severity));
  }
  return set;
}

}  // namespace jlint
