// jlint/lint/rule.hpp - The contract every lint rule implements
//
// A rule is constructed once from its configuration properties and then asked
// to check individual CST nodes. Rules are immutable after construction and
// may be shared by several worker threads.
//
#pragma once

#include <gsl/span>

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "jlint/basic/diagnostic.hpp"
#include "jlint/basic/source_manager.hpp"
#include "jlint/syntax/ts_ll.hpp"

namespace jlint
{

// ============================================================================
// Properties
// ============================================================================

/// Rule configuration: string keys to string values, ordered for determinism
using Properties = std::map<std::string, std::string, std::less<>>;

namespace props
{

/// Parse a boolean property ("true"/"false", case-insensitive); otherwise `fallback`
[[nodiscard]] bool get_bool(const Properties & properties, std::string_view key, bool fallback);

/// True when `key` is present but its value cannot be parsed as a boolean
[[nodiscard]] bool is_malformed_bool(const Properties & properties, std::string_view key);

}  // namespace props

// ============================================================================
// CheckContext
// ============================================================================

/**
 * Read-only view of the file under analysis, handed to every rule invocation.
 */
class CheckContext
{
public:
  CheckContext(const SourceFile & source, ts_ll::Node root) : source_(source), root_(root) {}

  [[nodiscard]] const SourceFile & source() const noexcept { return source_; }
  [[nodiscard]] ts_ll::Node root() const noexcept { return root_; }

  [[nodiscard]] std::string_view text(ts_ll::Node node) const noexcept
  {
    return node.text(source_);
  }

  [[nodiscard]] uint32_t line_of(uint32_t offset) const noexcept
  {
    return source_.get_line_column(offset).line;
  }

  [[nodiscard]] bool same_line(uint32_t a, uint32_t b) const noexcept
  {
    return line_of(a) == line_of(b);
  }

private:
  const SourceFile & source_;
  ts_ll::Node root_;
};

// ============================================================================
// Rule
// ============================================================================

class Rule
{
public:
  Rule() = default;
  Rule(const Rule &) = delete;
  Rule & operator=(const Rule &) = delete;
  virtual ~Rule() = default;

  /// Configuration module name, e.g. "FinalLocalVariable"
  [[nodiscard]] virtual std::string_view name() const noexcept = 0;

  /**
   * Node kinds this rule wants to see.
   *
   * std::nullopt means the rule is invoked for every node of the tree.
   */
  [[nodiscard]] virtual std::optional<gsl::span<const std::string_view>> relevant_kinds()
    const noexcept
  {
    return std::nullopt;
  }

  /**
   * Check one node.
   *
   * Invoked once per visited node during the pre-order walk. Must not keep
   * state between invocations.
   */
  [[nodiscard]] virtual std::vector<Diagnostic> check(
    const CheckContext & ctx, ts_ll::Node node) const = 0;
};

}  // namespace jlint
