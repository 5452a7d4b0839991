// jlint/basic/diagnostic.hpp - Diagnostic types produced by lint rules
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "jlint/basic/source_manager.hpp"

namespace jlint
{

// ============================================================================
// Core Structures
// ============================================================================

/**
 * Severity level for diagnostics.
 */
enum class Severity : uint8_t {
  Error,
  Warning,
  Info,
  Hint,
};

[[nodiscard]] std::string_view to_string(Severity severity) noexcept;

/// Parse "error" / "warning" / "info" / "hint" (case-insensitive)
[[nodiscard]] std::optional<Severity> parse_severity(std::string_view text);

/**
 * Whether a violation kind can carry an automated fix.
 */
enum class FixAvailability : uint8_t {
  None,       ///< Never fixable
  Sometimes,  ///< Fixable for some shapes only
  Always,     ///< Every diagnostic of this kind carries a fix
};

[[nodiscard]] std::string_view to_string(FixAvailability availability) noexcept;

/**
 * What was violated: a stable identifier, the human-readable message and the
 * fix availability declared by the kind.
 */
struct ViolationKind
{
  std::string id;       // e.g., "VariableShouldBeFinal"
  std::string message;  // e.g., "Variable 'x' should be declared final."
  FixAvailability fix_availability = FixAvailability::None;
};

/**
 * One text edit: replace `range` with `replacement_text`.
 * An empty range is an insertion, an empty replacement a deletion.
 */
struct Edit
{
  SourceRange range;
  std::string replacement_text;

  [[nodiscard]] static Edit replacement(SourceRange range, std::string text)
  {
    return Edit{range, std::move(text)};
  }
  [[nodiscard]] static Edit insertion(uint32_t offset, std::string text)
  {
    return Edit{SourceRange::at(offset), std::move(text)};
  }
  [[nodiscard]] static Edit deletion(SourceRange range) { return Edit{range, std::string()}; }
};

/**
 * A set of edits that together resolve one diagnostic.
 */
struct Fix
{
  std::vector<Edit> edits;
};

struct Diagnostic
{
  std::string rule;  // name of the rule that produced it, filled by the dispatcher
  ViolationKind kind;
  SourceRange range;
  Severity severity = Severity::Error;
  std::optional<Fix> fix;

  [[nodiscard]] const std::string & message() const noexcept { return kind.message; }
};

// ============================================================================
// Forward Declarations
// ============================================================================

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Fluent builder for one diagnostic; registers it in the bag on destruction (RAII).
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;

  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;

  ~DiagnosticBuilder();

  DiagnosticBuilder & with_severity(Severity severity);

  DiagnosticBuilder & with_edit(Edit edit);

  DiagnosticBuilder & with_fix(Fix fix);

private:
  DiagnosticBag & bag_;
  Diagnostic diagnostic_;
  bool active_ = true;
};

// ============================================================================
// DiagnosticBag
// ============================================================================

class DiagnosticBag
{
public:
  DiagnosticBag() = default;

  DiagnosticBag(const DiagnosticBag &) = default;
  DiagnosticBag & operator=(const DiagnosticBag &) = default;
  DiagnosticBag(DiagnosticBag &&) = default;
  DiagnosticBag & operator=(DiagnosticBag &&) = default;

  // Builder Starter
  DiagnosticBuilder report(SourceRange range, ViolationKind kind);

  // Add
  void add(Diagnostic && diag);
  void add(const Diagnostic & diag);

  // Accessors
  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }

  [[nodiscard]] bool has_errors() const;
  [[nodiscard]] size_t count(Severity severity) const;

  /// Move the collected diagnostics out, leaving the bag empty
  [[nodiscard]] std::vector<Diagnostic> take();

  // Utilities
  void merge(DiagnosticBag && other);
  void merge(const DiagnosticBag & other);

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  std::vector<Diagnostic> diagnostics_;
};

}  // namespace jlint
