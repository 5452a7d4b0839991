// jlint/basic/diagnostic.cpp - Diagnostic implementation
#include "jlint/basic/diagnostic.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <utility>

namespace jlint
{

std::string_view to_string(Severity severity) noexcept
{
  switch (severity) {
    case Severity::Error:
      return "error";
    case Severity::Warning:
      return "warning";
    case Severity::Info:
      return "info";
    case Severity::Hint:
      return "hint";
  }
  return "error";
}

std::optional<Severity> parse_severity(std::string_view text)
{
  std::string lowered;
  lowered.reserve(text.size());
  for (const char c : text) {
    lowered += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }

  if (lowered == "error") return Severity::Error;
  if (lowered == "warning") return Severity::Warning;
  if (lowered == "info") return Severity::Info;
  if (lowered == "hint") return Severity::Hint;
  return std::nullopt;
}

std::string_view to_string(FixAvailability availability) noexcept
{
  switch (availability) {
    case FixAvailability::None:
      return "none";
    case FixAvailability::Sometimes:
      return "sometimes";
    case FixAvailability::Always:
      return "always";
  }
  return "none";
}

// ============================================================================
// DiagnosticBuilder
// ============================================================================

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag)
: bag_(bag), diagnostic_(std::move(diag))
{
}

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBuilder && other) noexcept
: bag_(other.bag_), diagnostic_(std::move(other.diagnostic_)), active_(other.active_)
{
  other.active_ = false;
}

DiagnosticBuilder::~DiagnosticBuilder()
{
  if (active_) {
    bag_.add(std::move(diagnostic_));
  }
}

DiagnosticBuilder & DiagnosticBuilder::with_severity(Severity severity)
{
  diagnostic_.severity = severity;
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_edit(Edit edit)
{
  if (!diagnostic_.fix) {
    diagnostic_.fix = Fix{};
  }
  diagnostic_.fix->edits.push_back(std::move(edit));
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_fix(Fix fix)
{
  diagnostic_.fix = std::move(fix);
  return *this;
}

// ============================================================================
// DiagnosticBag
// ============================================================================

DiagnosticBuilder DiagnosticBag::report(SourceRange range, ViolationKind kind)
{
  Diagnostic d;
  d.kind = std::move(kind);
  d.range = range;
  return {*this, std::move(d)};
}

void DiagnosticBag::add(Diagnostic && diag) { diagnostics_.push_back(std::move(diag)); }

void DiagnosticBag::add(const Diagnostic & diag) { diagnostics_.push_back(diag); }

bool DiagnosticBag::has_errors() const
{
  return std::any_of(diagnostics_.begin(), diagnostics_.end(), [](const Diagnostic & d) {
    return d.severity == Severity::Error;
  });
}

size_t DiagnosticBag::count(Severity severity) const
{
  return static_cast<size_t>(
    std::count_if(diagnostics_.begin(), diagnostics_.end(), [severity](const Diagnostic & d) {
      return d.severity == severity;
    }));
}

std::vector<Diagnostic> DiagnosticBag::take()
{
  std::vector<Diagnostic> out = std::move(diagnostics_);
  diagnostics_.clear();
  return out;
}

void DiagnosticBag::merge(DiagnosticBag && other)
{
  diagnostics_.insert(
    diagnostics_.end(), std::make_move_iterator(other.diagnostics_.begin()),
    std::make_move_iterator(other.diagnostics_.end()));
  other.diagnostics_.clear();
}

void DiagnosticBag::merge(const DiagnosticBag & other)
{
  diagnostics_.insert(diagnostics_.end(), other.diagnostics_.begin(), other.diagnostics_.end());
}

}  // namespace jlint
