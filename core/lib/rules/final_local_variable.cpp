// jlint/rules/final_local_variable.cpp - Effective-finality flow analysis
#include "jlint/rules/final_local_variable.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cstdint>
#include <utility>

#include "jlint/rules/rule_utils.hpp"
#include "jlint/syntax/node_kinds.hpp"

namespace jlint::rules
{

namespace
{

namespace kind = syntax::kind;
namespace field = syntax::field;

constexpr std::array<std::string_view, 6> k_relevant_kinds = {
  kind::k_method_declaration, kind::k_constructor_declaration,
  kind::k_compact_constructor_declaration,
  kind::k_static_initializer, kind::k_block, kind::k_lambda_expression,
};

// ============================================================================
// Flow state
// ============================================================================

/// Value-giving actions seen on the worst path: 0, 1, or 2 (two or more)
using ValueCount = uint8_t;
constexpr ValueCount k_many = 2;

enum class Binding : uint8_t {
  Tracked,   // reported when it ends with exactly one value-giving action
  Excluded,  // resolves names and absorbs assignments, never reported
};

struct Candidate
{
  std::string_view name;
  SourceRange name_range;
  Binding binding = Binding::Tracked;
  /// Number of repeating regions (loops, closures) enclosing the declaration
  uint32_t region_depth = 0;
};

struct Scope
{
  std::vector<std::pair<std::string_view, size_t>> bindings;
};

/**
 * Per-path state: counts indexed by candidate id.
 * Ids past the end of `counts` are implicitly 0.
 */
struct FlowState
{
  std::vector<ValueCount> counts;
  bool reachable = true;
};

/**
 * Join of alternative paths.
 *
 * Counts are the per-candidate maximum over the reachable alternatives. When
 * no alternative is reachable, all of them are joined and the result stays
 * unreachable.
 */
FlowState merge(const std::vector<FlowState> & alternatives)
{
  bool any_reachable = false;
  size_t width = 0;
  for (const auto & alt : alternatives) {
    any_reachable = any_reachable || alt.reachable;
    width = std::max(width, alt.counts.size());
  }

  FlowState out;
  out.counts.assign(width, 0);
  out.reachable = any_reachable;
  for (const auto & alt : alternatives) {
    if (any_reachable && !alt.reachable) continue;
    for (size_t i = 0; i < alt.counts.size(); ++i) {
      out.counts[i] = std::max(out.counts[i], alt.counts[i]);
    }
  }
  return out;
}

ts_ll::Node unwrap_parentheses(ts_ll::Node node)
{
  while (!node.is_null() && node.kind() == kind::k_parenthesized_expression &&
         node.named_child_count() > 0) {
    node = node.named_child(0);
  }
  return node;
}

bool is_type_body(ts_ll::Node node)
{
  return !node.is_null() && syntax::is_one_of(node.kind(), syntax::k_type_body_kinds);
}

bool is_instance_initializer(ts_ll::Node block)
{
  return block.kind() == kind::k_block && is_type_body(block.parent());
}

bool is_callable_declaration(std::string_view k)
{
  return k == kind::k_method_declaration || k == kind::k_constructor_declaration ||
         k == kind::k_compact_constructor_declaration;
}

/// A lambda that is not nested in any executable body (e.g. in a field initializer)
bool is_top_level_lambda(ts_ll::Node lambda)
{
  for (ts_ll::Node p = lambda.parent(); !p.is_null(); p = p.parent()) {
    const std::string_view k = p.kind();
    if (
      is_callable_declaration(k) || k == kind::k_static_initializer ||
      k == kind::k_lambda_expression || is_instance_initializer(p)) {
      return false;
    }
    if (is_type_body(p)) {
      return true;
    }
  }
  return true;
}

/// The node a dispatched node is analyzed from, or a null node
ts_ll::Node analysis_unit(ts_ll::Node node)
{
  const std::string_view k = node.kind();
  if (is_callable_declaration(k)) {
    return node.child_by_field(field::k_body);  // null for abstract methods
  }
  if (k == kind::k_static_initializer) {
    for (uint32_t i = 0; i < node.named_child_count(); ++i) {
      if (node.named_child(i).kind() == kind::k_block) return node.named_child(i);
    }
    return {};
  }
  if (k == kind::k_block) {
    return is_instance_initializer(node) ? node : ts_ll::Node();
  }
  if (k == kind::k_lambda_expression) {
    return is_top_level_lambda(node) ? node : ts_ll::Node();
  }
  return {};
}

// ============================================================================
// FinalityAnalyzer
// ============================================================================

/**
 * Walks one executable body in evaluation order.
 *
 * Scopes map names to candidate ids. Each candidate lives in an arena and is
 * identified by its index. Branches run from a snapshot of the state and are
 * joined with `merge`. Disqualification (a second value-giving action, or an
 * assignment from inside a repeating region nested deeper than the
 * declaration) is recorded globally so that no later join can undo it.
 *
 * Nested class bodies are walked in capture-only mode: their own locals are
 * analyzed by separate dispatches, so here they only shadow outer names.
 */
class FinalityAnalyzer
{
public:
  FinalityAnalyzer(const CheckContext & ctx, const FinalLocalVariable::Options & options)
  : ctx_(ctx), options_(options)
  {
  }

  std::vector<Diagnostic> run(ts_ll::Node unit)
  {
    push_scope();
    visit(unit);
    pop_scope();
    return diagnostics_.take();
  }

private:
  // ---------------------------------------------------------------------------
  // Scopes and candidates
  // ---------------------------------------------------------------------------

  void push_scope() { scopes_.emplace_back(); }

  void pop_scope()
  {
    for (const auto & [name, id] : scopes_.back().bindings) {
      const Candidate & c = candidates_[id];
      if (c.binding != Binding::Tracked || disqualified_[id]) continue;
      if (count_of(id) == 1) {
        diagnostics_.report(
          c.name_range, ViolationKind{
                          std::string(FinalLocalVariable::k_violation_id),
                          fmt::format("Variable '{}' should be declared final.", c.name),
                          FixAvailability::None,
                        });
      }
    }
    scopes_.pop_back();
  }

  ValueCount & count_of(size_t id)
  {
    if (state_.counts.size() <= id) {
      state_.counts.resize(id + 1, 0);
    }
    return state_.counts[id];
  }

  void declare(ts_ll::Node name_node, bool has_value, Binding binding)
  {
    if (name_node.is_null()) return;

    const std::string_view name = ctx_.text(name_node);
    if (capture_only_ > 0) {
      binding = Binding::Excluded;
    }
    if (name == "_" && !options_.validate_unnamed_variables) {
      binding = Binding::Excluded;
    }

    const size_t id = candidates_.size();
    candidates_.push_back(Candidate{name, name_node.range(), binding, region_depth_});
    disqualified_.push_back(false);
    scopes_.back().bindings.emplace_back(name, id);
    count_of(id) = has_value ? 1 : 0;
  }

  [[nodiscard]] std::optional<size_t> resolve(std::string_view name) const
  {
    for (auto scope = scopes_.rbegin(); scope != scopes_.rend(); ++scope) {
      for (auto b = scope->bindings.rbegin(); b != scope->bindings.rend(); ++b) {
        if (b->first == name) return b->second;
      }
    }
    return std::nullopt;
  }

  /// One value-giving action on `target` (the left side of an assignment or an update operand)
  void record_assignment(ts_ll::Node target)
  {
    target = unwrap_parentheses(target);
    if (target.is_null()) return;
    if (target.kind() != kind::k_identifier) {
      visit(target);
      return;
    }

    const auto id = resolve(ctx_.text(target));
    if (!id) return;
    const Candidate & c = candidates_[*id];
    if (c.binding == Binding::Excluded) return;

    ValueCount & count = count_of(*id);
    if (region_depth_ > c.region_depth || count >= 1) {
      count = k_many;
      disqualified_[*id] = true;
    } else {
      count = 1;
    }
  }

  void declare_parameters(ts_ll::Node params)
  {
    if (params.is_null()) return;
    const std::string_view k = params.kind();
    if (k == kind::k_identifier) {
      declare(params, true, Binding::Excluded);
      return;
    }
    for (uint32_t i = 0; i < params.named_child_count(); ++i) {
      const ts_ll::Node p = params.named_child(i);
      if (p.kind() == kind::k_identifier) {
        declare(p, true, Binding::Excluded);
      } else if (p.kind() == kind::k_formal_parameter) {
        declare(p.child_by_field(field::k_name), true, Binding::Excluded);
      } else if (p.kind() == kind::k_spread_parameter) {
        for (const ts_ll::Node d : declarators_of(p)) {
          declare(d.child_by_field(field::k_name), true, Binding::Excluded);
        }
      }
    }
  }

  // ---------------------------------------------------------------------------
  // Visitors
  // ---------------------------------------------------------------------------

  void visit(ts_ll::Node node)
  {
    if (node.is_null()) return;

    const std::string_view k = node.kind();
    if (k == kind::k_block || k == kind::k_constructor_body) {
      visit_block(node);
    } else if (k == kind::k_local_variable_declaration) {
      visit_local_declaration(node);
    } else if (k == kind::k_if_statement || k == kind::k_ternary_expression) {
      visit_conditional(node);
    } else if (k == kind::k_while_statement) {
      visit_while(node);
    } else if (k == kind::k_do_statement) {
      visit_do(node);
    } else if (k == kind::k_for_statement) {
      visit_for(node);
    } else if (k == kind::k_enhanced_for_statement) {
      visit_enhanced_for(node);
    } else if (k == kind::k_switch_statement || k == kind::k_switch_expression) {
      visit_switch(node);
    } else if (k == kind::k_try_statement) {
      visit_try(node);
    } else if (k == kind::k_try_with_resources_statement) {
      push_scope();
      visit_resources(node.child_by_field(field::k_resources));
      visit_try(node);
      pop_scope();
    } else if (k == kind::k_lambda_expression) {
      visit_lambda(node);
    } else if (is_type_body(node)) {
      visit_type_body(node);
    } else if (k == kind::k_assignment_expression) {
      visit(node.child_by_field(field::k_right));
      record_assignment(node.child_by_field(field::k_left));
    } else if (k == kind::k_update_expression) {
      ts_ll::Node operand = node.child_by_field(field::k_argument);
      if (operand.is_null() && node.named_child_count() > 0) {
        operand = node.named_child(0);
      }
      record_assignment(operand);
    } else if (syntax::is_one_of(k, syntax::k_abrupt_exit_kinds)) {
      visit_children(node);
      state_.reachable = false;
    } else {
      visit_children(node);
    }
  }

  void visit_children(ts_ll::Node node)
  {
    for (const ts_ll::Node c : statement_children(node)) {
      visit(c);
    }
  }

  void visit_block(ts_ll::Node node)
  {
    push_scope();
    visit_children(node);
    pop_scope();
  }

  void visit_local_declaration(ts_ll::Node decl, Binding binding = Binding::Tracked)
  {
    if (has_modifier(decl, kind::k_final)) {
      binding = Binding::Excluded;
    }
    for (const ts_ll::Node declarator : declarators_of(decl)) {
      const ts_ll::Node value = declarator.child_by_field(field::k_value);
      visit(value);
      declare(declarator.child_by_field(field::k_name), !value.is_null(), binding);
    }
  }

  /// if/else and ?: share the same shape
  void visit_conditional(ts_ll::Node node)
  {
    visit(node.child_by_field(field::k_condition));
    const FlowState entry = state_;

    visit(node.child_by_field(field::k_consequence));
    FlowState taken = std::move(state_);

    state_ = entry;
    visit(node.child_by_field(field::k_alternative));
    state_ = merge({std::move(taken), std::move(state_)});
  }

  void visit_while(ts_ll::Node node)
  {
    ++region_depth_;
    visit(node.child_by_field(field::k_condition));
    const FlowState skipped = state_;
    visit(node.child_by_field(field::k_body));
    --region_depth_;
    state_ = merge({skipped, std::move(state_)});
  }

  void visit_do(ts_ll::Node node)
  {
    ++region_depth_;
    visit(node.child_by_field(field::k_body));
    visit(node.child_by_field(field::k_condition));
    --region_depth_;
  }

  void visit_for(ts_ll::Node node)
  {
    std::vector<ts_ll::Node> init;
    std::vector<ts_ll::Node> update;
    for (uint32_t i = 0; i < node.child_count(); ++i) {
      const ts_ll::Node c = node.child(i);
      if (!c.is_named()) continue;
      const std::string_view f = node.field_name_for_child(i);
      if (f == field::k_init) {
        init.push_back(c);
      } else if (f == field::k_update) {
        update.push_back(c);
      }
    }

    push_scope();
    for (const ts_ll::Node n : init) {
      if (n.kind() == kind::k_local_variable_declaration) {
        visit_local_declaration(n, Binding::Excluded);
      } else {
        visit(n);
      }
    }

    ++region_depth_;
    visit(node.child_by_field(field::k_condition));
    const FlowState skipped = state_;
    visit(node.child_by_field(field::k_body));
    for (const ts_ll::Node n : update) {
      visit(n);
    }
    --region_depth_;
    state_ = merge({skipped, std::move(state_)});
    pop_scope();
  }

  void visit_enhanced_for(ts_ll::Node node)
  {
    visit(node.child_by_field(field::k_value));
    const FlowState skipped = state_;

    push_scope();
    ++region_depth_;
    const bool tracked =
      options_.validate_enhanced_for_loop_variable && !has_modifier(node, kind::k_final);
    declare(
      node.child_by_field(field::k_name), true, tracked ? Binding::Tracked : Binding::Excluded);
    visit(node.child_by_field(field::k_body));
    --region_depth_;
    pop_scope();

    state_ = merge({skipped, std::move(state_)});
  }

  void visit_switch(ts_ll::Node node)
  {
    visit(node.child_by_field(field::k_condition));
    const ts_ll::Node block = node.child_by_field(field::k_body);
    if (block.is_null()) return;

    push_scope();
    const FlowState entry = state_;
    std::vector<FlowState> exits;
    std::optional<FlowState> previous;
    bool previous_falls_through = false;
    bool has_default = false;

    for (const ts_ll::Node arm : statement_children(block)) {
      const bool is_group = arm.kind() == kind::k_switch_block_statement_group;
      if (!is_group && arm.kind() != kind::k_switch_rule) continue;

      if (previous && previous_falls_through && previous->reachable) {
        state_ = *previous;
      } else {
        // Names declared by earlier groups stay in scope with their last known count.
        state_ = entry;
        if (previous && previous->counts.size() > state_.counts.size()) {
          state_.counts.insert(
            state_.counts.end(), previous->counts.begin() + state_.counts.size(),
            previous->counts.end());
        }
      }

      ts_ll::Node last;
      for (const ts_ll::Node c : statement_children(arm)) {
        if (c.kind() == kind::k_switch_label) {
          has_default = has_default || c.has_child_of_kind(kind::k_default);
          continue;
        }
        visit(c);
        last = c;
      }

      previous_falls_through =
        is_group && (last.is_null() || !syntax::is_one_of(last.kind(), syntax::k_jump_kinds));
      if (!previous_falls_through) {
        exits.push_back(state_);
      }
      previous = std::move(state_);
    }

    if (previous && previous_falls_through) {
      exits.push_back(*previous);
    }
    if (!has_default || exits.empty()) {
      exits.push_back(entry);
    }
    state_ = merge(exits);
    pop_scope();
  }

  void visit_resources(ts_ll::Node resources)
  {
    if (resources.is_null()) return;
    for (const ts_ll::Node r : statement_children(resources)) {
      const ts_ll::Node value = r.child_by_field(field::k_value);
      if (value.is_null()) {
        visit(r);
        continue;
      }
      visit(value);
      declare(r.child_by_field(field::k_name), true, Binding::Excluded);
    }
  }

  /// Each catch starts from the state after the body; finally runs after the join
  void visit_try(ts_ll::Node node)
  {
    const bool entry_reachable = state_.reachable;
    visit(node.child_by_field(field::k_body));
    const FlowState after_body = state_;

    std::vector<FlowState> exits{after_body};
    ts_ll::Node finally_clause;
    for (const ts_ll::Node c : statement_children(node)) {
      if (c.kind() == kind::k_catch_clause) {
        state_ = after_body;
        state_.reachable = entry_reachable;
        push_scope();
        for (const ts_ll::Node p : statement_children(c)) {
          if (p.kind() == kind::k_catch_formal_parameter) {
            declare(p.child_by_field(field::k_name), true, Binding::Excluded);
          }
        }
        visit(c.child_by_field(field::k_body));
        pop_scope();
        exits.push_back(std::move(state_));
      } else if (c.kind() == kind::k_finally_clause) {
        finally_clause = c;
      }
    }

    state_ = merge(exits);
    if (!finally_clause.is_null()) {
      visit_children(finally_clause);
    }
  }

  /// The body may run any number of times, including never
  void visit_lambda(ts_ll::Node node)
  {
    const FlowState skipped = state_;
    ++region_depth_;
    push_scope();
    declare_parameters(node.child_by_field(field::k_parameters));
    visit(node.child_by_field(field::k_body));
    pop_scope();
    --region_depth_;
    state_ = merge({skipped, std::move(state_)});
  }

  void visit_type_body(ts_ll::Node body)
  {
    const FlowState skipped = state_;
    ++region_depth_;
    ++capture_only_;
    push_scope();

    const std::vector<ts_ll::Node> members = statement_children(body);
    for (const ts_ll::Node m : members) {
      if (m.kind() != kind::k_field_declaration) continue;
      for (const ts_ll::Node d : declarators_of(m)) {
        declare(d.child_by_field(field::k_name), true, Binding::Excluded);
      }
    }

    for (const ts_ll::Node m : members) {
      if (m.kind() == kind::k_field_declaration) {
        for (const ts_ll::Node d : declarators_of(m)) {
          visit(d.child_by_field(field::k_value));
        }
      } else if (is_callable_declaration(m.kind())) {
        push_scope();
        declare_parameters(m.child_by_field(field::k_parameters));
        visit(m.child_by_field(field::k_body));
        pop_scope();
      } else {
        visit(m);
      }
    }

    pop_scope();
    --capture_only_;
    --region_depth_;
    state_ = merge({skipped, std::move(state_)});
  }

  const CheckContext & ctx_;
  FinalLocalVariable::Options options_;

  std::vector<Candidate> candidates_;
  std::vector<bool> disqualified_;
  std::vector<Scope> scopes_;
  FlowState state_;

  uint32_t region_depth_ = 0;
  uint32_t capture_only_ = 0;

  DiagnosticBag diagnostics_;
};

}  // namespace

// ============================================================================
// FinalLocalVariable
// ============================================================================

std::unique_ptr<FinalLocalVariable> FinalLocalVariable::from_config(const Properties & properties)
{
  Options options;
  options.validate_enhanced_for_loop_variable =
    props::get_bool(properties, k_validate_enhanced_for, false);
  options.validate_unnamed_variables =
    props::get_bool(properties, k_validate_unnamed, false);
  return std::make_unique<FinalLocalVariable>(options);
}

std::optional<gsl::span<const std::string_view>> FinalLocalVariable::relevant_kinds()
  const noexcept
{
  return gsl::span<const std::string_view>(k_relevant_kinds.data(), k_relevant_kinds.size());
}

std::vector<Diagnostic> FinalLocalVariable::check(const CheckContext & ctx, ts_ll::Node node) const
{
  const ts_ll::Node unit = analysis_unit(node);
  if (unit.is_null()) {
    return {};
  }
  FinalityAnalyzer analyzer(ctx, options_);
  return analyzer.run(unit);
}

}  // namespace jlint::rules
