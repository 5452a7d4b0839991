// jlint/rules/unused_imports.cpp - Imports that are never referenced
#include "jlint/rules/unused_imports.hpp"

#include <fmt/format.h>

#include <array>
#include <cctype>
#include <regex>

#include "jlint/rules/rule_utils.hpp"
#include "jlint/syntax/node_kinds.hpp"

namespace jlint::rules
{

namespace
{

namespace kind = syntax::kind;

constexpr std::array<std::string_view, 1> k_relevant_kinds = {kind::k_program};

constexpr std::string_view k_java_lang = "java.lang";

// {@link X}, {@linkplain X#m(A, B)}, {@value X#F}
const std::regex & inline_tag_pattern()
{
  static const std::regex re(R"(\{@(?:link|linkplain|value)\s+([^}\s][^}]*)\})");
  return re;
}

// @see X, @throws X, @exception X
const std::regex & block_tag_pattern()
{
  static const std::regex re(R"(@(?:see|throws|exception)\s+([A-Za-z_$][\w$.#]*(?:\([^)]*\))?))");
  return re;
}

const std::regex & identifier_pattern()
{
  static const std::regex re(R"([A-Za-z_$][\w$]*)");
  return re;
}

/// Add every identifier of a Javadoc reference ("Map.Entry#get(List)") to `out`
void add_reference_names(const std::string & reference, std::set<std::string, std::less<>> & out)
{
  auto begin = std::sregex_iterator(reference.begin(), reference.end(), identifier_pattern());
  for (auto it = begin; it != std::sregex_iterator(); ++it) {
    out.insert(it->str());
  }
}

void scan_javadoc(std::string_view comment, std::set<std::string, std::less<>> & out)
{
  const std::string text(comment);
  for (const std::regex * re : {&inline_tag_pattern(), &block_tag_pattern()}) {
    auto begin = std::sregex_iterator(text.begin(), text.end(), *re);
    for (auto it = begin; it != std::sregex_iterator(); ++it) {
      add_reference_names((*it)[1].str(), out);
    }
  }
}

size_t segment_count(std::string_view path)
{
  size_t n = 1;
  for (const char c : path) {
    if (c == '.') ++n;
  }
  return n;
}

bool is_blank(std::string_view s)
{
  for (const char c : s) {
    if (!std::isspace(static_cast<unsigned char>(c))) return false;
  }
  return true;
}

/// Delete the whole line when the import is alone on it, otherwise just the import
Edit delete_import(const SourceFile & sf, SourceRange range)
{
  const LineColumn first = sf.get_line_column(range.get_begin());
  const LineColumn last = sf.get_line_column(range.get_end());
  const uint32_t line_begin = sf.get_line_offset(first.line - 1);
  const uint32_t next_line = sf.get_line_offset(last.line);

  const std::string_view before =
    sf.get_slice(SourceRange(line_begin, range.get_begin().get_offset()));
  const std::string_view after = sf.get_slice(SourceRange(range.get_end().get_offset(), next_line));
  if (is_blank(before) && is_blank(after)) {
    return Edit::deletion(SourceRange(line_begin, next_line));
  }
  return Edit::deletion(range);
}

}  // namespace

std::unique_ptr<UnusedImports> UnusedImports::from_config(const Properties & properties)
{
  return std::make_unique<UnusedImports>(props::get_bool(properties, k_process_javadoc, true));
}

std::optional<gsl::span<const std::string_view>> UnusedImports::relevant_kinds() const noexcept
{
  return gsl::span<const std::string_view>(k_relevant_kinds.data(), k_relevant_kinds.size());
}

std::set<std::string, std::less<>> UnusedImports::collect_references(
  const CheckContext & ctx, ts_ll::Node program) const
{
  std::set<std::string, std::less<>> names;

  ts_ll::Cursor cursor(program);
  bool done = false;
  while (!done) {
    const ts_ll::Node n = cursor.current_node();
    const std::string_view k = n.kind();

    bool descend = true;
    if (k == kind::k_import_declaration || k == kind::k_package_declaration) {
      descend = false;
    } else if (k == kind::k_identifier || k == kind::k_type_identifier) {
      names.emplace(ctx.text(n));
    } else if (k == kind::k_block_comment) {
      const std::string_view text = ctx.text(n);
      if (process_javadoc_ && text.substr(0, 3) == "/**") {
        scan_javadoc(text, names);
      }
    }

    if (descend && cursor.goto_first_child()) {
      continue;
    }
    while (!cursor.goto_next_sibling()) {
      if (!cursor.goto_parent()) {
        done = true;
        break;
      }
    }
  }

  return names;
}

std::vector<Diagnostic> UnusedImports::check(const CheckContext & ctx, ts_ll::Node node) const
{
  const std::vector<ImportInfo> imports = collect_imports(node, ctx.source());
  if (imports.empty()) {
    return {};
  }

  const auto package = get_package_name(node, ctx.source());
  const auto references = collect_references(ctx, node);

  DiagnosticBag diags;
  for (const ImportInfo & import : imports) {
    if (import.is_wildcard || !import.simple_name) continue;

    bool unused = references.find(*import.simple_name) == references.end();
    if (!import.is_static) {
      const auto import_package = import.package();
      if (import_package == k_java_lang && segment_count(import.path) == 3) {
        unused = true;
      } else if (package && import_package == std::string_view(*package)) {
        unused = true;
      }
    }
    if (!unused) continue;

    diags
      .report(
        import.range,
        ViolationKind{
          std::string(k_violation_id),
          fmt::format("Unused import - {}.", import.path),
          FixAvailability::Always,
        })
      .with_edit(delete_import(ctx.source(), import.range));
  }
  return diags.take();
}

}  // namespace jlint::rules
