// jlint_dump_ast - Dump the tree-sitter-java CST of a Java source
//
// Usage:
//   jlint_dump_ast [--named] < MyClass.java
//
#include <fmt/core.h>

#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>

#include "jlint/syntax/cst_dumper.hpp"
#include "jlint/syntax/frontend.hpp"

namespace
{

void print_usage(const char * program_name)
{
  std::cerr << "Usage: " << program_name << " [--named] < File.java\n\n"
            << "Options:\n"
            << "  --named      Only print named nodes\n"
            << "  -h, --help   Show this help message\n";
}

}  // namespace

int main(int argc, char * argv[])
{
  bool named_only = false;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--named") {
      named_only = true;
    } else if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      return 0;
    } else {
      fmt::print(stderr, "error: unknown argument '{}'\n", arg);
      print_usage(argv[0]);
      return 2;
    }
  }

  std::string source(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>{});
  if (std::cin.bad()) {
    fmt::print(stderr, "error: failed to read stdin\n");
    return 1;
  }
  if (source.find_first_not_of(" \t\r\n") == std::string::npos) {
    fmt::print(stderr, "error: no input provided; pipe a Java file to stdin\n");
    print_usage(argv[0]);
    return 1;
  }

  try {
    const auto parsed = jlint::parse_source(std::move(source), "<stdin>");
    if (!parsed->is_analyzable()) {
      fmt::print(stderr, "error: failed to parse Java source\n");
      return 1;
    }

    jlint::CstDumper dumper(std::cout, parsed->source);
    dumper.set_named_only(named_only);
    dumper.dump(parsed->root());
  } catch (const std::runtime_error & e) {
    fmt::print(stderr, "error: {}\n", e.what());
    return 1;
  }
  return 0;
}
