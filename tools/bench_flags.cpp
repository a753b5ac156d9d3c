#include "tools/bench_flags.hpp"

#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>

#include "absl/strings/str_format.h"
#include "argparse/argparse.hpp"

namespace cowlist::tools {

namespace {

int PositiveArgument(argparse::ArgumentParser const& program,
                     std::string const& name) {
  auto value = program.get<int>(name);
  if (value <= 0) {
    throw std::runtime_error(
        absl::StrFormat("%s must be positive, got %d", name, value));
  }
  return value;
}

}  // namespace

BenchFlags ExtractFlags(int argc, char const* const* argv) {
  BenchFlags flags;

  argparse::ArgumentParser program("cowlist_bench");
  program.add_description("Exercises copy-on-write sharing of LinkedList.");
  program.add_argument("--count")
      .help("number of elements in the shared list")
      .default_value(flags.count)
      .scan<'i', int>();
  program.add_argument("--copies")
      .help("number of copies mutated per round")
      .default_value(flags.copies)
      .scan<'i', int>();
  program.add_argument("--rounds")
      .help("number of rounds to run")
      .default_value(flags.rounds)
      .scan<'i', int>();
  program.add_argument("--trace_cow")
      .help("log every copy-on-write clone to stderr")
      .default_value(false)
      .flag();
  program.add_argument("--verbose")
      .help("print per-round timings")
      .default_value(false)
      .flag();

  try {
    program.parse_args(argc, argv);
    flags.count = PositiveArgument(program, "--count");
    flags.copies = PositiveArgument(program, "--copies");
    flags.rounds = PositiveArgument(program, "--rounds");
    flags.trace_cow = program.get<bool>("--trace_cow");
    flags.verbose = program.get<bool>("--verbose");
    return flags;
  } catch (const std::exception& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << program;
    throw;
  }
}

}  // namespace cowlist::tools
