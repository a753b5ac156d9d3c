#ifndef COWLIST_TOOLS_BENCH_FLAGS_HPP
#define COWLIST_TOOLS_BENCH_FLAGS_HPP

namespace cowlist::tools {

class BenchFlags {
 public:
  // Number of elements in the list every round starts from.
  int count = 10000;
  // Number of copies taken of that list before mutating them.
  int copies = 4;
  int rounds = 10;
  bool trace_cow = false;
  bool verbose = false;
};

// Parses the command line. On a malformed command line, prints the problem
// and the usage text to stderr and rethrows.
BenchFlags ExtractFlags(int argc, char const* const* argv);

}  // namespace cowlist::tools

#endif
