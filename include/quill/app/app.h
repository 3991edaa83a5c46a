#pragma once

#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace quill::app {

inline constexpr int kExitOk = 0;
inline constexpr int kExitSourceError = 1;
inline constexpr int kExitUsage = 2;

// Runs the command-line tool on `arguments` (without the program name).
// A location of "-" reads the stylesheet from `in`. The normalized result goes
// to `out`; usage text and diagnostics go to `err`.
int run(const std::vector<std::string>& arguments, std::istream& in, std::ostream& out,
        std::ostream& err);

}  // namespace quill::app
