#ifndef QUILL_CORE_CONFIG_H
#define QUILL_CORE_CONFIG_H

#include <cstddef>

namespace quill::core::config {

// Bracket blocks and combinator chains deeper than this are rejected with a
// parse error.
inline constexpr std::size_t kDefaultMaxNestingDepth = 256;

inline constexpr const char kDiagnosticsModule[] = "css";

inline constexpr const char kProgramName[] = "quill_css";
inline constexpr const char kVersionString[] = "quill_css 0.1.0";

}  // namespace quill::core::config

#endif  // QUILL_CORE_CONFIG_H
