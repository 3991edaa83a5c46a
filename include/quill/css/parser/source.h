#pragma once
#include <quill/css/parser/parser.h>
#include <istream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace quill::css {

// Failure to read a stylesheet source. Distinct from ParseError: malformed
// CSS never produces a SourceError.
class SourceError : public std::runtime_error {
public:
    explicit SourceError(const std::string& message) : std::runtime_error(message) {}
};

// Validates UTF-8, replacing every invalid sequence with U+FFFD, and strips
// a leading byte order mark.
std::string decode_utf8(std::string_view bytes);

std::string read_source(std::istream& in);

// `location` is a filesystem path or a `file:` URL.
std::string load_source(const std::string& location);

StyleSheetParseResult parse_stylesheet(std::istream& in,
                                       const ParserOptions& options = {});
StyleSheetParseResult load_stylesheet(const std::string& location,
                                      const ParserOptions& options = {});

} // namespace quill::css
