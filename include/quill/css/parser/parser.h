#pragma once
#include <quill/core/config.h>
#include <quill/css/parser/selector.h>
#include <quill/css/parser/stylesheet.h>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace quill::core {
class DiagnosticEmitter;
}

namespace quill::css {

struct ParseError {
    std::string message;
    size_t line = 0;
    size_t position = 0;  // byte offset of the offending token

    std::string to_string() const;
    bool operator==(const ParseError& other) const;
};

// Thrown inside the parser and caught at the nearest recovery point.
// Malformed CSS never reaches the caller as an exception.
class CSSParseException : public std::runtime_error {
public:
    explicit CSSParseException(ParseError error);
    const ParseError& error() const { return error_; }

private:
    ParseError error_;
};

struct ParserOptions {
    size_t max_nesting_depth = core::config::kDefaultMaxNestingDepth;
};

struct StyleSheetParseResult {
    StyleSheet stylesheet;
    std::vector<ParseError> errors;
};

struct DeclarationListParseResult {
    std::vector<Declaration> declarations;
    std::vector<ParseError> errors;
};

struct SelectorGroupParseResult {
    SelectorGroup selectors;
    std::vector<ParseError> errors;
};

// Recursive-descent parser for the supported CSS subset. All parse state is
// local to a single call, so one parser may be reused for many documents.
class CSSParser {
public:
    CSSParser() = default;
    explicit CSSParser(ParserOptions options);

    StyleSheetParseResult parse_stylesheet(std::string_view css) const;

    // Parses the contents of an inline style attribute, e.g. "fill: red; stroke: blue".
    DeclarationListParseResult parse_declaration_list(std::string_view css) const;

    SelectorGroupParseResult parse_selector_group(std::string_view css) const;

    const ParserOptions& options() const { return options_; }

private:
    ParserOptions options_;
};

StyleSheetParseResult parse_stylesheet(std::string_view css);
DeclarationListParseResult parse_declaration_list(std::string_view css);
SelectorGroupParseResult parse_selector_group(std::string_view css);

// Forwards parse errors to the diagnostics layer as warnings.
void report_parse_errors(const std::vector<ParseError>& errors,
                         core::DiagnosticEmitter& emitter,
                         const std::string& stage);

} // namespace quill::css
