#pragma once
#include <quill/css/parser/selector.h>
#include <quill/css/parser/tokenizer.h>
#include <string>
#include <variant>
#include <vector>

namespace quill::css {

struct Declaration {
    std::string property;
    // Raw value tokens. Bracketed runs stay flat and balanced.
    std::vector<CSSToken> terms;
    size_t start_offset = 0;  // start of the property name
    size_t end_offset = 0;    // end of the last term

    std::string value_text() const { return serialize_tokens(terms); }
    std::string to_string() const;
    bool operator==(const Declaration& other) const;
};

struct StyleRule {
    SelectorGroup selectors;
    std::vector<Declaration> declarations;

    std::string to_string() const;
};

// An at-rule is kept as raw tokens; interpreting it is left to the caller.
struct AtRule {
    std::string keyword;             // without '@'
    std::vector<CSSToken> header;    // tokens before '{' or ';'
    std::vector<CSSToken> body;      // block contents, braces stripped
    bool has_block = false;          // false when terminated by ';'

    std::string to_string() const;
};

using Rule = std::variant<StyleRule, AtRule>;

struct StyleSheet {
    std::vector<Rule> rules;

    std::vector<const StyleRule*> style_rules() const;
    std::vector<const AtRule*> at_rules() const;
    std::string to_string() const;
};

std::ostream& operator<<(std::ostream& os, const Declaration& declaration);

} // namespace quill::css
