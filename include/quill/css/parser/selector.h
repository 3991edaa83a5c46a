#pragma once
#include <quill/css/parser/tokenizer.h>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace quill::css {

enum class SelectorKind {
    // Simple selectors
    Universal,           // *
    Type,                // div, rect
    Id,                  // #bar
    Class,               // .foo
    Attribute,           // [attr=val]
    PseudoClass,         // :hover
    PseudoClassFunction, // :nth-child(2n)
    Negation,            // :not(.foo)
    SelectNothing,       // stands in for a selector that failed to parse
    // Combinators
    And,                 // a.b
    Descendant,          // a b
    Child,               // a > b
    AdjacentSibling,     // a + b
    GeneralSibling       // a ~ b
};

enum class AttributeMatch {
    Exists,     // [attr]
    Equals,     // [attr=val]
    Includes,   // [attr~=val]
    DashMatch,  // [attr|=val]
    Prefix,     // [attr^=val]
    Suffix,     // [attr$=val]
    Substring   // [attr*=val]
};

struct Selector;
using SelectorPtr = std::shared_ptr<const Selector>;

// A node of a selector tree. Combinator nodes hold a simple selector on the
// left and the rest of the chain on the right, so chains lean right:
// "a > b > c" is Child(a, Child(b, c)).
struct Selector {
    SelectorKind kind = SelectorKind::Universal;

    // Type, Id, Class, Attribute and pseudo-class name
    std::string name;

    // Attribute selector specifics
    AttributeMatch attr_match = AttributeMatch::Exists;
    std::optional<std::string> attr_value;

    // PseudoClassFunction argument tokens, uninterpreted
    std::vector<CSSToken> arguments;

    // Negation: left is the negated simple selector.
    // Combinators: left and right operands.
    SelectorPtr left;
    SelectorPtr right;

    bool is_simple() const;
    bool is_combinator() const;

    std::string to_string() const;

    bool operator==(const Selector& other) const;
    bool operator!=(const Selector& other) const { return !(*this == other); }

    static SelectorPtr universal();
    static SelectorPtr type(std::string name);
    static SelectorPtr id(std::string name);
    static SelectorPtr class_name(std::string name);
    static SelectorPtr attribute(std::string name, AttributeMatch match = AttributeMatch::Exists,
                                 std::optional<std::string> value = std::nullopt);
    static SelectorPtr pseudo_class(std::string name);
    static SelectorPtr pseudo_class_function(std::string name, std::vector<CSSToken> arguments = {});
    static SelectorPtr negation(std::string name, SelectorPtr inner);
    static SelectorPtr select_nothing();
    static SelectorPtr combine(SelectorKind combinator, SelectorPtr left, SelectorPtr right);
};

// Comma-separated alternatives
struct SelectorGroup {
    std::vector<SelectorPtr> selectors;

    std::string to_string() const;
    bool operator==(const SelectorGroup& other) const;
    bool operator!=(const SelectorGroup& other) const { return !(*this == other); }
};

const char* selector_kind_name(SelectorKind kind);
const char* attribute_match_operator(AttributeMatch match);

std::ostream& operator<<(std::ostream& os, const Selector& selector);
std::ostream& operator<<(std::ostream& os, const SelectorGroup& group);

} // namespace quill::css
