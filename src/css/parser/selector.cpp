#include <quill/css/parser/selector.h>

namespace quill::css {

namespace {

std::string ident_css(const std::string& name) {
    CSSToken token;
    token.type = CSSToken::Ident;
    token.value = name;
    return token.to_css();
}

std::string string_css(const std::string& value) {
    CSSToken token;
    token.type = CSSToken::String;
    token.value = value;
    return token.to_css();
}

bool same_operand(const SelectorPtr& a, const SelectorPtr& b) {
    if (!a || !b) return a == b;
    return *a == *b;
}

SelectorPtr make_simple(SelectorKind kind, std::string name) {
    auto selector = std::make_shared<Selector>();
    selector->kind = kind;
    selector->name = std::move(name);
    return selector;
}

} // namespace

// ---------------------------------------------------------------------------
// Factories
// ---------------------------------------------------------------------------

SelectorPtr Selector::universal() {
    return make_simple(SelectorKind::Universal, "");
}

SelectorPtr Selector::type(std::string name) {
    return make_simple(SelectorKind::Type, std::move(name));
}

SelectorPtr Selector::id(std::string name) {
    return make_simple(SelectorKind::Id, std::move(name));
}

SelectorPtr Selector::class_name(std::string name) {
    return make_simple(SelectorKind::Class, std::move(name));
}

SelectorPtr Selector::attribute(std::string name, AttributeMatch match,
                                std::optional<std::string> value) {
    auto selector = std::make_shared<Selector>();
    selector->kind = SelectorKind::Attribute;
    selector->name = std::move(name);
    selector->attr_match = match;
    selector->attr_value = std::move(value);
    return selector;
}

SelectorPtr Selector::pseudo_class(std::string name) {
    return make_simple(SelectorKind::PseudoClass, std::move(name));
}

SelectorPtr Selector::pseudo_class_function(std::string name, std::vector<CSSToken> arguments) {
    auto selector = std::make_shared<Selector>();
    selector->kind = SelectorKind::PseudoClassFunction;
    selector->name = std::move(name);
    selector->arguments = std::move(arguments);
    return selector;
}

SelectorPtr Selector::negation(std::string name, SelectorPtr inner) {
    auto selector = std::make_shared<Selector>();
    selector->kind = SelectorKind::Negation;
    selector->name = std::move(name);
    selector->left = std::move(inner);
    return selector;
}

SelectorPtr Selector::select_nothing() {
    return make_simple(SelectorKind::SelectNothing, "");
}

SelectorPtr Selector::combine(SelectorKind combinator, SelectorPtr left, SelectorPtr right) {
    auto selector = std::make_shared<Selector>();
    selector->kind = combinator;
    selector->left = std::move(left);
    selector->right = std::move(right);
    return selector;
}

// ---------------------------------------------------------------------------
// Selector
// ---------------------------------------------------------------------------

bool Selector::is_simple() const {
    return !is_combinator();
}

bool Selector::is_combinator() const {
    switch (kind) {
        case SelectorKind::And:
        case SelectorKind::Descendant:
        case SelectorKind::Child:
        case SelectorKind::AdjacentSibling:
        case SelectorKind::GeneralSibling:
            return true;
        default:
            return false;
    }
}

std::string Selector::to_string() const {
    auto operand = [](const SelectorPtr& s) { return s ? s->to_string() : std::string(); };

    switch (kind) {
        case SelectorKind::Universal:
            return "*";
        case SelectorKind::Type:
            return ident_css(name);
        case SelectorKind::Id: {
            CSSToken hash;
            hash.type = CSSToken::Hash;
            hash.value = name;
            return hash.to_css();
        }
        case SelectorKind::Class:
            return "." + ident_css(name);
        case SelectorKind::Attribute: {
            std::string out = "[" + ident_css(name);
            if (attr_match != AttributeMatch::Exists) {
                out += attribute_match_operator(attr_match);
                out += string_css(attr_value.value_or(""));
            }
            return out + "]";
        }
        case SelectorKind::PseudoClass:
            return ":" + ident_css(name);
        case SelectorKind::PseudoClassFunction:
            return ":" + ident_css(name) + "(" + serialize_tokens(arguments) + ")";
        case SelectorKind::Negation:
            return ":" + ident_css(name) + "(" + operand(left) + ")";
        case SelectorKind::SelectNothing:
            return ":not(*)";
        case SelectorKind::And:
            return operand(left) + operand(right);
        case SelectorKind::Descendant:
            return operand(left) + " " + operand(right);
        case SelectorKind::Child:
            return operand(left) + " > " + operand(right);
        case SelectorKind::AdjacentSibling:
            return operand(left) + " + " + operand(right);
        case SelectorKind::GeneralSibling:
            return operand(left) + " ~ " + operand(right);
    }
    return "";
}

bool Selector::operator==(const Selector& other) const {
    return kind == other.kind && name == other.name &&
           attr_match == other.attr_match && attr_value == other.attr_value &&
           arguments == other.arguments &&
           same_operand(left, other.left) && same_operand(right, other.right);
}

// ---------------------------------------------------------------------------
// SelectorGroup
// ---------------------------------------------------------------------------

std::string SelectorGroup::to_string() const {
    std::string out;
    for (size_t i = 0; i < selectors.size(); ++i) {
        if (i > 0) out += ", ";
        out += selectors[i] ? selectors[i]->to_string() : std::string();
    }
    return out;
}

bool SelectorGroup::operator==(const SelectorGroup& other) const {
    if (selectors.size() != other.selectors.size()) return false;
    for (size_t i = 0; i < selectors.size(); ++i) {
        if (!same_operand(selectors[i], other.selectors[i])) return false;
    }
    return true;
}

const char* selector_kind_name(SelectorKind kind) {
    switch (kind) {
        case SelectorKind::Universal:           return "Universal";
        case SelectorKind::Type:                return "Type";
        case SelectorKind::Id:                  return "Id";
        case SelectorKind::Class:               return "Class";
        case SelectorKind::Attribute:           return "Attribute";
        case SelectorKind::PseudoClass:         return "PseudoClass";
        case SelectorKind::PseudoClassFunction: return "PseudoClassFunction";
        case SelectorKind::Negation:            return "Negation";
        case SelectorKind::SelectNothing:       return "SelectNothing";
        case SelectorKind::And:                 return "And";
        case SelectorKind::Descendant:          return "Descendant";
        case SelectorKind::Child:               return "Child";
        case SelectorKind::AdjacentSibling:     return "AdjacentSibling";
        case SelectorKind::GeneralSibling:      return "GeneralSibling";
    }
    return "Unknown";
}

const char* attribute_match_operator(AttributeMatch match) {
    switch (match) {
        case AttributeMatch::Exists:    return "";
        case AttributeMatch::Equals:    return "=";
        case AttributeMatch::Includes:  return "~=";
        case AttributeMatch::DashMatch: return "|=";
        case AttributeMatch::Prefix:    return "^=";
        case AttributeMatch::Suffix:    return "$=";
        case AttributeMatch::Substring: return "*=";
    }
    return "";
}

std::ostream& operator<<(std::ostream& os, const Selector& selector) {
    return os << selector_kind_name(selector.kind) << "(" << selector.to_string() << ")";
}

std::ostream& operator<<(std::ostream& os, const SelectorGroup& group) {
    return os << group.to_string();
}

} // namespace quill::css
