#include <quill/css/parser/parser.h>
#include <quill/core/diagnostics.h>
#include <quill/css/parser/tokenizer.h>
#include <algorithm>
#include <cctype>
#include <iterator>

namespace quill::css {

// ---------------------------------------------------------------------------
// ParseError
// ---------------------------------------------------------------------------

std::string ParseError::to_string() const {
    return "line " + std::to_string(line) + ", offset " + std::to_string(position) +
           ": " + message;
}

bool ParseError::operator==(const ParseError& other) const {
    return message == other.message && line == other.line && position == other.position;
}

CSSParseException::CSSParseException(ParseError error)
    : std::runtime_error(error.to_string()), error_(std::move(error)) {}

namespace {

// ---------------------------------------------------------------------------
// Parse context
// ---------------------------------------------------------------------------

// Everything a single parse call mutates. Created per call and passed to
// every grammar production.
struct ParseContext {
    ParseContext(CSSTokenizer& tokenizer, const ParserOptions& parser_options)
        : tt(tokenizer), options(parser_options) {}

    CSSTokenizer& tt;
    const ParserOptions& options;
    std::vector<ParseError> errors;

    size_t depth = 0;            // recursion depth of blocks and selector chains
    std::vector<CSSToken::Type> open_terms; // closers still owed by the current declaration value
    bool rule_block_open = false; // the current style rule has consumed its '{'

    void record(const CSSParseException& e) { errors.push_back(e.error()); }
};

[[noreturn]] void fail(const std::string& production, const std::string& expected,
                       const CSSToken& found) {
    throw CSSParseException(ParseError{
        production + ": " + expected + " expected, found " + describe_token(found),
        found.line, found.start_offset});
}

[[noreturn]] void fail_at(const std::string& message, const CSSToken& at) {
    throw CSSParseException(ParseError{message, at.line, at.start_offset});
}

class DepthGuard {
public:
    explicit DepthGuard(ParseContext& ctx) : ctx_(ctx) {
        if (ctx_.depth >= ctx_.options.max_nesting_depth) {
            fail_at("nesting deeper than " + std::to_string(ctx_.options.max_nesting_depth) +
                    " levels", ctx_.tt.current());
        }
        ++ctx_.depth;
    }
    ~DepthGuard() { --ctx_.depth; }

    DepthGuard(const DepthGuard&) = delete;
    DepthGuard& operator=(const DepthGuard&) = delete;

private:
    ParseContext& ctx_;
};

bool is_insignificant(const CSSToken& token) {
    return token.type == CSSToken::Whitespace || token.type == CSSToken::Comment ||
           token.type == CSSToken::CDO || token.type == CSSToken::CDC;
}

// Advances past whitespace, comments, CDO and CDC starting at the current
// token; returns the first significant token.
CSSToken skip_insignificant(ParseContext& ctx) {
    CSSToken token = ctx.tt.current();
    while (is_insignificant(token)) {
        token = ctx.tt.next_token_no_skip();
    }
    return token;
}

// Selector-level terminators are handed back so the enclosing production
// still sees them.
void unread_if_selector_boundary(ParseContext& ctx, const CSSToken& token) {
    if (token.type == CSSToken::LeftBrace || token.type == CSSToken::Comma ||
        token.type == CSSToken::EndOfFile) {
        ctx.tt.push_back();
    }
}

void trim_whitespace(std::vector<CSSToken>& tokens) {
    auto blank = [](const CSSToken& t) {
        return t.type == CSSToken::Whitespace || t.type == CSSToken::Comment;
    };
    while (!tokens.empty() && blank(tokens.back())) {
        tokens.pop_back();
    }
    auto first = std::find_if_not(tokens.begin(), tokens.end(), blank);
    tokens.erase(tokens.begin(), first);
}

std::string ascii_lower(std::string value) {
    std::transform(
        value.begin(),
        value.end(),
        value.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

// ---------------------------------------------------------------------------
// Component values (at-rule headers and bodies)
// ---------------------------------------------------------------------------

void parse_component_value(ParseContext& ctx, std::vector<CSSToken>& out);

void parse_block(ParseContext& ctx, std::vector<CSSToken>& out,
                 CSSToken::Type open_type, CSSToken::Type close_type,
                 const char* production, const char* opener, const char* closer) {
    DepthGuard guard(ctx);
    CSSToken open = ctx.tt.next_token_no_skip();
    if (open.type != open_type) {
        fail(production, opener, open);
    }
    out.push_back(open);
    while (true) {
        CSSToken token = ctx.tt.next_token_no_skip();
        if (token.type == close_type) {
            out.push_back(token);
            return;
        }
        if (token.type == CSSToken::EndOfFile) {
            fail(production, closer, token);
        }
        ctx.tt.push_back();
        parse_component_value(ctx, out);
    }
}

void parse_curly_block(ParseContext& ctx, std::vector<CSSToken>& out) {
    parse_block(ctx, out, CSSToken::LeftBrace, CSSToken::RightBrace, "CurlyBlock", "'{'", "'}'");
}

void parse_round_block(ParseContext& ctx, std::vector<CSSToken>& out) {
    parse_block(ctx, out, CSSToken::LeftParen, CSSToken::RightParen, "RoundBlock", "'('", "')'");
}

void parse_square_block(ParseContext& ctx, std::vector<CSSToken>& out) {
    parse_block(ctx, out, CSSToken::LeftBracket, CSSToken::RightBracket, "SquareBlock", "'['", "']'");
}

void parse_function_block(ParseContext& ctx, std::vector<CSSToken>& out) {
    parse_block(ctx, out, CSSToken::Function, CSSToken::RightParen, "FunctionBlock", "function", "')'");
}

void parse_component_value(ParseContext& ctx, std::vector<CSSToken>& out) {
    CSSToken token = ctx.tt.next_token_no_skip();
    switch (token.type) {
        case CSSToken::LeftBrace:
            ctx.tt.push_back();
            parse_curly_block(ctx, out);
            break;
        case CSSToken::LeftParen:
            ctx.tt.push_back();
            parse_round_block(ctx, out);
            break;
        case CSSToken::LeftBracket:
            ctx.tt.push_back();
            parse_square_block(ctx, out);
            break;
        case CSSToken::Function:
            ctx.tt.push_back();
            parse_function_block(ctx, out);
            break;
        case CSSToken::EndOfFile:
            fail("ComponentValue", "token", token);
        default:
            out.push_back(token);
            break;
    }
}

// ---------------------------------------------------------------------------
// At-rules
// ---------------------------------------------------------------------------

AtRule parse_at_rule(ParseContext& ctx) {
    CSSToken at = ctx.tt.next_token_no_skip();
    if (at.type != CSSToken::AtKeyword) {
        fail("AtRule", "at-keyword", at);
    }

    AtRule rule;
    rule.keyword = at.value;

    while (true) {
        CSSToken token = ctx.tt.next_token_no_skip();
        if (token.type == CSSToken::Semicolon) {
            trim_whitespace(rule.header);
            return rule;
        }
        if (token.type == CSSToken::LeftBrace) {
            break;
        }
        if (token.type == CSSToken::EndOfFile) {
            fail("AtRule", "'{' or ';'", token);
        }
        ctx.tt.push_back();
        parse_component_value(ctx, rule.header);
    }

    ctx.tt.push_back();
    parse_curly_block(ctx, rule.body);
    // Strip the outer braces
    rule.body.erase(rule.body.begin());
    rule.body.pop_back();

    trim_whitespace(rule.header);
    trim_whitespace(rule.body);
    rule.has_block = true;
    return rule;
}

// ---------------------------------------------------------------------------
// Selectors
// ---------------------------------------------------------------------------

SelectorPtr parse_simple_selector(ParseContext& ctx);

SelectorPtr parse_attribute_selector(ParseContext& ctx) {
    CSSToken open = ctx.tt.next_token_no_skip();
    if (open.type != CSSToken::LeftBracket) {
        fail("AttributeSelector", "'['", open);
    }

    CSSToken name = ctx.tt.next_token();
    if (name.type != CSSToken::Ident) {
        unread_if_selector_boundary(ctx, name);
        fail("AttributeSelector", "identifier", name);
    }

    CSSToken op = ctx.tt.next_token();
    AttributeMatch match = AttributeMatch::Exists;
    switch (op.type) {
        case CSSToken::RightBracket:
            return Selector::attribute(name.value);
        case CSSToken::IncludeMatch:   match = AttributeMatch::Includes; break;
        case CSSToken::DashMatch:      match = AttributeMatch::DashMatch; break;
        case CSSToken::PrefixMatch:    match = AttributeMatch::Prefix; break;
        case CSSToken::SuffixMatch:    match = AttributeMatch::Suffix; break;
        case CSSToken::SubstringMatch: match = AttributeMatch::Substring; break;
        default:
            if (op.is_delim('=')) {
                match = AttributeMatch::Equals;
                break;
            }
            unread_if_selector_boundary(ctx, op);
            fail("AttributeSelector", "operator or ']'", op);
    }

    CSSToken value = ctx.tt.next_token();
    if (value.type != CSSToken::Ident && value.type != CSSToken::String &&
        value.type != CSSToken::Number) {
        unread_if_selector_boundary(ctx, value);
        fail("AttributeSelector", "identifier, string or number", value);
    }

    CSSToken close = ctx.tt.next_token();
    if (close.type != CSSToken::RightBracket) {
        unread_if_selector_boundary(ctx, close);
        fail("AttributeSelector", "']'", close);
    }

    return Selector::attribute(name.value, match, value.value);
}

SelectorPtr parse_function_pseudo_class(ParseContext& ctx) {
    CSSToken function = ctx.tt.next_token_no_skip();
    if (function.type != CSSToken::Function) {
        fail("FunctionPseudoClassSelector", "function", function);
    }
    const std::string& name = function.value;

    if (ascii_lower(name) == "not") {
        DepthGuard guard(ctx);
        SelectorPtr inner = parse_simple_selector(ctx);
        CSSToken close = ctx.tt.next_token();
        if (close.type != CSSToken::RightParen) {
            unread_if_selector_boundary(ctx, close);
            fail(":" + name + "() Selector", "')'", close);
        }
        return Selector::negation(name, std::move(inner));
    }

    // Other functions keep their arguments as raw tokens
    std::vector<CSSToken> arguments;
    size_t nesting = 0;
    while (true) {
        CSSToken token = ctx.tt.next_token_no_skip();
        if (token.type == CSSToken::EndOfFile) {
            ctx.tt.push_back();
            fail(":" + name + "() Selector", "')'", token);
        }
        if (token.type == CSSToken::LeftBrace || token.type == CSSToken::RightBrace) {
            // Leave the brace for the enclosing rule
            ctx.tt.push_back();
            fail(":" + name + "() Selector", "')'", token);
        }
        if (token.type == CSSToken::RightParen) {
            if (nesting == 0) break;
            --nesting;
        } else if (token.type == CSSToken::LeftParen || token.type == CSSToken::Function) {
            ++nesting;
        }
        arguments.push_back(token);
    }
    trim_whitespace(arguments);
    return Selector::pseudo_class_function(name, std::move(arguments));
}

SelectorPtr parse_pseudo_class_selector(ParseContext& ctx) {
    CSSToken colon = ctx.tt.next_token_no_skip();
    if (colon.type != CSSToken::Colon) {
        fail("PseudoClassSelector", "':'", colon);
    }
    CSSToken token = ctx.tt.next_token_no_skip();
    if (token.type == CSSToken::Ident) {
        return Selector::pseudo_class(token.value);
    }
    if (token.type == CSSToken::Function) {
        ctx.tt.push_back();
        return parse_function_pseudo_class(ctx);
    }
    unread_if_selector_boundary(ctx, token);
    fail("PseudoClassSelector", "identifier or function", token);
}

// Never throws: a selector that cannot be parsed is recorded and replaced by
// SelectNothing so the surrounding tree stays well formed.
SelectorPtr parse_simple_selector(ParseContext& ctx) {
    ctx.tt.next_token_no_skip();
    CSSToken token = skip_insignificant(ctx);

    try {
        switch (token.type) {
            case CSSToken::Ident:
                return Selector::type(token.value);
            case CSSToken::Hash:
                return Selector::id(token.value);
            case CSSToken::Colon:
                ctx.tt.push_back();
                return parse_pseudo_class_selector(ctx);
            case CSSToken::LeftBracket:
                ctx.tt.push_back();
                return parse_attribute_selector(ctx);
            case CSSToken::Delim:
                if (token.is_delim('*')) {
                    return Selector::universal();
                }
                if (token.is_delim('.')) {
                    CSSToken name = ctx.tt.next_token_no_skip();
                    if (name.type != CSSToken::Ident) {
                        unread_if_selector_boundary(ctx, name);
                        fail("SimpleSelector", "identifier", name);
                    }
                    return Selector::class_name(name.value);
                }
                break;
            default:
                break;
        }
        unread_if_selector_boundary(ctx, token);
        fail("SimpleSelector", "simple selector", token);
    } catch (const CSSParseException& e) {
        ctx.record(e);
        return Selector::select_nothing();
    }
}

SelectorPtr parse_selector(ParseContext& ctx) {
    DepthGuard guard(ctx);
    SelectorPtr simple = parse_simple_selector(ctx);
    SelectorPtr selector = simple;

    while (true) {
        CSSToken token = ctx.tt.next_token_no_skip();
        if (token.type == CSSToken::EndOfFile || token.type == CSSToken::LeftBrace ||
            token.type == CSSToken::Comma) {
            break;
        }

        bool potential_descendant = false;
        while (token.type == CSSToken::Whitespace || token.type == CSSToken::Comment) {
            if (token.type == CSSToken::Whitespace) {
                potential_descendant = true;
            }
            token = ctx.tt.next_token_no_skip();
        }
        if (token.type == CSSToken::EndOfFile || token.type == CSSToken::LeftBrace ||
            token.type == CSSToken::Comma) {
            break;
        }

        // The rest of the chain becomes the right operand
        if (token.is_delim('>')) {
            selector = Selector::combine(SelectorKind::Child, simple, parse_selector(ctx));
        } else if (token.is_delim('+')) {
            selector = Selector::combine(SelectorKind::AdjacentSibling, simple, parse_selector(ctx));
        } else if (token.is_delim('~')) {
            selector = Selector::combine(SelectorKind::GeneralSibling, simple, parse_selector(ctx));
        } else {
            ctx.tt.push_back();
            SelectorKind kind = potential_descendant ? SelectorKind::Descendant : SelectorKind::And;
            selector = Selector::combine(kind, simple, parse_selector(ctx));
        }
    }

    ctx.tt.push_back();
    return selector;
}

SelectorGroup consume_selector_group(ParseContext& ctx) {
    SelectorGroup group;
    group.selectors.push_back(parse_selector(ctx));

    while (true) {
        CSSToken token = ctx.tt.next_token_no_skip();
        if (token.type == CSSToken::EndOfFile || token.type == CSSToken::LeftBrace) {
            break;
        }
        token = skip_insignificant(ctx);
        if (token.type != CSSToken::Comma) {
            fail("SelectorGroup", "','", token);
        }
        ctx.tt.next_token_no_skip();
        skip_insignificant(ctx);
        ctx.tt.push_back();
        group.selectors.push_back(parse_selector(ctx));
    }

    ctx.tt.push_back();
    return group;
}

// ---------------------------------------------------------------------------
// Declarations
// ---------------------------------------------------------------------------

void scan_term(ParseContext& ctx, const CSSToken& token, std::vector<CSSToken>& terms);

const char* closer_text(CSSToken::Type close) {
    switch (close) {
        case CSSToken::RightBrace:   return "'}'";
        case CSSToken::RightBracket: return "']'";
        default:                     return "')'";
    }
}

// Copies a bracketed run into the flat term list, keeping it balanced.
void scan_bracketed_terms(ParseContext& ctx, const CSSToken& open, CSSToken::Type close,
                          std::vector<CSSToken>& terms) {
    DepthGuard guard(ctx);
    terms.push_back(open);
    ctx.open_terms.push_back(close);

    while (true) {
        CSSToken token = ctx.tt.next_token_no_skip();
        if (token.type == close) {
            terms.push_back(token);
            ctx.open_terms.pop_back();
            return;
        }
        if (token.type == CSSToken::EndOfFile) {
            fail("Terms", closer_text(close), token);
        }
        if (token.type == CSSToken::RightBrace) {
            // Closes an enclosing '{' of the value, or else the rule itself
            ctx.tt.push_back();
            fail("Terms", closer_text(close), token);
        }
        if (token.type == CSSToken::RightParen || token.type == CSSToken::RightBracket) {
            fail("Terms", closer_text(close), token);
        }
        scan_term(ctx, token, terms);
    }
}

void scan_term(ParseContext& ctx, const CSSToken& token, std::vector<CSSToken>& terms) {
    switch (token.type) {
        case CSSToken::Comment:
        case CSSToken::CDO:
        case CSSToken::CDC:
            // Dropped, but still separates its neighbours
            if (!terms.empty() && terms.back().type != CSSToken::Whitespace) {
                CSSToken space = token;
                space.type = CSSToken::Whitespace;
                space.value = " ";
                terms.push_back(space);
            }
            break;
        case CSSToken::Whitespace:
            if (!terms.empty() && terms.back().type == CSSToken::Whitespace) {
                terms.back().value += token.value;
                terms.back().end_offset = token.end_offset;
            } else {
                terms.push_back(token);
            }
            break;
        case CSSToken::BadString:
        case CSSToken::BadUrl:
            fail_at("Terms: unexpected " + describe_token(token), token);
        case CSSToken::RightParen:
        case CSSToken::RightBracket:
            fail_at("Terms: unmatched " + describe_token(token), token);
        case CSSToken::LeftBrace:
            scan_bracketed_terms(ctx, token, CSSToken::RightBrace, terms);
            break;
        case CSSToken::LeftBracket:
            scan_bracketed_terms(ctx, token, CSSToken::RightBracket, terms);
            break;
        case CSSToken::LeftParen:
        case CSSToken::Function:
            scan_bracketed_terms(ctx, token, CSSToken::RightParen, terms);
            break;
        default:
            terms.push_back(token);
            break;
    }
}

// Collects the value up to the next top-level ';' or '}', which is left
// unconsumed.
std::vector<CSSToken> parse_terms(ParseContext& ctx) {
    std::vector<CSSToken> terms;
    while (true) {
        CSSToken token = ctx.tt.next_token_no_skip();
        if (token.type == CSSToken::EndOfFile || token.type == CSSToken::Semicolon ||
            token.type == CSSToken::RightBrace) {
            ctx.tt.push_back();
            break;
        }
        scan_term(ctx, token, terms);
    }
    trim_whitespace(terms);
    return terms;
}

Declaration parse_declaration(ParseContext& ctx) {
    CSSToken property = ctx.tt.next_token_no_skip();
    if (property.type != CSSToken::Ident) {
        fail("Declaration", "property name", property);
    }

    CSSToken colon = ctx.tt.next_token();
    if (colon.type != CSSToken::Colon) {
        if (colon.type == CSSToken::Semicolon || colon.type == CSSToken::RightBrace ||
            colon.type == CSSToken::EndOfFile) {
            ctx.tt.push_back();
        }
        fail("Declaration", "':'", colon);
    }

    Declaration decl;
    decl.property = property.value;
    decl.start_offset = property.start_offset;
    decl.terms = parse_terms(ctx);
    decl.end_offset = decl.terms.empty() ? ctx.tt.offset() : decl.terms.back().end_offset;
    return decl;
}

// Drops the innermost open run expecting `close` and everything opened inside
// it. Returns false when no such run is open.
bool close_open_run(std::vector<CSSToken::Type>& open, CSSToken::Type close) {
    auto match = std::find(open.rbegin(), open.rend(), close);
    if (match == open.rend()) {
        return false;
    }
    open.erase(std::prev(match.base()), open.end());
    return true;
}

// Skips the rest of a broken declaration: through the next ';' outside any
// bracket, or up to the '}' closing the rule. A '}' only belongs to the value
// while one of its '{' runs is still open.
void skip_to_declaration_end(ParseContext& ctx, std::vector<CSSToken::Type> open) {
    while (true) {
        CSSToken token = ctx.tt.next_token_no_skip();
        switch (token.type) {
            case CSSToken::EndOfFile:
                ctx.tt.push_back();
                return;
            case CSSToken::Semicolon:
                if (open.empty()) return;
                break;
            case CSSToken::RightBrace:
                if (!close_open_run(open, CSSToken::RightBrace)) {
                    ctx.tt.push_back();
                    return;
                }
                break;
            case CSSToken::LeftBrace:
                open.push_back(CSSToken::RightBrace);
                break;
            case CSSToken::LeftBracket:
                open.push_back(CSSToken::RightBracket);
                break;
            case CSSToken::LeftParen:
            case CSSToken::Function:
                open.push_back(CSSToken::RightParen);
                break;
            case CSSToken::RightBracket:
            case CSSToken::RightParen:
                close_open_run(open, token.type);
                break;
            default:
                break;
        }
    }
}

// With in_block the list ends at '}' (left unconsumed); otherwise it runs to
// the end of input and a '}' is an error.
std::vector<Declaration> consume_declaration_list(ParseContext& ctx, bool in_block) {
    std::vector<Declaration> declarations;

    while (true) {
        CSSToken token = ctx.tt.next_token();
        if (token.type == CSSToken::EndOfFile) {
            break;
        }
        if (token.type == CSSToken::RightBrace) {
            if (in_block) break;
            ctx.record(CSSParseException(ParseError{
                "DeclarationList: unexpected '}'", token.line, token.start_offset}));
            continue;
        }
        if (token.type == CSSToken::Semicolon || token.type == CSSToken::CDO ||
            token.type == CSSToken::CDC) {
            continue;
        }

        ctx.tt.push_back();
        ctx.open_terms.clear();
        try {
            if (token.type != CSSToken::Ident) {
                fail("DeclarationList", "declaration", token);
            }
            declarations.push_back(parse_declaration(ctx));
        } catch (const CSSParseException& e) {
            ctx.record(e);
            std::vector<CSSToken::Type> open = std::move(ctx.open_terms);
            ctx.open_terms.clear();
            skip_to_declaration_end(ctx, std::move(open));
        }
    }

    ctx.tt.push_back();
    return declarations;
}

// ---------------------------------------------------------------------------
// Style rules and the stylesheet
// ---------------------------------------------------------------------------

StyleRule parse_style_rule(ParseContext& ctx) {
    StyleRule rule;

    ctx.tt.next_token_no_skip();
    CSSToken token = skip_insignificant(ctx);
    ctx.tt.push_back();
    if (token.type == CSSToken::LeftBrace) {
        // A bare block applies to every element
        rule.selectors.selectors.push_back(Selector::universal());
    } else {
        rule.selectors = consume_selector_group(ctx);
    }

    ctx.tt.next_token_no_skip();
    token = skip_insignificant(ctx);
    if (token.type != CSSToken::LeftBrace) {
        fail("StyleRule", "'{'", token);
    }
    ctx.rule_block_open = true;

    rule.declarations = consume_declaration_list(ctx, true);

    ctx.tt.next_token_no_skip();
    token = skip_insignificant(ctx);
    if (token.type != CSSToken::RightBrace) {
        fail("StyleRule", "'}'", token);
    }
    ctx.rule_block_open = false;
    return rule;
}

// After a rule failed: finish its block if it had one, and make sure at
// least one token was consumed so the stylesheet loop moves on.
void recover_from_rule_error(ParseContext& ctx, size_t rule_start) {
    if (ctx.rule_block_open) {
        ctx.rule_block_open = false;
        size_t nesting = 1;
        while (nesting > 0) {
            CSSToken token = ctx.tt.next_token_no_skip();
            if (token.type == CSSToken::EndOfFile) {
                ctx.tt.push_back();
                return;
            }
            if (token.type == CSSToken::LeftBrace) {
                ++nesting;
            } else if (token.type == CSSToken::RightBrace) {
                --nesting;
            }
        }
        return;
    }
    if (ctx.tt.offset() == rule_start) {
        ctx.tt.next_token_no_skip();
    }
}

StyleSheet consume_stylesheet(ParseContext& ctx) {
    StyleSheet sheet;

    while (true) {
        CSSToken token = ctx.tt.next_token_no_skip();
        if (token.type == CSSToken::EndOfFile) {
            break;
        }
        if (is_insignificant(token)) {
            continue;
        }
        if (token.type == CSSToken::RightBrace) {
            ctx.record(CSSParseException(ParseError{
                "StyleSheet: unexpected '}'", token.line, token.start_offset}));
            continue;
        }

        ctx.tt.push_back();
        ctx.rule_block_open = false;
        ctx.depth = 0;
        try {
            if (token.type == CSSToken::AtKeyword) {
                sheet.rules.emplace_back(parse_at_rule(ctx));
            } else {
                sheet.rules.emplace_back(parse_style_rule(ctx));
            }
        } catch (const CSSParseException& e) {
            ctx.record(e);
            ctx.depth = 0;
            recover_from_rule_error(ctx, token.start_offset);
        }
    }

    return sheet;
}

} // namespace

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

CSSParser::CSSParser(ParserOptions options) : options_(options) {}

StyleSheetParseResult CSSParser::parse_stylesheet(std::string_view css) const {
    CSSTokenizer tokenizer(css);
    ParseContext ctx(tokenizer, options_);

    StyleSheetParseResult result;
    result.stylesheet = consume_stylesheet(ctx);
    result.errors = std::move(ctx.errors);
    return result;
}

DeclarationListParseResult CSSParser::parse_declaration_list(std::string_view css) const {
    CSSTokenizer tokenizer(css);
    ParseContext ctx(tokenizer, options_);

    DeclarationListParseResult result;
    result.declarations = consume_declaration_list(ctx, false);
    result.errors = std::move(ctx.errors);
    return result;
}

SelectorGroupParseResult CSSParser::parse_selector_group(std::string_view css) const {
    CSSTokenizer tokenizer(css);
    ParseContext ctx(tokenizer, options_);

    SelectorGroupParseResult result;
    try {
        result.selectors = consume_selector_group(ctx);
        CSSToken rest = ctx.tt.next_token();
        if (rest.type != CSSToken::EndOfFile) {
            fail("SelectorGroup", "end of input", rest);
        }
    } catch (const CSSParseException& e) {
        ctx.record(e);
    }
    result.errors = std::move(ctx.errors);
    return result;
}

StyleSheetParseResult parse_stylesheet(std::string_view css) {
    return CSSParser().parse_stylesheet(css);
}

DeclarationListParseResult parse_declaration_list(std::string_view css) {
    return CSSParser().parse_declaration_list(css);
}

SelectorGroupParseResult parse_selector_group(std::string_view css) {
    return CSSParser().parse_selector_group(css);
}

void report_parse_errors(const std::vector<ParseError>& errors,
                         core::DiagnosticEmitter& emitter,
                         const std::string& stage) {
    for (const auto& error : errors) {
        emitter.emit_at(core::Severity::Warning, core::config::kDiagnosticsModule, stage,
                        error.message, error.line, error.position);
    }
}

} // namespace quill::css
